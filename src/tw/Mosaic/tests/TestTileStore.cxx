// __BEGIN_LICENSE__
//  Copyright (c) 2006-2013, United States Government as represented by the
//  Administrator of the National Aeronautics and Space Administration. All
//  rights reserved.
//
//  The NASA Vision Workbench is licensed under the Apache License,
//  Version 2.0 (the "License"); you may not use this file except in
//  compliance with the License. You may obtain a copy of the License at
//  http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.
// __END_LICENSE__


#include <test/Helpers.h>
#include <tw/Mosaic/TileServer.h>
#include <tw/Mosaic/TileStore.h>
#include <tw/FileIO/PngIO.h>

#include <boost/filesystem/operations.hpp>

#include <fstream>

namespace fs = boost::filesystem;

using namespace tw;
using namespace tw::mosaic;
using namespace tw::test;

namespace {

  ImageView<PixelRGBA8> solid( int32 size, PixelRGBA8 const& px ) {
    ImageView<PixelRGBA8> img( size, size );
    img.fill( px );
    return img;
  }

  TilePyramid two_tiles() {
    TilePyramid pyramid( 11, 12, 16 );
    pyramid.insert( Tile( TileIndex(12, 655, 2513), solid(16, PixelRGBA8(1, 2, 3, 255)) ) );
    pyramid.insert( Tile( TileIndex(11, 327, 1256), solid(16, PixelRGBA8(4, 5, 6, 64)) ) );
    return pyramid;
  }
}

TEST( TilePyramid, Insert ) {
  TilePyramid pyramid = two_tiles();
  EXPECT_EQ( 2u, pyramid.size() );
  EXPECT_TRUE( pyramid.find( TileIndex(12, 0, 0) ) == 0 );
  EXPECT_EQ( 1u, pyramid.tiles_at( 11 ).size() );
  EXPECT_EQ( 0u, pyramid.tiles_at( 13 ).size() );

  EXPECT_THROW( pyramid.insert( Tile( TileIndex(10, 0, 0), solid(16, PixelRGBA8()) ) ), ArgumentErr );
  EXPECT_THROW( pyramid.insert( Tile( TileIndex(12, 0, 0), solid(8, PixelRGBA8()) ) ), ArgumentErr );
  EXPECT_THROW( pyramid.insert( Tile( TileIndex(11, 2048, 0), solid(16, PixelRGBA8()) ) ), ArgumentErr );
  EXPECT_THROW( pyramid.insert( Tile( TileIndex(12, 655, 2513), solid(16, PixelRGBA8()) ) ), LogicErr );
  EXPECT_THROW( TilePyramid( 5, 4, 16 ), ArgumentErr );
}

TEST( TileStore, Namespaces ) {
  UnlinkName root("tilestore-ns");
  TileStore store( root );
  std::string a = store.allocate_namespace(), b = store.allocate_namespace();
  EXPECT_EQ( 36u, a.size() );
  EXPECT_NE( a, b );
  EXPECT_TRUE( TileStore::valid_namespace( a ) );
  EXPECT_FALSE( store.exists( a ) );

  EXPECT_FALSE( TileStore::valid_namespace( "" ) );
  EXPECT_FALSE( TileStore::valid_namespace( "." ) );
  EXPECT_FALSE( TileStore::valid_namespace( ".." ) );
  EXPECT_FALSE( TileStore::valid_namespace( "a/b" ) );
  EXPECT_FALSE( TileStore::valid_namespace( ".hidden.partial" ) );
  EXPECT_FALSE( store.exists( "../" ) );
}

TEST( TileStore, PublishLayout ) {
  UnlinkName root("tilestore-publish");
  TileStore store( root );
  std::string id = store.allocate_namespace();
  store.publish( id, two_tiles() );

  EXPECT_TRUE( store.exists( id ) );
  EXPECT_TRUE( fs::is_regular_file( root + "/" + id + "/tiles/12/655/2513.png" ) );
  EXPECT_TRUE( fs::is_regular_file( root + "/" + id + "/tiles/11/327/1256.png" ) );
  EXPECT_FALSE( fs::exists( root + "/." + id + ".partial" ) );

  boost::optional<std::string> bytes = store.read_tile( id, TileIndex(11, 327, 1256) );
  ASSERT_TRUE( bytes.is_initialized() );
  EXPECT_TRUE( fileio::decode_png( *bytes ) == solid(16, PixelRGBA8(4, 5, 6, 64)) );

  EXPECT_FALSE( store.read_tile( id, TileIndex(11, 0, 0) ).is_initialized() );
  EXPECT_FALSE( store.read_tile( "no-such-namespace", TileIndex(11, 327, 1256) ).is_initialized() );

  // A namespace is written once.
  EXPECT_THROW( store.publish( id, two_tiles() ), StorageErr );
}

TEST( TileStore, FailedPublishLeavesNothing ) {
  // The root is a plain file, so no directory can be made under it.
  UnlinkName root("tilestore-blocked");
  {
    std::ofstream f( root.c_str() );
    f << "not a directory";
  }
  TileStore store( root );
  store.set_retries( 1 );
  std::string id = store.allocate_namespace();
  EXPECT_THROW( store.publish( id, two_tiles() ), StorageErr );
  EXPECT_FALSE( store.exists( id ) );
}

TEST( TileServer, ServesTilesNorthUp ) {
  UnlinkName root("tileserver");
  TileStore store( root );
  std::string id = store.allocate_namespace();
  store.publish( id, two_tiles() );

  TileServer server( store, 16 );
  EXPECT_TRUE( server.namespace_exists( id ) );

  // South row 2513 at zoom 12 is north row 4095 - 2513 = 1582.
  std::string png = server.get_tile( id, 12, 655, 1582 );
  EXPECT_TRUE( fileio::decode_png( png ) == solid(16, PixelRGBA8(1, 2, 3, 255)) );
  EXPECT_EQ( *store.read_tile( id, TileIndex(12, 655, 2513) ), png );
}

TEST( TileServer, PlaceholderOnMiss ) {
  UnlinkName root("tileserver-miss");
  TileStore store( root );
  std::string id = store.allocate_namespace();
  store.publish( id, two_tiles() );

  TileServer server( store );
  ImageView<PixelRGBA8> placeholder = fileio::decode_png( server.placeholder() );
  EXPECT_EQ( 256, placeholder.cols() );
  EXPECT_EQ( 256, placeholder.rows() );
  for (int32 j = 0; j < placeholder.rows(); ++j)
    for (int32 i = 0; i < placeholder.cols(); ++i)
      ASSERT_EQ( 0, placeholder(i, j).a() );

  EXPECT_EQ( server.placeholder(), server.get_tile( id, 12, 0, 0 ) );
  EXPECT_EQ( server.placeholder(), server.get_tile( "no-such-namespace", 12, 655, 1582 ) );
  EXPECT_EQ( server.placeholder(), server.get_tile( "../etc", 12, 655, 1582 ) );
  EXPECT_EQ( server.placeholder(), server.get_tile( id, 12, -1, 0 ) );
  EXPECT_EQ( server.placeholder(), server.get_tile( id, 12, 0, 4096 ) );
  EXPECT_EQ( server.placeholder(), server.get_tile( id, 31, 0, 0 ) );
  EXPECT_FALSE( server.namespace_exists( "no-such-namespace" ) );
}

TEST( TileServer, PlaceholderOnUnreadableTile ) {
  UnlinkName root("tileserver-bad");
  TileStore store( root );
  std::string id = store.allocate_namespace();
  store.publish( id, two_tiles() );

  // A directory in place of the tile file is a miss.
  fs::path tile = fs::path(root) / id / "tiles" / "12" / "655" / "2513.png";
  fs::remove( tile );
  fs::create_directories( tile / "oops" );

  TileServer server( store, 16 );
  EXPECT_EQ( server.placeholder(), server.get_tile( id, 12, 655, 1582 ) );
}
