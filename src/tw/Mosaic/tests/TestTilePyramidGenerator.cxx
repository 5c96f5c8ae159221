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
#include <tw/Mosaic/TilePyramidGenerator.h>
#include <tw/Cartography/WebMercator.h>
#include <tw/Core/Settings.h>
#include <tw/Core/System.h>
#include <tw/Image/Manipulation.h>

#include <cmath>

using namespace tw;
using namespace tw::mosaic;
namespace wm = tw::cartography::web_mercator;

namespace {

  ImageView<uint8> rgba_planes( int32 cols, int32 rows, PixelRGBA8 const& px ) {
    ImageView<uint8> img( cols, rows, 4 );
    for (int32 j = 0; j < rows; ++j)
      for (int32 i = 0; i < cols; ++i)
        for (int32 p = 0; p < 4; ++p)
          img(i, j, p) = px[p];
    return img;
  }

  // Six zoom 12 tiles around San Francisco, cols 655-657 and south
  // rows 2512-2513, inset by 100m on every side.
  BBox2 six_tiles() {
    BBox2 box = wm::tile_bbox( 12, 655, 2512 );
    box.grow( wm::tile_bbox( 12, 657, 2513 ) );
    box.expand( -100 );
    return box;
  }

  // A color ramp with a transparent hole in it.
  RasterImage ramp_with_hole( int32 cols, int32 rows ) {
    ImageView<uint8> img( cols, rows, 4 );
    for (int32 j = 0; j < rows; ++j)
      for (int32 i = 0; i < cols; ++i) {
        bool hole = i >= cols/4 && i < cols/2 && j >= rows/4 && j < rows/2;
        img(i, j, 0) = hole ? 0 : uint8( 4*i % 256 );
        img(i, j, 1) = hole ? 0 : uint8( 3*j % 256 );
        img(i, j, 2) = hole ? 0 : uint8( (i*j) % 256 );
        img(i, j, 3) = hole ? 0 : 255;
      }
    return RasterImage( img );
  }

  TilePyramidGenerator small_generator( RasterImage const& raster, BBox2 const& bbox ) {
    TilePyramidGenerator gen( raster, bbox );
    gen.set_zoom_range( 10, 12 );
    gen.set_tile_size( 32 );
    return gen;
  }
}

TEST( TilePyramidGenerator, Defaults ) {
  TilePyramidGenerator gen( RasterImage( rgba_planes(4, 4, PixelRGBA8(uint8(1))) ), six_tiles() );
  EXPECT_EQ( 9, gen.get_min_zoom() );
  EXPECT_EQ( 16, gen.get_max_zoom() );
  EXPECT_EQ( 256, gen.get_tile_size() );
  EXPECT_EQ( BilinearKernel, gen.get_kernel() );
}

TEST( TilePyramidGenerator, BadArguments ) {
  ImageView<uint8> rgb( 4, 4, 3 );
  EXPECT_THROW( TilePyramidGenerator( RasterImage(rgb), six_tiles() ), ArgumentErr );

  TilePyramidGenerator gen( RasterImage( rgba_planes(4, 4, PixelRGBA8(uint8(1))) ), six_tiles() );
  EXPECT_THROW( gen.set_tile_size( 100 ), ArgumentErr );
  EXPECT_THROW( gen.set_tile_size( 0 ), ArgumentErr );
  EXPECT_THROW( gen.set_zoom_range( 5, 4 ), ArgumentErr );
  EXPECT_THROW( gen.set_zoom_range( 0, 31 ), ArgumentErr );
}

TEST( TilePyramidGenerator, SingleTile ) {
  // The raster covers exactly one zoom 3 tile.
  PixelRGBA8 color( 200, 100, 50, 255 );
  TilePyramidGenerator gen( RasterImage( rgba_planes(32, 32, color) ), wm::tile_bbox( 3, 4, 4 ) );
  gen.set_zoom_range( 2, 3 );
  gen.set_tile_size( 16 );
  TilePyramid pyramid = gen.generate();

  ASSERT_EQ( 2u, pyramid.size() );
  Tile const* tile = pyramid.find( TileIndex(3, 4, 4) );
  ASSERT_TRUE( tile != 0 );
  for (int32 j = 0; j < 16; ++j)
    for (int32 i = 0; i < 16; ++i)
      ASSERT_EQ( color, tile->pixels()(i, j) ) << "at " << i << "," << j;

  // One level up it is the south-west quarter of its parent.
  Tile const* parent = pyramid.find( TileIndex(2, 2, 2) );
  ASSERT_TRUE( parent != 0 );
  EXPECT_EQ( color, parent->pixels()(0, 15) );
  EXPECT_EQ( color, parent->pixels()(7, 8) );
  EXPECT_EQ( PixelRGBA8(), parent->pixels()(8, 8) );
  EXPECT_EQ( PixelRGBA8(), parent->pixels()(0, 7) );
  EXPECT_EQ( PixelRGBA8(), parent->pixels()(15, 0) );
}

TEST( TilePyramidGenerator, CoversTheRaster ) {
  RasterImage raster( rgba_planes( 96, 64, PixelRGBA8(10, 20, 30, 255) ) );
  TilePyramid pyramid = small_generator( raster, six_tiles() ).generate();

  std::vector<Tile> deepest = pyramid.tiles_at( 12 );
  ASSERT_EQ( 6u, deepest.size() );
  BBox2 covered;
  for (size_t i = 0; i < deepest.size(); ++i)
    covered.grow( wm::tile_bbox( 12, deepest[i].index().col, deepest[i].index().row ) );
  EXPECT_TRUE( covered.contains( six_tiles() ) );

  EXPECT_EQ( 2u, pyramid.tiles_at( 11 ).size() );
  EXPECT_TRUE( pyramid.contains( TileIndex(11, 327, 1256) ) );
  EXPECT_TRUE( pyramid.contains( TileIndex(11, 328, 1256) ) );
  EXPECT_EQ( 2u, pyramid.tiles_at( 10 ).size() );
  EXPECT_EQ( 10u, pyramid.size() );
}

TEST( TilePyramidGenerator, LowerLevelsAreBoxAverages ) {
  TilePyramid pyramid = small_generator( ramp_with_hole( 96, 64 ), six_tiles() ).generate();
  const int32 size = pyramid.tile_size();

  for (TilePyramid::const_iterator it = pyramid.begin(); it != pyramid.end(); ++it) {
    TileIndex const& index = it->first;
    EXPECT_FALSE( is_transparent( it->second.pixels() ) ) << index;
    if (index.zoom == pyramid.max_zoom())
      continue;

    // Lay out the children north-up, missing ones transparent.
    ImageView<PixelRGBA8> children( 2*size, 2*size );
    for (int32 dy = 0; dy < 2; ++dy)
      for (int32 dx = 0; dx < 2; ++dx) {
        Tile const* child = pyramid.find( index.child(dx, dy) );
        if (!child) continue;
        for (int32 j = 0; j < size; ++j)
          for (int32 i = 0; i < size; ++i)
            children( dx*size + i, (1-dy)*size + j ) = child->pixels()(i, j);
      }

    for (int32 j = 0; j < size; ++j)
      for (int32 i = 0; i < size; ++i)
        for (int32 c = 0; c < 4; ++c) {
          double mean = ( children(2*i, 2*j)[c] + children(2*i+1, 2*j)[c] +
                          children(2*i, 2*j+1)[c] + children(2*i+1, 2*j+1)[c] ) / 4.0;
          ASSERT_LE( std::abs( it->second.pixels()(i, j)[c] - mean ), 1.0 )
            << index << " pixel " << i << "," << j << " channel " << c;
        }
  }
}

TEST( TilePyramidGenerator, EmptyTilesAreOmitted ) {
  RasterImage clear( rgba_planes( 96, 64, PixelRGBA8() ) );
  TilePyramid pyramid = small_generator( clear, six_tiles() ).generate();
  EXPECT_TRUE( pyramid.empty() );

  // Only the tiles under the opaque corner survive.
  ImageView<uint8> corner = rgba_planes( 96, 64, PixelRGBA8() );
  for (int32 j = 0; j < 10; ++j)
    for (int32 i = 0; i < 10; ++i)
      for (int32 p = 0; p < 4; ++p)
        corner(i, j, p) = 255;
  pyramid = small_generator( RasterImage(corner), six_tiles() ).generate();
  ASSERT_EQ( 1u, pyramid.tiles_at( 12 ).size() );
  EXPECT_TRUE( pyramid.contains( TileIndex(12, 655, 2513) ) );
  EXPECT_EQ( 3u, pyramid.size() );
}

TEST( TilePyramidGenerator, SameOutputOnAnyThreadCount ) {
  uint32 threads = tw_settings().default_num_threads();
  RasterImage raster = ramp_with_hole( 96, 64 );

  tw_settings().set_default_num_threads( 1 );
  TilePyramid serial = small_generator( raster, six_tiles() ).generate();
  tw_settings().set_default_num_threads( 4 );
  TilePyramid parallel = small_generator( raster, six_tiles() ).generate();
  tw_settings().set_default_num_threads( threads );

  ASSERT_EQ( serial.size(), parallel.size() );
  TilePyramid::const_iterator a = serial.begin(), b = parallel.begin();
  for ( ; a != serial.end(); ++a, ++b) {
    EXPECT_EQ( a->first, b->first );
    EXPECT_TRUE( a->second.pixels() == b->second.pixels() ) << a->first;
  }
}

TEST( TilePyramidGenerator, ReportsProgress ) {
  ProgressCallback progress;
  small_generator( ramp_with_hole( 96, 64 ), six_tiles() ).generate( progress );
  EXPECT_DOUBLE_EQ( 1.0, progress.progress() );
}
