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
#include <tw/Pipeline/GeorefPipeline.h>
#include <tw/Cartography/WebMercator.h>
#include <tw/Core/Settings.h>
#include <tw/Core/System.h>
#include <tw/FileIO/GdalIO.h>
#include <tw/FileIO/PngIO.h>

#include <boost/filesystem/operations.hpp>

#include <iterator>

namespace fs = boost::filesystem;

using namespace tw;
using namespace tw::cartography;
using namespace tw::mosaic;
using namespace tw::pipeline;
using namespace tw::test;
namespace wm = tw::cartography::web_mercator;

namespace {

  // A right triangle in pixel space, about 1km on a side.
  ControlPointSet right_triangle() {
    ControlPointSet set;
    set.push_back( ControlPoint( Vector2(  0,   0), 37.00, -122.00 ) );
    set.push_back( ControlPoint( Vector2(100,   0), 37.00, -121.99 ) );
    set.push_back( ControlPoint( Vector2(  0, 100), 36.99, -122.00 ) );
    return set;
  }

  RasterImage gray_ramp( int32 cols, int32 rows ) {
    ImageView<uint8> img( cols, rows );
    for (int32 j = 0; j < rows; ++j)
      for (int32 i = 0; i < cols; ++i)
        img(i,j) = uint8( (2*i + j) % 256 );
    return RasterImage( img );
  }

  // Writes an input image for run_pipeline.  Its own georeference is ignored.
  void write_input( std::string const& filename, RasterImage const& raster ) {
    fileio::write_geotiff( filename, raster, BBox2( 0, 0, raster.width(), raster.height() ) );
  }

  bool same_tiles( TilePyramid const& a, TilePyramid const& b ) {
    if (a.size() != b.size())
      return false;
    for (TilePyramid::const_iterator ia = a.begin(), ib = b.begin(); ia != a.end(); ++ia, ++ib)
      if (ia->first != ib->first ||
          fileio::encode_png( ia->second.pixels() ) != fileio::encode_png( ib->second.pixels() ))
        return false;
    return true;
  }

  size_t directory_entries( std::string const& dir ) {
    if (!fs::exists( dir ))
      return 0;
    return std::distance( fs::directory_iterator( dir ), fs::directory_iterator() );
  }
}

TEST( PipelineOptions, Defaults ) {
  PipelineOptions options;
  EXPECT_EQ( 9, options.min_zoom );
  EXPECT_EQ( 16, options.max_zoom );
  EXPECT_EQ( 256, options.tile_size );
  EXPECT_EQ( BilinearKernel, options.kernel );
  EXPECT_EQ( "EPSG:3857", options.target_srs );
  EXPECT_EQ( "EPSG:4326", options.source_srs );
  EXPECT_FALSE( options.keep_intermediate );
  EXPECT_NO_THROW( options.validate() );
}

TEST( PipelineOptions, Validate ) {
  PipelineOptions options;
  options.min_zoom = 17;
  EXPECT_THROW( options.validate(), ArgumentErr );
  options.min_zoom = 9;
  options.max_zoom = 31;
  EXPECT_THROW( options.validate(), ArgumentErr );
  options.max_zoom = 16;
  options.tile_size = 300;
  EXPECT_THROW( options.validate(), ArgumentErr );
  options.tile_size = 512;
  EXPECT_NO_THROW( options.validate() );
  options.target_srs = "EPSG:4326";
  EXPECT_THROW( options.validate(), ArgumentErr );
  options.target_srs = "epsg:3857";
  EXPECT_NO_THROW( options.validate() );
  options.source_srs = "EPSG:32610";
  EXPECT_THROW( options.validate(), ArgumentErr );
}

TEST( GeorefPipeline, MinimalRun ) {
  PipelineOptions options;
  ProjectedRaster warped;
  RasterImage rgba;
  TilePyramid pyramid = build_pyramid( gray_ramp(100, 100), right_triangle(), options,
                                       ProgressCallback::dummy_instance(), &warped, &rgba );

  // No destination pixel falls outside the source.
  ASSERT_EQ( 4, rgba.band_count() );
  for (int32 j = 0; j < rgba.height(); ++j)
    for (int32 i = 0; i < rgba.width(); ++i)
      ASSERT_EQ( 255, rgba(i, j, 3) ) << "at " << i << "," << j;

  ASSERT_FALSE( pyramid.empty() );
  EXPECT_EQ( 9, pyramid.min_zoom() );
  EXPECT_EQ( 16, pyramid.max_zoom() );
  EXPECT_EQ( 1u, pyramid.tiles_at( 9 ).size() );

  // Every zoom 16 tile that overlaps the warped extent by at least a
  // tile pixel is present.
  BBox2 inner = warped.bbox;
  inner.expand( -wm::resolution( 16, 256 ) );
  BBox2i range = wm::tiles_touching( inner, 16 );
  ASSERT_FALSE( range.empty() );
  for (int32 col = range.min()[0]; col < range.max()[0]; ++col)
    for (int32 row = range.min()[1]; row < range.max()[1]; ++row)
      EXPECT_TRUE( pyramid.contains( TileIndex(16, col, row) ) ) << col << "," << row;
}

TEST( GeorefPipeline, Idempotent ) {
  PipelineOptions options;
  options.min_zoom = 12;
  TilePyramid a = build_pyramid( gray_ramp(100, 100), right_triangle(), options );
  TilePyramid b = build_pyramid( gray_ramp(100, 100), right_triangle(), options );
  EXPECT_TRUE( same_tiles( a, b ) );
}

TEST( GeorefPipeline, PaletteMatchesExpandedColors ) {
  ImageView<uint8> indices( 100, 100 ), colors( 100, 100, 3 );
  ColorTable table;
  table.push_back( PixelRGB8(255, 0, 0) );
  table.push_back( PixelRGB8(0, 128, 0) );
  table.push_back( PixelRGB8(10, 20, 30) );
  for (int32 j = 0; j < 100; ++j)
    for (int32 i = 0; i < 100; ++i) {
      uint8 index = uint8( (i/10 + j/10) % 3 );
      indices(i, j) = index;
      for (int32 p = 0; p < 3; ++p)
        colors(i, j, p) = table.lookup( index )[p];
    }

  PipelineOptions options;
  options.min_zoom = 14;
  options.kernel = NearestPixelKernel;
  TilePyramid paletted = build_pyramid( RasterImage(indices, table), right_triangle(), options );
  TilePyramid expanded = build_pyramid( RasterImage(colors), right_triangle(), options );
  EXPECT_TRUE( same_tiles( paletted, expanded ) );
}

TEST( GeorefPipeline, InsufficientPoints ) {
  UnlinkName input("pipeline-two-points.tif");
  UnlinkName root("pipeline-two-points-tiles");
  write_input( input, gray_ramp(100, 100) );

  ControlPointSet two;
  two.push_back( ControlPoint( Vector2(  0, 0), 37.00, -122.00 ) );
  two.push_back( ControlPoint( Vector2(100, 0), 37.00, -121.99 ) );

  TileStore store( root );
  EXPECT_THROW( run_pipeline( input, two, PipelineOptions(), store ), InsufficientControlPointsErr );
  EXPECT_EQ( 0u, directory_entries( root ) );
}

TEST( GeorefPipeline, UnopenableImage ) {
  UnlinkName root("pipeline-no-image-tiles");
  TileStore store( root );
  EXPECT_THROW( run_pipeline( TEST_OBJDIR "/no-such-image.tif", right_triangle(), PipelineOptions(), store ),
                UnopenableImageErr );
  EXPECT_EQ( 0u, directory_entries( root ) );
}

TEST( GeorefPipeline, PublishesRuns ) {
  UnlinkName input("pipeline-run.tif");
  UnlinkName root("pipeline-run-tiles");
  UnlinkName tmp("pipeline-run-tmp");
  write_input( input, gray_ramp(100, 100) );

  std::string tmp_directory = tw_settings().tmp_directory();
  tw_settings().set_tmp_directory( tmp );

  PipelineOptions options;
  options.min_zoom = 14;
  options.keep_intermediate = true;
  TileStore store( root );
  ProgressCallback progress;
  std::string first = run_pipeline( input, right_triangle(), options, store, progress );
  options.keep_intermediate = false;
  std::string second = run_pipeline( input, right_triangle(), options, store );
  tw_settings().set_tmp_directory( tmp_directory );

  EXPECT_DOUBLE_EQ( 1.0, progress.progress() );
  EXPECT_NE( first, second );
  EXPECT_TRUE( store.exists( first ) );
  EXPECT_TRUE( store.exists( second ) );
  EXPECT_EQ( 2u, directory_entries( root ) );

  EXPECT_TRUE( fs::is_regular_file( tmp + "/" + first + "/warped.tif" ) );
  RasterImage kept = fileio::read_raster( tmp + "/" + first + "/rgba.tif" );
  EXPECT_EQ( 4, kept.band_count() );
  EXPECT_FALSE( fs::exists( tmp + "/" + second ) );

  // Both namespaces hold the same bytes.
  TilePyramid expected = build_pyramid( gray_ramp(100, 100), right_triangle(), options );
  for (TilePyramid::const_iterator it = expected.begin(); it != expected.end(); ++it) {
    boost::optional<std::string> a = store.read_tile( first, it->first );
    boost::optional<std::string> b = store.read_tile( second, it->first );
    ASSERT_TRUE( a.is_initialized() ) << it->first;
    ASSERT_TRUE( b.is_initialized() ) << it->first;
    EXPECT_EQ( *a, *b );
    EXPECT_EQ( fileio::encode_png( it->second.pixels() ), *a );
  }
}
