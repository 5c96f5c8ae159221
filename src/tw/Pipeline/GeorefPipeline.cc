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


#include <tw/Pipeline/GeorefPipeline.h>
#include <tw/Cartography/GeoTransform.h>
#include <tw/Cartography/WebMercator.h>
#include <tw/Core/Exception.h>
#include <tw/Core/Log.h>
#include <tw/Core/Settings.h>
#include <tw/Core/Stopwatch.h>
#include <tw/Core/System.h>
#include <tw/FileIO/GdalIO.h>
#include <tw/Image/BandNormalize.h>
#include <tw/Mosaic/TilePyramidGenerator.h>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/filesystem/operations.hpp>

namespace fs = boost::filesystem;

namespace tw {
namespace pipeline {

  using cartography::ControlPointSet;
  using cartography::GeoTransform;
  using cartography::ProjectedRaster;
  using mosaic::TilePyramid;
  namespace wm = cartography::web_mercator;

  PipelineOptions::PipelineOptions()
    : min_zoom( tw_settings().min_zoom() ),
      max_zoom( tw_settings().max_zoom() ),
      tile_size( tw_settings().tile_size() ),
      kernel( interpolation_kernel_from_string( tw_settings().resample_kernel() ) ),
      target_srs( wm::SRS ),
      source_srs( wm::GEOGRAPHIC_SRS ),
      keep_intermediate( false ) {}

  void PipelineOptions::validate() const {
    if (min_zoom < 0 || min_zoom > max_zoom || max_zoom > wm::MAX_ZOOM)
      tw_throw( ArgumentErr() << "Invalid zoom range [" << min_zoom << "," << max_zoom
                << "]; zoom levels run from 0 to " << wm::MAX_ZOOM << "." );
    if (tile_size <= 0 || (tile_size & (tile_size-1)) != 0)
      tw_throw( ArgumentErr() << "Tile size must be a power of two, not " << tile_size << "." );
    if (boost::to_upper_copy( target_srs ) != wm::SRS)
      tw_throw( ArgumentErr() << "Unsupported target projection \"" << target_srs
                << "\"; only " << wm::SRS << " is supported." );
    if (boost::to_upper_copy( source_srs ) != wm::GEOGRAPHIC_SRS)
      tw_throw( ArgumentErr() << "Unsupported control point CRS \"" << source_srs
                << "\"; only " << wm::GEOGRAPHIC_SRS << " is supported." );
  }

  std::ostream& operator<<( std::ostream& os, PipelineOptions const& options ) {
    return os << "PipelineOptions(zoom " << options.min_zoom << "-" << options.max_zoom
              << ", " << options.tile_size << "px tiles, " << interpolation_kernel_name( options.kernel )
              << ", " << options.source_srs << " -> " << options.target_srs << ")";
  }

  mosaic::TilePyramid build_pyramid( RasterImage const& raster, ControlPointSet const& points,
                                     PipelineOptions const& options, ProgressCallback const& progress,
                                     ProjectedRaster* warped, RasterImage* rgba ) {
    options.validate();
    TW_OUT(DebugMessage, "pipeline") << "Building pyramid for " << raster << " with " << options << "\n";
    progress.report_progress( 0 );

    Stopwatch sw;
    sw.start();
    GeoTransform tx( points );
    sw.stop();
    TW_OUT(InfoMessage, "pipeline") << "Solved a thin plate spline through " << tx.point_count()
                                    << " control points in " << sw.elapsed_seconds() << "s.\n";

    Stopwatch warp_sw;
    warp_sw.start();
    ProjectedRaster projected = cartography::reproject( raster, tx, options.kernel,
                                                        SubProgressCallback( progress, 0.0, 0.5 ) );
    warp_sw.stop();
    TW_OUT(InfoMessage, "pipeline") << "Warped to " << projected.raster.width() << "x"
                                    << projected.raster.height() << " pixels in "
                                    << warp_sw.elapsed_seconds() << "s.\n";

    Stopwatch band_sw;
    band_sw.start();
    RasterImage normalized = normalize_bands( projected.raster, projected.mask );
    band_sw.stop();
    progress.report_progress( 0.55 );
    TW_OUT(InfoMessage, "pipeline") << "Converted " << classify_bands( projected.raster )
                                    << " raster to RGBA in " << band_sw.elapsed_seconds() << "s.\n";

    Stopwatch tile_sw;
    tile_sw.start();
    mosaic::TilePyramidGenerator generator( normalized, projected.bbox );
    generator.set_zoom_range( options.min_zoom, options.max_zoom );
    generator.set_tile_size( options.tile_size );
    generator.set_kernel( options.kernel );
    TilePyramid pyramid = generator.generate( SubProgressCallback( progress, 0.55, 1.0 ) );
    tile_sw.stop();
    TW_OUT(InfoMessage, "pipeline") << "Cut " << pyramid << " in " << tile_sw.elapsed_seconds() << "s.\n";

    if (warped)
      *warped = projected;
    if (rgba)
      *rgba = normalized;
    progress.report_finished();
    return pyramid;
  }

  std::string run_pipeline( std::string const& image_path, ControlPointSet const& points,
                            PipelineOptions const& options, mosaic::TileStore const& store,
                            ProgressCallback const& progress ) {
    options.validate();
    RasterImage raster = fileio::read_raster( image_path );

    ProjectedRaster warped;
    RasterImage rgba;
    TilePyramid pyramid = build_pyramid( raster, points, options, SubProgressCallback( progress, 0.0, 0.9 ),
                                         &warped, &rgba );

    std::string id = store.allocate_namespace();
    if (options.keep_intermediate) {
      fs::path dir = fs::path( tw_settings().tmp_directory() ) / id;
      fs::create_directories( dir );
      fileio::write_geotiff( (dir / "warped.tif").string(), warped.raster, warped.bbox, warped.srs );
      fileio::write_geotiff( (dir / "rgba.tif").string(), rgba, warped.bbox, warped.srs );
      TW_OUT(InfoMessage, "pipeline") << "Kept intermediate rasters in " << dir.string() << "\n";
    }

    store.publish( id, pyramid );
    progress.report_finished();
    TW_OUT(InfoMessage, "pipeline") << "Published " << image_path << " as " << id << "\n";
    return id;
  }

}} // namespace tw::pipeline
