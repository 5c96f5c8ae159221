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


/// \file GeorefPipeline.h
///
/// The georeferencing pipeline: solve a thin plate spline from the
/// control points, warp the image into Web Mercator, convert it to
/// RGBA, and cut it into a tile pyramid.
///
/// Each run is independent.  A run either publishes a complete
/// pyramid under a fresh namespace and returns its id, or throws and
/// publishes nothing.
///
#ifndef __TW_PIPELINE_GEOREFPIPELINE_H__
#define __TW_PIPELINE_GEOREFPIPELINE_H__

#include <tw/Cartography/ControlPoint.h>
#include <tw/Cartography/Reproject.h>
#include <tw/Core/ProgressCallback.h>
#include <tw/Image/Interpolation.h>
#include <tw/Image/RasterImage.h>
#include <tw/Mosaic/TilePyramid.h>
#include <tw/Mosaic/TileStore.h>

#include <ostream>
#include <string>

namespace tw {
namespace pipeline {

  /// Per-run configuration.  The defaults come from tw_settings().
  struct PipelineOptions {
    int32 min_zoom, max_zoom;
    int32 tile_size;
    InterpolationKernel kernel;
    std::string target_srs;   // only EPSG:3857
    std::string source_srs;   // only EPSG:4326
    bool keep_intermediate;   // write GeoTIFFs under tmp_directory/{id}/

    PipelineOptions();

    /// Throws ArgumentErr for a bad zoom range, a tile size that is
    /// not a positive power of two, or an unsupported projection.
    void validate() const;
  };

  std::ostream& operator<<( std::ostream& os, PipelineOptions const& options );

  /// Runs every stage in memory.  If warped or rgba is given, the
  /// reprojected raster and its RGBA conversion are stored there.
  mosaic::TilePyramid build_pyramid( RasterImage const& raster,
                                     cartography::ControlPointSet const& points,
                                     PipelineOptions const& options,
                                     ProgressCallback const& progress = ProgressCallback::dummy_instance(),
                                     cartography::ProjectedRaster* warped = 0,
                                     RasterImage* rgba = 0 );

  /// Reads the image, builds the pyramid and publishes it to the store
  /// under a newly allocated namespace, whose id is returned.  The
  /// namespace is only allocated once every stage has succeeded.
  std::string run_pipeline( std::string const& image_path,
                            cartography::ControlPointSet const& points,
                            PipelineOptions const& options,
                            mosaic::TileStore const& store,
                            ProgressCallback const& progress = ProgressCallback::dummy_instance() );

}} // namespace tw::pipeline

#endif // __TW_PIPELINE_GEOREFPIPELINE_H__
