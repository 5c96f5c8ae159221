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


/// \file Reproject.h
///
/// Warps a source raster through a GeoTransform into Web Mercator.
///
/// For every destination pixel center the projected location is taken
/// back to (lng, lat), then through GeoTransform::reverse() to a
/// source pixel location, where the source is sampled.  Destination
/// pixels whose source location falls outside the image are left at
/// zero and marked as holding no data.
///
#ifndef __TW_CARTOGRAPHY_REPROJECT_H__
#define __TW_CARTOGRAPHY_REPROJECT_H__

#include <tw/Cartography/GeoTransform.h>
#include <tw/Core/ProgressCallback.h>
#include <tw/Image/Interpolation.h>
#include <tw/Image/RasterImage.h>
#include <tw/Math/BBox.h>

#include <iosfwd>
#include <string>

namespace tw {
namespace cartography {

  /// A raster placed in a projected coordinate system.
  struct ProjectedRaster {
    /// The warped pixels, with the source's band layout and color
    /// table.
    RasterImage raster;

    /// One plane, 255 where the pixel holds data and 0 elsewhere.
    ImageView<uint8> mask;

    /// The area the raster covers, in projected units.  Row 0 is the
    /// north edge.
    BBox2 bbox;

    /// The projection identifier, e.g. "EPSG:3857".
    std::string srs;

    /// Size of a pixel in projected units, per axis.
    Vector2 pixel_size() const {
      return Vector2( bbox.width() / raster.width(), bbox.height() / raster.height() );
    }
  };

  std::ostream& operator<<( std::ostream& os, ProjectedRaster const& r );

  /// The layout of the destination grid.
  struct WarpOutput {
    BBox2 bbox;
    int32 cols, rows;
    WarpOutput() : cols(0), rows(0) {}
  };

  /// Chooses the destination grid for warping a cols x rows source.
  ///
  /// The extent is the bounding box of the projected source outline,
  /// sampled 20 times per edge, together with the control points.  The
  /// pixel size is the projected length of the source diagonal divided
  /// by its length in pixels, so the output keeps roughly the source's
  /// ground resolution.  Pixel counts are rounded up and the pixel size
  /// on each axis then shrunk to fit the extent exactly.  Throws
  /// ProjectionErr if the outline cannot be projected.
  WarpOutput suggest_warp_output( int32 cols, int32 rows, GeoTransform const& tx );

  /// Warps a raster into Web Mercator.  A raster with a color table is
  /// always sampled with NearestPixelKernel.  Rows are processed in
  /// blocks on a FifoWorkQueue.  Throws ProjectionErr if the
  /// destination extent cannot be computed or evaluated.
  ProjectedRaster reproject( RasterImage const& src, GeoTransform const& tx,
                             InterpolationKernel kernel = BilinearKernel,
                             ProgressCallback const& progress = ProgressCallback::dummy_instance() );

}} // namespace tw::cartography

#endif // __TW_CARTOGRAPHY_REPROJECT_H__
