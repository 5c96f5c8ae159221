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


#ifndef __TW_CARTOGRAPHY_GEOTRANSFORM_H__
#define __TW_CARTOGRAPHY_GEOTRANSFORM_H__

#include <tw/Cartography/ControlPoint.h>
#include <tw/Cartography/ThinPlateSpline.h>

/// \file GeoTransform.h The rubber-sheet mapping between source image pixels and WGS84.

namespace tw {
namespace cartography {

  /// A pair of thin-plate splines fitted to the same control points,
  /// one in each direction, the way GDAL's TPS transformer works.
  /// Both pass exactly through every control point.
  ///
  /// The object is immutable once built, so concurrent calls to
  /// forward() and reverse() are safe.
  class GeoTransform {
    std::vector<ControlPoint> m_points;
    ThinPlateSpline m_pixel_to_lonlat;
    ThinPlateSpline m_lonlat_to_pixel;

  public:
    /// Fits the transform to the set's usable points.  Throws
    /// InsufficientControlPointsErr if fewer than three remain and
    /// DegenerateControlPointsErr if they do not span an area in both
    /// pixel and geographic space.
    explicit GeoTransform( ControlPointSet const& points );

    /// Maps a source pixel location to (lng, lat) in degrees.
    Vector2 forward( Vector2 const& pixel ) const { return m_pixel_to_lonlat( pixel ); }

    /// Maps (lng, lat) in degrees to a source pixel location.
    Vector2 reverse( Vector2 const& lonlat ) const { return m_lonlat_to_pixel( lonlat ); }

    /// The distinct control points the splines pass through.
    std::vector<ControlPoint> const& control_points() const { return m_points; }

    size_t point_count() const { return m_points.size(); }
  };

}} // namespace tw::cartography

#endif // __TW_CARTOGRAPHY_GEOTRANSFORM_H__
