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


/// \file WebMercator.h
///
/// Spherical ("web") Mercator, EPSG:3857, and the standard tiling of
/// it.  At zoom z the square world [-H,H] x [-H,H], H being half the
/// equatorial circumference, is cut into 2^z x 2^z tiles.
///
#ifndef __TW_CARTOGRAPHY_WEBMERCATOR_H__
#define __TW_CARTOGRAPHY_WEBMERCATOR_H__

#include <tw/Core/FundamentalTypes.h>
#include <tw/Math/BBox.h>
#include <tw/Math/Vector.h>

#include <string>

namespace tw {
namespace cartography {
namespace web_mercator {

  /// WGS84 semi-major axis, used as the sphere radius.
  const double EARTH_RADIUS = 6378137.0;

  /// pi * EARTH_RADIUS, in meters.
  const double HALF_CIRCUMFERENCE = 20037508.342789244;

  /// The latitude at which the projected world becomes square.
  const double MAX_LATITUDE = 85.0511287798066;

  /// The deepest zoom level for which tile rows and columns fit in an
  /// int32.
  const int32 MAX_ZOOM = 30;

  const char* const SRS = "EPSG:3857";
  const char* const GEOGRAPHIC_SRS = "EPSG:4326";

  /// (lng, lat) degrees to projected meters.  Latitude is clamped to
  /// +-MAX_LATITUDE.
  Vector2 lonlat_to_point( Vector2 const& lonlat );

  /// Projected meters to (lng, lat) degrees.
  Vector2 point_to_lonlat( Vector2 const& point );

  /// The whole projected world.
  BBox2 world_bbox();

  /// Meters per pixel at the given zoom level.
  double resolution( int32 zoom, int32 tile_size );

  /// The footprint of a tile in projected meters.  Rows count up from
  /// the south edge of the world (the TMS convention).
  BBox2 tile_bbox( int32 zoom, int32 col, int32 south_row );

  /// The range of tiles at the given zoom that a projected box
  /// touches, as a box of [col, south_row] indices, clipped to the
  /// world.
  BBox2i tiles_touching( BBox2 const& bbox, int32 zoom );

}}} // namespace tw::cartography::web_mercator

#endif // __TW_CARTOGRAPHY_WEBMERCATOR_H__
