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


#include <tw/Cartography/WebMercator.h>
#include <tw/Core/Exception.h>

#include <boost/math/constants/constants.hpp>

#include <algorithm>
#include <cmath>

namespace tw {
namespace cartography {
namespace web_mercator {

  namespace {
    const double PI = boost::math::constants::pi<double>();
    const double DEG_TO_RAD = PI / 180.0;
    const double RAD_TO_DEG = 180.0 / PI;

    void check_zoom( int32 zoom ) {
      TW_ASSERT( zoom >= 0 && zoom <= MAX_ZOOM,
                 ArgumentErr() << "Zoom level " << zoom << " is outside [0," << MAX_ZOOM << "]." );
    }
  }

  Vector2 lonlat_to_point( Vector2 const& lonlat ) {
    double lat = std::max( -MAX_LATITUDE, std::min( MAX_LATITUDE, lonlat[1] ) );
    return Vector2( EARTH_RADIUS * lonlat[0] * DEG_TO_RAD,
                    EARTH_RADIUS * std::log( std::tan( PI/4 + lat * DEG_TO_RAD / 2 ) ) );
  }

  Vector2 point_to_lonlat( Vector2 const& point ) {
    return Vector2( point[0] / EARTH_RADIUS * RAD_TO_DEG,
                    (2 * std::atan( std::exp( point[1] / EARTH_RADIUS ) ) - PI/2) * RAD_TO_DEG );
  }

  BBox2 world_bbox() {
    return BBox2( Vector2(-HALF_CIRCUMFERENCE, -HALF_CIRCUMFERENCE),
                  Vector2( HALF_CIRCUMFERENCE,  HALF_CIRCUMFERENCE) );
  }

  double resolution( int32 zoom, int32 tile_size ) {
    check_zoom( zoom );
    return 2 * HALF_CIRCUMFERENCE / (double(tile_size) * double(int64(1) << zoom));
  }

  BBox2 tile_bbox( int32 zoom, int32 col, int32 south_row ) {
    check_zoom( zoom );
    double size = 2 * HALF_CIRCUMFERENCE / double(int64(1) << zoom);
    Vector2 min( -HALF_CIRCUMFERENCE + col * size, -HALF_CIRCUMFERENCE + south_row * size );
    return BBox2( min, min + Vector2(size, size) );
  }

  BBox2i tiles_touching( BBox2 const& bbox, int32 zoom ) {
    check_zoom( zoom );
    const int64 n = int64(1) << zoom;
    double size = 2 * HALF_CIRCUMFERENCE / double(n);
    int64 c0 = int64( std::floor( (bbox.min()[0] + HALF_CIRCUMFERENCE) / size ) );
    int64 r0 = int64( std::floor( (bbox.min()[1] + HALF_CIRCUMFERENCE) / size ) );
    int64 c1 = int64( std::ceil ( (bbox.max()[0] + HALF_CIRCUMFERENCE) / size ) );
    int64 r1 = int64( std::ceil ( (bbox.max()[1] + HALF_CIRCUMFERENCE) / size ) );
    c0 = std::max<int64>( c0, 0 ); r0 = std::max<int64>( r0, 0 );
    c1 = std::min<int64>( c1, n ); r1 = std::min<int64>( r1, n );
    if (c1 <= c0 || r1 <= r0)
      return BBox2i();
    return BBox2i( Vector2i( int32(c0), int32(r0) ), Vector2i( int32(c1), int32(r1) ) );
  }

}}} // namespace tw::cartography::web_mercator
