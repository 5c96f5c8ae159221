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


#include <tw/Cartography/GeoTransform.h>
#include <tw/Core/Exception.h>
#include <tw/Core/Log.h>

namespace {

  std::vector<tw::Vector2> pixels( std::vector<tw::cartography::ControlPoint> const& points ) {
    std::vector<tw::Vector2> result;
    for (size_t i = 0; i < points.size(); ++i)
      result.push_back( points[i].pixel() );
    return result;
  }

  std::vector<tw::Vector2> lonlats( std::vector<tw::cartography::ControlPoint> const& points ) {
    std::vector<tw::Vector2> result;
    for (size_t i = 0; i < points.size(); ++i)
      result.push_back( points[i].lonlat() );
    return result;
  }

}

namespace tw {
namespace cartography {

  GeoTransform::GeoTransform( ControlPointSet const& set )
    : m_points( set.usable_points() ) {
    if (m_points.size() < 3)
      tw_throw( InsufficientControlPointsErr() << "At least 3 distinct control points are required, got "
                << m_points.size() << " (of " << set.size() << " supplied)." );

    m_pixel_to_lonlat = ThinPlateSpline( pixels(m_points), lonlats(m_points) );
    m_lonlat_to_pixel = ThinPlateSpline( lonlats(m_points), pixels(m_points) );
    TW_OUT(DebugMessage, "cartography") << "GeoTransform: solved thin-plate spline through "
                                         << point_count() << " control points\n";
  }

}} // namespace tw::cartography
