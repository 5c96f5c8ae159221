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


/// \file ControlPoint.h
///
/// Correspondences between source image pixels and WGS84 geographic
/// coordinates.
///
/// Pixel coordinates use the pixel-corner convention: the center of
/// pixel (i,j) is (i+0.5, j+0.5).  Geographic coordinates are decimal
/// degrees; internally a location is stored as (lng, lat) so that x
/// stays east.
///
#ifndef __TW_CARTOGRAPHY_CONTROLPOINT_H__
#define __TW_CARTOGRAPHY_CONTROLPOINT_H__

#include <tw/Math/Vector.h>

#include <iosfwd>
#include <string>
#include <vector>

namespace tw {
namespace cartography {

  /// A single pixel to geographic correspondence.
  class ControlPoint {
    Vector2 m_pixel;
    Vector2 m_lonlat;
  public:
    ControlPoint() {}

    /// Throws InputErr if the pixel is negative or the location falls
    /// outside [-180,180] x [-90,90].
    ControlPoint( Vector2 const& pixel, double lat, double lng );

    Vector2 const& pixel() const { return m_pixel; }
    double lat() const { return m_lonlat[1]; }
    double lng() const { return m_lonlat[0]; }

    /// The location as (lng, lat).
    Vector2 const& lonlat() const { return m_lonlat; }
  };

  bool operator==( ControlPoint const& a, ControlPoint const& b );
  inline bool operator!=( ControlPoint const& a, ControlPoint const& b ) { return !(a == b); }
  std::ostream& operator<<( std::ostream& os, ControlPoint const& cp );

  /// An ordered set of control points.
  ///
  /// The set accepts every individually valid point.  Conflicts
  /// between points are resolved by usable_points(), which is what the
  /// transform solver consumes.
  class ControlPointSet {
    std::vector<ControlPoint> m_points;
  public:
    typedef std::vector<ControlPoint>::const_iterator const_iterator;

    ControlPointSet() {}
    explicit ControlPointSet( std::vector<ControlPoint> const& points ) : m_points(points) {}

    void push_back( ControlPoint const& cp ) { m_points.push_back(cp); }
    size_t size() const { return m_points.size(); }
    bool empty() const { return m_points.empty(); }
    ControlPoint const& operator[]( size_t i ) const { return m_points[i]; }
    const_iterator begin() const { return m_points.begin(); }
    const_iterator end() const { return m_points.end(); }

    /// Returns the points with exact duplicates collapsed, in first
    /// appearance order.  Throws DegenerateControlPointsErr if two
    /// points share a pixel but not a location, or share a location
    /// but not a pixel.
    std::vector<ControlPoint> usable_points() const;

    /// Parses a document of the form
    ///   {"points":[{"image":{"x":..,"y":..},"map":{"lat":..,"lng":..}}, ...]}
    /// Numbers may also be given as numeric strings.  Throws InputErr
    /// on malformed input.
    static ControlPointSet from_json( std::string const& text );

    /// Reads and parses a file with from_json().  Throws IOErr if the
    /// file cannot be read.
    static ControlPointSet from_json_file( std::string const& filename );
  };

  std::ostream& operator<<( std::ostream& os, ControlPointSet const& set );

}} // namespace tw::cartography

#endif // __TW_CARTOGRAPHY_CONTROLPOINT_H__
