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


#include <tw/Cartography/ControlPoint.h>
#include <tw/Core/Exception.h>
#include <tw/Core/Log.h>

#include <json/json.h>

#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/math/special_functions/fpclassify.hpp>

#include <fstream>
#include <sstream>

namespace tw {
namespace cartography {

  ControlPoint::ControlPoint( Vector2 const& pixel, double lat, double lng )
    : m_pixel(pixel), m_lonlat(lng, lat) {
    if (!is_finite(pixel) || pixel[0] < 0 || pixel[1] < 0)
      tw_throw( InputErr() << "Control point pixel " << pixel << " must be non-negative." );
    if (!(lat >= -90 && lat <= 90))
      tw_throw( InputErr() << "Control point latitude " << lat << " is outside [-90,90]." );
    if (!(lng >= -180 && lng <= 180))
      tw_throw( InputErr() << "Control point longitude " << lng << " is outside [-180,180]." );
  }

  bool operator==( ControlPoint const& a, ControlPoint const& b ) {
    return a.pixel() == b.pixel() && a.lonlat() == b.lonlat();
  }

  std::ostream& operator<<( std::ostream& os, ControlPoint const& cp ) {
    return os << "ControlPoint(pixel=" << cp.pixel() << ", lat=" << cp.lat() << ", lng=" << cp.lng() << ")";
  }

  std::vector<ControlPoint> ControlPointSet::usable_points() const {
    std::vector<ControlPoint> result;
    for (const_iterator it = begin(); it != end(); ++it) {
      bool duplicate = false;
      for (size_t i = 0; i < result.size(); ++i) {
        bool same_pixel = result[i].pixel() == it->pixel();
        bool same_geo = result[i].lonlat() == it->lonlat();
        if (same_pixel && same_geo) {
          duplicate = true;
          break;
        }
        if (same_pixel)
          tw_throw( DegenerateControlPointsErr() << "Pixel " << it->pixel()
                    << " is tied to two locations: " << result[i] << " and " << *it );
        if (same_geo)
          tw_throw( DegenerateControlPointsErr() << "Location (" << it->lat() << "," << it->lng()
                    << ") is tied to two pixels: " << result[i] << " and " << *it );
      }
      if (duplicate) {
        TW_OUT(DebugMessage, "cartography") << "Dropping duplicate " << *it << "\n";
      } else {
        result.push_back( *it );
      }
    }
    return result;
  }

  namespace {

    Json::Value const& member( Json::Value const& obj, const char* key, std::string const& where ) {
      if (!obj.isObject() || !obj.isMember(key))
        tw_throw( InputErr() << "Control points: " << where << " is missing \"" << key << "\"." );
      return obj[key];
    }

    double number( Json::Value const& obj, const char* key, std::string const& where ) {
      Json::Value const& v = member( obj, key, where );
      double result = 0;
      if (v.isNumeric() && !v.isBool()) {
        result = v.asDouble();
      } else if (v.isString()) {
        std::string s = boost::algorithm::trim_copy( v.asString() );
        try {
          result = boost::lexical_cast<double>( s );
        } catch (const boost::bad_lexical_cast&) {
          tw_throw( InputErr() << "Control points: " << where << "." << key
                    << " is not a number: \"" << v.asString() << "\"." );
        }
      } else {
        tw_throw( InputErr() << "Control points: " << where << "." << key << " is not a number." );
      }
      if (!boost::math::isfinite(result))
        tw_throw( InputErr() << "Control points: " << where << "." << key << " is not finite." );
      return result;
    }

  } // anonymous namespace

  ControlPointSet ControlPointSet::from_json( std::string const& text ) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errs;
    std::istringstream stream( text );
    if (!Json::parseFromStream( builder, stream, &root, &errs ))
      tw_throw( InputErr() << "Control points: invalid JSON: " << errs );

    Json::Value const& points = member( root, "points", "document" );
    if (!points.isArray())
      tw_throw( InputErr() << "Control points: \"points\" must be an array." );

    ControlPointSet result;
    for (Json::ArrayIndex i = 0; i < points.size(); ++i) {
      std::ostringstream where;
      where << "points[" << i << "]";
      Json::Value const& image = member( points[i], "image", where.str() );
      Json::Value const& map = member( points[i], "map", where.str() );
      double x = number( image, "x", where.str() + ".image" );
      double y = number( image, "y", where.str() + ".image" );
      double lat = number( map, "lat", where.str() + ".map" );
      double lng = number( map, "lng", where.str() + ".map" );
      result.push_back( ControlPoint( Vector2(x, y), lat, lng ) );
    }

    TW_OUT(DebugMessage, "cartography") << "Parsed " << result << "\n";
    return result;
  }

  ControlPointSet ControlPointSet::from_json_file( std::string const& filename ) {
    std::ifstream f( filename.c_str() );
    if (!f)
      tw_throw( IOErr() << "Could not open control point file \"" << filename << "\"." );
    std::ostringstream text;
    text << f.rdbuf();
    return from_json( text.str() );
  }

  std::ostream& operator<<( std::ostream& os, ControlPointSet const& set ) {
    os << "ControlPointSet(" << set.size() << " points)";
    return os;
  }

}} // namespace tw::cartography
