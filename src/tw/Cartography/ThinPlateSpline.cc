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


#include <tw/Cartography/ThinPlateSpline.h>
#include <tw/Core/Exception.h>
#include <tw/Core/Log.h>
#include <tw/Math/BBox.h>
#include <tw/Math/LinearAlgebra.h>

#include <boost/math/special_functions/fpclassify.hpp>

#include <algorithm>
#include <cmath>

namespace {
  // U(d) with d the squared distance.
  inline double base_func( tw::Vector2 const& a, tw::Vector2 const& b ) {
    double d = tw::math::norm_2_sqr( a - b );
    if (d == 0)
      return 0;
    return d * std::log(d);
  }
}

namespace tw {
namespace cartography {

  bool collinear( std::vector<Vector2> const& points ) {
    const size_t n = points.size();
    if (n < 3)
      return true;

    Vector2 mean;
    for (size_t i = 0; i < n; ++i)
      mean += points[i];
    mean /= double(n);

    // The scatter matrix of a set spread over a line has rank one.
    double ssxx = 0, ssyy = 0, ssxy = 0;
    for (size_t i = 0; i < n; ++i) {
      Vector2 d = points[i] - mean;
      ssxx += d[0]*d[0];
      ssyy += d[1]*d[1];
      ssxy += d[0]*d[1];
    }
    double trace = ssxx + ssyy;
    if (trace <= 0)
      return true;
    return ssxx*ssyy - ssxy*ssxy <= 1e-12 * trace*trace;
  }

  ThinPlateSpline::ThinPlateSpline( std::vector<Vector2> const& from, std::vector<Vector2> const& to )
    : m_src_scale(1.0) {
    TW_ASSERT( from.size() == to.size(),
               ArgumentErr() << "ThinPlateSpline: " << from.size() << " source points but "
               << to.size() << " destination points." );
    const size_t n = from.size();
    if (n < 3)
      tw_throw( InsufficientControlPointsErr() << "A thin-plate spline needs at least 3 points, got " << n << "." );
    if (collinear( from ))
      tw_throw( DegenerateControlPointsErr() << "Control points are collinear." );

    // Center and scale the source points so the system is well
    // conditioned whatever the units.
    BBox2 extent;
    for (size_t i = 0; i < n; ++i) {
      extent.grow( from[i] );
      m_src_offset += from[i];
      m_dst_offset += to[i];
    }
    m_src_offset /= double(n);
    m_dst_offset /= double(n);
    m_src_scale = 1.0 / std::max( extent.width(), extent.height() );

    m_points.resize( n );
    for (size_t i = 0; i < n; ++i)
      m_points[i] = normalize( from[i] );

    //  [ K   P ] [ w ]   [ v ]
    //  [ P^T 0 ] [ a ] = [ 0 ]
    math::Matrix<double> A( n+3, n+3 ), B( n+3, 2 );
    for (size_t r = 0; r < n; ++r) {
      for (size_t c = r+1; c < n; ++c)
        A(r,c) = A(c,r) = base_func( m_points[r], m_points[c] );
      A(r,n)   = A(n,r)   = 1.0;
      A(r,n+1) = A(n+1,r) = m_points[r][0];
      A(r,n+2) = A(n+2,r) = m_points[r][1];
      B(r,0) = to[r][0] - m_dst_offset[0];
      B(r,1) = to[r][1] - m_dst_offset[1];
    }

    try {
      m_coeffs = math::solve( A, B );
    } catch (const MathErr& e) {
      tw_throw( DegenerateControlPointsErr() << "Thin-plate spline system is singular: " << e.desc() );
    }
    for (math::Matrix<double>::const_iterator it = m_coeffs.begin(); it != m_coeffs.end(); ++it)
      if (!boost::math::isfinite(*it))
        tw_throw( DegenerateControlPointsErr() << "Thin-plate spline system is singular." );

    TW_OUT(VerboseDebugMessage, "cartography") << "ThinPlateSpline: fit " << n << " points, affine part ["
      << m_coeffs(n,0) << " " << m_coeffs(n+1,0) << " " << m_coeffs(n+2,0) << "; "
      << m_coeffs(n,1) << " " << m_coeffs(n+1,1) << " " << m_coeffs(n+2,1) << "]\n";
  }

  Vector2 ThinPlateSpline::operator()( Vector2 const& p ) const {
    const size_t n = m_points.size();
    Vector2 q = normalize( p );
    Vector2 result( m_coeffs(n,0) + m_coeffs(n+1,0)*q[0] + m_coeffs(n+2,0)*q[1],
                    m_coeffs(n,1) + m_coeffs(n+1,1)*q[0] + m_coeffs(n+2,1)*q[1] );
    for (size_t i = 0; i < n; ++i) {
      double u = base_func( q, m_points[i] );
      result[0] += m_coeffs(i,0) * u;
      result[1] += m_coeffs(i,1) * u;
    }
    return result + m_dst_offset;
  }

}} // namespace tw::cartography
