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


/// \file ThinPlateSpline.h
///
/// A two dimensional thin-plate spline: the smooth map R^2 -> R^2 of
/// minimal bending energy that passes exactly through a set of point
/// correspondences.
///
/// With n source points p_i the spline is
///
///   f(p) = a0 + a1*x + a2*y + sum_i w_i U(|p - p_i|^2),   U(d) = d log d
///
/// where the weights and the affine part come from one (n+3)x(n+3)
/// linear system solved for both output coordinates at once.  Source
/// coordinates are centered and scaled to unit extent before solving.
///
#ifndef __TW_CARTOGRAPHY_THINPLATESPLINE_H__
#define __TW_CARTOGRAPHY_THINPLATESPLINE_H__

#include <tw/Math/Matrix.h>
#include <tw/Math/Vector.h>

#include <vector>

namespace tw {
namespace cartography {

  class ThinPlateSpline {
    std::vector<Vector2> m_points;   // normalized source points
    Vector2 m_src_offset, m_dst_offset;
    double m_src_scale;
    math::Matrix<double> m_coeffs;   // (n+3) x 2

    Vector2 normalize( Vector2 const& p ) const {
      return (p - m_src_offset) * m_src_scale;
    }

  public:
    /// Default constructor, does not generate a usable object.
    ThinPlateSpline() : m_src_scale(1.0) {}

    /// Fits the spline with from[i] -> to[i].  Throws ArgumentErr if
    /// the lists differ in length, InsufficientControlPointsErr with
    /// fewer than three points, and DegenerateControlPointsErr when the
    /// source points are collinear or the system is singular.
    ThinPlateSpline( std::vector<Vector2> const& from, std::vector<Vector2> const& to );

    /// Evaluates the spline.
    Vector2 operator()( Vector2 const& p ) const;

    size_t size() const { return m_points.size(); }
  };

  /// True if the points lie on one line, up to rounding: the
  /// determinant of their scatter matrix vanishes relative to its
  /// trace squared.  Thin strips of points are not collinear.
  bool collinear( std::vector<Vector2> const& points );

}} // namespace tw::cartography

#endif // __TW_CARTOGRAPHY_THINPLATESPLINE_H__
