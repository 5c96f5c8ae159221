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


/// \file Math/BBox.h
///
/// Provides a two-dimensional axis-aligned bounding box class.
///
/// A box covers the half-open region [min, max): contains() is true
/// for points on the minimal edges but not on the maximal ones, so
/// BBox2i(0,0,256,256) holds exactly the pixels of one tile.
///
#ifndef __TW_MATH_BBOX_H__
#define __TW_MATH_BBOX_H__

#include <tw/Math/Vector.h>

#include <boost/numeric/conversion/bounds.hpp>

#include <algorithm>
#include <cmath>
#include <ostream>

namespace tw {
namespace math {

  template <class RealT>
  class BBox {
  public:

    /// Default constructor.  Constructs the ultimate empty bounding
    /// box, whose limits are at the opposite corners of the underlying
    /// numeric space.  This is a useful starting point if you intend
    /// to grow your bounding box to fit a collection of items.
    BBox() {
      m_min[0] = m_min[1] = boost::numeric::bounds<RealT>::highest();
      m_max[0] = m_max[1] = boost::numeric::bounds<RealT>::lowest();
    }

    /// Constructs a bounding box with the given minimal and maximal points.
    BBox( Vector<RealT,2> const& min, Vector<RealT,2> const& max ) : m_min(min), m_max(max) {}

    /// Constructs a bounding box with the given minimal point
    /// coordinates and dimensions.
    BBox( RealT minx, RealT miny, RealT width, RealT height )
      : m_min(minx, miny), m_max(minx + width, miny + height) {}

    /// Returns true if the bounding box is empty (i.e. degenerate).
    bool empty() const { return !( m_min[0] < m_max[0] && m_min[1] < m_max[1] ); }

    Vector<RealT,2> const& min() const { return m_min; }
    Vector<RealT,2>      & min()       { return m_min; }
    Vector<RealT,2> const& max() const { return m_max; }
    Vector<RealT,2>      & max()       { return m_max; }

    RealT width () const { return m_max[0] - m_min[0]; }
    RealT height() const { return m_max[1] - m_min[1]; }
    Vector<RealT,2> size() const { return m_max - m_min; }
    Vector<RealT,2> center() const { return Vector<RealT,2>( (m_min[0]+m_max[0])/2, (m_min[1]+m_max[1])/2 ); }

    /// Grows the box to include the given point.
    void grow( Vector<RealT,2> const& point ) {
      for (size_t i = 0; i < 2; ++i) {
        m_min[i] = std::min( m_min[i], point[i] );
        m_max[i] = std::max( m_max[i], point[i] );
      }
    }

    /// Grows the box to include the given box.
    void grow( BBox const& bbox ) {
      if (bbox.empty()) return;
      grow( bbox.min() );
      grow( bbox.max() );
    }

    /// Crops (intersects) this box to the given box.
    void crop( BBox const& bbox ) {
      for (size_t i = 0; i < 2; ++i) {
        m_min[i] = std::max( m_min[i], bbox.min()[i] );
        m_max[i] = std::min( m_max[i], bbox.max()[i] );
      }
    }

    /// Expands the box by the given offset in every direction.
    void expand( RealT offset ) {
      m_min -= Vector<RealT,2>( offset, offset );
      m_max += Vector<RealT,2>( offset, offset );
    }

    /// Returns true if the given point lies in [min, max).
    bool contains( Vector<RealT,2> const& point ) const {
      return m_min[0] <= point[0] && point[0] < m_max[0]
          && m_min[1] <= point[1] && point[1] < m_max[1];
    }

    /// Returns true if the given box lies entirely inside this one.
    bool contains( BBox const& bbox ) const {
      return m_min[0] <= bbox.min()[0] && bbox.max()[0] <= m_max[0]
          && m_min[1] <= bbox.min()[1] && bbox.max()[1] <= m_max[1];
    }

    /// Returns true if the interiors of the two boxes overlap.
    bool intersects( BBox const& bbox ) const {
      return m_min[0] < bbox.max()[0] && bbox.min()[0] < m_max[0]
          && m_min[1] < bbox.max()[1] && bbox.min()[1] < m_max[1];
    }

  protected:
    Vector<RealT,2> m_min, m_max;
  };

  template <class RealT>
  inline bool operator==( BBox<RealT> const& b1, BBox<RealT> const& b2 ) {
    return b1.min() == b2.min() && b1.max() == b2.max();
  }

  template <class RealT>
  inline bool operator!=( BBox<RealT> const& b1, BBox<RealT> const& b2 ) {
    return !( b1 == b2 );
  }

  template <class RealT>
  inline std::ostream& operator<<( std::ostream& os, BBox<RealT> const& bbox ) {
    return os << "(" << bbox.min() << "-" << bbox.max() << ")";
  }

  /// The smallest integer box that covers a floating point box.
  inline BBox<int32> grow_bbox_to_int( BBox<float64> const& bbox ) {
    Vector<int32,2> min( int32(std::floor(bbox.min()[0])), int32(std::floor(bbox.min()[1])) );
    Vector<int32,2> max( int32(std::ceil (bbox.max()[0])), int32(std::ceil (bbox.max()[1])) );
    return BBox<int32>( min, max );
  }

} // namespace math

  using math::BBox;
  typedef BBox<float64> BBox2;
  typedef BBox<int32>   BBox2i;

} // namespace tw

#endif // __TW_MATH_BBOX_H__
