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


/// \file Math/Vector.h
///
/// Provides a fixed-size mathematical vector class.
///
/// The vector classes are intended to be used in the places where
/// TileWarp handles coordinates: pixel positions, geographic (lon,
/// lat) pairs, projected (x, y) points and tile addresses.  Elements
/// are accessed with operator[] or the x()/y()/z() shorthands.
///
/// Supported operations:
///   Elementwise sum and difference of two vectors
///   Products and quotients of a vector and a scalar
///   Equality and inequality tests
///   Norms via norm_2() and norm_2_sqr()
///   Dot products via dot_prod()
///
#ifndef __TW_MATH_VECTOR_H__
#define __TW_MATH_VECTOR_H__

#include <tw/Core/FundamentalTypes.h>

#include <boost/array.hpp>
#include <boost/static_assert.hpp>
#include <boost/math/special_functions/fpclassify.hpp>

#include <cmath>
#include <ostream>
#include <algorithm>

namespace tw {
namespace math {

  /// A fixed-dimension mathematical vector class.
  template <class ElemT, size_t SizeN>
  class Vector {
    BOOST_STATIC_ASSERT( SizeN > 0 );
    typedef boost::array<ElemT,SizeN> core_type;
    core_type core_;

  public:
    typedef ElemT value_type;
    typedef ElemT& reference_type;
    typedef ElemT const& const_reference_type;
    typedef typename core_type::iterator iterator;
    typedef typename core_type::const_iterator const_iterator;

    /// Constructs a vector of zeroes.
    Vector() {
      std::fill( begin(), end(), ElemT() );
    }

    /// Constructs a two-element vector.
    Vector( ElemT e1, ElemT e2 ) {
      BOOST_STATIC_ASSERT( SizeN == 2 );
      core_[0] = e1; core_[1] = e2;
    }

    /// Constructs a three-element vector.
    Vector( ElemT e1, ElemT e2, ElemT e3 ) {
      BOOST_STATIC_ASSERT( SizeN == 3 );
      core_[0] = e1; core_[1] = e2; core_[2] = e3;
    }

    /// Converts from a vector with a different element type.
    template <class OtherT>
    explicit Vector( Vector<OtherT,SizeN> const& v ) {
      for (size_t i = 0; i < SizeN; ++i)
        core_[i] = static_cast<ElemT>(v[i]);
    }

    size_t size() const { return SizeN; }

    reference_type operator[]( size_t i ) { return core_[i]; }
    const_reference_type operator[]( size_t i ) const { return core_[i]; }

    reference_type x() { return core_[0]; }
    const_reference_type x() const { return core_[0]; }
    reference_type y() { BOOST_STATIC_ASSERT( SizeN >= 2 ); return core_[1]; }
    const_reference_type y() const { BOOST_STATIC_ASSERT( SizeN >= 2 ); return core_[1]; }
    reference_type z() { BOOST_STATIC_ASSERT( SizeN >= 3 ); return core_[2]; }
    const_reference_type z() const { BOOST_STATIC_ASSERT( SizeN >= 3 ); return core_[2]; }

    iterator begin() { return core_.begin(); }
    iterator end() { return core_.end(); }
    const_iterator begin() const { return core_.begin(); }
    const_iterator end() const { return core_.end(); }

    Vector& operator+=( Vector const& v ) {
      for (size_t i = 0; i < SizeN; ++i) core_[i] += v[i];
      return *this;
    }
    Vector& operator-=( Vector const& v ) {
      for (size_t i = 0; i < SizeN; ++i) core_[i] -= v[i];
      return *this;
    }
    Vector& operator*=( ElemT s ) {
      for (size_t i = 0; i < SizeN; ++i) core_[i] *= s;
      return *this;
    }
    Vector& operator/=( ElemT s ) {
      for (size_t i = 0; i < SizeN; ++i) core_[i] /= s;
      return *this;
    }
  };

  template <class ElemT, size_t SizeN>
  inline Vector<ElemT,SizeN> operator+( Vector<ElemT,SizeN> v1, Vector<ElemT,SizeN> const& v2 ) {
    return v1 += v2;
  }

  template <class ElemT, size_t SizeN>
  inline Vector<ElemT,SizeN> operator-( Vector<ElemT,SizeN> v1, Vector<ElemT,SizeN> const& v2 ) {
    return v1 -= v2;
  }

  template <class ElemT, size_t SizeN>
  inline Vector<ElemT,SizeN> operator-( Vector<ElemT,SizeN> v ) {
    for (size_t i = 0; i < SizeN; ++i) v[i] = -v[i];
    return v;
  }

  template <class ElemT, size_t SizeN>
  inline Vector<ElemT,SizeN> operator*( Vector<ElemT,SizeN> v, ElemT s ) {
    return v *= s;
  }

  template <class ElemT, size_t SizeN>
  inline Vector<ElemT,SizeN> operator*( ElemT s, Vector<ElemT,SizeN> v ) {
    return v *= s;
  }

  template <class ElemT, size_t SizeN>
  inline Vector<ElemT,SizeN> operator/( Vector<ElemT,SizeN> v, ElemT s ) {
    return v /= s;
  }

  /// Equality of two vectors.  Exact for floating point elements.
  template <class ElemT, size_t SizeN>
  inline bool operator==( Vector<ElemT,SizeN> const& v1, Vector<ElemT,SizeN> const& v2 ) {
    return std::equal( v1.begin(), v1.end(), v2.begin() );
  }

  template <class ElemT, size_t SizeN>
  inline bool operator!=( Vector<ElemT,SizeN> const& v1, Vector<ElemT,SizeN> const& v2 ) {
    return !( v1 == v2 );
  }

  /// Lexicographic ordering, so vectors can key a std::map.
  template <class ElemT, size_t SizeN>
  inline bool operator<( Vector<ElemT,SizeN> const& v1, Vector<ElemT,SizeN> const& v2 ) {
    return std::lexicographical_compare( v1.begin(), v1.end(), v2.begin(), v2.end() );
  }

  template <class ElemT, size_t SizeN>
  inline double dot_prod( Vector<ElemT,SizeN> const& v1, Vector<ElemT,SizeN> const& v2 ) {
    double result = 0;
    for (size_t i = 0; i < SizeN; ++i)
      result += double(v1[i]) * double(v2[i]);
    return result;
  }

  template <class ElemT, size_t SizeN>
  inline double norm_2_sqr( Vector<ElemT,SizeN> const& v ) {
    return dot_prod( v, v );
  }

  template <class ElemT, size_t SizeN>
  inline double norm_2( Vector<ElemT,SizeN> const& v ) {
    return std::sqrt( norm_2_sqr( v ) );
  }

  /// Elementwise test that every entry is a finite number.
  template <class ElemT, size_t SizeN>
  inline bool is_finite( Vector<ElemT,SizeN> const& v ) {
    for (size_t i = 0; i < SizeN; ++i)
      if (!(boost::math::isfinite)(double(v[i])))
        return false;
    return true;
  }

  /// Prints "Vector2(1,2)".
  template <class ElemT, size_t SizeN>
  inline std::ostream& operator<<( std::ostream& os, Vector<ElemT,SizeN> const& v ) {
    os << "Vector" << SizeN << "(";
    for (size_t i = 0; i < SizeN; ++i) {
      if (i) os << ",";
      os << v[i];
    }
    return os << ")";
  }

} // namespace math

  using math::Vector;
  typedef Vector<float64,2> Vector2;
  typedef Vector<float64,3> Vector3;
  typedef Vector<int32,2>   Vector2i;
  typedef Vector<int32,3>   Vector3i;

} // namespace tw

#endif // __TW_MATH_VECTOR_H__
