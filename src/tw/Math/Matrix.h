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


/// \file Math/Matrix.h
///
/// Provides a dynamically-sized dense matrix class.
///
/// Elements are stored in row-major order and accessed with
/// operator()(row, col).  The matrix is sized at construction or with
/// set_size().
///
#ifndef __TW_MATH_MATRIX_H__
#define __TW_MATH_MATRIX_H__

#include <tw/Core/Exception.h>
#include <tw/Core/FundamentalTypes.h>

#include <vector>
#include <ostream>
#include <algorithm>

namespace tw {
namespace math {

  template <class ElemT>
  class Matrix {
    std::vector<ElemT> m_data;
    size_t m_rows, m_cols;

  public:
    typedef ElemT value_type;
    typedef typename std::vector<ElemT>::iterator iterator;
    typedef typename std::vector<ElemT>::const_iterator const_iterator;

    /// Constructs an empty matrix.
    Matrix() : m_rows(0), m_cols(0) {}

    /// Constructs a zero matrix of the given size.
    Matrix( size_t rows, size_t cols ) : m_data(rows*cols, ElemT()), m_rows(rows), m_cols(cols) {}

    size_t rows() const { return m_rows; }
    size_t cols() const { return m_cols; }

    /// Change the size of the matrix.  Elements in memory are
    /// preserved only when preserve is set.
    void set_size( size_t new_rows, size_t new_cols, bool preserve = false ) {
      if (preserve) {
        std::vector<ElemT> data(new_rows*new_cols, ElemT());
        for (size_t i = 0; i < std::min(m_rows, new_rows); ++i)
          for (size_t j = 0; j < std::min(m_cols, new_cols); ++j)
            data[i*new_cols + j] = m_data[i*m_cols + j];
        m_data.swap(data);
      } else {
        m_data.assign(new_rows*new_cols, ElemT());
      }
      m_rows = new_rows;
      m_cols = new_cols;
    }

    void set_zero() { std::fill( m_data.begin(), m_data.end(), ElemT() ); }

    ElemT& operator()( size_t row, size_t col ) {
      TW_DEBUG_ASSERT( row < m_rows && col < m_cols, LogicErr() << "Matrix index out of range" );
      return m_data[row*m_cols + col];
    }
    ElemT const& operator()( size_t row, size_t col ) const {
      TW_DEBUG_ASSERT( row < m_rows && col < m_cols, LogicErr() << "Matrix index out of range" );
      return m_data[row*m_cols + col];
    }

    ElemT* data() { return m_rows*m_cols ? &m_data[0] : 0; }
    ElemT const* data() const { return m_rows*m_cols ? &m_data[0] : 0; }

    iterator begin() { return m_data.begin(); }
    iterator end() { return m_data.end(); }
    const_iterator begin() const { return m_data.begin(); }
    const_iterator end() const { return m_data.end(); }
  };

  /// Matrix product.
  template <class ElemT>
  Matrix<ElemT> operator*( Matrix<ElemT> const& a, Matrix<ElemT> const& b ) {
    TW_ASSERT( a.cols() == b.rows(),
               ArgumentErr() << "Matrix product: inner dimensions " << a.cols() << " and " << b.rows() << " differ" );
    Matrix<ElemT> result( a.rows(), b.cols() );
    for (size_t i = 0; i < a.rows(); ++i)
      for (size_t k = 0; k < a.cols(); ++k) {
        ElemT aik = a(i,k);
        for (size_t j = 0; j < b.cols(); ++j)
          result(i,j) += aik * b(k,j);
      }
    return result;
  }

  template <class ElemT>
  Matrix<ElemT> transpose( Matrix<ElemT> const& m ) {
    Matrix<ElemT> result( m.cols(), m.rows() );
    for (size_t i = 0; i < m.rows(); ++i)
      for (size_t j = 0; j < m.cols(); ++j)
        result(j,i) = m(i,j);
    return result;
  }

  template <class ElemT>
  std::ostream& operator<<( std::ostream& os, Matrix<ElemT> const& m ) {
    os << "Matrix" << m.rows() << 'x' << m.cols() << '(';
    for (size_t i = 0; i < m.rows(); ++i) {
      os << '(';
      for (size_t j = 0; j < m.cols(); ++j) {
        if (j) os << ',';
        os << m(i,j);
      }
      os << ')';
    }
    return os << ')';
  }

} // namespace math

  using math::Matrix;

} // namespace tw

#endif // __TW_MATH_MATRIX_H__
