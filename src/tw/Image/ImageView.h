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


/// \file ImageView.h
///
/// Defines the core in-memory image view type.
///
#ifndef __TW_IMAGE_IMAGEVIEW_H__
#define __TW_IMAGE_IMAGEVIEW_H__

#include <tw/Core/Exception.h>
#include <tw/Core/FundamentalTypes.h>

#include <boost/smart_ptr.hpp>

#include <algorithm>
#include <cstddef>

namespace tw {

  /// The standard image container for in-memory image data.
  ///
  /// The ImageView object does not contain the image data itself but
  /// rather a pointer to it.  More than one ImageView object can point
  /// to the same data: copying an ImageView is a shallow, lightweight
  /// operation and the underlying buffer is reference counted.  Use
  /// copy() when an independent buffer is needed.
  ///
  /// Pixels are stored planar: all of plane 0 in row-major order, then
  /// plane 1, and so on.
  template <class PixelT>
  class ImageView {
    boost::shared_array<PixelT> m_data;
    int32 m_cols, m_rows, m_planes;
    PixelT *m_origin;
    ptrdiff_t m_cstride, m_rstride, m_pstride;

  public:
    /// The pixel type of the image.
    typedef PixelT pixel_type;

    /// Constructs an empty image with zero size.
    ImageView()
      : m_cols(0), m_rows(0), m_planes(0), m_origin(0), m_cstride(0),
        m_rstride(0), m_pstride(0) {}

    /// Constructs an image with the given dimensions, every pixel set
    /// to the default-constructed value.
    ImageView( int32 cols, int32 rows, int32 planes=1 )
      : m_cols(0), m_rows(0), m_planes(0), m_origin(0), m_cstride(0),
        m_rstride(0), m_pstride(0) {
      set_size( cols, rows, planes );
    }

    /// Returns the number of columns in the image.
    inline int32 cols() const { return m_cols; }

    /// Returns the number of rows in the image.
    inline int32 rows() const { return m_rows; }

    /// Returns the number of planes in the image.
    inline int32 planes() const { return m_planes; }

    /// Returns the pixel at the given position in the given plane.
    inline PixelT& operator()( int32 col, int32 row, int32 plane=0 ) {
      return *(m_origin + col*m_cstride + row*m_rstride + plane*m_pstride);
    }

    inline PixelT const& operator()( int32 col, int32 row, int32 plane=0 ) const {
      return *(m_origin + col*m_cstride + row*m_rstride + plane*m_pstride);
    }

    /// Adjusts the size of the image, allocating a new buffer if the
    /// size has changed.  A new buffer is filled with the
    /// default-constructed pixel value.
    void set_size( int32 cols, int32 rows, int32 planes = 1 ) {
      TW_ASSERT( cols >= 0 && rows >= 0 && planes >= 0,
                 ArgumentErr() << "Cannot allocate image with negative dimensions "
                 << cols << "x" << rows << "x" << planes );
      if( cols==m_cols && rows==m_rows && planes==m_planes ) return;

      size_t size = size_t(cols)*size_t(rows)*size_t(planes);
      if( size==0 ) {
        m_data.reset();
      }
      else {
        boost::shared_array<PixelT> data( new PixelT[size] );
        std::fill( data.get(), data.get()+size, PixelT() );
        m_data = data;
      }

      m_cols = cols;
      m_rows = rows;
      m_planes = planes;
      m_origin = m_data.get();
      m_cstride = 1;
      m_rstride = cols;
      m_pstride = ptrdiff_t(rows)*cols;
    }

    /// Resets to an empty image with zero size.
    void reset() {
      m_data.reset();
      m_cols = m_rows = m_planes = 0;
      m_origin = 0;
      m_cstride = m_rstride = m_pstride = 0;
    }

    /// Sets every pixel of every plane to the given value.
    void fill( PixelT const& value ) {
      std::fill( m_origin, m_origin + num_pixels(), value );
    }

    /// Total pixel count across all planes.
    size_t num_pixels() const { return size_t(m_cols)*size_t(m_rows)*size_t(m_planes); }

    /// Returns a pointer to the origin of the image in memory.
    PixelT* data() { return m_origin; }
    PixelT const* data() const { return m_origin; }

    /// True if this ImageView points to a valid block of memory.
    bool is_valid() const { return m_origin != 0; }
  };

  /// Returns a deep copy of the given image.
  template <class PixelT>
  ImageView<PixelT> copy( ImageView<PixelT> const& src ) {
    ImageView<PixelT> result( src.cols(), src.rows(), src.planes() );
    if (src.num_pixels())
      std::copy( src.data(), src.data() + src.num_pixels(), result.data() );
    return result;
  }

  /// Returns true if the two images have the same size and pixels.
  template <class PixelT>
  bool operator==( ImageView<PixelT> const& a, ImageView<PixelT> const& b ) {
    if (a.cols() != b.cols() || a.rows() != b.rows() || a.planes() != b.planes())
      return false;
    return std::equal( a.data(), a.data() + a.num_pixels(), b.data() );
  }

  template <class PixelT>
  bool operator!=( ImageView<PixelT> const& a, ImageView<PixelT> const& b ) {
    return !( a == b );
  }

} // namespace tw

#endif // __TW_IMAGE_IMAGEVIEW_H__
