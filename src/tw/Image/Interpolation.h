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


/// \file Interpolation.h
///
/// Sampling of 8-bit planar images at non-integer positions.
///
/// Positions are in pixel-corner coordinates: pixel (i,j) covers the
/// square [i,i+1) x [j,j+1) and its center is (i+0.5, j+0.5).  A
/// position outside [0,cols] x [0,rows] has no sample.
///
/// Every sampler takes a validity functor valid(i,j) that says whether
/// the pixel (i,j) holds data.  Pixels outside the image are never
/// valid.  Invalid neighbours contribute nothing, and the bilinear
/// weights of the remaining neighbours are renormalized to sum to one.
///
#ifndef __TW_IMAGE_INTERPOLATION_H__
#define __TW_IMAGE_INTERPOLATION_H__

#include <tw/Image/ImageView.h>

#include <algorithm>
#include <cmath>
#include <string>

namespace tw {

  /// Runtime choice of sampling kernel.
  enum InterpolationKernel {
    NearestPixelKernel,
    BilinearKernel
  };

  /// Parses "nearest" or "bilinear".  Throws ArgumentErr otherwise.
  InterpolationKernel interpolation_kernel_from_string( std::string const& name );

  /// The inverse of interpolation_kernel_from_string.
  std::string interpolation_kernel_name( InterpolationKernel kernel );

  /// Every pixel inside the image is valid.
  struct AllValid {
    bool operator()( int32 /*i*/, int32 /*j*/ ) const { return true; }
  };

  /// A pixel is valid where the given plane of a mask image is nonzero.
  struct PlaneValid {
    ImageView<uint8> const& m_mask;
    int32 m_plane;
    PlaneValid( ImageView<uint8> const& mask, int32 plane ) : m_mask(mask), m_plane(plane) {}
    bool operator()( int32 i, int32 j ) const { return m_mask(i, j, m_plane) != 0; }
  };

  /// True if (u,v) lies on the image in pixel-corner coordinates.
  inline bool sample_in_bounds( int32 cols, int32 rows, double u, double v ) {
    return u >= 0 && v >= 0 && u <= cols && v <= rows;
  }

  /// Nearest-pixel sampling.  Returns the pixel that contains (u,v);
  /// the far edges belong to the last row and column.
  struct NearestPixelInterpolation {
    template <class ValidT>
    bool operator()( ImageView<uint8> const& img, double u, double v,
                     ValidT const& valid, uint8* out ) const {
      if (!sample_in_bounds( img.cols(), img.rows(), u, v ))
        return false;
      int32 i = std::min( int32(std::floor(u)), img.cols()-1 );
      int32 j = std::min( int32(std::floor(v)), img.rows()-1 );
      if (!valid(i, j))
        return false;
      for (int32 p = 0; p < img.planes(); ++p)
        out[p] = img(i, j, p);
      return true;
    }
  };

  /// Bilinear sampling over the four pixel centers surrounding (u,v).
  /// Each plane is rounded to the nearest integer.
  struct BilinearInterpolation {
    template <class ValidT>
    bool operator()( ImageView<uint8> const& img, double u, double v,
                     ValidT const& valid, uint8* out ) const {
      if (!sample_in_bounds( img.cols(), img.rows(), u, v ))
        return false;

      const double x = u - 0.5, y = v - 0.5;
      const int32 x0 = int32(std::floor(x)), y0 = int32(std::floor(y));
      const double fx = x - x0, fy = y - y0;

      const int32 ni[4] = { x0, x0+1, x0,   x0+1 };
      const int32 nj[4] = { y0, y0,   y0+1, y0+1 };
      const double w[4] = { (1-fx)*(1-fy), fx*(1-fy), (1-fx)*fy, fx*fy };

      double weight_sum = 0;
      bool use[4];
      for (int k = 0; k < 4; ++k) {
        use[k] = w[k] > 0 && ni[k] >= 0 && nj[k] >= 0 &&
                 ni[k] < img.cols() && nj[k] < img.rows() && valid(ni[k], nj[k]);
        if (use[k])
          weight_sum += w[k];
      }
      if (weight_sum <= 0)
        return false;

      for (int32 p = 0; p < img.planes(); ++p) {
        double value = 0;
        for (int k = 0; k < 4; ++k)
          if (use[k])
            value += w[k] * img(ni[k], nj[k], p);
        value = std::floor( value / weight_sum + 0.5 );
        out[p] = uint8( std::max( 0.0, std::min( 255.0, value ) ) );
      }
      return true;
    }
  };

  /// Samples every plane of img at (u,v) with the chosen kernel,
  /// writing img.planes() values to out.  Returns false, leaving out
  /// untouched, when there is no sample at (u,v).
  template <class ValidT>
  bool sample_pixel( ImageView<uint8> const& img, double u, double v,
                     InterpolationKernel kernel, ValidT const& valid, uint8* out ) {
    if (kernel == NearestPixelKernel)
      return NearestPixelInterpolation()( img, u, v, valid, out );
    return BilinearInterpolation()( img, u, v, valid, out );
  }

  inline bool sample_pixel( ImageView<uint8> const& img, double u, double v,
                            InterpolationKernel kernel, uint8* out ) {
    return sample_pixel( img, u, v, kernel, AllValid(), out );
  }

} // namespace tw

#endif // __TW_IMAGE_INTERPOLATION_H__
