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


#include <tw/Image/Manipulation.h>

#include <algorithm>

namespace tw {

  ImageView<PixelRGBA8> crop( ImageView<PixelRGBA8> const& src, BBox2i const& region ) {
    TW_ASSERT( BBox2i(0, 0, src.cols(), src.rows()).contains(region),
               ArgumentErr() << "crop: region " << region << " exceeds the "
               << src.cols() << "x" << src.rows() << " image" );

    ImageView<PixelRGBA8> result( region.width(), region.height() );
    for (int32 j = 0; j < region.height(); ++j)
      for (int32 i = 0; i < region.width(); ++i)
        result(i, j) = src(region.min()[0] + i, region.min()[1] + j);
    return result;
  }

  void paste( ImageView<PixelRGBA8>& dest, ImageView<PixelRGBA8> const& src, int32 col, int32 row ) {
    const int32 i_begin = std::max( 0, -col ), i_end = std::min( src.cols(), dest.cols() - col );
    const int32 j_begin = std::max( 0, -row ), j_end = std::min( src.rows(), dest.rows() - row );
    for (int32 j = j_begin; j < j_end; ++j)
      for (int32 i = i_begin; i < i_end; ++i)
        dest(col + i, row + j) = src(i, j);
  }

  ImageView<PixelRGBA8> box_subsample_2x2( ImageView<PixelRGBA8> const& src ) {
    TW_ASSERT( src.cols() % 2 == 0 && src.rows() % 2 == 0,
               ArgumentErr() << "box_subsample_2x2: dimensions must be even, got "
               << src.cols() << "x" << src.rows() );

    ImageView<PixelRGBA8> result( src.cols() / 2, src.rows() / 2 );
    for (int32 j = 0; j < result.rows(); ++j) {
      for (int32 i = 0; i < result.cols(); ++i) {
        PixelRGBA8 const& a = src(2*i,   2*j);
        PixelRGBA8 const& b = src(2*i+1, 2*j);
        PixelRGBA8 const& c = src(2*i,   2*j+1);
        PixelRGBA8 const& d = src(2*i+1, 2*j+1);
        PixelRGBA8& out = result(i, j);
        for (int ch = 0; ch < 4; ++ch)
          out[ch] = uint8( (int(a[ch]) + int(b[ch]) + int(c[ch]) + int(d[ch]) + 2) / 4 );
      }
    }
    return result;
  }

  bool is_transparent( ImageView<PixelRGBA8> const& img ) {
    PixelRGBA8 const* p = img.data();
    PixelRGBA8 const* end = p + img.num_pixels();
    for (; p != end; ++p)
      if (p->a() != 0)
        return false;
    return true;
  }

} // namespace tw
