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


/// \file Manipulation.h
///
/// Whole-image operations on RGBA tiles: cropping, pasting and 2x2
/// box subsampling.
///
#ifndef __TW_IMAGE_MANIPULATION_H__
#define __TW_IMAGE_MANIPULATION_H__

#include <tw/Image/ImageView.h>
#include <tw/Image/PixelTypes.h>
#include <tw/Math/BBox.h>

namespace tw {

  /// Copies the given region of src into a new image.  The region
  /// must lie inside src.
  ImageView<PixelRGBA8> crop( ImageView<PixelRGBA8> const& src, BBox2i const& region );

  /// Writes src into dest with its top-left corner at (col, row).
  /// Parts of src that fall outside dest are dropped.
  void paste( ImageView<PixelRGBA8>& dest, ImageView<PixelRGBA8> const& src, int32 col, int32 row );

  /// Halves both dimensions by averaging each 2x2 block of pixels.
  /// Every channel, alpha included, is averaged independently and
  /// rounded half up: (a+b+c+d+2)/4.  The image dimensions must be
  /// even.
  ImageView<PixelRGBA8> box_subsample_2x2( ImageView<PixelRGBA8> const& src );

  /// True if every pixel has zero alpha.
  bool is_transparent( ImageView<PixelRGBA8> const& img );

} // namespace tw

#endif // __TW_IMAGE_MANIPULATION_H__
