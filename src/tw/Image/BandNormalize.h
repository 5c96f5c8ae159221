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


/// \file BandNormalize.h
///
/// Conversion of rasters with any supported band layout to four
/// bands (red, green, blue, alpha).
///
/// The layouts form a closed set:
///
///   bands  color table   layout           result
///   1      yes           IndexedLayout    palette color, alpha from the data mask
///   1      no            GrayscaleLayout  R=G=B=band, alpha from the data mask
///   3      -             RgbLayout        R,G,B copied, alpha from the data mask
///   >=4    -             RgbaPlusLayout   first four bands copied unchanged
///
/// Zero or two bands raise UnsupportedBandLayoutErr.  The data mask is
/// 255 where a pixel holds data and 0 elsewhere; outside the mask the
/// color bands are set to zero.
///
#ifndef __TW_IMAGE_BANDNORMALIZE_H__
#define __TW_IMAGE_BANDNORMALIZE_H__

#include <tw/Image/RasterImage.h>

#include <ostream>

namespace tw {

  enum BandLayout {
    IndexedLayout,
    GrayscaleLayout,
    RgbLayout,
    RgbaPlusLayout
  };

  std::ostream& operator<<( std::ostream& os, BandLayout layout );

  /// Identifies the layout of a raster.  Throws
  /// UnsupportedBandLayoutErr for zero or two bands.
  BandLayout classify_bands( RasterImage const& raster );

  /// Converts a raster to a four-band RGBA raster.  mask must be a
  /// single plane of the raster's size, or empty when every pixel
  /// holds data.  The mask is ignored for RgbaPlusLayout.
  RasterImage normalize_bands( RasterImage const& raster,
                               ImageView<uint8> const& mask = ImageView<uint8>() );

} // namespace tw

#endif // __TW_IMAGE_BANDNORMALIZE_H__
