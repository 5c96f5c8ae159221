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


#include <tw/Image/BandNormalize.h>
#include <tw/Core/Log.h>

namespace tw {

  std::ostream& operator<<( std::ostream& os, BandLayout layout ) {
    switch (layout) {
    case IndexedLayout:   return os << "indexed";
    case GrayscaleLayout: return os << "grayscale";
    case RgbLayout:       return os << "rgb";
    case RgbaPlusLayout:  return os << "rgba";
    }
    return os << "unknown";
  }

  BandLayout classify_bands( RasterImage const& raster ) {
    const int32 bands = raster.band_count();
    if (bands == 1)
      return raster.has_color_table() ? IndexedLayout : GrayscaleLayout;
    if (bands == 3)
      return RgbLayout;
    if (bands >= 4)
      return RgbaPlusLayout;
    tw_throw( UnsupportedBandLayoutErr() << "Cannot convert a raster with "
              << bands << " bands to RGBA" );
  }

  namespace {

    // Writes one output pixel: the color where the mask says there is
    // data, transparent black elsewhere.
    inline void put_pixel( ImageView<uint8>& out, int32 i, int32 j, bool has_data,
                           uint8 r, uint8 g, uint8 b ) {
      if (has_data) {
        out(i,j,0) = r; out(i,j,1) = g; out(i,j,2) = b; out(i,j,3) = 255;
      } else {
        out(i,j,0) = out(i,j,1) = out(i,j,2) = out(i,j,3) = 0;
      }
    }

  } // anonymous namespace

  RasterImage normalize_bands( RasterImage const& raster, ImageView<uint8> const& mask ) {
    const BandLayout layout = classify_bands( raster );
    const int32 cols = raster.width(), rows = raster.height();

    if (layout != RgbaPlusLayout && mask.is_valid())
      TW_ASSERT( mask.cols() == cols && mask.rows() == rows && mask.planes() == 1,
                 ArgumentErr() << "normalize_bands: mask is " << mask.cols() << "x" << mask.rows()
                 << "x" << mask.planes() << ", raster is " << cols << "x" << rows );

    TW_OUT(DebugMessage, "image") << "Normalizing " << raster << " as " << layout << "\n";

    ImageView<uint8> out( cols, rows, 4 );
    const bool masked = mask.is_valid();

    switch (layout) {
    case IndexedLayout: {
      ColorTable const& table = raster.color_table();
      for (int32 j = 0; j < rows; ++j)
        for (int32 i = 0; i < cols; ++i) {
          PixelRGB8 c = table.lookup( raster(i,j) );
          put_pixel( out, i, j, !masked || mask(i,j), c.r(), c.g(), c.b() );
        }
      break;
    }
    case GrayscaleLayout:
      for (int32 j = 0; j < rows; ++j)
        for (int32 i = 0; i < cols; ++i) {
          uint8 v = raster(i,j);
          put_pixel( out, i, j, !masked || mask(i,j), v, v, v );
        }
      break;
    case RgbLayout:
      for (int32 j = 0; j < rows; ++j)
        for (int32 i = 0; i < cols; ++i)
          put_pixel( out, i, j, !masked || mask(i,j), raster(i,j,0), raster(i,j,1), raster(i,j,2) );
      break;
    case RgbaPlusLayout:
      for (int32 p = 0; p < 4; ++p)
        for (int32 j = 0; j < rows; ++j)
          for (int32 i = 0; i < cols; ++i)
            out(i,j,p) = raster(i,j,p);
      break;
    }

    return RasterImage( out );
  }

} // namespace tw
