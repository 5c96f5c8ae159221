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


#ifndef __TW_FILEIO_PNGIO_H__
#define __TW_FILEIO_PNGIO_H__

#include <tw/Image/ImageView.h>
#include <tw/Image/PixelTypes.h>

#include <string>

extern "C" {
#include <png.h>
}

/// \file PngIO.h In-memory PNG encoding and decoding of RGBA tiles.

namespace tw {
namespace fileio {
namespace detail {

// These classes hold the libpng state for one encode or decode.  They
// are not intended for use by users (thus the detail namespace).
class PngIO {
  protected:
    png_structp m_ctx;
    png_infop m_info;
    PngIO();
};

class PngIODecompress : public PngIO {
  private:
    std::string const& m_src;
    size_t m_pos;

    static void read_fn(png_structp ctx, png_bytep data, png_size_t len);

  public:
    PngIODecompress(std::string const& src);
    ~PngIODecompress();
    ImageView<PixelRGBA8> read();
};

class PngIOCompress : public PngIO {
  private:
    std::string m_dst;

    static void write_fn(png_structp ctx, png_bytep data, png_size_t len);
    static void flush_fn(png_structp ctx);

  public:
    PngIOCompress();
    ~PngIOCompress();
    std::string write(ImageView<PixelRGBA8> const& image);
};

} // namespace detail

  /// Encodes an RGBA image as an 8-bit RGBA PNG.  Throws IOErr if
  /// libpng fails and ArgumentErr for an empty image.
  std::string encode_png( ImageView<PixelRGBA8> const& image );

  /// Decodes a PNG of any color type and bit depth, expanding it to
  /// 8-bit RGBA.  Images without alpha come back opaque.  Throws IOErr
  /// if the bytes are not a valid PNG.
  ImageView<PixelRGBA8> decode_png( std::string const& data );

}} // namespace tw::fileio

#endif // __TW_FILEIO_PNGIO_H__
