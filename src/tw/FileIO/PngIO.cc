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


#include <tw/FileIO/PngIO.h>
#include <tw/Core/Exception.h>
#include <tw/Core/Log.h>

#include <boost/scoped_array.hpp>

#include <cstring>
#include <zlib.h>

namespace {
  static void png_error_handler(png_structp /*png_ptr*/, png_const_charp error_msg) {
    tw::tw_throw( tw::IOErr() << "PngIO Error: " << error_msg );
  }

  static void png_warning_handler(png_structp /*png_ptr*/, png_const_charp warning_msg) {
    TW_OUT(tw::DebugMessage, "fileio") << "PngIO: " << warning_msg << std::endl;
  }
}

namespace tw {
namespace fileio {
namespace detail {

PngIO::PngIO()
  : m_ctx(0), m_info(0) {}

////////////////////////////////////////////////////////////////////////////////
// Decompress
////////////////////////////////////////////////////////////////////////////////
PngIODecompress::PngIODecompress(std::string const& src)
  : m_src(src), m_pos(0)
{
  m_ctx = png_create_read_struct(PNG_LIBPNG_VER_STRING, 0, png_error_handler, png_warning_handler);
  TW_ASSERT(m_ctx, IOErr() << "Failed to create read struct");
  m_info = png_create_info_struct(m_ctx);
  if (!m_info) {
    png_destroy_read_struct(&m_ctx, NULL, NULL);
    tw_throw(IOErr() << "Failed to create info struct");
  }
  png_set_read_fn(m_ctx, this, &PngIODecompress::read_fn);
}

PngIODecompress::~PngIODecompress() {
  png_destroy_read_struct(&m_ctx, &m_info, NULL);
}

void PngIODecompress::read_fn(png_structp ctx, png_bytep data, png_size_t len) {
  PngIODecompress *self = reinterpret_cast<PngIODecompress*>(png_get_io_ptr(ctx));
  if (self->m_pos + len > self->m_src.size())
    png_error(ctx, "unexpected end of data");
  std::memcpy(data, self->m_src.data() + self->m_pos, len);
  self->m_pos += len;
}

ImageView<PixelRGBA8> PngIODecompress::read() {
  if (m_src.size() < 8 || png_sig_cmp(reinterpret_cast<png_const_bytep>(m_src.data()), 0, 8) != 0)
    tw_throw(IOErr() << "PngIO Error: not a PNG stream");

  png_uint_32 width, height;
  int bit_depth, color_type, interlace_type, compression_type, filter_type;

  png_read_info(m_ctx, m_info);
  png_get_IHDR(m_ctx, m_info, &width, &height, &bit_depth, &color_type, &interlace_type, &compression_type, &filter_type);

  // Expand paletted images to RGB
  // Expand grayscale images of less than 8-bit depth to 8-bit depth
  // Expand tRNS chunks to alpha channels.
  if (bit_depth < 8 || color_type == PNG_COLOR_TYPE_PALETTE || png_get_valid(m_ctx, m_info, PNG_INFO_tRNS))
    png_set_expand(m_ctx);

  if (bit_depth == 16)
    png_set_strip_16(m_ctx);

  if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA)
    png_set_gray_to_rgb(m_ctx);

  // Anything still missing an alpha channel gets an opaque one.
  if (!(color_type & PNG_COLOR_MASK_ALPHA) && !png_get_valid(m_ctx, m_info, PNG_INFO_tRNS))
    png_set_add_alpha(m_ctx, 0xff, PNG_FILLER_AFTER);

  png_set_interlace_handling(m_ctx);

  // Update info with the transforms we applied
  png_read_update_info(m_ctx, m_info);

  size_t png_row = png_get_rowbytes(m_ctx, m_info);
  TW_ASSERT(png_row == size_t(width) * 4, LogicErr() << "PngIO: expected an RGBA8 row after expansion");

  boost::scoped_array<png_byte> buffer( new png_byte[png_row * height] );
  boost::scoped_array<png_bytep> rows( new png_bytep[height] );
  for (size_t i = 0; i < height; ++i)
    rows[i] = buffer.get() + i * png_row;

  png_read_image(m_ctx, rows.get());
  png_read_end(m_ctx, NULL);

  ImageView<PixelRGBA8> image( width, height );
  for (int32 j = 0; j < int32(height); ++j) {
    png_bytep p = rows[j];
    for (int32 i = 0; i < int32(width); ++i, p += 4)
      image(i,j) = PixelRGBA8( p[0], p[1], p[2], p[3] );
  }
  return image;
}

////////////////////////////////////////////////////////////////////////////////
// Compress
////////////////////////////////////////////////////////////////////////////////
PngIOCompress::PngIOCompress() {
  m_ctx = png_create_write_struct(PNG_LIBPNG_VER_STRING, 0, png_error_handler, png_warning_handler);
  TW_ASSERT(m_ctx, IOErr() << "Failed to create write struct");
  m_info = png_create_info_struct(m_ctx);
  if (!m_info) {
    png_destroy_write_struct(&m_ctx, NULL);
    tw_throw(IOErr() << "Failed to create info struct");
  }
  png_set_write_fn(m_ctx, this, &PngIOCompress::write_fn, &PngIOCompress::flush_fn);
}

PngIOCompress::~PngIOCompress() {
  png_destroy_write_struct(&m_ctx, &m_info);
}

void PngIOCompress::write_fn(png_structp ctx, png_bytep data, png_size_t len) {
  PngIOCompress *self = reinterpret_cast<PngIOCompress*>(png_get_io_ptr(ctx));
  self->m_dst.append(reinterpret_cast<const char*>(data), len);
}

void PngIOCompress::flush_fn(png_structp /*ctx*/) {}

std::string PngIOCompress::write(ImageView<PixelRGBA8> const& image) {
  TW_ASSERT(image.cols() > 0 && image.rows() > 0,
            ArgumentErr() << "PngIO: Cannot encode an empty image");
  TW_ASSERT(image.planes() == 1, ArgumentErr() << "PNG does not support multi-plane images");

  png_set_compression_level(m_ctx, Z_BEST_SPEED);
  png_set_IHDR(m_ctx, m_info, image.cols(), image.rows(), 8, PNG_COLOR_TYPE_RGBA,
               PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
  png_write_info(m_ctx, m_info);

  const size_t skip = size_t(image.cols()) * 4;
  boost::scoped_array<png_byte> row( new png_byte[skip] );
  for (int32 j = 0; j < image.rows(); ++j) {
    png_bytep p = row.get();
    for (int32 i = 0; i < image.cols(); ++i, p += 4) {
      PixelRGBA8 const& px = image(i,j);
      p[0] = px.r(); p[1] = px.g(); p[2] = px.b(); p[3] = px.a();
    }
    png_write_row(m_ctx, row.get());
  }

  png_write_end(m_ctx, m_info);
  return m_dst;
}

} // namespace detail

  std::string encode_png( ImageView<PixelRGBA8> const& image ) {
    detail::PngIOCompress png;
    return png.write( image );
  }

  ImageView<PixelRGBA8> decode_png( std::string const& data ) {
    detail::PngIODecompress png( data );
    return png.read();
  }

}} // namespace tw::fileio
