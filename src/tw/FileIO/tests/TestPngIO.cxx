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


#include <test/Helpers.h>
#include <tw/FileIO/PngIO.h>

using namespace tw;
using namespace tw::fileio;

TEST(PngIO, TransparentTile) {
  ImageView<PixelRGBA8> blank(256, 256);
  std::string png = encode_png(blank);

  // PNG signature
  ASSERT_GT( png.size(), 8u );
  EXPECT_EQ( '\x89', png[0] );
  EXPECT_EQ( "PNG", png.substr(1,3) );

  ImageView<PixelRGBA8> back = decode_png(png);
  ASSERT_EQ( 256, back.cols() );
  ASSERT_EQ( 256, back.rows() );
  EXPECT_EQ( PixelRGBA8(), back(0,0) );
  EXPECT_EQ( PixelRGBA8(), back(255,255) );
}

TEST(PngIO, KeepsPixels) {
  ImageView<PixelRGBA8> img(3, 2);
  img(0,0) = PixelRGBA8(255, 0, 0, 255);
  img(1,0) = PixelRGBA8(0, 255, 0, 128);
  img(2,1) = PixelRGBA8(1, 2, 3, 4);

  ImageView<PixelRGBA8> back = decode_png( encode_png(img) );
  EXPECT_TRUE( back == img );
}

TEST(PngIO, Errors) {
  EXPECT_THROW( encode_png(ImageView<PixelRGBA8>()), ArgumentErr );
  EXPECT_THROW( decode_png(""), IOErr );
  EXPECT_THROW( decode_png("definitely not a png"), IOErr );

  // A truncated stream fails inside libpng.
  ImageView<PixelRGBA8> img(16, 16);
  img.fill( PixelRGBA8(uint8(200)) );
  std::string png = encode_png(img);
  EXPECT_THROW( decode_png(png.substr(0, png.size()/2)), IOErr );
}
