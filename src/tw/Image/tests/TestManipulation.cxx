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
#include <tw/Image/Manipulation.h>

using namespace tw;

TEST(Manipulation, BoxSubsample) {
  ImageView<PixelRGBA8> img(2,2);
  img(0,0) = PixelRGBA8(0, 10, 255, 255);
  img(1,0) = PixelRGBA8(1, 10, 255, 255);
  img(0,1) = PixelRGBA8(0, 11, 255, 0);
  img(1,1) = PixelRGBA8(1, 11, 255, 0);

  ImageView<PixelRGBA8> half = box_subsample_2x2(img);
  ASSERT_EQ( 1, half.cols() );
  ASSERT_EQ( 1, half.rows() );
  // (0+1+0+1+2)/4 = 1, (10+10+11+11+2)/4 = 11, (255*2+2)/4 = 128
  EXPECT_EQ( PixelRGBA8(1, 11, 255, 128), half(0,0) );
}

TEST(Manipulation, BoxSubsampleNeedsEvenSize) {
  EXPECT_THROW( box_subsample_2x2(ImageView<PixelRGBA8>(3,2)), ArgumentErr );
}

TEST(Manipulation, PasteAndCrop) {
  ImageView<PixelRGBA8> canvas(4,4);
  ImageView<PixelRGBA8> patch(2,2);
  patch.fill( PixelRGBA8(uint8(9)) );

  paste( canvas, patch, 2, 2 );
  EXPECT_EQ( PixelRGBA8(uint8(9)), canvas(3,3) );
  EXPECT_EQ( PixelRGBA8(), canvas(1,1) );

  // Overhanging parts are dropped.
  paste( canvas, patch, -1, -1 );
  EXPECT_EQ( PixelRGBA8(uint8(9)), canvas(0,0) );
  EXPECT_EQ( PixelRGBA8(), canvas(1,0) );

  ImageView<PixelRGBA8> corner = crop( canvas, BBox2i(2,2,2,2) );
  EXPECT_TRUE( corner == patch );
  EXPECT_THROW( crop(canvas, BBox2i(3,3,2,2)), ArgumentErr );
}

TEST(Manipulation, Transparent) {
  ImageView<PixelRGBA8> img(8,8);
  EXPECT_TRUE( is_transparent(img) );
  img(7,7) = PixelRGBA8(0,0,0,1);
  EXPECT_FALSE( is_transparent(img) );
}
