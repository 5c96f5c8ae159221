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
#include <tw/Image/Interpolation.h>

using namespace tw;

namespace {
  // A 2x2 single-plane image:
  //   10  20
  //   30  40
  ImageView<uint8> two_by_two() {
    ImageView<uint8> img(2,2);
    img(0,0) = 10; img(1,0) = 20;
    img(0,1) = 30; img(1,1) = 40;
    return img;
  }
}

TEST(Interpolation, KernelNames) {
  EXPECT_EQ( BilinearKernel, interpolation_kernel_from_string("bilinear") );
  EXPECT_EQ( NearestPixelKernel, interpolation_kernel_from_string(" Nearest ") );
  EXPECT_EQ( "bilinear", interpolation_kernel_name(BilinearKernel) );
  EXPECT_THROW( interpolation_kernel_from_string("cubic"), ArgumentErr );
}

TEST(Interpolation, BilinearAtCenters) {
  ImageView<uint8> img = two_by_two();
  uint8 out = 0;
  ASSERT_TRUE( sample_pixel(img, 0.5, 0.5, BilinearKernel, &out) );
  EXPECT_EQ( 10, out );
  ASSERT_TRUE( sample_pixel(img, 1.5, 1.5, BilinearKernel, &out) );
  EXPECT_EQ( 40, out );
  ASSERT_TRUE( sample_pixel(img, 1.0, 1.0, BilinearKernel, &out) );
  EXPECT_EQ( 25, out );
  ASSERT_TRUE( sample_pixel(img, 1.0, 0.5, BilinearKernel, &out) );
  EXPECT_EQ( 15, out );
}

TEST(Interpolation, BilinearEdgesRenormalize) {
  ImageView<uint8> img = two_by_two();
  uint8 out = 0;
  // On the outer edge half the neighbours are off the image.
  ASSERT_TRUE( sample_pixel(img, 0.0, 0.5, BilinearKernel, &out) );
  EXPECT_EQ( 10, out );
  ASSERT_TRUE( sample_pixel(img, 2.0, 2.0, BilinearKernel, &out) );
  EXPECT_EQ( 40, out );

  out = 99;
  EXPECT_FALSE( sample_pixel(img, -0.01, 1.0, BilinearKernel, &out) );
  EXPECT_FALSE( sample_pixel(img, 1.0, 2.01, BilinearKernel, &out) );
  EXPECT_EQ( 99, out );
}

TEST(Interpolation, ValidityMask) {
  ImageView<uint8> img = two_by_two();
  ImageView<uint8> mask(2,2);
  mask.fill(255);
  mask(1,1) = 0;

  uint8 out = 0;
  // The masked 40 drops out; 10, 20 and 30 share the weight equally.
  ASSERT_TRUE( sample_pixel(img, 1.0, 1.0, BilinearKernel, PlaneValid(mask, 0), &out) );
  EXPECT_EQ( 20, out );

  EXPECT_FALSE( sample_pixel(img, 1.5, 1.5, NearestPixelKernel, PlaneValid(mask, 0), &out) );
  EXPECT_FALSE( sample_pixel(img, 1.5, 1.5, BilinearKernel, PlaneValid(mask, 0), &out) );
}

TEST(Interpolation, Nearest) {
  ImageView<uint8> img = two_by_two();
  uint8 out = 0;
  ASSERT_TRUE( sample_pixel(img, 0.99, 0.2, NearestPixelKernel, &out) );
  EXPECT_EQ( 10, out );
  ASSERT_TRUE( sample_pixel(img, 1.0, 0.2, NearestPixelKernel, &out) );
  EXPECT_EQ( 20, out );
  ASSERT_TRUE( sample_pixel(img, 2.0, 2.0, NearestPixelKernel, &out) );
  EXPECT_EQ( 40, out );
}

TEST(Interpolation, MultiPlane) {
  ImageView<uint8> img(1,1,3);
  img(0,0,0) = 1; img(0,0,1) = 2; img(0,0,2) = 3;
  uint8 out[3] = { 0, 0, 0 };
  ASSERT_TRUE( sample_pixel(img, 0.25, 0.75, BilinearKernel, out) );
  EXPECT_EQ( 1, out[0] );
  EXPECT_EQ( 2, out[1] );
  EXPECT_EQ( 3, out[2] );
}
