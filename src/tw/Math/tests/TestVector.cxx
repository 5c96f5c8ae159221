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
#include <tw/Math/Vector.h>
#include <tw/Math/BBox.h>

#include <limits>
#include <sstream>

using namespace tw;

TEST(Vector, Arithmetic) {
  Vector2 a(1,2), b(3,5);
  EXPECT_EQ( Vector2(4,7),  a + b );
  EXPECT_EQ( Vector2(-2,-3), a - b );
  EXPECT_EQ( Vector2(2,4),  a * 2.0 );
  EXPECT_EQ( Vector2(2,4),  2.0 * a );
  EXPECT_EQ( Vector2(0.5,1), a / 2.0 );
  EXPECT_EQ( Vector2(-1,-2), -a );
  EXPECT_DOUBLE_EQ( 13, dot_prod(a, b) );
  EXPECT_DOUBLE_EQ( 5, norm_2(Vector2(3,4)) );
  EXPECT_DOUBLE_EQ( 1, a.x() );
  EXPECT_DOUBLE_EQ( 2, a.y() );
}

TEST(Vector, Ordering) {
  EXPECT_TRUE( Vector3i(0,1,2) < Vector3i(0,2,0) );
  EXPECT_FALSE( Vector3i(1,0,0) < Vector3i(0,9,9) );
  EXPECT_TRUE( Vector2i(1,1) != Vector2i(1,2) );
}

TEST(Vector, Finite) {
  EXPECT_TRUE( is_finite(Vector2(1e10, -3)) );
  EXPECT_FALSE( is_finite(Vector2(std::numeric_limits<double>::quiet_NaN(), 0)) );
  EXPECT_FALSE( is_finite(Vector2(0, std::numeric_limits<double>::infinity())) );
}

TEST(Vector, Stream) {
  std::ostringstream os;
  os << Vector2i(3,4);
  EXPECT_EQ( "Vector2(3,4)", os.str() );
}

TEST(BBox, Basic) {
  BBox2i b(0,0,256,256);
  EXPECT_EQ( 256, b.width() );
  EXPECT_EQ( 256, b.height() );
  EXPECT_TRUE( b.contains(Vector2i(0,0)) );
  EXPECT_TRUE( b.contains(Vector2i(255,255)) );
  EXPECT_FALSE( b.contains(Vector2i(256,10)) );
  EXPECT_FALSE( b.empty() );
}

TEST(BBox, Grow) {
  BBox2 b;
  EXPECT_TRUE( b.empty() );
  b.grow( Vector2(1,5) );
  b.grow( Vector2(-2,3) );
  EXPECT_EQ( Vector2(-2,3), b.min() );
  EXPECT_EQ( Vector2(1,5),  b.max() );

  BBox2 other(0,0,10,10);
  b.crop(other);
  EXPECT_EQ( Vector2(0,3), b.min() );
  EXPECT_EQ( Vector2(1,5), b.max() );
  EXPECT_TRUE( other.contains(b) );
  EXPECT_TRUE( other.intersects(b) );
  EXPECT_FALSE( BBox2(20,20,1,1).intersects(other) );
}

TEST(BBox, GrowToInt) {
  BBox2i b = grow_bbox_to_int( BBox2(Vector2(-0.5, 1.2), Vector2(3.1, 4.0)) );
  EXPECT_EQ( Vector2i(-1,1), b.min() );
  EXPECT_EQ( Vector2i(4,4),  b.max() );
}
