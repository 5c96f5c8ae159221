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
#include <tw/Cartography/WebMercator.h>

using namespace tw;
using namespace tw::cartography;
namespace wm = tw::cartography::web_mercator;

TEST( WebMercator, KnownPoints ) {
  Vector2 origin = wm::lonlat_to_point( Vector2(0, 0) );
  EXPECT_NEAR( 0, origin[0], 1e-9 );
  EXPECT_NEAR( 0, origin[1], 1e-9 );

  Vector2 corner = wm::lonlat_to_point( Vector2(180, wm::MAX_LATITUDE) );
  EXPECT_NEAR( wm::HALF_CIRCUMFERENCE, corner[0], 1e-3 );
  EXPECT_NEAR( wm::HALF_CIRCUMFERENCE, corner[1], 1e-3 );

  // Beyond the square world latitude is clamped.
  Vector2 pole = wm::lonlat_to_point( Vector2(0, 90) );
  EXPECT_NEAR( wm::HALF_CIRCUMFERENCE, pole[1], 1e-3 );

  Vector2 sf = wm::lonlat_to_point( Vector2(-122.4194, 37.7749) );
  EXPECT_NEAR( -13627665.27, sf[0], 0.1 );
  EXPECT_NEAR(   4547675.35, sf[1], 0.1 );
}

TEST( WebMercator, Inverse ) {
  Vector2 lonlat(-122.4194, 37.7749);
  Vector2 back = wm::point_to_lonlat( wm::lonlat_to_point( lonlat ) );
  EXPECT_NEAR( lonlat[0], back[0], 1e-10 );
  EXPECT_NEAR( lonlat[1], back[1], 1e-10 );
}

TEST( WebMercator, Tiles ) {
  EXPECT_NEAR( 156543.03392804097, wm::resolution(0, 256), 1e-6 );
  EXPECT_NEAR( 0.29858214173896974, wm::resolution(19, 256), 1e-12 );

  BBox2 world = wm::tile_bbox( 0, 0, 0 );
  EXPECT_EQ( wm::world_bbox(), world );

  // Zoom 1, south-west quadrant
  BBox2 sw = wm::tile_bbox( 1, 0, 0 );
  EXPECT_NEAR( -wm::HALF_CIRCUMFERENCE, sw.min()[0], 1e-6 );
  EXPECT_NEAR( -wm::HALF_CIRCUMFERENCE, sw.min()[1], 1e-6 );
  EXPECT_NEAR( 0, sw.max()[0], 1e-6 );
  EXPECT_NEAR( 0, sw.max()[1], 1e-6 );

  EXPECT_THROW( wm::tile_bbox( -1, 0, 0 ), ArgumentErr );
  EXPECT_THROW( wm::resolution( 31, 256 ), ArgumentErr );
}

TEST( WebMercator, TilesTouching ) {
  // A small box just north-east of the origin at zoom 2 falls in the
  // tile whose south-west corner is the origin.
  BBox2 box( Vector2(10, 10), Vector2(20, 20) );
  BBox2i range = wm::tiles_touching( box, 2 );
  EXPECT_EQ( BBox2i( Vector2i(2, 2), Vector2i(3, 3) ), range );

  // Clipped to the world.
  BBox2i all = wm::tiles_touching( BBox2( Vector2(-1e9, -1e9), Vector2(1e9, 1e9) ), 3 );
  EXPECT_EQ( BBox2i( Vector2i(0, 0), Vector2i(8, 8) ), all );

  EXPECT_TRUE( wm::tiles_touching( BBox2( Vector2(-1e9, -1e9), Vector2(-9e8, -9e8) ), 3 ).empty() );
}
