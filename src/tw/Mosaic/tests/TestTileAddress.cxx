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
#include <tw/Mosaic/TileAddress.h>

using namespace tw;
using namespace tw::mosaic;

TEST( TileAddress, FlipRow ) {
  EXPECT_EQ( 0, flip_row(0, 0) );
  EXPECT_EQ( 1, flip_row(1, 0) );
  EXPECT_EQ( 0, flip_row(1, 1) );
  EXPECT_EQ( 4095, flip_row(12, 0) );
  EXPECT_EQ( (1 << 30) - 1, flip_row(30, 0) );
  EXPECT_EQ( 0, flip_row(30, (1 << 30) - 1) );
}

TEST( TileAddress, FlipIsSelfInverse ) {
  for (int32 zoom = 0; zoom <= 10; ++zoom)
    for (int32 row = 0; row < (1 << zoom); ++row)
      ASSERT_EQ( row, flip_row( zoom, flip_row( zoom, row ) ) ) << "zoom " << zoom;

  const int32 rows[] = { 0, 1, 12345, (1 << 30) - 2, (1 << 30) - 1 };
  for (size_t i = 0; i < sizeof(rows)/sizeof(rows[0]); ++i)
    EXPECT_EQ( rows[i], flip_row( 30, flip_row( 30, rows[i] ) ) );
}

TEST( TileAddress, OutOfRange ) {
  EXPECT_THROW( flip_row(-1, 0), ArgumentErr );
  EXPECT_THROW( flip_row(31, 0), ArgumentErr );
  EXPECT_THROW( flip_row(3, 8), ArgumentErr );
  EXPECT_THROW( flip_row(3, -1), ArgumentErr );
  EXPECT_THROW( index_from_xyz(3, 8, 0), ArgumentErr );

  EXPECT_TRUE( tile_address_in_range(0, 0, 0) );
  EXPECT_FALSE( tile_address_in_range(0, 1, 0) );
  EXPECT_FALSE( tile_address_in_range(2, 0, -1) );
}

TEST( TileAddress, Paths ) {
  TileIndex index = index_from_xyz( 12, 655, 1582 );
  EXPECT_EQ( TileIndex(12, 655, 2513), index );
  EXPECT_EQ( "12/655/2513.png", tile_path( index ) );
  EXPECT_EQ( "0/0/0.jpg", tile_path( TileIndex(), ".jpg" ) );
}

TEST( TileAddress, ParentAndChildren ) {
  TileIndex index( 5, 10, 21 );
  EXPECT_EQ( TileIndex(4, 5, 10), index.parent() );
  for (int32 dy = 0; dy < 2; ++dy)
    for (int32 dx = 0; dx < 2; ++dx)
      EXPECT_EQ( index, index.child(dx, dy).parent() );
  EXPECT_EQ( TileIndex(6, 21, 43), index.child(1, 1) );

  EXPECT_TRUE( TileIndex(4, 9, 9) < TileIndex(5, 0, 0) );
  EXPECT_TRUE( TileIndex(5, 0, 9) < TileIndex(5, 1, 0) );
}
