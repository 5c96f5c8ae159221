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


#include <tw/Core/Exception.h>
#include <test/Helpers.h>

using namespace tw;

TW_DEFINE_EXCEPTION(Level1Err, Exception);
TW_DEFINE_EXCEPTION(Level2Err, Level1Err);

TEST(Exceptions, Hierarchy) {

  Level1Err l1;
  Level2Err l2;
  l1 << "Test message1.";
  l2 << "Test message2.";
  EXPECT_EQ(l1.name() , "Level1Err" );
  EXPECT_EQ(l2.name() , "Level2Err" );
  EXPECT_STREQ("Test message2.", l2.what());

  EXPECT_THROW(throw Level1Err(), Exception);
  EXPECT_THROW(throw Level2Err(), Exception);
  EXPECT_THROW(throw Level2Err(), Level1Err);
  EXPECT_THROW(throw Level2Err(), Level2Err);
}

TEST(Exceptions, ThrowKeepsMostDerivedType) {
  // tw_throw takes an Exception const&, so this checks that the
  // default handler rethrows with the concrete type.
  EXPECT_THROW(tw_throw( Level2Err() << "Rawr" ), Level2Err);
  EXPECT_THROW(tw_throw( InsufficientControlPointsErr() << "2 points" ), GeometryErr);
  EXPECT_THROW(tw_throw( UnopenableImageErr() << "nope" ), InputErr);
  EXPECT_THROW(TW_ASSERT( false, ProjectionErr() ), ProjectionErr);
  EXPECT_NO_THROW(TW_ASSERT( true, ProjectionErr() ));
}

TEST(Exceptions, Taxonomy) {
  try {
    tw_throw( DegenerateControlPointsErr() << "collinear" );
    FAIL() << "tw_throw returned";
  } catch (const GeometryErr& e) {
    EXPECT_EQ("DegenerateControlPointsErr", e.name());
    EXPECT_EQ("collinear", e.desc());
    std::ostringstream os;
    os << e;
    EXPECT_EQ("DegenerateControlPointsErr: collinear", os.str());
  }

  UnsupportedBandLayoutErr band;
  StorageErr storage;
  Exception* band_base = &band;
  Exception* storage_base = &storage;
  EXPECT_TRUE(dynamic_cast<GeometryErr*>(band_base) == NULL);
  EXPECT_TRUE(dynamic_cast<InputErr*>(storage_base) == NULL);
}
