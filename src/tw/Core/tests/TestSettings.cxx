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


#include <tw/Core/Settings.h>
#include <tw/Core/ConfigParser.h>
#include <tw/Core/System.h>
#include <test/Helpers.h>

#include <fstream>
#include <sstream>

using namespace tw;
using namespace tw::test;

TEST(Settings, Defaults) {
  Settings s;
  s.set_rc_filename("");
  EXPECT_EQ( 9,  s.min_zoom() );
  EXPECT_EQ( 16, s.max_zoom() );
  EXPECT_EQ( 256u, s.tile_size() );
  EXPECT_EQ( 3u, s.storage_retries() );
  EXPECT_EQ( "bilinear", s.resample_kernel() );
  EXPECT_LT( 0u, s.default_num_threads() );
}

TEST(Settings, TWrc) {

  const char *conf = "\n\
      # Comment 1                         \n\
                                          \n\
      [general]                           \n\
      nonexistent_entry = 1               \n\
      default_num_threads = 20            \n\
                                          \n\
      [tiling]                            \n\
      min_zoom = 3                        \n\
      max_zoom = 5                        \n\
      tile_size = 128                     \n\
                                          \n\
      [warp]                              \n\
      kernel = nearest                    \n\
                                          \n\
      [storage]                           \n\
      retries = not_a_number              \n\
                                          \n\
      [logfile console]                   \n\
      10 = *           # all level 10     \n\
      30 = mosaic.foo                     \n\
      ";

  UnlinkName file("test_twrc");
  std::ofstream ostr(file.c_str());
  ASSERT_TRUE(ostr.is_open()) << "Could not open test config file for writing";
  ostr << conf;
  ostr.close();

  Settings s;
  s.set_rc_filename(file);
  EXPECT_EQ( 20u, s.default_num_threads() );
  EXPECT_EQ( 3,   s.min_zoom() );
  EXPECT_EQ( 5,   s.max_zoom() );
  EXPECT_EQ( 128u, s.tile_size() );
  EXPECT_EQ( "nearest", s.resample_kernel() );
  // The bad line is skipped, the default survives.
  EXPECT_EQ( 3u, s.storage_retries() );
}

TEST(Settings, Override) {
  Settings s;
  s.set_rc_filename("");
  s.set_default_num_threads(5);
  s.set_max_zoom(12);
  EXPECT_EQ( 5u, s.default_num_threads() );
  EXPECT_EQ( 12, s.max_zoom() );

  // Values from a config file never replace values set through the API.
  std::istringstream stream("[tiling]\nmax_zoom = 14\nmin_zoom = 2\n");
  parse_config(stream, s);
  EXPECT_EQ( 12, s.max_zoom() );
  EXPECT_EQ( 2,  s.min_zoom() );
}

TEST(Settings, MissingFile) {
  Settings s;
  EXPECT_THROW(parse_config_file(TEST_OBJDIR "/no_such_twrc", s), IOErr);
}
