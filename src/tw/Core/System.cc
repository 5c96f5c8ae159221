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


#include <tw/Core/System.h>
#include <tw/Core/Log.h>
#include <tw/Core/Settings.h>
#include <tw/Core/RunOnce.h>

// Both singletons are created together, settings first, and never
// destroyed: log messages may still be written from static
// destructors.
namespace {
  tw::RunOnce core_once = TW_RUNONCE_INIT;

  tw::Settings *g_settings = 0;
  tw::Log      *g_log      = 0;

  void create_core_singletons() {
    g_settings = new tw::Settings();
    g_log      = new tw::Log();
  }
}

tw::Settings& tw::tw_settings() {
  core_once.run( create_core_singletons );
  return *g_settings;
}

tw::Log& tw::tw_log() {
  core_once.run( create_core_singletons );
  return *g_log;
}
