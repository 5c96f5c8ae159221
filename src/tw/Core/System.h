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


/// \file Core/System.h
///
/// Access to the process-wide Settings and Log.  Both are created on
/// first use by either function.

#ifndef __TW_CORE_SYSTEM_H__
#define __TW_CORE_SYSTEM_H__

namespace tw {

  class Log;
  class Settings;

  /// The system log.  Route messages through TW_OUT rather than
  /// writing to it directly, for example
  ///     tw_log().console_log().rule_set().add_rule(DebugMessage, "mosaic");
  /// turns on mosaic debug output.
  Log& tw_log();

  /// Runtime settings, backed by ~/.twrc.
  Settings& tw_settings();
}

#endif // __TW_CORE_SYSTEM_H__
