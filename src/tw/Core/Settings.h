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


/// \file Core/Settings.h
///
/// This file provides a singleton object that provides access to
/// TileWarp system-wide settings.  These can be twiddled
/// programmatically by interacting with this object, or they can be
/// set using the ~/.twrc file in the user's home directory.  That
/// file is polled for changes whenever a setting is read, so the user
/// can modify the contents of that file while the program is running.
///
/// A value set through the API always wins over the rc file: the
/// rc_set_* methods used by the config parser leave overridden
/// settings alone.

#ifndef __TW_CORE_SETTINGS_H__
#define __TW_CORE_SETTINGS_H__

#include <ctime>
#include <string>

#include <tw/Core/FundamentalTypes.h>
#include <tw/Core/System.h>
#include <tw/Core/Thread.h>

namespace tw {

  // -------------------------------------------------------
  //                    Settings
  // -------------------------------------------------------

  /// The system settings class manages runtime configuration for
  /// TileWarp.
  ///
  /// Access the system settings using the tw_settings() function,
  /// which returns a singleton instance of this class.
  class Settings : private boost::noncopyable {

#define TW_DECLARE_SETTING(Name, Type)\
    private:\
      Type m_ ## Name; \
      bool m_ ## Name ## _override; \
    public: \
      Type Name(); \
      void set_ ## Name(const Type& x); \
      void rc_set_ ## Name(const Type& x);

    // The number of worker threads used for reprojection and tiling.
    TW_DECLARE_SETTING(default_num_threads, uint32);

    // The directory used to store intermediate rasters.
    TW_DECLARE_SETTING(tmp_directory, std::string);

    // How many times a failed publish is retried before giving up.
    TW_DECLARE_SETTING(storage_retries, uint32);

    // Default zoom range of a generated pyramid.
    TW_DECLARE_SETTING(min_zoom, int32);
    TW_DECLARE_SETTING(max_zoom, int32);

    // Edge length of a square tile, in pixels.
    TW_DECLARE_SETTING(tile_size, uint32);

    // Interpolation kernel name: "bilinear" or "nearest".
    TW_DECLARE_SETTING(resample_kernel, std::string);

#undef TW_DECLARE_SETTING

    // rc file polling.  m_rc_mutex also serializes parsing.
    std::string m_rc_filename;
    std::time_t m_rc_last_poll;
    std::time_t m_rc_last_modification;
    double m_rc_poll_period;
    RecursiveMutex m_rc_mutex;
    RecursiveMutex m_settings_mutex;

  public:

    /// You should not create an instance of Settings on your own
    /// except in tests.  Use tw_settings() instead.
    Settings();

    /// Change the rc filename (default: ~/.twrc).  An empty filename
    /// disables the rc file.
    void set_rc_filename(std::string filename, bool parse_now = true);

    /// Change the rc file poll period.  (default: 5 seconds)
    void set_rc_poll_period(double seconds);

    /// Re-read the rc file if the poll period has elapsed and the file
    /// has changed since it was last read.
    void reload_config();
  };

} // namespace tw

#endif // __TW_CORE_SETTINGS_H__
