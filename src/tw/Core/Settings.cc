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
#include <tw/Core/Exception.h>

#include <boost/filesystem/operations.hpp>

#include <cstdlib>
#include <iostream>

namespace fs = boost::filesystem;

namespace tw {

namespace {

  std::string default_tmp_directory() {
    boost::system::error_code ec;
    fs::path tmp = fs::temp_directory_path( ec );
    return ec ? std::string("/tmp") : tmp.string();
  }

  // An empty name disables the rc file.
  std::string default_rc_filename() {
    const char* home = std::getenv( "HOME" );
    if (!home || !*home)
      return std::string();
    return (fs::path( home ) / ".twrc").string();
  }

  uint32 hardware_thread_count() {
    uint32 n = boost::thread::hardware_concurrency();
    return n > 0 ? n : 4;
  }
}

#define TW_INIT_SETTING(Name, Default) m_ ## Name(Default), m_ ## Name ## _override(false)

Settings::Settings()
  : TW_INIT_SETTING(default_num_threads, hardware_thread_count()),
    TW_INIT_SETTING(tmp_directory,       default_tmp_directory()),
    TW_INIT_SETTING(storage_retries,     3),
    TW_INIT_SETTING(min_zoom,            9),
    TW_INIT_SETTING(max_zoom,            16),
    TW_INIT_SETTING(tile_size,           256),
    TW_INIT_SETTING(resample_kernel,     std::string("bilinear")),
    m_rc_filename( default_rc_filename() ),
    m_rc_last_poll( 0 ),
    m_rc_last_modification( 0 ),
    m_rc_poll_period( 5.0 ) {}

#undef TW_INIT_SETTING

// Called before every setting read and every log message, so it must
// not log.
void Settings::reload_config() {
  RecursiveMutex::Lock lock( m_rc_mutex );
  if (m_rc_filename.empty())
    return;

  std::time_t now = std::time( 0 );
  if (m_rc_last_poll != 0 && std::difftime( now, m_rc_last_poll ) < m_rc_poll_period)
    return;
  m_rc_last_poll = now;

  boost::system::error_code ec;
  std::time_t modified = fs::last_write_time( m_rc_filename, ec );
  if (ec || modified <= m_rc_last_modification)
    return;
  m_rc_last_modification = modified;

  try {
    parse_config_file( m_rc_filename.c_str(), *this );
  } catch (const IOErr& e) {
    std::cerr << "Could not reread " << m_rc_filename << ": " << e.what() << std::endl;
  }
}

void Settings::set_rc_filename( std::string filename, bool parse_now ) {
  {
    RecursiveMutex::Lock lock( m_rc_mutex );
    m_rc_filename = filename;
    m_rc_last_poll = 0;
    m_rc_last_modification = 0;
  }
  if (parse_now)
    reload_config();
}

void Settings::set_rc_poll_period( double seconds ) {
  {
    RecursiveMutex::Lock lock( m_rc_mutex );
    m_rc_poll_period = seconds;
    m_rc_last_poll = 0;
  }
  reload_config();
}

// A getter rereads the rc file unless the value was set through the
// API, which always wins.
#define TW_DEFINE_SETTING(Name, Type)                  \
  Type Settings::Name() {                              \
    if (!m_ ## Name ## _override)                      \
      reload_config();                                 \
    RecursiveMutex::Lock lock( m_settings_mutex );     \
    return m_ ## Name;                                 \
  }                                                    \
  void Settings::set_ ## Name( const Type& x ) {       \
    RecursiveMutex::Lock lock( m_settings_mutex );     \
    m_ ## Name ## _override = true;                    \
    m_ ## Name = x;                                    \
  }                                                    \
  void Settings::rc_set_ ## Name( const Type& x ) {    \
    RecursiveMutex::Lock lock( m_settings_mutex );     \
    if (!m_ ## Name ## _override)                      \
      m_ ## Name = x;                                  \
  }

TW_DEFINE_SETTING(default_num_threads, uint32)
TW_DEFINE_SETTING(tmp_directory, std::string)
TW_DEFINE_SETTING(storage_retries, uint32)
TW_DEFINE_SETTING(min_zoom, int32)
TW_DEFINE_SETTING(max_zoom, int32)
TW_DEFINE_SETTING(tile_size, uint32)
TW_DEFINE_SETTING(resample_kernel, std::string)

#undef TW_DEFINE_SETTING

} // namespace tw
