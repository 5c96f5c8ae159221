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


#include <tw/Core/ConfigParser.h>
#include <tw/Core/Exception.h>
#include <tw/Core/FundamentalTypes.h>
#include <tw/Core/Log.h>
#include <tw/Core/Settings.h>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <boost/shared_ptr.hpp>

#include <fstream>
#include <iostream>

namespace po = boost::program_options;

namespace {

  using namespace tw;

  // Applies one "section.key = value" pair.  Returns false for keys
  // that are not settings.
  bool apply_setting( Settings& settings, std::string const& key, std::string const& value ) {
    if      (key == "general.default_num_threads") settings.rc_set_default_num_threads( boost::lexical_cast<uint32>(value) );
    else if (key == "general.tmp_directory")       settings.rc_set_tmp_directory( value );
    else if (key == "storage.retries")             settings.rc_set_storage_retries( boost::lexical_cast<uint32>(value) );
    else if (key == "tiling.min_zoom")             settings.rc_set_min_zoom( boost::lexical_cast<int32>(value) );
    else if (key == "tiling.max_zoom")             settings.rc_set_max_zoom( boost::lexical_cast<int32>(value) );
    else if (key == "tiling.tile_size")            settings.rc_set_tile_size( boost::lexical_cast<uint32>(value) );
    else if (key == "warp.kernel")                 settings.rc_set_resample_kernel( value );
    else return false;
    return true;
  }

  // Tracks which log a run of "[logfile <name>]" rules applies to.
  class LogRuleTarget {
    std::string m_name;
    boost::shared_ptr<LogInstance> m_log;
  public:
    LogRuleTarget() : m_name("console") {}

    LogRuleSet& rules_for( std::string const& name ) {
      if (name != m_name) {
        m_name = name;
        m_log.reset();
        if (name != "console") {
          m_log.reset( new LogInstance( name ) );
          tw_log().add( m_log );
        }
      }
      return m_log ? m_log->rule_set() : tw_log().console_log().rule_set();
    }
  };

  // "[logfile <name>]" sections arrive as "logfile <name>.<level>".
  void apply_log_rule( LogRuleTarget& target, std::string const& key, std::string const& pattern ) {
    size_t dot = key.find_last_of( '.' );
    if (dot == std::string::npos || dot <= 8 || dot+1 == key.size() || pattern.empty())
      return;

    int32 level = message_level_from_string( key.substr( dot+1 ) );
    if (level >= DebugMessage)
      std::cerr << "Warning! Your config file enables debug logging. This will be slow." << std::endl;
    target.rules_for( key.substr( 8, dot-8 ) ).add_rule( level, pattern );
  }
}

void tw::parse_config_file( const char* fn, tw::Settings& settings ) {
  std::ifstream file( fn );
  if (!file.is_open())
    tw_throw( IOErr() << "Could not open config file: " << fn );
  parse_config( file, settings );
}

void tw::parse_config( std::basic_istream<char>& stream, tw::Settings& settings ) {
  // The system log calls reload_config() before every message, and we
  // are inside it here, so report problems on std::cerr only.
  po::options_description desc("All options");
  desc.add_options()("*", "All");

  po::parsed_options opts( 0 );
  try {
    opts = po::parse_config_file( stream, desc );
  } catch (const po::error& e) {
    std::cerr << "Could not parse config file, ignoring it. (" << e.what() << ")" << std::endl;
    return;
  }

  LogRuleTarget target;
  for (size_t i = 0; i < opts.options.size(); ++i) {
    po::option const& o = opts.options[i];
    if (o.value.empty())
      continue;
    try {
      if (boost::starts_with( o.string_key, "logfile " ))
        apply_log_rule( target, o.string_key, o.value[0] );
      else
        apply_setting( settings, o.string_key, o.value[0] );
    } catch (const boost::bad_lexical_cast&) {
      std::cerr << "Could not parse line in config file near " << o.string_key << ", skipping." << std::endl;
    } catch (const ArgumentErr& e) {
      std::cerr << "Skipping " << o.string_key << " in config file: " << e.what() << std::endl;
    }
  }
}
