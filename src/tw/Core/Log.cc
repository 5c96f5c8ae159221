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


#include <tw/Core/Log.h>
#include <tw/Core/Exception.h>
#include <tw/Core/Settings.h>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/lexical_cast.hpp>

#include <algorithm>
#include <fstream>
#include <iostream>

namespace tw {

namespace {

  detail::NullBuf g_null_buf;
  std::ostream g_null_ostream( &g_null_buf );

  std::string timestamp() {
    std::string stamp = boost::posix_time::to_iso_extended_string(
                          boost::posix_time::second_clock::local_time() );
    std::replace( stamp.begin(), stamp.end(), 'T', ' ' );
    return stamp;
  }

  bool ends_line( char c ) { return c == '\n' || c == '\r'; }
}

int32 message_level_from_string( std::string const& name ) {
  if (name == "*" || name == "EveryMessage")   return EveryMessage;
  if (name == "NoMessage")                     return NoMessage;
  if (name == "ErrorMessage")                  return ErrorMessage;
  if (name == "WarningMessage")                return WarningMessage;
  if (name == "InfoMessage")                   return InfoMessage;
  if (name == "DebugMessage")                  return DebugMessage;
  if (name == "VerboseDebugMessage")           return VerboseDebugMessage;
  try {
    return boost::lexical_cast<int32>( name );
  } catch (const boost::bad_lexical_cast&) {
    tw_throw( ArgumentErr() << "Unknown log level \"" << name << "\"." );
  }
  return NoMessage; // never reached
}

std::ostream& tw_out( int log_level, std::string const& log_namespace ) {
  return tw_log()( log_level, log_namespace );
}

// ---------------------------------------------------
// Stream buffers
// ---------------------------------------------------

namespace detail {

  void LineBuf::emit( std::string& line ) {
    if (line.empty() || !m_target)
      return;
    m_target->sputn( line.data(), std::streamsize( line.size() ) );
    m_target->pubsync();
    line.clear();
  }

  LineBuf::int_type LineBuf::overflow( int_type c ) {
    if (traits_type::eq_int_type( c, traits_type::eof() ))
      return traits_type::not_eof( c );
    Mutex::Lock lock( m_mutex );
    std::string& line = m_lines[ Thread::id() ];
    line.push_back( traits_type::to_char_type( c ) );
    if (ends_line( traits_type::to_char_type( c ) ))
      emit( line );
    return c;
  }

  std::streamsize LineBuf::xsputn( const char* s, std::streamsize n ) {
    Mutex::Lock lock( m_mutex );
    std::string& line = m_lines[ Thread::id() ];
    line.append( s, size_t( n ) );
    if (!line.empty() && ends_line( line[line.size()-1] ))
      emit( line );
    return n;
  }

  int LineBuf::sync() {
    Mutex::Lock lock( m_mutex );
    std::map<uint64, std::string>::iterator it = m_lines.find( Thread::id() );
    if (it != m_lines.end())
      emit( it->second );
    return 0;
  }

  LineBuf::~LineBuf() {
    Mutex::Lock lock( m_mutex );
    for (std::map<uint64, std::string>::iterator it = m_lines.begin(); it != m_lines.end(); ++it)
      emit( it->second );
  }

  TeeBuf::int_type TeeBuf::overflow( int_type c ) {
    if (!traits_type::eq_int_type( c, traits_type::eof() ))
      for (size_t i = 0; i < m_targets.size(); ++i)
        m_targets[i]->put( traits_type::to_char_type( c ) );
    return traits_type::not_eof( c );
  }

  std::streamsize TeeBuf::xsputn( const char* s, std::streamsize n ) {
    for (size_t i = 0; i < m_targets.size(); ++i)
      m_targets[i]->write( s, n );
    return n;
  }

  int TeeBuf::sync() {
    for (size_t i = 0; i < m_targets.size(); ++i)
      m_targets[i]->flush();
    return 0;
  }

} // namespace detail

// ---------------------------------------------------
// LogRuleSet
// ---------------------------------------------------

LogRuleSet::LogRuleSet( LogRuleSet const& other ) {
  Mutex::Lock lock( other.m_mutex );
  m_rules = other.m_rules;
}

LogRuleSet& LogRuleSet::operator=( LogRuleSet const& other ) {
  if (this == &other)
    return *this;
  std::vector<Rule> rules;
  {
    Mutex::Lock lock( other.m_mutex );
    rules = other.m_rules;
  }
  Mutex::Lock lock( m_mutex );
  m_rules.swap( rules );
  return *this;
}

void LogRuleSet::add_rule( int log_level, std::string const& log_namespace ) {
  size_t star = log_namespace.find( '*' );
  if (star != std::string::npos) {
    if (log_namespace.find( '*', star+1 ) != std::string::npos)
      tw_throw( ArgumentErr() << "Illegal log rule \"" << log_namespace << "\": only one wildcard is supported." );
    if (star != 0 && star != log_namespace.size()-1)
      tw_throw( ArgumentErr() << "Illegal log rule \"" << log_namespace
                << "\": the wildcard must begin or end the pattern." );
  }
  Mutex::Lock lock( m_mutex );
  m_rules.push_back( Rule( log_level, boost::to_lower_copy( log_namespace ) ) );
}

void LogRuleSet::clear() {
  Mutex::Lock lock( m_mutex );
  m_rules.clear();
}

bool LogRuleSet::matches( std::string const& pattern, std::string const& name ) {
  if (pattern == "*")
    return true;
  if (pattern.empty() || (pattern[0] != '*' && pattern[pattern.size()-1] != '*'))
    return pattern == name;
  if (pattern[0] == '*')
    return boost::ends_with( name, pattern.substr(1) );

  std::string prefix = pattern.substr( 0, pattern.size()-1 );
  // "mosaic.*" covers "mosaic" as well as its children.
  if (boost::ends_with( prefix, "." ) && name == prefix.substr( 0, prefix.size()-1 ))
    return true;
  return boost::starts_with( name, prefix );
}

bool LogRuleSet::operator()( int log_level, std::string const& log_namespace ) const {
  std::string name = boost::to_lower_copy( log_namespace );
  {
    Mutex::Lock lock( m_mutex );
    for (std::vector<Rule>::const_reverse_iterator it = m_rules.rbegin(); it != m_rules.rend(); ++it) {
      if (!matches( it->pattern, name ))
        continue;
      return it->level == EveryMessage || log_level <= it->level;
    }
  }

  if (log_level <= WarningMessage)
    return true;
  return log_level <= InfoMessage && (name == "console" || matches( "*.progress", name ));
}

// ---------------------------------------------------
// LogInstance
// ---------------------------------------------------

LogInstance::LogInstance( std::string const& log_filename, bool prepend_infostamp )
  : m_prepend_infostamp( prepend_infostamp ) {
  std::ofstream* file = new std::ofstream( log_filename.c_str(), std::ios::app );
  m_file.reset( file );
  if (!file->is_open())
    tw_throw( IOErr() << "Could not open log file " << log_filename << " for writing." );
  *file << "\n\nTileWarp log started at " << timestamp() << ".\n\n";
  m_buf.reset( new detail::LineBuf( file->rdbuf() ) );
  m_stream.reset( new std::ostream( m_buf.get() ) );
}

LogInstance::LogInstance( std::ostream& log_ostream, bool prepend_infostamp )
  : m_buf( new detail::LineBuf( log_ostream.rdbuf() ) ),
    m_stream( new std::ostream( m_buf.get() ) ),
    m_prepend_infostamp( prepend_infostamp ) {}

LogInstance::~LogInstance() {
  m_stream.reset();
  m_buf.reset();
}

std::ostream& LogInstance::operator()( int log_level, std::string const& log_namespace ) {
  if (!accepts( log_level, log_namespace ))
    return g_null_ostream;

  std::ostream& out = *m_stream;
  if (m_prepend_infostamp)
    out << timestamp() << " {" << Thread::id() << "} [ " << log_namespace << " ] : ";
  if (log_level == ErrorMessage)
    out << "Error: ";
  else if (log_level == WarningMessage)
    out << "Warning: ";
  return out;
}

// ---------------------------------------------------
// Log
// ---------------------------------------------------

struct Log::ThreadStream {
  detail::TeeBuf buf;
  std::ostream stream;
  ThreadStream() : stream( &buf ) {}
};

Log::Log() : m_console_log( new LogInstance( std::cout, false ) ) {}

Log::~Log() {}

std::ostream& Log::operator()( int log_level, std::string const& log_namespace ) {
  // Pick up rule changes from the rc file first.
  tw_settings().reload_config();

  boost::shared_ptr<ThreadStream> ts;
  {
    Mutex::Lock lock( m_streams_mutex );
    boost::shared_ptr<ThreadStream>& slot = m_streams[ Thread::id() ];
    if (!slot)
      slot.reset( new ThreadStream );
    ts = slot;
  }

  ts->buf.reset();
  Mutex::Lock lock( m_logs_mutex );
  if (m_console_log->accepts( log_level, log_namespace ))
    ts->buf.add( (*m_console_log)( log_level, log_namespace ) );
  for (size_t i = 0; i < m_logs.size(); ++i)
    if (m_logs[i]->accepts( log_level, log_namespace ))
      ts->buf.add( (*m_logs[i])( log_level, log_namespace ) );
  return ts->stream;
}

void Log::add( std::ostream& stream, LogRuleSet rule_set, bool prepend_infostamp ) {
  boost::shared_ptr<LogInstance> log( new LogInstance( stream, prepend_infostamp ) );
  log->rule_set() = rule_set;
  add( log );
}

void Log::add( boost::shared_ptr<LogInstance> log ) {
  Mutex::Lock lock( m_logs_mutex );
  m_logs.push_back( log );
}

void Log::clear() {
  Mutex::Lock lock( m_logs_mutex );
  m_logs.clear();
}

LogInstance& Log::console_log() {
  Mutex::Lock lock( m_logs_mutex );
  return *m_console_log;
}

void Log::set_console_stream( std::ostream& stream, LogRuleSet rule_set, bool prepend_infostamp ) {
  boost::shared_ptr<LogInstance> console( new LogInstance( stream, prepend_infostamp ) );
  console->rule_set() = rule_set;
  Mutex::Lock lock( m_logs_mutex );
  m_console_log = console;
}

bool Log::is_enabled( int log_level, std::string const& log_namespace ) {
  Mutex::Lock lock( m_logs_mutex );
  if (m_console_log->accepts( log_level, log_namespace ))
    return true;
  for (size_t i = 0; i < m_logs.size(); ++i)
    if (m_logs[i]->accepts( log_level, log_namespace ))
      return true;
  return false;
}

} // namespace tw
