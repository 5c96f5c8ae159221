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


/// \file Core/Log.h
///
/// The system log.  Messages carry a level and a namespace ("pipeline",
/// "mosaic", "pipeline.progress", ...) and are written to the console
/// and to any number of log files, each filtered by its own LogRuleSet.
///
/// Output is collected per thread and written one complete line at a
/// time, so workers tiling in parallel never split each other's lines.
/// A line ends with a trailing newline or an explicit std::flush.
///
///   TW_OUT(DebugMessage, "mosaic") << "Level " << z << " done.\n";
///
#ifndef __TW_CORE_LOG_H__
#define __TW_CORE_LOG_H__

#include <tw/Core/FundamentalTypes.h>
#include <tw/Core/Thread.h>
#include <tw/Core/System.h>

#include <boost/noncopyable.hpp>
#include <boost/scoped_ptr.hpp>
#include <boost/shared_ptr.hpp>

#include <map>
#include <ostream>
#include <streambuf>
#include <string>
#include <vector>

namespace tw {

  // Lower number -> higher priority
  enum MessageLevel {
    NoMessage           = -1,
    ErrorMessage        =  0,
    WarningMessage      = 10,
    InfoMessage         = 20,
    DebugMessage        = 30,
    VerboseDebugMessage = 40,
    EveryMessage        = 100
  };

  /// Parses "InfoMessage", "DebugMessage", ..., "*" (EveryMessage) or a
  /// plain integer.  Throws ArgumentErr on anything else.
  int32 message_level_from_string( std::string const& name );

  /// \cond INTERNAL
  namespace detail {

    // Swallows everything written to it.
    class NullBuf : public std::streambuf {
    protected:
      virtual int_type overflow( int_type c ) { return traits_type::not_eof(c); }
      virtual std::streamsize xsputn( const char*, std::streamsize n ) { return n; }
    };

    // Collects characters per thread and passes each finished line on
    // to the target streambuf in a single write.
    class LineBuf : public std::streambuf {
      std::streambuf* m_target;
      std::map<uint64, std::string> m_lines;
      Mutex m_mutex;

      void emit( std::string& line );
    protected:
      virtual int_type overflow( int_type c );
      virtual std::streamsize xsputn( const char* s, std::streamsize n );
      virtual int sync();
    public:
      explicit LineBuf( std::streambuf* target ) : m_target( target ) {}
      ~LineBuf();
    };

    // Forwards everything to a set of streams chosen per message.
    class TeeBuf : public std::streambuf {
      std::vector<std::ostream*> m_targets;
    protected:
      virtual int_type overflow( int_type c );
      virtual std::streamsize xsputn( const char* s, std::streamsize n );
      virtual int sync();
    public:
      void reset() { m_targets.clear(); }
      void add( std::ostream& target ) { m_targets.push_back( &target ); }
      bool empty() const { return m_targets.empty(); }
    };

  } // namespace detail
  /// \endcond

  /// Filters log messages by level and namespace.
  ///
  /// Each rule is a (level, namespace pattern) pair.  The most recently
  /// added rule whose pattern matches a message's namespace decides:
  /// the message passes when its level is at or above the rule's
  /// priority.  A pattern may hold one wildcard, either leading
  /// ("*.progress") or trailing ("mosaic.*", which also matches
  /// "mosaic" itself).  With no matching rule, "console" and
  /// "*.progress" pass at InfoMessage and every namespace passes
  /// warnings and errors.
  class LogRuleSet {
    struct Rule {
      int level;
      std::string pattern;
      Rule( int l, std::string const& p ) : level(l), pattern(p) {}
    };
    std::vector<Rule> m_rules;
    mutable Mutex m_mutex;

    static bool matches( std::string const& pattern, std::string const& name );

  public:
    LogRuleSet() {}
    LogRuleSet( LogRuleSet const& other );
    LogRuleSet& operator=( LogRuleSet const& other );
    virtual ~LogRuleSet() {}

    /// Throws ArgumentErr for a pattern with more than one wildcard or
    /// a wildcard in the middle.
    void add_rule( int log_level, std::string const& log_namespace );
    void clear();

    virtual bool operator()( int log_level, std::string const& log_namespace ) const;
  };

  /// One log destination: a stream plus the rules that decide what
  /// reaches it.
  class LogInstance : private boost::noncopyable {
    boost::scoped_ptr<std::ostream> m_file;
    boost::scoped_ptr<detail::LineBuf> m_buf;
    boost::scoped_ptr<std::ostream> m_stream;
    bool m_prepend_infostamp;
    LogRuleSet m_rule_set;

  public:
    /// Appends to the named file.  Throws IOErr if it cannot be opened.
    explicit LogInstance( std::string const& log_filename, bool prepend_infostamp = true );

    /// Writes to an existing stream, which must outlive the instance.
    explicit LogInstance( std::ostream& log_ostream, bool prepend_infostamp = true );

    ~LogInstance();

    /// Returns the log stream with the message header already written
    /// if the rules accept the message, or a stream that discards
    /// everything otherwise.
    std::ostream& operator()( int log_level, std::string const& log_namespace = "console" );

    bool accepts( int log_level, std::string const& log_namespace ) const {
      return m_rule_set( log_level, log_namespace );
    }

    LogRuleSet& rule_set() { return m_rule_set; }
  };

  /// The system log: a console instance plus any number of others.
  /// Use tw_log() rather than constructing one.
  class Log : private boost::noncopyable {
    boost::shared_ptr<LogInstance> m_console_log;
    std::vector<boost::shared_ptr<LogInstance> > m_logs;
    Mutex m_logs_mutex;

    // Each thread writes through its own tee so that the set of
    // matching instances chosen for one message is not disturbed by
    // another thread.
    struct ThreadStream;
    std::map<uint64, boost::shared_ptr<ThreadStream> > m_streams;
    Mutex m_streams_mutex;

  public:
    Log();
    ~Log();

    /// Returns a stream that reaches every instance accepting the
    /// given level and namespace.
    std::ostream& operator()( int log_level, std::string const& log_namespace = "console" );

    void add( std::ostream& stream, LogRuleSet rule_set = LogRuleSet(), bool prepend_infostamp = true );
    void add( boost::shared_ptr<LogInstance> log );

    /// Removes every instance except the console.
    void clear();

    LogInstance& console_log();
    void set_console_stream( std::ostream& stream, LogRuleSet rule_set = LogRuleSet(),
                             bool prepend_infostamp = true );

    /// True if some instance would accept the message.
    bool is_enabled( int log_level = InfoMessage, std::string const& log_namespace = "console" );
  };

  /// Writes a message to the system log.
  std::ostream& tw_out( int log_level = InfoMessage, std::string const& log_namespace = "console" );

  /// Like tw_out, but the stream arguments are only evaluated when the
  /// message would be written somewhere.  The empty branch keeps a
  /// following else bound to the caller's if.
#define TW_OUT(...) if(!::tw::tw_log().is_enabled(__VA_ARGS__)) {} else ::tw::tw_out(__VA_ARGS__)

} // namespace tw

#endif // __TW_CORE_LOG_H__
