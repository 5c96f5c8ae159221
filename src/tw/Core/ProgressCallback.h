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


/// \file Core/ProgressCallback.h
///
/// Progress reporting for long-running stages.  Progress runs from 0
/// (not started) to 1 (finished).  A pipeline run hands each stage a
/// SubProgressCallback covering its share of the whole.  Reports may
/// come from worker threads.
///
#ifndef __TW_CORE_PROGRESSCALLBACK_H__
#define __TW_CORE_PROGRESSCALLBACK_H__

#include <tw/Core/FundamentalTypes.h>
#include <tw/Core/Log.h>
#include <tw/Core/Thread.h>

#include <string>

namespace tw {

  /// Records the latest progress.  The reporting methods are const so
  /// that a temporary callback can be passed by const reference.
  class ProgressCallback {
  protected:
    mutable double m_progress;
    mutable Mutex m_mutex;

    // Called with m_mutex held after every change.
    virtual void progress_changed() const {}

  public:
    ProgressCallback() : m_progress(0) {}
    ProgressCallback( ProgressCallback const& other ) : m_progress( other.progress() ) {}
    virtual ~ProgressCallback() {}

    virtual void report_progress( double progress ) const;
    virtual void report_incremental_progress( double increment ) const;
    virtual void report_finished() const { report_progress( 1.0 ); }

    virtual double progress() const;

    /// A shared callback that ignores every report.
    static ProgressCallback const& dummy_instance();
  };

  /// Maps [0,1] onto the range [from,to] of a parent callback.
  class SubProgressCallback : public ProgressCallback {
    ProgressCallback const& m_parent;
    double m_from, m_to;
  public:
    SubProgressCallback( ProgressCallback const& parent, double from, double to )
      : m_parent(parent), m_from(from), m_to(to) {}

    virtual void report_progress( double progress ) const {
      m_parent.report_progress( m_from + (m_to - m_from) * progress );
    }
    virtual void report_incremental_progress( double increment ) const {
      m_parent.report_incremental_progress( (m_to - m_from) * increment );
    }
    virtual void report_finished() const { m_parent.report_progress( m_to ); }
    virtual double progress() const {
      return (m_parent.progress() - m_from) / (m_to - m_from);
    }
  };

  /// Draws a text progress bar on the "<namespace>.progress" log
  /// namespace, redrawn in place whenever progress moves by a percent.
  class TerminalProgressCallback : public ProgressCallback {
    MessageLevel m_level;
    std::string m_namespace;
    std::string m_label;
    mutable int m_last_percent;

  protected:
    virtual void progress_changed() const;

  public:
    /// Throws ArgumentErr for a level below InfoMessage.
    TerminalProgressCallback( std::string const& log_namespace, std::string const& label,
                              MessageLevel level = InfoMessage );

    virtual void report_finished() const;
  };

} // namespace tw

#endif // __TW_CORE_PROGRESSCALLBACK_H__
