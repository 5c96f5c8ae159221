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


#include <tw/Core/ProgressCallback.h>
#include <tw/Core/Exception.h>

#include <algorithm>
#include <sstream>

namespace tw {

namespace {

  class NullProgressCallback : public ProgressCallback {
  public:
    virtual void report_progress( double ) const {}
    virtual void report_incremental_progress( double ) const {}
    virtual void report_finished() const {}
  };

  NullProgressCallback g_null_progress;

  const int BAR_WIDTH = 50;
}

ProgressCallback const& ProgressCallback::dummy_instance() {
  return g_null_progress;
}

void ProgressCallback::report_progress( double progress ) const {
  Mutex::Lock lock( m_mutex );
  m_progress = progress;
  progress_changed();
}

void ProgressCallback::report_incremental_progress( double increment ) const {
  Mutex::Lock lock( m_mutex );
  m_progress += increment;
  progress_changed();
}

double ProgressCallback::progress() const {
  Mutex::Lock lock( m_mutex );
  return m_progress;
}

TerminalProgressCallback::TerminalProgressCallback( std::string const& log_namespace,
                                                    std::string const& label,
                                                    MessageLevel level )
  : m_level( level ), m_namespace( log_namespace + ".progress" ),
    m_label( label ), m_last_percent( -1 ) {
  if (level < InfoMessage)
    tw_throw( ArgumentErr() << "TerminalProgressCallback needs InfoMessage or a lower priority." );
}

void TerminalProgressCallback::progress_changed() const {
  double clamped = std::min( 1.0, std::max( 0.0, m_progress ) );
  int percent = int( clamped * 100 );
  if (percent == m_last_percent)
    return;
  m_last_percent = percent;

  int filled = int( clamped * BAR_WIDTH );
  std::ostringstream bar;
  bar << "\r" << m_label << " [" << std::string( filled, '*' )
      << std::string( BAR_WIDTH - filled, '.' ) << "] " << percent << "%";
  TW_OUT(m_level, m_namespace) << bar.str() << std::flush;
}

void TerminalProgressCallback::report_finished() const {
  Mutex::Lock lock( m_mutex );
  m_progress = 1.0;
  m_last_percent = 100;
  TW_OUT(m_level, m_namespace) << "\r" << m_label << " [" << std::string( BAR_WIDTH, '*' )
                               << "] Complete!\n";
}

} // namespace tw
