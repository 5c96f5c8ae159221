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


#include <tw/Core/Stopwatch.h>
#include <tw/Core/Exception.h>

#include <sys/time.h>

namespace tw {

  uint64 Stopwatch::microtime() {
    struct timeval tv;
    gettimeofday( &tv, NULL );
    return uint64(tv.tv_sec) * 1000000 + uint64(tv.tv_usec);
  }

  void Stopwatch::start() {
    if (m_depth++ == 0)
      m_started = microtime();
  }

  void Stopwatch::stop() {
    TW_ASSERT( m_depth > 0, LogicErr() << "Stopwatch stopped without being started." );
    if (--m_depth == 0) {
      m_elapsed += microtime() - m_started;
      ++m_stops;
    }
  }

  uint64 Stopwatch::elapsed_microseconds() const {
    if (m_depth == 0)
      return m_elapsed;
    return m_elapsed + (microtime() - m_started);
  }

} // namespace tw
