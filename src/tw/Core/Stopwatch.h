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


/// \file Core/Stopwatch.h
///
/// Wall-clock timing of pipeline stages.
///
#ifndef __TW_CORE_STOPWATCH_H__
#define __TW_CORE_STOPWATCH_H__

#include <tw/Core/FundamentalTypes.h>

namespace tw {

  /// Accumulates the wall-clock time spent between start() and stop()
  /// calls.  Nested start() calls are counted, and only the outermost
  /// stop() ends an interval.  Not thread safe.
  class Stopwatch {
    uint64 m_elapsed;
    uint64 m_started;
    uint32 m_depth;
    uint32 m_stops;

  public:
    /// Microseconds since the epoch.
    static uint64 microtime();

    Stopwatch() : m_elapsed(0), m_started(0), m_depth(0), m_stops(0) {}

    void start();
    void stop();
    void reset() { *this = Stopwatch(); }

    bool is_running() const { return m_depth != 0; }
    uint32 num_stops() const { return m_stops; }

    /// Includes the current interval when running.
    uint64 elapsed_microseconds() const;
    double elapsed_seconds() const { return double(elapsed_microseconds()) * 1e-6; }
  };

} // namespace tw

#endif // __TW_CORE_STOPWATCH_H__
