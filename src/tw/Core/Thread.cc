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


#include <tw/Core/Thread.h>

#include <boost/thread/tss.hpp>

namespace {

  // Allocated once and never freed, so that threads logging from
  // static destructors can still ask for their id.
  struct ThreadIds {
    tw::Mutex mutex;
    tw::uint64 next;
    boost::thread_specific_ptr<tw::uint64> current;
    ThreadIds() : next(0) {}
  };

  ThreadIds& thread_ids() {
    static ThreadIds* ids = new ThreadIds();
    return *ids;
  }
}

tw::uint64 tw::Thread::id() {
  ThreadIds& ids = thread_ids();
  if (!ids.current.get()) {
    Mutex::Lock lock( ids.mutex );
    ids.current.reset( new uint64( ids.next++ ) );
  }
  return *ids.current;
}
