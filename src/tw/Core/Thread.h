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


/// \file Core/Thread.h
///
/// Thin wrappers around Boost.Thread: Mutex and RecursiveMutex with
/// nested scoped Lock classes, a Condition to wait on, and a Thread
/// that runs any object with operator().
///
#ifndef __TW_CORE_THREAD_H__
#define __TW_CORE_THREAD_H__

#include <tw/Core/FundamentalTypes.h>

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/thread/locks.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/recursive_mutex.hpp>
#include <boost/thread/thread.hpp>

namespace tw {

  /// Exclusive lock.  Lock and unlock it through a Mutex::Lock.
  class Mutex : private boost::mutex {
  public:
    Mutex() {}

    void lock()   { boost::mutex::lock(); }
    void unlock() { boost::mutex::unlock(); }

    /// Locks the mutex for the lifetime of the object.
    class Lock : private boost::unique_lock<boost::mutex>, private boost::noncopyable {
    public:
      explicit Lock( Mutex& mutex ) : boost::unique_lock<boost::mutex>( mutex ) {}
      void lock()   { boost::unique_lock<boost::mutex>::lock(); }
      void unlock() { boost::unique_lock<boost::mutex>::unlock(); }
    };
  };

  /// A mutex the owning thread may lock again.
  class RecursiveMutex : private boost::recursive_mutex {
  public:
    RecursiveMutex() {}

    void lock()   { boost::recursive_mutex::lock(); }
    void unlock() { boost::recursive_mutex::unlock(); }

    class Lock : private boost::unique_lock<boost::recursive_mutex>, private boost::noncopyable {
    public:
      explicit Lock( RecursiveMutex& mutex ) : boost::unique_lock<boost::recursive_mutex>( mutex ) {}
      void lock()   { boost::unique_lock<boost::recursive_mutex>::lock(); }
      void unlock() { boost::unique_lock<boost::recursive_mutex>::unlock(); }
    };
  };

  /// Wait for a state change announced by another thread.  Waiting
  /// releases the held lock and takes it back before returning.
  class Condition : private boost::condition_variable_any, private boost::noncopyable {
  public:
    Condition() {}

    void notify_one() { boost::condition_variable_any::notify_one(); }
    void notify_all() { boost::condition_variable_any::notify_all(); }

    template <class LockT>
    void wait( LockT& lock ) { boost::condition_variable_any::wait( lock ); }

    /// Waits until pred() holds.
    template <class LockT, class PredT>
    void wait( LockT& lock, PredT pred ) { boost::condition_variable_any::wait( lock, pred ); }
  };

  /// Runs a task object's operator() on a new thread.  The caller
  /// keeps the task through the shared pointer and must join() before
  /// the Thread is destroyed.
  class Thread : private boost::noncopyable {
    boost::thread m_thread;

    template <class TaskT>
    struct Runner {
      boost::shared_ptr<TaskT> task;
      explicit Runner( boost::shared_ptr<TaskT> const& t ) : task(t) {}
      void operator()() { (*task)(); }
    };

  public:
    template <class TaskT>
    explicit Thread( boost::shared_ptr<TaskT> const& task ) : m_thread( Runner<TaskT>( task ) ) {}

    void join() { m_thread.join(); }

    /// A small unique number for the calling thread, assigned on the
    /// first call from that thread.
    static uint64 id();

    static void sleep_ms( uint32 milliseconds ) {
      boost::this_thread::sleep( boost::posix_time::milliseconds( milliseconds ) );
    }
  };

} // namespace tw

#endif // __TW_CORE_THREAD_H__
