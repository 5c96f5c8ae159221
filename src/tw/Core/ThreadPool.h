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


/// \file tw/Core/ThreadPool.h
///
/// A small thread pool.  Work is expressed as Task subclasses and
/// handed to a FifoWorkQueue, which runs at most num_threads of them
/// at a time.  WorkQueue::join_all() is the barrier: it returns once
/// every queued task has finished.
///
/// A task that throws does not take down its worker thread.  The
/// exception is stored on the task, and the owner rethrows it on its
/// own thread with Task::rethrow_if_failed() after joining.
///
#ifndef __TW_CORE_THREADPOOL_H__
#define __TW_CORE_THREADPOOL_H__

#include <tw/Core/Settings.h>
#include <tw/Core/System.h>
#include <tw/Core/Thread.h>

#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>

#include <deque>
#include <exception>
#include <vector>

namespace tw {

  class WorkQueue;

  /// A unit of work.  Subclasses implement operator().
  class Task : private boost::noncopyable {
    mutable Mutex m_mutex;
    Condition m_finished_event;
    bool m_finished;
    std::exception_ptr m_error;

    friend class WorkQueue;
    // Runs operator() and records how it ended.
    void run();

  public:
    Task() : m_finished(false) {}
    virtual ~Task() {}

    virtual void operator()() = 0;

    bool is_finished() const;

    /// Blocks until the task has run.
    void join();

    /// True if operator() ended with an exception.
    bool failed() const;

    /// Rethrows the exception that escaped operator(), if any.
    void rethrow_if_failed() const;
  };

  /// The thread pool.  Subclasses decide the order in which tasks run
  /// by implementing get_next_task(), and call notify() whenever they
  /// have queued more work.
  class WorkQueue : private boost::noncopyable {
    struct Worker;

    Mutex m_mutex;
    Condition m_idle_event;
    int m_max_workers;
    int m_active_workers;
    std::vector<boost::shared_ptr<Thread> > m_threads;

    // Worker loop: keeps taking tasks until there are none left.
    void work();

  protected:
    /// Returns the next task to run, or an empty pointer.  Called with
    /// the pool's lock held, from any thread.
    virtual boost::shared_ptr<Task> get_next_task() = 0;

    /// Starts another worker if the pool is not yet full.
    void notify();

  public:
    explicit WorkQueue( int num_threads = tw_settings().default_num_threads() );

    /// Subclasses must call join_all() in their own destructor, since
    /// the workers call back into get_next_task().
    virtual ~WorkQueue();

    int max_threads();
    int active_threads();

    /// Waits until every queued task has run and every worker has
    /// exited.
    void join_all();
  };

  /// Runs tasks in the order they were added.
  class FifoWorkQueue : public WorkQueue {
    Mutex m_queue_mutex;
    std::deque<boost::shared_ptr<Task> > m_queue;

  protected:
    virtual boost::shared_ptr<Task> get_next_task();

  public:
    explicit FifoWorkQueue( int num_threads = tw_settings().default_num_threads() )
      : WorkQueue( num_threads ) {}
    virtual ~FifoWorkQueue() { join_all(); }

    /// Number of tasks waiting for a worker.
    size_t size();

    void add_task( boost::shared_ptr<Task> task );
  };

} // namespace tw

#endif // __TW_CORE_THREADPOOL_H__
