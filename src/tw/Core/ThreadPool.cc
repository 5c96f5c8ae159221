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


#include <tw/Core/ThreadPool.h>
#include <tw/Core/Exception.h>
#include <tw/Core/Log.h>

namespace tw {

  // ---------------------------------------------------
  // Task
  // ---------------------------------------------------

  void Task::run() {
    std::exception_ptr error;
    try {
      (*this)();
    } catch (...) {
      // Handed back to the owner through rethrow_if_failed().
      error = std::current_exception();
    }
    Mutex::Lock lock( m_mutex );
    m_error = error;
    m_finished = true;
    m_finished_event.notify_all();
  }

  bool Task::is_finished() const {
    Mutex::Lock lock( m_mutex );
    return m_finished;
  }

  void Task::join() {
    Mutex::Lock lock( m_mutex );
    while (!m_finished)
      m_finished_event.wait( lock );
  }

  bool Task::failed() const {
    Mutex::Lock lock( m_mutex );
    return bool( m_error );
  }

  void Task::rethrow_if_failed() const {
    std::exception_ptr error;
    {
      Mutex::Lock lock( m_mutex );
      error = m_error;
    }
    if (error)
      std::rethrow_exception( error );
  }

  // ---------------------------------------------------
  // WorkQueue
  // ---------------------------------------------------

  struct WorkQueue::Worker {
    WorkQueue& queue;
    explicit Worker( WorkQueue& q ) : queue(q) {}
    void operator()() { queue.work(); }
  };

  WorkQueue::WorkQueue( int num_threads )
    : m_max_workers( num_threads ), m_active_workers( 0 ) {
    TW_ASSERT( num_threads > 0, ArgumentErr() << "WorkQueue: need at least one thread, got " << num_threads << "." );
  }

  WorkQueue::~WorkQueue() {
    // Reaps the threads of any workers that have already exited.
    for (size_t i = 0; i < m_threads.size(); ++i)
      m_threads[i]->join();
  }

  void WorkQueue::work() {
    for (;;) {
      boost::shared_ptr<Task> task;
      {
        // Taking a task and retiring happen under the same lock as
        // notify(), so a task queued meanwhile is never stranded.
        Mutex::Lock lock( m_mutex );
        task = get_next_task();
        if (!task) {
          --m_active_workers;
          TW_OUT(DebugMessage, "thread") << "WorkQueue: worker exiting, "
                                         << m_active_workers << " still active.\n";
          m_idle_event.notify_all();
          return;
        }
      }
      task->run();
    }
  }

  void WorkQueue::notify() {
    Mutex::Lock lock( m_mutex );
    if (m_active_workers >= m_max_workers)
      return;
    ++m_active_workers;
    boost::shared_ptr<Worker> worker( new Worker( *this ) );
    m_threads.push_back( boost::shared_ptr<Thread>( new Thread( worker ) ) );
    TW_OUT(DebugMessage, "thread") << "WorkQueue: started worker, " << m_active_workers
                                   << " of " << m_max_workers << " active.\n";
  }

  int WorkQueue::max_threads() {
    Mutex::Lock lock( m_mutex );
    return m_max_workers;
  }

  int WorkQueue::active_threads() {
    Mutex::Lock lock( m_mutex );
    return m_active_workers;
  }

  void WorkQueue::join_all() {
    std::vector<boost::shared_ptr<Thread> > threads;
    {
      Mutex::Lock lock( m_mutex );
      while (m_active_workers != 0)
        m_idle_event.wait( lock );
      threads.swap( m_threads );
    }
    for (size_t i = 0; i < threads.size(); ++i)
      threads[i]->join();
  }

  // ---------------------------------------------------
  // FifoWorkQueue
  // ---------------------------------------------------

  size_t FifoWorkQueue::size() {
    Mutex::Lock lock( m_queue_mutex );
    return m_queue.size();
  }

  void FifoWorkQueue::add_task( boost::shared_ptr<Task> task ) {
    {
      Mutex::Lock lock( m_queue_mutex );
      m_queue.push_back( task );
    }
    notify();
  }

  boost::shared_ptr<Task> FifoWorkQueue::get_next_task() {
    Mutex::Lock lock( m_queue_mutex );
    if (m_queue.empty())
      return boost::shared_ptr<Task>();
    boost::shared_ptr<Task> task = m_queue.front();
    m_queue.pop_front();
    return task;
  }

} // namespace tw
