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


#include <test/Helpers.h>
#include <tw/Core/ThreadPool.h>

#include <vector>

using namespace tw;

class CountTask : public Task {
  int& m_slot;
  int  m_value;
public:
  CountTask(int& slot, int value) : m_slot(slot), m_value(value) {}
  void operator()() {
    Thread::sleep_ms(5);
    m_slot = m_value;
  }
};

class FailingTask : public Task {
public:
  void operator()() {
    tw_throw( ProjectionErr() << "row block 3 fell off the map" );
  }
};

TEST(ThreadPool, JoinAllIsABarrier) {
  std::vector<int> results(32, 0);
  std::vector<boost::shared_ptr<CountTask> > tasks;

  FifoWorkQueue queue(4);
  for (int i = 0; i < 32; ++i) {
    tasks.push_back(boost::shared_ptr<CountTask>(new CountTask(results[i], i + 1)));
    queue.add_task(tasks.back());
  }
  queue.join_all();

  EXPECT_EQ( 0u, queue.size() );
  EXPECT_EQ( 0, queue.active_threads() );
  for (int i = 0; i < 32; ++i) {
    EXPECT_TRUE( tasks[i]->is_finished() );
    EXPECT_EQ( i + 1, results[i] );
  }
}

TEST(ThreadPool, LimitedThreads) {
  FifoWorkQueue queue(2);
  EXPECT_EQ( 2, queue.max_threads() );

  int a = 0, b = 0, c = 0;
  queue.add_task(boost::shared_ptr<Task>(new CountTask(a, 1)));
  queue.add_task(boost::shared_ptr<Task>(new CountTask(b, 2)));
  queue.add_task(boost::shared_ptr<Task>(new CountTask(c, 3)));
  EXPECT_GE( 2, queue.active_threads() );
  queue.join_all();
  EXPECT_EQ( 1, a );
  EXPECT_EQ( 2, b );
  EXPECT_EQ( 3, c );
}

TEST(ThreadPool, ErrorsSurfaceOnTheOwner) {
  boost::shared_ptr<FailingTask> bad(new FailingTask);
  int ok_slot = 0;
  boost::shared_ptr<CountTask> good(new CountTask(ok_slot, 7));

  FifoWorkQueue queue(2);
  queue.add_task(bad);
  queue.add_task(good);
  queue.join_all();

  EXPECT_TRUE( bad->failed() );
  EXPECT_FALSE( good->failed() );
  EXPECT_EQ( 7, ok_slot );
  EXPECT_THROW( bad->rethrow_if_failed(), ProjectionErr );
  EXPECT_NO_THROW( good->rethrow_if_failed() );
}

TEST(ThreadPool, ReuseAfterJoin) {
  FifoWorkQueue queue(1);
  int x = 0, y = 0;
  queue.add_task(boost::shared_ptr<Task>(new CountTask(x, 1)));
  queue.join_all();
  queue.add_task(boost::shared_ptr<Task>(new CountTask(y, 2)));
  queue.join_all();
  EXPECT_EQ( 1, x );
  EXPECT_EQ( 2, y );
}
