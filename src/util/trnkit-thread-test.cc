// util/trnkit-thread-test.cc

// Copyright 2012  Johns Hopkins University (Author: Daniel Povey)
// Copyright 2026  trnkit authors

// See ../../COPYING for clarification regarding multiple authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//  http://www.apache.org/licenses/LICENSE-2.0
//
// THIS CODE IS PROVIDED *AS IS* BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, EITHER EXPRESS OR IMPLIED, INCLUDING WITHOUT LIMITATION ANY IMPLIED
// WARRANTIES OR CONDITIONS OF TITLE, FITNESS FOR A PARTICULAR PURPOSE,
// MERCHANTABLITY OR NON-INFRINGEMENT.
// See the Apache 2 License for the specific language governing permissions and
// limitations under the License.

#include <atomic>
#include <chrono>
#include <thread>

#include "base/trnkit-common.h"
#include "util/trnkit-thread.h"

namespace trnkit {

// Sleeps for a random time, so tasks finish out of order, then records its
// index on destruction.
class MyTaskClass {
 public:
  MyTaskClass(int32 index, std::vector<int32> *output,
              std::atomic<int32> *num_running, std::atomic<int32> *max_running):
      index_(index), output_(output), num_running_(num_running),
      max_running_(max_running) { }

  void operator () () {
    int32 n = ++(*num_running_);
    int32 m = max_running_->load();
    while (n > m && !max_running_->compare_exchange_weak(m, n)) { }
    std::this_thread::sleep_for(std::chrono::milliseconds(rand() % 5));
    --(*num_running_);
  }

  ~MyTaskClass() { output_->push_back(index_); }

 private:
  int32 index_;
  std::vector<int32> *output_;
  std::atomic<int32> *num_running_;
  std::atomic<int32> *max_running_;
};

void TestTaskSequencer() {
  TaskSequencerConfig config;
  config.num_threads = 1 + rand() % 4;

  std::vector<int32> output;
  std::atomic<int32> num_running(0), max_running(0);
  int32 num_tasks = rand() % 100;
  {
    TaskSequencer<MyTaskClass> sequencer(config);
    TRNKIT_ASSERT(sequencer.NumThreads() == config.num_threads);
    for (int32 i = 0; i < num_tasks; i++)
      sequencer.Run(new MyTaskClass(i, &output, &num_running, &max_running));
    sequencer.Wait();
    TRNKIT_ASSERT(static_cast<int32>(output.size()) == num_tasks);
    // The sequencer can be reused after Wait().
    for (int32 i = 0; i < 10; i++)
      sequencer.Run(new MyTaskClass(num_tasks + i, &output, &num_running,
                                    &max_running));
  }
  TRNKIT_ASSERT(static_cast<int32>(output.size()) == num_tasks + 10);
  for (size_t i = 0; i < output.size(); i++)
    TRNKIT_ASSERT(output[i] == static_cast<int32>(i));
  TRNKIT_ASSERT(max_running.load() <= config.num_threads);
}

void TestSemaphore() {
  Semaphore sema(2);
  sema.Wait();
  sema.Wait();
  // The count is now 0, so the waiter blocks until Signal().
  std::atomic<bool> done(false);
  std::thread waiter([&sema, &done]() { sema.Wait(); done = true; });
  TRNKIT_ASSERT(!done);
  sema.Signal();
  waiter.join();
  TRNKIT_ASSERT(done);
}

}  // end namespace trnkit

int main() {
  using namespace trnkit;
  TestSemaphore();
  for (int32 i = 0; i < 20; i++)
    TestTaskSequencer();
  std::cout << "Test OK.\n";
}
