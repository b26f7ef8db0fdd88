// util/trnkit-thread.h

// Copyright 2012  Johns Hopkins University (Author: Daniel Povey)
//                 Frantisek Skala

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

#ifndef TRNKIT_UTIL_TRNKIT_THREAD_H_
#define TRNKIT_UTIL_TRNKIT_THREAD_H_ 1

#include <thread>

#include "util/trnkit-semaphore.h"

namespace trnkit {

// Filled in by the caller from its own options (e.g. TrnReaderOptions).
struct TaskSequencerConfig {
  int32 num_threads;
  TaskSequencerConfig(): num_threads(1) { }
  void Check() const { TRNKIT_ASSERT(num_threads >= 1); }
};

/// TaskSequencer runs tasks in parallel threads while making sure that their
/// results come out in the order the tasks were submitted.  Class C must have
/// an operator () that does the work, and a destructor that does the output
/// (or whatever else must happen in submission order).  The operator () of
/// different tasks runs concurrently, so it must not touch shared state
/// without locking; the destructors are called one at a time, in order.
template<class C>
class TaskSequencer {
 public:
  TaskSequencer(const TaskSequencerConfig &config):
      num_threads_(config.num_threads),
      threads_avail_(config.num_threads),
      tot_threads_avail_(config.num_threads + 20),
      thread_list_(NULL) {
    config.Check();
  }

  /// This function takes ownership of the pointer "c", and will delete it
  /// in the same sequence as Run was called on the jobs.
  void Run(C *c) {
    threads_avail_.Wait();  // wait till we have a thread for computation free.
    tot_threads_avail_.Wait();  // this ensures we don't have too many threads
    // waiting on their predecessors, and consuming memory.

    // the new task waits for the previous one, whose details are in "tail".
    RunTaskArgsList *args = new RunTaskArgsList(this, c, thread_list_);
    thread_list_ = args;
    args->thread = std::thread(TaskSequencer<C>::RunTask, args);
  }

  /// Waits until all the tasks submitted so far have run and been deleted.
  /// More tasks may be submitted afterwards.
  void Wait() {
    if (thread_list_ != NULL) {
      thread_list_->thread.join();
      TRNKIT_ASSERT(thread_list_->tail == NULL);  // thread would not
      // have exited without setting tail to NULL.
      delete thread_list_;
      thread_list_ = NULL;
    }
  }

  /// The destructor waits for the last thread to exit.
  ~TaskSequencer() {
    Wait();
  }

  int32 NumThreads() const { return num_threads_; }

 private:
  struct RunTaskArgsList {
    TaskSequencer *me;  // Think of this as a "this" pointer.
    C *c;  // Class instance of the job to do
    std::thread thread;
    RunTaskArgsList *tail;
    RunTaskArgsList(TaskSequencer *me, C *c, RunTaskArgsList *tail):
        me(me), c(c), tail(tail) {}
  };
  // This static function gets run in the threads that we create.
  static void RunTask(RunTaskArgsList *args) {
    // (1) run the job.
    (*(args->c))();  // call operator () on args->c, which does the computation.
    args->me->threads_avail_.Signal();  // Signal that the compute-intensive
    // part of the thread is done (we want to run no more than
    // config_.num_threads of these.)

    // (2) destroy "c", but only after the previous task has been destroyed,
    //     so destructors run in submission order.
    if (args->tail != NULL) {
      args->tail->thread.join();
    }

    delete args->c;  // delete the object "c".  This may produce output; the
    // previous task is finished, so there is no concurrent access.
    args->c = NULL;

    if (args->tail != NULL) {
      TRNKIT_ASSERT(args->tail->tail == NULL);  // Because we already
      // did join on args->tail->thread, which means that
      // thread was done, and before it exited, it would have
      // deleted and set to NULL its tail (which is the next line of code).
      delete args->tail;
      args->tail = NULL;
    }
    // Signal the semaphore that limits the number of threads alive, counting
    // those waiting on their predecessor as well as those computing.
    args->me->tot_threads_avail_.Signal();
  }

  int32 num_threads_;  // copy of config.num_threads (since Semaphore doesn't
  // store original count).

  Semaphore threads_avail_;  // Initialized to the number of threads we are
  // supposed to run with; the function Run() waits on this.

  Semaphore tot_threads_avail_;  // We use this semaphore to ensure we don't
  // consume too much memory...
  RunTaskArgsList *thread_list_;

};

}  // namespace trnkit

#endif  // TRNKIT_UTIL_TRNKIT_THREAD_H_
