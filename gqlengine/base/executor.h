//
// Copyright 2019 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//


#ifndef GQLENGINE_BASE_EXECUTOR_H_
#define GQLENGINE_BASE_EXECUTOR_H_

#include <cstddef>
#include <deque>
#include <functional>
#include <thread>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

namespace gqlengine_base {

// Runs posted tasks. Implementations decide when and on which thread a task
// runs; the only guarantee is that every posted task runs exactly once before
// the executor is destroyed.
//
// Thread safety: Post() may be called from any thread, including from inside
// a running task.
class Executor {
 public:
  virtual ~Executor() = default;

  virtual void Post(std::function<void()> task) = 0;
};

// Runs each task immediately on the posting thread.
class InlineExecutor : public Executor {
 public:
  void Post(std::function<void()> task) override;
};

// Queues tasks and runs them on the thread that calls RunUntilIdle(). Tasks
// posted while draining are run in the same call.
class SingleThreadedExecutor : public Executor {
 public:
  SingleThreadedExecutor() = default;
  SingleThreadedExecutor(const SingleThreadedExecutor&) = delete;
  SingleThreadedExecutor& operator=(const SingleThreadedExecutor&) = delete;
  ~SingleThreadedExecutor() override;

  void Post(std::function<void()> task) override;

  // Runs queued tasks until the queue is empty. Returns the number of tasks
  // that ran.
  size_t RunUntilIdle();

  // Runs at most one queued task. Returns false if the queue was empty.
  bool RunOne();

  size_t pending() const;

 private:
  mutable absl::Mutex mu_;
  std::deque<std::function<void()>> queue_ ABSL_GUARDED_BY(mu_);
};

// A fixed-size pool of worker threads. The destructor runs every task that
// was posted before it, then joins the workers.
class ThreadPoolExecutor : public Executor {
 public:
  // `num_threads` of 0 means std::thread::hardware_concurrency().
  explicit ThreadPoolExecutor(size_t num_threads);
  ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
  ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;
  ~ThreadPoolExecutor() override;

  void Post(std::function<void()> task) override;

  size_t num_threads() const { return workers_.size(); }

 private:
  void WorkerLoop();

  absl::Mutex mu_;
  std::deque<std::function<void()>> queue_ ABSL_GUARDED_BY(mu_);
  bool stopping_ ABSL_GUARDED_BY(mu_) = false;
  std::vector<std::thread> workers_;
};

}  // namespace gqlengine_base

#endif  // GQLENGINE_BASE_EXECUTOR_H_
