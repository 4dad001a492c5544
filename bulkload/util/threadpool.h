// Copyright 2022 Ringgaard Research ApS
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef BULKLOAD_UTIL_THREADPOOL_H_
#define BULKLOAD_UTIL_THREADPOOL_H_

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <vector>

#include "bulkload/util/thread.h"

namespace bulkload {

// Pool of worker threads executing tasks from a bounded task queue.
class ThreadPool {
 public:
  typedef std::function<void()> Task;

  ThreadPool(int num_workers, int queue_size);

  // Wait for all tasks to complete and terminate workers.
  ~ThreadPool();

  // Start worker threads.
  void StartWorkers();

  // Schedule task to run in one of the workers. Blocks if the task queue is
  // full.
  void Schedule(Task &&task);

  // Stop accepting tasks and let the workers exit when the queue is empty.
  void Shutdown();

  // Wait until all worker threads have terminated.
  void Join();

 private:
  // Fetch next task. Returns false when the pool is shut down and the queue
  // is empty.
  bool FetchTask(Task *task);

  // Worker threads.
  std::vector<ClosureThread> workers_;
  int num_workers_;

  // Pending tasks.
  std::queue<Task> tasks_;
  size_t queue_size_;

  // Pool is shutting down.
  bool done_ = false;

  // Mutex and signals for task queue.
  std::mutex mu_;
  std::condition_variable nonempty_;
  std::condition_variable nonfull_;
};

}  // namespace bulkload

#endif  // BULKLOAD_UTIL_THREADPOOL_H_
