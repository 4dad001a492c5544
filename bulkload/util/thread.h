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

#ifndef BULKLOAD_UTIL_THREAD_H_
#define BULKLOAD_UTIL_THREAD_H_

#include <pthread.h>
#include <functional>

#include "bulkload/base/types.h"

namespace bulkload {

// Thread that runs a closure. Threads are detached unless they are marked as
// joinable before they are started.
class ClosureThread {
 public:
  typedef std::function<void()> Closure;

  explicit ClosureThread(Closure closure) : closure_(std::move(closure)) {}
  ClosureThread(ClosureThread &&other);
  ~ClosureThread();

  // Start thread.
  void Start();

  // Wait for thread to terminate.
  void Join();

  // Mark thread as joinable. Must be called before the thread is started.
  void SetJoinable(bool joinable) { joinable_ = joinable; }

  // Check if thread is running.
  bool running() const { return running_; }

 private:
  // Thread entry point.
  static void *ThreadMain(void *arg);

  // Closure run by the thread.
  Closure closure_;

  // Thread handle.
  pthread_t thread_;
  bool joinable_ = false;
  bool running_ = false;

  DISALLOW_COPY_AND_ASSIGN(ClosureThread);
};

}  // namespace bulkload

#endif  // BULKLOAD_UTIL_THREAD_H_
