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

#ifndef BULKLOAD_UTIL_THROTTLE_H_
#define BULKLOAD_UTIL_THROTTLE_H_

#include <condition_variable>
#include <mutex>

namespace bulkload {

// A throttle limits the number of concurrent activities. Start() blocks until
// a slot is available and Done() releases it. Wait() blocks until all started
// activities have completed.
class Throttle {
 public:
  explicit Throttle(int max);

  // Acquire slot, waiting until one is free.
  void Start();

  // Release slot.
  void Done();

  // Wait until all activities are done.
  void Wait();

  // Number of activities currently running.
  int active();

 private:
  // Maximum number of concurrent activities.
  int max_;

  // Number of activities in progress.
  int active_ = 0;

  // Mutex and signal for throttle state.
  std::mutex mu_;
  std::condition_variable changed_;
};

}  // namespace bulkload

#endif  // BULKLOAD_UTIL_THROTTLE_H_
