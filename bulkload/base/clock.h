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

#ifndef BULKLOAD_BASE_CLOCK_H_
#define BULKLOAD_BASE_CLOCK_H_

#include <time.h>

#include "bulkload/base/types.h"

namespace bulkload {

// Monotonic clock for measuring elapsed time.
class Clock {
 public:
  // Current monotonic time in microseconds.
  static int64 micros() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return ts.tv_sec * 1000000LL + ts.tv_nsec / 1000;
  }

  // Start and stop clock.
  void start() { start_ = micros(); }
  void stop() { end_ = micros(); }

  // Elapsed time between start and stop.
  int64 us() const { return end_ - start_; }
  int64 ms() const { return us() / 1000; }
  double secs() const { return us() / 1e6; }

  // Elapsed time since start.
  int64 elapsed_us() const { return micros() - start_; }
  double elapsed_secs() const { return elapsed_us() / 1e6; }

 private:
  int64 start_ = 0;
  int64 end_ = 0;
};

}  // namespace bulkload

#endif  // BULKLOAD_BASE_CLOCK_H_
