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

#ifndef BULKLOAD_LOADER_PROGRESS_H_
#define BULKLOAD_LOADER_PROGRESS_H_

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>

#include "bulkload/base/clock.h"
#include "bulkload/base/types.h"
#include "bulkload/util/thread.h"

namespace bulkload {

// Counter that can be updated from multiple threads.
class Counter {
 public:
  void Increment() { value_++; }
  void Increment(int64 delta) { value_ += delta; }
  int64 value() const { return value_; }

 private:
  std::atomic<int64> value_{0};
};

// Progress tracking for a loader run. A reporter thread periodically logs the
// counters for the current phase.
class Progress {
 public:
  // Loader phases.
  enum Phase {
    PHASE_SETUP,
    PHASE_MAP,
    PHASE_REDUCE,
  };

  Progress();
  ~Progress();

  // Start reporter thread logging progress every interval seconds. No
  // progress is logged if the interval is zero.
  void Start(int interval);

  // Stop reporter thread.
  void Stop();

  // Set current phase.
  void SetPhase(Phase phase);
  Phase phase() const { return phase_; }

  // Log final summary.
  void EndSummary();

  // Return progress line for current phase.
  string Report();

  // Map phase counters.
  Counter chunks_read;
  Counter chunks_mapped;
  Counter records;
  Counter errors;
  Counter map_entries;
  Counter map_files;

  // Reduce phase counters.
  Counter reduce_batches;
  Counter reduce_keys;
  Counter reduce_postings;
  Counter segments;

 private:
  // Reporter thread main loop.
  void Reporter(int interval);

  // Current phase.
  std::atomic<Phase> phase_{PHASE_SETUP};

  // Time since start of run and of the current phase.
  Clock run_clock_;
  Clock phase_clock_;

  // Reporter thread.
  ClosureThread *reporter_ = nullptr;
  bool stop_ = false;
  std::mutex mu_;
  std::condition_variable wakeup_;
};

}  // namespace bulkload

#endif  // BULKLOAD_LOADER_PROGRESS_H_
