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

#include "bulkload/loader/progress.h"

#include <stdio.h>
#include <chrono>

#include "bulkload/base/logging.h"

namespace bulkload {

// Format rate as events per second.
static double Rate(int64 count, double secs) {
  return secs > 0 ? count / secs : 0;
}

Progress::Progress() {
  run_clock_.start();
  phase_clock_.start();
}

Progress::~Progress() {
  Stop();
}

void Progress::Start(int interval) {
  if (interval <= 0 || reporter_ != nullptr) return;
  stop_ = false;
  reporter_ = new ClosureThread([this, interval]() { Reporter(interval); });
  reporter_->SetJoinable(true);
  reporter_->Start();
}

void Progress::Stop() {
  if (reporter_ == nullptr) return;
  {
    std::lock_guard<std::mutex> lock(mu_);
    stop_ = true;
    wakeup_.notify_all();
  }
  reporter_->Join();
  delete reporter_;
  reporter_ = nullptr;
}

void Progress::SetPhase(Phase phase) {
  std::lock_guard<std::mutex> lock(mu_);
  phase_ = phase;
  phase_clock_.start();
}

string Progress::Report() {
  double secs = phase_clock_.elapsed_secs();
  char line[256];
  switch (phase_) {
    case PHASE_SETUP:
      snprintf(line, sizeof(line), "SETUP %.0fs", secs);
      break;
    case PHASE_MAP:
      snprintf(line, sizeof(line),
               "MAP %.0fs chunks:%lld/%lld records:%lld errors:%lld "
               "edges:%lld files:%lld edge_speed:%.0f/s",
               secs,
               static_cast<long long>(chunks_mapped.value()),
               static_cast<long long>(chunks_read.value()),
               static_cast<long long>(records.value()),
               static_cast<long long>(errors.value()),
               static_cast<long long>(map_entries.value()),
               static_cast<long long>(map_files.value()),
               Rate(map_entries.value(), secs));
      break;
    case PHASE_REDUCE:
      snprintf(line, sizeof(line),
               "REDUCE %.0fs batches:%lld keys:%lld postings:%lld "
               "segments:%lld key_speed:%.0f/s",
               secs,
               static_cast<long long>(reduce_batches.value()),
               static_cast<long long>(reduce_keys.value()),
               static_cast<long long>(reduce_postings.value()),
               static_cast<long long>(segments.value()),
               Rate(reduce_keys.value(), secs));
      break;
  }
  return line;
}

void Progress::Reporter(int interval) {
  std::unique_lock<std::mutex> lock(mu_);
  while (!stop_) {
    wakeup_.wait_for(lock, std::chrono::seconds(interval));
    if (stop_) break;
    LOG(INFO) << Report();
  }
}

void Progress::EndSummary() {
  Stop();
  double secs = run_clock_.elapsed_secs();
  LOG(INFO) << "Total: " << secs << "s, "
            << records.value() << " records, "
            << errors.value() << " skipped, "
            << map_entries.value() << " edges, "
            << reduce_keys.value() << " keys, "
            << segments.value() << " segments, "
            << Rate(records.value(), secs) << " records/s";
}

}  // namespace bulkload
