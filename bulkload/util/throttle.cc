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

#include "bulkload/util/throttle.h"

#include "bulkload/base/logging.h"

namespace bulkload {

Throttle::Throttle(int max) : max_(max) {
  CHECK_GT(max, 0);
}

void Throttle::Start() {
  std::unique_lock<std::mutex> lock(mu_);
  while (active_ >= max_) changed_.wait(lock);
  active_++;
}

void Throttle::Done() {
  std::lock_guard<std::mutex> lock(mu_);
  CHECK_GT(active_, 0) << "Throttle released more times than acquired";
  active_--;
  changed_.notify_all();
}

void Throttle::Wait() {
  std::unique_lock<std::mutex> lock(mu_);
  while (active_ > 0) changed_.wait(lock);
}

int Throttle::active() {
  std::lock_guard<std::mutex> lock(mu_);
  return active_;
}

}  // namespace bulkload
