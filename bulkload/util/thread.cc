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

#include "bulkload/util/thread.h"

#include "bulkload/base/logging.h"

namespace bulkload {

ClosureThread::ClosureThread(ClosureThread &&other)
    : closure_(std::move(other.closure_)),
      thread_(other.thread_),
      joinable_(other.joinable_),
      running_(other.running_) {
  CHECK(!running_) << "Cannot move running thread";
}

ClosureThread::~ClosureThread() {
  CHECK(!running_ || !joinable_) << "Joinable thread destroyed while running";
}

void ClosureThread::Start() {
  pthread_attr_t attr;
  pthread_attr_init(&attr);
  if (!joinable_) pthread_attr_setdetachstate(&attr, PTHREAD_CREATE_DETACHED);
  int rc = pthread_create(&thread_, &attr, ThreadMain, this);
  pthread_attr_destroy(&attr);
  CHECK_EQ(rc, 0) << "Unable to start thread";
  running_ = true;
}

void ClosureThread::Join() {
  CHECK(joinable_);
  if (!running_) return;
  int rc = pthread_join(thread_, nullptr);
  CHECK_EQ(rc, 0) << "Unable to join thread";
  running_ = false;
}

void *ClosureThread::ThreadMain(void *arg) {
  ClosureThread *thread = static_cast<ClosureThread *>(arg);
  thread->closure_();
  return nullptr;
}

}  // namespace bulkload
