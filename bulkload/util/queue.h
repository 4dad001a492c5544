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

#ifndef BULKLOAD_UTIL_QUEUE_H_
#define BULKLOAD_UTIL_QUEUE_H_

#include <condition_variable>
#include <mutex>
#include <queue>
#include <utility>

#include "bulkload/base/logging.h"

namespace bulkload {

// Bounded queue for producer/consumer threads. Producers block when the queue
// is full and consumers block when it is empty. When the queue is closed, the
// consumers drain the remaining elements and are then told that there is no
// more input.
template<typename T> class Queue {
 public:
  explicit Queue(int capacity) : capacity_(capacity) {
    CHECK_GT(capacity, 0);
  }

  // Add element to queue, waiting until there is room for it. The queue must
  // not be closed.
  void Put(T item) {
    std::unique_lock<std::mutex> lock(mu_);
    CHECK(!closed_) << "Put on closed queue";
    while (queue_.size() >= capacity_) nonfull_.wait(lock);
    queue_.push(std::move(item));
    nonempty_.notify_one();
  }

  // Get next element from queue, waiting until one is available. Returns false
  // when the queue has been closed and all elements have been consumed.
  bool Get(T *item) {
    std::unique_lock<std::mutex> lock(mu_);
    while (queue_.empty()) {
      if (closed_) return false;
      nonempty_.wait(lock);
    }
    *item = std::move(queue_.front());
    queue_.pop();
    nonfull_.notify_one();
    return true;
  }

  // Close queue, signaling that no more elements will be added. Closing an
  // already closed queue has no effect.
  void Close() {
    std::lock_guard<std::mutex> lock(mu_);
    closed_ = true;
    nonempty_.notify_all();
  }

  // Check if queue has been closed.
  bool closed() {
    std::lock_guard<std::mutex> lock(mu_);
    return closed_;
  }

  // Number of elements in queue.
  size_t size() {
    std::lock_guard<std::mutex> lock(mu_);
    return queue_.size();
  }

  // Maximum number of elements in queue.
  size_t capacity() const { return capacity_; }

 private:
  // Elements in queue.
  std::queue<T> queue_;

  // Maximum number of elements in queue.
  size_t capacity_;

  // Queue has been closed for input.
  bool closed_ = false;

  // Mutex for serializing access to queue.
  std::mutex mu_;

  // Signals for queue state changes.
  std::condition_variable nonempty_;
  std::condition_variable nonfull_;
};

}  // namespace bulkload

#endif  // BULKLOAD_UTIL_QUEUE_H_
