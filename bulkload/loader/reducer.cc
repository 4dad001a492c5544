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

#include "bulkload/loader/reducer.h"

#include <mutex>
#include <string>
#include <vector>

#include "bulkload/base/logging.h"
#include "bulkload/file/recordio.h"
#include "bulkload/util/threadpool.h"
#include "bulkload/util/throttle.h"

namespace bulkload {

Reducer::Reducer(LoaderState *state, BatchQueue *input)
    : state_(state), input_(input) {}

Status Reducer::Run() {
  const Options &options = state_->options();
  ThreadPool pool(options.write_threads, options.max_pending_writes);
  pool.StartWorkers();
  Throttle throttle(options.max_pending_writes);
  std::mutex mu;
  Status status;

  ShuffleBatch *batch;
  while (input_->Get(&batch)) {
    state_->progress()->reduce_batches.Increment();
    bool failed;
    {
      std::lock_guard<std::mutex> lock(mu);
      failed = !status;
    }
    if (failed) {
      delete batch;
      continue;
    }

    throttle.Start();
    pool.Schedule([this, batch, &throttle, &mu, &status]() {
      Status st = Reduce(batch);
      delete batch;
      if (!st) {
        std::lock_guard<std::mutex> lock(mu);
        if (status) status = st;
      }
      throttle.Done();
    });
  }

  throttle.Wait();
  pool.Shutdown();
  pool.Join();
  return status;
}

Status Reducer::Reduce(ShuffleBatch *batch) {
  std::vector<MapEntry> &entries = batch->entries;
  std::vector<string> keys;
  std::vector<string> values;
  std::vector<Posting> postings;
  int64 num_postings = 0;

  size_t i = 0;
  while (i < entries.size()) {
    // Collect postings for key. Entries are sorted by uid within the key, and
    // for duplicate uids the last posting wins.
    const string &key = entries[i].key;
    postings.clear();
    size_t j = i;
    while (j < entries.size() && entries[j].key == key) {
      Posting &posting = entries[j].posting;
      if (!postings.empty() && postings.back().uid == posting.uid) {
        postings.back() = std::move(posting);
      } else {
        postings.push_back(std::move(posting));
      }
      j++;
    }

    keys.push_back(key);
    values.emplace_back();
    EncodePostingList(postings, &values.back());
    num_postings += postings.size();
    i = j;
  }

  std::vector<Record> records;
  records.reserve(keys.size());
  for (size_t k = 0; k < keys.size(); ++k) {
    records.emplace_back(keys[k], values[k]);
  }
  Status st = batch->store->WriteSegment(records);
  if (!st) return st;

  Progress *progress = state_->progress();
  progress->reduce_keys.Increment(keys.size());
  progress->reduce_postings.Increment(num_postings);
  progress->segments.Increment();
  return Status::OK;
}

}  // namespace bulkload
