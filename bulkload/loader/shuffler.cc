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

#include "bulkload/loader/shuffler.h"

#include <mutex>
#include <queue>

#include "bulkload/base/logging.h"
#include "bulkload/file/file.h"
#include "bulkload/file/recordio.h"
#include "bulkload/loader/shard-map.h"
#include "bulkload/util/thread.h"
#include "bulkload/util/throttle.h"

namespace bulkload {

namespace {

// Map file being merged with its current entry.
struct MergeInput {
  RecordReader *reader = nullptr;
  MapEntry entry;

  // Read next entry. Sets *done at the end of the file.
  Status Next(bool *done) {
    *done = reader->Done();
    if (*done) return Status::OK;
    Record record;
    Status st = reader->Read(&record);
    if (!st) return st;
    entry.key.assign(record.key.data(), record.key.size());
    Slice value = record.value;
    if (!DecodePosting(&value, &entry.posting)) {
      return Status(EBADMSG, "Invalid posting in map file");
    }
    return Status::OK;
  }
};

// Order merge inputs so the smallest entry is on top of the heap.
struct MergeOrder {
  bool operator()(const MergeInput *a, const MergeInput *b) const {
    return b->entry < a->entry;
  }
};

}  // namespace

Shuffler::Shuffler(LoaderState *state, BatchQueue *output, int batch_size)
    : state_(state), output_(output), batch_size_(batch_size) {}

Status Shuffler::Run() {
  const Options &options = state_->options();
  Throttle throttle(options.num_shufflers);
  std::mutex mu;
  Status status;

  std::vector<ClosureThread> threads;
  threads.reserve(options.reduce_shards);
  for (int shard = 0; shard < options.reduce_shards; ++shard) {
    throttle.Start();
    threads.emplace_back([this, shard, &throttle, &mu, &status]() {
      Status st = ShuffleShard(shard);
      if (!st) {
        std::lock_guard<std::mutex> lock(mu);
        if (status) status = st;
      }
      throttle.Done();
    });
    threads.back().SetJoinable(true);
    threads.back().Start();
  }
  for (ClosureThread &thread : threads) thread.Join();

  output_->Close();
  return status;
}

Status Shuffler::MapFiles(int reduce_shard, std::vector<string> *files) {
  files->clear();
  const Options &options = state_->options();
  for (int shard = 0; shard < options.map_shards; ++shard) {
    if (ShardMap::ReduceShard(shard, options.reduce_shards) != reduce_shard) {
      continue;
    }
    string dir = state_->ShardDir(shard);
    if (!File::IsDirectory(dir)) continue;
    Status st = File::Walk(dir, [files](const string &path) {
      if (Slice(path).ends_with(".map")) files->push_back(path);
    });
    if (!st) return st;
  }
  return Status::OK;
}

Status Shuffler::ShuffleShard(int reduce_shard) {
  OutputStore *store = state_->stores()[reduce_shard];
  std::vector<string> files;
  Status st = MapFiles(reduce_shard, &files);
  if (!st) return st;
  LOG(INFO) << "Shuffle " << files.size() << " map files into "
            << store->dir();

  // Open all map files and read the first entry from each.
  std::vector<MergeInput> inputs(files.size());
  std::priority_queue<MergeInput *, std::vector<MergeInput *>, MergeOrder>
      heap;
  for (int i = 0; st && i < files.size(); ++i) {
    st = RecordReader::Open(files[i], RecordFileOptions(), &inputs[i].reader);
    if (!st) break;
    bool done;
    st = inputs[i].Next(&done);
    if (st && !done) heap.push(&inputs[i]);
  }

  // Merge entries in key order into batches. A batch is only ended between
  // keys.
  ShuffleBatch *batch = nullptr;
  while (st && !heap.empty()) {
    MergeInput *input = heap.top();
    heap.pop();

    if (batch != nullptr && batch->entries.size() >= batch_size_ &&
        batch->entries.back().key != input->entry.key) {
      output_->Put(batch);
      batch = nullptr;
    }
    if (batch == nullptr) {
      batch = new ShuffleBatch();
      batch->store = store;
      batch->entries.reserve(batch_size_);
    }
    batch->entries.push_back(std::move(input->entry));

    bool done;
    st = input->Next(&done);
    if (st && !done) heap.push(input);
  }
  if (batch != nullptr) {
    if (st) {
      output_->Put(batch);
    } else {
      delete batch;
    }
  }

  for (MergeInput &input : inputs) delete input.reader;
  return st;
}

}  // namespace bulkload
