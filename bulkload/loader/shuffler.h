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

#ifndef BULKLOAD_LOADER_SHUFFLER_H_
#define BULKLOAD_LOADER_SHUFFLER_H_

#include <string>
#include <vector>

#include "bulkload/base/status.h"
#include "bulkload/base/types.h"
#include "bulkload/loader/output-store.h"
#include "bulkload/loader/posting.h"
#include "bulkload/loader/state.h"
#include "bulkload/util/queue.h"

namespace bulkload {

// Batch of map entries in key order for one output store. All entries for a
// key are in the same batch.
struct ShuffleBatch {
  OutputStore *store = nullptr;
  std::vector<MapEntry> entries;
};

// Queue of batches from the shuffler to the reducer.
typedef Queue<ShuffleBatch *> BatchQueue;

// The shuffler merges the map files for each reduce shard in key order and
// sends the entries to the reducer in batches.
class Shuffler {
 public:
  // Default number of entries in a batch.
  static const int kBatchSize = 100000;

  Shuffler(LoaderState *state, BatchQueue *output,
           int batch_size = kBatchSize);

  // Shuffle all reduce shards and close the output queue. Up to the
  // configured number of shufflers run concurrently.
  Status Run();

  // Merge map files for reduce shard into batches for its output store.
  Status ShuffleShard(int reduce_shard);

  // Find map files for reduce shard.
  Status MapFiles(int reduce_shard, std::vector<string> *files);

 private:
  // Shared loader state.
  LoaderState *state_;

  // Output queue.
  BatchQueue *output_;

  // Batch size threshold. Batches can be larger to keep keys together.
  int batch_size_;
};

}  // namespace bulkload

#endif  // BULKLOAD_LOADER_SHUFFLER_H_
