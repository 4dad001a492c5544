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

#ifndef BULKLOAD_LOADER_STATE_H_
#define BULKLOAD_LOADER_STATE_H_

#include <atomic>
#include <string>
#include <vector>

#include "bulkload/base/types.h"
#include "bulkload/loader/options.h"
#include "bulkload/loader/output-store.h"
#include "bulkload/loader/progress.h"
#include "bulkload/loader/schema.h"
#include "bulkload/loader/shard-map.h"

namespace bulkload {

// State shared by all stages of a loader run. The options, write timestamp
// and shard map are fixed when the state is created. The schema store and
// progress counters are internally synchronized. Output stores are only added
// by the loader itself, never by the workers.
class LoaderState {
 public:
  // Takes ownership of the schema store.
  LoaderState(const Options &options, uint64 write_ts, SchemaStore *schema);
  ~LoaderState();

  // Run configuration.
  const Options &options() const { return options_; }

  // Timestamp for all records written in the run.
  uint64 write_ts() const { return write_ts_; }

  // Predicate to map shard assignment.
  ShardMap *shards() { return &shards_; }

  // Predicate schemas.
  SchemaStore *schema() { return schema_; }

  // Progress counters.
  Progress *progress() { return &progress_; }

  // Output stores, one per reduce shard.
  const std::vector<OutputStore *> &stores() const { return stores_; }

  // Add output store. Takes ownership of the store.
  void AddStore(OutputStore *store) { stores_.push_back(store); }

  // Directory with map output for all shards.
  string MapOutputDir() const;

  // Directory with map output for shard.
  string ShardDir(int shard) const;

  // Directory for output store for reduce shard.
  string StoreDir(int shard) const;

  // Allocate id for new map output file.
  uint32 NextMapFileId() { return next_map_file_++; }

  // Signal that the current stage has failed. Readers stop producing chunks
  // and mappers discard the remaining ones.
  void Abort() { aborted_ = true; }
  bool aborted() const { return aborted_; }

 private:
  const Options options_;
  const uint64 write_ts_;
  ShardMap shards_;
  SchemaStore *schema_;
  Progress progress_;
  std::vector<OutputStore *> stores_;
  std::atomic<uint32> next_map_file_{0};
  std::atomic<bool> aborted_{false};

  DISALLOW_COPY_AND_ASSIGN(LoaderState);
};

}  // namespace bulkload

#endif  // BULKLOAD_LOADER_STATE_H_
