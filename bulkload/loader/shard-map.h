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

#ifndef BULKLOAD_LOADER_SHARD_MAP_H_
#define BULKLOAD_LOADER_SHARD_MAP_H_

#include <mutex>
#include <string>
#include <unordered_map>

#include "bulkload/base/types.h"

namespace bulkload {

// Assignment of predicates to map shards. Each predicate is assigned to a
// shard the first time it is seen, going round-robin over the shards, so all
// edges for a predicate end up in the same shard.
class ShardMap {
 public:
  explicit ShardMap(int num_shards);

  // Return map shard for predicate.
  int ShardFor(const string &predicate);

  // Number of map shards.
  int num_shards() const { return num_shards_; }

  // Reduce shard for map shard.
  static int ReduceShard(int map_shard, int reduce_shards) {
    return map_shard % reduce_shards;
  }

 private:
  // Number of map shards.
  int num_shards_;

  // Shard for next new predicate.
  int next_shard_ = 0;

  // Shard for each predicate.
  std::unordered_map<string, int> shards_;
  std::mutex mu_;
};

}  // namespace bulkload

#endif  // BULKLOAD_LOADER_SHARD_MAP_H_
