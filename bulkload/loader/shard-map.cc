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

#include "bulkload/loader/shard-map.h"

#include "bulkload/base/logging.h"

namespace bulkload {

ShardMap::ShardMap(int num_shards) : num_shards_(num_shards) {
  CHECK_GT(num_shards, 0);
}

int ShardMap::ShardFor(const string &predicate) {
  std::lock_guard<std::mutex> lock(mu_);
  auto result = shards_.emplace(predicate, next_shard_);
  if (result.second) next_shard_ = (next_shard_ + 1) % num_shards_;
  return result.first->second;
}

}  // namespace bulkload
