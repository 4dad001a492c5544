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

#include "bulkload/loader/state.h"

#include <stdio.h>

#include "bulkload/file/file.h"

namespace bulkload {

LoaderState::LoaderState(const Options &options, uint64 write_ts,
                         SchemaStore *schema)
    : options_(options),
      write_ts_(write_ts),
      shards_(options.map_shards),
      schema_(schema) {}

LoaderState::~LoaderState() {
  for (OutputStore *store : stores_) delete store;
  delete schema_;
}

string LoaderState::MapOutputDir() const {
  return JoinPath(options_.tmp_dir, "shards");
}

string LoaderState::ShardDir(int shard) const {
  char name[16];
  snprintf(name, sizeof(name), "%03d", shard);
  return JoinPath(MapOutputDir(), name);
}

string LoaderState::StoreDir(int shard) const {
  return JoinPath(JoinPath(options_.out_dir, std::to_string(shard)), "p");
}

}  // namespace bulkload
