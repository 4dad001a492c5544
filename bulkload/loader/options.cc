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

#include "bulkload/loader/options.h"

namespace bulkload {

Status Options::Validate() const {
  if (rdf_dir.empty() == json_dir.empty()) {
    return Status(EINVAL, "Exactly one of --rdfs or --jsons must be given");
  }
  if (schema_file.empty()) {
    return Status(EINVAL, "Schema file must be specified with --schema_file");
  }
  if (num_workers <= 0) {
    return Status(EINVAL, "Number of workers must be positive");
  }
  if (map_buf_size <= 0) {
    return Status(EINVAL, "Map output buffer size must be positive");
  }
  if (num_shufflers <= 0) {
    return Status(EINVAL, "Number of shufflers must be positive");
  }
  if (map_shards <= 0 || reduce_shards <= 0) {
    return Status(EINVAL, "Number of shards must be positive");
  }
  if (reduce_shards > map_shards) {
    return Status(EINVAL, "Number of reduce shards cannot exceed the number "
                          "of map shards");
  }
  if (write_threads <= 0 || max_pending_writes <= 0) {
    return Status(EINVAL, "Reducer write limits must be positive");
  }
  if (tmp_dir.empty() || out_dir.empty()) {
    return Status(EINVAL, "Output and temp directories must be specified");
  }
  return Status::OK;
}

}  // namespace bulkload
