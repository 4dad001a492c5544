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

#ifndef BULKLOAD_LOADER_OPTIONS_H_
#define BULKLOAD_LOADER_OPTIONS_H_

#include <string>

#include "bulkload/base/status.h"
#include "bulkload/base/types.h"
#include "bulkload/loader/chunker.h"

namespace bulkload {

// Configuration for a loader run.
struct Options {
  // Input directories. Exactly one of these must be set.
  string rdf_dir;
  string json_dir;

  // Schema file.
  string schema_file;

  // Output directory with one store per reduce shard.
  string out_dir = "out";

  // Directory for temporary files.
  string tmp_dir = "tmp";

  // Number of mapper workers and concurrent file readers.
  int num_workers = 4;

  // Map output buffer size per shard before it is written to disk.
  int64 map_buf_size = 64 << 20;

  // Skip map phase and reduce existing map output in the temp directory.
  bool skip_map_phase = false;

  // Remove temp directory when done.
  bool cleanup_tmp = true;

  // Number of reduce shards shuffled concurrently.
  int num_shufflers = 1;

  // Store external ids as xid edges.
  bool store_xids = false;

  // Address of authority for timestamps and uids.
  string authority = "localhost:5080";

  // Skip malformed records instead of failing.
  bool ignore_errors = false;

  // Number of map and reduce shards.
  int map_shards = 1;
  int reduce_shards = 1;

  // Reducer write pool size and limit on pending segment writes.
  int write_threads = 4;
  int max_pending_writes = 100;

  // Seconds between progress reports.
  int progress_interval = 2;

  // Check that the options are consistent.
  Status Validate() const;

  // Input format and directory.
  InputFormat format() const {
    return rdf_dir.empty() ? FORMAT_JSON : FORMAT_RDF;
  }
  const string &input_dir() const {
    return rdf_dir.empty() ? json_dir : rdf_dir;
  }
};

}  // namespace bulkload

#endif  // BULKLOAD_LOADER_OPTIONS_H_
