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

#include <unistd.h>
#include <string>

#include "bulkload/base/flags.h"
#include "bulkload/base/init.h"
#include "bulkload/base/logging.h"
#include "bulkload/base/types.h"
#include "bulkload/file/file.h"
#include "bulkload/loader/authority.h"
#include "bulkload/loader/loader.h"
#include "bulkload/loader/options.h"

DEFINE_string(rdfs, "", "Directory with *.rdf or *.rdf.gz files to load");
DEFINE_string(jsons, "", "Directory with *.json or *.json.gz files to load");
DEFINE_string(schema_file, "", "Location of schema file");
DEFINE_string(out, "out", "Location to write the final output stores");
DEFINE_string(tmp, "tmp", "Temp directory used for on-disk scratch space");
DEFINE_int32(workers, 0,
             "Number of mapper workers and concurrent file readers "
             "(0 means the number of CPUs)");
DEFINE_int32(mapoutput_mb, 64, "Size of map output buffers in MB");
DEFINE_bool(skip_map_phase, false,
            "Skip the map phase and reduce the map output in the temp "
            "directory from an earlier run");
DEFINE_bool(cleanup_tmp, true, "Remove temp directory after completion");
DEFINE_int32(shufflers, 1, "Number of reduce shards shuffled concurrently");
DEFINE_bool(store_xids, false, "Store external ids as xid edges");
DEFINE_string(authority, "localhost:5080",
              "Address of authority for timestamps and uids");
DEFINE_bool(ignore_errors, false, "Skip malformed records");
DEFINE_int32(map_shards, 1,
             "Number of map output shards. Must be at least the number of "
             "reduce shards");
DEFINE_int32(reduce_shards, 1, "Number of reduce shards and output stores");
DEFINE_int32(write_threads, 4, "Number of threads writing output segments");
DEFINE_int32(max_pending_writes, 100,
             "Maximum number of output segments waiting to be written");
DEFINE_int32(progress_interval, 2,
             "Seconds between progress reports (0 to disable)");

using namespace bulkload;

// Timeout for connecting to the authority.
static const int kDialTimeoutMs = 60000;

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  // Get options from flags.
  Options options;
  options.rdf_dir = FLAGS_rdfs;
  options.json_dir = FLAGS_jsons;
  options.schema_file = FLAGS_schema_file;
  options.out_dir = FLAGS_out;
  options.tmp_dir = FLAGS_tmp;
  options.num_workers = FLAGS_workers;
  if (options.num_workers == 0) {
    options.num_workers = sysconf(_SC_NPROCESSORS_ONLN);
  }
  options.map_buf_size = static_cast<int64>(FLAGS_mapoutput_mb) << 20;
  options.skip_map_phase = FLAGS_skip_map_phase;
  options.cleanup_tmp = FLAGS_cleanup_tmp;
  options.num_shufflers = FLAGS_shufflers;
  options.store_xids = FLAGS_store_xids;
  options.authority = FLAGS_authority;
  options.ignore_errors = FLAGS_ignore_errors;
  options.map_shards = FLAGS_map_shards;
  options.reduce_shards = FLAGS_reduce_shards;
  options.write_threads = FLAGS_write_threads;
  options.max_pending_writes = FLAGS_max_pending_writes;
  options.progress_interval = FLAGS_progress_interval;
  Status st = options.Validate();
  if (!st) {
    LOG(ERROR) << st.message();
    return 1;
  }

  // Set up temp directory. Map output from an earlier run is kept when the
  // map phase is skipped.
  if (!options.skip_map_phase && File::Exists(options.tmp_dir)) {
    CHECK(File::DeleteRecursively(options.tmp_dir));
  }
  CHECK(File::MakeDirectories(options.tmp_dir));

  // Connect to authority.
  LOG(INFO) << "Connecting to authority at " << options.authority;
  AuthorityClient authority;
  st = authority.Connect(options.authority, kDialTimeoutMs);
  if (!st) {
    LOG(FATAL) << "Unable to connect to authority, is it running at "
               << options.authority << "? " << st;
  }

  // Run loader.
  Loader loader(options, &authority);
  if (!options.skip_map_phase) loader.MapStage();
  loader.ReduceStage();
  loader.WriteSchema();
  loader.Cleanup();

  if (options.cleanup_tmp) {
    st = File::DeleteRecursively(options.tmp_dir);
    if (!st) LOG(WARNING) << "Error removing temp directory: " << st;
  }
  st = authority.Close();
  if (!st) LOG(WARNING) << "Error closing authority connection: " << st;

  return 0;
}
