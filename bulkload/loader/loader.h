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

#ifndef BULKLOAD_LOADER_LOADER_H_
#define BULKLOAD_LOADER_LOADER_H_

#include <string>

#include "bulkload/base/status.h"
#include "bulkload/base/types.h"
#include "bulkload/loader/authority.h"
#include "bulkload/loader/chunker.h"
#include "bulkload/loader/mapper.h"
#include "bulkload/loader/options.h"
#include "bulkload/loader/state.h"
#include "bulkload/loader/xidmap.h"

namespace bulkload {

// Bulk loader converting RDF or JSON input into sharded output stores. A run
// consists of the map stage, the reduce stage, writing the schema and closing
// the stores, in that order.
class Loader {
 public:
  // Get the write timestamp from the authority and read the schema. Errors
  // reading the schema are fatal.
  Loader(const Options &options, Authority *authority);
  ~Loader();

  // Run map stage. Exits with status 1 if there are no input files and
  // terminates on all other errors.
  void MapStage();

  // Run reduce stage. Terminates on errors.
  void ReduceStage();

  // Write schema to all output stores.
  void WriteSchema();

  // Close output stores and log summary.
  void Cleanup();

  // Run map stage and return status. The xid map only lives for the duration
  // of the map stage and is released on all paths out of it.
  Status RunMapStage();

  // Run reduce stage and return status.
  Status RunReduceStage();

  // Shared loader state.
  LoaderState *state() { return state_; }

 private:
  // Run readers and mappers for all input files.
  Status RunMappers(XidMap *xids);

  // Split input file into chunks and add them to the queue.
  Status ReadFile(const string &filename, InputFormat format,
                  ChunkQueue *queue);

  // Authority for timestamps and uids.
  Authority *authority_;

  // Shared state for all stages.
  LoaderState *state_;

  DISALLOW_COPY_AND_ASSIGN(Loader);
};

}  // namespace bulkload

#endif  // BULKLOAD_LOADER_LOADER_H_
