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

#ifndef BULKLOAD_LOADER_MAPPER_H_
#define BULKLOAD_LOADER_MAPPER_H_

#include <string>
#include <vector>

#include "bulkload/base/slice.h"
#include "bulkload/base/status.h"
#include "bulkload/base/types.h"
#include "bulkload/loader/chunker.h"
#include "bulkload/loader/nquad.h"
#include "bulkload/loader/posting.h"
#include "bulkload/loader/schema.h"
#include "bulkload/loader/state.h"
#include "bulkload/loader/xidmap.h"
#include "bulkload/util/queue.h"

namespace bulkload {

// Queue of input chunks from the file readers to the mappers.
typedef Queue<string *> ChunkQueue;

// A mapper parses chunks into edges, assigns uids to the nodes and writes the
// resulting map entries to sorted map files for each map shard.
class Mapper {
 public:
  Mapper(LoaderState *state, XidMap *xids, int id);

  // Process chunks from the queue until it is closed and drained. Returns the
  // first error. After an error, the remaining chunks are consumed without
  // being processed so the readers are never blocked.
  Status Run(ChunkQueue *input, InputFormat format);

  // Process one chunk.
  Status ProcessChunk(const Slice &chunk, InputFormat format);

  // Write all buffered map entries to map files.
  Status FlushAll();

 private:
  // Edge prepared for mapping with its schema and value.
  struct Edge {
    const NQuad *nquad;
    const PredicateSchema *schema;
    Posting value;
    std::vector<string> terms;
  };

  // Map entries buffered for a shard.
  struct ShardBuffer {
    std::vector<MapEntry> entries;
    int64 size = 0;
  };

  // Map the edges of one record.
  Status ProcessRecord(const std::vector<NQuad> &nquads);

  // Check edges against schema and compute values and index terms.
  Status PrepareEdges(const std::vector<NQuad> &nquads,
                      std::vector<Edge> *edges);

  // Assign uids to nodes and emit map entries for edge.
  Status EmitEdge(const Edge &edge);

  // Look up or assign uid for node, emitting an xid edge for new nodes if
  // external ids are stored.
  Status LookupUid(const string &xid, uint64 *uid);

  // Add map entry to shard buffer.
  Status AddEntry(int shard, const string &key, const Posting &posting);

  // Write buffered entries for shard to a new map file.
  Status FlushShard(int shard);

  // Handle malformed record. Returns OK if errors are ignored.
  Status RecordError(const Status &error);

  // Shared loader state.
  LoaderState *state_;

  // Xid to uid mapping.
  XidMap *xids_;

  // Buffered entries for each map shard.
  std::vector<ShardBuffer> shards_;

  // Converter for JSON records.
  JSONConverter json_;

  DISALLOW_COPY_AND_ASSIGN(Mapper);
};

}  // namespace bulkload

#endif  // BULKLOAD_LOADER_MAPPER_H_
