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

#ifndef BULKLOAD_LOADER_XIDMAP_H_
#define BULKLOAD_LOADER_XIDMAP_H_

#include <list>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

#include "bulkload/base/status.h"
#include "bulkload/base/types.h"
#include "bulkload/file/file.h"
#include "bulkload/loader/authority.h"
#include "bulkload/util/iobuffer.h"

namespace bulkload {

// Disposable on-disk store mapping external ids to uids. Entries are appended
// to a log file which is never synced, and an in-memory index maps the
// fingerprint of each id to the position of its entry in the log. Flushed
// entries are read through a memory mapping of the log.
class XidStore {
 public:
  ~XidStore();

  // Create store in new directory.
  static Status Open(const string &dir, XidStore **store);

  // Look up uid for xid. Sets *found to false if xid is not in the store.
  Status Lookup(const string &xid, uint64 *uid, bool *found);

  // Add xid to the store. The xid must not already be in the store.
  Status Insert(const string &xid, uint64 uid);

  // Close store. The log file is kept on disk.
  Status Close();

  // Number of entries in the store.
  int64 size();

 private:
  explicit XidStore(File *file) : file_(file) {}

  // Write buffered entries to log file.
  Status Flush();

  // Read entry at position in log.
  Status ReadEntry(uint64 pos, string *xid, uint64 *uid);

  // Map flushed part of the log into memory.
  Status Remap();

  // Log file.
  File *file_;

  // Buffer for entries not yet written to the log file.
  IOBuffer buffer_;

  // Log position of the start of the buffer.
  uint64 flushed_ = 0;

  // Memory mapping of the flushed part of the log.
  char *mapped_ = nullptr;
  size_t mapped_size_ = 0;

  // Log position for each xid fingerprint.
  std::unordered_map<uint64, uint64> index_;

  // Entries for xids whose fingerprint collides with an earlier xid.
  std::unordered_map<string, uint64> collisions_;

  // Mutex for serializing access to the store.
  std::mutex mu_;

  DISALLOW_COPY_AND_ASSIGN(XidStore);
};

// Configuration for xid map.
struct XidMapOptions {
  // Number of cache shards. Must be a power of two.
  int num_shards = 1 << 10;

  // Total number of cached entries.
  int lru_size = 1 << 19;

  // Number of uids leased from the authority at a time.
  int lease_size = 10000;

  // Timeout for lease requests and delay before retrying failed requests.
  int timeout_ms = 1000;
  int backoff_ms = 1000;
};

// Map from external ids to uids. A sharded LRU cache sits in front of the
// xid store, and new uids are leased from the authority in blocks. The map
// can be used from multiple threads.
class XidMap {
 public:
  XidMap(XidStore *store, Authority *authority, const XidMapOptions &options);
  ~XidMap();

  // Get uid for node id. Uid literals like 0x1a are returned verbatim. Other
  // ids are assigned a new uid the first time they are seen, in which case
  // *created is set.
  Status AssignUid(const string &xid, uint64 *uid, bool *created);

  // Drop all cached entries.
  void EvictAll();

  // Number of cached entries.
  int64 cached();

 private:
  // Cache shard with entries in LRU order, most recently used first.
  struct Shard {
    typedef std::list<std::pair<string, uint64>> LRUList;
    LRUList lru;
    std::unordered_map<string, LRUList::iterator> entries;
    std::mutex mu;
  };

  // Get next uid from the current lease, leasing a new block when the current
  // lease is used up.
  Status NewUid(uint64 *uid);

  // Backing store.
  XidStore *store_;

  // Authority for leasing uids.
  Authority *authority_;

  // Cache shards.
  Shard *shards_;
  int num_shards_;
  int shard_capacity_;

  // Current uid lease.
  XidMapOptions options_;
  uint64 next_uid_ = 0;
  uint64 lease_end_ = 0;
  std::mutex lease_mu_;

  DISALLOW_COPY_AND_ASSIGN(XidMap);
};

}  // namespace bulkload

#endif  // BULKLOAD_LOADER_XIDMAP_H_
