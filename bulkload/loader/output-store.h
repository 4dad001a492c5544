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

#ifndef BULKLOAD_LOADER_OUTPUT_STORE_H_
#define BULKLOAD_LOADER_OUTPUT_STORE_H_

#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "bulkload/base/status.h"
#include "bulkload/base/types.h"
#include "bulkload/file/recordio.h"

namespace bulkload {

// Output store for one reduce shard. The store is a directory with segment
// files and a manifest. Each segment is a record file with records sorted by
// key, all stamped with the version of the store. The manifest lists the
// version and the segments in the order they were written.
class OutputStore {
 public:
  // Callback for scanning records in a store.
  typedef std::function<void(const Record &record)> Callback;

  ~OutputStore();

  // Create new output store in directory. Fails if the directory already
  // holds a store.
  static Status Create(const string &dir, uint64 version, OutputStore **store);

  // Write records as a new segment. The records must be sorted by key. This
  // can be called from multiple threads.
  Status WriteSegment(const std::vector<Record> &records);

  // Write manifest and close store. No segments can be written after this.
  Status Close();

  // Read all records from a closed store in segment order.
  static Status Scan(const string &dir, const Callback &callback,
                     uint64 *version = nullptr);

  // Store directory.
  const string &dir() const { return dir_; }

  // Version stamped on all records.
  uint64 version() const { return version_; }

  // Number of segments written.
  int num_segments();

 private:
  OutputStore(const string &dir, uint64 version)
      : dir_(dir), version_(version) {}

  // Store directory.
  string dir_;

  // Version for records.
  uint64 version_;

  // Completed segments.
  std::vector<int> segments_;

  // Next segment number.
  int next_segment_ = 0;

  // Store has been closed.
  bool closed_ = false;

  // Mutex for segment list.
  std::mutex mu_;

  DISALLOW_COPY_AND_ASSIGN(OutputStore);
};

}  // namespace bulkload

#endif  // BULKLOAD_LOADER_OUTPUT_STORE_H_
