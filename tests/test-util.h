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

#ifndef BULKLOAD_TESTS_TEST_UTIL_H_
#define BULKLOAD_TESTS_TEST_UTIL_H_

#include <stdlib.h>
#include <string.h>
#include <zlib.h>
#include <mutex>
#include <string>
#include <vector>

#include "bulkload/base/clock.h"
#include "bulkload/base/logging.h"
#include "bulkload/base/status.h"
#include "bulkload/base/types.h"
#include "bulkload/file/file.h"
#include "bulkload/loader/authority.h"
#include "bulkload/stream/stream.h"

namespace bulkload {

// Input stream reading from a string in fixed-size blocks.
class StringInputStream : public InputStream {
 public:
  explicit StringInputStream(const string &data, int block_size = 1 << 16)
      : data_(data), block_size_(block_size) {}

  bool Next(const void **data, int *size) override {
    if (position_ >= data_.size()) return false;
    int n = data_.size() - position_;
    if (n > block_size_) n = block_size_;
    *data = data_.data() + position_;
    *size = n;
    position_ += n;
    last_ = n;
    return true;
  }

  void BackUp(int count) override {
    CHECK_LE(count, last_);
    position_ -= count;
    last_ -= count;
  }

  bool Skip(int count) override {
    if (position_ + count > data_.size()) {
      position_ = data_.size();
      return false;
    }
    position_ += count;
    return true;
  }

  int64 ByteCount() const override { return position_; }

 private:
  string data_;
  int block_size_;
  size_t position_ = 0;
  int last_ = 0;
};

// Temporary directory removed on destruction.
class TempDir {
 public:
  TempDir() {
    const char *base = getenv("TEST_TMPDIR");
    if (base == nullptr) base = getenv("TMPDIR");
    if (base == nullptr) base = "/tmp";
    string pattern = JoinPath(base, "bulkload-test-XXXXXX");
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back(0);
    CHECK(mkdtemp(buf.data()) != nullptr) << "mkdtemp failed: " << pattern;
    path_ = buf.data();
  }

  ~TempDir() {
    Status st = File::DeleteRecursively(path_);
    if (!st) LOG(WARNING) << "Error removing " << path_ << ": " << st;
  }

  const string &path() const { return path_; }

  // Path of file or directory inside the temp directory.
  string file(const string &name) const { return JoinPath(path_, name); }

  // Write file in temp directory, creating parent directories as needed.
  string Write(const string &name, const string &contents) const {
    string filename = file(name);
    size_t slash = filename.rfind('/');
    CHECK(File::MakeDirectories(filename.substr(0, slash)));
    CHECK(File::WriteContents(filename, contents));
    return filename;
  }

 private:
  string path_;
};

// Compress data in gzip format.
inline string GZip(const string &data) {
  z_stream zs;
  memset(&zs, 0, sizeof(zs));
  CHECK_EQ(deflateInit2(&zs, Z_BEST_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS,
                        8, Z_DEFAULT_STRATEGY), Z_OK);
  string out(deflateBound(&zs, data.size()) + 64, 0);
  zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data.data()));
  zs.avail_in = data.size();
  zs.next_out = reinterpret_cast<Bytef *>(&out[0]);
  zs.avail_out = out.size();
  CHECK_EQ(deflate(&zs, Z_FINISH), Z_STREAM_END);
  out.resize(zs.total_out);
  CHECK_EQ(deflateEnd(&zs), Z_OK);
  return out;
}

// In-memory authority handing out consecutive timestamps and uids. It can be
// told to fail a number of requests before succeeding.
class FakeAuthority : public Authority {
 public:
  Status AssignTimestamps(int num, int timeout_ms, uint64 *first) override {
    return Assign(&next_ts_, &timestamp_calls_, num, first);
  }

  Status AssignUids(int num, int timeout_ms, uint64 *first) override {
    return Assign(&next_uid_, &uid_calls_, num, first);
  }

  // Fail the next n requests.
  void FailNext(int n) {
    std::lock_guard<std::mutex> lock(mu_);
    failures_ = n;
  }

  // Time of each timestamp request in microseconds.
  std::vector<int64> timestamp_calls() {
    std::lock_guard<std::mutex> lock(mu_);
    return timestamp_calls_;
  }

  int uid_requests() {
    std::lock_guard<std::mutex> lock(mu_);
    return uid_calls_.size();
  }

  uint64 next_uid() {
    std::lock_guard<std::mutex> lock(mu_);
    return next_uid_;
  }

 private:
  Status Assign(uint64 *next, std::vector<int64> *calls, int num,
                uint64 *first) {
    std::lock_guard<std::mutex> lock(mu_);
    calls->push_back(Clock::micros());
    if (failures_ > 0) {
      failures_--;
      return Status(ECONNREFUSED, "Authority unavailable");
    }
    *first = *next;
    *next += num;
    return Status::OK;
  }

  uint64 next_ts_ = 1;
  uint64 next_uid_ = 1;
  int failures_ = 0;
  std::vector<int64> timestamp_calls_;
  std::vector<int64> uid_calls_;
  std::mutex mu_;
};

}  // namespace bulkload

#endif  // BULKLOAD_TESTS_TEST_UTIL_H_
