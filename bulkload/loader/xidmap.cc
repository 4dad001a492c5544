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

#include "bulkload/loader/xidmap.h"

#include <errno.h>
#include <string.h>
#include <unistd.h>
#include <sys/mman.h>

#include "bulkload/base/logging.h"
#include "bulkload/loader/nquad.h"
#include "bulkload/util/fingerprint.h"
#include "bulkload/util/varint.h"

namespace bulkload {

// Write buffer size for xid log.
static const int kLogBufferSize = 1 << 20;

XidStore::~XidStore() {
  Status st = Close();
  if (!st) LOG(ERROR) << "Error closing xid store: " << st;
}

Status XidStore::Open(const string &dir, XidStore **store) {
  Status st = File::Mkdir(dir);
  if (!st) return st;
  File *file;
  st = File::Open(JoinPath(dir, "xids.log"), "w+", &file);
  if (!st) return st;
  XidStore *s = new XidStore(file);
  s->buffer_.Reset(kLogBufferSize);
  *store = s;
  return Status::OK;
}

Status XidStore::Lookup(const string &xid, uint64 *uid, bool *found) {
  std::lock_guard<std::mutex> lock(mu_);
  *found = false;
  auto f = index_.find(Fingerprint(xid));
  if (f == index_.end()) return Status::OK;

  string stored;
  Status st = ReadEntry(f->second, &stored, uid);
  if (!st) return st;
  if (stored == xid) {
    *found = true;
    return Status::OK;
  }

  auto c = collisions_.find(xid);
  if (c != collisions_.end()) {
    *uid = c->second;
    *found = true;
  }
  return Status::OK;
}

Status XidStore::Insert(const string &xid, uint64 uid) {
  CHECK(file_ != nullptr) << "Insert into closed xid store";
  std::lock_guard<std::mutex> lock(mu_);
  uint64 pos = flushed_ + buffer_.available();
  auto result = index_.emplace(Fingerprint(xid), pos);
  if (!result.second) collisions_[xid] = uid;

  // Entry is the uid followed by the length-prefixed xid.
  char header[8 + Varint::kMax64];
  memcpy(header, &uid, 8);
  char *end = Varint::Encode64(header + 8, xid.size());
  if (buffer_.remaining() < (end - header) + xid.size()) {
    Status st = Flush();
    if (!st) return st;
  }
  buffer_.Write(header, end - header);
  buffer_.Write(xid.data(), xid.size());
  return Status::OK;
}

Status XidStore::Flush() {
  if (buffer_.empty()) return Status::OK;
  Status st = file_->Write(buffer_.begin(), buffer_.available());
  if (!st) return st;
  flushed_ += buffer_.available();
  buffer_.Clear();
  return Remap();
}

Status XidStore::Remap() {
  if (mapped_ != nullptr) {
    if (munmap(mapped_, mapped_size_) != 0) {
      return Status(errno, "munmap", strerror(errno));
    }
    mapped_ = nullptr;
    mapped_size_ = 0;
  }
  if (flushed_ == 0) return Status::OK;
  void *data = mmap(nullptr, flushed_, PROT_READ, MAP_SHARED, file_->fd(), 0);
  if (data == MAP_FAILED) return Status(errno, "mmap", strerror(errno));
  mapped_ = static_cast<char *>(data);
  mapped_size_ = flushed_;
  return Status::OK;
}

Status XidStore::ReadEntry(uint64 pos, string *xid, uint64 *uid) {
  // Entries are never split between the log file and the write buffer.
  const char *data;
  const char *end;
  if (pos >= flushed_) {
    data = buffer_.begin() + (pos - flushed_);
    end = buffer_.end();
  } else {
    data = mapped_ + pos;
    end = mapped_ + mapped_size_;
  }

  uint64 size;
  if (end - data < 9) return Status(EBADMSG, "Truncated xid log entry");
  const char *p = Varint::Parse64(data + 8, end, &size);
  if (p == nullptr || size > end - p) {
    return Status(EBADMSG, "Corrupt xid log entry");
  }
  memcpy(uid, data, 8);
  xid->assign(p, size);
  return Status::OK;
}

Status XidStore::Close() {
  std::lock_guard<std::mutex> lock(mu_);
  if (file_ == nullptr) return Status::OK;
  Status st = Flush();
  if (mapped_ != nullptr) {
    if (munmap(mapped_, mapped_size_) != 0 && st) {
      st = Status(errno, "munmap", strerror(errno));
    }
    mapped_ = nullptr;
    mapped_size_ = 0;
  }
  Status close = file_->Close();
  file_ = nullptr;
  index_.clear();
  collisions_.clear();
  return st ? close : st;
}

int64 XidStore::size() {
  std::lock_guard<std::mutex> lock(mu_);
  return index_.size() + collisions_.size();
}

XidMap::XidMap(XidStore *store, Authority *authority,
               const XidMapOptions &options)
    : store_(store), authority_(authority), options_(options) {
  num_shards_ = options.num_shards;
  CHECK_GT(num_shards_, 0);
  CHECK_EQ(num_shards_ & (num_shards_ - 1), 0)
      << "Number of xid map shards must be a power of two";
  shards_ = new Shard[num_shards_];
  shard_capacity_ = options.lru_size / num_shards_;
  if (shard_capacity_ < 1) shard_capacity_ = 1;
}

XidMap::~XidMap() {
  delete [] shards_;
}

Status XidMap::AssignUid(const string &xid, uint64 *uid, bool *created) {
  *created = false;
  if (ParseUidLiteral(xid, uid)) return Status::OK;

  Shard &shard = shards_[Fingerprint(xid) & (num_shards_ - 1)];
  std::lock_guard<std::mutex> lock(shard.mu);

  // Look up xid in cache.
  auto f = shard.entries.find(xid);
  if (f != shard.entries.end()) {
    shard.lru.splice(shard.lru.begin(), shard.lru, f->second);
    *uid = f->second->second;
    return Status::OK;
  }

  // Look up xid in store and assign a new uid if it is not found.
  bool found;
  Status st = store_->Lookup(xid, uid, &found);
  if (!st) return st;
  if (!found) {
    st = NewUid(uid);
    if (!st) return st;
    st = store_->Insert(xid, *uid);
    if (!st) return st;
    *created = true;
  }

  // Add to cache, evicting the least recently used entry if the shard is full.
  shard.lru.emplace_front(xid, *uid);
  shard.entries[xid] = shard.lru.begin();
  if (shard.lru.size() > shard_capacity_) {
    shard.entries.erase(shard.lru.back().first);
    shard.lru.pop_back();
  }
  return Status::OK;
}

Status XidMap::NewUid(uint64 *uid) {
  std::lock_guard<std::mutex> lock(lease_mu_);
  while (next_uid_ == lease_end_) {
    uint64 first;
    Status st = authority_->AssignUids(options_.lease_size,
                                       options_.timeout_ms, &first);
    if (st) {
      next_uid_ = first;
      lease_end_ = first + options_.lease_size;
      VLOG(1) << "Leased uids " << first << " to " << lease_end_ - 1;
      break;
    }
    LOG(WARNING) << "Error leasing uids, retrying: " << st;
    usleep(options_.backoff_ms * 1000);
  }
  *uid = next_uid_++;
  return Status::OK;
}

void XidMap::EvictAll() {
  for (int i = 0; i < num_shards_; ++i) {
    Shard &shard = shards_[i];
    std::lock_guard<std::mutex> lock(shard.mu);
    shard.entries.clear();
    shard.lru.clear();
  }
}

int64 XidMap::cached() {
  int64 total = 0;
  for (int i = 0; i < num_shards_; ++i) {
    std::lock_guard<std::mutex> lock(shards_[i].mu);
    total += shards_[i].lru.size();
  }
  return total;
}

}  // namespace bulkload
