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

#include "bulkload/loader/output-store.h"

#include <stdio.h>
#include <stdlib.h>
#include <algorithm>

#include "bulkload/base/logging.h"
#include "bulkload/file/file.h"

namespace bulkload {

static const char *kManifest = "MANIFEST";

// File name for segment.
static string SegmentName(int segment) {
  char name[32];
  snprintf(name, sizeof(name), "%06d.seg", segment);
  return name;
}

OutputStore::~OutputStore() {
  if (!closed_) {
    Status st = Close();
    if (!st) LOG(ERROR) << "Error closing output store " << dir_ << ": " << st;
  }
}

Status OutputStore::Create(const string &dir, uint64 version,
                           OutputStore **store) {
  if (File::Exists(JoinPath(dir, kManifest))) {
    return Status(EEXIST, "Output store already exists", dir);
  }
  Status st = File::MakeDirectories(dir);
  if (!st) return st;
  *store = new OutputStore(dir, version);
  return Status::OK;
}

Status OutputStore::WriteSegment(const std::vector<Record> &records) {
  int segment;
  {
    std::lock_guard<std::mutex> lock(mu_);
    CHECK(!closed_) << "Write to closed output store " << dir_;
    segment = next_segment_++;
  }

  RecordWriter *writer;
  Status st = RecordWriter::Open(JoinPath(dir_, SegmentName(segment)),
                                 RecordFileOptions(), &writer);
  if (!st) return st;
  for (const Record &record : records) {
    st = writer->Write(record.key, version_, record.value);
    if (!st) break;
  }
  Status close = writer->Close();
  delete writer;
  if (!st) return st;
  if (!close) return close;

  std::lock_guard<std::mutex> lock(mu_);
  segments_.push_back(segment);
  return Status::OK;
}

Status OutputStore::Close() {
  std::lock_guard<std::mutex> lock(mu_);
  if (closed_) return Status::OK;
  closed_ = true;

  std::sort(segments_.begin(), segments_.end());
  string manifest = "version " + std::to_string(version_) + "\n";
  for (int segment : segments_) {
    manifest.append("segment ");
    manifest.append(SegmentName(segment));
    manifest.push_back('\n');
  }
  return File::WriteContents(JoinPath(dir_, kManifest), manifest);
}

int OutputStore::num_segments() {
  std::lock_guard<std::mutex> lock(mu_);
  return segments_.size();
}

Status OutputStore::Scan(const string &dir, const Callback &callback,
                         uint64 *version) {
  string manifest;
  Status st = File::ReadContents(JoinPath(dir, kManifest), &manifest);
  if (!st) return st;

  size_t pos = 0;
  while (pos < manifest.size()) {
    size_t eol = manifest.find('\n', pos);
    if (eol == string::npos) eol = manifest.size();
    string line = manifest.substr(pos, eol - pos);
    pos = eol + 1;

    if (line.compare(0, 8, "version ") == 0) {
      if (version != nullptr) {
        *version = strtoull(line.c_str() + 8, nullptr, 10);
      }
    } else if (line.compare(0, 8, "segment ") == 0) {
      RecordReader *reader;
      st = RecordReader::Open(JoinPath(dir, line.substr(8)),
                              RecordFileOptions(), &reader);
      if (!st) return st;
      while (!reader->Done()) {
        Record record;
        st = reader->Read(&record);
        if (!st) break;
        callback(record);
      }
      Status close = reader->Close();
      delete reader;
      if (!st) return st;
      if (!close) return close;
    } else if (!line.empty()) {
      return Status(EBADMSG, "Invalid manifest line", line);
    }
  }
  return Status::OK;
}

}  // namespace bulkload
