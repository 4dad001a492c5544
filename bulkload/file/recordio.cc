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

#include "bulkload/file/recordio.h"

#include <string.h>
#include <snappy.h>

#include "bulkload/base/logging.h"
#include "bulkload/util/varint.h"

namespace bulkload {

// Return truncation error.
static Status Corrupt(const string &filename, const char *what) {
  return Status(EBADMSG, what, filename);
}

RecordReader::RecordReader(File *file, const RecordFileOptions &options)
    : file_(file), buffer_size_(options.buffer_size) {
  input_.Reset(buffer_size_);
}

RecordReader::~RecordReader() {
  if (file_ != nullptr) {
    Status st = Close();
    if (!st) LOG(WARNING) << "Error closing record file: " << st;
  }
}

Status RecordReader::Open(const string &filename,
                          const RecordFileOptions &options,
                          RecordReader **reader) {
  File *file;
  Status st = File::Open(filename, "r", &file);
  if (!st) return st;
  RecordReader *r = new RecordReader(file, options);
  st = r->Init();
  if (!st) {
    delete r;
    return st;
  }
  *reader = r;
  return Status::OK;
}

Status RecordReader::Init() {
  Status st = file_->GetSize(&size_);
  if (!st) return st;
  st = Fill(HEADER_LEN);
  if (!st) return st;
  uint32 magic;
  if (!input_.Read(&magic, 4) || magic != MAGIC) {
    return Corrupt(file_->filename(), "Not a record file");
  }
  uint8 hdrlen;
  if (!input_.Read(&hdrlen, 1) || hdrlen < HEADER_LEN ||
      input_.available() < hdrlen - 5) {
    return Corrupt(file_->filename(), "Invalid record file header");
  }
  input_.Consume(hdrlen - 5);
  position_ = hdrlen;
  return Status::OK;
}

Status RecordReader::Fill(size_t needed) {
  if (input_.available() >= needed) return Status::OK;
  input_.Flush();
  if (input_.capacity() < needed) input_.Resize(needed);
  while (input_.available() < needed) {
    uint64 bytes;
    Status st = file_->Read(input_.end(), input_.remaining(), &bytes);
    if (!st) return st;
    if (bytes == 0) break;
    input_.Append(bytes);
  }
  return Status::OK;
}

Status RecordReader::Read(Record *record) {
  if (Done()) return Status(ENOENT, "No more records", file_->filename());

  // Read record size.
  Status st = Fill(Varint::kMax64);
  if (!st) return st;
  uint64 size;
  const char *p = Varint::Parse64(input_.begin(), input_.end(), &size);
  if (p == nullptr) return Corrupt(file_->filename(), "Truncated record size");
  size_t hdrlen = p - input_.begin();
  input_.Consume(hdrlen);

  // Read the rest of the record.
  st = Fill(size);
  if (!st) return st;
  if (input_.available() < size) {
    return Corrupt(file_->filename(), "Truncated record");
  }
  const char *data = input_.Consume(size);
  const char *end = data + size;
  position_ += hdrlen + size;

  // Parse record flags and key.
  uint8 flags = *data++;
  uint64 ksize;
  data = Varint::Parse64(data, end, &ksize);
  if (data == nullptr || ksize > end - data) {
    return Corrupt(file_->filename(), "Invalid record key");
  }
  record->key = Slice(data, ksize);
  data += ksize;

  // Parse optional version.
  record->version = 0;
  if (flags & VERSIONED) {
    if (end - data < 8) return Corrupt(file_->filename(), "Invalid version");
    memcpy(&record->version, data, 8);
    data += 8;
  }

  // Get value, decompressing if needed.
  if (flags & COMPRESSED) {
    size_t length;
    if (!snappy::GetUncompressedLength(data, end - data, &length)) {
      return Corrupt(file_->filename(), "Invalid compressed value");
    }
    uncompressed_.resize(length);
    if (!snappy::RawUncompress(data, end - data, &uncompressed_[0])) {
      return Corrupt(file_->filename(), "Corrupt compressed value");
    }
    record->value = Slice(uncompressed_);
  } else {
    record->value = Slice(data, end);
  }

  return Status::OK;
}

Status RecordReader::Close() {
  if (file_ == nullptr) return Status::OK;
  Status st = file_->Close();
  file_ = nullptr;
  return st;
}

RecordWriter::RecordWriter(File *file, const RecordFileOptions &options)
    : file_(file),
      buffer_size_(options.buffer_size),
      compression_(options.compression),
      min_compress_size_(options.min_compress_size) {
  output_.Reset(buffer_size_);

  // Write file header.
  uint32 magic = MAGIC;
  uint8 hdrlen = HEADER_LEN;
  uint8 compression = compression_;
  uint16 flags = 0;
  output_.Write(&magic, 4);
  output_.Write(&hdrlen, 1);
  output_.Write(&compression, 1);
  output_.Write(&flags, 2);
  position_ = HEADER_LEN;
}

RecordWriter::~RecordWriter() {
  if (file_ != nullptr) {
    Status st = Close();
    if (!st) LOG(ERROR) << "Error closing record file: " << st;
  }
}

Status RecordWriter::Open(const string &filename,
                          const RecordFileOptions &options,
                          RecordWriter **writer) {
  File *file;
  Status st = File::Open(filename, "w", &file);
  if (!st) return st;
  *writer = new RecordWriter(file, options);
  return Status::OK;
}

Status RecordWriter::Write(const Record &record) {
  // Compress value if it is worthwhile.
  Slice value = record.value;
  uint8 flags = 0;
  if (compression_ == SNAPPY && value.size() >= min_compress_size_) {
    compressed_.clear();
    snappy::Compress(value.data(), value.size(), &compressed_);
    if (compressed_.size() < value.size()) {
      value = Slice(compressed_);
      flags |= COMPRESSED;
    }
  }
  if (record.version != 0) flags |= VERSIONED;

  // Compute record size.
  uint64 size = 1 + Varint::Length64(record.key.size()) + record.key.size() +
                value.size();
  if (flags & VERSIONED) size += 8;

  // Write record header.
  char header[1 + 2 * Varint::kMax64];
  char *p = Varint::Encode64(header, size);
  *p++ = flags;
  p = Varint::Encode64(p, record.key.size());
  size_t hdrlen = p - header;

  // Flush buffer if the record does not fit.
  size_t total = hdrlen + record.key.size() + value.size() + 8;
  if (output_.remaining() < total && !output_.empty()) {
    Status st = Flush();
    if (!st) return st;
  }

  output_.Write(header, hdrlen);
  output_.Write(record.key);
  if (flags & VERSIONED) output_.Write(&record.version, 8);
  output_.Write(value);
  position_ += Varint::Length64(size) + size;

  // Write large records through to the file immediately.
  if (output_.available() >= buffer_size_) return Flush();
  return Status::OK;
}

Status RecordWriter::Flush() {
  if (output_.empty()) return Status::OK;
  Status st = file_->Write(output_.begin(), output_.available());
  output_.Clear();
  return st;
}

Status RecordWriter::Close() {
  if (file_ == nullptr) return Status::OK;
  Status st = Flush();
  Status close = file_->Close();
  file_ = nullptr;
  return st ? close : st;
}

}  // namespace bulkload
