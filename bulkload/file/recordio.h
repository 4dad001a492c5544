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

#ifndef BULKLOAD_FILE_RECORDIO_H_
#define BULKLOAD_FILE_RECORDIO_H_

#include <string>

#include "bulkload/base/slice.h"
#include "bulkload/base/status.h"
#include "bulkload/base/types.h"
#include "bulkload/file/file.h"
#include "bulkload/util/iobuffer.h"

namespace bulkload {

// Record with key, optional version and value.
struct Record {
  Record() {}
  Record(const Slice &key, const Slice &value) : key(key), value(value) {}
  Record(const Slice &key, uint64 version, const Slice &value)
      : key(key), value(value), version(version) {}

  Slice key;
  Slice value;
  uint64 version = 0;
};

// A record file is a header followed by a sequence of records:
//
//   header: magic:uint32 hdrlen:uint8 compression:uint8 flags:uint16
//   record: size:varint flags:uint8 ksize:varint key {version:uint64} value
//
// The record size covers everything after the size varint. Bit 0 in the
// record flags is set for versioned records and bit 1 if the value is snappy
// compressed.
class RecordFile {
 public:
  // Magic number for identifying record files.
  static const uint32 MAGIC = 0x42434552;  // RECB

  // File header length.
  static const int HEADER_LEN = 8;

  // Record flags.
  static const uint8 VERSIONED = 1;
  static const uint8 COMPRESSED = 2;

  // Compression types.
  enum CompressionType {
    UNCOMPRESSED = 0,
    SNAPPY = 1,
  };
};

// Configuration options for record files.
struct RecordFileOptions {
  // Input/output buffer size.
  int buffer_size = 1 << 16;

  // Value compression.
  RecordFile::CompressionType compression = RecordFile::SNAPPY;

  // Values smaller than this are never compressed.
  int min_compress_size = 64;
};

// Reader for reading records sequentially from a record file.
class RecordReader : public RecordFile {
 public:
  RecordReader(File *file, const RecordFileOptions &options);
  ~RecordReader();

  // Open record file.
  static Status Open(const string &filename, const RecordFileOptions &options,
                     RecordReader **reader);

  // Check that the file has a valid header. Must be called before Read().
  Status Init();

  // Return true if all records have been read.
  bool Done() const { return position_ >= size_; }

  // Read next record. The key and value slices are valid until the next read.
  Status Read(Record *record);

  // Current position in record file.
  uint64 Tell() const { return position_; }

  // Close record file.
  Status Close();

 private:
  // Ensure that at least 'needed' bytes are in the input buffer, unless the
  // end of the file is reached first.
  Status Fill(size_t needed);

  // Input file.
  File *file_;

  // File size and current position.
  uint64 size_ = 0;
  uint64 position_ = 0;

  // Input buffer.
  IOBuffer input_;
  int buffer_size_;

  // Buffer for decompressed values.
  string uncompressed_;
};

// Writer for writing records to a record file.
class RecordWriter : public RecordFile {
 public:
  RecordWriter(File *file, const RecordFileOptions &options);
  ~RecordWriter();

  // Create new record file.
  static Status Open(const string &filename, const RecordFileOptions &options,
                     RecordWriter **writer);

  // Write record.
  Status Write(const Record &record);

  // Write key/value pair.
  Status Write(const Slice &key, const Slice &value) {
    return Write(Record(key, value));
  }

  // Write key/version/value triple.
  Status Write(const Slice &key, uint64 version, const Slice &value) {
    return Write(Record(key, version, value));
  }

  // Flush output buffer to file.
  Status Flush();

  // Flush and close record file.
  Status Close();

  // Number of bytes written including buffered output.
  uint64 Tell() const { return position_; }

 private:
  // Output file. Null when closed.
  File *file_;

  // Position in file including buffered output.
  uint64 position_ = 0;

  // Output buffer.
  IOBuffer output_;
  int buffer_size_;

  // Compression settings.
  CompressionType compression_;
  int min_compress_size_;

  // Buffer for compressed values.
  string compressed_;
};

}  // namespace bulkload

#endif  // BULKLOAD_FILE_RECORDIO_H_
