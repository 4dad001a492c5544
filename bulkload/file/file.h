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

#ifndef BULKLOAD_FILE_FILE_H_
#define BULKLOAD_FILE_FILE_H_

#include <functional>
#include <string>
#include <vector>

#include "bulkload/base/status.h"
#include "bulkload/base/types.h"

namespace bulkload {

// File backed by a POSIX file descriptor.
class File {
 public:
  // Callback for directory walks.
  typedef std::function<void(const string &path)> WalkCallback;

  // Open file. The mode is "r" for reading, "w" for writing (truncating any
  // existing file), "a" for appending, and "r+" or "w+" for reading and
  // writing.
  static Status Open(const string &name, const char *mode, File **file);

  // Open file and terminate on errors.
  static File *OpenOrDie(const string &name, const char *mode);

  // Read up to size bytes from the current position. The number of bytes read
  // is zero at end of file.
  Status Read(void *buffer, size_t size, uint64 *read);

  // Read exactly size bytes. Terminates on errors and short reads.
  void ReadOrDie(void *buffer, size_t size);

  // Read up to size bytes from position without moving the file position.
  Status PRead(uint64 pos, void *buffer, size_t size, uint64 *read);

  // Write data to file.
  Status Write(const void *buffer, size_t size);

  // Write data to file and terminate on errors.
  void WriteOrDie(const void *buffer, size_t size);

  // Write string to file.
  Status WriteString(const string &str) {
    return Write(str.data(), str.size());
  }

  // Flush file data to disk.
  Status Sync();

  // Get current file size.
  Status GetSize(uint64 *size);

  // Close file and delete the file object.
  Status Close();

  // File descriptor.
  int fd() const { return fd_; }

  // File name.
  const string &filename() const { return filename_; }

  // Check if file exists.
  static bool Exists(const string &path);

  // Check if path is a directory.
  static bool IsDirectory(const string &path);

  // Create directory. Fails if the directory already exists.
  static Status Mkdir(const string &dir);

  // Create directory and all missing parent directories.
  static Status MakeDirectories(const string &dir);

  // Delete file or directory tree.
  static Status DeleteRecursively(const string &path);

  // Call callback for every regular file under directory, recursively.
  static Status Walk(const string &dir, const WalkCallback &callback);

  // List the entries of a directory in sorted order.
  static Status ListDirectory(const string &dir, std::vector<string> *names);

  // Read whole file into string.
  static Status ReadContents(const string &filename, string *data);

  // Write string to file, replacing existing content.
  static Status WriteContents(const string &filename, const string &data);

 private:
  File(int fd, const string &filename) : fd_(fd), filename_(filename) {}
  ~File() = default;

  // File descriptor.
  int fd_;

  // File name.
  string filename_;

  DISALLOW_COPY_AND_ASSIGN(File);
};

// Join two path components.
string JoinPath(const string &dir, const string &name);

}  // namespace bulkload

#endif  // BULKLOAD_FILE_FILE_H_
