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

#include "bulkload/file/file.h"

#include <dirent.h>
#include <fcntl.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <algorithm>

#include "bulkload/base/logging.h"

namespace bulkload {

// Return system error status.
static Status IOError(const string &context, int error) {
  return Status(error, strerror(error), context);
}

Status File::Open(const string &name, const char *mode, File **file) {
  int flags;
  if (strcmp(mode, "r") == 0) {
    flags = O_RDONLY;
  } else if (strcmp(mode, "w") == 0) {
    flags = O_WRONLY | O_CREAT | O_TRUNC;
  } else if (strcmp(mode, "a") == 0) {
    flags = O_WRONLY | O_CREAT | O_APPEND;
  } else if (strcmp(mode, "r+") == 0) {
    flags = O_RDWR;
  } else if (strcmp(mode, "w+") == 0) {
    flags = O_RDWR | O_CREAT | O_TRUNC;
  } else {
    return Status(EINVAL, "Invalid file mode", mode);
  }

  int fd = open(name.c_str(), flags | O_CLOEXEC, 0644);
  if (fd < 0) return IOError(name, errno);
  *file = new File(fd, name);
  return Status::OK;
}

File *File::OpenOrDie(const string &name, const char *mode) {
  File *file = nullptr;
  Status st = Open(name, mode, &file);
  CHECK(st) << st;
  return file;
}

Status File::Read(void *buffer, size_t size, uint64 *read) {
  for (;;) {
    ssize_t rc = ::read(fd_, buffer, size);
    if (rc >= 0) {
      *read = rc;
      return Status::OK;
    }
    if (errno != EINTR) return IOError(filename_, errno);
  }
}

void File::ReadOrDie(void *buffer, size_t size) {
  char *p = static_cast<char *>(buffer);
  while (size > 0) {
    uint64 bytes;
    Status st = Read(p, size, &bytes);
    CHECK(st) << st;
    CHECK_GT(bytes, 0) << "Unexpected end of file: " << filename_;
    p += bytes;
    size -= bytes;
  }
}

Status File::PRead(uint64 pos, void *buffer, size_t size, uint64 *read) {
  char *p = static_cast<char *>(buffer);
  uint64 total = 0;
  while (size > 0) {
    ssize_t rc = pread(fd_, p, size, pos);
    if (rc < 0) {
      if (errno == EINTR) continue;
      return IOError(filename_, errno);
    }
    if (rc == 0) break;
    p += rc;
    pos += rc;
    size -= rc;
    total += rc;
  }
  *read = total;
  return Status::OK;
}

Status File::Write(const void *buffer, size_t size) {
  const char *p = static_cast<const char *>(buffer);
  while (size > 0) {
    ssize_t rc = ::write(fd_, p, size);
    if (rc < 0) {
      if (errno == EINTR) continue;
      return IOError(filename_, errno);
    }
    p += rc;
    size -= rc;
  }
  return Status::OK;
}

void File::WriteOrDie(const void *buffer, size_t size) {
  Status st = Write(buffer, size);
  CHECK(st) << st;
}

Status File::Sync() {
  if (fsync(fd_) != 0) return IOError(filename_, errno);
  return Status::OK;
}

Status File::GetSize(uint64 *size) {
  struct stat st;
  if (fstat(fd_, &st) != 0) return IOError(filename_, errno);
  *size = st.st_size;
  return Status::OK;
}

Status File::Close() {
  int rc = close(fd_);
  Status st = rc == 0 ? Status::OK : IOError(filename_, errno);
  delete this;
  return st;
}

bool File::Exists(const string &path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0;
}

bool File::IsDirectory(const string &path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

Status File::Mkdir(const string &dir) {
  if (mkdir(dir.c_str(), 0755) != 0) return IOError(dir, errno);
  return Status::OK;
}

Status File::MakeDirectories(const string &dir) {
  if (dir.empty() || IsDirectory(dir)) return Status::OK;
  size_t slash = dir.find_last_of('/');
  if (slash != string::npos && slash > 0) {
    Status st = MakeDirectories(dir.substr(0, slash));
    if (!st) return st;
  }
  if (mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) {
    return IOError(dir, errno);
  }
  return Status::OK;
}

Status File::ListDirectory(const string &dir, std::vector<string> *names) {
  DIR *d = opendir(dir.c_str());
  if (d == nullptr) return IOError(dir, errno);
  names->clear();
  struct dirent *entry;
  while ((entry = readdir(d)) != nullptr) {
    if (strcmp(entry->d_name, ".") == 0 || strcmp(entry->d_name, "..") == 0) {
      continue;
    }
    names->push_back(entry->d_name);
  }
  closedir(d);
  std::sort(names->begin(), names->end());
  return Status::OK;
}

Status File::DeleteRecursively(const string &path) {
  struct stat st;
  if (lstat(path.c_str(), &st) != 0) {
    if (errno == ENOENT) return Status::OK;
    return IOError(path, errno);
  }
  if (S_ISDIR(st.st_mode)) {
    std::vector<string> names;
    Status status = ListDirectory(path, &names);
    if (!status) return status;
    for (const string &name : names) {
      status = DeleteRecursively(JoinPath(path, name));
      if (!status) return status;
    }
    if (rmdir(path.c_str()) != 0) return IOError(path, errno);
  } else {
    if (unlink(path.c_str()) != 0) return IOError(path, errno);
  }
  return Status::OK;
}

Status File::Walk(const string &dir, const WalkCallback &callback) {
  std::vector<string> names;
  Status st = ListDirectory(dir, &names);
  if (!st) return st;
  for (const string &name : names) {
    string path = JoinPath(dir, name);
    if (IsDirectory(path)) {
      st = Walk(path, callback);
      if (!st) return st;
    } else {
      callback(path);
    }
  }
  return Status::OK;
}

Status File::ReadContents(const string &filename, string *data) {
  File *file;
  Status st = Open(filename, "r", &file);
  if (!st) return st;
  data->clear();
  char buffer[1 << 16];
  for (;;) {
    uint64 bytes;
    st = file->Read(buffer, sizeof(buffer), &bytes);
    if (!st || bytes == 0) break;
    data->append(buffer, bytes);
  }
  Status close = file->Close();
  return st ? close : st;
}

Status File::WriteContents(const string &filename, const string &data) {
  File *file;
  Status st = Open(filename, "w", &file);
  if (!st) return st;
  st = file->Write(data.data(), data.size());
  Status close = file->Close();
  return st ? close : st;
}

string JoinPath(const string &dir, const string &name) {
  if (dir.empty()) return name;
  if (dir.back() == '/') return dir + name;
  return dir + "/" + name;
}

}  // namespace bulkload
