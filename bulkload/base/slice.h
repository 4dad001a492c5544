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

#ifndef BULKLOAD_BASE_SLICE_H_
#define BULKLOAD_BASE_SLICE_H_

#include <string.h>
#include <iosfwd>
#include <string>

#include "bulkload/base/types.h"

namespace bulkload {

// A slice is a reference to a contiguous range of bytes. The slice does not
// own the data, so the referenced memory must outlive the slice.
class Slice {
 public:
  Slice() : data_(""), size_(0) {}
  Slice(const char *data, size_t size) : data_(data), size_(size) {}
  Slice(const void *data, size_t size)
      : data_(static_cast<const char *>(data)), size_(size) {}
  Slice(const char *begin, const char *end)
      : data_(begin), size_(end - begin) {}
  Slice(const string &str) : data_(str.data()), size_(str.size()) {}
  Slice(const char *str) : data_(str), size_(strlen(str)) {}

  // Return data and size of slice.
  const char *data() const { return data_; }
  size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }

  // Begin and end of slice.
  const char *begin() const { return data_; }
  const char *end() const { return data_ + size_; }

  // Return the ith byte in the slice.
  char operator[](size_t n) const { return data_[n]; }

  // Return copy of slice as string.
  string str() const { return string(data_, size_); }

  // Three-way comparison.
  int compare(const Slice &other) const {
    size_t n = size_ < other.size_ ? size_ : other.size_;
    int r = memcmp(data_, other.data_, n);
    if (r == 0) {
      if (size_ < other.size_) return -1;
      if (size_ > other.size_) return 1;
    }
    return r;
  }

  // Check if slice starts with prefix.
  bool starts_with(const Slice &prefix) const {
    return size_ >= prefix.size_ &&
           memcmp(data_, prefix.data_, prefix.size_) == 0;
  }

  // Check if slice ends with suffix.
  bool ends_with(const Slice &suffix) const {
    return size_ >= suffix.size_ &&
           memcmp(data_ + size_ - suffix.size_, suffix.data_,
                  suffix.size_) == 0;
  }

  // Drop the first n bytes from the slice.
  void remove_prefix(size_t n) {
    data_ += n;
    size_ -= n;
  }

 private:
  const char *data_;
  size_t size_;
};

inline bool operator==(const Slice &x, const Slice &y) {
  return x.size() == y.size() && memcmp(x.data(), y.data(), x.size()) == 0;
}

inline bool operator!=(const Slice &x, const Slice &y) {
  return !(x == y);
}

inline bool operator<(const Slice &x, const Slice &y) {
  return x.compare(y) < 0;
}

std::ostream &operator<<(std::ostream &os, const Slice &slice);

}  // namespace bulkload

#endif  // BULKLOAD_BASE_SLICE_H_
