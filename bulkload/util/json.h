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

#ifndef BULKLOAD_UTIL_JSON_H_
#define BULKLOAD_UTIL_JSON_H_

#include <string>
#include <utility>
#include <vector>

#include "bulkload/base/slice.h"
#include "bulkload/base/status.h"
#include "bulkload/base/types.h"

namespace bulkload {

// Simple JSON document model with a parser. Numbers keep their textual form
// so they can be stored without loss of precision.
class JSON {
 public:
  class Object;
  class Array;

  // JSON value types.
  enum Type {NIL, INT, FLOAT, BOOL, STRING, OBJECT, ARRAY, ERROR};

  // JSON object with list of key/value pairs in input order.
  class Object {
   public:
    // Add key/value pair to object.
    void Add(const string &key, JSON &&value) {
      items_.emplace_back(key, std::move(value));
    }

    // Number of key/value pairs.
    int size() const { return items_.size(); }

    // Get keys and values.
    const string &key(int index) const { return items_[index].first; }
    const JSON &value(int index) const { return items_[index].second; }

    // Look up value for key. Returns an error value if key is not found.
    const JSON &operator [](const string &key) const;

   private:
    std::vector<std::pair<string, JSON>> items_;
  };

  // JSON array with list of values.
  class Array {
   public:
    // Add element to array.
    void Add(JSON &&value) { elements_.emplace_back(std::move(value)); }

    // Number of elements.
    int size() const { return elements_.size(); }

    // Get element.
    const JSON &operator [](int index) const { return elements_[index]; }

   private:
    std::vector<JSON> elements_;
  };

  // Default value is an error value.
  JSON() : s_(nullptr), type_(ERROR) {}
  JSON(JSON &&other) : s_(other.s_), type_(other.type_) {
    other.type_ = ERROR;
    other.s_ = nullptr;
  }
  JSON &operator=(JSON &&other);
  ~JSON();

  // Parse JSON text. Trailing content other than whitespace is an error.
  static Status Parse(const Slice &text, JSON *result);

  // Value type.
  Type type() const { return type_; }
  bool valid() const { return type_ != ERROR; }
  bool scalar() const {
    return type_ == INT || type_ == FLOAT || type_ == BOOL || type_ == STRING;
  }

  // Value accessors. Numbers and strings return their text.
  const string &text() const;
  bool b() const { return type_ == BOOL && b_; }
  int64 i() const;
  const Object *o() const { return type_ == OBJECT ? o_ : nullptr; }
  const Array *a() const { return type_ == ARRAY ? a_ : nullptr; }

  // Object lookup.
  const JSON &operator [](const string &key) const;

 private:
  class Parser;

  explicit JSON(Type type) : s_(nullptr), type_(type) {}

  // Release owned value.
  void Clear();

  union {
    bool b_;         // BOOL
    string *s_;      // STRING, INT, FLOAT
    Object *o_;      // OBJECT
    Array *a_;       // ARRAY
  };
  Type type_;

  static const JSON ERROR_VALUE;
  static const string EMPTY_STRING;

  DISALLOW_COPY_AND_ASSIGN(JSON);
};

}  // namespace bulkload

#endif  // BULKLOAD_UTIL_JSON_H_
