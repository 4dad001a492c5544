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

#ifndef BULKLOAD_LOADER_NQUAD_H_
#define BULKLOAD_LOADER_NQUAD_H_

#include <string>
#include <vector>

#include "bulkload/base/slice.h"
#include "bulkload/base/status.h"
#include "bulkload/base/types.h"
#include "bulkload/loader/value.h"

namespace bulkload {

class JSON;

// Graph edge from subject to either another node or a literal value. Node
// ids are IRIs without angle brackets, blank nodes like _:x, or uid literals
// like 0x1a.
struct NQuad {
  string subject;
  string predicate;

  // Object node for uid edges. Empty for value edges.
  string object_id;

  // Object value for value edges with its type and language.
  string object_value;
  ValueType value_type = TYPE_DEFAULT;
  string lang;

  // Optional graph label.
  string label;

  // Check if the object is a value.
  bool has_value() const { return object_id.empty(); }
};

// Parse one line of N-Quad input:
//   <subj> <pred> (<obj> | _:obj | "literal"[@lang | ^^<type>]) [<label>] .
// Sets *empty for blank lines and comment lines.
Status ParseRDF(const Slice &line, NQuad *nquad, bool *empty);

// Convert JSON object to edges. The object becomes a node with the id in its
// uid field, or a new blank node named by the prefix and the counter. Scalar
// fields become value edges, nested objects become uid edges to child nodes
// and arrays produce one edge per element. Keys like name@en set the language
// of the value.
class JSONConverter {
 public:
  explicit JSONConverter(const string &blank_prefix)
      : blank_prefix_(blank_prefix) {}

  // Parse JSON object text and convert it to edges.
  Status Convert(const Slice &text, std::vector<NQuad> *nquads);

 private:
  // Convert object and return its node id.
  Status ConvertObject(const JSON &object, std::vector<NQuad> *nquads,
                       string *id);

  // Add edge for value.
  Status ConvertValue(const string &subject, const string &key,
                      const JSON &value, std::vector<NQuad> *nquads);

  // Prefix and counter for new blank nodes.
  string blank_prefix_;
  uint64 next_blank_ = 0;
};

// Check if node id is a uid literal like 0x1a and return the uid.
bool ParseUidLiteral(const string &id, uint64 *uid);

}  // namespace bulkload

#endif  // BULKLOAD_LOADER_NQUAD_H_
