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

#ifndef BULKLOAD_LOADER_SCHEMA_H_
#define BULKLOAD_LOADER_SCHEMA_H_

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "bulkload/base/status.h"
#include "bulkload/base/types.h"
#include "bulkload/loader/output-store.h"
#include "bulkload/loader/value.h"

namespace bulkload {

// Schema for one predicate.
struct PredicateSchema {
  // Predicate name.
  string predicate;

  // Value type. List predicates can have multiple values per node.
  ValueType type = TYPE_DEFAULT;
  bool list = false;

  // Tokenizers for index terms.
  std::vector<string> tokenizers;

  // Predicate directives.
  bool reverse = false;
  bool count = false;
  bool lang = false;

  // Schema was inferred from the data and not given in the schema file.
  bool inferred = false;

  // Return schema in schema file syntax.
  string ToString() const;
};

// Parse schema text with one predicate schema per statement:
//   name: type [@index(tokenizer, ...)] [@reverse] [@count] [@lang] .
// The type is one of default, string, int, float, bool, datetime, uid or a
// list type like [uid]. Text after # is a comment.
Status ParseSchema(const string &text, std::vector<PredicateSchema> *schema);

// Read and parse schema file. Files ending in .gz are decompressed.
Status ReadSchema(const string &filename, std::vector<PredicateSchema> *schema);

// Thread-safe schema registry for the predicates in a run. Predicates found
// in the data that are not in the schema are added with an inferred schema.
class SchemaStore {
 public:
  explicit SchemaStore(const std::vector<PredicateSchema> &schema);
  ~SchemaStore();

  // Look up schema for predicate. Returns null for unknown predicates.
  const PredicateSchema *Lookup(const string &predicate);

  // Get schema for predicate. If the predicate is unknown, a schema is
  // inferred from the edge: uid for edges to nodes and default for values.
  const PredicateSchema *Get(const string &predicate, bool uid_edge);

  // Add predicate schema if the predicate is not already known.
  void Add(const PredicateSchema &schema);

  // Write all predicate schemas as a segment in the output store.
  Status Write(OutputStore *store);

  // Number of predicates.
  int size();

 private:
  // Schema for each predicate. Entries are never removed so pointers stay
  // valid for the life of the store.
  std::map<string, PredicateSchema *> predicates_;

  // Mutex for serializing access to the predicate map.
  std::mutex mu_;

  DISALLOW_COPY_AND_ASSIGN(SchemaStore);
};

}  // namespace bulkload

#endif  // BULKLOAD_LOADER_SCHEMA_H_
