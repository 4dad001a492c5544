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

#ifndef BULKLOAD_LOADER_VALUE_H_
#define BULKLOAD_LOADER_VALUE_H_

#include <string>

#include "bulkload/base/status.h"
#include "bulkload/base/types.h"

namespace bulkload {

// Value types for predicates.
enum ValueType {
  TYPE_DEFAULT = 0,
  TYPE_STRING = 1,
  TYPE_INT = 2,
  TYPE_FLOAT = 3,
  TYPE_BOOL = 4,
  TYPE_DATETIME = 5,
  TYPE_UID = 6,
};

// Name of value type as used in schema files.
const char *ValueTypeName(ValueType type);

// Look up value type by name. Returns false for unknown types.
bool ParseValueType(const string &name, ValueType *type);

// Map RDF literal datatype, e.g. xs:int, to value type. Unknown and empty
// datatypes map to TYPE_DEFAULT.
ValueType DatatypeValueType(const string &datatype);

// Check that text is a valid value of the type and convert it to canonical
// form, e.g. "1.50" becomes "1.5" for floats.
Status ConvertValue(ValueType type, const string &text, string *value);

}  // namespace bulkload

#endif  // BULKLOAD_LOADER_VALUE_H_
