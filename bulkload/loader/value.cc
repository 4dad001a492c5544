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

#include "bulkload/loader/value.h"

#include <ctype.h>
#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

namespace bulkload {

static const char *kTypeNames[] = {
  "default", "string", "int", "float", "bool", "datetime", "uid",
};

const char *ValueTypeName(ValueType type) {
  return kTypeNames[type];
}

bool ParseValueType(const string &name, ValueType *type) {
  for (int i = 0; i <= TYPE_UID; ++i) {
    if (name == kTypeNames[i]) {
      *type = static_cast<ValueType>(i);
      return true;
    }
  }
  return false;
}

ValueType DatatypeValueType(const string &datatype) {
  string name = datatype;
  if (name.compare(0, 3, "xs:") == 0) name = name.substr(3);
  if (name == "string") return TYPE_STRING;
  if (name == "int" || name == "integer" || name == "long") return TYPE_INT;
  if (name == "float" || name == "double" || name == "decimal") {
    return TYPE_FLOAT;
  }
  if (name == "boolean") return TYPE_BOOL;
  if (name == "dateTime" || name == "date") return TYPE_DATETIME;
  return TYPE_DEFAULT;
}

// Check that text holds a date or date-time, i.e. YYYY[-MM[-DD[Thh:mm...]]].
static bool IsDateTime(const string &text) {
  if (text.size() < 4) return false;
  for (int i = 0; i < 4; ++i) {
    if (!isdigit(text[i])) return false;
  }
  if (text.size() == 4) return true;
  if (text[4] != '-') return false;
  for (size_t i = 5; i < text.size(); ++i) {
    char c = text[i];
    if (!isdigit(c) && strchr("-:T.Z+", c) == nullptr) return false;
  }
  return true;
}

Status ConvertValue(ValueType type, const string &text, string *value) {
  switch (type) {
    case TYPE_DEFAULT:
    case TYPE_STRING:
      *value = text;
      return Status::OK;

    case TYPE_INT: {
      char *end;
      errno = 0;
      long long n = strtoll(text.c_str(), &end, 10);
      if (text.empty() || *end != 0 || errno != 0) {
        return Status(EINVAL, "Invalid int value", text);
      }
      *value = std::to_string(n);
      return Status::OK;
    }

    case TYPE_FLOAT: {
      char *end;
      errno = 0;
      double d = strtod(text.c_str(), &end);
      if (text.empty() || *end != 0 || errno != 0) {
        return Status(EINVAL, "Invalid float value", text);
      }
      char buf[32];
      snprintf(buf, sizeof(buf), "%.17g", d);
      *value = buf;
      return Status::OK;
    }

    case TYPE_BOOL:
      if (text == "true" || text == "1") {
        *value = "true";
      } else if (text == "false" || text == "0") {
        *value = "false";
      } else {
        return Status(EINVAL, "Invalid bool value", text);
      }
      return Status::OK;

    case TYPE_DATETIME:
      if (!IsDateTime(text)) {
        return Status(EINVAL, "Invalid datetime value", text);
      }
      *value = text;
      return Status::OK;

    case TYPE_UID:
      return Status(EINVAL, "Value given for uid predicate", text);
  }
  return Status(EINVAL, "Unknown value type");
}

}  // namespace bulkload
