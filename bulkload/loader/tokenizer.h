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

#ifndef BULKLOAD_LOADER_TOKENIZER_H_
#define BULKLOAD_LOADER_TOKENIZER_H_

#include <string>
#include <vector>

#include "bulkload/base/status.h"
#include "bulkload/base/types.h"
#include "bulkload/loader/value.h"

namespace bulkload {

// Check if tokenizer name is known and can be used for values of the type.
bool ValidTokenizer(const string &name, ValueType type);

// Compute index terms for value. Each term starts with a byte identifying the
// tokenizer, so terms from different tokenizers on the same predicate never
// collide.
Status Tokenize(const string &tokenizer, const string &value,
                std::vector<string> *terms);

}  // namespace bulkload

#endif  // BULKLOAD_LOADER_TOKENIZER_H_
