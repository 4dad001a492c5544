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

#ifndef BULKLOAD_BASE_INIT_H_
#define BULKLOAD_BASE_INIT_H_

namespace bulkload {

// Initialize program. This parses the command line flags, removing them from
// the argument list, and sets up logging.
void InitProgram(int *argc, char ***argv);

}  // namespace bulkload

#endif  // BULKLOAD_BASE_INIT_H_
