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

#include "bulkload/base/init.h"

#include <stdlib.h>
#include <string>

#include "bulkload/base/flags.h"
#include "bulkload/base/logging.h"
#include "bulkload/base/types.h"

DECLARE_int32(v);
DECLARE_int32(minloglevel);

namespace bulkload {

void InitProgram(int *argc, char ***argv) {
  // Initialize command line flags.
  if (*argc > 0) {
    string usage;
    usage.append((*argv)[0]);
    usage.append(" [OPTIONS]\n");
    Flag::SetUsageMessage(usage);
    if (Flag::ParseCommandLineFlags(argc, *argv) != 0) exit(1);
  }

  // Set up logging from flags.
  log_verbosity = FLAGS_v;
  log_min_severity = FLAGS_minloglevel;
}

}  // namespace bulkload
