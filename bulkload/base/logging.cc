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

#include "bulkload/base/logging.h"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/time.h>
#include <time.h>

#include "bulkload/base/flags.h"

DEFINE_int32(v, 0, "Verbosity level for VLOG messages");
DEFINE_int32(minloglevel, 0, "Minimum severity level for log messages");

namespace bulkload {

int log_min_severity = 0;
int log_verbosity = 0;

LogMessage::LogMessage(const char *fname, int line, int severity)
    : fname_(fname), line_(line), severity_(severity) {}

LogMessage::~LogMessage() {
  if (severity_ >= log_min_severity) GenerateLogMessage();
}

void LogMessage::GenerateLogMessage() {
  // Get current time.
  struct timeval tv;
  gettimeofday(&tv, nullptr);
  struct tm tm;
  localtime_r(&tv.tv_sec, &tm);
  char timestamp[32];
  strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &tm);

  // Strip directory from file name.
  const char *base = strrchr(fname_, '/');
  base = base == nullptr ? fname_ : base + 1;

  fprintf(stderr, "%s.%06d: %c %s:%d] %s\n",
          timestamp, static_cast<int>(tv.tv_usec),
          "IWEF"[severity_], base, line_, str().c_str());
}

LogMessageFatal::LogMessageFatal(const char *file, int line)
    : LogMessage(file, line, FATAL) {}

LogMessageFatal::~LogMessageFatal() {
  GenerateLogMessage();
  fflush(stderr);
  abort();
}

}  // namespace bulkload
