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

#ifndef BULKLOAD_BASE_LOGGING_H_
#define BULKLOAD_BASE_LOGGING_H_

#include <sstream>
#include <string>

#include "bulkload/base/types.h"

namespace bulkload {

// Log severity levels.
enum LogSeverity {
  INFO = 0,
  WARNING = 1,
  ERROR = 2,
  FATAL = 3,
};

// Minimum severity level for log messages to be output.
extern int log_min_severity;

// Verbosity level for VLOG messages.
extern int log_verbosity;

// Log message that is output when it is destructed. Fatal messages terminate
// the program.
class LogMessage : public std::basic_ostringstream<char> {
 public:
  LogMessage(const char *fname, int line, int severity);
  ~LogMessage() override;

 protected:
  // Output log message.
  void GenerateLogMessage();

 private:
  const char *fname_;
  int line_;
  int severity_;
};

// Log message that always terminates the program.
class LogMessageFatal : public LogMessage {
 public:
  LogMessageFatal(const char *file, int line);
  [[noreturn]] ~LogMessageFatal() override;
};

// Helper for discarding stream output of disabled log statements.
class LogMessageVoidify {
 public:
  void operator&(const std::ostream &) {}
};

// Build the failure message for CHECK_XX macros.
template<typename T1, typename T2>
string *MakeCheckOpString(const T1 &v1, const T2 &v2, const char *exprtext) {
  std::ostringstream os;
  os << exprtext << " (" << v1 << " vs. " << v2 << ")";
  return new string(os.str());
}

#define BULKLOAD_DEFINE_CHECK_OP(name, op)                       \
  template<typename T1, typename T2>                             \
  inline string *name##Impl(const T1 &v1, const T2 &v2,          \
                            const char *exprtext) {              \
    if (v1 op v2) return nullptr;                                \
    return MakeCheckOpString(v1, v2, exprtext);                  \
  }

BULKLOAD_DEFINE_CHECK_OP(Check_EQ, ==)
BULKLOAD_DEFINE_CHECK_OP(Check_NE, !=)
BULKLOAD_DEFINE_CHECK_OP(Check_LE, <=)
BULKLOAD_DEFINE_CHECK_OP(Check_LT, <)
BULKLOAD_DEFINE_CHECK_OP(Check_GE, >=)
BULKLOAD_DEFINE_CHECK_OP(Check_GT, >)

#undef BULKLOAD_DEFINE_CHECK_OP

}  // namespace bulkload

#define _LOG_INFO \
  ::bulkload::LogMessage(__FILE__, __LINE__, ::bulkload::INFO)
#define _LOG_WARNING \
  ::bulkload::LogMessage(__FILE__, __LINE__, ::bulkload::WARNING)
#define _LOG_ERROR \
  ::bulkload::LogMessage(__FILE__, __LINE__, ::bulkload::ERROR)
#define _LOG_FATAL \
  ::bulkload::LogMessageFatal(__FILE__, __LINE__)

#define LOG(severity) _LOG_##severity

#define VLOG_IS_ON(level) ((level) <= ::bulkload::log_verbosity)

#define VLOG(level)                        \
  !VLOG_IS_ON(level) ? (void) 0 :          \
  ::bulkload::LogMessageVoidify() & LOG(INFO)

#define CHECK(condition)                   \
  if (!(condition))                        \
    LOG(FATAL) << "Check failed: " #condition " "

#define CHECK_OP(name, op, val1, val2)                                \
  while (::bulkload::string *_result =                                \
             ::bulkload::name##Impl((val1), (val2),                   \
                                    #val1 " " #op " " #val2))         \
    ::bulkload::LogMessageFatal(__FILE__, __LINE__) << *_result

#define CHECK_EQ(val1, val2) CHECK_OP(Check_EQ, ==, val1, val2)
#define CHECK_NE(val1, val2) CHECK_OP(Check_NE, !=, val1, val2)
#define CHECK_LE(val1, val2) CHECK_OP(Check_LE, <=, val1, val2)
#define CHECK_LT(val1, val2) CHECK_OP(Check_LT, <, val1, val2)
#define CHECK_GE(val1, val2) CHECK_OP(Check_GE, >=, val1, val2)
#define CHECK_GT(val1, val2) CHECK_OP(Check_GT, >, val1, val2)

#ifdef NDEBUG
#define DCHECK(condition) while (false) CHECK(condition)
#define DCHECK_EQ(val1, val2) while (false) CHECK_EQ(val1, val2)
#define DCHECK_NE(val1, val2) while (false) CHECK_NE(val1, val2)
#define DCHECK_LE(val1, val2) while (false) CHECK_LE(val1, val2)
#define DCHECK_LT(val1, val2) while (false) CHECK_LT(val1, val2)
#define DCHECK_GE(val1, val2) while (false) CHECK_GE(val1, val2)
#define DCHECK_GT(val1, val2) while (false) CHECK_GT(val1, val2)
#else
#define DCHECK(condition) CHECK(condition)
#define DCHECK_EQ(val1, val2) CHECK_EQ(val1, val2)
#define DCHECK_NE(val1, val2) CHECK_NE(val1, val2)
#define DCHECK_LE(val1, val2) CHECK_LE(val1, val2)
#define DCHECK_LT(val1, val2) CHECK_LT(val1, val2)
#define DCHECK_GE(val1, val2) CHECK_GE(val1, val2)
#define DCHECK_GT(val1, val2) CHECK_GT(val1, val2)
#endif

#endif  // BULKLOAD_BASE_LOGGING_H_
