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

#ifndef BULKLOAD_BASE_FLAGS_H_
#define BULKLOAD_BASE_FLAGS_H_

#include <iosfwd>
#include <string>

#include "bulkload/base/types.h"

namespace bulkload {

// Command line flag. Flags are registered in a global list through the
// DEFINE_XXX macros and set by ParseCommandLineFlags().
class Flag {
 public:
  // Flag types.
  enum Type {BOOL, INT32, UINT32, INT64, UINT64, DOUBLE, STRING};

  // Register flag.
  Flag(const char *name, Type type, const char *help,
       const char *filename, void *storage);

  // Find flag by name.
  static Flag *Find(const char *name);

  // Set usage message for --help.
  static void SetUsageMessage(const string &usage);

  // Parse command line flags and remove them from the argument list. Returns
  // zero on success.
  static int ParseCommandLineFlags(int *argc, char **argv);

  // Print list of flags.
  static void PrintHelp();

  // Set flag value from string.
  bool Set(const char *str, bool neg = false);

  // Flag value.
  template<typename T> T &value() { return *static_cast<T *>(storage); }
  template<typename T> const T &value() const {
    return *static_cast<const T *>(storage);
  }

  const char *name;
  Type type;
  const char *help;
  const char *filename;
  void *storage;
  Flag *next;

  // Global list of flags.
  static Flag *head;
  static Flag *tail;
};

std::ostream &operator<<(std::ostream &os, const Flag &flag);

// Registration helper for flags.
template<typename T> class FlagRegisterer {
 public:
  FlagRegisterer(const char *name, Flag::Type type, const char *help,
                 const char *filename, T *storage)
      : flag_(name, type, help, filename, storage) {}

 private:
  Flag flag_;
};

}  // namespace bulkload

#define BULKLOAD_DEFINE_FLAG(type, ftype, name, value, help)        \
  type FLAGS_##name = value;                                        \
  static ::bulkload::FlagRegisterer<type> flag_registerer_##name(   \
      #name, ::bulkload::Flag::ftype, help, __FILE__, &FLAGS_##name)

#define BULKLOAD_DECLARE_FLAG(type, name) extern type FLAGS_##name

#define DEFINE_bool(name, value, help) \
  BULKLOAD_DEFINE_FLAG(bool, BOOL, name, value, help)
#define DEFINE_int32(name, value, help) \
  BULKLOAD_DEFINE_FLAG(::bulkload::int32, INT32, name, value, help)
#define DEFINE_uint32(name, value, help) \
  BULKLOAD_DEFINE_FLAG(::bulkload::uint32, UINT32, name, value, help)
#define DEFINE_int64(name, value, help) \
  BULKLOAD_DEFINE_FLAG(::bulkload::int64, INT64, name, value, help)
#define DEFINE_uint64(name, value, help) \
  BULKLOAD_DEFINE_FLAG(::bulkload::uint64, UINT64, name, value, help)
#define DEFINE_double(name, value, help) \
  BULKLOAD_DEFINE_FLAG(double, DOUBLE, name, value, help)
#define DEFINE_string(name, value, help) \
  BULKLOAD_DEFINE_FLAG(::bulkload::string, STRING, name, value, help)

#define DECLARE_bool(name) BULKLOAD_DECLARE_FLAG(bool, name)
#define DECLARE_int32(name) BULKLOAD_DECLARE_FLAG(::bulkload::int32, name)
#define DECLARE_uint32(name) BULKLOAD_DECLARE_FLAG(::bulkload::uint32, name)
#define DECLARE_int64(name) BULKLOAD_DECLARE_FLAG(::bulkload::int64, name)
#define DECLARE_uint64(name) BULKLOAD_DECLARE_FLAG(::bulkload::uint64, name)
#define DECLARE_double(name) BULKLOAD_DECLARE_FLAG(double, name)
#define DECLARE_string(name) BULKLOAD_DECLARE_FLAG(::bulkload::string, name)

#endif  // BULKLOAD_BASE_FLAGS_H_
