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

#include "bulkload/base/flags.h"

#include <stdlib.h>
#include <string.h>
#include <strings.h>
#include <fstream>
#include <iostream>

DEFINE_bool(help, false, "Print help message");
DEFINE_string(config, "", "Configuration file with flags");

namespace bulkload {

Flag *Flag::head = nullptr;
Flag *Flag::tail = nullptr;

// Program usage message.
static string usage_message;

// Flag type names.
static const char *flagtype[] = {
  "bool", "int32", "uint32", "int64", "uint64", "double", "string",
};

Flag::Flag(const char *name, Type type, const char *help,
           const char *filename, void *storage)
    : name(name), type(type), help(help), filename(filename),
      storage(storage), next(nullptr) {
  if (head == nullptr) {
    head = tail = this;
  } else {
    tail->next = this;
    tail = this;
  }
}

Flag *Flag::Find(const char *name) {
  for (Flag *f = head; f != nullptr; f = f->next) {
    if (strcmp(name, f->name) == 0) return f;
  }
  return nullptr;
}

void Flag::SetUsageMessage(const string &usage) {
  usage_message = usage;
}

// Split argument into flag name and value. The argument is modified in place.
// Returns false if the argument is not a flag. The name is null for "--".
static bool SplitArgument(char *arg, const char **name, const char **value) {
  *name = nullptr;
  *value = nullptr;
  if (arg == nullptr || arg[0] != '-') return false;
  arg++;
  if (*arg == '-') {
    arg++;
    if (*arg == '\0') return true;
  }
  *name = arg;
  char *eq = strchr(arg, '=');
  if (eq != nullptr) {
    *eq = '\0';
    *value = eq + 1;
  }
  return true;
}

// Trim spaces from both ends of string.
static string Trim(const string &str) {
  size_t begin = str.find_first_not_of(" \t\r");
  if (begin == string::npos) return "";
  size_t end = str.find_last_not_of(" \t\r");
  return str.substr(begin, end - begin + 1);
}

// Read flags from configuration file with "name = value" lines. Returns the
// number of errors.
static int ParseConfigFile(const string &filename) {
  std::ifstream config(filename);
  if (!config) {
    std::cerr << "Error: config file not found: " << filename << "\n";
    return 1;
  }

  int errors = 0;
  string line;
  while (std::getline(config, line)) {
    string entry = Trim(line);
    if (entry.empty() || entry[0] == '#') continue;

    size_t eq = entry.find('=');
    if (eq == string::npos) {
      std::cerr << "Error: bad configuration line: " << line << "\n";
      errors++;
      continue;
    }
    string name = Trim(entry.substr(0, eq));
    string value = Trim(entry.substr(eq + 1));

    Flag *flag = Flag::Find(name.c_str());
    if (flag == nullptr) {
      std::cerr << "Error: unknown configuration option " << name << "\n";
      errors++;
    } else if (!flag->Set(value.c_str())) {
      std::cerr << "Error: illegal value for option " << name << "\n";
      errors++;
    }
  }
  return errors;
}

int Flag::ParseCommandLineFlags(int *argc, char **argv) {
  int rc = 0;
  for (int i = 1; i < *argc;) {
    int first = i;
    char *arg = argv[i++];

    const char *name;
    const char *value;
    if (!SplitArgument(arg, &name, &value)) continue;
    if (name == nullptr) break;

    // Look up flag, allowing a "no" prefix for negated boolean flags.
    bool neg = false;
    Flag *flag = Find(name);
    if (flag == nullptr && strncmp(name, "no", 2) == 0) {
      flag = Find(name + 2);
      neg = flag != nullptr && flag->type == BOOL;
      if (!neg) flag = nullptr;
    }
    if (flag == nullptr) {
      std::cerr << "Error: unrecognized flag " << arg << "\n"
                << "Try --help for options\n";
      rc = first;
      break;
    }

    // Non-boolean flags take the value from the next argument if needed.
    if (value == nullptr && flag->type != BOOL) {
      if (i < *argc) value = argv[i++];
      if (value == nullptr) {
        std::cerr << "Error: missing value for flag " << arg << " of type "
                  << flagtype[flag->type] << "\n";
        rc = first;
        break;
      }
    }

    if (!flag->Set(value, neg)) {
      std::cerr << "Error: illegal value for flag " << arg << " of type "
                << flagtype[flag->type] << "\nTry --help for options\n";
      rc = first;
      break;
    }

    // Remove flag from argument list.
    while (first < i) argv[first++] = nullptr;
  }

  // Compact remaining arguments.
  int j = 1;
  for (int i = 1; i < *argc; i++) {
    if (argv[i] != nullptr) argv[j++] = argv[i];
  }
  *argc = j;

  if (!FLAGS_config.empty() && ParseConfigFile(FLAGS_config) != 0) rc = -1;

  if (FLAGS_help) {
    PrintHelp();
    exit(0);
  }

  return rc;
}

bool Flag::Set(const char *str, bool neg) {
  if (type == BOOL) {
    bool bval = !neg;
    if (!neg && str != nullptr) {
      if (strcasecmp(str, "true") == 0 || strcasecmp(str, "yes") == 0 ||
          strcmp(str, "1") == 0) {
        bval = true;
      } else if (strcasecmp(str, "false") == 0 || strcasecmp(str, "no") == 0 ||
                 strcmp(str, "0") == 0) {
        bval = false;
      } else {
        return false;
      }
    }
    value<bool>() = bval;
    return true;
  }

  char *endptr = nullptr;
  switch (type) {
    case INT32:
      value<int32>() = strtol(str, &endptr, 10);
      break;
    case UINT32:
      value<uint32>() = strtoul(str, &endptr, 10);
      break;
    case INT64:
      value<int64>() = strtoll(str, &endptr, 10);
      break;
    case UINT64:
      value<uint64>() = strtoull(str, &endptr, 10);
      break;
    case DOUBLE:
      value<double>() = strtod(str, &endptr);
      break;
    case STRING:
      value<string>() = str;
      break;
    case BOOL:
      break;
  }
  return endptr == nullptr || (endptr != str && *endptr == '\0');
}

std::ostream &operator<<(std::ostream &os, const Flag &flag) {
  switch (flag.type) {
    case Flag::BOOL: return os << (flag.value<bool>() ? "true" : "false");
    case Flag::INT32: return os << flag.value<int32>();
    case Flag::UINT32: return os << flag.value<uint32>();
    case Flag::INT64: return os << flag.value<int64>();
    case Flag::UINT64: return os << flag.value<uint64>();
    case Flag::DOUBLE: return os << flag.value<double>();
    case Flag::STRING: return os << flag.value<string>();
  }
  return os;
}

void Flag::PrintHelp() {
  if (!usage_message.empty()) std::cout << usage_message << "\n";
  if (head == nullptr) return;
  std::cout << "Options:\n";
  for (Flag *f = head; f != nullptr; f = f->next) {
    std::cout << "  --" << f->name << " (" << f->help << ")\n"
              << "        type: " << flagtype[f->type] << "  default: " << *f
              << "\n";
  }
}

}  // namespace bulkload
