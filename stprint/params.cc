// Copyright 2023 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "stprint/params.h"

#include <cstring>
#include <iostream>

#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"

namespace stprint {
namespace params {
namespace {

template <typename... Args>
void PrintError(const absl::FormatSpec<Args...>& format, Args... args) {
  std::cerr << "Error: " << absl::StrFormat(format, args...) << std::endl;
}

// Warnings go to stderr as well. stdout only receives sanitized text.
template <typename... Args>
void PrintWarning(const absl::FormatSpec<Args...>& format, Args... args) {
  std::cerr << "Warning: " << absl::StrFormat(format, args...) << std::endl;
}

enum class OptionResult { kConsumedKey, kConsumedKeyValue, kError };

const char kHelpText[] =
    R"(Print untrusted text safely to a terminal

Copies printable ASCII, tabs, newlines and SGR color sequences to stdout and
replaces every other character by '_'. This blocks escape sequences that move
the cursor, clear the screen, change the window title or query the terminal.

Usage:
  stprint [options] [--] [text]...

Parameters:
  text                    Untrusted text to print. Multiple texts are joined
                          by newlines. If none is given, reads from stdin.
                          All arguments after the first text are treated as
                          text, even if they start with '-'.

Options:
    --no-colors           Redact all SGR sequences, including colors
    --no-extra-colors     Redact 8-bit and 24-bit colors, keep 4-bit colors
    --exclude-color code  Redact SGR sequences containing the parameter code,
                          e.g. 30 or 38;5;1. May be given multiple times.
    --exclude-colors list Comma-separated list of codes to redact
-v, --verbose             Increase log verbosity (logs go to stderr)
    --log-file path       Write logs to path instead of stderr
-h  --help                Help for stprint
)";

void AddExcludedColors(const char* value, Parameters* params) {
  for (absl::string_view code : absl::StrSplit(value, ',', absl::SkipEmpty())) {
    params->config.exclude_colors.push_back(std::string(code));
  }
}

OptionResult HandleParameter(const std::string& key, const char* value,
                             Parameters* params, bool* help) {
  if (key == "no-colors") {
    params->config.colors = false;
    return OptionResult::kConsumedKey;
  }

  if (key == "no-extra-colors") {
    params->config.extra_colors = false;
    return OptionResult::kConsumedKey;
  }

  if (key == "exclude-color") {
    if (value) {
      params->config.exclude_colors.emplace_back(value);
    }
    return OptionResult::kConsumedKeyValue;
  }

  if (key == "exclude-colors") {
    if (value) {
      AddExcludedColors(value, params);
    }
    return OptionResult::kConsumedKeyValue;
  }

  if (key == "v" || key == "verbose") {
    params->verbosity++;
    return OptionResult::kConsumedKey;
  }

  if (key == "log-file") {
    if (value) {
      params->log_file = value;
    }
    return OptionResult::kConsumedKeyValue;
  }

  if (key == "h" || key == "help") {
    *help = true;
    return OptionResult::kConsumedKey;
  }

  PrintError("Unknown option: '%s'", key);
  return OptionResult::kError;
}

bool ValidateParameters(const Parameters& params, bool help) {
  if (help) {
    std::cout << kHelpText;
    return false;
  }

  if (!params.config.colors && !params.config.exclude_colors.empty()) {
    PrintWarning("Excluded colors '%s' have no effect with --no-colors",
                 absl::StrJoin(params.config.exclude_colors, ","));
  }

  return true;
}

bool CheckOptionResult(OptionResult result, const std::string& name,
                       const char* value) {
  switch (result) {
    case OptionResult::kConsumedKey:
      return true;

    case OptionResult::kConsumedKeyValue:
      if (!value) {
        PrintError("Option '%s' needs a value", name);
        return false;
      }
      return true;

    case OptionResult::kError:
      // Error message was already printed.
      return false;
  }

  return true;
}

}  // namespace

const char* HelpText() { return kHelpText; }

// Note that abseil has a flags library, but the C++ version doesn't support
// short names ("-v") and would try to interpret untrusted text that looks like
// a flag.
bool Parse(int argc, const char* const* argv, Parameters* parameters) {
  bool help = false;
  int index = 1;
  for (; index < argc; ++index) {
    // '--' ends the options, everything after it is text.
    if (strcmp(argv[index], "--") == 0) {
      ++index;
      break;
    }

    // Handle '--key [value]' and '--key=value' options.
    bool equality_used = false;
    if (strncmp(argv[index], "--", 2) == 0) {
      std::string key(argv[index] + 2);
      const char* value = nullptr;
      size_t equality_pos = key.find("=");
      if (equality_pos != std::string::npos) {
        if (equality_pos + 1 < key.size()) {
          value = argv[index] + 2 + equality_pos + 1;
        }
        key = key.substr(0, equality_pos);
        equality_used = true;
      } else {
        value = index + 1 < argc && argv[index + 1][0] != '-' ? argv[index + 1]
                                                              : nullptr;
      }
      // An empty value is treated like a missing one. An empty color code
      // would match every parameter.
      if (value && value[0] == 0) value = nullptr;
      OptionResult result = HandleParameter(key, value, parameters, &help);
      if (!CheckOptionResult(result, key, value)) {
        return false;
      }
      if (equality_used && result == OptionResult::kConsumedKey) {
        PrintError("Option '%s' doesn't take a value", key);
        return false;
      }
      if (!equality_used && result == OptionResult::kConsumedKeyValue) {
        ++index;
      }
      continue;
    }

    // Handle '-abc' options. A lone '-' is text.
    if (argv[index][0] == '-' && argv[index][1] != 0) {
      char key[] = "x";
      char name[] = "-x";
      for (const char* c = argv[index] + 1; *c != 0; ++c) {
        key[0] = *c;
        name[1] = *c;
        OptionResult result = HandleParameter(key, nullptr, parameters, &help);
        if (result == OptionResult::kConsumedKeyValue) {
          PrintError("Option '%s' can't be combined with a value", name);
          return false;
        }
        if (!CheckOptionResult(result, name, nullptr)) {
          return false;
        }
      }
      continue;
    }

    // The first text ends the options.
    break;
  }

  for (; index < argc; ++index) {
    parameters->texts.push_back(argv[index]);
  }

  return ValidateParameters(*parameters, help);
}

}  // namespace params
}  // namespace stprint
