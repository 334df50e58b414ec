/*
 * Copyright 2023 Google LLC
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef STPRINT_PARAMS_H_
#define STPRINT_PARAMS_H_

#include <string>
#include <vector>

#include "sanitizer/sanitizer_config.h"

namespace stprint {
namespace params {

// All stprint command line parameters.
struct Parameters {
  SanitizerConfig config;
  int verbosity = 0;
  std::string log_file;

  // Untrusted text passed on the command line. If empty, text is read from
  // stdin.
  std::vector<std::string> texts;
};

// Parses options and untrusted text from the command line args.
// Prints a help text if -h/--help was given. Returns false if the program
// should exit, i.e. on errors or if the help text was printed.
bool Parse(int argc, const char* const* argv, Parameters* parameters);

// Returns the help text printed for -h/--help.
const char* HelpText();

}  // namespace params
}  // namespace stprint

#endif  // STPRINT_PARAMS_H_
