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

#include <cstdio>
#include <memory>
#include <string>

#include "absl/status/status.h"
#include "common/log.h"
#include "common/status_macros.h"
#include "sanitizer/sanitizer.h"
#include "stprint/params.h"
#include "stprint/text_io.h"

namespace stprint {
namespace {

enum class ExitCode { kOk = 0, kUsage = 1, kFailure = 2 };

std::unique_ptr<Log> CreateLog(const params::Parameters& parameters) {
  LogLevel level = Log::VerbosityToLogLevel(parameters.verbosity);
  if (parameters.log_file.empty()) {
    return std::make_unique<ConsoleLog>(level);
  }
  auto file_log =
      std::make_unique<FileLog>(level, parameters.log_file.c_str());
  if (file_log->IsOpen()) {
    return file_log;
  }
  fprintf(stderr, "Warning: Logging to stderr instead of '%s'\n",
          parameters.log_file.c_str());
  return std::make_unique<ConsoleLog>(level);
}

absl::Status Run(const params::Parameters& parameters) {
  std::unique_ptr<Sanitizer> sanitizer;
  ASSIGN_OR_RETURN(sanitizer, Sanitizer::Create(parameters.config),
                   "Failed to create sanitizer");

  std::string text;
  if (!parameters.texts.empty()) {
    LOG_INFO("Sanitizing %u command line argument(s)", parameters.texts.size());
    text = JoinArguments(parameters.texts);
  } else {
    LOG_INFO("Sanitizing stdin");
    ASSIGN_OR_RETURN(text, ReadAll(stdin), "Failed to read stdin");
  }

  RETURN_IF_ERROR(WriteAll(stdout, sanitizer->Sanitize(text)),
                  "Failed to write stdout");
  return absl::OkStatus();
}

}  // namespace
}  // namespace stprint

// Usage: stprint [options] [--] [text]...
// Reads stdin if no text is given.
int main(int argc, char* argv[]) {
  stprint::params::Parameters parameters;
  if (!stprint::params::Parse(argc, argv, &parameters)) {
    return static_cast<int>(stprint::ExitCode::kUsage);
  }

  stprint::ScopedLog scoped_log(stprint::CreateLog(parameters));
  absl::Status status = stprint::Run(parameters);
  if (!status.ok()) {
    fprintf(stderr, "Error: %s\n", std::string(status.message()).c_str());
    return static_cast<int>(stprint::ExitCode::kFailure);
  }
  return static_cast<int>(stprint::ExitCode::kOk);
}
