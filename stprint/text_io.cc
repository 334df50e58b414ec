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

#include "stprint/text_io.h"

#include <cerrno>

#ifdef _WIN32
#include <fcntl.h>
#include <io.h>
#endif

#include "absl/strings/str_join.h"
#include "common/log.h"
#include "common/status_macros.h"

namespace stprint {
namespace {

constexpr size_t kReadChunkSize = 64 << 10;

// Text mode on Windows converts line endings and stops reading at ^Z.
absl::Status SetBinaryMode(FILE* file) {
#ifdef _WIN32
  if (_setmode(_fileno(file), _O_BINARY) == -1) {
    return absl::ErrnoToStatus(errno, "_setmode() failed");
  }
#else
  (void)file;
#endif
  return absl::OkStatus();
}

}  // namespace

absl::StatusOr<std::string> ReadAll(FILE* file) {
  RETURN_IF_ERROR(SetBinaryMode(file));
  std::string data;
  char buffer[kReadChunkSize];
  for (;;) {
    size_t bytes_read = fread(buffer, 1, sizeof(buffer), file);
    data.append(buffer, bytes_read);
    if (bytes_read < sizeof(buffer)) break;
  }

  if (ferror(file)) {
    return absl::ErrnoToStatus(errno, "fread() failed");
  }
  LOG_DEBUG("Read %u bytes", data.size());
  return data;
}

absl::Status WriteAll(FILE* file, absl::string_view data) {
  RETURN_IF_ERROR(SetBinaryMode(file));
  if (fwrite(data.data(), 1, data.size(), file) != data.size()) {
    return absl::ErrnoToStatus(errno, "fwrite() failed");
  }
  if (fflush(file) != 0) {
    return absl::ErrnoToStatus(errno, "fflush() failed");
  }
  return absl::OkStatus();
}

std::string JoinArguments(const std::vector<std::string>& args) {
  return absl::StrJoin(args, "\n");
}

}  // namespace stprint
