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

#ifndef STPRINT_TEXT_IO_H_
#define STPRINT_TEXT_IO_H_

#include <cstdio>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace stprint {

// Switches |file| to binary mode and reads it until EOF. The data is returned
// as is, including \0 bytes, \r\n line endings and invalid UTF-8.
absl::StatusOr<std::string> ReadAll(FILE* file);

// Writes all of |data| to |file| in binary mode and flushes it.
absl::Status WriteAll(FILE* file, absl::string_view data);

// Joins command line texts with newlines, e.g. {"a", "b"} -> "a\nb".
std::string JoinArguments(const std::vector<std::string>& args);

}  // namespace stprint

#endif  // STPRINT_TEXT_IO_H_
