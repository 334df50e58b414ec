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

#ifndef COMMON_STATUS_H_
#define COMMON_STATUS_H_

#include <string>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"

namespace stprint {

//
// Convenience helper functions for status creation.
//

inline absl::Status MakeStatus(const char* message) {
  return absl::InternalError(message);
}

template <typename... Args>
absl::Status MakeStatus(const absl::FormatSpec<Args...>& format, Args... args) {
  return absl::InternalError(absl::StrFormat(format, args...));
}

// Convenience helper for cases that may or may not have a message to wrap.
inline absl::Status WrapStatus(absl::Status inner_status) {
  return inner_status;
}

// Returns OK if |inner_status| is OK and a copy of |inner_status| with given
// message + |inner_status|'s message otherwise.
template <typename... Args>
absl::Status WrapStatus(absl::Status inner_status,
                        const absl::FormatSpec<Args...>& format, Args... args) {
  if (inner_status.ok()) {
    return inner_status;
  }

  std::string message = absl::StrFormat(format, args...);
  absl::Status wrapped_status(
      inner_status.code(), absl::StrCat(inner_status.message(), "; ", message));
  inner_status.ForEachPayload(
      [&wrapped_status](absl::string_view key, const absl::Cord& value) {
        wrapped_status.SetPayload(key, value);
      });
  return wrapped_status;
}

}  // namespace stprint

#endif  // COMMON_STATUS_H_
