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

#ifndef COMMON_UTIL_H_
#define COMMON_UTIL_H_

#include <string>

#include "absl/strings/string_view.h"

namespace stprint {

// Assorted utilities
class Util {
 public:
  // Returns the number of bytes of the first UTF8 code point in |str|.
  // Returns 0 if |str| is empty, if the code point is not valid or if it is
  // truncated at the end of |str|. Unlike C strings, |str| may contain \0,
  // which counts as a 1-byte code point.
  static int Utf8CodePointLen(absl::string_view str);
};

}  // namespace stprint

#endif  // COMMON_UTIL_H_
