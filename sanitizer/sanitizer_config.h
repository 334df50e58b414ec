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

#ifndef SANITIZER_SANITIZER_CONFIG_H_
#define SANITIZER_SANITIZER_CONFIG_H_

#include <string>
#include <vector>

namespace stprint {

// Determines which SGR (color and formatting) escape sequences survive
// sanitization. Everything else is always redacted.
struct SanitizerConfig {
  // Allow SGR sequences at all. If false, every ESC is redacted.
  bool colors = true;

  // Allow 8-bit (38;5;n) and 24-bit (38;2;r;g;b) colors in addition to the
  // basic 4-bit ones. Has no effect if |colors| is false.
  bool extra_colors = true;

  // Literal SGR parameter tokens such as "30" or "38;5;1". A sequence that has
  // a parameter starting with one of these is redacted as a whole.
  std::vector<std::string> exclude_colors;
};

}  // namespace stprint

#endif  // SANITIZER_SANITIZER_CONFIG_H_
