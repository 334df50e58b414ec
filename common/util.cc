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

#include "common/util.h"

#include <cstdint>

namespace stprint {

// static
int Util::Utf8CodePointLen(absl::string_view str) {
  // UTF-8 code points are encoded as follows:
  // 1-byte: 0xxxxxxx
  // 2-byte: 110xxxxx 10xxxxxx
  // 3-byte: 1110xxxx 10xxxxxx 10xxxxxx
  // 4-byte: 11110xxx 10xxxxxx 10xxxxxx 10xxxxxx
  if (str.empty()) return 0;

  const uint8_t* ustr = reinterpret_cast<const uint8_t*>(str.data());
  const size_t size = str.size();
  auto is10 = [ustr, size](size_t index) {
    return index < size && (ustr[index] & 0xC0) == 0x80;
  };

  if ((ustr[0] & 0x80) == 0x00) return 1;
  if ((ustr[0] & 0xE0) == 0xC0) return is10(1) ? 2 : 0;
  if ((ustr[0] & 0xF0) == 0xE0) return is10(1) && is10(2) ? 3 : 0;
  if ((ustr[0] & 0xF8) == 0xF0) return is10(1) && is10(2) && is10(3) ? 4 : 0;
  return 0;
}

}  // namespace stprint
