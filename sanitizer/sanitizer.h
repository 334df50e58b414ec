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

#ifndef SANITIZER_SANITIZER_H_
#define SANITIZER_SANITIZER_H_

#include <memory>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "sanitizer/sanitizer_config.h"
#include "sanitizer/sgr_grammar.h"

namespace stprint {

// Makes untrusted text safe to print on a terminal.
//
// Printable ASCII, tab and newline are kept. SGR sequences accepted by the
// SgrGrammar of the config are copied verbatim. Every other character, i.e.
// control characters, DEL, non-ASCII code points and any other escape
// sequence, is replaced by a single '_'. Bytes that are not valid UTF-8 are
// replaced one by one.
// Example: "\x1b[2Jvulnerable: True\b\b\b\bFalse"
//          is sanitized to
//          "_[2Jvulnerable: True____False"
//
// Sanitize() is const and may be called concurrently.
class Sanitizer {
 public:
  static constexpr char kRedactionMark = '_';

  // Creates a sanitizer for |config|. Builds the SGR grammar if colors are
  // enabled.
  static absl::StatusOr<std::unique_ptr<Sanitizer>> Create(
      SanitizerConfig config);

  Sanitizer(const Sanitizer&) = delete;
  Sanitizer& operator=(const Sanitizer&) = delete;

  ~Sanitizer();

  // Returns the sanitized |text|. Never fails.
  std::string Sanitize(absl::string_view text) const;

  const SanitizerConfig& config() const { return config_; }

 private:
  Sanitizer(SanitizerConfig config, std::unique_ptr<SgrGrammar> grammar);

  const SanitizerConfig config_;

  // Null if colors are disabled.
  const std::unique_ptr<SgrGrammar> grammar_;
};

// Convenience method that creates a Sanitizer for |config| and sanitizes
// |text|. Prefer reusing a Sanitizer when processing many inputs.
absl::StatusOr<std::string> Sanitize(
    absl::string_view text, const SanitizerConfig& config = SanitizerConfig());

}  // namespace stprint

#endif  // SANITIZER_SANITIZER_H_
