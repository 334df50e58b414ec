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

#include "sanitizer/sanitizer.h"

#include <cstdint>
#include <utility>

#include "common/log.h"
#include "common/status_macros.h"
#include "common/util.h"

namespace stprint {
namespace {

enum class Action {
  kPassThrough,     // Copy the character.
  kEscapeSequence,  // ESC [, try to match an SGR body.
  kRedact,          // Replace the code point by kRedactionMark.
};

constexpr uint8_t kTab = 0x09;
constexpr uint8_t kNewline = 0x0A;
constexpr uint8_t kESC = 0x1B;  // ANSI escape character.

Action Classify(absl::string_view text, size_t n, bool colors) {
  const uint8_t ch = static_cast<uint8_t>(text[n]);
  if ((ch >= 0x20 && ch <= 0x7E) || ch == kTab || ch == kNewline) {
    return Action::kPassThrough;
  }
  if (colors && ch == kESC && n + 1 < text.size() && text[n + 1] == '[') {
    return Action::kEscapeSequence;
  }
  return Action::kRedact;
}

}  // namespace

// static
absl::StatusOr<std::unique_ptr<Sanitizer>> Sanitizer::Create(
    SanitizerConfig config) {
  std::unique_ptr<SgrGrammar> grammar;
  if (config.colors) {
    ASSIGN_OR_RETURN(grammar, SgrGrammar::Create(config),
                     "Failed to build SGR grammar");
  }
  LOG_DEBUG("Sanitizer created: colors=%s, extra_colors=%s, %u excluded",
            config.colors ? "on" : "off", config.extra_colors ? "on" : "off",
            config.exclude_colors.size());
  return std::unique_ptr<Sanitizer>(
      new Sanitizer(std::move(config), std::move(grammar)));
}

Sanitizer::Sanitizer(SanitizerConfig config,
                     std::unique_ptr<SgrGrammar> grammar)
    : config_(std::move(config)), grammar_(std::move(grammar)) {}

Sanitizer::~Sanitizer() = default;

std::string Sanitizer::Sanitize(absl::string_view text) const {
  std::string result;
  result.reserve(text.size());

  size_t n = 0;
  while (n < text.size()) {
    switch (Classify(text, n, grammar_ != nullptr)) {
      case Action::kPassThrough:
        result.push_back(text[n]);
        ++n;
        continue;

      case Action::kEscapeSequence: {
        // On failure, only the ESC is redacted. The '[' and the rest of the
        // sequence are classified on their own.
        size_t body_len = grammar_->MatchLength(text.substr(n + 2));
        if (body_len > 0) {
          result.append(text.data() + n, body_len + 2);
          n += body_len + 2;
          continue;
        }
        break;
      }

      case Action::kRedact:
        break;
    }

    // Redact the whole code point, or a single byte if it is not valid UTF-8.
    int len = Util::Utf8CodePointLen(text.substr(n));
    result.push_back(kRedactionMark);
    n += len > 0 ? static_cast<size_t>(len) : 1;
  }

  return result;
}

absl::StatusOr<std::string> Sanitize(absl::string_view text,
                                     const SanitizerConfig& config) {
  std::unique_ptr<Sanitizer> sanitizer;
  ASSIGN_OR_RETURN(sanitizer, Sanitizer::Create(config));
  return sanitizer->Sanitize(text);
}

}  // namespace stprint
