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

#ifndef SANITIZER_SGR_GRAMMAR_H_
#define SANITIZER_SGR_GRAMMAR_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "sanitizer/sanitizer_config.h"

namespace re2 {
class RE2;
}  // namespace re2

namespace stprint {

// Immutable matcher for the bodies of SGR escape sequences, i.e. the part
// between ESC [ and the terminating m, that a SanitizerConfig allows.
//
// The accepted language is
//    4-bit: ;*(P(;+P)*)?m
//    8-bit: ;*(P;+)*[34]8;5;N(;+P)*;*m
//   24-bit: ;*(P;+)*[34]8;2;N;N;N(;+P)*;*m
// where P is a basic attribute or color code and N is an integer 0..255.
// The 8-bit and 24-bit forms are only accepted if extra colors are enabled.
//
// Matching uses RE2 and runs in linear time. Excluded colors are checked as
// literal prefixes after the match, see MatchLength().
//
// Thread-safe. A grammar can be shared by any number of concurrent scans.
class SgrGrammar {
 public:
  // Builds the grammar for |config|. |config.colors| must be true. Fails if
  // the composed pattern does not compile.
  static absl::StatusOr<std::unique_ptr<SgrGrammar>> Create(
      const SanitizerConfig& config);

  SgrGrammar(const SgrGrammar&) = delete;
  SgrGrammar& operator=(const SgrGrammar&) = delete;

  ~SgrGrammar();

  // Returns the number of bytes of the SGR body including the terminating 'm'
  // at the start of |text|, which should directly follow an ESC [ introducer.
  // Returns 0 if |text| does not start with an acceptable body.
  //
  // A body is not acceptable if the remaining |text| at the start of any of
  // its parameters, or at the start of an extra color selector, begins with an
  // excluded color. In that case the whole sequence is rejected.
  size_t MatchLength(absl::string_view text) const;

  // Returns the composed RE2 pattern.
  const std::string& pattern() const;

 private:
  SgrGrammar(std::unique_ptr<re2::RE2> regex,
             std::vector<std::string> exclude_colors);

  // Returns true if an excluded color starts at a parameter of |body|.
  // |text| is the full text that |body| is a prefix of. Parameters strictly
  // inside [selector_begin, selector_end) belong to an extra color selector
  // and are not checked.
  bool HasExcludedColor(absl::string_view text, absl::string_view body,
                        size_t selector_begin, size_t selector_end) const;

  std::unique_ptr<re2::RE2> regex_;
  const std::vector<std::string> exclude_colors_;
};

}  // namespace stprint

#endif  // SANITIZER_SGR_GRAMMAR_H_
