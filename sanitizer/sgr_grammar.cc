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

#include "sanitizer/sgr_grammar.h"

#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "common/log.h"
#include "common/status.h"
#include "re2/re2.h"

namespace stprint {
namespace {

// Basic SGR parameters: attributes 0-9, 21-25 and 27-29, foreground 30-37 and
// 39, background 40-47 and 49, bright foreground 90-97 and bright background
// 100-107.
constexpr char kBasicParam[] =
    "(?:[0-9]|2[1-5]|2[7-9]|3[0-7]|39|4[0-7]|49|9[0-7]|10[0-7])";

// An integer 0..255, optionally zero-padded.
constexpr char kColorIndex[] = "(?:[01]?[0-9]?[0-9]|2[0-4][0-9]|25[0-5])";

enum class Feature {
  kColors,       // Requires SanitizerConfig::colors.
  kExtraColors,  // Requires SanitizerConfig::colors and ::extra_colors.
};

// One way to spell an acceptable SGR body.
struct Alternative {
  const char* name;
  Feature feature;
  // Pattern of the extended color selector, e.g. "38;5;n". Null for the
  // plain list of basic parameters.
  const char* selector;
};

constexpr Alternative kAlternatives[] = {
    {"4-bit", Feature::kColors, nullptr},
    {"8-bit", Feature::kExtraColors, "[34]8;5;{n}"},
    {"24-bit", Feature::kExtraColors, "[34]8;2;{n};{n};{n}"},
};

bool IsEnabled(Feature feature, const SanitizerConfig& config) {
  switch (feature) {
    case Feature::kColors:
      return config.colors;
    case Feature::kExtraColors:
      return config.colors && config.extra_colors;
  }
  return false;
}

std::string AlternativePattern(const Alternative& alt) {
  const std::string param = kBasicParam;
  if (!alt.selector) {
    return absl::StrCat(";*(?:", param, "(?:;+", param, ")*)?m");
  }

  std::string selector = alt.selector;
  for (size_t pos = selector.find("{n}"); pos != std::string::npos;
       pos = selector.find("{n}", pos)) {
    selector.replace(pos, 3, kColorIndex);
    pos += sizeof(kColorIndex) - 1;
  }

  // The selector is captured so that parameters inside it can be skipped by
  // the excluded color check.
  return absl::StrCat(";*(?:", param, ";+)*(", selector, ")(?:;+", param,
                      ")*;*m");
}

// Composes all alternatives enabled by |config| into one pattern. Each
// extended color alternative contributes exactly one capturing group.
std::string BuildPattern(const SanitizerConfig& config) {
  std::vector<std::string> parts;
  for (const Alternative& alt : kAlternatives) {
    if (!IsEnabled(alt.feature, config)) continue;
    LOG_VERBOSE("Adding %s SGR alternative", alt.name);
    parts.push_back(absl::StrCat("(?:", AlternativePattern(alt), ")"));
  }
  return absl::StrJoin(parts, "|");
}

}  // namespace

// static
absl::StatusOr<std::unique_ptr<SgrGrammar>> SgrGrammar::Create(
    const SanitizerConfig& config) {
  if (!config.colors) {
    return absl::FailedPreconditionError(
        "SGR grammar requested, but colors are disabled");
  }

  re2::RE2::Options options;
  options.set_log_errors(false);
  std::string pattern = BuildPattern(config);
  auto regex = std::make_unique<re2::RE2>(pattern, options);
  if (!regex->ok()) {
    return MakeStatus("Failed to compile SGR pattern '%s': %s", pattern,
                      regex->error());
  }

  if (!config.exclude_colors.empty()) {
    LOG_DEBUG("Excluded colors: %s",
              absl::StrJoin(config.exclude_colors, ", "));
  }
  LOG_DEBUG("SGR pattern: %s", pattern);
  return std::unique_ptr<SgrGrammar>(
      new SgrGrammar(std::move(regex), config.exclude_colors));
}

SgrGrammar::SgrGrammar(std::unique_ptr<re2::RE2> regex,
                       std::vector<std::string> exclude_colors)
    : regex_(std::move(regex)), exclude_colors_(std::move(exclude_colors)) {}

SgrGrammar::~SgrGrammar() = default;

const std::string& SgrGrammar::pattern() const { return regex_->pattern(); }

size_t SgrGrammar::MatchLength(absl::string_view text) const {
  // Group 0 is the whole match, the rest are the extra color selectors. The
  // selectors are only needed to check excluded colors, and RE2 is faster if
  // it does not have to extract them.
  const int num_groups =
      exclude_colors_.empty() ? 1 : regex_->NumberOfCapturingGroups() + 1;
  std::vector<re2::StringPiece> groups(num_groups);
  const re2::StringPiece input(text.data(), text.size());
  if (!regex_->Match(input, 0, input.size(), re2::RE2::ANCHOR_START,
                     groups.data(), num_groups)) {
    return 0;
  }

  const size_t length = groups[0].size();
  if (exclude_colors_.empty()) return length;

  size_t selector_begin = 0;
  size_t selector_end = 0;
  for (int n = 1; n < num_groups; ++n) {
    if (groups[n].data() == nullptr) continue;
    selector_begin = groups[n].data() - input.data();
    selector_end = selector_begin + groups[n].size();
    break;
  }

  // Strip the terminating 'm'.
  absl::string_view body = text.substr(0, length - 1);
  if (HasExcludedColor(text, body, selector_begin, selector_end)) return 0;
  return length;
}

bool SgrGrammar::HasExcludedColor(absl::string_view text,
                                  absl::string_view body,
                                  size_t selector_begin,
                                  size_t selector_end) const {
  for (size_t pos = 0; pos < body.size(); ++pos) {
    // Parameters start with a digit at the beginning or after a semicolon.
    if (!absl::ascii_isdigit(body[pos])) continue;
    if (pos > 0 && body[pos - 1] != ';') continue;
    if (pos > selector_begin && pos < selector_end) continue;

    absl::string_view rest = text.substr(pos);
    for (const std::string& excluded : exclude_colors_) {
      if (absl::StartsWith(rest, excluded)) {
        LOG_VERBOSE("Rejecting SGR body '%s', excluded color '%s' at %u",
                    body, excluded, pos);
        return true;
      }
    }
  }
  return false;
}

}  // namespace stprint
