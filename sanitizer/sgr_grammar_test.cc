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

#include "absl/strings/match.h"
#include "common/status_test_macros.h"
#include "gtest/gtest.h"

namespace stprint {
namespace {

class SgrGrammarTest : public ::testing::Test {
 protected:
  // Builds a grammar for |config| and asserts success.
  std::unique_ptr<SgrGrammar> Build(const SanitizerConfig& config) {
    absl::StatusOr<std::unique_ptr<SgrGrammar>> grammar =
        SgrGrammar::Create(config);
    EXPECT_OK(grammar);
    return grammar.ok() ? std::move(*grammar) : nullptr;
  }

  std::unique_ptr<SgrGrammar> BuildExcluding(
      std::vector<std::string> exclude_colors) {
    SanitizerConfig config;
    config.exclude_colors = std::move(exclude_colors);
    return Build(config);
  }
};

TEST_F(SgrGrammarTest, FailsIfColorsDisabled) {
  SanitizerConfig config;
  config.colors = false;
  EXPECT_ERROR(FailedPrecondition, SgrGrammar::Create(config));
}

TEST_F(SgrGrammarTest, MatchesImplicitReset) {
  auto grammar = Build(SanitizerConfig());
  ASSERT_TRUE(grammar);
  EXPECT_EQ(grammar->MatchLength("m"), 1);
  EXPECT_EQ(grammar->MatchLength(";m"), 2);
  EXPECT_EQ(grammar->MatchLength(";;;m"), 4);
}

TEST_F(SgrGrammarTest, MatchesBasicParameters) {
  auto grammar = Build(SanitizerConfig());
  ASSERT_TRUE(grammar);
  for (const char* param :
       {"0",  "1",  "9",  "21", "25", "27", "29", "30",  "37",  "39",
        "40", "47", "49", "90", "97", "100", "107"}) {
    std::string body = std::string(param) + "m";
    EXPECT_EQ(grammar->MatchLength(body), body.size()) << body;
  }
}

TEST_F(SgrGrammarTest, RejectsUnknownParameters) {
  auto grammar = Build(SanitizerConfig());
  ASSERT_TRUE(grammar);
  for (const char* body : {"20m", "26m", "38m", "48m", "50m", "89m", "98m",
                           "108m", "200m", "0000m"}) {
    EXPECT_EQ(grammar->MatchLength(body), 0) << body;
  }
}

TEST_F(SgrGrammarTest, MatchesSemicolonSeparatedParameters) {
  auto grammar = Build(SanitizerConfig());
  ASSERT_TRUE(grammar);
  EXPECT_EQ(grammar->MatchLength("1;31m"), 5);
  EXPECT_EQ(grammar->MatchLength(";1;31m"), 6);
  EXPECT_EQ(grammar->MatchLength("1;;31m"), 6);
  EXPECT_EQ(grammar->MatchLength(";;1;;;4;31;42m"), 14);
}

TEST_F(SgrGrammarTest, RejectsTrailingSemicolonAfterBasicParameter) {
  auto grammar = Build(SanitizerConfig());
  ASSERT_TRUE(grammar);
  EXPECT_EQ(grammar->MatchLength("31;m"), 0);
}

TEST_F(SgrGrammarTest, MatchesOnlyPrefix) {
  auto grammar = Build(SanitizerConfig());
  ASSERT_TRUE(grammar);
  EXPECT_EQ(grammar->MatchLength("31mred text"), 3);
  EXPECT_EQ(grammar->MatchLength("mm"), 1);
}

TEST_F(SgrGrammarTest, RejectsOtherControlSequences) {
  auto grammar = Build(SanitizerConfig());
  ASSERT_TRUE(grammar);
  EXPECT_EQ(grammar->MatchLength(""), 0);
  EXPECT_EQ(grammar->MatchLength("31"), 0);
  EXPECT_EQ(grammar->MatchLength("2J"), 0);
  EXPECT_EQ(grammar->MatchLength("H"), 0);
  EXPECT_EQ(grammar->MatchLength("?25l"), 0);
  EXPECT_EQ(grammar->MatchLength("6n"), 0);
  EXPECT_EQ(grammar->MatchLength("1;31 m"), 0);
}

TEST_F(SgrGrammarTest, Matches8BitColors) {
  auto grammar = Build(SanitizerConfig());
  ASSERT_TRUE(grammar);
  EXPECT_EQ(grammar->MatchLength("38;5;1m"), 7);
  EXPECT_EQ(grammar->MatchLength("48;5;255m"), 9);
  EXPECT_EQ(grammar->MatchLength("38;5;012m"), 9);
  EXPECT_EQ(grammar->MatchLength("1;38;5;1;4m"), 11);
  EXPECT_EQ(grammar->MatchLength("1;;38;5;1;;4m"), 13);
  EXPECT_EQ(grammar->MatchLength("38;5;1;m"), 8);
  EXPECT_EQ(grammar->MatchLength("38;5;256m"), 0);
  EXPECT_EQ(grammar->MatchLength("38;5;1000m"), 0);
  EXPECT_EQ(grammar->MatchLength("58;5;1m"), 0);
  EXPECT_EQ(grammar->MatchLength("38;5m"), 0);
}

TEST_F(SgrGrammarTest, Matches24BitColors) {
  auto grammar = Build(SanitizerConfig());
  ASSERT_TRUE(grammar);
  EXPECT_EQ(grammar->MatchLength("38;2;255;0;0m"), 13);
  EXPECT_EQ(grammar->MatchLength("1;48;2;0;128;255;4m"), 19);
  EXPECT_EQ(grammar->MatchLength("38;2;255;0m"), 0);
  EXPECT_EQ(grammar->MatchLength("38;2;256;0;0m"), 0);
}

TEST_F(SgrGrammarTest, RejectsMultipleExtraColorSelectors) {
  auto grammar = Build(SanitizerConfig());
  ASSERT_TRUE(grammar);
  EXPECT_EQ(grammar->MatchLength("38;5;1;48;5;2m"), 0);
}

TEST_F(SgrGrammarTest, RejectsExtraColorsIfDisabled) {
  SanitizerConfig config;
  config.extra_colors = false;
  auto grammar = Build(config);
  ASSERT_TRUE(grammar);
  EXPECT_EQ(grammar->MatchLength("31m"), 3);
  EXPECT_EQ(grammar->MatchLength("38;5;1m"), 0);
  EXPECT_EQ(grammar->MatchLength("38;2;255;0;0m"), 0);
  EXPECT_FALSE(absl::StrContains(grammar->pattern(), "8;5;"));
}

TEST_F(SgrGrammarTest, RejectsExcludedColors) {
  auto grammar = BuildExcluding({"30", "37"});
  ASSERT_TRUE(grammar);
  EXPECT_EQ(grammar->MatchLength("30m"), 0);
  EXPECT_EQ(grammar->MatchLength("31m"), 3);
  EXPECT_EQ(grammar->MatchLength("32m"), 3);
  EXPECT_EQ(grammar->MatchLength("37m"), 0);
}

TEST_F(SgrGrammarTest, ExcludedColorRejectsWholeSequence) {
  auto grammar = BuildExcluding({"30"});
  ASSERT_TRUE(grammar);
  EXPECT_EQ(grammar->MatchLength("1;30m"), 0);
  EXPECT_EQ(grammar->MatchLength("30;1m"), 0);
  EXPECT_EQ(grammar->MatchLength("38;5;1;30m"), 0);
  EXPECT_EQ(grammar->MatchLength("1;31m"), 5);
}

TEST_F(SgrGrammarTest, ExcludedColorsArePrefixes) {
  auto grammar = BuildExcluding({"1"});
  ASSERT_TRUE(grammar);
  EXPECT_EQ(grammar->MatchLength("1m"), 0);
  EXPECT_EQ(grammar->MatchLength("100m"), 0);
  EXPECT_EQ(grammar->MatchLength("31m"), 3);
}

TEST_F(SgrGrammarTest, ExcludesExtraColors) {
  auto grammar = BuildExcluding({"38;5;1"});
  ASSERT_TRUE(grammar);
  EXPECT_EQ(grammar->MatchLength("38;5;1m"), 0);
  EXPECT_EQ(grammar->MatchLength("38;5;12m"), 0);
  EXPECT_EQ(grammar->MatchLength("1;38;5;1m"), 0);
  EXPECT_EQ(grammar->MatchLength("38;5;2m"), 7);
  EXPECT_EQ(grammar->MatchLength("48;5;1m"), 7);
}

TEST_F(SgrGrammarTest, DoesNotCheckParametersInsideExtraColorSelector) {
  auto grammar = BuildExcluding({"1", "5"});
  ASSERT_TRUE(grammar);
  EXPECT_EQ(grammar->MatchLength("38;5;1m"), 7);
  EXPECT_EQ(grammar->MatchLength("38;2;1;5;1m"), 11);
  EXPECT_EQ(grammar->MatchLength("38;5;1;1m"), 0);
}

TEST_F(SgrGrammarTest, TreatsExcludedColorsAsLiterals) {
  auto grammar = BuildExcluding({"3.", "(", "[0-9]*", "\\"});
  ASSERT_TRUE(grammar);
  EXPECT_EQ(grammar->MatchLength("31m"), 3);
  EXPECT_EQ(grammar->MatchLength("38;5;1m"), 7);
}

TEST_F(SgrGrammarTest, EmptyExcludedColorRejectsAllParameters) {
  auto grammar = BuildExcluding({""});
  ASSERT_TRUE(grammar);
  EXPECT_EQ(grammar->MatchLength("m"), 1);
  EXPECT_EQ(grammar->MatchLength(";;m"), 3);
  EXPECT_EQ(grammar->MatchLength("31m"), 0);
  EXPECT_EQ(grammar->MatchLength("38;5;1m"), 0);
}

TEST_F(SgrGrammarTest, HandlesLongBodies) {
  auto grammar = Build(SanitizerConfig());
  ASSERT_TRUE(grammar);
  std::string body(1 << 16, ';');
  EXPECT_EQ(grammar->MatchLength(body), 0);
  body.push_back('m');
  EXPECT_EQ(grammar->MatchLength(body), body.size());
}

}  // namespace
}  // namespace stprint
