#include "cli/options.hpp"
#include <gtest/gtest.h>

using dwas::cli::normalize_flag;
using dwas::cli::parse_command_line;
using dwas::cli::split_list;
using dwas::cli::split_shell_words;

using Words = std::vector<std::string>;

TEST(CliOptions, SplitsShellWords) {
  auto words = split_shell_words("  --jobs=4 --except 'lint, docs' \"a b\"c  ");
  ASSERT_TRUE(words);
  EXPECT_EQ(*words, (Words{"--jobs=4", "--except", "lint, docs", "a bc"}));
}

TEST(CliOptions, EmptyQuotesMakeAnEmptyWord) {
  auto words = split_shell_words("a '' b");
  ASSERT_TRUE(words);
  EXPECT_EQ(*words, (Words{"a", "", "b"}));
}

TEST(CliOptions, UnterminatedQuoteIsAnError) {
  auto words = split_shell_words("--only 'lint");
  ASSERT_FALSE(words);
  EXPECT_EQ(words.error().code, dwas::engine::ErrorCode::InvalidConfig);
}

TEST(CliOptions, NormalizesFlagNames) {
  EXPECT_EQ(normalize_flag("--no-setup"), "--no_setup");
  EXPECT_EQ(normalize_flag("--install-command=pip install -q"), "--install_command=pip install -q");
  EXPECT_EQ(normalize_flag("-j"), "-j");
  EXPECT_EQ(normalize_flag("pytest-unit"), "pytest-unit");
}

TEST(CliOptions, AddoptsComeBeforeTheCommandLine) {
  auto line = parse_command_line({"dwas", "--only", "lint"}, "--fail-fast --jobs 2");
  ASSERT_TRUE(line);
  EXPECT_EQ(line->flags, (Words{"dwas", "--fail_fast", "--jobs", "2", "--only", "lint"}));
  EXPECT_TRUE(line->user_args.empty());
}

TEST(CliOptions, DoubleDashStartsUserArgs) {
  auto line = parse_command_line({"dwas", "pytest", "--", "-k", "--no-cov", "--"}, nullptr);
  ASSERT_TRUE(line);
  EXPECT_EQ(line->flags, (Words{"dwas", "pytest"}));
  EXPECT_EQ(line->user_args, (Words{"-k", "--no-cov", "--"}));
}

TEST(CliOptions, AddoptsErrorsArePropagated) {
  auto line = parse_command_line({"dwas"}, "--only \"lint");
  ASSERT_FALSE(line);
  EXPECT_EQ(line.error().message, "DWAS_ADDOPTS: unterminated quote");
}

TEST(CliOptions, SplitsCommaLists) {
  EXPECT_EQ(split_list("lint, pytest[3.8],,docs "), (Words{"lint", "pytest[3.8]", "docs"}));
  EXPECT_TRUE(split_list("").empty());
  EXPECT_EQ(split_list(Words{"a,b", "c"}), (Words{"a", "b", "c"}));
}

TEST(CliOptions, ListingAlwaysExitsZero) {
  using dwas::cli::exit_status;
  using dwas::engine::ErrorCode;
  using dwas::engine::make_error;

  auto cycle = make_error(ErrorCode::CyclicGraph, "Cyclic dependency detected: a --> b --> a");
  auto missing = make_error(ErrorCode::InvalidConfig, "cannot open step file dwasfile.json");
  EXPECT_EQ(exit_status(cycle, true), 0);
  EXPECT_EQ(exit_status(missing, true), 0);
  EXPECT_EQ(exit_status(cycle, false), 2);
  EXPECT_EQ(exit_status(make_error(ErrorCode::Execution, "boom"), false), 1);
}
