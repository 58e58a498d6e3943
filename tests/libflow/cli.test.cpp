#include "libflow/cli.hpp"        // libflow::parse_args libflow::usage
#include "libflow/exceptions.hpp" // libflow::UsageError
#include <gtest/gtest.h>          // EXPECT_* TEST_F testing::Test
#include <string>                 // std::string
#include <string_view>            // std::string_view
#include <vector>                 // std::vector

class CliTest : public testing::Test {
protected:
  using Strings = std::vector<std::string>;

  void expect_usage_error(const Strings& args, std::string_view message) {
    EXPECT_THROW(libflow::parse_args(args), libflow::UsageError);
    try {
      libflow::parse_args(args);
    } catch (const libflow::UsageError& e) {
      EXPECT_EQ(std::string{e.what()}, message);
    }
  }
};

TEST_F(CliTest, Defaults) {
  auto options{libflow::parse_args({})};
  EXPECT_TRUE(options.pick_paths.empty());
  EXPECT_TRUE(options.input_file.empty());
  EXPECT_TRUE(options.from_format.empty());
  EXPECT_TRUE(options.to_format.empty());
  EXPECT_FALSE(options.compact);
  EXPECT_FALSE(options.verbose);
  EXPECT_FALSE(options.show_help);
}

TEST_F(CliTest, RepeatableFlags) {
  auto options{libflow::parse_args({"-pick", "user.name", "--pick=user.id",
      "-set", "a=1", "-set", "b=x", "-delete", "secret", "-where",
      "status=active"})};
  EXPECT_EQ(options.pick_paths, (Strings{"user.name", "user.id"}));
  EXPECT_EQ(options.set_pairs, (Strings{"a=1", "b=x"}));
  EXPECT_EQ(options.delete_paths, Strings{"secret"});
  EXPECT_EQ(options.where_pairs, Strings{"status=active"});
}

TEST_F(CliTest, StringFlags) {
  auto options{libflow::parse_args({"-in", "data.yaml", "--out=result.json",
      "-from", "yaml", "--to", "json"})};
  EXPECT_EQ(options.input_file, "data.yaml");
  EXPECT_EQ(options.output_file, "result.json");
  EXPECT_EQ(options.from_format, "yaml");
  EXPECT_EQ(options.to_format, "json");
}

TEST_F(CliTest, ValueMayContainEquals) {
  auto options{libflow::parse_args({"-set=config.url=http://x?a=b"})};
  EXPECT_EQ(options.set_pairs, Strings{"config.url=http://x?a=b"});
}

TEST_F(CliTest, ValueMayStartWithDash) {
  auto options{libflow::parse_args({"-set", "-n=1"})};
  EXPECT_EQ(options.set_pairs, Strings{"-n=1"});
}

TEST_F(CliTest, BooleanFlags) {
  auto options{libflow::parse_args(
      {"-compact", "--preserve-hierarchy", "-v", "-version", "-h"})};
  EXPECT_TRUE(options.compact);
  EXPECT_TRUE(options.preserve_hierarchy);
  EXPECT_TRUE(options.verbose);
  EXPECT_TRUE(options.show_version);
  EXPECT_TRUE(options.show_help);
}

TEST_F(CliTest, BooleanValues) {
  EXPECT_TRUE(libflow::parse_args({"-compact=true"}).compact);
  EXPECT_TRUE(libflow::parse_args({"-compact=1"}).compact);
  EXPECT_FALSE(libflow::parse_args({"-compact=false"}).compact);
  EXPECT_FALSE(libflow::parse_args({"--verbose=0"}).verbose);
}

TEST_F(CliTest, BooleanDoesNotConsumeNextArgument) {
  auto options{libflow::parse_args({"-compact", "input.json"})};
  EXPECT_TRUE(options.compact);
  EXPECT_EQ(options.input_file, "input.json");
}

TEST_F(CliTest, PositionalInputFile) {
  auto options{libflow::parse_args({"-pick", "a", "data.json"})};
  EXPECT_EQ(options.input_file, "data.json");
}

TEST_F(CliTest, DoubleDashEndsFlags) {
  auto options{libflow::parse_args({"-compact", "--", "-odd-name.json"})};
  EXPECT_EQ(options.input_file, "-odd-name.json");
}

TEST_F(CliTest, DirectoryMode) {
  auto options{libflow::parse_args({"-dir", "logs", "-from", "json"})};
  EXPECT_EQ(options.input_dir, "logs");
  EXPECT_TRUE(options.input_file.empty());
}

TEST_F(CliTest, UndefinedFlag) {
  expect_usage_error({"-bogus"}, "flag provided but not defined: -bogus");
  expect_usage_error({"--nope=1"}, "flag provided but not defined: -nope");
}

TEST_F(CliTest, MissingValue) {
  expect_usage_error({"-pick"}, "flag needs an argument: -pick");
  expect_usage_error({"-compact", "--in"}, "flag needs an argument: -in");
}

TEST_F(CliTest, InvalidBoolean) {
  expect_usage_error(
      {"-compact=yes"}, "invalid boolean value \"yes\" for flag -compact");
}

TEST_F(CliTest, SecondPositional) {
  expect_usage_error({"a.json", "b.json"}, "unexpected argument \"b.json\"");
}

TEST_F(CliTest, InputGivenTwice) {
  expect_usage_error({"-in", "a.json", "b.json"},
      "input file given both as -in and as an argument");
}

TEST_F(CliTest, DirectoryWithInputFile) {
  expect_usage_error({"-dir", "logs", "-in", "a.json"},
      "-dir can not be combined with an input file");
}

TEST_F(CliTest, Usage) {
  auto text{libflow::usage("flow")};
  EXPECT_EQ(text.rfind("Usage: flow [flags] [input file]\n", 0), 0u);
  EXPECT_NE(text.find("-preserve-hierarchy"), std::string::npos);
  EXPECT_NE(text.find("  flow -in users.json"), std::string::npos);
}
