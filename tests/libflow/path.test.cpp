#include "libflow/path.hpp" // libflow::parse libflow::to_string
#include <gtest/gtest.h>    // EXPECT_* TEST_F testing::Test
#include <string_view>      // std::string_view
#include <variant>          // std::get std::holds_alternative

class PathTest : public testing::Test {
protected:
  void expect_to_string(std::string_view path, std::string_view want) {
    // `parse` convenience function.
    EXPECT_EQ(libflow::to_string(libflow::parse(path)), want);

    // `Parser.parse()`.
    libflow::Parser parser{};
    EXPECT_EQ(libflow::to_string(parser.parse(path)), want);
  }
};

TEST_F(PathTest, SingleKey) { expect_to_string("user", "user"); }
TEST_F(PathTest, DottedKeys) { expect_to_string("user.name", "user.name"); }
TEST_F(PathTest, Index) { expect_to_string("items[0]", "items[0]"); }
TEST_F(PathTest, Wildcard) { expect_to_string("items[*]", "items[*]"); }

TEST_F(PathTest, NestedWildcards) {
  expect_to_string(
      "org.teams[*].members[0].name", "org.teams[*].members[0].name");
}

TEST_F(PathTest, LargeIndex) {
  expect_to_string("items[1234567]", "items[1234567]");
}

TEST_F(PathTest, KeysMayContainSpacesAndSymbols) {
  expect_to_string("first name.$ref", "first name.$ref");
}

TEST_F(PathTest, StepsHaveKeysAndIndices) {
  auto steps{libflow::parse("a.b[2].c[*]")};
  ASSERT_EQ(steps.size(), 3);

  EXPECT_EQ(steps[0].key, "a");
  EXPECT_FALSE(steps[0].has_index());

  EXPECT_EQ(steps[1].key, "b");
  EXPECT_TRUE(steps[1].has_index());
  EXPECT_FALSE(steps[1].is_wildcard());
  EXPECT_EQ(std::get<std::size_t>(steps[1].index), 2);

  EXPECT_EQ(steps[2].key, "c");
  EXPECT_TRUE(steps[2].is_wildcard());
}

TEST_F(PathTest, HasWildcard) {
  EXPECT_TRUE(libflow::has_wildcard(libflow::parse("a[*].b")));
  EXPECT_FALSE(libflow::has_wildcard(libflow::parse("a[0].b")));
}

TEST_F(PathTest, StepEquality) {
  EXPECT_EQ(libflow::parse("a[1]"), libflow::parse("a[1]"));
  EXPECT_NE(libflow::parse("a[1]"), libflow::parse("a[2]"));
  EXPECT_NE(libflow::parse("a[*]"), libflow::parse("a"));
}
