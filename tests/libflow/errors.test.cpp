#include "libflow/exceptions.hpp" // libflow::PathError
#include "libflow/path.hpp"       // libflow::parse
#include <gtest/gtest.h>          // EXPECT_* TEST_F testing::Test
#include <string>                 // std::string
#include <string_view>            // std::string_view

class ErrorTest : public testing::Test {
protected:
  void expect_path_error(std::string_view path, libflow::PathErrorKind kind,
      std::string_view message) {
    EXPECT_THROW(libflow::parse(path), libflow::PathError);
    try {
      libflow::parse(path);
    } catch (const libflow::PathError& e) {
      EXPECT_EQ(e.kind(), kind);
      EXPECT_EQ(std::string{e.what()}, message);
    }
  }
};

TEST_F(ErrorTest, EmptyPath) {
  expect_path_error("", libflow::PathErrorKind::empty_path, "empty path ('':0)");
}

TEST_F(ErrorTest, LeadingBracket) {
  expect_path_error("[0]", libflow::PathErrorKind::invalid_segment,
      "invalid segment \"[0]\" ('[0]':0)");
}

TEST_F(ErrorTest, MissingClosingBracket) {
  expect_path_error("a.items[0", libflow::PathErrorKind::invalid_segment,
      "invalid segment \"items[0\" ('a.items[0':2)");
}

TEST_F(ErrorTest, TrailingTextAfterBracket) {
  expect_path_error("items[0]x", libflow::PathErrorKind::invalid_segment,
      "invalid segment \"items[0]x\" ('items[0]x':0)");
}

TEST_F(ErrorTest, EmptySegment) {
  expect_path_error("a..b", libflow::PathErrorKind::invalid_segment,
      "empty segment ('a..b':2)");
}

TEST_F(ErrorTest, TrailingDot) {
  expect_path_error("a.", libflow::PathErrorKind::invalid_segment,
      "empty segment ('a.':2)");
}

TEST_F(ErrorTest, EmptyIndex) {
  expect_path_error("items[]", libflow::PathErrorKind::empty_index,
      "empty index in \"items[]\" ('items[]':0)");
}

TEST_F(ErrorTest, NegativeIndex) {
  expect_path_error("a.items[-1]", libflow::PathErrorKind::invalid_index,
      "invalid non-negative index in \"items[-1]\" ('a.items[-1]':2)");
}

TEST_F(ErrorTest, NonNumericIndex) {
  expect_path_error("items[x]", libflow::PathErrorKind::invalid_index,
      "invalid non-negative index in \"items[x]\" ('items[x]':0)");
}

TEST_F(ErrorTest, PathErrorCarriesPathAndOffset) {
  try {
    libflow::parse("a.b.c[z]");
    FAIL() << "expected a PathError";
  } catch (const libflow::PathError& e) {
    EXPECT_EQ(e.path(), "a.b.c[z]");
    EXPECT_EQ(e.offset(), 4);
  }
}

TEST_F(ErrorTest, StepErrorMessage) {
  libflow::StepError error{2, "pick(a)", "boom"};
  EXPECT_EQ(std::string{error.what()}, "pipeline step 2 (pick(a)) failed: boom");
  EXPECT_EQ(error.index(), 2);
  EXPECT_EQ(error.description(), "pick(a)");
  EXPECT_EQ(error.cause(), "boom");
}

TEST_F(ErrorTest, StepErrorWithoutDescription) {
  libflow::StepError error{0, "", "boom"};
  EXPECT_EQ(std::string{error.what()}, "pipeline step 0 failed: boom");
}

TEST_F(ErrorTest, UnsupportedErrorIsAFormatError) {
  EXPECT_THROW(throw libflow::UnsupportedError("nope"), libflow::FormatError);
}
