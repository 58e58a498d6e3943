#include "libflow/exceptions.hpp"   // libflow::FormatError
#include "libflow/formats/json.hpp" // libflow::parse_json_literal
#include "libflow/formats/yaml.hpp" // libflow::YamlFormat
#include <cmath>                    // std::isnan std::isinf
#include <gtest/gtest.h>            // EXPECT_* TEST_F testing::Test
#include <sstream>                  // std::istringstream std::ostringstream
#include <string>                   // std::string
#include <string_view>              // std::string_view
#include <variant>                  // std::get
#include <vector>                   // std::vector

class YamlTest : public testing::Test {
protected:
  libflow::YamlFormat format{};

  libflow::Document doc(std::string_view json) {
    return *libflow::parse_json_literal(json);
  }

  std::vector<libflow::Document> parse_all(std::string_view input) {
    std::istringstream in{std::string{input}};
    std::vector<libflow::Document> rv{};
    format.new_parser(in)->for_each(
        [&rv](libflow::Document document) { rv.push_back(std::move(document)); });
    return rv;
  }

  std::string write_all(const std::vector<libflow::Document>& documents) {
    std::ostringstream out{};
    auto formatter{format.new_formatter(out, libflow::FormatterOptions{})};
    for (const auto& document : documents) {
      formatter->write(document);
    }
    formatter->close();
    return out.str();
  }

  void expect_scalar(std::string_view value, const libflow::Document& want) {
    EXPECT_EQ(libflow::resolve_plain_scalar(value), want)
        << "resolving '" << value << "'";
  }
};

TEST_F(YamlTest, ResolveNull) {
  expect_scalar("", libflow::Document{});
  expect_scalar("~", libflow::Document{});
  expect_scalar("null", libflow::Document{});
  expect_scalar("NULL", libflow::Document{});
}

TEST_F(YamlTest, ResolveBooleans) {
  expect_scalar("true", libflow::Document{true});
  expect_scalar("False", libflow::Document{false});
  expect_scalar("yes", libflow::Document{"yes"});
  expect_scalar("off", libflow::Document{"off"});
}

TEST_F(YamlTest, ResolveIntegers) {
  expect_scalar("42", libflow::Document{42});
  expect_scalar("-7", libflow::Document{-7});
  expect_scalar("+12", libflow::Document{12});
  expect_scalar("0x1F", libflow::Document{31});
  expect_scalar("0o17", libflow::Document{15});
  expect_scalar("0x", libflow::Document{"0x"});
  expect_scalar("0o9", libflow::Document{"0o9"});
}

TEST_F(YamlTest, ResolveLargeIntegerAsFloat) {
  auto resolved{libflow::resolve_plain_scalar("99999999999999999999")};
  EXPECT_EQ(resolved.kind(), libflow::Kind::real);
}

TEST_F(YamlTest, ResolveFloats) {
  expect_scalar("1.5", libflow::Document{1.5});
  expect_scalar("-.5", libflow::Document{-0.5});
  expect_scalar("1e3", libflow::Document{1000.0});
  expect_scalar("2.", libflow::Document{2.0});
  expect_scalar("1e", libflow::Document{"1e"});
  expect_scalar(".", libflow::Document{"."});
}

TEST_F(YamlTest, ResolveSpecialFloats) {
  auto inf{libflow::resolve_plain_scalar(".inf")};
  ASSERT_EQ(inf.kind(), libflow::Kind::real);
  EXPECT_TRUE(std::isinf(std::get<double>(inf.value)));
  EXPECT_GT(std::get<double>(inf.value), 0);

  auto negative_inf{libflow::resolve_plain_scalar("-.Inf")};
  ASSERT_EQ(negative_inf.kind(), libflow::Kind::real);
  EXPECT_LT(std::get<double>(negative_inf.value), 0);

  auto nan{libflow::resolve_plain_scalar(".NaN")};
  ASSERT_EQ(nan.kind(), libflow::Kind::real);
  EXPECT_TRUE(std::isnan(std::get<double>(nan.value)));
}

TEST_F(YamlTest, ResolveStrings) {
  expect_scalar("alice", libflow::Document{"alice"});
  expect_scalar("123abc", libflow::Document{"123abc"});
  expect_scalar("1.2.3", libflow::Document{"1.2.3"});
}

TEST_F(YamlTest, DetectMarkers) {
  EXPECT_EQ(format.detector().detect("---\na: 1\n"), 100);
  EXPECT_EQ(format.detector().detect("%YAML 1.2\n---\n"), 100);
}

TEST_F(YamlTest, DetectKeyValue) {
  EXPECT_EQ(format.detector().detect("name: alice\nage: 30\n"), 90);
}

TEST_F(YamlTest, DetectRulesOutJson) {
  EXPECT_EQ(format.detector().detect("{\"a\": 1}"), 0);
  EXPECT_EQ(format.detector().detect("[1, 2]"), 0);
  EXPECT_EQ(format.detector().detect(""), 0);
  EXPECT_EQ(format.detector().detect("plain text"), 0);
}

TEST_F(YamlTest, SingleDocument) {
  auto documents = parse_all("user:\n  name: alice\n  age: 30\ntags: [a, b]\n");
  ASSERT_EQ(documents.size(), 1);
  EXPECT_EQ(documents[0],
      doc(R"({"user":{"name":"alice","age":30},"tags":["a","b"]})"));
}

TEST_F(YamlTest, MultipleDocuments) {
  auto documents = parse_all("a: 1\n---\nb: 2\n---\n- x\n- 3.5\n");
  ASSERT_EQ(documents.size(), 3);
  EXPECT_EQ(documents[0], doc(R"({"a":1})"));
  EXPECT_EQ(documents[1], doc(R"({"b":2})"));
  EXPECT_EQ(documents[2], doc(R"(["x",3.5])"));
}

TEST_F(YamlTest, EmptyStream) { EXPECT_TRUE(parse_all("").empty()); }

TEST_F(YamlTest, QuotedScalarsStayStrings) {
  auto documents = parse_all("a: \"123\"\nb: 'true'\nc: ~\nd:\n");
  ASSERT_EQ(documents.size(), 1);
  EXPECT_EQ(documents[0], doc(R"({"a":"123","b":"true","c":null,"d":null})"));
}

TEST_F(YamlTest, CoreTags) {
  auto documents = parse_all("a: !!str 12\nb: !!float 3\nc: !!int 0x10\n");
  ASSERT_EQ(documents.size(), 1);
  EXPECT_EQ(documents[0], doc(R"({"a":"12","b":3.0,"c":16})"));
}

TEST_F(YamlTest, MismatchedTag) {
  EXPECT_THROW(parse_all("a: !!int abc\n"), libflow::FormatError);
  try {
    parse_all("a: !!int abc\n");
  } catch (const libflow::FormatError& e) {
    EXPECT_EQ(std::string{e.what()}, "yaml: cannot decode \"abc\" as !!int");
  }
}

TEST_F(YamlTest, AnchorsAndAliases) {
  auto documents =
      parse_all("base: &b\n  x: 1\n  y: [1, 2]\ncopy: *b\nname: &n bob\nalias: *n\n");
  ASSERT_EQ(documents.size(), 1);
  EXPECT_EQ(documents[0], doc(R"({
    "base": {"x": 1, "y": [1, 2]},
    "copy": {"x": 1, "y": [1, 2]},
    "name": "bob",
    "alias": "bob"
  })"));
}

TEST_F(YamlTest, NonStringKeys) {
  auto documents = parse_all("1: one\ntrue: yes\n~: nothing\n");
  ASSERT_EQ(documents.size(), 1);
  EXPECT_EQ(documents[0], doc(R"({"1":"one","true":"yes","":"nothing"})"));
}

TEST_F(YamlTest, SyntaxError) {
  try {
    parse_all("a: [1, 2\n");
    FAIL() << "expected a FormatError";
  } catch (const libflow::FormatError& e) {
    EXPECT_EQ(std::string{e.what()}.rfind("yaml: ", 0), 0u) << e.what();
  }
}

TEST_F(YamlTest, WriteMapping) {
  EXPECT_EQ(write_all({doc(R"({"b":2,"a":"x"})")}), "a: x\nb: 2\n");
}

TEST_F(YamlTest, WriteSeparatesDocuments) {
  EXPECT_EQ(write_all({doc(R"({"a":1})"), doc(R"({"a":2})")}),
      "a: 1\n---\na: 2\n");
}

TEST_F(YamlTest, WriteScalars) {
  EXPECT_EQ(write_all({libflow::Document{}}), "null\n");
  EXPECT_EQ(write_all({libflow::Document{true}}), "true\n");
  EXPECT_EQ(write_all({libflow::Document{2.0}}), "2.0\n");
  EXPECT_EQ(write_all({libflow::Document{1.5}}), "1.5\n");
  EXPECT_EQ(write_all({libflow::Document{1000000.0}}), "1e+06\n");
  EXPECT_EQ(libflow::resolve_plain_scalar("1e+06"), libflow::Document{1000000.0});
}

TEST_F(YamlTest, WriteQuotesAmbiguousStrings) {
  auto out{write_all({doc(R"({"a":"true","b":"123","c":"","d":"plain"})")})};
  EXPECT_NE(out.find("a: \"true\""), std::string::npos) << out;
  EXPECT_NE(out.find("b: \"123\""), std::string::npos) << out;
  EXPECT_NE(out.find("c: \"\""), std::string::npos) << out;
  EXPECT_NE(out.find("d: plain"), std::string::npos) << out;
}

TEST_F(YamlTest, WrittenDocumentsReadBack) {
  auto written{doc(R"({
    "user": {"name": "alice", "id": "42", "scores": [1, 2.5, null]},
    "active": false
  })")};
  auto documents = parse_all(write_all({written, written}));
  ASSERT_EQ(documents.size(), 2);
  EXPECT_EQ(documents[0], written);
  EXPECT_EQ(documents[1], written);
}
