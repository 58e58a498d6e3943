#ifndef LIBFLOW_FORMATS_JSON_H
#define LIBFLOW_FORMATS_JSON_H

#include "libflow/formats/format.hpp"
#include <json/json.h> // Json::Value Json::CharReader Json::StreamWriter
#include <memory>      // std::unique_ptr
#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view

namespace libflow {

// Convert a jsoncpp value to a document. Integers that fit in 64 bits
// become integers, all other numbers become doubles.
Document from_json(const Json::Value& value);

// Convert a document to a jsoncpp value.
Json::Value to_json(const Document& document);

// Parse _text_ as a single JSON value. Returns std::nullopt if _text_ is
// empty or not valid JSON.
std::optional<Document> parse_json_literal(std::string_view text);

class JsonDetector : public Detector {
public:
  int detect(std::string_view prefix) const override;
};

// Streams the elements of a top level array one at a time, then any
// further top level values concatenated in the same input.
class JsonParser : public DocumentParser {
public:
  explicit JsonParser(std::istream& in);

  void for_each(const DocumentCallback& callback) override;

private:
  std::istream& m_in;
  std::unique_ptr<Json::CharReader> m_reader{};

  // Skip whitespace and return the next character without consuming it.
  int peek_non_space();

  // Consume and return the text of one complete JSON value.
  std::string scan_value();
  void scan_string(std::string& out);

  Document decode(const std::string& text) const;
};

class JsonFormatter : public Formatter {
public:
  JsonFormatter(std::ostream& out, const FormatterOptions& options);

  void write(const Document& document) override;
  void close() override;

private:
  std::ostream& m_out;
  Json::StreamWriterBuilder m_builder{};
  unsigned int m_precision{0};
  std::unique_ptr<Json::StreamWriter> m_writer{};
};

class JsonFormat : public Format {
public:
  std::string name() const override { return "json"; };
  const Detector& detector() const override { return m_detector; };
  std::unique_ptr<DocumentParser> new_parser(std::istream& in) const override;
  std::unique_ptr<Formatter> new_formatter(
      std::ostream& out, const FormatterOptions& options) const override;

private:
  JsonDetector m_detector{};
};

// A _Document::value_t_ visitor building the equivalent jsoncpp value.
struct ToJsonVisitor {
  Json::Value operator()(std::nullptr_t) const;
  Json::Value operator()(bool b) const;
  Json::Value operator()(std::int64_t i) const;
  Json::Value operator()(double d) const;
  Json::Value operator()(const std::string& s) const;
  Json::Value operator()(const Sequence& sequence) const;
  Json::Value operator()(const Mapping& mapping) const;
};

} // namespace libflow

#endif // LIBFLOW_FORMATS_JSON_H
