#ifndef LIBFLOW_FORMATS_YAML_H
#define LIBFLOW_FORMATS_YAML_H

#include "libflow/formats/format.hpp"
#include <cstddef>         // std::size_t
#include <memory>          // std::unique_ptr
#include <string>          // std::string
#include <string_view>     // std::string_view
#include <yaml-cpp/yaml.h> // YAML::Parser YAML::Emitter

namespace libflow {

// Resolve an untagged plain scalar with the YAML 1.2 core schema. Returns
// a string document if _value_ is not a null, boolean, integer or float.
Document resolve_plain_scalar(std::string_view value);

class YamlDetector : public Detector {
public:
  int detect(std::string_view prefix) const override;
};

// Streams each document in a YAML stream. Mapping keys are converted to
// strings and aliases are replaced with copies of their anchored nodes.
class YamlParser : public DocumentParser {
public:
  explicit YamlParser(std::istream& in)
      : m_parser{std::make_unique<YAML::Parser>(in)} {};

  void for_each(const DocumentCallback& callback) override;

private:
  std::unique_ptr<YAML::Parser> m_parser{};
};

// Writes block style YAML with a two space indent, separating documents
// with `---`.
class YamlFormatter : public Formatter {
public:
  explicit YamlFormatter(std::ostream& out) : m_out{out} {};

  void write(const Document& document) override;
  void close() override;

private:
  std::ostream& m_out;
  std::size_t m_count{0};
};

class YamlFormat : public Format {
public:
  std::string name() const override { return "yaml"; };
  const Detector& detector() const override { return m_detector; };
  std::unique_ptr<DocumentParser> new_parser(std::istream& in) const override;
  std::unique_ptr<Formatter> new_formatter(
      std::ostream& out, const FormatterOptions& options) const override;

private:
  YamlDetector m_detector{};
};

// A _Document::value_t_ visitor writing each alternative to an emitter.
struct EmitVisitor {
  YAML::Emitter& emitter;

  void operator()(std::nullptr_t) const;
  void operator()(bool b) const;
  void operator()(std::int64_t i) const;
  void operator()(double d) const;
  void operator()(const std::string& s) const;
  void operator()(const Sequence& sequence) const;
  void operator()(const Mapping& mapping) const;
};

} // namespace libflow

#endif // LIBFLOW_FORMATS_YAML_H
