#include "libflow/formats/yaml.hpp"
#include "libflow/exceptions.hpp" // libflow::FormatError
#include <yaml-cpp/anchor.h>       // YAML::anchor_t YAML::NullAnchor
#include <yaml-cpp/eventhandler.h> // YAML::EventHandler
#include <cctype>                 // std::isxdigit
#include <charconv>               // std::from_chars
#include <cmath>                  // std::isnan std::isinf
#include <cstdint>                // std::int64_t
#include <cstdlib>                // std::strtod
#include <limits>                 // std::numeric_limits
#include <map>                    // std::map
#include <optional>               // std::optional
#include <string>                 // std::string
#include <system_error>           // std::errc
#include <utility>                // std::move
#include <variant>                // std::visit
#include <vector>                 // std::vector

namespace libflow {

using namespace std::string_literals;

namespace {

constexpr std::string_view TAG_PREFIX{"tag:yaml.org,2002:"};

bool is_digits(std::string_view s, int base) noexcept {
  if (s.empty()) {
    return false;
  }
  for (auto ch : s) {
    auto ok{base == 16 ? std::isxdigit(static_cast<unsigned char>(ch)) != 0
            : base == 8 ? ch >= '0' && ch <= '7'
                        : ch >= '0' && ch <= '9'};
    if (!ok) {
      return false;
    }
  }
  return true;
}

std::optional<std::int64_t> to_integer(std::string_view s, int base) {
  std::int64_t rv{0};
  auto [ptr, ec]{std::from_chars(s.data(), s.data() + s.size(), rv, base)};
  if (ec != std::errc{} || ptr != s.data() + s.size()) {
    return std::nullopt;
  }
  return rv;
}

// [-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?
bool is_decimal_float(std::string_view s) noexcept {
  std::size_t i{0};
  if (i < s.size() && (s[i] == '-' || s[i] == '+')) {
    ++i;
  }

  std::size_t int_digits{0};
  while (i < s.size() && s[i] >= '0' && s[i] <= '9') {
    ++i;
    ++int_digits;
  }

  std::size_t frac_digits{0};
  if (i < s.size() && s[i] == '.') {
    ++i;
    while (i < s.size() && s[i] >= '0' && s[i] <= '9') {
      ++i;
      ++frac_digits;
    }
  }

  if (int_digits == 0 && frac_digits == 0) {
    return false;
  }

  if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
    ++i;
    if (i < s.size() && (s[i] == '-' || s[i] == '+')) {
      ++i;
    }
    std::size_t exp_digits{0};
    while (i < s.size() && s[i] >= '0' && s[i] <= '9') {
      ++i;
      ++exp_digits;
    }
    if (exp_digits == 0) {
      return false;
    }
  }

  return i == s.size();
}

Document resolve_tagged_scalar(const std::string& tag, const std::string& value) {
  // Quoted scalars carry the non-specific tag "!".
  if (tag == "!") {
    return value;
  }
  if (tag == "?" || tag.empty()) {
    return resolve_plain_scalar(value);
  }

  if (tag.compare(0, TAG_PREFIX.size(), TAG_PREFIX) == 0) {
    auto name{std::string_view{tag}.substr(TAG_PREFIX.size())};
    if (name == "str" || name == "binary" || name == "timestamp") {
      return value;
    }
    auto resolved{resolve_plain_scalar(value)};
    if ((name == "int" && resolved.kind() == Kind::integer) ||
        (name == "float" && (resolved.kind() == Kind::real ||
                                resolved.kind() == Kind::integer)) ||
        (name == "bool" && resolved.kind() == Kind::boolean) ||
        (name == "null" && resolved.is_null())) {
      if (name == "float" && resolved.kind() == Kind::integer) {
        return static_cast<double>(std::get<std::int64_t>(resolved.value));
      }
      return resolved;
    }
    throw FormatError("yaml: cannot decode \""s + value + "\" as !!"s +
                      std::string{name});
  }

  // Local tags are not interpreted.
  return resolve_plain_scalar(value);
}

// Builds one document from the events of one YAML document.
class DocumentBuilder : public YAML::EventHandler {
public:
  void OnDocumentStart(const YAML::Mark&) override {}
  void OnDocumentEnd() override {}

  void OnNull(const YAML::Mark&, YAML::anchor_t anchor) override {
    add(Document{}, anchor, "");
  }

  void OnAlias(const YAML::Mark& mark, YAML::anchor_t anchor) override {
    auto it{m_anchors.find(anchor)};
    if (it == m_anchors.end()) {
      throw FormatError("yaml: alias to an incomplete or unknown anchor at "
                        "line "s +
                        std::to_string(mark.line + 1));
    }
    auto node{it->second};
    auto key{to_display_string(node)};
    add(std::move(node), YAML::NullAnchor, std::move(key));
  }

  void OnScalar(const YAML::Mark&, const std::string& tag,
      YAML::anchor_t anchor, const std::string& value) override {
    add(resolve_tagged_scalar(tag, value), anchor, value);
  }

  void OnSequenceStart(const YAML::Mark&, const std::string&,
      YAML::anchor_t anchor, YAML::EmitterStyle::value) override {
    m_stack.push_back(Frame{Sequence{}, anchor, std::nullopt});
  }

  void OnSequenceEnd() override { end_container(); }

  void OnMapStart(const YAML::Mark&, const std::string&, YAML::anchor_t anchor,
      YAML::EmitterStyle::value) override {
    m_stack.push_back(Frame{Mapping{}, anchor, std::nullopt});
  }

  void OnMapEnd() override { end_container(); }

  Document take() { return std::move(m_root); }

private:
  struct Frame {
    Document container{};
    YAML::anchor_t anchor{YAML::NullAnchor};
    std::optional<std::string> key{};
  };

  std::vector<Frame> m_stack{};
  std::map<YAML::anchor_t, Document> m_anchors{};
  Document m_root{};

  void end_container() {
    auto frame{std::move(m_stack.back())};
    m_stack.pop_back();
    auto key{to_display_string(frame.container)};
    add(std::move(frame.container), frame.anchor, std::move(key));
  }

  // Attach _node_ to the innermost open container. _key_ is the text used
  // when _node_ is a mapping key.
  void add(Document node, YAML::anchor_t anchor, std::string key) {
    if (anchor != YAML::NullAnchor) {
      m_anchors[anchor] = node;
    }

    if (m_stack.empty()) {
      m_root = std::move(node);
      return;
    }

    auto& frame{m_stack.back()};
    if (auto sequence{frame.container.sequence()}) {
      sequence->push_back(std::move(node));
      return;
    }

    if (!frame.key) {
      frame.key = std::move(key);
      return;
    }

    frame.container.mapping()->insert_or_assign(
        std::move(*frame.key), std::move(node));
    frame.key.reset();
  }
};

} // namespace

Document resolve_plain_scalar(std::string_view value) {
  if (value.empty() || value == "~" || value == "null" || value == "Null" ||
      value == "NULL") {
    return Document{};
  }

  if (value == "true" || value == "True" || value == "TRUE") {
    return true;
  }
  if (value == "false" || value == "False" || value == "FALSE") {
    return false;
  }

  if (value.size() > 2 && value[0] == '0' && (value[1] == 'x' || value[1] == 'o')) {
    auto base{value[1] == 'x' ? 16 : 8};
    auto digits{value.substr(2)};
    if (is_digits(digits, base)) {
      if (auto i{to_integer(digits, base)}) {
        return *i;
      }
    }
  }

  auto unsigned_part{value};
  if (value.front() == '+' || value.front() == '-') {
    unsigned_part = value.substr(1);
  }
  if (is_digits(unsigned_part, 10)) {
    auto text{value.front() == '+' ? value.substr(1) : value};
    if (auto i{to_integer(text, 10)}) {
      return *i;
    }
    return std::strtod(std::string{value}.c_str(), nullptr);
  }

  if (is_decimal_float(value)) {
    return std::strtod(std::string{value}.c_str(), nullptr);
  }

  if (value == ".inf" || value == ".Inf" || value == ".INF" ||
      value == "+.inf" || value == "+.Inf" || value == "+.INF") {
    return std::numeric_limits<double>::infinity();
  }
  if (value == "-.inf" || value == "-.Inf" || value == "-.INF") {
    return -std::numeric_limits<double>::infinity();
  }
  if (value == ".nan" || value == ".NaN" || value == ".NAN") {
    return std::numeric_limits<double>::quiet_NaN();
  }

  return std::string{value};
}

int YamlDetector::detect(std::string_view prefix) const {
  auto head{trim_leading_space(prefix)};
  if (head.empty()) {
    return 0;
  }
  if (head.front() == '%' || head.substr(0, 3) == "---") {
    return 100;
  }
  if (head.front() == '{' || head.front() == '[') {
    return 0;
  }
  if (looks_like_key_value(head)) {
    return 90;
  }
  return 0;
}

void YamlParser::for_each(const DocumentCallback& callback) {
  for (;;) {
    DocumentBuilder builder{};
    bool more{false};
    try {
      more = m_parser->HandleNextDocument(builder);
    } catch (const YAML::Exception& e) {
      throw FormatError("yaml: "s + e.what());
    }
    if (!more) {
      return;
    }
    callback(builder.take());
  }
}

void YamlFormatter::write(const Document& document) {
  YAML::Emitter emitter{};
  emitter.SetIndent(2);
  emitter.SetNullFormat(YAML::LowerNull);
  emitter.SetBoolFormat(YAML::TrueFalseBool);
  std::visit(EmitVisitor{emitter}, document.value);

  if (!emitter.good()) {
    throw FormatError("yaml: "s + emitter.GetLastError());
  }

  if (m_count++ > 0) {
    m_out << "---\n";
  }
  m_out << emitter.c_str() << '\n';
  if (!m_out) {
    throw FormatError("yaml: failed to write document");
  }
}

void YamlFormatter::close() { m_out.flush(); }

std::unique_ptr<DocumentParser> YamlFormat::new_parser(std::istream& in) const {
  return std::make_unique<YamlParser>(in);
}

std::unique_ptr<Formatter> YamlFormat::new_formatter(
    std::ostream& out, const FormatterOptions&) const {
  return std::make_unique<YamlFormatter>(out);
}

void EmitVisitor::operator()(std::nullptr_t) const { emitter << YAML::Null; }

void EmitVisitor::operator()(bool b) const { emitter << b; }

void EmitVisitor::operator()(std::int64_t i) const { emitter << i; }

void EmitVisitor::operator()(double d) const {
  if (std::isnan(d)) {
    emitter << ".nan";
    return;
  }
  if (std::isinf(d)) {
    emitter << (d > 0 ? ".inf" : "-.inf");
    return;
  }

  // Keep a decimal point so the value reads back as a float.
  auto text{format_double(d)};
  if (text.find_first_of(".e") == std::string::npos) {
    text += ".0";
  }
  emitter << text;
}

void EmitVisitor::operator()(const std::string& s) const {
  if (resolve_plain_scalar(s).kind() != Kind::string) {
    emitter << YAML::DoubleQuoted;
  }
  emitter << s;
}

void EmitVisitor::operator()(const Sequence& sequence) const {
  emitter << YAML::BeginSeq;
  for (const auto& element : sequence) {
    std::visit(*this, element.value);
  }
  emitter << YAML::EndSeq;
}

void EmitVisitor::operator()(const Mapping& mapping) const {
  emitter << YAML::BeginMap;
  for (const auto& [key, value] : mapping) {
    emitter << YAML::Key;
    (*this)(key);
    emitter << YAML::Value;
    std::visit(*this, value.value);
  }
  emitter << YAML::EndMap;
}

} // namespace libflow
