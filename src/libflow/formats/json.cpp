#include "libflow/formats/json.hpp"
#include "libflow/exceptions.hpp" // libflow::FormatError
#include "libflow/utils.hpp"      // libflow::trim
#include <algorithm>              // std::max std::min
#include <cctype>                 // std::isspace
#include <charconv>               // std::to_chars std::from_chars
#include <cmath>                  // std::fabs std::floor std::isfinite std::log10
#include <sstream>                // std::ostringstream
#include <string>                 // std::string
#include <utility>                // std::move
#include <variant>                // std::visit

namespace libflow {

using namespace std::string_literals;

namespace {

constexpr std::string_view DELIMITERS{",[]{}:\""};

Json::CharReaderBuilder reader_builder() {
  Json::CharReaderBuilder builder{};
  Json::CharReaderBuilder::strictMode(&builder.settings_);
  builder["strictRoot"] = false;
  builder["rejectDupKeys"] = false;
  return builder;
}

constexpr unsigned int MAX_DOUBLE_DIGITS{17};

// Fewest significant digits that read back as exactly _d_.
unsigned int round_trip_digits(double d) {
  if (!std::isfinite(d)) {
    return 1;
  }

  // Below the number of integer digits %g switches to exponent form.
  unsigned int least{1};
  if (auto magnitude{std::fabs(d)}; magnitude >= 1.0) {
    least = std::min(MAX_DOUBLE_DIGITS,
        static_cast<unsigned int>(std::floor(std::log10(magnitude))) + 1);
  }

  char buf[64];
  for (unsigned int digits{least}; digits < MAX_DOUBLE_DIGITS; ++digits) {
    auto [end, ec]{std::to_chars(buf, buf + sizeof(buf), d,
        std::chars_format::general, static_cast<int>(digits))};
    double parsed{};
    if (ec == std::errc{} &&
        std::from_chars(buf, end, parsed).ec == std::errc{} && parsed == d) {
      return digits;
    }
  }
  return MAX_DOUBLE_DIGITS;
}

// The precision every real in _document_ needs to survive a write.
unsigned int round_trip_digits(const Document& document) {
  if (auto d{std::get_if<double>(&document.value)}) {
    return round_trip_digits(*d);
  }

  unsigned int rv{1};
  if (auto sequence{document.sequence()}) {
    for (const auto& item : *sequence) {
      rv = std::max(rv, round_trip_digits(item));
    }
  } else if (auto mapping{document.mapping()}) {
    for (const auto& [key, value] : *mapping) {
      rv = std::max(rv, round_trip_digits(value));
    }
  }
  return rv;
}

} // namespace

Document from_json(const Json::Value& value) {
  switch (value.type()) {
  case Json::nullValue:
    return Document{};
  case Json::booleanValue:
    return value.asBool();
  case Json::intValue:
    return static_cast<std::int64_t>(value.asInt64());
  case Json::uintValue:
    if (value.isInt64()) {
      return static_cast<std::int64_t>(value.asInt64());
    }
    return value.asDouble();
  case Json::realValue:
    return value.asDouble();
  case Json::stringValue:
    return value.asString();
  case Json::arrayValue: {
    Sequence rv{};
    rv.reserve(value.size());
    for (const auto& element : value) {
      rv.push_back(from_json(element));
    }
    return rv;
  }
  case Json::objectValue: {
    Mapping rv{};
    for (auto it{value.begin()}; it != value.end(); ++it) {
      rv.insert_or_assign(it.name(), from_json(*it));
    }
    return rv;
  }
  default:
    return Document{};
  }
}

Json::Value to_json(const Document& document) {
  return std::visit(ToJsonVisitor(), document.value);
}

std::optional<Document> parse_json_literal(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }

  std::unique_ptr<Json::CharReader> reader{reader_builder().newCharReader()};
  Json::Value root{};
  std::string errors{};
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
    return std::nullopt;
  }
  return from_json(root);
}

int JsonDetector::detect(std::string_view prefix) const {
  auto head{trim_leading_space(prefix)};
  if (head.empty()) {
    return 80;
  }
  if (head.front() == '{' || head.front() == '[') {
    return 100;
  }
  if (head.front() == '%' || head.substr(0, 3) == "---" ||
      looks_like_key_value(head)) {
    return 0;
  }
  return 50;
}

JsonParser::JsonParser(std::istream& in)
    : m_in{in}, m_reader{reader_builder().newCharReader()} {}

void JsonParser::for_each(const DocumentCallback& callback) {
  auto c{peek_non_space()};
  if (c == std::char_traits<char>::eof()) {
    return;
  }

  if (c == '[') {
    m_in.get();
    if (peek_non_space() == ']') {
      m_in.get();
    } else {
      for (;;) {
        peek_non_space();
        callback(decode(scan_value()));
        c = peek_non_space();
        m_in.get();
        if (c == ']') {
          break;
        }
        if (c != ',') {
          throw FormatError("json: expected ',' or ']' after array element");
        }
      }
    }
  }

  while (peek_non_space() != std::char_traits<char>::eof()) {
    callback(decode(scan_value()));
  }
}

int JsonParser::peek_non_space() {
  auto c{m_in.peek()};
  while (c != std::char_traits<char>::eof() && std::isspace(c)) {
    m_in.get();
    c = m_in.peek();
  }
  return c;
}

std::string JsonParser::scan_value() {
  std::string rv{};
  auto c{m_in.peek()};

  if (c == '"') {
    scan_string(rv);
    return rv;
  }

  if (c == '{' || c == '[') {
    int depth{0};
    do {
      c = m_in.get();
      if (c == std::char_traits<char>::eof()) {
        throw FormatError("json: unexpected end of input");
      }
      if (c == '"') {
        m_in.unget();
        scan_string(rv);
        continue;
      }
      rv.push_back(static_cast<char>(c));
      if (c == '{' || c == '[') {
        ++depth;
      } else if (c == '}' || c == ']') {
        --depth;
      }
    } while (depth > 0);
    return rv;
  }

  while (c != std::char_traits<char>::eof() && !std::isspace(c) &&
         DELIMITERS.find(static_cast<char>(c)) == std::string_view::npos) {
    rv.push_back(static_cast<char>(m_in.get()));
    c = m_in.peek();
  }

  if (rv.empty()) {
    throw FormatError("json: unexpected character '"s +
                      static_cast<char>(c) + "'"s);
  }
  return rv;
}

void JsonParser::scan_string(std::string& out) {
  out.push_back(static_cast<char>(m_in.get()));
  bool escaped{false};
  for (;;) {
    auto c{m_in.get()};
    if (c == std::char_traits<char>::eof()) {
      throw FormatError("json: unterminated string");
    }
    out.push_back(static_cast<char>(c));
    if (escaped) {
      escaped = false;
    } else if (c == '\\') {
      escaped = true;
    } else if (c == '"') {
      return;
    }
  }
}

Document JsonParser::decode(const std::string& text) const {
  Json::Value root{};
  std::string errors{};
  if (!m_reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
    auto message{std::string{trim(errors)}};
    throw FormatError("json: "s + message);
  }
  return from_json(root);
}

JsonFormatter::JsonFormatter(std::ostream& out, const FormatterOptions& options)
    : m_out{out} {
  m_builder["commentStyle"] = "None";
  m_builder["indentation"] = options.compact ? "" : "  ";
  m_builder["enableYAMLCompatibility"] = !options.compact;
  m_builder["emitUTF8"] = true;
}

void JsonFormatter::write(const Document& document) {
  // Reals are written with the shortest precision that keeps them exact.
  auto precision{round_trip_digits(document)};
  if (!m_writer || precision != m_precision) {
    m_builder["precision"] = precision;
    m_writer.reset(m_builder.newStreamWriter());
    m_precision = precision;
  }

  m_writer->write(to_json(document), &m_out);
  m_out << '\n';
  if (!m_out) {
    throw FormatError("json: failed to write document");
  }
}

void JsonFormatter::close() { m_out.flush(); }

std::unique_ptr<DocumentParser> JsonFormat::new_parser(std::istream& in) const {
  return std::make_unique<JsonParser>(in);
}

std::unique_ptr<Formatter> JsonFormat::new_formatter(
    std::ostream& out, const FormatterOptions& options) const {
  return std::make_unique<JsonFormatter>(out, options);
}

Json::Value ToJsonVisitor::operator()(std::nullptr_t) const {
  return Json::Value{Json::nullValue};
}

Json::Value ToJsonVisitor::operator()(bool b) const { return Json::Value{b}; }

Json::Value ToJsonVisitor::operator()(std::int64_t i) const {
  return Json::Value{static_cast<Json::Int64>(i)};
}

Json::Value ToJsonVisitor::operator()(double d) const {
  return Json::Value{d};
}

Json::Value ToJsonVisitor::operator()(const std::string& s) const {
  return Json::Value{s};
}

Json::Value ToJsonVisitor::operator()(const Sequence& sequence) const {
  Json::Value rv{Json::arrayValue};
  for (const auto& element : sequence) {
    rv.append(to_json(element));
  }
  return rv;
}

Json::Value ToJsonVisitor::operator()(const Mapping& mapping) const {
  Json::Value rv{Json::objectValue};
  for (const auto& [key, value] : mapping) {
    rv[key] = to_json(value);
  }
  return rv;
}

} // namespace libflow
