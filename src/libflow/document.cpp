#include "libflow/document.hpp"
#include <charconv>     // std::to_chars std::chars_format
#include <cmath>        // std::isnan std::isinf
#include <cstdlib>      // std::atoi
#include <string>       // std::string std::to_string
#include <system_error> // std::errc
#include <variant>      // std::visit

namespace libflow {

std::string kind_to_string(Kind kind) {
  switch (kind) {
  case Kind::null:
    return "null";
  case Kind::boolean:
    return "boolean";
  case Kind::integer:
    return "integer";
  case Kind::real:
    return "real";
  case Kind::string:
    return "string";
  case Kind::sequence:
    return "sequence";
  case Kind::mapping:
    return "mapping";
  default:
    return "unknown";
  }
}

bool operator==(const Document& lhs, const Document& rhs) {
  return lhs.value == rhs.value;
}

std::string to_display_string(const Document& document) {
  return std::visit(DisplayStringVisitor(), document.value);
}

std::string format_double(double d) {
  if (std::isnan(d)) {
    return "NaN";
  }
  if (std::isinf(d)) {
    return d > 0 ? "+Inf" : "-Inf";
  }

  // Shortest round trippable digits, as d.ddde[+-]xx
  char buf[64];
  auto [end, ec]{std::to_chars(buf, buf + sizeof(buf), d,
      std::chars_format::scientific)};
  if (ec != std::errc{}) {
    return std::to_string(d);
  }
  std::string scientific{buf, end};

  auto e_pos{scientific.find('e')};
  auto mantissa{scientific.substr(0, e_pos)};
  auto exponent{std::atoi(scientific.c_str() + e_pos + 1)};

  std::string sign{};
  if (mantissa.front() == '-') {
    sign = "-";
    mantissa.erase(0, 1);
  }

  if (exponent < -4 || exponent >= 6) {
    return sign + scientific.substr(sign.size());
  }

  std::string digits{};
  for (auto ch : mantissa) {
    if (ch != '.') {
      digits.push_back(ch);
    }
  }

  std::string rv{};
  if (exponent < 0) {
    rv = "0." + std::string(static_cast<std::size_t>(-exponent - 1), '0') +
         digits;
  } else {
    auto point{static_cast<std::size_t>(exponent) + 1};
    if (digits.size() <= point) {
      rv = digits + std::string(point - digits.size(), '0');
    } else {
      rv = digits.substr(0, point) + "." + digits.substr(point);
    }
  }
  return sign + rv;
}

std::ostream& operator<<(std::ostream& os, const Document& document) {
  return os << to_display_string(document);
}

std::string DisplayStringVisitor::operator()(std::nullptr_t) const {
  return "<nil>";
}

std::string DisplayStringVisitor::operator()(bool b) const {
  return b ? "true" : "false";
}

std::string DisplayStringVisitor::operator()(std::int64_t i) const {
  return std::to_string(i);
}

std::string DisplayStringVisitor::operator()(double d) const {
  return format_double(d);
}

std::string DisplayStringVisitor::operator()(const std::string& s) const {
  return s;
}

std::string DisplayStringVisitor::operator()(const Sequence& sequence) const {
  std::string rv{"["};
  for (auto it{sequence.cbegin()}; it != sequence.cend(); ++it) {
    if (it != sequence.cbegin()) {
      rv += " ";
    }
    rv += to_display_string(*it);
  }
  rv += "]";
  return rv;
}

std::string DisplayStringVisitor::operator()(const Mapping& mapping) const {
  std::string rv{"map["};
  for (auto it{mapping.cbegin()}; it != mapping.cend(); ++it) {
    if (it != mapping.cbegin()) {
      rv += " ";
    }
    rv += it->first + ":" + to_display_string(it->second);
  }
  rv += "]";
  return rv;
}

} // namespace libflow
