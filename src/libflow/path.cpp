#include "libflow/path.hpp"
#include "libflow/exceptions.hpp" // libflow::PathError
#include <charconv>               // std::from_chars
#include <string>                 // std::string std::to_string
#include <system_error>           // std::errc
#include <utility>                // std::move
#include <variant>                // std::visit

namespace libflow {

using namespace std::string_literals;

bool operator==(const Step& lhs, const Step& rhs) {
  if (lhs.key != rhs.key || lhs.index.index() != rhs.index.index()) {
    return false;
  }
  if (auto i{std::get_if<std::size_t>(&lhs.index)}) {
    return *i == std::get<std::size_t>(rhs.index);
  }
  return true;
}

steps_t Parser::parse(std::string_view path) const {
  if (path.empty()) {
    throw PathError("empty path", PathErrorKind::empty_path, path, 0);
  }

  steps_t steps{};
  std::size_t start{0};

  for (;;) {
    auto end{path.find('.', start)};
    auto segment{path.substr(start, end == std::string_view::npos
                                        ? std::string_view::npos
                                        : end - start)};
    steps.push_back(parse_segment(segment, path, start));
    if (end == std::string_view::npos) {
      break;
    }
    start = end + 1;
  }

  return steps;
}

steps_t parse(std::string_view path) {
  Parser parser{};
  return parser.parse(path);
}

Step Parser::parse_segment(
    std::string_view segment, std::string_view path, std::size_t offset) const {
  if (segment.empty()) {
    throw PathError(
        "empty segment", PathErrorKind::invalid_segment, path, offset);
  }

  auto open{segment.find('[')};
  if (open == std::string_view::npos) {
    return Step{std::string{segment}, std::monostate{}};
  }

  if (open == 0 || segment.back() != ']') {
    throw PathError("invalid segment \""s + std::string{segment} + "\""s,
        PathErrorKind::invalid_segment, path, offset);
  }

  auto body{segment.substr(open + 1, segment.size() - open - 2)};
  return Step{std::string{segment.substr(0, open)},
      parse_index(body, segment, path, offset)};
}

index_t Parser::parse_index(std::string_view body, std::string_view segment,
    std::string_view path, std::size_t offset) const {
  if (body.empty()) {
    throw PathError("empty index in \""s + std::string{segment} + "\""s,
        PathErrorKind::empty_index, path, offset);
  }

  if (body == "*") {
    return Wildcard{};
  }

  std::size_t index{0};
  auto [ptr, ec]{std::from_chars(body.data(), body.data() + body.size(), index)};
  if (ec != std::errc{} || ptr != body.data() + body.size()) {
    throw PathError(
        "invalid non-negative index in \""s + std::string{segment} + "\""s,
        PathErrorKind::invalid_index, path, offset);
  }

  return index;
}

std::string to_string(const steps_t& steps) {
  std::string rv{};
  for (auto it{steps.cbegin()}; it != steps.cend(); ++it) {
    if (it != steps.cbegin()) {
      rv += ".";
    }
    rv += it->key;
    rv += std::visit(IndexToStringVisitor(), it->index);
  }
  return rv;
}

bool has_wildcard(const steps_t& steps) {
  for (const auto& step : steps) {
    if (step.is_wildcard()) {
      return true;
    }
  }
  return false;
}

std::string IndexToStringVisitor::operator()(const std::monostate&) const {
  return "";
}

std::string IndexToStringVisitor::operator()(std::size_t index) const {
  return "["s + std::to_string(index) + "]"s;
}

std::string IndexToStringVisitor::operator()(const Wildcard&) const {
  return "[*]";
}

} // namespace libflow
