#include "libflow/access.hpp"     // libflow::find
#include "libflow/exceptions.hpp" // libflow::ArgumentError
#include "libflow/operations.hpp" // libflow::Where
#include "libflow/utils.hpp"      // libflow::split_assignment
#include <string>                 // std::string

namespace libflow {

using namespace std::string_literals;

Where Where::from_pairs(const std::vector<std::string>& pairs) {
  std::vector<Condition> conditions{};
  Parser parser{};

  for (const auto& pair : pairs) {
    auto parts{split_assignment(pair)};
    if (!parts) {
      throw ArgumentError("invalid where condition '"s + pair +
                          "': must be in format key=value"s);
    }

    auto& [path, expected] = *parts;
    if (path.empty()) {
      throw ArgumentError(
          "invalid where condition '"s + pair + "': key cannot be empty"s);
    }

    conditions.push_back(Condition{parser.parse(path), std::move(expected)});
  }

  return Where{std::move(conditions)};
}

Result Where::apply(Document document) const {
  if (!matches(document)) {
    return Filtered{};
  }
  return document;
}

bool Where::matches(const Document& document) const {
  for (const auto& condition : m_conditions) {
    auto found{find(document, condition.path)};
    if (!found || to_display_string(*found) != condition.expected) {
      return false;
    }
  }
  return true;
}

std::string Where::description() const {
  if (m_conditions.empty()) {
    return "where: (no conditions)";
  }

  std::string rv{"where: "};
  for (auto it{m_conditions.cbegin()}; it != m_conditions.cend(); ++it) {
    if (it != m_conditions.cbegin()) {
      rv += " AND ";
    }
    rv += to_string(it->path) + "=" + it->expected;
  }
  return rv;
}

} // namespace libflow
