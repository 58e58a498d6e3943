#include "libflow/access.hpp"       // libflow::set_overwrite
#include "libflow/exceptions.hpp"   // libflow::ArgumentError
#include "libflow/expand.hpp"       // libflow::expand
#include "libflow/formats/json.hpp" // libflow::parse_json_literal
#include "libflow/operations.hpp"   // libflow::Set
#include "libflow/utils.hpp"        // libflow::split_assignment
#include <cstddef>                  // std::size_t
#include <string>                   // std::string

namespace libflow {

using namespace std::string_literals;

namespace {

// Expand _path_ up to and including its last wildcard step, then append
// the remaining steps to every match. Steps after the last wildcard need
// not exist yet.
std::vector<steps_t> expand_for_assignment(
    const Document& document, const steps_t& path) {
  std::size_t last_wildcard{0};
  for (std::size_t i{0}; i < path.size(); ++i) {
    if (path[i].is_wildcard()) {
      last_wildcard = i;
    }
  }

  steps_t head{path.begin(), path.begin() + last_wildcard + 1};
  auto rv{expand(document, head)};
  for (auto& steps : rv) {
    steps.insert(steps.end(), path.begin() + last_wildcard + 1, path.end());
  }
  return rv;
}

} // namespace

Set Set::from_pairs(const std::vector<std::string>& pairs) {
  std::vector<Assignment> assignments{};
  Parser parser{};

  for (const auto& pair : pairs) {
    auto parts{split_assignment(pair)};
    if (!parts) {
      throw ArgumentError("invalid set assignment \""s + pair +
                          "\" (expected path=value)"s);
    }

    auto& [path, value] = *parts;
    if (path.empty()) {
      throw ArgumentError(
          "invalid set assignment \""s + pair + "\": empty path"s);
    }

    auto literal{parse_json_literal(value)};
    assignments.push_back(Assignment{
        parser.parse(path), literal ? std::move(*literal) : Document{value}});
  }

  return Set{std::move(assignments)};
}

Result Set::apply(Document document) const {
  if (!document.is_mapping()) {
    document = Mapping{};
  }

  for (const auto& assignment : m_assignments) {
    if (!has_wildcard(assignment.path)) {
      set_overwrite(*document.mapping(), assignment.path, assignment.value);
      continue;
    }
    for (const auto& steps : expand_for_assignment(document, assignment.path)) {
      set_overwrite(*document.mapping(), steps, assignment.value);
    }
  }

  return document;
}

std::string Set::description() const {
  std::string rv{"set("};
  for (auto it{m_assignments.cbegin()}; it != m_assignments.cend(); ++it) {
    if (it != m_assignments.cbegin()) {
      rv += ", ";
    }
    rv += to_string(it->path);
  }
  rv += ")";
  return rv;
}

} // namespace libflow
