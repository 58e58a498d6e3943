#include "libflow/access.hpp"     // libflow::remove
#include "libflow/expand.hpp"     // libflow::expand
#include "libflow/operations.hpp" // libflow::Delete
#include <string>                 // std::string

namespace libflow {

Delete::Delete(const std::vector<std::string>& paths) {
  Parser parser{};
  for (const auto& path : paths) {
    m_paths.push_back(parser.parse(path));
  }
}

Result Delete::apply(Document document) const {
  for (const auto& path : m_paths) {
    if (!has_wildcard(path)) {
      remove(document, path);
      continue;
    }

    // Remove matches last to first, so removing one sequence element does
    // not shift the indices of those still to be removed.
    auto concrete{expand(document, path)};
    for (auto it{concrete.crbegin()}; it != concrete.crend(); ++it) {
      remove(document, *it);
    }
  }
  return document;
}

std::string Delete::description() const {
  std::string rv{"delete("};
  for (auto it{m_paths.cbegin()}; it != m_paths.cend(); ++it) {
    if (it != m_paths.cbegin()) {
      rv += ", ";
    }
    rv += to_string(*it);
  }
  rv += ")";
  return rv;
}

} // namespace libflow
