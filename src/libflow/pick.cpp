#include "libflow/access.hpp"     // libflow::find libflow::set_overwrite
#include "libflow/expand.hpp"     // libflow::expand
#include "libflow/operations.hpp" // libflow::Pick
#include <string>                 // std::string

namespace libflow {

Pick::Pick(const std::vector<std::string>& paths, bool preserve_hierarchy)
    : m_preserve_hierarchy{preserve_hierarchy} {
  Parser parser{};
  for (const auto& path : paths) {
    m_paths.push_back(parser.parse(path));
  }
}

Result Pick::apply(Document document) const {
  if (m_paths.empty()) {
    return document;
  }
  if (m_preserve_hierarchy) {
    return pick_hierarchy(document);
  }
  if (m_paths.size() == 1) {
    return pick_single(document);
  }
  return pick_many(document);
}

std::string Pick::description() const {
  std::string rv{"pick("};
  for (auto it{m_paths.cbegin()}; it != m_paths.cend(); ++it) {
    if (it != m_paths.cbegin()) {
      rv += ", ";
    }
    rv += to_string(*it);
  }
  rv += ")";
  if (m_preserve_hierarchy) {
    rv += " [preserve hierarchy]";
  }
  return rv;
}

Document Pick::pick_single(const Document& document) const {
  const auto& path{m_paths.front()};

  if (!has_wildcard(path)) {
    auto found{find(document, path)};
    return found ? *found : Document{};
  }

  auto concrete{expand(document, path)};
  if (concrete.size() == 1) {
    return *find(document, concrete.front());
  }

  Sequence rv{};
  for (const auto& steps : concrete) {
    if (auto found{find(document, steps)}) {
      rv.push_back(*found);
    }
  }
  return rv;
}

Document Pick::pick_many(const Document& document) const {
  Mapping rv{};

  for (const auto& path : m_paths) {
    const auto& key{path.back().key};

    if (!has_wildcard(path)) {
      if (auto found{find(document, path)}) {
        rv[key] = *found;
      }
      continue;
    }

    Sequence values{};
    for (const auto& steps : expand(document, path)) {
      if (auto found{find(document, steps)}) {
        values.push_back(*found);
      }
    }
    if (!values.empty()) {
      rv[key] = std::move(values);
    }
  }

  if (rv.empty()) {
    return Document{};
  }
  return rv;
}

Document Pick::pick_hierarchy(const Document& document) const {
  Mapping rv{};
  for (const auto& path : m_paths) {
    for (const auto& steps : expand(document, path)) {
      if (auto found{find(document, steps)}) {
        set_overwrite(rv, steps, *found);
      }
    }
  }
  return rv;
}

} // namespace libflow
