#include "libflow/access.hpp"
#include "libflow/exceptions.hpp" // libflow::PathError
#include <cstddef>                // std::size_t
#include <utility>                // std::move
#include <variant>                // std::get_if

namespace libflow {

namespace {

void throw_for_wildcard(const steps_t& steps) {
  if (has_wildcard(steps)) {
    auto path{to_string(steps)};
    throw PathError("wildcard not allowed in a concrete path",
        PathErrorKind::wildcard_not_allowed, path, path.find("[*]"));
  }
}

} // namespace

const Document* find(const Document& document, const steps_t& steps) noexcept {
  const Document* current{&document};

  for (const auto& step : steps) {
    auto mapping{current->mapping()};
    if (!mapping) {
      return nullptr;
    }

    auto it{mapping->find(step.key)};
    if (it == mapping->end()) {
      return nullptr;
    }
    current = &it->second;

    if (step.is_wildcard()) {
      return nullptr;
    }

    if (auto index{std::get_if<std::size_t>(&step.index)}) {
      auto sequence{current->sequence()};
      if (!sequence || *index >= sequence->size()) {
        return nullptr;
      }
      current = &(*sequence)[*index];
    }
  }

  return current;
}

std::optional<Document> get(const Document& document, const steps_t& steps) {
  if (auto found{find(document, steps)}) {
    return *found;
  }
  return std::nullopt;
}

void set_overwrite(Mapping& root, const steps_t& steps, Document value) {
  throw_for_wildcard(steps);
  Mapping* current{&root};

  for (std::size_t i{0}; i < steps.size(); ++i) {
    const auto& step{steps[i]};
    const bool last{i == steps.size() - 1};
    auto& child{(*current)[step.key]};

    auto index{std::get_if<std::size_t>(&step.index)};
    if (!index) {
      if (last) {
        child = std::move(value);
        return;
      }
      if (!child.is_mapping()) {
        child = Mapping{};
      }
      current = child.mapping();
      continue;
    }

    if (!child.is_sequence()) {
      child = Sequence{};
    }
    auto sequence{child.sequence()};
    if (*index >= sequence->size()) {
      sequence->resize(*index + 1);
    }

    auto& element{(*sequence)[*index]};
    if (last) {
      element = std::move(value);
      return;
    }
    if (!element.is_mapping()) {
      element = Mapping{};
    }
    current = element.mapping();
  }
}

void remove(Document& root, const steps_t& steps) {
  throw_for_wildcard(steps);
  if (steps.empty()) {
    return;
  }

  // Walk to the container holding the last step's key.
  Document* parent{&root};
  for (std::size_t i{0}; i + 1 < steps.size(); ++i) {
    auto mapping{parent->mapping()};
    if (!mapping) {
      return;
    }
    auto it{mapping->find(steps[i].key)};
    if (it == mapping->end()) {
      return;
    }
    parent = &it->second;

    if (auto index{std::get_if<std::size_t>(&steps[i].index)}) {
      auto sequence{parent->sequence()};
      if (!sequence || *index >= sequence->size()) {
        return;
      }
      parent = &(*sequence)[*index];
    }
  }

  auto mapping{parent->mapping()};
  if (!mapping) {
    return;
  }

  const auto& step{steps.back()};
  auto it{mapping->find(step.key)};
  if (it == mapping->end()) {
    return;
  }

  auto index{std::get_if<std::size_t>(&step.index)};
  if (!index) {
    mapping->erase(it);
    return;
  }

  auto sequence{it->second.sequence()};
  if (!sequence || *index >= sequence->size()) {
    return;
  }
  sequence->erase(sequence->begin() + static_cast<std::ptrdiff_t>(*index));
}

} // namespace libflow
