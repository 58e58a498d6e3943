#include "libflow/expand.hpp"
#include <cstddef> // std::size_t
#include <variant> // std::get_if

namespace libflow {

namespace {

void expand_steps(const Document& document, const steps_t& steps,
    std::size_t position, steps_t& prefix, std::vector<steps_t>& out) {
  if (position == steps.size()) {
    out.push_back(prefix);
    return;
  }

  const auto& step{steps[position]};
  auto mapping{document.mapping()};
  if (!mapping) {
    return;
  }

  auto it{mapping->find(step.key)};
  if (it == mapping->end()) {
    return;
  }

  const auto& child{it->second};

  if (!step.has_index()) {
    prefix.push_back(step);
    expand_steps(child, steps, position + 1, prefix, out);
    prefix.pop_back();
    return;
  }

  auto sequence{child.sequence()};
  if (!sequence) {
    return;
  }

  if (auto index{std::get_if<std::size_t>(&step.index)}) {
    if (*index >= sequence->size()) {
      return;
    }
    prefix.push_back(step);
    expand_steps((*sequence)[*index], steps, position + 1, prefix, out);
    prefix.pop_back();
    return;
  }

  for (std::size_t i{0}; i < sequence->size(); ++i) {
    prefix.push_back(Step{step.key, i});
    expand_steps((*sequence)[i], steps, position + 1, prefix, out);
    prefix.pop_back();
  }
}

} // namespace

std::vector<steps_t> expand(const Document& document, const steps_t& steps) {
  std::vector<steps_t> rv{};
  steps_t prefix{};
  prefix.reserve(steps.size());
  expand_steps(document, steps, 0, prefix, rv);
  return rv;
}

std::vector<std::string> expand(
    const Document& document, std::string_view path) {
  std::vector<std::string> rv{};
  for (const auto& concrete : expand(document, parse(path))) {
    rv.push_back(to_string(concrete));
  }
  return rv;
}

} // namespace libflow
