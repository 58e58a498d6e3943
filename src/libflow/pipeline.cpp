#include "libflow/pipeline.hpp"
#include "libflow/exceptions.hpp" // libflow::StepError
#include <exception>              // std::exception
#include <utility>                // std::move
#include <variant>                // std::get

namespace libflow {

void Pipeline::append(std::unique_ptr<Operation> operation) {
  m_operations.push_back(std::move(operation));
}

Result Pipeline::apply(Document document) const {
  Result current{std::move(document)};

  for (std::size_t i{0}; i < m_operations.size(); ++i) {
    if (is_filtered(current)) {
      break;
    }

    const auto& operation{m_operations[i]};
    try {
      current = operation->apply(std::get<Document>(std::move(current)));
    } catch (const std::exception& e) {
      throw StepError(i, operation->description(), e.what());
    }
  }

  return current;
}

} // namespace libflow
