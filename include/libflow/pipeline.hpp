#ifndef LIBFLOW_PIPELINE_H
#define LIBFLOW_PIPELINE_H

#include "libflow/document.hpp"
#include "libflow/operations.hpp"
#include <cstddef> // std::size_t
#include <memory>  // std::unique_ptr
#include <vector>  // std::vector

namespace libflow {

using operations_t = std::vector<std::unique_ptr<Operation>>;

// An ordered list of operations, applied left to right.
//
// A pipeline holds no state besides its operations, so it can be applied
// to any number of documents in turn.
class Pipeline {
public:
  Pipeline() = default;
  explicit Pipeline(operations_t operations)
      : m_operations{std::move(operations)} {};

  void append(std::unique_ptr<Operation> operation);

  bool empty() const noexcept { return m_operations.empty(); };
  std::size_t size() const noexcept { return m_operations.size(); };
  const operations_t& operations() const noexcept { return m_operations; };

  // Thread _document_ through every operation. Throws a StepError
  // identifying the failing operation if any operation throws. If an
  // operation returns the Filtered marker, later operations are not run and
  // the marker is returned.
  Result apply(Document document) const;

private:
  operations_t m_operations{};
};

} // namespace libflow

#endif // LIBFLOW_PIPELINE_H
