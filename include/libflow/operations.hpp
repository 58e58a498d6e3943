#ifndef LIBFLOW_OPERATIONS_H
#define LIBFLOW_OPERATIONS_H

#include "libflow/document.hpp"
#include "libflow/path.hpp"
#include <string>  // std::string
#include <utility> // std::move
#include <variant> // std::variant std::holds_alternative
#include <vector>  // std::vector

namespace libflow {

// The marker an operation returns when a document should be dropped. It is
// distinct from a null document.
struct Filtered {};

inline bool operator==(const Filtered&, const Filtered&) noexcept {
  return true;
}

using Result = std::variant<Document, Filtered>;

inline bool is_filtered(const Result& result) noexcept {
  return std::holds_alternative<Filtered>(result);
}

// A transformation applied to one document at a time.
class Operation {
public:
  virtual ~Operation() = default;

  // Transform _document_, returning the new document or the Filtered
  // marker. Callers must use the returned value in place of _document_.
  virtual Result apply(Document document) const = 0;

  // A short human readable description, used in error messages.
  virtual std::string description() const = 0;
};

// Extract values from a document.
//
// In flattened mode a single path yields its value directly (or an array
// of values when a wildcard matches several elements), and several paths
// yield a mapping keyed by each path's final key. With _preserve_hierarchy_
// the result is always a mapping that reproduces the nesting of every
// picked value.
class Pick : public Operation {
public:
  explicit Pick(
      const std::vector<std::string>& paths, bool preserve_hierarchy = false);

  Result apply(Document document) const override;
  std::string description() const override;

protected:
  Document pick_single(const Document& document) const;
  Document pick_many(const Document& document) const;
  Document pick_hierarchy(const Document& document) const;

private:
  std::vector<steps_t> m_paths{};
  bool m_preserve_hierarchy{false};
};

struct Assignment {
  steps_t path{};
  Document value{};
};

// Assign values at paths, creating or overwriting intermediate structure.
// A document that is not a mapping is replaced by an empty mapping before
// the first assignment.
class Set : public Operation {
public:
  explicit Set(std::vector<Assignment> assignments)
      : m_assignments{std::move(assignments)} {};

  // Build a Set from `path=value` strings. The value is parsed as JSON if
  // possible, otherwise it is used as a literal string.
  //
  // Throws an ArgumentError if a pair has no `=` or an empty path, and a
  // PathError if a path is malformed.
  static Set from_pairs(const std::vector<std::string>& pairs);

  Result apply(Document document) const override;
  std::string description() const override;

  const std::vector<Assignment>& assignments() const noexcept {
    return m_assignments;
  };

private:
  std::vector<Assignment> m_assignments{};
};

// Remove values at paths. Paths are applied in order, each one expanded
// against the document as left by the previous deletion.
class Delete : public Operation {
public:
  explicit Delete(const std::vector<std::string>& paths);

  Result apply(Document document) const override;
  std::string description() const override;

private:
  std::vector<steps_t> m_paths{};
};

struct Condition {
  steps_t path{};
  std::string expected{};
};

// Keep documents for which every condition holds. A condition holds when
// its path resolves and the display string of the resolved value equals
// the expected string.
class Where : public Operation {
public:
  explicit Where(std::vector<Condition> conditions)
      : m_conditions{std::move(conditions)} {};

  // Build a Where from `path=expected` strings. Both sides are trimmed.
  //
  // Throws an ArgumentError if a pair has no `=` or an empty path, and a
  // PathError if a path is malformed.
  static Where from_pairs(const std::vector<std::string>& pairs);

  Result apply(Document document) const override;
  std::string description() const override;

  bool matches(const Document& document) const;

private:
  std::vector<Condition> m_conditions{};
};

} // namespace libflow

#endif // LIBFLOW_OPERATIONS_H
