#ifndef LIBFLOW_PATH_H
#define LIBFLOW_PATH_H

#include <cstddef>     // std::size_t
#include <string>      // std::string
#include <string_view> // std::string_view
#include <variant>     // std::variant std::monostate
#include <vector>      // std::vector

namespace libflow {

// The wildcard index marker, `[*]`.
struct Wildcard {};

// A step's optional array index. std::monostate means the step does not
// index into a sequence.
using index_t = std::variant<std::monostate, std::size_t, Wildcard>;

// One dot separated part of a path. A key followed by an optional index or
// wildcard, like `items`, `items[0]` or `items[*]`.
struct Step {
  std::string key{};
  index_t index{};

  bool has_index() const noexcept {
    return !std::holds_alternative<std::monostate>(index);
  };

  bool is_wildcard() const noexcept {
    return std::holds_alternative<Wildcard>(index);
  };
};

bool operator==(const Step& lhs, const Step& rhs);

using steps_t = std::vector<Step>;

// The path parser.
//
// Paths are split on `.` and each part is parsed independently, so
// a parser holds no state between calls to _parse()_.
class Parser {
public:
  // Parse _path_ into a sequence of steps. Throws a PathError if _path_ is
  // empty or any of its segments is malformed.
  steps_t parse(std::string_view path) const;

protected:
  Step parse_segment(
      std::string_view segment, std::string_view path, std::size_t offset) const;

  // Convert the text between brackets to an index. Throws a PathError if
  // _body_ is empty or not a non-negative integer.
  index_t parse_index(std::string_view body, std::string_view segment,
      std::string_view path, std::size_t offset) const;
};

// Return a sequence of steps parsed from _path_.
steps_t parse(std::string_view path);

// Return a canonical string representation of a sequence of steps.
std::string to_string(const steps_t& steps);

// Return true if any step in _steps_ is a wildcard.
bool has_wildcard(const steps_t& steps);

// A _index_t_ visitor returning the bracketed representation of an index,
// or an empty string if there is no index.
struct IndexToStringVisitor {
  std::string operator()(const std::monostate&) const;
  std::string operator()(std::size_t index) const;
  std::string operator()(const Wildcard&) const;
};

} // namespace libflow

#endif // LIBFLOW_PATH_H
