#ifndef LIBFLOW_DOCUMENT_H
#define LIBFLOW_DOCUMENT_H

#include <cstddef>  // std::nullptr_t
#include <cstdint>  // std::int64_t
#include <iostream> // std::ostream
#include <map>      // std::map
#include <string>   // std::string
#include <utility>  // std::move
#include <variant>  // std::variant std::get_if
#include <vector>   // std::vector

namespace libflow {

struct Document;

// Mapping keys are kept sorted, so mappings serialize in key order.
using Mapping = std::map<std::string, Document>;
using Sequence = std::vector<Document>;

enum class Kind {
  null,
  boolean,
  integer,
  real,
  string,
  sequence,
  mapping,
};

// Return a string representation of Kind _kind_.
std::string kind_to_string(Kind kind);

// One decoded unit of structured data. The order of alternatives in
// _value_t_ matches the order of Kind.
struct Document {
  using value_t = std::variant<std::nullptr_t, bool, std::int64_t, double,
      std::string, Sequence, Mapping>;

  value_t value{nullptr};

  Document() = default;
  Document(std::nullptr_t) : value{nullptr} {};
  Document(bool b) : value{b} {};
  Document(int i) : value{static_cast<std::int64_t>(i)} {};
  Document(std::int64_t i) : value{i} {};
  Document(double d) : value{d} {};
  Document(const char* s) : value{std::string{s}} {};
  Document(std::string s) : value{std::move(s)} {};
  Document(Sequence s) : value{std::move(s)} {};
  Document(Mapping m) : value{std::move(m)} {};

  Kind kind() const noexcept { return static_cast<Kind>(value.index()); };

  bool is_null() const noexcept { return kind() == Kind::null; };
  bool is_sequence() const noexcept { return kind() == Kind::sequence; };
  bool is_mapping() const noexcept { return kind() == Kind::mapping; };

  // Narrowing accessors. Each returns a null pointer if this document does
  // not hold the requested alternative.
  Mapping* mapping() noexcept { return std::get_if<Mapping>(&value); };
  const Mapping* mapping() const noexcept {
    return std::get_if<Mapping>(&value);
  };
  Sequence* sequence() noexcept { return std::get_if<Sequence>(&value); };
  const Sequence* sequence() const noexcept {
    return std::get_if<Sequence>(&value);
  };
};

bool operator==(const Document& lhs, const Document& rhs);

// Return the default text representation of _document_, as used when
// comparing documents against strings. Mappings are rendered as
// `map[k:v ...]`, sequences as `[a b]` and null as `<nil>`.
std::string to_display_string(const Document& document);

// Return a string representation of a double in its shortest round
// trippable form, switching to exponent notation for very large or very
// small magnitudes.
std::string format_double(double d);

std::ostream& operator<<(std::ostream& os, const Document& document);

// A _value_t_ visitor returning the display string for each alternative.
struct DisplayStringVisitor {
  std::string operator()(std::nullptr_t) const;
  std::string operator()(bool b) const;
  std::string operator()(std::int64_t i) const;
  std::string operator()(double d) const;
  std::string operator()(const std::string& s) const;
  std::string operator()(const Sequence& sequence) const;
  std::string operator()(const Mapping& mapping) const;
};

} // namespace libflow

#endif // LIBFLOW_DOCUMENT_H
