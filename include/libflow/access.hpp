#ifndef LIBFLOW_ACCESS_H
#define LIBFLOW_ACCESS_H

#include "libflow/document.hpp"
#include "libflow/path.hpp"
#include <optional> // std::optional

namespace libflow {

// Return a pointer to the value at _steps_ in _document_, or a null pointer
// if the path does not resolve. A key step requires a mapping containing
// the key, an index step additionally requires a sequence with the index in
// range. A wildcard step never resolves.
const Document* find(const Document& document, const steps_t& steps) noexcept;

// Return a copy of the value at _steps_, or std::nullopt if not found.
std::optional<Document> get(const Document& document, const steps_t& steps);

// Assign _value_ at _steps_ in _root_, creating intermediate mappings and
// sequences as needed. Any existing value whose type does not fit the next
// step is replaced. Sequences grow to exactly the needed length, padded
// with null.
//
// Throws a PathError if _steps_ contains a wildcard.
void set_overwrite(Mapping& root, const steps_t& steps, Document value);

// Remove the value at _steps_ from _root_. Removing a sequence element
// shifts later elements left. Does nothing if the path does not resolve.
//
// Throws a PathError if _steps_ contains a wildcard.
void remove(Document& root, const steps_t& steps);

} // namespace libflow

#endif // LIBFLOW_ACCESS_H
