#ifndef LIBFLOW_EXPAND_H
#define LIBFLOW_EXPAND_H

#include "libflow/document.hpp"
#include "libflow/path.hpp"
#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

namespace libflow {

// Return every concrete path in _document_ matched by _steps_, in ascending
// index order, depth first. Only existing indices are enumerated. A step
// that does not resolve contributes no paths. A path without wildcards
// yields itself if it resolves, and nothing otherwise.
std::vector<steps_t> expand(const Document& document, const steps_t& steps);

// Parse _path_ and return the string representation of every concrete path
// it matches in _document_. Throws a PathError if _path_ is malformed.
std::vector<std::string> expand(
    const Document& document, std::string_view path);

} // namespace libflow

#endif // LIBFLOW_EXPAND_H
