#ifndef LIBFLOW_UTILS_H
#define LIBFLOW_UTILS_H

#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view
#include <utility>     // std::pair

namespace libflow {

// Return _s_ without leading and trailing ASCII whitespace.
std::string_view trim(std::string_view s) noexcept;

// Split _s_ on its first `=`, trimming both sides. Returns std::nullopt if
// _s_ does not contain `=`.
std::optional<std::pair<std::string, std::string>> split_assignment(
    std::string_view s);

// Return true if _s_ ends with _suffix_, ignoring ASCII case.
bool ends_with_icase(std::string_view s, std::string_view suffix) noexcept;

} // namespace libflow

#endif // LIBFLOW_UTILS_H
