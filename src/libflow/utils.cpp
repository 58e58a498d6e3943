#include "libflow/utils.hpp"
#include <cctype> // std::tolower

namespace libflow {

namespace {
constexpr std::string_view WHITESPACE{" \t\n\r\f\v"};
}

std::string_view trim(std::string_view s) noexcept {
  auto start{s.find_first_not_of(WHITESPACE)};
  if (start == std::string_view::npos) {
    return {};
  }
  auto end{s.find_last_not_of(WHITESPACE)};
  return s.substr(start, end - start + 1);
}

std::optional<std::pair<std::string, std::string>> split_assignment(
    std::string_view s) {
  auto eq{s.find('=')};
  if (eq == std::string_view::npos) {
    return std::nullopt;
  }
  return std::pair{
      std::string{trim(s.substr(0, eq))}, std::string{trim(s.substr(eq + 1))}};
}

bool ends_with_icase(std::string_view s, std::string_view suffix) noexcept {
  if (suffix.size() > s.size()) {
    return false;
  }
  auto tail{s.substr(s.size() - suffix.size())};
  for (std::size_t i{0}; i < tail.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(tail[i])) !=
        std::tolower(static_cast<unsigned char>(suffix[i]))) {
      return false;
    }
  }
  return true;
}

} // namespace libflow
