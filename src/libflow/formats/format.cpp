#include "libflow/formats/format.hpp"

namespace libflow {

std::string_view trim_leading_space(std::string_view prefix) noexcept {
  auto start{prefix.find_first_not_of(" \t\r\n")};
  if (start == std::string_view::npos) {
    return {};
  }
  return prefix.substr(start);
}

bool looks_like_key_value(std::string_view prefix) noexcept {
  auto line{prefix.substr(0, prefix.find('\n'))};

  auto colon{line.find(':')};
  if (colon == std::string_view::npos) {
    return false;
  }

  // npos compares greater than any position
  return colon < line.find(',') && colon < line.find('}');
}

} // namespace libflow
