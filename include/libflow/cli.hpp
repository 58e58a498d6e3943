#ifndef LIBFLOW_CLI_H
#define LIBFLOW_CLI_H

#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

namespace libflow {

// Everything the command line can configure.
struct Options {
  std::vector<std::string> pick_paths{};
  std::vector<std::string> set_pairs{};
  std::vector<std::string> delete_paths{};
  std::vector<std::string> where_pairs{};

  std::string input_file{};
  std::string output_file{};
  std::string input_dir{};

  // Empty means decide from the input file name or by detection.
  std::string from_format{};

  // Empty means json.
  std::string to_format{};

  bool compact{false};
  bool preserve_hierarchy{false};
  bool verbose{false};
  bool show_help{false};
  bool show_version{false};
};

// Parse command line arguments, not including the program name. Flags may
// be written with one or two leading dashes, and take their value from the
// next argument or after `=`. Throws a UsageError for unknown flags,
// missing values and conflicting arguments.
Options parse_args(const std::vector<std::string>& args);

// Return the help text for the executable named _program_.
std::string usage(std::string_view program);

} // namespace libflow

#endif // LIBFLOW_CLI_H
