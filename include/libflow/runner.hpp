#ifndef LIBFLOW_RUNNER_H
#define LIBFLOW_RUNNER_H

#include "libflow/cli.hpp"
#include "libflow/formats/registry.hpp"
#include "libflow/pipeline.hpp"
#include <cstddef>     // std::size_t
#include <iostream>    // std::istream std::ostream
#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

namespace libflow {

// Return a pipeline of the operations configured in _options_, in the
// order where, pick, set, delete. Throws an ArgumentError or PathError for
// malformed arguments.
Pipeline build_pipeline(const Options& options);

// Return the name of the input format, from `-from` or the input file's
// extension. An empty string means the format must be detected.
std::string determine_input_format(const Options& options);

// Return the name of the output format, `json` unless `-to` was given.
std::string determine_output_format(const Options& options);

// Return the file extensions read in directory mode for format _name_.
// Throws an ArgumentError for an unknown format.
std::vector<std::string> directory_extensions(std::string_view name);

// Parse every document in _in_, apply the configured pipeline and write
// the surviving documents to _out_. The first error is thrown.
void run(std::istream& in, std::ostream& out, const Options& options,
    const Registry& registry);

struct DirectoryReport {
  std::size_t files{0};
  std::vector<std::string> errors{};

  bool ok() const noexcept { return errors.empty(); };
};

// Process every file below `options.input_dir` whose extension belongs to
// the input format, in sorted path order. Each output document is wrapped
// as `{"_file": ..., "_row": ..., "data": ...}`. A failing file does not
// stop the run; its error is recorded in the report.
DirectoryReport run_directory(
    const Options& options, const Registry& registry, std::ostream& out);

} // namespace libflow

#endif // LIBFLOW_RUNNER_H
