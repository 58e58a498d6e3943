#include "libflow/cli.hpp"
#include "libflow/exceptions.hpp"
#include "libflow/flow.hpp"
#include "libflow/runner.hpp"
#include <fstream>
#include <glog/logging.h>
#include <iostream>
#include <string>
#include <vector>

namespace {

int run_stream(const libflow::Options& options, libflow::Registry& registry) {
  std::ifstream input_file{};
  std::istream* in{&std::cin};
  if (!options.input_file.empty()) {
    input_file.open(options.input_file, std::ios::binary);
    if (!input_file) {
      LOG(ERROR) << "error opening input: " << options.input_file;
      return 1;
    }
    in = &input_file;
  }

  std::ofstream output_file{};
  std::ostream* out{&std::cout};
  if (!options.output_file.empty()) {
    output_file.open(options.output_file, std::ios::binary | std::ios::trunc);
    if (!output_file) {
      LOG(ERROR) << "error opening output: " << options.output_file;
      return 1;
    }
    out = &output_file;
  }

  libflow::run(*in, *out, options, registry);
  out->flush();
  return 0;
}

int run_directory(const libflow::Options& options, libflow::Registry& registry) {
  std::ofstream output_file{};
  std::ostream* out{&std::cout};
  if (!options.output_file.empty()) {
    output_file.open(options.output_file, std::ios::binary | std::ios::trunc);
    if (!output_file) {
      LOG(ERROR) << "error opening output: " << options.output_file;
      return 1;
    }
    out = &output_file;
  }

  auto report{libflow::run_directory(options, registry, *out)};
  out->flush();
  return report.ok() ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
  FLAGS_logtostderr = true;
  google::InitGoogleLogging(argv[0]);

  std::vector<std::string> args{argv + 1, argv + argc};
  libflow::Options options{};
  try {
    options = libflow::parse_args(args);
  } catch (const libflow::UsageError& e) {
    std::cerr << e.what() << "\n\n" << libflow::usage(argv[0]);
    return 2;
  }

  if (options.show_help) {
    std::cout << libflow::usage(argv[0]);
    return 0;
  }

  if (options.show_version) {
    std::cout << argv[0] << " Version " << LIBFLOW_VERSION_MAJOR << "."
              << LIBFLOW_VERSION_MINOR << "." << LIBFLOW_VERSION_PATCH
              << std::endl;
    return 0;
  }

  if (options.verbose) {
    FLAGS_v = 1;
  }

  auto& registry{libflow::default_registry()};
  libflow::register_builtin_formats(registry);

  try {
    if (!options.input_dir.empty()) {
      return run_directory(options, registry);
    }
    return run_stream(options, registry);
  } catch (const std::exception& e) {
    LOG(ERROR) << e.what();
    return 1;
  }
}
