#include "libflow/runner.hpp"
#include "libflow/exceptions.hpp" // libflow::ArgumentError
#include "libflow/operations.hpp" // libflow::Pick libflow::Set
#include "libflow/utils.hpp"      // libflow::ends_with_icase
#include <algorithm>              // std::sort
#include <filesystem>             // std::filesystem
#include <fstream>                // std::ifstream
#include <glog/logging.h>         // LOG VLOG
#include <memory>                 // std::make_unique
#include <optional>               // std::optional
#include <system_error>           // std::error_code
#include <utility>                // std::move
#include <variant>                // std::get

namespace libflow {

using namespace std::string_literals;
namespace fs = std::filesystem;

namespace {

std::string join(const std::vector<std::string>& items) {
  std::string rv{};
  for (const auto& item : items) {
    if (!rv.empty()) {
      rv += ", ";
    }
    rv += item;
  }
  return rv;
}

std::string describe(const Pipeline& pipeline) {
  if (pipeline.empty()) {
    return "(empty)";
  }
  std::string rv{};
  for (const auto& operation : pipeline.operations()) {
    if (!rv.empty()) {
      rv += " | ";
    }
    rv += operation->description();
  }
  return rv;
}

bool has_extension(const fs::path& path, const std::vector<std::string>& extensions) {
  auto name{path.filename().string()};
  for (const auto& extension : extensions) {
    if (ends_with_icase(name, extension)) {
      return true;
    }
  }
  return false;
}

} // namespace

Pipeline build_pipeline(const Options& options) {
  Pipeline pipeline{};

  // Filter first so later operations only see documents that are kept.
  if (!options.where_pairs.empty()) {
    pipeline.append(
        std::make_unique<Where>(Where::from_pairs(options.where_pairs)));
  }

  if (!options.pick_paths.empty()) {
    pipeline.append(
        std::make_unique<Pick>(options.pick_paths, options.preserve_hierarchy));
  }

  if (!options.set_pairs.empty()) {
    pipeline.append(std::make_unique<Set>(Set::from_pairs(options.set_pairs)));
  }

  if (!options.delete_paths.empty()) {
    pipeline.append(std::make_unique<Delete>(options.delete_paths));
  }

  return pipeline;
}

std::string determine_input_format(const Options& options) {
  if (!options.from_format.empty()) {
    return options.from_format;
  }

  if (!options.input_file.empty()) {
    const auto& file{options.input_file};
    if (ends_with_icase(file, ".json")) {
      return "json";
    }
    if (ends_with_icase(file, ".yaml") || ends_with_icase(file, ".yml")) {
      return "yaml";
    }
    if (ends_with_icase(file, ".avro")) {
      return "avro";
    }
    if (ends_with_icase(file, ".parquet")) {
      return "parquet";
    }
  }

  return "";
}

std::string determine_output_format(const Options& options) {
  return options.to_format.empty() ? "json" : options.to_format;
}

std::vector<std::string> directory_extensions(std::string_view name) {
  if (name == "json") {
    return {".json"};
  }
  if (name == "yaml") {
    return {".yaml", ".yml"};
  }
  if (name == "avro") {
    return {".avro"};
  }
  if (name == "parquet") {
    return {".parquet"};
  }
  throw ArgumentError(
      "unknown format for directory processing: "s + std::string{name});
}

void run(std::istream& in, std::ostream& out, const Options& options,
    const Registry& registry) {
  auto pipeline{build_pipeline(options)};
  auto output{registry.get(determine_output_format(options))};
  auto formatter{output->new_formatter(out, FormatterOptions{options.compact})};

  std::shared_ptr<const Format> input{};
  std::optional<Detection> detection{};
  std::istream* source{&in};

  auto input_name{determine_input_format(options)};
  if (input_name.empty()) {
    detection.emplace(registry.auto_detect(in));
    input = detection->format();
    source = &detection->stream();
    VLOG(1) << "detected input format " << input->name() << " (confidence "
            << detection->confidence() << ")";
  } else {
    input = registry.get(input_name);
  }

  VLOG(1) << "reading " << input->name() << ", writing " << output->name();
  VLOG(1) << "pipeline: " << describe(pipeline);

  auto parser{input->new_parser(*source)};
  parser->for_each([&](Document document) {
    auto result{pipeline.apply(std::move(document))};
    if (!is_filtered(result)) {
      formatter->write(std::get<Document>(result));
    }
  });

  formatter->close();
}

DirectoryReport run_directory(
    const Options& options, const Registry& registry, std::ostream& out) {
  auto input_name{options.from_format.empty() ? "json"s : options.from_format};
  auto extensions{directory_extensions(input_name)};
  auto input{registry.get(input_name)};
  auto output{registry.get(determine_output_format(options))};
  auto pipeline{build_pipeline(options)};

  std::vector<fs::path> files{};
  std::error_code ec{};
  fs::recursive_directory_iterator it{options.input_dir, ec};
  for (; !ec && it != fs::recursive_directory_iterator{}; it.increment(ec)) {
    std::error_code status_ec{};
    if (it->is_regular_file(status_ec) &&
        has_extension(it->path(), extensions)) {
      files.push_back(it->path());
    }
  }
  if (ec) {
    throw ArgumentError("error walking directory "s + options.input_dir +
                        ": " + ec.message());
  }
  std::sort(files.begin(), files.end());

  VLOG(1) << "pipeline: " << describe(pipeline);

  DirectoryReport report{};
  auto formatter{output->new_formatter(out, FormatterOptions{options.compact})};

  for (const auto& path : files) {
    ++report.files;
    auto name{path.string()};
    VLOG(1) << "processing " << name;

    std::ifstream file{path, std::ios::binary};
    if (!file) {
      report.errors.push_back("failed to open "s + name);
      LOG(ERROR) << report.errors.back();
      continue;
    }

    try {
      auto parser{input->new_parser(file)};
      std::int64_t row{0};
      parser->for_each([&](Document document) {
        ++row;
        auto result{pipeline.apply(std::move(document))};
        if (is_filtered(result)) {
          return;
        }
        formatter->write(Mapping{
            {"_file", name},
            {"_row", row},
            {"data", std::move(std::get<Document>(result))},
        });
      });
    } catch (const std::exception& e) {
      report.errors.push_back("failed to process "s + name + ": " + e.what());
      LOG(ERROR) << report.errors.back();
    }
  }

  formatter->close();

  if (report.files == 0) {
    LOG(WARNING) << "no files with extensions " << join(extensions)
                 << " found in " << options.input_dir;
  }

  if (!report.ok()) {
    LOG(ERROR) << "encountered " << report.errors.size()
               << " error(s) during processing";
    for (std::size_t i{0}; i < report.errors.size(); ++i) {
      LOG(ERROR) << "  " << i + 1 << ". " << report.errors[i];
    }
  }

  return report;
}

} // namespace libflow
