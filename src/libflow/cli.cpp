#include "libflow/cli.hpp"
#include "libflow/exceptions.hpp" // libflow::UsageError
#include <cstddef>                // std::size_t
#include <functional>             // std::less
#include <map>                    // std::map
#include <optional>               // std::optional

namespace libflow {

using namespace std::string_literals;

namespace {

enum class FlagKind {
  list,
  string,
  boolean,
};

struct Flag {
  FlagKind kind;
  std::vector<std::string> Options::*list{nullptr};
  std::string Options::*string{nullptr};
  bool Options::*boolean{nullptr};
};

Flag list_flag(std::vector<std::string> Options::*member) {
  return Flag{FlagKind::list, member, nullptr, nullptr};
}

Flag string_flag(std::string Options::*member) {
  return Flag{FlagKind::string, nullptr, member, nullptr};
}

Flag bool_flag(bool Options::*member) {
  return Flag{FlagKind::boolean, nullptr, nullptr, member};
}

const std::map<std::string, Flag, std::less<>> FLAGS{
    {"pick", list_flag(&Options::pick_paths)},
    {"set", list_flag(&Options::set_pairs)},
    {"delete", list_flag(&Options::delete_paths)},
    {"where", list_flag(&Options::where_pairs)},
    {"in", string_flag(&Options::input_file)},
    {"out", string_flag(&Options::output_file)},
    {"dir", string_flag(&Options::input_dir)},
    {"from", string_flag(&Options::from_format)},
    {"to", string_flag(&Options::to_format)},
    {"compact", bool_flag(&Options::compact)},
    {"preserve-hierarchy", bool_flag(&Options::preserve_hierarchy)},
    {"verbose", bool_flag(&Options::verbose)},
    {"v", bool_flag(&Options::verbose)},
    {"help", bool_flag(&Options::show_help)},
    {"h", bool_flag(&Options::show_help)},
    {"version", bool_flag(&Options::show_version)},
};

bool parse_bool(std::string_view name, std::string_view value) {
  if (value == "true" || value == "1") {
    return true;
  }
  if (value == "false" || value == "0") {
    return false;
  }
  throw UsageError("invalid boolean value \""s + std::string{value} +
                   "\" for flag -" + std::string{name});
}

} // namespace

Options parse_args(const std::vector<std::string>& args) {
  Options options{};
  std::optional<std::string> positional{};
  bool flags_done{false};

  for (std::size_t i{0}; i < args.size(); ++i) {
    std::string_view arg{args[i]};

    if (flags_done || arg.size() < 2 || arg[0] != '-') {
      if (positional) {
        throw UsageError("unexpected argument \""s + std::string{arg} + "\"");
      }
      positional = std::string{arg};
      continue;
    }

    if (arg == "--") {
      flags_done = true;
      continue;
    }

    auto name{arg.substr(arg[1] == '-' ? 2 : 1)};
    std::optional<std::string_view> inline_value{};
    if (auto eq{name.find('=')}; eq != std::string_view::npos) {
      inline_value = name.substr(eq + 1);
      name = name.substr(0, eq);
    }

    auto it{FLAGS.find(name)};
    if (it == FLAGS.end()) {
      throw UsageError("flag provided but not defined: -"s + std::string{name});
    }

    const auto& flag{it->second};
    if (flag.kind == FlagKind::boolean) {
      options.*flag.boolean =
          inline_value ? parse_bool(name, *inline_value) : true;
      continue;
    }

    std::string value{};
    if (inline_value) {
      value = std::string{*inline_value};
    } else if (i + 1 < args.size()) {
      value = args[++i];
    } else {
      throw UsageError("flag needs an argument: -"s + std::string{name});
    }

    if (flag.kind == FlagKind::list) {
      (options.*flag.list).push_back(std::move(value));
    } else {
      options.*flag.string = std::move(value);
    }
  }

  if (positional) {
    if (!options.input_file.empty()) {
      throw UsageError("input file given both as -in and as an argument");
    }
    options.input_file = std::move(*positional);
  }

  if (!options.input_dir.empty() && !options.input_file.empty()) {
    throw UsageError("-dir can not be combined with an input file");
  }

  return options;
}

std::string usage(std::string_view program) {
  auto name{std::string{program}};
  return "Usage: "s + name + " [flags] [input file]\n"
         "\n"
         "Extract, modify and filter JSON, YAML, Avro and Parquet documents.\n"
         "\n"
         "Flags:\n"
         "  -pick <path>           pick a value by path (repeatable)\n"
         "  -set <path=value>      set a value, parsed as JSON if possible "
         "(repeatable)\n"
         "  -delete <path>         delete a value by path (repeatable)\n"
         "  -where <path=value>    keep documents where every condition holds "
         "(repeatable)\n"
         "  -in <file>             read from a file instead of stdin\n"
         "  -out <file>            write to a file instead of stdout\n"
         "  -dir <directory>       process every matching file in a directory\n"
         "  -from <format>         input format: json, yaml, avro or parquet\n"
         "  -to <format>           output format: json or yaml (default json)\n"
         "  -compact               write compact output\n"
         "  -preserve-hierarchy    keep the full path structure in picked "
         "output\n"
         "  -v, -verbose           log progress to stderr\n"
         "  -h, -help              show this help\n"
         "  -version               show version information\n"
         "\n"
         "Examples:\n"
         "  " + name + " -in users.json -pick users[*].name\n"
         "  " + name + " -in config.yaml -set server.port=8080 -to json\n"
         "  " + name + " -dir ./logs -from json -where level=error\n";
}

} // namespace libflow
