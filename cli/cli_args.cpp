#include "cli_args.h"

#include <algorithm>

#include "html_parser.h"
#include "util/string_util.h"

namespace hsearch::cli {

namespace {

bool is_flag(const std::string& arg) {
  return arg.rfind("--", 0) == 0;
}

/// Applies one "--name value" pair to options.
/// MUST reject unknown names and malformed values with a user-facing message.
bool apply_value_flag(const std::string& name,
                      const std::string& value,
                      CliOptions& options,
                      std::string& error) {
  if (name == "--max-results") {
    // A negative limit is valid and selects nothing.
    bool negative = value.size() > 1 && value[0] == '-';
    std::optional<size_t> parsed = util::parse_size(negative ? value.substr(1) : value);
    if (!parsed.has_value()) {
      error = "Invalid max results";
      return false;
    }
    options.max_results = negative ? 0 : *parsed;
    return true;
  }
  if (name == "--mode") {
    if (value != "plain" && value != "json") {
      error = "Invalid --mode value (use plain|json)";
      return false;
    }
    options.output_mode = value;
    return true;
  }
  if (name == "--html-parser") {
    std::optional<HtmlParserBackend> backend = parse_backend_name(value);
    if (!backend.has_value()) {
      error = "Invalid --html-parser value (use strict|libxml2)";
      return false;
    }
    options.parser = backend;
    return true;
  }
  if (name == "--config") {
    options.config_path = value;
    return true;
  }
  error = "Unknown flag: " + name;
  return false;
}

}  // namespace

std::string usage(const std::string& prog_name) {
  return "Usage: " + prog_name + " query pattern [files...]";
}

void print_help(std::ostream& os, const std::string& prog_name) {
  os << usage(prog_name) << "\n\n";
  os << "Options:\n";
  os << "  --max-results <n>              Print at most n matches across all files\n";
  os << "  --mode plain|json              Output format (default: plain)\n";
  os << "  --html-parser strict|libxml2   HTML backend (default: strict)\n";
  os << "  --config <path>                Read settings from this config file\n";
  os << "  --color=disabled|enabled       Toggle ANSI colors\n";
  os << "  -h, --help                     Show this help\n\n";
  os << "If no files are given, HTML is read from stdin.\n";
  os << "Query syntax: tag#id.class[key=value], 'a b' (descendant), 'a > b' (child), 'a, b' (union).\n\n";
  os << "Examples:\n";
  os << "  " << prog_name << " \"div > h1.title\" index.html\n";
  os << "  " << prog_name << " \"ul li, p\" a.html b.html --max-results 5\n";
}

bool parse_cli_args(const std::vector<std::string>& args, CliOptions& options, std::string& error) {
  for (const auto& arg : args) {
    if (arg == "-h" || arg == "--help") {
      options.show_help = true;
      return true;
    }
  }

  CliOptions parsed;
  std::vector<std::string> positionals;
  std::vector<std::string> seen_flags;
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "--color=disabled") {
      parsed.color = false;
      continue;
    }
    if (arg == "--color=enabled") {
      parsed.color = true;
      continue;
    }
    if (is_flag(arg)) {
      if (i + 1 >= args.size()) {
        error = "Flag without value";
        return false;
      }
      // WHY: the first occurrence of a repeated flag wins; later values are not read.
      if (std::find(seen_flags.begin(), seen_flags.end(), arg) == seen_flags.end()) {
        if (!apply_value_flag(arg, args[i + 1], parsed, error)) {
          return false;
        }
        seen_flags.push_back(arg);
      }
      ++i;
      continue;
    }
    positionals.push_back(arg);
  }

  if (positionals.empty()) {
    error = "Not enough arguments";
    return false;
  }
  parsed.query = positionals.front();
  if (positionals.size() > 1) {
    parsed.inputs.kind = SearchInputs::Kind::Files;
    parsed.inputs.paths.assign(positionals.begin() + 1, positionals.end());
  }
  options = parsed;
  return true;
}

bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return parse_cli_args(args, options, error);
}

}  // namespace hsearch::cli
