#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "hsearch/hsearch.h"

namespace hsearch::cli {

/// Captures CLI arguments so main can dispatch without re-parsing raw argv.
/// Unset optionals fall back to the config file, then to built-in defaults.
/// Inputs are argv; outputs are populated fields with no side effects by itself.
struct CliOptions {
  std::string query;
  SearchInputs inputs;
  std::optional<size_t> max_results;
  std::optional<std::string> output_mode;
  std::optional<HtmlParserBackend> parser;
  std::optional<bool> color;
  std::string config_path;
  bool show_help = false;
};

/// Returns the one-line usage string for a program name.
std::string usage(const std::string& prog_name);
/// Prints the full help text for -h/--help.
/// MUST remain accurate to supported flags and MUST not throw on stream failures.
void print_help(std::ostream& os, const std::string& prog_name);
/// Parses arguments (without argv[0]) into options and reports a user-facing error string.
/// Value flags may appear in any position; -h/--help anywhere wins over everything else.
/// MUST return false on invalid flags and MUST not throw.
bool parse_cli_args(const std::vector<std::string>& args, CliOptions& options, std::string& error);
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

}  // namespace hsearch::cli
