#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

#include "cli_args.h"
#include "cli_utils.h"
#include "config.h"
#include "query_parser.h"

namespace {

void print_error(const std::string& message, bool color) {
  std::cerr << hsearch::cli::format_error(message, color) << std::endl;
}

bool debug_enabled() {
  const char* value = std::getenv("HSEARCH_DEBUG");
  return value != nullptr && *value != '\0';
}

std::string program_name(char** argv) {
  std::string name = (argv != nullptr && argv[0] != nullptr) ? argv[0] : "hsearch";
  size_t slash = name.find_last_of('/');
  return slash == std::string::npos ? name : name.substr(slash + 1);
}

int run(int argc, char** argv) {
  const std::string prog = program_name(argv);
  hsearch::cli::CliOptions options;
  std::string error;
  if (!hsearch::cli::parse_cli_args(argc, argv, options, error)) {
    print_error(error, false);
    std::cerr << hsearch::cli::usage(prog) << std::endl;
    return 1;
  }
  if (options.show_help) {
    hsearch::cli::print_help(std::cout, prog);
    return 0;
  }

  std::string config_path = hsearch::cli::resolve_config_path(options.config_path);
  hsearch::cli::CliSettings settings;
  if (!hsearch::cli::load_config(config_path, settings, error)) {
    if (!error.empty()) {
      print_error(error, false);
      return 1;
    }
    if (!options.config_path.empty()) {
      print_error("Config file not found: " + options.config_path, false);
      return 1;
    }
  }
  hsearch::cli::apply_cli_settings(settings, options);

  // Assumption: color defaults on but never reaches a pipe or file.
  const bool color_allowed = options.color.value_or(true);
  const bool color = color_allowed && hsearch::cli::stdout_is_tty();
  const bool error_color = color_allowed && hsearch::cli::stderr_is_tty();
  const bool debug = debug_enabled();

  if (debug) {
    hsearch::QueryParseResult parsed = hsearch::parse_query(options.query);
    if (parsed.query.has_value()) {
      std::cerr << "hsearch: query " << hsearch::query_to_string(*parsed.query) << std::endl;
    }
  }

  hsearch::SearchOptions search_options;
  search_options.max_results = options.max_results;
  search_options.parser = options.parser.value_or(hsearch::HtmlParserBackend::Strict);
  hsearch::SearchResult result = hsearch::search_inputs(options.query, options.inputs, search_options);
  if (result.error.has_value()) {
    print_error(hsearch::describe_error(*result.error), error_color);
    return 1;
  }
  if (debug) {
    for (const auto& entry : hsearch::cli::count_matches_by_path(result.matches)) {
      std::cerr << "hsearch: " << entry.first << ": " << entry.second << " match(es)" << std::endl;
    }
  }

  if (options.output_mode.value_or("plain") == "json") {
    std::cout << hsearch::cli::colorize_json(hsearch::cli::build_json(result.matches), color) << std::endl;
  } else {
    std::cout << hsearch::cli::format_plain(result.matches, color);
  }
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  try {
    return run(argc, argv);
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << std::endl;
    return 2;
  }
}
