#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "cli_args.h"

namespace hsearch::cli {

/// Settings read from config.toml; unset fields leave CLI defaults alone.
struct CliSettings {
  std::optional<std::string> output_mode;
  std::optional<bool> color;
  std::optional<size_t> max_results;
  std::optional<HtmlParserBackend> parser;
};

/// Resolves the config path: explicit flag, $HSEARCH_CONFIG, XDG, then ~/.config.
std::string resolve_config_path(const std::string& explicit_path);
/// Loads settings from a TOML-subset file.
/// Returns false with an empty error when the file does not exist.
/// MUST return false with a line-numbered error on malformed values.
bool load_config(const std::string& path, CliSettings& out, std::string& error);
/// Fills options the command line left unset; flags always win over the file.
void apply_cli_settings(const CliSettings& settings, CliOptions& options);

}  // namespace hsearch::cli
