#include "config.h"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "html_parser.h"
#include "util/string_util.h"

namespace hsearch::cli {

namespace {

std::string get_env(const char* name) {
  if (const char* value = std::getenv(name)) {
    if (*value) return value;
  }
  return {};
}

bool parse_bool(const std::string& raw, bool& out) {
  std::string lower = util::to_lower(raw);
  if (lower == "true") {
    out = true;
    return true;
  }
  if (lower == "false") {
    out = false;
    return true;
  }
  return false;
}

std::string parse_string_value(const std::string& raw, bool& ok) {
  std::string trimmed = util::trim_ws(raw);
  if (trimmed.empty()) {
    ok = false;
    return {};
  }
  if (trimmed.front() == '"' || trimmed.front() == '\'') {
    if (trimmed.size() < 2 || trimmed.back() != trimmed.front()) {
      ok = false;
      return {};
    }
    ok = true;
    return trimmed.substr(1, trimmed.size() - 2);
  }
  ok = true;
  return trimmed;
}

}  // namespace

std::string resolve_config_path(const std::string& explicit_path) {
  if (!explicit_path.empty()) {
    return explicit_path;
  }
  std::string override = get_env("HSEARCH_CONFIG");
  if (!override.empty()) {
    return override;
  }
  std::string xdg_config = get_env("XDG_CONFIG_HOME");
  if (!xdg_config.empty()) {
    return (std::filesystem::path(xdg_config) / "hsearch" / "config.toml").string();
  }
  std::string home = get_env("HOME");
  if (!home.empty()) {
    return (std::filesystem::path(home) / ".config" / "hsearch" / "config.toml").string();
  }
  return "hsearch.config.toml";
}

bool load_config(const std::string& path, CliSettings& out, std::string& error) {
  out = CliSettings{};
  if (path.empty()) return false;
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return false;
  }
  std::ifstream in(path);
  if (!in) {
    error = "Failed to open config: " + path;
    return false;
  }
  std::string section;
  std::string line;
  size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    std::string trimmed = util::trim_ws(line);
    if (trimmed.empty()) continue;
    if (trimmed[0] == '#') continue;
    if (trimmed.size() >= 2 && trimmed[0] == '/' && trimmed[1] == '/') continue;
    if (trimmed.front() == '[' && trimmed.back() == ']') {
      section = util::trim_ws(trimmed.substr(1, trimmed.size() - 2));
      continue;
    }
    size_t eq = trimmed.find('=');
    if (eq == std::string::npos) {
      error = "Expected key = value at line " + std::to_string(line_no);
      return false;
    }
    std::string key = util::trim_ws(trimmed.substr(0, eq));
    std::string value = util::trim_ws(trimmed.substr(eq + 1));
    if (key.empty()) continue;
    std::string full_key = section.empty() ? key : section + "." + key;
    bool ok = false;
    if (full_key == "output.mode") {
      std::string parsed = parse_string_value(value, ok);
      if (!ok || (parsed != "plain" && parsed != "json")) {
        error = "Invalid output.mode at line " + std::to_string(line_no);
        return false;
      }
      out.output_mode = parsed;
    } else if (full_key == "output.color") {
      bool parsed = false;
      if (!parse_bool(value, parsed)) {
        error = "Invalid output.color at line " + std::to_string(line_no);
        return false;
      }
      out.color = parsed;
    } else if (full_key == "search.max_results") {
      std::string parsed = parse_string_value(value, ok);
      std::string lower = util::to_lower(parsed);
      if (ok && (lower == "inf" || lower == "unlimited")) {
        out.max_results.reset();
        continue;
      }
      std::optional<size_t> parsed_num = ok ? util::parse_size(parsed) : std::nullopt;
      if (!parsed_num.has_value()) {
        error = "Invalid search.max_results at line " + std::to_string(line_no);
        return false;
      }
      out.max_results = parsed_num;
    } else if (full_key == "html.parser") {
      std::string parsed = parse_string_value(value, ok);
      std::optional<HtmlParserBackend> backend =
          ok ? parse_backend_name(parsed) : std::nullopt;
      if (!backend.has_value()) {
        error = "Invalid html.parser at line " + std::to_string(line_no);
        return false;
      }
      out.parser = backend;
    }
  }
  return true;
}

void apply_cli_settings(const CliSettings& settings, CliOptions& options) {
  if (!options.output_mode.has_value()) {
    options.output_mode = settings.output_mode;
  }
  if (!options.color.has_value()) {
    options.color = settings.color;
  }
  if (!options.max_results.has_value()) {
    options.max_results = settings.max_results;
  }
  if (!options.parser.has_value()) {
    options.parser = settings.parser;
  }
}

}  // namespace hsearch::cli
