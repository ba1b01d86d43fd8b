#include "cli_utils.h"

#include <cctype>
#include <cstdio>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "ui/color.h"

namespace hsearch::cli {

std::string format_plain(const std::vector<FileMatch>& matches, bool color) {
  std::string out;
  for (const auto& match : matches) {
    if (color) out += kColor.cyan;
    out += match.path;
    if (color) out += kColor.reset;
    out += "\n";
    out += render_html(match.node);
    out += "\n\n\n";
  }
  return out;
}

std::string format_error(const std::string& message, bool color) {
  std::string out;
  if (color) out += kColor.red;
  out += "Error: " + message;
  if (color) out += kColor.reset;
  return out;
}

std::string build_json(const std::vector<FileMatch>& matches) {
  using nlohmann::json;
  json out = json::array();
  for (const auto& match : matches) {
    json obj = json::object();
    obj["path"] = match.path;
    const auto& element = match.node.element();
    obj["tag"] = element.tag;
    json attrs = json::array();
    for (const auto& attr : element.attributes) {
      attrs.push_back(json::array({attr.first, attr.second}));
    }
    obj["attributes"] = attrs;
    obj["html"] = render_html(match.node);
    out.push_back(obj);
  }
  // WHY: HTML bytes are not guaranteed UTF-8; replace instead of throwing.
  return out.dump(2, ' ', false, json::error_handler_t::replace);
}

std::string colorize_json(const std::string& input, bool enable) {
  if (!enable) return input;
  std::string out;
  out.reserve(input.size() * 2);
  bool in_string = false;
  bool escape = false;
  for (size_t i = 0; i < input.size(); ++i) {
    char c = input[i];
    if (in_string) {
      if (escape) {
        escape = false;
      } else if (c == '\\') {
        escape = true;
      } else if (c == '"') {
        in_string = false;
        out += '"';
        out += kColor.reset;
        continue;
      }
      out += c;
      continue;
    }

    if (c == '"') {
      in_string = true;
      out += kColor.green;
      out += '"';
      continue;
    }

    if (std::isdigit(static_cast<unsigned char>(c)) || c == '-') {
      out += kColor.cyan;
      while (i < input.size() &&
             (std::isdigit(static_cast<unsigned char>(input[i])) || input[i] == '.' || input[i] == '-' ||
              input[i] == 'e' || input[i] == 'E' || input[i] == '+')) {
        out += input[i++];
      }
      --i;
      out += kColor.reset;
      continue;
    }

    if (c == '{' || c == '}' || c == '[' || c == ']' || c == ':' || c == ',') {
      out += kColor.dim;
      out += c;
      out += kColor.reset;
      continue;
    }

    out += c;
  }
  return out;
}

std::vector<std::pair<std::string, size_t>> count_matches_by_path(const std::vector<FileMatch>& matches) {
  std::vector<std::pair<std::string, size_t>> counts;
  for (const auto& match : matches) {
    if (counts.empty() || counts.back().first != match.path) {
      counts.emplace_back(match.path, 0);
    }
    ++counts.back().second;
  }
  return counts;
}

bool stdout_is_tty() {
  return isatty(fileno(stdout)) != 0;
}

bool stderr_is_tty() {
  return isatty(fileno(stderr)) != 0;
}

}  // namespace hsearch::cli
