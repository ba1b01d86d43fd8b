#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "hsearch/hsearch.h"

namespace hsearch::cli {

/// Renders matches the plain way: path line, subtree, blank separator.
/// MUST keep result order and MUST color only the path line when color is set.
/// Inputs are matches/flag; outputs are text with no side effects.
std::string format_plain(const std::vector<FileMatch>& matches, bool color);
/// Formats one "Error: ..." line without the trailing newline.
/// MUST close the color before the line ends so the terminal is reset for the next line.
std::string format_error(const std::string& message, bool color);
/// Serializes matches into a JSON array of {path, tag, attributes, html} objects.
/// MUST keep attribute order and duplicates as [key, value] pairs.
std::string build_json(const std::vector<FileMatch>& matches);
/// Applies ANSI coloring to JSON for readability when enabled.
/// MUST NOT alter JSON semantics and MUST be disabled for non-TTY output.
/// Inputs are JSON text and a flag; outputs are colored text with no side effects.
std::string colorize_json(const std::string& input, bool enable);
/// Counts matches per path in first-seen order for debug output.
std::vector<std::pair<std::string, size_t>> count_matches_by_path(const std::vector<FileMatch>& matches);
/// Checks whether stdout is attached to a terminal.
bool stdout_is_tty();
/// Checks whether stderr is attached to a terminal; error lines are colored only then.
bool stderr_is_tty();

}  // namespace hsearch::cli
