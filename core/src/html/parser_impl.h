#pragma once

#include <string>

#include "../html_parser.h"

namespace hsearch {

/// Parses HTML with the built-in scanner that rejects unbalanced markup.
/// MUST be deterministic and MUST report the byte offset of the first problem.
/// Inputs are HTML strings; outputs are HtmlParseResult with no side effects.
HtmlParseResult parse_html_strict(const std::string& html);
/// Parses HTML using libxml2 in recovery mode.
/// MUST follow libxml2 recovery behavior and MUST not execute scripts.
/// Inputs are HTML strings; outputs are HtmlParseResult with no side effects.
HtmlParseResult parse_html_libxml2(const std::string& html);

}  // namespace hsearch
