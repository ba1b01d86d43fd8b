#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace hsearch::util {

/// Converts a string to lowercase for case-insensitive comparisons.
/// MUST avoid locale-sensitive behavior to keep parsing deterministic.
/// Inputs are strings; outputs are lowercase strings with no side effects.
std::string to_lower(const std::string& s);
/// Trims leading and trailing ASCII whitespace.
/// MUST preserve internal whitespace and MUST not modify the input.
/// Inputs are strings; outputs are trimmed strings with no side effects.
std::string trim_ws(const std::string& s);
/// Parses a non-negative decimal integer, rejecting signs and trailing characters.
/// MUST return nullopt on overflow instead of throwing.
std::optional<size_t> parse_size(const std::string& s);

}  // namespace hsearch::util
