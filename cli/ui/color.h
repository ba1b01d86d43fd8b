#pragma once

namespace hsearch::cli {

/// ANSI codes for match paths, JSON highlighting and error lines.
/// MUST stay ASCII-only; callers skip them entirely when stdout is not a TTY.
struct Color {
  const char* reset = "\033[0m";
  const char* red = "\033[31m";
  const char* green = "\033[32m";
  const char* cyan = "\033[36m";
  const char* dim = "\033[2m";
};

/// Provides a shared color palette instance to keep output styling consistent.
/// MUST be initialized exactly once and MUST remain immutable in normal usage.
/// Inputs/outputs are the global instance; side effects happen on usage in I/O.
extern Color kColor;

}  // namespace hsearch::cli
