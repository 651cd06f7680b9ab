// kaleido/basic/diagnostic.hpp - A user-facing error report
#pragma once

#include <optional>
#include <string>

#include "kaleido/basic/source_file.hpp"

namespace kaleido
{

/**
 * One error as shown to the user: a stable code, a message, the source range
 * it points at with a short label, and an optional hint.
 *
 * The front end stops at the first error, so a run produces at most one.
 */
struct Diagnostic
{
  std::string code;  // e.g. "E0002"; empty when the error has no code
  std::string message;
  SourceRange range;  // invalid when there is no source location
  std::string label;  // printed beside the marker under the source line
  std::optional<std::string> help;
};

}  // namespace kaleido
