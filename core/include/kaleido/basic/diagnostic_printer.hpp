// kaleido/basic/diagnostic_printer.hpp - Terminal rendering of diagnostics
#pragma once

#include <iosfwd>
#include <string_view>

#include "kaleido/basic/diagnostic.hpp"
#include "kaleido/basic/source_file.hpp"

namespace kaleido
{

/**
 * Renders a diagnostic against its source line:
 *
 *   error[E0002]: invalid operator ':'
 *       --> demo.kl:1:3
 *         |
 *       1 | x : 1
 *         |   ^ no binding power configured
 *         |
 *         = help: configured operators are * + - /
 *
 * Colors go through rang and are only emitted when enabled.
 */
class DiagnosticPrinter
{
public:
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceFiles & files);

private:
  void print_header(const Diagnostic & diag);
  void print_snippet(const SourceFile & file, const Diagnostic & diag);
  void print_help(std::string_view help);
  void print_gutter(std::string_view mark);

  std::ostream & os_;
  bool use_color_;
};

}  // namespace kaleido
