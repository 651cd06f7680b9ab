// kaleido/basic/diagnostic_printer.cpp - Terminal rendering of diagnostics
//
// fmt does the layout; rang adds colors.
//
#include "kaleido/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <ostream>
#include <rang.hpp>
#include <string>

namespace kaleido
{

namespace
{

constexpr std::string_view k_tab_expansion = "    ";

/// Source line with tabs widened, plus the blank prefix that puts the marker under `column`.
struct MarkedLine
{
  std::string text;
  std::string marker_indent;
};

MarkedLine expand_tabs(std::string_view line, uint32_t column)
{
  MarkedLine out;
  for (size_t i = 0; i < line.size(); ++i) {
    const bool before_marker = i + 1 < column;
    if (line[i] == '\t') {
      out.text += k_tab_expansion;
      if (before_marker) out.marker_indent += k_tab_expansion;
    } else {
      out.text += line[i];
      if (before_marker) out.marker_indent += ' ';
    }
  }
  // A marker at end of input sits one column past the last character.
  if (column > line.size() + 1) {
    out.marker_indent.append(column - line.size() - 1, ' ');
  }
  return out;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  rang::setControlMode(use_color_ ? rang::control::Force : rang::control::Off);
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceFiles & files)
{
  print_header(diag);

  const SourceFile * file = diag.range.is_valid() ? files.find(diag.range.file()) : nullptr;
  if (file != nullptr) {
    const LineCol at = file->locate(diag.range.begin());
    print_gutter("-->");
    fmt::print(os_, " {}:{}:{}\n", file->name(), at.line, at.column);
    print_gutter("|");
    os_ << "\n";
    print_snippet(*file, diag);
  }

  if (diag.help) {
    print_help(*diag.help);
  }
  os_ << "\n";
}

void DiagnosticPrinter::print_header(const Diagnostic & diag)
{
  os_ << rang::style::bold << rang::fg::red << "error";
  if (!diag.code.empty()) {
    fmt::print(os_, "[{}]", diag.code);
  }
  os_ << rang::fg::reset;
  fmt::print(os_, ": {}", diag.message);
  os_ << rang::style::reset << "\n";
}

void DiagnosticPrinter::print_snippet(const SourceFile & file, const Diagnostic & diag)
{
  const LineCol begin = file.locate(diag.range.begin());
  const LineCol end = file.locate(diag.range.end());
  const MarkedLine line = expand_tabs(file.line(begin.line), begin.column);

  // Ranges spanning lines are marked at their first character only.
  const uint32_t width =
    (end.line == begin.line && end.column > begin.column) ? end.column - begin.column : 1;

  os_ << rang::fg::cyan << rang::style::bold;
  fmt::print(os_, " {:>4} |", begin.line);
  os_ << rang::style::reset << rang::fg::reset;
  fmt::print(os_, " {}\n", line.text);

  print_gutter("|");
  fmt::print(os_, " {}", line.marker_indent);
  os_ << rang::fg::red << rang::style::bold << std::string(width, '^');
  if (!diag.label.empty()) {
    fmt::print(os_, " {}", diag.label);
  }
  os_ << rang::style::reset << rang::fg::reset << "\n";
}

void DiagnosticPrinter::print_help(std::string_view help)
{
  print_gutter("|");
  os_ << "\n";
  print_gutter("=");
  fmt::print(os_, " help: {}\n", help);
}

void DiagnosticPrinter::print_gutter(std::string_view mark)
{
  // Marks are right-aligned to the pipe column after a four-digit line number.
  os_ << rang::fg::cyan << rang::style::bold;
  fmt::print(os_, "{:>7}", mark);
  os_ << rang::style::reset << rang::fg::reset;
}

}  // namespace kaleido
