// kaleido/syntax/frontend.hpp - Source text to AST in one call
#pragma once

#include <optional>
#include <string>

#include "kaleido/ast/ast.hpp"
#include "kaleido/ast/ast_context.hpp"
#include "kaleido/basic/diagnostic.hpp"
#include "kaleido/basic/source_file.hpp"
#include "kaleido/syntax/operator_table.hpp"
#include "kaleido/syntax/parse_error.hpp"

namespace kaleido
{

struct ParseOutput
{
  FileId file_id = FileId::invalid();
  Program * program = nullptr;  // nullptr when parsing failed
  std::optional<syntax::ParseError> error;

  [[nodiscard]] bool ok() const noexcept { return program != nullptr; }
};

/**
 * Add `text` to `files` under `name`, tokenize it and parse a program into `ast`.
 *
 * On failure the output carries the first parse error; make_diagnostic turns
 * it into something printable.
 */
[[nodiscard]] ParseOutput parse_source(
  SourceFiles & files, std::string name, std::string text, AstContext & ast,
  const syntax::OperatorTable & operators = syntax::OperatorTable::defaults());

/// User-facing form of a parse error. The help text for InvalidOperator lists `operators`.
[[nodiscard]] Diagnostic make_diagnostic(
  const syntax::ParseError & error, const syntax::OperatorTable & operators);

}  // namespace kaleido
