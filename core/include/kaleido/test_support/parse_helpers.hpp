// kaleido/test_support/parse_helpers.hpp - helpers for unit tests
//
// A single-file parsing pipeline for tests. The unit owns the source table
// and the arena, so ranges and nodes stay valid for the whole test.
//
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "kaleido/ast/ast_context.hpp"
#include "kaleido/basic/diagnostic.hpp"
#include "kaleido/basic/source_file.hpp"
#include "kaleido/syntax/frontend.hpp"
#include "kaleido/syntax/lexer.hpp"
#include "kaleido/syntax/operator_table.hpp"
#include "kaleido/syntax/parser.hpp"

namespace kaleido::test_support
{

struct TestParseUnit
{
  SourceFiles files;
  FileId file_id = FileId::invalid();
  std::unique_ptr<AstContext> ast;
  const syntax::OperatorTable * operators = nullptr;
  Program * program = nullptr;
  std::optional<syntax::ParseError> error;

  [[nodiscard]] const SourceFile & file() const { return *files.find(file_id); }

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept { return file().text(r); }

  [[nodiscard]] LineCol locate(uint32_t offset) const noexcept { return file().locate(offset); }

  /// The printable form of `error`; only valid when parsing failed.
  [[nodiscard]] Diagnostic diagnostic() const { return make_diagnostic(*error, *operators); }
};

/// `operators` must outlive the returned unit.
[[nodiscard]] inline TestParseUnit parse(
  std::string src, const syntax::OperatorTable & operators = syntax::OperatorTable::defaults(),
  std::string name = "<test>.kl")
{
  TestParseUnit out;
  out.ast = std::make_unique<AstContext>();
  out.operators = &operators;

  const ParseOutput parsed =
    parse_source(out.files, std::move(name), std::move(src), *out.ast, operators);
  out.file_id = parsed.file_id;
  out.program = parsed.program;
  out.error = parsed.error;
  return out;
}

/// A single expression parsed with its own arena.
struct TestExprUnit
{
  std::string source;
  std::unique_ptr<AstContext> ast;
  Expr * expr = nullptr;
  std::optional<syntax::ParseError> error;
  bool consumed_all = false;
};

[[nodiscard]] inline TestExprUnit parse_expression(
  std::string src, const syntax::OperatorTable & operators = syntax::OperatorTable::defaults())
{
  TestExprUnit out;
  out.source = std::move(src);
  out.ast = std::make_unique<AstContext>();

  syntax::Parser parser(*out.ast, syntax::tokenize(out.source), operators);
  out.expr = parser.parse_expression();
  out.error = parser.error();
  out.consumed_all = parser.at_eof();
  return out;
}

}  // namespace kaleido::test_support
