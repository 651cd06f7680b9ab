// kaleido/syntax/frontend.cpp - Source text to AST in one call
#include "kaleido/syntax/frontend.hpp"

#include <string_view>
#include <utility>

#include "kaleido/syntax/lexer.hpp"
#include "kaleido/syntax/parser.hpp"

namespace kaleido
{

namespace
{

std::string operator_help(const syntax::OperatorTable & operators)
{
  if (operators.empty()) {
    return "no binary operators are configured";
  }
  std::string help = "configured operators are";
  for (const auto & symbol : operators.symbols()) {
    help += ' ';
    help += symbol;
  }
  return help;
}

}  // namespace

Diagnostic make_diagnostic(
  const syntax::ParseError & error, const syntax::OperatorTable & operators)
{
  Diagnostic d;
  d.code = std::string(error.code());
  d.message = error.message();
  d.range = error.range;

  switch (error.kind) {
    case syntax::ParseErrorKind::InvalidToken:
      d.label = "not expected here";
      break;
    case syntax::ParseErrorKind::InvalidOperator:
      d.label = "no binding power configured";
      d.help = operator_help(operators);
      break;
    case syntax::ParseErrorKind::UnexpectedEof:
      d.label = "input ends here";
      d.help = "the construct before this point is incomplete";
      break;
  }
  return d;
}

ParseOutput parse_source(
  SourceFiles & files, std::string name, std::string text, AstContext & ast,
  const syntax::OperatorTable & operators)
{
  ParseOutput out;
  out.file_id = files.add(std::move(name), std::move(text));

  const std::string_view source = files.find(out.file_id)->text();
  syntax::Parser parser(ast, syntax::tokenize(source, out.file_id), operators);
  out.program = parser.parse_program();
  out.error = parser.error();
  return out;
}

}  // namespace kaleido
