// kaleidoc - Kaleido front-end command line interface
//
// Usage:
//   kaleidoc [options] <source words...>
//   kaleidoc [options] --file <path>
//
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "kaleido/ast/ast_context.hpp"
#include "kaleido/ast/ast_dumper.hpp"
#include "kaleido/ast/json_visitor.hpp"
#include "kaleido/ast/source_printer.hpp"
#include "kaleido/basic/diagnostic_printer.hpp"
#include "kaleido/project/project_config.hpp"
#include "kaleido/syntax/frontend.hpp"
#include "kaleido/syntax/lexer.hpp"

namespace fs = std::filesystem;

namespace
{

constexpr int k_exit_ok = 0;
constexpr int k_exit_error = 1;
constexpr int k_exit_usage = 2;

void print_usage(const char * program_name)
{
  std::cerr << "Kaleido front end v0.1.0\n\n"
            << "Usage: " << program_name << " [options] <source words...>\n"
            << "       " << program_name << " [options] --file <path>\n\n"
            << "Source words are joined with single spaces.\n\n"
            << "Options:\n"
            << "  --emit <kind>            Output: tree (default), json, source, tokens\n"
            << "  --file <path>            Read source text from a file\n"
            << "  --config <path>          Use this kaleido.yaml (default: search upward)\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n"
            << "  --                       Treat every remaining argument as source\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

enum class EmitKind { Tree, Json, Source, Tokens };

struct CommandArgs
{
  std::vector<std::string> words;
  std::string input_file;
  std::string config_path;
  EmitKind emit = EmitKind::Tree;
  bool verbose = false;
  bool show_help = false;
  std::string usage_error;
};

std::optional<EmitKind> parse_emit_kind(const std::string & s)
{
  if (s == "tree") return EmitKind::Tree;
  if (s == "json") return EmitKind::Json;
  if (s == "source") return EmitKind::Source;
  if (s == "tokens") return EmitKind::Tokens;
  return std::nullopt;
}

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;
  bool only_words = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (only_words) {
      args.words.push_back(arg);
    } else if (arg == "--") {
      only_words = true;
    } else if (arg == "--emit" || arg == "--file" || arg == "--config") {
      if (i + 1 >= argc) {
        args.usage_error = "missing value for " + arg;
        return args;
      }
      const std::string value = argv[++i];
      if (arg == "--file") {
        args.input_file = value;
      } else if (arg == "--config") {
        args.config_path = value;
      } else if (const auto kind = parse_emit_kind(value)) {
        args.emit = *kind;
      } else {
        args.usage_error = "unknown --emit kind '" + value + "'";
        return args;
      }
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg.rfind("--", 0) == 0) {
      args.usage_error = "unknown option '" + arg + "'";
      return args;
    } else {
      // Anything else is source text, including operators such as "-".
      args.words.push_back(arg);
    }
  }

  if (!args.input_file.empty() && !args.words.empty()) {
    args.usage_error = "give source either as words or with --file, not both";
  } else if (args.input_file.empty() && args.words.empty() && !args.show_help) {
    args.usage_error = "no source given";
  }
  return args;
}

// ============================================================================
// Pipeline
// ============================================================================

std::string join_words(const std::vector<std::string> & words)
{
  std::string out;
  for (const auto & w : words) {
    if (!out.empty()) out += ' ';
    out += w;
  }
  return out;
}

/// Resolve the operator table from --config or a kaleido.yaml found upward.
std::optional<kaleido::syntax::OperatorTable> load_operators(const CommandArgs & args)
{
  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::path(args.config_path);
  } else {
    config_path = kaleido::find_project_config(fs::current_path());
  }

  if (!config_path) {
    if (args.verbose) {
      std::cerr << "No " << kaleido::k_project_config_file_name
                << " found; using default operators\n";
    }
    return kaleido::syntax::OperatorTable::defaults();
  }

  const auto result = kaleido::load_project_config(*config_path);
  if (!result.success) {
    std::cerr << "error: " << result.error << "\n";
    return std::nullopt;
  }
  if (args.verbose) {
    std::cerr << "Using configuration: " << config_path->string();
    if (!result.config.package.name.empty()) {
      std::cerr << " (package " << result.config.package.name << ")";
    }
    std::cerr << "\n";
  }
  return result.config.parser.operator_table();
}

void print_tokens(const kaleido::SourceFile & file, kaleido::FileId file_id)
{
  for (const auto & tok : kaleido::syntax::tokenize(file.text(), file_id)) {
    const auto at = file.locate(tok.begin());
    std::cout << at.line << ":" << at.column << "\t" << kaleido::syntax::to_string(tok.kind);
    if (tok.kind != kaleido::syntax::TokenKind::Eof) {
      std::cout << "\t" << tok.text;
    }
    std::cout << "\n";
  }
}

int run(const CommandArgs & args)
{
  std::string source_text;
  std::string name = "<command-line>";

  if (!args.input_file.empty()) {
    name = args.input_file;
    std::ifstream file(args.input_file);
    if (!file.is_open()) {
      std::cerr << "error: failed to open file: " << args.input_file << "\n";
      return k_exit_error;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    source_text = buffer.str();
  } else {
    source_text = join_words(args.words);
  }

  if (args.verbose) {
    std::cerr << "Source:\n" << source_text << "\n\n";
  }

  kaleido::SourceFiles files;

  if (args.emit == EmitKind::Tokens) {
    // The lexer never fails, so tokens are shown even for input that does not parse.
    const kaleido::FileId id = files.add(std::move(name), std::move(source_text));
    print_tokens(*files.find(id), id);
    return k_exit_ok;
  }

  const auto operators = load_operators(args);
  if (!operators) {
    return k_exit_error;
  }

  kaleido::AstContext ast;
  const kaleido::ParseOutput parsed =
    kaleido::parse_source(files, std::move(name), std::move(source_text), ast, *operators);

  if (parsed.error) {
    const bool use_color = isatty(fileno(stderr)) != 0;
    kaleido::DiagnosticPrinter printer(std::cerr, use_color);
    printer.print(kaleido::make_diagnostic(*parsed.error, *operators), files);
    return k_exit_error;
  }

  if (args.verbose) {
    std::cerr << "Parsed " << parsed.program->items.size() << " top-level item(s), "
              << ast.node_count() << " node(s), " << ast.name_count() << " distinct name(s)\n";
  }

  switch (args.emit) {
    case EmitKind::Tree:
      std::cout << kaleido::dump_to_string(parsed.program);
      break;
    case EmitKind::Json:
      std::cout << kaleido::to_json(parsed.program).dump(2) << "\n";
      break;
    case EmitKind::Source:
      std::cout << kaleido::print_source(parsed.program);
      break;
    case EmitKind::Tokens:  // handled before parsing
      break;
  }
  return k_exit_ok;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return k_exit_ok;
  }

  if (!args.usage_error.empty()) {
    std::cerr << "error: " << args.usage_error << "\n";
    print_usage(argv[0]);
    return k_exit_usage;
  }

  try {
    return run(args);
  } catch (const std::exception & e) {
    std::cerr << "internal error: " << e.what() << "\n";
    return k_exit_error;
  }
}
