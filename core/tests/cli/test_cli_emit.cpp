// test_cli_emit.cpp - kaleidoc end-to-end behavior

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#if defined(__unix__) || defined(__APPLE__)
#include <sys/wait.h>
#endif

namespace fs = std::filesystem;

namespace
{

std::string read_all(const fs::path & p)
{
  std::ifstream in(p);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void write_all(const fs::path & p, const std::string & s)
{
  std::ofstream out(p);
  ASSERT_TRUE(out.is_open()) << "Failed to open file for writing: " << p.string();
  out << s;
}

fs::path make_temp_dir(std::string_view prefix)
{
  const auto base = fs::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = base / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

std::string shell_quote(const std::string & s)
{
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('\'');
  for (char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

struct CliResult
{
  int exit_code = -1;
  std::string out;
  std::string err;
};

/// Run kaleidoc with `args` from `cwd`, capturing both output streams.
CliResult run_cli(const fs::path & cwd, const std::vector<std::string> & args)
{
  CliResult result;
#ifndef KALEIDO_CLI_PATH
  (void)cwd;
  (void)args;
  return result;
#else
  const fs::path out_file = cwd / "stdout.txt";
  const fs::path err_file = cwd / "stderr.txt";

  std::string cmd = "cd " + shell_quote(cwd.string()) + " && " + shell_quote(KALEIDO_CLI_PATH);
  for (const auto & a : args) {
    cmd += " " + shell_quote(a);
  }
  cmd += " > " + shell_quote(out_file.string()) + " 2> " + shell_quote(err_file.string());

  const int rc = std::system(cmd.c_str());
#if defined(__unix__) || defined(__APPLE__)
  if (rc == -1) {
    result.exit_code = 127;
  } else if (WIFEXITED(rc)) {
    result.exit_code = WEXITSTATUS(rc);
  } else {
    result.exit_code = 128;
  }
#else
  result.exit_code = rc;
#endif
  result.out = read_all(out_file);
  result.err = read_all(err_file);
  return result;
#endif
}

class CliEmitTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
#ifndef KALEIDO_CLI_PATH
    GTEST_SKIP() << "KALEIDO_CLI_PATH is not configured (kaleidoc target missing?)";
#endif
    dir_ = make_temp_dir("kaleidoc_cli");
  }

  void TearDown() override
  {
    if (!dir_.empty()) {
      std::error_code ec;
      fs::remove_all(dir_, ec);
    }
  }

  fs::path dir_;
};

}  // namespace

TEST_F(CliEmitTest, TreeFromWords)
{
  const auto r = run_cli(dir_, {"1", "+", "2", "*", "x"});
  EXPECT_EQ(r.exit_code, 0) << r.err;

  const std::string expected =
    "Program\n"
    "`-FunctionDecl [anonymous]\n"
    "  |-Prototype name='' params=''\n"
    "  `-BinaryExpr op='+'\n"
    "    |-NumberExpr 1\n"
    "    `-BinaryExpr op='*'\n"
    "      |-NumberExpr 2\n"
    "      `-VariableExpr name='x'\n"
    "\n";
  EXPECT_EQ(r.out, expected);
}

TEST_F(CliEmitTest, DashIsSourceText)
{
  const auto r = run_cli(dir_, {"--emit", "source", "a", "-", "b", "-", "c"});
  EXPECT_EQ(r.exit_code, 0) << r.err;
  EXPECT_EQ(r.out, "((a - b) - c);\n");
}

TEST_F(CliEmitTest, SourceFromFile)
{
  write_all(dir_ / "prog.kl", "# demo\nextern sin(x);\ndef f(y) sin(y) * 2;\n");
  const auto r = run_cli(dir_, {"--emit", "source", "--file", "prog.kl"});
  EXPECT_EQ(r.exit_code, 0) << r.err;
  EXPECT_EQ(r.out, "extern sin(x);\ndef f(y) (sin(y) * 2);\n");
}

TEST_F(CliEmitTest, UnicodeIdentifiersFromFile)
{
  write_all(dir_ / "uni.kl", "def caf\xC3\xA9(\xCE\xBB) \xCE\xBB * 2;\ncaf\xC3\xA9(1);\n");
  const auto r = run_cli(dir_, {"--emit", "source", "--file", "uni.kl"});
  EXPECT_EQ(r.exit_code, 0) << r.err;
  EXPECT_EQ(r.out, "def caf\xC3\xA9(\xCE\xBB) (\xCE\xBB * 2);\ncaf\xC3\xA9(1);\n");
}

TEST_F(CliEmitTest, ParseErrorPointsIntoTheFile)
{
  write_all(dir_ / "bad.kl", "1;\nx : 1\n");
  const auto r = run_cli(dir_, {"--file", "bad.kl"});
  EXPECT_EQ(r.exit_code, 1);
  EXPECT_NE(r.err.find("--> bad.kl:2:3"), std::string::npos) << r.err;
  EXPECT_NE(r.err.find("    2 | x : 1"), std::string::npos) << r.err;
}

TEST_F(CliEmitTest, JsonOutput)
{
  const auto r = run_cli(dir_, {"--emit", "json", "extern", "g(a);"});
  EXPECT_EQ(r.exit_code, 0) << r.err;
  EXPECT_NE(r.out.find("\"type\": \"ExternDecl\""), std::string::npos) << r.out;
  EXPECT_NE(r.out.find("\"name\": \"g\""), std::string::npos) << r.out;
}

TEST_F(CliEmitTest, TokensEvenWhenParsingWouldFail)
{
  const auto r = run_cli(dir_, {"--emit", "tokens", "x", ":", "1"});
  EXPECT_EQ(r.exit_code, 0) << r.err;

  const std::string expected =
    "1:1\tidentifier\tx\n"
    "1:3\toperator\t:\n"
    "1:5\tnumber\t1\n"
    "1:6\t<eof>\n";
  EXPECT_EQ(r.out, expected);
}

TEST_F(CliEmitTest, ParseErrorIsReported)
{
  const auto r = run_cli(dir_, {"x", ":", "1"});
  EXPECT_EQ(r.exit_code, 1);
  EXPECT_TRUE(r.out.empty());
  EXPECT_NE(r.err.find("error[E0002]: invalid operator ':'"), std::string::npos) << r.err;
  EXPECT_NE(r.err.find("= help: configured operators are * + - /"), std::string::npos) << r.err;
}

TEST_F(CliEmitTest, ProjectConfigIsFoundUpward)
{
  write_all(dir_ / "kaleido.yaml", "parser:\n  operators:\n    '<': 10\n");
  fs::create_directories(dir_ / "sub");

  const auto r = run_cli(dir_ / "sub", {"--emit", "source", "a", "<", "b", "+", "1"});
  EXPECT_EQ(r.exit_code, 0) << r.err;
  EXPECT_EQ(r.out, "(a < (b + 1));\n");
}

TEST_F(CliEmitTest, ExplicitConfig)
{
  write_all(dir_ / "custom.yaml", "parser:\n  inherit_defaults: false\n  operators:\n    '+': 1\n");

  const auto r = run_cli(dir_, {"--config", "custom.yaml", "1", "*", "2"});
  EXPECT_EQ(r.exit_code, 1);
  EXPECT_NE(r.err.find("configured operators are +"), std::string::npos) << r.err;
}

TEST_F(CliEmitTest, InvalidConfig)
{
  write_all(dir_ / "kaleido.yaml", "parser:\n  operators:\n    'ab': 1\n");
  const auto r = run_cli(dir_, {"1"});
  EXPECT_EQ(r.exit_code, 1);
  EXPECT_NE(r.err.find("invalid operator 'ab'"), std::string::npos) << r.err;
}

TEST_F(CliEmitTest, UsageErrors)
{
  EXPECT_EQ(run_cli(dir_, {}).exit_code, 2);
  EXPECT_EQ(run_cli(dir_, {"--emit", "bytecode", "1"}).exit_code, 2);
  EXPECT_EQ(run_cli(dir_, {"--bogus", "1"}).exit_code, 2);
  EXPECT_EQ(run_cli(dir_, {"--file", "a.kl", "1"}).exit_code, 2);
  EXPECT_EQ(run_cli(dir_, {"--emit"}).exit_code, 2);
}

TEST_F(CliEmitTest, DoubleDashPassesOptionsAsSource)
{
  const auto r = run_cli(dir_, {"--emit", "tokens", "--", "--emit"});
  EXPECT_EQ(r.exit_code, 0) << r.err;
  EXPECT_EQ(r.out, "1:1\toperator\t-\n1:2\toperator\t-\n1:3\tidentifier\temit\n1:7\t<eof>\n");
}

TEST_F(CliEmitTest, Help)
{
  const auto r = run_cli(dir_, {"--help"});
  EXPECT_EQ(r.exit_code, 0);
  EXPECT_NE(r.err.find("--emit <kind>"), std::string::npos);
}

TEST_F(CliEmitTest, MissingFile)
{
  const auto r = run_cli(dir_, {"--file", "nope.kl"});
  EXPECT_EQ(r.exit_code, 1);
  EXPECT_NE(r.err.find("failed to open file"), std::string::npos);
}
