// test_source_printer.cpp - Canonical printing and reparse stability
//
#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <random>
#include <string>
#include <vector>

#include "kaleido/ast/ast_context.hpp"
#include "kaleido/ast/ast_dumper.hpp"
#include "kaleido/ast/source_printer.hpp"
#include "kaleido/test_support/parse_helpers.hpp"

namespace kaleido
{
namespace
{

// Parses `src`, prints it, parses the printed text again and expects both
// trees to dump identically. Returns the printed text.
std::string expect_stable(const std::string & src)
{
  auto first = test_support::parse(src);
  EXPECT_NE(first.program, nullptr) << src;
  if (!first.program) return {};

  const std::string printed = print_source(first.program);
  auto second = test_support::parse(printed);
  EXPECT_NE(second.program, nullptr) << printed;
  if (!second.program) return printed;

  EXPECT_EQ(dump_to_string(first.program), dump_to_string(second.program)) << printed;
  EXPECT_EQ(print_source(second.program), printed);
  return printed;
}

/// Random expression tree over the default operators.
class RandomExprBuilder
{
public:
  RandomExprBuilder(AstContext & ast, unsigned seed) : ast_(ast), rng_(seed) {}

  Expr * build(int depth)
  {
    std::uniform_int_distribution<int> pick(0, depth <= 0 ? 1 : 3);
    switch (pick(rng_)) {
      case 0:
        return ast_.make<NumberExpr>(random_number());
      case 1:
        return ast_.make<VariableExpr>(ast_.intern(random_name()));
      case 2: {
        static constexpr const char * k_ops[] = {"+", "-", "*", "/"};
        std::uniform_int_distribution<int> op(0, 3);
        Expr * lhs = build(depth - 1);
        Expr * rhs = build(depth - 1);
        return ast_.make<BinaryExpr>(ast_.intern(k_ops[op(rng_)]), lhs, rhs);
      }
      default: {
        std::uniform_int_distribution<int> argc(0, 3);
        std::vector<Expr *> args;
        const int n = argc(rng_);
        for (int i = 0; i < n; ++i) {
          args.push_back(build(depth - 1));
        }
        return ast_.make<CallExpr>(ast_.intern(random_name()), ast_.list(args));
      }
    }
  }

private:
  double random_number()
  {
    std::uniform_int_distribution<int> kind(0, 3);
    switch (kind(rng_)) {
      case 0:
        return static_cast<double>(std::uniform_int_distribution<int>(0, 1000)(rng_));
      case 1:
        return std::uniform_real_distribution<double>(0.0, 1.0)(rng_);
      case 2:
        return std::uniform_real_distribution<double>(0.0, 1e12)(rng_);
      default:
        return std::ldexp(1.0, std::uniform_int_distribution<int>(-60, 60)(rng_));
    }
  }

  std::string random_name()
  {
    static constexpr const char * k_names[] = {"x", "y", "foo", "bar2", "a_b"};
    std::uniform_int_distribution<int> pick(0, 4);
    return k_names[pick(rng_)];
  }

  AstContext & ast_;
  std::mt19937 rng_;
};

}  // namespace

TEST(AstSourcePrinter, CanonicalForms)
{
  auto unit = test_support::parse(
    "extern sin(x);\n"
    "def f(a, b) a + b * 2;\n"
    "1 - 2 - 3;\n"
    "g();\n");
  ASSERT_NE(unit.program, nullptr);

  const std::string expected =
    "extern sin(x);\n"
    "def f(a, b) (a + (b * 2));\n"
    "((1 - 2) - 3);\n"
    "g();\n";
  EXPECT_EQ(print_source(unit.program), expected);
}

TEST(AstSourcePrinter, ReparseIsStable)
{
  for (const char * src : {
         "",
         "x",
         "1 + 2 * 3 - 4 / 5",
         "(1 + 2) * (3 - 4)",
         "def id(v) v; id(id(1))",
         "extern pow(b, e); def sq(x) pow(x, 2); sq(3) + sq(4)",
         "0.1 + 0.2; 2.; 1234567.875",
         "x y z",
       }) {
    expect_stable(src);
  }
}

TEST(AstSourcePrinter, NumbersNeverUseExponents)
{
  EXPECT_EQ(format_number(0.0), "0");
  EXPECT_EQ(format_number(2.0), "2");
  EXPECT_EQ(format_number(0.25), "0.25");
  EXPECT_EQ(format_number(1e21), "1000000000000000000000");
  EXPECT_EQ(format_number(1e-7), "0.0000001");

  const std::string max = format_number(std::numeric_limits<double>::max());
  EXPECT_EQ(max.size(), 309U);
  EXPECT_EQ(max.find_first_not_of("0123456789"), std::string::npos);
}

TEST(AstSourcePrinter, InfinityPrintsAsOverflowingLiteral)
{
  const std::string huge = "1" + std::string(400, '0');
  auto unit = test_support::parse(huge);
  ASSERT_NE(unit.program, nullptr);

  const std::string printed = expect_stable(huge);
  EXPECT_EQ(printed, "1" + std::string(309, '0') + ";\n");
}

TEST(AstSourcePrinter, RandomTreesReparseIdentically)
{
  for (unsigned seed = 1; seed <= 200; ++seed) {
    AstContext ast;
    RandomExprBuilder builder(ast, seed);
    Expr * expr = builder.build(4);

    const std::string printed = print_source(expr);
    auto reparsed = test_support::parse_expression(printed);
    ASSERT_NE(reparsed.expr, nullptr) << "seed " << seed << ": " << printed;
    EXPECT_TRUE(reparsed.consumed_all) << printed;
    EXPECT_EQ(dump_to_string(expr), dump_to_string(reparsed.expr)) << printed;
  }
}

}  // namespace kaleido
