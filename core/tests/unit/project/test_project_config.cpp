// tests/project/test_project_config.cpp - kaleido.yaml loading
//

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <utility>

#include "kaleido/project/project_config.hpp"
#include "kaleido/test_support/parse_helpers.hpp"

using namespace kaleido;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(const std::string & name)
  : path(std::filesystem::temp_directory_path() / ("kaleido_test_" + name))
  {
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;

  std::filesystem::path write(const std::string & file, const std::string & content) const
  {
    const auto p = path / file;
    std::filesystem::create_directories(p.parent_path());
    std::ofstream out(p);
    out << content;
    return p;
  }
};

}  // namespace

TEST(ProjectConfig, MissingFile)
{
  const TempDir dir("missing");
  const auto result = load_project_config(dir.path / k_project_config_file_name);
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("not found"), std::string::npos);
}

TEST(ProjectConfig, EmptyFileUsesDefaults)
{
  const TempDir dir("empty");
  const auto cfg_path = dir.write(k_project_config_file_name, "");

  const auto result = load_project_config(cfg_path);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_TRUE(result.config.package.name.empty());
  EXPECT_TRUE(result.config.parser.inherit_defaults);
  EXPECT_TRUE(result.config.parser.operators.empty());
  EXPECT_EQ(result.config.project_root, std::filesystem::absolute(dir.path));

  const auto table = result.config.parser.operator_table();
  EXPECT_EQ(table.size(), 4U);
  EXPECT_EQ(table.find("*"), 40U);
}

TEST(ProjectConfig, ExtraOperators)
{
  const TempDir dir("extra");
  const auto cfg_path = dir.write(
    k_project_config_file_name,
    "package:\n"
    "  name: demo\n"
    "parser:\n"
    "  operators:\n"
    "    '<': 10\n"
    "    '*': 45\n");

  const auto result = load_project_config(cfg_path);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.package.name, "demo");

  const auto table = result.config.parser.operator_table();
  EXPECT_EQ(table.size(), 5U);
  EXPECT_EQ(table.find("<"), 10U);
  EXPECT_EQ(table.find("*"), 45U);
  EXPECT_EQ(table.find("+"), 20U);
}

TEST(ProjectConfig, WithoutDefaults)
{
  const TempDir dir("no_defaults");
  const auto cfg_path = dir.write(
    k_project_config_file_name,
    "parser:\n"
    "  inherit_defaults: false\n"
    "  operators:\n"
    "    '+': 1\n");

  const auto result = load_project_config(cfg_path);
  ASSERT_TRUE(result.success) << result.error;

  const auto table = result.config.parser.operator_table();
  EXPECT_EQ(table.size(), 1U);
  EXPECT_TRUE(table.contains("+"));
  EXPECT_FALSE(table.contains("*"));
}

TEST(ProjectConfig, ConfiguredTableDrivesParser)
{
  const TempDir dir("drives_parser");
  const auto cfg_path = dir.write(
    k_project_config_file_name,
    "parser:\n"
    "  operators:\n"
    "    '<': 10\n");

  const auto result = load_project_config(cfg_path);
  ASSERT_TRUE(result.success) << result.error;
  const auto table = result.config.parser.operator_table();

  auto unit = test_support::parse("a < b + 1", table);
  ASSERT_NE(unit.program, nullptr);

  auto rejected = test_support::parse("a < b + 1");
  EXPECT_EQ(rejected.program, nullptr);
}

TEST(ProjectConfig, RejectsInvalidOperatorKeys)
{
  for (const char * key : {"'=='", "'a'", "'7'", "';'", "'('", "''"}) {
    const TempDir dir("bad_key");
    const auto cfg_path = dir.write(
      k_project_config_file_name,
      std::string("parser:\n  operators:\n    ") + key + ": 10\n");

    const auto result = load_project_config(cfg_path);
    EXPECT_FALSE(result.success) << key;
    EXPECT_NE(result.error.find("invalid operator"), std::string::npos) << result.error;
  }
}

TEST(ProjectConfig, RejectsBadBindingPowers)
{
  const std::pair<const char *, const char *> cases[] = {
    {"-1", "out of range"},
    {"4294967296", "out of range"},
    {"1.5", "non-negative integer"},
    {"high", "non-negative integer"},
  };

  for (const auto & [value, message] : cases) {
    const TempDir dir("bad_power");
    const auto cfg_path = dir.write(
      k_project_config_file_name,
      std::string("parser:\n  operators:\n    '%': ") + value + "\n");

    const auto result = load_project_config(cfg_path);
    EXPECT_FALSE(result.success) << value;
    EXPECT_NE(result.error.find(message), std::string::npos) << result.error;
  }
}

TEST(ProjectConfig, AcceptsMaximumBindingPower)
{
  const TempDir dir("max_power");
  const auto cfg_path = dir.write(
    k_project_config_file_name,
    "parser:\n"
    "  operators:\n"
    "    '^': 4294967295\n");

  const auto result = load_project_config(cfg_path);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.parser.operators.at("^"), 4294967295U);
}

TEST(ProjectConfig, RejectsStructuralErrors)
{
  const std::pair<const char *, const char *> cases[] = {
    {"parser: 3\n", "parser must be a map"},
    {"parser:\n  operators: [1, 2]\n", "parser.operators must be a map"},
    {"parser:\n  inherit_defaults: maybe\n", "invalid configuration"},
    {"parser: {operators: {'+': 1}\n", "failed to parse YAML"},
  };

  for (const auto & [yaml, message] : cases) {
    const TempDir dir("structure");
    const auto cfg_path = dir.write(k_project_config_file_name, yaml);

    const auto result = load_project_config(cfg_path);
    EXPECT_FALSE(result.success) << yaml;
    EXPECT_NE(result.error.find(message), std::string::npos) << result.error;
  }
}

TEST(ProjectConfig, FindSearchesUpward)
{
  const TempDir dir("find");
  const auto cfg_path = dir.write(k_project_config_file_name, "package:\n  name: up\n");
  const auto nested = dir.write("src/deep/main.kl", "1;\n");

  const auto found = find_project_config(nested.parent_path());
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(std::filesystem::weakly_canonical(*found), std::filesystem::weakly_canonical(cfg_path));

  // A file path starts the search from its directory.
  const auto from_file = find_project_config(nested);
  ASSERT_TRUE(from_file.has_value());
  EXPECT_EQ(
    std::filesystem::weakly_canonical(*from_file), std::filesystem::weakly_canonical(cfg_path));
}
