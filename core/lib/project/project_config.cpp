// kaleido/project/project_config.cpp - Project configuration implementation
//
#include "kaleido/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <limits>
#include <string>
#include <utility>

#include "kaleido/syntax/char_class.hpp"

namespace kaleido
{

namespace
{

/// Parse the 'parser.operators' map into `out`.
bool parse_operators(const YAML::Node & node, ParserConfig & out, std::string & error)
{
  if (!node.IsMap()) {
    error = "parser.operators must be a map of operator to binding power";
    return false;
  }

  for (const auto & entry : node) {
    const auto symbol = entry.first.as<std::string>();
    if (!syntax::is_operator_lexeme(symbol)) {
      error = "invalid operator '" + symbol +
              "' in parser.operators (must be a single character that is not a letter, digit, "
              "whitespace, '#', '(', ')', ',' or ';')";
      return false;
    }

    int64_t power = 0;
    try {
      power = entry.second.as<int64_t>();
    } catch (const YAML::Exception &) {
      error = "binding power of '" + symbol + "' must be a non-negative integer";
      return false;
    }
    if (power < 0 || power > std::numeric_limits<uint32_t>::max()) {
      error = "binding power of '" + symbol + "' is out of range: " + std::to_string(power);
      return false;
    }

    out.operators[symbol] = static_cast<uint32_t>(power);
  }
  return true;
}

}  // namespace

syntax::OperatorTable ParserConfig::operator_table() const
{
  syntax::OperatorTable table;
  if (inherit_defaults) {
    table = syntax::OperatorTable::defaults();
  }
  for (const auto & [symbol, power] : operators) {
    table.set(symbol, power);
  }
  return table;
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  try {
    // Parse 'package' section
    if (root["package"]) {
      const auto & pkg = root["package"];
      if (pkg["name"]) {
        config.package.name = pkg["name"].as<std::string>();
      }
    }

    // Parse 'parser' section
    if (root["parser"]) {
      const auto & parser = root["parser"];
      if (!parser.IsMap()) {
        return ConfigLoadResult::fail("parser must be a map");
      }

      if (parser["inherit_defaults"]) {
        config.parser.inherit_defaults = parser["inherit_defaults"].as<bool>();
      }

      if (parser["operators"]) {
        std::string error;
        if (!parse_operators(parser["operators"], config.parser, error)) {
          return ConfigLoadResult::fail(error);
        }
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace kaleido
