// kaleido/project/project_config.hpp - Project configuration (kaleido.yaml)
//
// Parses and validates kaleido.yaml project configuration files.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>

#include "kaleido/syntax/operator_table.hpp"

namespace kaleido
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Package metadata section.
 */
struct PackageConfig
{
  std::string name;
};

/**
 * Parser section: which binary operators exist and how tightly they bind.
 */
struct ParserConfig
{
  /// Start from the built-in table (* / + -) before applying `operators`
  bool inherit_defaults = true;

  /// Additional or overriding binding powers, keyed by operator character
  std::map<std::string, uint32_t> operators;

  /// The table a parser for this project should use.
  [[nodiscard]] syntax::OperatorTable operator_table() const;
};

/**
 * Complete project configuration (kaleido.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  ParserConfig parser;

  /// Directory containing kaleido.yaml
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a kaleido.yaml file.
 *
 * Fails on a missing file, malformed YAML, and operator entries the lexer
 * could never produce or whose binding power is not a non-negative integer.
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Search for kaleido.yaml from start_dir upward to the filesystem root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_project_config_file_name = "kaleido.yaml";

}  // namespace kaleido
