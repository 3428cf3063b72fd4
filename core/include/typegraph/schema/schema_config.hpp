// typegraph/schema/schema_config.hpp - Build and project configuration (typegraph.yaml)
//
// Parses and validates typegraph.yaml project configuration files.
// Designed for reuse by the CLI and by embedding applications.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "typegraph/reflection/scalar_table.hpp"

namespace typegraph
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Schema-wide defaults for one build pass.
 *
 * Immutable for the lifetime of a MetadataBuilder.
 */
struct BuildSchemaConfig
{
  /// Nullability of types that carry no explicit override
  bool nullable_by_default = false;

  /// Custom scalar names (in addition to the built-in scalars)
  std::vector<std::string> scalars;
};

/**
 * Package metadata section.
 */
struct PackageConfig
{
  std::string name;
  std::string version;
};

/**
 * Complete project configuration (typegraph.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  BuildSchemaConfig schema;

  /// Declaration manifests (relative to project_root unless absolute)
  std::vector<std::filesystem::path> manifests;

  /// Directory containing typegraph.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  /// Manifest paths with relative entries resolved against project_root
  [[nodiscard]] std::vector<std::filesystem::path> manifest_paths() const
  {
    std::vector<std::filesystem::path> paths;
    paths.reserve(manifests.size());
    for (const auto & manifest : manifests) {
      paths.push_back(manifest.is_absolute() ? manifest : project_root / manifest);
    }
    return paths;
  }
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Outcome of reading typegraph.yaml: either a validated ProjectConfig or the
 * first problem found in the file.
 */
struct ConfigLoadResult
{
  ProjectConfig config;  ///< meaningful only when `success`
  bool success = false;
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
 * Read and validate a typegraph.yaml file.
 *
 * `project_root` of the result is the directory holding the file.
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/// Nearest typegraph.yaml in `start_dir` or one of its parents
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Build the scalar namespace for a configuration: built-ins plus the
 * configured custom scalars.
 */
[[nodiscard]] ScalarTable make_scalar_table(const BuildSchemaConfig & config);

/**
 * Check that `name` can be registered as a custom scalar: it must be a
 * plain type name and must not be a built-in scalar or alias.
 *
 * @return Error message, or std::nullopt if the name is acceptable
 */
[[nodiscard]] std::optional<std::string> validate_scalar_name(std::string_view name);

inline constexpr const char * k_project_config_file_name = "typegraph.yaml";

}  // namespace typegraph
