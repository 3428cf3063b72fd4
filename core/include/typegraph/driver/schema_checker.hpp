// typegraph/driver/schema_checker.hpp - Schema check driver
//
// Single entry point for the check pipeline.
// Used by the CLI and can be integrated into other tools.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "typegraph/basic/diagnostic.hpp"
#include "typegraph/metadata/metadata.hpp"
#include "typegraph/metadata/raw_metadata_storage.hpp"
#include "typegraph/schema/schema_config.hpp"

namespace typegraph
{

// ============================================================================
// Check Options
// ============================================================================

struct CheckOptions
{
  /// Default nullability (overrides project config)
  std::optional<bool> nullable_by_default;

  /// Custom scalars added on top of the project config
  std::vector<std::string> extra_scalars;

  /// Warn about declarations that no resolution will ever read
  bool warn_orphans = true;

  /// Enable verbose output
  bool verbose = false;
};

// ============================================================================
// Check Result
// ============================================================================

struct CheckResult
{
  /// Whether every declared type and resolver resolved (no errors)
  bool success = false;

  /// Collected diagnostics (errors, warnings, etc.)
  DiagnosticBag diagnostics;

  /// Successfully resolved metadata, in class declaration order
  std::vector<ObjectTypeMetadata> object_types;
  std::vector<InputTypeMetadata> input_types;
  std::vector<ResolverMetadata> resolvers;

  /// Declarations loaded by the checker (null for check_storage)
  std::unique_ptr<RawMetadataStorage> storage;
};

// ============================================================================
// Schema Checker
// ============================================================================

/**
 * Driver that resolves every declaration of a schema and reports all
 * failures at once.
 *
 * The pipeline consists of:
 * 1. Manifest loading (class declaration, then declaration collection)
 * 2. Resolution of every declared object type, input type and resolver
 *    through one MetadataBuilder
 * 3. Orphan declaration warnings
 */
class SchemaChecker
{
public:
  /**
   * Check a single declaration manifest.
   *
   * @param manifest Path to the YAML manifest
   * @param config Build-wide defaults (before option overrides)
   * @param options Check options
   */
  [[nodiscard]] static CheckResult check_manifest(
    const std::filesystem::path & manifest, const BuildSchemaConfig & config,
    const CheckOptions & options);

  /**
   * Check all manifests of a project.
   *
   * @param config Project configuration (from typegraph.yaml)
   * @param options Check options (may override config settings)
   */
  [[nodiscard]] static CheckResult check_project(
    const ProjectConfig & config, const CheckOptions & options);

  /**
   * Check declarations that are already collected.
   *
   * @param storage Raw declarations (not retained by the result)
   * @param config Build-wide defaults (used as is)
   * @param warn_orphans Whether to report orphan declarations
   */
  [[nodiscard]] static CheckResult check_storage(
    const RawMetadataStorage & storage, const BuildSchemaConfig & config,
    bool warn_orphans = true);

  /// Apply the option overrides to a build config
  [[nodiscard]] static BuildSchemaConfig effective_config(
    const BuildSchemaConfig & config, const CheckOptions & options);

private:
  static void report_orphans(const RawMetadataStorage & storage, DiagnosticBag & diags);
};

}  // namespace typegraph
