// typegraph/manifest/manifest_loader.hpp - YAML declaration manifests
//
// Populates a RawMetadataStorage from a declaration manifest:
//
//   classes:
//     - name: User
//       object_type: { name: User, description: A shop customer }
//       fields:
//         - { property: id, type: ID }
//         - { property: tags, type: "[String]", nullable: true }
//     - name: UserResolver
//       resolver: { description: User queries }
//       queries:
//         - property: getUser
//           type: User
//           parameters:
//             - { kind: single_arg, name: id, type: Int }
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "typegraph/metadata/raw_metadata_storage.hpp"

namespace typegraph
{

/**
 * Result of loading a manifest.
 */
struct ManifestLoadResult
{
  bool success = false;

  /// Number of class entries collected
  size_t class_count = 0;

  /// Error message if loading failed
  std::string error;

  static ManifestLoadResult ok(size_t classes)
  {
    ManifestLoadResult r;
    r.class_count = classes;
    r.success = true;
    return r;
  }

  static ManifestLoadResult fail(std::string msg)
  {
    ManifestLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * Load a manifest from YAML text into `storage`.
 *
 * All class names of the manifest are declared before any declaration is
 * collected, so entries may reference classes that appear later. On failure
 * the storage may contain the declarations collected before the error.
 */
[[nodiscard]] ManifestLoadResult load_manifest_string(
  std::string_view yaml, RawMetadataStorage & storage);

/**
 * Load a manifest file into `storage`.
 */
[[nodiscard]] ManifestLoadResult load_manifest_file(
  const std::filesystem::path & path, RawMetadataStorage & storage);

/**
 * Parse a parameter kind as spelled in manifests
 * (`single_arg`, `spread_args`, `context`, `info`).
 */
[[nodiscard]] std::optional<ParamKind> parse_param_kind(std::string_view text);

}  // namespace typegraph
