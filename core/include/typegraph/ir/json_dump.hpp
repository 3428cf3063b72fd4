// typegraph/ir/json_dump.hpp - JSON serialization for resolved metadata
//
// Returns nlohmann::json objects for the schema IR. Classes are named
// through the raw metadata source they were declared in.
//
#pragma once

#include <nlohmann/json.hpp>

#include "typegraph/metadata/metadata.hpp"

namespace typegraph
{

class RawMetadataSource;
struct CheckResult;

/**
 * Serialize a type descriptor.
 *
 * Shape: {"value": "User", "kind": "Class", "nullable": false, "listDepth": 1}
 */
[[nodiscard]] nlohmann::json to_json(const TypeMetadata & type, const RawMetadataSource & names);

[[nodiscard]] nlohmann::json to_json(
  const ObjectTypeMetadata & object_type, const RawMetadataSource & names);

[[nodiscard]] nlohmann::json to_json(
  const InputTypeMetadata & input_type, const RawMetadataSource & names);

[[nodiscard]] nlohmann::json to_json(
  const ResolverMetadata & resolver, const RawMetadataSource & names);

/**
 * Serialize a whole check run.
 *
 * @return {"success", "objectTypes", "inputTypes", "resolvers", "diagnostics"}
 */
[[nodiscard]] nlohmann::json to_json(const CheckResult & result, const RawMetadataSource & names);

}  // namespace typegraph
