// typegraph/metadata/raw_metadata.hpp - Unvalidated declarations
//
// Raw metadata as harvested from class/field/method annotations, before
// semantic resolution. Owned by the raw metadata store and never mutated by
// the metadata builder.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "typegraph/basic/class_id.hpp"

namespace typegraph
{

// ============================================================================
// Parameter Kind
// ============================================================================

/**
 * How a resolver method parameter is bound.
 */
enum class ParamKind : uint8_t {
  SingleArg,   ///< one argument bound directly to the parameter
  SpreadArgs,  ///< an input type whose fields are splatted into the argument list
  Context,     ///< request context injection
  Info,        ///< resolve-info injection
};

[[nodiscard]] constexpr std::string_view to_string(ParamKind kind) noexcept
{
  switch (kind) {
    case ParamKind::SingleArg:
      return "SingleArg";
    case ParamKind::SpreadArgs:
      return "SpreadArgs";
    case ParamKind::Context:
      return "Context";
    case ParamKind::Info:
      return "Info";
  }
  return "SingleArg";
}

// ============================================================================
// Type Reference
// ============================================================================

/**
 * A declared type, as written in the annotation.
 *
 * `type_expr` uses the list syntax of the schema language:
 * `User`, `[User]`, `[[Int]]`.
 */
struct RawTypeReference
{
  std::string type_expr;

  /// Explicit nullability override (falls back to the build-wide default)
  std::optional<bool> nullable;

  /// Explicit list depth override (used when `type_expr` has no brackets)
  std::optional<uint32_t> list_depth;
};

// ============================================================================
// Class-level Declarations
// ============================================================================

struct RawObjectTypeMetadata
{
  ClassId target;
  std::string name;
  std::optional<std::string> description;
};

struct RawInputTypeMetadata
{
  ClassId target;
  std::string name;
  std::optional<std::string> description;
};

struct RawResolverMetadata
{
  ClassId target;
  std::optional<std::string> description;
};

// ============================================================================
// Member-level Declarations
// ============================================================================

struct RawFieldMetadata
{
  ClassId target;
  std::string property_key;
  std::string schema_name;
  std::optional<std::string> description;
  RawTypeReference type_ref;
};

struct RawQueryMetadata
{
  ClassId target;
  std::string property_key;  ///< handler method name
  std::string schema_name;
  std::optional<std::string> description;
  RawTypeReference type_ref;  ///< return type
};

struct RawParameterMetadata
{
  ClassId target;
  std::string property_key;  ///< handler method name
  uint32_t index = 0;        ///< position in the handler signature
  ParamKind kind = ParamKind::SingleArg;

  /// Argument name (SingleArg only)
  std::string name;
  std::optional<std::string> description;

  /// Declared type (empty for Context/Info)
  RawTypeReference type_ref;
};

}  // namespace typegraph
