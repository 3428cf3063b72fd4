// typegraph/metadata/type_metadata.hpp - Normalized type descriptor
//
// Output of type reflection: a value reference plus nullability and list
// depth modifiers.
//
#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "typegraph/basic/class_id.hpp"

namespace typegraph
{

class RawMetadataSource;

// ============================================================================
// Type Value
// ============================================================================

enum class TypeValueKind : uint8_t {
  Scalar,  ///< built-in or configured scalar, by canonical name
  Class,   ///< object or input type, by class identity
};

/**
 * The underlying value of a type, without modifiers.
 */
struct TypeValue
{
  TypeValueKind kind = TypeValueKind::Scalar;

  /// For Scalar: canonical scalar name (e.g. "Int")
  std::string scalar_name;

  /// For Class: the referenced class
  ClassId class_id;

  [[nodiscard]] static TypeValue scalar(std::string name)
  {
    TypeValue v;
    v.kind = TypeValueKind::Scalar;
    v.scalar_name = std::move(name);
    return v;
  }

  [[nodiscard]] static TypeValue class_type(ClassId id)
  {
    TypeValue v;
    v.kind = TypeValueKind::Class;
    v.class_id = id;
    return v;
  }

  [[nodiscard]] bool is_scalar() const noexcept { return kind == TypeValueKind::Scalar; }
  [[nodiscard]] bool is_class() const noexcept { return kind == TypeValueKind::Class; }

  [[nodiscard]] bool operator==(const TypeValue & other) const
  {
    if (kind != other.kind) {
      return false;
    }
    return is_class() ? class_id == other.class_id : scalar_name == other.scalar_name;
  }
  [[nodiscard]] bool operator!=(const TypeValue & other) const { return !(*this == other); }
};

// ============================================================================
// Type Modifiers
// ============================================================================

struct TypeModifiers
{
  bool nullable = false;

  /// 0 = not a list, N = list nested N levels deep
  uint32_t list_depth = 0;

  [[nodiscard]] bool operator==(const TypeModifiers & other) const noexcept
  {
    return nullable == other.nullable && list_depth == other.list_depth;
  }
  [[nodiscard]] bool operator!=(const TypeModifiers & other) const noexcept
  {
    return !(*this == other);
  }
};

// ============================================================================
// Type Metadata
// ============================================================================

struct TypeMetadata
{
  TypeValue value;
  TypeModifiers modifiers;

  [[nodiscard]] bool is_list() const noexcept { return modifiers.list_depth > 0; }

  [[nodiscard]] bool operator==(const TypeMetadata & other) const
  {
    return value == other.value && modifiers == other.modifiers;
  }
  [[nodiscard]] bool operator!=(const TypeMetadata & other) const { return !(*this == other); }
};

/// Name of the underlying value ("Int", or the class name via `names`)
[[nodiscard]] std::string value_name(const TypeValue & value, const RawMetadataSource & names);

/**
 * SDL-style spelling of a type, e.g. `[User!]!`.
 *
 * List items are always non-null; `nullable` applies to the outermost type.
 */
[[nodiscard]] std::string to_string(const TypeMetadata & type, const RawMetadataSource & names);

}  // namespace typegraph
