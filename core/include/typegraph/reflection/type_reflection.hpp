// typegraph/reflection/type_reflection.hpp - Raw type reference → TypeMetadata
//
// TypeReflector is the seam the metadata builder resolves declared types
// through. ExpressionTypeReflector resolves the textual type expressions
// stored in raw declarations.
//
#pragma once

#include <string_view>

#include "typegraph/basic/decl_location.hpp"
#include "typegraph/metadata/raw_metadata.hpp"
#include "typegraph/metadata/type_metadata.hpp"
#include "typegraph/reflection/scalar_table.hpp"

namespace typegraph
{

class RawMetadataSource;

// ============================================================================
// Type Reflector
// ============================================================================

/**
 * Converts a raw declared type plus the build-wide default nullability into
 * a normalized type descriptor.
 *
 * Implementations throw TypeReflectionError for declared types they cannot
 * understand.
 */
class TypeReflector
{
public:
  virtual ~TypeReflector() = default;

  [[nodiscard]] virtual TypeMetadata get_field_type_metadata(
    const RawFieldMetadata & field, bool nullable_by_default) const = 0;

  [[nodiscard]] virtual TypeMetadata get_query_type_metadata(
    const RawQueryMetadata & query, bool nullable_by_default) const = 0;

  [[nodiscard]] virtual TypeMetadata get_query_parameter_type_metadata(
    const RawParameterMetadata & parameter, bool nullable_by_default) const = 0;
};

// ============================================================================
// Expression Type Reflector
// ============================================================================

/**
 * Resolves type expressions (`User`, `[Int]`, ...) against the scalar
 * namespace and the classes declared in a raw metadata source.
 *
 * Rules:
 * - a name resolves to a scalar first, then to a declared class; classes may
 *   be declared after the declaration that references them
 * - list depth is the bracket depth of the expression; an explicit list
 *   depth override applies when the expression has no brackets and must
 *   agree with it otherwise
 * - nullability is the explicit override, else `nullable_by_default`
 */
class ExpressionTypeReflector final : public TypeReflector
{
public:
  /**
   * @param names Source used to resolve class names (must outlive this)
   * @param scalars Scalar namespace (see make_scalar_table)
   */
  ExpressionTypeReflector(const RawMetadataSource & names, ScalarTable scalars);

  [[nodiscard]] TypeMetadata get_field_type_metadata(
    const RawFieldMetadata & field, bool nullable_by_default) const override;

  [[nodiscard]] TypeMetadata get_query_type_metadata(
    const RawQueryMetadata & query, bool nullable_by_default) const override;

  [[nodiscard]] TypeMetadata get_query_parameter_type_metadata(
    const RawParameterMetadata & parameter, bool nullable_by_default) const override;

  /**
   * Resolve one type reference.
   *
   * @param location Declaration the reference belongs to (for errors)
   */
  [[nodiscard]] TypeMetadata reflect(
    const RawTypeReference & ref, bool nullable_by_default, const DeclLocation & location) const;

private:
  [[nodiscard]] TypeValue resolve_value(std::string_view name, const DeclLocation & location) const;

  const RawMetadataSource & names_;
  ScalarTable scalars_;
};

}  // namespace typegraph
