// typegraph/reflection/type_reflection.cpp - Type expression reflection
//
#include "typegraph/reflection/type_reflection.hpp"

#include <string>
#include <utility>

#include "typegraph/metadata/errors.hpp"
#include "typegraph/metadata/raw_metadata_storage.hpp"
#include "typegraph/reflection/type_expr.hpp"

namespace typegraph
{

ExpressionTypeReflector::ExpressionTypeReflector(
  const RawMetadataSource & names, ScalarTable scalars)
: names_(names), scalars_(std::move(scalars))
{
}

TypeMetadata ExpressionTypeReflector::get_field_type_metadata(
  const RawFieldMetadata & field, bool nullable_by_default) const
{
  return reflect(
    field.type_ref, nullable_by_default,
    DeclLocation::of_member(
      field.target, std::string(names_.class_name(field.target)), field.property_key));
}

TypeMetadata ExpressionTypeReflector::get_query_type_metadata(
  const RawQueryMetadata & query, bool nullable_by_default) const
{
  return reflect(
    query.type_ref, nullable_by_default,
    DeclLocation::of_member(
      query.target, std::string(names_.class_name(query.target)), query.property_key));
}

TypeMetadata ExpressionTypeReflector::get_query_parameter_type_metadata(
  const RawParameterMetadata & parameter, bool nullable_by_default) const
{
  return reflect(
    parameter.type_ref, nullable_by_default,
    DeclLocation::of_parameter(
      parameter.target, std::string(names_.class_name(parameter.target)),
      parameter.property_key, parameter.index));
}

TypeMetadata ExpressionTypeReflector::reflect(
  const RawTypeReference & ref, bool nullable_by_default, const DeclLocation & location) const
{
  const TypeExprParseResult parsed = parse_type_expr(ref.type_expr);
  if (!parsed.success) {
    throw TypeReflectionError(
      location, "invalid type expression on '" + location.to_string() + "': " + parsed.error);
  }

  TypeMetadata type;
  type.value = resolve_value(parsed.expr.name, location);

  // List depth: brackets in the expression, or the explicit override
  uint32_t list_depth = parsed.expr.list_depth;
  if (ref.list_depth) {
    if (list_depth == 0) {
      list_depth = *ref.list_depth;
    } else if (*ref.list_depth != list_depth) {
      throw TypeReflectionError(
        location, "conflicting list depth on '" + location.to_string() + "': type '" +
                    ref.type_expr + "' has depth " + std::to_string(list_depth) +
                    " but list_depth is " + std::to_string(*ref.list_depth));
    }
  }

  type.modifiers.list_depth = list_depth;
  type.modifiers.nullable = ref.nullable.value_or(nullable_by_default);
  return type;
}

TypeValue ExpressionTypeReflector::resolve_value(
  std::string_view name, const DeclLocation & location) const
{
  if (const auto scalar = scalars_.lookup(name)) {
    return TypeValue::scalar(std::string(*scalar));
  }

  if (const auto class_id = names_.find_class_by_name(name)) {
    return TypeValue::class_type(*class_id);
  }

  throw TypeReflectionError(
    location, "unknown type '" + std::string(name) + "' on '" + location.to_string() + "'");
}

}  // namespace typegraph
