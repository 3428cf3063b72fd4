// typegraph/builder/metadata_builder.cpp - Metadata resolution and validation
//
#include "typegraph/builder/metadata_builder.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

#include "typegraph/metadata/errors.hpp"
#include "typegraph/metadata/raw_metadata_storage.hpp"
#include "typegraph/reflection/type_reflection.hpp"

namespace typegraph
{

namespace
{

size_t count_kind(const std::vector<RawParameterMetadata> & params, ParamKind kind)
{
  return static_cast<size_t>(std::count_if(
    params.begin(), params.end(), [kind](const RawParameterMetadata & p) { return p.kind == kind; }));
}

}  // namespace

MetadataBuilder::MetadataBuilder(
  const RawMetadataSource & storage, const TypeReflector & reflector, BuildSchemaConfig config)
: storage_(storage), reflector_(reflector), config_(std::move(config))
{
}

// ============================================================================
// Object and Input Types
// ============================================================================

const ObjectTypeMetadata & MetadataBuilder::resolve_object_type(ClassId type_class)
{
  auto cached = object_type_metadata_by_class_.find(type_class);
  if (cached != object_type_metadata_by_class_.end()) {
    return cached->second;
  }

  const RawObjectTypeMetadata * raw = storage_.find_object_type_metadata(type_class);
  if (raw == nullptr) {
    throw MissingClassMetadataError(class_location(type_class), "ObjectType");
  }

  ObjectTypeMetadata metadata{*raw, build_fields_metadata(type_class)};

  auto result = object_type_metadata_by_class_.insert_or_assign(type_class, std::move(metadata));
  return result.first->second;
}

const InputTypeMetadata & MetadataBuilder::resolve_input_type(ClassId type_class)
{
  auto cached = input_type_metadata_by_class_.find(type_class);
  if (cached != input_type_metadata_by_class_.end()) {
    return cached->second;
  }

  const RawInputTypeMetadata * raw = storage_.find_input_type_metadata(type_class);
  if (raw == nullptr) {
    throw MissingClassMetadataError(class_location(type_class), "InputType");
  }

  InputTypeMetadata metadata{*raw, build_fields_metadata(type_class)};

  auto result = input_type_metadata_by_class_.insert_or_assign(type_class, std::move(metadata));
  return result.first->second;
}

std::vector<FieldMetadata> MetadataBuilder::build_fields_metadata(ClassId type_class) const
{
  const std::vector<RawFieldMetadata> * raw_fields = storage_.find_fields_metadata(type_class);
  if (raw_fields == nullptr || raw_fields->empty()) {
    throw MissingFieldsError(class_location(type_class));
  }

  std::vector<FieldMetadata> fields;
  fields.reserve(raw_fields->size());
  for (const auto & raw_field : *raw_fields) {
    TypeMetadata type = reflector_.get_field_type_metadata(raw_field, config_.nullable_by_default);
    fields.push_back(FieldMetadata{raw_field, std::move(type)});
  }
  return fields;
}

// ============================================================================
// Resolvers
// ============================================================================

const ResolverMetadata & MetadataBuilder::resolve_resolver(ClassId resolver_class)
{
  auto cached = resolver_metadata_by_class_.find(resolver_class);
  if (cached != resolver_metadata_by_class_.end()) {
    return cached->second;
  }

  const RawResolverMetadata * raw = storage_.find_resolver_metadata(resolver_class);
  if (raw == nullptr) {
    throw MissingClassMetadataError(class_location(resolver_class), "Resolver");
  }

  // TODO: apply the same non-empty check to mutations and subscriptions once
  // the raw store collects them.
  const std::vector<RawQueryMetadata> * raw_queries =
    storage_.find_queries_metadata(resolver_class);
  if (raw_queries == nullptr || raw_queries->empty()) {
    throw MissingResolverMethodsError(class_location(resolver_class));
  }

  ResolverMetadata metadata{*raw, {}};
  metadata.queries.reserve(raw_queries->size());
  for (const auto & raw_query : *raw_queries) {
    metadata.queries.push_back(build_query_metadata(resolver_class, raw_query));
  }

  auto result = resolver_metadata_by_class_.insert_or_assign(resolver_class, std::move(metadata));
  return result.first->second;
}

QueryMetadata MetadataBuilder::build_query_metadata(
  ClassId resolver_class, const RawQueryMetadata & raw_query) const
{
  TypeMetadata return_type =
    reflector_.get_query_type_metadata(raw_query, config_.nullable_by_default);

  static const std::vector<RawParameterMetadata> k_no_parameters;
  const std::vector<RawParameterMetadata> * found =
    storage_.find_parameters_metadata(resolver_class, raw_query.property_key);
  const std::vector<RawParameterMetadata> & raw_parameters =
    found != nullptr ? *found : k_no_parameters;

  const size_t spread_args_count = count_kind(raw_parameters, ParamKind::SpreadArgs);
  if (spread_args_count > 1) {
    throw MultipleArgsUsageError(query_location(raw_query));
  }
  const size_t single_arg_count = count_kind(raw_parameters, ParamKind::SingleArg);
  if (spread_args_count > 0 && single_arg_count > 0) {
    throw SimultaneousArgsUsageError(query_location(raw_query));
  }

  QueryMetadata query{raw_query, std::move(return_type), {}};
  query.parameters.reserve(raw_parameters.size());
  for (const auto & raw_parameter : raw_parameters) {
    query.parameters.push_back(build_parameter_metadata(raw_parameter));
  }
  return query;
}

ParameterMetadata MetadataBuilder::build_parameter_metadata(
  const RawParameterMetadata & raw_parameter) const
{
  switch (raw_parameter.kind) {
    case ParamKind::SingleArg: {
      return SingleArgParameterMetadata{
        raw_parameter,
        reflector_.get_query_parameter_type_metadata(raw_parameter, config_.nullable_by_default)};
    }
    case ParamKind::SpreadArgs: {
      TypeMetadata type =
        reflector_.get_query_parameter_type_metadata(raw_parameter, config_.nullable_by_default);
      if (!type.value.is_class() || type.is_list()) {
        throw WrongArgsTypeError(parameter_location(raw_parameter), to_string(type, storage_));
      }
      return SpreadArgsParameterMetadata{raw_parameter, std::move(type)};
    }
    case ParamKind::Context:
      return ContextParameterMetadata{raw_parameter};
    case ParamKind::Info:
      return InfoParameterMetadata{raw_parameter};
  }
  throw std::logic_error("unhandled parameter kind");
}

// ============================================================================
// Error Locations
// ============================================================================

DeclLocation MetadataBuilder::class_location(ClassId target) const
{
  return DeclLocation::of_class(target, std::string(storage_.class_name(target)));
}

DeclLocation MetadataBuilder::query_location(const RawQueryMetadata & query) const
{
  return DeclLocation::of_member(
    query.target, std::string(storage_.class_name(query.target)), query.property_key);
}

DeclLocation MetadataBuilder::parameter_location(const RawParameterMetadata & parameter) const
{
  return DeclLocation::of_parameter(
    parameter.target, std::string(storage_.class_name(parameter.target)), parameter.property_key,
    parameter.index);
}

}  // namespace typegraph
