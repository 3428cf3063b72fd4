// typegraph/builder/metadata_builder.hpp - Raw declarations → typed schema metadata
//
// Resolves and validates the raw declarations of one class into the typed
// metadata consumed by schema construction, memoizing the result per class.
//
#pragma once

#include <unordered_map>
#include <vector>

#include "typegraph/basic/class_id.hpp"
#include "typegraph/basic/decl_location.hpp"
#include "typegraph/metadata/metadata.hpp"
#include "typegraph/schema/schema_config.hpp"

namespace typegraph
{

class RawMetadataSource;
class TypeReflector;

/**
 * Metadata resolver for one schema build pass.
 *
 * Each resolve_* call either returns the validated metadata of a class or
 * throws a MetadataError describing the offending declaration. Successful
 * results are cached per class and per kind (object type, input type,
 * resolver); the three caches are independent. Failures are never cached,
 * so a later call retries the full resolution.
 *
 * Returned references stay valid for the lifetime of the builder. The cache
 * is discarded with the builder at the end of the build pass.
 *
 * Not thread-safe: concurrent first-time resolutions of one class are not
 * deduplicated. Use one builder per thread.
 */
class MetadataBuilder
{
public:
  /**
   * @param storage Raw declarations (must outlive the builder)
   * @param reflector Type reflection (must outlive the builder)
   * @param config Build-wide defaults, fixed for the builder's lifetime
   */
  MetadataBuilder(
    const RawMetadataSource & storage, const TypeReflector & reflector, BuildSchemaConfig config);

  MetadataBuilder(const MetadataBuilder &) = delete;
  MetadataBuilder & operator=(const MetadataBuilder &) = delete;

  // ===========================================================================
  // Resolution
  // ===========================================================================

  /**
   * Resolve the object type declared by `type_class`.
   *
   * @throws MissingClassMetadataError no ObjectType declaration
   * @throws MissingFieldsError no (or an empty list of) field declarations
   * @throws TypeReflectionError a field type cannot be resolved
   */
  const ObjectTypeMetadata & resolve_object_type(ClassId type_class);

  /**
   * Resolve the input type declared by `type_class`.
   *
   * @throws MissingClassMetadataError no InputType declaration
   * @throws MissingFieldsError no (or an empty list of) field declarations
   * @throws TypeReflectionError a field type cannot be resolved
   */
  const InputTypeMetadata & resolve_input_type(ClassId type_class);

  /**
   * Resolve the resolver declared by `resolver_class`, with all its queries
   * and their parameters.
   *
   * @throws MissingClassMetadataError no Resolver declaration
   * @throws MissingResolverMethodsError no (or an empty list of) queries
   * @throws MultipleArgsUsageError a query has several spread-arguments parameters
   * @throws SimultaneousArgsUsageError a query mixes both argument styles
   * @throws WrongArgsTypeError a spread-arguments type is a scalar or a list
   * @throws TypeReflectionError a return or parameter type cannot be resolved
   */
  const ResolverMetadata & resolve_resolver(ClassId resolver_class);

  // ===========================================================================
  // Cache State
  // ===========================================================================

  [[nodiscard]] bool has_cached_object_type(ClassId type_class) const
  {
    return object_type_metadata_by_class_.count(type_class) > 0;
  }

  [[nodiscard]] bool has_cached_input_type(ClassId type_class) const
  {
    return input_type_metadata_by_class_.count(type_class) > 0;
  }

  [[nodiscard]] bool has_cached_resolver(ClassId resolver_class) const
  {
    return resolver_metadata_by_class_.count(resolver_class) > 0;
  }

  [[nodiscard]] const BuildSchemaConfig & config() const noexcept { return config_; }

private:
  /// Fields of an object/input type; throws MissingFieldsError if there are none
  [[nodiscard]] std::vector<FieldMetadata> build_fields_metadata(ClassId type_class) const;

  [[nodiscard]] QueryMetadata build_query_metadata(
    ClassId resolver_class, const RawQueryMetadata & raw_query) const;

  [[nodiscard]] ParameterMetadata build_parameter_metadata(
    const RawParameterMetadata & raw_parameter) const;

  [[nodiscard]] DeclLocation class_location(ClassId target) const;
  [[nodiscard]] DeclLocation query_location(const RawQueryMetadata & query) const;
  [[nodiscard]] DeclLocation parameter_location(const RawParameterMetadata & parameter) const;

  const RawMetadataSource & storage_;
  const TypeReflector & reflector_;
  const BuildSchemaConfig config_;

  std::unordered_map<ClassId, ObjectTypeMetadata> object_type_metadata_by_class_;
  std::unordered_map<ClassId, InputTypeMetadata> input_type_metadata_by_class_;
  std::unordered_map<ClassId, ResolverMetadata> resolver_metadata_by_class_;
};

}  // namespace typegraph
