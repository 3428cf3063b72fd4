// typegraph/metadata/errors.cpp - Metadata resolution errors
//
#include "typegraph/metadata/errors.hpp"

#include <utility>

namespace typegraph
{

std::string_view error_code(MetadataErrorKind kind) noexcept
{
  switch (kind) {
    case MetadataErrorKind::MissingClassMetadata:
      return "TG001";
    case MetadataErrorKind::MissingFields:
      return "TG002";
    case MetadataErrorKind::MissingResolverMethods:
      return "TG003";
    case MetadataErrorKind::MultipleArgsUsage:
      return "TG004";
    case MetadataErrorKind::SimultaneousArgsUsage:
      return "TG005";
    case MetadataErrorKind::WrongArgsType:
      return "TG006";
    case MetadataErrorKind::TypeReflection:
      return "TG007";
  }
  return "TG000";
}

std::string_view to_string(MetadataErrorKind kind) noexcept
{
  switch (kind) {
    case MetadataErrorKind::MissingClassMetadata:
      return "MissingClassMetadata";
    case MetadataErrorKind::MissingFields:
      return "MissingFields";
    case MetadataErrorKind::MissingResolverMethods:
      return "MissingResolverMethods";
    case MetadataErrorKind::MultipleArgsUsage:
      return "MultipleArgsUsage";
    case MetadataErrorKind::SimultaneousArgsUsage:
      return "SimultaneousArgsUsage";
    case MetadataErrorKind::WrongArgsType:
      return "WrongArgsType";
    case MetadataErrorKind::TypeReflection:
      return "TypeReflection";
  }
  return "Unknown";
}

MetadataError::MetadataError(
  MetadataErrorKind kind, DeclLocation location, const std::string & message)
: std::runtime_error(message), kind_(kind), location_(std::move(location))
{
}

// ============================================================================
// Class-level Errors
// ============================================================================

MissingClassMetadataError::MissingClassMetadataError(
  DeclLocation location, std::string_view expected_category)
: MetadataError(
    MetadataErrorKind::MissingClassMetadata, location,
    "class '" + location.to_string() + "' has no " + std::string(expected_category) +
      " declaration"),
  expected_category_(expected_category)
{
}

std::string MissingClassMetadataError::help() const
{
  return "declare '" + location().class_name + "' as " + expected_category_ +
         " before using it in the schema";
}

MissingFieldsError::MissingFieldsError(DeclLocation location)
: MetadataError(
    MetadataErrorKind::MissingFields, location,
    "type '" + location.to_string() + "' declares no fields")
{
}

std::string MissingFieldsError::help() const
{
  return "object and input types need at least one field";
}

MissingResolverMethodsError::MissingResolverMethodsError(DeclLocation location)
: MetadataError(
    MetadataErrorKind::MissingResolverMethods, location,
    "resolver '" + location.to_string() + "' declares no query methods")
{
}

std::string MissingResolverMethodsError::help() const
{
  return "declare at least one query handler on the resolver class";
}

// ============================================================================
// Query-level Errors
// ============================================================================

MultipleArgsUsageError::MultipleArgsUsageError(DeclLocation query)
: MetadataError(
    MetadataErrorKind::MultipleArgsUsage, query,
    "query '" + query.to_string() + "' declares more than one spread-arguments parameter")
{
}

std::string MultipleArgsUsageError::help() const
{
  return "merge the argument bags into a single input type";
}

SimultaneousArgsUsageError::SimultaneousArgsUsageError(DeclLocation query)
: MetadataError(
    MetadataErrorKind::SimultaneousArgsUsage, query,
    "query '" + query.to_string() + "' mixes single-argument and spread-arguments parameters")
{
}

std::string SimultaneousArgsUsageError::help() const
{
  return "use either single arguments or one spread-arguments input type";
}

// ============================================================================
// Parameter/Type-level Errors
// ============================================================================

WrongArgsTypeError::WrongArgsTypeError(DeclLocation parameter, const std::string & type_spelling)
: MetadataError(
    MetadataErrorKind::WrongArgsType, parameter,
    "spread-arguments parameter '" + parameter.to_string() + "' has type '" + type_spelling +
      "', expected a non-list input type")
{
}

std::string WrongArgsTypeError::help() const
{
  return "spread arguments must be a single input type class, not a scalar or a list";
}

TypeReflectionError::TypeReflectionError(DeclLocation location, const std::string & message)
: MetadataError(MetadataErrorKind::TypeReflection, std::move(location), message)
{
}

}  // namespace typegraph
