// typegraph/metadata/errors.hpp - Metadata resolution errors
//
// Every resolution failure is fatal to the current attempt and is thrown as
// a MetadataError subclass carrying the location of the offending
// declaration.
//
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include "typegraph/basic/decl_location.hpp"

namespace typegraph
{

enum class MetadataErrorKind : uint8_t {
  MissingClassMetadata,
  MissingFields,
  MissingResolverMethods,
  MultipleArgsUsage,
  SimultaneousArgsUsage,
  WrongArgsType,
  TypeReflection,
};

/// Stable diagnostic code ("TG001".."TG007")
[[nodiscard]] std::string_view error_code(MetadataErrorKind kind) noexcept;

[[nodiscard]] std::string_view to_string(MetadataErrorKind kind) noexcept;

// ============================================================================
// Base
// ============================================================================

class MetadataError : public std::runtime_error
{
public:
  MetadataError(MetadataErrorKind kind, DeclLocation location, const std::string & message);

  [[nodiscard]] MetadataErrorKind kind() const noexcept { return kind_; }
  [[nodiscard]] std::string_view code() const noexcept { return error_code(kind_); }
  [[nodiscard]] const DeclLocation & location() const noexcept { return location_; }

  /// Suggested fix, shown as `help:` by the driver
  [[nodiscard]] virtual std::string help() const { return {}; }

private:
  MetadataErrorKind kind_;
  DeclLocation location_;
};

// ============================================================================
// Class-level Errors
// ============================================================================

class MissingClassMetadataError : public MetadataError
{
public:
  /// `expected_category` is "ObjectType", "InputType" or "Resolver"
  MissingClassMetadataError(DeclLocation location, std::string_view expected_category);

  [[nodiscard]] const std::string & expected_category() const noexcept
  {
    return expected_category_;
  }

  [[nodiscard]] std::string help() const override;

private:
  std::string expected_category_;
};

class MissingFieldsError : public MetadataError
{
public:
  explicit MissingFieldsError(DeclLocation location);

  [[nodiscard]] std::string help() const override;
};

class MissingResolverMethodsError : public MetadataError
{
public:
  explicit MissingResolverMethodsError(DeclLocation location);

  [[nodiscard]] std::string help() const override;
};

// ============================================================================
// Query-level Errors
// ============================================================================

class MultipleArgsUsageError : public MetadataError
{
public:
  explicit MultipleArgsUsageError(DeclLocation query);

  [[nodiscard]] std::string help() const override;
};

class SimultaneousArgsUsageError : public MetadataError
{
public:
  explicit SimultaneousArgsUsageError(DeclLocation query);

  [[nodiscard]] std::string help() const override;
};

// ============================================================================
// Parameter/Type-level Errors
// ============================================================================

class WrongArgsTypeError : public MetadataError
{
public:
  /// `type_spelling` is the resolved type as written in SDL (e.g. "[Int!]!")
  WrongArgsTypeError(DeclLocation parameter, const std::string & type_spelling);

  [[nodiscard]] std::string help() const override;
};

/**
 * A declared type expression could not be turned into a type descriptor.
 *
 * Raised by type reflection; the builder lets it propagate unchanged.
 */
class TypeReflectionError : public MetadataError
{
public:
  TypeReflectionError(DeclLocation location, const std::string & message);
};

}  // namespace typegraph
