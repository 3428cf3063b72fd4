// typegraph/metadata/metadata.hpp - Resolved, typed metadata (the schema IR)
//
// Each resolved struct extends its raw counterpart with the resolved type
// information. Values are built once by MetadataBuilder and are immutable
// afterwards.
//
#pragma once

#include <type_traits>
#include <variant>
#include <vector>

#include "typegraph/metadata/raw_metadata.hpp"
#include "typegraph/metadata/type_metadata.hpp"

namespace typegraph
{

// ============================================================================
// Types and Fields
// ============================================================================

struct FieldMetadata : RawFieldMetadata
{
  TypeMetadata type;
};

/// Invariant: `fields` is never empty.
struct ObjectTypeMetadata : RawObjectTypeMetadata
{
  std::vector<FieldMetadata> fields;
};

/// Invariant: `fields` is never empty.
struct InputTypeMetadata : RawInputTypeMetadata
{
  std::vector<FieldMetadata> fields;
};

// ============================================================================
// Parameters
// ============================================================================

struct SingleArgParameterMetadata : RawParameterMetadata
{
  TypeMetadata type;
};

/// `type.value` is always a class and `type` is never a list.
struct SpreadArgsParameterMetadata : RawParameterMetadata
{
  TypeMetadata type;
};

struct ContextParameterMetadata : RawParameterMetadata
{
};

struct InfoParameterMetadata : RawParameterMetadata
{
};

/**
 * A resolved handler parameter.
 *
 * Closed set of alternatives: consumers match all of them (see
 * `parameter_kind()` for the pattern).
 */
using ParameterMetadata = std::variant<
  SingleArgParameterMetadata, SpreadArgsParameterMetadata, ContextParameterMetadata,
  InfoParameterMetadata>;

namespace detail
{

template <typename T>
inline constexpr bool always_false_v = false;

}  // namespace detail

/// Raw declaration behind a resolved parameter
[[nodiscard]] inline const RawParameterMetadata & raw_parameter(const ParameterMetadata & param)
{
  return std::visit(
    [](const auto & p) -> const RawParameterMetadata & { return p; }, param);
}

[[nodiscard]] inline ParamKind parameter_kind(const ParameterMetadata & param)
{
  return std::visit(
    [](const auto & p) {
      using T = std::decay_t<decltype(p)>;
      if constexpr (std::is_same_v<T, SingleArgParameterMetadata>) {
        return ParamKind::SingleArg;
      } else if constexpr (std::is_same_v<T, SpreadArgsParameterMetadata>) {
        return ParamKind::SpreadArgs;
      } else if constexpr (std::is_same_v<T, ContextParameterMetadata>) {
        return ParamKind::Context;
      } else if constexpr (std::is_same_v<T, InfoParameterMetadata>) {
        return ParamKind::Info;
      } else {
        static_assert(detail::always_false_v<T>, "unhandled parameter metadata");
      }
    },
    param);
}

/// Resolved type of a parameter, or nullptr for injected parameters
[[nodiscard]] inline const TypeMetadata * parameter_type(const ParameterMetadata & param)
{
  if (const auto * single = std::get_if<SingleArgParameterMetadata>(&param)) {
    return &single->type;
  }
  if (const auto * spread = std::get_if<SpreadArgsParameterMetadata>(&param)) {
    return &spread->type;
  }
  return nullptr;
}

// ============================================================================
// Queries and Resolvers
// ============================================================================

struct QueryMetadata : RawQueryMetadata
{
  TypeMetadata type;
  std::vector<ParameterMetadata> parameters;
};

/// Invariant: `queries` is never empty.
struct ResolverMetadata : RawResolverMetadata
{
  std::vector<QueryMetadata> queries;
};

}  // namespace typegraph
