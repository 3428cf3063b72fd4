// typegraph/metadata/raw_metadata_storage.hpp - Raw declaration store
//
// RawMetadataSource is the read-only view the metadata builder consumes.
// RawMetadataStorage is the append-only in-memory store that declaration
// collection (e.g. the manifest loader) populates.
//
#pragma once

#include <deque>
#include <gsl/span>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "typegraph/basic/class_id.hpp"
#include "typegraph/metadata/raw_metadata.hpp"

namespace typegraph
{

// ============================================================================
// Read-only Source
// ============================================================================

/**
 * Read-only access to raw declarations.
 *
 * All lookups are by exact class identity (and method name where
 * applicable). A `nullptr` result means "not found", which callers must
 * keep distinct from an empty sequence.
 */
class RawMetadataSource
{
public:
  virtual ~RawMetadataSource() = default;

  [[nodiscard]] virtual const RawObjectTypeMetadata * find_object_type_metadata(
    ClassId target) const = 0;
  [[nodiscard]] virtual const RawInputTypeMetadata * find_input_type_metadata(
    ClassId target) const = 0;
  [[nodiscard]] virtual const RawResolverMetadata * find_resolver_metadata(
    ClassId target) const = 0;

  [[nodiscard]] virtual const std::vector<RawFieldMetadata> * find_fields_metadata(
    ClassId target) const = 0;
  [[nodiscard]] virtual const std::vector<RawQueryMetadata> * find_queries_metadata(
    ClassId target) const = 0;
  [[nodiscard]] virtual const std::vector<RawParameterMetadata> * find_parameters_metadata(
    ClassId target, std::string_view method) const = 0;

  /// Look up a declared class by its name
  [[nodiscard]] virtual std::optional<ClassId> find_class_by_name(std::string_view name) const = 0;

  /// Name a class was declared with (empty if the id is unknown)
  [[nodiscard]] virtual std::string_view class_name(ClassId target) const = 0;
};

// ============================================================================
// In-memory Storage
// ============================================================================

/**
 * Append-only store of raw declarations.
 *
 * Classes are declared first (which assigns their ClassId), then their
 * class-, member- and parameter-level declarations are collected. Nothing is
 * ever removed, so pointers returned by the find_* methods stay valid until
 * the next collect_* call for the same class.
 */
class RawMetadataStorage final : public RawMetadataSource
{
public:
  RawMetadataStorage() = default;

  // Owns the declarations handed out by pointer
  RawMetadataStorage(const RawMetadataStorage &) = delete;
  RawMetadataStorage & operator=(const RawMetadataStorage &) = delete;
  RawMetadataStorage(RawMetadataStorage &&) = default;
  RawMetadataStorage & operator=(RawMetadataStorage &&) = default;

  // ===========================================================================
  // Class Declaration
  // ===========================================================================

  /**
   * Declare a class and get its identity.
   *
   * Declaring an already known name returns the existing identity.
   */
  ClassId declare_class(std::string_view name);

  /// All declared classes, in declaration order
  [[nodiscard]] gsl::span<const ClassId> classes() const noexcept { return classes_; }

  // ===========================================================================
  // Collection
  // ===========================================================================

  void collect_object_type_metadata(RawObjectTypeMetadata metadata);
  void collect_input_type_metadata(RawInputTypeMetadata metadata);
  void collect_resolver_metadata(RawResolverMetadata metadata);

  void collect_field_metadata(RawFieldMetadata metadata);

  /// Append fields of `target`; creates the (possibly empty) field list
  void collect_fields_metadata(ClassId target, std::vector<RawFieldMetadata> fields);

  void collect_query_metadata(RawQueryMetadata metadata);

  /// Keeps the parameters of one method ordered by `index`
  void collect_parameter_metadata(RawParameterMetadata metadata);

  // ===========================================================================
  // RawMetadataSource
  // ===========================================================================

  [[nodiscard]] const RawObjectTypeMetadata * find_object_type_metadata(
    ClassId target) const override;
  [[nodiscard]] const RawInputTypeMetadata * find_input_type_metadata(
    ClassId target) const override;
  [[nodiscard]] const RawResolverMetadata * find_resolver_metadata(
    ClassId target) const override;

  [[nodiscard]] const std::vector<RawFieldMetadata> * find_fields_metadata(
    ClassId target) const override;
  [[nodiscard]] const std::vector<RawQueryMetadata> * find_queries_metadata(
    ClassId target) const override;
  [[nodiscard]] const std::vector<RawParameterMetadata> * find_parameters_metadata(
    ClassId target, std::string_view method) const override;

  [[nodiscard]] std::optional<ClassId> find_class_by_name(std::string_view name) const override;
  [[nodiscard]] std::string_view class_name(ClassId target) const override;

  // ===========================================================================
  // Enumeration
  // ===========================================================================

  /// Methods of `target` that have parameter declarations, sorted by name
  [[nodiscard]] std::vector<std::string> parameterized_methods(ClassId target) const;

private:
  using ParametersByMethod = std::unordered_map<std::string, std::vector<RawParameterMetadata>>;

  std::vector<ClassId> classes_;
  // NOTE: class_name() hands out views into these strings, so the container
  // must keep element addresses stable.
  std::deque<std::string> class_names_;  // indexed by ClassId::value()
  std::unordered_map<std::string, ClassId> class_by_name_;

  std::unordered_map<ClassId, RawObjectTypeMetadata> object_types_;
  std::unordered_map<ClassId, RawInputTypeMetadata> input_types_;
  std::unordered_map<ClassId, RawResolverMetadata> resolvers_;

  std::unordered_map<ClassId, std::vector<RawFieldMetadata>> fields_;
  std::unordered_map<ClassId, std::vector<RawQueryMetadata>> queries_;
  std::unordered_map<ClassId, ParametersByMethod> parameters_;
};

}  // namespace typegraph
