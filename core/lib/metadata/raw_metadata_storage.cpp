// typegraph/metadata/raw_metadata_storage.cpp - Raw declaration store implementation
//
#include "typegraph/metadata/raw_metadata_storage.hpp"

#include <algorithm>
#include <utility>

namespace typegraph
{

// ============================================================================
// Class Declaration
// ============================================================================

ClassId RawMetadataStorage::declare_class(std::string_view name)
{
  auto it = class_by_name_.find(std::string(name));
  if (it != class_by_name_.end()) {
    return it->second;
  }

  const ClassId id(static_cast<uint32_t>(class_names_.size()));
  class_names_.emplace_back(name);
  class_by_name_.emplace(std::string(name), id);
  classes_.push_back(id);
  return id;
}

// ============================================================================
// Collection
// ============================================================================

// A class-level declaration collected twice replaces the earlier one.

void RawMetadataStorage::collect_object_type_metadata(RawObjectTypeMetadata metadata)
{
  const ClassId target = metadata.target;
  object_types_.insert_or_assign(target, std::move(metadata));
}

void RawMetadataStorage::collect_input_type_metadata(RawInputTypeMetadata metadata)
{
  const ClassId target = metadata.target;
  input_types_.insert_or_assign(target, std::move(metadata));
}

void RawMetadataStorage::collect_resolver_metadata(RawResolverMetadata metadata)
{
  const ClassId target = metadata.target;
  resolvers_.insert_or_assign(target, std::move(metadata));
}

void RawMetadataStorage::collect_field_metadata(RawFieldMetadata metadata)
{
  const ClassId target = metadata.target;
  fields_[target].push_back(std::move(metadata));
}

void RawMetadataStorage::collect_fields_metadata(
  ClassId target, std::vector<RawFieldMetadata> fields)
{
  auto & existing = fields_[target];
  existing.insert(
    existing.end(), std::make_move_iterator(fields.begin()), std::make_move_iterator(fields.end()));
}

void RawMetadataStorage::collect_query_metadata(RawQueryMetadata metadata)
{
  const ClassId target = metadata.target;
  queries_[target].push_back(std::move(metadata));
}

void RawMetadataStorage::collect_parameter_metadata(RawParameterMetadata metadata)
{
  auto & params = parameters_[metadata.target][metadata.property_key];

  // Annotations may be collected in any order; keep signature order
  const auto pos = std::upper_bound(
    params.begin(), params.end(), metadata.index,
    [](uint32_t index, const RawParameterMetadata & p) { return index < p.index; });
  params.insert(pos, std::move(metadata));
}

// ============================================================================
// Lookup
// ============================================================================

namespace
{

template <typename Map>
const typename Map::mapped_type * find_in(const Map & map, ClassId target)
{
  auto it = map.find(target);
  return it != map.end() ? &it->second : nullptr;
}

}  // namespace

const RawObjectTypeMetadata * RawMetadataStorage::find_object_type_metadata(ClassId target) const
{
  return find_in(object_types_, target);
}

const RawInputTypeMetadata * RawMetadataStorage::find_input_type_metadata(ClassId target) const
{
  return find_in(input_types_, target);
}

const RawResolverMetadata * RawMetadataStorage::find_resolver_metadata(ClassId target) const
{
  return find_in(resolvers_, target);
}

const std::vector<RawFieldMetadata> * RawMetadataStorage::find_fields_metadata(
  ClassId target) const
{
  return find_in(fields_, target);
}

const std::vector<RawQueryMetadata> * RawMetadataStorage::find_queries_metadata(
  ClassId target) const
{
  return find_in(queries_, target);
}

const std::vector<RawParameterMetadata> * RawMetadataStorage::find_parameters_metadata(
  ClassId target, std::string_view method) const
{
  const ParametersByMethod * by_method = find_in(parameters_, target);
  if (by_method == nullptr) {
    return nullptr;
  }
  auto it = by_method->find(std::string(method));
  return it != by_method->end() ? &it->second : nullptr;
}

std::optional<ClassId> RawMetadataStorage::find_class_by_name(std::string_view name) const
{
  auto it = class_by_name_.find(std::string(name));
  if (it == class_by_name_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::string_view RawMetadataStorage::class_name(ClassId target) const
{
  if (!target.is_valid() || target.value() >= class_names_.size()) {
    return {};
  }
  return class_names_[target.value()];
}

// ============================================================================
// Enumeration
// ============================================================================

std::vector<std::string> RawMetadataStorage::parameterized_methods(ClassId target) const
{
  std::vector<std::string> methods;
  if (const ParametersByMethod * by_method = find_in(parameters_, target)) {
    methods.reserve(by_method->size());
    for (const auto & [method, params] : *by_method) {
      (void)params;
      methods.push_back(method);
    }
  }
  std::sort(methods.begin(), methods.end());
  return methods;
}

}  // namespace typegraph
