// typegraph/test_support/counting_metadata_source.hpp - helpers for unit tests
//
// A RawMetadataSource decorator that counts lookups, so tests can observe
// whether a resolution was served from the builder's cache.
//
#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include "typegraph/metadata/raw_metadata_storage.hpp"

namespace typegraph::test_support
{

struct LookupCounts
{
  size_t object_type = 0;
  size_t input_type = 0;
  size_t resolver = 0;
  size_t fields = 0;
  size_t queries = 0;
  size_t parameters = 0;

  [[nodiscard]] size_t total() const noexcept
  {
    return object_type + input_type + resolver + fields + queries + parameters;
  }
};

class CountingMetadataSource final : public RawMetadataSource
{
public:
  explicit CountingMetadataSource(const RawMetadataSource & inner) : inner_(inner) {}

  [[nodiscard]] const LookupCounts & counts() const noexcept { return counts_; }
  void reset() noexcept { counts_ = LookupCounts{}; }

  [[nodiscard]] const RawObjectTypeMetadata * find_object_type_metadata(
    ClassId target) const override
  {
    ++counts_.object_type;
    return inner_.find_object_type_metadata(target);
  }

  [[nodiscard]] const RawInputTypeMetadata * find_input_type_metadata(
    ClassId target) const override
  {
    ++counts_.input_type;
    return inner_.find_input_type_metadata(target);
  }

  [[nodiscard]] const RawResolverMetadata * find_resolver_metadata(ClassId target) const override
  {
    ++counts_.resolver;
    return inner_.find_resolver_metadata(target);
  }

  [[nodiscard]] const std::vector<RawFieldMetadata> * find_fields_metadata(
    ClassId target) const override
  {
    ++counts_.fields;
    return inner_.find_fields_metadata(target);
  }

  [[nodiscard]] const std::vector<RawQueryMetadata> * find_queries_metadata(
    ClassId target) const override
  {
    ++counts_.queries;
    return inner_.find_queries_metadata(target);
  }

  [[nodiscard]] const std::vector<RawParameterMetadata> * find_parameters_metadata(
    ClassId target, std::string_view method) const override
  {
    ++counts_.parameters;
    return inner_.find_parameters_metadata(target, method);
  }

  // Name lookups are not counted: type reflection uses them freely
  [[nodiscard]] std::optional<ClassId> find_class_by_name(std::string_view name) const override
  {
    return inner_.find_class_by_name(name);
  }

  [[nodiscard]] std::string_view class_name(ClassId target) const override
  {
    return inner_.class_name(target);
  }

private:
  const RawMetadataSource & inner_;
  mutable LookupCounts counts_;
};

}  // namespace typegraph::test_support
