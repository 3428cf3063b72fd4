// typegraph/metadata/type_metadata.cpp - Type descriptor helpers
//
#include "typegraph/metadata/type_metadata.hpp"

#include "typegraph/metadata/raw_metadata_storage.hpp"

namespace typegraph
{

std::string value_name(const TypeValue & value, const RawMetadataSource & names)
{
  if (value.is_scalar()) {
    return value.scalar_name;
  }
  const std::string_view name = names.class_name(value.class_id);
  if (name.empty()) {
    return "<class #" + std::to_string(value.class_id.value()) + ">";
  }
  return std::string(name);
}

std::string to_string(const TypeMetadata & type, const RawMetadataSource & names)
{
  const uint32_t depth = type.modifiers.list_depth;
  if (depth == 0) {
    std::string out = value_name(type.value, names);
    return type.modifiers.nullable ? out : out + "!";
  }

  // Items are non-null at every level below the outermost list
  std::string out(depth, '[');
  out += value_name(type.value, names);
  out += '!';
  for (uint32_t level = 1; level < depth; ++level) {
    out += "]!";
  }
  out += ']';
  if (!type.modifiers.nullable) {
    out += '!';
  }
  return out;
}

}  // namespace typegraph
