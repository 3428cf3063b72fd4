// typegraph/manifest/manifest_loader.cpp - YAML declaration manifest loading
//
#include "typegraph/manifest/manifest_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <string>
#include <unordered_set>
#include <vector>

namespace typegraph
{

namespace
{

// Deeper nesting is almost certainly a typo in the manifest
constexpr int k_max_list_depth = 32;

std::optional<std::string> optional_string(const YAML::Node & node, const char * key)
{
  if (!node[key]) {
    return std::nullopt;
  }
  return node[key].as<std::string>();
}

/// `key: true`, `key: {}` and `key: {...}` all declare the category
bool declares_category(const YAML::Node & node)
{
  if (!node) {
    return false;
  }
  if (node.IsScalar()) {
    return node.as<bool>();
  }
  return node.IsMap();
}

bool parse_type_ref(
  const YAML::Node & node, const std::string & owner, RawTypeReference & out, std::string & error)
{
  if (!node["type"]) {
    error = owner + ": missing 'type'";
    return false;
  }
  out.type_expr = node["type"].as<std::string>();

  if (node["nullable"]) {
    out.nullable = node["nullable"].as<bool>();
  }
  if (node["list_depth"]) {
    const int depth = node["list_depth"].as<int>();
    if (depth < 0) {
      error = owner + ": list_depth must not be negative";
      return false;
    }
    if (depth > k_max_list_depth) {
      error = owner + ": list_depth must not exceed " + std::to_string(k_max_list_depth);
      return false;
    }
    out.list_depth = static_cast<uint32_t>(depth);
  }
  return true;
}

/// Parse a single field entry
std::optional<RawFieldMetadata> parse_field(
  const YAML::Node & node, ClassId target, const std::string & class_name, std::string & error)
{
  if (!node.IsMap()) {
    error = class_name + ": field entry must be a map";
    return std::nullopt;
  }
  if (!node["property"]) {
    error = class_name + ": field entry must have a 'property'";
    return std::nullopt;
  }

  RawFieldMetadata field;
  field.target = target;
  field.property_key = node["property"].as<std::string>();
  field.schema_name = optional_string(node, "name").value_or(field.property_key);
  field.description = optional_string(node, "description");

  if (!parse_type_ref(node, class_name + "." + field.property_key, field.type_ref, error)) {
    return std::nullopt;
  }
  return field;
}

/// Parse a single parameter entry at `position` in the handler signature
std::optional<RawParameterMetadata> parse_parameter(
  const YAML::Node & node, const RawQueryMetadata & query, const std::string & owner,
  uint32_t position, std::string & error)
{
  if (!node.IsMap()) {
    error = owner + ": parameter entry must be a map";
    return std::nullopt;
  }
  if (!node["kind"]) {
    error = owner + ": parameter entry must have a 'kind'";
    return std::nullopt;
  }

  const auto kind_text = node["kind"].as<std::string>();
  const auto kind = parse_param_kind(kind_text);
  if (!kind) {
    error = owner + ": unknown parameter kind '" + kind_text +
            "' (must be 'single_arg', 'spread_args', 'context' or 'info')";
    return std::nullopt;
  }

  RawParameterMetadata param;
  param.target = query.target;
  param.property_key = query.property_key;
  param.kind = *kind;
  param.index = node["index"] ? node["index"].as<uint32_t>() : position;
  param.name = optional_string(node, "name").value_or("");
  param.description = optional_string(node, "description");

  switch (param.kind) {
    case ParamKind::SingleArg:
      if (param.name.empty()) {
        error = owner + ": single_arg parameter must have a 'name'";
        return std::nullopt;
      }
      if (!parse_type_ref(node, owner, param.type_ref, error)) {
        return std::nullopt;
      }
      break;
    case ParamKind::SpreadArgs:
      if (!parse_type_ref(node, owner, param.type_ref, error)) {
        return std::nullopt;
      }
      break;
    case ParamKind::Context:
    case ParamKind::Info:
      break;
  }
  return param;
}

/// Parse one query entry and collect it together with its parameters
bool collect_query(
  const YAML::Node & node, ClassId target, const std::string & class_name,
  RawMetadataStorage & storage, std::string & error)
{
  if (!node.IsMap()) {
    error = class_name + ": query entry must be a map";
    return false;
  }
  if (!node["property"]) {
    error = class_name + ": query entry must have a 'property'";
    return false;
  }

  RawQueryMetadata query;
  query.target = target;
  query.property_key = node["property"].as<std::string>();
  query.schema_name = optional_string(node, "name").value_or(query.property_key);
  query.description = optional_string(node, "description");

  const std::string owner = class_name + "." + query.property_key;
  if (!parse_type_ref(node, owner, query.type_ref, error)) {
    return false;
  }

  std::vector<RawParameterMetadata> params;
  if (const auto params_node = node["parameters"]) {
    if (!params_node.IsSequence()) {
      error = owner + ": parameters must be a list";
      return false;
    }
    uint32_t position = 0;
    for (const auto & param_node : params_node) {
      auto param = parse_parameter(param_node, query, owner, position++, error);
      if (!param) {
        return false;
      }
      params.push_back(std::move(*param));
    }
  }

  storage.collect_query_metadata(std::move(query));
  for (auto & param : params) {
    storage.collect_parameter_metadata(std::move(param));
  }
  return true;
}

/// Collect every declaration of one class entry
bool collect_class(
  const YAML::Node & entry, RawMetadataStorage & storage, std::string & error)
{
  const auto class_name = entry["name"].as<std::string>();
  const ClassId target = storage.declare_class(class_name);

  if (declares_category(entry["object_type"])) {
    const auto & node = entry["object_type"];
    RawObjectTypeMetadata object_type;
    object_type.target = target;
    object_type.name = node.IsMap() ? optional_string(node, "name").value_or(class_name) : class_name;
    object_type.description = node.IsMap() ? optional_string(node, "description") : std::nullopt;
    storage.collect_object_type_metadata(std::move(object_type));
  }

  if (declares_category(entry["input_type"])) {
    const auto & node = entry["input_type"];
    RawInputTypeMetadata input_type;
    input_type.target = target;
    input_type.name = node.IsMap() ? optional_string(node, "name").value_or(class_name) : class_name;
    input_type.description = node.IsMap() ? optional_string(node, "description") : std::nullopt;
    storage.collect_input_type_metadata(std::move(input_type));
  }

  if (declares_category(entry["resolver"])) {
    const auto & node = entry["resolver"];
    RawResolverMetadata resolver;
    resolver.target = target;
    resolver.description = node.IsMap() ? optional_string(node, "description") : std::nullopt;
    storage.collect_resolver_metadata(std::move(resolver));
  }

  if (const auto fields_node = entry["fields"]) {
    if (!fields_node.IsSequence()) {
      error = class_name + ": fields must be a list";
      return false;
    }
    std::vector<RawFieldMetadata> fields;
    std::unordered_set<std::string> properties;
    for (const auto & field_node : fields_node) {
      auto field = parse_field(field_node, target, class_name, error);
      if (!field) {
        return false;
      }
      if (!properties.insert(field->property_key).second) {
        error = class_name + ": duplicate field '" + field->property_key + "'";
        return false;
      }
      fields.push_back(std::move(*field));
    }
    // An explicit empty list is kept: it is reported differently from no list
    storage.collect_fields_metadata(target, std::move(fields));
  }

  if (const auto queries_node = entry["queries"]) {
    if (!queries_node.IsSequence()) {
      error = class_name + ": queries must be a list";
      return false;
    }
    // Parameters are keyed by method, so a repeated query would share them
    std::unordered_set<std::string> properties;
    for (const auto & query_node : queries_node) {
      if (query_node.IsMap() && query_node["property"]) {
        const auto property = query_node["property"].as<std::string>();
        if (!properties.insert(property).second) {
          error = class_name + ": duplicate query '" + property + "'";
          return false;
        }
      }
      if (!collect_query(query_node, target, class_name, storage, error)) {
        return false;
      }
    }
  }

  return true;
}

ManifestLoadResult load_manifest_node(const YAML::Node & root, RawMetadataStorage & storage)
{
  if (!root.IsMap() || !root["classes"]) {
    return ManifestLoadResult::fail("manifest must be a map with a 'classes' list");
  }
  const auto classes = root["classes"];
  if (!classes.IsSequence()) {
    return ManifestLoadResult::fail("classes must be a list");
  }

  try {
    // Pass 1: declare every class so that type references resolve in any order
    std::unordered_set<std::string> seen;
    for (const auto & entry : classes) {
      if (!entry.IsMap() || !entry["name"]) {
        return ManifestLoadResult::fail("class entry must be a map with a 'name'");
      }
      const auto name = entry["name"].as<std::string>();
      if (!seen.insert(name).second) {
        return ManifestLoadResult::fail("duplicate class entry: '" + name + "'");
      }
      if (storage.find_class_by_name(name)) {
        return ManifestLoadResult::fail(
          "class '" + name + "' is already listed by another manifest");
      }
      storage.declare_class(name);
    }

    // Pass 2: collect declarations
    for (const auto & entry : classes) {
      std::string error;
      if (!collect_class(entry, storage, error)) {
        return ManifestLoadResult::fail(error);
      }
    }

    return ManifestLoadResult::ok(seen.size());
  } catch (const YAML::Exception & e) {
    return ManifestLoadResult::fail("invalid manifest: " + std::string(e.what()));
  }
}

}  // namespace

std::optional<ParamKind> parse_param_kind(std::string_view text)
{
  if (text == "single_arg") {
    return ParamKind::SingleArg;
  }
  if (text == "spread_args") {
    return ParamKind::SpreadArgs;
  }
  if (text == "context") {
    return ParamKind::Context;
  }
  if (text == "info") {
    return ParamKind::Info;
  }
  return std::nullopt;
}

ManifestLoadResult load_manifest_string(std::string_view yaml, RawMetadataStorage & storage)
{
  YAML::Node root;
  try {
    root = YAML::Load(std::string(yaml));
  } catch (const YAML::Exception & e) {
    return ManifestLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return load_manifest_node(root, storage);
}

ManifestLoadResult load_manifest_file(
  const std::filesystem::path & path, RawMetadataStorage & storage)
{
  if (!std::filesystem::exists(path)) {
    return ManifestLoadResult::fail("manifest not found: " + path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(path.string());
  } catch (const YAML::Exception & e) {
    return ManifestLoadResult::fail(
      "failed to parse YAML in " + path.string() + ": " + std::string(e.what()));
  }

  ManifestLoadResult result = load_manifest_node(root, storage);
  if (!result.success) {
    result.error = path.string() + ": " + result.error;
  }
  return result;
}

}  // namespace typegraph
