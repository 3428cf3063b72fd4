// typegraph/schema/schema_config.cpp - Project configuration implementation
//
#include "typegraph/schema/schema_config.hpp"

#include <yaml-cpp/yaml.h>

#include "typegraph/reflection/type_expr.hpp"

namespace typegraph
{

namespace
{

/// Parse the 'schema' section
bool parse_schema_section(const YAML::Node & node, BuildSchemaConfig & schema, std::string & error)
{
  if (!node.IsMap()) {
    error = "schema must be a map";
    return false;
  }

  if (node["nullable_by_default"]) {
    try {
      schema.nullable_by_default = node["nullable_by_default"].as<bool>();
    } catch (const YAML::Exception &) {
      error = "schema.nullable_by_default must be a boolean";
      return false;
    }
  }

  if (node["scalars"]) {
    if (!node["scalars"].IsSequence()) {
      error = "schema.scalars must be a list";
      return false;
    }

    for (const auto & scalar : node["scalars"]) {
      const auto name = scalar.as<std::string>();
      if (const auto invalid = validate_scalar_name(name)) {
        error = "schema.scalars: " + *invalid;
        return false;
      }
      schema.scalars.push_back(name);
    }
  }

  return true;
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  // Load YAML
  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  try {
    // Parse 'package' section
    if (root["package"]) {
      const auto & pkg = root["package"];
      if (pkg["name"]) {
        config.package.name = pkg["name"].as<std::string>();
      }
      if (pkg["version"]) {
        config.package.version = pkg["version"].as<std::string>();
      }
    }

    // Parse 'schema' section
    if (root["schema"]) {
      std::string schema_error;
      if (!parse_schema_section(root["schema"], config.schema, schema_error)) {
        return ConfigLoadResult::fail(schema_error);
      }
    }

    // Parse 'manifests' section
    if (root["manifests"]) {
      if (!root["manifests"].IsSequence()) {
        return ConfigLoadResult::fail("manifests must be a list");
      }
      for (const auto & manifest : root["manifests"]) {
        config.manifests.emplace_back(manifest.as<std::string>());
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    // Move up to parent
    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

std::optional<std::string> validate_scalar_name(std::string_view name)
{
  const TypeExprParseResult parsed = parse_type_expr(name);
  if (!parsed.success || parsed.expr.list_depth != 0 || parsed.expr.name != name) {
    return "'" + std::string(name) + "' is not a valid type name";
  }

  ScalarTable builtins;
  builtins.register_builtins();
  if (builtins.contains(name)) {
    return "'" + std::string(name) + "' is a built-in scalar";
  }
  return std::nullopt;
}

ScalarTable make_scalar_table(const BuildSchemaConfig & config)
{
  ScalarTable table;
  table.register_builtins();
  for (const auto & name : config.scalars) {
    // Duplicates are harmless; the first definition wins
    table.define(name);
  }
  return table;
}

}  // namespace typegraph
