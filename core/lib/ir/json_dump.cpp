// typegraph/ir/json_dump.cpp - JSON serialization implementation
//
#include "typegraph/ir/json_dump.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "typegraph/driver/schema_checker.hpp"
#include "typegraph/metadata/raw_metadata_storage.hpp"

namespace typegraph
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

void put_description(json & j, const std::optional<std::string> & description)
{
  if (description) {
    j["description"] = *description;
  }
}

json j_location(const DeclLocation & loc)
{
  if (!loc.is_valid()) {
    return nullptr;
  }
  return loc.to_string();
}

const char * severity_name(Severity severity)
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Note:
      return "note";
  }
  return "error";
}

json j_fields(const std::vector<FieldMetadata> & fields, const RawMetadataSource & names)
{
  json out = json::array();
  for (const auto & field : fields) {
    json j{
      {"name", field.schema_name},
      {"property", field.property_key},
      {"type", to_json(field.type, names)}};
    put_description(j, field.description);
    out.push_back(std::move(j));
  }
  return out;
}

json j_parameter(const ParameterMetadata & param, const RawMetadataSource & names)
{
  const RawParameterMetadata & raw = raw_parameter(param);
  json j{{"index", raw.index}, {"kind", std::string(to_string(parameter_kind(param)))}};

  if (parameter_kind(param) == ParamKind::SingleArg) {
    j["name"] = raw.name;
  }
  if (const TypeMetadata * type = parameter_type(param)) {
    j["type"] = to_json(*type, names);
  }
  put_description(j, raw.description);
  return j;
}

json j_diagnostic(const Diagnostic & diag)
{
  json j{
    {"severity", severity_name(diag.severity)},
    {"message", diag.message},
    {"location", j_location(diag.location)}};
  if (!diag.code.empty()) {
    j["code"] = diag.code;
  }
  if (!diag.related.empty()) {
    json related = json::array();
    for (const auto & loc : diag.related) {
      related.push_back(j_location(loc));
    }
    j["related"] = std::move(related);
  }
  if (diag.help_message) {
    j["help"] = *diag.help_message;
  }
  return j;
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

json to_json(const TypeMetadata & type, const RawMetadataSource & names)
{
  return json{
    {"value", value_name(type.value, names)},
    {"kind", type.value.is_class() ? "Class" : "Scalar"},
    {"nullable", type.modifiers.nullable},
    {"listDepth", type.modifiers.list_depth}};
}

json to_json(const ObjectTypeMetadata & object_type, const RawMetadataSource & names)
{
  json j{
    {"class", std::string(names.class_name(object_type.target))},
    {"name", object_type.name},
    {"fields", j_fields(object_type.fields, names)}};
  put_description(j, object_type.description);
  return j;
}

json to_json(const InputTypeMetadata & input_type, const RawMetadataSource & names)
{
  json j{
    {"class", std::string(names.class_name(input_type.target))},
    {"name", input_type.name},
    {"fields", j_fields(input_type.fields, names)}};
  put_description(j, input_type.description);
  return j;
}

json to_json(const ResolverMetadata & resolver, const RawMetadataSource & names)
{
  json queries = json::array();
  for (const auto & query : resolver.queries) {
    json params = json::array();
    for (const auto & param : query.parameters) {
      params.push_back(j_parameter(param, names));
    }

    json q{
      {"name", query.schema_name},
      {"method", query.property_key},
      {"type", to_json(query.type, names)},
      {"parameters", std::move(params)}};
    put_description(q, query.description);
    queries.push_back(std::move(q));
  }

  json j{
    {"class", std::string(names.class_name(resolver.target))}, {"queries", std::move(queries)}};
  put_description(j, resolver.description);
  return j;
}

json to_json(const CheckResult & result, const RawMetadataSource & names)
{
  json object_types = json::array();
  for (const auto & t : result.object_types) {
    object_types.push_back(to_json(t, names));
  }

  json input_types = json::array();
  for (const auto & t : result.input_types) {
    input_types.push_back(to_json(t, names));
  }

  json resolvers = json::array();
  for (const auto & r : result.resolvers) {
    resolvers.push_back(to_json(r, names));
  }

  json diagnostics = json::array();
  for (const auto & d : result.diagnostics) {
    diagnostics.push_back(j_diagnostic(d));
  }

  return json{
    {"success", result.success},
    {"objectTypes", std::move(object_types)},
    {"inputTypes", std::move(input_types)},
    {"resolvers", std::move(resolvers)},
    {"diagnostics", std::move(diagnostics)}};
}

}  // namespace typegraph
