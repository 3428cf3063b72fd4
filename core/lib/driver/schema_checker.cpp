// typegraph/driver/schema_checker.cpp - Schema check driver implementation
//
#include "typegraph/driver/schema_checker.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <utility>

#include "typegraph/builder/metadata_builder.hpp"
#include "typegraph/manifest/manifest_loader.hpp"
#include "typegraph/metadata/errors.hpp"
#include "typegraph/reflection/type_reflection.hpp"

namespace typegraph
{

namespace
{

void report_metadata_error(
  const MetadataError & e, const RawMetadataSource & storage, DiagnosticBag & diags)
{
  auto builder = diags.report_error(e.location(), e.what());
  builder.with_code(std::string(e.code()));

  // Point at the parameters that take part in an argument conflict
  if (
    e.kind() == MetadataErrorKind::MultipleArgsUsage ||
    e.kind() == MetadataErrorKind::SimultaneousArgsUsage) {
    const DeclLocation & query = e.location();
    if (const auto * params = storage.find_parameters_metadata(query.class_id, query.member)) {
      for (const auto & param : *params) {
        if (param.kind == ParamKind::SingleArg || param.kind == ParamKind::SpreadArgs) {
          builder.with_related(DeclLocation::of_parameter(
            query.class_id, query.class_name, query.member, param.index));
        }
      }
    }
  }

  const std::string help = e.help();
  if (!help.empty()) {
    builder.with_help(help);
  }
}

/// Run one resolution, turning a MetadataError into a diagnostic
template <typename Resolve>
bool try_resolve(const RawMetadataSource & storage, DiagnosticBag & diags, Resolve && resolve)
{
  try {
    resolve();
    return true;
  } catch (const MetadataError & e) {
    report_metadata_error(e, storage, diags);
    return false;
  }
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

BuildSchemaConfig SchemaChecker::effective_config(
  const BuildSchemaConfig & config, const CheckOptions & options)
{
  BuildSchemaConfig effective = config;
  if (options.nullable_by_default) {
    effective.nullable_by_default = *options.nullable_by_default;
  }
  for (const auto & scalar : options.extra_scalars) {
    if (std::find(effective.scalars.begin(), effective.scalars.end(), scalar) ==
        effective.scalars.end()) {
      effective.scalars.push_back(scalar);
    }
  }
  return effective;
}

CheckResult SchemaChecker::check_manifest(
  const std::filesystem::path & manifest, const BuildSchemaConfig & config,
  const CheckOptions & options)
{
  ProjectConfig project;
  project.schema = config;
  project.manifests.push_back(manifest);
  project.project_root = std::filesystem::current_path();
  return check_project(project, options);
}

CheckResult SchemaChecker::check_project(
  const ProjectConfig & config, const CheckOptions & options)
{
  auto storage = std::make_unique<RawMetadataStorage>();
  DiagnosticBag load_diags;

  // === Phase 1: Manifest loading ===
  for (const auto & path : config.manifest_paths()) {
    if (options.verbose) {
      std::cerr << "Loading manifest: " << path.string() << "\n";
    }

    const ManifestLoadResult loaded = load_manifest_file(path, *storage);
    if (!loaded.success) {
      load_diags.report_error(DeclLocation{}, loaded.error);
      continue;
    }

    if (options.verbose) {
      std::cerr << "  " << loaded.class_count << " class(es)\n";
    }
  }

  if (load_diags.has_errors()) {
    CheckResult result;
    result.diagnostics = std::move(load_diags);
    result.storage = std::move(storage);
    return result;
  }

  // === Phase 2: Resolution ===
  const BuildSchemaConfig effective = effective_config(config.schema, options);
  if (options.verbose) {
    std::cerr << "Resolving " << storage->classes().size() << " class(es)"
              << (effective.nullable_by_default ? " (nullable by default)" : "") << "\n";
  }

  CheckResult result = check_storage(*storage, effective, options.warn_orphans);
  result.storage = std::move(storage);
  return result;
}

CheckResult SchemaChecker::check_storage(
  const RawMetadataStorage & storage, const BuildSchemaConfig & config, bool warn_orphans)
{
  CheckResult result;

  const ExpressionTypeReflector reflector(storage, make_scalar_table(config));
  MetadataBuilder builder(storage, reflector, config);

  for (const ClassId cls : storage.classes()) {
    if (storage.find_object_type_metadata(cls) != nullptr) {
      try_resolve(storage, result.diagnostics, [&] {
        result.object_types.push_back(builder.resolve_object_type(cls));
      });
    }
    if (storage.find_input_type_metadata(cls) != nullptr) {
      try_resolve(storage, result.diagnostics, [&] {
        result.input_types.push_back(builder.resolve_input_type(cls));
      });
    }
    if (storage.find_resolver_metadata(cls) != nullptr) {
      try_resolve(storage, result.diagnostics, [&] {
        result.resolvers.push_back(builder.resolve_resolver(cls));
      });
    }
  }

  if (warn_orphans) {
    report_orphans(storage, result.diagnostics);
  }

  result.success = !result.diagnostics.has_errors();
  return result;
}

// ============================================================================
// Orphan Declarations
// ============================================================================

void SchemaChecker::report_orphans(const RawMetadataStorage & storage, DiagnosticBag & diags)
{
  for (const ClassId cls : storage.classes()) {
    const std::string name(storage.class_name(cls));
    const bool is_type = storage.find_object_type_metadata(cls) != nullptr ||
                         storage.find_input_type_metadata(cls) != nullptr;

    const auto * fields = storage.find_fields_metadata(cls);
    if (!is_type && fields != nullptr && !fields->empty()) {
      diags
        .report_warning(
          DeclLocation::of_class(cls, name), "fields of '" + name + "' are never used")
        .with_note("the class has no ObjectType or InputType declaration");
    }

    const auto * queries = storage.find_queries_metadata(cls);
    if (storage.find_resolver_metadata(cls) == nullptr && queries != nullptr && !queries->empty()) {
      diags
        .report_warning(
          DeclLocation::of_class(cls, name), "queries of '" + name + "' are never used")
        .with_note("the class has no Resolver declaration");
    }

    for (const auto & method : storage.parameterized_methods(cls)) {
      const bool is_query =
        queries != nullptr &&
        std::any_of(queries->begin(), queries->end(), [&](const RawQueryMetadata & q) {
          return q.property_key == method;
        });
      if (!is_query) {
        diags
          .report_warning(
            DeclLocation::of_member(cls, name, method),
            "parameters of '" + name + "." + method + "' are never used")
          .with_note("'" + method + "' is not a declared query");
      }
    }
  }
}

}  // namespace typegraph
