// tgc - TypeGraph schema checker Command Line Interface
//
// Usage:
//   tgc check [manifest.yaml | --project]
//   tgc dump [manifest.yaml | --project] [-o output.json]
//   tgc init <project-name>
//
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "typegraph/basic/diagnostic_printer.hpp"
#include "typegraph/driver/schema_checker.hpp"
#include "typegraph/ir/json_dump.hpp"
#include "typegraph/schema/schema_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "TypeGraph Schema Checker v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check [manifest.yaml]    Resolve and validate all declarations\n"
            << "  dump [manifest.yaml]     Print the resolved schema metadata as JSON\n"
            << "  init <project-name>      Initialize a new project\n\n"
            << "Options:\n"
            << "  -o, --output <path>      Output file (dump)\n"
            << "  --project                Use typegraph.yaml\n"
            << "  --nullable-by-default    Types are nullable unless declared otherwise\n"
            << "  --scalar <Name>          Register a custom scalar (repeatable)\n"
            << "  --no-orphan-warnings     Do not warn about unused declarations\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(const typegraph::DiagnosticBag & diagnostics)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  typegraph::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics);

  const size_t errors = diagnostics.count(typegraph::Severity::Error);
  const size_t warnings = diagnostics.count(typegraph::Severity::Warning);
  std::cerr << errors << (errors == 1 ? " error" : " errors") << ", " << warnings
            << (warnings == 1 ? " warning" : " warnings") << " generated\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string output_path;
  std::vector<std::string> scalars;
  bool use_project = false;
  bool nullable_by_default = false;
  bool no_orphan_warnings = false;
  bool verbose = false;
  bool show_help = false;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        args.output_path = argv[++i];
      }
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--nullable-by-default") {
      args.nullable_by_default = true;
    } else if (arg == "--scalar") {
      if (i + 1 < argc) {
        args.scalars.emplace_back(argv[++i]);
      }
    } else if (arg == "--no-orphan-warnings") {
      args.no_orphan_warnings = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    }
  }

  return args;
}

// ============================================================================
// Commands
// ============================================================================

/// Run the check pipeline; prints an error and returns nullopt on setup failure
std::optional<typegraph::CheckResult> run_check(const CommandArgs & args)
{
  for (const auto & scalar : args.scalars) {
    if (const auto invalid = typegraph::validate_scalar_name(scalar)) {
      std::cerr << "error: --scalar: " << *invalid << "\n";
      return std::nullopt;
    }
  }

  typegraph::CheckOptions options;
  options.verbose = args.verbose;
  options.extra_scalars = args.scalars;
  options.warn_orphans = !args.no_orphan_warnings;
  if (args.nullable_by_default) {
    options.nullable_by_default = true;
  }

  if (args.use_project || args.input_file.empty()) {
    // Project mode: find typegraph.yaml
    auto config_path = typegraph::find_project_config(fs::current_path());
    if (!config_path) {
      std::cerr << "error: no " << typegraph::k_project_config_file_name
                << " found in current directory or parents\n";
      return std::nullopt;
    }

    const auto config_result = typegraph::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return std::nullopt;
    }

    if (args.verbose) {
      std::cerr << "Checking project: " << config_result.config.package.name << "\n";
    }

    return typegraph::SchemaChecker::check_project(config_result.config, options);
  }

  // Single manifest mode
  const fs::path input_path = fs::absolute(args.input_file);

  if (!fs::exists(input_path)) {
    std::cerr << "error: file not found: " << input_path.string() << "\n";
    return std::nullopt;
  }

  if (args.verbose) {
    std::cerr << "Checking: " << input_path.string() << "\n";
  }

  return typegraph::SchemaChecker::check_manifest(input_path, {}, options);
}

int cmd_check(const CommandArgs & args)
{
  const auto result = run_check(args);
  if (!result) {
    return 1;
  }

  if (!result->diagnostics.empty()) {
    print_diagnostics(result->diagnostics);
  }

  if (result->success) {
    std::cout << (args.input_file.empty() ? "project" : args.input_file) << ": OK ("
              << result->object_types.size() << " object type(s), "
              << result->input_types.size() << " input type(s), " << result->resolvers.size()
              << " resolver(s))\n";
    return 0;
  }

  return 1;
}

int cmd_dump(const CommandArgs & args)
{
  const auto result = run_check(args);
  if (!result) {
    return 1;
  }

  if (!result->diagnostics.empty()) {
    print_diagnostics(result->diagnostics);
  }

  const std::string text = typegraph::to_json(*result, *result->storage).dump(2);

  if (args.output_path.empty()) {
    std::cout << text << "\n";
  } else {
    std::ofstream out(args.output_path);
    if (!out.is_open()) {
      std::cerr << "error: failed to open output file: " << args.output_path << "\n";
      return 1;
    }
    out << text << "\n";
    if (args.verbose) {
      std::cerr << "Wrote: " << args.output_path << "\n";
    }
  }

  return result->success ? 0 : 1;
}

int cmd_init(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: project name required\n";
    std::cerr << "usage: tgc init <project-name>\n";
    return 1;
  }

  const fs::path project_dir = fs::current_path() / args.input_file;

  if (fs::exists(project_dir)) {
    std::cerr << "error: directory already exists: " << project_dir.string() << "\n";
    return 1;
  }

  try {
    fs::create_directories(project_dir / "schema");

    // Create typegraph.yaml
    std::ofstream config(project_dir / typegraph::k_project_config_file_name);
    config << "package:\n"
           << "  name: '" << args.input_file << "'\n"
           << "  version: '0.1.0'\n\n"
           << "schema:\n"
           << "  nullable_by_default: false\n"
           << "  scalars: []\n\n"
           << "manifests:\n"
           << "  - './schema/types.yaml'\n";
    config.close();

    // Create a starter manifest
    std::ofstream manifest(project_dir / "schema" / "types.yaml");
    manifest << "classes:\n"
             << "  - name: Recipe\n"
             << "    object_type: { description: A cooking recipe }\n"
             << "    fields:\n"
             << "      - { property: id, type: ID }\n"
             << "      - { property: title, type: String }\n"
             << "  - name: RecipeResolver\n"
             << "    resolver: true\n"
             << "    queries:\n"
             << "      - property: recipe\n"
             << "        type: Recipe\n"
             << "        nullable: true\n"
             << "        parameters:\n"
             << "          - { kind: single_arg, name: id, type: ID }\n";
    manifest.close();

    std::cout << "Initialized new TypeGraph project in " << project_dir.string() << "\n";
    std::cout << "\nNext steps:\n"
              << "  cd " << args.input_file << "\n"
              << "  tgc check\n";

    return 0;
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  if (args.command == "dump") {
    return cmd_dump(args);
  }

  if (args.command == "init") {
    return cmd_init(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
