// typegraph/basic/diagnostic.hpp - Diagnostic types for schema checking
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "typegraph/basic/decl_location.hpp"

namespace typegraph
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
  Note,
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;     // e.g., "TG004"
  std::string message;  // main message

  /// Declaration the diagnostic is about
  DeclLocation location;

  /// Secondary declarations involved (e.g. the conflicting parameters)
  std::vector<DeclLocation> related;

  std::vector<std::string> notes;
  std::optional<std::string> help_message;
};

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic with a fluent interface and registers it with the bag
 * when destroyed (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);

  DiagnosticBuilder & with_related(DeclLocation location);

  DiagnosticBuilder & with_note(std::string note);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

/**
 * Ordered collection of the diagnostics of one check run.
 *
 * Diagnostics keep report order; grouping by class is left to consumers
 * (see DiagnosticPrinter::print_all).
 */
class DiagnosticBag
{
public:
  DiagnosticBuilder report_error(DeclLocation location, std::string message);
  DiagnosticBuilder report_warning(DeclLocation location, std::string message);
  DiagnosticBuilder report_note(DeclLocation location, std::string message);

  void add(Diagnostic diag) { diagnostics_.push_back(std::move(diag)); }

  /// Move all diagnostics of `other` to the end of this bag
  void merge(DiagnosticBag && other);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] size_t count(Severity severity) const;
  [[nodiscard]] bool has_errors() const { return count(Severity::Error) > 0; }
  [[nodiscard]] bool has_warnings() const { return count(Severity::Warning) > 0; }

  /// Copies of the diagnostics with the given severity, in report order
  [[nodiscard]] std::vector<Diagnostic> of_severity(Severity severity) const;
  [[nodiscard]] std::vector<Diagnostic> errors() const { return of_severity(Severity::Error); }
  [[nodiscard]] std::vector<Diagnostic> warnings() const
  {
    return of_severity(Severity::Warning);
  }

  /// Diagnostics located on `target` (any member or parameter of it)
  [[nodiscard]] std::vector<const Diagnostic *> for_class(ClassId target) const;

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace typegraph
