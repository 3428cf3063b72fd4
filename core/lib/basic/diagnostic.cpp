// typegraph/basic/diagnostic.cpp - Diagnostic implementation
#include "typegraph/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace typegraph
{

namespace
{

Diagnostic make_diagnostic(Severity severity, DeclLocation location, std::string message)
{
  Diagnostic d;
  d.severity = severity;
  d.message = std::move(message);
  d.location = std::move(location);
  return d;
}

}  // namespace

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  diagnostic_.code = std::move(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_related(DeclLocation location)
{
  diagnostic_.related.push_back(std::move(location));
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_note(std::string note)
{
  diagnostic_.notes.push_back(std::move(note));
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report_error(DeclLocation location, std::string message)
{
  return {*this, make_diagnostic(Severity::Error, std::move(location), std::move(message))};
}

DiagnosticBuilder DiagnosticBag::report_warning(DeclLocation location, std::string message)
{
  return {*this, make_diagnostic(Severity::Warning, std::move(location), std::move(message))};
}

DiagnosticBuilder DiagnosticBag::report_note(DeclLocation location, std::string message)
{
  return {*this, make_diagnostic(Severity::Note, std::move(location), std::move(message))};
}

size_t DiagnosticBag::count(Severity severity) const
{
  return static_cast<size_t>(std::count_if(
    diagnostics_.begin(), diagnostics_.end(),
    [severity](const Diagnostic & d) { return d.severity == severity; }));
}

std::vector<Diagnostic> DiagnosticBag::of_severity(Severity severity) const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [severity](const Diagnostic & d) { return d.severity == severity; });
  return result;
}

std::vector<const Diagnostic *> DiagnosticBag::for_class(ClassId target) const
{
  std::vector<const Diagnostic *> result;
  for (const auto & d : diagnostics_) {
    if (d.location.class_id == target) {
      result.push_back(&d);
    }
  }
  return result;
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  if (diagnostics_.empty()) {
    diagnostics_ = std::move(other.diagnostics_);
  } else {
    std::move(
      other.diagnostics_.begin(), other.diagnostics_.end(), std::back_inserter(diagnostics_));
  }
  other.diagnostics_.clear();
}

}  // namespace typegraph
