// typegraph/basic/diagnostic_printer.hpp
//
// Prints diagnostics with their declaration location in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "typegraph/basic/diagnostic.hpp"

namespace typegraph
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[TG005]: query 'UserResolver.getUser' mixes single and spread arguments
 *     --> UserResolver.getUser
 *         |
 *         = related: UserResolver.getUser#1
 *         = help: use either single arguments or one spread-arguments input type
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /**
   * Print a single diagnostic.
   */
  void print(const Diagnostic & diag);

  /**
   * Print all diagnostics from a DiagnosticBag, grouped by declaring class.
   */
  void print_all(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_related(const DeclLocation & location);
  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace typegraph
