// typegraph/reflection/type_expr.hpp - Declared type expression parsing
//
// Grammar:
//   type := '[' type ']' | NAME
//   NAME := [A-Za-z_][A-Za-z0-9_]*
// Whitespace is allowed between tokens.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace typegraph
{

/**
 * A parsed type expression: the referenced name and how many list
 * brackets wrap it.
 */
struct ParsedTypeExpr
{
  std::string name;
  uint32_t list_depth = 0;
};

/**
 * Result of parsing a type expression.
 */
struct TypeExprParseResult
{
  /// Parsed expression (only valid if success == true)
  ParsedTypeExpr expr;

  bool success = false;

  /// Error message if parsing failed
  std::string error;

  static TypeExprParseResult ok(ParsedTypeExpr e)
  {
    TypeExprParseResult r;
    r.expr = std::move(e);
    r.success = true;
    return r;
  }

  static TypeExprParseResult fail(std::string msg)
  {
    TypeExprParseResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * Parse a declared type expression such as `User`, `[Int]` or `[[Tag]]`.
 */
[[nodiscard]] TypeExprParseResult parse_type_expr(std::string_view text);

}  // namespace typegraph
