// typegraph/reflection/type_expr.cpp - Declared type expression parsing
//
#include "typegraph/reflection/type_expr.hpp"

#include <cctype>

namespace typegraph
{

namespace
{

bool is_ident_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_'; }
bool is_ident_continue(unsigned char c) { return (std::isalnum(c) != 0) || c == '_'; }

class TypeExprParser
{
public:
  explicit TypeExprParser(std::string_view src) : src_(src) {}

  TypeExprParseResult parse()
  {
    skip_whitespace();
    if (eof()) {
      return TypeExprParseResult::fail("empty type expression");
    }

    ParsedTypeExpr expr;

    // Opening brackets
    while (peek() == '[') {
      advance();
      ++expr.list_depth;
      skip_whitespace();
    }

    if (!is_ident_start(static_cast<unsigned char>(peek()))) {
      return fail_here("expected a type name");
    }
    const size_t start = pos_;
    while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
      advance();
    }
    expr.name = std::string(src_.substr(start, pos_ - start));
    skip_whitespace();

    // Closing brackets must balance the opening ones
    for (uint32_t i = 0; i < expr.list_depth; ++i) {
      if (peek() != ']') {
        return fail_here("expected ']'");
      }
      advance();
      skip_whitespace();
    }

    if (!eof()) {
      return fail_here("unexpected trailing input");
    }
    return TypeExprParseResult::ok(std::move(expr));
  }

private:
  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek() const noexcept { return eof() ? '\0' : src_[pos_]; }
  void advance() noexcept { ++pos_; }

  void skip_whitespace()
  {
    while (!eof() && (std::isspace(static_cast<unsigned char>(peek())) != 0)) {
      advance();
    }
  }

  [[nodiscard]] TypeExprParseResult fail_here(std::string_view what) const
  {
    std::string msg(what);
    msg += " at offset ";
    msg += std::to_string(pos_);
    msg += " in '";
    msg += src_;
    msg += "'";
    return TypeExprParseResult::fail(std::move(msg));
  }

  std::string_view src_;
  size_t pos_ = 0;
};

}  // namespace

TypeExprParseResult parse_type_expr(std::string_view text) { return TypeExprParser(text).parse(); }

}  // namespace typegraph
