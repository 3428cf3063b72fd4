// tests/reflection/test_type_expr.cpp - Unit tests for type expression parsing
//

#include <gtest/gtest.h>

#include "typegraph/reflection/type_expr.hpp"

using namespace typegraph;

TEST(ReflectionTypeExpr, PlainName)
{
  const auto r = parse_type_expr("User");
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.expr.name, "User");
  EXPECT_EQ(r.expr.list_depth, 0U);
}

TEST(ReflectionTypeExpr, NestedLists)
{
  const auto one = parse_type_expr("[Int]");
  ASSERT_TRUE(one.success) << one.error;
  EXPECT_EQ(one.expr.name, "Int");
  EXPECT_EQ(one.expr.list_depth, 1U);

  const auto two = parse_type_expr("[[Tag_2]]");
  ASSERT_TRUE(two.success) << two.error;
  EXPECT_EQ(two.expr.name, "Tag_2");
  EXPECT_EQ(two.expr.list_depth, 2U);
}

TEST(ReflectionTypeExpr, WhitespaceBetweenTokens)
{
  const auto r = parse_type_expr("  [ [ String ] ]  ");
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.expr.name, "String");
  EXPECT_EQ(r.expr.list_depth, 2U);
}

TEST(ReflectionTypeExpr, Empty)
{
  const auto r = parse_type_expr("   ");
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, "empty type expression");
}

TEST(ReflectionTypeExpr, UnbalancedBrackets)
{
  const auto r = parse_type_expr("[[Int]");
  EXPECT_FALSE(r.success);
  EXPECT_NE(r.error.find("expected ']'"), std::string::npos);
}

TEST(ReflectionTypeExpr, MissingName)
{
  const auto r = parse_type_expr("[]");
  EXPECT_FALSE(r.success);
  EXPECT_NE(r.error.find("expected a type name at offset 1"), std::string::npos);
}

TEST(ReflectionTypeExpr, TrailingInput)
{
  EXPECT_FALSE(parse_type_expr("Int]").success);
  EXPECT_FALSE(parse_type_expr("Int!").success);
  EXPECT_FALSE(parse_type_expr("Map<Int>").success);
}

TEST(ReflectionTypeExpr, NameMustNotStartWithDigit)
{
  EXPECT_FALSE(parse_type_expr("2Fast").success);
}
