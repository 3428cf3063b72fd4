// tests/metadata/test_raw_metadata_storage.cpp - Unit tests for the raw declaration store
//

#include <gtest/gtest.h>

#include <string>
#include <utility>

#include "typegraph/metadata/raw_metadata_storage.hpp"

using namespace typegraph;

namespace
{

RawParameterMetadata make_param(ClassId target, std::string method, uint32_t index)
{
  RawParameterMetadata param;
  param.target = target;
  param.property_key = std::move(method);
  param.index = index;
  param.kind = ParamKind::SingleArg;
  param.name = "p" + std::to_string(index);
  param.type_ref.type_expr = "Int";
  return param;
}

}  // namespace

TEST(MetadataStorage, DeclareClassAssignsStableIds)
{
  RawMetadataStorage storage;
  const ClassId user = storage.declare_class("User");
  const ClassId post = storage.declare_class("Post");

  EXPECT_TRUE(user.is_valid());
  EXPECT_NE(user, post);
  EXPECT_EQ(storage.declare_class("User"), user);

  ASSERT_EQ(storage.classes().size(), 2U);
  EXPECT_EQ(storage.classes()[0], user);
  EXPECT_EQ(storage.classes()[1], post);

  EXPECT_EQ(storage.class_name(post), "Post");
  EXPECT_EQ(storage.find_class_by_name("User"), user);
  EXPECT_FALSE(storage.find_class_by_name("Comment").has_value());
}

TEST(MetadataStorage, ClassNamesSurviveGrowth)
{
  RawMetadataStorage storage;
  const ClassId first = storage.declare_class("First");
  const std::string_view name = storage.class_name(first);

  for (int i = 0; i < 200; ++i) {
    storage.declare_class("C" + std::to_string(i));
  }
  EXPECT_EQ(name, "First");
}

TEST(MetadataStorage, UnknownClassName)
{
  const RawMetadataStorage storage;
  EXPECT_TRUE(storage.class_name(ClassId::invalid()).empty());
  EXPECT_TRUE(storage.class_name(ClassId(42)).empty());
}

TEST(MetadataStorage, NotFoundIsDistinctFromEmpty)
{
  RawMetadataStorage storage;
  const ClassId with_empty = storage.declare_class("WithEmpty");
  const ClassId without = storage.declare_class("Without");

  storage.collect_fields_metadata(with_empty, {});

  const auto * empty = storage.find_fields_metadata(with_empty);
  ASSERT_NE(empty, nullptr);
  EXPECT_TRUE(empty->empty());
  EXPECT_EQ(storage.find_fields_metadata(without), nullptr);
  EXPECT_EQ(storage.find_queries_metadata(without), nullptr);
  EXPECT_EQ(storage.find_parameters_metadata(without, "any"), nullptr);
}

TEST(MetadataStorage, ClassDeclarationIsReplaced)
{
  RawMetadataStorage storage;
  const ClassId cls = storage.declare_class("User");
  storage.collect_object_type_metadata({cls, "User", std::nullopt});
  storage.collect_object_type_metadata({cls, "Person", std::string("renamed")});

  const auto * object_type = storage.find_object_type_metadata(cls);
  ASSERT_NE(object_type, nullptr);
  EXPECT_EQ(object_type->name, "Person");
  EXPECT_EQ(storage.find_input_type_metadata(cls), nullptr);
  EXPECT_EQ(storage.find_resolver_metadata(cls), nullptr);
}

TEST(MetadataStorage, ParametersAreOrderedByIndex)
{
  RawMetadataStorage storage;
  const ClassId cls = storage.declare_class("R");
  storage.collect_parameter_metadata(make_param(cls, "q", 2));
  storage.collect_parameter_metadata(make_param(cls, "q", 0));
  storage.collect_parameter_metadata(make_param(cls, "q", 1));

  const auto * params = storage.find_parameters_metadata(cls, "q");
  ASSERT_NE(params, nullptr);
  ASSERT_EQ(params->size(), 3U);
  EXPECT_EQ((*params)[0].index, 0U);
  EXPECT_EQ((*params)[1].index, 1U);
  EXPECT_EQ((*params)[2].index, 2U);
  EXPECT_EQ(storage.find_parameters_metadata(cls, "other"), nullptr);
}

TEST(MetadataStorage, ParameterizedMethodsAreSorted)
{
  RawMetadataStorage storage;
  const ClassId cls = storage.declare_class("R");
  storage.collect_parameter_metadata(make_param(cls, "zeta", 0));
  storage.collect_parameter_metadata(make_param(cls, "alpha", 0));
  storage.collect_parameter_metadata(make_param(cls, "alpha", 1));

  const auto methods = storage.parameterized_methods(cls);
  ASSERT_EQ(methods.size(), 2U);
  EXPECT_EQ(methods[0], "alpha");
  EXPECT_EQ(methods[1], "zeta");
  EXPECT_TRUE(storage.parameterized_methods(storage.declare_class("Other")).empty());
}
