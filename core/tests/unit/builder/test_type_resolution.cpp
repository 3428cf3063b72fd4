// tests/builder/test_type_resolution.cpp - Unit tests for object/input type resolution
//
// Tests MetadataBuilder::resolve_object_type / resolve_input_type: caching,
// missing declarations, empty field lists and nullability defaulting.
//

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <utility>

#include "typegraph/builder/metadata_builder.hpp"
#include "typegraph/metadata/errors.hpp"
#include "typegraph/metadata/raw_metadata_storage.hpp"
#include "typegraph/reflection/type_reflection.hpp"
#include "typegraph/test_support/counting_metadata_source.hpp"

using namespace typegraph;

namespace
{

RawFieldMetadata make_field(
  ClassId target, std::string property, std::string type_expr,
  std::optional<bool> nullable = std::nullopt)
{
  RawFieldMetadata field;
  field.target = target;
  field.property_key = property;
  field.schema_name = std::move(property);
  field.type_ref.type_expr = std::move(type_expr);
  field.type_ref.nullable = nullable;
  return field;
}

ScalarTable builtin_scalars()
{
  ScalarTable scalars;
  scalars.register_builtins();
  return scalars;
}

/// User { id: ID, name: String, friends: [User] } declared as object type
struct UserSchema
{
  RawMetadataStorage storage;
  ClassId user;

  UserSchema()
  {
    user = storage.declare_class("User");
    storage.collect_object_type_metadata({user, "User", std::string("A person")});
    storage.collect_field_metadata(make_field(user, "id", "ID"));
    storage.collect_field_metadata(make_field(user, "name", "String"));
    storage.collect_field_metadata(make_field(user, "friends", "[User]"));
  }
};

}  // namespace

// ============================================================================
// Object Types
// ============================================================================

TEST(BuilderObjectType, ResolvesFieldsInDeclarationOrder)
{
  UserSchema schema;
  const ExpressionTypeReflector reflector(schema.storage, builtin_scalars());
  MetadataBuilder builder(schema.storage, reflector, BuildSchemaConfig{});

  const ObjectTypeMetadata & user = builder.resolve_object_type(schema.user);

  EXPECT_EQ(user.target, schema.user);
  EXPECT_EQ(user.name, "User");
  ASSERT_TRUE(user.description.has_value());
  EXPECT_EQ(*user.description, "A person");

  ASSERT_EQ(user.fields.size(), 3U);
  EXPECT_EQ(user.fields[0].property_key, "id");
  EXPECT_EQ(user.fields[1].property_key, "name");
  EXPECT_EQ(user.fields[2].property_key, "friends");

  EXPECT_TRUE(user.fields[0].type.value.is_scalar());
  EXPECT_EQ(user.fields[0].type.value.scalar_name, "ID");

  const TypeMetadata & friends = user.fields[2].type;
  EXPECT_TRUE(friends.value.is_class());
  EXPECT_EQ(friends.value.class_id, schema.user);
  EXPECT_EQ(friends.modifiers.list_depth, 1U);
}

TEST(BuilderObjectType, SecondCallIsServedFromCache)
{
  UserSchema schema;
  test_support::CountingMetadataSource counting(schema.storage);
  const ExpressionTypeReflector reflector(counting, builtin_scalars());
  MetadataBuilder builder(counting, reflector, BuildSchemaConfig{});

  const ObjectTypeMetadata & first = builder.resolve_object_type(schema.user);
  const size_t lookups_after_first = counting.counts().total();
  EXPECT_GT(lookups_after_first, 0U);

  const ObjectTypeMetadata & second = builder.resolve_object_type(schema.user);
  EXPECT_EQ(counting.counts().total(), lookups_after_first);

  EXPECT_EQ(&first, &second);
  ASSERT_EQ(first.fields.size(), second.fields.size());
  for (size_t i = 0; i < first.fields.size(); ++i) {
    EXPECT_EQ(first.fields[i].property_key, second.fields[i].property_key);
    EXPECT_EQ(first.fields[i].type, second.fields[i].type);
  }
}

TEST(BuilderObjectType, CachesAreIndependentPerKind)
{
  UserSchema schema;
  schema.storage.collect_input_type_metadata({schema.user, "UserInput", std::nullopt});

  const ExpressionTypeReflector reflector(schema.storage, builtin_scalars());
  MetadataBuilder builder(schema.storage, reflector, BuildSchemaConfig{});

  (void)builder.resolve_object_type(schema.user);

  EXPECT_TRUE(builder.has_cached_object_type(schema.user));
  EXPECT_FALSE(builder.has_cached_input_type(schema.user));
  EXPECT_FALSE(builder.has_cached_resolver(schema.user));

  const InputTypeMetadata & input = builder.resolve_input_type(schema.user);
  EXPECT_EQ(input.name, "UserInput");
  EXPECT_TRUE(builder.has_cached_input_type(schema.user));
}

TEST(BuilderObjectType, MissingDeclarationIsNotCached)
{
  RawMetadataStorage storage;
  const ClassId cls = storage.declare_class("Orphan");
  storage.collect_field_metadata(make_field(cls, "id", "ID"));

  const ExpressionTypeReflector reflector(storage, builtin_scalars());
  MetadataBuilder builder(storage, reflector, BuildSchemaConfig{});

  try {
    (void)builder.resolve_object_type(cls);
    FAIL() << "expected MissingClassMetadataError";
  } catch (const MissingClassMetadataError & e) {
    EXPECT_EQ(e.kind(), MetadataErrorKind::MissingClassMetadata);
    EXPECT_EQ(e.expected_category(), "ObjectType");
    EXPECT_EQ(e.location().class_id, cls);
    EXPECT_EQ(e.location().class_name, "Orphan");
    EXPECT_EQ(e.code(), "TG001");
  }

  EXPECT_FALSE(builder.has_cached_object_type(cls));
}

TEST(BuilderObjectType, FailureIsRetriedAfterFix)
{
  RawMetadataStorage storage;
  const ClassId cls = storage.declare_class("Late");
  storage.collect_object_type_metadata({cls, "Late", std::nullopt});

  const ExpressionTypeReflector reflector(storage, builtin_scalars());
  MetadataBuilder builder(storage, reflector, BuildSchemaConfig{});

  EXPECT_THROW((void)builder.resolve_object_type(cls), MissingFieldsError);
  EXPECT_FALSE(builder.has_cached_object_type(cls));

  storage.collect_field_metadata(make_field(cls, "id", "ID"));
  const ObjectTypeMetadata & late = builder.resolve_object_type(cls);
  EXPECT_EQ(late.fields.size(), 1U);
}

TEST(BuilderObjectType, NoFieldDeclarations)
{
  RawMetadataStorage storage;
  const ClassId cls = storage.declare_class("Empty");
  storage.collect_object_type_metadata({cls, "Empty", std::nullopt});

  const ExpressionTypeReflector reflector(storage, builtin_scalars());
  MetadataBuilder builder(storage, reflector, BuildSchemaConfig{});

  try {
    (void)builder.resolve_object_type(cls);
    FAIL() << "expected MissingFieldsError";
  } catch (const MissingFieldsError & e) {
    EXPECT_EQ(e.location().class_id, cls);
    EXPECT_EQ(e.code(), "TG002");
  }
}

TEST(BuilderObjectType, EmptyFieldList)
{
  RawMetadataStorage storage;
  const ClassId cls = storage.declare_class("Empty");
  storage.collect_object_type_metadata({cls, "Empty", std::nullopt});
  storage.collect_fields_metadata(cls, {});
  ASSERT_NE(storage.find_fields_metadata(cls), nullptr);

  const ExpressionTypeReflector reflector(storage, builtin_scalars());
  MetadataBuilder builder(storage, reflector, BuildSchemaConfig{});

  EXPECT_THROW((void)builder.resolve_object_type(cls), MissingFieldsError);
}

TEST(BuilderObjectType, UnknownFieldTypePropagates)
{
  RawMetadataStorage storage;
  const ClassId cls = storage.declare_class("Broken");
  storage.collect_object_type_metadata({cls, "Broken", std::nullopt});
  storage.collect_field_metadata(make_field(cls, "when", "DateTime"));

  const ExpressionTypeReflector reflector(storage, builtin_scalars());
  MetadataBuilder builder(storage, reflector, BuildSchemaConfig{});

  try {
    (void)builder.resolve_object_type(cls);
    FAIL() << "expected TypeReflectionError";
  } catch (const TypeReflectionError & e) {
    EXPECT_EQ(e.location().member, "when");
    EXPECT_NE(std::string(e.what()).find("DateTime"), std::string::npos);
  }
  EXPECT_FALSE(builder.has_cached_object_type(cls));
}

// ============================================================================
// Input Types
// ============================================================================

TEST(BuilderInputType, MissingInputDeclaration)
{
  UserSchema schema;
  const ExpressionTypeReflector reflector(schema.storage, builtin_scalars());
  MetadataBuilder builder(schema.storage, reflector, BuildSchemaConfig{});

  try {
    (void)builder.resolve_input_type(schema.user);
    FAIL() << "expected MissingClassMetadataError";
  } catch (const MissingClassMetadataError & e) {
    EXPECT_EQ(e.expected_category(), "InputType");
  }
  EXPECT_FALSE(builder.has_cached_input_type(schema.user));
}

TEST(BuilderInputType, EmptyFieldList)
{
  RawMetadataStorage storage;
  const ClassId cls = storage.declare_class("EmptyInput");
  storage.collect_input_type_metadata({cls, "EmptyInput", std::nullopt});
  storage.collect_fields_metadata(cls, {});

  const ExpressionTypeReflector reflector(storage, builtin_scalars());
  MetadataBuilder builder(storage, reflector, BuildSchemaConfig{});

  try {
    (void)builder.resolve_input_type(cls);
    FAIL() << "expected MissingFieldsError";
  } catch (const MissingFieldsError & e) {
    EXPECT_EQ(e.location().class_id, cls);
    EXPECT_EQ(e.code(), "TG002");
  }
  EXPECT_FALSE(builder.has_cached_input_type(cls));

  // A later declaration is picked up because the failure was not cached
  storage.collect_field_metadata(make_field(cls, "name", "String"));
  EXPECT_EQ(builder.resolve_input_type(cls).fields.size(), 1U);
}

TEST(BuilderInputType, ResolvesInputFields)
{
  RawMetadataStorage storage;
  const ClassId cls = storage.declare_class("NewUserInput");
  storage.collect_input_type_metadata({cls, "NewUserInput", std::nullopt});
  storage.collect_field_metadata(make_field(cls, "name", "String"));
  storage.collect_field_metadata(make_field(cls, "age", "Int", true));

  const ExpressionTypeReflector reflector(storage, builtin_scalars());
  MetadataBuilder builder(storage, reflector, BuildSchemaConfig{});

  const InputTypeMetadata & input = builder.resolve_input_type(cls);
  ASSERT_EQ(input.fields.size(), 2U);
  EXPECT_FALSE(input.fields[0].type.modifiers.nullable);
  EXPECT_TRUE(input.fields[1].type.modifiers.nullable);
}

// ============================================================================
// Nullability Defaulting
// ============================================================================

TEST(BuilderNullability, DefaultFalseMakesFieldsNonNull)
{
  UserSchema schema;
  const ExpressionTypeReflector reflector(schema.storage, builtin_scalars());
  BuildSchemaConfig config;
  config.nullable_by_default = false;
  MetadataBuilder builder(schema.storage, reflector, config);

  for (const auto & field : builder.resolve_object_type(schema.user).fields) {
    EXPECT_FALSE(field.type.modifiers.nullable) << field.property_key;
  }
}

TEST(BuilderNullability, DefaultTrueMakesFieldsNullable)
{
  UserSchema schema;
  const ExpressionTypeReflector reflector(schema.storage, builtin_scalars());
  BuildSchemaConfig config;
  config.nullable_by_default = true;
  MetadataBuilder builder(schema.storage, reflector, config);

  for (const auto & field : builder.resolve_object_type(schema.user).fields) {
    EXPECT_TRUE(field.type.modifiers.nullable) << field.property_key;
  }
}

TEST(BuilderNullability, ExplicitOverrideWins)
{
  RawMetadataStorage storage;
  const ClassId cls = storage.declare_class("Post");
  storage.collect_object_type_metadata({cls, "Post", std::nullopt});
  storage.collect_field_metadata(make_field(cls, "id", "ID", false));

  const ExpressionTypeReflector reflector(storage, builtin_scalars());
  BuildSchemaConfig config;
  config.nullable_by_default = true;
  MetadataBuilder builder(storage, reflector, config);

  EXPECT_FALSE(builder.resolve_object_type(cls).fields[0].type.modifiers.nullable);
}
