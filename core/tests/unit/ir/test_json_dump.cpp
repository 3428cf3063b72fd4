// tests/ir/test_json_dump.cpp - Unit tests for JSON serialization of resolved metadata
//

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "typegraph/driver/schema_checker.hpp"
#include "typegraph/ir/json_dump.hpp"
#include "typegraph/manifest/manifest_loader.hpp"

using namespace typegraph;
using nlohmann::json;

namespace
{

const char * k_manifest = R"(
classes:
  - name: User
    object_type: { description: A person }
    fields:
      - { property: id, type: ID }
      - { property: tags, type: "[String]", nullable: true }
  - name: UserFilter
    input_type: { name: UserFilterInput }
    fields:
      - { property: name, type: String }
  - name: UserResolver
    resolver: true
    queries:
      - property: getUser
        type: User
        parameters:
          - { kind: single_arg, name: id, type: Int }
          - { kind: context }
      - property: findUsers
        name: users
        type: "[User]"
        parameters:
          - { kind: spread_args, type: UserFilter }
)";

class JsonDumpFixture : public ::testing::Test
{
protected:
  void SetUp() override
  {
    ASSERT_TRUE(load_manifest_string(k_manifest, storage_).success);
    result_ = SchemaChecker::check_storage(storage_, BuildSchemaConfig{});
    ASSERT_TRUE(result_.success);
  }

  RawMetadataStorage storage_;
  CheckResult result_;
};

}  // namespace

TEST_F(JsonDumpFixture, TypeShape)
{
  const json j = to_json(result_.object_types[0].fields[1].type, storage_);
  EXPECT_EQ(j["value"], "String");
  EXPECT_EQ(j["kind"], "Scalar");
  EXPECT_EQ(j["nullable"], true);
  EXPECT_EQ(j["listDepth"], 1);
}

TEST_F(JsonDumpFixture, ObjectType)
{
  const json j = to_json(result_.object_types[0], storage_);
  EXPECT_EQ(j["class"], "User");
  EXPECT_EQ(j["name"], "User");
  EXPECT_EQ(j["description"], "A person");
  ASSERT_EQ(j["fields"].size(), 2U);
  EXPECT_EQ(j["fields"][0]["name"], "id");
  EXPECT_EQ(j["fields"][0]["type"]["value"], "ID");
  EXPECT_EQ(j["fields"][0]["type"]["nullable"], false);
  EXPECT_FALSE(j["fields"][0].contains("description"));
}

TEST_F(JsonDumpFixture, InputTypeUsesSchemaName)
{
  const json j = to_json(result_.input_types[0], storage_);
  EXPECT_EQ(j["class"], "UserFilter");
  EXPECT_EQ(j["name"], "UserFilterInput");
}

TEST_F(JsonDumpFixture, ResolverQueriesAndParameters)
{
  const json j = to_json(result_.resolvers[0], storage_);
  EXPECT_EQ(j["class"], "UserResolver");
  ASSERT_EQ(j["queries"].size(), 2U);

  const json & get_user = j["queries"][0];
  EXPECT_EQ(get_user["name"], "getUser");
  EXPECT_EQ(get_user["type"]["value"], "User");
  EXPECT_EQ(get_user["type"]["kind"], "Class");
  EXPECT_EQ(get_user["type"]["listDepth"], 0);

  const json & params = get_user["parameters"];
  ASSERT_EQ(params.size(), 2U);
  EXPECT_EQ(params[0]["kind"], "SingleArg");
  EXPECT_EQ(params[0]["name"], "id");
  EXPECT_EQ(params[0]["type"]["value"], "Int");
  EXPECT_EQ(params[1]["kind"], "Context");
  EXPECT_FALSE(params[1].contains("type"));

  const json & users = j["queries"][1];
  EXPECT_EQ(users["name"], "users");
  EXPECT_EQ(users["method"], "findUsers");
  EXPECT_EQ(users["parameters"][0]["kind"], "SpreadArgs");
  EXPECT_EQ(users["parameters"][0]["type"]["value"], "UserFilter");
}

TEST_F(JsonDumpFixture, WholeCheckResult)
{
  const json j = to_json(result_, storage_);
  EXPECT_EQ(j["success"], true);
  EXPECT_EQ(j["objectTypes"].size(), 1U);
  EXPECT_EQ(j["inputTypes"].size(), 1U);
  EXPECT_EQ(j["resolvers"].size(), 1U);
  EXPECT_TRUE(j["diagnostics"].empty());
}

TEST(JsonDump, DiagnosticsCarryCodeAndLocation)
{
  RawMetadataStorage storage;
  ASSERT_TRUE(load_manifest_string(
                "classes:\n"
                "  - name: Empty\n"
                "    object_type: true\n",
                storage)
                .success);

  const CheckResult result = SchemaChecker::check_storage(storage, BuildSchemaConfig{});
  const json j = to_json(result, storage);

  EXPECT_EQ(j["success"], false);
  ASSERT_EQ(j["diagnostics"].size(), 1U);
  EXPECT_EQ(j["diagnostics"][0]["severity"], "error");
  EXPECT_EQ(j["diagnostics"][0]["code"], "TG002");
  EXPECT_EQ(j["diagnostics"][0]["location"], "Empty");
}
