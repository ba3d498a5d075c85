//
// Copyright 2019 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//


#include "gqlengine/public/schema.h"

#include <memory>
#include <utility>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "gqlengine/base/testing/status_matchers.h"
#include "gqlengine/public/directives.h"
#include "gqlengine/public/type.h"

namespace gqlengine {
namespace {

using ::gqlengine_base::testing::StatusIs;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

class SchemaTest : public ::testing::Test {
 protected:
  absl::StatusOr<std::unique_ptr<const Schema>> Build(
      SchemaOptions options = {}) {
    return Schema::Create(std::move(config_), options);
  }

  ObjectType* QueryWithField() {
    ObjectType* query = factory_.MakeObjectType("Query");
    query->AddField({.name = "a", .type = types::StringType()});
    config_.query = query;
    return query;
  }

  TypeFactory factory_;
  SchemaConfig config_;
};

TEST_F(SchemaTest, CollectsReferencedTypes) {
  ObjectType* query = QueryWithField();
  ObjectType* user = factory_.MakeObjectType("User");
  user->AddField({.name = "id", .type = types::IdType()});
  query->AddField(
      {.name = "users",
       .type = factory_.MakeNonNullType(factory_.MakeListType(user))});
  GQLENGINE_ASSERT_OK_AND_ASSIGN(std::unique_ptr<const Schema> schema,
                                 Build());
  GQLENGINE_EXPECT_OK(schema->Validate());
  EXPECT_EQ(schema->GetType("User"), user);
  EXPECT_NE(schema->GetType("ID"), nullptr);
  EXPECT_EQ(schema->GetType("Missing"), nullptr);
  EXPECT_EQ(schema->GetRootType(OperationType::kQuery), query);
  EXPECT_EQ(schema->GetRootType(OperationType::kMutation), nullptr);
}

TEST_F(SchemaTest, ProvidesTypenameOnEveryCompositeType) {
  QueryWithField();
  GQLENGINE_ASSERT_OK_AND_ASSIGN(std::unique_ptr<const Schema> schema,
                                 Build());
  const FieldDefinition* typename_field =
      schema->GetField(schema->GetType("Query"), "__typename");
  ASSERT_NE(typename_field, nullptr);
  EXPECT_EQ(typename_field->type->ToString(), "String!");
  EXPECT_EQ(schema->GetField(schema->GetType("Query"), "missing"), nullptr);
}

TEST_F(SchemaTest, ComputesPossibleTypes) {
  QueryWithField();
  InterfaceType* node = factory_.MakeInterfaceType("Node");
  node->AddField({.name = "id", .type = types::IdType()});
  ObjectType* user = factory_.MakeObjectType("User");
  user->AddField({.name = "id", .type = types::IdType()});
  user->AddInterface(node);
  ObjectType* post = factory_.MakeObjectType("Post");
  post->AddField({.name = "id", .type = types::IdType()});
  post->AddInterface(node);
  UnionType* entity = factory_.MakeUnionType("Entity");
  entity->AddMember(post);
  config_.types = {user, post, entity};
  GQLENGINE_ASSERT_OK_AND_ASSIGN(std::unique_ptr<const Schema> schema,
                                 Build());
  GQLENGINE_EXPECT_OK(schema->Validate());
  EXPECT_THAT(schema->GetPossibleTypes(node), ElementsAre(user, post));
  EXPECT_THAT(schema->GetPossibleTypes(entity), ElementsAre(post));
  EXPECT_TRUE(schema->IsSubType(node, user));
  EXPECT_FALSE(schema->IsSubType(entity, user));
}

TEST_F(SchemaTest, RejectsDuplicateTypeNames) {
  QueryWithField();
  ObjectType* first = factory_.MakeObjectType("Thing");
  first->AddField({.name = "a", .type = types::StringType()});
  ObjectType* second = factory_.MakeObjectType("Thing");
  second->AddField({.name = "b", .type = types::StringType()});
  config_.types = {first, second};
  EXPECT_THAT(Build(),
              StatusIs(absl::StatusCode::kFailedPrecondition,
                       HasSubstr("multiple types named 'Thing'")));
}

TEST_F(SchemaTest, ValidateReportsEveryProblem) {
  ObjectType* query = factory_.MakeObjectType("Query");
  config_.query = query;
  EnumType* empty_enum = factory_.MakeEnumType("Mood");
  query->AddField({.name = "mood", .type = empty_enum});
  GQLENGINE_ASSERT_OK_AND_ASSIGN(std::unique_ptr<const Schema> schema,
                                 Build());
  absl::Status status = schema->Validate();
  EXPECT_THAT(status, StatusIs(absl::StatusCode::kFailedPrecondition));
  EXPECT_EQ(status.message(),
            "Enum type Mood must define one or more values.");
  // The result is cached.
  EXPECT_EQ(schema->Validate(), status);
}

TEST_F(SchemaTest, ValidateChecksNames) {
  ObjectType* query = QueryWithField();
  query->AddField({.name = "__secret", .type = types::StringType()});
  query->AddField({.name = "bad-name", .type = types::StringType()});
  GQLENGINE_ASSERT_OK_AND_ASSIGN(std::unique_ptr<const Schema> schema,
                                 Build());
  EXPECT_EQ(schema->Validate().message(),
            "Name '__secret' must not begin with '__', which is reserved by "
            "GraphQL introspection.\n\n"
            "Names must only contain [_a-zA-Z0-9] but 'bad-name' does not.");
}

TEST_F(SchemaTest, ValidateChecksInterfaceImplementations) {
  QueryWithField();
  InterfaceType* named = factory_.MakeInterfaceType("Named");
  named->AddField({.name = "name", .type = types::StringType()});
  ObjectType* user = factory_.MakeObjectType("User");
  user->AddField({.name = "id", .type = types::IdType()});
  user->AddInterface(named);
  ObjectType* pet = factory_.MakeObjectType("Pet");
  pet->AddField({.name = "name", .type = types::IntType()});
  pet->AddInterface(named);
  config_.types = {user, pet};
  GQLENGINE_ASSERT_OK_AND_ASSIGN(std::unique_ptr<const Schema> schema,
                                 Build());
  absl::Status status = schema->Validate();
  EXPECT_THAT(status.message(),
              HasSubstr("Interface field Named.name expected but User does "
                        "not provide it."));
  EXPECT_THAT(status.message(),
              HasSubstr("Interface field Named.name expects type String but "
                        "Pet.name is type Int."));
}

TEST_F(SchemaTest, ValidateRequiresQueryType) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(std::unique_ptr<const Schema> schema,
                                 Build());
  EXPECT_THAT(schema->Validate(),
              StatusIs(absl::StatusCode::kFailedPrecondition,
                       HasSubstr("Query root type must be provided.")));
}

TEST_F(SchemaTest, AssumeValidSkipsValidation) {
  config_.query = factory_.MakeObjectType("Query");
  GQLENGINE_ASSERT_OK_AND_ASSIGN(std::unique_ptr<const Schema> schema,
                                 Build({.assume_valid = true}));
  GQLENGINE_EXPECT_OK(schema->Validate());
}

TEST_F(SchemaTest, EnablingDeferStreamAddsDirectives) {
  QueryWithField();
  GQLENGINE_ASSERT_OK_AND_ASSIGN(std::unique_ptr<const Schema> schema,
                                 Build({.enable_defer_stream = true}));
  EXPECT_EQ(schema->GetDirective("defer"), directives::DeferDirective());
  EXPECT_EQ(schema->GetDirective("stream"), directives::StreamDirective());
  EXPECT_NE(schema->GetDirective("skip"), nullptr);
  EXPECT_NE(schema->GetType("Int"), nullptr);
}

TEST_F(SchemaTest, NonNullIsSubTypeOfNullable) {
  QueryWithField();
  GQLENGINE_ASSERT_OK_AND_ASSIGN(std::unique_ptr<const Schema> schema,
                                 Build());
  EXPECT_TRUE(schema->IsTypeSubTypeOf(
      factory_.MakeNonNullType(types::StringType()), types::StringType()));
  EXPECT_FALSE(schema->IsTypeSubTypeOf(
      types::StringType(), factory_.MakeNonNullType(types::StringType())));
}

}  // namespace
}  // namespace gqlengine
