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


#include "gqlengine/testing/test_schemas.h"

#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "gqlengine/base/ret_check.h"
#include "gqlengine/base/status_macros.h"
#include "gqlengine/language/ast.h"
#include "gqlengine/language/parser.h"
#include "gqlengine/public/execute.h"

namespace gqlengine {
namespace testing {

using gqlengine_base::Future;
using gqlengine_base::Promise;
using gqlengine_base::SingleThreadedExecutor;

absl::StatusOr<TestSchema> MakeHeroSchema(SchemaOptions options) {
  TestSchema test_schema;
  test_schema.factory = std::make_unique<TypeFactory>();
  TypeFactory& factory = *test_schema.factory;
  const Type* non_null_string = factory.MakeNonNullType(types::StringType());

  ObjectType* friend_type = factory.MakeObjectType("Friend");
  friend_type->AddField({.name = "id", .type = types::IdType()});
  friend_type->AddField({.name = "name", .type = types::StringType()});
  friend_type->AddField({.name = "nonNullName", .type = non_null_string});

  ObjectType* hero = factory.MakeObjectType("Hero");
  hero->AddField({.name = "id", .type = types::IdType()});
  hero->AddField({.name = "name", .type = types::StringType()});
  hero->AddField({.name = "nonNullName", .type = non_null_string});
  hero->AddField(
      {.name = "friends", .type = factory.MakeListType(friend_type)});

  ObjectType* query = factory.MakeObjectType("Query");
  query->AddField({.name = "hero", .type = hero});
  query->AddField({.name = "scalarList",
                   .type = factory.MakeListType(types::StringType())});
  query->AddField(
      {.name = "friendList", .type = factory.MakeListType(friend_type)});
  query->AddField(
      {.name = "nonNullFriendList",
       .type = factory.MakeListType(factory.MakeNonNullType(friend_type))});

  SchemaConfig config;
  config.query = query;
  GQLENGINE_ASSIGN_OR_RETURN(test_schema.schema,
                             Schema::Create(std::move(config), options));
  return test_schema;
}

absl::StatusOr<TestSchema> MakeCharacterSchema() {
  TestSchema test_schema;
  test_schema.factory = std::make_unique<TypeFactory>();
  TypeFactory& factory = *test_schema.factory;

  InterfaceType* character = factory.MakeInterfaceType("Character");
  character->AddField({.name = "name", .type = types::StringType()});

  ObjectType* human = factory.MakeObjectType("Human");
  human->AddInterface(character);
  human->AddField({.name = "name", .type = types::StringType()});
  human->AddField({.name = "homePlanet", .type = types::StringType()});

  ObjectType* droid = factory.MakeObjectType("Droid");
  droid->AddInterface(character);
  droid->AddField({.name = "name", .type = types::StringType()});
  droid->AddField({.name = "primaryFunction", .type = types::StringType()});

  UnionType* search_result = factory.MakeUnionType("SearchResult");
  search_result->AddMember(human);
  search_result->AddMember(droid);

  ObjectType* query = factory.MakeObjectType("Query");
  query->AddField({.name = "hero", .type = character});
  query->AddField(
      {.name = "search", .type = factory.MakeListType(search_result)});

  SchemaConfig config;
  config.query = query;
  config.types = {human, droid};
  GQLENGINE_ASSIGN_OR_RETURN(test_schema.schema,
                             Schema::Create(std::move(config)));
  return test_schema;
}

absl::StatusOr<std::string> ExecuteQuery(const Schema& schema,
                                         absl::string_view query,
                                         const ExecuteOptions& options) {
  GQLENGINE_ASSIGN_OR_RETURN(std::unique_ptr<ParserOutput> parsed,
                             Parse(query));
  GQLENGINE_ASSIGN_OR_RETURN(ExecutionResult result,
                             ExecuteSync(schema, *parsed->document(), options));
  return result.ToJson();
}

Value DelayedValue(SingleThreadedExecutor* executor,
                   absl::StatusOr<Value> value) {
  Promise<absl::StatusOr<Value>> promise;
  executor->Post([promise, value = std::move(value)] { promise.Set(value); });
  return Value::Pending(promise.future());
}

absl::StatusOr<std::vector<std::string>> CollectPayloads(
    const Future<ExecutionOutcome>& outcome,
    SingleThreadedExecutor* executor) {
  if (executor != nullptr) executor->RunUntilIdle();
  GQLENGINE_RET_CHECK(outcome.is_ready()) << "Execution did not complete";

  std::vector<std::string> payloads;
  if (const auto* result = std::get_if<ExecutionResult>(&outcome.value())) {
    payloads.push_back(result->ToJson());
    return payloads;
  }
  const auto& incremental =
      std::get<IncrementalExecutionResults>(outcome.value());
  payloads.push_back(incremental.initial_result.ToJson());
  while (true) {
    Future<SubsequentResultStream::NextResult> next =
        incremental.subsequent_results->Next();
    if (executor != nullptr) executor->RunUntilIdle();
    GQLENGINE_RET_CHECK(next.is_ready()) << "Subsequent result is stuck";
    GQLENGINE_RETURN_IF_ERROR(next.value().status());
    if (!next.value()->has_value()) break;
    payloads.push_back((*next.value())->ToJson());
  }
  return payloads;
}

}  // namespace testing
}  // namespace gqlengine
