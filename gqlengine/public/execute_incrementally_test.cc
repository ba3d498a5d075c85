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


// Incremental delivery with @defer and @stream.

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "gqlengine/base/executor.h"
#include "gqlengine/base/future.h"
#include "gqlengine/base/status_macros.h"
#include "gqlengine/base/testing/status_matchers.h"
#include "gqlengine/language/parser.h"
#include "gqlengine/public/async_iterator.h"
#include "gqlengine/public/execute.h"
#include "gqlengine/public/execution_result.h"
#include "gqlengine/public/resolve_info.h"
#include "gqlengine/public/schema.h"
#include "gqlengine/public/type.h"
#include "gqlengine/public/value.h"
#include "gqlengine/testing/test_schemas.h"

namespace gqlengine {
namespace {

using ::gqlengine::testing::CollectPayloads;
using ::gqlengine::testing::DelayedValue;
using ::gqlengine::testing::MakeHeroSchema;
using ::gqlengine::testing::TestSchema;
using ::gqlengine_base::Future;
using ::gqlengine_base::SingleThreadedExecutor;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::SizeIs;
using ::testing::StartsWith;

class ExecuteIncrementallyTest : public ::testing::Test {
 protected:
  static constexpr int kLongList = 20000;

  // "0", "1", ... as string values.
  static std::vector<Value> NumberedItems(int size) {
    std::vector<Value> items;
    items.reserve(size);
    for (int i = 0; i < size; ++i) {
      items.push_back(Value::String(absl::StrCat(i)));
    }
    return items;
  }

  void SetUp() override {
    GQLENGINE_ASSERT_OK_AND_ASSIGN(
        hero_, MakeHeroSchema({.enable_defer_stream = true}));
    options_.root_value = Value::Object(
        {{"hero", Value::Object({{"id", Value::String("1")},
                                 {"name", Value::String("Luke")},
                                 {"nonNullName", Value::String("Luke")}})},
         {"scalarList",
          Value::List({Value::String("apple"), Value::String("banana"),
                       Value::String("coconut")})}});
  }

  absl::StatusOr<std::vector<std::string>> Run(
      absl::string_view query, SingleThreadedExecutor* executor = nullptr) {
    GQLENGINE_ASSIGN_OR_RETURN(parsed_, Parse(query));
    options_.executor = executor;
    GQLENGINE_ASSIGN_OR_RETURN(
        Future<ExecutionOutcome> outcome,
        ExecuteIncrementally(*hero_.schema, *parsed_->document(), options_));
    return CollectPayloads(outcome, executor);
  }

  TestSchema hero_;
  ExecuteOptions options_;
  std::unique_ptr<ParserOutput> parsed_;
};

TEST_F(ExecuteIncrementallyTest, DefersInlineFragment) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      std::vector<std::string> payloads,
      Run("{ hero { id ... @defer { name } } }"));
  EXPECT_THAT(
      payloads,
      ElementsAre(
          R"({"data":{"hero":{"id":"1"}},"pending":[{"id":"0","path":)"
          R"(["hero"]}],"hasNext":true})",
          R"({"hasNext":false,"incremental":[{"data":{"name":"Luke"},)"
          R"("id":"0"}],"completed":[{"id":"0"}]})"));
}

TEST_F(ExecuteIncrementallyTest, DefersWithLabel) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      std::vector<std::string> payloads,
      Run(R"({ hero { id ... @defer(label: "slow") { name } } })"));
  ASSERT_THAT(payloads, SizeIs(2));
  EXPECT_THAT(payloads[0],
              HasSubstr(R"("pending":[{"id":"0","path":["hero"],)"
                        R"("label":"slow"}])"));
}

TEST_F(ExecuteIncrementallyTest, DefersAsynchronousFields) {
  SingleThreadedExecutor executor;
  options_.root_value = Value::Object(
      {{"hero",
        Value::Object({{"id", Value::String("1")},
                       {"name", DelayedValue(&executor,
                                             Value::String("Luke"))}})}});
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      std::vector<std::string> payloads,
      Run("{ hero { id ... @defer { name } } }", &executor));
  EXPECT_THAT(
      payloads,
      ElementsAre(
          R"({"data":{"hero":{"id":"1"}},"pending":[{"id":"0","path":)"
          R"(["hero"]}],"hasNext":true})",
          R"({"hasNext":false,"incremental":[{"data":{"name":"Luke"},)"
          R"("id":"0"}],"completed":[{"id":"0"}]})"));
}

TEST_F(ExecuteIncrementallyTest, DisabledDeferReturnsSingleResult) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      std::vector<std::string> payloads,
      Run("{ hero { id ... @defer(if: false) { name } } }"));
  EXPECT_THAT(payloads,
              ElementsAre(R"({"data":{"hero":{"id":"1","name":"Luke"}}})"));
}

TEST_F(ExecuteIncrementallyTest, DeferredNonNullErrorCompletesWithErrors) {
  options_.root_value = Value::Object(
      {{"hero", Value::Object({{"id", Value::String("1")},
                               {"nonNullName", Value::Null()}})}});
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      std::vector<std::string> payloads,
      Run("{ hero { id ... @defer { nonNullName } } }"));
  ASSERT_THAT(payloads, SizeIs(2));
  EXPECT_EQ(payloads[1],
            R"({"hasNext":false,"completed":[{"id":"0","errors":[)"
            R"({"message":"Cannot return null for non-nullable field )"
            R"(Hero.nonNullName.","locations":[{"line":1,"column":26}],)"
            R"("path":["hero","nonNullName"]}]}]})");
}

TEST_F(ExecuteIncrementallyTest, StreamsListItems) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      std::vector<std::string> payloads,
      Run("{ scalarList @stream(initialCount: 1) }"));
  EXPECT_THAT(
      payloads,
      ElementsAre(
          R"({"data":{"scalarList":["apple"]},"pending":[{"id":"0",)"
          R"("path":["scalarList"]}],"hasNext":true})",
          R"({"hasNext":true,"incremental":[{"items":["banana"],"id":"0"}]})",
          R"({"hasNext":true,"incremental":[{"items":["coconut"],)"
          R"("id":"0"}]})",
          R"({"hasNext":false,"completed":[{"id":"0"}]})"));
}

TEST_F(ExecuteIncrementallyTest, StreamOfWholeListReturnsSingleResult) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      std::vector<std::string> payloads,
      Run("{ scalarList @stream(initialCount: 3) }"));
  EXPECT_THAT(payloads,
              ElementsAre(R"({"data":{"scalarList":["apple","banana",)"
                          R"("coconut"]}})"));
}

TEST_F(ExecuteIncrementallyTest, StreamsLongListWithoutExecutor) {
  options_.root_value =
      Value::Object({{"scalarList", Value::List(NumberedItems(kLongList))}});
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      std::vector<std::string> payloads,
      Run("{ scalarList @stream(initialCount: 0) }"));
  ASSERT_THAT(payloads, SizeIs(kLongList + 2));
  EXPECT_EQ(payloads[0],
            R"({"data":{"scalarList":[]},"pending":[{"id":"0",)"
            R"("path":["scalarList"]}],"hasNext":true})");
  EXPECT_EQ(payloads[1],
            R"({"hasNext":true,"incremental":[{"items":["0"],"id":"0"}]})");
  EXPECT_EQ(payloads[kLongList],
            absl::StrCat(R"({"hasNext":true,"incremental":[{"items":[")",
                         kLongList - 1, R"("],"id":"0"}]})"));
  EXPECT_EQ(payloads.back(), R"({"hasNext":false,"completed":[{"id":"0"}]})");
}

TEST_F(ExecuteIncrementallyTest, CompletesLongIteratorWithoutExecutor) {
  options_.root_value = Value::Object(
      {{"scalarList", Value::Iterator(std::make_shared<VectorAsyncIterator>(
                          NumberedItems(kLongList)))}});
  GQLENGINE_ASSERT_OK_AND_ASSIGN(std::vector<std::string> payloads,
                                 Run("{ scalarList }"));
  ASSERT_THAT(payloads, SizeIs(1));
  std::vector<std::string> expected;
  for (int i = 0; i < kLongList; ++i) {
    expected.push_back(absl::StrCat("\"", i, "\""));
  }
  EXPECT_EQ(payloads[0], absl::StrCat(R"({"data":{"scalarList":[)",
                                      absl::StrJoin(expected, ","), "]}}"));
}

TEST_F(ExecuteIncrementallyTest, StreamsLongIteratorWithoutExecutor) {
  options_.root_value = Value::Object(
      {{"scalarList", Value::Iterator(std::make_shared<VectorAsyncIterator>(
                          NumberedItems(kLongList)))}});
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      std::vector<std::string> payloads,
      Run("{ scalarList @stream(initialCount: 0) }"));
  ASSERT_THAT(payloads, SizeIs(kLongList + 2));
  EXPECT_EQ(payloads[1],
            R"({"hasNext":true,"incremental":[{"items":["0"],"id":"0"}]})");
  EXPECT_EQ(payloads.back(), R"({"hasNext":false,"completed":[{"id":"0"}]})");
}

TEST_F(ExecuteIncrementallyTest, NestedDeferIsPendingAfterParent) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      std::vector<std::string> payloads,
      Run("{ hero { id ... @defer { name ... @defer { nonNullName } } } }"));
  EXPECT_THAT(
      payloads,
      ElementsAre(
          R"({"data":{"hero":{"id":"1"}},"pending":[{"id":"0","path":)"
          R"(["hero"]}],"hasNext":true})",
          R"({"hasNext":true,"pending":[{"id":"1","path":["hero"]}],)"
          R"("incremental":[{"data":{"name":"Luke"},"id":"0"}],)"
          R"("completed":[{"id":"0"}]})",
          R"({"hasNext":false,"incremental":[{"data":{"nonNullName":)"
          R"("Luke"},"id":"1"}],"completed":[{"id":"1"}]})"));
}

TEST_F(ExecuteIncrementallyTest, DefersInsideListItems) {
  options_.root_value = Value::Object(
      {{"friendList",
        Value::List({Value::Object({{"id", Value::String("2")},
                                    {"name", Value::String("Han")}}),
                     Value::Object({{"id", Value::String("3")},
                                    {"name", Value::String("Leia")}})})}});
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      std::vector<std::string> payloads,
      Run("{ friendList { id ... @defer { name } } }"));
  EXPECT_THAT(
      payloads,
      ElementsAre(
          R"({"data":{"friendList":[{"id":"2"},{"id":"3"}]},"pending":[)"
          R"({"id":"0","path":["friendList",0]},)"
          R"({"id":"1","path":["friendList",1]}],"hasNext":true})",
          R"({"hasNext":false,"incremental":[{"data":{"name":"Han"},)"
          R"("id":"0"},{"data":{"name":"Leia"},"id":"1"}],)"
          R"("completed":[{"id":"0"},{"id":"1"}]})"));
}

TEST_F(ExecuteIncrementallyTest, DeliversUnderParentWithSubPath) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      std::vector<std::string> payloads,
      Run(R"({ ... @defer(label: "DeferID") { hero { id } } )"
          R"(hero { ... @defer(label: "DeferName") { name } } })"));
  EXPECT_THAT(
      payloads,
      ElementsAre(
          R"({"data":{"hero":{}},"pending":[)"
          R"({"id":"0","path":[],"label":"DeferID"},)"
          R"({"id":"1","path":["hero"],"label":"DeferName"}],)"
          R"("hasNext":true})",
          R"({"hasNext":false,"incremental":[{"data":{"id":"1"},"id":"0",)"
          R"("subPath":["hero"]},{"data":{"name":"Luke"},"id":"1"}],)"
          R"("completed":[{"id":"0"},{"id":"1"}]})"));
}

TEST_F(ExecuteIncrementallyTest, SharedFieldsUseDeepestFragment) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      std::vector<std::string> payloads,
      Run("{ ... @defer { hero { id } } hero { ... @defer { id } } }"));
  EXPECT_THAT(
      payloads,
      ElementsAre(
          R"({"data":{"hero":{}},"pending":[{"id":"0","path":[]},)"
          R"({"id":"1","path":["hero"]}],"hasNext":true})",
          R"({"hasNext":false,"incremental":[{"data":{"id":"1"},)"
          R"("id":"1"}],"completed":[{"id":"0"},{"id":"1"}]})"));
}

TEST_F(ExecuteIncrementallyTest, StreamedNonNullItemErrorCompletesStream) {
  options_.root_value = Value::Object(
      {{"nonNullFriendList",
        Value::List({Value::Object({{"name", Value::String("Han")}}),
                     Value::Null()})}});
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      std::vector<std::string> payloads,
      Run("{ nonNullFriendList @stream(initialCount: 1) { name } }"));
  ASSERT_THAT(payloads, SizeIs(2));
  EXPECT_EQ(payloads[0],
            R"({"data":{"nonNullFriendList":[{"name":"Han"}]},"pending":[)"
            R"({"id":"0","path":["nonNullFriendList"]}],"hasNext":true})");
  EXPECT_THAT(payloads[1],
              StartsWith(R"({"hasNext":false,"completed":[{"id":"0",)"
                         R"("errors":[{"message":"Cannot return null for )"
                         R"(non-nullable field Query.nonNullFriendList.")"));
  EXPECT_THAT(payloads[1], HasSubstr(R"("path":["nonNullFriendList",1])"));
}

TEST_F(ExecuteIncrementallyTest, RejectsNegativeInitialCount) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      std::vector<std::string> payloads,
      Run("{ scalarList @stream(initialCount: -1) }"));
  ASSERT_THAT(payloads, SizeIs(1));
  EXPECT_THAT(payloads[0], HasSubstr(R"("data":{"scalarList":null})"));
  EXPECT_THAT(payloads[0],
              HasSubstr("initialCount must be a positive integer"));
}

TEST_F(ExecuteIncrementallyTest, ExecuteSyncRejectsExperimentalSchema) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(std::unique_ptr<ParserOutput> parsed,
                                 Parse("{ hero { id } }"));
  EXPECT_THAT(ExecuteSync(*hero_.schema, *parsed->document(), options_),
              ::gqlengine_base::testing::StatusIs(
                  absl::StatusCode::kFailedPrecondition));
}

TEST(StreamCancellationTest, ReturnClosesTheSourceIterator) {
  SimplePubSub numbers;
  TypeFactory factory;
  ObjectType* query = factory.MakeObjectType("Query");
  query->AddField(
      {.name = "numbers",
       .type = factory.MakeListType(types::IntType()),
       .resolve = [&numbers](const Value&, const Value&,
                             const ResolveInfo&) -> absl::StatusOr<Value> {
         return Value::Iterator(numbers.Subscribe());
       }});
  SchemaConfig config;
  config.query = query;
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      std::unique_ptr<const Schema> schema,
      Schema::Create(std::move(config), {.enable_defer_stream = true}));
  GQLENGINE_ASSERT_OK_AND_ASSIGN(std::unique_ptr<ParserOutput> parsed,
                                 Parse("{ numbers @stream(initialCount: 0) }"));
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      Future<ExecutionOutcome> outcome,
      ExecuteIncrementally(*schema, *parsed->document()));
  ASSERT_TRUE(outcome.is_ready());
  const auto* results =
      std::get_if<IncrementalExecutionResults>(&outcome.value());
  ASSERT_NE(results, nullptr);
  EXPECT_EQ(results->initial_result.data.ToJson(), R"({"numbers":[]})");
  EXPECT_EQ(numbers.subscriber_count(), 1u);

  EXPECT_TRUE(results->subsequent_results->Return().Wait().ok());
  EXPECT_EQ(numbers.subscriber_count(), 0u);
}

TEST(StreamIteratorErrorTest, ErrorAfterInitialCountCompletesStream) {
  int pulls = 0;
  TypeFactory factory;
  ObjectType* query = factory.MakeObjectType("Query");
  query->AddField(
      {.name = "numbers",
       .type = factory.MakeListType(types::IntType()),
       .resolve = [&pulls](const Value&, const Value&,
                           const ResolveInfo&) -> absl::StatusOr<Value> {
         return Value::Iterator(std::make_shared<CallbackAsyncIterator>(
             [&pulls]() -> Future<AsyncIterator::NextResult> {
               if (pulls++ == 0) {
                 return gqlengine_base::MakeReadyFuture(
                     AsyncIterator::NextResult(
                         std::optional<Value>(Value::Int(1))));
               }
               return gqlengine_base::MakeReadyFuture(
                   AsyncIterator::NextResult(
                       absl::UnavailableError("feed lost")));
             }));
       }});
  SchemaConfig config;
  config.query = query;
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      std::unique_ptr<const Schema> schema,
      Schema::Create(std::move(config), {.enable_defer_stream = true}));
  GQLENGINE_ASSERT_OK_AND_ASSIGN(std::unique_ptr<ParserOutput> parsed,
                                 Parse("{ numbers @stream(initialCount: 1) }"));
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      Future<ExecutionOutcome> outcome,
      ExecuteIncrementally(*schema, *parsed->document()));
  GQLENGINE_ASSERT_OK_AND_ASSIGN(std::vector<std::string> payloads,
                                 CollectPayloads(outcome, nullptr));
  EXPECT_THAT(
      payloads,
      ElementsAre(
          R"({"data":{"numbers":[1]},"pending":[{"id":"0","path":)"
          R"(["numbers"]}],"hasNext":true})",
          R"({"hasNext":false,"completed":[{"id":"0","errors":[)"
          R"({"message":"feed lost","locations":[{"line":1,"column":3}],)"
          R"("path":["numbers"]}]}]})"));
  EXPECT_EQ(pulls, 2);
}

TEST(MutationDeferTest, DefersFieldsOfMutationResult) {
  TypeFactory factory;
  ObjectType* hero = factory.MakeObjectType("Hero");
  hero->AddField({.name = "id", .type = types::IdType()});
  hero->AddField({.name = "name", .type = types::StringType()});
  ObjectType* query = factory.MakeObjectType("Query");
  query->AddField({.name = "hero", .type = hero});
  ObjectType* mutation = factory.MakeObjectType("Mutation");
  mutation->AddField({.name = "addHero", .type = hero});
  SchemaConfig config;
  config.query = query;
  config.mutation = mutation;
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      std::unique_ptr<const Schema> schema,
      Schema::Create(std::move(config), {.enable_defer_stream = true}));
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      std::unique_ptr<ParserOutput> parsed,
      Parse("mutation { addHero { id ... @defer { name } } }"));
  ExecuteOptions options;
  options.root_value = Value::Object(
      {{"addHero", Value::Object({{"id", Value::String("2")},
                                  {"name", Value::String("Leia")}})}});
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      Future<ExecutionOutcome> outcome,
      ExecuteIncrementally(*schema, *parsed->document(), options));
  GQLENGINE_ASSERT_OK_AND_ASSIGN(std::vector<std::string> payloads,
                                 CollectPayloads(outcome, nullptr));
  EXPECT_THAT(
      payloads,
      ElementsAre(
          R"({"data":{"addHero":{"id":"2"}},"pending":[{"id":"0","path":)"
          R"(["addHero"]}],"hasNext":true})",
          R"({"hasNext":false,"incremental":[{"data":{"name":"Leia"},)"
          R"("id":"0"}],"completed":[{"id":"0"}]})"));
}

}  // namespace
}  // namespace gqlengine
