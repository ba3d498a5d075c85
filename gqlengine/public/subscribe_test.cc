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


// Subscriptions: source event streams and their mapping to responses.

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "gqlengine/base/future.h"
#include "gqlengine/base/ret_check.h"
#include "gqlengine/base/status_macros.h"
#include "gqlengine/base/testing/status_matchers.h"
#include "gqlengine/language/parser.h"
#include "gqlengine/public/async_iterator.h"
#include "gqlengine/public/execute.h"
#include "gqlengine/public/resolve_info.h"
#include "gqlengine/public/schema.h"
#include "gqlengine/public/type.h"
#include "gqlengine/public/value.h"

namespace gqlengine {
namespace {

using ::gqlengine_base::Future;
using ::testing::HasSubstr;
using ::testing::SizeIs;

class SubscribeTest : public ::testing::Test {
 protected:
  void SetUp() override { BuildSchema(SchemaOptions()); }

  void BuildSchema(SchemaOptions options) {
    schema_.reset();
    factory_ = std::make_unique<TypeFactory>();
    ObjectType* email = factory_->MakeObjectType("Email");
    email->AddField({.name = "subject", .type = types::StringType()});
    email->AddField({.name = "unread", .type = types::BooleanType()});

    ObjectType* query = factory_->MakeObjectType("Query");
    query->AddField({.name = "inbox", .type = types::StringType()});

    ObjectType* subscription = factory_->MakeObjectType("Subscription");
    subscription->AddField(
        {.name = "importantEmail",
         .type = email,
         .subscribe = [this](const Value&, const Value&,
                             const ResolveInfo&) -> absl::StatusOr<Value> {
           if (!subscribe_error_.ok()) return subscribe_error_;
           if (!return_iterator_) return Value::String("not a stream");
           return Value::Iterator(pubsub_.Subscribe());
         }});

    SchemaConfig config;
    config.query = query;
    config.subscription = subscription;
    GQLENGINE_ASSERT_OK_AND_ASSIGN(schema_,
                                   Schema::Create(std::move(config), options));
  }

  static Value EmailEvent(std::string subject) {
    return Value::Object(
        {{"importantEmail",
          Value::Object({{"subject", Value::String(std::move(subject))},
                         {"unread", Value::Bool(true)}})}});
  }

  absl::StatusOr<SubscriptionOutcome> Run(absl::string_view query) {
    GQLENGINE_ASSIGN_OR_RETURN(parsed_, Parse(query));
    GQLENGINE_ASSIGN_OR_RETURN(Future<SubscriptionOutcome> outcome,
                               Subscribe(*schema_, *parsed_->document()));
    GQLENGINE_RET_CHECK(outcome.is_ready());
    return outcome.value();
  }

  SimplePubSub pubsub_;
  absl::Status subscribe_error_;
  bool return_iterator_ = true;
  std::unique_ptr<TypeFactory> factory_;
  std::unique_ptr<const Schema> schema_;
  std::unique_ptr<ParserOutput> parsed_;
};

TEST_F(SubscribeTest, MapsEachEventToAResponse) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      SubscriptionOutcome outcome,
      Run("subscription { importantEmail { subject } }"));
  ASSERT_TRUE(
      std::holds_alternative<std::shared_ptr<SubscriptionResultStream>>(
          outcome));
  auto stream = std::get<std::shared_ptr<SubscriptionResultStream>>(outcome);

  Future<SubscriptionResultStream::NextResult> first = stream->Next();
  EXPECT_FALSE(first.is_ready());
  EXPECT_TRUE(pubsub_.Emit(EmailEvent("Hello")));
  ASSERT_TRUE(first.is_ready());
  GQLENGINE_ASSERT_OK(first.value().status());
  ASSERT_TRUE(first.value()->has_value());
  EXPECT_EQ((*first.value())->ToJson(),
            R"({"data":{"importantEmail":{"subject":"Hello"}}})");

  // Events emitted while nobody reads are buffered.
  EXPECT_TRUE(pubsub_.Emit(EmailEvent("Again")));
  Future<SubscriptionResultStream::NextResult> second = stream->Next();
  ASSERT_TRUE(second.is_ready());
  ASSERT_TRUE(second.value().ok());
  ASSERT_TRUE(second.value()->has_value());
  EXPECT_EQ((*second.value())->ToJson(),
            R"({"data":{"importantEmail":{"subject":"Again"}}})");
}

TEST_F(SubscribeTest, ReturnClosesTheSourceStream) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      SubscriptionOutcome outcome,
      Run("subscription { importantEmail { subject } }"));
  auto stream = std::get<std::shared_ptr<SubscriptionResultStream>>(outcome);
  Future<SubscriptionResultStream::NextResult> pending = stream->Next();
  EXPECT_EQ(pubsub_.subscriber_count(), 1u);

  Future<absl::Status> closed = stream->Return();
  ASSERT_TRUE(closed.is_ready());
  GQLENGINE_EXPECT_OK(closed.value());
  EXPECT_EQ(pubsub_.subscriber_count(), 0u);
  EXPECT_FALSE(pubsub_.Emit(EmailEvent("Lost")));

  // The read in flight ends with the stream.
  ASSERT_TRUE(pending.is_ready());
  ASSERT_TRUE(pending.value().ok());
  EXPECT_FALSE(pending.value()->has_value());

  Future<SubscriptionResultStream::NextResult> after = stream->Next();
  ASSERT_TRUE(after.is_ready());
  ASSERT_TRUE(after.value().ok());
  EXPECT_FALSE(after.value()->has_value());
}

TEST_F(SubscribeTest, ReportsNonStreamResult) {
  return_iterator_ = false;
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      SubscriptionOutcome outcome,
      Run("subscription { importantEmail { subject } }"));
  ASSERT_TRUE(std::holds_alternative<ExecutionResult>(outcome));
  const ExecutionResult& result = std::get<ExecutionResult>(outcome);
  EXPECT_TRUE(result.data.is_null());
  ASSERT_THAT(result.errors, SizeIs(1));
  EXPECT_THAT(result.errors[0].message,
              HasSubstr("Subscription field must return AsyncIterable. "
                        "Received: "));
  ASSERT_TRUE(result.errors[0].path.has_value());
  EXPECT_EQ(PathKeysToString(*result.errors[0].path), "importantEmail");
}

TEST_F(SubscribeTest, LocatesSubscribeErrors) {
  subscribe_error_ = absl::UnavailableError("mail server down");
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      SubscriptionOutcome outcome,
      Run("subscription { importantEmail { subject } }"));
  const ExecutionResult& result = std::get<ExecutionResult>(outcome);
  EXPECT_EQ(result.ToJson(),
            R"({"data":null,"errors":[{"message":"mail server down",)"
            R"("locations":[{"line":1,"column":16}],)"
            R"("path":["importantEmail"]}]})");
}

TEST_F(SubscribeTest, RejectsDeferInSubscription) {
  BuildSchema({.enable_defer_stream = true});
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      SubscriptionOutcome outcome,
      Run("subscription { ... @defer { importantEmail { subject } } }"));
  const ExecutionResult& result = std::get<ExecutionResult>(outcome);
  ASSERT_THAT(result.errors, SizeIs(1));
  EXPECT_THAT(result.errors[0].message,
              HasSubstr("`@defer` directive not supported on subscription "
                        "operations."));
}

TEST_F(SubscribeTest, CreateSourceEventStreamReturnsTheIterator) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      std::unique_ptr<ParserOutput> parsed,
      Parse("subscription { importantEmail { subject } }"));
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      Future<SourceEventStreamOutcome> outcome,
      CreateSourceEventStream(*schema_, *parsed->document()));
  ASSERT_TRUE(outcome.is_ready());
  auto events = std::get<std::shared_ptr<AsyncIterator>>(outcome.value());
  pubsub_.Emit(Value::String("raw"));
  Future<AsyncIterator::NextResult> next = events->Next();
  ASSERT_TRUE(next.is_ready());
  ASSERT_TRUE(next.value().ok());
  ASSERT_TRUE(next.value()->has_value());
  EXPECT_EQ((*next.value())->string_value(), "raw");
}

TEST(SubscribeWithoutRootTest, ReportsMissingSubscriptionType) {
  TypeFactory factory;
  ObjectType* query = factory.MakeObjectType("Query");
  query->AddField({.name = "inbox", .type = types::StringType()});
  SchemaConfig config;
  config.query = query;
  GQLENGINE_ASSERT_OK_AND_ASSIGN(std::unique_ptr<const Schema> schema,
                                 Schema::Create(std::move(config)));
  GQLENGINE_ASSERT_OK_AND_ASSIGN(std::unique_ptr<ParserOutput> parsed,
                                 Parse("subscription { inbox }"));
  GQLENGINE_ASSERT_OK_AND_ASSIGN(Future<SubscriptionOutcome> outcome,
                                 Subscribe(*schema, *parsed->document()));
  ASSERT_TRUE(outcome.is_ready());
  const ExecutionResult& result = std::get<ExecutionResult>(outcome.value());
  ASSERT_THAT(result.errors, SizeIs(1));
  EXPECT_EQ(result.errors[0].message,
            "Schema is not configured to execute subscription operation.");
}

}  // namespace
}  // namespace gqlengine
