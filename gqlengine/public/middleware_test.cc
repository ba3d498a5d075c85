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


#include "gqlengine/public/middleware.h"

#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "gqlengine/base/status_macros.h"
#include "gqlengine/base/testing/status_matchers.h"
#include "gqlengine/public/resolve_info.h"
#include "gqlengine/public/type.h"
#include "gqlengine/public/value.h"

namespace gqlengine {
namespace {

using ::gqlengine_base::testing::IsOkAndHolds;
using ::gqlengine_base::testing::StatusIs;
using ::testing::ElementsAre;

Middleware Tracing(std::string name, std::vector<std::string>* calls) {
  return [name, calls](const FieldResolver& next, const Value& source,
                       const Value& args,
                       const ResolveInfo& info) -> absl::StatusOr<Value> {
    calls->push_back(absl::StrCat("enter ", name));
    absl::StatusOr<Value> result = next(source, args, info);
    calls->push_back(absl::StrCat("leave ", name));
    return result;
  };
}

FieldResolver Constant(std::string value) {
  return [value](const Value&, const Value&,
                 const ResolveInfo&) -> absl::StatusOr<Value> {
    return Value::String(value);
  };
}

TEST(MiddlewareManagerTest, EmptyManagerReturnsTheResolver) {
  MiddlewareManager manager({});
  EXPECT_TRUE(manager.empty());
  FieldResolver resolver = manager.GetFieldResolver(nullptr, Constant("x"));
  EXPECT_THAT(resolver(Value(), Value(), ResolveInfo()),
              IsOkAndHolds(Value::String("x")));
}

TEST(MiddlewareManagerTest, LastMiddlewareIsOutermost) {
  std::vector<std::string> calls;
  MiddlewareManager manager({Tracing("first", &calls),
                             Tracing("second", &calls)});
  FieldDefinition field{.name = "f", .type = types::StringType()};
  FieldResolver resolver = manager.GetFieldResolver(&field, Constant("x"));
  GQLENGINE_ASSERT_OK(resolver(Value(), Value(), ResolveInfo()).status());
  EXPECT_THAT(calls, ElementsAre("enter second", "enter first", "leave first",
                                 "leave second"));
}

TEST(MiddlewareManagerTest, MiddlewareCanShortCircuit) {
  Middleware deny = [](const FieldResolver&, const Value&, const Value&,
                       const ResolveInfo& info) -> absl::StatusOr<Value> {
    return absl::PermissionDeniedError(
        absl::StrCat("No access to ", info.field_name));
  };
  MiddlewareManager manager({deny});
  FieldDefinition field{.name = "secret", .type = types::StringType()};
  ResolveInfo info;
  info.field_name = "secret";
  EXPECT_THAT(manager.GetFieldResolver(&field, Constant("x"))(Value(), Value(),
                                                              info),
              StatusIs(absl::StatusCode::kPermissionDenied,
                       "No access to secret"));
}

TEST(MiddlewareManagerTest, ChainIsBuiltOncePerField) {
  MiddlewareManager manager({[](const FieldResolver& next, const Value& source,
                                const Value& args, const ResolveInfo& info) {
    return next(source, args, info);
  }});
  FieldDefinition field{.name = "f", .type = types::StringType()};
  manager.GetFieldResolver(&field, Constant("first"));
  // The cached chain keeps wrapping the first resolver.
  EXPECT_THAT(manager.GetFieldResolver(&field, Constant("second"))(
                  Value(), Value(), ResolveInfo()),
              IsOkAndHolds(Value::String("first")));
}

}  // namespace
}  // namespace gqlengine
