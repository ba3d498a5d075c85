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


#include "gqlengine/base/status_builder.h"

#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "gqlengine/base/ret_check.h"
#include "gqlengine/base/status_macros.h"
#include "gqlengine/base/status_payload.h"
#include "gqlengine/base/testing/status_matchers.h"
#include "gqlengine/proto/graphql_error.pb.h"

namespace gqlengine_base {
namespace {

using ::gqlengine_base::testing::IsOk;
using ::gqlengine_base::testing::IsOkAndHolds;
using ::gqlengine_base::testing::StatusIs;
using ::testing::HasSubstr;
using ::testing::StartsWith;

TEST(StatusBuilderTest, AnnotatesOriginalMessage) {
  absl::Status status = StatusBuilder(absl::NotFoundError("no field"))
                        << "while resolving";
  EXPECT_THAT(status, StatusIs(absl::StatusCode::kNotFound,
                               "no field; while resolving"));
}

TEST(StatusBuilderTest, PrependsWithoutSeparator) {
  absl::Status status =
      StatusBuilder(absl::InvalidArgumentError("Int cannot represent 1.5"))
          .SetPrepend()
      << "Variable '$n' got invalid value 1.5; ";
  EXPECT_THAT(status, StatusIs(absl::StatusCode::kInvalidArgument,
                               "Variable '$n' got invalid value 1.5; Int "
                               "cannot represent 1.5"));
}

TEST(StatusBuilderTest, CodeOnlyBuilderUsesStreamedMessage) {
  absl::StatusOr<int> result = InvalidArgumentErrorBuilder()
                               << "Unknown operation named 'Q'.";
  EXPECT_THAT(result, StatusIs(absl::StatusCode::kInvalidArgument,
                               "Unknown operation named 'Q'."));
}

TEST(StatusBuilderTest, OkStatusIgnoresEverything) {
  absl::Status status = StatusBuilder(absl::OkStatus()) << "ignored";
  EXPECT_THAT(status, IsOk());
}

TEST(StatusBuilderTest, AttachedPayloadSurvivesAnnotation) {
  gqlengine::GraphQLErrorPayload payload;
  payload.add_locations()->set_line(3);
  absl::Status status = StatusBuilder(absl::InvalidArgumentError("bad"))
                            .Attach(payload)
                        << "more";
  ASSERT_TRUE(HasPayloadWithType<gqlengine::GraphQLErrorPayload>(status));
  EXPECT_EQ(GetPayload<gqlengine::GraphQLErrorPayload>(status)
                .locations(0)
                .line(),
            3);
  EXPECT_EQ(status.message(), "bad; more");
}

absl::Status CheckPositive(int n) {
  GQLENGINE_RET_CHECK_GT(n, 0) << "for n";
  return absl::OkStatus();
}

absl::StatusOr<int> CheckNotNull(const int* value) {
  GQLENGINE_RET_CHECK(value != nullptr);
  return *value;
}

absl::StatusOr<int> Twice(const int* value) {
  GQLENGINE_ASSIGN_OR_RETURN(int n, CheckNotNull(value));
  GQLENGINE_RETURN_IF_ERROR(CheckPositive(n));
  return 2 * n;
}

TEST(RetCheckTest, ReportsInternalErrorWithCondition) {
  EXPECT_THAT(CheckPositive(1), IsOk());
  EXPECT_THAT(CheckPositive(-2),
              StatusIs(absl::StatusCode::kInternal,
                       HasSubstr("n > 0 (-2 vs. 0) for n")));
  EXPECT_THAT(CheckNotNull(nullptr),
              StatusIs(absl::StatusCode::kInternal,
                       StartsWith("GQLENGINE_RET_CHECK failure")));
}

TEST(StatusMacrosTest, PropagatesFirstFailure) {
  int three = 3;
  int minus = -1;
  EXPECT_THAT(Twice(&three), IsOkAndHolds(6));
  EXPECT_THAT(Twice(nullptr), StatusIs(absl::StatusCode::kInternal,
                                       HasSubstr("value != nullptr")));
  EXPECT_THAT(Twice(&minus), StatusIs(absl::StatusCode::kInternal,
                                      HasSubstr("n > 0")));
}

}  // namespace
}  // namespace gqlengine_base
