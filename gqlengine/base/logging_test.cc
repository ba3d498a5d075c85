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


#include "gqlengine/base/logging.h"

#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/base/log_severity.h"
#include "absl/log/scoped_mock_log.h"
#include "absl/status/status.h"
#include "gqlengine/base/status_builder.h"

namespace gqlengine_base {
namespace {

using ::testing::_;
using ::testing::HasSubstr;

class LoggingTest : public ::testing::Test {
 protected:
  void TearDown() override { set_vlog_level(-1); }
};

TEST_F(LoggingTest, VlogLevelOverridesDefault) {
  set_vlog_level(2);
  EXPECT_EQ(get_vlog_level(), 2);
  EXPECT_TRUE(GQLENGINE_VLOG_IS_ON(2));
  EXPECT_FALSE(GQLENGINE_VLOG_IS_ON(3));
}

TEST_F(LoggingTest, VlogWritesOnlyEnabledLevels) {
  set_vlog_level(1);
  absl::ScopedMockLog log(absl::MockLogDefault::kDisallowUnexpected);
  EXPECT_CALL(log, Log(absl::LogSeverity::kInfo, HasSubstr("logging_test.cc"),
                       "collected 3 root fields"));
  log.StartCapturingLogs();
  GQLENGINE_VLOG(1) << "collected 3 root fields";
  GQLENGINE_VLOG(2) << "resolving hero.name";
}

TEST_F(LoggingTest, LogUsesTheGivenSeverity) {
  absl::ScopedMockLog log(absl::MockLogDefault::kDisallowUnexpected);
  EXPECT_CALL(log,
              Log(absl::LogSeverity::kWarning, _, "stream was not closed"));
  log.StartCapturingLogs();
  GQLENGINE_LOG(WARNING) << "stream was not closed";
  GQLENGINE_LOG_IF(WARNING, false) << "never logged";
}

TEST_F(LoggingTest, StatusBuilderLogsAtItsSourceLocation) {
  absl::ScopedMockLog log(absl::MockLogDefault::kDisallowUnexpected);
  EXPECT_CALL(log, Log(absl::LogSeverity::kError,
                       HasSubstr("logging_test.cc"), HasSubstr("lost field")));
  log.StartCapturingLogs();
  absl::Status status =
      StatusBuilder(absl::InternalError("lost field")).LogError();
  EXPECT_EQ(status.code(), absl::StatusCode::kInternal);
}

TEST_F(LoggingTest, InitLoggingSetsVerbosity) {
  EXPECT_TRUE(InitLogging(::testing::TempDir().c_str(), "gqlengine_test", 3));
  EXPECT_EQ(get_vlog_level(), 3);
  EXPECT_FALSE(get_log_directory().empty());
  EXPECT_EQ(get_log_directory().back(), '/');
}

TEST(CheckTest, FailedCheckDies) {
  int fields = 0;
  EXPECT_DEATH(GQLENGINE_CHECK(fields == 1) << "no fields",
               "Check failed: fields == 1");
}

}  // namespace
}  // namespace gqlengine_base
