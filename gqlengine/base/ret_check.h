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


#ifndef GQLENGINE_BASE_RET_CHECK_H_
#define GQLENGINE_BASE_RET_CHECK_H_

// Macros for non-fatal assertions. Instead of aborting the process on
// failure, these return an absl::Status with code kInternal from the current
// method.
//
//   GQLENGINE_RET_CHECK(field_def != nullptr);
//   GQLENGINE_RET_CHECK_EQ(path.size(), depth) << "while completing list";
//   GQLENGINE_RET_CHECK_FAIL() << "Unexpected type kind";
//
// The GQLENGINE_RET_CHECK* macros can only be used in functions that return
// absl::Status or absl::StatusOr. They end with a StatusBuilder and can be
// customized like GQLENGINE_RETURN_IF_ERROR.

#include <string>

#include "absl/status/status.h"
#include "gqlengine/base/logging.h"
#include "gqlengine/base/source_location.h"
#include "gqlengine/base/status_builder.h"
#include "gqlengine/base/status_macros.h"

namespace gqlengine_base {
namespace internal_ret_check {

// Returns a StatusBuilder that corresponds to a `GQLENGINE_RET_CHECK` failure.
StatusBuilder RetCheckFailSlowPath(SourceLocation location);
StatusBuilder RetCheckFailSlowPath(SourceLocation location,
                                   const char* condition);
StatusBuilder RetCheckFailSlowPath(SourceLocation location,
                                   const char* condition,
                                   const absl::Status& s);

// Takes ownership of `condition`, as produced by the Check_*Impl helpers in
// logging.h.
StatusBuilder RetCheckFailSlowPath(SourceLocation location,
                                   std::string* condition);

inline StatusBuilder RetCheckImpl(const absl::Status& status,
                                  const char* condition,
                                  SourceLocation location) {
  if (ABSL_PREDICT_TRUE(status.ok()))
    return StatusBuilder(absl::OkStatus(), location);
  return RetCheckFailSlowPath(location, condition, status);
}

}  // namespace internal_ret_check
}  // namespace gqlengine_base

#define GQLENGINE_RET_CHECK(cond)                                     \
  while (ABSL_PREDICT_FALSE(!(cond)))                                 \
  return ::gqlengine_base::internal_ret_check::RetCheckFailSlowPath( \
      GQLENGINE_LOC, #cond)

#define GQLENGINE_RET_CHECK_FAIL()                                    \
  return ::gqlengine_base::internal_ret_check::RetCheckFailSlowPath( \
      GQLENGINE_LOC)

// Asserts that an expression returning absl::Status is ok, turning any
// failure into an internal error that wraps the original text.
#define GQLENGINE_RET_CHECK_OK(status)                                        \
  GQLENGINE_RETURN_IF_ERROR(::gqlengine_base::internal_ret_check::RetCheckImpl( \
      (status), #status, GQLENGINE_LOC))

#define GQLENGINE_STATUS_MACROS_INTERNAL_RET_CHECK_OP(name, op, lhs, rhs) \
  while (std::string* _result = ::gqlengine_base::Check_##name##Impl(     \
             ::gqlengine_base::GetReferenceableValue(lhs),                \
             ::gqlengine_base::GetReferenceableValue(rhs),                \
             #lhs " " #op " " #rhs))                                      \
  return ::gqlengine_base::internal_ret_check::RetCheckFailSlowPath(     \
      GQLENGINE_LOC, _result)

#define GQLENGINE_RET_CHECK_EQ(lhs, rhs) \
  GQLENGINE_STATUS_MACROS_INTERNAL_RET_CHECK_OP(EQ, ==, lhs, rhs)
#define GQLENGINE_RET_CHECK_NE(lhs, rhs) \
  GQLENGINE_STATUS_MACROS_INTERNAL_RET_CHECK_OP(NE, !=, lhs, rhs)
#define GQLENGINE_RET_CHECK_LE(lhs, rhs) \
  GQLENGINE_STATUS_MACROS_INTERNAL_RET_CHECK_OP(LE, <=, lhs, rhs)
#define GQLENGINE_RET_CHECK_LT(lhs, rhs) \
  GQLENGINE_STATUS_MACROS_INTERNAL_RET_CHECK_OP(LT, <, lhs, rhs)
#define GQLENGINE_RET_CHECK_GE(lhs, rhs) \
  GQLENGINE_STATUS_MACROS_INTERNAL_RET_CHECK_OP(GE, >=, lhs, rhs)
#define GQLENGINE_RET_CHECK_GT(lhs, rhs) \
  GQLENGINE_STATUS_MACROS_INTERNAL_RET_CHECK_OP(GT, >, lhs, rhs)

#endif  // GQLENGINE_BASE_RET_CHECK_H_
