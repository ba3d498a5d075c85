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


#ifndef GQLENGINE_BASE_STATUS_MACROS_H_
#define GQLENGINE_BASE_STATUS_MACROS_H_

// Helper macros to return and propagate errors with `absl::Status`.

#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "gqlengine/base/status_builder.h"

// Evaluates an expression that produces a `absl::Status`. If the status
// is not ok, returns it from the current function.
//
//   absl::Status CoerceAll() {
//     GQLENGINE_RETURN_IF_ERROR(CoerceOne(args...));
//     GQLENGINE_RETURN_IF_ERROR(CoerceOther(args...)) << "while coercing";
//     return absl::OkStatus();
//   }
//
// The macro ends with a `gqlengine_base::StatusBuilder` which allows the
// returned status to be extended with more details. Chained expressions are
// only evaluated on error.
//
// Inside a lambda, annotate the return type to avoid confusion between a
// StatusBuilder and an absl::Status.
#define GQLENGINE_RETURN_IF_ERROR(expr)                                \
  GQLENGINE_STATUS_MACROS_IMPL_ELSE_BLOCKER_                           \
  if (::gqlengine_base::status_macro_internal::StatusAdaptorForMacros  \
          status_macro_internal_adaptor = {(expr), GQLENGINE_LOC}) {   \
  } else /* NOLINT */                                                  \
    return status_macro_internal_adaptor.Consume()

// Executes an expression `rexpr` that returns a `absl::StatusOr<T>`. On OK,
// assigns its value to `lhs`, otherwise returns from the current function.
// The optional `error_expression` may use a StatusBuilder named `_`.
//
//   GQLENGINE_ASSIGN_OR_RETURN(Value coerced, CoerceInputValue(...));
//   GQLENGINE_ASSIGN_OR_RETURN(const Type* type, LookupType(name),
//                              _ << "while resolving " << name);
//
// WARNING: expands into multiple statements; it cannot be used as the body
// of an if statement without {}.
#define GQLENGINE_ASSIGN_OR_RETURN(...)                              \
  GQLENGINE_STATUS_MACROS_IMPL_GET_VARIADIC_(                        \
      __VA_ARGS__, GQLENGINE_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_3_, \
      GQLENGINE_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_2_)              \
  (__VA_ARGS__)

// =================================================================
// == Implementation details, do not rely on anything below here. ==
// =================================================================

#define GQLENGINE_STATUS_MACROS_IMPL_GET_VARIADIC_(_1, _2, _3, NAME, ...) NAME

#define GQLENGINE_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_2_(lhs, rexpr) \
  GQLENGINE_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_3_(lhs, rexpr, std::move(_))
#define GQLENGINE_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_3_(lhs, rexpr,         \
                                                         error_expression)   \
  GQLENGINE_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_(                            \
      GQLENGINE_STATUS_MACROS_IMPL_CONCAT_(_status_or_value, __LINE__), lhs, \
      rexpr, error_expression)
#define GQLENGINE_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_(statusor, lhs, rexpr, \
                                                       error_expression)     \
  auto statusor = (rexpr);                                                   \
  if (ABSL_PREDICT_FALSE(!statusor.ok())) {                                  \
    ::gqlengine_base::StatusBuilder _(std::move(statusor).status(),          \
                                      GQLENGINE_LOC);                        \
    (void)_; /* error_expression is allowed to not use this variable */      \
    return (error_expression);                                               \
  }                                                                          \
  lhs = std::move(statusor).value()

#define GQLENGINE_STATUS_MACROS_IMPL_CONCAT_INNER_(x, y) x##y
#define GQLENGINE_STATUS_MACROS_IMPL_CONCAT_(x, y) \
  GQLENGINE_STATUS_MACROS_IMPL_CONCAT_INNER_(x, y)

// Keeps `if (x) GQLENGINE_RETURN_IF_ERROR(expr) << "msg";` from binding a
// dangling else.
#define GQLENGINE_STATUS_MACROS_IMPL_ELSE_BLOCKER_ \
  switch (0)                                       \
  case 0:                                          \
  default:  // NOLINT

namespace gqlengine_base {
namespace status_macro_internal {

// Provides a conversion to bool so that it can be used inside an if statement
// that declares a variable.
class StatusAdaptorForMacros {
 public:
  StatusAdaptorForMacros(const absl::Status& status, SourceLocation loc)
      : builder_(status, loc) {}

  StatusAdaptorForMacros(absl::Status&& status, SourceLocation loc)
      : builder_(std::move(status), loc) {}

  StatusAdaptorForMacros(const StatusBuilder& builder, SourceLocation loc)
      : builder_(builder) {}

  StatusAdaptorForMacros(StatusBuilder&& builder, SourceLocation loc)
      : builder_(std::move(builder)) {}

  StatusAdaptorForMacros(const StatusAdaptorForMacros&) = delete;
  StatusAdaptorForMacros& operator=(const StatusAdaptorForMacros&) = delete;

  explicit operator bool() const { return ABSL_PREDICT_TRUE(builder_.ok()); }

  StatusBuilder&& Consume() { return std::move(builder_); }

 private:
  StatusBuilder builder_;
};

}  // namespace status_macro_internal
}  // namespace gqlengine_base

#endif  // GQLENGINE_BASE_STATUS_MACROS_H_
