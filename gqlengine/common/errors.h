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


#ifndef GQLENGINE_COMMON_ERRORS_H_
#define GQLENGINE_COMMON_ERRORS_H_

// Common error status factory functions. The factories return
// gqlengine_base::StatusBuilder so that the message can be built with <<.
//
// kInvalidArgument is used for every error that ends up in a response
// (syntax, coercion and field errors). kFailedPrecondition is used when the
// library is called incorrectly, e.g. with an invalid schema.
//
//   return MakeGraphQLError() << "Unknown operation named '" << name << "'.";
//
// Errors that point at the document carry a GraphQLErrorPayload; see
// gqlengine/public/graphql_error.h for the helpers that attach one.

#include "gqlengine/base/status_builder.h"

namespace gqlengine {

// Creates a StatusBuilder for errors reported in a response, using the
// INVALID_ARGUMENT code.
inline ::gqlengine_base::StatusBuilder MakeGraphQLError() {
  return ::gqlengine_base::InvalidArgumentErrorBuilder();
}

// Creates a StatusBuilder for API misuse, using the FAILED_PRECONDITION code.
inline ::gqlengine_base::StatusBuilder MakeMisuseError() {
  return ::gqlengine_base::FailedPreconditionErrorBuilder();
}

}  // namespace gqlengine

#endif  // GQLENGINE_COMMON_ERRORS_H_
