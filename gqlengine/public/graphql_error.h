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


#ifndef GQLENGINE_PUBLIC_GRAPHQL_ERROR_H_
#define GQLENGINE_PUBLIC_GRAPHQL_ERROR_H_

// Errors reported in a GraphQL response.
//
// Inside the engine an error is an absl::Status. A status that points at the
// document or at a response field carries a GraphQLErrorPayload with the
// source locations and the response path; such a status is called located.
// GraphQLError is the user-facing form that ends up in
// ExecutionResult::errors.

#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "gqlengine/language/ast.h"
#include "gqlengine/language/source.h"
#include "gqlengine/public/response_path.h"

namespace gqlengine {

struct GraphQLError {
  std::string message;
  std::vector<SourcePosition> locations;
  // Unset for errors that are not associated with a response field.
  std::optional<std::vector<PathKey>> path;
  // JSON encoded values, by key.
  std::map<std::string, std::string> extensions;
  // The code of the originating status. Not part of the response.
  absl::StatusCode code = absl::StatusCode::kInvalidArgument;

  static GraphQLError FromStatus(const absl::Status& status);
  absl::Status ToStatus() const;

  // The response form: {"message": ..., "locations": [...], "path": [...],
  // "extensions": {...}}. Absent parts are omitted.
  std::string ToJson() const;

  // The message followed by one "(line:column)" per location.
  std::string ToString() const;
  // The message followed by an excerpt of `source` around each location.
  std::string ToString(const Source& source) const;
};

bool operator==(const GraphQLError& a, const GraphQLError& b);
inline bool operator!=(const GraphQLError& a, const GraphQLError& b) {
  return !(a == b);
}
std::ostream& operator<<(std::ostream& out, const GraphQLError& error);

// Orders errors by locations, then path, then message.
bool GraphQLErrorLess(const GraphQLError& a, const GraphQLError& b);

// Attaches the locations of `nodes` to `status` unless it already has
// locations. OK statuses are returned unchanged.
absl::Status WithNodeLocations(absl::Status status,
                               absl::Span<const Node* const> nodes);

// Turns an error raised while resolving or completing a field into a located
// error: attaches the locations of `field_nodes` (unless present) and `path`.
// A status that already has a path is returned unchanged, so that an error
// propagating through several fields keeps the innermost path.
absl::Status LocateError(absl::Status status,
                         absl::Span<const FieldNode* const> field_nodes,
                         const ResponsePath* path);

// Whether `status` carries a response path.
bool HasErrorPath(const absl::Status& status);

// Adds an "extensions" entry. `json_value` must be JSON text.
absl::Status WithErrorExtension(absl::Status status, absl::string_view key,
                                absl::string_view json_value);

}  // namespace gqlengine

#endif  // GQLENGINE_PUBLIC_GRAPHQL_ERROR_H_
