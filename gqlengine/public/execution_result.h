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


#ifndef GQLENGINE_PUBLIC_EXECUTION_RESULT_H_
#define GQLENGINE_PUBLIC_EXECUTION_RESULT_H_

// The response shapes produced by execution. Each type's ToJson() renders the
// GraphQL response wire format; parts that are absent are omitted, and so
// are empty error lists.

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "absl/status/statusor.h"
#include "gqlengine/base/future.h"
#include "gqlengine/public/graphql_error.h"
#include "gqlengine/public/response_path.h"
#include "gqlengine/public/value.h"

namespace gqlengine {

struct ExecutionResult {
  // The response data. Invalid when execution did not start, e.g. because
  // variable coercion failed; null when an error propagated to the root.
  Value data;
  std::vector<GraphQLError> errors;
  // An object value, or invalid for none.
  Value extensions;

  std::string ToJson() const;
};

// A deferred fragment or stream announced to the client. Its `id` is
// referenced by later payloads.
struct PendingResult {
  std::string id;
  std::vector<PathKey> path;
  std::optional<std::string> label;

  std::string ToJson() const;
};

// A pending fragment or stream that is finished. Errors mean it was abandoned
// because an error propagated past its root.
struct CompletedResult {
  std::string id;
  std::vector<GraphQLError> errors;

  std::string ToJson() const;
};

struct IncrementalDeferResult {
  // An object value with the fragment's fields.
  Value data;
  std::string id;
  // The location of `data` below the pending path of `id`, if not directly
  // there.
  std::vector<PathKey> sub_path;
  std::vector<GraphQLError> errors;

  std::string ToJson() const;
};

struct IncrementalStreamResult {
  // Items appended to the streamed list.
  std::vector<Value> items;
  std::string id;
  std::vector<GraphQLError> errors;

  std::string ToJson() const;
};

using IncrementalResult =
    std::variant<IncrementalDeferResult, IncrementalStreamResult>;

// The first payload of an incremental response.
struct InitialIncrementalExecutionResult {
  Value data;
  std::vector<GraphQLError> errors;
  std::vector<PendingResult> pending;
  bool has_next = true;
  Value extensions;

  std::string ToJson() const;
};

// Every later payload. `has_next` is false on the last one.
struct SubsequentIncrementalExecutionResult {
  bool has_next = false;
  std::vector<PendingResult> pending;
  std::vector<IncrementalResult> incremental;
  std::vector<CompletedResult> completed;
  Value extensions;

  std::string ToJson() const;
};

// The payloads following the initial one.
class SubsequentResultStream {
 public:
  // nullopt once the stream is exhausted.
  using NextResult =
      absl::StatusOr<std::optional<SubsequentIncrementalExecutionResult>>;

  virtual ~SubsequentResultStream() = default;

  // The next payload. Must not be called again before the previous future is
  // ready.
  virtual gqlengine_base::Future<NextResult> Next() = 0;

  // Stops the stream early and closes the source iterators of unfinished
  // streams.
  virtual gqlengine_base::Future<absl::Status> Return() = 0;
};

struct IncrementalExecutionResults {
  InitialIncrementalExecutionResult initial_result;
  std::shared_ptr<SubsequentResultStream> subsequent_results;
};

// A single response, or an incremental one if @defer or @stream produced
// work to deliver later.
using ExecutionOutcome =
    std::variant<ExecutionResult, IncrementalExecutionResults>;

// Sorts `errors` by location, path and message.
void SortErrors(std::vector<GraphQLError>& errors);

}  // namespace gqlengine

#endif  // GQLENGINE_PUBLIC_EXECUTION_RESULT_H_
