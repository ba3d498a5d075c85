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


#ifndef GQLENGINE_PUBLIC_EXECUTE_H_
#define GQLENGINE_PUBLIC_EXECUTE_H_

// Entry points for executing a parsed GraphQL document against a schema.
//
// Example:
//   GQLENGINE_ASSIGN_OR_RETURN(std::unique_ptr<DocumentNode> document,
//                              Parse(Source("{ hero { name } }")));
//   ExecuteOptions options;
//   options.root_value = root;
//   GQLENGINE_ASSIGN_OR_RETURN(ExecutionResult result,
//                              ExecuteSync(*schema, *document, options));
//   std::cout << result.ToJson();
//
// Errors of the request itself (unknown operation, invalid variables) and
// field errors are reported inside the result. A non-OK status from these
// functions means the caller misused the API, e.g. by passing an invalid
// schema.
//
// The document is not validated: it is the caller's responsibility to run
// validation before execution if the document is untrusted.

#include <memory>
#include <optional>
#include <variant>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "gqlengine/base/future.h"
#include "gqlengine/language/ast.h"
#include "gqlengine/public/async_iterator.h"
#include "gqlengine/public/execute_options.h"
#include "gqlengine/public/execution_result.h"
#include "gqlengine/public/schema.h"

namespace gqlengine {

// Executes the selected operation. The future becomes ready once every
// resolver has completed.
//
// Fails with kFailedPrecondition if the schema is invalid or installs @defer
// or @stream; use ExecuteIncrementally() for such schemas.
absl::StatusOr<gqlengine_base::Future<ExecutionResult>> Execute(
    const Schema& schema, const DocumentNode& document,
    const ExecuteOptions& options = {});

// Like Execute(), but honors @defer and @stream. If the response has parts to
// deliver later, the outcome is an IncrementalExecutionResults whose
// subsequent results must be consumed or closed with Return().
absl::StatusOr<gqlengine_base::Future<ExecutionOutcome>> ExecuteIncrementally(
    const Schema& schema, const DocumentNode& document,
    const ExecuteOptions& options = {});

// Executes a request whose resolvers all complete synchronously. Fails with
// kFailedPrecondition if any work is still pending when the root selection
// set returns.
absl::StatusOr<ExecutionResult> ExecuteSync(const Schema& schema,
                                            const DocumentNode& document,
                                            const ExecuteOptions& options = {});

// Resolves the root field of a subscription operation to its source event
// stream. Errors are returned as an ExecutionResult.
using SourceEventStreamOutcome =
    std::variant<ExecutionResult, std::shared_ptr<AsyncIterator>>;

absl::StatusOr<gqlengine_base::Future<SourceEventStreamOutcome>>
CreateSourceEventStream(const Schema& schema, const DocumentNode& document,
                        const ExecuteOptions& options = {});

// The response stream of a subscription: one ExecutionResult per source
// event, computed by executing the operation with the event as root value.
class SubscriptionResultStream {
 public:
  // nullopt once the source stream is exhausted or closed. A non-OK status is
  // an error of the source stream.
  using NextResult = absl::StatusOr<std::optional<ExecutionResult>>;

  virtual ~SubscriptionResultStream() = default;

  // The result for the next event. Must not be called again before the
  // previous future is ready.
  virtual gqlengine_base::Future<NextResult> Next() = 0;

  // Closes the source event stream.
  virtual gqlengine_base::Future<absl::Status> Return() = 0;
};

using SubscriptionOutcome =
    std::variant<ExecutionResult, std::shared_ptr<SubscriptionResultStream>>;

// Creates the source event stream and maps every event to a response.
// Errors creating the stream are returned as an ExecutionResult.
absl::StatusOr<gqlengine_base::Future<SubscriptionOutcome>> Subscribe(
    const Schema& schema, const DocumentNode& document,
    const ExecuteOptions& options = {});

}  // namespace gqlengine

#endif  // GQLENGINE_PUBLIC_EXECUTE_H_
