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


#include "gqlengine/public/execute.h"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "gqlengine/base/logging.h"
#include "gqlengine/base/status_macros.h"
#include "gqlengine/common/errors.h"
#include "gqlengine/execution/execution_context.h"
#include "gqlengine/public/directives.h"
#include "gqlengine/public/graphql_error.h"

namespace gqlengine {

using gqlengine_base::Future;
using gqlengine_base::MakeReadyFuture;

namespace {

constexpr char kUnexpectedMultiplePayloads[] =
    "Executing this GraphQL operation would unexpectedly produce multiple "
    "payloads (due to @defer or @stream directive)";

ExecutionResult ErrorResult(Value data,
                            const std::vector<absl::Status>& errors) {
  ExecutionResult result;
  result.data = std::move(data);
  for (const absl::Status& error : errors) {
    result.errors.push_back(GraphQLError::FromStatus(error));
  }
  SortErrors(result.errors);
  return result;
}

// Validates the schema and prepares the operation. Returns null and fills
// `error_result` if the request cannot be executed.
absl::StatusOr<std::shared_ptr<ExecutionContext>> PrepareExecution(
    const Schema& schema, const DocumentNode& document,
    const ExecuteOptions& options, ExecutionResult* error_result) {
  GQLENGINE_RETURN_IF_ERROR(schema.Validate());
  std::vector<absl::Status> errors;
  std::shared_ptr<ExecutionContext> context =
      ExecutionContext::Create(schema, document, options, &errors);
  if (context == nullptr) {
    GQLENGINE_VLOG(1) << "Request not executed: " << errors.size()
                      << " errors";
    *error_result = ErrorResult(Value(), errors);
  }
  return context;
}

// The single result of an execution that must not be incremental. Closes the
// subsequent results of an incremental one.
ExecutionResult ToSingleResult(const ExecutionOutcome& outcome) {
  if (const auto* result = std::get_if<ExecutionResult>(&outcome)) {
    return *result;
  }
  const auto& incremental = std::get<IncrementalExecutionResults>(outcome);
  incremental.subsequent_results->Return().OnReady(
      [](const absl::Status& status) {
        GQLENGINE_LOG_IF(WARNING, !status.ok())
            << "Closing subsequent results failed: " << status;
      });
  const std::vector<absl::Status> errors = {MakeMisuseError()
                                            << kUnexpectedMultiplePayloads};
  return ErrorResult(Value(), errors);
}

class EventResultStream : public SubscriptionResultStream {
 public:
  EventResultStream(std::shared_ptr<AsyncIterator> source,
                    std::shared_ptr<ExecutionContext> context)
      : source_(std::move(source)), context_(std::move(context)) {}

  Future<NextResult> Next() override {
    if (closed_) return MakeReadyFuture(NextResult(std::nullopt));
    std::shared_ptr<ExecutionContext> context = context_;
    return source_->Next().Then(
        [context](const AsyncIterator::NextResult& event)
            -> Future<NextResult> {
          if (!event.ok()) return MakeReadyFuture(NextResult(event.status()));
          if (!event->has_value()) {
            return MakeReadyFuture(NextResult(std::nullopt));
          }
          return context->ForEvent(**event)->ExecuteOperation().Then(
              [](const ExecutionOutcome& outcome) {
                return NextResult(ToSingleResult(outcome));
              });
        });
  }

  Future<absl::Status> Return() override {
    if (closed_.exchange(true)) return MakeReadyFuture(absl::OkStatus());
    GQLENGINE_VLOG(1) << "Closing subscription event stream";
    return source_->Return();
  }

 private:
  const std::shared_ptr<AsyncIterator> source_;
  const std::shared_ptr<ExecutionContext> context_;
  std::atomic<bool> closed_{false};
};

}  // namespace

absl::StatusOr<Future<ExecutionOutcome>> ExecuteIncrementally(
    const Schema& schema, const DocumentNode& document,
    const ExecuteOptions& options) {
  ExecutionResult error_result;
  GQLENGINE_ASSIGN_OR_RETURN(
      std::shared_ptr<ExecutionContext> context,
      PrepareExecution(schema, document, options, &error_result));
  if (context == nullptr) {
    return MakeReadyFuture(ExecutionOutcome(std::move(error_result)));
  }
  return context->ExecuteOperation();
}

absl::StatusOr<Future<ExecutionResult>> Execute(
    const Schema& schema, const DocumentNode& document,
    const ExecuteOptions& options) {
  if (schema.GetDirective(directives::DeferDirective()->name()) != nullptr ||
      schema.GetDirective(directives::StreamDirective()->name()) != nullptr) {
    return MakeMisuseError()
           << "The provided schema unexpectedly contains experimental "
              "directives (@defer or @stream). These directives may only be "
              "utilized if experimental execution features are explicitly "
              "enabled.";
  }
  GQLENGINE_ASSIGN_OR_RETURN(Future<ExecutionOutcome> outcome,
                             ExecuteIncrementally(schema, document, options));
  return outcome.Then(&ToSingleResult);
}

absl::StatusOr<ExecutionResult> ExecuteSync(const Schema& schema,
                                            const DocumentNode& document,
                                            const ExecuteOptions& options) {
  GQLENGINE_ASSIGN_OR_RETURN(Future<ExecutionResult> result,
                             Execute(schema, document, options));
  if (!result.is_ready()) {
    return MakeMisuseError()
           << "GraphQL execution failed to complete synchronously.";
  }
  return result.value();
}

absl::StatusOr<Future<SourceEventStreamOutcome>> CreateSourceEventStream(
    const Schema& schema, const DocumentNode& document,
    const ExecuteOptions& options) {
  ExecutionResult error_result;
  GQLENGINE_ASSIGN_OR_RETURN(
      std::shared_ptr<ExecutionContext> context,
      PrepareExecution(schema, document, options, &error_result));
  if (context == nullptr) {
    return MakeReadyFuture(SourceEventStreamOutcome(std::move(error_result)));
  }
  return context->CreateSourceEventStream().Then(
      [](const absl::StatusOr<std::shared_ptr<AsyncIterator>>& stream)
          -> SourceEventStreamOutcome {
        if (!stream.ok()) return ErrorResult(Value::Null(), {stream.status()});
        return *stream;
      });
}

absl::StatusOr<Future<SubscriptionOutcome>> Subscribe(
    const Schema& schema, const DocumentNode& document,
    const ExecuteOptions& options) {
  ExecutionResult error_result;
  GQLENGINE_ASSIGN_OR_RETURN(
      std::shared_ptr<ExecutionContext> context,
      PrepareExecution(schema, document, options, &error_result));
  if (context == nullptr) {
    return MakeReadyFuture(SubscriptionOutcome(std::move(error_result)));
  }
  return context->CreateSourceEventStream().Then(
      [context](const absl::StatusOr<std::shared_ptr<AsyncIterator>>& stream)
          -> SubscriptionOutcome {
        if (!stream.ok()) return ErrorResult(Value::Null(), {stream.status()});
        GQLENGINE_VLOG(1) << "Subscribed to source event stream";
        return std::shared_ptr<SubscriptionResultStream>(
            std::make_shared<EventResultStream>(*stream, context));
      });
}

}  // namespace gqlengine
