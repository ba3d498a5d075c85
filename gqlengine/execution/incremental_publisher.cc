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


#include "gqlengine/execution/incremental_publisher.h"

#include <algorithm>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "absl/strings/str_cat.h"
#include "gqlengine/base/logging.h"

namespace gqlengine {

namespace {

using MaybePayload = std::optional<SubsequentIncrementalExecutionResult>;

std::vector<GraphQLError> ToGraphQLErrors(
    const std::vector<absl::Status>& statuses) {
  std::vector<GraphQLError> errors;
  errors.reserve(statuses.size());
  for (const absl::Status& status : statuses) {
    errors.push_back(GraphQLError::FromStatus(status));
  }
  return errors;
}

int PathDepth(const ResponsePath::Ptr& path) {
  return path == nullptr ? 0 : path->depth();
}

}  // namespace

IncrementalPublisher::IncrementalPublisher(
    std::shared_ptr<CancellableStreams> cancellable_streams)
    : graph_(IncrementalGraph::Create()),
      cancellable_streams_(std::move(cancellable_streams)) {}

IncrementalExecutionResults IncrementalPublisher::BuildResponse(
    Value data, std::vector<GraphQLError> errors,
    const std::vector<IncrementalDataRecordPtr>& records,
    std::shared_ptr<CancellableStreams> cancellable_streams) {
  std::shared_ptr<IncrementalPublisher> publisher(
      new IncrementalPublisher(std::move(cancellable_streams)));
  publisher->graph_->AddIncrementalDataRecords(records);

  IncrementalExecutionResults results;
  results.initial_result.data = std::move(data);
  results.initial_result.errors = std::move(errors);
  results.initial_result.pending =
      publisher->ToPendingResults(publisher->graph_->GetNewPending());
  results.initial_result.has_next = true;
  results.subsequent_results = std::move(publisher);
  return results;
}

gqlengine_base::Future<SubsequentResultStream::NextResult>
IncrementalPublisher::Next() {
  {
    absl::MutexLock lock(&mu_);
    if (done_) {
      return gqlengine_base::MakeReadyFuture(NextResult(MaybePayload()));
    }
  }
  return Drain(std::make_shared<SubsequentIncrementalExecutionResult>());
}

gqlengine_base::Future<absl::Status> IncrementalPublisher::Return() {
  {
    absl::MutexLock lock(&mu_);
    done_ = true;
  }
  graph_->Stop();
  return ReturnStreamIterators();
}

gqlengine_base::Future<SubsequentResultStream::NextResult>
IncrementalPublisher::Drain(
    std::shared_ptr<SubsequentIncrementalExecutionResult> payload) {
  std::shared_ptr<IncrementalPublisher> self = shared_from_this();
  return graph_->NextCompletedBatch().Then(
      [self, payload](const std::optional<IncrementalGraph::Batch>& batch)
          -> gqlengine_base::Future<NextResult> {
        if (!batch.has_value()) {
          return gqlengine_base::MakeReadyFuture(NextResult(MaybePayload()));
        }
        for (const IncrementalDataRecordResult& result : *batch) {
          self->HandleCompletedData(result, payload.get());
        }
        if (payload->incremental.empty() && payload->completed.empty()) {
          return self->Drain(payload);
        }
        payload->has_next = self->graph_->HasNext();
        if (!payload->has_next) {
          absl::MutexLock lock(&self->mu_);
          self->done_ = true;
        }
        return gqlengine_base::MakeReadyFuture(
            NextResult(MaybePayload(std::move(*payload))));
      });
}

void IncrementalPublisher::HandleCompletedData(
    const IncrementalDataRecordResult& result,
    SubsequentIncrementalExecutionResult* payload) {
  if (const auto* deferred =
          std::get_if<DeferredGroupedFieldSetResult>(&result)) {
    HandleDeferredGroupedFieldSet(*deferred, payload);
  } else {
    HandleStreamItems(std::get<StreamItemsResult>(result), payload);
  }
  std::vector<PendingResult> pending = ToPendingResults(graph_->GetNewPending());
  payload->pending.insert(payload->pending.end(),
                          std::make_move_iterator(pending.begin()),
                          std::make_move_iterator(pending.end()));
}

void IncrementalPublisher::HandleDeferredGroupedFieldSet(
    const DeferredGroupedFieldSetResult& result,
    SubsequentIncrementalExecutionResult* payload) {
  if (!result.reconcilable()) {
    const std::vector<GraphQLError> errors = ToGraphQLErrors(result.errors);
    for (const DeferredFragmentRecordPtr& fragment :
         result.deferred_fragment_records) {
      // Several grouped field sets of one fragment may fail.
      if (!graph_->RemoveDeferredFragment(fragment.get())) continue;
      GQLENGINE_VLOG(2) << "Deferred fragment " << fragment->id()
                        << " abandoned";
      payload->completed.push_back(CompletedResult{fragment->id(), errors});
    }
    return;
  }

  auto shared_result =
      std::make_shared<const DeferredGroupedFieldSetResult>(result);
  graph_->AddCompletedReconcilableDeferredGroupedFieldSet(shared_result);
  graph_->AddIncrementalDataRecords(result.incremental_data_records);

  for (const DeferredFragmentRecordPtr& fragment :
       result.deferred_fragment_records) {
    auto reconcilable_results =
        graph_->CompleteDeferredFragment(fragment.get());
    if (!reconcilable_results.has_value()) continue;
    for (const auto& reconcilable : *reconcilable_results) {
      // Deliver under the deepest pending fragment that contains the data.
      std::string best_id = fragment->id();
      int max_depth = PathDepth(fragment->path());
      for (const DeferredFragmentRecordPtr& other :
           reconcilable->deferred_fragment_records) {
        if (other == fragment || other->id().empty()) continue;
        const int depth = PathDepth(other->path());
        if (depth > max_depth) {
          max_depth = depth;
          best_id = other->id();
        }
      }
      IncrementalDeferResult entry;
      entry.data = *reconcilable->data;
      entry.id = std::move(best_id);
      entry.sub_path.assign(
          reconcilable->path.begin() +
              std::min<size_t>(max_depth, reconcilable->path.size()),
          reconcilable->path.end());
      entry.errors = ToGraphQLErrors(reconcilable->errors);
      payload->incremental.push_back(std::move(entry));
    }
    GQLENGINE_VLOG(2) << "Deferred fragment " << fragment->id()
                      << " completed";
    payload->completed.push_back(CompletedResult{fragment->id(), {}});
  }
}

void IncrementalPublisher::HandleStreamItems(
    const StreamItemsResult& result,
    SubsequentIncrementalExecutionResult* payload) {
  const StreamRecordPtr& stream = result.stream_record;
  if (result.item.has_value()) {
    IncrementalStreamResult entry;
    entry.items.push_back(*result.item);
    entry.id = stream->id();
    entry.errors = ToGraphQLErrors(result.errors);
    payload->incremental.push_back(std::move(entry));
    graph_->AddIncrementalDataRecords(result.incremental_data_records);
    return;
  }

  graph_->RemoveStream(stream.get());
  payload->completed.push_back(
      CompletedResult{stream->id(), ToGraphQLErrors(result.errors)});
  GQLENGINE_VLOG(2) << "Stream " << stream->id()
                    << (result.errors.empty() ? " completed" : " failed");
  if (!stream->cancellable()) return;
  cancellable_streams_->Remove(stream);
  if (!result.errors.empty()) {
    stream->EarlyReturn().OnReady([](const absl::Status& status) {
      GQLENGINE_LOG_IF(WARNING, !status.ok())
          << "Closing a failed stream: " << status;
    });
  }
}

std::vector<PendingResult> IncrementalPublisher::ToPendingResults(
    std::vector<SubsequentResultRecord> records) {
  std::vector<PendingResult> pending;
  pending.reserve(records.size());
  for (SubsequentResultRecord& record : records) {
    std::string id = absl::StrCat(next_id_++);
    PendingResult entry;
    entry.id = id;
    if (auto* fragment = std::get_if<DeferredFragmentRecordPtr>(&record)) {
      (*fragment)->set_id(std::move(id));
      entry.path = ResponsePath::AsList((*fragment)->path().get());
      entry.label = (*fragment)->label();
    } else {
      const StreamRecordPtr& stream = std::get<StreamRecordPtr>(record);
      stream->set_id(std::move(id));
      entry.path = ResponsePath::AsList(stream->path().get());
      entry.label = stream->label();
    }
    GQLENGINE_VLOG(2) << "Pending " << entry.id << " at "
                      << PathKeysToString(entry.path);
    pending.push_back(std::move(entry));
  }
  return pending;
}

gqlengine_base::Future<absl::Status>
IncrementalPublisher::ReturnStreamIterators() {
  std::vector<gqlengine_base::Future<absl::Status>> returns;
  for (const StreamRecordPtr& stream : cancellable_streams_->TakeAll()) {
    returns.push_back(stream->EarlyReturn());
  }
  return gqlengine_base::CollectAll(std::move(returns))
      .Then([](const std::vector<absl::Status>& statuses) {
        for (const absl::Status& status : statuses) {
          GQLENGINE_LOG_IF(WARNING, !status.ok())
              << "Closing a cancelled stream: " << status;
        }
        return absl::OkStatus();
      });
}

}  // namespace gqlengine
