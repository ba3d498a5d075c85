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


#ifndef GQLENGINE_EXECUTION_INCREMENTAL_PUBLISHER_H_
#define GQLENGINE_EXECUTION_INCREMENTAL_PUBLISHER_H_

#include <memory>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"
#include "gqlengine/base/future.h"
#include "gqlengine/execution/incremental_graph.h"
#include "gqlengine/execution/incremental_types.h"
#include "gqlengine/public/execution_result.h"
#include "gqlengine/public/graphql_error.h"
#include "gqlengine/public/value.h"

namespace gqlengine {

// Turns the results of incremental data records into subsequent payloads.
//
// Each payload holds everything that completed since the previous one:
// fragments whose grouped field sets have all arrived, stream items, and the
// fragments and streams that became pending as a consequence. Ids are
// assigned sequentially from "0" as entries are announced.
class IncrementalPublisher
    : public SubsequentResultStream,
      public std::enable_shared_from_this<IncrementalPublisher> {
 public:
  // Announces the fragments and streams of `records`, which were discovered
  // while computing the initial result.
  static IncrementalExecutionResults BuildResponse(
      Value data, std::vector<GraphQLError> errors,
      const std::vector<IncrementalDataRecordPtr>& records,
      std::shared_ptr<CancellableStreams> cancellable_streams);

  IncrementalPublisher(const IncrementalPublisher&) = delete;
  IncrementalPublisher& operator=(const IncrementalPublisher&) = delete;

  gqlengine_base::Future<NextResult> Next() override ABSL_LOCKS_EXCLUDED(mu_);
  gqlengine_base::Future<absl::Status> Return() override
      ABSL_LOCKS_EXCLUDED(mu_);

 private:
  explicit IncrementalPublisher(
      std::shared_ptr<CancellableStreams> cancellable_streams);

  std::vector<PendingResult> ToPendingResults(
      std::vector<SubsequentResultRecord> records);

  void HandleCompletedData(const IncrementalDataRecordResult& result,
                           SubsequentIncrementalExecutionResult* payload);
  void HandleDeferredGroupedFieldSet(
      const DeferredGroupedFieldSetResult& result,
      SubsequentIncrementalExecutionResult* payload);
  void HandleStreamItems(const StreamItemsResult& result,
                         SubsequentIncrementalExecutionResult* payload);

  // Waits for completed results until `payload` has something to report.
  gqlengine_base::Future<NextResult> Drain(
      std::shared_ptr<SubsequentIncrementalExecutionResult> payload);

  gqlengine_base::Future<absl::Status> ReturnStreamIterators();

  const std::shared_ptr<IncrementalGraph> graph_;
  const std::shared_ptr<CancellableStreams> cancellable_streams_;
  // Only touched by the single Next() in flight.
  int next_id_ = 0;

  absl::Mutex mu_;
  bool done_ ABSL_GUARDED_BY(mu_) = false;
};

}  // namespace gqlengine

#endif  // GQLENGINE_EXECUTION_INCREMENTAL_PUBLISHER_H_
