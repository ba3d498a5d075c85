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


#ifndef GQLENGINE_EXECUTION_INCREMENTAL_GRAPH_H_
#define GQLENGINE_EXECUTION_INCREMENTAL_GRAPH_H_

#include <deque>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/synchronization/mutex.h"
#include "gqlengine/base/future.h"
#include "gqlengine/execution/incremental_types.h"

namespace gqlengine {

// A deferred fragment or a stream that is, or is about to be, pending.
using SubsequentResultRecord =
    std::variant<DeferredFragmentRecordPtr, StreamRecordPtr>;

// Tracks the deferred fragments and streams of one request and the results of
// their incremental data records.
//
// A fragment becomes pending once its parent has completed, unless it has no
// grouped field set of its own, in which case its children take its place.
// Only the records of pending fragments and streams are watched; their
// results are queued in completion order.
//
// Thread safe. Results arrive on whichever thread completes them.
class IncrementalGraph : public std::enable_shared_from_this<IncrementalGraph> {
 public:
  using Batch = std::vector<IncrementalDataRecordResult>;

  static std::shared_ptr<IncrementalGraph> Create();

  IncrementalGraph(const IncrementalGraph&) = delete;
  IncrementalGraph& operator=(const IncrementalGraph&) = delete;

  void AddIncrementalDataRecords(
      const std::vector<IncrementalDataRecordPtr>& records)
      ABSL_LOCKS_EXCLUDED(mu_);

  // Records that `result` arrived for each of its fragments.
  void AddCompletedReconcilableDeferredGroupedFieldSet(
      const std::shared_ptr<const DeferredGroupedFieldSetResult>& result)
      ABSL_LOCKS_EXCLUDED(mu_);

  // Returns the fragments and streams that became pending since the last
  // call, parents first, and starts watching their records.
  std::vector<SubsequentResultRecord> GetNewPending() ABSL_LOCKS_EXCLUDED(mu_);

  // The results completed so far, or the next ones to complete. nullopt once
  // the graph has been stopped.
  gqlengine_base::Future<std::optional<Batch>> NextCompletedBatch()
      ABSL_LOCKS_EXCLUDED(mu_);

  // Whether anything is still pending.
  bool HasNext() const ABSL_LOCKS_EXCLUDED(mu_);

  // If every grouped field set of `fragment` has arrived, removes it from
  // the pending set, makes its children eligible, and returns its results
  // that were not delivered with another fragment. Otherwise returns
  // nullopt.
  std::optional<std::vector<std::shared_ptr<const DeferredGroupedFieldSetResult>>>
  CompleteDeferredFragment(const DeferredFragmentRecord* fragment)
      ABSL_LOCKS_EXCLUDED(mu_);

  // Abandons `fragment` and its descendants. Returns false if it was already
  // completed or removed.
  bool RemoveDeferredFragment(const DeferredFragmentRecord* fragment)
      ABSL_LOCKS_EXCLUDED(mu_);

  void RemoveStream(const StreamRecord* stream) ABSL_LOCKS_EXCLUDED(mu_);

  // Resolves a waiting NextCompletedBatch() with nullopt and ignores later
  // results.
  void Stop() ABSL_LOCKS_EXCLUDED(mu_);

 private:
  struct DeferredFragmentNode {
    DeferredFragmentRecordPtr record;
    // Grouped field sets that have not arrived, in insertion order.
    std::vector<IncrementalDataRecordPtr> pending_records;
    std::vector<std::shared_ptr<const DeferredGroupedFieldSetResult>>
        reconcilable_results;
    std::vector<DeferredFragmentNode*> children;
    // Set once delivered. Children added later have no parent to wait for.
    bool completed = false;
  };

  // A pending entry is keyed by the fragment node or the stream record.
  using PendingKey = const void*;

  IncrementalGraph() = default;

  DeferredFragmentNode* AddDeferredFragmentNode(
      const DeferredFragmentRecordPtr& record)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
  void RemovePending(PendingKey key) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
  void RemoveDeferredFragmentLocked(const DeferredFragmentRecord* fragment)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

  void AddNewRecord(const IncrementalDataRecordPtr& record)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
  void Enqueue(const IncrementalDataRecordResult& result)
      ABSL_LOCKS_EXCLUDED(mu_);

  mutable absl::Mutex mu_;
  absl::flat_hash_set<PendingKey> pending_ ABSL_GUARDED_BY(mu_);
  absl::flat_hash_map<const DeferredFragmentRecord*,
                      std::unique_ptr<DeferredFragmentNode>>
      fragment_nodes_ ABSL_GUARDED_BY(mu_);
  // Fragment nodes and streams to consider in the next GetNewPending(), in
  // discovery order.
  std::vector<std::variant<DeferredFragmentNode*, StreamRecordPtr>>
      new_pending_ ABSL_GUARDED_BY(mu_);
  // Records of pending entries that are not watched yet.
  std::vector<IncrementalDataRecordPtr> new_records_ ABSL_GUARDED_BY(mu_);
  absl::flat_hash_set<const IncrementalDataRecord*> watched_
      ABSL_GUARDED_BY(mu_);
  std::deque<IncrementalDataRecordResult> completed_queue_
      ABSL_GUARDED_BY(mu_);
  std::optional<gqlengine_base::Promise<std::optional<Batch>>> waiter_
      ABSL_GUARDED_BY(mu_);
  bool stopped_ ABSL_GUARDED_BY(mu_) = false;
};

}  // namespace gqlengine

#endif  // GQLENGINE_EXECUTION_INCREMENTAL_GRAPH_H_
