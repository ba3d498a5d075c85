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


#include "gqlengine/execution/incremental_graph.h"

#include <algorithm>
#include <deque>
#include <memory>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

#include "gqlengine/base/logging.h"

namespace gqlengine {

std::shared_ptr<IncrementalGraph> IncrementalGraph::Create() {
  return std::shared_ptr<IncrementalGraph>(new IncrementalGraph());
}

void IncrementalGraph::AddIncrementalDataRecords(
    const std::vector<IncrementalDataRecordPtr>& records) {
  absl::MutexLock lock(&mu_);
  for (const IncrementalDataRecordPtr& record : records) {
    if (!record->is_deferred_grouped_field_set()) {
      const StreamRecordPtr& stream = record->stream_record;
      const bool queued = std::any_of(
          new_pending_.begin(), new_pending_.end(), [&stream](const auto& e) {
            const StreamRecordPtr* s = std::get_if<StreamRecordPtr>(&e);
            return s != nullptr && *s == stream;
          });
      if (!pending_.contains(stream.get()) && !queued) {
        new_pending_.push_back(stream);
      }
      AddNewRecord(record);
      continue;
    }
    for (const DeferredFragmentRecordPtr& fragment :
         record->deferred_fragment_records) {
      DeferredFragmentNode* node = AddDeferredFragmentNode(fragment);
      if (pending_.contains(node)) AddNewRecord(record);
      node->pending_records.push_back(record);
    }
  }
}

void IncrementalGraph::AddCompletedReconcilableDeferredGroupedFieldSet(
    const std::shared_ptr<const DeferredGroupedFieldSetResult>& result) {
  absl::MutexLock lock(&mu_);
  for (const DeferredFragmentRecordPtr& fragment :
       result->deferred_fragment_records) {
    auto it = fragment_nodes_.find(fragment.get());
    if (it == fragment_nodes_.end()) continue;
    DeferredFragmentNode* node = it->second.get();
    auto& records = node->pending_records;
    records.erase(std::remove_if(records.begin(), records.end(),
                                 [&result](const IncrementalDataRecordPtr& r) {
                                   return r.get() == result->record;
                                 }),
                  records.end());
    node->reconcilable_results.push_back(result);
  }
}

std::vector<SubsequentResultRecord> IncrementalGraph::GetNewPending() {
  std::vector<SubsequentResultRecord> new_pending;
  std::vector<IncrementalDataRecordPtr> to_watch;
  {
    absl::MutexLock lock(&mu_);
    std::deque<std::variant<DeferredFragmentNode*, StreamRecordPtr>> queue(
        new_pending_.begin(), new_pending_.end());
    new_pending_.clear();
    while (!queue.empty()) {
      auto entry = std::move(queue.front());
      queue.pop_front();
      if (StreamRecordPtr* stream = std::get_if<StreamRecordPtr>(&entry)) {
        pending_.insert(stream->get());
        new_pending.push_back(std::move(*stream));
        continue;
      }
      DeferredFragmentNode* node = std::get<DeferredFragmentNode*>(entry);
      if (!node->pending_records.empty()) {
        for (const IncrementalDataRecordPtr& record : node->pending_records) {
          AddNewRecord(record);
        }
        pending_.insert(node);
        new_pending.push_back(node->record);
      } else {
        for (DeferredFragmentNode* child : node->children) {
          queue.push_back(child);
        }
      }
    }
    to_watch.swap(new_records_);
  }

  std::weak_ptr<IncrementalGraph> weak_self = weak_from_this();
  for (const IncrementalDataRecordPtr& record : to_watch) {
    record->result.OnReady(
        [weak_self](const IncrementalDataRecordResult& result) {
          if (std::shared_ptr<IncrementalGraph> self = weak_self.lock()) {
            self->Enqueue(result);
          }
        });
  }
  return new_pending;
}

gqlengine_base::Future<std::optional<IncrementalGraph::Batch>>
IncrementalGraph::NextCompletedBatch() {
  absl::MutexLock lock(&mu_);
  if (stopped_) return gqlengine_base::MakeReadyFuture(std::optional<Batch>());
  if (!completed_queue_.empty()) {
    Batch batch(std::make_move_iterator(completed_queue_.begin()),
                std::make_move_iterator(completed_queue_.end()));
    completed_queue_.clear();
    return gqlengine_base::MakeReadyFuture(std::optional<Batch>(std::move(batch)));
  }
  GQLENGINE_DCHECK(!waiter_.has_value()) << "Concurrent NextCompletedBatch()";
  waiter_.emplace();
  return waiter_->future();
}

bool IncrementalGraph::HasNext() const {
  absl::MutexLock lock(&mu_);
  return !pending_.empty();
}

std::optional<std::vector<std::shared_ptr<const DeferredGroupedFieldSetResult>>>
IncrementalGraph::CompleteDeferredFragment(
    const DeferredFragmentRecord* fragment) {
  absl::MutexLock lock(&mu_);
  auto it = fragment_nodes_.find(fragment);
  if (it == fragment_nodes_.end()) return std::nullopt;
  DeferredFragmentNode* node = it->second.get();
  if (node->completed || !node->pending_records.empty()) return std::nullopt;

  std::vector<std::shared_ptr<const DeferredGroupedFieldSetResult>> results =
      node->reconcilable_results;
  for (const auto& result : results) {
    for (const DeferredFragmentRecordPtr& other :
         result->deferred_fragment_records) {
      auto other_it = fragment_nodes_.find(other.get());
      if (other_it == fragment_nodes_.end()) continue;
      auto& other_results = other_it->second->reconcilable_results;
      other_results.erase(
          std::remove(other_results.begin(), other_results.end(), result),
          other_results.end());
    }
  }
  pending_.erase(node);
  node->completed = true;
  for (DeferredFragmentNode* child : node->children) {
    new_pending_.push_back(child);
  }
  return results;
}

bool IncrementalGraph::RemoveDeferredFragment(
    const DeferredFragmentRecord* fragment) {
  absl::MutexLock lock(&mu_);
  auto it = fragment_nodes_.find(fragment);
  if (it == fragment_nodes_.end() || it->second->completed) return false;
  RemoveDeferredFragmentLocked(fragment);
  return true;
}

void IncrementalGraph::RemoveDeferredFragmentLocked(
    const DeferredFragmentRecord* fragment) {
  auto it = fragment_nodes_.find(fragment);
  if (it == fragment_nodes_.end()) return;
  std::unique_ptr<DeferredFragmentNode> node = std::move(it->second);
  fragment_nodes_.erase(it);
  pending_.erase(node.get());
  if (fragment->parent() != nullptr) {
    auto parent_it = fragment_nodes_.find(fragment->parent().get());
    if (parent_it != fragment_nodes_.end()) {
      auto& siblings = parent_it->second->children;
      siblings.erase(std::remove(siblings.begin(), siblings.end(), node.get()),
                     siblings.end());
    }
  }
  new_pending_.erase(
      std::remove_if(new_pending_.begin(), new_pending_.end(),
                     [&node](const auto& entry) {
                       DeferredFragmentNode* const* n =
                           std::get_if<DeferredFragmentNode*>(&entry);
                       return n != nullptr && *n == node.get();
                     }),
      new_pending_.end());
  for (DeferredFragmentNode* child : node->children) {
    RemoveDeferredFragmentLocked(child->record.get());
  }
}

void IncrementalGraph::RemoveStream(const StreamRecord* stream) {
  absl::MutexLock lock(&mu_);
  pending_.erase(stream);
}

void IncrementalGraph::Stop() {
  std::optional<gqlengine_base::Promise<std::optional<Batch>>> waiter;
  {
    absl::MutexLock lock(&mu_);
    stopped_ = true;
    waiter.swap(waiter_);
    completed_queue_.clear();
  }
  if (waiter.has_value()) waiter->Set(std::nullopt);
}

IncrementalGraph::DeferredFragmentNode*
IncrementalGraph::AddDeferredFragmentNode(
    const DeferredFragmentRecordPtr& record) {
  auto it = fragment_nodes_.find(record.get());
  if (it != fragment_nodes_.end()) return it->second.get();

  auto owned = std::make_unique<DeferredFragmentNode>();
  owned->record = record;
  DeferredFragmentNode* node = owned.get();
  fragment_nodes_.emplace(record.get(), std::move(owned));
  if (record->parent() == nullptr) {
    new_pending_.push_back(node);
    return node;
  }
  DeferredFragmentNode* parent = AddDeferredFragmentNode(record->parent());
  if (parent->completed) {
    new_pending_.push_back(node);
  } else {
    parent->children.push_back(node);
  }
  return node;
}

void IncrementalGraph::AddNewRecord(const IncrementalDataRecordPtr& record) {
  if (!watched_.insert(record.get()).second) return;
  new_records_.push_back(record);
}

void IncrementalGraph::Enqueue(const IncrementalDataRecordResult& result) {
  std::optional<gqlengine_base::Promise<std::optional<Batch>>> waiter;
  Batch batch;
  {
    absl::MutexLock lock(&mu_);
    if (stopped_) return;
    if (!waiter_.has_value()) {
      completed_queue_.push_back(result);
      return;
    }
    waiter.swap(waiter_);
    batch.push_back(result);
  }
  waiter->Set(std::optional<Batch>(std::move(batch)));
}

}  // namespace gqlengine
