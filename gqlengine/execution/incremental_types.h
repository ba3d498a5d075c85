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


#ifndef GQLENGINE_EXECUTION_INCREMENTAL_TYPES_H_
#define GQLENGINE_EXECUTION_INCREMENTAL_TYPES_H_

// Bookkeeping for @defer and @stream. Execution produces incremental data
// records, each with a future result; the incremental graph and publisher
// turn those results into subsequent payloads.

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"
#include "gqlengine/base/future.h"
#include "gqlengine/public/async_iterator.h"
#include "gqlengine/public/response_path.h"
#include "gqlengine/public/value.h"

namespace gqlengine {

// One @defer application at one place in the response. Announced to the
// client as pending once its parent fragment has been delivered.
class DeferredFragmentRecord {
 public:
  DeferredFragmentRecord(ResponsePath::Ptr path,
                         std::optional<std::string> label,
                         std::shared_ptr<DeferredFragmentRecord> parent)
      : path_(std::move(path)),
        label_(std::move(label)),
        parent_(std::move(parent)) {}
  DeferredFragmentRecord(const DeferredFragmentRecord&) = delete;
  DeferredFragmentRecord& operator=(const DeferredFragmentRecord&) = delete;

  const ResponsePath::Ptr& path() const { return path_; }
  const std::optional<std::string>& label() const { return label_; }
  const std::shared_ptr<DeferredFragmentRecord>& parent() const {
    return parent_;
  }

  // Assigned by the publisher when announced. Empty before.
  const std::string& id() const { return id_; }
  void set_id(std::string id) { id_ = std::move(id); }

 private:
  const ResponsePath::Ptr path_;
  const std::optional<std::string> label_;
  const std::shared_ptr<DeferredFragmentRecord> parent_;
  std::string id_;
};

using DeferredFragmentRecordPtr = std::shared_ptr<DeferredFragmentRecord>;

// One streamed list field. A stream over an iterator that supports early
// return is cancellable: closing the response closes the iterator.
class StreamRecord {
 public:
  StreamRecord(ResponsePath::Ptr path, std::optional<std::string> label,
               std::shared_ptr<AsyncIterator> iterator = nullptr)
      : path_(std::move(path)),
        label_(std::move(label)),
        iterator_(std::move(iterator)) {}
  StreamRecord(const StreamRecord&) = delete;
  StreamRecord& operator=(const StreamRecord&) = delete;

  const ResponsePath::Ptr& path() const { return path_; }
  const std::optional<std::string>& label() const { return label_; }

  bool cancellable() const {
    return iterator_ != nullptr && iterator_->has_return();
  }
  // REQUIRES: cancellable().
  gqlengine_base::Future<absl::Status> EarlyReturn() const {
    return iterator_->Return();
  }

  const std::string& id() const { return id_; }
  void set_id(std::string id) { id_ = std::move(id); }

 private:
  const ResponsePath::Ptr path_;
  const std::optional<std::string> label_;
  const std::shared_ptr<AsyncIterator> iterator_;
  std::string id_;
};

using StreamRecordPtr = std::shared_ptr<StreamRecord>;

struct IncrementalDataRecord;
using IncrementalDataRecordPtr = std::shared_ptr<IncrementalDataRecord>;

struct DeferredGroupedFieldSetResult {
  // The record that produced this result. Only used as an identity.
  const IncrementalDataRecord* record = nullptr;
  std::vector<DeferredFragmentRecordPtr> deferred_fragment_records;
  std::vector<PathKey> path;
  // Absent if an error propagated past the grouped field set. Such a result
  // cannot be reconciled and abandons its fragments.
  std::optional<Value> data;
  std::vector<absl::Status> errors;
  std::vector<IncrementalDataRecordPtr> incremental_data_records;

  bool reconcilable() const { return data.has_value(); }
};

struct StreamItemsResult {
  StreamRecordPtr stream_record;
  // Absent when the stream is exhausted or failed.
  std::optional<Value> item;
  // With `item`, errors of nullable positions in it. Without, the errors
  // that ended the stream.
  std::vector<absl::Status> errors;
  // The records for the next item and for deferred work inside this one.
  std::vector<IncrementalDataRecordPtr> incremental_data_records;
};

using IncrementalDataRecordResult =
    std::variant<DeferredGroupedFieldSetResult, StreamItemsResult>;

// A unit of work whose result is delivered after the initial payload: a
// deferred grouped field set or one item of a stream.
struct IncrementalDataRecord {
  // For a deferred grouped field set, the fragments that deliver it.
  std::vector<DeferredFragmentRecordPtr> deferred_fragment_records;
  // For stream items, the stream.
  StreamRecordPtr stream_record;
  gqlengine_base::Future<IncrementalDataRecordResult> result;

  bool is_deferred_grouped_field_set() const {
    return stream_record == nullptr;
  }
};

// The cancellable streams of a request that are still running.
class CancellableStreams {
 public:
  void Add(StreamRecordPtr stream) ABSL_LOCKS_EXCLUDED(mu_);
  void Remove(const StreamRecordPtr& stream) ABSL_LOCKS_EXCLUDED(mu_);
  // Removes and returns every stream.
  std::vector<StreamRecordPtr> TakeAll() ABSL_LOCKS_EXCLUDED(mu_);

 private:
  absl::Mutex mu_;
  absl::flat_hash_set<StreamRecordPtr> streams_ ABSL_GUARDED_BY(mu_);
};

}  // namespace gqlengine

#endif  // GQLENGINE_EXECUTION_INCREMENTAL_TYPES_H_
