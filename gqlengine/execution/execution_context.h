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


#ifndef GQLENGINE_EXECUTION_EXECUTION_CONTEXT_H_
#define GQLENGINE_EXECUTION_EXECUTION_CONTEXT_H_

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "gqlengine/base/executor.h"
#include "gqlengine/base/future.h"
#include "gqlengine/execution/build_field_plan.h"
#include "gqlengine/execution/collect_fields.h"
#include "gqlengine/execution/incremental_types.h"
#include "gqlengine/language/ast.h"
#include "gqlengine/public/async_iterator.h"
#include "gqlengine/public/execute_options.h"
#include "gqlengine/public/execution_result.h"
#include "gqlengine/public/middleware.h"
#include "gqlengine/public/resolve_info.h"
#include "gqlengine/public/response_path.h"
#include "gqlengine/public/schema.h"
#include "gqlengine/public/type.h"
#include "gqlengine/public/value.h"

namespace gqlengine {

// A completed value and the incremental data records discovered while
// completing it.
struct GraphQLWrappedResult {
  Value value;
  std::vector<IncrementalDataRecordPtr> incremental_data_records;
};

// A non-OK status is an error that is still propagating towards a nullable
// ancestor.
using WrappedResultOr = absl::StatusOr<GraphQLWrappedResult>;
using WrappedResultFuture = gqlengine_base::Future<WrappedResultOr>;

// The scope in which field errors are recorded: the initial response, one
// deferred grouped field set, or one stream item. Fields completed inside a
// deferred grouped field set also see the defer usages that deliver it.
class IncrementalContext {
 public:
  IncrementalContext() = default;
  explicit IncrementalContext(DeferUsageSet defer_usage_set)
      : defer_usage_set_(std::move(defer_usage_set)) {}
  IncrementalContext(const IncrementalContext&) = delete;
  IncrementalContext& operator=(const IncrementalContext&) = delete;

  const DeferUsageSet& defer_usage_set() const { return defer_usage_set_; }

  void AddError(absl::Status error) ABSL_LOCKS_EXCLUDED(mu_);
  std::vector<absl::Status> TakeErrors() ABSL_LOCKS_EXCLUDED(mu_);

 private:
  const DeferUsageSet defer_usage_set_;
  absl::Mutex mu_;
  std::vector<absl::Status> errors_ ABSL_GUARDED_BY(mu_);
};

// The deferred fragment created for each defer usage at the current place in
// the response.
using DeferMap =
    absl::flat_hash_map<const DeferUsage*, DeferredFragmentRecordPtr>;
using DeferMapPtr = std::shared_ptr<const DeferMap>;

// Executes one operation of a document: the evaluator.
//
// The context is shared by every task of the execution; work posted to the
// executor holds a reference to it. Results are futures that become ready on
// whichever thread completes the last resolver they depend on.
//
// The schema and the document must outlive the execution, including the
// subsequent results of an incremental response.
class ExecutionContext
    : public std::enable_shared_from_this<ExecutionContext> {
 public:
  // Selects the operation and coerces the variable values. Returns null and
  // fills `errors` if the request cannot be executed.
  static std::shared_ptr<ExecutionContext> Create(
      const Schema& schema, const DocumentNode& document,
      const ExecuteOptions& options, std::vector<absl::Status>* errors);

  ExecutionContext(const ExecutionContext&) = delete;
  ExecutionContext& operator=(const ExecutionContext&) = delete;

  const OperationDefinitionNode& operation() const { return *operation_; }

  // Executes the operation. Errors that prevent execution of the root
  // selection set yield null data.
  gqlengine_base::Future<ExecutionOutcome> ExecuteOperation();

  // Resolves the event stream of a subscription operation's root field. A
  // non-OK result is a located error for the response.
  gqlengine_base::Future<absl::StatusOr<std::shared_ptr<AsyncIterator>>>
  CreateSourceEventStream();

  // A context for executing the operation once per subscription event, with
  // `event` as the root value.
  std::shared_ptr<ExecutionContext> ForEvent(Value event) const;

  // Used for fields without a resolver: the property named after the field,
  // invoked with the arguments if it is a function.
  static absl::StatusOr<Value> DefaultFieldResolver(const Value& source,
                                                    const Value& args,
                                                    const ResolveInfo& info);

  // Used for abstract types without a resolve_type function: the
  // `__typename` property, otherwise the first possible type whose
  // is_type_of accepts the value.
  static absl::StatusOr<Value> DefaultTypeResolver(const Value& value,
                                                   const ResolveInfo& info,
                                                   const Type* abstract_type);

 private:
  struct SubfieldPlan {
    // Keeps the key of the memo entry alive.
    FieldGroupPtr field_group;
    FieldPlan plan;
    std::vector<DeferUsagePtr> new_defer_usages;
  };

  struct StreamUsage {
    int initial_count = 0;
    std::optional<std::string> label;
    // The list field's group without defer usages.
    FieldGroupPtr field_group;
  };

  // The root mutation fields still to execute and the results so far. Only
  // one field is in flight at a time.
  struct SerialExecution {
    const ObjectType* parent_type = nullptr;
    Value source;
    std::vector<GroupedFieldSet::Entry> entries;
    std::shared_ptr<IncrementalContext> context;
    DeferMapPtr defer_map;
    ObjectFields fields;
    std::vector<IncrementalDataRecordPtr> records;
  };

  // The items of an iterator-backed list pulled so far.
  struct AsyncListCompletion {
    const Type* item_type = nullptr;
    FieldGroupPtr field_group;
    std::shared_ptr<const ResolveInfo> info;
    ResponsePath::Ptr path;
    std::shared_ptr<const StreamUsage> stream_usage;
    std::shared_ptr<IncrementalContext> context;
    DeferMapPtr defer_map;
    std::vector<WrappedResultFuture> items;
    std::vector<IncrementalDataRecordPtr> stream_records;
  };

  // The source of a streamed list: the remaining items of `items`, or the
  // values still to come from `iterator`.
  struct StreamCursor {
    StreamRecordPtr stream;
    std::shared_ptr<const StreamUsage> stream_usage;
    std::shared_ptr<const ResolveInfo> info;
    const Type* item_type = nullptr;
    Value items;
    std::shared_ptr<AsyncIterator> iterator;
  };
  using StreamCursorPtr = std::shared_ptr<const StreamCursor>;

  explicit ExecutionContext(const Schema& schema);

  void Post(std::function<void()> task);

  WrappedResultFuture ExecuteRootGroupedFieldSet(
      const ObjectType* root_type, const CollectedFields& collected,
      const std::shared_ptr<IncrementalContext>& context);

  WrappedResultFuture ExecuteFields(
      const ObjectType* parent_type, const Value& source,
      const ResponsePath::Ptr& path, const GroupedFieldSet& grouped_field_set,
      const std::shared_ptr<IncrementalContext>& context,
      const DeferMapPtr& defer_map);

  // Root mutation fields: each field completes before the next one starts.
  WrappedResultFuture ExecuteFieldsSerially(
      const ObjectType* parent_type, const Value& source,
      const GroupedFieldSet& grouped_field_set,
      const std::shared_ptr<IncrementalContext>& context,
      const DeferMapPtr& defer_map);

  WrappedResultFuture ExecuteNextSerialField(
      const std::shared_ptr<SerialExecution>& serial, size_t index);

  WrappedResultFuture ExecuteField(
      const ObjectType* parent_type, const FieldDefinition* field,
      const Value& source, const FieldGroupPtr& field_group,
      const ResponsePath::Ptr& path,
      const std::shared_ptr<IncrementalContext>& context,
      const DeferMapPtr& defer_map);

  std::shared_ptr<const ResolveInfo> BuildResolveInfo(
      const FieldDefinition* field, const FieldGroup& field_group,
      const ObjectType* parent_type, const ResponsePath::Ptr& path) const;

  // Records an error of a nullable position and completes it with null. For a
  // non-null position the error keeps propagating.
  static WrappedResultOr HandleFieldError(absl::Status error,
                                          const Type* return_type,
                                          const FieldGroup& field_group,
                                          const ResponsePath* path,
                                          IncrementalContext* context);

  WrappedResultFuture CompleteValue(
      const Type* return_type, const FieldGroupPtr& field_group,
      const std::shared_ptr<const ResolveInfo>& info,
      const ResponsePath::Ptr& path, const Value& result,
      const std::shared_ptr<IncrementalContext>& context,
      const DeferMapPtr& defer_map);

  WrappedResultFuture CompleteListValue(
      const ListType* return_type, const FieldGroupPtr& field_group,
      const std::shared_ptr<const ResolveInfo>& info,
      const ResponsePath::Ptr& path, const Value& result,
      const std::shared_ptr<IncrementalContext>& context,
      const DeferMapPtr& defer_map);

  WrappedResultFuture CompleteAsyncIteratorValue(
      const Type* item_type, const FieldGroupPtr& field_group,
      const std::shared_ptr<const ResolveInfo>& info,
      const ResponsePath::Ptr& path,
      const std::shared_ptr<AsyncIterator>& iterator,
      std::shared_ptr<const StreamUsage> stream_usage,
      const std::shared_ptr<IncrementalContext>& context,
      const DeferMapPtr& defer_map);

  // Pulls items from `iterator` until it ends or the rest of the list is
  // streamed. A non-OK result is a located iterator error.
  gqlengine_base::Future<absl::Status> PullAsyncListItems(
      const std::shared_ptr<AsyncListCompletion>& list,
      const std::shared_ptr<AsyncIterator>& iterator);

  // Consumes ready values of `iterator` starting at `index` in a loop and
  // returns at the first pending one, which resumes from its callback. Sets
  // `done` once the list is complete.
  void ContinueAsyncListItems(
      const std::shared_ptr<AsyncListCompletion>& list,
      const std::shared_ptr<AsyncIterator>& iterator, size_t index,
      const gqlengine_base::Promise<absl::Status>& done);

  // Records the pulled value at `index`. Returns false, with `done` set, if
  // the list ends here.
  bool AddAsyncListItem(const std::shared_ptr<AsyncListCompletion>& list,
                        size_t index, const AsyncIterator::NextResult& next,
                        const gqlengine_base::Promise<absl::Status>& done);

  // Completes one list item, recording its error if the item type is
  // nullable.
  WrappedResultFuture CompleteListItemValue(
      const Type* item_type, const FieldGroupPtr& field_group,
      const std::shared_ptr<const ResolveInfo>& info,
      const ResponsePath::Ptr& item_path, const Value& item,
      const std::shared_ptr<IncrementalContext>& context,
      const DeferMapPtr& defer_map);

  absl::StatusOr<Value> CompleteLeafValue(const Type* return_type,
                                          const Value& result) const;

  WrappedResultFuture CompleteAbstractValue(
      const NamedType* return_type, const FieldGroupPtr& field_group,
      const std::shared_ptr<const ResolveInfo>& info,
      const ResponsePath::Ptr& path, const Value& result,
      const std::shared_ptr<IncrementalContext>& context,
      const DeferMapPtr& defer_map);

  absl::StatusOr<const ObjectType*> EnsureValidRuntimeType(
      const Value& runtime_type_name, const NamedType* return_type,
      const ResolveInfo& info, const Value& result) const;

  WrappedResultFuture CompleteObjectValue(
      const ObjectType* return_type, const FieldGroupPtr& field_group,
      const std::shared_ptr<const ResolveInfo>& info,
      const ResponsePath::Ptr& path, const Value& result,
      const std::shared_ptr<IncrementalContext>& context,
      const DeferMapPtr& defer_map);

  WrappedResultFuture CollectAndExecuteSubfields(
      const ObjectType* return_type, const FieldGroupPtr& field_group,
      const ResponsePath::Ptr& path, const Value& result,
      const std::shared_ptr<IncrementalContext>& context,
      const DeferMapPtr& defer_map);

  // Memoized per (type, field group). A field group is always executed with
  // the same parent defer usages, so they need not be part of the key.
  absl::StatusOr<std::shared_ptr<const SubfieldPlan>> BuildSubfieldPlan(
      const ObjectType* return_type, const FieldGroupPtr& field_group,
      const DeferUsageSet& parent_defer_usages) ABSL_LOCKS_EXCLUDED(mu_);

  // Creates a deferred fragment for each new usage at `path`. Returns
  // `defer_map` itself if there are none.
  static DeferMapPtr AddNewDeferredFragments(
      const std::vector<DeferUsagePtr>& new_defer_usages,
      const DeferMapPtr& defer_map, const ResponsePath::Ptr& path);

  std::vector<IncrementalDataRecordPtr> ExecuteDeferredGroupedFieldSets(
      const ObjectType* parent_type, const Value& source,
      const ResponsePath::Ptr& path,
      const std::vector<NewGroupedFieldSet>& new_grouped_field_sets,
      const DeferMapPtr& defer_map);

  gqlengine_base::Future<IncrementalDataRecordResult>
  ExecuteDeferredGroupedFieldSet(
      const IncrementalDataRecord* record,
      const std::vector<DeferredFragmentRecordPtr>& fragments,
      const ObjectType* parent_type,
      const Value& source, const ResponsePath::Ptr& path,
      const GroupedFieldSet& grouped_field_set,
      const std::shared_ptr<IncrementalContext>& context,
      const DeferMapPtr& defer_map);

  // Null if the list is not streamed at `path`.
  absl::StatusOr<std::shared_ptr<const StreamUsage>> GetStreamUsage(
      const FieldGroup& field_group, const ResponsePath::Ptr& path) const;

  // The record for the item of `cursor` at `index`. Its completion is
  // posted; later items are delivered by the same task.
  IncrementalDataRecordPtr BuildStreamItemRecord(const StreamCursorPtr& cursor,
                                                 size_t index);

  // Fulfills `promise` with the item at `index`, then the records that follow
  // it, while items are ready. A pending item resumes from its callback.
  void RunStreamItems(const StreamCursorPtr& cursor, size_t index,
                      gqlengine_base::Promise<IncrementalDataRecordResult>
                          promise);

  // The completed item at `index`, or a result without an item at the end
  // of the stream or on an iterator error.
  gqlengine_base::Future<StreamItemsResult> NextStreamItem(
      const StreamCursorPtr& cursor, size_t index);

  // Sets `promise` to `result`. If it carries an item, the record of the
  // next item is appended to it and its promise returned.
  static std::optional<gqlengine_base::Promise<IncrementalDataRecordResult>>
  DeliverStreamItem(
      const StreamCursorPtr& cursor, const StreamItemsResult& result,
      const gqlengine_base::Promise<IncrementalDataRecordResult>& promise);

  gqlengine_base::Future<StreamItemsResult> CompleteStreamItem(
      const StreamRecordPtr& stream, const ResponsePath::Ptr& item_path,
      const Value& item, const std::shared_ptr<const StreamUsage>& stream_usage,
      const std::shared_ptr<const ResolveInfo>& info, const Type* item_type);

  ExecutionOutcome BuildDataResponse(
      const WrappedResultOr& result,
      const std::shared_ptr<IncrementalContext>& context) const;

  const Schema& schema_;
  const OperationDefinitionNode* operation_ = nullptr;
  FragmentMap fragments_;
  VariableValues variable_values_;
  Value root_value_;
  Value context_value_;
  FieldResolver field_resolver_;
  TypeResolver type_resolver_;
  FieldResolver subscribe_field_resolver_;
  // Null without middleware.
  std::shared_ptr<MiddlewareManager> middleware_;
  gqlengine_base::Executor* executor_ = nullptr;
  const std::shared_ptr<CancellableStreams> cancellable_streams_;

  absl::Mutex mu_;
  absl::flat_hash_map<std::pair<const ObjectType*, const FieldGroup*>,
                      std::shared_ptr<const SubfieldPlan>>
      subfield_plans_ ABSL_GUARDED_BY(mu_);
};

}  // namespace gqlengine

#endif  // GQLENGINE_EXECUTION_EXECUTION_CONTEXT_H_
