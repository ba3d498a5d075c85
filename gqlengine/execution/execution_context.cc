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


#include "gqlengine/execution/execution_context.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "gqlengine/base/logging.h"
#include "gqlengine/base/ret_check.h"
#include "gqlengine/base/status_macros.h"
#include "gqlengine/common/errors.h"
#include "gqlengine/execution/incremental_publisher.h"
#include "gqlengine/execution/values.h"
#include "gqlengine/public/directives.h"
#include "gqlengine/public/graphql_error.h"

namespace gqlengine {

using gqlengine_base::CollectAll;
using gqlengine_base::Future;
using gqlengine_base::MakeReadyFuture;
using gqlengine_base::Promise;

namespace {

WrappedResultFuture ReadyResult(WrappedResultOr result) {
  return MakeReadyFuture(std::move(result));
}

WrappedResultFuture ReadyValue(Value value) {
  return ReadyResult(GraphQLWrappedResult{std::move(value), {}});
}

void AppendRecords(const std::vector<IncrementalDataRecordPtr>& records,
                   std::vector<IncrementalDataRecordPtr>* out) {
  out->insert(out->end(), records.begin(), records.end());
}

std::vector<const Node*> AsNodes(const FieldGroup& field_group) {
  std::vector<const Node*> nodes;
  nodes.reserve(field_group.fields.size());
  for (const FieldDetails& details : field_group.fields) {
    nodes.push_back(details.node);
  }
  return nodes;
}

// Appends `records` to a result once it is available.
WrappedResultFuture WithIncrementalDataRecords(
    const WrappedResultFuture& result,
    std::vector<IncrementalDataRecordPtr> records) {
  if (records.empty()) return result;
  return result.Then(
      [records](const WrappedResultOr& completed) -> WrappedResultOr {
        if (!completed.ok()) return completed;
        GraphQLWrappedResult out = *completed;
        AppendRecords(records, &out.incremental_data_records);
        return out;
      });
}

// Assembles completed list items, failing with the first item error that
// propagates. `stream_records` follow the records of the items.
WrappedResultOr CombineListItems(
    const std::vector<WrappedResultOr>& items,
    const std::vector<IncrementalDataRecordPtr>& stream_records) {
  GraphQLWrappedResult out;
  std::vector<Value> values;
  values.reserve(items.size());
  for (const WrappedResultOr& item : items) {
    if (!item.ok()) return item.status();
    values.push_back(item->value);
    AppendRecords(item->incremental_data_records,
                  &out.incremental_data_records);
  }
  AppendRecords(stream_records, &out.incremental_data_records);
  out.value = Value::List(std::move(values));
  return out;
}

std::string FieldCoordinate(const ResolveInfo& info) {
  return absl::StrCat(info.parent_type->name(), ".", info.field_name);
}

}  // namespace

void IncrementalContext::AddError(absl::Status error) {
  absl::MutexLock lock(&mu_);
  errors_.push_back(std::move(error));
}

std::vector<absl::Status> IncrementalContext::TakeErrors() {
  absl::MutexLock lock(&mu_);
  std::vector<absl::Status> errors;
  errors.swap(errors_);
  return errors;
}

ExecutionContext::ExecutionContext(const Schema& schema)
    : schema_(schema),
      cancellable_streams_(std::make_shared<CancellableStreams>()) {}

std::shared_ptr<ExecutionContext> ExecutionContext::Create(
    const Schema& schema, const DocumentNode& document,
    const ExecuteOptions& options, std::vector<absl::Status>* errors) {
  const OperationDefinitionNode* operation = nullptr;
  FragmentMap fragments;
  for (const DefinitionNode* definition : document.definitions()) {
    switch (definition->node_kind()) {
      case NodeKind::kOperationDefinition: {
        const auto* candidate =
            definition->GetAsOrDie<OperationDefinitionNode>();
        if (options.operation_name.empty()) {
          if (operation != nullptr) {
            errors->push_back(MakeGraphQLError()
                              << "Must provide operation name if query "
                                 "contains multiple operations.");
            return nullptr;
          }
          operation = candidate;
        } else if (candidate->name() == options.operation_name) {
          operation = candidate;
        }
        break;
      }
      case NodeKind::kFragmentDefinition: {
        const auto* fragment =
            definition->GetAsOrDie<FragmentDefinitionNode>();
        fragments[fragment->name()] = fragment;
        break;
      }
      default:
        break;
    }
  }
  if (operation == nullptr) {
    if (!options.operation_name.empty()) {
      errors->push_back(MakeGraphQLError() << "Unknown operation named '"
                                           << options.operation_name << "'.");
    } else {
      errors->push_back(MakeGraphQLError() << "Must provide an operation.");
    }
    return nullptr;
  }

  const int max_errors =
      options.max_variable_errors >= 0
          ? options.max_variable_errors
          : absl::GetFlag(FLAGS_gqlengine_max_variable_errors);
  VariableCoercionResult variables =
      GetVariableValues(schema, operation->variable_definitions(),
                        options.variable_values, max_errors);
  if (!variables.ok()) {
    *errors = std::move(variables.errors);
    return nullptr;
  }

  std::shared_ptr<ExecutionContext> context(new ExecutionContext(schema));
  context->operation_ = operation;
  context->fragments_ = std::move(fragments);
  context->variable_values_ = std::move(variables.coerced);
  context->root_value_ = options.root_value;
  context->context_value_ = options.context_value;
  context->field_resolver_ = options.field_resolver != nullptr
                                 ? options.field_resolver
                                 : FieldResolver(&DefaultFieldResolver);
  context->type_resolver_ = options.type_resolver != nullptr
                                ? options.type_resolver
                                : TypeResolver(&DefaultTypeResolver);
  context->subscribe_field_resolver_ =
      options.subscribe_field_resolver != nullptr
          ? options.subscribe_field_resolver
          : context->field_resolver_;
  if (!options.middleware.empty()) {
    context->middleware_ =
        std::make_shared<MiddlewareManager>(options.middleware);
  }
  context->executor_ = options.executor;
  return context;
}

std::shared_ptr<ExecutionContext> ExecutionContext::ForEvent(
    Value event) const {
  std::shared_ptr<ExecutionContext> context(new ExecutionContext(schema_));
  context->operation_ = operation_;
  context->fragments_ = fragments_;
  context->variable_values_ = variable_values_;
  context->root_value_ = std::move(event);
  context->context_value_ = context_value_;
  context->field_resolver_ = field_resolver_;
  context->type_resolver_ = type_resolver_;
  context->subscribe_field_resolver_ = subscribe_field_resolver_;
  context->middleware_ = middleware_;
  context->executor_ = executor_;
  return context;
}

absl::StatusOr<Value> ExecutionContext::DefaultFieldResolver(
    const Value& source, const Value& args, const ResolveInfo& info) {
  Value property;
  if (source.is_object()) {
    const Value* field = source.FindField(info.field_name);
    if (field != nullptr) property = *field;
  } else if (source.is_host()) {
    property = source.host_object()->GetField(info.field_name);
  }
  if (property.is_function()) return property.function()(args, info);
  return property;
}

absl::StatusOr<Value> ExecutionContext::DefaultTypeResolver(
    const Value& value, const ResolveInfo& info, const Type* abstract_type) {
  if (value.is_object()) {
    const Value* type_name = value.FindField("__typename");
    if (type_name != nullptr && type_name->is_string()) return *type_name;
  } else if (value.is_host()) {
    std::string type_name = value.host_object()->TypeName();
    if (!type_name.empty()) return Value::String(std::move(type_name));
  }
  for (const ObjectType* type :
       info.schema->GetPossibleTypes(abstract_type->AsNamed())) {
    if (type->is_type_of() == nullptr) continue;
    GQLENGINE_ASSIGN_OR_RETURN(const bool matches,
                               type->is_type_of()(value, info));
    if (matches) return Value::String(type->name());
  }
  return Value::Null();
}

void ExecutionContext::Post(std::function<void()> task) {
  if (executor_ == nullptr) {
    task();
    return;
  }
  executor_->Post(std::move(task));
}

Future<ExecutionOutcome> ExecutionContext::ExecuteOperation() {
  const OperationType operation_type = operation_->operation();
  GQLENGINE_VLOG(1) << "Executing " << OperationTypeName(operation_type)
                    << " operation '" << operation_->name() << "'";
  auto context = std::make_shared<IncrementalContext>();

  const ObjectType* root_type = schema_.GetRootType(operation_type);
  if (root_type == nullptr) {
    const Node* const nodes[] = {operation_};
    absl::Status error = MakeGraphQLError()
                         << "Schema is not configured to execute "
                         << OperationTypeName(operation_type) << " operation.";
    return MakeReadyFuture(
        BuildDataResponse(WithNodeLocations(std::move(error), nodes), context));
  }
  absl::StatusOr<CollectedFields> collected = CollectFields(
      schema_, fragments_, variable_values_, root_type, *operation_);
  if (!collected.ok()) {
    return MakeReadyFuture(BuildDataResponse(collected.status(), context));
  }
  GQLENGINE_VLOG(1) << collected->fields.size() << " root fields, "
                    << collected->new_defer_usages.size() << " deferred";

  std::shared_ptr<ExecutionContext> self = shared_from_this();
  return ExecuteRootGroupedFieldSet(root_type, *collected, context)
      .Then([self, context](const WrappedResultOr& result) {
        return self->BuildDataResponse(result, context);
      });
}

WrappedResultFuture ExecutionContext::ExecuteRootGroupedFieldSet(
    const ObjectType* root_type, const CollectedFields& collected,
    const std::shared_ptr<IncrementalContext>& context) {
  FieldPlan plan = BuildFieldPlan(collected.fields, context->defer_usage_set());
  DeferMapPtr defer_map = AddNewDeferredFragments(
      collected.new_defer_usages, std::make_shared<const DeferMap>(),
      ResponsePath::Ptr());

  WrappedResultFuture data =
      operation_->operation() == OperationType::kMutation
          ? ExecuteFieldsSerially(root_type, root_value_,
                                  plan.grouped_field_set, context, defer_map)
          : ExecuteFields(root_type, root_value_, ResponsePath::Ptr(),
                          plan.grouped_field_set, context, defer_map);
  if (plan.new_grouped_field_sets.empty()) return data;
  return WithIncrementalDataRecords(
      data, ExecuteDeferredGroupedFieldSets(root_type, root_value_,
                                            ResponsePath::Ptr(),
                                            plan.new_grouped_field_sets,
                                            defer_map));
}

WrappedResultFuture ExecutionContext::ExecuteFields(
    const ObjectType* parent_type, const Value& source,
    const ResponsePath::Ptr& path, const GroupedFieldSet& grouped_field_set,
    const std::shared_ptr<IncrementalContext>& context,
    const DeferMapPtr& defer_map) {
  std::vector<std::string> response_keys;
  std::vector<WrappedResultFuture> fields;
  response_keys.reserve(grouped_field_set.size());
  fields.reserve(grouped_field_set.size());
  for (const auto& [response_key, field_group] : grouped_field_set) {
    const FieldDefinition* field =
        schema_.GetField(parent_type, field_group->first_node().name());
    if (field == nullptr) continue;
    response_keys.push_back(response_key);
    fields.push_back(ExecuteField(
        parent_type, field, source, field_group,
        ResponsePath::Add(path, response_key, parent_type->name()), context,
        defer_map));
  }
  return CollectAll(std::move(fields))
      .Then([response_keys](const std::vector<WrappedResultOr>& results)
                -> WrappedResultOr {
        GraphQLWrappedResult out;
        ObjectFields object;
        object.reserve(results.size());
        for (size_t i = 0; i < results.size(); ++i) {
          if (!results[i].ok()) return results[i].status();
          object.emplace_back(response_keys[i], results[i]->value);
          AppendRecords(results[i]->incremental_data_records,
                        &out.incremental_data_records);
        }
        out.value = Value::Object(std::move(object));
        return out;
      });
}

WrappedResultFuture ExecutionContext::ExecuteFieldsSerially(
    const ObjectType* parent_type, const Value& source,
    const GroupedFieldSet& grouped_field_set,
    const std::shared_ptr<IncrementalContext>& context,
    const DeferMapPtr& defer_map) {
  auto serial = std::make_shared<SerialExecution>();
  serial->parent_type = parent_type;
  serial->source = source;
  serial->entries.assign(grouped_field_set.begin(), grouped_field_set.end());
  serial->context = context;
  serial->defer_map = defer_map;
  return ExecuteNextSerialField(serial, 0);
}

WrappedResultFuture ExecutionContext::ExecuteNextSerialField(
    const std::shared_ptr<SerialExecution>& serial, size_t index) {
  const FieldDefinition* field = nullptr;
  for (; index < serial->entries.size(); ++index) {
    field = schema_.GetField(serial->parent_type,
                             serial->entries[index].second->first_node().name());
    if (field != nullptr) break;
  }
  if (index == serial->entries.size()) {
    GraphQLWrappedResult out;
    out.value = Value::Object(std::move(serial->fields));
    out.incremental_data_records = std::move(serial->records);
    return ReadyResult(std::move(out));
  }

  const auto& [response_key, field_group] = serial->entries[index];
  std::shared_ptr<ExecutionContext> self = shared_from_this();
  return ExecuteField(serial->parent_type, field, serial->source, field_group,
                      ResponsePath::Add(ResponsePath::Ptr(), response_key,
                                        serial->parent_type->name()),
                      serial->context, serial->defer_map)
      .Then([self, serial, index](const WrappedResultOr& result)
                -> WrappedResultFuture {
        if (!result.ok()) return ReadyResult(result.status());
        serial->fields.emplace_back(serial->entries[index].first,
                                    result->value);
        AppendRecords(result->incremental_data_records, &serial->records);
        return self->ExecuteNextSerialField(serial, index + 1);
      });
}

std::shared_ptr<const ResolveInfo> ExecutionContext::BuildResolveInfo(
    const FieldDefinition* field, const FieldGroup& field_group,
    const ObjectType* parent_type, const ResponsePath::Ptr& path) const {
  auto info = std::make_shared<ResolveInfo>();
  info->field_name = field->name;
  info->field_nodes = field_group.ToNodes();
  info->return_type = field->type;
  info->parent_type = parent_type;
  info->path = path;
  info->schema = &schema_;
  info->fragments = &fragments_;
  info->root_value = root_value_;
  info->operation = operation_;
  info->variable_values = &variable_values_;
  info->context_value = context_value_;
  return info;
}

WrappedResultFuture ExecutionContext::ExecuteField(
    const ObjectType* parent_type, const FieldDefinition* field,
    const Value& source, const FieldGroupPtr& field_group,
    const ResponsePath::Ptr& path,
    const std::shared_ptr<IncrementalContext>& context,
    const DeferMapPtr& defer_map) {
  const Type* return_type = field->type;
  std::shared_ptr<const ResolveInfo> info =
      BuildResolveInfo(field, *field_group, parent_type, path);
  GQLENGINE_VLOG(3) << "Resolving " << FieldCoordinate(*info) << " at "
                    << ResponsePath::ToString(path.get());

  FieldResolver resolver =
      field->resolve != nullptr ? field->resolve : field_resolver_;
  if (middleware_ != nullptr) {
    resolver = middleware_->GetFieldResolver(field, resolver);
  }

  const FieldNode& node = field_group->first_node();
  absl::StatusOr<Value> args = GetArgumentValues(
      field->arguments, node.arguments(), node, &variable_values_);
  if (!args.ok()) {
    return ReadyResult(HandleFieldError(args.status(), return_type,
                                        *field_group, path.get(),
                                        context.get()));
  }
  absl::StatusOr<Value> result = resolver(source, *args, *info);
  if (!result.ok()) {
    return ReadyResult(HandleFieldError(result.status(), return_type,
                                        *field_group, path.get(),
                                        context.get()));
  }
  return CompleteValue(return_type, field_group, info, path, *result, context,
                       defer_map)
      .Then([return_type, field_group, path,
             context](const WrappedResultOr& completed) -> WrappedResultOr {
        if (completed.ok()) return completed;
        return HandleFieldError(completed.status(), return_type, *field_group,
                                path.get(), context.get());
      });
}

WrappedResultOr ExecutionContext::HandleFieldError(
    absl::Status error, const Type* return_type, const FieldGroup& field_group,
    const ResponsePath* path, IncrementalContext* context) {
  absl::Status located =
      LocateError(std::move(error), field_group.ToNodes(), path);
  if (return_type->IsNonNull()) return located;
  GQLENGINE_VLOG(3) << "Field error at " << ResponsePath::ToString(path)
                    << ": " << located.message();
  context->AddError(std::move(located));
  return GraphQLWrappedResult{Value::Null(), {}};
}

WrappedResultFuture ExecutionContext::CompleteValue(
    const Type* return_type, const FieldGroupPtr& field_group,
    const std::shared_ptr<const ResolveInfo>& info,
    const ResponsePath::Ptr& path, const Value& result,
    const std::shared_ptr<IncrementalContext>& context,
    const DeferMapPtr& defer_map) {
  if (result.is_pending()) {
    std::shared_ptr<ExecutionContext> self = shared_from_this();
    return result.pending().Then(
        [self, return_type, field_group, info, path, context,
         defer_map](const absl::StatusOr<Value>& resolved)
            -> WrappedResultFuture {
          if (!resolved.ok()) return ReadyResult(resolved.status());
          return self->CompleteValue(return_type, field_group, info, path,
                                     *resolved, context, defer_map);
        });
  }

  if (return_type->IsNonNull()) {
    return CompleteValue(return_type->of_type(), field_group, info, path,
                         result, context, defer_map)
        .Then([info](const WrappedResultOr& completed) -> WrappedResultOr {
          if (!completed.ok() || !completed->value.is_null()) {
            return completed;
          }
          return absl::Status(MakeGraphQLError()
                              << "Cannot return null for non-nullable field "
                              << FieldCoordinate(*info) << ".");
        });
  }

  if (result.is_nullish()) return ReadyValue(Value::Null());

  if (const ListType* list_type = return_type->AsList()) {
    return CompleteListValue(list_type, field_group, info, path, result,
                             context, defer_map);
  }
  if (return_type->IsLeaf()) {
    absl::StatusOr<Value> leaf = CompleteLeafValue(return_type, result);
    if (!leaf.ok()) return ReadyResult(leaf.status());
    return ReadyValue(*std::move(leaf));
  }
  if (return_type->IsAbstract()) {
    return CompleteAbstractValue(return_type->AsNamed(), field_group, info,
                                 path, result, context, defer_map);
  }
  if (const ObjectType* object_type = return_type->AsObject()) {
    return CompleteObjectValue(object_type, field_group, info, path, result,
                               context, defer_map);
  }
  return ReadyResult(absl::Status(
      MakeGraphQLError() << "Cannot complete value of unexpected output type: '"
                         << return_type->ToString() << "'."));
}

WrappedResultFuture ExecutionContext::CompleteListValue(
    const ListType* return_type, const FieldGroupPtr& field_group,
    const std::shared_ptr<const ResolveInfo>& info,
    const ResponsePath::Ptr& path, const Value& result,
    const std::shared_ptr<IncrementalContext>& context,
    const DeferMapPtr& defer_map) {
  const Type* item_type = return_type->of_type();
  if (result.is_async_iterator()) {
    absl::StatusOr<std::shared_ptr<const StreamUsage>> stream_usage =
        GetStreamUsage(*field_group, path);
    if (!stream_usage.ok()) return ReadyResult(stream_usage.status());
    return CompleteAsyncIteratorValue(item_type, field_group, info, path,
                                      result.async_iterator(),
                                      *std::move(stream_usage), context,
                                      defer_map);
  }
  if (!result.is_list()) {
    return ReadyResult(absl::Status(
        MakeGraphQLError()
        << "Expected Iterable, but did not find one for field '"
        << FieldCoordinate(*info) << "'."));
  }
  absl::StatusOr<std::shared_ptr<const StreamUsage>> stream_usage =
      GetStreamUsage(*field_group, path);
  if (!stream_usage.ok()) return ReadyResult(stream_usage.status());

  const std::vector<Value>& items = result.list_value();
  std::vector<WrappedResultFuture> completed_items;
  std::vector<IncrementalDataRecordPtr> stream_records;
  for (size_t index = 0; index < items.size(); ++index) {
    if (*stream_usage != nullptr &&
        index >= static_cast<size_t>((*stream_usage)->initial_count)) {
      auto stream =
          std::make_shared<StreamRecord>(path, (*stream_usage)->label);
      GQLENGINE_VLOG(2) << "Streaming " << ResponsePath::ToString(path.get())
                        << " from index " << index;
      auto cursor = std::make_shared<StreamCursor>();
      cursor->stream = std::move(stream);
      cursor->stream_usage = *stream_usage;
      cursor->info = info;
      cursor->item_type = item_type;
      cursor->items = result;
      stream_records.push_back(BuildStreamItemRecord(cursor, index));
      break;
    }
    completed_items.push_back(CompleteListItemValue(
        item_type, field_group, info,
        ResponsePath::Add(path, static_cast<int>(index)), items[index],
        context, defer_map));
  }
  return CollectAll(std::move(completed_items))
      .Then([stream_records](const std::vector<WrappedResultOr>& results) {
        return CombineListItems(results, stream_records);
      });
}

WrappedResultFuture ExecutionContext::CompleteAsyncIteratorValue(
    const Type* item_type, const FieldGroupPtr& field_group,
    const std::shared_ptr<const ResolveInfo>& info,
    const ResponsePath::Ptr& path,
    const std::shared_ptr<AsyncIterator>& iterator,
    std::shared_ptr<const StreamUsage> stream_usage,
    const std::shared_ptr<IncrementalContext>& context,
    const DeferMapPtr& defer_map) {
  auto list = std::make_shared<AsyncListCompletion>();
  list->item_type = item_type;
  list->field_group = field_group;
  list->info = info;
  list->path = path;
  list->stream_usage = std::move(stream_usage);
  list->context = context;
  list->defer_map = defer_map;
  return PullAsyncListItems(list, iterator)
      .Then([list](const absl::Status& status) -> WrappedResultFuture {
        if (!status.ok()) return ReadyResult(status);
        return CollectAll(list->items)
            .Then([list](const std::vector<WrappedResultOr>& results) {
              return CombineListItems(results, list->stream_records);
            });
      });
}

Future<absl::Status> ExecutionContext::PullAsyncListItems(
    const std::shared_ptr<AsyncListCompletion>& list,
    const std::shared_ptr<AsyncIterator>& iterator) {
  Promise<absl::Status> done;
  ContinueAsyncListItems(list, iterator, 0, done);
  return done.future();
}

void ExecutionContext::ContinueAsyncListItems(
    const std::shared_ptr<AsyncListCompletion>& list,
    const std::shared_ptr<AsyncIterator>& iterator, size_t index,
    const Promise<absl::Status>& done) {
  while (true) {
    if (list->stream_usage != nullptr &&
        index >= static_cast<size_t>(list->stream_usage->initial_count)) {
      auto stream = std::make_shared<StreamRecord>(
          list->path, list->stream_usage->label, iterator);
      if (stream->cancellable()) cancellable_streams_->Add(stream);
      GQLENGINE_VLOG(2) << "Streaming "
                        << ResponsePath::ToString(list->path.get())
                        << " from index " << index << " of an iterator";
      auto cursor = std::make_shared<StreamCursor>();
      cursor->stream = std::move(stream);
      cursor->stream_usage = list->stream_usage;
      cursor->info = list->info;
      cursor->item_type = list->item_type;
      cursor->iterator = iterator;
      list->stream_records.push_back(BuildStreamItemRecord(cursor, index));
      done.Set(absl::OkStatus());
      return;
    }
    Future<AsyncIterator::NextResult> next = iterator->Next();
    if (!next.is_ready()) {
      std::shared_ptr<ExecutionContext> self = shared_from_this();
      next.OnReady([self, list, iterator, index,
                    done](const AsyncIterator::NextResult& result) {
        if (self->AddAsyncListItem(list, index, result, done)) {
          self->ContinueAsyncListItems(list, iterator, index + 1, done);
        }
      });
      return;
    }
    if (!AddAsyncListItem(list, index, next.value(), done)) return;
    ++index;
  }
}

bool ExecutionContext::AddAsyncListItem(
    const std::shared_ptr<AsyncListCompletion>& list, size_t index,
    const AsyncIterator::NextResult& next, const Promise<absl::Status>& done) {
  if (!next.ok()) {
    done.Set(LocateError(next.status(), list->field_group->ToNodes(),
                         list->path.get()));
    return false;
  }
  if (!next->has_value()) {
    done.Set(absl::OkStatus());
    return false;
  }
  list->items.push_back(CompleteListItemValue(
      list->item_type, list->field_group, list->info,
      ResponsePath::Add(list->path, static_cast<int>(index)), **next,
      list->context, list->defer_map));
  return true;
}

WrappedResultFuture ExecutionContext::CompleteListItemValue(
    const Type* item_type, const FieldGroupPtr& field_group,
    const std::shared_ptr<const ResolveInfo>& info,
    const ResponsePath::Ptr& item_path, const Value& item,
    const std::shared_ptr<IncrementalContext>& context,
    const DeferMapPtr& defer_map) {
  return CompleteValue(item_type, field_group, info, item_path, item, context,
                       defer_map)
      .Then([item_type, field_group, item_path,
             context](const WrappedResultOr& completed) -> WrappedResultOr {
        if (completed.ok()) return completed;
        return HandleFieldError(completed.status(), item_type, *field_group,
                                item_path.get(), context.get());
      });
}

absl::StatusOr<Value> ExecutionContext::CompleteLeafValue(
    const Type* return_type, const Value& result) const {
  absl::StatusOr<Value> serialized =
      return_type->IsScalar() ? return_type->AsScalar()->Serialize(result)
                              : return_type->AsEnum()->Serialize(result);
  GQLENGINE_RETURN_IF_ERROR(serialized.status());
  if (serialized->is_nullish()) {
    return MakeGraphQLError()
           << "Expected `" << return_type->ToString() << ".serialize("
           << result.DebugString()
           << ")` to return non-nullable value, returned: "
           << serialized->DebugString();
  }
  return serialized;
}

WrappedResultFuture ExecutionContext::CompleteAbstractValue(
    const NamedType* return_type, const FieldGroupPtr& field_group,
    const std::shared_ptr<const ResolveInfo>& info,
    const ResponsePath::Ptr& path, const Value& result,
    const std::shared_ptr<IncrementalContext>& context,
    const DeferMapPtr& defer_map) {
  TypeResolver resolve_type = type_resolver_;
  if (const InterfaceType* interface_type = return_type->AsInterface();
      interface_type != nullptr && interface_type->resolve_type() != nullptr) {
    resolve_type = interface_type->resolve_type();
  } else if (const UnionType* union_type = return_type->AsUnion();
             union_type != nullptr && union_type->resolve_type() != nullptr) {
    resolve_type = union_type->resolve_type();
  }
  absl::StatusOr<Value> runtime_type = resolve_type(result, *info, return_type);
  if (!runtime_type.ok()) return ReadyResult(runtime_type.status());

  std::shared_ptr<ExecutionContext> self = shared_from_this();
  auto complete = [self, return_type, field_group, info, path, result, context,
                   defer_map](const Value& type_name) -> WrappedResultFuture {
    absl::StatusOr<const ObjectType*> object_type =
        self->EnsureValidRuntimeType(type_name, return_type, *info, result);
    if (!object_type.ok()) return ReadyResult(object_type.status());
    return self->CompleteObjectValue(*object_type, field_group, info, path,
                                     result, context, defer_map);
  };
  if (runtime_type->is_pending()) {
    return runtime_type->pending().Then(
        [complete](const absl::StatusOr<Value>& type_name)
            -> WrappedResultFuture {
          if (!type_name.ok()) return ReadyResult(type_name.status());
          return complete(*type_name);
        });
  }
  return complete(*runtime_type);
}

absl::StatusOr<const ObjectType*> ExecutionContext::EnsureValidRuntimeType(
    const Value& runtime_type_name, const NamedType* return_type,
    const ResolveInfo& info, const Value& result) const {
  const std::string& abstract_name = return_type->name();
  if (runtime_type_name.is_nullish()) {
    return MakeGraphQLError()
           << "Abstract type '" << abstract_name
           << "' must resolve to an Object type at runtime for field '"
           << FieldCoordinate(info) << "'. Either the '" << abstract_name
           << "' type should provide a 'resolve_type' function or each "
              "possible type should provide an 'is_type_of' function.";
  }
  if (!runtime_type_name.is_string()) {
    return MakeGraphQLError()
           << "Abstract type '" << abstract_name
           << "' must resolve to an Object type at runtime for field '"
           << FieldCoordinate(info) << "' with value " << result.DebugString()
           << ", received '" << runtime_type_name.DebugString() << "'.";
  }
  const std::string& type_name = runtime_type_name.string_value();
  const NamedType* runtime_type = schema_.GetType(type_name);
  if (runtime_type == nullptr) {
    return MakeGraphQLError() << "Abstract type '" << abstract_name
                              << "' was resolved to a type '" << type_name
                              << "' that does not exist inside the schema.";
  }
  if (!runtime_type->IsObject()) {
    return MakeGraphQLError() << "Abstract type '" << abstract_name
                              << "' was resolved to a non-object type '"
                              << type_name << "'.";
  }
  if (!schema_.IsSubType(return_type, runtime_type)) {
    return MakeGraphQLError() << "Runtime Object type '" << type_name
                              << "' is not a possible type for '"
                              << abstract_name << "'.";
  }
  return runtime_type->AsObject();
}

WrappedResultFuture ExecutionContext::CompleteObjectValue(
    const ObjectType* return_type, const FieldGroupPtr& field_group,
    const std::shared_ptr<const ResolveInfo>& info,
    const ResponsePath::Ptr& path, const Value& result,
    const std::shared_ptr<IncrementalContext>& context,
    const DeferMapPtr& defer_map) {
  if (return_type->is_type_of() != nullptr) {
    absl::StatusOr<bool> matches = return_type->is_type_of()(result, *info);
    if (!matches.ok()) return ReadyResult(matches.status());
    if (!*matches) {
      return ReadyResult(absl::Status(
          MakeGraphQLError() << "Expected value of type '" << return_type->name()
                             << "' but got: " << result.DebugString() << "."));
    }
  }
  return CollectAndExecuteSubfields(return_type, field_group, path, result,
                                    context, defer_map);
}

WrappedResultFuture ExecutionContext::CollectAndExecuteSubfields(
    const ObjectType* return_type, const FieldGroupPtr& field_group,
    const ResponsePath::Ptr& path, const Value& result,
    const std::shared_ptr<IncrementalContext>& context,
    const DeferMapPtr& defer_map) {
  absl::StatusOr<std::shared_ptr<const SubfieldPlan>> subfield_plan =
      BuildSubfieldPlan(return_type, field_group, context->defer_usage_set());
  if (!subfield_plan.ok()) return ReadyResult(subfield_plan.status());
  const FieldPlan& plan = (*subfield_plan)->plan;

  DeferMapPtr new_defer_map = AddNewDeferredFragments(
      (*subfield_plan)->new_defer_usages, defer_map, path);
  WrappedResultFuture sub_fields =
      ExecuteFields(return_type, result, path, plan.grouped_field_set, context,
                    new_defer_map);
  if (plan.new_grouped_field_sets.empty()) return sub_fields;
  return WithIncrementalDataRecords(
      sub_fields,
      ExecuteDeferredGroupedFieldSets(return_type, result, path,
                                      plan.new_grouped_field_sets,
                                      new_defer_map));
}

absl::StatusOr<std::shared_ptr<const ExecutionContext::SubfieldPlan>>
ExecutionContext::BuildSubfieldPlan(const ObjectType* return_type,
                                    const FieldGroupPtr& field_group,
                                    const DeferUsageSet& parent_defer_usages) {
  const auto key = std::make_pair(return_type, field_group.get());
  {
    absl::MutexLock lock(&mu_);
    auto it = subfield_plans_.find(key);
    if (it != subfield_plans_.end()) return it->second;
  }
  GQLENGINE_ASSIGN_OR_RETURN(
      CollectedFields collected,
      CollectSubfields(schema_, fragments_, variable_values_, *operation_,
                       return_type, field_group->fields));
  auto plan = std::make_shared<SubfieldPlan>();
  plan->field_group = field_group;
  plan->plan = BuildFieldPlan(collected.fields, parent_defer_usages);
  plan->new_defer_usages = std::move(collected.new_defer_usages);

  // Concurrent completions of the same field group must share one plan, so
  // that they agree on the identity of its defer usages.
  absl::MutexLock lock(&mu_);
  return subfield_plans_.try_emplace(key, std::move(plan)).first->second;
}

DeferMapPtr ExecutionContext::AddNewDeferredFragments(
    const std::vector<DeferUsagePtr>& new_defer_usages,
    const DeferMapPtr& defer_map, const ResponsePath::Ptr& path) {
  if (new_defer_usages.empty()) return defer_map;
  auto new_defer_map = std::make_shared<DeferMap>(*defer_map);
  for (const DeferUsagePtr& usage : new_defer_usages) {
    DeferredFragmentRecordPtr parent;
    if (usage->parent() != nullptr) {
      auto it = new_defer_map->find(usage->parent().get());
      if (it != new_defer_map->end()) parent = it->second;
    }
    (*new_defer_map)[usage.get()] = std::make_shared<DeferredFragmentRecord>(
        path, usage->label(), std::move(parent));
  }
  return new_defer_map;
}

std::vector<IncrementalDataRecordPtr>
ExecutionContext::ExecuteDeferredGroupedFieldSets(
    const ObjectType* parent_type, const Value& source,
    const ResponsePath::Ptr& path,
    const std::vector<NewGroupedFieldSet>& new_grouped_field_sets,
    const DeferMapPtr& defer_map) {
  std::vector<IncrementalDataRecordPtr> records;
  records.reserve(new_grouped_field_sets.size());
  for (const NewGroupedFieldSet& new_set : new_grouped_field_sets) {
    auto record = std::make_shared<IncrementalDataRecord>();
    for (const DeferUsagePtr& usage : new_set.defer_usages) {
      auto it = defer_map->find(usage.get());
      if (it == defer_map->end()) {
        GQLENGINE_DCHECK(false) << "No deferred fragment for a defer usage";
        continue;
      }
      record->deferred_fragment_records.push_back(it->second);
    }
    Promise<IncrementalDataRecordResult> promise;
    record->result = promise.future();

    auto context = std::make_shared<IncrementalContext>(new_set.defer_usages);
    auto grouped_field_set =
        std::make_shared<const GroupedFieldSet>(new_set.grouped_field_set);
    std::shared_ptr<ExecutionContext> self = shared_from_this();
    auto execute = [self, record_id = record.get(),
                    fragments = record->deferred_fragment_records, parent_type,
                    source, path, grouped_field_set, context, defer_map,
                    promise]() {
      self->ExecuteDeferredGroupedFieldSet(record_id, fragments, parent_type,
                                           source, path, *grouped_field_set,
                                           context, defer_map)
          .OnReady([promise](const IncrementalDataRecordResult& result) {
            promise.Set(result);
          });
    };
    GQLENGINE_VLOG(2) << "Deferred grouped field set of "
                      << grouped_field_set->size() << " fields at '"
                      << ResponsePath::ToString(path.get()) << "'"
                      << (new_set.should_initiate_defer ? "" : ", executed now");
    if (new_set.should_initiate_defer) {
      Post(std::move(execute));
    } else {
      execute();
    }
    records.push_back(std::move(record));
  }
  return records;
}

Future<IncrementalDataRecordResult>
ExecutionContext::ExecuteDeferredGroupedFieldSet(
    const IncrementalDataRecord* record,
    const std::vector<DeferredFragmentRecordPtr>& fragments,
    const ObjectType* parent_type, const Value& source,
    const ResponsePath::Ptr& path, const GroupedFieldSet& grouped_field_set,
    const std::shared_ptr<IncrementalContext>& context,
    const DeferMapPtr& defer_map) {
  std::vector<PathKey> path_keys = ResponsePath::AsList(path.get());
  return ExecuteFields(parent_type, source, path, grouped_field_set, context,
                       defer_map)
      .Then([record, fragments, path_keys,
             context](const WrappedResultOr& result)
                -> IncrementalDataRecordResult {
        DeferredGroupedFieldSetResult out;
        out.record = record;
        out.deferred_fragment_records = fragments;
        out.path = path_keys;
        out.errors = context->TakeErrors();
        if (!result.ok()) {
          out.errors.push_back(result.status());
          return out;
        }
        out.data = result->value;
        out.incremental_data_records = result->incremental_data_records;
        return out;
      });
}

absl::StatusOr<std::shared_ptr<const ExecutionContext::StreamUsage>>
ExecutionContext::GetStreamUsage(const FieldGroup& field_group,
                                 const ResponsePath::Ptr& path) const {
  // Inner lists of a multidimensional list are not streamed.
  if (path != nullptr && path->is_index()) {
    return std::shared_ptr<const StreamUsage>();
  }
  const Directive* stream_directive =
      schema_.GetDirective(directives::StreamDirective()->name());
  if (stream_directive == nullptr) return std::shared_ptr<const StreamUsage>();

  GQLENGINE_ASSIGN_OR_RETURN(
      std::optional<Value> stream,
      GetDirectiveValues(*stream_directive, field_group.first_node(),
                         &variable_values_));
  if (!stream.has_value()) return std::shared_ptr<const StreamUsage>();
  const Value* if_value = stream->FindField("if");
  if (if_value != nullptr && if_value->is_bool() && !if_value->bool_value()) {
    return std::shared_ptr<const StreamUsage>();
  }

  const Value* initial_count = stream->FindField("initialCount");
  GQLENGINE_RET_CHECK(initial_count != nullptr && initial_count->is_int())
      << "initialCount must be a number";
  if (initial_count->int_value() < 0) {
    return MakeGraphQLError() << "initialCount must be a positive integer";
  }
  if (operation_->operation() == OperationType::kSubscription) {
    return MakeGraphQLError()
           << "`@stream` directive not supported on subscription operations. "
              "Disable `@stream` by setting the `if` argument to `false`.";
  }

  auto usage = std::make_shared<StreamUsage>();
  usage->initial_count = static_cast<int>(initial_count->int_value());
  const Value* label = stream->FindField("label");
  if (label != nullptr && label->is_string()) {
    usage->label = label->string_value();
  }
  auto streamed_group = std::make_shared<FieldGroup>();
  for (const FieldDetails& details : field_group.fields) {
    streamed_group->fields.push_back(FieldDetails{details.node, nullptr});
  }
  usage->field_group = std::move(streamed_group);
  return std::shared_ptr<const StreamUsage>(std::move(usage));
}

IncrementalDataRecordPtr ExecutionContext::BuildStreamItemRecord(
    const StreamCursorPtr& cursor, size_t index) {
  auto record = std::make_shared<IncrementalDataRecord>();
  record->stream_record = cursor->stream;
  Promise<IncrementalDataRecordResult> promise;
  record->result = promise.future();

  std::shared_ptr<ExecutionContext> self = shared_from_this();
  Post([self, cursor, index, promise] {
    self->RunStreamItems(cursor, index, promise);
  });
  return record;
}

void ExecutionContext::RunStreamItems(
    const StreamCursorPtr& cursor, size_t index,
    Promise<IncrementalDataRecordResult> promise) {
  while (true) {
    Future<StreamItemsResult> item = NextStreamItem(cursor, index);
    if (!item.is_ready()) {
      std::shared_ptr<ExecutionContext> self = shared_from_this();
      item.OnReady([self, cursor, index,
                    promise](const StreamItemsResult& result) {
        std::optional<Promise<IncrementalDataRecordResult>> next =
            DeliverStreamItem(cursor, result, promise);
        if (next.has_value()) {
          self->RunStreamItems(cursor, index + 1, *std::move(next));
        }
      });
      return;
    }
    std::optional<Promise<IncrementalDataRecordResult>> next =
        DeliverStreamItem(cursor, item.value(), promise);
    if (!next.has_value()) return;
    promise = *std::move(next);
    ++index;
  }
}

Future<StreamItemsResult> ExecutionContext::NextStreamItem(
    const StreamCursorPtr& cursor, size_t index) {
  ResponsePath::Ptr item_path =
      ResponsePath::Add(cursor->stream->path(), static_cast<int>(index));
  if (cursor->iterator == nullptr) {
    if (index >= cursor->items.list_value().size()) {
      StreamItemsResult end;
      end.stream_record = cursor->stream;
      return MakeReadyFuture(std::move(end));
    }
    return CompleteStreamItem(cursor->stream, item_path,
                              cursor->items.list_value()[index],
                              cursor->stream_usage, cursor->info,
                              cursor->item_type);
  }
  std::shared_ptr<ExecutionContext> self = shared_from_this();
  return cursor->iterator->Next().Then(
      [self, cursor, item_path](const AsyncIterator::NextResult& next)
          -> Future<StreamItemsResult> {
        StreamItemsResult out;
        out.stream_record = cursor->stream;
        if (!next.ok()) {
          out.errors.push_back(
              LocateError(next.status(),
                          cursor->stream_usage->field_group->ToNodes(),
                          cursor->stream->path().get()));
          return MakeReadyFuture(std::move(out));
        }
        if (!next->has_value()) return MakeReadyFuture(std::move(out));
        return self->CompleteStreamItem(cursor->stream, item_path, **next,
                                        cursor->stream_usage, cursor->info,
                                        cursor->item_type);
      });
}

std::optional<Promise<IncrementalDataRecordResult>>
ExecutionContext::DeliverStreamItem(
    const StreamCursorPtr& cursor, const StreamItemsResult& result,
    const Promise<IncrementalDataRecordResult>& promise) {
  StreamItemsResult out = result;
  if (!out.item.has_value()) {
    promise.Set(std::move(out));
    return std::nullopt;
  }
  // The record of the next item is fulfilled by whoever delivered this one.
  auto next = std::make_shared<IncrementalDataRecord>();
  next->stream_record = cursor->stream;
  Promise<IncrementalDataRecordResult> next_promise;
  next->result = next_promise.future();
  out.incremental_data_records.push_back(std::move(next));
  promise.Set(std::move(out));
  return next_promise;
}

Future<StreamItemsResult> ExecutionContext::CompleteStreamItem(
    const StreamRecordPtr& stream, const ResponsePath::Ptr& item_path,
    const Value& item, const std::shared_ptr<const StreamUsage>& stream_usage,
    const std::shared_ptr<const ResolveInfo>& info, const Type* item_type) {
  auto context = std::make_shared<IncrementalContext>();
  const FieldGroupPtr& field_group = stream_usage->field_group;
  return CompleteValue(item_type, field_group, info, item_path, item, context,
                       std::make_shared<const DeferMap>())
      .Then([stream, item_type, field_group, item_path,
             context](const WrappedResultOr& completed) -> StreamItemsResult {
        WrappedResultOr handled =
            completed.ok()
                ? completed
                : HandleFieldError(completed.status(), item_type, *field_group,
                                   item_path.get(), context.get());
        StreamItemsResult result;
        result.stream_record = stream;
        result.errors = context->TakeErrors();
        if (!handled.ok()) {
          result.errors.push_back(handled.status());
          return result;
        }
        result.item = handled->value;
        result.incremental_data_records = handled->incremental_data_records;
        return result;
      });
}

ExecutionOutcome ExecutionContext::BuildDataResponse(
    const WrappedResultOr& result,
    const std::shared_ptr<IncrementalContext>& context) const {
  std::vector<absl::Status> statuses = context->TakeErrors();
  Value data = Value::Null();
  std::vector<IncrementalDataRecordPtr> records;
  if (result.ok()) {
    data = result->value;
    records = result->incremental_data_records;
  } else {
    statuses.push_back(result.status());
  }
  std::vector<GraphQLError> errors;
  errors.reserve(statuses.size());
  for (const absl::Status& status : statuses) {
    errors.push_back(GraphQLError::FromStatus(status));
  }
  SortErrors(errors);

  if (records.empty()) {
    ExecutionResult response;
    response.data = std::move(data);
    response.errors = std::move(errors);
    return response;
  }
  GQLENGINE_VLOG(1) << "Initial result with " << records.size()
                    << " incremental data records";
  return IncrementalPublisher::BuildResponse(std::move(data), std::move(errors),
                                             records, cancellable_streams_);
}

Future<absl::StatusOr<std::shared_ptr<AsyncIterator>>>
ExecutionContext::CreateSourceEventStream() {
  using EventStreamOr = absl::StatusOr<std::shared_ptr<AsyncIterator>>;
  const ObjectType* root_type = schema_.subscription_type();
  if (root_type == nullptr) {
    const Node* const nodes[] = {operation_};
    absl::Status error =
        MakeGraphQLError()
        << "Schema is not configured to execute subscription operation.";
    return MakeReadyFuture(
        EventStreamOr(WithNodeLocations(std::move(error), nodes)));
  }
  absl::StatusOr<CollectedFields> collected = CollectFields(
      schema_, fragments_, variable_values_, root_type, *operation_);
  if (!collected.ok()) {
    return MakeReadyFuture(EventStreamOr(collected.status()));
  }
  if (collected->fields.empty()) {
    return MakeReadyFuture(EventStreamOr(
        MakeGraphQLError() << "The subscription selects no root field."));
  }

  const auto& [response_key, field_details] = *collected->fields.begin();
  auto field_group = std::make_shared<FieldGroup>();
  field_group->fields = field_details;
  const std::string& field_name = field_group->first_node().name();
  const FieldDefinition* field = schema_.GetField(root_type, field_name);
  if (field == nullptr) {
    absl::Status error = MakeGraphQLError() << "The subscription field '"
                                            << field_name
                                            << "' is not defined.";
    return MakeReadyFuture(EventStreamOr(
        WithNodeLocations(std::move(error), AsNodes(*field_group))));
  }

  ResponsePath::Ptr path =
      ResponsePath::Add(ResponsePath::Ptr(), response_key, root_type->name());
  std::shared_ptr<const ResolveInfo> info =
      BuildResolveInfo(field, *field_group, root_type, path);
  auto assert_event_stream =
      [field_group, path,
       info](const absl::StatusOr<Value>& result) -> EventStreamOr {
    if (!result.ok()) {
      return LocateError(result.status(), field_group->ToNodes(), path.get());
    }
    if (!result->is_async_iterator()) {
      absl::Status error = MakeGraphQLError()
                           << "Subscription field must return AsyncIterable. "
                              "Received: "
                           << result->DebugString() << ".";
      return LocateError(std::move(error), field_group->ToNodes(),
                         path.get());
    }
    return result->async_iterator();
  };

  const FieldNode& node = field_group->first_node();
  absl::StatusOr<Value> args = GetArgumentValues(
      field->arguments, node.arguments(), node, &variable_values_);
  if (!args.ok()) return MakeReadyFuture(assert_event_stream(args.status()));
  const FieldResolver& resolve_fn =
      field->subscribe != nullptr ? field->subscribe
                                  : subscribe_field_resolver_;
  absl::StatusOr<Value> result = resolve_fn(root_value_, *args, *info);
  if (result.ok() && result->is_pending()) {
    return result->pending().Then(assert_event_stream);
  }
  return MakeReadyFuture(assert_event_stream(result));
}

}  // namespace gqlengine
