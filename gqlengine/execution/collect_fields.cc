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


#include "gqlengine/execution/collect_fields.h"

#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "gqlengine/base/logging.h"
#include "gqlengine/base/status_macros.h"
#include "gqlengine/common/errors.h"
#include "gqlengine/execution/values.h"
#include "gqlengine/public/directives.h"

namespace gqlengine {

std::vector<const DeferUsage*> DeferUsage::Ancestors() const {
  std::vector<const DeferUsage*> ancestors;
  for (const DeferUsage* usage = parent_.get(); usage != nullptr;
       usage = usage->parent().get()) {
    ancestors.push_back(usage);
  }
  std::reverse(ancestors.begin(), ancestors.end());
  return ancestors;
}

namespace {

// Walks selection sets for one runtime type. Fragments spread without @defer
// are visited at most once per collection.
class FieldCollector {
 public:
  FieldCollector(const Schema& schema, const FragmentMap& fragments,
                 const VariableValues& variables,
                 const OperationDefinitionNode& operation,
                 const ObjectType* runtime_type)
      : schema_(schema),
        fragments_(fragments),
        variables_(variables),
        operation_(operation),
        runtime_type_(runtime_type),
        defer_enabled_(schema.GetDirective(
                           directives::DeferDirective()->name()) != nullptr) {}

  absl::Status Collect(const SelectionSetNode& selection_set,
                       const DeferUsagePtr& defer_usage);

  CollectedFields release() { return std::move(collected_); }

 private:
  absl::StatusOr<bool> ShouldIncludeNode(const SelectionNode& node) const;
  // The new usage if `node` carries an enabled @defer, else null.
  absl::StatusOr<DeferUsagePtr> GetDeferUsage(
      const SelectionNode& node, const DeferUsagePtr& parent) const;
  bool DoesFragmentConditionMatch(const NamedTypeNode* type_condition) const;

  // Collects `selection_set`, under `new_usage` if set.
  absl::Status CollectFragment(const SelectionSetNode& selection_set,
                               const DeferUsagePtr& defer_usage,
                               DeferUsagePtr new_usage);

  const Schema& schema_;
  const FragmentMap& fragments_;
  const VariableValues& variables_;
  const OperationDefinitionNode& operation_;
  const ObjectType* runtime_type_;
  const bool defer_enabled_;

  absl::flat_hash_set<std::string> visited_fragment_names_;
  CollectedFields collected_;
};

absl::Status FieldCollector::Collect(const SelectionSetNode& selection_set,
                                     const DeferUsagePtr& defer_usage) {
  for (const SelectionNode* selection : selection_set.selections()) {
    GQLENGINE_ASSIGN_OR_RETURN(const bool include,
                               ShouldIncludeNode(*selection));
    if (!include) continue;

    switch (selection->node_kind()) {
      case NodeKind::kField: {
        const FieldNode* field = selection->GetAsOrDie<FieldNode>();
        collected_.fields[field->response_key()].push_back(
            FieldDetails{field, defer_usage});
        break;
      }
      case NodeKind::kInlineFragment: {
        const InlineFragmentNode* fragment =
            selection->GetAsOrDie<InlineFragmentNode>();
        if (!DoesFragmentConditionMatch(fragment->type_condition())) break;
        GQLENGINE_ASSIGN_OR_RETURN(DeferUsagePtr new_usage,
                                   GetDeferUsage(*fragment, defer_usage));
        GQLENGINE_RETURN_IF_ERROR(CollectFragment(
            *fragment->selection_set(), defer_usage, std::move(new_usage)));
        break;
      }
      case NodeKind::kFragmentSpread: {
        const FragmentSpreadNode* spread =
            selection->GetAsOrDie<FragmentSpreadNode>();
        GQLENGINE_ASSIGN_OR_RETURN(DeferUsagePtr new_usage,
                                   GetDeferUsage(*spread, defer_usage));
        if (new_usage == nullptr &&
            visited_fragment_names_.contains(spread->name())) {
          break;
        }
        auto it = fragments_.find(spread->name());
        if (it == fragments_.end() ||
            !DoesFragmentConditionMatch(it->second->type_condition())) {
          break;
        }
        if (new_usage == nullptr) {
          visited_fragment_names_.insert(spread->name());
        }
        GQLENGINE_RETURN_IF_ERROR(CollectFragment(
            *it->second->selection_set(), defer_usage, std::move(new_usage)));
        break;
      }
      default:
        GQLENGINE_DCHECK(false)
            << "Unexpected selection " << selection->GetNodeKindString();
        break;
    }
  }
  return absl::OkStatus();
}

absl::Status FieldCollector::CollectFragment(
    const SelectionSetNode& selection_set, const DeferUsagePtr& defer_usage,
    DeferUsagePtr new_usage) {
  if (new_usage == nullptr) return Collect(selection_set, defer_usage);
  collected_.new_defer_usages.push_back(new_usage);
  return Collect(selection_set, new_usage);
}

// @skip takes precedence over @include.
absl::StatusOr<bool> FieldCollector::ShouldIncludeNode(
    const SelectionNode& node) const {
  GQLENGINE_ASSIGN_OR_RETURN(
      std::optional<Value> skip,
      GetDirectiveValues(*directives::SkipDirective(), node, &variables_));
  if (skip.has_value()) {
    const Value* if_value = skip->FindField("if");
    if (if_value != nullptr && if_value->is_bool() && if_value->bool_value()) {
      return false;
    }
  }
  GQLENGINE_ASSIGN_OR_RETURN(
      std::optional<Value> include,
      GetDirectiveValues(*directives::IncludeDirective(), node, &variables_));
  if (include.has_value()) {
    const Value* if_value = include->FindField("if");
    if (if_value != nullptr && if_value->is_bool() && !if_value->bool_value()) {
      return false;
    }
  }
  return true;
}

absl::StatusOr<DeferUsagePtr> FieldCollector::GetDeferUsage(
    const SelectionNode& node, const DeferUsagePtr& parent) const {
  if (!defer_enabled_) return DeferUsagePtr();
  GQLENGINE_ASSIGN_OR_RETURN(
      std::optional<Value> defer,
      GetDirectiveValues(*directives::DeferDirective(), node, &variables_));
  if (!defer.has_value()) return DeferUsagePtr();
  const Value* if_value = defer->FindField("if");
  if (if_value != nullptr && if_value->is_bool() && !if_value->bool_value()) {
    return DeferUsagePtr();
  }

  if (operation_.operation() == OperationType::kSubscription) {
    return MakeGraphQLError()
           << "`@defer` directive not supported on subscription operations. "
              "Disable `@defer` by setting the `if` argument to `false`.";
  }

  std::optional<std::string> label;
  const Value* label_value = defer->FindField("label");
  if (label_value != nullptr && label_value->is_string()) {
    label = label_value->string_value();
  }
  return std::make_shared<const DeferUsage>(std::move(label), parent);
}

bool FieldCollector::DoesFragmentConditionMatch(
    const NamedTypeNode* type_condition) const {
  if (type_condition == nullptr) return true;
  const Type* conditional_type = schema_.TypeFromAst(*type_condition);
  if (conditional_type == nullptr) return false;
  if (conditional_type == runtime_type_) return true;
  if (conditional_type->IsAbstract()) {
    return schema_.IsSubType(conditional_type->AsNamed(), runtime_type_);
  }
  return false;
}

}  // namespace

absl::StatusOr<CollectedFields> CollectFields(
    const Schema& schema, const FragmentMap& fragments,
    const VariableValues& variables, const ObjectType* runtime_type,
    const OperationDefinitionNode& operation) {
  FieldCollector collector(schema, fragments, variables, operation,
                           runtime_type);
  GQLENGINE_RETURN_IF_ERROR(
      collector.Collect(*operation.selection_set(), DeferUsagePtr()));
  return collector.release();
}

absl::StatusOr<CollectedFields> CollectSubfields(
    const Schema& schema, const FragmentMap& fragments,
    const VariableValues& variables, const OperationDefinitionNode& operation,
    const ObjectType* return_type, absl::Span<const FieldDetails> field_group) {
  FieldCollector collector(schema, fragments, variables, operation,
                           return_type);
  for (const FieldDetails& details : field_group) {
    if (details.node->selection_set() == nullptr) continue;
    GQLENGINE_RETURN_IF_ERROR(collector.Collect(*details.node->selection_set(),
                                                details.defer_usage));
  }
  return collector.release();
}

}  // namespace gqlengine
