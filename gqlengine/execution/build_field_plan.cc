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


#include "gqlengine/execution/build_field_plan.h"

#include <algorithm>
#include <iterator>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace gqlengine {

bool DeferUsageSet::contains(const DeferUsage* usage) const {
  return std::any_of(
      usages_.begin(), usages_.end(),
      [usage](const DeferUsagePtr& member) { return member.get() == usage; });
}

void DeferUsageSet::insert(DeferUsagePtr usage) {
  if (!contains(usage.get())) usages_.push_back(std::move(usage));
}

bool operator==(const DeferUsageSet& a, const DeferUsageSet& b) {
  if (a.size() != b.size()) return false;
  for (const DeferUsagePtr& usage : a) {
    if (!b.contains(usage.get())) return false;
  }
  return true;
}

std::vector<const FieldNode*> FieldGroup::ToNodes() const {
  std::vector<const FieldNode*> nodes;
  nodes.reserve(fields.size());
  for (const FieldDetails& details : fields) nodes.push_back(details.node);
  return nodes;
}

namespace {

// The set of deferred fragments that deliver `field_details`.
DeferUsageSet DeliveringDeferUsages(const FieldDetailsList& field_details) {
  DeferUsageSet usages;
  for (const FieldDetails& details : field_details) {
    if (details.defer_usage == nullptr) return DeferUsageSet();
    usages.insert(details.defer_usage);
  }
  DeferUsageSet outermost;
  for (const DeferUsagePtr& usage : usages) {
    const std::vector<const DeferUsage*> ancestors = usage->Ancestors();
    if (std::none_of(ancestors.begin(), ancestors.end(),
                     [&usages](const DeferUsage* ancestor) {
                       return usages.contains(ancestor);
                     })) {
      outermost.insert(usage);
    }
  }
  return outermost;
}

void AddToGroup(GroupedFieldSet& grouped_field_set,
                const std::string& response_key,
                const FieldDetailsList& field_details) {
  auto group = std::make_shared<FieldGroup>();
  group->fields = field_details;
  grouped_field_set[response_key] = std::move(group);
}

}  // namespace

FieldPlan BuildFieldPlan(const ResponseKeyMap<FieldDetailsList>& fields,
                         const DeferUsageSet& parent_defer_usages) {
  FieldPlan plan;
  for (const auto& [response_key, field_details] : fields) {
    DeferUsageSet defer_usages = DeliveringDeferUsages(field_details);
    if (defer_usages == parent_defer_usages) {
      AddToGroup(plan.grouped_field_set, response_key, field_details);
      continue;
    }

    auto it = std::find_if(plan.new_grouped_field_sets.begin(),
                           plan.new_grouped_field_sets.end(),
                           [&defer_usages](const NewGroupedFieldSet& set) {
                             return set.defer_usages == defer_usages;
                           });
    if (it == plan.new_grouped_field_sets.end()) {
      NewGroupedFieldSet new_set;
      new_set.should_initiate_defer = std::any_of(
          defer_usages.begin(), defer_usages.end(),
          [&parent_defer_usages](const DeferUsagePtr& usage) {
            return !parent_defer_usages.contains(usage.get());
          });
      new_set.defer_usages = defer_usages;
      plan.new_grouped_field_sets.push_back(std::move(new_set));
      it = std::prev(plan.new_grouped_field_sets.end());
    }
    AddToGroup(it->grouped_field_set, response_key, field_details);
  }
  return plan;
}

}  // namespace gqlengine
