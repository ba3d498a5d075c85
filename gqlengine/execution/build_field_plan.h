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


#ifndef GQLENGINE_EXECUTION_BUILD_FIELD_PLAN_H_
#define GQLENGINE_EXECUTION_BUILD_FIELD_PLAN_H_

#include <memory>
#include <vector>

#include "gqlengine/execution/collect_fields.h"
#include "gqlengine/language/ast.h"

namespace gqlengine {

// A set of defer usages, compared by identity and iterated in insertion
// order.
class DeferUsageSet {
 public:
  using const_iterator = std::vector<DeferUsagePtr>::const_iterator;

  DeferUsageSet() = default;

  bool contains(const DeferUsage* usage) const;
  // No-op if `usage` is already a member.
  void insert(DeferUsagePtr usage);
  void clear() { usages_.clear(); }

  bool empty() const { return usages_.empty(); }
  size_t size() const { return usages_.size(); }
  const_iterator begin() const { return usages_.begin(); }
  const_iterator end() const { return usages_.end(); }

  // Same members, in any order.
  friend bool operator==(const DeferUsageSet& a, const DeferUsageSet& b);
  friend bool operator!=(const DeferUsageSet& a, const DeferUsageSet& b) {
    return !(a == b);
  }

 private:
  std::vector<DeferUsagePtr> usages_;
};

// The occurrences of one response key that are executed together.
struct FieldGroup {
  FieldDetailsList fields;

  std::vector<const FieldNode*> ToNodes() const;
  const FieldNode& first_node() const { return *fields.front().node; }
};

// Field groups are shared so that their address identifies them for as long
// as anything refers to them.
using FieldGroupPtr = std::shared_ptr<const FieldGroup>;
using GroupedFieldSet = ResponseKeyMap<FieldGroupPtr>;

// Fields that are delivered with a set of deferred fragments other than the
// parent's.
struct NewGroupedFieldSet {
  DeferUsageSet defer_usages;
  GroupedFieldSet grouped_field_set;
  // Whether any of `defer_usages` is not already deferring the parent. If
  // not, the set is executed right away along with the parent.
  bool should_initiate_defer = false;
};

struct FieldPlan {
  // Fields delivered along with the parent.
  GroupedFieldSet grouped_field_set;
  std::vector<NewGroupedFieldSet> new_grouped_field_sets;
};

// Partitions collected fields by the set of deferred fragments each response
// key is delivered with. A key that also occurs outside of any @defer is not
// deferred, and a usage nested in another usage of the same key is dropped in
// favor of the outer one.
FieldPlan BuildFieldPlan(const ResponseKeyMap<FieldDetailsList>& fields,
                         const DeferUsageSet& parent_defer_usages);

}  // namespace gqlengine

#endif  // GQLENGINE_EXECUTION_BUILD_FIELD_PLAN_H_
