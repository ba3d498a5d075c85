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


#ifndef GQLENGINE_EXECUTION_COLLECT_FIELDS_H_
#define GQLENGINE_EXECUTION_COLLECT_FIELDS_H_

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "gqlengine/language/ast.h"
#include "gqlengine/public/resolve_info.h"
#include "gqlengine/public/schema.h"
#include "gqlengine/public/type.h"
#include "gqlengine/public/value.h"

namespace gqlengine {

// One application of @defer during field collection. Nested applications are
// linked to the one that encloses them. Usages are compared by identity.
class DeferUsage {
 public:
  DeferUsage(std::optional<std::string> label,
             std::shared_ptr<const DeferUsage> parent)
      : label_(std::move(label)), parent_(std::move(parent)) {}
  DeferUsage(const DeferUsage&) = delete;
  DeferUsage& operator=(const DeferUsage&) = delete;

  const std::optional<std::string>& label() const { return label_; }
  const std::shared_ptr<const DeferUsage>& parent() const { return parent_; }

  // The enclosing usages, outermost first.
  std::vector<const DeferUsage*> Ancestors() const;

 private:
  const std::optional<std::string> label_;
  const std::shared_ptr<const DeferUsage> parent_;
};

using DeferUsagePtr = std::shared_ptr<const DeferUsage>;

// A field selection and the @defer under which it was collected, null if it
// is not deferred.
struct FieldDetails {
  const FieldNode* node = nullptr;
  DeferUsagePtr defer_usage;
};

// Values keyed by response key, iterated in the order the keys were first
// inserted.
template <typename V>
class ResponseKeyMap {
 public:
  using Entry = std::pair<std::string, V>;
  using const_iterator = typename std::vector<Entry>::const_iterator;

  // Returns the value for `key`, inserting a default one if missing. The
  // reference is invalidated by the next insertion.
  V& operator[](absl::string_view key) {
    auto it = index_.find(key);
    if (it != index_.end()) return entries_[it->second].second;
    index_.emplace(std::string(key), entries_.size());
    entries_.emplace_back(std::string(key), V());
    return entries_.back().second;
  }

  // Null if `key` is absent.
  const V* Find(absl::string_view key) const {
    auto it = index_.find(key);
    return it == index_.end() ? nullptr : &entries_[it->second].second;
  }

  const_iterator begin() const { return entries_.begin(); }
  const_iterator end() const { return entries_.end(); }
  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

 private:
  std::vector<Entry> entries_;
  absl::flat_hash_map<std::string, size_t> index_;
};

using FieldDetailsList = std::vector<FieldDetails>;

struct CollectedFields {
  ResponseKeyMap<FieldDetailsList> fields;
  // The @defer applications encountered, each after the one enclosing it.
  std::vector<DeferUsagePtr> new_defer_usages;
};

// Collects the fields of the operation's selection set that apply to
// `runtime_type`, grouped by response key. Honors @skip and @include, and
// @defer if the schema defines it.
//
// Fails if a directive argument cannot be coerced or if @defer is enabled in
// a subscription.
absl::StatusOr<CollectedFields> CollectFields(
    const Schema& schema, const FragmentMap& fragments,
    const VariableValues& variables, const ObjectType* runtime_type,
    const OperationDefinitionNode& operation);

// Collects the subfields of `field_group`, the occurrences of a single
// response key whose completed value has object type `return_type`. Each
// occurrence's selection set starts out under the occurrence's own @defer.
absl::StatusOr<CollectedFields> CollectSubfields(
    const Schema& schema, const FragmentMap& fragments,
    const VariableValues& variables, const OperationDefinitionNode& operation,
    const ObjectType* return_type, absl::Span<const FieldDetails> field_group);

}  // namespace gqlengine

#endif  // GQLENGINE_EXECUTION_COLLECT_FIELDS_H_
