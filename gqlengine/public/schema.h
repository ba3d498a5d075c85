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


#ifndef GQLENGINE_PUBLIC_SCHEMA_H_
#define GQLENGINE_PUBLIC_SCHEMA_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/base/call_once.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "gqlengine/language/ast.h"
#include "gqlengine/public/directives.h"
#include "gqlengine/public/type.h"

namespace gqlengine {

struct SchemaConfig {
  const ObjectType* query = nullptr;
  const ObjectType* mutation = nullptr;
  const ObjectType* subscription = nullptr;
  // Types that are not reachable from the roots, typically object types that
  // are only returned through an interface.
  std::vector<const NamedType*> types;
  // Empty means the specified directives.
  std::vector<const Directive*> directives;
  std::string description;
};

struct SchemaOptions {
  // Installs the experimental @defer and @stream directives. Only
  // ExecuteIncrementally() accepts such a schema.
  bool enable_defer_stream = false;
  // Skips Validate(); the schema is trusted to be valid.
  bool assume_valid = false;
};

// A GraphQL schema: root operation types, every named type reachable from
// them, and the directives. The types are owned by the TypeFactory that
// created them, which must outlive the schema.
//
// Immutable and thread safe once created.
class Schema {
 public:
  // Collects the type map by walking the roots, `config.types` and the
  // directive arguments. Fails if two different types share a name.
  static absl::StatusOr<std::unique_ptr<const Schema>> Create(
      SchemaConfig config, SchemaOptions options = {});

  Schema(const Schema&) = delete;
  Schema& operator=(const Schema&) = delete;

  const ObjectType* query_type() const { return query_; }
  const ObjectType* mutation_type() const { return mutation_; }
  const ObjectType* subscription_type() const { return subscription_; }
  const std::string& description() const { return description_; }

  // The root type for `operation`, or null if the schema does not support
  // it.
  const ObjectType* GetRootType(OperationType operation) const;

  const NamedType* GetType(absl::string_view name) const;
  // Named types in the order they were discovered.
  const std::vector<const NamedType*>& types() const { return type_list_; }

  const Directive* GetDirective(absl::string_view name) const;
  const std::vector<const Directive*>& directives() const {
    return directives_;
  }

  // The field `field_name` of `parent_type`, including the __typename meta
  // field. Returns null if there is no such field.
  const FieldDefinition* GetField(const NamedType* parent_type,
                                  absl::string_view field_name) const;

  // The object types an abstract type may resolve to. Empty for other types.
  const std::vector<const ObjectType*>& GetPossibleTypes(
      const NamedType* abstract_type) const;

  // Whether `maybe_sub_type` is a member of the union, or implements the
  // interface (object and interface types alike).
  bool IsSubType(const NamedType* abstract_type,
                 const NamedType* maybe_sub_type) const;

  // Whether `maybe_sub_type` may be used where `super_type` is expected,
  // considering wrappers (covariant NonNull and List).
  bool IsTypeSubTypeOf(const Type* maybe_sub_type,
                       const Type* super_type) const;

  // The type a type reference in a document denotes, e.g. `[Episode!]`.
  // Returns null if the named type is not in the schema.
  const Type* TypeFromAst(const TypeNode& node) const;

  // Checks the rules a schema must satisfy before executing requests against
  // it. The result is computed once and cached. All problems are reported in
  // one kFailedPrecondition status, separated by blank lines.
  absl::Status Validate() const;

 private:
  Schema() = default;

  absl::Status AddType(const Type* type);
  absl::Status ValidateImpl() const;

  const ObjectType* query_ = nullptr;
  const ObjectType* mutation_ = nullptr;
  const ObjectType* subscription_ = nullptr;
  std::string description_;
  bool assume_valid_ = false;

  std::vector<const NamedType*> type_list_;
  absl::flat_hash_map<std::string, const NamedType*> types_by_name_;
  std::vector<const Directive*> directives_;

  // Abstract type to the object types that implement or belong to it.
  absl::flat_hash_map<const NamedType*, std::vector<const ObjectType*>>
      possible_types_;
  // Interface to the interfaces that implement it.
  absl::flat_hash_map<const NamedType*, std::vector<const InterfaceType*>>
      interface_implementations_;

  // Interns the wrapper types of TypeFromAst().
  std::unique_ptr<TypeFactory> wrapper_types_;

  mutable absl::once_flag validate_once_;
  mutable absl::Status validation_status_;
};

// Returns the __typename meta field, which every composite type has.
const FieldDefinition* TypeNameMetaFieldDef();

}  // namespace gqlengine

#endif  // GQLENGINE_PUBLIC_SCHEMA_H_
