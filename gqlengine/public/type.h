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


#ifndef GQLENGINE_PUBLIC_TYPE_H_
#define GQLENGINE_PUBLIC_TYPE_H_

// The GraphQL type system: named types (scalars, enums, objects,
// interfaces, unions and input objects) and the List and NonNull wrappers.
//
// Every type is owned by a TypeFactory. Named types are created mutable so
// that fields may refer to types defined later, which is needed for cyclic
// type graphs:
//
//   TypeFactory factory;
//   ObjectType* person = factory.MakeObjectType("Person");
//   person->AddField({.name = "name", .type = types::StringType()});
//   person->AddField({.name = "friends",
//                     .type = factory.MakeListType(person)});
//
// Once a Schema refers to a type, the type must no longer be modified; from
// then on it is only read, possibly from several threads.

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "gqlengine/public/value.h"

namespace gqlengine {

class EnumType;
class InputObjectType;
class InterfaceType;
class ListType;
class NamedType;
class NonNullType;
class ObjectType;
class ScalarType;
class Type;
class TypeFactory;
class UnionType;
class ValueNode;
struct ResolveInfo;

enum class TypeKind {
  kScalar,
  kObject,
  kInterface,
  kUnion,
  kEnum,
  kInputObject,
  kList,
  kNonNull,
};

// Returns the kind as it is spelled in introspection, e.g. "INPUT_OBJECT".
std::string TypeKindName(TypeKind kind);

// Produces the value of a field. `args` is an object Value holding the
// coerced arguments. The result may be a pending Value.
using FieldResolver = std::function<absl::StatusOr<Value>(
    const Value& source, const Value& args, const ResolveInfo& info)>;

// Determines the concrete object type of `value` for an interface or union.
// Returns the type name as a string Value, null if it cannot be determined,
// or a pending Value producing either.
using TypeResolver = std::function<absl::StatusOr<Value>(
    const Value& value, const ResolveInfo& info, const Type* abstract_type)>;

// Whether `value` belongs to an object type.
using IsTypeOfFn = std::function<absl::StatusOr<bool>(const Value& value,
                                                      const ResolveInfo& info)>;

class Type {
 public:
  Type(const Type&) = delete;
  Type& operator=(const Type&) = delete;
  virtual ~Type() = default;

  TypeKind kind() const { return kind_; }

  bool IsScalar() const { return kind_ == TypeKind::kScalar; }
  bool IsObject() const { return kind_ == TypeKind::kObject; }
  bool IsInterface() const { return kind_ == TypeKind::kInterface; }
  bool IsUnion() const { return kind_ == TypeKind::kUnion; }
  bool IsEnum() const { return kind_ == TypeKind::kEnum; }
  bool IsInputObject() const { return kind_ == TypeKind::kInputObject; }
  bool IsList() const { return kind_ == TypeKind::kList; }
  bool IsNonNull() const { return kind_ == TypeKind::kNonNull; }

  bool IsWrapping() const { return IsList() || IsNonNull(); }
  bool IsNamed() const { return !IsWrapping(); }
  bool IsLeaf() const { return IsScalar() || IsEnum(); }
  bool IsAbstract() const { return IsInterface() || IsUnion(); }
  bool IsComposite() const { return IsObject() || IsAbstract(); }

  // Whether values of this type may be used as arguments and variables.
  bool IsInputType() const;
  // Whether values of this type may be returned by fields.
  bool IsOutputType() const;

  // Downcasts. Each returns null when the kind does not match.
  const ScalarType* AsScalar() const;
  const EnumType* AsEnum() const;
  const ObjectType* AsObject() const;
  const InterfaceType* AsInterface() const;
  const UnionType* AsUnion() const;
  const InputObjectType* AsInputObject() const;
  const ListType* AsList() const;
  const NonNullType* AsNonNull() const;
  const NamedType* AsNamed() const;

  // The wrapped type of a List or NonNull type, null for named types.
  virtual const Type* of_type() const { return nullptr; }

  // This type without an outer NonNull wrapper.
  const Type* Nullable() const;

  // The named type at the core of all wrappers.
  const NamedType* Named() const;

  // The type as written in a document, e.g. "[Int!]!".
  virtual std::string ToString() const = 0;

  // Wrappers compare structurally, named types by identity.
  bool Equals(const Type* other) const;

 protected:
  explicit Type(TypeKind kind) : kind_(kind) {}

 private:
  const TypeKind kind_;
};

class NamedType : public Type {
 public:
  const std::string& name() const { return name_; }
  const std::string& description() const { return description_; }

  std::string ToString() const override { return name_; }

 protected:
  NamedType(TypeKind kind, std::string name, std::string description)
      : Type(kind),
        name_(std::move(name)),
        description_(std::move(description)) {}

 private:
  const std::string name_;
  const std::string description_;
};

class ScalarType final : public NamedType {
 public:
  // Converts an internal value into its response representation.
  using SerializeFn = std::function<absl::StatusOr<Value>(const Value& value)>;
  // Converts a variable value into an internal value.
  using ParseValueFn =
      std::function<absl::StatusOr<Value>(const Value& input_value)>;
  // Converts a literal into an internal value. `variables` is null when
  // variables are not available.
  using ParseLiteralFn = std::function<absl::StatusOr<Value>(
      const ValueNode& node, const VariableValues* variables)>;

  struct Options {
    std::string description;
    std::string specified_by_url;
    // Each function defaults to the identity. The default ParseLiteral
    // converts the literal untyped and passes it to ParseValue.
    SerializeFn serialize;
    ParseValueFn parse_value;
    ParseLiteralFn parse_literal;
  };

  const std::string& specified_by_url() const { return specified_by_url_; }

  absl::StatusOr<Value> Serialize(const Value& value) const;
  absl::StatusOr<Value> ParseValue(const Value& input_value) const;
  absl::StatusOr<Value> ParseLiteral(const ValueNode& node,
                                     const VariableValues* variables) const;

 private:
  friend class TypeFactory;
  ScalarType(std::string name, Options options);

  const std::string specified_by_url_;
  const SerializeFn serialize_;
  const ParseValueFn parse_value_;
  const ParseLiteralFn parse_literal_;
};

struct EnumValueDefinition {
  std::string name;
  // The internal value. Defaults to the name as a string.
  Value value;
  std::string description;
  std::optional<std::string> deprecation_reason;
};

class EnumType final : public NamedType {
 public:
  // Adds a value. An invalid `value` stands for the name itself.
  EnumType* AddValue(std::string name, Value value = Value(),
                     std::string description = "",
                     std::optional<std::string> deprecation_reason =
                         std::nullopt);

  const std::vector<EnumValueDefinition>& values() const { return values_; }
  const EnumValueDefinition* FindValue(absl::string_view name) const;

  // Internal value to enum value name.
  absl::StatusOr<Value> Serialize(const Value& value) const;
  // Enum value name to internal value.
  absl::StatusOr<Value> ParseValue(const Value& input_value) const;
  absl::StatusOr<Value> ParseLiteral(const ValueNode& node,
                                     const VariableValues* variables) const;

 private:
  friend class TypeFactory;
  EnumType(std::string name, std::string description)
      : NamedType(TypeKind::kEnum, std::move(name), std::move(description)) {}

  std::vector<std::string> SuggestValues(absl::string_view unknown) const;

  std::vector<EnumValueDefinition> values_;
  absl::flat_hash_map<std::string, int> index_by_name_;
};

// An argument, an input object field or a directive argument.
struct InputValueDefinition {
  std::string name;
  const Type* type = nullptr;
  // The internal default value. Invalid when there is none.
  Value default_value;
  std::string description;
  std::optional<std::string> deprecation_reason;
  // The key used for the coerced value. Empty means `name`.
  std::string out_name;

  const std::string& coerced_name() const {
    return out_name.empty() ? name : out_name;
  }
  bool has_default_value() const { return default_value.is_valid(); }
  // A NonNull input without a default.
  bool IsRequired() const;
};

struct FieldDefinition {
  std::string name;
  const Type* type = nullptr;
  std::vector<InputValueDefinition> arguments;
  // Null means the executor's default field resolver.
  FieldResolver resolve;
  // For root subscription fields: produces the event stream.
  FieldResolver subscribe;
  std::string description;
  std::optional<std::string> deprecation_reason;

  const InputValueDefinition* FindArgument(absl::string_view name) const;
};

// Common parts of object and interface types.
class FieldsType : public NamedType {
 public:
  // Adds a field. Returns the stored definition, which stays valid for the
  // life of the type.
  const FieldDefinition* AddField(FieldDefinition field);

  // Fields in definition order.
  const std::vector<const FieldDefinition*>& fields() const {
    return field_list_;
  }
  const FieldDefinition* FindField(absl::string_view name) const;

  void AddInterface(const InterfaceType* interface);
  const std::vector<const InterfaceType*>& interfaces() const {
    return interfaces_;
  }
  bool Implements(const InterfaceType* interface) const;

 protected:
  using NamedType::NamedType;

 private:
  std::vector<std::unique_ptr<FieldDefinition>> owned_fields_;
  std::vector<const FieldDefinition*> field_list_;
  absl::flat_hash_map<std::string, const FieldDefinition*> fields_by_name_;
  std::vector<const InterfaceType*> interfaces_;
};

class ObjectType final : public FieldsType {
 public:
  void set_is_type_of(IsTypeOfFn is_type_of) {
    is_type_of_ = std::move(is_type_of);
  }
  const IsTypeOfFn& is_type_of() const { return is_type_of_; }

 private:
  friend class TypeFactory;
  ObjectType(std::string name, std::string description)
      : FieldsType(TypeKind::kObject, std::move(name), std::move(description)) {
  }

  IsTypeOfFn is_type_of_;
};

class InterfaceType final : public FieldsType {
 public:
  void set_resolve_type(TypeResolver resolve_type) {
    resolve_type_ = std::move(resolve_type);
  }
  const TypeResolver& resolve_type() const { return resolve_type_; }

 private:
  friend class TypeFactory;
  InterfaceType(std::string name, std::string description)
      : FieldsType(TypeKind::kInterface, std::move(name),
                   std::move(description)) {}

  TypeResolver resolve_type_;
};

class UnionType final : public NamedType {
 public:
  void AddMember(const ObjectType* member) { members_.push_back(member); }
  const std::vector<const ObjectType*>& members() const { return members_; }

  void set_resolve_type(TypeResolver resolve_type) {
    resolve_type_ = std::move(resolve_type);
  }
  const TypeResolver& resolve_type() const { return resolve_type_; }

 private:
  friend class TypeFactory;
  UnionType(std::string name, std::string description)
      : NamedType(TypeKind::kUnion, std::move(name), std::move(description)) {}

  std::vector<const ObjectType*> members_;
  TypeResolver resolve_type_;
};

class InputObjectType final : public NamedType {
 public:
  const InputValueDefinition* AddField(InputValueDefinition field);

  const std::vector<const InputValueDefinition*>& fields() const {
    return field_list_;
  }
  const InputValueDefinition* FindField(absl::string_view name) const;

  // A @oneOf input object requires exactly one non-null field.
  bool is_one_of() const { return is_one_of_; }
  void set_is_one_of(bool is_one_of) { is_one_of_ = is_one_of; }

 private:
  friend class TypeFactory;
  InputObjectType(std::string name, std::string description)
      : NamedType(TypeKind::kInputObject, std::move(name),
                  std::move(description)) {}

  std::vector<std::unique_ptr<InputValueDefinition>> owned_fields_;
  std::vector<const InputValueDefinition*> field_list_;
  absl::flat_hash_map<std::string, const InputValueDefinition*>
      fields_by_name_;
  bool is_one_of_ = false;
};

class ListType final : public Type {
 public:
  const Type* of_type() const override { return element_type_; }
  std::string ToString() const override;

 private:
  friend class TypeFactory;
  explicit ListType(const Type* element_type)
      : Type(TypeKind::kList), element_type_(element_type) {}

  const Type* const element_type_;
};

class NonNullType final : public Type {
 public:
  const Type* of_type() const override { return nullable_type_; }
  std::string ToString() const override;

 private:
  friend class TypeFactory;
  explicit NonNullType(const Type* nullable_type)
      : Type(TypeKind::kNonNull), nullable_type_(nullable_type) {}

  const Type* const nullable_type_;
};

// Creates and owns types. List and NonNull wrappers are interned, so
// MakeListType(t) returns the same pointer each time for a given t.
//
// Thread safe. Types live as long as the factory, which must outlive every
// Schema built from them.
class TypeFactory {
 public:
  TypeFactory() = default;
  TypeFactory(const TypeFactory&) = delete;
  TypeFactory& operator=(const TypeFactory&) = delete;

  ScalarType* MakeScalarType(std::string name, ScalarType::Options options);
  EnumType* MakeEnumType(std::string name, std::string description = "");
  ObjectType* MakeObjectType(std::string name, std::string description = "");
  InterfaceType* MakeInterfaceType(std::string name,
                                   std::string description = "");
  UnionType* MakeUnionType(std::string name, std::string description = "");
  InputObjectType* MakeInputObjectType(std::string name,
                                       std::string description = "");

  const ListType* MakeListType(const Type* element_type);
  // Wrapping a NonNull type again returns it unchanged.
  const Type* MakeNonNullType(const Type* type);

 private:
  template <typename T>
  T* Own(T* type);

  absl::Mutex mutex_;
  std::vector<std::unique_ptr<const Type>> owned_types_ ABSL_GUARDED_BY(mutex_);
  absl::flat_hash_map<const Type*, const ListType*> list_types_
      ABSL_GUARDED_BY(mutex_);
  absl::flat_hash_map<const Type*, const NonNullType*> non_null_types_
      ABSL_GUARDED_BY(mutex_);
};

namespace types {

// The built-in scalars. These are static and live forever.
const ScalarType* IntType();
const ScalarType* FloatType();
const ScalarType* StringType();
const ScalarType* BooleanType();
const ScalarType* IdType();

// `String!`, used by the __typename meta field.
const Type* NonNullStringType();

const std::vector<const ScalarType*>& SpecifiedScalarTypes();
bool IsSpecifiedScalarType(const Type* type);

// The range of GraphQL Int values.
inline constexpr int64_t kMaxInt = 2147483647;
inline constexpr int64_t kMinInt = -2147483648LL;

}  // namespace types

}  // namespace gqlengine

#endif  // GQLENGINE_PUBLIC_TYPE_H_
