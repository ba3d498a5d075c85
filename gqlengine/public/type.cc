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


#include "gqlengine/public/type.h"

#include <cmath>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "gqlengine/base/logging.h"
#include "gqlengine/common/errors.h"
#include "gqlengine/common/json_util.h"
#include "gqlengine/common/suggestion_list.h"
#include "gqlengine/execution/value_from_ast.h"
#include "gqlengine/language/ast.h"
#include "gqlengine/language/printer.h"

namespace gqlengine {

std::string TypeKindName(TypeKind kind) {
  switch (kind) {
    case TypeKind::kScalar:
      return "SCALAR";
    case TypeKind::kObject:
      return "OBJECT";
    case TypeKind::kInterface:
      return "INTERFACE";
    case TypeKind::kUnion:
      return "UNION";
    case TypeKind::kEnum:
      return "ENUM";
    case TypeKind::kInputObject:
      return "INPUT_OBJECT";
    case TypeKind::kList:
      return "LIST";
    case TypeKind::kNonNull:
      return "NON_NULL";
  }
  return "UNKNOWN";
}

bool Type::IsInputType() const {
  const NamedType* named = Named();
  return named->IsScalar() || named->IsEnum() || named->IsInputObject();
}

bool Type::IsOutputType() const {
  const NamedType* named = Named();
  return !named->IsInputObject();
}

const ScalarType* Type::AsScalar() const {
  return IsScalar() ? static_cast<const ScalarType*>(this) : nullptr;
}
const EnumType* Type::AsEnum() const {
  return IsEnum() ? static_cast<const EnumType*>(this) : nullptr;
}
const ObjectType* Type::AsObject() const {
  return IsObject() ? static_cast<const ObjectType*>(this) : nullptr;
}
const InterfaceType* Type::AsInterface() const {
  return IsInterface() ? static_cast<const InterfaceType*>(this) : nullptr;
}
const UnionType* Type::AsUnion() const {
  return IsUnion() ? static_cast<const UnionType*>(this) : nullptr;
}
const InputObjectType* Type::AsInputObject() const {
  return IsInputObject() ? static_cast<const InputObjectType*>(this) : nullptr;
}
const ListType* Type::AsList() const {
  return IsList() ? static_cast<const ListType*>(this) : nullptr;
}
const NonNullType* Type::AsNonNull() const {
  return IsNonNull() ? static_cast<const NonNullType*>(this) : nullptr;
}
const NamedType* Type::AsNamed() const {
  return IsNamed() ? static_cast<const NamedType*>(this) : nullptr;
}

const Type* Type::Nullable() const { return IsNonNull() ? of_type() : this; }

const NamedType* Type::Named() const {
  const Type* type = this;
  while (type->IsWrapping()) {
    type = type->of_type();
  }
  return static_cast<const NamedType*>(type);
}

bool Type::Equals(const Type* other) const {
  if (this == other) return true;
  if (other == nullptr || kind_ != other->kind_ || IsNamed()) return false;
  return of_type()->Equals(other->of_type());
}

std::string ListType::ToString() const {
  return absl::StrCat("[", element_type_->ToString(), "]");
}

std::string NonNullType::ToString() const {
  return absl::StrCat(nullable_type_->ToString(), "!");
}

// ScalarType

ScalarType::ScalarType(std::string name, Options options)
    : NamedType(TypeKind::kScalar, std::move(name),
                std::move(options.description)),
      specified_by_url_(std::move(options.specified_by_url)),
      serialize_(std::move(options.serialize)),
      parse_value_(std::move(options.parse_value)),
      parse_literal_(std::move(options.parse_literal)) {}

absl::StatusOr<Value> ScalarType::Serialize(const Value& value) const {
  if (serialize_ == nullptr) return value;
  return serialize_(value);
}

absl::StatusOr<Value> ScalarType::ParseValue(const Value& input_value) const {
  if (parse_value_ == nullptr) return input_value;
  return parse_value_(input_value);
}

absl::StatusOr<Value> ScalarType::ParseLiteral(
    const ValueNode& node, const VariableValues* variables) const {
  if (parse_literal_ != nullptr) return parse_literal_(node, variables);
  return ParseValue(ValueFromAstUntyped(node, variables));
}

// EnumType

EnumType* EnumType::AddValue(std::string name, Value value,
                             std::string description,
                             std::optional<std::string> deprecation_reason) {
  if (!value.is_valid()) {
    value = Value::String(name);
  }
  index_by_name_.emplace(name, static_cast<int>(values_.size()));
  values_.push_back({std::move(name), std::move(value), std::move(description),
                     std::move(deprecation_reason)});
  return this;
}

const EnumValueDefinition* EnumType::FindValue(absl::string_view name) const {
  auto it = index_by_name_.find(name);
  return it == index_by_name_.end() ? nullptr : &values_[it->second];
}

std::vector<std::string> EnumType::SuggestValues(
    absl::string_view unknown) const {
  std::vector<std::string> names;
  names.reserve(values_.size());
  for (const EnumValueDefinition& value : values_) {
    names.push_back(value.name);
  }
  return SuggestionList(unknown, names);
}

absl::StatusOr<Value> EnumType::Serialize(const Value& value) const {
  for (const EnumValueDefinition& definition : values_) {
    if (definition.value.Equals(value)) {
      return Value::String(definition.name);
    }
  }
  return MakeGraphQLError() << "Enum '" << name()
                            << "' cannot represent value: "
                            << value.DebugString();
}

absl::StatusOr<Value> EnumType::ParseValue(const Value& input_value) const {
  if (input_value.is_string()) {
    const EnumValueDefinition* definition =
        FindValue(input_value.string_value());
    if (definition == nullptr) {
      return MakeGraphQLError()
             << "Value '" << input_value.string_value()
             << "' does not exist in '" << name() << "' enum."
             << DidYouMean(SuggestValues(input_value.string_value()),
                           "the enum value");
    }
    return definition->value;
  }
  const std::string value_str = input_value.DebugString();
  return MakeGraphQLError()
         << "Enum '" << name() << "' cannot represent non-string value: "
         << value_str << "."
         << DidYouMean(SuggestValues(value_str), "the enum value");
}

absl::StatusOr<Value> EnumType::ParseLiteral(
    const ValueNode& node, const VariableValues* variables) const {
  if (const EnumValueNode* enum_node = node.GetAsOrNull<EnumValueNode>()) {
    const EnumValueDefinition* definition = FindValue(enum_node->value());
    if (definition == nullptr) {
      return MakeGraphQLError()
             << "Value '" << enum_node->value() << "' does not exist in '"
             << name() << "' enum."
             << DidYouMean(SuggestValues(enum_node->value()),
                           "the enum value");
    }
    return definition->value;
  }
  const std::string value_str = PrintValueNode(node);
  return MakeGraphQLError()
         << "Enum '" << name() << "' cannot represent non-enum value: "
         << value_str << "."
         << DidYouMean(SuggestValues(value_str), "the enum value");
}

// Input values and fields

bool InputValueDefinition::IsRequired() const {
  return type->IsNonNull() && !has_default_value();
}

const InputValueDefinition* FieldDefinition::FindArgument(
    absl::string_view name) const {
  for (const InputValueDefinition& argument : arguments) {
    if (argument.name == name) return &argument;
  }
  return nullptr;
}

const FieldDefinition* FieldsType::AddField(FieldDefinition field) {
  auto owned = std::make_unique<FieldDefinition>(std::move(field));
  const FieldDefinition* stored = owned.get();
  owned_fields_.push_back(std::move(owned));
  field_list_.push_back(stored);
  fields_by_name_[stored->name] = stored;
  return stored;
}

const FieldDefinition* FieldsType::FindField(absl::string_view name) const {
  auto it = fields_by_name_.find(name);
  return it == fields_by_name_.end() ? nullptr : it->second;
}

void FieldsType::AddInterface(const InterfaceType* interface) {
  interfaces_.push_back(interface);
}

bool FieldsType::Implements(const InterfaceType* interface) const {
  for (const InterfaceType* candidate : interfaces_) {
    if (candidate == interface) return true;
  }
  return false;
}

const InputValueDefinition* InputObjectType::AddField(
    InputValueDefinition field) {
  auto owned = std::make_unique<InputValueDefinition>(std::move(field));
  const InputValueDefinition* stored = owned.get();
  owned_fields_.push_back(std::move(owned));
  field_list_.push_back(stored);
  fields_by_name_[stored->name] = stored;
  return stored;
}

const InputValueDefinition* InputObjectType::FindField(
    absl::string_view name) const {
  auto it = fields_by_name_.find(name);
  return it == fields_by_name_.end() ? nullptr : it->second;
}

// TypeFactory

template <typename T>
T* TypeFactory::Own(T* type) {
  absl::MutexLock lock(&mutex_);
  owned_types_.emplace_back(type);
  return type;
}

ScalarType* TypeFactory::MakeScalarType(std::string name,
                                        ScalarType::Options options) {
  return Own(new ScalarType(std::move(name), std::move(options)));
}

EnumType* TypeFactory::MakeEnumType(std::string name,
                                    std::string description) {
  return Own(new EnumType(std::move(name), std::move(description)));
}

ObjectType* TypeFactory::MakeObjectType(std::string name,
                                        std::string description) {
  return Own(new ObjectType(std::move(name), std::move(description)));
}

InterfaceType* TypeFactory::MakeInterfaceType(std::string name,
                                              std::string description) {
  return Own(new InterfaceType(std::move(name), std::move(description)));
}

UnionType* TypeFactory::MakeUnionType(std::string name,
                                      std::string description) {
  return Own(new UnionType(std::move(name), std::move(description)));
}

InputObjectType* TypeFactory::MakeInputObjectType(std::string name,
                                                  std::string description) {
  return Own(new InputObjectType(std::move(name), std::move(description)));
}

const ListType* TypeFactory::MakeListType(const Type* element_type) {
  GQLENGINE_CHECK(element_type != nullptr);
  absl::MutexLock lock(&mutex_);
  const ListType*& list_type = list_types_[element_type];
  if (list_type == nullptr) {
    list_type = new ListType(element_type);
    owned_types_.emplace_back(list_type);
  }
  return list_type;
}

const Type* TypeFactory::MakeNonNullType(const Type* type) {
  GQLENGINE_CHECK(type != nullptr);
  if (type->IsNonNull()) return type;
  absl::MutexLock lock(&mutex_);
  const NonNullType*& non_null_type = non_null_types_[type];
  if (non_null_type == nullptr) {
    non_null_type = new NonNullType(type);
    owned_types_.emplace_back(non_null_type);
  }
  return non_null_type;
}

// Built-in scalars

namespace {

bool IsIntegral(double value) {
  return std::isfinite(value) && value == std::trunc(value);
}

bool InIntRange(double value) {
  return value >= types::kMinInt && value <= types::kMaxInt;
}

absl::StatusOr<Value> SerializeInt(const Value& value) {
  double number = 0;
  if (value.is_bool()) {
    return Value::Int(value.bool_value() ? 1 : 0);
  } else if (value.is_int()) {
    number = static_cast<double>(value.int_value());
  } else if (value.is_float() && IsIntegral(value.float_value())) {
    number = value.float_value();
  } else if (value.is_string() && !value.string_value().empty() &&
             absl::SimpleAtod(value.string_value(), &number) &&
             IsIntegral(number)) {
    // A numeric string.
  } else {
    return MakeGraphQLError() << "Int cannot represent non-integer value: "
                              << value.DebugString();
  }
  if (!InIntRange(number)) {
    return MakeGraphQLError()
           << "Int cannot represent non 32-bit signed integer value: "
           << value.DebugString();
  }
  return Value::Int(static_cast<int64_t>(number));
}

absl::StatusOr<Value> ParseIntValue(const Value& value) {
  double number = 0;
  if (value.is_int()) {
    number = static_cast<double>(value.int_value());
  } else if (value.is_float() && IsIntegral(value.float_value())) {
    number = value.float_value();
  } else {
    return MakeGraphQLError() << "Int cannot represent non-integer value: "
                              << value.DebugString();
  }
  if (!InIntRange(number)) {
    return MakeGraphQLError()
           << "Int cannot represent non 32-bit signed integer value: "
           << value.DebugString();
  }
  return Value::Int(static_cast<int64_t>(number));
}

absl::StatusOr<Value> ParseIntLiteral(const ValueNode& node,
                                      const VariableValues* variables) {
  const IntValueNode* int_node = node.GetAsOrNull<IntValueNode>();
  int64_t number = 0;
  if (int_node != nullptr && absl::SimpleAtoi(int_node->value(), &number) &&
      number >= types::kMinInt && number <= types::kMaxInt) {
    return Value::Int(number);
  }
  return Value();
}

absl::StatusOr<Value> SerializeFloat(const Value& value) {
  double number = 0;
  if (value.is_bool()) {
    return Value::Float(value.bool_value() ? 1 : 0);
  } else if (value.is_number()) {
    number = value.float_value();
  } else if (value.is_string() && !value.string_value().empty() &&
             absl::SimpleAtod(value.string_value(), &number)) {
    // A numeric string.
  } else {
    number = NAN;
  }
  if (!std::isfinite(number)) {
    return MakeGraphQLError() << "Float cannot represent non numeric value: "
                              << value.DebugString();
  }
  return Value::Float(number);
}

absl::StatusOr<Value> ParseFloatValue(const Value& value) {
  if (!value.is_number() || !std::isfinite(value.float_value())) {
    return MakeGraphQLError() << "Float cannot represent non numeric value: "
                              << value.DebugString();
  }
  return Value::Float(value.float_value());
}

absl::StatusOr<Value> ParseFloatLiteral(const ValueNode& node,
                                        const VariableValues* variables) {
  const std::string* text = nullptr;
  if (const FloatValueNode* float_node = node.GetAsOrNull<FloatValueNode>()) {
    text = &float_node->value();
  } else if (const IntValueNode* int_node = node.GetAsOrNull<IntValueNode>()) {
    text = &int_node->value();
  }
  double number = 0;
  if (text != nullptr && absl::SimpleAtod(*text, &number)) {
    return Value::Float(number);
  }
  return Value();
}

absl::StatusOr<Value> SerializeString(const Value& value) {
  if (value.is_string()) return value;
  if (value.is_bool()) {
    return Value::String(value.bool_value() ? "true" : "false");
  }
  if (value.is_int()) return Value::String(absl::StrCat(value.int_value()));
  if (value.is_float() && std::isfinite(value.float_value())) {
    return Value::String(JsonNumber(value.float_value()));
  }
  return MakeGraphQLError() << "String cannot represent value: "
                            << value.DebugString();
}

absl::StatusOr<Value> ParseStringValue(const Value& value) {
  if (!value.is_string()) {
    return MakeGraphQLError() << "String cannot represent a non string value: "
                              << value.DebugString();
  }
  return value;
}

absl::StatusOr<Value> ParseStringLiteral(const ValueNode& node,
                                         const VariableValues* variables) {
  if (const StringValueNode* string_node =
          node.GetAsOrNull<StringValueNode>()) {
    return Value::String(string_node->value());
  }
  return Value();
}

absl::StatusOr<Value> SerializeBoolean(const Value& value) {
  if (value.is_bool()) return value;
  if (value.is_number() && std::isfinite(value.float_value())) {
    return Value::Bool(value.float_value() != 0);
  }
  return MakeGraphQLError() << "Boolean cannot represent a non boolean value: "
                            << value.DebugString();
}

absl::StatusOr<Value> ParseBooleanValue(const Value& value) {
  if (!value.is_bool()) {
    return MakeGraphQLError()
           << "Boolean cannot represent a non boolean value: "
           << value.DebugString();
  }
  return value;
}

absl::StatusOr<Value> ParseBooleanLiteral(const ValueNode& node,
                                          const VariableValues* variables) {
  if (const BooleanValueNode* bool_node =
          node.GetAsOrNull<BooleanValueNode>()) {
    return Value::Bool(bool_node->value());
  }
  return Value();
}

absl::StatusOr<Value> SerializeId(const Value& value) {
  if (value.is_string()) return value;
  if (value.is_int()) return Value::String(absl::StrCat(value.int_value()));
  if (value.is_float() && IsIntegral(value.float_value())) {
    return Value::String(absl::StrFormat("%.0f", value.float_value()));
  }
  return MakeGraphQLError() << "ID cannot represent value: "
                            << value.DebugString();
}

absl::StatusOr<Value> ParseIdValue(const Value& value) {
  if (value.is_string()) return value;
  if (value.is_int()) return Value::String(absl::StrCat(value.int_value()));
  if (value.is_float() && IsIntegral(value.float_value())) {
    return Value::String(absl::StrFormat("%.0f", value.float_value()));
  }
  return MakeGraphQLError() << "ID cannot represent value: "
                            << value.DebugString();
}

absl::StatusOr<Value> ParseIdLiteral(const ValueNode& node,
                                     const VariableValues* variables) {
  if (const StringValueNode* string_node =
          node.GetAsOrNull<StringValueNode>()) {
    return Value::String(string_node->value());
  }
  if (const IntValueNode* int_node = node.GetAsOrNull<IntValueNode>()) {
    return Value::String(int_node->value());
  }
  return Value();
}

TypeFactory* BuiltinTypeFactory() {
  static TypeFactory* factory = new TypeFactory();
  return factory;
}

}  // namespace

namespace types {

const ScalarType* IntType() {
  static const ScalarType* type = BuiltinTypeFactory()->MakeScalarType(
      "Int",
      {.description =
           "The `Int` scalar type represents non-fractional signed whole "
           "numeric values. Int can represent values between -(2^31) and "
           "2^31 - 1.",
       .serialize = &SerializeInt,
       .parse_value = &ParseIntValue,
       .parse_literal = &ParseIntLiteral});
  return type;
}

const ScalarType* FloatType() {
  static const ScalarType* type = BuiltinTypeFactory()->MakeScalarType(
      "Float",
      {.description =
           "The `Float` scalar type represents signed double-precision "
           "fractional values as specified by [IEEE 754]"
           "(https://en.wikipedia.org/wiki/IEEE_floating_point).",
       .serialize = &SerializeFloat,
       .parse_value = &ParseFloatValue,
       .parse_literal = &ParseFloatLiteral});
  return type;
}

const ScalarType* StringType() {
  static const ScalarType* type = BuiltinTypeFactory()->MakeScalarType(
      "String",
      {.description =
           "The `String` scalar type represents textual data, represented "
           "as UTF-8 character sequences. The String type is most often "
           "used by GraphQL to represent free-form human-readable text.",
       .serialize = &SerializeString,
       .parse_value = &ParseStringValue,
       .parse_literal = &ParseStringLiteral});
  return type;
}

const ScalarType* BooleanType() {
  static const ScalarType* type = BuiltinTypeFactory()->MakeScalarType(
      "Boolean",
      {.description =
           "The `Boolean` scalar type represents `true` or `false`.",
       .serialize = &SerializeBoolean,
       .parse_value = &ParseBooleanValue,
       .parse_literal = &ParseBooleanLiteral});
  return type;
}

const ScalarType* IdType() {
  static const ScalarType* type = BuiltinTypeFactory()->MakeScalarType(
      "ID",
      {.description =
           "The `ID` scalar type represents a unique identifier, often used "
           "to refetch an object or as key for a cache. The ID type appears "
           "in a JSON response as a String; however, it is not intended to "
           "be human-readable. When expected as an input type, any string "
           "(such as `\"4\"`) or integer (such as `4`) input value will be "
           "accepted as an ID.",
       .serialize = &SerializeId,
       .parse_value = &ParseIdValue,
       .parse_literal = &ParseIdLiteral});
  return type;
}

const Type* NonNullStringType() {
  static const Type* type = BuiltinTypeFactory()->MakeNonNullType(StringType());
  return type;
}

const std::vector<const ScalarType*>& SpecifiedScalarTypes() {
  static const auto* scalars = new std::vector<const ScalarType*>{
      StringType(), IntType(), FloatType(), BooleanType(), IdType()};
  return *scalars;
}

bool IsSpecifiedScalarType(const Type* type) {
  for (const ScalarType* scalar : SpecifiedScalarTypes()) {
    if (scalar == type) return true;
  }
  return false;
}

}  // namespace types

}  // namespace gqlengine
