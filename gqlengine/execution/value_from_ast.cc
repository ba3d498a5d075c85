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


#include "gqlengine/execution/value_from_ast.h"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/numbers.h"
#include "gqlengine/base/logging.h"

namespace gqlengine {

namespace {

const Value* LookupVariable(const VariableNode& variable,
                            const VariableValues* variables) {
  if (variables == nullptr) return nullptr;
  auto it = variables->find(variable.name());
  if (it == variables->end() || !it->second.is_valid()) return nullptr;
  return &it->second;
}

Value InputObjectFromAst(const ObjectValueNode& object,
                         const InputObjectType* type,
                         const VariableValues* variables) {
  absl::flat_hash_map<std::string, const ObjectFieldNode*> field_nodes;
  for (const ObjectFieldNode* field_node : object.fields()) {
    field_nodes.emplace(field_node->name(), field_node);
  }
  ObjectFields coerced;
  for (const InputValueDefinition* field : type->fields()) {
    auto it = field_nodes.find(field->name);
    if (it == field_nodes.end() ||
        IsMissingVariable(it->second->value(), variables)) {
      if (field->has_default_value()) {
        coerced.emplace_back(field->coerced_name(), field->default_value);
      } else if (field->type->IsNonNull()) {
        return Value();
      }
      continue;
    }
    Value field_value = ValueFromAst(it->second->value(), field->type,
                                     variables);
    if (!field_value.is_valid()) return Value();
    coerced.emplace_back(field->coerced_name(), std::move(field_value));
  }
  if (type->is_one_of()) {
    if (coerced.size() != 1 || coerced[0].second.is_null()) return Value();
  }
  return Value::Object(std::move(coerced));
}

}  // namespace

bool IsMissingVariable(const ValueNode* node,
                       const VariableValues* variables) {
  const VariableNode* variable = node->GetAsOrNull<VariableNode>();
  return variable != nullptr && LookupVariable(*variable, variables) == nullptr;
}

Value ValueFromAst(const ValueNode* node, const Type* type,
                   const VariableValues* variables) {
  if (node == nullptr) return Value();

  if (const VariableNode* variable = node->GetAsOrNull<VariableNode>()) {
    const Value* variable_value = LookupVariable(*variable, variables);
    if (variable_value == nullptr) return Value();
    if (variable_value->is_null() && type->IsNonNull()) return Value();
    // Variables are coerced before execution, so the value is already of
    // the right type.
    return *variable_value;
  }

  if (type->IsNonNull()) {
    if (node->Is<NullValueNode>()) return Value();
    return ValueFromAst(node, type->of_type(), variables);
  }

  if (node->Is<NullValueNode>()) return Value::Null();

  if (const ListType* list_type = type->AsList()) {
    const Type* item_type = list_type->of_type();
    if (const ListValueNode* list = node->GetAsOrNull<ListValueNode>()) {
      std::vector<Value> items;
      items.reserve(list->values().size());
      for (const ValueNode* item_node : list->values()) {
        if (IsMissingVariable(item_node, variables)) {
          // A missing variable inside a list is null rather than omitted.
          if (item_type->IsNonNull()) return Value();
          items.push_back(Value::Null());
          continue;
        }
        Value item = ValueFromAst(item_node, item_type, variables);
        if (!item.is_valid()) return Value();
        items.push_back(std::move(item));
      }
      return Value::List(std::move(items));
    }
    Value item = ValueFromAst(node, item_type, variables);
    if (!item.is_valid()) return Value();
    return Value::List({std::move(item)});
  }

  if (const InputObjectType* input_object = type->AsInputObject()) {
    const ObjectValueNode* object = node->GetAsOrNull<ObjectValueNode>();
    if (object == nullptr) return Value();
    return InputObjectFromAst(*object, input_object, variables);
  }

  absl::StatusOr<Value> parsed;
  if (const ScalarType* scalar = type->AsScalar()) {
    parsed = scalar->ParseLiteral(*node, variables);
  } else if (const EnumType* enum_type = type->AsEnum()) {
    parsed = enum_type->ParseLiteral(*node, variables);
  } else {
    GQLENGINE_DCHECK(false) << "Unexpected input type: " << type->ToString();
    return Value();
  }
  // Parse failures are not reported here; the caller decides what to say.
  if (!parsed.ok()) return Value();
  return *std::move(parsed);
}

Value ValueFromAstUntyped(const ValueNode& node,
                          const VariableValues* variables) {
  switch (node.node_kind()) {
    case NodeKind::kNullValue:
      return Value::Null();
    case NodeKind::kIntValue: {
      const std::string& text = node.GetAsOrDie<IntValueNode>()->value();
      int64_t number;
      if (absl::SimpleAtoi(text, &number)) return Value::Int(number);
      double big;
      if (absl::SimpleAtod(text, &big)) return Value::Float(big);
      return Value();
    }
    case NodeKind::kFloatValue: {
      double number;
      if (!absl::SimpleAtod(node.GetAsOrDie<FloatValueNode>()->value(),
                            &number)) {
        return Value();
      }
      return Value::Float(number);
    }
    case NodeKind::kStringValue:
      return Value::String(node.GetAsOrDie<StringValueNode>()->value());
    case NodeKind::kEnumValue:
      return Value::String(node.GetAsOrDie<EnumValueNode>()->value());
    case NodeKind::kBooleanValue:
      return Value::Bool(node.GetAsOrDie<BooleanValueNode>()->value());
    case NodeKind::kListValue: {
      std::vector<Value> items;
      for (const ValueNode* item : node.GetAsOrDie<ListValueNode>()->values()) {
        items.push_back(ValueFromAstUntyped(*item, variables));
      }
      return Value::List(std::move(items));
    }
    case NodeKind::kObjectValue: {
      ObjectFields fields;
      for (const ObjectFieldNode* field :
           node.GetAsOrDie<ObjectValueNode>()->fields()) {
        fields.emplace_back(field->name(),
                            ValueFromAstUntyped(*field->value(), variables));
      }
      return Value::Object(std::move(fields));
    }
    case NodeKind::kVariable: {
      const Value* value =
          LookupVariable(*node.GetAsOrDie<VariableNode>(), variables);
      return value == nullptr ? Value() : *value;
    }
    default:
      GQLENGINE_DCHECK(false) << "Unexpected value node: "
                              << node.GetNodeKindString();
      return Value();
  }
}

}  // namespace gqlengine
