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


#include "gqlengine/language/printer.h"

#include <string>

#include "absl/strings/str_cat.h"
#include "gqlengine/common/json_util.h"
#include "gqlengine/language/ast.h"

namespace gqlengine {

namespace {

void AppendValue(const ValueNode& value, std::string* out) {
  switch (value.node_kind()) {
    case NodeKind::kVariable:
      absl::StrAppend(out, "$", value.GetAsOrDie<VariableNode>()->name());
      return;
    case NodeKind::kIntValue:
      absl::StrAppend(out, value.GetAsOrDie<IntValueNode>()->value());
      return;
    case NodeKind::kFloatValue:
      absl::StrAppend(out, value.GetAsOrDie<FloatValueNode>()->value());
      return;
    case NodeKind::kStringValue:
      JsonEscapeString(value.GetAsOrDie<StringValueNode>()->value(), out);
      return;
    case NodeKind::kBooleanValue:
      absl::StrAppend(
          out, value.GetAsOrDie<BooleanValueNode>()->value() ? "true" : "false");
      return;
    case NodeKind::kNullValue:
      absl::StrAppend(out, "null");
      return;
    case NodeKind::kEnumValue:
      absl::StrAppend(out, value.GetAsOrDie<EnumValueNode>()->value());
      return;
    case NodeKind::kListValue: {
      out->push_back('[');
      bool first = true;
      for (const ValueNode* item : value.GetAsOrDie<ListValueNode>()->values()) {
        if (!first) absl::StrAppend(out, ", ");
        first = false;
        AppendValue(*item, out);
      }
      out->push_back(']');
      return;
    }
    case NodeKind::kObjectValue: {
      out->push_back('{');
      bool first = true;
      for (const ObjectFieldNode* field :
           value.GetAsOrDie<ObjectValueNode>()->fields()) {
        if (!first) absl::StrAppend(out, ", ");
        first = false;
        absl::StrAppend(out, field->name(), ": ");
        AppendValue(*field->value(), out);
      }
      out->push_back('}');
      return;
    }
    default:
      absl::StrAppend(out, "<", value.GetNodeKindString(), ">");
      return;
  }
}

}  // namespace

std::string PrintValueNode(const ValueNode& value) {
  std::string out;
  AppendValue(value, &out);
  return out;
}

std::string PrintTypeNode(const TypeNode& type) {
  switch (type.node_kind()) {
    case NodeKind::kNamedType:
      return type.GetAsOrDie<NamedTypeNode>()->name();
    case NodeKind::kListType:
      return absl::StrCat(
          "[", PrintTypeNode(*type.GetAsOrDie<ListTypeNode>()->type()), "]");
    case NodeKind::kNonNullType:
      return absl::StrCat(
          PrintTypeNode(*type.GetAsOrDie<NonNullTypeNode>()->type()), "!");
    default:
      return absl::StrCat("<", type.GetNodeKindString(), ">");
  }
}

}  // namespace gqlengine
