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


#include "gqlengine/language/ast.h"

#include <string>

#include "absl/strings/string_view.h"

namespace gqlengine {

absl::string_view OperationTypeName(OperationType operation) {
  switch (operation) {
    case OperationType::kQuery:
      return "query";
    case OperationType::kMutation:
      return "mutation";
    case OperationType::kSubscription:
      return "subscription";
  }
  return "query";
}

std::string Node::NodeKindToString(NodeKind node_kind) {
  switch (node_kind) {
    case NodeKind::kDocument:
      return "Document";
    case NodeKind::kOperationDefinition:
      return "OperationDefinition";
    case NodeKind::kVariableDefinition:
      return "VariableDefinition";
    case NodeKind::kFragmentDefinition:
      return "FragmentDefinition";
    case NodeKind::kSelectionSet:
      return "SelectionSet";
    case NodeKind::kField:
      return "Field";
    case NodeKind::kFragmentSpread:
      return "FragmentSpread";
    case NodeKind::kInlineFragment:
      return "InlineFragment";
    case NodeKind::kArgument:
      return "Argument";
    case NodeKind::kDirective:
      return "Directive";
    case NodeKind::kVariable:
      return "Variable";
    case NodeKind::kIntValue:
      return "IntValue";
    case NodeKind::kFloatValue:
      return "FloatValue";
    case NodeKind::kStringValue:
      return "StringValue";
    case NodeKind::kBooleanValue:
      return "BooleanValue";
    case NodeKind::kNullValue:
      return "NullValue";
    case NodeKind::kEnumValue:
      return "EnumValue";
    case NodeKind::kListValue:
      return "ListValue";
    case NodeKind::kObjectValue:
      return "ObjectValue";
    case NodeKind::kObjectField:
      return "ObjectField";
    case NodeKind::kNamedType:
      return "NamedType";
    case NodeKind::kListType:
      return "ListType";
    case NodeKind::kNonNullType:
      return "NonNullType";
  }
  return "<unknown node kind>";
}

const DirectiveNode* DirectivesHolder::FindDirective(
    absl::string_view name) const {
  for (const DirectiveNode* directive : directives_) {
    if (directive->name() == name) return directive;
  }
  return nullptr;
}

}  // namespace gqlengine
