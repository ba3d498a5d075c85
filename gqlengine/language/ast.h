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


#ifndef GQLENGINE_LANGUAGE_AST_H_
#define GQLENGINE_LANGUAGE_AST_H_

// Parse tree of the executable subset of the GraphQL language. Nodes are
// created by the parser, owned by a ParserOutput and immutable afterwards.
// Child links are plain const pointers that stay valid for the lifetime of
// the owning ParserOutput.

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/string_view.h"
#include "absl/types/variant.h"
#include "gqlengine/base/logging.h"
#include "gqlengine/language/source.h"

namespace gqlengine {

enum class NodeKind {
  kDocument,
  kOperationDefinition,
  kVariableDefinition,
  kFragmentDefinition,
  kSelectionSet,
  kField,
  kFragmentSpread,
  kInlineFragment,
  kArgument,
  kDirective,
  kVariable,
  kIntValue,
  kFloatValue,
  kStringValue,
  kBooleanValue,
  kNullValue,
  kEnumValue,
  kListValue,
  kObjectValue,
  kObjectField,
  kNamedType,
  kListType,
  kNonNullType,
};

enum class OperationType {
  kQuery,
  kMutation,
  kSubscription,
};

// Returns "query", "mutation" or "subscription".
absl::string_view OperationTypeName(OperationType operation);

// Half-open byte range [start, end) in `source`.
struct Location {
  int start = -1;
  int end = -1;
  const Source* source = nullptr;

  bool valid() const { return source != nullptr && start >= 0; }
};

// Base class for all parse tree nodes.
class Node {
 public:
  explicit Node(NodeKind node_kind) : node_kind_(node_kind) {}
  Node(const Node&) = delete;
  Node& operator=(const Node&) = delete;
  virtual ~Node() = default;

  NodeKind node_kind() const { return node_kind_; }

  const Location& location() const { return location_; }
  void set_location(const Location& location) { location_ = location; }

  // Returns whether or not this node is a specific node type.
  template <typename NodeType>
  bool Is() const {
    return node_kind_ == NodeType::kConcreteNodeKind;
  }

  // Return this node cast as a NodeType, or null if this is not possible.
  template <typename NodeType>
  const NodeType* GetAsOrNull() const {
    if (!Is<NodeType>()) return nullptr;
    return static_cast<const NodeType*>(this);
  }

  // Return this node cast as a NodeType. Crashes if the kind does not match.
  template <typename NodeType>
  const NodeType* GetAsOrDie() const {
    const NodeType* as_node_type = GetAsOrNull<NodeType>();
    GQLENGINE_CHECK(as_node_type != nullptr)
        << "Could not cast " << GetNodeKindString()
        << " to the specified NodeType";
    return as_node_type;
  }

  std::string GetNodeKindString() const { return NodeKindToString(node_kind_); }

  static std::string NodeKindToString(NodeKind node_kind);

 private:
  const NodeKind node_kind_;
  Location location_;
};

// ----------------------------------------------------------------------------
// Values and types.

class ValueNode : public Node {
 public:
  using Node::Node;
};

class VariableNode final : public ValueNode {
 public:
  static constexpr NodeKind kConcreteNodeKind = NodeKind::kVariable;
  explicit VariableNode(std::string name)
      : ValueNode(kConcreteNodeKind), name_(std::move(name)) {}

  const std::string& name() const { return name_; }

 private:
  std::string name_;
};

class IntValueNode final : public ValueNode {
 public:
  static constexpr NodeKind kConcreteNodeKind = NodeKind::kIntValue;
  explicit IntValueNode(std::string value)
      : ValueNode(kConcreteNodeKind), value_(std::move(value)) {}

  // The literal digits, e.g. "-12".
  const std::string& value() const { return value_; }

 private:
  std::string value_;
};

class FloatValueNode final : public ValueNode {
 public:
  static constexpr NodeKind kConcreteNodeKind = NodeKind::kFloatValue;
  explicit FloatValueNode(std::string value)
      : ValueNode(kConcreteNodeKind), value_(std::move(value)) {}

  const std::string& value() const { return value_; }

 private:
  std::string value_;
};

class StringValueNode final : public ValueNode {
 public:
  static constexpr NodeKind kConcreteNodeKind = NodeKind::kStringValue;
  StringValueNode(std::string value, bool block)
      : ValueNode(kConcreteNodeKind), value_(std::move(value)), block_(block) {}

  // The decoded value, with escapes and block string indentation resolved.
  const std::string& value() const { return value_; }
  bool block() const { return block_; }

 private:
  std::string value_;
  bool block_;
};

class BooleanValueNode final : public ValueNode {
 public:
  static constexpr NodeKind kConcreteNodeKind = NodeKind::kBooleanValue;
  explicit BooleanValueNode(bool value)
      : ValueNode(kConcreteNodeKind), value_(value) {}

  bool value() const { return value_; }

 private:
  bool value_;
};

class NullValueNode final : public ValueNode {
 public:
  static constexpr NodeKind kConcreteNodeKind = NodeKind::kNullValue;
  NullValueNode() : ValueNode(kConcreteNodeKind) {}
};

class EnumValueNode final : public ValueNode {
 public:
  static constexpr NodeKind kConcreteNodeKind = NodeKind::kEnumValue;
  explicit EnumValueNode(std::string value)
      : ValueNode(kConcreteNodeKind), value_(std::move(value)) {}

  const std::string& value() const { return value_; }

 private:
  std::string value_;
};

class ListValueNode final : public ValueNode {
 public:
  static constexpr NodeKind kConcreteNodeKind = NodeKind::kListValue;
  ListValueNode() : ValueNode(kConcreteNodeKind) {}

  const std::vector<const ValueNode*>& values() const { return values_; }
  void add_value(const ValueNode* value) { values_.push_back(value); }

 private:
  std::vector<const ValueNode*> values_;
};

class ObjectFieldNode final : public Node {
 public:
  static constexpr NodeKind kConcreteNodeKind = NodeKind::kObjectField;
  ObjectFieldNode(std::string name, const ValueNode* value)
      : Node(kConcreteNodeKind), name_(std::move(name)), value_(value) {}

  const std::string& name() const { return name_; }
  const ValueNode* value() const { return value_; }

 private:
  std::string name_;
  const ValueNode* value_;
};

class ObjectValueNode final : public ValueNode {
 public:
  static constexpr NodeKind kConcreteNodeKind = NodeKind::kObjectValue;
  ObjectValueNode() : ValueNode(kConcreteNodeKind) {}

  const std::vector<const ObjectFieldNode*>& fields() const { return fields_; }
  void add_field(const ObjectFieldNode* field) { fields_.push_back(field); }

 private:
  std::vector<const ObjectFieldNode*> fields_;
};

class TypeNode : public Node {
 public:
  using Node::Node;
};

class NamedTypeNode final : public TypeNode {
 public:
  static constexpr NodeKind kConcreteNodeKind = NodeKind::kNamedType;
  explicit NamedTypeNode(std::string name)
      : TypeNode(kConcreteNodeKind), name_(std::move(name)) {}

  const std::string& name() const { return name_; }

 private:
  std::string name_;
};

class ListTypeNode final : public TypeNode {
 public:
  static constexpr NodeKind kConcreteNodeKind = NodeKind::kListType;
  explicit ListTypeNode(const TypeNode* type)
      : TypeNode(kConcreteNodeKind), type_(type) {}

  const TypeNode* type() const { return type_; }

 private:
  const TypeNode* type_;
};

class NonNullTypeNode final : public TypeNode {
 public:
  static constexpr NodeKind kConcreteNodeKind = NodeKind::kNonNullType;
  explicit NonNullTypeNode(const TypeNode* type)
      : TypeNode(kConcreteNodeKind), type_(type) {}

  // Never a NonNullTypeNode.
  const TypeNode* type() const { return type_; }

 private:
  const TypeNode* type_;
};

// ----------------------------------------------------------------------------
// Arguments and directives.

class ArgumentNode final : public Node {
 public:
  static constexpr NodeKind kConcreteNodeKind = NodeKind::kArgument;
  ArgumentNode(std::string name, const ValueNode* value)
      : Node(kConcreteNodeKind), name_(std::move(name)), value_(value) {}

  const std::string& name() const { return name_; }
  const ValueNode* value() const { return value_; }

 private:
  std::string name_;
  const ValueNode* value_;
};

class DirectiveNode final : public Node {
 public:
  static constexpr NodeKind kConcreteNodeKind = NodeKind::kDirective;
  explicit DirectiveNode(std::string name)
      : Node(kConcreteNodeKind), name_(std::move(name)) {}

  const std::string& name() const { return name_; }
  const std::vector<const ArgumentNode*>& arguments() const {
    return arguments_;
  }
  void add_argument(const ArgumentNode* argument) {
    arguments_.push_back(argument);
  }

 private:
  std::string name_;
  std::vector<const ArgumentNode*> arguments_;
};

// Shared by every node that may carry directives.
class DirectivesHolder {
 public:
  const std::vector<const DirectiveNode*>& directives() const {
    return directives_;
  }
  void add_directive(const DirectiveNode* directive) {
    directives_.push_back(directive);
  }

  // Returns the first directive named `name`, or null.
  const DirectiveNode* FindDirective(absl::string_view name) const;

 private:
  std::vector<const DirectiveNode*> directives_;
};

// ----------------------------------------------------------------------------
// Selections.

class SelectionSetNode;

class SelectionNode : public Node, public DirectivesHolder {
 public:
  using Node::Node;
};

class FieldNode final : public SelectionNode {
 public:
  static constexpr NodeKind kConcreteNodeKind = NodeKind::kField;
  FieldNode(std::string alias, std::string name)
      : SelectionNode(kConcreteNodeKind),
        alias_(std::move(alias)),
        name_(std::move(name)) {}

  // Empty when the field has no alias.
  const std::string& alias() const { return alias_; }
  const std::string& name() const { return name_; }

  // The key under which this field appears in the response.
  const std::string& response_key() const {
    return alias_.empty() ? name_ : alias_;
  }

  const std::vector<const ArgumentNode*>& arguments() const {
    return arguments_;
  }
  void add_argument(const ArgumentNode* argument) {
    arguments_.push_back(argument);
  }

  // Null for leaf fields.
  const SelectionSetNode* selection_set() const { return selection_set_; }
  void set_selection_set(const SelectionSetNode* selection_set) {
    selection_set_ = selection_set;
  }

 private:
  std::string alias_;
  std::string name_;
  std::vector<const ArgumentNode*> arguments_;
  const SelectionSetNode* selection_set_ = nullptr;
};

class FragmentSpreadNode final : public SelectionNode {
 public:
  static constexpr NodeKind kConcreteNodeKind = NodeKind::kFragmentSpread;
  explicit FragmentSpreadNode(std::string name)
      : SelectionNode(kConcreteNodeKind), name_(std::move(name)) {}

  const std::string& name() const { return name_; }

 private:
  std::string name_;
};

class InlineFragmentNode final : public SelectionNode {
 public:
  static constexpr NodeKind kConcreteNodeKind = NodeKind::kInlineFragment;
  InlineFragmentNode() : SelectionNode(kConcreteNodeKind) {}

  // Null when the fragment has no type condition.
  const NamedTypeNode* type_condition() const { return type_condition_; }
  void set_type_condition(const NamedTypeNode* type_condition) {
    type_condition_ = type_condition;
  }

  const SelectionSetNode* selection_set() const { return selection_set_; }
  void set_selection_set(const SelectionSetNode* selection_set) {
    selection_set_ = selection_set;
  }

 private:
  const NamedTypeNode* type_condition_ = nullptr;
  const SelectionSetNode* selection_set_ = nullptr;
};

class SelectionSetNode final : public Node {
 public:
  static constexpr NodeKind kConcreteNodeKind = NodeKind::kSelectionSet;
  SelectionSetNode() : Node(kConcreteNodeKind) {}

  const std::vector<const SelectionNode*>& selections() const {
    return selections_;
  }
  void add_selection(const SelectionNode* selection) {
    selections_.push_back(selection);
  }

 private:
  std::vector<const SelectionNode*> selections_;
};

// ----------------------------------------------------------------------------
// Definitions.

class DefinitionNode : public Node, public DirectivesHolder {
 public:
  using Node::Node;
};

class VariableDefinitionNode final : public Node, public DirectivesHolder {
 public:
  static constexpr NodeKind kConcreteNodeKind = NodeKind::kVariableDefinition;
  VariableDefinitionNode(const VariableNode* variable, const TypeNode* type,
                         const ValueNode* default_value)
      : Node(kConcreteNodeKind),
        variable_(variable),
        type_(type),
        default_value_(default_value) {}

  const VariableNode* variable() const { return variable_; }
  const TypeNode* type() const { return type_; }
  // Null when no default is given.
  const ValueNode* default_value() const { return default_value_; }

 private:
  const VariableNode* variable_;
  const TypeNode* type_;
  const ValueNode* default_value_;
};

class OperationDefinitionNode final : public DefinitionNode {
 public:
  static constexpr NodeKind kConcreteNodeKind = NodeKind::kOperationDefinition;
  OperationDefinitionNode(OperationType operation, std::string name)
      : DefinitionNode(kConcreteNodeKind),
        operation_(operation),
        name_(std::move(name)) {}

  OperationType operation() const { return operation_; }
  // Empty for anonymous operations.
  const std::string& name() const { return name_; }

  const std::vector<const VariableDefinitionNode*>& variable_definitions()
      const {
    return variable_definitions_;
  }
  void add_variable_definition(const VariableDefinitionNode* definition) {
    variable_definitions_.push_back(definition);
  }

  const SelectionSetNode* selection_set() const { return selection_set_; }
  void set_selection_set(const SelectionSetNode* selection_set) {
    selection_set_ = selection_set;
  }

 private:
  OperationType operation_;
  std::string name_;
  std::vector<const VariableDefinitionNode*> variable_definitions_;
  const SelectionSetNode* selection_set_ = nullptr;
};

class FragmentDefinitionNode final : public DefinitionNode {
 public:
  static constexpr NodeKind kConcreteNodeKind = NodeKind::kFragmentDefinition;
  FragmentDefinitionNode(std::string name, const NamedTypeNode* type_condition)
      : DefinitionNode(kConcreteNodeKind),
        name_(std::move(name)),
        type_condition_(type_condition) {}

  const std::string& name() const { return name_; }
  const NamedTypeNode* type_condition() const { return type_condition_; }

  const SelectionSetNode* selection_set() const { return selection_set_; }
  void set_selection_set(const SelectionSetNode* selection_set) {
    selection_set_ = selection_set;
  }

 private:
  std::string name_;
  const NamedTypeNode* type_condition_;
  const SelectionSetNode* selection_set_ = nullptr;
};

class DocumentNode final : public Node {
 public:
  static constexpr NodeKind kConcreteNodeKind = NodeKind::kDocument;
  DocumentNode() : Node(kConcreteNodeKind) {}

  const std::vector<const DefinitionNode*>& definitions() const {
    return definitions_;
  }
  void add_definition(const DefinitionNode* definition) {
    definitions_.push_back(definition);
  }

 private:
  std::vector<const DefinitionNode*> definitions_;
};

// ----------------------------------------------------------------------------

// Owns the nodes created while parsing one input.
class NodeArena {
 public:
  NodeArena() = default;
  NodeArena(const NodeArena&) = delete;
  NodeArena& operator=(const NodeArena&) = delete;

  template <typename NodeType, typename... Args>
  NodeType* New(Args&&... args) {
    auto node = std::make_unique<NodeType>(std::forward<Args>(args)...);
    NodeType* raw = node.get();
    nodes_.push_back(std::move(node));
    return raw;
  }

  size_t size() const { return nodes_.size(); }

 private:
  std::vector<std::unique_ptr<Node>> nodes_;
};

// The result of parsing. Keeps the Source and every node alive; pointers
// obtained from it must not outlive it.
class ParserOutput {
 public:
  using Root = absl::variant<const DocumentNode*, const ValueNode*,
                             const TypeNode*>;

  ParserOutput(std::shared_ptr<const Source> source,
               std::unique_ptr<NodeArena> arena, Root root)
      : source_(std::move(source)), arena_(std::move(arena)), root_(root) {}
  ParserOutput(const ParserOutput&) = delete;
  ParserOutput& operator=(const ParserOutput&) = delete;

  // Each getter returns null unless the matching Parse* function produced
  // this output.
  const DocumentNode* document() const { return GetRootAs<DocumentNode>(); }
  const ValueNode* value() const { return GetRootAs<ValueNode>(); }
  const TypeNode* type() const { return GetRootAs<TypeNode>(); }

  const Source& source() const { return *source_; }

 private:
  template <typename T>
  const T* GetRootAs() const {
    const T* const* node = absl::get_if<const T*>(&root_);
    return node == nullptr ? nullptr : *node;
  }

  // Destroyed after the nodes, which point into it.
  std::shared_ptr<const Source> source_;
  std::unique_ptr<NodeArena> arena_;
  Root root_;
};

}  // namespace gqlengine

#endif  // GQLENGINE_LANGUAGE_AST_H_
