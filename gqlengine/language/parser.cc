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


#include "gqlengine/language/parser.h"

#include <memory>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "gqlengine/base/logging.h"
#include "gqlengine/base/status_macros.h"
#include "gqlengine/language/ast.h"
#include "gqlengine/language/lexer.h"
#include "gqlengine/language/source.h"

namespace gqlengine {

namespace {

bool IsTypeSystemKeyword(absl::string_view name) {
  return name == "schema" || name == "scalar" || name == "type" ||
         name == "interface" || name == "union" || name == "enum" ||
         name == "input" || name == "directive" || name == "extend";
}

// Recursive descent parser over the token stream of one Source. Each Parse*
// method expects the lexer to be positioned on the first token of its
// production and leaves it on the first token after it.
class Parser {
 public:
  explicit Parser(std::shared_ptr<const Source> source)
      : source_(std::move(source)),
        lexer_(source_.get()),
        arena_(std::make_unique<NodeArena>()) {}
  Parser(const Parser&) = delete;
  Parser& operator=(const Parser&) = delete;

  absl::StatusOr<std::unique_ptr<ParserOutput>> ParseDocumentOutput() {
    GQLENGINE_ASSIGN_OR_RETURN(const DocumentNode* document, ParseDocument());
    return Finish(document);
  }

  absl::StatusOr<std::unique_ptr<ParserOutput>> ParseValueOutput(
      bool is_const) {
    GQLENGINE_RETURN_IF_ERROR(ExpectToken(TokenKind::kStartOfFile));
    GQLENGINE_ASSIGN_OR_RETURN(const ValueNode* value,
                               ParseValueLiteral(is_const));
    GQLENGINE_RETURN_IF_ERROR(ExpectToken(TokenKind::kEndOfFile));
    return Finish(value);
  }

  absl::StatusOr<std::unique_ptr<ParserOutput>> ParseTypeOutput() {
    GQLENGINE_RETURN_IF_ERROR(ExpectToken(TokenKind::kStartOfFile));
    GQLENGINE_ASSIGN_OR_RETURN(const TypeNode* type, ParseTypeReference());
    GQLENGINE_RETURN_IF_ERROR(ExpectToken(TokenKind::kEndOfFile));
    return Finish(type);
  }

 private:
  std::unique_ptr<ParserOutput> Finish(ParserOutput::Root root) {
    GQLENGINE_VLOG(3) << "Parsed " << source_->name() << " into "
                      << arena_->size() << " nodes";
    return std::make_unique<ParserOutput>(std::move(source_),
                                          std::move(arena_), root);
  }

  // --------------------------------------------------------------------------
  // Token helpers.

  const Token& token() const { return lexer_.token(); }

  bool Peek(TokenKind kind) const { return token().kind == kind; }

  Location LocationFrom(const Token& start_token) const {
    Location location;
    location.start = start_token.start;
    location.end = lexer_.last_token().end;
    location.source = source_.get();
    return location;
  }

  template <typename NodeType>
  void SetLocation(NodeType* node, const Token& start_token) const {
    node->set_location(LocationFrom(start_token));
  }

  absl::Status Unexpected(const Token& at_token) const {
    return MakeSyntaxError(*source_, at_token.start,
                           absl::StrCat("Unexpected ",
                                        TokenDescription(at_token), "."));
  }
  absl::Status Unexpected() const { return Unexpected(token()); }

  // Consumes a token of `kind`, or fails with "Expected <kind>, found ...".
  absl::Status ExpectToken(TokenKind kind) {
    if (token().kind == kind) return lexer_.Advance();
    return MakeSyntaxError(
        *source_, token().start,
        absl::StrCat("Expected ", TokenKindDescription(kind), ", found ",
                     TokenDescription(token()), "."));
  }

  // Consumes a token of `kind` if it is next. Sets `*found` accordingly.
  absl::Status ExpectOptionalToken(TokenKind kind, bool* found) {
    *found = token().kind == kind;
    if (*found) return lexer_.Advance();
    return absl::OkStatus();
  }

  bool PeekKeyword(absl::string_view value) const {
    return token().kind == TokenKind::kName && token().value == value;
  }

  absl::Status ExpectKeyword(absl::string_view value) {
    if (PeekKeyword(value)) return lexer_.Advance();
    return MakeSyntaxError(*source_, token().start,
                           absl::StrCat("Expected \"", value, "\", found ",
                                        TokenDescription(token()), "."));
  }

  absl::Status ExpectOptionalKeyword(absl::string_view value, bool* found) {
    *found = PeekKeyword(value);
    if (*found) return lexer_.Advance();
    return absl::OkStatus();
  }

  // Parses `open item+ close`; each item is handed to `add`.
  template <typename ParseItem>
  absl::Status Many(TokenKind open, ParseItem parse_item, TokenKind close) {
    GQLENGINE_RETURN_IF_ERROR(ExpectToken(open));
    bool done = false;
    while (!done) {
      GQLENGINE_RETURN_IF_ERROR(parse_item());
      GQLENGINE_RETURN_IF_ERROR(ExpectOptionalToken(close, &done));
    }
    return absl::OkStatus();
  }

  // Parses `open item* close`.
  template <typename ParseItem>
  absl::Status Any(TokenKind open, ParseItem parse_item, TokenKind close) {
    GQLENGINE_RETURN_IF_ERROR(ExpectToken(open));
    while (true) {
      bool done;
      GQLENGINE_RETURN_IF_ERROR(ExpectOptionalToken(close, &done));
      if (done) break;
      GQLENGINE_RETURN_IF_ERROR(parse_item());
    }
    return absl::OkStatus();
  }

  // Parses `(open item+ close)?`.
  template <typename ParseItem>
  absl::Status OptionalMany(TokenKind open, ParseItem parse_item,
                            TokenKind close) {
    if (!Peek(open)) return absl::OkStatus();
    return Many(open, parse_item, close);
  }

  absl::StatusOr<std::string> ParseName() {
    std::string name = token().value;
    GQLENGINE_RETURN_IF_ERROR(ExpectToken(TokenKind::kName));
    return name;
  }

  // --------------------------------------------------------------------------
  // Document.

  absl::StatusOr<const DocumentNode*> ParseDocument() {
    const Token start = token();
    DocumentNode* document = arena_->New<DocumentNode>();
    GQLENGINE_RETURN_IF_ERROR(Many(
        TokenKind::kStartOfFile,
        [this, document]() -> absl::Status {
          GQLENGINE_ASSIGN_OR_RETURN(const DefinitionNode* definition,
                                     ParseDefinition());
          document->add_definition(definition);
          return absl::OkStatus();
        },
        TokenKind::kEndOfFile));
    SetLocation(document, start);
    return document;
  }

  absl::StatusOr<const DefinitionNode*> ParseDefinition() {
    if (Peek(TokenKind::kBraceL)) return ParseOperationDefinition();
    if (Peek(TokenKind::kString) || Peek(TokenKind::kBlockString)) {
      // Descriptions only precede type system definitions.
      return Unexpected();
    }
    if (Peek(TokenKind::kName)) {
      const std::string& keyword = token().value;
      if (keyword == "query" || keyword == "mutation" ||
          keyword == "subscription") {
        return ParseOperationDefinition();
      }
      if (keyword == "fragment") return ParseFragmentDefinition();
      if (IsTypeSystemKeyword(keyword)) return Unexpected();
    }
    return Unexpected();
  }

  absl::StatusOr<const DefinitionNode*> ParseOperationDefinition() {
    const Token start = token();
    if (Peek(TokenKind::kBraceL)) {
      // Query shorthand.
      OperationDefinitionNode* operation =
          arena_->New<OperationDefinitionNode>(OperationType::kQuery, "");
      GQLENGINE_ASSIGN_OR_RETURN(const SelectionSetNode* selection_set,
                                 ParseSelectionSet());
      operation->set_selection_set(selection_set);
      SetLocation(operation, start);
      return operation;
    }
    GQLENGINE_ASSIGN_OR_RETURN(const OperationType operation_type,
                               ParseOperationType());
    std::string name;
    if (Peek(TokenKind::kName)) {
      GQLENGINE_ASSIGN_OR_RETURN(name, ParseName());
    }
    OperationDefinitionNode* operation =
        arena_->New<OperationDefinitionNode>(operation_type, std::move(name));
    GQLENGINE_RETURN_IF_ERROR(OptionalMany(
        TokenKind::kParenL,
        [this, operation]() -> absl::Status {
          GQLENGINE_ASSIGN_OR_RETURN(const VariableDefinitionNode* definition,
                                     ParseVariableDefinition());
          operation->add_variable_definition(definition);
          return absl::OkStatus();
        },
        TokenKind::kParenR));
    GQLENGINE_RETURN_IF_ERROR(ParseDirectives(/*is_const=*/false, operation));
    GQLENGINE_ASSIGN_OR_RETURN(const SelectionSetNode* selection_set,
                               ParseSelectionSet());
    operation->set_selection_set(selection_set);
    SetLocation(operation, start);
    return operation;
  }

  absl::StatusOr<OperationType> ParseOperationType() {
    const Token operation_token = token();
    GQLENGINE_RETURN_IF_ERROR(ExpectToken(TokenKind::kName));
    if (operation_token.value == "query") return OperationType::kQuery;
    if (operation_token.value == "mutation") return OperationType::kMutation;
    if (operation_token.value == "subscription") {
      return OperationType::kSubscription;
    }
    return Unexpected(operation_token);
  }

  absl::StatusOr<const VariableDefinitionNode*> ParseVariableDefinition() {
    const Token start = token();
    GQLENGINE_ASSIGN_OR_RETURN(const VariableNode* variable, ParseVariable());
    GQLENGINE_RETURN_IF_ERROR(ExpectToken(TokenKind::kColon));
    GQLENGINE_ASSIGN_OR_RETURN(const TypeNode* type, ParseTypeReference());
    const ValueNode* default_value = nullptr;
    bool has_default;
    GQLENGINE_RETURN_IF_ERROR(
        ExpectOptionalToken(TokenKind::kEquals, &has_default));
    if (has_default) {
      GQLENGINE_ASSIGN_OR_RETURN(default_value,
                                 ParseValueLiteral(/*is_const=*/true));
    }
    VariableDefinitionNode* definition =
        arena_->New<VariableDefinitionNode>(variable, type, default_value);
    GQLENGINE_RETURN_IF_ERROR(ParseDirectives(/*is_const=*/true, definition));
    SetLocation(definition, start);
    return definition;
  }

  absl::StatusOr<const VariableNode*> ParseVariable() {
    const Token start = token();
    GQLENGINE_RETURN_IF_ERROR(ExpectToken(TokenKind::kDollar));
    GQLENGINE_ASSIGN_OR_RETURN(std::string name, ParseName());
    VariableNode* variable = arena_->New<VariableNode>(std::move(name));
    SetLocation(variable, start);
    return variable;
  }

  // --------------------------------------------------------------------------
  // Selections.

  absl::StatusOr<const SelectionSetNode*> ParseSelectionSet() {
    const Token start = token();
    SelectionSetNode* selection_set = arena_->New<SelectionSetNode>();
    GQLENGINE_RETURN_IF_ERROR(Many(
        TokenKind::kBraceL,
        [this, selection_set]() -> absl::Status {
          GQLENGINE_ASSIGN_OR_RETURN(const SelectionNode* selection,
                                     ParseSelection());
          selection_set->add_selection(selection);
          return absl::OkStatus();
        },
        TokenKind::kBraceR));
    SetLocation(selection_set, start);
    return selection_set;
  }

  absl::StatusOr<const SelectionNode*> ParseSelection() {
    if (Peek(TokenKind::kSpread)) return ParseFragment();
    return ParseField();
  }

  absl::StatusOr<const SelectionNode*> ParseField() {
    const Token start = token();
    GQLENGINE_ASSIGN_OR_RETURN(std::string name_or_alias, ParseName());
    std::string alias;
    std::string name;
    bool has_alias;
    GQLENGINE_RETURN_IF_ERROR(
        ExpectOptionalToken(TokenKind::kColon, &has_alias));
    if (has_alias) {
      alias = std::move(name_or_alias);
      GQLENGINE_ASSIGN_OR_RETURN(name, ParseName());
    } else {
      name = std::move(name_or_alias);
    }
    FieldNode* field =
        arena_->New<FieldNode>(std::move(alias), std::move(name));
    GQLENGINE_RETURN_IF_ERROR(OptionalMany(
        TokenKind::kParenL,
        [this, field]() -> absl::Status {
          GQLENGINE_ASSIGN_OR_RETURN(const ArgumentNode* argument,
                                     ParseArgument(/*is_const=*/false));
          field->add_argument(argument);
          return absl::OkStatus();
        },
        TokenKind::kParenR));
    GQLENGINE_RETURN_IF_ERROR(ParseDirectives(/*is_const=*/false, field));
    if (Peek(TokenKind::kBraceL)) {
      GQLENGINE_ASSIGN_OR_RETURN(const SelectionSetNode* selection_set,
                                 ParseSelectionSet());
      field->set_selection_set(selection_set);
    }
    SetLocation(field, start);
    return field;
  }

  absl::StatusOr<const ArgumentNode*> ParseArgument(bool is_const) {
    const Token start = token();
    GQLENGINE_ASSIGN_OR_RETURN(std::string name, ParseName());
    GQLENGINE_RETURN_IF_ERROR(ExpectToken(TokenKind::kColon));
    GQLENGINE_ASSIGN_OR_RETURN(const ValueNode* value,
                               ParseValueLiteral(is_const));
    ArgumentNode* argument = arena_->New<ArgumentNode>(std::move(name), value);
    SetLocation(argument, start);
    return argument;
  }

  // Parses either a fragment spread or an inline fragment.
  absl::StatusOr<const SelectionNode*> ParseFragment() {
    const Token start = token();
    GQLENGINE_RETURN_IF_ERROR(ExpectToken(TokenKind::kSpread));
    bool has_type_condition;
    GQLENGINE_RETURN_IF_ERROR(
        ExpectOptionalKeyword("on", &has_type_condition));
    if (!has_type_condition && Peek(TokenKind::kName)) {
      GQLENGINE_ASSIGN_OR_RETURN(std::string name, ParseFragmentName());
      FragmentSpreadNode* spread =
          arena_->New<FragmentSpreadNode>(std::move(name));
      GQLENGINE_RETURN_IF_ERROR(ParseDirectives(/*is_const=*/false, spread));
      SetLocation(spread, start);
      return spread;
    }
    InlineFragmentNode* fragment = arena_->New<InlineFragmentNode>();
    if (has_type_condition) {
      GQLENGINE_ASSIGN_OR_RETURN(const NamedTypeNode* type_condition,
                                 ParseNamedType());
      fragment->set_type_condition(type_condition);
    }
    GQLENGINE_RETURN_IF_ERROR(ParseDirectives(/*is_const=*/false, fragment));
    GQLENGINE_ASSIGN_OR_RETURN(const SelectionSetNode* selection_set,
                               ParseSelectionSet());
    fragment->set_selection_set(selection_set);
    SetLocation(fragment, start);
    return fragment;
  }

  absl::StatusOr<const DefinitionNode*> ParseFragmentDefinition() {
    const Token start = token();
    GQLENGINE_RETURN_IF_ERROR(ExpectKeyword("fragment"));
    GQLENGINE_ASSIGN_OR_RETURN(std::string name, ParseFragmentName());
    GQLENGINE_RETURN_IF_ERROR(ExpectKeyword("on"));
    GQLENGINE_ASSIGN_OR_RETURN(const NamedTypeNode* type_condition,
                               ParseNamedType());
    FragmentDefinitionNode* fragment =
        arena_->New<FragmentDefinitionNode>(std::move(name), type_condition);
    GQLENGINE_RETURN_IF_ERROR(ParseDirectives(/*is_const=*/false, fragment));
    GQLENGINE_ASSIGN_OR_RETURN(const SelectionSetNode* selection_set,
                               ParseSelectionSet());
    fragment->set_selection_set(selection_set);
    SetLocation(fragment, start);
    return fragment;
  }

  // A fragment name is any name but "on".
  absl::StatusOr<std::string> ParseFragmentName() {
    if (PeekKeyword("on")) return Unexpected();
    return ParseName();
  }

  // --------------------------------------------------------------------------
  // Values.

  absl::StatusOr<const ValueNode*> ParseValueLiteral(bool is_const) {
    const Token start = token();
    switch (start.kind) {
      case TokenKind::kBracketL: {
        ListValueNode* list = arena_->New<ListValueNode>();
        GQLENGINE_RETURN_IF_ERROR(Any(
            TokenKind::kBracketL,
            [this, list, is_const]() -> absl::Status {
              GQLENGINE_ASSIGN_OR_RETURN(const ValueNode* item,
                                         ParseValueLiteral(is_const));
              list->add_value(item);
              return absl::OkStatus();
            },
            TokenKind::kBracketR));
        SetLocation(list, start);
        return list;
      }
      case TokenKind::kBraceL: {
        ObjectValueNode* object = arena_->New<ObjectValueNode>();
        GQLENGINE_RETURN_IF_ERROR(Any(
            TokenKind::kBraceL,
            [this, object, is_const]() -> absl::Status {
              GQLENGINE_ASSIGN_OR_RETURN(const ObjectFieldNode* field,
                                         ParseObjectField(is_const));
              object->add_field(field);
              return absl::OkStatus();
            },
            TokenKind::kBraceR));
        SetLocation(object, start);
        return object;
      }
      case TokenKind::kInt:
        return Leaf<IntValueNode>(start, start.value);
      case TokenKind::kFloat:
        return Leaf<FloatValueNode>(start, start.value);
      case TokenKind::kString:
        return Leaf<StringValueNode>(start, start.value, /*block=*/false);
      case TokenKind::kBlockString:
        return Leaf<StringValueNode>(start, start.value, /*block=*/true);
      case TokenKind::kName:
        if (start.value == "true") return Leaf<BooleanValueNode>(start, true);
        if (start.value == "false") {
          return Leaf<BooleanValueNode>(start, false);
        }
        if (start.value == "null") return Leaf<NullValueNode>(start);
        return Leaf<EnumValueNode>(start, start.value);
      case TokenKind::kDollar:
        if (is_const) {
          GQLENGINE_RETURN_IF_ERROR(ExpectToken(TokenKind::kDollar));
          if (Peek(TokenKind::kName)) {
            return MakeSyntaxError(
                *source_, start.start,
                absl::StrCat("Unexpected variable \"$", token().value,
                             "\" in constant value."));
          }
          return Unexpected(start);
        }
        return ParseVariable();
      default:
        return Unexpected();
    }
  }

  // Consumes the current token and wraps it into a value node.
  template <typename NodeType, typename... Args>
  absl::StatusOr<const ValueNode*> Leaf(const Token& start, Args&&... args) {
    NodeType* node = arena_->New<NodeType>(std::forward<Args>(args)...);
    GQLENGINE_RETURN_IF_ERROR(lexer_.Advance());
    SetLocation(node, start);
    return node;
  }

  absl::StatusOr<const ObjectFieldNode*> ParseObjectField(bool is_const) {
    const Token start = token();
    GQLENGINE_ASSIGN_OR_RETURN(std::string name, ParseName());
    GQLENGINE_RETURN_IF_ERROR(ExpectToken(TokenKind::kColon));
    GQLENGINE_ASSIGN_OR_RETURN(const ValueNode* value,
                               ParseValueLiteral(is_const));
    ObjectFieldNode* field =
        arena_->New<ObjectFieldNode>(std::move(name), value);
    SetLocation(field, start);
    return field;
  }

  // --------------------------------------------------------------------------
  // Directives.

  absl::Status ParseDirectives(bool is_const, DirectivesHolder* holder) {
    while (Peek(TokenKind::kAt)) {
      GQLENGINE_ASSIGN_OR_RETURN(const DirectiveNode* directive,
                                 ParseDirective(is_const));
      holder->add_directive(directive);
    }
    return absl::OkStatus();
  }

  absl::StatusOr<const DirectiveNode*> ParseDirective(bool is_const) {
    const Token start = token();
    GQLENGINE_RETURN_IF_ERROR(ExpectToken(TokenKind::kAt));
    GQLENGINE_ASSIGN_OR_RETURN(std::string name, ParseName());
    DirectiveNode* directive = arena_->New<DirectiveNode>(std::move(name));
    GQLENGINE_RETURN_IF_ERROR(OptionalMany(
        TokenKind::kParenL,
        [this, directive, is_const]() -> absl::Status {
          GQLENGINE_ASSIGN_OR_RETURN(const ArgumentNode* argument,
                                     ParseArgument(is_const));
          directive->add_argument(argument);
          return absl::OkStatus();
        },
        TokenKind::kParenR));
    SetLocation(directive, start);
    return directive;
  }

  // --------------------------------------------------------------------------
  // Types.

  absl::StatusOr<const TypeNode*> ParseTypeReference() {
    const Token start = token();
    const TypeNode* type;
    bool is_list;
    GQLENGINE_RETURN_IF_ERROR(
        ExpectOptionalToken(TokenKind::kBracketL, &is_list));
    if (is_list) {
      GQLENGINE_ASSIGN_OR_RETURN(const TypeNode* item_type,
                                 ParseTypeReference());
      GQLENGINE_RETURN_IF_ERROR(ExpectToken(TokenKind::kBracketR));
      ListTypeNode* list = arena_->New<ListTypeNode>(item_type);
      SetLocation(list, start);
      type = list;
    } else {
      GQLENGINE_ASSIGN_OR_RETURN(type, ParseNamedType());
    }
    bool is_non_null;
    GQLENGINE_RETURN_IF_ERROR(
        ExpectOptionalToken(TokenKind::kBang, &is_non_null));
    if (is_non_null) {
      NonNullTypeNode* non_null = arena_->New<NonNullTypeNode>(type);
      SetLocation(non_null, start);
      return non_null;
    }
    return type;
  }

  absl::StatusOr<const NamedTypeNode*> ParseNamedType() {
    const Token start = token();
    GQLENGINE_ASSIGN_OR_RETURN(std::string name, ParseName());
    NamedTypeNode* type = arena_->New<NamedTypeNode>(std::move(name));
    SetLocation(type, start);
    return type;
  }

  std::shared_ptr<const Source> source_;
  Lexer lexer_;
  std::unique_ptr<NodeArena> arena_;
};

}  // namespace

absl::StatusOr<std::unique_ptr<ParserOutput>> Parse(
    std::shared_ptr<const Source> source) {
  Parser parser(std::move(source));
  return parser.ParseDocumentOutput();
}

absl::StatusOr<std::unique_ptr<ParserOutput>> Parse(absl::string_view text) {
  return Parse(std::make_shared<const Source>(std::string(text)));
}

absl::StatusOr<std::unique_ptr<ParserOutput>> ParseValue(
    absl::string_view text) {
  Parser parser(std::make_shared<const Source>(std::string(text)));
  return parser.ParseValueOutput(/*is_const=*/false);
}

absl::StatusOr<std::unique_ptr<ParserOutput>> ParseConstValue(
    absl::string_view text) {
  Parser parser(std::make_shared<const Source>(std::string(text)));
  return parser.ParseValueOutput(/*is_const=*/true);
}

absl::StatusOr<std::unique_ptr<ParserOutput>> ParseType(
    absl::string_view text) {
  Parser parser(std::make_shared<const Source>(std::string(text)));
  return parser.ParseTypeOutput();
}

}  // namespace gqlengine
