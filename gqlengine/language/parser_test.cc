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

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "gqlengine/base/status_payload.h"
#include "gqlengine/base/testing/status_matchers.h"
#include "gqlengine/language/ast.h"
#include "gqlengine/language/printer.h"
#include "gqlengine/proto/graphql_error.pb.h"

namespace gqlengine {
namespace {

using ::gqlengine_base::testing::StatusIs;

TEST(ParserTest, ParsesQueryShorthand) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(std::unique_ptr<ParserOutput> output,
                                 Parse("{ hero { name } }"));
  const DocumentNode* document = output->document();
  ASSERT_NE(document, nullptr);
  ASSERT_EQ(document->definitions().size(), 1u);
  const OperationDefinitionNode* operation =
      document->definitions()[0]->GetAsOrNull<OperationDefinitionNode>();
  ASSERT_NE(operation, nullptr);
  EXPECT_EQ(operation->operation(), OperationType::kQuery);
  EXPECT_EQ(operation->name(), "");
  ASSERT_EQ(operation->selection_set()->selections().size(), 1u);
  const FieldNode* hero =
      operation->selection_set()->selections()[0]->GetAsOrDie<FieldNode>();
  EXPECT_EQ(hero->name(), "hero");
  ASSERT_NE(hero->selection_set(), nullptr);
  EXPECT_EQ(hero->selection_set()->selections().size(), 1u);
}

TEST(ParserTest, ParsesNamedOperationWithVariables) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      std::unique_ptr<ParserOutput> output,
      Parse("mutation Like($id: ID!, $n: [Int] = [1, 2] @dir) @op {\n"
            "  like(id: $id, n: $n) @include(if: true) { count }\n"
            "}"));
  const OperationDefinitionNode* operation =
      output->document()->definitions()[0]->GetAsOrDie<OperationDefinitionNode>();
  EXPECT_EQ(operation->operation(), OperationType::kMutation);
  EXPECT_EQ(operation->name(), "Like");
  ASSERT_EQ(operation->variable_definitions().size(), 2u);
  const VariableDefinitionNode* id = operation->variable_definitions()[0];
  EXPECT_EQ(id->variable()->name(), "id");
  EXPECT_EQ(PrintTypeNode(*id->type()), "ID!");
  EXPECT_EQ(id->default_value(), nullptr);
  const VariableDefinitionNode* n = operation->variable_definitions()[1];
  EXPECT_EQ(PrintTypeNode(*n->type()), "[Int]");
  ASSERT_NE(n->default_value(), nullptr);
  EXPECT_EQ(PrintValueNode(*n->default_value()), "[1, 2]");
  EXPECT_EQ(n->directives().size(), 1u);
  ASSERT_EQ(operation->directives().size(), 1u);
  EXPECT_EQ(operation->directives()[0]->name(), "op");

  const FieldNode* like =
      operation->selection_set()->selections()[0]->GetAsOrDie<FieldNode>();
  ASSERT_EQ(like->arguments().size(), 2u);
  EXPECT_EQ(like->arguments()[0]->name(), "id");
  EXPECT_EQ(PrintValueNode(*like->arguments()[0]->value()), "$id");
  const DirectiveNode* include = like->FindDirective("include");
  ASSERT_NE(include, nullptr);
  EXPECT_EQ(PrintValueNode(*include->arguments()[0]->value()), "true");
  EXPECT_EQ(like->FindDirective("skip"), nullptr);
}

TEST(ParserTest, ParsesAliasesAndFragments) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      std::unique_ptr<ParserOutput> output,
      Parse("query { smallPic: pic(size: 64) ...F ... on User { id } "
            "... @defer(label: \"x\") { name } }\n"
            "fragment F on User { friends { id } }"));
  const DocumentNode* document = output->document();
  ASSERT_EQ(document->definitions().size(), 2u);
  const SelectionSetNode* selections =
      document->definitions()[0]
          ->GetAsOrDie<OperationDefinitionNode>()
          ->selection_set();
  ASSERT_EQ(selections->selections().size(), 4u);

  const FieldNode* pic = selections->selections()[0]->GetAsOrDie<FieldNode>();
  EXPECT_EQ(pic->alias(), "smallPic");
  EXPECT_EQ(pic->name(), "pic");
  EXPECT_EQ(pic->response_key(), "smallPic");

  const FragmentSpreadNode* spread =
      selections->selections()[1]->GetAsOrDie<FragmentSpreadNode>();
  EXPECT_EQ(spread->name(), "F");

  const InlineFragmentNode* on_user =
      selections->selections()[2]->GetAsOrDie<InlineFragmentNode>();
  ASSERT_NE(on_user->type_condition(), nullptr);
  EXPECT_EQ(on_user->type_condition()->name(), "User");

  const InlineFragmentNode* deferred =
      selections->selections()[3]->GetAsOrDie<InlineFragmentNode>();
  EXPECT_EQ(deferred->type_condition(), nullptr);
  ASSERT_NE(deferred->FindDirective("defer"), nullptr);

  const FragmentDefinitionNode* fragment =
      document->definitions()[1]->GetAsOrDie<FragmentDefinitionNode>();
  EXPECT_EQ(fragment->name(), "F");
  EXPECT_EQ(fragment->type_condition()->name(), "User");
}

TEST(ParserTest, RecordsLocations) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(std::unique_ptr<ParserOutput> output,
                                 Parse("{\n  a\n  b(x: 1)\n}"));
  const SelectionSetNode* selections =
      output->document()
          ->definitions()[0]
          ->GetAsOrDie<OperationDefinitionNode>()
          ->selection_set();
  const Location& location = selections->selections()[1]->location();
  ASSERT_TRUE(location.valid());
  EXPECT_EQ(location.start, 8);
  EXPECT_EQ(location.end, 15);
  const SourcePosition position = location.source->GetPosition(location.start);
  EXPECT_EQ(position.line, 3);
  EXPECT_EQ(position.column, 3);
}

TEST(ParserTest, ParsesValues) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      std::unique_ptr<ParserOutput> output,
      ParseValue("{a: [1, -2.5e3, \"s\\n\"], b: RED, c: null, d: $v, "
                 "e: \"\"\"block\"\"\"}"));
  ASSERT_NE(output->value(), nullptr);
  EXPECT_EQ(output->document(), nullptr);
  EXPECT_EQ(PrintValueNode(*output->value()),
            "{a: [1, -2.5e3, \"s\\n\"], b: RED, c: null, d: $v, "
            "e: \"block\"}");
}

TEST(ParserTest, ConstValuesRejectVariables) {
  EXPECT_THAT(ParseConstValue("[1, $v]"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Syntax Error: Unexpected variable \"$v\" in constant "
                       "value."));
  EXPECT_THAT(Parse("query ($a: Int = $b) { f }"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Syntax Error: Unexpected variable \"$b\" in constant "
                       "value."));
}

TEST(ParserTest, ParsesTypes) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(std::unique_ptr<ParserOutput> output,
                                 ParseType("[[String!]]!"));
  ASSERT_NE(output->type(), nullptr);
  EXPECT_TRUE(output->type()->Is<NonNullTypeNode>());
  EXPECT_EQ(PrintTypeNode(*output->type()), "[[String!]]!");
}

TEST(ParserTest, ReportsExpectedToken) {
  EXPECT_THAT(Parse("{"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Syntax Error: Expected Name, found <EOF>."));
  EXPECT_THAT(Parse("{ a(b 1) }"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Syntax Error: Expected \":\", found Int \"1\"."));
  EXPECT_THAT(Parse("fragment F User { a }"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Syntax Error: Expected \"on\", found Name \"User\"."));
}

TEST(ParserTest, RejectsUnexpectedTokens) {
  EXPECT_THAT(Parse(""),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Syntax Error: Unexpected <EOF>."));
  EXPECT_THAT(Parse("{}"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Syntax Error: Expected Name, found \"}\"."));
  EXPECT_THAT(Parse("fragment on on T { a }"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Syntax Error: Unexpected Name \"on\"."));
  EXPECT_THAT(Parse("{ ...on }"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Syntax Error: Expected Name, found \"}\"."));
}

TEST(ParserTest, RejectsTypeSystemDefinitions) {
  EXPECT_THAT(Parse("type Query { a: String }"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Syntax Error: Unexpected Name \"type\"."));
  EXPECT_THAT(Parse("\"doc\" query { a }"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Syntax Error: Unexpected String \"doc\"."));
}

TEST(ParserTest, SyntaxErrorCarriesLocation) {
  absl::StatusOr<std::unique_ptr<ParserOutput>> output =
      Parse("{\n  a(\n}");
  ASSERT_FALSE(output.ok());
  const GraphQLErrorPayload payload =
      gqlengine_base::GetPayload<GraphQLErrorPayload>(output.status());
  ASSERT_EQ(payload.locations_size(), 1u);
  EXPECT_EQ(payload.locations(0).line(), 3);
  EXPECT_EQ(payload.locations(0).column(), 1);
  EXPECT_TRUE(payload.located());
}

}  // namespace
}  // namespace gqlengine
