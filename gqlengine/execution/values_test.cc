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


#include "gqlengine/execution/values.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "gqlengine/base/testing/status_matchers.h"
#include "gqlengine/execution/coerce_input_value.h"
#include "gqlengine/execution/value_from_ast.h"
#include "gqlengine/language/ast.h"
#include "gqlengine/language/parser.h"
#include "gqlengine/public/schema.h"
#include "gqlengine/public/type.h"
#include "gqlengine/public/value.h"

namespace gqlengine {
namespace {

using ::gqlengine_base::testing::StatusIs;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::SizeIs;

// input Point { x: Int!  y: Int = 0 }
// enum Color { RED GREEN }
// type Query { field(n: Int, point: Point, color: Color): String }
class ValuesTest : public ::testing::Test {
 protected:
  void SetUp() override {
    point_ = factory_.MakeInputObjectType("Point");
    point_->AddField({.name = "x",
                      .type = factory_.MakeNonNullType(types::IntType())});
    point_->AddField({.name = "y",
                      .type = types::IntType(),
                      .default_value = Value::Int(0)});
    color_ = factory_.MakeEnumType("Color");
    color_->AddValue("RED", Value::Int(1));
    color_->AddValue("GREEN", Value::Int(2));

    ObjectType* query = factory_.MakeObjectType("Query");
    query->AddField({.name = "field",
                     .type = types::StringType(),
                     .arguments = {{.name = "n", .type = types::IntType()},
                                   {.name = "point", .type = point_},
                                   {.name = "color", .type = color_}}});
    SchemaConfig config;
    config.query = query;
    GQLENGINE_ASSERT_OK_AND_ASSIGN(schema_, Schema::Create(std::move(config)));
  }

  Value FromLiteral(absl::string_view literal, const Type* type,
                    const VariableValues* variables = nullptr) {
    absl::StatusOr<std::unique_ptr<ParserOutput>> parsed = ParseValue(literal);
    EXPECT_TRUE(parsed.ok()) << parsed.status();
    if (!parsed.ok()) return Value();
    Value value = ValueFromAst((*parsed)->value(), type, variables);
    outputs_.push_back(*std::move(parsed));
    return value;
  }

  const OperationDefinitionNode* ParseOperation(absl::string_view query) {
    absl::StatusOr<std::unique_ptr<ParserOutput>> parsed = Parse(query);
    EXPECT_TRUE(parsed.ok()) << parsed.status();
    if (!parsed.ok()) return nullptr;
    const OperationDefinitionNode* operation =
        (*parsed)->document()->definitions()[0]
            ->GetAsOrDie<OperationDefinitionNode>();
    outputs_.push_back(*std::move(parsed));
    return operation;
  }

  TypeFactory factory_;
  InputObjectType* point_ = nullptr;
  EnumType* color_ = nullptr;
  std::unique_ptr<const Schema> schema_;
  std::vector<std::unique_ptr<ParserOutput>> outputs_;
};

TEST_F(ValuesTest, ValueFromAstCoercesLiterals) {
  EXPECT_EQ(FromLiteral("123", types::IntType()).DebugString(), "123");
  EXPECT_EQ(FromLiteral("[1, 2]", factory_.MakeListType(types::IntType()))
                .DebugString(),
            "[1, 2]");
  EXPECT_EQ(
      FromLiteral("7", factory_.MakeListType(types::IntType())).DebugString(),
      "[7]");
  EXPECT_TRUE(FromLiteral("null", types::IntType()).is_null());
  EXPECT_EQ(FromLiteral("{x: 1}", point_).DebugString(), "{ x: 1, y: 0 }");
  EXPECT_EQ(FromLiteral("GREEN", color_).DebugString(), "2");
}

TEST_F(ValuesTest, ValueFromAstRejectsInvalidLiterals) {
  EXPECT_FALSE(FromLiteral("null", factory_.MakeNonNullType(types::IntType()))
                   .is_valid());
  EXPECT_FALSE(FromLiteral("\"abc\"", types::IntType()).is_valid());
  EXPECT_FALSE(FromLiteral("{y: 1}", point_).is_valid());
  EXPECT_FALSE(FromLiteral("BLUE", color_).is_valid());
  EXPECT_FALSE(
      FromLiteral("[1, \"two\"]", factory_.MakeListType(types::IntType()))
          .is_valid());
}

TEST_F(ValuesTest, ValueFromAstResolvesVariables) {
  VariableValues variables;
  variables["a"] = Value::Int(5);
  EXPECT_EQ(FromLiteral("$a", types::IntType(), &variables).DebugString(),
            "5");
  EXPECT_FALSE(FromLiteral("$missing", types::IntType(), &variables)
                   .is_valid());
  // A missing variable inside a list becomes null.
  EXPECT_EQ(FromLiteral("[$a, $missing]",
                        factory_.MakeListType(types::IntType()), &variables)
                .DebugString(),
            "[5, null]");
}

TEST_F(ValuesTest, CoerceInputValueAcceptsValidInput) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      Value coerced,
      CoerceInputValue(Value::Object({{"x", Value::Int(3)}}), point_));
  EXPECT_EQ(coerced.DebugString(), "{ x: 3, y: 0 }");

  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      Value list,
      CoerceInputValue(Value::Int(4), factory_.MakeListType(types::IntType())));
  EXPECT_EQ(list.DebugString(), "[4]");
}

TEST_F(ValuesTest, CoerceInputValueNamesTheInvalidPart) {
  const Type* points = factory_.MakeListType(point_);
  EXPECT_THAT(
      CoerceInputValue(
          Value::List({Value::Object({{"x", Value::String("abc")}})}), points),
      StatusIs(absl::StatusCode::kInvalidArgument,
               "Invalid value \"abc\" at 'value[0].x': Int cannot represent "
               "non-integer value: \"abc\""));
  EXPECT_THAT(CoerceInputValue(Value::Object({}), point_),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Invalid value {}: Field 'x' of required type 'Int!' "
                       "was not provided."));
  EXPECT_THAT(CoerceInputValue(
                  Value::Object({{"x", Value::Int(1)}, {"z", Value::Int(2)}}),
                  point_),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Field 'z' is not defined by type 'Point'.")));
}

TEST_F(ValuesTest, CoerceInputValueReportsEveryError) {
  std::vector<std::string> paths;
  CoerceInputValue(
      Value::List({Value::String("a"), Value::Int(1), Value::String("b")}),
      factory_.MakeListType(types::IntType()),
      [&paths](const std::vector<PathKey>& path, const Value&,
               absl::Status) { paths.push_back(PrintPathList(path)); });
  EXPECT_THAT(paths, ElementsAre("[0]", "[2]"));
}

TEST_F(ValuesTest, GetVariableValuesCoercesInputs) {
  const OperationDefinitionNode* operation = ParseOperation(
      "query ($n: Int, $p: Point, $d: Int = 9) { field }");
  ASSERT_NE(operation, nullptr);
  VariableValues inputs;
  inputs["n"] = Value::Int(1);
  inputs["p"] = Value::Object({{"x", Value::Int(2)}});
  VariableCoercionResult result = GetVariableValues(
      *schema_, operation->variable_definitions(), inputs, 50);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.coerced["n"].DebugString(), "1");
  EXPECT_EQ(result.coerced["p"].DebugString(), "{ x: 2, y: 0 }");
  EXPECT_EQ(result.coerced["d"].DebugString(), "9");
}

TEST_F(ValuesTest, GetVariableValuesReportsProblems) {
  const OperationDefinitionNode* operation = ParseOperation(
      "query ($a: Int!, $b: Int!, $c: Int) { field }");
  ASSERT_NE(operation, nullptr);
  VariableValues inputs;
  inputs["b"] = Value::Null();
  inputs["c"] = Value::String("abc");
  VariableCoercionResult result = GetVariableValues(
      *schema_, operation->variable_definitions(), inputs, 50);
  ASSERT_THAT(result.errors, SizeIs(3));
  EXPECT_EQ(result.errors[0].message(),
            "Variable '$a' of required type 'Int!' was not provided.");
  EXPECT_EQ(result.errors[1].message(),
            "Variable '$b' of non-null type 'Int!' must not be null.");
  EXPECT_EQ(result.errors[2].message(),
            "Variable '$c' got invalid value \"abc\"; Int cannot represent "
            "non-integer value: \"abc\"");
}

TEST_F(ValuesTest, GetVariableValuesStopsAtErrorLimit) {
  const OperationDefinitionNode* operation = ParseOperation(
      "query ($a: Int!, $b: Int!, $c: Int!) { field }");
  ASSERT_NE(operation, nullptr);
  VariableCoercionResult result = GetVariableValues(
      *schema_, operation->variable_definitions(), VariableValues(), 1);
  ASSERT_THAT(result.errors, SizeIs(2));
  EXPECT_EQ(result.errors[1].message(),
            "Too many errors processing variables, error limit reached. "
            "Execution aborted.");
}

TEST_F(ValuesTest, GetVariableValuesRejectsOutputTypes) {
  const OperationDefinitionNode* operation =
      ParseOperation("query ($q: Query) { field }");
  ASSERT_NE(operation, nullptr);
  VariableCoercionResult result = GetVariableValues(
      *schema_, operation->variable_definitions(), VariableValues(), 50);
  ASSERT_THAT(result.errors, SizeIs(1));
  EXPECT_EQ(result.errors[0].message(),
            "Variable '$q' expected value of type 'Query' which cannot be "
            "used as an input type.");
}

class ArgumentValuesTest : public ValuesTest {
 protected:
  absl::StatusOr<Value> Arguments(absl::string_view query,
                                  const VariableValues* variables = nullptr) {
    const OperationDefinitionNode* operation = ParseOperation(query);
    if (operation == nullptr) return absl::InternalError("parse failed");
    const FieldNode* field =
        operation->selection_set()->selections()[0]->GetAsOrDie<FieldNode>();
    const FieldDefinition* definition =
        schema_->GetField(schema_->GetRootType(OperationType::kQuery), "field");
    return GetArgumentValues(definition->arguments, field->arguments(), *field,
                             variables);
  }
};

TEST_F(ArgumentValuesTest, CoercesLiteralsAndVariables) {
  VariableValues variables;
  variables["v"] = Value::Int(8);
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      Value args,
      Arguments("query ($v: Int) { field(n: $v, point: {x: 1}, color: RED) }",
                &variables));
  EXPECT_EQ(args.DebugString(), "{ n: 8, point: { x: 1, y: 0 }, color: 1 }");
}

TEST_F(ArgumentValuesTest, OmitsUnsetArgumentsWithoutDefaults) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(Value args, Arguments("{ field }"));
  EXPECT_EQ(args.DebugString(), "{}");
}

TEST_F(ArgumentValuesTest, ReportsInvalidLiteral) {
  EXPECT_THAT(Arguments(R"({ field(n: "x") })"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Argument 'n' has invalid value \"x\"."));
}

}  // namespace
}  // namespace gqlengine
