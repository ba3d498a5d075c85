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


#ifndef GQLENGINE_EXECUTION_VALUE_FROM_AST_H_
#define GQLENGINE_EXECUTION_VALUE_FROM_AST_H_

#include "gqlengine/language/ast.h"
#include "gqlengine/public/type.h"
#include "gqlengine/public/value.h"

namespace gqlengine {

// Produces the internal value of the literal `node` for the input type
// `type`. Returns an invalid Value when the literal is not valid for the type;
// this never reports why, callers that need a message produce their own.
//
// A variable reference evaluates to the variable's coerced value. A variable
// that is absent from `variables` (or `variables` == nullptr) yields an
// invalid Value, which the caller may treat as "not provided".
//
// | Literal       | Type          | Result              |
// | ------------- | ------------- | ------------------- |
// | null          | nullable      | null                |
// | null          | NonNull       | invalid             |
// | [1, 2]        | [Int]         | [1, 2]              |
// | 1             | [Int]         | [1]                 |
// | {a: 1}        | Input object  | {a: 1} + defaults   |
// | "x"           | Scalar / Enum | type->ParseLiteral  |
Value ValueFromAst(const ValueNode* node, const Type* type,
                   const VariableValues* variables);

// Produces a value from a literal without a type. Enum literals become
// strings and integers that do not fit in int64 become floats.
Value ValueFromAstUntyped(const ValueNode& node,
                          const VariableValues* variables);

// Whether `node` is a variable that has no runtime value.
bool IsMissingVariable(const ValueNode* node, const VariableValues* variables);

}  // namespace gqlengine

#endif  // GQLENGINE_EXECUTION_VALUE_FROM_AST_H_
