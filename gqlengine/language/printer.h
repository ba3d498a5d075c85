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


#ifndef GQLENGINE_LANGUAGE_PRINTER_H_
#define GQLENGINE_LANGUAGE_PRINTER_H_

#include <string>

#include "gqlengine/language/ast.h"

namespace gqlengine {

// Prints a value literal back to GraphQL source form: `{a: [1, "x"], b: $v}`.
std::string PrintValueNode(const ValueNode& value);

// Prints a type reference: `[String!]!`.
std::string PrintTypeNode(const TypeNode& type);

}  // namespace gqlengine

#endif  // GQLENGINE_LANGUAGE_PRINTER_H_
