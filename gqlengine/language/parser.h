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


#ifndef GQLENGINE_LANGUAGE_PARSER_H_
#define GQLENGINE_LANGUAGE_PARSER_H_

#include <memory>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "gqlengine/language/ast.h"
#include "gqlengine/language/source.h"

namespace gqlengine {

// Parses an executable GraphQL document: operations and fragments. Type
// system definitions and extensions are rejected with a syntax error.
//
// On success the returned ParserOutput owns the tree and keeps `source`
// alive. On failure returns a kInvalidArgument status whose message starts
// with "Syntax Error:" and which carries a GraphQLErrorPayload with the
// line and column of the offending token.
absl::StatusOr<std::unique_ptr<ParserOutput>> Parse(
    std::shared_ptr<const Source> source);
absl::StatusOr<std::unique_ptr<ParserOutput>> Parse(absl::string_view text);

// Parses a single value literal such as `[1, {a: $b}]`. The result is in
// ParserOutput::value().
absl::StatusOr<std::unique_ptr<ParserOutput>> ParseValue(
    absl::string_view text);

// Like ParseValue, but variables are a syntax error.
absl::StatusOr<std::unique_ptr<ParserOutput>> ParseConstValue(
    absl::string_view text);

// Parses a type reference such as `[String!]!`. The result is in
// ParserOutput::type().
absl::StatusOr<std::unique_ptr<ParserOutput>> ParseType(
    absl::string_view text);

}  // namespace gqlengine

#endif  // GQLENGINE_LANGUAGE_PARSER_H_
