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


#ifndef GQLENGINE_EXECUTION_VALUES_H_
#define GQLENGINE_EXECUTION_VALUES_H_

#include <optional>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "gqlengine/language/ast.h"
#include "gqlengine/public/directives.h"
#include "gqlengine/public/schema.h"
#include "gqlengine/public/type.h"
#include "gqlengine/public/value.h"

namespace gqlengine {

struct VariableCoercionResult {
  VariableValues coerced;
  // Every problem found, each located at its variable definition. Coercion
  // failed if this is not empty.
  std::vector<absl::Status> errors;

  bool ok() const { return errors.empty(); }
};

// Coerces the request's raw variable values according to the operation's
// variable definitions. Unlike argument coercion this does not stop at the
// first problem; once more than `max_errors` problems have been found it
// gives up with a final "Too many errors" entry.
VariableCoercionResult GetVariableValues(
    const Schema& schema,
    absl::Span<const VariableDefinitionNode* const> definitions,
    const VariableValues& inputs, int max_errors);

// Coerces the arguments given at `node` (a field or a directive) according
// to `definitions`. Returns an object value keyed by each argument's coerced
// name. Fails on the first invalid argument.
absl::StatusOr<Value> GetArgumentValues(
    absl::Span<const InputValueDefinition> definitions,
    absl::Span<const ArgumentNode* const> argument_nodes, const Node& node,
    const VariableValues* variables);

// The coerced arguments of the first application of `directive` on `node`,
// or nullopt if the directive is not applied there.
absl::StatusOr<std::optional<Value>> GetDirectiveValues(
    const Directive& directive, const DirectivesHolder& node,
    const VariableValues* variables);

}  // namespace gqlengine

#endif  // GQLENGINE_EXECUTION_VALUES_H_
