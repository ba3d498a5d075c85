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


#ifndef GQLENGINE_PUBLIC_EXECUTE_OPTIONS_H_
#define GQLENGINE_PUBLIC_EXECUTE_OPTIONS_H_

#include <string>
#include <vector>

#include "absl/flags/declare.h"
#include "gqlengine/base/executor.h"
#include "gqlengine/public/middleware.h"
#include "gqlengine/public/type.h"
#include "gqlengine/public/value.h"

// Default for ExecuteOptions::max_variable_errors.
ABSL_DECLARE_FLAG(int, gqlengine_max_variable_errors);

namespace gqlengine {

// Per-request settings for Execute() and Subscribe().
struct ExecuteOptions {
  // The source of the root fields.
  Value root_value;
  // Passed to every resolver in ResolveInfo::context_value.
  Value context_value;
  // Raw variable values, coerced according to the operation's variable
  // definitions.
  VariableValues variable_values;
  // The operation to run. May be empty if the document has exactly one.
  std::string operation_name;

  // Used for fields without a resolver. Defaults to DefaultFieldResolver().
  FieldResolver field_resolver;
  // Used for abstract types without a resolve_type function. Defaults to
  // DefaultTypeResolver().
  TypeResolver type_resolver;
  // Used for subscription root fields without a subscribe function.
  // Defaults to `field_resolver`.
  FieldResolver subscribe_field_resolver;
  std::vector<Middleware> middleware;

  // Runs deferred work and streamed items. Null means inline on the thread
  // that triggers it. Must outlive the execution, including the subsequent
  // results of an incremental response.
  gqlengine_base::Executor* executor = nullptr;

  // Variable coercion stops after this many errors. Negative means
  // --gqlengine_max_variable_errors.
  int max_variable_errors = -1;
};

}  // namespace gqlengine

#endif  // GQLENGINE_PUBLIC_EXECUTE_OPTIONS_H_
