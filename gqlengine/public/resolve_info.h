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


#ifndef GQLENGINE_PUBLIC_RESOLVE_INFO_H_
#define GQLENGINE_PUBLIC_RESOLVE_INFO_H_

#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "gqlengine/language/ast.h"
#include "gqlengine/public/response_path.h"
#include "gqlengine/public/type.h"
#include "gqlengine/public/value.h"

namespace gqlengine {

class Schema;

// Fragment definitions of a document, by name.
using FragmentMap =
    absl::flat_hash_map<std::string, const FragmentDefinitionNode*>;

// Information about the field being resolved, passed to field resolvers,
// type resolvers and is_type_of functions. The pointers are owned by the
// execution and stay valid until the resolver's result has been consumed.
struct ResolveInfo {
  std::string field_name;
  // Every field node that contributes to this response key.
  std::vector<const FieldNode*> field_nodes;
  const Type* return_type = nullptr;
  const ObjectType* parent_type = nullptr;
  ResponsePath::Ptr path;
  const Schema* schema = nullptr;
  const FragmentMap* fragments = nullptr;
  Value root_value;
  const OperationDefinitionNode* operation = nullptr;
  const VariableValues* variable_values = nullptr;
  Value context_value;
};

}  // namespace gqlengine

#endif  // GQLENGINE_PUBLIC_RESOLVE_INFO_H_
