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

#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/strings/str_cat.h"
#include "gqlengine/base/logging.h"
#include "gqlengine/base/status_builder.h"
#include "gqlengine/base/status_macros.h"
#include "gqlengine/common/errors.h"
#include "gqlengine/execution/coerce_input_value.h"
#include "gqlengine/execution/value_from_ast.h"
#include "gqlengine/language/printer.h"
#include "gqlengine/public/graphql_error.h"

namespace gqlengine {

namespace {

// Collects variable coercion errors up to a limit.
class VariableErrorCollector {
 public:
  explicit VariableErrorCollector(int max_errors) : max_errors_(max_errors) {}

  // Returns false once the limit has been exceeded; the caller must stop.
  bool Add(absl::Status error) {
    if (limit_reached_) return false;
    if (static_cast<int>(errors_.size()) >= max_errors_) {
      errors_.push_back(MakeGraphQLError()
                        << "Too many errors processing variables, error limit "
                           "reached. Execution aborted.");
      limit_reached_ = true;
      return false;
    }
    errors_.push_back(std::move(error));
    return true;
  }

  bool limit_reached() const { return limit_reached_; }
  std::vector<absl::Status> release() { return std::move(errors_); }

 private:
  const int max_errors_;
  std::vector<absl::Status> errors_;
  bool limit_reached_ = false;
};

absl::Status Located(absl::Status status, const Node& node) {
  const Node* nodes[] = {&node};
  return WithNodeLocations(std::move(status), nodes);
}

// The default of an omitted argument. Input object defaults are coerced
// again so that their fields use the coerced names.
absl::StatusOr<Value> DefaultArgumentValue(const InputValueDefinition& arg) {
  if (arg.type->Nullable()->IsInputObject()) {
    return CoerceInputValue(arg.default_value, arg.type);
  }
  return arg.default_value;
}

}  // namespace

VariableCoercionResult GetVariableValues(
    const Schema& schema,
    absl::Span<const VariableDefinitionNode* const> definitions,
    const VariableValues& inputs, int max_errors) {
  VariableCoercionResult result;
  VariableErrorCollector collector(max_errors);

  for (const VariableDefinitionNode* definition : definitions) {
    if (collector.limit_reached()) break;
    const std::string& name = definition->variable()->name();
    const Type* type = schema.TypeFromAst(*definition->type());
    if (type == nullptr || !type->IsInputType()) {
      collector.Add(Located(MakeGraphQLError()
                                << "Variable '$" << name
                                << "' expected value of type '"
                                << PrintTypeNode(*definition->type())
                                << "' which cannot be used as an input type.",
                            *definition->type()));
      continue;
    }

    auto it = inputs.find(name);
    if (it == inputs.end() || !it->second.is_valid()) {
      if (definition->default_value() != nullptr) {
        result.coerced[name] =
            ValueFromAst(definition->default_value(), type, nullptr);
      } else if (type->IsNonNull()) {
        collector.Add(Located(MakeGraphQLError()
                                  << "Variable '$" << name
                                  << "' of required type '" << type->ToString()
                                  << "' was not provided.",
                              *definition));
      }
      continue;
    }

    const Value& value = it->second;
    if (value.is_null() && type->IsNonNull()) {
      collector.Add(Located(MakeGraphQLError()
                                << "Variable '$" << name
                                << "' of non-null type '" << type->ToString()
                                << "' must not be null.",
                            *definition));
      continue;
    }

    result.coerced[name] = CoerceInputValue(
        value, type,
        [&](const std::vector<PathKey>& path, const Value& invalid_value,
            absl::Status error) {
          std::string prefix = absl::StrCat("Variable '$", name,
                                            "' got invalid value ",
                                            invalid_value.DebugString());
          if (!path.empty()) {
            absl::StrAppend(&prefix, " at '", name, PrintPathList(path), "'");
          }
          absl::Status located =
              gqlengine_base::StatusBuilder(std::move(error)).SetPrepend()
              << prefix << "; ";
          collector.Add(Located(std::move(located), *definition));
        });
  }

  result.errors = collector.release();
  if (!result.errors.empty()) {
    GQLENGINE_VLOG(2) << "Variable coercion failed with "
                      << result.errors.size() << " errors";
  }
  return result;
}

absl::StatusOr<Value> GetArgumentValues(
    absl::Span<const InputValueDefinition> definitions,
    absl::Span<const ArgumentNode* const> argument_nodes, const Node& node,
    const VariableValues* variables) {
  absl::flat_hash_map<absl::string_view, const ArgumentNode*> nodes_by_name;
  for (const ArgumentNode* argument : argument_nodes) {
    nodes_by_name.emplace(argument->name(), argument);
  }

  ObjectFields coerced;
  for (const InputValueDefinition& arg : definitions) {
    auto it = nodes_by_name.find(arg.name);
    if (it == nodes_by_name.end()) {
      if (arg.has_default_value()) {
        GQLENGINE_ASSIGN_OR_RETURN(Value value, DefaultArgumentValue(arg));
        coerced.emplace_back(arg.coerced_name(), std::move(value));
      } else if (arg.type->IsNonNull()) {
        return Located(MakeGraphQLError()
                           << "Argument '" << arg.name << "' of required type '"
                           << arg.type->ToString() << "' was not provided.",
                       node);
      }
      continue;
    }

    const ValueNode* value_node = it->second->value();
    bool is_null = value_node->Is<NullValueNode>();

    if (const VariableNode* variable = value_node->GetAsOrNull<VariableNode>()) {
      const Value* variable_value = nullptr;
      if (variables != nullptr) {
        auto var_it = variables->find(variable->name());
        if (var_it != variables->end()) variable_value = &var_it->second;
      }
      if (variable_value == nullptr) {
        if (arg.has_default_value()) {
          GQLENGINE_ASSIGN_OR_RETURN(Value value, DefaultArgumentValue(arg));
          coerced.emplace_back(arg.coerced_name(), std::move(value));
        } else if (arg.type->IsNonNull()) {
          return Located(
              MakeGraphQLError()
                  << "Argument '" << arg.name << "' of required type '"
                  << arg.type->ToString() << "' was provided the variable '$"
                  << variable->name()
                  << "' which was not provided a runtime value.",
              *value_node);
        }
        continue;
      }
      is_null = variable_value->is_nullish();
    }

    if (is_null && arg.type->IsNonNull()) {
      return Located(MakeGraphQLError()
                         << "Argument '" << arg.name << "' of non-null type '"
                         << arg.type->ToString() << "' must not be null.",
                     *value_node);
    }

    Value value = ValueFromAst(value_node, arg.type, variables);
    if (!value.is_valid()) {
      return Located(MakeGraphQLError()
                         << "Argument '" << arg.name << "' has invalid value "
                         << PrintValueNode(*value_node) << ".",
                     *value_node);
    }
    coerced.emplace_back(arg.coerced_name(), std::move(value));
  }
  return Value::Object(std::move(coerced));
}

absl::StatusOr<std::optional<Value>> GetDirectiveValues(
    const Directive& directive, const DirectivesHolder& node,
    const VariableValues* variables) {
  const DirectiveNode* directive_node = node.FindDirective(directive.name());
  if (directive_node == nullptr) return std::optional<Value>();
  GQLENGINE_ASSIGN_OR_RETURN(
      Value values, GetArgumentValues(directive.args(),
                                      directive_node->arguments(),
                                      *directive_node, variables));
  return std::optional<Value>(std::move(values));
}

}  // namespace gqlengine
