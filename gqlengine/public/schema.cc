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


#include "gqlengine/public/schema.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/algorithm/container.h"
#include "absl/container/flat_hash_set.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "gqlengine/base/logging.h"
#include "gqlengine/base/status_macros.h"
#include "gqlengine/common/errors.h"
#include "gqlengine/public/resolve_info.h"
#include "re2/re2.h"

namespace gqlengine {

namespace {

const std::vector<const ObjectType*>& EmptyObjectTypes() {
  static const auto* empty = new std::vector<const ObjectType*>();
  return *empty;
}

// Collects schema problems in the order they are found.
class SchemaValidator {
 public:
  explicit SchemaValidator(const Schema& schema) : schema_(schema) {}

  absl::Status Validate() {
    ValidateRootTypes();
    ValidateDirectives();
    ValidateTypes();
    if (errors_.empty()) return absl::OkStatus();
    return MakeMisuseError() << absl::StrJoin(errors_, "\n\n");
  }

 private:
  void ReportError(std::string message) {
    errors_.push_back(std::move(message));
  }

  void ValidateName(absl::string_view name) {
    static LazyRE2 kNameStart = {"[_a-zA-Z].*"};
    static LazyRE2 kName = {"[_a-zA-Z][_a-zA-Z0-9]*"};
    if (name.empty()) {
      ReportError("Expected name to be a non-empty string.");
    } else if (absl::StartsWith(name, "__")) {
      ReportError(absl::StrCat(
          "Name '", name,
          "' must not begin with '__', which is reserved by GraphQL "
          "introspection."));
    } else if (!RE2::FullMatch(name, *kNameStart)) {
      ReportError(absl::StrCat(
          "Names must start with a letter or underscore, but '", name,
          "' does not."));
    } else if (!RE2::FullMatch(name, *kName)) {
      ReportError(absl::StrCat("Names must only contain [_a-zA-Z0-9] but '",
                               name, "' does not."));
    }
  }

  static std::string TypeString(const Type* type) {
    return type == nullptr ? "null" : type->ToString();
  }

  void ValidateRootTypes() {
    if (schema_.query_type() == nullptr) {
      ReportError("Query root type must be provided.");
    }
  }

  void ValidateDirectives() {
    for (const Directive* directive : schema_.directives()) {
      ValidateName(directive->name());
      absl::flat_hash_set<std::string> arg_names;
      for (const InputValueDefinition& arg : directive->args()) {
        ValidateName(arg.name);
        if (!arg_names.insert(arg.name).second) {
          ReportError(absl::StrCat("Argument @", directive->name(), "(",
                                   arg.name, ":) can only be defined once."));
          continue;
        }
        if (arg.type == nullptr || !arg.type->IsInputType()) {
          ReportError(absl::StrCat("The type of @", directive->name(), "(",
                                   arg.name,
                                   ":) must be Input Type but got: ",
                                   TypeString(arg.type), "."));
        }
        if (arg.IsRequired() && arg.deprecation_reason.has_value()) {
          ReportError(absl::StrCat("Required argument @", directive->name(),
                                   "(", arg.name,
                                   ":) cannot be deprecated."));
        }
      }
    }
  }

  void ValidateTypes() {
    for (const NamedType* type : schema_.types()) {
      ValidateName(type->name());
      if (const ObjectType* object = type->AsObject()) {
        ValidateFields(object);
        ValidateInterfaces(object);
      } else if (const InterfaceType* interface = type->AsInterface()) {
        ValidateFields(interface);
        ValidateInterfaces(interface);
      } else if (const UnionType* union_type = type->AsUnion()) {
        ValidateUnionMembers(union_type);
      } else if (const EnumType* enum_type = type->AsEnum()) {
        ValidateEnumValues(enum_type);
      } else if (const InputObjectType* input = type->AsInputObject()) {
        ValidateInputFields(input);
      }
    }
  }

  void ValidateFields(const FieldsType* type) {
    if (type->fields().empty()) {
      ReportError(absl::StrCat("Type ", type->name(),
                               " must define one or more fields."));
    }
    for (const FieldDefinition* field : type->fields()) {
      ValidateName(field->name);
      if (field->type == nullptr || !field->type->IsOutputType()) {
        ReportError(absl::StrCat("The type of ", type->name(), ".",
                                 field->name,
                                 " must be Output Type but got: ",
                                 TypeString(field->type), "."));
      }
      absl::flat_hash_set<std::string> arg_names;
      for (const InputValueDefinition& arg : field->arguments) {
        ValidateName(arg.name);
        if (!arg_names.insert(arg.name).second) {
          ReportError(absl::StrCat("Field argument ", type->name(), ".",
                                   field->name, "(", arg.name,
                                   ":) can only be defined once."));
          break;
        }
        if (arg.type == nullptr || !arg.type->IsInputType()) {
          ReportError(absl::StrCat("Field argument ", type->name(), ".",
                                   field->name, "(", arg.name,
                                   ":) must be Input Type but got: ",
                                   TypeString(arg.type), "."));
        }
        if (arg.IsRequired() && arg.deprecation_reason.has_value()) {
          ReportError(absl::StrCat("Required argument ", type->name(), ".",
                                   field->name, "(", arg.name,
                                   ":) cannot be deprecated."));
        }
      }
    }
  }

  void ValidateInterfaces(const FieldsType* type) {
    absl::flat_hash_set<const InterfaceType*> implemented;
    for (const InterfaceType* interface : type->interfaces()) {
      if (interface == type) {
        ReportError(absl::StrCat("Type ", type->name(),
                                 " cannot implement itself because it would "
                                 "create a circular reference."));
        continue;
      }
      if (!implemented.insert(interface).second) {
        ReportError(absl::StrCat("Type ", type->name(),
                                 " can only implement ", interface->name(),
                                 " once."));
        continue;
      }
      ValidateImplementsAncestors(type, interface);
      ValidateImplementsInterface(type, interface);
    }
  }

  void ValidateImplementsAncestors(const FieldsType* type,
                                   const InterfaceType* interface) {
    for (const InterfaceType* transitive : interface->interfaces()) {
      if (type->Implements(transitive)) continue;
      if (transitive == type) {
        ReportError(absl::StrCat("Type ", type->name(),
                                 " cannot implement ", interface->name(),
                                 " because it would create a circular "
                                 "reference."));
      } else {
        ReportError(absl::StrCat("Type ", type->name(), " must implement ",
                                 transitive->name(),
                                 " because it is implemented by ",
                                 interface->name(), "."));
      }
    }
  }

  void ValidateImplementsInterface(const FieldsType* type,
                                   const InterfaceType* interface) {
    for (const FieldDefinition* interface_field : interface->fields()) {
      const std::string& field_name = interface_field->name;
      const FieldDefinition* type_field = type->FindField(field_name);
      if (type_field == nullptr) {
        ReportError(absl::StrCat("Interface field ", interface->name(), ".",
                                 field_name, " expected but ", type->name(),
                                 " does not provide it."));
        continue;
      }
      if (type_field->type != nullptr && interface_field->type != nullptr &&
          !schema_.IsTypeSubTypeOf(type_field->type, interface_field->type)) {
        ReportError(absl::StrCat(
            "Interface field ", interface->name(), ".", field_name,
            " expects type ", interface_field->type->ToString(), " but ",
            type->name(), ".", field_name, " is type ",
            type_field->type->ToString(), "."));
      }
      for (const InputValueDefinition& interface_arg :
           interface_field->arguments) {
        const InputValueDefinition* type_arg =
            type_field->FindArgument(interface_arg.name);
        if (type_arg == nullptr) {
          ReportError(absl::StrCat("Interface field argument ",
                                   interface->name(), ".", field_name, "(",
                                   interface_arg.name, ":) expected but ",
                                   type->name(), ".", field_name,
                                   " does not provide it."));
          continue;
        }
        if (type_arg->type != nullptr && interface_arg.type != nullptr &&
            !type_arg->type->Equals(interface_arg.type)) {
          ReportError(absl::StrCat(
              "Interface field argument ", interface->name(), ".", field_name,
              "(", interface_arg.name, ":) expects type ",
              interface_arg.type->ToString(), " but ", type->name(), ".",
              field_name, "(", interface_arg.name, ":) is type ",
              type_arg->type->ToString(), "."));
        }
      }
      for (const InputValueDefinition& type_arg : type_field->arguments) {
        if (interface_field->FindArgument(type_arg.name) == nullptr &&
            type_arg.IsRequired()) {
          ReportError(absl::StrCat(
              "Object field ", type->name(), ".", field_name,
              " includes required argument ", type_arg.name,
              " that is missing from the Interface field ", interface->name(),
              ".", field_name, "."));
        }
      }
    }
  }

  void ValidateUnionMembers(const UnionType* union_type) {
    if (union_type->members().empty()) {
      ReportError(absl::StrCat("Union type ", union_type->name(),
                               " must define one or more member types."));
    }
    absl::flat_hash_set<const ObjectType*> included;
    for (const ObjectType* member : union_type->members()) {
      if (!included.insert(member).second) {
        ReportError(absl::StrCat("Union type ", union_type->name(),
                                 " can only include type ", member->name(),
                                 " once."));
      }
    }
  }

  void ValidateEnumValues(const EnumType* enum_type) {
    if (enum_type->values().empty()) {
      ReportError(absl::StrCat("Enum type ", enum_type->name(),
                               " must define one or more values."));
    }
    absl::flat_hash_set<std::string> seen;
    for (const EnumValueDefinition& value : enum_type->values()) {
      if (!seen.insert(value.name).second) {
        ReportError(absl::StrCat("Enum type ", enum_type->name(),
                                 " can include value ", value.name,
                                 " only once."));
        continue;
      }
      ValidateName(value.name);
      if (value.name == "true" || value.name == "false" ||
          value.name == "null") {
        ReportError(absl::StrCat("Enum type ", enum_type->name(),
                                 " cannot include value: ", value.name, "."));
      }
    }
  }

  void ValidateInputFields(const InputObjectType* input) {
    if (input->fields().empty()) {
      ReportError(absl::StrCat("Input Object type ", input->name(),
                               " must define one or more fields."));
    }
    for (const InputValueDefinition* field : input->fields()) {
      ValidateName(field->name);
      if (field->type == nullptr || !field->type->IsInputType()) {
        ReportError(absl::StrCat("The type of ", input->name(), ".",
                                 field->name,
                                 " must be Input Type but got: ",
                                 TypeString(field->type), "."));
      }
      if (field->IsRequired() && field->deprecation_reason.has_value()) {
        ReportError(absl::StrCat("Required input field ", input->name(), ".",
                                 field->name, " cannot be deprecated."));
      }
      if (input->is_one_of()) {
        if (field->type != nullptr && field->type->IsNonNull()) {
          ReportError(absl::StrCat("OneOf input field ", input->name(), ".",
                                   field->name, " must be nullable."));
        }
        if (field->has_default_value()) {
          ReportError(absl::StrCat("OneOf input field ", input->name(), ".",
                                   field->name,
                                   " cannot have a default value."));
        }
      }
    }
  }

  const Schema& schema_;
  std::vector<std::string> errors_;
};

}  // namespace

const FieldDefinition* TypeNameMetaFieldDef() {
  static const FieldDefinition* field = new FieldDefinition{
      .name = "__typename",
      .type = types::NonNullStringType(),
      .resolve = [](const Value& source, const Value& args,
                    const ResolveInfo& info) -> absl::StatusOr<Value> {
        return Value::String(info.parent_type->name());
      },
      .description = "The name of the current Object type at runtime.",
  };
  return field;
}

absl::StatusOr<std::unique_ptr<const Schema>> Schema::Create(
    SchemaConfig config, SchemaOptions options) {
  std::unique_ptr<Schema> schema(new Schema());
  schema->wrapper_types_ = std::make_unique<TypeFactory>();
  schema->query_ = config.query;
  schema->mutation_ = config.mutation;
  schema->subscription_ = config.subscription;
  schema->description_ = std::move(config.description);
  schema->assume_valid_ = options.assume_valid;

  schema->directives_ = config.directives.empty()
                            ? directives::SpecifiedDirectives()
                            : std::move(config.directives);
  if (options.enable_defer_stream) {
    for (const Directive* directive :
         {directives::DeferDirective(), directives::StreamDirective()}) {
      if (!absl::c_linear_search(schema->directives_, directive)) {
        schema->directives_.push_back(directive);
      }
    }
  }

  GQLENGINE_RETURN_IF_ERROR(schema->AddType(schema->query_));
  GQLENGINE_RETURN_IF_ERROR(schema->AddType(schema->mutation_));
  GQLENGINE_RETURN_IF_ERROR(schema->AddType(schema->subscription_));
  for (const NamedType* type : config.types) {
    GQLENGINE_RETURN_IF_ERROR(schema->AddType(type));
  }
  for (const Directive* directive : schema->directives_) {
    for (const InputValueDefinition& arg : directive->args()) {
      GQLENGINE_RETURN_IF_ERROR(schema->AddType(arg.type));
    }
  }

  for (const NamedType* type : schema->type_list_) {
    if (const ObjectType* object = type->AsObject()) {
      for (const InterfaceType* interface : object->interfaces()) {
        schema->possible_types_[interface].push_back(object);
      }
    } else if (const InterfaceType* interface = type->AsInterface()) {
      for (const InterfaceType* parent : interface->interfaces()) {
        schema->interface_implementations_[parent].push_back(interface);
      }
    } else if (const UnionType* union_type = type->AsUnion()) {
      schema->possible_types_[union_type] = union_type->members();
    }
  }

  GQLENGINE_VLOG(1) << "Created schema with " << schema->type_list_.size()
                    << " types";
  return std::unique_ptr<const Schema>(std::move(schema));
}

absl::Status Schema::AddType(const Type* type) {
  if (type == nullptr) return absl::OkStatus();
  const NamedType* named = type->Named();
  auto [it, inserted] = types_by_name_.emplace(named->name(), named);
  if (!inserted) {
    if (it->second != named) {
      return MakeMisuseError()
             << "Schema must contain uniquely named types but contains "
                "multiple types named '"
             << named->name() << "'.";
    }
    return absl::OkStatus();
  }
  type_list_.push_back(named);

  if (const UnionType* union_type = named->AsUnion()) {
    for (const ObjectType* member : union_type->members()) {
      GQLENGINE_RETURN_IF_ERROR(AddType(member));
    }
  }
  if (const FieldsType* fields_type =
          named->IsObject() || named->IsInterface()
              ? static_cast<const FieldsType*>(named)
              : nullptr) {
    for (const InterfaceType* interface : fields_type->interfaces()) {
      GQLENGINE_RETURN_IF_ERROR(AddType(interface));
    }
    for (const FieldDefinition* field : fields_type->fields()) {
      for (const InputValueDefinition& arg : field->arguments) {
        GQLENGINE_RETURN_IF_ERROR(AddType(arg.type));
      }
      GQLENGINE_RETURN_IF_ERROR(AddType(field->type));
    }
  }
  if (const InputObjectType* input = named->AsInputObject()) {
    for (const InputValueDefinition* field : input->fields()) {
      GQLENGINE_RETURN_IF_ERROR(AddType(field->type));
    }
  }
  return absl::OkStatus();
}

const ObjectType* Schema::GetRootType(OperationType operation) const {
  switch (operation) {
    case OperationType::kQuery:
      return query_;
    case OperationType::kMutation:
      return mutation_;
    case OperationType::kSubscription:
      return subscription_;
  }
  return nullptr;
}

const NamedType* Schema::GetType(absl::string_view name) const {
  auto it = types_by_name_.find(name);
  return it == types_by_name_.end() ? nullptr : it->second;
}

const Directive* Schema::GetDirective(absl::string_view name) const {
  for (const Directive* directive : directives_) {
    if (directive->name() == name) return directive;
  }
  return nullptr;
}

const FieldDefinition* Schema::GetField(const NamedType* parent_type,
                                        absl::string_view field_name) const {
  if (field_name == "__typename") return TypeNameMetaFieldDef();
  if (parent_type->IsObject() || parent_type->IsInterface()) {
    return static_cast<const FieldsType*>(parent_type)->FindField(field_name);
  }
  return nullptr;
}

const std::vector<const ObjectType*>& Schema::GetPossibleTypes(
    const NamedType* abstract_type) const {
  auto it = possible_types_.find(abstract_type);
  return it == possible_types_.end() ? EmptyObjectTypes() : it->second;
}

bool Schema::IsSubType(const NamedType* abstract_type,
                       const NamedType* maybe_sub_type) const {
  if (const ObjectType* object = maybe_sub_type->AsObject()) {
    return absl::c_linear_search(GetPossibleTypes(abstract_type), object);
  }
  if (const InterfaceType* interface = maybe_sub_type->AsInterface()) {
    auto it = interface_implementations_.find(abstract_type);
    return it != interface_implementations_.end() &&
           absl::c_linear_search(it->second, interface);
  }
  return false;
}

bool Schema::IsTypeSubTypeOf(const Type* maybe_sub_type,
                             const Type* super_type) const {
  if (maybe_sub_type->Equals(super_type)) return true;
  if (super_type->IsNonNull()) {
    if (maybe_sub_type->IsNonNull()) {
      return IsTypeSubTypeOf(maybe_sub_type->of_type(), super_type->of_type());
    }
    return false;
  }
  if (maybe_sub_type->IsNonNull()) {
    return IsTypeSubTypeOf(maybe_sub_type->of_type(), super_type);
  }
  if (super_type->IsList()) {
    if (maybe_sub_type->IsList()) {
      return IsTypeSubTypeOf(maybe_sub_type->of_type(), super_type->of_type());
    }
    return false;
  }
  if (maybe_sub_type->IsList()) return false;
  return super_type->IsAbstract() &&
         (maybe_sub_type->IsInterface() || maybe_sub_type->IsObject()) &&
         IsSubType(super_type->AsNamed(), maybe_sub_type->AsNamed());
}

const Type* Schema::TypeFromAst(const TypeNode& node) const {
  if (const NonNullTypeNode* non_null = node.GetAsOrNull<NonNullTypeNode>()) {
    const Type* inner = TypeFromAst(*non_null->type());
    return inner == nullptr ? nullptr : wrapper_types_->MakeNonNullType(inner);
  }
  if (const ListTypeNode* list = node.GetAsOrNull<ListTypeNode>()) {
    const Type* inner = TypeFromAst(*list->type());
    return inner == nullptr ? nullptr : wrapper_types_->MakeListType(inner);
  }
  return GetType(node.GetAsOrDie<NamedTypeNode>()->name());
}

absl::Status Schema::Validate() const {
  if (assume_valid_) return absl::OkStatus();
  absl::call_once(validate_once_,
                  [this] { validation_status_ = ValidateImpl(); });
  return validation_status_;
}

absl::Status Schema::ValidateImpl() const {
  SchemaValidator validator(*this);
  return validator.Validate();
}

}  // namespace gqlengine
