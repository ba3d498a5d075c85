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


#include "gqlengine/public/directives.h"

#include <string>
#include <vector>

namespace gqlengine {

std::string DirectiveLocationName(DirectiveLocation location) {
  switch (location) {
    case DirectiveLocation::kQuery:
      return "QUERY";
    case DirectiveLocation::kMutation:
      return "MUTATION";
    case DirectiveLocation::kSubscription:
      return "SUBSCRIPTION";
    case DirectiveLocation::kField:
      return "FIELD";
    case DirectiveLocation::kFragmentDefinition:
      return "FRAGMENT_DEFINITION";
    case DirectiveLocation::kFragmentSpread:
      return "FRAGMENT_SPREAD";
    case DirectiveLocation::kInlineFragment:
      return "INLINE_FRAGMENT";
    case DirectiveLocation::kVariableDefinition:
      return "VARIABLE_DEFINITION";
    case DirectiveLocation::kSchema:
      return "SCHEMA";
    case DirectiveLocation::kScalar:
      return "SCALAR";
    case DirectiveLocation::kObject:
      return "OBJECT";
    case DirectiveLocation::kFieldDefinition:
      return "FIELD_DEFINITION";
    case DirectiveLocation::kArgumentDefinition:
      return "ARGUMENT_DEFINITION";
    case DirectiveLocation::kInterface:
      return "INTERFACE";
    case DirectiveLocation::kUnion:
      return "UNION";
    case DirectiveLocation::kEnum:
      return "ENUM";
    case DirectiveLocation::kEnumValue:
      return "ENUM_VALUE";
    case DirectiveLocation::kInputObject:
      return "INPUT_OBJECT";
    case DirectiveLocation::kInputFieldDefinition:
      return "INPUT_FIELD_DEFINITION";
  }
  return "UNKNOWN";
}

const InputValueDefinition* Directive::FindArgument(
    absl::string_view name) const {
  for (const InputValueDefinition& arg : args_) {
    if (arg.name == name) return &arg;
  }
  return nullptr;
}

namespace directives {

namespace {

const Type* NonNullBoolean() {
  static TypeFactory* factory = new TypeFactory();
  static const Type* type = factory->MakeNonNullType(types::BooleanType());
  return type;
}

const Type* NonNullString() { return types::NonNullStringType(); }

}  // namespace

const Directive* IncludeDirective() {
  static const Directive* directive = new Directive(
      "include",
      {DirectiveLocation::kField, DirectiveLocation::kFragmentSpread,
       DirectiveLocation::kInlineFragment},
      {{.name = "if",
        .type = NonNullBoolean(),
        .description = "Included when true."}},
      /*is_repeatable=*/false,
      "Directs the executor to include this field or fragment only when the "
      "`if` argument is true.");
  return directive;
}

const Directive* SkipDirective() {
  static const Directive* directive = new Directive(
      "skip",
      {DirectiveLocation::kField, DirectiveLocation::kFragmentSpread,
       DirectiveLocation::kInlineFragment},
      {{.name = "if",
        .type = NonNullBoolean(),
        .description = "Skipped when true."}},
      /*is_repeatable=*/false,
      "Directs the executor to skip this field or fragment when the `if` "
      "argument is true.");
  return directive;
}

const Directive* DeferDirective() {
  static const Directive* directive = new Directive(
      "defer",
      {DirectiveLocation::kFragmentSpread, DirectiveLocation::kInlineFragment},
      {{.name = "if",
        .type = NonNullBoolean(),
        .default_value = Value::Bool(true),
        .description = "Deferred when true or undefined."},
       {.name = "label",
        .type = types::StringType(),
        .description = "Unique name"}},
      /*is_repeatable=*/false,
      "Directs the executor to defer this fragment when the `if` argument is "
      "true or undefined.");
  return directive;
}

const Directive* StreamDirective() {
  static const Directive* directive = new Directive(
      "stream", {DirectiveLocation::kField},
      {{.name = "if",
        .type = NonNullBoolean(),
        .default_value = Value::Bool(true),
        .description = "Stream when true or undefined."},
       {.name = "label",
        .type = types::StringType(),
        .description = "Unique name"},
       {.name = "initialCount",
        .type = types::IntType(),
        .default_value = Value::Int(0),
        .description = "Number of items to return immediately"}},
      /*is_repeatable=*/false,
      "Directs the executor to stream plural fields when the `if` argument "
      "is true or undefined.");
  return directive;
}

const Directive* DeprecatedDirective() {
  static const Directive* directive = new Directive(
      "deprecated",
      {DirectiveLocation::kFieldDefinition,
       DirectiveLocation::kArgumentDefinition,
       DirectiveLocation::kInputFieldDefinition,
       DirectiveLocation::kEnumValue},
      {{.name = "reason",
        .type = types::StringType(),
        .default_value = Value::String(std::string(kDefaultDeprecationReason)),
        .description =
            "Explains why this element was deprecated, usually also including "
            "a suggestion for how to access supported similar data. Formatted "
            "using the Markdown syntax, as specified by "
            "[CommonMark](https://commonmark.org/)."}},
      /*is_repeatable=*/false,
      "Marks an element of a GraphQL schema as no longer supported.");
  return directive;
}

const Directive* SpecifiedByDirective() {
  static const Directive* directive = new Directive(
      "specifiedBy", {DirectiveLocation::kScalar},
      {{.name = "url",
        .type = NonNullString(),
        .description = "The URL that specifies the behavior of this scalar."}},
      /*is_repeatable=*/false,
      "Exposes a URL that specifies the behavior of this scalar.");
  return directive;
}

const Directive* OneOfDirective() {
  static const Directive* directive = new Directive(
      "oneOf", {DirectiveLocation::kInputObject}, {},
      /*is_repeatable=*/false,
      "Indicates exactly one field must be supplied and this field must not "
      "be `null`.");
  return directive;
}

const std::vector<const Directive*>& SpecifiedDirectives() {
  static const auto* specified = new std::vector<const Directive*>{
      IncludeDirective(), SkipDirective(), DeprecatedDirective(),
      SpecifiedByDirective(), OneOfDirective()};
  return *specified;
}

bool IsSpecifiedDirective(const Directive* directive) {
  for (const Directive* specified : SpecifiedDirectives()) {
    if (specified == directive) return true;
  }
  return false;
}

}  // namespace directives

}  // namespace gqlengine
