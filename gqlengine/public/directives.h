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


#ifndef GQLENGINE_PUBLIC_DIRECTIVES_H_
#define GQLENGINE_PUBLIC_DIRECTIVES_H_

#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "gqlengine/public/type.h"

namespace gqlengine {

enum class DirectiveLocation {
  // Executable locations.
  kQuery,
  kMutation,
  kSubscription,
  kField,
  kFragmentDefinition,
  kFragmentSpread,
  kInlineFragment,
  kVariableDefinition,
  // Type system locations.
  kSchema,
  kScalar,
  kObject,
  kFieldDefinition,
  kArgumentDefinition,
  kInterface,
  kUnion,
  kEnum,
  kEnumValue,
  kInputObject,
  kInputFieldDefinition,
};

// Returns the location as it is spelled in SDL, e.g. "FRAGMENT_SPREAD".
std::string DirectiveLocationName(DirectiveLocation location);

// A directive definition.
class Directive {
 public:
  Directive(std::string name, std::vector<DirectiveLocation> locations,
            std::vector<InputValueDefinition> args, bool is_repeatable = false,
            std::string description = "")
      : name_(std::move(name)),
        locations_(std::move(locations)),
        args_(std::move(args)),
        is_repeatable_(is_repeatable),
        description_(std::move(description)) {}
  Directive(const Directive&) = delete;
  Directive& operator=(const Directive&) = delete;

  const std::string& name() const { return name_; }
  const std::vector<DirectiveLocation>& locations() const {
    return locations_;
  }
  const std::vector<InputValueDefinition>& args() const { return args_; }
  bool is_repeatable() const { return is_repeatable_; }
  const std::string& description() const { return description_; }

  const InputValueDefinition* FindArgument(absl::string_view name) const;

  // "@name"
  std::string ToString() const { return "@" + name_; }

 private:
  const std::string name_;
  const std::vector<DirectiveLocation> locations_;
  const std::vector<InputValueDefinition> args_;
  const bool is_repeatable_;
  const std::string description_;
};

namespace directives {

inline constexpr absl::string_view kDefaultDeprecationReason =
    "No longer supported";

// The built-in directives. These are static and live forever.
const Directive* IncludeDirective();
const Directive* SkipDirective();
const Directive* DeprecatedDirective();
const Directive* SpecifiedByDirective();
const Directive* OneOfDirective();

// Incremental delivery. Only installed in schemas that enable it.
const Directive* DeferDirective();
const Directive* StreamDirective();

// @include, @skip, @deprecated, @specifiedBy and @oneOf.
const std::vector<const Directive*>& SpecifiedDirectives();
bool IsSpecifiedDirective(const Directive* directive);

}  // namespace directives

}  // namespace gqlengine

#endif  // GQLENGINE_PUBLIC_DIRECTIVES_H_
