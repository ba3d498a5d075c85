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


#include "gqlengine/execution/coerce_input_value.h"

#include <string>
#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "gqlengine/base/status_builder.h"
#include "gqlengine/common/errors.h"
#include "gqlengine/common/suggestion_list.h"

namespace gqlengine {

namespace {

class InputCoercer {
 public:
  explicit InputCoercer(const InputCoercionErrorHandler& on_error)
      : on_error_(on_error) {}

  Value Coerce(const Value& input_value, const Type* type);

 private:
  Value CoerceInputObject(const Value& input_value,
                          const InputObjectType* type);
  Value CoerceLeaf(const Value& input_value, const NamedType* type);

  void Report(const Value& invalid_value, absl::Status error) {
    on_error_(path_, invalid_value, std::move(error));
  }

  const InputCoercionErrorHandler& on_error_;
  std::vector<PathKey> path_;
};

Value InputCoercer::Coerce(const Value& input_value, const Type* type) {
  if (type->IsNonNull()) {
    if (!input_value.is_nullish()) {
      return Coerce(input_value, type->of_type());
    }
    Report(input_value, MakeGraphQLError()
                            << "Expected non-nullable type '"
                            << type->ToString() << "' not to be None.");
    return Value();
  }

  if (input_value.is_nullish()) {
    return Value::Null();
  }

  if (const ListType* list_type = type->AsList()) {
    const Type* item_type = list_type->of_type();
    if (!input_value.is_list()) {
      // A single value is accepted as a list of one.
      return Value::List({Coerce(input_value, item_type)});
    }
    std::vector<Value> items;
    const std::vector<Value>& input_items = input_value.list_value();
    items.reserve(input_items.size());
    for (int i = 0; i < static_cast<int>(input_items.size()); ++i) {
      path_.push_back(i);
      items.push_back(Coerce(input_items[i], item_type));
      path_.pop_back();
    }
    return Value::List(std::move(items));
  }

  if (const InputObjectType* input_object = type->AsInputObject()) {
    return CoerceInputObject(input_value, input_object);
  }

  return CoerceLeaf(input_value, type->AsNamed());
}

Value InputCoercer::CoerceInputObject(const Value& input_value,
                                      const InputObjectType* type) {
  if (!input_value.is_object()) {
    Report(input_value, MakeGraphQLError() << "Expected type '" << type->name()
                                           << "' to be a mapping.");
    return Value();
  }

  ObjectFields coerced;
  for (const InputValueDefinition* field : type->fields()) {
    const Value* field_value = input_value.FindField(field->name);
    if (field_value == nullptr || !field_value->is_valid()) {
      if (field->has_default_value()) {
        coerced.emplace_back(field->coerced_name(), field->default_value);
      } else if (field->type->IsNonNull()) {
        Report(input_value, MakeGraphQLError()
                                << "Field '" << field->name
                                << "' of required type '"
                                << field->type->ToString()
                                << "' was not provided.");
      }
      continue;
    }
    path_.push_back(field->name);
    Value coerced_field = Coerce(*field_value, field->type);
    path_.pop_back();
    coerced.emplace_back(field->coerced_name(), std::move(coerced_field));
  }

  // Every provided field must be defined.
  for (const auto& [name, value] : input_value.object_fields()) {
    if (type->FindField(name) != nullptr) continue;
    std::vector<std::string> field_names;
    for (const InputValueDefinition* field : type->fields()) {
      field_names.push_back(field->name);
    }
    Report(input_value, MakeGraphQLError()
                            << "Field '" << name << "' is not defined by type '"
                            << type->name() << "'."
                            << DidYouMean(SuggestionList(name, field_names)));
  }

  if (type->is_one_of()) {
    if (coerced.size() != 1) {
      Report(input_value, MakeGraphQLError()
                              << "Exactly one key must be specified for OneOf "
                                 "type '"
                              << type->name() << "'.");
    } else if (coerced[0].second.is_null()) {
      const std::string& key = coerced[0].first;
      path_.push_back(key);
      Report(coerced[0].second, MakeGraphQLError()
                                    << "Field '" << key
                                    << "' must be non-null.");
      path_.pop_back();
    }
  }
  return Value::Object(std::move(coerced));
}

Value InputCoercer::CoerceLeaf(const Value& input_value,
                               const NamedType* type) {
  absl::StatusOr<Value> parsed;
  if (const ScalarType* scalar = type->AsScalar()) {
    parsed = scalar->ParseValue(input_value);
  } else if (const EnumType* enum_type = type->AsEnum()) {
    parsed = enum_type->ParseValue(input_value);
  } else {
    parsed = absl::InternalError(
        absl::StrCat("Unexpected input type: ", type->name()));
  }
  if (!parsed.ok()) {
    if (absl::IsInvalidArgument(parsed.status())) {
      Report(input_value, parsed.status());
    } else {
      // Not an error produced for the client; keep its text as the detail.
      Report(input_value, MakeGraphQLError()
                              << "Expected type '" << type->name() << "'. "
                              << parsed.status().message());
    }
    return Value();
  }
  if (!parsed->is_valid()) {
    Report(input_value, MakeGraphQLError()
                            << "Expected type '" << type->name() << "'.");
  }
  return *std::move(parsed);
}

}  // namespace

std::string PrintPathList(const std::vector<PathKey>& path) {
  std::string out;
  for (const PathKey& key : path) {
    if (const int* index = std::get_if<int>(&key)) {
      absl::StrAppend(&out, "[", *index, "]");
    } else {
      absl::StrAppend(&out, ".", std::get<std::string>(key));
    }
  }
  return out;
}

Value CoerceInputValue(const Value& input_value, const Type* type,
                       const InputCoercionErrorHandler& on_error) {
  InputCoercer coercer(on_error);
  return coercer.Coerce(input_value, type);
}

absl::StatusOr<Value> CoerceInputValue(const Value& input_value,
                                       const Type* type) {
  absl::Status first_error;
  Value coerced = CoerceInputValue(
      input_value, type,
      [&first_error](const std::vector<PathKey>& path,
                     const Value& invalid_value, absl::Status error) {
        if (!first_error.ok()) return;
        std::string prefix =
            absl::StrCat("Invalid value ", invalid_value.DebugString());
        if (!path.empty()) {
          absl::StrAppend(&prefix, " at 'value", PrintPathList(path), "'");
        }
        first_error = gqlengine_base::StatusBuilder(std::move(error))
                          .SetPrepend()
                      << prefix << ": ";
      });
  if (!first_error.ok()) return first_error;
  return coerced;
}

}  // namespace gqlengine
