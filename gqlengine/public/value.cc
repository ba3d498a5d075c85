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


#include "gqlengine/public/value.h"

#include <cmath>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "gqlengine/base/logging.h"
#include "gqlengine/common/json_util.h"

namespace gqlengine {

Value Value::Null() { return Value(kNull, std::monostate()); }

Value Value::Bool(bool value) {
  return Value(kBoolean, Payload(std::in_place_type<bool>, value));
}

Value Value::Int(int64_t value) {
  return Value(kInt, Payload(std::in_place_type<int64_t>, value));
}

Value Value::Float(double value) {
  return Value(kFloat, Payload(std::in_place_type<double>, value));
}

Value Value::String(std::string value) {
  return Value(kString,
               Payload(std::in_place_type<std::string>, std::move(value)));
}

Value Value::List(std::vector<Value> values) {
  return Value(kList,
               std::make_shared<const std::vector<Value>>(std::move(values)));
}

Value Value::Object(ObjectFields fields) {
  return Value(kObject, std::make_shared<const ObjectFields>(std::move(fields)));
}

Value Value::Host(std::shared_ptr<HostObject> host) {
  if (host == nullptr) return Null();
  return Value(kHost, std::move(host));
}

Value Value::Function(ValueFunction function) {
  return Value(kFunction,
               std::make_shared<const ValueFunction>(std::move(function)));
}

Value Value::Pending(PendingValue pending) {
  return Value(kPending, std::move(pending));
}

Value Value::Pending(gqlengine_base::Future<Value> pending) {
  return Pending(pending.Then(
      [](const Value& value) -> absl::StatusOr<Value> { return value; }));
}

Value Value::Iterator(std::shared_ptr<AsyncIterator> iterator) {
  if (iterator == nullptr) return Null();
  return Value(kAsyncIterator, std::move(iterator));
}

bool Value::bool_value() const {
  GQLENGINE_DCHECK(is_bool()) << KindName(kind_);
  return std::get<bool>(payload_);
}

int64_t Value::int_value() const {
  GQLENGINE_DCHECK(is_int()) << KindName(kind_);
  return std::get<int64_t>(payload_);
}

double Value::float_value() const {
  if (kind_ == kInt) return static_cast<double>(std::get<int64_t>(payload_));
  GQLENGINE_DCHECK(is_float()) << KindName(kind_);
  return std::get<double>(payload_);
}

const std::string& Value::string_value() const {
  GQLENGINE_DCHECK(is_string()) << KindName(kind_);
  return std::get<std::string>(payload_);
}

const std::vector<Value>& Value::list_value() const {
  GQLENGINE_DCHECK(is_list()) << KindName(kind_);
  return *std::get<std::shared_ptr<const std::vector<Value>>>(payload_);
}

const ObjectFields& Value::object_fields() const {
  GQLENGINE_DCHECK(is_object()) << KindName(kind_);
  return *std::get<std::shared_ptr<const ObjectFields>>(payload_);
}

const std::shared_ptr<HostObject>& Value::host_object() const {
  GQLENGINE_DCHECK(is_host()) << KindName(kind_);
  return std::get<std::shared_ptr<HostObject>>(payload_);
}

const ValueFunction& Value::function() const {
  GQLENGINE_DCHECK(is_function()) << KindName(kind_);
  return *std::get<std::shared_ptr<const ValueFunction>>(payload_);
}

const PendingValue& Value::pending() const {
  GQLENGINE_DCHECK(is_pending()) << KindName(kind_);
  return std::get<PendingValue>(payload_);
}

const std::shared_ptr<AsyncIterator>& Value::async_iterator() const {
  GQLENGINE_DCHECK(is_async_iterator()) << KindName(kind_);
  return std::get<std::shared_ptr<AsyncIterator>>(payload_);
}

const Value* Value::FindField(absl::string_view name) const {
  if (!is_object()) return nullptr;
  for (const auto& [field_name, field_value] : object_fields()) {
    if (field_name == name) return &field_value;
  }
  return nullptr;
}

bool Value::Equals(const Value& that) const {
  if (kind_ != that.kind_) return false;
  switch (kind_) {
    case kInvalid:
    case kNull:
      return true;
    case kBoolean:
      return bool_value() == that.bool_value();
    case kInt:
      return int_value() == that.int_value();
    case kFloat:
      return float_value() == that.float_value();
    case kString:
      return string_value() == that.string_value();
    case kList: {
      const std::vector<Value>& a = list_value();
      const std::vector<Value>& b = that.list_value();
      if (a.size() != b.size()) return false;
      for (size_t i = 0; i < a.size(); ++i) {
        if (!a[i].Equals(b[i])) return false;
      }
      return true;
    }
    case kObject: {
      const ObjectFields& a = object_fields();
      const ObjectFields& b = that.object_fields();
      if (a.size() != b.size()) return false;
      for (size_t i = 0; i < a.size(); ++i) {
        if (a[i].first != b[i].first || !a[i].second.Equals(b[i].second)) {
          return false;
        }
      }
      return true;
    }
    case kHost:
      return host_object() == that.host_object();
    case kFunction:
      return std::get<std::shared_ptr<const ValueFunction>>(payload_) ==
             std::get<std::shared_ptr<const ValueFunction>>(that.payload_);
    case kPending:
      // Futures have no identity accessor; two pending values are never
      // considered equal.
      return false;
    case kAsyncIterator:
      return async_iterator() == that.async_iterator();
  }
  return false;
}

std::string Value::KindName(Kind kind) {
  switch (kind) {
    case kInvalid:
      return "INVALID";
    case kNull:
      return "NULL";
    case kBoolean:
      return "BOOLEAN";
    case kInt:
      return "INT";
    case kFloat:
      return "FLOAT";
    case kString:
      return "STRING";
    case kList:
      return "LIST";
    case kObject:
      return "OBJECT";
    case kHost:
      return "HOST";
    case kFunction:
      return "FUNCTION";
    case kPending:
      return "PENDING";
    case kAsyncIterator:
      return "ASYNC_ITERATOR";
  }
  return "UNKNOWN";
}

void Value::AppendDebugString(std::string* out) const {
  switch (kind_) {
    case kInvalid:
      absl::StrAppend(out, "undefined");
      return;
    case kNull:
      absl::StrAppend(out, "null");
      return;
    case kBoolean:
      absl::StrAppend(out, bool_value() ? "true" : "false");
      return;
    case kInt:
      absl::StrAppend(out, int_value());
      return;
    case kFloat: {
      const double value = float_value();
      if (std::isnan(value)) {
        absl::StrAppend(out, "NaN");
      } else if (std::isinf(value)) {
        absl::StrAppend(out, value > 0 ? "Infinity" : "-Infinity");
      } else {
        absl::StrAppend(out, JsonNumber(value));
      }
      return;
    }
    case kString:
      JsonEscapeString(string_value(), out);
      return;
    case kList: {
      out->push_back('[');
      bool first = true;
      for (const Value& item : list_value()) {
        if (!first) absl::StrAppend(out, ", ");
        first = false;
        item.AppendDebugString(out);
      }
      out->push_back(']');
      return;
    }
    case kObject: {
      const ObjectFields& fields = object_fields();
      if (fields.empty()) {
        absl::StrAppend(out, "{}");
        return;
      }
      absl::StrAppend(out, "{ ");
      bool first = true;
      for (const auto& [name, value] : fields) {
        if (!first) absl::StrAppend(out, ", ");
        first = false;
        absl::StrAppend(out, name, ": ");
        value.AppendDebugString(out);
      }
      absl::StrAppend(out, " }");
      return;
    }
    case kHost: {
      const std::string type_name = host_object()->TypeName();
      absl::StrAppend(out, "<", type_name.empty() ? "host object" : type_name,
                      ">");
      return;
    }
    case kFunction:
      absl::StrAppend(out, "<function>");
      return;
    case kPending:
      absl::StrAppend(out, "<pending>");
      return;
    case kAsyncIterator:
      absl::StrAppend(out, "<async iterator>");
      return;
  }
}

std::string Value::DebugString() const {
  std::string out;
  AppendDebugString(&out);
  return out;
}

void Value::AppendJson(std::string* out) const {
  switch (kind_) {
    case kBoolean:
      absl::StrAppend(out, bool_value() ? "true" : "false");
      return;
    case kInt:
      absl::StrAppend(out, int_value());
      return;
    case kFloat:
      absl::StrAppend(out, JsonNumber(float_value()));
      return;
    case kString:
      JsonEscapeString(string_value(), out);
      return;
    case kList: {
      out->push_back('[');
      bool first = true;
      for (const Value& item : list_value()) {
        if (!first) out->push_back(',');
        first = false;
        item.AppendJson(out);
      }
      out->push_back(']');
      return;
    }
    case kObject: {
      out->push_back('{');
      bool first = true;
      for (const auto& [name, value] : object_fields()) {
        if (!first) out->push_back(',');
        first = false;
        JsonEscapeString(name, out);
        out->push_back(':');
        value.AppendJson(out);
      }
      out->push_back('}');
      return;
    }
    default:
      absl::StrAppend(out, "null");
      return;
  }
}

std::string Value::ToJson() const {
  std::string out;
  AppendJson(&out);
  return out;
}

std::ostream& operator<<(std::ostream& out, const Value& value) {
  return out << value.DebugString();
}

}  // namespace gqlengine
