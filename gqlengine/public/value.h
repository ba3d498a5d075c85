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


#ifndef GQLENGINE_PUBLIC_VALUE_H_
#define GQLENGINE_PUBLIC_VALUE_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "gqlengine/base/future.h"

namespace gqlengine {

class AsyncIterator;
class HostObject;
class Value;
struct ResolveInfo;

// Ordered (name, value) pairs of an object value.
using ObjectFields = std::vector<std::pair<std::string, Value>>;

// A callable property. The default field resolver invokes it with the field
// arguments and the resolve info.
using ValueFunction =
    std::function<absl::StatusOr<Value>(const Value& args,
                                        const ResolveInfo& info)>;

// The eventual outcome of an asynchronous resolver.
using PendingValue = gqlengine_base::Future<absl::StatusOr<Value>>;

// A dynamically typed value flowing through execution: variables, arguments,
// resolver results and the response data itself.
//
// Values are immutable and cheap to copy; lists and objects share their
// contents. A default-constructed Value is *invalid*, which stands for "no
// value" (an omitted argument or an unset variable) and is distinct from
// null.
//
// Besides the JSON-compatible kinds a Value may wrap application state that
// only resolvers understand: a HostObject, a function, a pending future, or an
// AsyncIterator. These never appear in a serialized response.
class Value {
 public:
  enum Kind {
    kInvalid,
    kNull,
    kBoolean,
    kInt,
    kFloat,
    kString,
    kList,
    kObject,
    kHost,
    kFunction,
    kPending,
    kAsyncIterator,
  };

  // An invalid value.
  Value() = default;

  static Value Null();
  static Value Bool(bool value);
  static Value Int(int64_t value);
  static Value Float(double value);
  static Value String(std::string value);
  static Value List(std::vector<Value> values);
  static Value Object(ObjectFields fields);
  static Value Host(std::shared_ptr<HostObject> host);
  static Value Function(ValueFunction function);
  static Value Pending(PendingValue pending);
  static Value Iterator(std::shared_ptr<AsyncIterator> iterator);

  // Shorthand for a resolver result that completes later.
  static Value Pending(gqlengine_base::Future<Value> pending);

  Kind kind() const { return kind_; }

  bool is_valid() const { return kind_ != kInvalid; }
  bool is_null() const { return kind_ == kNull; }
  // Null or invalid.
  bool is_nullish() const { return kind_ == kNull || kind_ == kInvalid; }
  bool is_bool() const { return kind_ == kBoolean; }
  bool is_int() const { return kind_ == kInt; }
  bool is_float() const { return kind_ == kFloat; }
  bool is_number() const { return kind_ == kInt || kind_ == kFloat; }
  bool is_string() const { return kind_ == kString; }
  bool is_list() const { return kind_ == kList; }
  bool is_object() const { return kind_ == kObject; }
  bool is_host() const { return kind_ == kHost; }
  bool is_function() const { return kind_ == kFunction; }
  bool is_pending() const { return kind_ == kPending; }
  bool is_async_iterator() const { return kind_ == kAsyncIterator; }

  // Accessors. Each REQUIRES the matching kind.
  bool bool_value() const;
  int64_t int_value() const;
  // Also accepts kInt.
  double float_value() const;
  const std::string& string_value() const;
  const std::vector<Value>& list_value() const;
  const ObjectFields& object_fields() const;
  const std::shared_ptr<HostObject>& host_object() const;
  const ValueFunction& function() const;
  const PendingValue& pending() const;
  const std::shared_ptr<AsyncIterator>& async_iterator() const;

  // For kObject values, the value of field `name`, or null if absent.
  const Value* FindField(absl::string_view name) const;

  // Structural equality over the JSON-compatible kinds. Host objects,
  // functions, pending values and iterators compare by identity.
  bool Equals(const Value& that) const;

  // Human-readable rendering for error messages, e.g. `{ a: [1, "x"] }`.
  std::string DebugString() const;

  // JSON text. Kinds without a JSON form serialize as null.
  std::string ToJson() const;

  // Returns the kind as a string, e.g. "INT".
  static std::string KindName(Kind kind);

 private:
  using Payload =
      std::variant<std::monostate, bool, int64_t, double, std::string,
                   std::shared_ptr<const std::vector<Value>>,
                   std::shared_ptr<const ObjectFields>,
                   std::shared_ptr<HostObject>,
                   std::shared_ptr<const ValueFunction>, PendingValue,
                   std::shared_ptr<AsyncIterator>>;

  Value(Kind kind, Payload payload)
      : kind_(kind), payload_(std::move(payload)) {}

  void AppendDebugString(std::string* out) const;
  void AppendJson(std::string* out) const;

  Kind kind_ = kInvalid;
  Payload payload_;
};

inline bool operator==(const Value& a, const Value& b) { return a.Equals(b); }
inline bool operator!=(const Value& a, const Value& b) { return !a.Equals(b); }

// Allows Values in EXPECT_EQ and log lines.
std::ostream& operator<<(std::ostream& out, const Value& value);

// Coerced variable values of an operation, keyed by variable name without
// the leading '$'.
using VariableValues = absl::flat_hash_map<std::string, Value>;

// Application state exposed to the default resolvers. Implementations must be
// safe to call from the threads that run resolvers.
class HostObject {
 public:
  virtual ~HostObject() = default;

  // The value of property `name`, or an invalid Value if there is none.
  virtual Value GetField(absl::string_view name) const = 0;

  // The name of the GraphQL object type this object represents, used by the
  // default type resolver. Empty when unknown.
  virtual std::string TypeName() const { return ""; }
};

}  // namespace gqlengine

#endif  // GQLENGINE_PUBLIC_VALUE_H_
