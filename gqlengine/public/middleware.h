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


#ifndef GQLENGINE_PUBLIC_MIDDLEWARE_H_
#define GQLENGINE_PUBLIC_MIDDLEWARE_H_

#include <functional>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "gqlengine/public/resolve_info.h"
#include "gqlengine/public/type.h"
#include "gqlengine/public/value.h"

namespace gqlengine {

// Wraps field resolution. A middleware calls `next` to continue with the
// rest of the chain, and may inspect or replace its result.
//
//   Middleware upper_case = [](const FieldResolver& next, const Value& source,
//                              const Value& args, const ResolveInfo& info)
//       -> absl::StatusOr<Value> {
//     GQLENGINE_ASSIGN_OR_RETURN(Value value, next(source, args, info));
//     if (!value.is_string()) return value;
//     return Value::String(absl::AsciiStrToUpper(value.string_value()));
//   };
using Middleware = std::function<absl::StatusOr<Value>(
    const FieldResolver& next, const Value& source, const Value& args,
    const ResolveInfo& info)>;

// Chains middleware around field resolvers. Each middleware wraps the chain
// built from the ones listed before it, so the last one is the outermost.
//
// Thread safe.
class MiddlewareManager {
 public:
  explicit MiddlewareManager(std::vector<Middleware> middleware)
      : middleware_(std::move(middleware)) {}
  MiddlewareManager(const MiddlewareManager&) = delete;
  MiddlewareManager& operator=(const MiddlewareManager&) = delete;

  bool empty() const { return middleware_.empty(); }

  // Returns `resolver` wrapped in the middleware. The chain is built once per
  // `field`; `field` may be null for a resolver that belongs to no field.
  FieldResolver GetFieldResolver(const FieldDefinition* field,
                                 const FieldResolver& resolver)
      ABSL_LOCKS_EXCLUDED(mu_);

 private:
  FieldResolver Chain(FieldResolver resolver) const;

  const std::vector<Middleware> middleware_;

  absl::Mutex mu_;
  absl::flat_hash_map<const FieldDefinition*, FieldResolver> cache_
      ABSL_GUARDED_BY(mu_);
};

}  // namespace gqlengine

#endif  // GQLENGINE_PUBLIC_MIDDLEWARE_H_
