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


#include "gqlengine/public/middleware.h"

#include <utility>

namespace gqlengine {

FieldResolver MiddlewareManager::GetFieldResolver(
    const FieldDefinition* field, const FieldResolver& resolver) {
  if (middleware_.empty()) return resolver;
  absl::MutexLock lock(&mu_);
  auto it = cache_.find(field);
  if (it == cache_.end()) {
    it = cache_.emplace(field, Chain(resolver)).first;
  }
  return it->second;
}

FieldResolver MiddlewareManager::Chain(FieldResolver resolver) const {
  for (const Middleware& middleware : middleware_) {
    resolver = [middleware, next = std::move(resolver)](
                   const Value& source, const Value& args,
                   const ResolveInfo& info) {
      return middleware(next, source, args, info);
    };
  }
  return resolver;
}

}  // namespace gqlengine
