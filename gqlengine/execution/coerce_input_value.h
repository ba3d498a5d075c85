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


#ifndef GQLENGINE_EXECUTION_COERCE_INPUT_VALUE_H_
#define GQLENGINE_EXECUTION_COERCE_INPUT_VALUE_H_

#include <functional>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "gqlengine/public/response_path.h"
#include "gqlengine/public/type.h"
#include "gqlengine/public/value.h"

namespace gqlengine {

// Receives each problem found while coercing an input value. `path` leads
// from the coerced value to the offending part of it; `invalid_value` is that
// part.
using InputCoercionErrorHandler =
    std::function<void(const std::vector<PathKey>& path,
                       const Value& invalid_value, absl::Status error)>;

// Coerces an external input value (typically a variable value from the
// request) into the internal value of input type `type`. Every problem is
// reported to `on_error`; coercion continues past errors so that a caller
// can collect all of them. The returned value is only meaningful if no error
// was reported.
Value CoerceInputValue(const Value& input_value, const Type* type,
                       const InputCoercionErrorHandler& on_error);

// As above, but returns the first problem as an error whose message names
// the invalid value and its location, e.g.
// "Invalid value 1 at 'value.a[0]': Expected type 'Boolean'".
absl::StatusOr<Value> CoerceInputValue(const Value& input_value,
                                       const Type* type);

// "[0]" for indexes and ".name" for keys, concatenated.
std::string PrintPathList(const std::vector<PathKey>& path);

}  // namespace gqlengine

#endif  // GQLENGINE_EXECUTION_COERCE_INPUT_VALUE_H_
