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


#ifndef GQLENGINE_COMMON_JSON_UTIL_H_
#define GQLENGINE_COMMON_JSON_UTIL_H_

#include <string>

#include "absl/strings/string_view.h"

namespace gqlengine {

// Appends the contents of `raw` to `out` escaped in JSON style, surrounded by
// double quotes.
void JsonEscapeString(absl::string_view raw, std::string* out);

// Returns `raw` as a quoted JSON string.
std::string JsonQuote(absl::string_view raw);

// Returns true iff JsonEscapeString(...) would have found any characters that
// need escaping in the given raw input string.
bool JsonStringNeedsEscaping(absl::string_view raw);

// Formats a finite double with the fewest digits that parse back to the same
// value. Integral values print without a fractional part ("3", not "3.0").
std::string JsonNumber(double value);

}  // namespace gqlengine

#endif  // GQLENGINE_COMMON_JSON_UTIL_H_
