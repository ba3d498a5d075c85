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


#ifndef GQLENGINE_COMMON_SUGGESTION_LIST_H_
#define GQLENGINE_COMMON_SUGGESTION_LIST_H_

#include <optional>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"

namespace gqlengine {

// Computes the case-insensitive edit distance between `a` and `b`, counting
// insertions, deletions, substitutions and swaps of two adjacent characters
// as one edit each. Strings that differ only in case are at distance 1.
// Returns nullopt once the distance is known to exceed `threshold`.
//
// Only the last three rows of the dynamic programming table are kept, so the
// space cost is O(min(|a|, |b|)).
std::optional<int> LexicalDistance(absl::string_view a, absl::string_view b,
                                   int threshold);

// Given an invalid input string and a list of valid options, returns the
// options close enough to be a plausible typo, sorted by distance and then
// lexicographically.
std::vector<std::string> SuggestionList(
    absl::string_view input, const std::vector<std::string>& options);

// Given ["A", "B", "C"] returns " Did you mean 'A', 'B', or 'C'?". At most
// five suggestions are listed. Returns "" when there are none. A non-empty
// `sub_message` goes before the list: " Did you mean the enum value 'A'?".
std::string DidYouMean(const std::vector<std::string>& suggestions,
                       absl::string_view sub_message = "");

}  // namespace gqlengine

#endif  // GQLENGINE_COMMON_SUGGESTION_LIST_H_
