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


#include "gqlengine/common/suggestion_list.h"

#include <algorithm>
#include <array>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"

namespace gqlengine {

namespace {

constexpr int kMaxSuggestions = 5;

}  // namespace

std::optional<int> LexicalDistance(absl::string_view a, absl::string_view b,
                                   int threshold) {
  if (a == b) return 0;

  std::string lower_a = absl::AsciiStrToLower(a);
  std::string lower_b = absl::AsciiStrToLower(b);
  // Any case change counts as a single edit.
  if (lower_a == lower_b) return 1;

  // Keep the shorter string in `lower_b` so rows are as small as possible.
  if (lower_a.size() < lower_b.size()) std::swap(lower_a, lower_b);
  const int a_length = static_cast<int>(lower_a.size());
  const int b_length = static_cast<int>(lower_b.size());
  if (a_length - b_length > threshold) return std::nullopt;

  std::array<std::vector<int>, 3> rows;
  for (std::vector<int>& row : rows) row.assign(b_length + 1, 0);
  for (int j = 0; j <= b_length; ++j) rows[0][j] = j;

  for (int i = 1; i <= a_length; ++i) {
    const std::vector<int>& up_row = rows[(i - 1) % 3];
    std::vector<int>& current_row = rows[i % 3];
    int smallest_cell = current_row[0] = i;
    for (int j = 1; j <= b_length; ++j) {
      const int cost = lower_a[i - 1] == lower_b[j - 1] ? 0 : 1;
      int current_cell = std::min({up_row[j] + 1,           // Delete.
                                   current_row[j - 1] + 1,  // Insert.
                                   up_row[j - 1] + cost});  // Substitute.
      if (i > 1 && j > 1 && lower_a[i - 1] == lower_b[j - 2] &&
          lower_a[i - 2] == lower_b[j - 1]) {
        // Transposition.
        const int double_diagonal_cell = rows[(i - 2) % 3][j - 2];
        current_cell = std::min(current_cell, double_diagonal_cell + 1);
      }
      smallest_cell = std::min(smallest_cell, current_cell);
      current_row[j] = current_cell;
    }
    // Early exit, since the distance can only grow from here.
    if (smallest_cell > threshold) return std::nullopt;
  }

  const int distance = rows[a_length % 3][b_length];
  if (distance > threshold) return std::nullopt;
  return distance;
}

std::vector<std::string> SuggestionList(
    absl::string_view input, const std::vector<std::string>& options) {
  const int threshold = static_cast<int>(input.size() * 0.4) + 1;
  std::vector<std::pair<int, std::string>> by_distance;
  for (const std::string& option : options) {
    std::optional<int> distance = LexicalDistance(input, option, threshold);
    if (distance.has_value()) {
      by_distance.emplace_back(*distance, option);
    }
  }
  std::sort(by_distance.begin(), by_distance.end());
  std::vector<std::string> suggestions;
  suggestions.reserve(by_distance.size());
  for (auto& entry : by_distance) {
    suggestions.push_back(std::move(entry.second));
  }
  return suggestions;
}

std::string DidYouMean(const std::vector<std::string>& suggestions,
                       absl::string_view sub_message) {
  if (suggestions.empty()) return "";
  const int count =
      std::min<int>(static_cast<int>(suggestions.size()), kMaxSuggestions);
  std::string message = " Did you mean ";
  if (!sub_message.empty()) absl::StrAppend(&message, sub_message, " ");
  for (int i = 0; i < count; ++i) {
    if (i > 0) {
      absl::StrAppend(&message, count > 2 ? ", " : " ");
      if (i == count - 1) absl::StrAppend(&message, "or ");
    }
    absl::StrAppend(&message, "'", suggestions[i], "'");
  }
  absl::StrAppend(&message, "?");
  return message;
}

}  // namespace gqlengine
