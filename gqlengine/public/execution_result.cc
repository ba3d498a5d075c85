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


#include "gqlengine/public/execution_result.h"

#include <algorithm>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "gqlengine/common/json_util.h"

namespace gqlengine {

namespace {

void AppendErrors(const std::vector<GraphQLError>& errors, std::string* out) {
  if (errors.empty()) return;
  absl::StrAppend(out, ",\"errors\":[",
                  absl::StrJoin(errors, ",",
                                [](std::string* out, const GraphQLError& e) {
                                  absl::StrAppend(out, e.ToJson());
                                }),
                  "]");
}

template <typename T>
void AppendList(absl::string_view key, const std::vector<T>& items,
                std::string* out) {
  if (items.empty()) return;
  absl::StrAppend(out, ",", JsonQuote(key), ":[",
                  absl::StrJoin(items, ",",
                                [](std::string* out, const T& item) {
                                  absl::StrAppend(out, item.ToJson());
                                }),
                  "]");
}

void AppendExtensions(const Value& extensions, std::string* out) {
  if (!extensions.is_valid()) return;
  absl::StrAppend(out, ",\"extensions\":", extensions.ToJson());
}

// Drops the leading comma left by the Append helpers when nothing preceded
// them.
std::string CloseObject(std::string body) {
  if (!body.empty() && body[0] == ',') body.erase(0, 1);
  return absl::StrCat("{", body, "}");
}

}  // namespace

std::string ExecutionResult::ToJson() const {
  std::string out;
  if (data.is_valid()) absl::StrAppend(&out, ",\"data\":", data.ToJson());
  AppendErrors(errors, &out);
  AppendExtensions(extensions, &out);
  return CloseObject(std::move(out));
}

std::string PendingResult::ToJson() const {
  std::string out = absl::StrCat("{\"id\":", JsonQuote(id),
                                 ",\"path\":", PathKeysToJson(path));
  if (label.has_value()) absl::StrAppend(&out, ",\"label\":", JsonQuote(*label));
  absl::StrAppend(&out, "}");
  return out;
}

std::string CompletedResult::ToJson() const {
  std::string out = absl::StrCat("{\"id\":", JsonQuote(id));
  AppendErrors(errors, &out);
  absl::StrAppend(&out, "}");
  return out;
}

std::string IncrementalDeferResult::ToJson() const {
  std::string out = absl::StrCat("{\"data\":", data.ToJson(),
                                 ",\"id\":", JsonQuote(id));
  if (!sub_path.empty()) {
    absl::StrAppend(&out, ",\"subPath\":", PathKeysToJson(sub_path));
  }
  AppendErrors(errors, &out);
  absl::StrAppend(&out, "}");
  return out;
}

std::string IncrementalStreamResult::ToJson() const {
  std::string out = absl::StrCat(
      "{\"items\":[",
      absl::StrJoin(items, ",",
                    [](std::string* out, const Value& item) {
                      absl::StrAppend(out, item.ToJson());
                    }),
      "],\"id\":", JsonQuote(id));
  AppendErrors(errors, &out);
  absl::StrAppend(&out, "}");
  return out;
}

std::string InitialIncrementalExecutionResult::ToJson() const {
  std::string out;
  if (data.is_valid()) absl::StrAppend(&out, ",\"data\":", data.ToJson());
  AppendErrors(errors, &out);
  AppendList("pending", pending, &out);
  absl::StrAppend(&out, ",\"hasNext\":", has_next ? "true" : "false");
  AppendExtensions(extensions, &out);
  return CloseObject(std::move(out));
}

std::string SubsequentIncrementalExecutionResult::ToJson() const {
  std::string out = absl::StrCat("{\"hasNext\":", has_next ? "true" : "false");
  AppendList("pending", pending, &out);
  if (!incremental.empty()) {
    absl::StrAppend(
        &out, ",\"incremental\":[",
        absl::StrJoin(incremental, ",",
                      [](std::string* out, const IncrementalResult& result) {
                        std::visit(
                            [out](const auto& r) {
                              absl::StrAppend(out, r.ToJson());
                            },
                            result);
                      }),
        "]");
  }
  AppendList("completed", completed, &out);
  AppendExtensions(extensions, &out);
  absl::StrAppend(&out, "}");
  return out;
}

void SortErrors(std::vector<GraphQLError>& errors) {
  std::stable_sort(errors.begin(), errors.end(), GraphQLErrorLess);
}

}  // namespace gqlengine
