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


#include "gqlengine/public/response_path.h"

#include <algorithm>
#include <utility>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "gqlengine/common/json_util.h"

namespace gqlengine {

ResponsePath::ResponsePath(Ptr prev, PathKey key, std::string type_name)
    : prev_(std::move(prev)),
      key_(std::move(key)),
      type_name_(std::move(type_name)),
      depth_(prev_ == nullptr ? 1 : prev_->depth_ + 1) {}

ResponsePath::Ptr ResponsePath::Add(Ptr prev, std::string key,
                                    std::string type_name) {
  return std::make_shared<const ResponsePath>(
      std::move(prev), PathKey(std::move(key)), std::move(type_name));
}

ResponsePath::Ptr ResponsePath::Add(Ptr prev, int index) {
  return std::make_shared<const ResponsePath>(std::move(prev), PathKey(index),
                                              "");
}

std::vector<PathKey> ResponsePath::AsList(const ResponsePath* path) {
  std::vector<PathKey> keys;
  for (const ResponsePath* p = path; p != nullptr; p = p->prev_.get()) {
    keys.push_back(p->key_);
  }
  std::reverse(keys.begin(), keys.end());
  return keys;
}

std::string ResponsePath::ToString(const ResponsePath* path) {
  return PathKeysToString(AsList(path));
}

std::string PathKeysToString(const std::vector<PathKey>& keys) {
  return absl::StrJoin(keys, ".", [](std::string* out, const PathKey& key) {
    if (const int* index = std::get_if<int>(&key)) {
      absl::StrAppend(out, *index);
    } else {
      absl::StrAppend(out, std::get<std::string>(key));
    }
  });
}

std::string PathKeysToJson(const std::vector<PathKey>& keys) {
  return absl::StrCat(
      "[",
      absl::StrJoin(keys, ",",
                    [](std::string* out, const PathKey& key) {
                      if (const int* index = std::get_if<int>(&key)) {
                        absl::StrAppend(out, *index);
                      } else {
                        absl::StrAppend(out,
                                        JsonQuote(std::get<std::string>(key)));
                      }
                    }),
      "]");
}

}  // namespace gqlengine
