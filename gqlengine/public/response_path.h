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


#ifndef GQLENGINE_PUBLIC_RESPONSE_PATH_H_
#define GQLENGINE_PUBLIC_RESPONSE_PATH_H_

#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "absl/strings/string_view.h"

namespace gqlengine {

// One segment of a response path: a response key or a list index.
using PathKey = std::variant<std::string, int>;

// The location of a value in the response, as an immutable singly linked
// list from the leaf back to the root. Sibling fields and list items share
// their common prefix, so extending a path is cheap.
//
//   ResponsePath::Ptr path = ResponsePath::Add(nullptr, "hero", "Query");
//   path = ResponsePath::Add(path, 0);
//   ResponsePath::ToString(path.get());  // "hero.0"
//
// The root is represented by a null pointer.
class ResponsePath {
 public:
  using Ptr = std::shared_ptr<const ResponsePath>;

  static Ptr Add(Ptr prev, std::string key, std::string type_name = "");
  static Ptr Add(Ptr prev, int index);

  const PathKey& key() const { return key_; }
  bool is_index() const { return std::holds_alternative<int>(key_); }
  const Ptr& prev() const { return prev_; }
  // Name of the parent type for a response key segment, empty for indexes.
  const std::string& type_name() const { return type_name_; }
  // Number of segments from the root, this one included.
  int depth() const { return depth_; }

  // The segments from the root to `path`. Empty for the root.
  static std::vector<PathKey> AsList(const ResponsePath* path);

  // Segments joined with '.', e.g. "hero.friends.0.name".
  static std::string ToString(const ResponsePath* path);

  ResponsePath(Ptr prev, PathKey key, std::string type_name);

 private:
  Ptr prev_;
  PathKey key_;
  std::string type_name_;
  int depth_;
};

// Renders a list of path segments the way ResponsePath::ToString does.
std::string PathKeysToString(const std::vector<PathKey>& keys);

// A JSON array of the segments, e.g. ["hero",0,"name"].
std::string PathKeysToJson(const std::vector<PathKey>& keys);

}  // namespace gqlengine

#endif  // GQLENGINE_PUBLIC_RESPONSE_PATH_H_
