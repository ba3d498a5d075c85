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


#ifndef GQLENGINE_LANGUAGE_SOURCE_H_
#define GQLENGINE_LANGUAGE_SOURCE_H_

#include <string>
#include <vector>

#include "absl/strings/string_view.h"

namespace gqlengine {

// A 1-based line and column in a Source.
struct SourcePosition {
  int line = 0;
  int column = 0;

  friend bool operator==(const SourcePosition& a, const SourcePosition& b) {
    return a.line == b.line && a.column == b.column;
  }
  friend bool operator<(const SourcePosition& a, const SourcePosition& b) {
    return a.line != b.line ? a.line < b.line : a.column < b.column;
  }
};

// The text of a GraphQL document together with a name used in messages.
// Translates byte offsets into line/column positions. "\r\n", "\n" and "\r"
// all end a line.
class Source {
 public:
  explicit Source(std::string body, std::string name = "GraphQL request");
  Source(const Source&) = delete;
  Source& operator=(const Source&) = delete;

  absl::string_view body() const { return body_; }
  const std::string& name() const { return name_; }

  // Returns the position of `offset`. Offsets past the end map to the end of
  // the body.
  SourcePosition GetPosition(int offset) const;

 private:
  std::string body_;
  std::string name_;
  // Byte offset at which each line starts. line_starts_[0] is always 0.
  std::vector<int> line_starts_;
};

}  // namespace gqlengine

#endif  // GQLENGINE_LANGUAGE_SOURCE_H_
