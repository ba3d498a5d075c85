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


#include "gqlengine/language/source.h"

#include <algorithm>
#include <string>
#include <utility>

namespace gqlengine {

Source::Source(std::string body, std::string name)
    : body_(std::move(body)), name_(std::move(name)) {
  line_starts_.push_back(0);
  const int size = static_cast<int>(body_.size());
  for (int i = 0; i < size; ++i) {
    if (body_[i] == '\r') {
      if (i + 1 < size && body_[i + 1] == '\n') ++i;
      line_starts_.push_back(i + 1);
    } else if (body_[i] == '\n') {
      line_starts_.push_back(i + 1);
    }
  }
}

SourcePosition Source::GetPosition(int offset) const {
  offset = std::clamp(offset, 0, static_cast<int>(body_.size()));
  // The last line start that is <= offset.
  auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
  const int line_index = static_cast<int>(it - line_starts_.begin()) - 1;
  SourcePosition position;
  position.line = line_index + 1;
  position.column = offset - line_starts_[line_index] + 1;
  return position;
}

}  // namespace gqlengine
