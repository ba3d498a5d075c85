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


#include "gqlengine/execution/incremental_types.h"

#include <utility>
#include <vector>

namespace gqlengine {

void CancellableStreams::Add(StreamRecordPtr stream) {
  absl::MutexLock lock(&mu_);
  streams_.insert(std::move(stream));
}

void CancellableStreams::Remove(const StreamRecordPtr& stream) {
  absl::MutexLock lock(&mu_);
  streams_.erase(stream);
}

std::vector<StreamRecordPtr> CancellableStreams::TakeAll() {
  absl::MutexLock lock(&mu_);
  std::vector<StreamRecordPtr> streams(streams_.begin(), streams_.end());
  streams_.clear();
  return streams;
}

}  // namespace gqlengine
