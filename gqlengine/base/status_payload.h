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


#ifndef GQLENGINE_BASE_STATUS_PAYLOAD_H_
#define GQLENGINE_BASE_STATUS_PAYLOAD_H_

// Helpers for attaching protocol buffer payloads to an absl::Status and
// reading them back. Payloads are keyed by a type URL derived from the
// message's full name.

#include <string>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"

namespace gqlengine_base {

extern const absl::string_view kGqlEngineTypeUrlPrefix;

// Return the type_url for encoding a Status payload of type T.
template <class T>
std::string GetTypeUrl() {
  return absl::StrCat(kGqlEngineTypeUrlPrefix, T::descriptor()->full_name());
}

// Attaches the given payload. This will overwrite any previous payload with
// the same type.
template <class T>
void AttachPayload(absl::Status* status, const T& payload) {
  absl::Cord serialized = absl::Cord(payload.SerializeAsString());
  status->SetPayload(GetTypeUrl<T>(), serialized);
}

// Whether the given status carries a payload of type T.
template <class T>
bool HasPayloadWithType(const absl::Status& status) {
  return status.GetPayload(GetTypeUrl<T>()).has_value();
}

// Gets the payload of type T from the status. Returns a default instance if
// the status does not contain a payload of the given type, or if it does not
// parse.
template <class T>
T GetPayload(const absl::Status& status) {
  absl::optional<absl::Cord> payload = status.GetPayload(GetTypeUrl<T>());
  if (!payload.has_value()) {
    return T();
  }
  T proto;
  if (!proto.ParseFromString(std::string(*payload))) {
    proto.Clear();
  }
  return proto;
}

// Whether the given status has any payload at all.
bool HasPayload(const absl::Status& status);

// Creates a human readable string from the status, including its payloads.
// Exact form is not defined.
std::string StatusToString(const absl::Status& status);

}  // namespace gqlengine_base

#endif  // GQLENGINE_BASE_STATUS_PAYLOAD_H_
