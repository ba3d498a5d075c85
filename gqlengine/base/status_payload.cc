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


#include "gqlengine/base/status_payload.h"

#include <memory>
#include <string>

#include "google/protobuf/descriptor.h"
#include "google/protobuf/message.h"
#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/strip.h"

namespace gqlengine_base {

const absl::string_view kGqlEngineTypeUrlPrefix =
    "type.googleapis.com/";

bool HasPayload(const absl::Status& status) {
  bool found = false;
  status.ForEachPayload(
      [&found](absl::string_view, const absl::Cord&) { found = true; });
  return found;
}

namespace {

std::string PayloadToString(absl::string_view type_url,
                            const absl::Cord& payload) {
  absl::string_view descriptor_full_name = type_url;
  if (absl::ConsumePrefix(&descriptor_full_name, kGqlEngineTypeUrlPrefix)) {
    const google::protobuf::DescriptorPool* pool =
        google::protobuf::DescriptorPool::generated_pool();
    const google::protobuf::Descriptor* desc =
        pool->FindMessageTypeByName(std::string(descriptor_full_name));
    if (desc != nullptr) {
      google::protobuf::MessageFactory* factory =
          google::protobuf::MessageFactory::generated_factory();
      auto msg = absl::WrapUnique(factory->GetPrototype(desc)->New());
      if (msg->ParseFromString(std::string(payload))) {
        return absl::StrCat("[", descriptor_full_name, "] { ",
                            msg->ShortDebugString(), " }");
      }
    }
  }
  return absl::StrCat("[", type_url, "] <unknown type>");
}

}  // namespace

std::string StatusToString(const absl::Status& status) {
  if (status.ok()) {
    return "OK";
  }
  std::string ret = absl::StrCat(absl::StatusCodeToString(status.code()), ": ",
                                 status.message());
  status.ForEachPayload(
      [&ret](absl::string_view type_url, const absl::Cord& payload) {
        absl::StrAppend(&ret, " ", PayloadToString(type_url, payload));
      });
  return ret;
}

}  // namespace gqlengine_base
