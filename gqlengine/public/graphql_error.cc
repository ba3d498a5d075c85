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


#include "gqlengine/public/graphql_error.h"

#include <algorithm>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "gqlengine/base/status_payload.h"
#include "gqlengine/common/json_util.h"
#include "gqlengine/proto/graphql_error.pb.h"

namespace gqlengine {

namespace {

using gqlengine_base::AttachPayload;
using gqlengine_base::GetPayload;

void AddNodeLocations(absl::Span<const Node* const> nodes,
                      GraphQLErrorPayload* payload) {
  for (const Node* node : nodes) {
    if (node == nullptr || !node->location().valid()) continue;
    const SourcePosition position =
        node->location().source->GetPosition(node->location().start);
    ErrorLocation* location = payload->add_locations();
    location->set_line(position.line);
    location->set_column(position.column);
  }
}

// Renders the lines around `position`, marking the column with a caret:
//
//   GraphQL request:2:3
//   1 | {
//   2 |   a
//     |   ^
//   3 | }
std::string HighlightSourceAtPosition(const Source& source,
                                      const SourcePosition& position) {
  // "\r\n", "\n" and "\r" each end a line.
  std::vector<absl::string_view> lines;
  const absl::string_view body = source.body();
  size_t start = 0;
  for (size_t i = 0; i <= body.size(); ++i) {
    if (i == body.size() || body[i] == '\n' || body[i] == '\r') {
      lines.push_back(body.substr(start, i - start));
      if (i + 1 < body.size() && body[i] == '\r' && body[i + 1] == '\n') ++i;
      start = i + 1;
    }
  }

  const int line_index = position.line - 1;
  std::vector<std::pair<std::string, std::string>> printed;
  auto add_line = [&](int index) {
    if (index < 0 || index >= static_cast<int>(lines.size())) return;
    printed.emplace_back(absl::StrCat(index + 1), std::string(lines[index]));
  };
  add_line(line_index - 1);
  add_line(line_index);
  printed.emplace_back("", std::string(position.column - 1, ' ') + "^");
  add_line(line_index + 1);

  size_t pad = 0;
  for (const auto& [prefix, text] : printed) pad = std::max(pad, prefix.size());
  std::string out = absl::StrCat(source.name(), ":", position.line, ":",
                                 position.column);
  for (const auto& [prefix, text] : printed) {
    absl::StrAppend(&out, "\n", std::string(pad - prefix.size(), ' '), prefix,
                    " |", text.empty() ? "" : " ", text);
  }
  return out;
}

}  // namespace

GraphQLError GraphQLError::FromStatus(const absl::Status& status) {
  GraphQLError error;
  error.message = std::string(status.message());
  error.code = status.code();
  if (!gqlengine_base::HasPayloadWithType<GraphQLErrorPayload>(status)) {
    return error;
  }
  const GraphQLErrorPayload payload = GetPayload<GraphQLErrorPayload>(status);
  for (const ErrorLocation& location : payload.locations()) {
    error.locations.push_back({location.line(), location.column()});
  }
  if (payload.has_path()) {
    std::vector<PathKey> path;
    for (const PathEntry& entry : payload.path()) {
      if (entry.has_index()) {
        path.emplace_back(entry.index());
      } else {
        path.emplace_back(entry.key());
      }
    }
    error.path = std::move(path);
  }
  for (const auto& [key, value] : payload.extensions()) {
    error.extensions.emplace(key, value);
  }
  return error;
}

absl::Status GraphQLError::ToStatus() const {
  absl::Status status(code, message);
  GraphQLErrorPayload payload;
  for (const SourcePosition& position : locations) {
    ErrorLocation* location = payload.add_locations();
    location->set_line(position.line);
    location->set_column(position.column);
  }
  if (path.has_value()) {
    payload.set_has_path(true);
    payload.set_located(true);
    for (const PathKey& key : *path) {
      if (const int* index = std::get_if<int>(&key)) {
        payload.add_path()->set_index(*index);
      } else {
        payload.add_path()->set_key(std::get<std::string>(key));
      }
    }
  }
  for (const auto& [key, value] : extensions) {
    (*payload.mutable_extensions())[key] = value;
  }
  AttachPayload(&status, payload);
  return status;
}

std::string GraphQLError::ToJson() const {
  std::string out = absl::StrCat(
      "{\"message\":",
      JsonQuote(message.empty() ? "An unknown error occurred." : message));
  if (!locations.empty()) {
    absl::StrAppend(
        &out, ",\"locations\":[",
        absl::StrJoin(locations, ",",
                      [](std::string* out, const SourcePosition& position) {
                        absl::StrAppend(out, "{\"line\":", position.line,
                                        ",\"column\":", position.column, "}");
                      }),
        "]");
  }
  if (path.has_value()) {
    absl::StrAppend(&out, ",\"path\":", PathKeysToJson(*path));
  }
  if (!extensions.empty()) {
    absl::StrAppend(
        &out, ",\"extensions\":{",
        absl::StrJoin(extensions, ",",
                      [](std::string* out,
                         const std::pair<const std::string, std::string>& e) {
                        absl::StrAppend(out, JsonQuote(e.first), ":",
                                        e.second);
                      }),
        "}");
  }
  absl::StrAppend(&out, "}");
  return out;
}

std::string GraphQLError::ToString() const {
  std::string out = message;
  for (const SourcePosition& position : locations) {
    absl::StrAppend(&out, " (", position.line, ":", position.column, ")");
  }
  return out;
}

std::string GraphQLError::ToString(const Source& source) const {
  if (locations.empty()) return message;
  std::vector<std::string> parts = {message};
  for (const SourcePosition& position : locations) {
    parts.push_back(HighlightSourceAtPosition(source, position));
  }
  return absl::StrCat(absl::StrJoin(parts, "\n\n"), "\n");
}

bool operator==(const GraphQLError& a, const GraphQLError& b) {
  return a.message == b.message && a.locations == b.locations &&
         a.path == b.path && a.extensions == b.extensions;
}

std::ostream& operator<<(std::ostream& out, const GraphQLError& error) {
  return out << error.ToJson();
}

bool GraphQLErrorLess(const GraphQLError& a, const GraphQLError& b) {
  static const std::vector<PathKey>* const kNoPath =
      new std::vector<PathKey>();
  const std::vector<PathKey>& a_path = a.path.has_value() ? *a.path : *kNoPath;
  const std::vector<PathKey>& b_path = b.path.has_value() ? *b.path : *kNoPath;
  return std::tie(a.locations, a_path, a.message) <
         std::tie(b.locations, b_path, b.message);
}

absl::Status WithNodeLocations(absl::Status status,
                               absl::Span<const Node* const> nodes) {
  if (status.ok()) return status;
  GraphQLErrorPayload payload = GetPayload<GraphQLErrorPayload>(status);
  if (payload.locations_size() > 0) return status;
  AddNodeLocations(nodes, &payload);
  AttachPayload(&status, payload);
  return status;
}

absl::Status LocateError(absl::Status status,
                         absl::Span<const FieldNode* const> field_nodes,
                         const ResponsePath* path) {
  if (status.ok()) return status;
  GraphQLErrorPayload payload = GetPayload<GraphQLErrorPayload>(status);
  if (payload.has_path()) return status;
  if (payload.locations_size() == 0) {
    std::vector<const Node*> nodes(field_nodes.begin(), field_nodes.end());
    AddNodeLocations(nodes, &payload);
  }
  for (const PathKey& key : ResponsePath::AsList(path)) {
    if (const int* index = std::get_if<int>(&key)) {
      payload.add_path()->set_index(*index);
    } else {
      payload.add_path()->set_key(std::get<std::string>(key));
    }
  }
  payload.set_has_path(true);
  payload.set_located(true);
  AttachPayload(&status, payload);
  return status;
}

bool HasErrorPath(const absl::Status& status) {
  return gqlengine_base::HasPayloadWithType<GraphQLErrorPayload>(status) &&
         GetPayload<GraphQLErrorPayload>(status).has_path();
}

absl::Status WithErrorExtension(absl::Status status, absl::string_view key,
                                absl::string_view json_value) {
  if (status.ok()) return status;
  GraphQLErrorPayload payload = GetPayload<GraphQLErrorPayload>(status);
  (*payload.mutable_extensions())[std::string(key)] = std::string(json_value);
  AttachPayload(&status, payload);
  return status;
}

}  // namespace gqlengine
