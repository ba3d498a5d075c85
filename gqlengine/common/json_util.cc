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


#include "gqlengine/common/json_util.h"

#include <cmath>
#include <cstdlib>
#include <string>

#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"

namespace gqlengine {

void JsonEscapeString(absl::string_view raw, std::string* out) {
  out->reserve(out->size() + raw.size() + 2);

  out->push_back('"');
  const size_t length = raw.length();
  for (size_t i = 0; i < length; ++i) {
    const unsigned char c = raw[i];
    if (c < 0x20) {
      // Not printable.
      out->push_back('\\');
      switch (c) {
        case '\b':
          out->push_back('b');
          break;
        case '\f':
          out->push_back('f');
          break;
        case '\n':
          out->push_back('n');
          break;
        case '\r':
          out->push_back('r');
          break;
        case '\t':
          out->push_back('t');
          break;
        default:
          absl::StrAppendFormat(out, "u%04x", c);
      }
      continue;
    }

    switch (c) {
      case '\"':
        out->append("\\\"");
        continue;
      case '\\':
        out->append("\\\\");
        continue;

      // U+2028 and U+2029 are legal in JSON strings but not in JavaScript
      // string literals, so they are always escaped.
      case 0xe2: {
        if ((i + 2 < length) && (raw[i + 1] == '\x80')) {
          if (raw[i + 2] == '\xa8') {
            out->append("\\u2028");
            i += 2;
            continue;
          } else if (raw[i + 2] == '\xa9') {
            out->append("\\u2029");
            i += 2;
            continue;
          }
        }
        out->push_back(c);
        continue;
      }
    }

    out->push_back(c);
  }
  out->push_back('"');
}

std::string JsonQuote(absl::string_view raw) {
  std::string out;
  JsonEscapeString(raw, &out);
  return out;
}

bool JsonStringNeedsEscaping(absl::string_view raw) {
  const size_t length = raw.length();
  for (size_t i = 0; i < length; ++i) {
    const unsigned char c = raw[i];
    if (c < 0x20 || c == '\"' || c == '\\') {
      return true;
    }
    if (c == 0xe2 && (i + 2 < length) && (raw[i + 1] == '\x80') &&
        (raw[i + 2] == '\xa8' || raw[i + 2] == '\xa9')) {
      return true;
    }
  }
  return false;
}

std::string JsonNumber(double value) {
  if (!std::isfinite(value)) {
    return "null";
  }
  if (value == std::trunc(value) && std::fabs(value) < 1e15) {
    return absl::StrFormat("%.0f", value);
  }
  for (int precision = 1; precision < 17; ++precision) {
    std::string candidate = absl::StrFormat("%.*g", precision, value);
    if (std::strtod(candidate.c_str(), nullptr) == value) {
      return candidate;
    }
  }
  return absl::StrFormat("%.17g", value);
}

}  // namespace gqlengine
