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


#ifndef GQLENGINE_BASE_SOURCE_LOCATION_H_
#define GQLENGINE_BASE_SOURCE_LOCATION_H_

// Captures the file and line of a call site so status builders and RET_CHECK
// failures can report where an error was raised. Pass `GQLENGINE_LOC` to any
// function that takes a `gqlengine_base::SourceLocation`.

#include <cstdint>

#include "absl/base/config.h"

#if defined(__is_identifier)
#define GQLENGINE_INTERNAL_HAS_KEYWORD(x) !(__is_identifier(x))
#else
#define GQLENGINE_INTERNAL_HAS_KEYWORD(x) 0
#endif

#if !defined(GQLENGINE_INTERNAL_HAVE_SOURCE_LOCATION_CURRENT)
#if GQLENGINE_INTERNAL_HAS_KEYWORD(__builtin_LINE) && \
    GQLENGINE_INTERNAL_HAS_KEYWORD(__builtin_FILE)
#define GQLENGINE_INTERNAL_HAVE_SOURCE_LOCATION_CURRENT 1
#elif defined(__GNUC__)
#define GQLENGINE_INTERNAL_HAVE_SOURCE_LOCATION_CURRENT 1
#else
#define GQLENGINE_INTERNAL_HAVE_SOURCE_LOCATION_CURRENT 0
#endif
#endif

#undef GQLENGINE_INTERNAL_HAS_KEYWORD

namespace gqlengine_base {

// A location in the source code of the program. Copyable.
class SourceLocation {
  struct PrivateTag {
   private:
    explicit PrivateTag() = default;
    friend class SourceLocation;
  };

 public:
  // Populates the object with dummy values.
  constexpr SourceLocation() : line_(0), file_name_(nullptr) {}

  // Only for use by the `GQLENGINE_LOC` macro.
  static constexpr SourceLocation DoNotInvokeDirectly(std::uint_least32_t line,
                                                      const char* file_name) {
    return SourceLocation(line, file_name);
  }

#if GQLENGINE_INTERNAL_HAVE_SOURCE_LOCATION_CURRENT
  // Creates a `SourceLocation` for the caller when used as a default
  // argument.
  static constexpr SourceLocation current(
      PrivateTag = PrivateTag{}, std::uint_least32_t line = __builtin_LINE(),
      const char* file_name = __builtin_FILE()) {
    return SourceLocation(line, file_name);
  }
#else
  static constexpr SourceLocation current() {
    return SourceLocation(1, "<source_location>");
  }
#endif

  constexpr std::uint_least32_t line() const { return line_; }
  constexpr const char* file_name() const { return file_name_; }

 private:
  // `file_name` must outlive all copies, so in practice it is a literal.
  constexpr SourceLocation(std::uint_least32_t line, const char* file_name)
      : line_(line), file_name_(file_name) {}

  std::uint_least32_t line_;
  const char* file_name_;
};

}  // namespace gqlengine_base

#define GQLENGINE_LOC \
  ::gqlengine_base::SourceLocation::DoNotInvokeDirectly(__LINE__, __FILE__)

#endif  // GQLENGINE_BASE_SOURCE_LOCATION_H_
