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


#ifndef GQLENGINE_BASE_STATUS_BUILDER_H_
#define GQLENGINE_BASE_STATUS_BUILDER_H_

#include <memory>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

#include "absl/base/attributes.h"
#include "absl/base/log_severity.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "gqlengine/base/source_location.h"
#include "gqlengine/base/status_payload.h"

namespace gqlengine_base {

// Creates a status based on an original_status, but enriched with additional
// information.  The builder implicitly converts to Status and StatusOr<T>
// allowing for it to be returned directly.
//
//   StatusBuilder builder(original, GQLENGINE_LOC);
//   builder.Attach(error_payload);
//   builder << "info about error";
//   return builder;
//
// When the original status is OK, all methods become no-ops and nothing will
// be logged. Messages streamed into the builder are joined to the original
// message with "; " unless SetPrepend() was called. All side
// effects (like logging) happen when the builder is converted to a status.
class ABSL_MUST_USE_RESULT StatusBuilder {
 public:
  StatusBuilder(absl::StatusCode code,
                SourceLocation location = SourceLocation::current());
  StatusBuilder(const absl::Status& original_status,
                SourceLocation location = SourceLocation::current());
  StatusBuilder(absl::Status&& original_status,
                SourceLocation location = SourceLocation::current());

  StatusBuilder(const StatusBuilder& sb);
  StatusBuilder& operator=(const StatusBuilder& sb);
  StatusBuilder(StatusBuilder&&) = default;
  StatusBuilder& operator=(StatusBuilder&&) = default;

  // The streamed message is prepended to the original message with no
  // separator.
  StatusBuilder& SetPrepend();

  // The result status is logged at `level` when the builder is converted.
  StatusBuilder& Log(absl::LogSeverity level);
  StatusBuilder& LogError() { return Log(absl::LogSeverity::kError); }

  template <typename T>
  StatusBuilder& operator<<(const T& value);

  // Attaches a proto containing additional details about the error.
  template <typename T>
  StatusBuilder& Attach(const T& data);

  // Calls `adaptor` on this builder to apply policies, type conversions
  // or side effects. Returns whatever `adaptor` returns, which may be void.
  //
  //   GQLENGINE_RETURN_IF_ERROR(CoerceArgument(...)).With(LocateAt(node));
  template <typename Adaptor>
  auto With(Adaptor&& adaptor) & -> decltype(
      std::forward<Adaptor>(adaptor)(*this)) {
    return std::forward<Adaptor>(adaptor)(*this);
  }
  template <typename Adaptor>
  auto With(Adaptor&& adaptor) && -> decltype(
      std::forward<Adaptor>(adaptor)(std::move(*this))) {
    return std::forward<Adaptor>(adaptor)(std::move(*this));
  }

  bool ok() const;
  absl::StatusCode code() const;

  // Implicit conversion to Status. This has side effects, so it should be
  // called at most once.
  operator absl::Status() const&;  // NOLINT
  operator absl::Status() &&;

  template <typename T>
  operator absl::StatusOr<T>() const&;  // NOLINT

  template <typename T>
  operator absl::StatusOr<T>() &&;  // NOLINT

  SourceLocation source_location() const;

 private:
  enum class MessageJoinStyle {
    kAnnotate,
    kPrepend,
  };

  static absl::Status JoinMessageToStatus(absl::Status s, absl::string_view msg,
                                          MessageJoinStyle style);

  absl::Status CreateStatusAndConditionallyLog() &&;

  void ConditionallyLog(const absl::Status& result) const;

  // Infrequently set builder options, instantiated lazily.
  struct Rep {
    explicit Rep() = default;
    Rep(const Rep& r);

    enum class LoggingMode {
      kDisabled,
      kLog,
    };
    LoggingMode logging_mode = LoggingMode::kDisabled;

    // Only used when `logging_mode == LoggingMode::kLog`.
    absl::LogSeverity log_severity = absl::LogSeverity::kInfo;

    // Gathers additional messages added with `<<` for use in the final status.
    std::ostringstream stream;

    MessageJoinStyle message_join_style = MessageJoinStyle::kAnnotate;
  };

  // The status that the result will be based on.  Can be modified by Attach().
  absl::Status status_;

  SourceLocation location_;

  // nullptr if nothing beyond the original status has been requested.
  std::unique_ptr<Rep> rep_;
};

// Each of the functions below creates StatusBuilder with a canonical error.
// The error code of the StatusBuilder matches the name of the function.
StatusBuilder FailedPreconditionErrorBuilder(
    SourceLocation location = SourceLocation::current());
StatusBuilder InternalErrorBuilder(
    SourceLocation location = SourceLocation::current());
StatusBuilder InvalidArgumentErrorBuilder(
    SourceLocation location = SourceLocation::current());

inline StatusBuilder::StatusBuilder(absl::StatusCode code,
                                    SourceLocation location)
    : status_(code, ""), location_(location) {}

inline StatusBuilder::StatusBuilder(const absl::Status& original_status,
                                    SourceLocation location)
    : status_(original_status), location_(location) {}

inline StatusBuilder::StatusBuilder(absl::Status&& original_status,
                                    SourceLocation location)
    : status_(std::move(original_status)), location_(location) {}

inline StatusBuilder::StatusBuilder(const StatusBuilder& sb)
    : status_(sb.status_), location_(sb.location_) {
  if (sb.rep_ != nullptr) {
    rep_.reset(new Rep(*sb.rep_));
  }
}

inline StatusBuilder& StatusBuilder::operator=(const StatusBuilder& sb) {
  status_ = sb.status_;
  location_ = sb.location_;
  if (sb.rep_ != nullptr) {
    rep_.reset(new Rep(*sb.rep_));
  } else {
    rep_ = nullptr;
  }
  return *this;
}

inline StatusBuilder& StatusBuilder::SetPrepend() {
  if (status_.ok()) return *this;
  if (rep_ == nullptr) rep_.reset(new Rep());
  rep_->message_join_style = MessageJoinStyle::kPrepend;
  return *this;
}

inline StatusBuilder& StatusBuilder::Log(absl::LogSeverity level) {
  if (status_.ok()) return *this;
  if (rep_ == nullptr) rep_.reset(new Rep());
  rep_->logging_mode = Rep::LoggingMode::kLog;
  rep_->log_severity = level;
  return *this;
}

// Implicitly converts `builder` to `Status` and write it to `os`.
inline std::ostream& operator<<(std::ostream& os,
                                const StatusBuilder& builder) {
  return os << static_cast<absl::Status>(builder);
}

template <typename T>
StatusBuilder& StatusBuilder::operator<<(const T& value) {
  if (status_.ok()) return *this;
  if (rep_ == nullptr) rep_.reset(new Rep());
  rep_->stream << value;
  return *this;
}

inline bool StatusBuilder::ok() const { return status_.ok(); }

inline absl::StatusCode StatusBuilder::code() const { return status_.code(); }

inline StatusBuilder::operator absl::Status() const& {
  if (rep_ == nullptr) return status_;
  return StatusBuilder(*this).CreateStatusAndConditionallyLog();
}

inline StatusBuilder::operator absl::Status() && {
  if (rep_ == nullptr) return std::move(status_);
  return std::move(*this).CreateStatusAndConditionallyLog();
}

template <typename T>
inline StatusBuilder::operator absl::StatusOr<T>() const& {
  if (rep_ == nullptr) return absl::StatusOr<T>(status_);
  return absl::StatusOr<T>(
      StatusBuilder(*this).CreateStatusAndConditionallyLog());
}

template <typename T>
inline StatusBuilder::operator absl::StatusOr<T>() && {
  if (rep_ == nullptr) return absl::StatusOr<T>(std::move(status_));
  return absl::StatusOr<T>(std::move(*this).CreateStatusAndConditionallyLog());
}

inline SourceLocation StatusBuilder::source_location() const {
  return location_;
}

template <typename T>
StatusBuilder& StatusBuilder::Attach(const T& data) {
  AttachPayload<T>(&status_, data);
  return *this;
}

}  // namespace gqlengine_base

#endif  // GQLENGINE_BASE_STATUS_BUILDER_H_
