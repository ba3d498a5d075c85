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

#ifndef GQLENGINE_BASE_LOGGING_H_
#define GQLENGINE_BASE_LOGGING_H_

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <ostream>
#include <sstream>
#include <string>

#include "absl/base/attributes.h"
#include "absl/base/log_severity.h"
#include "absl/log/absl_check.h"
#include "absl/log/absl_log.h"

// A GQLENGINE_LOG command with an associated verbosity level. The verbosity
// threshold may be configured at runtime with set_vlog_level, InitLogging or
// the --gqlengine_vlog_level flag.
//
// GQLENGINE_VLOG statements are logged at INFO severity if they are logged at
// all. The numeric levels are on a different scale than the severity levels.
// Example:
//
//   GQLENGINE_VLOG(1) << "Print when the VLOG level is set to be 1 or higher";
//
// level: the numeric level that determines whether to log the message.
#define GQLENGINE_VLOG(level) \
  ABSL_LOG_IF(INFO, (level) <= ::gqlengine_base::get_vlog_level())

#define GQLENGINE_VLOG_IS_ON(level) \
  ((level) <= ::gqlengine_base::get_vlog_level())

//   GQLENGINE_LOG(WARNING) << "Dropping stream record " << id;
#define GQLENGINE_LOG(severity) ABSL_LOG(severity)
#define GQLENGINE_LOG_IF(severity, condition) ABSL_LOG_IF(severity, condition)

// Aborts with a FATAL message when `condition` is false. Reserved for
// invariants whose violation leaves no way to continue; recoverable failures
// use GQLENGINE_RET_CHECK from ret_check.h instead.
#define GQLENGINE_CHECK(condition) ABSL_CHECK(condition)
#define GQLENGINE_DCHECK(condition) ABSL_DCHECK(condition)

namespace gqlengine_base {

// This formats a value for a failing CHECK_XX statement.  Ordinarily,
// it uses the definition for operator<<, with a few special cases below.
template <typename T>
inline void MakeCheckOpValueString(std::ostream *os, const T &v) {
  (*os) << v;
}

// Overrides for char types provide readable values for unprintable
// characters.
template <>
void MakeCheckOpValueString(std::ostream *os, const char &v);
template <>
void MakeCheckOpValueString(std::ostream *os, const signed char &v);
template <>
void MakeCheckOpValueString(std::ostream *os, const unsigned char &v);

// We need an explicit specialization for std::nullptr_t.
template <>
void MakeCheckOpValueString(std::ostream *os, const std::nullptr_t &v);

// A helper class for formatting "expr (V1 vs. V2)" in a CHECK_XX
// statement.  See MakeCheckOpString for sample usage.
class CheckOpMessageBuilder {
 public:
  // Constructs an object to format a CheckOp message. This constructor
  // initializes the message first with exprtext followed by " (".
  explicit CheckOpMessageBuilder(const char *exprtext);
  ~CheckOpMessageBuilder();
  // Gets the output stream for the first argument of the message.
  std::ostream *ForVar1() { return stream_; }
  // Gets the output stream for writing the argument of the message. This
  // writes " vs. " to the stream first.
  std::ostream *ForVar2();
  // Gets the built string contents. The stream is finished with an added ")".
  std::string *NewString();

 private:
  std::ostringstream *stream_;
};

template <typename T1, typename T2>
std::string *MakeCheckOpString(const T1 &v1, const T2 &v2,
                               const char *exprtext) {
  CheckOpMessageBuilder comb(exprtext);
  MakeCheckOpValueString(comb.ForVar1(), v1);
  MakeCheckOpValueString(comb.ForVar2(), v2);
  return comb.NewString();
}

// Helper functions for the RET_CHECK_OP macros.
// The (int, int) specialization works around the issue that the compiler
// will not instantiate the template version of the function on values of
// unnamed enum type.
#define GQLENGINE_DEFINE_CHECK_OP_IMPL(name, op)                         \
  template <typename T1, typename T2>                                    \
  inline std::string *name##Impl(const T1 &v1, const T2 &v2,             \
                                 const char *exprtext) {                 \
    if (v1 op v2) return nullptr;                                        \
    return ::gqlengine_base::MakeCheckOpString(v1, v2, exprtext);        \
  }                                                                      \
  inline std::string *name##Impl(int v1, int v2, const char *exprtext) { \
    return ::gqlengine_base::name##Impl<int, int>(v1, v2, exprtext);     \
  }

GQLENGINE_DEFINE_CHECK_OP_IMPL(Check_EQ, ==)
GQLENGINE_DEFINE_CHECK_OP_IMPL(Check_NE, !=)
GQLENGINE_DEFINE_CHECK_OP_IMPL(Check_LE, <=)
GQLENGINE_DEFINE_CHECK_OP_IMPL(Check_LT, <)
GQLENGINE_DEFINE_CHECK_OP_IMPL(Check_GE, >=)
GQLENGINE_DEFINE_CHECK_OP_IMPL(Check_GT, >)
#undef GQLENGINE_DEFINE_CHECK_OP_IMPL

// Function is overloaded for integral types to allow static const
// integrals declared in classes and not defined to be used as arguments to
// the check macros.
template <typename T>
inline const T &GetReferenceableValue(const T &t) {
  return t;
}
inline char GetReferenceableValue(char t) { return t; }
inline unsigned char GetReferenceableValue(unsigned char t) { return t; }
inline signed char GetReferenceableValue(signed char t) { return t; }
inline int GetReferenceableValue(int t) { return t; }
inline unsigned int GetReferenceableValue(unsigned int t) { return t; }
// NOLINTNEXTLINE(runtime/int)
inline long GetReferenceableValue(long t) { return t; }
// NOLINTNEXTLINE(runtime/int)
inline unsigned long GetReferenceableValue(unsigned long t) { return t; }
// NOLINTNEXTLINE(runtime/int)
inline long long GetReferenceableValue(long long t) { return t; }
// NOLINTNEXTLINE(runtime/int)
inline unsigned long long GetReferenceableValue(unsigned long long t) {
  return t;
}

// Gets the verbosity threshold for GQLENGINE_VLOG. A GQLENGINE_VLOG command
// with a level greater than this will be ignored.
int get_vlog_level();

// Sets the verbosity threshold. Overrides --gqlengine_vlog_level.
void set_vlog_level(int level);

// Gets the log directory that was specified when initialized.
std::string get_log_directory();

// Initializes minimal logging library.
//
// This should be called in main().
//
// directory: log file directory.
// file_name: name of the log file (recommend this be initialized with argv[0]).
// level: verbosity threshold for GQLENGINE_VLOG commands. A GQLENGINE_VLOG
//        command with a level equal to or lower than it will be logged.
// Returns true if initialized successfully.
bool InitLogging(const char *directory, const char *file_name, int level);

}  // namespace gqlengine_base

#endif  // GQLENGINE_BASE_LOGGING_H_
