// Copyright 2026 The Coral Authors
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

#ifndef CORAL_COMMON_LOGGING_LOGGING_H_
#define CORAL_COMMON_LOGGING_LOGGING_H_

#include <memory>
#include <sstream>
#include <string>

#include "absl/base/attributes.h"
#include "absl/base/optimization.h"
#include "absl/status/status.h"

// Stream-style logging and invariant checking.
//
//   CORAL_LOG(INFO) << "Formatting " << path;
//   CORAL_VLOG(3) << "Attaching comment: " << comment.text;
//   CORAL_CHECK(node != nullptr) << "Missing node";
//   CORAL_CHECK_EQ(a, b);
//
// Messages are written to stderr. FATAL messages (and failed checks) abort the
// process after the message is emitted. The CORAL_VLOG threshold is given by
// the `--v` command line flag.

namespace coral {

enum class LogSeverity {
  kInfo,
  kWarning,
  kError,
  kFatal,
};

namespace logging_internal {

class LogMessage {
 public:
  LogMessage(const char* file, int line, LogSeverity severity);
  LogMessage(const LogMessage&) = delete;
  LogMessage& operator=(const LogMessage&) = delete;
  ~LogMessage();

  std::ostream& stream() { return stream_; }

 protected:
  // Writes the accumulated message to stderr.
  void Flush();

 private:
  const char* file_;
  int line_;
  LogSeverity severity_;
  std::ostringstream stream_;
  bool flushed_ = false;
};

// A LogMessage that terminates the process once the message is emitted.
class LogMessageFatal : public LogMessage {
 public:
  LogMessageFatal(const char* file, int line);
  LogMessageFatal(const char* file, int line, const std::string& failure);
  ABSL_ATTRIBUTE_NORETURN ~LogMessageFatal();
};

// Used to turn a stream expression into a void expression inside of the
// conditional-operator based macros below.
class LogMessageVoidify {
 public:
  void operator&(std::ostream&) {}
};

// Returns whether CORAL_VLOG(level) statements should be emitted.
bool VlogIsOn(int level);

template <typename T1, typename T2>
std::unique_ptr<std::string> MakeCheckOpString(const T1& v1, const T2& v2,
                                               const char* exprtext) {
  std::ostringstream ss;
  ss << exprtext << " (" << v1 << " vs. " << v2 << ")";
  return std::make_unique<std::string>(ss.str());
}

#define CORAL_DEFINE_CHECK_OP_IMPL(name, op)                                \
  template <typename T1, typename T2>                                       \
  inline std::unique_ptr<std::string> name##Impl(const T1& v1, const T2& v2, \
                                                 const char* exprtext) {    \
    if (ABSL_PREDICT_TRUE(v1 op v2)) {                                      \
      return nullptr;                                                       \
    }                                                                       \
    return MakeCheckOpString(v1, v2, exprtext);                             \
  }

CORAL_DEFINE_CHECK_OP_IMPL(CheckEq, ==)
CORAL_DEFINE_CHECK_OP_IMPL(CheckNe, !=)
CORAL_DEFINE_CHECK_OP_IMPL(CheckLe, <=)
CORAL_DEFINE_CHECK_OP_IMPL(CheckLt, <)
CORAL_DEFINE_CHECK_OP_IMPL(CheckGe, >=)
CORAL_DEFINE_CHECK_OP_IMPL(CheckGt, >)
#undef CORAL_DEFINE_CHECK_OP_IMPL

std::unique_ptr<std::string> CheckOkImpl(const absl::Status& status,
                                         const char* exprtext);

template <typename T>
T* DieIfNull(const char* file, int line, const char* exprtext, T* t) {
  if (ABSL_PREDICT_FALSE(t == nullptr)) {
    LogMessageFatal(file, line).stream()
        << "Check failed: '" << exprtext << "' must not be null";
  }
  return t;
}

}  // namespace logging_internal
}  // namespace coral

#define CORAL_LOG_INFO                                  \
  ::coral::logging_internal::LogMessage(__FILE__, __LINE__, \
                                        ::coral::LogSeverity::kInfo)
#define CORAL_LOG_WARNING                               \
  ::coral::logging_internal::LogMessage(__FILE__, __LINE__, \
                                        ::coral::LogSeverity::kWarning)
#define CORAL_LOG_ERROR                                 \
  ::coral::logging_internal::LogMessage(__FILE__, __LINE__, \
                                        ::coral::LogSeverity::kError)
#define CORAL_LOG_FATAL \
  ::coral::logging_internal::LogMessageFatal(__FILE__, __LINE__)

#define CORAL_LOG(severity) CORAL_LOG_##severity.stream()

#define CORAL_VLOG_IS_ON(level) ::coral::logging_internal::VlogIsOn(level)

#define CORAL_VLOG(level)                              \
  !CORAL_VLOG_IS_ON(level)                             \
      ? (void)0                                        \
      : ::coral::logging_internal::LogMessageVoidify() & \
            CORAL_LOG(INFO)

#define CORAL_CHECK(condition)                         \
  ABSL_PREDICT_TRUE(condition)                         \
  ? (void)0                                            \
  : ::coral::logging_internal::LogMessageVoidify() &   \
        CORAL_LOG(FATAL) << "Check failed: " #condition " "

#define CORAL_CHECK_OP(name, op, val1, val2)                                \
  while (::std::unique_ptr<std::string> _coral_check_result =               \
             ::coral::logging_internal::name##Impl(                         \
                 (val1), (val2), #val1 " " #op " " #val2))                  \
  ::coral::logging_internal::LogMessageFatal(__FILE__, __LINE__,            \
                                             *_coral_check_result)          \
      .stream()

#define CORAL_CHECK_EQ(val1, val2) CORAL_CHECK_OP(CheckEq, ==, val1, val2)
#define CORAL_CHECK_NE(val1, val2) CORAL_CHECK_OP(CheckNe, !=, val1, val2)
#define CORAL_CHECK_LE(val1, val2) CORAL_CHECK_OP(CheckLe, <=, val1, val2)
#define CORAL_CHECK_LT(val1, val2) CORAL_CHECK_OP(CheckLt, <, val1, val2)
#define CORAL_CHECK_GE(val1, val2) CORAL_CHECK_OP(CheckGe, >=, val1, val2)
#define CORAL_CHECK_GT(val1, val2) CORAL_CHECK_OP(CheckGt, >, val1, val2)

#define CORAL_CHECK_OK(val)                                            \
  while (::std::unique_ptr<std::string> _coral_check_result =          \
             ::coral::logging_internal::CheckOkImpl((val), #val))      \
  ::coral::logging_internal::LogMessageFatal(__FILE__, __LINE__,       \
                                             *_coral_check_result)     \
      .stream()

#define CORAL_DIE_IF_NULL(val) \
  ::coral::logging_internal::DieIfNull(__FILE__, __LINE__, #val, (val))

#endif  // CORAL_COMMON_LOGGING_LOGGING_H_
