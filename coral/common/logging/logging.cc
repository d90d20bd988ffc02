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

#include "coral/common/logging/logging.h"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "absl/flags/flag.h"
#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"

ABSL_FLAG(int32_t, v, 0,
          "Show all CORAL_VLOG(m) messages for m <= this value.");

namespace coral {
namespace logging_internal {
namespace {

char SeverityChar(LogSeverity severity) {
  switch (severity) {
    case LogSeverity::kInfo:
      return 'I';
    case LogSeverity::kWarning:
      return 'W';
    case LogSeverity::kError:
      return 'E';
    case LogSeverity::kFatal:
      return 'F';
  }
  return '?';
}

// Strips the directory components from `path`.
absl::string_view Basename(absl::string_view path) {
  size_t pos = path.find_last_of('/');
  if (pos == absl::string_view::npos) {
    return path;
  }
  return path.substr(pos + 1);
}

}  // namespace

LogMessage::LogMessage(const char* file, int line, LogSeverity severity)
    : file_(file), line_(line), severity_(severity) {}

LogMessage::~LogMessage() { Flush(); }

void LogMessage::Flush() {
  if (flushed_) {
    return;
  }
  flushed_ = true;
  std::cerr << absl::StrFormat("%c %s:%d] %s\n", SeverityChar(severity_),
                               Basename(file_), line_, stream_.str());
  std::cerr.flush();
}

LogMessageFatal::LogMessageFatal(const char* file, int line)
    : LogMessage(file, line, LogSeverity::kFatal) {}

LogMessageFatal::LogMessageFatal(const char* file, int line,
                                 const std::string& failure)
    : LogMessage(file, line, LogSeverity::kFatal) {
  stream() << "Check failed: " << failure << " ";
}

LogMessageFatal::~LogMessageFatal() {
  Flush();
  std::abort();
}

bool VlogIsOn(int level) { return level <= absl::GetFlag(FLAGS_v); }

std::unique_ptr<std::string> CheckOkImpl(const absl::Status& status,
                                         const char* exprtext) {
  if (ABSL_PREDICT_TRUE(status.ok())) {
    return nullptr;
  }
  return std::make_unique<std::string>(
      absl::StrFormat("%s is OK (%s)", exprtext, status.ToString()));
}

}  // namespace logging_internal
}  // namespace coral
