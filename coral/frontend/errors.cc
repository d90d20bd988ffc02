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

#include "coral/frontend/errors.h"

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/match.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "coral/common/status/status_macros.h"
#include "coral/frontend/pos.h"
#include "re2/re2.h"

namespace coral {

absl::Status ParseErrorStatus(const Span& span, absl::string_view message) {
  return absl::InvalidArgumentError(
      absl::StrFormat("ParseError: %s %s", span.ToString(), message));
}

bool IsPositionalError(const absl::Status& status) {
  return status.code() == absl::StatusCode::kInvalidArgument &&
         (absl::StartsWith(status.message(), "ParseError: ") ||
          absl::StartsWith(status.message(), "ScanError: "));
}

absl::StatusOr<PositionalErrorData> GetPositionalErrorData(
    const absl::Status& status) {
  if (!IsPositionalError(status)) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Provided status is not a positional error: %s", status.ToString()));
  }
  absl::string_view s = status.message();
  std::string error_type;
  std::string span_text;
  std::string message;
  if (!RE2::FullMatch(re2::StringPiece(s.data(), s.size()),
                      R"((\w+): (\S+) ((?s).*))", &error_type, &span_text,
                      &message)) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Could not extract a position from error message: %s", s));
  }
  CORAL_ASSIGN_OR_RETURN(Span span, Span::FromString(span_text));
  return PositionalErrorData{span, message, error_type};
}

}  // namespace coral
