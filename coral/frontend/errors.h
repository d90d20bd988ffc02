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

#ifndef CORAL_FRONTEND_ERRORS_H_
#define CORAL_FRONTEND_ERRORS_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "coral/frontend/pos.h"

namespace coral {

// Returns a status that indicates a parse error at `span`. The position is
// encoded in the message as "ParseError: <span> <message>".
absl::Status ParseErrorStatus(const Span& span, absl::string_view message);

// Returns whether `status` is a positional error produced by the scanner or
// the parser (as opposed to e.g. an I/O error).
bool IsPositionalError(const absl::Status& status);

// The parts of a positional error message.
struct PositionalErrorData {
  Span span;
  std::string message;
  // E.g. "ParseError".
  std::string error_type;
};

// Extracts the position, error type and message from a positional error, or
// returns an error if `status` is not one.
absl::StatusOr<PositionalErrorData> GetPositionalErrorData(
    const absl::Status& status);

}  // namespace coral

#endif  // CORAL_FRONTEND_ERRORS_H_
