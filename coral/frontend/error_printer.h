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


#ifndef CORAL_FRONTEND_ERROR_PRINTER_H_
#define CORAL_FRONTEND_ERROR_PRINTER_H_

#include <cstdint>
#include <ostream>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "coral/frontend/pos.h"

namespace coral {

// Prints a human-readable error with source context to `os`.
//
// The output starts with the span, followed by the source lines around the
// error; the error start is marked with a caret and `error_message` is shown
// beside it. `contents` is the text of the file the span refers to.
//
// Args:
//   error_span: Span of the error in `contents`; clamped to the text.
//   error_message: Message displayed beside the caret.
//   contents: Source text of `error_span.filename()`.
//   os: Stream the output is written to.
//   error_context_line_count: Number of lines to display around the error
//     start; must be odd.
absl::Status PrintPositionalError(const Span& error_span,
                                  absl::string_view error_message,
                                  absl::string_view contents, std::ostream& os,
                                  int64_t error_context_line_count = 5);

}  // namespace coral

#endif  // CORAL_FRONTEND_ERROR_PRINTER_H_
