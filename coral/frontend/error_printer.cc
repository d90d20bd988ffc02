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


#include "coral/frontend/error_printer.h"

#include <algorithm>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"
#include "coral/frontend/pos.h"

namespace coral {

absl::Status PrintPositionalError(const Span& error_span,
                                  absl::string_view error_message,
                                  absl::string_view contents, std::ostream& os,
                                  int64_t error_context_line_count) {
  if (error_context_line_count <= 0 || error_context_line_count % 2 != 1) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Error context line count must be positive and odd; got %d",
        error_context_line_count));
  }

  std::vector<absl::string_view> lines = absl::StrSplit(contents, '\n');
  // Lines are \n-terminated, not \n-separated.
  if (lines.size() > 1 && lines.back().empty()) {
    lines.pop_back();
  }
  for (absl::string_view& line : lines) {
    absl::ConsumeSuffix(&line, "\r");
  }

  const Pos file_start(error_span.filename(), 0, 0);
  const Pos file_limit(error_span.filename(),
                       static_cast<int64_t>(lines.size()) - 1,
                       static_cast<int64_t>(lines.back().size()));
  const Pos start =
      std::max(file_start, std::min(error_span.start(), file_limit));

  int64_t line_count_each_side = error_context_line_count / 2;
  int64_t first_line_printed =
      std::max(start.lineno() - line_count_each_side, int64_t{0});
  int64_t last_line_printed =
      std::min(start.lineno() + line_count_each_side, file_limit.lineno());

  os << absl::StreamFormat("%s:%s-%s\n", error_span.filename(),
                           error_span.start().ToStringNoFile(),
                           error_span.limit().ToStringNoFile());
  for (int64_t i = first_line_printed; i <= last_line_printed; ++i) {
    os << absl::StreamFormat("%04d: %s\n", i + 1, lines[i]);
    if (i == start.lineno()) {
      // Point at the error start, lined up past the "0000: " prefix.
      std::string squiggles(start.colno() + 6, '~');
      os << absl::StreamFormat("%s^ %s\n", squiggles, error_message);
    }
  }
  return absl::OkStatus();
}

}  // namespace coral
