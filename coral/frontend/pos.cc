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


#include "coral/frontend/pos.h"

#include <cstdint>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "re2/re2.h"

namespace coral {

/* static */ absl::StatusOr<Span> Span::FromString(absl::string_view s) {
  static const RE2* const kSpanRe =
      new RE2(R"((.*):(\d+):(\d+)-(\d+):(\d+))");
  std::string filename;
  int64_t start_line;
  int64_t start_col;
  int64_t limit_line;
  int64_t limit_col;
  if (!RE2::FullMatch(re2::StringPiece(s.data(), s.size()), *kSpanRe,
                      &filename, &start_line, &start_col, &limit_line,
                      &limit_col) ||
      start_line < 1 || start_col < 1 || limit_line < 1 || limit_col < 1) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Cannot convert string to span: \"%s\"", s));
  }
  Pos start(filename, start_line - 1, start_col - 1);
  Pos limit(filename, limit_line - 1, limit_col - 1);
  if (limit < start) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Span limit precedes its start: \"%s\"", s));
  }
  return Span(std::move(start), std::move(limit));
}

}  // namespace coral
