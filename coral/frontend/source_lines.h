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

#ifndef CORAL_FRONTEND_SOURCE_LINES_H_
#define CORAL_FRONTEND_SOURCE_LINES_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"

namespace coral {

// Immutable line index over a source text.
class SourceLines {
 public:
  explicit SourceLines(std::string text);

  // Returns the raw text of zero-based line `lineno` without its line
  // terminator, or an empty view if there is no such line.
  absl::string_view GetLine(int64_t lineno) const;

  int64_t size() const { return static_cast<int64_t>(starts_.size()); }

 private:
  std::string text_;
  // Offset of the first character of each line within `text_`.
  std::vector<size_t> starts_;
};

}  // namespace coral

#endif  // CORAL_FRONTEND_SOURCE_LINES_H_
