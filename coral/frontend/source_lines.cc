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

#include "coral/frontend/source_lines.h"

#include <cstdint>
#include <string>
#include <utility>

#include "absl/strings/string_view.h"

namespace coral {

SourceLines::SourceLines(std::string text) : text_(std::move(text)) {
  if (text_.empty()) {
    return;
  }
  starts_.push_back(0);
  for (size_t i = 0; i < text_.size(); ++i) {
    if (text_[i] == '\n' && i + 1 < text_.size()) {
      starts_.push_back(i + 1);
    }
  }
}

absl::string_view SourceLines::GetLine(int64_t lineno) const {
  if (lineno < 0 || lineno >= size()) {
    return absl::string_view();
  }
  size_t start = starts_[lineno];
  size_t end = text_.find('\n', start);
  if (end == std::string::npos) {
    end = text_.size();
  }
  absl::string_view line(text_.data() + start, end - start);
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }
  return line;
}

}  // namespace coral
