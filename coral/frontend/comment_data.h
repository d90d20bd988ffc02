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

#ifndef CORAL_FRONTEND_COMMENT_DATA_H_
#define CORAL_FRONTEND_COMMENT_DATA_H_

#include <string>

#include "coral/frontend/pos.h"

namespace coral {

// A comment as collected by the scanner. `text` runs from the `#` up to (not
// including) the end of the line.
struct CommentData {
  Span span;
  std::string text;

  bool operator==(const CommentData& other) const {
    return span == other.span && text == other.text;
  }
};

}  // namespace coral

#endif  // CORAL_FRONTEND_COMMENT_DATA_H_
