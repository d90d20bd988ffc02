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


#ifndef CORAL_FMT_COMMENTS_H_
#define CORAL_FMT_COMMENTS_H_

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "coral/fmt/annotated.h"
#include "coral/frontend/ast.h"
#include "coral/frontend/comment_data.h"
#include "coral/frontend/source_lines.h"

namespace coral {

// Attaches `comments` to the statements of `module`, producing the annotated
// block for the module's top level.
//
// Comments are consumed in the given order in a single depth-first pass over
// the statements:
//
// * a comment on the first line of a statement trails that statement (or,
//   for a statement with clauses, is the comment of its header);
// * a comment on a line of its own becomes a standalone comment in the
//   innermost block that contains it: a comment after the last statement of a
//   body stays in the body while it is indented at least as deeply as that
//   statement, and every comment before a following `elif`, `else:`,
//   `except` or `finally:` header belongs to the body it follows;
// * a comment on an `else:` (`finally:`) line is the comment of that clause
//   only when the line consists of the header alone, as determined from
//   `source_lines`.
//
// Returns an error if `comments` is not ordered by position. `module` must
// outlive the result.
absl::StatusOr<Block> MergeComments(const Module& module,
                                    absl::Span<const CommentData> comments,
                                    const SourceLines& source_lines);

}  // namespace coral

#endif  // CORAL_FMT_COMMENTS_H_
