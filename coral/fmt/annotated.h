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


#ifndef CORAL_FMT_ANNOTATED_H_
#define CORAL_FMT_ANNOTATED_H_

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "coral/frontend/ast.h"
#include "coral/frontend/comment_data.h"

namespace coral {

// The comment-annotated view of a syntax tree that the printer consumes.
//
// Entries refer to statements owned by a Module, which must outlive them; the
// syntax tree itself is never modified. Every statement entry carries the
// annotated form of each statement sequence its statement owns, in the order
// given by Stmt::GetBlocks().

struct Block;

// A statement with no comment on its line.
struct Bare {
  const Stmt* stmt;
  std::vector<Block> blocks;
};

// A statement with a comment on the same source line as one of its header
// lines. That is the first line except for a decorated definition, whose
// comment may sit on a later decorator or on the `def`/`class` line.
struct Trailing {
  const Stmt* stmt;
  CommentData comment;
  std::vector<Block> blocks;
  // Index of the header line carrying the comment; decorators come first.
  int64_t header_line = 0;
};

// A statement with an `else:` arm (if, for, while, try) and the comments on
// its clause header lines.
struct ConditionalWithComments {
  const Stmt* stmt;
  // Comment on the line of the statement's own header, e.g. `if x:  # c`.
  std::optional<CommentData> head_comment;
  // Comment on a terminal `else:` line; never set for an `elif`.
  std::optional<CommentData> else_comment;
  // Try only: comment on the `finally:` line.
  std::optional<CommentData> finally_comment;
  // Try only: one (optional) comment per `except` header.
  std::vector<std::optional<CommentData>> handler_comments;
  std::vector<Block> blocks;
};

// A comment on a line of its own.
struct StandaloneComment {
  CommentData comment;
};

using BlockEntry =
    std::variant<Bare, Trailing, ConditionalWithComments, StandaloneComment>;

// A sequence of statements interleaved with standalone comments.
struct Block {
  std::vector<BlockEntry> entries;
};

// Returns the statement of `entry`, or nullptr for a standalone comment.
const Stmt* GetStmt(const BlockEntry& entry);

// Returns the child blocks of `entry` (empty for a standalone comment).
const std::vector<Block>& GetChildBlocks(const BlockEntry& entry);

// Returns a compact dump of the annotated structure, for tests and debugging;
// e.g.
//
//   [Trailing(Assign@0, "# c"), Comment("# d"), Bare(Function@2, [[...]])]
//
// Statements are named by node type and (zero-based) line.
std::string BlockEntryToString(const BlockEntry& entry);
std::string BlockToString(const Block& block);

}  // namespace coral

#endif  // CORAL_FMT_ANNOTATED_H_
