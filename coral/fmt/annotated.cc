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


#include "coral/fmt/annotated.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "coral/common/visitor.h"
#include "coral/frontend/ast.h"
#include "coral/frontend/comment_data.h"

namespace coral {
namespace {

std::string StmtToString(const Stmt* stmt) {
  return absl::StrFormat("%s@%d", stmt->GetNodeTypeName(), stmt->lineno());
}

std::string CommentToString(const CommentData& comment) {
  return absl::StrCat("\"", comment.text, "\"");
}

std::string OptionalCommentToString(const std::optional<CommentData>& comment) {
  return comment.has_value() ? CommentToString(*comment) : "none";
}

// Renders the ", [<block>, ...]" suffix for an entry with child blocks.
std::string BlocksSuffix(const std::vector<Block>& blocks) {
  if (blocks.empty()) {
    return "";
  }
  return absl::StrCat(
      ", [",
      absl::StrJoin(blocks, ", ",
                    [](std::string* out, const Block& block) {
                      absl::StrAppend(out, BlockToString(block));
                    }),
      "]");
}

}  // namespace

const Stmt* GetStmt(const BlockEntry& entry) {
  return std::visit(
      Visitor{
          [](const Bare& e) -> const Stmt* { return e.stmt; },
          [](const Trailing& e) -> const Stmt* { return e.stmt; },
          [](const ConditionalWithComments& e) -> const Stmt* {
            return e.stmt;
          },
          [](const StandaloneComment&) -> const Stmt* { return nullptr; },
      },
      entry);
}

const std::vector<Block>& GetChildBlocks(const BlockEntry& entry) {
  static const std::vector<Block>* kNoBlocks = new std::vector<Block>();
  return std::visit(
      Visitor{
          [](const Bare& e) -> const std::vector<Block>& { return e.blocks; },
          [](const Trailing& e) -> const std::vector<Block>& {
            return e.blocks;
          },
          [](const ConditionalWithComments& e) -> const std::vector<Block>& {
            return e.blocks;
          },
          [](const StandaloneComment&) -> const std::vector<Block>& {
            return *kNoBlocks;
          },
      },
      entry);
}

std::string BlockEntryToString(const BlockEntry& entry) {
  return std::visit(
      Visitor{
          [](const Bare& e) {
            return absl::StrCat("Bare(", StmtToString(e.stmt),
                                BlocksSuffix(e.blocks), ")");
          },
          [](const Trailing& e) {
            std::string header_line =
                e.header_line == 0
                    ? ""
                    : absl::StrCat(", header_line=", e.header_line);
            return absl::StrCat("Trailing(", StmtToString(e.stmt), ", ",
                                CommentToString(e.comment), header_line,
                                BlocksSuffix(e.blocks), ")");
          },
          [](const ConditionalWithComments& e) {
            std::string result =
                absl::StrCat("Conditional(", StmtToString(e.stmt));
            if (e.head_comment.has_value()) {
              absl::StrAppend(&result,
                              ", head=", CommentToString(*e.head_comment));
            }
            if (!e.handler_comments.empty()) {
              absl::StrAppend(
                  &result, ", handlers=[",
                  absl::StrJoin(e.handler_comments, ", ",
                                [](std::string* out,
                                   const std::optional<CommentData>& c) {
                                  absl::StrAppend(out,
                                                  OptionalCommentToString(c));
                                }),
                  "]");
            }
            if (e.else_comment.has_value()) {
              absl::StrAppend(&result,
                              ", else=", CommentToString(*e.else_comment));
            }
            if (e.finally_comment.has_value()) {
              absl::StrAppend(&result, ", finally=",
                              CommentToString(*e.finally_comment));
            }
            absl::StrAppend(&result, BlocksSuffix(e.blocks), ")");
            return result;
          },
          [](const StandaloneComment& e) {
            return absl::StrCat("Comment(", CommentToString(e.comment), ")");
          },
      },
      entry);
}

std::string BlockToString(const Block& block) {
  return absl::StrCat(
      "[",
      absl::StrJoin(block.entries, ", ",
                    [](std::string* out, const BlockEntry& entry) {
                      absl::StrAppend(out, BlockEntryToString(entry));
                    }),
      "]");
}

}  // namespace coral
