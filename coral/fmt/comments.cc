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


#include "coral/fmt/comments.h"

#include <cstdint>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "coral/common/logging/logging.h"
#include "coral/fmt/annotated.h"
#include "coral/frontend/ast.h"
#include "coral/frontend/comment_data.h"
#include "coral/frontend/pos.h"
#include "coral/frontend/source_lines.h"
#include "re2/re2.h"

namespace coral {
namespace {

constexpr int64_t kNoLimit = std::numeric_limits<int64_t>::max();

// Lines that hold nothing but a clause header and a comment.
const RE2& ElseHeaderRe() {
  static const RE2* re = new RE2(R"(^\s*else\s*:\s*#)");
  return *re;
}
const RE2& FinallyHeaderRe() {
  static const RE2* re = new RE2(R"(^\s*finally\s*:\s*#)");
  return *re;
}

// Returns the lines a statement's trailing comment may sit on, in header
// order: one per decorator, then the `def` or `class` line. Every other
// statement only has its first line.
std::vector<int64_t> GetHeaderLines(const Stmt* stmt) {
  const std::vector<Expr*>* decorators = nullptr;
  int64_t keyword_line = stmt->lineno();
  if (stmt->kind() == AstNodeKind::kFunction) {
    auto* f = static_cast<const Function*>(stmt);
    decorators = &f->decorators();
    keyword_line = f->keyword_pos().lineno();
  } else if (stmt->kind() == AstNodeKind::kClassDef) {
    auto* c = static_cast<const ClassDef*>(stmt);
    decorators = &c->decorators();
    keyword_line = c->keyword_pos().lineno();
  }
  std::vector<int64_t> lines;
  if (decorators != nullptr) {
    for (const Expr* decorator : *decorators) {
      lines.push_back(decorator->span().start().lineno());
    }
  }
  lines.push_back(keyword_line);
  return lines;
}

// Where the comments that follow the last statement of a block stop belonging
// to it.
struct BlockLimit {
  // Line of the next statement of the enclosing block, or of the next clause
  // header of the owning statement; comments on or after this line are never
  // taken.
  int64_t lineno;

  // Whether `lineno` is a clause header (`elif`, `else:`, `except`,
  // `finally:`). If so every comment before it is taken regardless of its
  // column; otherwise only comments indented at least as deeply as the last
  // statement are.
  bool clause_follows;

  // False for the implicit block that holds an `elif`: it has no lines of its
  // own, so the comments after it go to the enclosing block.
  bool sweep_trailing = true;
};

BlockLimit ClauseLimit(int64_t lineno) {
  return BlockLimit{lineno, /*clause_follows=*/true};
}

// Holds the cursor over the comments for a single MergeComments() call.
class CommentMerger {
 public:
  CommentMerger(absl::Span<const CommentData> comments,
                const SourceLines& source_lines)
      : comments_(comments), source_lines_(source_lines) {}

  Block MergeModule(const Module& module) {
    Block block = MergeBlock(module.body(),
                             BlockLimit{kNoLimit, /*clause_follows=*/false});
    while (!AtEnd()) {
      block.entries.push_back(StandaloneComment{Pop()});
    }
    return block;
  }

 private:
  bool AtEnd() const { return next_ >= comments_.size(); }
  const CommentData& Peek() const {
    CORAL_CHECK(!AtEnd());
    return comments_[next_];
  }
  int64_t PeekLine() const { return Peek().span.start().lineno(); }
  CommentData Pop() {
    CORAL_CHECK(!AtEnd());
    return comments_[next_++];
  }

  // Pops the next comment if it is on line `lineno`.
  std::optional<CommentData> TakeSameLine(int64_t lineno) {
    if (AtEnd() || PeekLine() != lineno) {
      return std::nullopt;
    }
    CORAL_VLOG(4) << "Attaching comment " << Peek().span << " to line "
                  << lineno + 1;
    return Pop();
  }

  // Pops the next comment if it is on the line of the clause keyword at
  // `keyword_pos` and that line is only the clause header followed by the
  // comment, e.g. `else:  # c` as opposed to `else: x = 1  # c`.
  std::optional<CommentData> TakeClauseComment(const Pos& keyword_pos,
                                               const RE2& header) {
    if (AtEnd() || PeekLine() != keyword_pos.lineno()) {
      return std::nullopt;
    }
    absl::string_view line = source_lines_.GetLine(PeekLine());
    if (!RE2::PartialMatch(re2::StringPiece(line.data(), line.size()),
                           header)) {
      CORAL_VLOG(4) << "Comment " << Peek().span
                    << " is not on a bare clause header line: `" << line
                    << "`";
      return std::nullopt;
    }
    CORAL_VLOG(4) << "Attaching comment " << Peek().span
                  << " to clause header @ " << keyword_pos;
    return Pop();
  }

  Block MergeBlock(const StmtBlock& stmts, const BlockLimit& limit);

  BlockEntry MergeStmt(const Stmt* stmt, const BlockLimit& limit);
  BlockEntry MergeIf(const If* node, const BlockLimit& limit);
  BlockEntry MergeLoop(const Stmt* node, const StmtBlock& body,
                       const StmtBlock& orelse,
                       const std::optional<Pos>& else_pos,
                       const BlockLimit& limit);
  BlockEntry MergeTry(const Try* node, const BlockLimit& limit);

  absl::Span<const CommentData> comments_;
  const SourceLines& source_lines_;
  // Index of the next comment not yet attached.
  size_t next_ = 0;
};

// Places each pending comment before the first statement on a later line.
Block Interleave(std::vector<BlockEntry> stmts,
                 std::vector<CommentData> pending) {
  Block block;
  auto it = pending.begin();
  for (BlockEntry& entry : stmts) {
    const int64_t lineno = GetStmt(entry)->lineno();
    while (it != pending.end() && it->span.start().lineno() < lineno) {
      block.entries.push_back(StandaloneComment{std::move(*it)});
      ++it;
    }
    block.entries.push_back(std::move(entry));
  }
  for (; it != pending.end(); ++it) {
    block.entries.push_back(StandaloneComment{std::move(*it)});
  }
  return block;
}

Block CommentMerger::MergeBlock(const StmtBlock& stmts,
                                const BlockLimit& limit) {
  std::vector<CommentData> pending;
  std::vector<BlockEntry> entries;
  entries.reserve(stmts.size());
  for (size_t i = 0; i < stmts.size(); ++i) {
    const Stmt* stmt = stmts[i];
    while (!AtEnd() && PeekLine() < stmt->lineno()) {
      CORAL_VLOG(5) << "Comment " << Peek().span << " precedes "
                    << stmt->GetNodeTypeName() << " @ " << stmt->span();
      pending.push_back(Pop());
    }
    // The comments after a statement's last nested block end where the next
    // statement starts.
    BlockLimit child_limit{
        i + 1 < stmts.size() ? stmts[i + 1]->lineno() : limit.lineno,
        /*clause_follows=*/false};
    entries.push_back(MergeStmt(stmt, child_limit));
  }

  if (limit.sweep_trailing) {
    const int64_t last_colno = stmts.empty() ? 0 : stmts.back()->colno();
    while (!AtEnd() && PeekLine() < limit.lineno) {
      const CommentData& next = Peek();
      if (!limit.clause_follows && next.span.start().colno() < last_colno) {
        break;
      }
      CORAL_VLOG(5) << "Comment " << next.span << " trails block";
      pending.push_back(Pop());
    }
  }
  return Interleave(std::move(entries), std::move(pending));
}

BlockEntry CommentMerger::MergeStmt(const Stmt* stmt, const BlockLimit& limit) {
  switch (stmt->kind()) {
    case AstNodeKind::kIf:
      return MergeIf(static_cast<const If*>(stmt), limit);
    case AstNodeKind::kWhile: {
      auto* node = static_cast<const While*>(stmt);
      return MergeLoop(node, node->body(), node->orelse(), node->else_pos(),
                       limit);
    }
    case AstNodeKind::kFor: {
      auto* node = static_cast<const For*>(stmt);
      return MergeLoop(node, node->body(), node->orelse(), node->else_pos(),
                       limit);
    }
    case AstNodeKind::kTry:
      return MergeTry(static_cast<const Try*>(stmt), limit);
    default:
      break;
  }

  // Only the first comment found on a header line is kept with the header; a
  // second one stays pending and lands in the body.
  std::optional<CommentData> comment;
  int64_t header_line = 0;
  const std::vector<int64_t> header_lines = GetHeaderLines(stmt);
  for (size_t i = 0; i < header_lines.size(); ++i) {
    comment = TakeSameLine(header_lines[i]);
    if (comment.has_value()) {
      header_line = static_cast<int64_t>(i);
      break;
    }
  }
  std::vector<Block> blocks;
  for (const StmtBlock* child : stmt->GetBlocks()) {
    blocks.push_back(MergeBlock(*child, limit));
  }
  if (comment.has_value()) {
    return Trailing{stmt, *std::move(comment), std::move(blocks),
                    header_line};
  }
  return Bare{stmt, std::move(blocks)};
}

BlockEntry CommentMerger::MergeIf(const If* node, const BlockLimit& limit) {
  ConditionalWithComments result{node};
  result.head_comment = TakeSameLine(node->lineno());
  const StmtBlock& orelse = node->orelse();
  if (orelse.empty()) {
    result.blocks.push_back(MergeBlock(node->body(), limit));
    result.blocks.push_back(Block{});
    return result;
  }
  if (!node->else_pos().has_value()) {
    // An `elif`: the else arm is the nested if statement alone.
    CORAL_CHECK_EQ(orelse.size(), 1);
    result.blocks.push_back(
        MergeBlock(node->body(), ClauseLimit(orelse.front()->lineno())));
    result.blocks.push_back(
        MergeBlock(orelse, BlockLimit{limit.lineno, /*clause_follows=*/false,
                                      /*sweep_trailing=*/false}));
    return result;
  }
  result.blocks.push_back(
      MergeBlock(node->body(), ClauseLimit(node->else_pos()->lineno())));
  result.else_comment = TakeClauseComment(*node->else_pos(), ElseHeaderRe());
  result.blocks.push_back(MergeBlock(orelse, limit));
  return result;
}

BlockEntry CommentMerger::MergeLoop(const Stmt* node, const StmtBlock& body,
                                    const StmtBlock& orelse,
                                    const std::optional<Pos>& else_pos,
                                    const BlockLimit& limit) {
  ConditionalWithComments result{node};
  result.head_comment = TakeSameLine(node->lineno());
  if (!else_pos.has_value()) {
    result.blocks.push_back(MergeBlock(body, limit));
    result.blocks.push_back(Block{});
    return result;
  }
  result.blocks.push_back(MergeBlock(body, ClauseLimit(else_pos->lineno())));
  result.else_comment = TakeClauseComment(*else_pos, ElseHeaderRe());
  result.blocks.push_back(MergeBlock(orelse, limit));
  return result;
}

BlockEntry CommentMerger::MergeTry(const Try* node, const BlockLimit& limit) {
  ConditionalWithComments result{node};
  result.head_comment = TakeSameLine(node->lineno());

  // Header lines of the clauses that follow the body, in order.
  std::vector<int64_t> clause_lines;
  for (const ExceptHandler* handler : node->handlers()) {
    clause_lines.push_back(handler->lineno());
  }
  if (node->else_pos().has_value()) {
    clause_lines.push_back(node->else_pos()->lineno());
  }
  if (node->finally_pos().has_value()) {
    clause_lines.push_back(node->finally_pos()->lineno());
  }
  size_t next_clause = 0;
  auto body_limit = [&]() -> BlockLimit {
    if (next_clause < clause_lines.size()) {
      return ClauseLimit(clause_lines[next_clause]);
    }
    return limit;
  };

  result.blocks.push_back(MergeBlock(node->body(), body_limit()));
  for (const ExceptHandler* handler : node->handlers()) {
    ++next_clause;
    result.handler_comments.push_back(TakeSameLine(handler->lineno()));
    result.blocks.push_back(MergeBlock(handler->body(), body_limit()));
  }
  if (node->else_pos().has_value()) {
    ++next_clause;
    result.else_comment = TakeClauseComment(*node->else_pos(), ElseHeaderRe());
    result.blocks.push_back(MergeBlock(node->orelse(), body_limit()));
  } else {
    result.blocks.push_back(Block{});
  }
  if (node->finally_pos().has_value()) {
    ++next_clause;
    result.finally_comment =
        TakeClauseComment(*node->finally_pos(), FinallyHeaderRe());
    result.blocks.push_back(MergeBlock(node->finalbody(), body_limit()));
  } else {
    result.blocks.push_back(Block{});
  }
  return result;
}

}  // namespace

absl::StatusOr<Block> MergeComments(const Module& module,
                                    absl::Span<const CommentData> comments,
                                    const SourceLines& source_lines) {
  for (size_t i = 1; i < comments.size(); ++i) {
    if (comments[i].span.start() < comments[i - 1].span.start()) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Comments must be ordered by position; comment @ %s follows comment "
          "@ %s",
          comments[i].span.ToString(), comments[i - 1].span.ToString()));
    }
  }
  CORAL_VLOG(3) << "Merging " << comments.size() << " comment(s) into module `"
                << module.name() << "`";
  CommentMerger merger(comments, source_lines);
  return merger.MergeModule(module);
}

}  // namespace coral
