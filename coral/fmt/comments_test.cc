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
#include <string>
#include <variant>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "coral/common/status/matchers.h"
#include "coral/fmt/annotated.h"
#include "coral/frontend/comment_data.h"
#include "coral/frontend/parser.h"
#include "coral/frontend/pos.h"
#include "coral/frontend/source_lines.h"

namespace coral {
namespace {

using status_testing::StatusIs;
using testing::HasSubstr;

int64_t CountComments(const Block& block) {
  int64_t count = 0;
  for (const BlockEntry& entry : block.entries) {
    if (std::holds_alternative<StandaloneComment>(entry)) {
      ++count;
      continue;
    }
    if (std::holds_alternative<Trailing>(entry)) {
      ++count;
    }
    if (const auto* cond = std::get_if<ConditionalWithComments>(&entry)) {
      count += cond->head_comment.has_value();
      count += cond->else_comment.has_value();
      count += cond->finally_comment.has_value();
      for (const auto& handler_comment : cond->handler_comments) {
        count += handler_comment.has_value();
      }
    }
    for (const Block& child : GetChildBlocks(entry)) {
      count += CountComments(child);
    }
  }
  return count;
}

class MergeCommentsTest : public ::testing::Test {
 public:
  void MergeAndCheck(absl::string_view program, absl::string_view want) {
    CORAL_ASSERT_OK_AND_ASSIGN(ParsedModule parsed,
                               ParseModule(program, "test.py"));
    CORAL_ASSERT_OK_AND_ASSIGN(
        Block block, MergeComments(*parsed.module, parsed.comments,
                                   parsed.source_lines));
    EXPECT_EQ(BlockToString(block), want);
    EXPECT_EQ(CountComments(block),
              static_cast<int64_t>(parsed.comments.size()));
  }
};

TEST_F(MergeCommentsTest, EmptyModule) { MergeAndCheck("", "[]"); }

TEST_F(MergeCommentsTest, NoComments) {
  MergeAndCheck("x = 1\ny = 2\n", "[Bare(Assign@0), Bare(Assign@1)]");
}

TEST_F(MergeCommentsTest, OnlyComments) {
  MergeAndCheck("# a\n\n# b\n", R"([Comment("# a"), Comment("# b")])");
}

TEST_F(MergeCommentsTest, TrailingAndStandalone) {
  MergeAndCheck("# leading\nx = 1  # trailing\n# final\n",
                R"([Comment("# leading"), Trailing(Assign@1, "# trailing"), )"
                R"(Comment("# final")])");
}

TEST_F(MergeCommentsTest, BranchCommentPlacement) {
  constexpr absl::string_view kProgram = R"(if True:  # c2
    x = 1  # c4
else: # c6
    x = 4  # c8
)";
  MergeAndCheck(kProgram,
                R"([Conditional(If@0, head="# c2", else="# c6", )"
                R"([[Trailing(Assign@1, "# c4")], )"
                R"([Trailing(Assign@3, "# c8")]])])");
}

TEST_F(MergeCommentsTest, ElifChainHeaderComments) {
  constexpr absl::string_view kProgram = R"(if a:  # c0
    x = 1
elif b:  # c2
    x = 2
elif c:  # c4
    x = 3
else:  # c6
    x = 4
)";
  MergeAndCheck(
      kProgram,
      R"([Conditional(If@0, head="# c0", [[Bare(Assign@1)], )"
      R"([Conditional(If@2, head="# c2", [[Bare(Assign@3)], )"
      R"([Conditional(If@4, head="# c4", else="# c6", )"
      R"([[Bare(Assign@5)], [Bare(Assign@7)]])]])]])])");
}

TEST_F(MergeCommentsTest, CommentAfterElseStatementTrailsStatement) {
  MergeAndCheck("if a:\n    x = 1\nelse: pass  # c\n",
                R"([Conditional(If@0, [[Bare(Assign@1)], )"
                R"([Trailing(Pass@2, "# c")]])])");
}

TEST_F(MergeCommentsTest, SameColumnCommentStaysInBody) {
  constexpr absl::string_view kProgram = R"(def f():
    x = 1
    # inside
# outside
y = 2
)";
  MergeAndCheck(kProgram,
                R"([Bare(Function@0, [[Bare(Assign@1), )"
                R"(Comment("# inside")]]), )"
                R"(Comment("# outside"), Bare(Assign@4)])");
}

TEST_F(MergeCommentsTest, CommentOnNextSiblingLineTrailsSibling) {
  MergeAndCheck("if a:\n    x = 1\ny = 2  # c\n",
                R"([Conditional(If@0, [[Bare(Assign@1)], []]), )"
                R"(Trailing(Assign@2, "# c")])");
}

TEST_F(MergeCommentsTest, CommentsBeforeElseBelongToBody) {
  constexpr absl::string_view kProgram = R"(if a:
    x = 1
# before else
else:
    # first
    x = 2
)";
  MergeAndCheck(kProgram,
                R"([Conditional(If@0, [[Bare(Assign@1), )"
                R"(Comment("# before else")], )"
                R"([Comment("# first"), Bare(Assign@5)]])])");
}

TEST_F(MergeCommentsTest, DedentedCommentAfterElifGoesToEnclosingBlock) {
  constexpr absl::string_view kProgram = R"(if a:
    x = 1
elif b:
    x = 2
# done
y = 3
)";
  MergeAndCheck(kProgram,
                R"([Conditional(If@0, [[Bare(Assign@1)], )"
                R"([Conditional(If@2, [[Bare(Assign@3)], []])]]), )"
                R"(Comment("# done"), Bare(Assign@5)])");
}

TEST_F(MergeCommentsTest, DedentedCommentAfterNestedBody) {
  constexpr absl::string_view kProgram = R"(def f():
    for i in x:
        g(i)
    # after loop
    return
)";
  MergeAndCheck(kProgram,
                R"([Bare(Function@0, [[Conditional(For@1, )"
                R"([[Bare(ExprStmt@2)], []]), Comment("# after loop"), )"
                R"(Bare(Return@4)]])])");
}

TEST_F(MergeCommentsTest, DefinitionHeaderComments) {
  constexpr absl::string_view kProgram = R"(@dec  # on decorator
def f():
    pass
class C:  # head
    # doc
    x = 1
)";
  MergeAndCheck(kProgram,
                R"([Trailing(Function@0, "# on decorator", [[Bare(Pass@2)]]), )"
                R"(Trailing(ClassDef@3, "# head", )"
                R"([[Comment("# doc"), Bare(Assign@5)]])])");
}

TEST_F(MergeCommentsTest, DecoratedDefinitionKeywordLineComments) {
  constexpr absl::string_view kProgram = R"(@dec
def f():  # on def
    pass
@a
@b  # on b
class C:  # on class
    x = 1
)";
  MergeAndCheck(kProgram,
                R"([Trailing(Function@0, "# on def", header_line=1, )"
                R"([[Bare(Pass@2)]]), )"
                R"(Trailing(ClassDef@3, "# on b", header_line=1, )"
                R"([[Comment("# on class"), Bare(Assign@6)]])])");
}

TEST_F(MergeCommentsTest, LoopHeaderComments) {
  constexpr absl::string_view kProgram = R"(for i in x:  # loop
    pass
else:  # no break
    pass
while y:
    pass
)";
  MergeAndCheck(kProgram,
                R"([Conditional(For@0, head="# loop", else="# no break", )"
                R"([[Bare(Pass@1)], [Bare(Pass@3)]]), )"
                R"(Conditional(While@4, [[Bare(Pass@5)], []])])");
}

TEST_F(MergeCommentsTest, TryHeaderComments) {
  constexpr absl::string_view kProgram = R"(try:  # t
    f()
except ValueError:  # v
    pass
except:
    pass
else:  # e
    pass
finally:  # f
    pass
)";
  MergeAndCheck(
      kProgram,
      R"([Conditional(Try@0, head="# t", handlers=["# v", none], )"
      R"(else="# e", finally="# f", [[Bare(ExprStmt@1)], [Bare(Pass@3)], )"
      R"([Bare(Pass@5)], [Bare(Pass@7)], [Bare(Pass@9)]])])");
}

TEST_F(MergeCommentsTest, FinallyWithStatementOnHeaderLine) {
  MergeAndCheck("try:\n    f()\nfinally: g()  # c\n",
                R"([Conditional(Try@0, [[Bare(ExprStmt@1)], [], )"
                R"([Trailing(ExprStmt@2, "# c")]])])");
}

TEST_F(MergeCommentsTest, CommentsInsideMultilineStatement) {
  constexpr absl::string_view kProgram = R"(x = [
    1,  # one
    2,
]
y = 2
)";
  MergeAndCheck(kProgram,
                R"([Bare(Assign@0), Comment("# one"), Bare(Assign@4)])");
}

TEST_F(MergeCommentsTest, RejectsUnorderedComments) {
  CORAL_ASSERT_OK_AND_ASSIGN(ParsedModule parsed,
                             ParseModule("x = 1\ny = 2\n", "test.py"));
  std::vector<CommentData> comments = {
      CommentData{Span(Pos("test.py", 1, 6), Pos("test.py", 1, 9)), "# b"},
      CommentData{Span(Pos("test.py", 0, 6), Pos("test.py", 0, 9)), "# a"},
  };
  EXPECT_THAT(MergeComments(*parsed.module, comments, parsed.source_lines),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("ordered by position")));
}

}  // namespace
}  // namespace coral
