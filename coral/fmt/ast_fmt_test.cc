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

#include "coral/fmt/ast_fmt.h"

#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/strings/string_view.h"
#include "coral/common/status/matchers.h"
#include "coral/fmt/annotated.h"
#include "coral/fmt/comments.h"
#include "coral/frontend/ast.h"
#include "coral/frontend/parser.h"

namespace coral {
namespace {

class AstFmtTest : public ::testing::Test {
 public:
  // Parses `program`, attaches its comments and checks the formatted text.
  void FormatAndCheck(absl::string_view program, absl::string_view want) {
    CORAL_ASSERT_OK_AND_ASSIGN(ParsedModule parsed,
                               ParseModule(program, "test.py"));
    CORAL_ASSERT_OK_AND_ASSIGN(
        Block block, MergeComments(*parsed.module, parsed.comments,
                                   parsed.source_lines));
    EXPECT_EQ(FormatBlock(block), want);
  }

  // Formats `program` and checks that it is unchanged.
  void FormatAndCheckStable(absl::string_view program) {
    FormatAndCheck(program, program);
  }

  // Parses the expression statement `text` and checks FormatExpr() of it.
  void FormatExprAndCheck(absl::string_view text, absl::string_view want) {
    CORAL_ASSERT_OK_AND_ASSIGN(
        ParsedModule parsed, ParseModule(std::string(text) + "\n", "test.py"));
    ASSERT_EQ(parsed.module->body().size(), 1);
    const Stmt* stmt = parsed.module->body()[0];
    ASSERT_EQ(stmt->kind(), AstNodeKind::kExprStmt);
    EXPECT_EQ(FormatExpr(static_cast<const ExprStmt*>(stmt)->expr()), want);
  }
};

TEST(FormatCommentTest, Normalizes) {
  EXPECT_EQ(FormatComment("#a bad comment"), "# a bad comment");
  EXPECT_EQ(FormatComment("#   spaced  "), "# spaced");
  EXPECT_EQ(FormatComment("# already"), "# already");
  EXPECT_EQ(FormatComment("#"), "#");
  EXPECT_EQ(FormatComment("#   "), "#");
  EXPECT_EQ(FormatComment("##x"), "# #x");
}

TEST_F(AstFmtTest, EmptyModule) { FormatAndCheck("", ""); }

TEST_F(AstFmtTest, Precedence) {
  FormatExprAndCheck("(a + b) * c", "(a + b) * c");
  FormatExprAndCheck("a + (b * c)", "a + b * c");
  FormatExprAndCheck("a - (b - c)", "a - (b - c)");
  FormatExprAndCheck("(a - b) - c", "a - b - c");
  FormatExprAndCheck("a | b & c ^ d", "a | b & c ^ d");
  FormatExprAndCheck("(a | b) << 2", "(a | b) << 2");
  FormatExprAndCheck("2 ** -1", "2 ** -1");
  FormatExprAndCheck("(-2) ** 2", "(-2) ** 2");
  FormatExprAndCheck("-2 ** 2", "-2 ** 2");
  FormatExprAndCheck("a ** (b ** c)", "a ** b ** c");
  FormatExprAndCheck("(a ** b) ** c", "(a ** b) ** c");
  FormatExprAndCheck("-(a + b)", "-(a + b)");
  FormatExprAndCheck("~x", "~x");
}

TEST_F(AstFmtTest, BooleanAndComparisonPrecedence) {
  FormatExprAndCheck("not (a and b)", "not (a and b)");
  FormatExprAndCheck("(not a) and b", "not a and b");
  FormatExprAndCheck("a or (b or c)", "a or (b or c)");
  FormatExprAndCheck("a or b and c", "a or b and c");
  FormatExprAndCheck("(a or b) and c", "(a or b) and c");
  FormatExprAndCheck("a < b < c", "a < b < c");
  FormatExprAndCheck("(a < b) < c", "(a < b) < c");
  FormatExprAndCheck("a not in b is not c", "a not in b is not c");
  FormatExprAndCheck("(a + 1) == b", "a + 1 == b");
}

TEST_F(AstFmtTest, ConditionalAndLambda) {
  FormatExprAndCheck("a if b else c if d else e", "a if b else c if d else e");
  FormatExprAndCheck("(a if b else c) if d else e",
                     "(a if b else c) if d else e");
  FormatExprAndCheck("lambda: 0", "lambda: 0");
  FormatExprAndCheck("lambda x, *args, y=1, **kw: x",
                     "lambda x, *args, y=1, **kw: x");
  FormatExprAndCheck("(lambda: 0)()", "(lambda: 0)()");
  FormatExprAndCheck("f(lambda x: x + 1)", "f(lambda x: x + 1)");
}

TEST_F(AstFmtTest, Tuples) {
  FormatAndCheck("(  1, )\n", "(1,)\n");
  FormatAndCheck("(1)\n", "1\n");
  FormatAndCheck("()\n", "()\n");
  FormatAndCheck("x = 1, 2\n", "x = (1, 2)\n");
  FormatAndCheck("a, b = b, a\n", "(a, b) = (b, a)\n");
  FormatAndCheck("for i, j in pairs:\n    pass\n",
                 "for (i, j) in pairs:\n    pass\n");
}

TEST_F(AstFmtTest, Subscripts) {
  FormatExprAndCheck("a[1, 2]", "a[1, 2]");
  FormatExprAndCheck("a[1:2, 3]", "a[1:2, 3]");
  FormatExprAndCheck("a[(1, 2)]", "a[1, 2]");
  FormatExprAndCheck("a[1,]", "a[1,]");
  FormatExprAndCheck("a[::2]", "a[::2]");
  FormatExprAndCheck("a[:]", "a[:]");
  FormatExprAndCheck("a[x:y]", "a[x:y]");
  FormatExprAndCheck("(a + b)[0]", "(a + b)[0]");
}

TEST_F(AstFmtTest, Constants) {
  FormatAndCheckStable("x = [..., None, True, False]\ny[..., 0]\n");
}

TEST_F(AstFmtTest, Numbers) {
  FormatAndCheck("42E+84\n", "4.2e+85\n");
  FormatAndCheck("1.50\n", "1.5\n");
  FormatAndCheck("1e16\n", "1e+16\n");
  FormatAndCheck("0.00001\n", "1e-05\n");
  FormatAndCheck("0xff\n", "255\n");
  FormatAndCheck("1_000_000\n", "1000000\n");
  FormatAndCheck("0o17\n", "15\n");
  FormatAndCheck("0b101\n", "5\n");
  FormatAndCheck("2J\n", "2j\n");
  FormatAndCheck("1.5j\n", "1.5j\n");
  FormatAndCheck("1 .real\n", "(1).real\n");
  FormatAndCheck("1.5.real\n", "1.5.real\n");
}

TEST_F(AstFmtTest, Strings) {
  FormatAndCheck("'single quotes'\n", "\"single quotes\"\n");
  FormatAndCheck("x = 'it\\'s'\n", "x = \"it's\"\n");
  FormatAndCheck("x = 'say \"hi\"'\n", "x = \"say \\\"hi\\\"\"\n");
  FormatAndCheck("x = 'a\\tb\\n'\n", "x = \"a\\tb\\n\"\n");
  FormatAndCheck("x = \"a\" 'b'\n", "x = \"ab\"\n");
  FormatAndCheck("x = '''two\nlines'''\n", "x = \"two\\nlines\"\n");
  FormatAndCheck("x = b'\\x00\\xff'\n", "x = b\"\\x00\\xff\"\n");
  FormatAndCheck("x = '\\x85\\u00a0'\n", "x = \"\\x85\\xa0\"\n");
}

TEST_F(AstFmtTest, RawStrings) {
  FormatAndCheck("x = r'\\d+'\n", "x = r\"\\d+\"\n");
  FormatAndCheck("x = r'say \"hi\"'\n", "x = r'say \"hi\"'\n");
  FormatAndCheck("x = rb'\\x'\n", "x = rb\"\\x\"\n");
  // Concatenation loses the verbatim spelling.
  FormatAndCheck("x = r'\\d' 'e'\n", "x = \"\\\\de\"\n");
}

TEST_F(AstFmtTest, FormattedStrings) {
  FormatAndCheck("f'{x}'\n", "f\"{x}\"\n");
  FormatAndCheck("f'{x!r:>{width}} {{lit}}'\n",
                 "f\"{x!r:>{width}} {{lit}}\"\n");
  FormatAndCheck("f\"{d['k']}\"\n", "f\"{d['k']}\"\n");
  FormatAndCheck("f'{ {1: 2}[1]}'\n", "f\"{ {1: 2}[1]}\"\n");
  FormatAndCheck("f'{a + b:08.3f}'\n", "f\"{a + b:08.3f}\"\n");
  FormatAndCheck("f'{(lambda: 1)()}'\n", "f\"{(lambda: 1)()}\"\n");
  FormatAndCheck("'a' f'{b}' 'c'\n", "f\"a{b}c\"\n");
}

TEST_F(AstFmtTest, Collections) {
  FormatExprAndCheck("[1,2,  3]", "[1, 2, 3]");
  FormatExprAndCheck("[]", "[]");
  FormatExprAndCheck("{1, *a}", "{1, *a}");
  FormatExprAndCheck("{'a': 1, **b}", "{\"a\": 1, **b}");
  FormatExprAndCheck("{}", "{}");
  FormatExprAndCheck("[*a, *b]", "[*a, *b]");
}

TEST_F(AstFmtTest, Comprehensions) {
  FormatExprAndCheck("[x for x in range(10) if x % 2 if x > 3]",
                     "[x for x in range(10) if x % 2 if x > 3]");
  FormatExprAndCheck("{k: v for k, v in items}",
                     "{k: v for (k, v) in items}");
  FormatExprAndCheck("{x for row in m for x in row}",
                     "{x for row in m for x in row}");
  FormatExprAndCheck("(x for x in (a if b else c))",
                     "(x for x in (a if b else c))");
}

TEST_F(AstFmtTest, Calls) {
  FormatExprAndCheck("f(a, *b, c=1, **d)", "f(a, *b, c=1, **d)");
  FormatExprAndCheck("f((x for x in y))", "f(x for x in y)");
  FormatExprAndCheck("f((x for x in y), 1)", "f((x for x in y), 1)");
  FormatExprAndCheck("a.b(c).d", "a.b(c).d");
  FormatExprAndCheck("f(*(a or b))", "f(*(a or b))");
}

TEST_F(AstFmtTest, Yield) {
  FormatAndCheckStable("def g():\n    x = yield y\n    yield\n"
                       "    yield from z\n    f((yield))\n");
}

TEST_F(AstFmtTest, Await) {
  FormatAndCheckStable(
      "x = await y\n"
      "await g(1)\n"
      "z = await a ** 2\n"
      "w = (await a).b + await (await c)\n");
  FormatExprAndCheck("(await x) ** 2", "await x ** 2");
  FormatExprAndCheck("-(await x)", "-await x");
  FormatExprAndCheck("(await x)[0]", "(await x)[0]");
}

TEST_F(AstFmtTest, SimpleStatements) {
  FormatAndCheckStable(
      "import os.path as p, sys\n"
      "from ..pkg import a as b, c\n"
      "from . import d\n"
      "from m import *\n"
      "global g, h\n"
      "del a[0], b\n"
      "x += 1\n"
      "y: int = 2\n"
      "z: str\n"
      "a = b = 3\n"
      "assert x, \"message\"\n"
      "raise E() from e\n"
      "raise\n"
      "pass\n");
  FormatAndCheck("from m import (a,\n    b)\n", "from m import a, b\n");
  FormatAndCheck("x = 1; y = 2\n", "x = 1\ny = 2\n");
}

TEST_F(AstFmtTest, Definitions) {
  FormatAndCheckStable(
      "@decorator\n"
      "@other(1)\n"
      "def f(a, b: int = 1, *args, c, d=2, **kwargs) -> None:\n"
      "    return a\n"
      "def g(*, key):\n"
      "    nonlocal x\n"
      "class C(Base, metaclass=Meta):\n"
      "    x = 1\n"
      "class D:\n"
      "    pass\n");
  FormatAndCheck("def f( a ,b ) :\n  return\n", "def f(a, b):\n    return\n");
}

TEST_F(AstFmtTest, CompoundStatements) {
  FormatAndCheckStable(
      "while x:\n"
      "    break\n"
      "else:\n"
      "    continue\n"
      "for i in range(3):\n"
      "    pass\n"
      "with open(p) as f, lock:\n"
      "    pass\n"
      "try:\n"
      "    f()\n"
      "except (A, B) as e:\n"
      "    pass\n"
      "except C:\n"
      "    pass\n"
      "except:\n"
      "    pass\n"
      "else:\n"
      "    g()\n"
      "finally:\n"
      "    h()\n");
  FormatAndCheck("if x: y = 1\n", "if x:\n    y = 1\n");
}

TEST_F(AstFmtTest, Indentation) {
  FormatAndCheck("if a:\n  if b:\n        x = 1\n  y = 2\n",
                 "if a:\n    if b:\n        x = 1\n    y = 2\n");
}

TEST_F(AstFmtTest, ElifChain) {
  FormatAndCheckStable(
      "if a:\n"
      "    x = 1\n"
      "elif b:\n"
      "    x = 2\n"
      "else:\n"
      "    x = 3\n");
  // A lone if in an else arm is the same tree as an elif.
  FormatAndCheck("if a:\n    pass\nelse:\n    if b:\n        pass\n",
                 "if a:\n    pass\nelif b:\n    pass\n");
}

TEST_F(AstFmtTest, ElseArmWithCommentsIsNotAnElif) {
  FormatAndCheckStable(
      "if a:\n"
      "    pass\n"
      "else:  # other\n"
      "    if b:\n"
      "        pass\n");
  FormatAndCheckStable(
      "if a:\n"
      "    pass\n"
      "else:\n"
      "    # other\n"
      "    if b:\n"
      "        pass\n");
}

TEST_F(AstFmtTest, Comments) {
  FormatAndCheck("#a bad comment\n", "# a bad comment\n");
  FormatAndCheck("x = 1 #c\n", "x = 1  # c\n");
  FormatAndCheck("#\n", "#\n");
  FormatAndCheck("def f():\n  # leading\n  pass  #  trailing  \n",
                 "def f():\n    # leading\n    pass  # trailing\n");
}

TEST_F(AstFmtTest, BranchComments) {
  constexpr absl::string_view kProgram = R"(if True:  # c2
    x = 1  # c4
else: # c6
    x = 4  # c8
)";
  FormatAndCheck(kProgram, R"(if True:  # c2
    x = 1  # c4
else:  # c6
    x = 4  # c8
)");
}

TEST_F(AstFmtTest, ClauseHeaderComments) {
  FormatAndCheckStable(
      "try:  # t\n"
      "    f()\n"
      "except E:  # e\n"
      "    pass\n"
      "finally:  # f\n"
      "    pass\n"
      "for x in y:  # loop\n"
      "    pass\n"
      "else:  # done\n"
      "    pass\n"
      "@dec  # decorated\n"
      "def f():\n"
      "    pass\n");
}

TEST_F(AstFmtTest, DecoratedDefinitionKeywordLineComments) {
  FormatAndCheckStable(
      "@dec\n"
      "def f():  # on def\n"
      "    pass\n"
      "@a\n"
      "@b(1)  # on second decorator\n"
      "class C:\n"
      "    x = 1\n");
  FormatAndCheck("@dec\nclass C :   # c\n  pass\n",
                 "@dec\nclass C:  # c\n    pass\n");
}

}  // namespace
}  // namespace coral
