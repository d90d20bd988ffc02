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

#include "coral/frontend/parser.h"

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "coral/common/status/matchers.h"
#include "coral/frontend/ast.h"
#include "coral/frontend/scanner.h"

namespace coral {

using status_testing::StatusIs;
using testing::HasSubstr;

static const char kFilename[] = "test.py";

class ParserTest : public ::testing::Test {
 public:
  // Parses `program` and checks the dump of the resulting module.
  void ParseAndCheck(std::string program, absl::string_view want) {
    CORAL_ASSERT_OK_AND_ASSIGN(ParsedModule parsed,
                               ParseModule(program, kFilename));
    EXPECT_EQ(parsed.module->ToString(), want);
  }

  absl::StatusOr<Expr*> ParseExpr(std::string expr_text) {
    scanner_.emplace(kFilename, std::move(expr_text));
    parser_.emplace("test", &*scanner_);
    return parser_->ParseExpression();
  }

  void ParseExprAndCheck(std::string expr_text, absl::string_view want) {
    CORAL_ASSERT_OK_AND_ASSIGN(Expr * e, ParseExpr(std::move(expr_text)));
    EXPECT_EQ(e->ToString(), want);
  }

  std::optional<Scanner> scanner_;
  std::optional<Parser> parser_;
};

TEST_F(ParserTest, EmptyModule) {
  ParseAndCheck("", "Module([])");
  ParseAndCheck("\n\n", "Module([])");
}

TEST_F(ParserTest, SimpleAssignment) {
  ParseAndCheck("x = 1\n", "Module([Assign([Name(\"x\")], Int(1))])");
}

TEST_F(ParserTest, ChainedAssignment) {
  ParseAndCheck("a = b = c\n",
                "Module([Assign([Name(\"a\"), Name(\"b\")], Name(\"c\"))])");
}

TEST_F(ParserTest, TupleAssignmentWithoutParens) {
  ParseAndCheck("a, b = b, a\n",
                "Module([Assign([Tuple([Name(\"a\"), Name(\"b\")])], "
                "Tuple([Name(\"b\"), Name(\"a\")]))])");
}

TEST_F(ParserTest, AugmentedAndAnnotatedAssignment) {
  ParseAndCheck("x += 1\ny: int = 2\nz: str\n",
                "Module([AugAssign(Name(\"x\"), Add, Int(1)), "
                "AnnAssign(Name(\"y\"), Name(\"int\"), Int(2)), "
                "AnnAssign(Name(\"z\"), Name(\"str\"), None)])");
}

TEST_F(ParserTest, SemicolonSeparatedStatements) {
  ParseAndCheck("pass; break; continue;\n",
                "Module([Pass(), Break(), Continue()])");
}

TEST_F(ParserTest, ArithmeticPrecedence) {
  ParseExprAndCheck("1 + 2 * 3",
                    "BinOp(Int(1), Add, BinOp(Int(2), Mult, Int(3)))");
  ParseExprAndCheck("(1 + 2) * 3",
                    "BinOp(BinOp(Int(1), Add, Int(2)), Mult, Int(3))");
  ParseExprAndCheck("a - b - c",
                    "BinOp(BinOp(Name(\"a\"), Sub, Name(\"b\")), Sub, "
                    "Name(\"c\"))");
}

TEST_F(ParserTest, PowerBindsTighterThanUnaryOnItsLeft) {
  ParseExprAndCheck("-x ** 2",
                    "UnaryOp(USub, BinOp(Name(\"x\"), Pow, Int(2)))");
  ParseExprAndCheck("2 ** -1", "BinOp(Int(2), Pow, UnaryOp(USub, Int(1)))");
  ParseExprAndCheck("a ** b ** c",
                    "BinOp(Name(\"a\"), Pow, BinOp(Name(\"b\"), Pow, "
                    "Name(\"c\")))");
}

TEST_F(ParserTest, BitwiseLevels) {
  ParseExprAndCheck("a | b ^ c & d << 1",
                    "BinOp(Name(\"a\"), BitOr, BinOp(Name(\"b\"), BitXor, "
                    "BinOp(Name(\"c\"), BitAnd, BinOp(Name(\"d\"), LShift, "
                    "Int(1)))))");
}

TEST_F(ParserTest, ComparisonChain) {
  ParseExprAndCheck(
      "a < b <= c",
      "Compare(Name(\"a\"), [Lt, LtE], [Name(\"b\"), Name(\"c\")])");
  ParseExprAndCheck(
      "a not in b is not c",
      "Compare(Name(\"a\"), [NotIn, IsNot], [Name(\"b\"), Name(\"c\")])");
}

TEST_F(ParserTest, BoolOpsAreFlattened) {
  ParseExprAndCheck("a and b and c or d",
                    "BoolOp(Or, [BoolOp(And, [Name(\"a\"), Name(\"b\"), "
                    "Name(\"c\")]), Name(\"d\")])");
  ParseExprAndCheck("not a and b",
                    "BoolOp(And, [UnaryOp(Not, Name(\"a\")), Name(\"b\")])");
}

TEST_F(ParserTest, Ternary) {
  ParseExprAndCheck("x if c else y",
                    "IfExp(test=Name(\"c\"), body=Name(\"x\"), "
                    "orelse=Name(\"y\"))");
}

TEST_F(ParserTest, CallArguments) {
  ParseExprAndCheck("f(a, *b, k=1, **kw)",
                    "Call(Name(\"f\"), [Name(\"a\"), Starred(Name(\"b\"))], "
                    "[keyword(\"k\", Int(1)), keyword(None, Name(\"kw\"))])");
  ParseExprAndCheck("f()", "Call(Name(\"f\"), [], [])");
  ParseExprAndCheck("f(a,)", "Call(Name(\"f\"), [Name(\"a\")], [])");
}

TEST_F(ParserTest, SoleGeneratorArgument) {
  ParseExprAndCheck("f(x for x in y)",
                    "Call(Name(\"f\"), [GeneratorExp(Name(\"x\"), "
                    "[comprehension(target=Name(\"x\"), iter=Name(\"y\"), "
                    "ifs=[])])], [])");
}

TEST_F(ParserTest, AttributesAndSubscripts) {
  ParseExprAndCheck("a.b[1:2, ::3]",
                    "Subscript(Attribute(Name(\"a\"), \"b\"), "
                    "Tuple([Slice(Int(1), Int(2), None), "
                    "Slice(None, None, Int(3))]))");
  ParseExprAndCheck("x[:]", "Subscript(Name(\"x\"), Slice(None, None, None))");
}

TEST_F(ParserTest, Displays) {
  ParseExprAndCheck("[1, 2,]", "List([Int(1), Int(2)])");
  ParseExprAndCheck("()", "Tuple([])");
  ParseExprAndCheck("(1,)", "Tuple([Int(1)])");
  ParseExprAndCheck("{1, 2}", "Set([Int(1), Int(2)])");
  ParseExprAndCheck("{}", "Dict(keys=[], values=[])");
  ParseExprAndCheck("{**a, 'k': 1}",
                    "Dict(keys=[None, Str(\"k\")], values=[Name(\"a\"), "
                    "Int(1)])");
}

TEST_F(ParserTest, Comprehensions) {
  ParseExprAndCheck("[x for x in y if x]",
                    "ListComp(Name(\"x\"), [comprehension(target=Name(\"x\"), "
                    "iter=Name(\"y\"), ifs=[Name(\"x\")])])");
  ParseExprAndCheck("{k: v for k, v in items}",
                    "DictComp(Name(\"k\"), Name(\"v\"), "
                    "[comprehension(target=Tuple([Name(\"k\"), Name(\"v\")]), "
                    "iter=Name(\"items\"), ifs=[])])");
  ParseExprAndCheck("{x for x in y}",
                    "SetComp(Name(\"x\"), [comprehension(target=Name(\"x\"), "
                    "iter=Name(\"y\"), ifs=[])])");
}

TEST_F(ParserTest, Constants) {
  ParseExprAndCheck("[..., None, True, False]",
                    "List([Constant(Ellipsis), Constant(None), "
                    "Constant(True), Constant(False)])");
}

TEST_F(ParserTest, Numbers) {
  ParseExprAndCheck("0x1F", "Int(31)");
  ParseExprAndCheck("1_000", "Int(1000)");
  ParseExprAndCheck("1.5", "Float(1.5)");
  ParseExprAndCheck("2j", "Imaginary(2)");
}

TEST_F(ParserTest, AdjacentStringsConcatenate) {
  ParseExprAndCheck("\"a\" 'b'", "Str(\"ab\")");
  ParseExprAndCheck("b'\\x00' b\"z\"", "Bytes(b\"\\x00z\")");
}

TEST_F(ParserTest, RawStringKeepsBody) {
  CORAL_ASSERT_OK_AND_ASSIGN(Expr * e, ParseExpr("r'\\d+'"));
  auto* s = dynamic_cast<String*>(e);
  ASSERT_NE(s, nullptr);
  EXPECT_EQ(s->value(), "\\d+");
  EXPECT_EQ(s->raw_body(), "\\d+");
}

TEST_F(ParserTest, FormattedString) {
  ParseExprAndCheck(
      "f\"x{a!r:>{w}}\"",
      "JoinedStr([Str(\"x\"), FormattedValue(Name(\"a\"), conversion=r, "
      "format_spec=JoinedStr([Str(\">\"), FormattedValue(Name(\"w\"), "
      "conversion=None, format_spec=None)]))])");
  ParseExprAndCheck("f'{{}}'", "JoinedStr([Str(\"{}\")])");
}

TEST_F(ParserTest, FormattedStringFieldExpression) {
  ParseExprAndCheck("f'{a + b}'",
                    "JoinedStr([FormattedValue(BinOp(Name(\"a\"), Add, "
                    "Name(\"b\")), conversion=None, format_spec=None)])");
}

TEST_F(ParserTest, Lambda) {
  ParseExprAndCheck(
      "lambda x, y=1: x",
      "Lambda(arguments(args=[arg(\"x\", None), arg(\"y\", None)], "
      "vararg=None, kwonlyargs=[], kw_defaults=[], kwarg=None, "
      "defaults=[Int(1)]), Name(\"x\"))");
  ParseExprAndCheck(
      "lambda: 0",
      "Lambda(arguments(args=[], vararg=None, kwonlyargs=[], kw_defaults=[], "
      "kwarg=None, defaults=[]), Int(0))");
}

TEST_F(ParserTest, IfElifElse) {
  ParseAndCheck(R"(if a:
    pass
elif b:
    pass
else:
    x = 1
)",
                "Module([If(Name(\"a\"), [Pass()], [If(Name(\"b\"), [Pass()], "
                "[Assign([Name(\"x\")], Int(1))])])])");
}

TEST_F(ParserTest, ElsePositionsAreRecorded) {
  CORAL_ASSERT_OK_AND_ASSIGN(ParsedModule parsed, ParseModule(R"(if a:
    pass
else:
    pass
)",
                                                              kFilename));
  ASSERT_EQ(parsed.module->body().size(), 1);
  auto* if_stmt = dynamic_cast<If*>(parsed.module->body()[0]);
  ASSERT_NE(if_stmt, nullptr);
  ASSERT_TRUE(if_stmt->else_pos().has_value());
  EXPECT_EQ(if_stmt->else_pos()->lineno(), 2);
  EXPECT_EQ(if_stmt->else_pos()->colno(), 0);
}

TEST_F(ParserTest, DefinitionKeywordPositionsAreRecorded) {
  CORAL_ASSERT_OK_AND_ASSIGN(ParsedModule parsed, ParseModule(R"(@a
@b
def f():
    pass
class C:
    pass
)",
                                                              kFilename));
  ASSERT_EQ(parsed.module->body().size(), 2);
  auto* f = dynamic_cast<Function*>(parsed.module->body()[0]);
  ASSERT_NE(f, nullptr);
  EXPECT_EQ(f->lineno(), 0);
  EXPECT_EQ(f->keyword_pos().lineno(), 2);
  EXPECT_EQ(f->keyword_pos().colno(), 0);
  auto* c = dynamic_cast<ClassDef*>(parsed.module->body()[1]);
  ASSERT_NE(c, nullptr);
  EXPECT_EQ(c->keyword_pos().lineno(), 4);
}

TEST_F(ParserTest, SameLineSuite) {
  ParseAndCheck("while x: x -= 1\n",
                "Module([While(Name(\"x\"), [AugAssign(Name(\"x\"), Sub, "
                "Int(1))], [])])");
}

TEST_F(ParserTest, ForElse) {
  ParseAndCheck(R"(for i, j in pairs:
    continue
else:
    pass
)",
                "Module([For(Tuple([Name(\"i\"), Name(\"j\")]), "
                "Name(\"pairs\"), [Continue()], [Pass()])])");
}

TEST_F(ParserTest, TryExceptFinally) {
  ParseAndCheck(R"(try:
    pass
except ValueError as e:
    pass
except:
    raise
finally:
    pass
)",
                "Module([Try([Pass()], [ExceptHandler(Name(\"ValueError\"), "
                "\"e\", [Pass()]), ExceptHandler(None, None, "
                "[Raise(None, None)])], [], [Pass()])])");
}

TEST_F(ParserTest, With) {
  ParseAndCheck(R"(with open(p) as f, lock:
    pass
)",
                "Module([With([withitem(Call(Name(\"open\"), [Name(\"p\")], "
                "[]), Name(\"f\")), withitem(Name(\"lock\"), None)], "
                "[Pass()])])");
}

TEST_F(ParserTest, DecoratedFunction) {
  ParseAndCheck(R"(@dec
def f(a: int, *args, b=2, **kw) -> str:
    return a
)",
                "Module([FunctionDef(\"f\", arguments(args=[arg(\"a\", "
                "Name(\"int\"))], vararg=arg(\"args\", None), "
                "kwonlyargs=[arg(\"b\", None)], kw_defaults=[Int(2)], "
                "kwarg=arg(\"kw\", None), defaults=[]), "
                "[Return(Name(\"a\"))], decorators=[Name(\"dec\")], "
                "returns=Name(\"str\"))])");
}

TEST_F(ParserTest, ClassDef) {
  ParseAndCheck(R"(class C(Base, metaclass=M):
    x = 1
)",
                "Module([ClassDef(\"C\", bases=[Name(\"Base\")], "
                "keywords=[keyword(\"metaclass\", Name(\"M\"))], "
                "[Assign([Name(\"x\")], Int(1))], decorators=[])])");
}

TEST_F(ParserTest, Imports) {
  ParseAndCheck("import os.path as p, sys\n",
                "Module([Import([alias(\"os.path\", \"p\"), "
                "alias(\"sys\", None)])])");
  ParseAndCheck("from ..pkg import (a as b, c,)\n",
                "Module([ImportFrom(\"pkg\", [alias(\"a\", \"b\"), "
                "alias(\"c\", None)], level=2)])");
  ParseAndCheck("from . import *\n",
                "Module([ImportFrom(\"\", [alias(\"*\", None)], level=1)])");
}

TEST_F(ParserTest, SimpleKeywordStatements) {
  ParseAndCheck("global a, b\ndel x[0], y\nassert x, \"msg\"\n",
                "Module([Global([\"a\", \"b\"]), "
                "Delete([Subscript(Name(\"x\"), Int(0)), Name(\"y\")]), "
                "Assert(Name(\"x\"), Str(\"msg\"))])");
  ParseAndCheck("raise E from e\n",
                "Module([Raise(Name(\"E\"), Name(\"e\"))])");
}

TEST_F(ParserTest, YieldForms) {
  ParseAndCheck(R"(def g():
    yield
    x = yield 1
    yield from y
)",
                "Module([FunctionDef(\"g\", arguments(args=[], vararg=None, "
                "kwonlyargs=[], kw_defaults=[], kwarg=None, defaults=[]), "
                "[Expr(Yield(None)), Assign([Name(\"x\")], Yield(Int(1))), "
                "Expr(YieldFrom(Name(\"y\")))], decorators=[], "
                "returns=None)])");
}

TEST_F(ParserTest, CommentsAreCollected) {
  CORAL_ASSERT_OK_AND_ASSIGN(
      ParsedModule parsed,
      ParseModule("# header\nx = 1  # trailing\n", kFilename));
  ASSERT_EQ(parsed.comments.size(), 2);
  EXPECT_EQ(parsed.comments[0].text, "# header");
  EXPECT_EQ(parsed.comments[0].span.start().lineno(), 0);
  EXPECT_EQ(parsed.comments[1].text, "# trailing");
  EXPECT_EQ(parsed.comments[1].span.start().lineno(), 1);
  EXPECT_EQ(parsed.comments[1].span.start().colno(), 7);
  EXPECT_EQ(parsed.module->ToString(),
            "Module([Assign([Name(\"x\")], Int(1))])");
}

TEST_F(ParserTest, AssignmentExpressionIsAnError) {
  EXPECT_THAT(ParseModule("(y := 1)\n", kFilename),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Assignment expressions (':=') are not "
                                 "supported.")));
}

TEST_F(ParserTest, PositionalOnlyParametersAreAnError) {
  EXPECT_THAT(ParseModule("def f(a, /):\n    pass\n", kFilename),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Positional-only parameters are not "
                                 "supported.")));
}

TEST_F(ParserTest, NonDefaultAfterDefaultIsAnError) {
  EXPECT_THAT(ParseModule("def f(a=1, b):\n    pass\n", kFilename),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Non-default argument follows default "
                                 "argument.")));
}

TEST_F(ParserTest, UnexpectedIndentIsAnError) {
  EXPECT_THAT(ParseModule("x = 1\n    y = 2\n", kFilename),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Unexpected indentation.")));
}

TEST_F(ParserTest, UnparenthesizedGeneratorIsAnError) {
  EXPECT_THAT(ParseModule("f(x for x in y, 1)\n", kFilename),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("must be parenthesized")));
}

TEST_F(ParserTest, MixedBytesAndStrIsAnError) {
  EXPECT_THAT(ParseModule("x = b'a' 'b'\n", kFilename),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Cannot mix bytes and nonbytes literals.")));
}

TEST_F(ParserTest, TryWithoutHandlersIsAnError) {
  EXPECT_THAT(ParseModule("try:\n    pass\nx = 1\n", kFilename),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Expected 'except' or 'finally' block")));
}

TEST_F(ParserTest, MissingExpressionIsAnError) {
  EXPECT_THAT(ParseModule("x = )\n", kFilename),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Expected start of an expression")));
}

TEST_F(ParserTest, ErrorMessageCarriesSpan) {
  EXPECT_THAT(ParseModule("x = )\n", kFilename),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("ParseError: test.py:1:5")));
}

}  // namespace coral
