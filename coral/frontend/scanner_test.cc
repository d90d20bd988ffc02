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

#include "coral/frontend/scanner.h"

#include <string>
#include <utility>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "coral/common/status/matchers.h"

namespace coral {
namespace {

using status_testing::StatusIs;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

static absl::StatusOr<std::vector<Token>> ToTokens(std::string text) {
  Scanner s("fake_file.py", std::move(text));
  return s.PopAll();
}

static std::vector<TokenKind> Kinds(const std::vector<Token>& tokens) {
  std::vector<TokenKind> kinds;
  for (const Token& tok : tokens) {
    kinds.push_back(tok.kind());
  }
  return kinds;
}

static void ExpectToken(const Token& tok, TokenKind kind,
                        absl::string_view value) {
  EXPECT_EQ(tok.kind(), kind) << tok.span();
  EXPECT_EQ(tok.GetValue(), std::string(value)) << tok.span();
}

TEST(ScannerTest, SimpleTokens) {
  CORAL_ASSERT_OK_AND_ASSIGN(std::vector<Token> tokens,
                             ToTokens("+ - ** << >>= -> := ..."));
  EXPECT_THAT(Kinds(tokens),
              ElementsAre(TokenKind::kPlus, TokenKind::kMinus,
                          TokenKind::kDoubleStar, TokenKind::kDoubleOAngle,
                          TokenKind::kDoubleCAngleEquals, TokenKind::kArrow,
                          TokenKind::kColonEquals, TokenKind::kEllipsis,
                          TokenKind::kNewline, TokenKind::kEof));
}

TEST(ScannerTest, KeywordsAndIdentifiers) {
  CORAL_ASSERT_OK_AND_ASSIGN(std::vector<Token> tokens,
                             ToTokens("if None iffy _x"));
  ASSERT_EQ(tokens.size(), 6);
  EXPECT_TRUE(tokens[0].IsKeyword(Keyword::kIf));
  EXPECT_TRUE(tokens[1].IsKeyword(Keyword::kNone));
  ExpectToken(tokens[2], TokenKind::kIdentifier, "iffy");
  ExpectToken(tokens[3], TokenKind::kIdentifier, "_x");
  EXPECT_EQ(tokens[0].ToErrorString(), "keyword:if");
}

TEST(ScannerTest, Numbers) {
  CORAL_ASSERT_OK_AND_ASSIGN(std::vector<Token> tokens,
                             ToTokens("0xf_00 1_000 1.5e-3 .5 3j 0"));
  ASSERT_EQ(tokens.size(), 8);
  ExpectToken(tokens[0], TokenKind::kNumber, "0xf_00");
  ExpectToken(tokens[1], TokenKind::kNumber, "1_000");
  ExpectToken(tokens[2], TokenKind::kNumber, "1.5e-3");
  ExpectToken(tokens[3], TokenKind::kNumber, ".5");
  ExpectToken(tokens[4], TokenKind::kNumber, "3j");
  ExpectToken(tokens[5], TokenKind::kNumber, "0");
}

TEST(ScannerTest, NumberErrors) {
  EXPECT_THAT(ToTokens("012"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Leading zeros")));
  EXPECT_THAT(ToTokens("1__0"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Invalid underscore")));
  EXPECT_THAT(ToTokens("0x"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Expected digits following 0x prefix.")));
}

TEST(ScannerTest, StringsKeepTheirSpelling) {
  CORAL_ASSERT_OK_AND_ASSIGN(
      std::vector<Token> tokens,
      ToTokens("'a\\'b' rb\"\\d\" f'{x}' '''multi\nline'''"));
  ASSERT_EQ(tokens.size(), 6);
  ExpectToken(tokens[0], TokenKind::kString, "'a\\'b'");
  ExpectToken(tokens[1], TokenKind::kString, "rb\"\\d\"");
  ExpectToken(tokens[2], TokenKind::kString, "f'{x}'");
  ExpectToken(tokens[3], TokenKind::kString, "'''multi\nline'''");
}

TEST(ScannerTest, UnterminatedString) {
  EXPECT_THAT(ToTokens("'abc\n'"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Unterminated string literal")));
  EXPECT_THAT(ToTokens("'''abc"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("without finding the closing quote")));
}

TEST(ScannerTest, IndentAndDedent) {
  CORAL_ASSERT_OK_AND_ASSIGN(std::vector<Token> tokens,
                             ToTokens("if x:\n    y\nz\n"));
  EXPECT_THAT(Kinds(tokens),
              ElementsAre(TokenKind::kKeyword, TokenKind::kIdentifier,
                          TokenKind::kColon, TokenKind::kNewline,
                          TokenKind::kIndent, TokenKind::kIdentifier,
                          TokenKind::kNewline, TokenKind::kDedent,
                          TokenKind::kIdentifier, TokenKind::kNewline,
                          TokenKind::kEof));
}

TEST(ScannerTest, DedentsAtEndOfInput) {
  CORAL_ASSERT_OK_AND_ASSIGN(std::vector<Token> tokens,
                             ToTokens("if x:\n  if y:\n    z"));
  EXPECT_THAT(Kinds(tokens),
              ElementsAre(TokenKind::kKeyword, TokenKind::kIdentifier,
                          TokenKind::kColon, TokenKind::kNewline,
                          TokenKind::kIndent, TokenKind::kKeyword,
                          TokenKind::kIdentifier, TokenKind::kColon,
                          TokenKind::kNewline, TokenKind::kIndent,
                          TokenKind::kIdentifier, TokenKind::kNewline,
                          TokenKind::kDedent, TokenKind::kDedent,
                          TokenKind::kEof));
}

TEST(ScannerTest, InconsistentDedent) {
  EXPECT_THAT(ToTokens("if x:\n    y\n  z\n"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Unindent does not match any outer "
                                 "indentation level.")));
}

TEST(ScannerTest, BracketsJoinLines) {
  CORAL_ASSERT_OK_AND_ASSIGN(std::vector<Token> tokens,
                             ToTokens("f(a,\n      b)\n"));
  EXPECT_THAT(Kinds(tokens),
              ElementsAre(TokenKind::kIdentifier, TokenKind::kOParen,
                          TokenKind::kIdentifier, TokenKind::kComma,
                          TokenKind::kIdentifier, TokenKind::kCParen,
                          TokenKind::kNewline, TokenKind::kEof));
}

TEST(ScannerTest, BackslashJoinsLines) {
  CORAL_ASSERT_OK_AND_ASSIGN(std::vector<Token> tokens,
                             ToTokens("x = 1 + \\\n    2\n"));
  EXPECT_THAT(Kinds(tokens),
              ElementsAre(TokenKind::kIdentifier, TokenKind::kEquals,
                          TokenKind::kNumber, TokenKind::kPlus,
                          TokenKind::kNumber, TokenKind::kNewline,
                          TokenKind::kEof));
}

TEST(ScannerTest, BlankAndCommentLinesProduceNoLayoutTokens) {
  Scanner s("fake_file.py", "# lead\n\nx  # trail\n    # indented\ny\n");
  CORAL_ASSERT_OK_AND_ASSIGN(std::vector<Token> tokens, s.PopAll());
  EXPECT_THAT(Kinds(tokens),
              ElementsAre(TokenKind::kIdentifier, TokenKind::kNewline,
                          TokenKind::kIdentifier, TokenKind::kNewline,
                          TokenKind::kEof));
  ASSERT_EQ(s.comments().size(), 3);
  EXPECT_EQ(s.comments()[0].text, "# lead");
  EXPECT_EQ(s.comments()[0].span.start(), Pos("fake_file.py", 0, 0));
  EXPECT_EQ(s.comments()[1].text, "# trail");
  EXPECT_EQ(s.comments()[1].span.start(), Pos("fake_file.py", 2, 3));
  EXPECT_EQ(s.comments()[2].text, "# indented");
  EXPECT_EQ(s.comments()[2].span.start(), Pos("fake_file.py", 3, 4));
}

TEST(ScannerTest, CarriageReturnIsNotPartOfComment) {
  Scanner s("fake_file.py", "x  # c\r\n");
  CORAL_ASSERT_OK(s.PopAll().status());
  ASSERT_EQ(s.comments().size(), 1);
  EXPECT_EQ(s.comments()[0].text, "# c");
}

TEST(ScannerTest, EofRepeats) {
  Scanner s("fake_file.py", "");
  CORAL_ASSERT_OK_AND_ASSIGN(Token first, s.Pop());
  EXPECT_EQ(first.kind(), TokenKind::kEof);
  EXPECT_TRUE(s.AtEof());
  CORAL_ASSERT_OK_AND_ASSIGN(Token second, s.Pop());
  EXPECT_EQ(second.kind(), TokenKind::kEof);
}

TEST(ScannerTest, ExpressionModeHasNoLayoutTokens) {
  Scanner s = Scanner::ForExpression(Pos("fake_file.py", 3, 10), "a +\n b");
  CORAL_ASSERT_OK_AND_ASSIGN(std::vector<Token> tokens, s.PopAll());
  EXPECT_THAT(Kinds(tokens),
              ElementsAre(TokenKind::kIdentifier, TokenKind::kPlus,
                          TokenKind::kIdentifier, TokenKind::kEof));
  EXPECT_EQ(tokens[0].span().start(), Pos("fake_file.py", 3, 10));
  EXPECT_EQ(tokens[2].span().start(), Pos("fake_file.py", 4, 1));
}

TEST(ScannerTest, UnrecognizedCharacter) {
  EXPECT_THAT(ToTokens("a ? b"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("ScanError: fake_file.py:1:3-1:4 "
                                 "Unrecognized character: '?'")));
}

}  // namespace
}  // namespace coral
