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

#include "coral/frontend/string_literal.h"

#include <string>
#include <variant>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "coral/common/status/matchers.h"

namespace coral {
namespace {

using status_testing::IsOkAndHolds;
using status_testing::StatusIs;
using ::testing::HasSubstr;

TEST(StringLiteralTest, SplitPlainLiteral) {
  CORAL_ASSERT_OK_AND_ASSIGN(StringLiteralParts parts,
                             SplitStringLiteral("'abc'"));
  EXPECT_FALSE(parts.is_bytes);
  EXPECT_FALSE(parts.is_raw);
  EXPECT_FALSE(parts.is_formatted);
  EXPECT_FALSE(parts.is_triple);
  EXPECT_EQ(parts.quote, '\'');
  EXPECT_EQ(parts.body, "abc");
  EXPECT_EQ(parts.body_offset, 1);
}

TEST(StringLiteralTest, SplitPrefixedTripleQuotedLiteral) {
  CORAL_ASSERT_OK_AND_ASSIGN(StringLiteralParts parts,
                             SplitStringLiteral("Rb\"\"\"a\"b\"\"\""));
  EXPECT_TRUE(parts.is_bytes);
  EXPECT_TRUE(parts.is_raw);
  EXPECT_TRUE(parts.is_triple);
  EXPECT_EQ(parts.quote, '"');
  EXPECT_EQ(parts.body, "a\"b");
  EXPECT_EQ(parts.body_offset, 5);
}

TEST(StringLiteralTest, EmptyLiteralIsNotTriple) {
  CORAL_ASSERT_OK_AND_ASSIGN(StringLiteralParts parts,
                             SplitStringLiteral("\"\""));
  EXPECT_FALSE(parts.is_triple);
  EXPECT_EQ(parts.body, "");
}

TEST(StringLiteralTest, SplitRejectsUnknownPrefix) {
  EXPECT_THAT(SplitStringLiteral("x'a'"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Invalid string literal prefix")));
}

TEST(StringLiteralTest, UnescapeSimpleEscapes) {
  EXPECT_THAT(UnescapeStringBody("a\\tb\\n\\\\\\'", /*is_bytes=*/false),
              IsOkAndHolds("a\tb\n\\'"));
}

TEST(StringLiteralTest, UnescapeLineContinuation) {
  EXPECT_THAT(UnescapeStringBody("ab\\\ncd", /*is_bytes=*/false),
              IsOkAndHolds("abcd"));
}

TEST(StringLiteralTest, UnescapeCodePointsAsUtf8) {
  EXPECT_THAT(UnescapeStringBody("\\xe9\\u00e9\\U0001F600\\101",
                                 /*is_bytes=*/false),
              IsOkAndHolds("\xc3\xa9\xc3\xa9\xf0\x9f\x98\x80" "A"));
}

TEST(StringLiteralTest, UnescapeBytes) {
  EXPECT_THAT(UnescapeStringBody("\\xff\\u1234", /*is_bytes=*/true),
              IsOkAndHolds(std::string("\xff\\u1234")));
}

TEST(StringLiteralTest, UnknownEscapeIsKept) {
  EXPECT_THAT(UnescapeStringBody("\\d", /*is_bytes=*/false),
              IsOkAndHolds("\\d"));
}

TEST(StringLiteralTest, TruncatedHexEscape) {
  EXPECT_THAT(UnescapeStringBody("\\x4", /*is_bytes=*/false),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Truncated \\x escape")));
}

TEST(StringLiteralTest, SplitFormattedBody) {
  CORAL_ASSERT_OK_AND_ASSIGN(std::vector<FStringPiece> pieces,
                             SplitFormattedStringBody("a{{b}} {x!r:>{w}}!"));
  ASSERT_EQ(pieces.size(), 3);
  EXPECT_EQ(std::get<std::string>(pieces[0]), "a{b} ");
  const FStringField& field = std::get<FStringField>(pieces[1]);
  EXPECT_EQ(field.expression, "x");
  EXPECT_EQ(field.offset, 8);
  EXPECT_EQ(field.conversion, 'r');
  EXPECT_EQ(field.format_spec, ">{w}");
  EXPECT_EQ(field.format_spec_offset, 12);
  EXPECT_EQ(std::get<std::string>(pieces[2]), "!");
}

TEST(StringLiteralTest, FieldExpressionMayContainBracesAndStrings) {
  CORAL_ASSERT_OK_AND_ASSIGN(std::vector<FStringPiece> pieces,
                             SplitFormattedStringBody("{d['}'] != {1: 2}}"));
  ASSERT_EQ(pieces.size(), 1);
  EXPECT_EQ(std::get<FStringField>(pieces[0]).expression,
            "d['}'] != {1: 2}");
}

TEST(StringLiteralTest, FormattedBodyErrors) {
  EXPECT_THAT(SplitFormattedStringBody("a}"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("single '}' is not allowed")));
  EXPECT_THAT(SplitFormattedStringBody("{x"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("expecting '}'")));
  EXPECT_THAT(SplitFormattedStringBody("{}"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("empty expression not allowed")));
  EXPECT_THAT(SplitFormattedStringBody("{x!z}"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("invalid conversion character")));
  EXPECT_THAT(SplitFormattedStringBody("{x=}"),
              StatusIs(absl::StatusCode::kUnimplemented,
                       HasSubstr("self-documenting")));
}

TEST(StringLiteralTest, Escape) {
  EXPECT_EQ(EscapeStringLiteral("a\"b'\n\\", '"', /*is_bytes=*/false),
            "a\\\"b'\\n\\\\");
  EXPECT_EQ(EscapeStringLiteral("a\"b'", '\'', /*is_bytes=*/false),
            "a\"b\\'");
  EXPECT_EQ(EscapeStringLiteral(std::string("\x01\xff", 2), '"',
                                /*is_bytes=*/true),
            "\\x01\\xff");
  // Non-ASCII text in a str literal is kept as is.
  EXPECT_EQ(EscapeStringLiteral("\xc3\xa9", '"', /*is_bytes=*/false),
            "\xc3\xa9");
}

TEST(StringLiteralTest, EscapeUnprintableLatin1) {
  // U+0080, U+009F, U+00A0 and U+00AD.
  EXPECT_EQ(EscapeStringLiteral("\xc2\x80\xc2\x9f\xc2\xa0\xc2\xad", '"',
                                /*is_bytes=*/false),
            "\\x80\\x9f\\xa0\\xad");
  // U+00A1 and U+00FF are printable.
  EXPECT_EQ(EscapeStringLiteral("\xc2\xa1\xc3\xbf", '"', /*is_bytes=*/false),
            "\xc2\xa1\xc3\xbf");
}

}  // namespace
}  // namespace coral
