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


#include "coral/frontend/errors.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "coral/common/status/matchers.h"
#include "coral/frontend/pos.h"

namespace coral {
namespace {

using status_testing::StatusIs;
using ::testing::HasSubstr;

TEST(ErrorsTest, ParseErrorCarriesSpan) {
  Span span(Pos("test.py", 0, 4), Pos("test.py", 0, 5));
  absl::Status status = ParseErrorStatus(span, "Expected an expression");
  EXPECT_THAT(status,
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "ParseError: test.py:1:5-1:6 Expected an expression"));
  EXPECT_TRUE(IsPositionalError(status));
}

TEST(ErrorsTest, OtherErrorsAreNotPositional) {
  EXPECT_FALSE(IsPositionalError(absl::OkStatus()));
  EXPECT_FALSE(IsPositionalError(absl::NotFoundError("ParseError: nope")));
  EXPECT_FALSE(IsPositionalError(absl::InvalidArgumentError("bad flag")));
}

TEST(ErrorsTest, GetPositionalErrorData) {
  Span span(Pos("dir/test.py", 2, 0), Pos("dir/test.py", 3, 7));
  CORAL_ASSERT_OK_AND_ASSIGN(
      PositionalErrorData data,
      GetPositionalErrorData(ParseErrorStatus(span, "Unexpected indent")));
  EXPECT_EQ(data.span, span);
  EXPECT_EQ(data.error_type, "ParseError");
  EXPECT_EQ(data.message, "Unexpected indent");

  CORAL_ASSERT_OK_AND_ASSIGN(
      data, GetPositionalErrorData(absl::InvalidArgumentError(
                "ScanError: test.py:1:3-1:4 Unterminated string\nliteral")));
  EXPECT_EQ(data.span, Span(Pos("test.py", 0, 2), Pos("test.py", 0, 3)));
  EXPECT_EQ(data.error_type, "ScanError");
  EXPECT_EQ(data.message, "Unterminated string\nliteral");
}

TEST(ErrorsTest, GetPositionalErrorDataRejectsOtherErrors) {
  EXPECT_THAT(GetPositionalErrorData(absl::NotFoundError("missing.py")),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("not a positional error")));
}

}  // namespace
}  // namespace coral
