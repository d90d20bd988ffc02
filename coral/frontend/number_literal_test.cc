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

#include "coral/frontend/number_literal.h"

#include <cmath>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "coral/common/status/matchers.h"

namespace coral {
namespace {

using status_testing::IsOkAndHolds;
using status_testing::StatusIs;
using ::testing::HasSubstr;

TEST(NumberLiteralTest, IntegerToDecimal) {
  EXPECT_THAT(IntegerToDecimal("0"), IsOkAndHolds("0"));
  EXPECT_THAT(IntegerToDecimal("1_000_000"), IsOkAndHolds("1000000"));
  EXPECT_THAT(IntegerToDecimal("0o17"), IsOkAndHolds("15"));
  EXPECT_THAT(IntegerToDecimal("0b1010"), IsOkAndHolds("10"));
  EXPECT_THAT(IntegerToDecimal("0x_FF"), IsOkAndHolds("255"));
}

TEST(NumberLiteralTest, IntegerBeyondSixtyFourBits) {
  EXPECT_THAT(IntegerToDecimal("0xffffffffffffffffffff"),
              IsOkAndHolds("1208925819614629174706175"));
  EXPECT_THAT(IntegerToDecimal("123456789012345678901234567890"),
              IsOkAndHolds("123456789012345678901234567890"));
}

TEST(NumberLiteralTest, IntegerRejectsBadDigits) {
  EXPECT_THAT(IntegerToDecimal("0o9"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("for base 8")));
  EXPECT_THAT(IntegerToDecimal("0x"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Invalid integer literal")));
  EXPECT_THAT(IntegerToDecimal("0_b"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Invalid integer literal")));
}

TEST(NumberLiteralTest, Kinds) {
  CORAL_ASSERT_OK_AND_ASSIGN(NumberLiteral i, ParseNumberLiteral("42"));
  EXPECT_EQ(i.kind, NumberKind::kInt);
  EXPECT_EQ(i.decimal, "42");

  CORAL_ASSERT_OK_AND_ASSIGN(NumberLiteral f, ParseNumberLiteral("1_0.5e1"));
  EXPECT_EQ(f.kind, NumberKind::kFloat);
  EXPECT_DOUBLE_EQ(f.value, 105.0);

  CORAL_ASSERT_OK_AND_ASSIGN(NumberLiteral j, ParseNumberLiteral("3.5J"));
  EXPECT_EQ(j.kind, NumberKind::kImaginary);
  EXPECT_DOUBLE_EQ(j.value, 3.5);

  CORAL_ASSERT_OK_AND_ASSIGN(NumberLiteral hex, ParseNumberLiteral("0xE"));
  EXPECT_EQ(hex.kind, NumberKind::kInt);
  EXPECT_EQ(hex.decimal, "14");
}

TEST(NumberLiteralTest, FloatOverflowIsInfinite) {
  CORAL_ASSERT_OK_AND_ASSIGN(NumberLiteral f, ParseNumberLiteral("1e999"));
  EXPECT_EQ(f.kind, NumberKind::kFloat);
  EXPECT_TRUE(std::isinf(f.value));
}

}  // namespace
}  // namespace coral
