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

#include "coral/fmt/reformat.h"

#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "coral/common/status/matchers.h"
#include "coral/fmt/ast_fmt.h"
#include "coral/frontend/ast.h"
#include "coral/frontend/parser.h"

namespace coral {
namespace {

using status_testing::IsOkAndHolds;
using status_testing::StatusIs;
using testing::HasSubstr;

constexpr absl::string_view kFilename = "test.py";

TEST(ReformatTest, QuotingNormalization) {
  EXPECT_THAT(Reformat("'single quotes'\n", kFilename),
              IsOkAndHolds("\"single quotes\"\n"));
}

TEST(ReformatTest, NumericCanonicalization) {
  EXPECT_THAT(Reformat("42E+84\n", kFilename), IsOkAndHolds("4.2e+85\n"));
}

TEST(ReformatTest, SingleElementTuple) {
  EXPECT_THAT(Reformat("(  1, )\n", kFilename), IsOkAndHolds("(1,)\n"));
  EXPECT_THAT(Reformat("(1)\n", kFilename), IsOkAndHolds("1\n"));
}

TEST(ReformatTest, CommentNormalization) {
  EXPECT_THAT(Reformat("#a bad comment\n", kFilename),
              IsOkAndHolds("# a bad comment\n"));
}

TEST(ReformatTest, EmptyInput) {
  EXPECT_THAT(Reformat("", kFilename), IsOkAndHolds(""));
  EXPECT_THAT(Reformat("\n\n", kFilename), IsOkAndHolds(""));
}

TEST(ReformatTest, Program) {
  constexpr absl::string_view kInput = R"(import os, sys  # imports
from collections import (OrderedDict,
                         defaultdict)

CONSTANT = 0x10  # sixteen


@decorator(arg = 1)
def function(a, b=2, *args, key: str = 'k', **kwargs) -> int:
    # Leading comment.
    total = a + b * 2  # trailing
    for item in args:
        if item % 2 == 0:
            continue
        elif item > 10:  # big
            break
        else:
          total += item
    else:
        total -= 1
    # between
    return total
)";
  constexpr absl::string_view kWant = R"(import os, sys  # imports
from collections import OrderedDict, defaultdict
CONSTANT = 16  # sixteen
@decorator(arg=1)
def function(a, b=2, *args, key: str = "k", **kwargs) -> int:
    # Leading comment.
    total = a + b * 2  # trailing
    for item in args:
        if item % 2 == 0:
            continue
        elif item > 10:  # big
            break
        else:
            total += item
    else:
        total -= 1
    # between
    return total
)";
  EXPECT_THAT(Reformat(kInput, kFilename), IsOkAndHolds(std::string(kWant)));
}

TEST(ReformatTest, ParseErrorIsSurfaced) {
  EXPECT_THAT(Reformat("x = )\n", kFilename),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("ParseError: test.py:1:5")));
  EXPECT_THAT(Reformat("x := 1\n", kFilename),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("ParseError:")));
}

TEST(ReformatTest, ScanErrorIsSurfaced) {
  EXPECT_THAT(Reformat("x = 'unterminated\n", kFilename),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("ScanError:")));
}

// Programs for the properties every reformatting must have.
constexpr absl::string_view kPrograms[] = {
    "",
    "# just\n#comments\n",
    R"(if True:  # c2
    x = 1  # c4
else: # c6
    x = 4  # c8
)",
    R"(if a:  # c0
    x = 1
elif b:  # c2
    x = 2
elif c:  # c4
    x = 3
else:  # c6
    x = 4
)",
    R"(if a:
    x = 1
  # odd column
else:
    y = 2
        # deeper
z = 3
)",
    R"(#!/usr/bin/env python
"""Module docstring."""
import os, sys  # imports

@decorator(arg = 1)
def function(a, b=2, *args, key: str = 'k', **kwargs) -> int:
    # Leading comment.
    total = a + b * 2  # trailing
    for item in args:
        if item % 2 == 0:
            continue
        elif item > 10:  # big
            break
    else:  # no break
        total -= 1
    # between
    while total > 100:
        total //= 2
    return total


class Thing(object):
  '''A class.'''
  attr: int = 3

  def method(self):
      try:  # try
          return self.attr ** -1
      except (ZeroDivisionError, TypeError) as e:  # oops
          raise ValueError('bad') from e
      else:
          pass
      finally:  # always
          pass
  # end of class


with open(__file__) as f:
    data = [line.strip() for line in f if line]
print(f'{len(data):>5} lines', {k: v for k, v in zip('ab', (1, 2))})
# trailing file comment
)",
    R"(x = [
    1,  # one
    2,
]
y = lambda *a, **k: (a, k)  # lambda
z = not (a or b) and -x ** 2 < (y if c else d)
w = r'\d+' + rb"\x" + b'\x00' + f"{x!r:>{w}}"
del x[1:2, ::3], y.z
)",
    R"(result = await fetch(url)  # await
total = (await a).b + await (await c) ** 2
)",
};

class ReformatPropertiesTest
    : public ::testing::TestWithParam<absl::string_view> {};

TEST_P(ReformatPropertiesTest, Idempotent) {
  CORAL_ASSERT_OK_AND_ASSIGN(std::string once,
                             Reformat(GetParam(), kFilename));
  EXPECT_THAT(Reformat(once, kFilename), IsOkAndHolds(once));
}

TEST_P(ReformatPropertiesTest, PreservesSyntaxTree) {
  CORAL_ASSERT_OK_AND_ASSIGN(ParsedModule original,
                             ParseModule(GetParam(), kFilename));
  CORAL_ASSERT_OK_AND_ASSIGN(std::string formatted,
                             Reformat(GetParam(), kFilename));
  CORAL_ASSERT_OK_AND_ASSIGN(ParsedModule reparsed,
                             ParseModule(formatted, kFilename));
  EXPECT_TRUE(NodesEqual(original.module.get(), reparsed.module.get()))
      << "original:  " << original.module->ToString()
      << "\nreparsed: " << reparsed.module->ToString();
}

TEST_P(ReformatPropertiesTest, PreservesComments) {
  CORAL_ASSERT_OK_AND_ASSIGN(ParsedModule original,
                             ParseModule(GetParam(), kFilename));
  CORAL_ASSERT_OK_AND_ASSIGN(std::string formatted,
                             Reformat(GetParam(), kFilename));
  CORAL_ASSERT_OK_AND_ASSIGN(ParsedModule reparsed,
                             ParseModule(formatted, kFilename));
  ASSERT_EQ(original.comments.size(), reparsed.comments.size());
  for (size_t i = 0; i < original.comments.size(); ++i) {
    EXPECT_EQ(FormatComment(original.comments[i].text),
              reparsed.comments[i].text);
  }
}

INSTANTIATE_TEST_SUITE_P(ReformatPropertiesTestInstance,
                         ReformatPropertiesTest,
                         ::testing::ValuesIn(kPrograms));

}  // namespace
}  // namespace coral
