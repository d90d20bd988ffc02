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


#include "coral/frontend/error_printer.h"

#include <sstream>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "coral/common/status/matchers.h"
#include "coral/frontend/pos.h"

namespace coral {
namespace {

using status_testing::IsOk;
using status_testing::StatusIs;

TEST(PrintPositionalErrorTest, MarksErrorStart) {
  constexpr char kContents[] = "a = 1\nb = )\nc = 3\n";
  Span span(Pos("test.py", 1, 4), Pos("test.py", 1, 5));
  std::ostringstream os;
  EXPECT_THAT(PrintPositionalError(span, "ParseError: bad", kContents, os),
              IsOk());
  EXPECT_EQ(os.str(),
            "test.py:2:5-2:6\n"
            "0001: a = 1\n"
            "0002: b = )\n"
            "~~~~~~~~~~^ ParseError: bad\n"
            "0003: c = 3\n");
}

TEST(PrintPositionalErrorTest, ContextIsLimited) {
  constexpr char kContents[] = "1\n2\n3\n4\n5\n";
  Span span(Pos("test.py", 2, 0), Pos("test.py", 2, 1));
  std::ostringstream os;
  EXPECT_THAT(PrintPositionalError(span, "msg", kContents, os,
                                   /*error_context_line_count=*/1),
              IsOk());
  EXPECT_EQ(os.str(),
            "test.py:3:1-3:2\n"
            "0003: 3\n"
            "~~~~~~^ msg\n");
}

TEST(PrintPositionalErrorTest, SpanPastEndIsClamped) {
  Span span(Pos("test.py", 9, 0), Pos("test.py", 9, 1));
  std::ostringstream os;
  EXPECT_THAT(PrintPositionalError(span, "msg", "x\n", os,
                                   /*error_context_line_count=*/1),
              IsOk());
  EXPECT_EQ(os.str(),
            "test.py:10:1-10:2\n"
            "0001: x\n"
            "~~~~~~~^ msg\n");
}

TEST(PrintPositionalErrorTest, RejectsEvenContext) {
  std::ostringstream os;
  Span span(Pos("test.py", 0, 0), Pos("test.py", 0, 1));
  EXPECT_THAT(PrintPositionalError(span, "msg", "x\n", os,
                                   /*error_context_line_count=*/2),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

}  // namespace
}  // namespace coral
