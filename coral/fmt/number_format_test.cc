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


#include "coral/fmt/number_format.h"

#include <limits>

#include "gtest/gtest.h"

namespace coral {
namespace {

TEST(NumberFormatTest, FloatReprPositional) {
  EXPECT_EQ(FloatRepr(0.0), "0.0");
  EXPECT_EQ(FloatRepr(1.0), "1.0");
  EXPECT_EQ(FloatRepr(1.5), "1.5");
  EXPECT_EQ(FloatRepr(0.1), "0.1");
  EXPECT_EQ(FloatRepr(100.0), "100.0");
  EXPECT_EQ(FloatRepr(0.0001), "0.0001");
  EXPECT_EQ(FloatRepr(3.14159), "3.14159");
  EXPECT_EQ(FloatRepr(1e15), "1000000000000000.0");
  EXPECT_EQ(FloatRepr(-2.5), "-2.5");
}

TEST(NumberFormatTest, FloatReprShortestRoundTrip) {
  EXPECT_EQ(FloatRepr(0.1 + 0.2), "0.30000000000000004");
  EXPECT_EQ(FloatRepr(1.0 / 3.0), "0.3333333333333333");
}

TEST(NumberFormatTest, FloatReprScientific) {
  EXPECT_EQ(FloatRepr(1e16), "1e+16");
  EXPECT_EQ(FloatRepr(0.00001), "1e-05");
  EXPECT_EQ(FloatRepr(42e84), "4.2e+85");
  EXPECT_EQ(FloatRepr(1.5e-300), "1.5e-300");
  EXPECT_EQ(FloatRepr(123456789012345678.0), "1.2345678901234568e+17");
}

TEST(NumberFormatTest, FloatReprInfinity) {
  EXPECT_EQ(FloatRepr(std::numeric_limits<double>::infinity()), "1e309");
}

TEST(NumberFormatTest, ImaginaryRepr) {
  EXPECT_EQ(ImaginaryRepr(2.0), "2j");
  EXPECT_EQ(ImaginaryRepr(1.5), "1.5j");
  EXPECT_EQ(ImaginaryRepr(0.0), "0j");
  EXPECT_EQ(ImaginaryRepr(1e20), "1e+20j");
}

}  // namespace
}  // namespace coral
