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

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string>

#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "coral/common/logging/logging.h"

namespace coral {
namespace {

// The significant digits of a finite, positive double and the position of the
// decimal point relative to them: value = 0.<digits> * 10^decpt.
struct ShortestDigits {
  std::string digits;
  int64_t decpt;
};

ShortestDigits GetShortestDigits(double value) {
  // 17 significant digits always suffice to round-trip a double.
  std::string text;
  for (int precision = 1; precision <= 17; ++precision) {
    text = absl::StrFormat("%.*e", precision - 1, value);
    if (std::strtod(text.c_str(), nullptr) == value) {
      break;
    }
  }
  // `text` is "d[.ddd]e[+-]xx".
  const size_t e = text.find('e');
  CORAL_CHECK_NE(e, std::string::npos) << text;
  std::string digits;
  for (size_t i = 0; i < e; ++i) {
    if (text[i] != '.') {
      digits.push_back(text[i]);
    }
  }
  int exponent = 0;
  CORAL_CHECK(absl::SimpleAtoi(absl::string_view(text).substr(e + 1),
                               &exponent))
      << text;
  while (digits.size() > 1 && digits.back() == '0') {
    digits.pop_back();
  }
  return ShortestDigits{digits, exponent + 1};
}

}  // namespace

std::string FloatRepr(double value) {
  if (std::isinf(value)) {
    return value < 0 ? "-1e309" : "1e309";
  }
  if (std::isnan(value)) {
    return "nan";
  }
  if (value == 0.0) {
    return std::signbit(value) ? "-0.0" : "0.0";
  }
  const std::string sign = value < 0 ? "-" : "";
  const ShortestDigits shortest = GetShortestDigits(std::fabs(value));
  const std::string& digits = shortest.digits;
  const int64_t ndigits = static_cast<int64_t>(digits.size());
  const int64_t decpt = shortest.decpt;

  if (decpt <= -4 || decpt > 16) {
    std::string mantissa = digits.substr(0, 1);
    if (ndigits > 1) {
      absl::StrAppend(&mantissa, ".", digits.substr(1));
    }
    const int64_t exponent = decpt - 1;
    return absl::StrFormat("%s%se%c%02d", sign, mantissa,
                           exponent < 0 ? '-' : '+', std::abs(exponent));
  }
  if (decpt <= 0) {
    return absl::StrCat(sign, "0.", std::string(-decpt, '0'), digits);
  }
  if (decpt >= ndigits) {
    return absl::StrCat(sign, digits, std::string(decpt - ndigits, '0'), ".0");
  }
  return absl::StrCat(sign, digits.substr(0, decpt), ".", digits.substr(decpt));
}

std::string ImaginaryRepr(double value) {
  std::string repr = FloatRepr(value);
  if (absl::EndsWith(repr, ".0")) {
    repr.resize(repr.size() - 2);
  }
  return absl::StrCat(repr, "j");
}

}  // namespace coral
