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

#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/string_view.h"

namespace coral {
namespace {

// Little-endian limbs in base 10^9.
constexpr uint32_t kLimbBase = 1000000000;

void MultiplyAdd(std::vector<uint32_t>* limbs, uint32_t factor,
                 uint32_t addend) {
  uint64_t carry = addend;
  for (uint32_t& limb : *limbs) {
    uint64_t product = static_cast<uint64_t>(limb) * factor + carry;
    limb = static_cast<uint32_t>(product % kLimbBase);
    carry = product / kLimbBase;
  }
  while (carry != 0) {
    limbs->push_back(static_cast<uint32_t>(carry % kLimbBase));
    carry /= kLimbBase;
  }
}

std::string LimbsToString(const std::vector<uint32_t>& limbs) {
  std::string result = absl::StrCat(limbs.back());
  for (auto it = limbs.rbegin() + 1; it != limbs.rend(); ++it) {
    absl::StrAppendFormat(&result, "%09d", *it);
  }
  return result;
}

}  // namespace

absl::StatusOr<std::string> IntegerToDecimal(absl::string_view text) {
  std::string s = absl::StrReplaceAll(text, {{"_", ""}});
  uint32_t base = 10;
  absl::string_view digits = s;
  if (s.size() >= 2 && s[0] == '0' && absl::ascii_isalpha(s[1])) {
    switch (absl::ascii_tolower(s[1])) {
      case 'x':
        base = 16;
        break;
      case 'o':
        base = 8;
        break;
      case 'b':
        base = 2;
        break;
      default:
        return absl::InvalidArgumentError(
            absl::StrFormat("Invalid integer literal: %s", text));
    }
    digits.remove_prefix(2);
  }
  if (digits.empty()) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Invalid integer literal: %s", text));
  }

  std::vector<uint32_t> limbs = {0};
  for (char c : digits) {
    uint32_t digit;
    if (absl::ascii_isdigit(c)) {
      digit = c - '0';
    } else if (absl::ascii_isxdigit(c)) {
      digit = absl::ascii_tolower(c) - 'a' + 10;
    } else {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Invalid digit '%c' in integer literal: %s", c, text));
    }
    if (digit >= base) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Invalid digit '%c' for base %d integer literal: %s", c, base, text));
    }
    MultiplyAdd(&limbs, base, digit);
  }
  return LimbsToString(limbs);
}

absl::StatusOr<NumberLiteral> ParseNumberLiteral(absl::string_view text) {
  if (text.empty()) {
    return absl::InvalidArgumentError("Empty number literal.");
  }
  NumberLiteral result;
  std::string s = absl::StrReplaceAll(text, {{"_", ""}});
  const bool is_prefixed =
      s.size() > 1 && s[0] == '0' && absl::ascii_isalpha(s[1]) &&
      absl::ascii_tolower(s[1]) != 'e' && absl::ascii_tolower(s[1]) != 'j';
  if (!is_prefixed && (s.back() == 'j' || s.back() == 'J')) {
    result.kind = NumberKind::kImaginary;
    s.pop_back();
  } else if (!is_prefixed &&
             s.find_first_of(".eE") != std::string::npos) {
    result.kind = NumberKind::kFloat;
  } else {
    result.kind = NumberKind::kInt;
    absl::StatusOr<std::string> decimal = IntegerToDecimal(text);
    if (!decimal.ok()) {
      return decimal.status();
    }
    result.decimal = *std::move(decimal);
    return result;
  }

  // strtod saturates to +/-HUGE_VAL on overflow, which is the value Python
  // gives such literals as well.
  const char* begin = s.c_str();
  char* end = nullptr;
  result.value = std::strtod(begin, &end);
  if (end != begin + s.size()) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Invalid floating point literal: %s", text));
  }
  return result;
}

}  // namespace coral
