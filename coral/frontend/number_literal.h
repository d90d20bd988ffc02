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

#ifndef CORAL_FRONTEND_NUMBER_LITERAL_H_
#define CORAL_FRONTEND_NUMBER_LITERAL_H_

#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace coral {

enum class NumberKind {
  kInt,
  kFloat,
  kImaginary,
};

// The value denoted by a number token.
struct NumberLiteral {
  NumberKind kind;
  // For kInt: the value as a decimal digit string (arbitrary precision).
  std::string decimal;
  // For kFloat: the value; for kImaginary: the imaginary part.
  double value = 0.0;
};

// Interprets the spelling of a number token, e.g. "0x_ff", "1_000", "1.5e3" or
// "2j".
absl::StatusOr<NumberLiteral> ParseNumberLiteral(absl::string_view text);

// Converts a (prefixed, possibly underscored) integer spelling to decimal;
// e.g. "0o17" -> "15".
absl::StatusOr<std::string> IntegerToDecimal(absl::string_view text);

}  // namespace coral

#endif  // CORAL_FRONTEND_NUMBER_LITERAL_H_
