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

#ifndef CORAL_FRONTEND_STRING_LITERAL_H_
#define CORAL_FRONTEND_STRING_LITERAL_H_

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace coral {

// The spelling of a string literal token taken apart; e.g. for `rb'''\d'''`
// is_raw and is_bytes are set, is_triple is set, quote is '\'' and body is
// `\d`.
struct StringLiteralParts {
  bool is_bytes = false;
  bool is_raw = false;
  bool is_formatted = false;
  bool is_triple = false;
  char quote = '"';
  // Text between the quotes; escapes are not decoded.
  std::string body;
  // Number of characters (prefix plus opening quotes) before the body.
  int64_t body_offset = 0;
};

absl::StatusOr<StringLiteralParts> SplitStringLiteral(absl::string_view text);

// Decodes the backslash escapes in the body of a (non-raw) literal. For str
// literals, code points produced by \x, octal, \u and \U escapes are encoded
// as UTF-8; for bytes literals \x and octal escapes produce single bytes and
// \u / \U are not escapes. Unrecognized escapes are kept verbatim.
absl::StatusOr<std::string> UnescapeStringBody(absl::string_view body,
                                               bool is_bytes);

// A replacement field of a formatted string literal, e.g. `{x!r:>{width}}`.
struct FStringField {
  // Source text of the expression.
  std::string expression;
  // Offset of `expression` within the body that was split.
  int64_t offset = 0;
  std::optional<char> conversion;
  // Source text of the format spec; may itself contain replacement fields.
  std::optional<std::string> format_spec;
  int64_t format_spec_offset = 0;
};

// Literal text (with doubled braces already collapsed, escapes not yet
// decoded) or a replacement field.
using FStringPiece = std::variant<std::string, FStringField>;

// Splits the body of a formatted string literal into literal text and
// replacement fields.
absl::StatusOr<std::vector<FStringPiece>> SplitFormattedStringBody(
    absl::string_view body);

// Renders `value` for placement between `quote` characters, re-deriving the
// escapes: backslash, the quote, \n, \r and \t get backslash escapes and other
// control characters get \xNN. For text that covers the C1 controls, the
// no-break space and the soft hyphen; for bytes, all non-ASCII bytes.
std::string EscapeStringLiteral(absl::string_view value, char quote,
                                bool is_bytes);

}  // namespace coral

#endif  // CORAL_FRONTEND_STRING_LITERAL_H_
