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

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "coral/common/logging/logging.h"

namespace coral {
namespace {

void AppendUtf8(uint32_t code_point, std::string* out) {
  if (code_point < 0x80) {
    out->push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out->push_back(static_cast<char>(0xc0 | (code_point >> 6)));
    out->push_back(static_cast<char>(0x80 | (code_point & 0x3f)));
  } else if (code_point < 0x10000) {
    out->push_back(static_cast<char>(0xe0 | (code_point >> 12)));
    out->push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3f)));
    out->push_back(static_cast<char>(0x80 | (code_point & 0x3f)));
  } else {
    out->push_back(static_cast<char>(0xf0 | (code_point >> 18)));
    out->push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3f)));
    out->push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3f)));
    out->push_back(static_cast<char>(0x80 | (code_point & 0x3f)));
  }
}

int HexCharToInt(char hex_char) {
  if (absl::ascii_isdigit(hex_char)) {
    return hex_char - '0';
  }
  return absl::ascii_tolower(hex_char) - 'a' + 10;
}

// Reads exactly `count` hex digits from `body` at `*i`.
absl::StatusOr<uint32_t> ReadHexDigits(absl::string_view body, size_t* i,
                                       int count, char escape) {
  uint32_t value = 0;
  for (int d = 0; d < count; ++d) {
    if (*i >= body.size() || !absl::ascii_isxdigit(body[*i])) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Truncated \\%c escape; expected %d hex digits.", escape, count));
    }
    value = (value << 4) | HexCharToInt(body[*i]);
    ++*i;
  }
  return value;
}

}  // namespace

absl::StatusOr<StringLiteralParts> SplitStringLiteral(absl::string_view text) {
  StringLiteralParts parts;
  size_t i = 0;
  while (i < text.size() && text[i] != '\'' && text[i] != '"') {
    switch (absl::ascii_tolower(text[i])) {
      case 'b':
        parts.is_bytes = true;
        break;
      case 'r':
        parts.is_raw = true;
        break;
      case 'f':
        parts.is_formatted = true;
        break;
      case 'u':
        break;
      default:
        return absl::InvalidArgumentError(
            absl::StrFormat("Invalid string literal prefix: %s", text));
    }
    ++i;
  }
  if (i == text.size()) {
    return absl::InvalidArgumentError(
        absl::StrFormat("String literal has no opening quote: %s", text));
  }
  parts.quote = text[i];
  const std::string triple(3, parts.quote);
  size_t quote_len = 1;
  if (text.substr(i).size() >= 6 && text.substr(i, 3) == triple) {
    parts.is_triple = true;
    quote_len = 3;
  }
  if (text.size() < i + 2 * quote_len) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Malformed string literal: %s", text));
  }
  parts.body_offset = static_cast<int64_t>(i + quote_len);
  parts.body = std::string(
      text.substr(i + quote_len, text.size() - i - 2 * quote_len));
  return parts;
}

absl::StatusOr<std::string> UnescapeStringBody(absl::string_view body,
                                               bool is_bytes) {
  std::string out;
  size_t i = 0;
  while (i < body.size()) {
    const char c = body[i];
    if (c != '\\' || i + 1 >= body.size()) {
      out.push_back(c);
      ++i;
      continue;
    }
    const char escape = body[i + 1];
    i += 2;
    switch (escape) {
      case '\n':
        // Line continuation.
        break;
      case '\r':
        if (i < body.size() && body[i] == '\n') {
          ++i;
        }
        break;
      // clang-format off
      case '\\': out.push_back('\\'); break;  // NOLINT
      case '\'': out.push_back('\''); break;  // NOLINT
      case '"': out.push_back('"'); break;  // NOLINT
      case 'a': out.push_back('\a'); break;  // NOLINT
      case 'b': out.push_back('\b'); break;  // NOLINT
      case 'f': out.push_back('\f'); break;  // NOLINT
      case 'n': out.push_back('\n'); break;  // NOLINT
      case 'r': out.push_back('\r'); break;  // NOLINT
      case 't': out.push_back('\t'); break;  // NOLINT
      case 'v': out.push_back('\v'); break;  // NOLINT
      // clang-format on
      case '0':
      case '1':
      case '2':
      case '3':
      case '4':
      case '5':
      case '6':
      case '7': {
        uint32_t value = escape - '0';
        for (int d = 0; d < 2 && i < body.size() && '0' <= body[i] &&
                        body[i] <= '7';
             ++d, ++i) {
          value = value * 8 + (body[i] - '0');
        }
        if (is_bytes) {
          out.push_back(static_cast<char>(value & 0xff));
        } else {
          AppendUtf8(value, &out);
        }
        break;
      }
      case 'x': {
        absl::StatusOr<uint32_t> value = ReadHexDigits(body, &i, 2, 'x');
        if (!value.ok()) {
          return value.status();
        }
        if (is_bytes) {
          out.push_back(static_cast<char>(*value));
        } else {
          AppendUtf8(*value, &out);
        }
        break;
      }
      case 'u':
      case 'U': {
        if (is_bytes) {
          out.push_back('\\');
          out.push_back(escape);
          break;
        }
        absl::StatusOr<uint32_t> value =
            ReadHexDigits(body, &i, escape == 'u' ? 4 : 8, escape);
        if (!value.ok()) {
          return value.status();
        }
        if (*value > 0x10ffff) {
          return absl::InvalidArgumentError(absl::StrFormat(
              "Illegal Unicode character in \\U escape: %#x", *value));
        }
        AppendUtf8(*value, &out);
        break;
      }
      case 'N':
        if (!is_bytes) {
          return absl::UnimplementedError(
              "Named Unicode escapes (\\N{...}) are not supported.");
        }
        out.push_back('\\');
        out.push_back(escape);
        break;
      default:
        out.push_back('\\');
        out.push_back(escape);
        break;
    }
  }
  return out;
}

absl::StatusOr<std::vector<FStringPiece>> SplitFormattedStringBody(
    absl::string_view body) {
  std::vector<FStringPiece> pieces;
  std::string literal;
  auto flush_literal = [&] {
    if (!literal.empty()) {
      pieces.push_back(std::move(literal));
      literal.clear();
    }
  };

  size_t i = 0;
  while (i < body.size()) {
    const char c = body[i];
    if (c == '}') {
      if (i + 1 < body.size() && body[i + 1] == '}') {
        literal.push_back('}');
        i += 2;
        continue;
      }
      return absl::InvalidArgumentError(
          "f-string: single '}' is not allowed.");
    }
    if (c != '{') {
      literal.push_back(c);
      ++i;
      continue;
    }
    if (i + 1 < body.size() && body[i + 1] == '{') {
      literal.push_back('{');
      i += 2;
      continue;
    }
    flush_literal();

    // Scan the expression up to a top-level '!', ':' or '}'.
    FStringField field;
    const size_t start = ++i;
    int64_t depth = 0;
    std::optional<char> in_quote;
    for (; i < body.size(); ++i) {
      const char ch = body[i];
      if (in_quote.has_value()) {
        if (ch == '\\') {
          ++i;
        } else if (ch == *in_quote) {
          in_quote = std::nullopt;
        }
        continue;
      }
      if (ch == '\'' || ch == '"') {
        in_quote = ch;
      } else if (ch == '(' || ch == '[' || ch == '{') {
        ++depth;
      } else if (ch == ')' || ch == ']' || ch == '}') {
        if (depth == 0) {
          break;
        }
        --depth;
      } else if (ch == '#') {
        return absl::InvalidArgumentError(
            "f-string expression part cannot include '#'.");
      } else if (depth == 0 && ch == '!') {
        if (i + 1 < body.size() && body[i + 1] == '=') {
          ++i;
          continue;
        }
        break;
      } else if (depth == 0 && ch == ':') {
        break;
      } else if (depth == 0 && ch == '=') {
        const bool compound =
            (i + 1 < body.size() && body[i + 1] == '=') ||
            (i > start && absl::string_view("=!<>").find(body[i - 1]) !=
                              absl::string_view::npos);
        if (i + 1 < body.size() && body[i + 1] == '=') {
          ++i;
        }
        if (!compound) {
          return absl::UnimplementedError(
              "f-string: self-documenting expressions ('=') are not "
              "supported.");
        }
      }
    }
    if (i >= body.size()) {
      return absl::InvalidArgumentError("f-string: expecting '}'.");
    }
    field.expression = std::string(body.substr(start, i - start));
    field.offset = static_cast<int64_t>(start);
    if (absl::StripAsciiWhitespace(field.expression).empty()) {
      return absl::InvalidArgumentError(
          "f-string: empty expression not allowed.");
    }

    if (body[i] == '!') {
      ++i;
      if (i >= body.size() ||
          absl::string_view("sra").find(body[i]) == absl::string_view::npos) {
        return absl::InvalidArgumentError(
            "f-string: invalid conversion character; expected 's', 'r', or "
            "'a'.");
      }
      field.conversion = body[i];
      ++i;
    }
    if (i < body.size() && body[i] == ':') {
      const size_t spec_start = ++i;
      int64_t nesting = 0;
      for (; i < body.size(); ++i) {
        if (body[i] == '{') {
          ++nesting;
        } else if (body[i] == '}') {
          if (nesting == 0) {
            break;
          }
          --nesting;
        }
      }
      field.format_spec = std::string(body.substr(spec_start, i - spec_start));
      field.format_spec_offset = static_cast<int64_t>(spec_start);
    }
    if (i >= body.size() || body[i] != '}') {
      return absl::InvalidArgumentError("f-string: expecting '}'.");
    }
    ++i;
    pieces.push_back(std::move(field));
  }
  flush_literal();
  return pieces;
}

std::string EscapeStringLiteral(absl::string_view value, char quote,
                                bool is_bytes) {
  std::string out;
  out.reserve(value.size());
  for (size_t i = 0; i < value.size(); ++i) {
    const char c = value[i];
    const unsigned char u = static_cast<unsigned char>(c);
    if (!is_bytes && u == 0xc2 && i + 1 < value.size()) {
      // U+0080..U+00A0 and U+00AD are encoded as 0xc2 followed by the code
      // point's low byte.
      const unsigned char next = static_cast<unsigned char>(value[i + 1]);
      if ((next >= 0x80 && next <= 0xa0) || next == 0xad) {
        absl::StrAppendFormat(&out, "\\x%02x", next);
        ++i;
        continue;
      }
    }
    if (c == '\\') {
      out.append("\\\\");
    } else if (c == quote) {
      out.push_back('\\');
      out.push_back(quote);
    } else if (c == '\n') {
      out.append("\\n");
    } else if (c == '\r') {
      out.append("\\r");
    } else if (c == '\t') {
      out.append("\\t");
    } else if (u < 0x20 || u == 0x7f || (is_bytes && u >= 0x80)) {
      absl::StrAppendFormat(&out, "\\x%02x", u);
    } else {
      out.push_back(c);
    }
  }
  return out;
}

}  // namespace coral
