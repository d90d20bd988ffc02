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

#include "coral/frontend/scanner.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "coral/common/logging/logging.h"

namespace coral {
namespace {

bool IsIdentifierChar(char c) {
  return absl::ascii_isalnum(c) || c == '_' ||
         static_cast<unsigned char>(c) >= 0x80;
}

bool IsIdentifierStartChar(char c) {
  return absl::ascii_isalpha(c) || c == '_' ||
         static_cast<unsigned char>(c) >= 0x80;
}

bool IsDigitOrUnderscore(char c) { return absl::ascii_isdigit(c) || c == '_'; }

// Returns whether `s` may prefix a string literal, e.g. the `rb` in `rb"\d"`.
bool IsStringPrefix(absl::string_view s) {
  std::string lower = absl::AsciiStrToLower(s);
  return lower == "r" || lower == "u" || lower == "b" || lower == "f" ||
         lower == "br" || lower == "rb" || lower == "fr" || lower == "rf";
}

}  // namespace

std::string Token::ToErrorString() const {
  if (kind_ == TokenKind::kKeyword) {
    return absl::StrFormat("keyword:%s", KeywordToString(GetKeyword()));
  }
  return TokenKindToString(kind_);
}

std::string Token::ToString() const {
  if (kind() == TokenKind::kKeyword) {
    return KeywordToString(GetKeyword());
  }
  if (GetValue().has_value()) {
    return GetValue().value();
  }
  return TokenKindToString(kind_);
}

/* static */ Scanner Scanner::ForExpression(const Pos& start,
                                            std::string text) {
  Scanner scanner(start.filename(), std::move(text));
  scanner.lineno_ = start.lineno();
  scanner.colno_ = start.colno();
  scanner.bracket_depth_ = 1;
  scanner.at_line_start_ = false;
  scanner.expression_mode_ = true;
  return scanner;
}

char Scanner::PopChar() {
  CORAL_CHECK(!AtCharEof()) << "Cannot pop character when at EOF.";
  char c = PeekChar();
  index_ += 1;
  if (c == '\n') {
    lineno_ += 1;
    colno_ = 0;
  } else {
    colno_ += 1;
  }
  return c;
}

void Scanner::DropChar(int64_t count) {
  for (int64_t i = 0; i < count; ++i) {
    (void)PopChar();
  }
}

bool Scanner::TryDropChar(char target) {
  if (!AtCharEof() && PeekChar() == target) {
    DropChar();
    return true;
  }
  return false;
}

void Scanner::PopComment() {
  const Pos start_pos = GetPos();
  CORAL_CHECK_EQ(PeekChar(), '#');
  std::string text;
  while (!AtCharEof() && PeekChar() != '\n') {
    text.append(1, PopChar());
  }
  if (!text.empty() && text.back() == '\r') {
    text.pop_back();
  }
  CORAL_VLOG(5) << "Comment @ " << start_pos << ": " << text;
  comments_.push_back(CommentData{Span(start_pos, GetPos()), std::move(text)});
}

absl::Status Scanner::ScanIndentation() {
  while (true) {
    int64_t column = 0;
    while (!AtCharEof()) {
      char c = PeekChar();
      if (c == ' ') {
        column += 1;
      } else if (c == '\t') {
        column = (column / 8 + 1) * 8;
      } else if (c == '\f') {
        column = 0;
      } else if (c != '\r') {
        break;
      }
      DropChar();
    }
    if (!AtCharEof() && PeekChar() == '#') {
      PopComment();
    }
    if (AtCharEof()) {
      at_line_start_ = false;
      return absl::OkStatus();
    }
    if (PeekChar() == '\n') {
      // Blank (or comment-only) line: no layout tokens.
      DropChar();
      continue;
    }

    at_line_start_ = false;
    const Pos pos = GetPos();
    if (column > indent_stack_.back()) {
      indent_stack_.push_back(column);
      pending_.push_back(Token(TokenKind::kIndent, Span(pos, pos)));
      return absl::OkStatus();
    }
    while (column < indent_stack_.back()) {
      indent_stack_.pop_back();
      pending_.push_back(Token(TokenKind::kDedent, Span(pos, pos)));
    }
    if (column != indent_stack_.back()) {
      return ScanError(
          Span(pos, pos),
          "Unindent does not match any outer indentation level.");
    }
    return absl::OkStatus();
  }
}

void Scanner::DropWhitespaceAndComments() {
  while (!AtCharEof()) {
    char c = PeekChar();
    if (c == ' ' || c == '\t' || c == '\f' || c == '\r') {
      DropChar();
    } else if (c == '\\' && PeekCharOrNull(1) == '\n') {
      // Explicit line joining.
      DropChar(2);
    } else if (c == '\\' && PeekCharOrNull(1) == '\r' &&
               PeekCharOrNull(2) == '\n') {
      DropChar(3);
    } else if (c == '#') {
      PopComment();
    } else if (c == '\n' && bracket_depth_ > 0) {
      // Implicit line joining.
      DropChar();
    } else {
      break;
    }
  }
}

void Scanner::QueueEndOfStream() {
  const Pos pos = GetPos();
  if (line_has_tokens_ && !expression_mode_) {
    pending_.push_back(Token(TokenKind::kNewline, Span(pos, pos)));
  }
  line_has_tokens_ = false;
  while (indent_stack_.size() > 1) {
    indent_stack_.pop_back();
    pending_.push_back(Token(TokenKind::kDedent, Span(pos, pos)));
  }
  pending_.push_back(Token(TokenKind::kEof, Span(pos, pos)));
  end_queued_ = true;
}

absl::StatusOr<Token> Scanner::Pop() {
  while (true) {
    if (!pending_.empty()) {
      Token tok = pending_.front();
      pending_.pop_front();
      if (tok.kind() == TokenKind::kEof) {
        // EOF repeats on every subsequent call.
        eof_popped_ = true;
        pending_.push_back(tok);
      }
      return tok;
    }
    CORAL_CHECK(!end_queued_);

    if (at_line_start_ && bracket_depth_ == 0) {
      CORAL_RETURN_IF_ERROR(ScanIndentation());
      continue;
    }

    DropWhitespaceAndComments();
    if (AtCharEof()) {
      QueueEndOfStream();
      continue;
    }

    const Pos start_pos = GetPos();
    const char startc = PeekChar();
    if (startc == '\n') {
      DropChar();
      at_line_start_ = true;
      if (!line_has_tokens_) {
        continue;
      }
      line_has_tokens_ = false;
      return Token(TokenKind::kNewline, Span(start_pos, GetPos()));
    }

    std::optional<Token> result;
    if (absl::ascii_isdigit(startc) ||
        (startc == '.' && absl::ascii_isdigit(PeekCharOrNull(1)))) {
      CORAL_ASSIGN_OR_RETURN(result, ScanNumber(start_pos));
    } else if (IsIdentifierStartChar(startc)) {
      CORAL_ASSIGN_OR_RETURN(result, ScanIdentifierOrKeyword(start_pos));
    } else if (startc == '\'' || startc == '"') {
      CORAL_ASSIGN_OR_RETURN(result, ScanString("", start_pos));
    } else {
      CORAL_ASSIGN_OR_RETURN(result, ScanOperator(start_pos));
    }
    line_has_tokens_ = true;
    return *std::move(result);
  }
}

/* static */ std::optional<Keyword> Scanner::GetKeyword(absl::string_view s) {
  static const auto* mapping = new absl::flat_hash_map<std::string, Keyword>{
#define MAKE_ITEM(__enum, unused, __str, ...) {__str, Keyword::__enum},
      CORAL_KEYWORDS(MAKE_ITEM)
#undef MAKE_ITEM
  };
  auto it = mapping->find(s);
  if (it == mapping->end()) {
    return std::nullopt;
  }
  return it->second;
}

absl::StatusOr<Token> Scanner::ScanIdentifierOrKeyword(const Pos& start_pos) {
  std::string s = ScanWhile("", IsIdentifierChar);
  if (!AtCharEof() && (PeekChar() == '\'' || PeekChar() == '"') &&
      IsStringPrefix(s)) {
    return ScanString(std::move(s), start_pos);
  }
  Span span(start_pos, GetPos());
  if (std::optional<Keyword> keyword = GetKeyword(s)) {
    return Token(span, *keyword);
  }
  return Token(TokenKind::kIdentifier, span, std::move(s));
}

absl::StatusOr<Token> Scanner::ScanString(std::string prefix,
                                          const Pos& start_pos) {
  const char quote = PopChar();
  CORAL_CHECK(quote == '\'' || quote == '"');
  bool triple = false;
  if (PeekCharOrNull(0) == quote && PeekCharOrNull(1) == quote) {
    DropChar(2);
    triple = true;
  }

  std::string text = std::move(prefix);
  text.append(triple ? 3 : 1, quote);
  while (true) {
    if (AtCharEof()) {
      return ScanError(Span(start_pos, GetPos()),
                       "Consumed all input without finding the closing quote "
                       "of a string literal.");
    }
    char c = PeekChar();
    if (c == '\\') {
      // Escapes (even in raw strings) keep the following character from
      // terminating the literal.
      text.append(1, PopChar());
      if (!AtCharEof()) {
        text.append(1, PopChar());
      }
      continue;
    }
    if (c == '\n' && !triple) {
      return ScanError(Span(start_pos, GetPos()),
                       "Unterminated string literal; newline seen before the "
                       "closing quote.");
    }
    if (c == quote) {
      if (!triple) {
        text.append(1, PopChar());
        break;
      }
      if (PeekCharOrNull(1) == quote && PeekCharOrNull(2) == quote) {
        DropChar(3);
        text.append(3, quote);
        break;
      }
    }
    text.append(1, PopChar());
  }
  return Token(TokenKind::kString, Span(start_pos, GetPos()), std::move(text));
}

absl::StatusOr<Token> Scanner::ScanNumber(const Pos& start_pos) {
  std::string s;
  const char c0 = PeekChar();
  const char c1 = absl::ascii_tolower(PeekCharOrNull(1));
  if (c0 == '0' && (c1 == 'x' || c1 == 'o' || c1 == 'b')) {
    s.append(1, PopChar());
    s.append(1, PopChar());
    std::function<bool(char)> is_radix_digit;
    if (c1 == 'x') {
      is_radix_digit = [](char c) {
        return absl::ascii_isxdigit(c) || c == '_';
      };
    } else if (c1 == 'o') {
      is_radix_digit = [](char c) {
        return ('0' <= c && c <= '7') || c == '_';
      };
    } else {
      is_radix_digit = [](char c) { return c == '0' || c == '1' || c == '_'; };
    }
    s = ScanWhile(std::move(s), is_radix_digit);
    if (s.size() == 2) {
      return ScanError(Span(start_pos, GetPos()),
                       absl::StrFormat("Expected digits following %s prefix.",
                                       s));
    }
  } else {
    bool is_int = true;
    s = ScanWhile("", IsDigitOrUnderscore);
    if (!AtCharEof() && PeekChar() == '.') {
      is_int = false;
      s.append(1, PopChar());
      s = ScanWhile(std::move(s), IsDigitOrUnderscore);
    }
    if (!AtCharEof() && (PeekChar() == 'e' || PeekChar() == 'E')) {
      const char n1 = PeekCharOrNull(1);
      const char n2 = PeekCharOrNull(2);
      if (absl::ascii_isdigit(n1) ||
          ((n1 == '+' || n1 == '-') && absl::ascii_isdigit(n2))) {
        is_int = false;
        s.append(1, PopChar());
        if (n1 == '+' || n1 == '-') {
          s.append(1, PopChar());
        }
        s = ScanWhile(std::move(s), IsDigitOrUnderscore);
      }
    }
    if (!AtCharEof() && (PeekChar() == 'j' || PeekChar() == 'J')) {
      is_int = false;
      s.append(1, PopChar());
    }
    if (is_int && s.size() > 1 && s[0] == '0' &&
        s.find_first_not_of("0_") != std::string::npos) {
      return ScanError(Span(start_pos, GetPos()),
                       "Leading zeros in decimal integer literals are not "
                       "permitted; use an 0o prefix for octal integers.");
    }
  }
  if (s.back() == '_' || s.find("__") != std::string::npos ||
      s.find("_.") != std::string::npos || s.find("._") != std::string::npos) {
    return ScanError(Span(start_pos, GetPos()),
                     absl::StrFormat("Invalid underscore in number: %s", s));
  }
  if (!AtCharEof() && IsIdentifierChar(PeekChar())) {
    return ScanError(
        Span(start_pos, GetPos()),
        absl::StrFormat("Invalid character '%c' in number literal.",
                        PeekChar()));
  }
  return Token(TokenKind::kNumber, Span(start_pos, GetPos()), std::move(s));
}

absl::StatusOr<Token> Scanner::ScanOperator(const Pos& start_pos) {
  auto mk = [&](TokenKind kind) {
    return Token(kind, Span(start_pos, GetPos()));
  };
  // Pops `suffix` if present and returns `with`, otherwise returns `without`.
  auto maybe = [&](char suffix, TokenKind with, TokenKind without) {
    return TryDropChar(suffix) ? with : without;
  };

  const char c = PopChar();
  switch (c) {
    case '(':
      bracket_depth_ += 1;
      return mk(TokenKind::kOParen);
    case '[':
      bracket_depth_ += 1;
      return mk(TokenKind::kOBrack);
    case '{':
      bracket_depth_ += 1;
      return mk(TokenKind::kOBrace);
    case ')':
    case ']':
    case '}': {
      if (bracket_depth_ > 0) {
        bracket_depth_ -= 1;
      }
      TokenKind kind = c == ')'   ? TokenKind::kCParen
                       : c == ']' ? TokenKind::kCBrack
                                  : TokenKind::kCBrace;
      return mk(kind);
    }
    // clang-format off
    case ',': return mk(TokenKind::kComma);  // NOLINT
    case ';': return mk(TokenKind::kSemi);  // NOLINT
    case '~': return mk(TokenKind::kTilde);  // NOLINT
    // clang-format on
    case ':':
      return mk(maybe('=', TokenKind::kColonEquals, TokenKind::kColon));
    case '.':
      if (PeekCharOrNull(0) == '.' && PeekCharOrNull(1) == '.') {
        DropChar(2);
        return mk(TokenKind::kEllipsis);
      }
      return mk(TokenKind::kDot);
    case '=':
      return mk(maybe('=', TokenKind::kDoubleEquals, TokenKind::kEquals));
    case '!':
      if (TryDropChar('=')) {
        return mk(TokenKind::kBangEquals);
      }
      break;
    case '<':
      if (TryDropChar('<')) {
        return mk(maybe('=', TokenKind::kDoubleOAngleEquals,
                        TokenKind::kDoubleOAngle));
      }
      return mk(maybe('=', TokenKind::kOAngleEquals, TokenKind::kOAngle));
    case '>':
      if (TryDropChar('>')) {
        return mk(maybe('=', TokenKind::kDoubleCAngleEquals,
                        TokenKind::kDoubleCAngle));
      }
      return mk(maybe('=', TokenKind::kCAngleEquals, TokenKind::kCAngle));
    case '+':
      return mk(maybe('=', TokenKind::kPlusEquals, TokenKind::kPlus));
    case '-':
      if (TryDropChar('>')) {
        return mk(TokenKind::kArrow);
      }
      return mk(maybe('=', TokenKind::kMinusEquals, TokenKind::kMinus));
    case '*':
      if (TryDropChar('*')) {
        return mk(maybe('=', TokenKind::kDoubleStarEquals,
                        TokenKind::kDoubleStar));
      }
      return mk(maybe('=', TokenKind::kStarEquals, TokenKind::kStar));
    case '/':
      if (TryDropChar('/')) {
        return mk(maybe('=', TokenKind::kDoubleSlashEquals,
                        TokenKind::kDoubleSlash));
      }
      return mk(maybe('=', TokenKind::kSlashEquals, TokenKind::kSlash));
    case '%':
      return mk(maybe('=', TokenKind::kPercentEquals, TokenKind::kPercent));
    case '&':
      return mk(maybe('=', TokenKind::kAmpersandEquals, TokenKind::kAmpersand));
    case '|':
      return mk(maybe('=', TokenKind::kBarEquals, TokenKind::kBar));
    case '^':
      return mk(maybe('=', TokenKind::kHatEquals, TokenKind::kHat));
    case '@':
      return mk(maybe('=', TokenKind::kAtEquals, TokenKind::kAt));
    default:
      break;
  }
  return ScanError(Span(start_pos, GetPos()),
                   absl::StrFormat("Unrecognized character: '%c' (%#x)", c,
                                   static_cast<unsigned char>(c)));
}

std::string KeywordToString(Keyword keyword) {
  switch (keyword) {
#define MAKE_CASE(__enum, unused, __str, ...) \
  case Keyword::__enum:                       \
    return __str;
    CORAL_KEYWORDS(MAKE_CASE)
#undef MAKE_CASE
  }
  return absl::StrFormat("<invalid Keyword(%d)>", static_cast<int>(keyword));
}

std::string TokenKindToString(TokenKind kind) {
  switch (kind) {
#define MAKE_CASE(__enum, unused, __str, ...) \
  case TokenKind::__enum:                     \
    return __str;
    CORAL_TOKEN_KINDS(MAKE_CASE)
#undef MAKE_CASE
  }
  return absl::StrFormat("<invalid TokenKind(%d)>", static_cast<int>(kind));
}

}  // namespace coral
