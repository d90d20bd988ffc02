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

#ifndef CORAL_FRONTEND_SCANNER_H_
#define CORAL_FRONTEND_SCANNER_H_

#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "absl/base/attributes.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "coral/common/logging/logging.h"
#include "coral/common/status/status_macros.h"
#include "coral/frontend/comment_data.h"
#include "coral/frontend/pos.h"

namespace coral {

#define CORAL_TOKEN_KINDS(X)                          \
  /* enum, pyname, str */                             \
  X(kEof, EOF, "EOF")                                 \
  X(kNewline, NEWLINE, "newline")                     \
  X(kIndent, INDENT, "indent")                        \
  X(kDedent, DEDENT, "dedent")                        \
  X(kKeyword, KEYWORD, "keyword")                     \
  X(kIdentifier, IDENTIFIER, "identifier")            \
  X(kNumber, NUMBER, "number")                        \
  X(kString, STRING, "string")                        \
  X(kOParen, OPAREN, "(")                             \
  X(kCParen, CPAREN, ")")                             \
  X(kOBrack, OBRACK, "[")                             \
  X(kCBrack, CBRACK, "]")                             \
  X(kOBrace, OBRACE, "{")                             \
  X(kCBrace, CBRACE, "}")                             \
  X(kDot, DOT, ".")                                   \
  X(kEllipsis, ELLIPSIS, "...")                       \
  X(kComma, COMMA, ",")                               \
  X(kColon, COLON, ":")                               \
  X(kColonEquals, COLON_EQUALS, ":=")                 \
  X(kSemi, SEMI, ";")                                 \
  X(kArrow, ARROW, "->")                              \
  X(kAt, AT, "@")                                     \
  X(kEquals, EQUALS, "=")                             \
  X(kPlus, PLUS, "+")                                 \
  X(kMinus, MINUS, "-")                               \
  X(kStar, STAR, "*")                                 \
  X(kDoubleStar, DOUBLE_STAR, "**")                   \
  X(kSlash, SLASH, "/")                               \
  X(kDoubleSlash, DOUBLE_SLASH, "//")                 \
  X(kPercent, PERCENT, "%")                           \
  X(kAmpersand, AMPERSAND, "&")                       \
  X(kBar, BAR, "|")                                   \
  X(kHat, HAT, "^")                                   \
  X(kTilde, TILDE, "~")                               \
  X(kDoubleOAngle, DOUBLE_OANGLE, "<<")               \
  X(kDoubleCAngle, DOUBLE_CANGLE, ">>")               \
  X(kOAngle, OANGLE, "<")                             \
  X(kCAngle, CANGLE, ">")                             \
  X(kOAngleEquals, OANGLE_EQUALS, "<=")               \
  X(kCAngleEquals, CANGLE_EQUALS, ">=")               \
  X(kDoubleEquals, DOUBLE_EQUALS, "==")               \
  X(kBangEquals, BANG_EQUALS, "!=")                   \
  /* augmented assignment */                          \
  X(kPlusEquals, PLUS_EQUALS, "+=")                   \
  X(kMinusEquals, MINUS_EQUALS, "-=")                 \
  X(kStarEquals, STAR_EQUALS, "*=")                   \
  X(kDoubleStarEquals, DOUBLE_STAR_EQUALS, "**=")     \
  X(kSlashEquals, SLASH_EQUALS, "/=")                 \
  X(kDoubleSlashEquals, DOUBLE_SLASH_EQUALS, "//=")   \
  X(kPercentEquals, PERCENT_EQUALS, "%=")             \
  X(kAtEquals, AT_EQUALS, "@=")                       \
  X(kAmpersandEquals, AMPERSAND_EQUALS, "&=")         \
  X(kBarEquals, BAR_EQUALS, "|=")                     \
  X(kHatEquals, HAT_EQUALS, "^=")                     \
  X(kDoubleOAngleEquals, DOUBLE_OANGLE_EQUALS, "<<=") \
  X(kDoubleCAngleEquals, DOUBLE_CANGLE_EQUALS, ">>=")

#define CORAL_KEYWORDS(X)             \
  /* enum, pyname, str */             \
  X(kFalse, FALSE, "False")           \
  X(kNone, NONE, "None")              \
  X(kTrue, TRUE, "True")              \
  X(kAnd, AND, "and")                 \
  X(kAs, AS, "as")                    \
  X(kAssert, ASSERT, "assert")        \
  X(kAsync, ASYNC, "async")           \
  X(kAwait, AWAIT, "await")           \
  X(kBreak, BREAK, "break")           \
  X(kClass, CLASS, "class")           \
  X(kContinue, CONTINUE, "continue")  \
  X(kDef, DEF, "def")                 \
  X(kDel, DEL, "del")                 \
  X(kElif, ELIF, "elif")              \
  X(kElse, ELSE, "else")              \
  X(kExcept, EXCEPT, "except")        \
  X(kFinally, FINALLY, "finally")     \
  X(kFor, FOR, "for")                 \
  X(kFrom, FROM, "from")              \
  X(kGlobal, GLOBAL, "global")        \
  X(kIf, IF, "if")                    \
  X(kImport, IMPORT, "import")        \
  X(kIn, IN, "in")                    \
  X(kIs, IS, "is")                    \
  X(kLambda, LAMBDA, "lambda")        \
  X(kNonlocal, NONLOCAL, "nonlocal")  \
  X(kNot, NOT, "not")                 \
  X(kOr, OR, "or")                    \
  X(kPass, PASS, "pass")              \
  X(kRaise, RAISE, "raise")           \
  X(kReturn, RETURN, "return")        \
  X(kTry, TRY, "try")                 \
  X(kWhile, WHILE, "while")           \
  X(kWith, WITH, "with")              \
  X(kYield, YIELD, "yield")

#define CORAL_FIRST_COMMA(A, ...) A,

enum class TokenKind { CORAL_TOKEN_KINDS(CORAL_FIRST_COMMA) };

std::string TokenKindToString(TokenKind kind);

inline std::ostream& operator<<(std::ostream& os, TokenKind kind) {
  os << TokenKindToString(kind);
  return os;
}

enum class Keyword { CORAL_KEYWORDS(CORAL_FIRST_COMMA) };

std::string KeywordToString(Keyword keyword);

// Token yielded by the Scanner below.
//
// Number and string tokens carry their source spelling as the value (for
// strings including the prefix and the quotes); decoding happens in the
// parser.
class Token {
 public:
  Token(TokenKind kind, Span span,
        std::optional<std::string> value = std::nullopt)
      : kind_(kind), span_(std::move(span)), payload_(std::move(value)) {}
  Token(Span span, Keyword keyword)
      : kind_(TokenKind::kKeyword), span_(std::move(span)), payload_(keyword) {}

  TokenKind kind() const { return kind_; }
  const Span& span() const { return span_; }

  std::optional<std::string> GetValue() const {
    if (std::holds_alternative<Keyword>(payload_)) {
      return KeywordToString(GetKeyword());
    }
    return std::get<std::optional<std::string>>(payload_);
  }

  // Note: assumes that the payload is not a keyword.
  const std::string& GetStringValue() const {
    return *std::get<std::optional<std::string>>(payload_);
  }

  Keyword GetKeyword() const { return std::get<Keyword>(payload_); }

  bool IsKeyword(Keyword target) const {
    return kind_ == TokenKind::kKeyword && GetKeyword() == target;
  }
  bool IsKeywordIn(absl::Span<Keyword const> targets) const {
    if (kind_ != TokenKind::kKeyword) {
      return false;
    }
    for (Keyword target : targets) {
      if (GetKeyword() == target) {
        return true;
      }
    }
    return false;
  }

  // Returns a string that represents this token suitable for use in displaying
  // this token for user error reporting; e.g. "keyword:else".
  std::string ToErrorString() const;

  std::string ToString() const;

 private:
  TokenKind kind_;
  Span span_;
  std::variant<std::optional<std::string>, Keyword> payload_;
};

// Converts the conceptual character stream in a string of text into a stream of
// tokens according to the Python lexical rules, including the layout tokens
// NEWLINE, INDENT and DEDENT.
//
// Comments are not returned as tokens; they are collected (in position order)
// as the scan proceeds and are available via comments().
class Scanner {
 public:
  Scanner(std::string filename, std::string text)
      : filename_(std::move(filename)), text_(std::move(text)) {}

  // Creates a scanner for a stand-alone expression, e.g. a replacement field
  // of a formatted string literal. The text behaves as if enclosed in
  // brackets: newlines are insignificant and no layout tokens are produced.
  // Positions are reported relative to `start`.
  static Scanner ForExpression(const Pos& start, std::string text);

  // Gets the current position in the character stream.
  Pos GetPos() const { return Pos(filename_, lineno_, colno_); }

  // Pops a token from the current position in the character stream, or returns
  // a status error if no token can be scanned out.
  //
  // At the end of the character stream a NEWLINE is produced if the last line
  // had tokens, then one DEDENT for every open indentation level, then EOF
  // tokens on every subsequent call.
  absl::StatusOr<Token> Pop();

  // Pops all tokens from the token stream until the EOF token (inclusive) and
  // returns them as a sequence.
  absl::StatusOr<std::vector<Token>> PopAll() {
    std::vector<Token> tokens;
    while (!AtEof()) {
      CORAL_ASSIGN_OR_RETURN(Token tok, Pop());
      tokens.push_back(tok);
    }
    return tokens;
  }

  // Returns whether the EOF token has been produced.
  bool AtEof() const { return eof_popped_; }

  // Comments seen so far, in the order they appear in the text.
  const std::vector<CommentData>& comments() const { return comments_; }
  std::vector<CommentData> TakeComments() { return std::move(comments_); }

 private:
  // Helper routine that creates a canonically-formatted scan error (which uses
  // the status code for an InvalidArgumentError, on the assumption the invalid
  // argument is the input text character stream).
  absl::Status ScanError(const Span& span, absl::string_view message) const {
    return absl::InvalidArgumentError(
        absl::StrFormat("ScanError: %s %s", span.ToString(), message));
  }

  // Determines whether string "s" matches a keyword -- if so, returns the
  // keyword enum that it corresponds to. Otherwise, typically the caller will
  // assume s is an identifier.
  static std::optional<Keyword> GetKeyword(absl::string_view s);

  // Processes the indentation at the start of a logical line. Blank and
  // comment-only lines are consumed entirely. Queues the INDENT/DEDENT tokens
  // implied by the indentation of the first non-blank line.
  absl::Status ScanIndentation();

  // Drops spaces, tabs, explicit line joins and comments on the current line.
  // Inside brackets newlines are dropped as well.
  void DropWhitespaceAndComments();

  // Pops a comment starting at the current `#` and records it.
  void PopComment();

  // Scans a number token out of the character stream. Note the number may have
  // a base determined by a radix-noting prefix; e.g. "0x" or "0b".
  //
  // Precondition: The character stream must be positioned over either a digit
  // or a '.' followed by a digit.
  absl::StatusOr<Token> ScanNumber(const Pos& start_pos);

  // Scans a string literal whose (already popped) prefix is `prefix`.
  //
  // Precondition: The character stream must be positioned at an open quote.
  absl::StatusOr<Token> ScanString(std::string prefix, const Pos& start_pos);

  // Scans the identifier-looking entity starting at the current position;
  // yields a keyword, an identifier, or (for a string prefix followed by a
  // quote) a string token.
  absl::StatusOr<Token> ScanIdentifierOrKeyword(const Pos& start_pos);

  // Scans an operator or delimiter token.
  absl::StatusOr<Token> ScanOperator(const Pos& start_pos);

  // Scans from the current position until ftake returns false or EOF is
  // reached.
  std::string ScanWhile(std::string s, const std::function<bool(char)>& ftake) {
    while (!AtCharEof()) {
      char peek = PeekChar();
      if (!ftake(peek)) {
        break;
      }
      s.append(1, PopChar());
    }
    return s;
  }

  // Queues the tokens that terminate the stream: NEWLINE (if the current line
  // has tokens), the DEDENTs for every open indentation level, and EOF.
  void QueueEndOfStream();

  // Returns whether the input character stream has been exhausted.
  bool AtCharEof() const {
    CORAL_CHECK_LE(index_, static_cast<int64_t>(text_.size()));
    return index_ == static_cast<int64_t>(text_.size());
  }

  // Peeks at the character at the head of the character stream.
  //
  // Precondition: have not hit the end of the character stream (i.e.
  // `!AtCharEof()`).
  char PeekChar() const {
    CORAL_CHECK_LT(index_, static_cast<int64_t>(text_.size()));
    return text_[index_];
  }

  // Peeks at the character `offset` positions after the head of the character
  // stream. If there is no such character in the character stream, returns
  // '\0'.
  char PeekCharOrNull(int64_t offset) const {
    if (index_ + offset >= static_cast<int64_t>(text_.size())) {
      return '\0';
    }
    return text_[index_ + offset];
  }

  // Pops a character from the head of the character stream and returns it.
  //
  // Precondition: the character stream is not extinguished (in which case this
  // routine will check-fail).
  ABSL_MUST_USE_RESULT char PopChar();

  // Drops "count" characters from the head of the character stream.
  void DropChar(int64_t count = 1);

  // Attempts to drop a character equal to "target": if it is present at the
  // head of the character stream, drops it and return true; otherwise
  // (including if we are at end of file) returns false.
  bool TryDropChar(char target);

  std::string filename_;
  std::string text_;
  int64_t index_ = 0;
  int64_t lineno_ = 0;
  int64_t colno_ = 0;

  // Stack of indentation columns of the enclosing blocks; never empty.
  std::vector<int64_t> indent_stack_ = {0};
  // Layout tokens that have been determined but not yet popped.
  std::deque<Token> pending_;
  int64_t bracket_depth_ = 0;
  bool at_line_start_ = true;
  bool line_has_tokens_ = false;
  bool expression_mode_ = false;
  bool end_queued_ = false;
  bool eof_popped_ = false;
  std::vector<CommentData> comments_;
};

}  // namespace coral

#endif  // CORAL_FRONTEND_SCANNER_H_
