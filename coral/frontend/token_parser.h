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

#ifndef CORAL_FRONTEND_TOKEN_PARSER_H_
#define CORAL_FRONTEND_TOKEN_PARSER_H_

#include <optional>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "coral/common/logging/logging.h"
#include "coral/common/status/status_macros.h"
#include "coral/frontend/errors.h"
#include "coral/frontend/scanner.h"

namespace coral {

// Single-token-lookahead helper layer over a Scanner; the recursive descent
// Parser derives from this.
class TokenParser {
 public:
  explicit TokenParser(Scanner* scanner)
      : scanner_(CORAL_DIE_IF_NULL(scanner)),
        last_limit_(scanner_->GetPos()) {}

 protected:
  // Returns the current position of the parser in the text, via its current
  // position the token stream.
  Pos GetPos() const {
    if (lookahead_.has_value()) {
      return lookahead_->span().start();
    }
    return scanner_->GetPos();
  }

  absl::StatusOr<std::optional<Token>> TryPopToken(TokenKind target) {
    CORAL_ASSIGN_OR_RETURN(const Token* peek, PeekToken());
    if (peek->kind() == target) {
      return PopTokenOrDie();
    }
    return std::nullopt;
  }

  absl::StatusOr<std::optional<Token>> TryPopKeyword(Keyword target) {
    CORAL_ASSIGN_OR_RETURN(const Token* peek, PeekToken());
    if (peek->IsKeyword(target)) {
      return PopTokenOrDie();
    }
    return std::nullopt;
  }

  absl::StatusOr<bool> TryDropToken(TokenKind target) {
    CORAL_ASSIGN_OR_RETURN(const Token* peek, PeekToken());
    if (peek->kind() == target) {
      DropTokenOrDie();
      return true;
    }
    return false;
  }

  absl::StatusOr<bool> TryDropKeyword(Keyword target) {
    CORAL_ASSIGN_OR_RETURN(const Token* peek, PeekToken());
    if (peek->IsKeyword(target)) {
      DropTokenOrDie();
      return true;
    }
    return false;
  }

  absl::StatusOr<const Token*> PeekToken() {
    if (lookahead_.has_value()) {
      return &*lookahead_;
    }

    CORAL_ASSIGN_OR_RETURN(lookahead_, scanner_->Pop());
    CORAL_CHECK(lookahead_.has_value());
    return &*lookahead_;
  }

  // Returns a token that has been popped destructively from the token stream.
  absl::StatusOr<Token> PopToken() {
    CORAL_ASSIGN_OR_RETURN(const Token* unused, PeekToken());
    (void)unused;
    CORAL_CHECK(lookahead_.has_value());
    Token tok = std::move(lookahead_).value();
    lookahead_ = std::nullopt;
    last_limit_ = tok.span().limit();
    return tok;
  }

  absl::StatusOr<std::string> PopIdentifierOrError() {
    CORAL_ASSIGN_OR_RETURN(Token tok, PopTokenOrError(TokenKind::kIdentifier));
    return *tok.GetValue();
  }

  // For use only when the caller knows there is lookahead present (in which
  // case we don't need to check for errors in potentially scanning the next
  // token).
  Token PopTokenOrDie() {
    CORAL_CHECK(lookahead_.has_value());
    return PopToken().value();
  }

  // Wraps PopToken() to signify popping a token without needing the value.
  absl::Status DropToken() { return PopToken().status(); }

  void DropTokenOrDie() { CORAL_CHECK_OK(DropToken()); }

  absl::StatusOr<bool> PeekTokenIs(TokenKind target) {
    CORAL_ASSIGN_OR_RETURN(const Token* tok, PeekToken());
    return tok->kind() == target;
  }
  absl::StatusOr<bool> PeekTokenIs(Keyword target) {
    CORAL_ASSIGN_OR_RETURN(const Token* tok, PeekToken());
    return tok->IsKeyword(target);
  }
  absl::StatusOr<bool> PeekTokenIn(absl::Span<TokenKind const> targets) {
    CORAL_ASSIGN_OR_RETURN(const Token* tok, PeekToken());
    for (TokenKind target : targets) {
      if (target == tok->kind()) {
        return true;
      }
    }
    return false;
  }

  absl::StatusOr<Token> PopTokenOrError(TokenKind target,
                                        const Token* start = nullptr,
                                        absl::string_view context = "") {
    CORAL_ASSIGN_OR_RETURN(const Token* tok, PeekToken());
    if (tok->kind() == target) {
      return PopToken();
    }
    std::string msg;
    if (start == nullptr) {
      msg = absl::StrFormat("Expected '%s', got '%s'",
                            TokenKindToString(target), tok->ToErrorString());
    } else {
      msg = absl::StrFormat(
          "Expected '%s' for construct starting with '%s' @ %s, got '%s'",
          TokenKindToString(target), start->ToErrorString(),
          start->span().ToString(), tok->ToErrorString());
    }
    if (!context.empty()) {
      msg = absl::StrCat(msg, ": ", context);
    }
    return ParseErrorStatus(tok->span(), msg);
  }

  // Wrapper around PopTokenOrError that does not return the token. Helps
  // signify that the intent was to drop the token in the caller code vs
  // 'forgetting' to do something with the popped token.
  absl::Status DropTokenOrError(TokenKind target, const Token* start = nullptr,
                                absl::string_view context = "") {
    CORAL_ASSIGN_OR_RETURN(Token token,
                           PopTokenOrError(target, start, context));
    (void)token;
    return absl::OkStatus();
  }

  absl::StatusOr<Token> PopKeywordOrError(Keyword keyword,
                                          absl::string_view context = "") {
    CORAL_ASSIGN_OR_RETURN(const Token* peek, PeekToken());
    if (peek->IsKeyword(keyword)) {
      return PopToken();
    }
    std::string msg =
        absl::StrFormat("Expected keyword '%s', got '%s'",
                        KeywordToString(keyword), peek->ToErrorString());
    if (!context.empty()) {
      msg = absl::StrCat(msg, ": ", context);
    }
    return ParseErrorStatus(peek->span(), msg);
  }

  absl::Status DropKeywordOrError(Keyword target) {
    CORAL_ASSIGN_OR_RETURN(Token token, PopKeywordOrError(target));
    (void)token;
    return absl::OkStatus();
  }

  // Returns the limit position of the most recently popped token; used as the
  // limit of the span of a production that has just been parsed.
  const Pos& GetLastLimit() const { return last_limit_; }

  // Returns a span from `start` to the end of the last popped token.
  Span SpanFrom(const Pos& start) const {
    if (last_limit_ < start) {
      return Span(start, start);
    }
    return Span(start, last_limit_);
  }

 private:
  Scanner* scanner_;
  std::optional<Token> lookahead_;
  Pos last_limit_;
};

}  // namespace coral

#endif  // CORAL_FRONTEND_TOKEN_PARSER_H_
