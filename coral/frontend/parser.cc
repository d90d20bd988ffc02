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

#include "coral/frontend/parser.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "coral/common/logging/logging.h"
#include "coral/common/status/status_macros.h"
#include "coral/frontend/errors.h"
#include "coral/frontend/number_literal.h"
#include "coral/frontend/string_literal.h"

namespace coral {
namespace {

constexpr TokenKind kBitOrKinds[] = {TokenKind::kBar};
constexpr TokenKind kBitXorKinds[] = {TokenKind::kHat};
constexpr TokenKind kBitAndKinds[] = {TokenKind::kAmpersand};
constexpr TokenKind kShiftKinds[] = {TokenKind::kDoubleOAngle,
                                     TokenKind::kDoubleCAngle};
constexpr TokenKind kArithKinds[] = {TokenKind::kPlus, TokenKind::kMinus};
constexpr TokenKind kTermKinds[] = {TokenKind::kStar, TokenKind::kSlash,
                                    TokenKind::kDoubleSlash,
                                    TokenKind::kPercent, TokenKind::kAt};
constexpr TokenKind kAugAssignKinds[] = {
    TokenKind::kPlusEquals,         TokenKind::kMinusEquals,
    TokenKind::kStarEquals,         TokenKind::kDoubleStarEquals,
    TokenKind::kSlashEquals,        TokenKind::kDoubleSlashEquals,
    TokenKind::kPercentEquals,      TokenKind::kAtEquals,
    TokenKind::kAmpersandEquals,    TokenKind::kBarEquals,
    TokenKind::kHatEquals,          TokenKind::kDoubleOAngleEquals,
    TokenKind::kDoubleCAngleEquals,
};
constexpr TokenKind kSliceBoundEndKinds[] = {
    TokenKind::kColon, TokenKind::kCBrack, TokenKind::kComma};

// Returns the binary operation denoted by an operator or augmented assignment
// token.
absl::StatusOr<BinopKind> BinopKindFromTokenKind(TokenKind kind) {
  switch (kind) {
    case TokenKind::kPlus:
    case TokenKind::kPlusEquals:
      return BinopKind::kAdd;
    case TokenKind::kMinus:
    case TokenKind::kMinusEquals:
      return BinopKind::kSub;
    case TokenKind::kStar:
    case TokenKind::kStarEquals:
      return BinopKind::kMul;
    case TokenKind::kAt:
    case TokenKind::kAtEquals:
      return BinopKind::kMatMul;
    case TokenKind::kSlash:
    case TokenKind::kSlashEquals:
      return BinopKind::kDiv;
    case TokenKind::kDoubleSlash:
    case TokenKind::kDoubleSlashEquals:
      return BinopKind::kFloorDiv;
    case TokenKind::kPercent:
    case TokenKind::kPercentEquals:
      return BinopKind::kMod;
    case TokenKind::kDoubleStar:
    case TokenKind::kDoubleStarEquals:
      return BinopKind::kPow;
    case TokenKind::kDoubleOAngle:
    case TokenKind::kDoubleOAngleEquals:
      return BinopKind::kShl;
    case TokenKind::kDoubleCAngle:
    case TokenKind::kDoubleCAngleEquals:
      return BinopKind::kShr;
    case TokenKind::kBar:
    case TokenKind::kBarEquals:
      return BinopKind::kBitOr;
    case TokenKind::kHat:
    case TokenKind::kHatEquals:
      return BinopKind::kBitXor;
    case TokenKind::kAmpersand:
    case TokenKind::kAmpersandEquals:
      return BinopKind::kBitAnd;
    default:
      break;
  }
  return absl::InvalidArgumentError(absl::StrFormat(
      "Token is not a binary operator: %s", TokenKindToString(kind)));
}

// Returns the position reached by advancing over `text` from `start`.
Pos AdvancePos(const Pos& start, absl::string_view text) {
  int64_t lineno = start.lineno();
  int64_t colno = start.colno();
  for (char c : text) {
    if (c == '\n') {
      ++lineno;
      colno = 0;
    } else {
      ++colno;
    }
  }
  return Pos(start.filename(), lineno, colno);
}

}  // namespace

absl::StatusOr<ParsedModule> ParseModule(absl::string_view text,
                                         absl::string_view filename) {
  Scanner scanner{std::string(filename), std::string(text)};
  Parser parser(std::string(filename), &scanner);
  CORAL_ASSIGN_OR_RETURN(std::unique_ptr<Module> module, parser.ParseModule());
  std::vector<CommentData> comments = scanner.TakeComments();
  CORAL_VLOG(3) << "Parsed " << filename << ": " << module->body().size()
                << " top-level statement(s), " << comments.size()
                << " comment(s)";
  return ParsedModule{std::move(module), std::move(comments),
                      SourceLines(std::string(text))};
}

absl::StatusOr<std::unique_ptr<Module>> Parser::ParseModule() {
  CORAL_CHECK(owned_module_ != nullptr)
      << "Nested parsers do not own their module";
  StmtBlock body;
  while (true) {
    CORAL_ASSIGN_OR_RETURN(const Token* peek, PeekToken());
    if (peek->kind() == TokenKind::kEof) {
      break;
    }
    if (peek->kind() == TokenKind::kNewline) {
      DropTokenOrDie();
      continue;
    }
    CORAL_RETURN_IF_ERROR(ParseStatement(&body));
  }
  module_->set_body(std::move(body));
  return std::move(owned_module_);
}

absl::StatusOr<bool> Parser::PeekStartsExpression() {
  CORAL_ASSIGN_OR_RETURN(const Token* tok, PeekToken());
  switch (tok->kind()) {
    case TokenKind::kIdentifier:
    case TokenKind::kNumber:
    case TokenKind::kString:
    case TokenKind::kOParen:
    case TokenKind::kOBrack:
    case TokenKind::kOBrace:
    case TokenKind::kMinus:
    case TokenKind::kPlus:
    case TokenKind::kTilde:
    case TokenKind::kStar:
    case TokenKind::kEllipsis:
      return true;
    case TokenKind::kKeyword:
      return tok->IsKeywordIn({Keyword::kNot, Keyword::kLambda,
                               Keyword::kAwait, Keyword::kTrue,
                               Keyword::kFalse, Keyword::kNone});
    default:
      return false;
  }
}

// -- Statements

absl::Status Parser::ParseStatement(StmtBlock* block) {
  CORAL_ASSIGN_OR_RETURN(const Token* peek, PeekToken());
  const Pos start = peek->span().start();
  CORAL_VLOG(5) << "ParseStatement @ " << start << " peek: "
                << peek->ToString();
  if (peek->kind() == TokenKind::kIndent) {
    return ParseErrorStatus(peek->span(), "Unexpected indentation.");
  }
  if (peek->kind() == TokenKind::kAt) {
    CORAL_ASSIGN_OR_RETURN(Stmt * stmt, ParseDecorated(start));
    block->push_back(stmt);
    return absl::OkStatus();
  }
  if (peek->kind() == TokenKind::kKeyword) {
    Stmt* stmt = nullptr;
    switch (peek->GetKeyword()) {
      case Keyword::kIf: {
        DropTokenOrDie();
        CORAL_ASSIGN_OR_RETURN(stmt, ParseIf(start));
        break;
      }
      case Keyword::kWhile: {
        DropTokenOrDie();
        CORAL_ASSIGN_OR_RETURN(stmt, ParseWhile(start));
        break;
      }
      case Keyword::kFor: {
        DropTokenOrDie();
        CORAL_ASSIGN_OR_RETURN(stmt, ParseFor(start));
        break;
      }
      case Keyword::kTry: {
        DropTokenOrDie();
        CORAL_ASSIGN_OR_RETURN(stmt, ParseTry(start));
        break;
      }
      case Keyword::kWith: {
        DropTokenOrDie();
        CORAL_ASSIGN_OR_RETURN(stmt, ParseWith(start));
        break;
      }
      case Keyword::kDef: {
        DropTokenOrDie();
        CORAL_ASSIGN_OR_RETURN(stmt, ParseFunction(start, start, {}));
        break;
      }
      case Keyword::kClass: {
        DropTokenOrDie();
        CORAL_ASSIGN_OR_RETURN(stmt, ParseClass(start, start, {}));
        break;
      }
      case Keyword::kAsync:
        return ParseErrorStatus(peek->span(),
                                "'async' constructs are not supported.");
      default:
        break;
    }
    if (stmt != nullptr) {
      block->push_back(stmt);
      return absl::OkStatus();
    }
  }
  return ParseSimpleStatements(block);
}

absl::StatusOr<StmtBlock> Parser::ParseBlock() {
  CORAL_RETURN_IF_ERROR(DropTokenOrError(TokenKind::kColon));
  StmtBlock block;
  CORAL_ASSIGN_OR_RETURN(bool is_suite, TryDropToken(TokenKind::kNewline));
  if (!is_suite) {
    CORAL_RETURN_IF_ERROR(ParseSimpleStatements(&block));
    return block;
  }
  CORAL_RETURN_IF_ERROR(DropTokenOrError(TokenKind::kIndent, /*start=*/nullptr,
                                         "expected an indented block"));
  while (true) {
    CORAL_ASSIGN_OR_RETURN(bool dedented, TryDropToken(TokenKind::kDedent));
    if (dedented) {
      break;
    }
    CORAL_RETURN_IF_ERROR(ParseStatement(&block));
  }
  return block;
}

absl::Status Parser::ParseSimpleStatements(StmtBlock* block) {
  while (true) {
    CORAL_ASSIGN_OR_RETURN(Stmt * stmt, ParseSmallStatement());
    block->push_back(stmt);
    CORAL_ASSIGN_OR_RETURN(bool dropped_semi, TryDropToken(TokenKind::kSemi));
    if (!dropped_semi) {
      break;
    }
    CORAL_ASSIGN_OR_RETURN(bool at_newline, PeekTokenIs(TokenKind::kNewline));
    if (at_newline) {
      break;
    }
  }
  return DropTokenOrError(TokenKind::kNewline, /*start=*/nullptr,
                          "expected end of statement");
}

absl::StatusOr<Stmt*> Parser::ParseSmallStatement() {
  CORAL_ASSIGN_OR_RETURN(const Token* peek, PeekToken());
  const Pos start = peek->span().start();
  if (peek->kind() != TokenKind::kKeyword) {
    return ParseExpressionStatement(start);
  }
  switch (peek->GetKeyword()) {
    case Keyword::kPass:
      DropTokenOrDie();
      return module_->Make<Pass>(SpanFrom(start));
    case Keyword::kBreak:
      DropTokenOrDie();
      return module_->Make<Break>(SpanFrom(start));
    case Keyword::kContinue:
      DropTokenOrDie();
      return module_->Make<Continue>(SpanFrom(start));
    case Keyword::kReturn: {
      DropTokenOrDie();
      Expr* value = nullptr;
      CORAL_ASSIGN_OR_RETURN(bool has_value, PeekStartsExpression());
      if (has_value) {
        CORAL_ASSIGN_OR_RETURN(value, ParseTestListStarExpr());
      }
      return module_->Make<Return>(SpanFrom(start), value);
    }
    case Keyword::kRaise: {
      DropTokenOrDie();
      Expr* exc = nullptr;
      Expr* cause = nullptr;
      CORAL_ASSIGN_OR_RETURN(bool has_exc, PeekStartsExpression());
      if (has_exc) {
        CORAL_ASSIGN_OR_RETURN(exc, ParseTest());
        CORAL_ASSIGN_OR_RETURN(bool has_cause, TryDropKeyword(Keyword::kFrom));
        if (has_cause) {
          CORAL_ASSIGN_OR_RETURN(cause, ParseTest());
        }
      }
      return module_->Make<Raise>(SpanFrom(start), exc, cause);
    }
    case Keyword::kGlobal: {
      DropTokenOrDie();
      CORAL_ASSIGN_OR_RETURN(std::vector<std::string> names, ParseNameList());
      return module_->Make<Global>(SpanFrom(start), std::move(names));
    }
    case Keyword::kNonlocal: {
      DropTokenOrDie();
      CORAL_ASSIGN_OR_RETURN(std::vector<std::string> names, ParseNameList());
      return module_->Make<Nonlocal>(SpanFrom(start), std::move(names));
    }
    case Keyword::kDel: {
      DropTokenOrDie();
      std::vector<Expr*> targets;
      while (true) {
        CORAL_ASSIGN_OR_RETURN(Expr * target, ParseTarget());
        targets.push_back(target);
        CORAL_ASSIGN_OR_RETURN(bool dropped_comma,
                               TryDropToken(TokenKind::kComma));
        if (!dropped_comma) {
          break;
        }
        CORAL_ASSIGN_OR_RETURN(bool more, PeekStartsExpression());
        if (!more) {
          break;
        }
      }
      return module_->Make<Delete>(SpanFrom(start), std::move(targets));
    }
    case Keyword::kAssert: {
      DropTokenOrDie();
      CORAL_ASSIGN_OR_RETURN(Expr * test, ParseTest());
      Expr* msg = nullptr;
      CORAL_ASSIGN_OR_RETURN(bool has_msg, TryDropToken(TokenKind::kComma));
      if (has_msg) {
        CORAL_ASSIGN_OR_RETURN(msg, ParseTest());
      }
      return module_->Make<Assert>(SpanFrom(start), test, msg);
    }
    case Keyword::kImport:
      DropTokenOrDie();
      return ParseImport(start);
    case Keyword::kFrom:
      DropTokenOrDie();
      return ParseImportFrom(start);
    default:
      return ParseExpressionStatement(start);
  }
}

absl::StatusOr<Stmt*> Parser::ParseExpressionStatement(const Pos& start) {
  // The right hand side of an assignment may be a yield expression.
  auto parse_value = [this]() -> absl::StatusOr<Expr*> {
    CORAL_ASSIGN_OR_RETURN(const Token* peek, PeekToken());
    if (peek->IsKeyword(Keyword::kYield)) {
      const Pos yield_start = peek->span().start();
      DropTokenOrDie();
      return ParseYield(yield_start);
    }
    return ParseTestListStarExpr();
  };

  CORAL_ASSIGN_OR_RETURN(Expr * first, parse_value());
  CORAL_ASSIGN_OR_RETURN(const Token* peek, PeekToken());
  switch (peek->kind()) {
    case TokenKind::kEquals: {
      std::vector<Expr*> targets = {first};
      while (true) {
        CORAL_ASSIGN_OR_RETURN(bool dropped, TryDropToken(TokenKind::kEquals));
        if (!dropped) {
          break;
        }
        CORAL_ASSIGN_OR_RETURN(Expr * rhs, parse_value());
        targets.push_back(rhs);
      }
      Expr* value = targets.back();
      targets.pop_back();
      return module_->Make<Assign>(SpanFrom(start), std::move(targets), value);
    }
    case TokenKind::kColon: {
      DropTokenOrDie();
      CORAL_ASSIGN_OR_RETURN(Expr * annotation, ParseTest());
      Expr* value = nullptr;
      CORAL_ASSIGN_OR_RETURN(bool has_value, TryDropToken(TokenKind::kEquals));
      if (has_value) {
        CORAL_ASSIGN_OR_RETURN(value, parse_value());
      }
      return module_->Make<AnnAssign>(SpanFrom(start), first, annotation,
                                      value);
    }
    default:
      break;
  }
  CORAL_ASSIGN_OR_RETURN(bool is_aug_assign, PeekTokenIn(kAugAssignKinds));
  if (is_aug_assign) {
    Token op = PopTokenOrDie();
    CORAL_ASSIGN_OR_RETURN(BinopKind kind, BinopKindFromTokenKind(op.kind()));
    CORAL_ASSIGN_OR_RETURN(Expr * value, parse_value());
    return module_->Make<AugAssign>(SpanFrom(start), first, kind, value);
  }
  return module_->Make<ExprStmt>(SpanFrom(start), first);
}

absl::StatusOr<std::string> Parser::ParseDottedName() {
  CORAL_ASSIGN_OR_RETURN(std::string name, PopIdentifierOrError());
  while (true) {
    CORAL_ASSIGN_OR_RETURN(bool dropped_dot, TryDropToken(TokenKind::kDot));
    if (!dropped_dot) {
      break;
    }
    CORAL_ASSIGN_OR_RETURN(std::string part, PopIdentifierOrError());
    absl::StrAppend(&name, ".", part);
  }
  return name;
}

absl::StatusOr<Alias*> Parser::ParseAlias(bool dotted) {
  CORAL_ASSIGN_OR_RETURN(Pos start, PeekPos());
  std::string name;
  if (dotted) {
    CORAL_ASSIGN_OR_RETURN(name, ParseDottedName());
  } else {
    CORAL_ASSIGN_OR_RETURN(name, PopIdentifierOrError());
  }
  std::optional<std::string> asname;
  CORAL_ASSIGN_OR_RETURN(bool has_as, TryDropKeyword(Keyword::kAs));
  if (has_as) {
    CORAL_ASSIGN_OR_RETURN(asname, PopIdentifierOrError());
  }
  return module_->Make<Alias>(SpanFrom(start), std::move(name),
                              std::move(asname));
}

absl::StatusOr<std::vector<std::string>> Parser::ParseNameList() {
  std::vector<std::string> names;
  while (true) {
    CORAL_ASSIGN_OR_RETURN(std::string name, PopIdentifierOrError());
    names.push_back(std::move(name));
    CORAL_ASSIGN_OR_RETURN(bool dropped_comma, TryDropToken(TokenKind::kComma));
    if (!dropped_comma) {
      break;
    }
  }
  return names;
}

absl::StatusOr<Stmt*> Parser::ParseImport(const Pos& start) {
  std::vector<Alias*> names;
  while (true) {
    CORAL_ASSIGN_OR_RETURN(Alias * alias, ParseAlias(/*dotted=*/true));
    names.push_back(alias);
    CORAL_ASSIGN_OR_RETURN(bool dropped_comma, TryDropToken(TokenKind::kComma));
    if (!dropped_comma) {
      break;
    }
  }
  return module_->Make<Import>(SpanFrom(start), std::move(names));
}

absl::StatusOr<Stmt*> Parser::ParseImportFrom(const Pos& start) {
  int64_t level = 0;
  while (true) {
    CORAL_ASSIGN_OR_RETURN(bool dropped_dot, TryDropToken(TokenKind::kDot));
    if (dropped_dot) {
      level += 1;
      continue;
    }
    CORAL_ASSIGN_OR_RETURN(bool dropped_ellipsis,
                           TryDropToken(TokenKind::kEllipsis));
    if (dropped_ellipsis) {
      level += 3;
      continue;
    }
    break;
  }
  std::string module_name;
  CORAL_ASSIGN_OR_RETURN(bool has_name, PeekTokenIs(TokenKind::kIdentifier));
  if (has_name) {
    CORAL_ASSIGN_OR_RETURN(module_name, ParseDottedName());
  } else if (level == 0) {
    CORAL_ASSIGN_OR_RETURN(const Token* peek, PeekToken());
    return ParseErrorStatus(
        peek->span(), absl::StrFormat("Expected module name; got '%s'",
                                      peek->ToErrorString()));
  }
  CORAL_RETURN_IF_ERROR(DropKeywordOrError(Keyword::kImport));

  std::vector<Alias*> names;
  CORAL_ASSIGN_OR_RETURN(std::optional<Token> star,
                         TryPopToken(TokenKind::kStar));
  if (star.has_value()) {
    names.push_back(module_->Make<Alias>(star->span(), "*", std::nullopt));
    return module_->Make<ImportFrom>(SpanFrom(start), std::move(module_name),
                                     level, std::move(names));
  }
  CORAL_ASSIGN_OR_RETURN(std::optional<Token> oparen,
                         TryPopToken(TokenKind::kOParen));
  if (oparen.has_value()) {
    CORAL_ASSIGN_OR_RETURN(
        names, ParseCommaSeq<Alias*>(
                   [this] { return ParseAlias(/*dotted=*/false); },
                   TokenKind::kCParen));
    if (names.empty()) {
      return ParseErrorStatus(SpanFrom(oparen->span().start()),
                              "Expected at least one name to import.");
    }
  } else {
    while (true) {
      CORAL_ASSIGN_OR_RETURN(Alias * alias, ParseAlias(/*dotted=*/false));
      names.push_back(alias);
      CORAL_ASSIGN_OR_RETURN(bool dropped_comma,
                             TryDropToken(TokenKind::kComma));
      if (!dropped_comma) {
        break;
      }
    }
  }
  return module_->Make<ImportFrom>(SpanFrom(start), std::move(module_name),
                                   level, std::move(names));
}

absl::StatusOr<std::optional<Pos>> Parser::ParseElse(StmtBlock* orelse) {
  CORAL_ASSIGN_OR_RETURN(std::optional<Token> else_tok,
                         TryPopKeyword(Keyword::kElse));
  if (!else_tok.has_value()) {
    return std::nullopt;
  }
  CORAL_ASSIGN_OR_RETURN(*orelse, ParseBlock());
  return else_tok->span().start();
}

absl::StatusOr<If*> Parser::ParseIf(const Pos& start) {
  CORAL_ASSIGN_OR_RETURN(Expr * test, ParseTest());
  CORAL_ASSIGN_OR_RETURN(StmtBlock body, ParseBlock());
  StmtBlock orelse;
  std::optional<Pos> else_pos;
  CORAL_ASSIGN_OR_RETURN(std::optional<Token> elif_tok,
                         TryPopKeyword(Keyword::kElif));
  if (elif_tok.has_value()) {
    CORAL_ASSIGN_OR_RETURN(If * elif, ParseIf(elif_tok->span().start()));
    orelse.push_back(elif);
  } else {
    CORAL_ASSIGN_OR_RETURN(else_pos, ParseElse(&orelse));
  }
  return module_->Make<If>(SpanFrom(start), test, std::move(body),
                           std::move(orelse), std::move(else_pos));
}

absl::StatusOr<While*> Parser::ParseWhile(const Pos& start) {
  CORAL_ASSIGN_OR_RETURN(Expr * test, ParseTest());
  CORAL_ASSIGN_OR_RETURN(StmtBlock body, ParseBlock());
  StmtBlock orelse;
  CORAL_ASSIGN_OR_RETURN(std::optional<Pos> else_pos, ParseElse(&orelse));
  return module_->Make<While>(SpanFrom(start), test, std::move(body),
                              std::move(orelse), std::move(else_pos));
}

absl::StatusOr<For*> Parser::ParseFor(const Pos& start) {
  CORAL_ASSIGN_OR_RETURN(Expr * target, ParseTargetList());
  CORAL_RETURN_IF_ERROR(DropKeywordOrError(Keyword::kIn));
  CORAL_ASSIGN_OR_RETURN(Expr * iter, ParseTestListStarExpr());
  CORAL_ASSIGN_OR_RETURN(StmtBlock body, ParseBlock());
  StmtBlock orelse;
  CORAL_ASSIGN_OR_RETURN(std::optional<Pos> else_pos, ParseElse(&orelse));
  return module_->Make<For>(SpanFrom(start), target, iter, std::move(body),
                            std::move(orelse), std::move(else_pos));
}

absl::StatusOr<Try*> Parser::ParseTry(const Pos& start) {
  CORAL_ASSIGN_OR_RETURN(StmtBlock body, ParseBlock());
  std::vector<ExceptHandler*> handlers;
  while (true) {
    CORAL_ASSIGN_OR_RETURN(std::optional<Token> except_tok,
                           TryPopKeyword(Keyword::kExcept));
    if (!except_tok.has_value()) {
      break;
    }
    Expr* type = nullptr;
    std::optional<std::string> name;
    CORAL_ASSIGN_OR_RETURN(bool bare, PeekTokenIs(TokenKind::kColon));
    if (!bare) {
      CORAL_ASSIGN_OR_RETURN(type, ParseTest());
      CORAL_ASSIGN_OR_RETURN(bool has_as, TryDropKeyword(Keyword::kAs));
      if (has_as) {
        CORAL_ASSIGN_OR_RETURN(name, PopIdentifierOrError());
      }
    }
    CORAL_ASSIGN_OR_RETURN(StmtBlock handler_body, ParseBlock());
    handlers.push_back(module_->Make<ExceptHandler>(
        SpanFrom(except_tok->span().start()), type, std::move(name),
        std::move(handler_body)));
  }

  StmtBlock orelse;
  CORAL_ASSIGN_OR_RETURN(const Token* peek, PeekToken());
  if (peek->IsKeyword(Keyword::kElse) && handlers.empty()) {
    return ParseErrorStatus(peek->span(),
                            "'else' clause requires an 'except' clause.");
  }
  CORAL_ASSIGN_OR_RETURN(std::optional<Pos> else_pos, ParseElse(&orelse));

  StmtBlock finalbody;
  std::optional<Pos> finally_pos;
  CORAL_ASSIGN_OR_RETURN(std::optional<Token> finally_tok,
                         TryPopKeyword(Keyword::kFinally));
  if (finally_tok.has_value()) {
    finally_pos = finally_tok->span().start();
    CORAL_ASSIGN_OR_RETURN(finalbody, ParseBlock());
  }
  if (handlers.empty() && !finally_pos.has_value()) {
    CORAL_ASSIGN_OR_RETURN(const Token* next, PeekToken());
    return ParseErrorStatus(
        next->span(),
        absl::StrFormat("Expected 'except' or 'finally' block; got '%s'",
                        next->ToErrorString()));
  }
  return module_->Make<Try>(SpanFrom(start), std::move(body),
                            std::move(handlers), std::move(orelse),
                            std::move(finalbody), std::move(else_pos),
                            std::move(finally_pos));
}

absl::StatusOr<With*> Parser::ParseWith(const Pos& start) {
  std::vector<WithItem*> items;
  while (true) {
    CORAL_ASSIGN_OR_RETURN(Pos item_start, PeekPos());
    CORAL_ASSIGN_OR_RETURN(Expr * context_expr, ParseTest());
    Expr* optional_vars = nullptr;
    CORAL_ASSIGN_OR_RETURN(bool has_as, TryDropKeyword(Keyword::kAs));
    if (has_as) {
      CORAL_ASSIGN_OR_RETURN(optional_vars, ParseTarget());
    }
    items.push_back(module_->Make<WithItem>(SpanFrom(item_start),
                                            context_expr, optional_vars));
    CORAL_ASSIGN_OR_RETURN(bool dropped_comma, TryDropToken(TokenKind::kComma));
    if (!dropped_comma) {
      break;
    }
  }
  CORAL_ASSIGN_OR_RETURN(StmtBlock body, ParseBlock());
  return module_->Make<With>(SpanFrom(start), std::move(items),
                             std::move(body));
}

absl::StatusOr<Stmt*> Parser::ParseDecorated(const Pos& start) {
  std::vector<Expr*> decorators;
  while (true) {
    CORAL_ASSIGN_OR_RETURN(bool dropped_at, TryDropToken(TokenKind::kAt));
    if (!dropped_at) {
      break;
    }
    CORAL_ASSIGN_OR_RETURN(Expr * decorator, ParseTest());
    decorators.push_back(decorator);
    CORAL_RETURN_IF_ERROR(DropTokenOrError(TokenKind::kNewline));
  }
  CORAL_ASSIGN_OR_RETURN(const Token* peek, PeekToken());
  const Pos keyword_pos = peek->span().start();
  if (peek->IsKeyword(Keyword::kDef)) {
    DropTokenOrDie();
    return ParseFunction(start, keyword_pos, std::move(decorators));
  }
  if (peek->IsKeyword(Keyword::kClass)) {
    DropTokenOrDie();
    return ParseClass(start, keyword_pos, std::move(decorators));
  }
  return ParseErrorStatus(
      peek->span(),
      absl::StrFormat("Expected 'def' or 'class' after decorator; got '%s'",
                      peek->ToErrorString()));
}

absl::StatusOr<Function*> Parser::ParseFunction(const Pos& start,
                                                const Pos& keyword_pos,
                                                std::vector<Expr*> decorators) {
  CORAL_ASSIGN_OR_RETURN(std::string name, PopIdentifierOrError());
  CORAL_ASSIGN_OR_RETURN(Token oparen, PopTokenOrError(TokenKind::kOParen));
  CORAL_ASSIGN_OR_RETURN(
      ParamList * params,
      ParseParamList(oparen.span().start(), TokenKind::kCParen,
                     /*allow_annotations=*/true));
  Expr* returns = nullptr;
  CORAL_ASSIGN_OR_RETURN(bool has_returns, TryDropToken(TokenKind::kArrow));
  if (has_returns) {
    CORAL_ASSIGN_OR_RETURN(returns, ParseTest());
  }
  CORAL_ASSIGN_OR_RETURN(StmtBlock body, ParseBlock());
  CORAL_VLOG(5) << "Parsed function " << name << " @ " << start;
  return module_->Make<Function>(SpanFrom(start), std::move(name), params,
                                 std::move(body), std::move(decorators),
                                 returns, keyword_pos);
}

absl::StatusOr<ClassDef*> Parser::ParseClass(const Pos& start,
                                             const Pos& keyword_pos,
                                             std::vector<Expr*> decorators) {
  CORAL_ASSIGN_OR_RETURN(std::string name, PopIdentifierOrError());
  std::vector<Expr*> bases;
  std::vector<KeywordArg*> keywords;
  CORAL_ASSIGN_OR_RETURN(bool has_args, TryDropToken(TokenKind::kOParen));
  if (has_args) {
    CORAL_RETURN_IF_ERROR(ParseCallArgs(&bases, &keywords));
  }
  CORAL_ASSIGN_OR_RETURN(StmtBlock body, ParseBlock());
  return module_->Make<ClassDef>(SpanFrom(start), std::move(name),
                                 std::move(bases), std::move(keywords),
                                 std::move(body), std::move(decorators),
                                 keyword_pos);
}

absl::StatusOr<Param*> Parser::ParseParam(bool allow_annotations) {
  CORAL_ASSIGN_OR_RETURN(Pos start, PeekPos());
  CORAL_ASSIGN_OR_RETURN(std::string name, PopIdentifierOrError());
  Expr* annotation = nullptr;
  if (allow_annotations) {
    CORAL_ASSIGN_OR_RETURN(bool has_annotation,
                           TryDropToken(TokenKind::kColon));
    if (has_annotation) {
      CORAL_ASSIGN_OR_RETURN(annotation, ParseTest());
    }
  }
  return module_->Make<Param>(SpanFrom(start), std::move(name), annotation);
}

absl::StatusOr<ParamList*> Parser::ParseParamList(const Pos& start,
                                                  TokenKind terminator,
                                                  bool allow_annotations) {
  std::vector<Param*> args;
  std::vector<Expr*> defaults;
  Param* vararg = nullptr;
  std::vector<Param*> kwonlyargs;
  std::vector<Expr*> kw_defaults;
  Param* kwarg = nullptr;
  bool seen_star = false;
  std::optional<Span> bare_star;
  while (true) {
    CORAL_ASSIGN_OR_RETURN(bool done, TryDropToken(terminator));
    if (done) {
      break;
    }
    CORAL_ASSIGN_OR_RETURN(const Token* peek, PeekToken());
    const Span peek_span = peek->span();
    if (kwarg != nullptr) {
      return ParseErrorStatus(peek_span,
                              "Parameters cannot follow the '**' parameter.");
    }
    if (peek->kind() == TokenKind::kSlash) {
      return ParseErrorStatus(peek_span,
                              "Positional-only parameters are not supported.");
    }
    if (peek->kind() == TokenKind::kDoubleStar) {
      DropTokenOrDie();
      CORAL_ASSIGN_OR_RETURN(kwarg, ParseParam(allow_annotations));
    } else if (peek->kind() == TokenKind::kStar) {
      if (seen_star) {
        return ParseErrorStatus(peek_span, "Duplicate '*' in parameter list.");
      }
      DropTokenOrDie();
      seen_star = true;
      CORAL_ASSIGN_OR_RETURN(bool named, PeekTokenIs(TokenKind::kIdentifier));
      if (named) {
        CORAL_ASSIGN_OR_RETURN(vararg, ParseParam(allow_annotations));
      } else {
        bare_star = peek_span;
      }
    } else {
      CORAL_ASSIGN_OR_RETURN(Param * param, ParseParam(allow_annotations));
      Expr* default_value = nullptr;
      CORAL_ASSIGN_OR_RETURN(bool has_default,
                             TryDropToken(TokenKind::kEquals));
      if (has_default) {
        CORAL_ASSIGN_OR_RETURN(default_value, ParseTest());
      }
      if (seen_star) {
        kwonlyargs.push_back(param);
        kw_defaults.push_back(default_value);
      } else {
        if (default_value == nullptr && !defaults.empty()) {
          return ParseErrorStatus(
              param->span(), "Non-default argument follows default argument.");
        }
        args.push_back(param);
        if (default_value != nullptr) {
          defaults.push_back(default_value);
        }
      }
    }
    CORAL_ASSIGN_OR_RETURN(bool dropped_comma, TryDropToken(TokenKind::kComma));
    if (!dropped_comma) {
      CORAL_RETURN_IF_ERROR(DropTokenOrError(terminator));
      break;
    }
  }
  if (bare_star.has_value() && kwonlyargs.empty()) {
    return ParseErrorStatus(*bare_star,
                            "Named arguments must follow bare '*'.");
  }
  return module_->Make<ParamList>(SpanFrom(start), std::move(args),
                                  std::move(defaults), vararg,
                                  std::move(kwonlyargs), std::move(kw_defaults),
                                  kwarg);
}

// -- Expressions

absl::StatusOr<Expr*> Parser::ParseTupleOf(
    const std::function<absl::StatusOr<Expr*>()>& element) {
  CORAL_ASSIGN_OR_RETURN(Pos start, PeekPos());
  CORAL_ASSIGN_OR_RETURN(Expr * first, element());
  CORAL_ASSIGN_OR_RETURN(bool is_tuple, PeekTokenIs(TokenKind::kComma));
  if (!is_tuple) {
    return first;
  }
  std::vector<Expr*> elements = {first};
  while (true) {
    CORAL_ASSIGN_OR_RETURN(bool dropped_comma, TryDropToken(TokenKind::kComma));
    if (!dropped_comma) {
      break;
    }
    CORAL_ASSIGN_OR_RETURN(bool more, PeekStartsExpression());
    if (!more) {
      break;
    }
    CORAL_ASSIGN_OR_RETURN(Expr * next, element());
    elements.push_back(next);
  }
  return module_->Make<Tuple>(SpanFrom(start), std::move(elements));
}

absl::StatusOr<Expr*> Parser::ParseTestListStarExpr() {
  return ParseTupleOf([this] { return ParseTestOrStar(); });
}

absl::StatusOr<Expr*> Parser::ParseTargetList() {
  return ParseTupleOf([this] { return ParseTarget(); });
}

absl::StatusOr<Expr*> Parser::ParseTestOrStar() {
  CORAL_ASSIGN_OR_RETURN(bool is_star, PeekTokenIs(TokenKind::kStar));
  if (is_star) {
    return ParseStarExpr();
  }
  return ParseTest();
}

absl::StatusOr<Expr*> Parser::ParseTarget() {
  CORAL_ASSIGN_OR_RETURN(bool is_star, PeekTokenIs(TokenKind::kStar));
  if (is_star) {
    return ParseStarExpr();
  }
  return ParseBitOr();
}

absl::StatusOr<Expr*> Parser::ParseStarExpr() {
  CORAL_ASSIGN_OR_RETURN(Token star, PopTokenOrError(TokenKind::kStar));
  CORAL_ASSIGN_OR_RETURN(Expr * value, ParseBitOr());
  return module_->Make<Starred>(SpanFrom(star.span().start()), value);
}

absl::StatusOr<Expr*> Parser::ParseTest() {
  CORAL_ASSIGN_OR_RETURN(const Token* peek, PeekToken());
  const Pos start = peek->span().start();
  if (peek->IsKeyword(Keyword::kLambda)) {
    DropTokenOrDie();
    return ParseLambda(start);
  }
  CORAL_ASSIGN_OR_RETURN(Expr * result, ParseOrTest());
  CORAL_ASSIGN_OR_RETURN(bool is_ternary, TryDropKeyword(Keyword::kIf));
  if (is_ternary) {
    CORAL_ASSIGN_OR_RETURN(Expr * test, ParseOrTest());
    CORAL_RETURN_IF_ERROR(DropKeywordOrError(Keyword::kElse));
    CORAL_ASSIGN_OR_RETURN(Expr * alternate, ParseTest());
    result = module_->Make<Ternary>(SpanFrom(start), test, result, alternate);
  }
  CORAL_ASSIGN_OR_RETURN(const Token* after, PeekToken());
  if (after->kind() == TokenKind::kColonEquals) {
    return ParseErrorStatus(
        after->span(), "Assignment expressions (':=') are not supported.");
  }
  return result;
}

absl::StatusOr<Expr*> Parser::ParseLambda(const Pos& start) {
  CORAL_ASSIGN_OR_RETURN(ParamList * params,
                         ParseParamList(start, TokenKind::kColon,
                                        /*allow_annotations=*/false));
  CORAL_ASSIGN_OR_RETURN(Expr * body, ParseTest());
  return module_->Make<Lambda>(SpanFrom(start), params, body);
}

absl::StatusOr<Expr*> Parser::ParseBoolOpChain(
    const std::function<absl::StatusOr<Expr*>()>& sub_production,
    Keyword keyword, BoolOpKind kind) {
  CORAL_ASSIGN_OR_RETURN(Pos start, PeekPos());
  CORAL_ASSIGN_OR_RETURN(Expr * first, sub_production());
  std::vector<Expr*> values = {first};
  while (true) {
    CORAL_ASSIGN_OR_RETURN(bool dropped, TryDropKeyword(keyword));
    if (!dropped) {
      break;
    }
    CORAL_ASSIGN_OR_RETURN(Expr * next, sub_production());
    values.push_back(next);
  }
  if (values.size() == 1) {
    return first;
  }
  return module_->Make<BoolOp>(SpanFrom(start), kind, std::move(values));
}

absl::StatusOr<Expr*> Parser::ParseOrTest() {
  return ParseBoolOpChain([this] { return ParseAndTest(); }, Keyword::kOr,
                          BoolOpKind::kOr);
}

absl::StatusOr<Expr*> Parser::ParseAndTest() {
  return ParseBoolOpChain([this] { return ParseNotTest(); }, Keyword::kAnd,
                          BoolOpKind::kAnd);
}

absl::StatusOr<Expr*> Parser::ParseNotTest() {
  CORAL_ASSIGN_OR_RETURN(std::optional<Token> not_tok,
                         TryPopKeyword(Keyword::kNot));
  if (!not_tok.has_value()) {
    return ParseComparison();
  }
  CORAL_ASSIGN_OR_RETURN(Expr * operand, ParseNotTest());
  return module_->Make<Unop>(SpanFrom(not_tok->span().start()), UnopKind::kNot,
                             operand);
}

absl::StatusOr<Expr*> Parser::ParseComparison() {
  CORAL_ASSIGN_OR_RETURN(Pos start, PeekPos());
  CORAL_ASSIGN_OR_RETURN(Expr * lhs, ParseBitOr());
  std::vector<CompareOpKind> ops;
  std::vector<Expr*> comparators;
  while (true) {
    CORAL_ASSIGN_OR_RETURN(const Token* peek, PeekToken());
    std::optional<CompareOpKind> op;
    switch (peek->kind()) {
      case TokenKind::kDoubleEquals:
        op = CompareOpKind::kEq;
        break;
      case TokenKind::kBangEquals:
        op = CompareOpKind::kNotEq;
        break;
      case TokenKind::kOAngle:
        op = CompareOpKind::kLt;
        break;
      case TokenKind::kOAngleEquals:
        op = CompareOpKind::kLtE;
        break;
      case TokenKind::kCAngle:
        op = CompareOpKind::kGt;
        break;
      case TokenKind::kCAngleEquals:
        op = CompareOpKind::kGtE;
        break;
      case TokenKind::kKeyword:
        if (peek->IsKeyword(Keyword::kIn)) {
          op = CompareOpKind::kIn;
        } else if (peek->IsKeyword(Keyword::kNot)) {
          op = CompareOpKind::kNotIn;
        } else if (peek->IsKeyword(Keyword::kIs)) {
          op = CompareOpKind::kIs;
        }
        break;
      default:
        break;
    }
    if (!op.has_value()) {
      break;
    }
    DropTokenOrDie();
    if (*op == CompareOpKind::kNotIn) {
      CORAL_RETURN_IF_ERROR(DropKeywordOrError(Keyword::kIn));
    } else if (*op == CompareOpKind::kIs) {
      CORAL_ASSIGN_OR_RETURN(bool is_not, TryDropKeyword(Keyword::kNot));
      if (is_not) {
        op = CompareOpKind::kIsNot;
      }
    }
    CORAL_ASSIGN_OR_RETURN(Expr * rhs, ParseBitOr());
    ops.push_back(*op);
    comparators.push_back(rhs);
  }
  if (ops.empty()) {
    return lhs;
  }
  return module_->Make<Compare>(SpanFrom(start), lhs, std::move(ops),
                                std::move(comparators));
}

absl::StatusOr<Expr*> Parser::ParseBinopChain(
    const std::function<absl::StatusOr<Expr*>()>& sub_production,
    absl::Span<TokenKind const> target_tokens) {
  CORAL_ASSIGN_OR_RETURN(Expr * lhs, sub_production());
  while (true) {
    CORAL_VLOG(5) << "Binop chain lhs: " << lhs->ToString();
    CORAL_ASSIGN_OR_RETURN(bool peek_in_targets, PeekTokenIn(target_tokens));
    if (!peek_in_targets) {
      break;
    }
    Token op = PopTokenOrDie();
    CORAL_ASSIGN_OR_RETURN(Expr * rhs, sub_production());
    CORAL_ASSIGN_OR_RETURN(BinopKind kind, BinopKindFromTokenKind(op.kind()));
    lhs = module_->Make<Binop>(Span(lhs->span().start(), GetLastLimit()), kind,
                               lhs, rhs);
  }
  CORAL_VLOG(5) << "Binop chain result: " << lhs->ToString();
  return lhs;
}

absl::StatusOr<Expr*> Parser::ParseBitOr() {
  return ParseBinopChain([this] { return ParseBitXor(); }, kBitOrKinds);
}

absl::StatusOr<Expr*> Parser::ParseBitXor() {
  return ParseBinopChain([this] { return ParseBitAnd(); }, kBitXorKinds);
}

absl::StatusOr<Expr*> Parser::ParseBitAnd() {
  return ParseBinopChain([this] { return ParseShift(); }, kBitAndKinds);
}

absl::StatusOr<Expr*> Parser::ParseShift() {
  return ParseBinopChain([this] { return ParseArith(); }, kShiftKinds);
}

absl::StatusOr<Expr*> Parser::ParseArith() {
  return ParseBinopChain([this] { return ParseTerm(); }, kArithKinds);
}

absl::StatusOr<Expr*> Parser::ParseTerm() {
  return ParseBinopChain([this] { return ParseFactor(); }, kTermKinds);
}

absl::StatusOr<Expr*> Parser::ParseFactor() {
  CORAL_ASSIGN_OR_RETURN(const Token* peek, PeekToken());
  std::optional<UnopKind> kind;
  switch (peek->kind()) {
    case TokenKind::kMinus:
      kind = UnopKind::kNegate;
      break;
    case TokenKind::kPlus:
      kind = UnopKind::kPlus;
      break;
    case TokenKind::kTilde:
      kind = UnopKind::kInvert;
      break;
    default:
      return ParsePower();
  }
  Token op = PopTokenOrDie();
  CORAL_ASSIGN_OR_RETURN(Expr * operand, ParseFactor());
  return module_->Make<Unop>(SpanFrom(op.span().start()), *kind, operand);
}

absl::StatusOr<Expr*> Parser::ParsePower() {
  CORAL_ASSIGN_OR_RETURN(Pos start, PeekPos());
  CORAL_ASSIGN_OR_RETURN(Expr * base, ParseAwaitPrimary());
  CORAL_ASSIGN_OR_RETURN(bool is_pow, TryDropToken(TokenKind::kDoubleStar));
  if (!is_pow) {
    return base;
  }
  // The exponent binds tighter than a unary operator on its left only.
  CORAL_ASSIGN_OR_RETURN(Expr * exponent, ParseFactor());
  return module_->Make<Binop>(SpanFrom(start), BinopKind::kPow, base,
                              exponent);
}

absl::StatusOr<Expr*> Parser::ParseAwaitPrimary() {
  CORAL_ASSIGN_OR_RETURN(std::optional<Token> await_tok,
                         TryPopKeyword(Keyword::kAwait));
  if (!await_tok.has_value()) {
    return ParsePrimary();
  }
  CORAL_ASSIGN_OR_RETURN(Expr * value, ParsePrimary());
  return module_->Make<Await>(SpanFrom(await_tok->span().start()), value);
}

absl::StatusOr<Expr*> Parser::ParsePrimary() {
  CORAL_ASSIGN_OR_RETURN(Pos start, PeekPos());
  CORAL_ASSIGN_OR_RETURN(Expr * lhs, ParseAtom());
  while (true) {
    CORAL_ASSIGN_OR_RETURN(const Token* peek, PeekToken());
    switch (peek->kind()) {
      case TokenKind::kDot: {
        DropTokenOrDie();
        CORAL_ASSIGN_OR_RETURN(std::string attr, PopIdentifierOrError());
        lhs = module_->Make<Attr>(SpanFrom(start), lhs, std::move(attr));
        break;
      }
      case TokenKind::kOParen: {
        DropTokenOrDie();
        std::vector<Expr*> args;
        std::vector<KeywordArg*> keywords;
        CORAL_RETURN_IF_ERROR(ParseCallArgs(&args, &keywords));
        lhs = module_->Make<Invocation>(SpanFrom(start), lhs, std::move(args),
                                        std::move(keywords));
        break;
      }
      case TokenKind::kOBrack: {
        DropTokenOrDie();
        CORAL_ASSIGN_OR_RETURN(Expr * index, ParseSubscript());
        CORAL_RETURN_IF_ERROR(DropTokenOrError(TokenKind::kCBrack));
        lhs = module_->Make<Index>(SpanFrom(start), lhs, index);
        break;
      }
      default:
        return lhs;
    }
  }
}

absl::Status Parser::ParseCallArgs(std::vector<Expr*>* args,
                                   std::vector<KeywordArg*>* keywords) {
  bool seen_double_star = false;
  while (true) {
    CORAL_ASSIGN_OR_RETURN(bool done, TryDropToken(TokenKind::kCParen));
    if (done) {
      break;
    }
    CORAL_ASSIGN_OR_RETURN(const Token* peek, PeekToken());
    const Span peek_span = peek->span();
    const Pos arg_start = peek_span.start();
    if (peek->kind() == TokenKind::kDoubleStar) {
      DropTokenOrDie();
      CORAL_ASSIGN_OR_RETURN(Expr * value, ParseTest());
      keywords->push_back(module_->Make<KeywordArg>(SpanFrom(arg_start),
                                                    std::nullopt, value));
      seen_double_star = true;
    } else if (peek->kind() == TokenKind::kStar) {
      if (seen_double_star) {
        return ParseErrorStatus(
            peek_span,
            "Iterable argument unpacking follows keyword argument unpacking.");
      }
      DropTokenOrDie();
      CORAL_ASSIGN_OR_RETURN(Expr * value, ParseTest());
      args->push_back(module_->Make<Starred>(SpanFrom(arg_start), value));
    } else {
      CORAL_ASSIGN_OR_RETURN(Expr * value, ParseTest());
      CORAL_ASSIGN_OR_RETURN(bool is_keyword, TryDropToken(TokenKind::kEquals));
      if (is_keyword) {
        auto* name = dynamic_cast<NameRef*>(value);
        if (name == nullptr) {
          return ParseErrorStatus(value->span(),
                                  "Expression cannot be a keyword argument.");
        }
        CORAL_ASSIGN_OR_RETURN(Expr * kw_value, ParseTest());
        keywords->push_back(module_->Make<KeywordArg>(
            SpanFrom(arg_start), name->identifier(), kw_value));
      } else {
        CORAL_ASSIGN_OR_RETURN(bool is_genexp, PeekTokenIs(Keyword::kFor));
        if (is_genexp) {
          if (!args->empty() || !keywords->empty()) {
            return ParseErrorStatus(
                value->span(), "Generator expression must be parenthesized.");
          }
          CORAL_ASSIGN_OR_RETURN(std::vector<Comprehension*> generators,
                                 ParseComprehensionClauses());
          args->push_back(module_->Make<GeneratorExp>(
              SpanFrom(arg_start), value, std::move(generators)));
          return DropTokenOrError(TokenKind::kCParen, /*start=*/nullptr,
                                  "generator expression must be parenthesized");
        }
        if (!keywords->empty()) {
          return ParseErrorStatus(
              value->span(), "Positional argument follows keyword argument.");
        }
        args->push_back(value);
      }
    }
    CORAL_ASSIGN_OR_RETURN(bool dropped_comma, TryDropToken(TokenKind::kComma));
    if (!dropped_comma) {
      return DropTokenOrError(TokenKind::kCParen);
    }
  }
  return absl::OkStatus();
}

absl::StatusOr<Expr*> Parser::ParseSubscript() {
  CORAL_ASSIGN_OR_RETURN(Pos start, PeekPos());
  CORAL_ASSIGN_OR_RETURN(Expr * first, ParseSliceOrTest());
  CORAL_ASSIGN_OR_RETURN(bool is_tuple, PeekTokenIs(TokenKind::kComma));
  if (!is_tuple) {
    return first;
  }
  std::vector<Expr*> elements = {first};
  while (true) {
    CORAL_ASSIGN_OR_RETURN(bool dropped_comma, TryDropToken(TokenKind::kComma));
    if (!dropped_comma) {
      break;
    }
    CORAL_ASSIGN_OR_RETURN(bool at_end, PeekTokenIs(TokenKind::kCBrack));
    if (at_end) {
      break;
    }
    CORAL_ASSIGN_OR_RETURN(Expr * next, ParseSliceOrTest());
    elements.push_back(next);
  }
  return module_->Make<Tuple>(SpanFrom(start), std::move(elements));
}

absl::StatusOr<Expr*> Parser::ParseSliceOrTest() {
  CORAL_ASSIGN_OR_RETURN(Pos start, PeekPos());
  Expr* lower = nullptr;
  CORAL_ASSIGN_OR_RETURN(bool at_colon, PeekTokenIs(TokenKind::kColon));
  if (!at_colon) {
    CORAL_ASSIGN_OR_RETURN(lower, ParseTestOrStar());
    CORAL_ASSIGN_OR_RETURN(at_colon, PeekTokenIs(TokenKind::kColon));
    if (!at_colon) {
      return lower;
    }
  }
  DropTokenOrDie();

  auto parse_bound = [this]() -> absl::StatusOr<Expr*> {
    CORAL_ASSIGN_OR_RETURN(bool absent, PeekTokenIn(kSliceBoundEndKinds));
    if (absent) {
      Expr* none = nullptr;
      return none;
    }
    return ParseTest();
  };
  CORAL_ASSIGN_OR_RETURN(Expr * upper, parse_bound());
  Expr* step = nullptr;
  CORAL_ASSIGN_OR_RETURN(bool has_step, TryDropToken(TokenKind::kColon));
  if (has_step) {
    CORAL_ASSIGN_OR_RETURN(step, parse_bound());
  }
  return module_->Make<Slice>(SpanFrom(start), lower, upper, step);
}

absl::StatusOr<std::vector<Comprehension*>>
Parser::ParseComprehensionClauses() {
  std::vector<Comprehension*> generators;
  while (true) {
    CORAL_ASSIGN_OR_RETURN(const Token* peek, PeekToken());
    if (peek->IsKeyword(Keyword::kAsync)) {
      return ParseErrorStatus(peek->span(),
                              "Asynchronous comprehensions are not supported.");
    }
    if (!peek->IsKeyword(Keyword::kFor)) {
      break;
    }
    const Pos start = peek->span().start();
    DropTokenOrDie();
    CORAL_ASSIGN_OR_RETURN(Expr * target, ParseTargetList());
    CORAL_RETURN_IF_ERROR(DropKeywordOrError(Keyword::kIn));
    CORAL_ASSIGN_OR_RETURN(Expr * iter, ParseOrTest());
    std::vector<Expr*> ifs;
    while (true) {
      CORAL_ASSIGN_OR_RETURN(bool has_if, TryDropKeyword(Keyword::kIf));
      if (!has_if) {
        break;
      }
      CORAL_ASSIGN_OR_RETURN(Expr * cond, ParseOrTest());
      ifs.push_back(cond);
    }
    generators.push_back(module_->Make<Comprehension>(SpanFrom(start), target,
                                                      iter, std::move(ifs)));
  }
  CORAL_CHECK(!generators.empty());
  return generators;
}

absl::StatusOr<Expr*> Parser::ParseYield(const Pos& start) {
  CORAL_ASSIGN_OR_RETURN(bool is_from, TryDropKeyword(Keyword::kFrom));
  if (is_from) {
    CORAL_ASSIGN_OR_RETURN(Expr * value, ParseTest());
    return module_->Make<YieldFrom>(SpanFrom(start), value);
  }
  Expr* value = nullptr;
  CORAL_ASSIGN_OR_RETURN(bool has_value, PeekStartsExpression());
  if (has_value) {
    CORAL_ASSIGN_OR_RETURN(value, ParseTestListStarExpr());
  }
  return module_->Make<Yield>(SpanFrom(start), value);
}

absl::StatusOr<Expr*> Parser::ParseAtom() {
  CORAL_ASSIGN_OR_RETURN(const Token* peek, PeekToken());
  const Span span = peek->span();
  switch (peek->kind()) {
    case TokenKind::kIdentifier: {
      Token tok = PopTokenOrDie();
      return module_->Make<NameRef>(tok.span(), tok.GetStringValue());
    }
    case TokenKind::kNumber: {
      Token tok = PopTokenOrDie();
      return ParseNumber(tok);
    }
    case TokenKind::kString:
      return ParseStrings();
    case TokenKind::kEllipsis:
      DropTokenOrDie();
      return module_->Make<Constant>(span, ConstantKind::kEllipsis);
    case TokenKind::kOParen:
      DropTokenOrDie();
      return ParseParenthesized(span.start());
    case TokenKind::kOBrack:
      DropTokenOrDie();
      return ParseListDisplay(span.start());
    case TokenKind::kOBrace:
      DropTokenOrDie();
      return ParseBraceDisplay(span.start());
    case TokenKind::kKeyword: {
      std::optional<ConstantKind> constant;
      switch (peek->GetKeyword()) {
        case Keyword::kTrue:
          constant = ConstantKind::kTrue;
          break;
        case Keyword::kFalse:
          constant = ConstantKind::kFalse;
          break;
        case Keyword::kNone:
          constant = ConstantKind::kNone;
          break;
        default:
          break;
      }
      if (constant.has_value()) {
        DropTokenOrDie();
        return module_->Make<Constant>(span, *constant);
      }
      break;
    }
    default:
      break;
  }
  return ParseErrorStatus(
      span, absl::StrFormat("Expected start of an expression; got: '%s'",
                            peek->ToErrorString()));
}

absl::StatusOr<Expr*> Parser::ParseParenthesized(const Pos& start) {
  CORAL_ASSIGN_OR_RETURN(const Token* peek, PeekToken());
  if (peek->kind() == TokenKind::kCParen) {
    DropTokenOrDie();
    return module_->Make<Tuple>(SpanFrom(start), std::vector<Expr*>());
  }
  if (peek->IsKeyword(Keyword::kYield)) {
    const Pos yield_start = peek->span().start();
    DropTokenOrDie();
    CORAL_ASSIGN_OR_RETURN(Expr * yield, ParseYield(yield_start));
    CORAL_RETURN_IF_ERROR(DropTokenOrError(TokenKind::kCParen));
    return yield;
  }
  CORAL_ASSIGN_OR_RETURN(Expr * first, ParseTestOrStar());
  CORAL_ASSIGN_OR_RETURN(bool is_genexp, PeekTokenIs(Keyword::kFor));
  if (is_genexp) {
    CORAL_ASSIGN_OR_RETURN(std::vector<Comprehension*> generators,
                           ParseComprehensionClauses());
    CORAL_RETURN_IF_ERROR(DropTokenOrError(TokenKind::kCParen));
    return module_->Make<GeneratorExp>(SpanFrom(start), first,
                                       std::move(generators));
  }
  CORAL_ASSIGN_OR_RETURN(bool is_tuple, TryDropToken(TokenKind::kComma));
  if (!is_tuple) {
    // Parentheses only group; they leave no node behind.
    CORAL_RETURN_IF_ERROR(DropTokenOrError(TokenKind::kCParen));
    return first;
  }
  CORAL_ASSIGN_OR_RETURN(std::vector<Expr*> rest,
                         ParseCommaSeq<Expr*>(
                             [this] { return ParseTestOrStar(); },
                             TokenKind::kCParen));
  std::vector<Expr*> elements = {first};
  elements.insert(elements.end(), rest.begin(), rest.end());
  return module_->Make<Tuple>(SpanFrom(start), std::move(elements));
}

absl::StatusOr<Expr*> Parser::ParseListDisplay(const Pos& start) {
  CORAL_ASSIGN_OR_RETURN(bool empty, TryDropToken(TokenKind::kCBrack));
  if (empty) {
    return module_->Make<List>(SpanFrom(start), std::vector<Expr*>());
  }
  CORAL_ASSIGN_OR_RETURN(Expr * first, ParseTestOrStar());
  CORAL_ASSIGN_OR_RETURN(bool is_comp, PeekTokenIs(Keyword::kFor));
  if (is_comp) {
    CORAL_ASSIGN_OR_RETURN(std::vector<Comprehension*> generators,
                           ParseComprehensionClauses());
    CORAL_RETURN_IF_ERROR(DropTokenOrError(TokenKind::kCBrack));
    return module_->Make<ListComp>(SpanFrom(start), first,
                                   std::move(generators));
  }
  std::vector<Expr*> elements = {first};
  CORAL_ASSIGN_OR_RETURN(bool more, TryDropToken(TokenKind::kComma));
  if (more) {
    CORAL_ASSIGN_OR_RETURN(std::vector<Expr*> rest,
                           ParseCommaSeq<Expr*>(
                               [this] { return ParseTestOrStar(); },
                               TokenKind::kCBrack));
    elements.insert(elements.end(), rest.begin(), rest.end());
  } else {
    CORAL_RETURN_IF_ERROR(DropTokenOrError(TokenKind::kCBrack));
  }
  return module_->Make<List>(SpanFrom(start), std::move(elements));
}

absl::StatusOr<Expr*> Parser::ParseBraceDisplay(const Pos& start) {
  using DictEntry = std::pair<Expr*, Expr*>;
  // A null key denotes `**mapping`.
  auto parse_dict_entry = [this]() -> absl::StatusOr<DictEntry> {
    CORAL_ASSIGN_OR_RETURN(bool is_unpack,
                           TryDropToken(TokenKind::kDoubleStar));
    if (is_unpack) {
      CORAL_ASSIGN_OR_RETURN(Expr * mapping, ParseBitOr());
      return DictEntry(nullptr, mapping);
    }
    CORAL_ASSIGN_OR_RETURN(Expr * key, ParseTest());
    CORAL_RETURN_IF_ERROR(DropTokenOrError(TokenKind::kColon));
    CORAL_ASSIGN_OR_RETURN(Expr * value, ParseTest());
    return DictEntry(key, value);
  };
  auto make_dict = [&](std::vector<DictEntry> entries) -> Expr* {
    std::vector<Expr*> keys;
    std::vector<Expr*> values;
    for (const DictEntry& entry : entries) {
      keys.push_back(entry.first);
      values.push_back(entry.second);
    }
    return module_->Make<Dict>(SpanFrom(start), std::move(keys),
                               std::move(values));
  };

  CORAL_ASSIGN_OR_RETURN(bool empty, TryDropToken(TokenKind::kCBrace));
  if (empty) {
    return make_dict({});
  }

  DictEntry first_entry;
  CORAL_ASSIGN_OR_RETURN(bool is_unpack, PeekTokenIs(TokenKind::kDoubleStar));
  if (is_unpack) {
    CORAL_ASSIGN_OR_RETURN(first_entry, parse_dict_entry());
  } else {
    CORAL_ASSIGN_OR_RETURN(Expr * first, ParseTestOrStar());
    CORAL_ASSIGN_OR_RETURN(bool is_dict, TryDropToken(TokenKind::kColon));
    if (!is_dict) {
      CORAL_ASSIGN_OR_RETURN(bool is_comp, PeekTokenIs(Keyword::kFor));
      if (is_comp) {
        CORAL_ASSIGN_OR_RETURN(std::vector<Comprehension*> generators,
                               ParseComprehensionClauses());
        CORAL_RETURN_IF_ERROR(DropTokenOrError(TokenKind::kCBrace));
        return module_->Make<SetComp>(SpanFrom(start), first,
                                      std::move(generators));
      }
      std::vector<Expr*> elements = {first};
      CORAL_ASSIGN_OR_RETURN(bool more, TryDropToken(TokenKind::kComma));
      if (more) {
        CORAL_ASSIGN_OR_RETURN(std::vector<Expr*> rest,
                               ParseCommaSeq<Expr*>(
                                   [this] { return ParseTestOrStar(); },
                                   TokenKind::kCBrace));
        elements.insert(elements.end(), rest.begin(), rest.end());
      } else {
        CORAL_RETURN_IF_ERROR(DropTokenOrError(TokenKind::kCBrace));
      }
      return module_->Make<Set>(SpanFrom(start), std::move(elements));
    }
    CORAL_ASSIGN_OR_RETURN(Expr * value, ParseTest());
    CORAL_ASSIGN_OR_RETURN(bool is_comp, PeekTokenIs(Keyword::kFor));
    if (is_comp) {
      CORAL_ASSIGN_OR_RETURN(std::vector<Comprehension*> generators,
                             ParseComprehensionClauses());
      CORAL_RETURN_IF_ERROR(DropTokenOrError(TokenKind::kCBrace));
      return module_->Make<DictComp>(SpanFrom(start), first, value,
                                     std::move(generators));
    }
    first_entry = DictEntry(first, value);
  }

  std::vector<DictEntry> entries = {first_entry};
  CORAL_ASSIGN_OR_RETURN(bool more, TryDropToken(TokenKind::kComma));
  if (more) {
    CORAL_ASSIGN_OR_RETURN(std::vector<DictEntry> rest,
                           ParseCommaSeq<DictEntry>(parse_dict_entry,
                                                    TokenKind::kCBrace));
    entries.insert(entries.end(), rest.begin(), rest.end());
  } else {
    CORAL_RETURN_IF_ERROR(DropTokenOrError(TokenKind::kCBrace));
  }
  return make_dict(std::move(entries));
}

absl::StatusOr<Expr*> Parser::ParseNumber(const Token& tok) {
  absl::StatusOr<NumberLiteral> literal =
      ParseNumberLiteral(tok.GetStringValue());
  if (!literal.ok()) {
    return ParseErrorStatus(tok.span(), literal.status().message());
  }
  return module_->Make<Number>(tok.span(), *std::move(literal),
                               tok.GetStringValue());
}

absl::StatusOr<Expr*> Parser::ParseStrings() {
  CORAL_ASSIGN_OR_RETURN(Pos start, PeekPos());
  std::optional<bool> is_bytes;
  bool is_formatted = false;
  int64_t count = 0;
  std::optional<std::string> raw_body;
  // Literal text not yet emitted as a part.
  std::string literal;
  std::vector<Expr*> parts;
  while (true) {
    CORAL_ASSIGN_OR_RETURN(std::optional<Token> tok,
                           TryPopToken(TokenKind::kString));
    if (!tok.has_value()) {
      break;
    }
    const std::string& text = tok->GetStringValue();
    absl::StatusOr<StringLiteralParts> split = SplitStringLiteral(text);
    if (!split.ok()) {
      return ParseErrorStatus(tok->span(), split.status().message());
    }
    if (is_bytes.has_value() && *is_bytes != split->is_bytes) {
      return ParseErrorStatus(tok->span(),
                              "Cannot mix bytes and nonbytes literals.");
    }
    is_bytes = split->is_bytes;
    ++count;
    raw_body = std::nullopt;
    if (split->is_formatted) {
      is_formatted = true;
      const Pos body_start = AdvancePos(
          tok->span().start(),
          absl::string_view(text).substr(0, split->body_offset));
      CORAL_RETURN_IF_ERROR(ParseFormattedBody(split->body, body_start,
                                               split->is_raw, tok->span(),
                                               &literal, &parts));
    } else if (split->is_raw) {
      raw_body = split->body;
      literal.append(split->body);
    } else {
      absl::StatusOr<std::string> decoded =
          UnescapeStringBody(split->body, split->is_bytes);
      if (!decoded.ok()) {
        return ParseErrorStatus(tok->span(), decoded.status().message());
      }
      literal.append(*decoded);
    }
  }
  CORAL_CHECK_GT(count, 0);
  const Span span = SpanFrom(start);
  if (is_formatted) {
    if (!literal.empty()) {
      parts.push_back(module_->Make<String>(span, std::move(literal)));
    }
    return module_->Make<FormattedString>(span, std::move(parts));
  }
  // The verbatim spelling is only kept for a lone raw literal.
  if (count != 1) {
    raw_body = std::nullopt;
  }
  if (*is_bytes) {
    return module_->Make<Bytes>(span, std::move(literal), std::move(raw_body));
  }
  return module_->Make<String>(span, std::move(literal), std::move(raw_body));
}

absl::Status Parser::ParseFormattedBody(absl::string_view body,
                                        const Pos& body_start, bool is_raw,
                                        const Span& span, std::string* literal,
                                        std::vector<Expr*>* parts) {
  absl::StatusOr<std::vector<FStringPiece>> pieces =
      SplitFormattedStringBody(body);
  if (!pieces.ok()) {
    return ParseErrorStatus(span, pieces.status().message());
  }
  for (const FStringPiece& piece : *pieces) {
    if (std::holds_alternative<std::string>(piece)) {
      const std::string& text = std::get<std::string>(piece);
      if (is_raw) {
        literal->append(text);
        continue;
      }
      absl::StatusOr<std::string> decoded =
          UnescapeStringBody(text, /*is_bytes=*/false);
      if (!decoded.ok()) {
        return ParseErrorStatus(span, decoded.status().message());
      }
      literal->append(*decoded);
      continue;
    }

    const FStringField& field = std::get<FStringField>(piece);
    if (!literal->empty()) {
      parts->push_back(module_->Make<String>(span, *literal));
      literal->clear();
    }
    CORAL_ASSIGN_OR_RETURN(
        Expr * value,
        ParseFieldExpression(
            field.expression,
            AdvancePos(body_start, body.substr(0, field.offset)), span));
    FormattedString* format_spec = nullptr;
    if (field.format_spec.has_value()) {
      std::string spec_literal;
      std::vector<Expr*> spec_parts;
      CORAL_RETURN_IF_ERROR(ParseFormattedBody(
          *field.format_spec,
          AdvancePos(body_start, body.substr(0, field.format_spec_offset)),
          is_raw, span, &spec_literal, &spec_parts));
      if (!spec_literal.empty()) {
        spec_parts.push_back(module_->Make<String>(span, spec_literal));
      }
      format_spec = module_->Make<FormattedString>(span, std::move(spec_parts));
    }
    parts->push_back(module_->Make<FormattedValue>(
        span, value, field.conversion, format_spec));
  }
  return absl::OkStatus();
}

absl::StatusOr<Expr*> Parser::ParseFieldExpression(absl::string_view text,
                                                   const Pos& start,
                                                   const Span& span) {
  CORAL_VLOG(5) << "Parsing formatted string field `" << text << "` @ "
                << start;
  Scanner scanner = Scanner::ForExpression(start, std::string(text));
  Parser parser(module_, &scanner);
  Expr* value = nullptr;
  CORAL_ASSIGN_OR_RETURN(const Token* peek, parser.PeekToken());
  if (peek->IsKeyword(Keyword::kYield)) {
    const Pos yield_start = peek->span().start();
    parser.DropTokenOrDie();
    CORAL_ASSIGN_OR_RETURN(value, parser.ParseYield(yield_start));
  } else {
    CORAL_ASSIGN_OR_RETURN(value, parser.ParseTestListStarExpr());
  }
  CORAL_RETURN_IF_ERROR(parser.DropTokenOrError(
      TokenKind::kEof, /*start=*/nullptr, "in formatted string field"));
  if (!scanner.comments().empty()) {
    return ParseErrorStatus(
        span, "Formatted string expression cannot include '#'.");
  }
  return value;
}

}  // namespace coral
