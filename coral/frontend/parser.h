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

#ifndef CORAL_FRONTEND_PARSER_H_
#define CORAL_FRONTEND_PARSER_H_

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "coral/common/status/status_macros.h"
#include "coral/frontend/ast.h"
#include "coral/frontend/comment_data.h"
#include "coral/frontend/scanner.h"
#include "coral/frontend/source_lines.h"
#include "coral/frontend/token_parser.h"

namespace coral {

// A parsed source file together with the trivia the syntax tree does not
// carry.
struct ParsedModule {
  std::unique_ptr<Module> module;
  // Comments in the order they appear in the text.
  std::vector<CommentData> comments;
  SourceLines source_lines;
};

// Parses `text` as a module; `filename` is used for positions in error
// messages.
absl::StatusOr<ParsedModule> ParseModule(absl::string_view text,
                                         absl::string_view filename);

class Parser : public TokenParser {
 public:
  Parser(std::string module_name, Scanner* scanner)
      : TokenParser(scanner),
        owned_module_(std::make_unique<Module>(std::move(module_name))),
        module_(owned_module_.get()) {}

  absl::StatusOr<std::unique_ptr<Module>> ParseModule();

  // Parses an expression (or an unparenthesized tuple of expressions) out of
  // the token stream.
  absl::StatusOr<Expr*> ParseExpression() { return ParseTestListStarExpr(); }

 private:
  friend class ParserTest;

  // Creates a parser for a nested token stream (a replacement field of a
  // formatted string) that makes its nodes in `module`.
  Parser(Module* module, Scanner* scanner)
      : TokenParser(scanner), module_(module) {}

  // Helper that parses a comma-delimited sequence of grammatical productions.
  //
  // Expects the caller to have popped the "initiator" token; however, this
  // (callee) pops the terminator token so the caller does not need to.
  //
  // Permits a trailing comma.
  template <typename T>
  absl::StatusOr<std::vector<T>> ParseCommaSeq(
      const std::function<absl::StatusOr<T>()>& fparse, TokenKind terminator) {
    std::vector<T> parsed;
    bool must_end = false;
    while (true) {
      CORAL_ASSIGN_OR_RETURN(bool popped_terminator, TryDropToken(terminator));
      if (popped_terminator) {
        break;
      }
      if (must_end) {
        CORAL_RETURN_IF_ERROR(DropTokenOrError(terminator));
        break;
      }
      CORAL_ASSIGN_OR_RETURN(T elem, fparse());
      parsed.push_back(elem);
      CORAL_ASSIGN_OR_RETURN(bool dropped_comma,
                             TryDropToken(TokenKind::kComma));
      must_end = !dropped_comma;
    }
    return parsed;
  }

  // Returns the start position of the next token.
  absl::StatusOr<Pos> PeekPos() {
    CORAL_ASSIGN_OR_RETURN(const Token* tok, PeekToken());
    return tok->span().start();
  }

  // Returns whether the next token can begin an expression; used to detect
  // the end of comma-separated lists without a closing delimiter.
  absl::StatusOr<bool> PeekStartsExpression();

  // -- Statements

  // Parses the statement(s) at the current position and appends them to
  // `block`; a line of simple statements may hold several.
  absl::Status ParseStatement(StmtBlock* block);

  // Parses the block following a compound statement header's colon: either
  // an indented suite or simple statements on the same line.
  absl::StatusOr<StmtBlock> ParseBlock();

  absl::Status ParseSimpleStatements(StmtBlock* block);
  absl::StatusOr<Stmt*> ParseSmallStatement();
  absl::StatusOr<Stmt*> ParseExpressionStatement(const Pos& start);
  absl::StatusOr<Stmt*> ParseImport(const Pos& start);
  absl::StatusOr<Stmt*> ParseImportFrom(const Pos& start);
  absl::StatusOr<std::string> ParseDottedName();
  absl::StatusOr<Alias*> ParseAlias(bool dotted);
  absl::StatusOr<std::vector<std::string>> ParseNameList();

  // Parses an if statement whose `if` (or `elif`) keyword at `start` has
  // already been popped.
  absl::StatusOr<If*> ParseIf(const Pos& start);
  absl::StatusOr<While*> ParseWhile(const Pos& start);
  absl::StatusOr<For*> ParseFor(const Pos& start);
  absl::StatusOr<Try*> ParseTry(const Pos& start);
  absl::StatusOr<With*> ParseWith(const Pos& start);
  absl::StatusOr<Stmt*> ParseDecorated(const Pos& start);
  // `start` is the first decorator's position when there is one;
  // `keyword_pos` is that of the already-dropped `def` or `class` keyword.
  absl::StatusOr<Function*> ParseFunction(const Pos& start,
                                          const Pos& keyword_pos,
                                          std::vector<Expr*> decorators);
  absl::StatusOr<ClassDef*> ParseClass(const Pos& start,
                                       const Pos& keyword_pos,
                                       std::vector<Expr*> decorators);

  // Parses an optional `else:` arm; returns the position of the `else`
  // keyword if there was one.
  absl::StatusOr<std::optional<Pos>> ParseElse(StmtBlock* orelse);

  // Parses a parameter list up to (and including) `terminator`. Annotations
  // are permitted only for function parameters (not for lambdas).
  absl::StatusOr<ParamList*> ParseParamList(const Pos& start,
                                            TokenKind terminator,
                                            bool allow_annotations);
  absl::StatusOr<Param*> ParseParam(bool allow_annotations);

  // -- Expressions

  // Parses `test` or `*expr` elements separated by commas; yields a Tuple if
  // a comma was seen.
  absl::StatusOr<Expr*> ParseTestListStarExpr();

  // Parses an assignment/for target list: bitwise-or level expressions (or
  // starred ones) separated by commas, terminated by a token that cannot
  // begin an expression.
  absl::StatusOr<Expr*> ParseTargetList();

  // Parses `element` productions separated by commas (a trailing comma is
  // permitted); the result is the sole element when there is no comma, and a
  // Tuple otherwise.
  absl::StatusOr<Expr*> ParseTupleOf(
      const std::function<absl::StatusOr<Expr*>()>& element);

  absl::StatusOr<Expr*> ParseTestOrStar();
  absl::StatusOr<Expr*> ParseStarExpr();
  absl::StatusOr<Expr*> ParseTarget();
  absl::StatusOr<Expr*> ParseTest();
  absl::StatusOr<Expr*> ParseOrTest();
  absl::StatusOr<Expr*> ParseAndTest();
  absl::StatusOr<Expr*> ParseNotTest();
  absl::StatusOr<Expr*> ParseComparison();
  absl::StatusOr<Expr*> ParseBitOr();
  absl::StatusOr<Expr*> ParseBitXor();
  absl::StatusOr<Expr*> ParseBitAnd();
  absl::StatusOr<Expr*> ParseShift();
  absl::StatusOr<Expr*> ParseArith();
  absl::StatusOr<Expr*> ParseTerm();
  absl::StatusOr<Expr*> ParseFactor();
  absl::StatusOr<Expr*> ParsePower();
  absl::StatusOr<Expr*> ParseAwaitPrimary();
  absl::StatusOr<Expr*> ParsePrimary();
  absl::StatusOr<Expr*> ParseAtom();
  absl::StatusOr<Expr*> ParseLambda(const Pos& start);
  absl::StatusOr<Expr*> ParseYield(const Pos& start);

  // Parses a run of `keyword`-separated operands into a single BoolOp (or
  // returns the sole operand).
  absl::StatusOr<Expr*> ParseBoolOpChain(
      const std::function<absl::StatusOr<Expr*>()>& sub_production,
      Keyword keyword, BoolOpKind kind);

  // Parses a chain of binary operations (left associative) at a given
  // precedence level.
  //
  // Args:
  //  sub_production: Parses the operands at the next-tighter level.
  //  target_tokens: Operator tokens of this precedence level.
  absl::StatusOr<Expr*> ParseBinopChain(
      const std::function<absl::StatusOr<Expr*>()>& sub_production,
      absl::Span<TokenKind const> target_tokens);

  // Parses the remainder of a parenthesized form after the `(`.
  absl::StatusOr<Expr*> ParseParenthesized(const Pos& start);
  absl::StatusOr<Expr*> ParseListDisplay(const Pos& start);
  absl::StatusOr<Expr*> ParseBraceDisplay(const Pos& start);

  // Parses one or more `for ... in ... [if ...]` clauses.
  absl::StatusOr<std::vector<Comprehension*>> ParseComprehensionClauses();

  // Parses call arguments after the `(` (up to and including the `)`).
  absl::Status ParseCallArgs(std::vector<Expr*>* args,
                             std::vector<KeywordArg*>* keywords);
  absl::StatusOr<Expr*> ParseSubscript();
  absl::StatusOr<Expr*> ParseSliceOrTest();

  // Parses a run of adjacent string literal tokens as one literal.
  absl::StatusOr<Expr*> ParseStrings();
  absl::StatusOr<Expr*> ParseNumber(const Token& tok);

  // Parses the body of a formatted string (or of a format spec nested in
  // one) into String/FormattedValue parts. `body_start` is the position of
  // the first character of `body`.
  absl::Status ParseFormattedBody(absl::string_view body,
                                  const Pos& body_start, bool is_raw,
                                  const Span& span, std::string* literal,
                                  std::vector<Expr*>* parts);
  absl::StatusOr<Expr*> ParseFieldExpression(absl::string_view text,
                                             const Pos& start,
                                             const Span& span);

  std::unique_ptr<Module> owned_module_;
  Module* module_;
};

}  // namespace coral

#endif  // CORAL_FRONTEND_PARSER_H_
