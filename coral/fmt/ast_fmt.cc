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


#include "coral/fmt/ast_fmt.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"
#include "coral/common/logging/logging.h"
#include "coral/common/visitor.h"
#include "coral/fmt/annotated.h"
#include "coral/fmt/number_format.h"
#include "coral/frontend/ast.h"
#include "coral/frontend/comment_data.h"
#include "coral/frontend/number_literal.h"
#include "coral/frontend/string_literal.h"

namespace coral {
namespace {

constexpr absl::string_view kIndent = "    ";

// Binding strength of expression forms, weakest first. An operand is
// parenthesized when its own precedence is lower than the precedence its
// position requires.
enum class Precedence {
  kTuple,
  kYield,
  kTest,  // conditional expression, lambda
  kOr,
  kAnd,
  kNot,
  kCmp,
  kBor,
  kBxor,
  kBand,
  kShift,
  kArith,
  kTerm,
  kFactor,  // unary + - ~
  kPower,
  kAwait,
  kAtom,
};

Precedence Next(Precedence p) {
  CORAL_CHECK(p != Precedence::kAtom);
  return static_cast<Precedence>(static_cast<int>(p) + 1);
}

Precedence BinopPrecedence(BinopKind kind) {
  switch (kind) {
    case BinopKind::kBitOr:
      return Precedence::kBor;
    case BinopKind::kBitXor:
      return Precedence::kBxor;
    case BinopKind::kBitAnd:
      return Precedence::kBand;
    case BinopKind::kShl:
    case BinopKind::kShr:
      return Precedence::kShift;
    case BinopKind::kAdd:
    case BinopKind::kSub:
      return Precedence::kArith;
    case BinopKind::kMul:
    case BinopKind::kMatMul:
    case BinopKind::kDiv:
    case BinopKind::kFloorDiv:
    case BinopKind::kMod:
      return Precedence::kTerm;
    case BinopKind::kPow:
      return Precedence::kPower;
  }
  CORAL_LOG(FATAL) << "Invalid binop kind: " << static_cast<int>(kind);
}

Precedence GetPrecedence(const Expr* e) {
  switch (e->kind()) {
    case AstNodeKind::kYield:
    case AstNodeKind::kYieldFrom:
      return Precedence::kYield;
    case AstNodeKind::kLambda:
    case AstNodeKind::kTernary:
      return Precedence::kTest;
    case AstNodeKind::kBoolOp:
      return static_cast<const BoolOp*>(e)->op() == BoolOpKind::kOr
                 ? Precedence::kOr
                 : Precedence::kAnd;
    case AstNodeKind::kUnop:
      return static_cast<const Unop*>(e)->unop_kind() == UnopKind::kNot
                 ? Precedence::kNot
                 : Precedence::kFactor;
    case AstNodeKind::kCompare:
      return Precedence::kCmp;
    case AstNodeKind::kBinop:
      return BinopPrecedence(static_cast<const Binop*>(e)->binop_kind());
    case AstNodeKind::kAwait:
      return Precedence::kAwait;
    default:
      // Atoms, primaries, and displays (which carry their own brackets).
      return Precedence::kAtom;
  }
}

std::string Unsupported(const AstNode* node) {
  return absl::StrCat("<unsupported:", node->GetNodeTypeName(), ">");
}

// Doubles the braces of literal text placed in a formatted string.
std::string EscapeBraces(absl::string_view text) {
  return absl::StrReplaceAll(text, {{"{", "{{"}, {"}", "}}"}});
}

// Spells a raw literal with its body kept verbatim, if some choice of quotes
// can delimit it.
std::optional<std::string> FormatRawLiteral(absl::string_view prefix,
                                            absl::string_view body) {
  if (!absl::StrContains(body, '\n')) {
    for (char quote : {'"', '\''}) {
      if (!absl::StrContains(body, quote)) {
        return absl::StrCat(prefix, std::string(1, quote), body,
                            std::string(1, quote));
      }
    }
  }
  for (absl::string_view quotes : {"\"\"\"", "'''"}) {
    if (!absl::StrContains(body, quotes) &&
        !absl::EndsWith(body, quotes.substr(0, 1))) {
      return absl::StrCat(prefix, quotes, body, quotes);
    }
  }
  return std::nullopt;
}

// Formats expressions; `quote` delimits string literals. Literals nested in a
// formatted string's replacement field use the other quote.
class ExprFormatter {
 public:
  explicit ExprFormatter(char quote) : quote_(quote) {}

  // Formats `e`, parenthesized if it binds more loosely than `context`
  // requires.
  std::string Format(const Expr* e, Precedence context) const {
    std::string text = FormatUnparenthesized(e);
    if (GetPrecedence(e) < context) {
      return absl::StrCat("(", text, ")");
    }
    return text;
  }

  std::string FormatParams(const ParamList* params) const;

 private:
  std::string FormatUnparenthesized(const Expr* e) const;

  std::string FormatStringLiteral(absl::string_view value,
                                  const std::optional<std::string>& raw_body,
                                  bool is_bytes) const;
  std::string FormatFormattedBody(const std::vector<Expr*>& parts) const;
  std::string FormatField(const FormattedValue* field) const;

  std::string FormatList(const std::vector<Expr*>& exprs,
                         Precedence context) const {
    return absl::StrJoin(exprs, ", ", [&](std::string* out, const Expr* e) {
      absl::StrAppend(out, Format(e, context));
    });
  }
  std::string FormatTuple(const SequenceExpr* tuple) const;
  std::string FormatSubscript(const Expr* index) const;
  std::string FormatGenerators(
      const std::vector<Comprehension*>& generators) const;
  std::string FormatKeyword(const KeywordArg* keyword) const;
  std::string FormatParam(const Param* param, const Expr* default_value) const;
  std::string FormatCall(const Invocation* call) const;

  char quote_;
};

std::string ExprFormatter::FormatStringLiteral(
    absl::string_view value, const std::optional<std::string>& raw_body,
    bool is_bytes) const {
  const absl::string_view prefix = is_bytes ? "b" : "";
  if (raw_body.has_value() && quote_ == '"') {
    std::optional<std::string> raw =
        FormatRawLiteral(is_bytes ? "rb" : "r", *raw_body);
    if (raw.has_value()) {
      return *raw;
    }
  }
  const std::string quote(1, quote_);
  return absl::StrCat(prefix, quote,
                      EscapeStringLiteral(value, quote_, is_bytes), quote);
}

std::string ExprFormatter::FormatFormattedBody(
    const std::vector<Expr*>& parts) const {
  std::string result;
  for (const Expr* part : parts) {
    if (part->kind() == AstNodeKind::kString) {
      absl::StrAppend(
          &result,
          EscapeBraces(EscapeStringLiteral(
              static_cast<const String*>(part)->value(), quote_, false)));
    } else if (part->kind() == AstNodeKind::kFormattedValue) {
      absl::StrAppend(&result,
                      FormatField(static_cast<const FormattedValue*>(part)));
    } else {
      absl::StrAppend(&result, Unsupported(part));
    }
  }
  return result;
}

std::string ExprFormatter::FormatField(const FormattedValue* field) const {
  const std::string expr =
      ExprFormatter('\'').Format(field->value(), Precedence::kOr);
  // A leading space keeps a display from reading as an escaped brace.
  std::string result = absl::StartsWith(expr, "{") ? "{ " : "{";
  absl::StrAppend(&result, expr);
  if (field->conversion().has_value()) {
    absl::StrAppend(&result, "!", std::string(1, *field->conversion()));
  }
  if (field->format_spec() != nullptr) {
    absl::StrAppend(&result, ":",
                    FormatFormattedBody(field->format_spec()->parts()));
  }
  absl::StrAppend(&result, "}");
  return result;
}

std::string ExprFormatter::FormatTuple(const SequenceExpr* tuple) const {
  const std::vector<Expr*>& elements = tuple->elements();
  if (elements.size() == 1) {
    return absl::StrCat("(", Format(elements[0], Precedence::kTest), ",)");
  }
  return absl::StrCat("(", FormatList(elements, Precedence::kTest), ")");
}

std::string ExprFormatter::FormatSubscript(const Expr* index) const {
  if (index->kind() != AstNodeKind::kTuple) {
    return Format(index, Precedence::kTest);
  }
  const std::vector<Expr*>& elements =
      static_cast<const Tuple*>(index)->elements();
  if (elements.empty()) {
    return "()";
  }
  if (elements.size() == 1) {
    return absl::StrCat(Format(elements[0], Precedence::kTest), ",");
  }
  return FormatList(elements, Precedence::kTest);
}

std::string ExprFormatter::FormatGenerators(
    const std::vector<Comprehension*>& generators) const {
  std::string result;
  for (const Comprehension* generator : generators) {
    absl::StrAppend(&result, " for ",
                    Format(generator->target(), Precedence::kTest), " in ",
                    Format(generator->iter(), Precedence::kOr));
    for (const Expr* condition : generator->ifs()) {
      absl::StrAppend(&result, " if ", Format(condition, Precedence::kOr));
    }
  }
  return result;
}

std::string ExprFormatter::FormatKeyword(const KeywordArg* keyword) const {
  if (!keyword->name().has_value()) {
    return absl::StrCat("**", Format(keyword->value(), Precedence::kBor));
  }
  return absl::StrCat(*keyword->name(), "=",
                      Format(keyword->value(), Precedence::kTest));
}

std::string ExprFormatter::FormatParam(const Param* param,
                                       const Expr* default_value) const {
  std::string result = param->name();
  if (param->annotation() != nullptr) {
    absl::StrAppend(&result, ": ",
                    Format(param->annotation(), Precedence::kTest));
  }
  if (default_value != nullptr) {
    absl::StrAppend(&result, param->annotation() != nullptr ? " = " : "=",
                    Format(default_value, Precedence::kTest));
  }
  return result;
}

std::string ExprFormatter::FormatParams(const ParamList* params) const {
  std::vector<std::string> pieces;
  const std::vector<Param*>& args = params->args();
  const std::vector<Expr*>& defaults = params->defaults();
  const size_t first_default = args.size() - defaults.size();
  for (size_t i = 0; i < args.size(); ++i) {
    pieces.push_back(FormatParam(
        args[i], i >= first_default ? defaults[i - first_default] : nullptr));
  }
  if (params->vararg() != nullptr) {
    pieces.push_back(
        absl::StrCat("*", FormatParam(params->vararg(), nullptr)));
  } else if (!params->kwonlyargs().empty()) {
    pieces.push_back("*");
  }
  for (size_t i = 0; i < params->kwonlyargs().size(); ++i) {
    pieces.push_back(
        FormatParam(params->kwonlyargs()[i], params->kw_defaults()[i]));
  }
  if (params->kwarg() != nullptr) {
    pieces.push_back(absl::StrCat("**", FormatParam(params->kwarg(), nullptr)));
  }
  return absl::StrJoin(pieces, ", ");
}

std::string ExprFormatter::FormatCall(const Invocation* call) const {
  const std::string callee = Format(call->callee(), Precedence::kAtom);
  // A sole generator expression argument shares the call's parentheses.
  if (call->args().size() == 1 && call->keywords().empty() &&
      call->args()[0]->kind() == AstNodeKind::kGeneratorExp) {
    return absl::StrCat(callee, FormatUnparenthesized(call->args()[0]));
  }
  std::vector<std::string> pieces;
  for (const Expr* arg : call->args()) {
    pieces.push_back(Format(arg, Precedence::kTest));
  }
  for (const KeywordArg* keyword : call->keywords()) {
    pieces.push_back(FormatKeyword(keyword));
  }
  return absl::StrCat(callee, "(", absl::StrJoin(pieces, ", "), ")");
}

std::string ExprFormatter::FormatUnparenthesized(const Expr* e) const {
  switch (e->kind()) {
    case AstNodeKind::kNameRef:
      return static_cast<const NameRef*>(e)->identifier();
    case AstNodeKind::kNumber: {
      auto* n = static_cast<const Number*>(e);
      switch (n->number_kind()) {
        case NumberKind::kInt:
          return n->decimal();
        case NumberKind::kFloat:
          return FloatRepr(n->value());
        case NumberKind::kImaginary:
          return ImaginaryRepr(n->value());
      }
      return Unsupported(e);
    }
    case AstNodeKind::kString: {
      auto* s = static_cast<const String*>(e);
      return FormatStringLiteral(s->value(), s->raw_body(), /*is_bytes=*/false);
    }
    case AstNodeKind::kBytes: {
      auto* b = static_cast<const Bytes*>(e);
      return FormatStringLiteral(b->value(), b->raw_body(), /*is_bytes=*/true);
    }
    case AstNodeKind::kConstant:
      return ConstantKindFormat(
          static_cast<const Constant*>(e)->constant_kind());
    case AstNodeKind::kFormattedString: {
      const std::string quote(1, quote_);
      return absl::StrCat(
          "f", quote,
          FormatFormattedBody(static_cast<const FormattedString*>(e)->parts()),
          quote);
    }
    case AstNodeKind::kFormattedValue:
      return FormatField(static_cast<const FormattedValue*>(e));
    case AstNodeKind::kList:
      return absl::StrCat(
          "[",
          FormatList(static_cast<const List*>(e)->elements(),
                     Precedence::kTest),
          "]");
    case AstNodeKind::kTuple:
      return FormatTuple(static_cast<const Tuple*>(e));
    case AstNodeKind::kSet:
      return absl::StrCat(
          "{",
          FormatList(static_cast<const Set*>(e)->elements(), Precedence::kTest),
          "}");
    case AstNodeKind::kDict: {
      auto* dict = static_cast<const Dict*>(e);
      std::vector<std::string> items;
      for (size_t i = 0; i < dict->keys().size(); ++i) {
        if (dict->keys()[i] == nullptr) {
          items.push_back(
              absl::StrCat("**", Format(dict->values()[i], Precedence::kBor)));
        } else {
          items.push_back(absl::StrCat(
              Format(dict->keys()[i], Precedence::kTest), ": ",
              Format(dict->values()[i], Precedence::kTest)));
        }
      }
      return absl::StrCat("{", absl::StrJoin(items, ", "), "}");
    }
    case AstNodeKind::kListComp:
    case AstNodeKind::kSetComp:
    case AstNodeKind::kGeneratorExp: {
      auto* comp = static_cast<const ElementComprehension*>(e);
      absl::string_view open = "(";
      absl::string_view close = ")";
      if (e->kind() == AstNodeKind::kListComp) {
        open = "[";
        close = "]";
      } else if (e->kind() == AstNodeKind::kSetComp) {
        open = "{";
        close = "}";
      }
      return absl::StrCat(open, Format(comp->element(), Precedence::kTest),
                          FormatGenerators(comp->generators()), close);
    }
    case AstNodeKind::kDictComp: {
      auto* comp = static_cast<const DictComp*>(e);
      return absl::StrCat("{", Format(comp->key(), Precedence::kTest), ": ",
                          Format(comp->value(), Precedence::kTest),
                          FormatGenerators(comp->generators()), "}");
    }
    case AstNodeKind::kBinop: {
      auto* binop = static_cast<const Binop*>(e);
      const Precedence p = BinopPrecedence(binop->binop_kind());
      // `**` is right-associative, and a unary operation may be its right
      // operand but not its left.
      const bool is_pow = binop->binop_kind() == BinopKind::kPow;
      return absl::StrCat(
          Format(binop->lhs(), is_pow ? Precedence::kAwait : p), " ",
          BinopKindFormat(binop->binop_kind()), " ",
          Format(binop->rhs(), is_pow ? Precedence::kFactor : Next(p)));
    }
    case AstNodeKind::kBoolOp: {
      auto* boolop = static_cast<const BoolOp*>(e);
      // Runs of the same operator are flattened into one node, so a nested
      // one was parenthesized.
      const Precedence operand = Next(GetPrecedence(e));
      const std::string separator =
          absl::StrCat(" ", BoolOpKindFormat(boolop->op()), " ");
      return absl::StrJoin(
          boolop->values(), separator,
          [&](std::string* out, const Expr* value) {
            absl::StrAppend(out, Format(value, operand));
          });
    }
    case AstNodeKind::kCompare: {
      auto* compare = static_cast<const Compare*>(e);
      std::string result = Format(compare->lhs(), Precedence::kBor);
      for (size_t i = 0; i < compare->ops().size(); ++i) {
        absl::StrAppend(&result, " ", CompareOpKindFormat(compare->ops()[i]),
                        " ",
                        Format(compare->comparators()[i], Precedence::kBor));
      }
      return result;
    }
    case AstNodeKind::kUnop: {
      auto* unop = static_cast<const Unop*>(e);
      if (unop->unop_kind() == UnopKind::kNot) {
        return absl::StrCat("not ", Format(unop->operand(), Precedence::kNot));
      }
      return absl::StrCat(UnopKindFormat(unop->unop_kind()),
                          Format(unop->operand(), Precedence::kFactor));
    }
    case AstNodeKind::kTernary: {
      auto* ternary = static_cast<const Ternary*>(e);
      return absl::StrCat(Format(ternary->consequent(), Precedence::kOr),
                          " if ", Format(ternary->test(), Precedence::kOr),
                          " else ",
                          Format(ternary->alternate(), Precedence::kTest));
    }
    case AstNodeKind::kLambda: {
      auto* lambda = static_cast<const Lambda*>(e);
      std::string result = "lambda";
      if (!lambda->params()->empty()) {
        absl::StrAppend(&result, " ", FormatParams(lambda->params()));
      }
      absl::StrAppend(&result, ": ", Format(lambda->body(), Precedence::kTest));
      return result;
    }
    case AstNodeKind::kInvocation:
      return FormatCall(static_cast<const Invocation*>(e));
    case AstNodeKind::kAttr: {
      auto* attr = static_cast<const Attr*>(e);
      std::string lhs = Format(attr->lhs(), Precedence::kAtom);
      // `1.real` would scan as a float.
      if (attr->lhs()->kind() == AstNodeKind::kNumber &&
          static_cast<const Number*>(attr->lhs())->number_kind() ==
              NumberKind::kInt) {
        lhs = absl::StrCat("(", lhs, ")");
      }
      return absl::StrCat(lhs, ".", attr->attr());
    }
    case AstNodeKind::kIndex: {
      auto* index = static_cast<const Index*>(e);
      return absl::StrCat(Format(index->lhs(), Precedence::kAtom), "[",
                          FormatSubscript(index->index()), "]");
    }
    case AstNodeKind::kSlice: {
      auto* slice = static_cast<const Slice*>(e);
      std::string result;
      if (slice->lower() != nullptr) {
        absl::StrAppend(&result, Format(slice->lower(), Precedence::kTest));
      }
      absl::StrAppend(&result, ":");
      if (slice->upper() != nullptr) {
        absl::StrAppend(&result, Format(slice->upper(), Precedence::kTest));
      }
      if (slice->step() != nullptr) {
        absl::StrAppend(&result, ":",
                        Format(slice->step(), Precedence::kTest));
      }
      return result;
    }
    case AstNodeKind::kStarred:
      return absl::StrCat("*", Format(static_cast<const Starred*>(e)->value(),
                                      Precedence::kBor));
    case AstNodeKind::kYield: {
      auto* yield = static_cast<const Yield*>(e);
      if (yield->value() == nullptr) {
        return "yield";
      }
      return absl::StrCat("yield ", Format(yield->value(), Precedence::kTest));
    }
    case AstNodeKind::kYieldFrom:
      return absl::StrCat(
          "yield from ",
          Format(static_cast<const YieldFrom*>(e)->value(), Precedence::kTest));
    case AstNodeKind::kAwait:
      // The operand is a primary; a nested await needs parentheses.
      return absl::StrCat(
          "await ",
          Format(static_cast<const Await*>(e)->value(), Precedence::kAtom));
    default:
      return Unsupported(e);
  }
}

// Renders a block's entries as indented lines.
class BlockPrinter {
 public:
  BlockPrinter() : expr_fmt_('"') {}

  void PrintBlock(const Block& block, int64_t level) {
    for (const BlockEntry& entry : block.entries) {
      PrintEntry(entry, level);
    }
  }

  std::string Finish() const {
    if (lines_.empty()) {
      return "";
    }
    return absl::StrCat(absl::StrJoin(lines_, "\n"), "\n");
  }

 private:
  void AddLine(int64_t level, absl::string_view text,
               const std::optional<CommentData>& comment = std::nullopt) {
    std::string line;
    for (int64_t i = 0; i < level; ++i) {
      absl::StrAppend(&line, kIndent);
    }
    absl::StrAppend(&line, text);
    if (comment.has_value()) {
      absl::StrAppend(&line, "  ", FormatComment(comment->text));
    }
    lines_.push_back(std::move(line));
  }

  std::string Fmt(const Expr* e, Precedence context = Precedence::kTest) const {
    return expr_fmt_.Format(e, context);
  }

  void PrintEntry(const BlockEntry& entry, int64_t level) {
    std::visit(Visitor{
                   [&](const Bare& e) {
                     PrintStmt(e.stmt, std::nullopt, 0, e.blocks, level);
                   },
                   [&](const Trailing& e) {
                     PrintStmt(e.stmt, e.comment, e.header_line, e.blocks,
                               level);
                   },
                   [&](const ConditionalWithComments& e) {
                     PrintConditional(e, level);
                   },
                   [&](const StandaloneComment& e) {
                     AddLine(level, FormatComment(e.comment.text));
                   },
               },
               entry);
  }

  // Prints a statement other than the ones with clauses; `comment` goes on
  // header line `comment_line`, counting decorators.
  void PrintStmt(const Stmt* stmt, const std::optional<CommentData>& comment,
                 int64_t comment_line, const std::vector<Block>& blocks,
                 int64_t level);

  void PrintConditional(const ConditionalWithComments& e, int64_t level);

  // Prints an if statement and its elif/else clauses; `keyword` is "if" or
  // "elif".
  void PrintIf(const ConditionalWithComments& e, absl::string_view keyword,
               int64_t level);

  // Prints the `else:` arm of a loop or try statement, if it has one.
  void PrintElse(const StmtBlock& orelse, const ConditionalWithComments& e,
                 const Block& block, int64_t level) {
    if (orelse.empty()) {
      return;
    }
    AddLine(level, "else:", e.else_comment);
    PrintBlock(block, level + 1);
  }

  std::string FormatSimpleStmt(const Stmt* stmt) const;
  std::string FormatAlias(const Alias* alias) const {
    if (alias->asname().has_value()) {
      return absl::StrCat(alias->name(), " as ", *alias->asname());
    }
    return alias->name();
  }

  ExprFormatter expr_fmt_;
  std::vector<std::string> lines_;
};

void BlockPrinter::PrintStmt(const Stmt* stmt,
                             const std::optional<CommentData>& comment,
                             int64_t comment_line,
                             const std::vector<Block>& blocks, int64_t level) {
  std::vector<std::string> header;
  switch (stmt->kind()) {
    case AstNodeKind::kFunction: {
      auto* f = static_cast<const Function*>(stmt);
      for (const Expr* decorator : f->decorators()) {
        header.push_back(absl::StrCat("@", Fmt(decorator)));
      }
      std::string def = absl::StrCat("def ", f->name(), "(",
                                     expr_fmt_.FormatParams(f->params()), ")");
      if (f->returns() != nullptr) {
        absl::StrAppend(&def, " -> ", Fmt(f->returns()));
      }
      header.push_back(absl::StrCat(def, ":"));
      break;
    }
    case AstNodeKind::kClassDef: {
      auto* c = static_cast<const ClassDef*>(stmt);
      for (const Expr* decorator : c->decorators()) {
        header.push_back(absl::StrCat("@", Fmt(decorator)));
      }
      std::vector<std::string> args;
      for (const Expr* base : c->bases()) {
        args.push_back(Fmt(base));
      }
      for (const KeywordArg* keyword : c->keywords()) {
        args.push_back(absl::StrCat(
            keyword->name().has_value() ? *keyword->name() : "**",
            keyword->name().has_value() ? "=" : "",
            Fmt(keyword->value(), keyword->name().has_value()
                                      ? Precedence::kTest
                                      : Precedence::kBor)));
      }
      std::string def = absl::StrCat("class ", c->name());
      if (!args.empty()) {
        absl::StrAppend(&def, "(", absl::StrJoin(args, ", "), ")");
      }
      header.push_back(absl::StrCat(def, ":"));
      break;
    }
    case AstNodeKind::kWith: {
      auto* w = static_cast<const With*>(stmt);
      std::vector<std::string> items;
      for (const WithItem* item : w->items()) {
        std::string text = Fmt(item->context_expr());
        if (item->optional_vars() != nullptr) {
          absl::StrAppend(&text, " as ", Fmt(item->optional_vars()));
        }
        items.push_back(std::move(text));
      }
      header.push_back(absl::StrCat("with ", absl::StrJoin(items, ", "), ":"));
      break;
    }
    default:
      header.push_back(FormatSimpleStmt(stmt));
      break;
  }

  for (size_t i = 0; i < header.size(); ++i) {
    AddLine(level, header[i],
            static_cast<int64_t>(i) == comment_line
                ? comment
                : std::optional<CommentData>());
  }
  for (const Block& block : blocks) {
    PrintBlock(block, level + 1);
  }
}

void BlockPrinter::PrintConditional(const ConditionalWithComments& e,
                                    int64_t level) {
  switch (e.stmt->kind()) {
    case AstNodeKind::kIf:
      PrintIf(e, "if", level);
      return;
    case AstNodeKind::kWhile: {
      auto* node = static_cast<const While*>(e.stmt);
      AddLine(level, absl::StrCat("while ", Fmt(node->test()), ":"),
              e.head_comment);
      PrintBlock(e.blocks[0], level + 1);
      PrintElse(node->orelse(), e, e.blocks[1], level);
      return;
    }
    case AstNodeKind::kFor: {
      auto* node = static_cast<const For*>(e.stmt);
      AddLine(level,
              absl::StrCat("for ", Fmt(node->target()), " in ",
                           Fmt(node->iter()), ":"),
              e.head_comment);
      PrintBlock(e.blocks[0], level + 1);
      PrintElse(node->orelse(), e, e.blocks[1], level);
      return;
    }
    case AstNodeKind::kTry: {
      auto* node = static_cast<const Try*>(e.stmt);
      const std::vector<ExceptHandler*>& handlers = node->handlers();
      CORAL_CHECK_EQ(e.blocks.size(), handlers.size() + 3);
      CORAL_CHECK_EQ(e.handler_comments.size(), handlers.size());
      AddLine(level, "try:", e.head_comment);
      PrintBlock(e.blocks[0], level + 1);
      for (size_t i = 0; i < handlers.size(); ++i) {
        const ExceptHandler* handler = handlers[i];
        std::string text = "except";
        if (handler->type() != nullptr) {
          absl::StrAppend(&text, " ", Fmt(handler->type()));
          if (handler->name().has_value()) {
            absl::StrAppend(&text, " as ", *handler->name());
          }
        }
        AddLine(level, absl::StrCat(text, ":"), e.handler_comments[i]);
        PrintBlock(e.blocks[i + 1], level + 1);
      }
      PrintElse(node->orelse(), e, e.blocks[handlers.size() + 1], level);
      if (!node->finalbody().empty()) {
        AddLine(level, "finally:", e.finally_comment);
        PrintBlock(e.blocks[handlers.size() + 2], level + 1);
      }
      return;
    }
    default:
      AddLine(level, Unsupported(e.stmt), e.head_comment);
      return;
  }
}

void BlockPrinter::PrintIf(const ConditionalWithComments& e,
                           absl::string_view keyword, int64_t level) {
  auto* node = static_cast<const If*>(e.stmt);
  AddLine(level, absl::StrCat(keyword, " ", Fmt(node->test()), ":"),
          e.head_comment);
  PrintBlock(e.blocks[0], level + 1);
  if (node->orelse().empty()) {
    return;
  }
  const Block& orelse = e.blocks[1];
  if (!e.else_comment.has_value() && orelse.entries.size() == 1) {
    if (const auto* nested =
            std::get_if<ConditionalWithComments>(&orelse.entries[0]);
        nested != nullptr && nested->stmt->kind() == AstNodeKind::kIf) {
      PrintIf(*nested, "elif", level);
      return;
    }
  }
  AddLine(level, "else:", e.else_comment);
  PrintBlock(orelse, level + 1);
}

std::string BlockPrinter::FormatSimpleStmt(const Stmt* stmt) const {
  switch (stmt->kind()) {
    case AstNodeKind::kExprStmt:
      return Fmt(static_cast<const ExprStmt*>(stmt)->expr(),
                 Precedence::kYield);
    case AstNodeKind::kAssign: {
      auto* assign = static_cast<const Assign*>(stmt);
      std::string result;
      for (const Expr* target : assign->targets()) {
        absl::StrAppend(&result, Fmt(target), " = ");
      }
      absl::StrAppend(&result, Fmt(assign->value(), Precedence::kYield));
      return result;
    }
    case AstNodeKind::kAugAssign: {
      auto* assign = static_cast<const AugAssign*>(stmt);
      return absl::StrCat(Fmt(assign->target()), " ",
                          BinopKindFormat(assign->op()), "= ",
                          Fmt(assign->value(), Precedence::kYield));
    }
    case AstNodeKind::kAnnAssign: {
      auto* assign = static_cast<const AnnAssign*>(stmt);
      std::string result = absl::StrCat(Fmt(assign->target()), ": ",
                                        Fmt(assign->annotation()));
      if (assign->value() != nullptr) {
        absl::StrAppend(&result, " = ",
                        Fmt(assign->value(), Precedence::kYield));
      }
      return result;
    }
    case AstNodeKind::kPass:
      return "pass";
    case AstNodeKind::kBreak:
      return "break";
    case AstNodeKind::kContinue:
      return "continue";
    case AstNodeKind::kReturn: {
      auto* ret = static_cast<const Return*>(stmt);
      if (ret->value() == nullptr) {
        return "return";
      }
      return absl::StrCat("return ", Fmt(ret->value()));
    }
    case AstNodeKind::kDelete: {
      auto* del = static_cast<const Delete*>(stmt);
      return absl::StrCat(
          "del ", absl::StrJoin(del->targets(), ", ",
                                [&](std::string* out, const Expr* target) {
                                  absl::StrAppend(out, Fmt(target));
                                }));
    }
    case AstNodeKind::kGlobal:
      return absl::StrCat(
          "global ", absl::StrJoin(static_cast<const Global*>(stmt)->names(),
                                   ", "));
    case AstNodeKind::kNonlocal:
      return absl::StrCat(
          "nonlocal ",
          absl::StrJoin(static_cast<const Nonlocal*>(stmt)->names(), ", "));
    case AstNodeKind::kImport: {
      auto* import = static_cast<const Import*>(stmt);
      return absl::StrCat(
          "import ", absl::StrJoin(import->names(), ", ",
                                   [&](std::string* out, const Alias* alias) {
                                     absl::StrAppend(out, FormatAlias(alias));
                                   }));
    }
    case AstNodeKind::kImportFrom: {
      auto* import = static_cast<const ImportFrom*>(stmt);
      return absl::StrCat(
          "from ", std::string(import->level(), '.'), import->module(),
          " import ",
          absl::StrJoin(import->names(), ", ",
                        [&](std::string* out, const Alias* alias) {
                          absl::StrAppend(out, FormatAlias(alias));
                        }));
    }
    case AstNodeKind::kRaise: {
      auto* raise = static_cast<const Raise*>(stmt);
      std::string result = "raise";
      if (raise->exc() != nullptr) {
        absl::StrAppend(&result, " ", Fmt(raise->exc()));
        if (raise->cause() != nullptr) {
          absl::StrAppend(&result, " from ", Fmt(raise->cause()));
        }
      }
      return result;
    }
    case AstNodeKind::kAssert: {
      auto* assert_stmt = static_cast<const Assert*>(stmt);
      std::string result = absl::StrCat("assert ", Fmt(assert_stmt->test()));
      if (assert_stmt->msg() != nullptr) {
        absl::StrAppend(&result, ", ", Fmt(assert_stmt->msg()));
      }
      return result;
    }
    default:
      return Unsupported(stmt);
  }
}

}  // namespace

std::string FormatExpr(const Expr* expr) {
  return ExprFormatter('"').Format(expr, Precedence::kTuple);
}

std::string FormatComment(absl::string_view text) {
  absl::string_view body = text;
  absl::ConsumePrefix(&body, "#");
  body = absl::StripAsciiWhitespace(body);
  if (body.empty()) {
    return "#";
  }
  return absl::StrCat("# ", body);
}

std::string FormatBlock(const Block& block) {
  BlockPrinter printer;
  printer.PrintBlock(block, /*level=*/0);
  return printer.Finish();
}

}  // namespace coral
