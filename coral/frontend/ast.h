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

#ifndef CORAL_FRONTEND_AST_H_
#define CORAL_FRONTEND_AST_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/string_view.h"
#include "coral/common/logging/logging.h"
#include "coral/frontend/number_literal.h"
#include "coral/frontend/pos.h"

namespace coral {

// Higher-order macros for all the statement and expression leaf types.
#define CORAL_AST_STMT_NODE_EACH(X) \
  X(AnnAssign)                      \
  X(Assert)                         \
  X(Assign)                         \
  X(AugAssign)                      \
  X(Break)                          \
  X(ClassDef)                       \
  X(Continue)                       \
  X(Delete)                         \
  X(ExprStmt)                       \
  X(For)                            \
  X(Function)                       \
  X(Global)                         \
  X(If)                             \
  X(Import)                         \
  X(ImportFrom)                     \
  X(Nonlocal)                       \
  X(Pass)                           \
  X(Raise)                          \
  X(Return)                         \
  X(Try)                            \
  X(While)                          \
  X(With)

#define CORAL_AST_EXPR_NODE_EACH(X) \
  X(Attr)                           \
  X(Await)                          \
  X(Binop)                          \
  X(BoolOp)                         \
  X(Bytes)                          \
  X(Compare)                        \
  X(Constant)                       \
  X(Dict)                           \
  X(DictComp)                       \
  X(FormattedString)                \
  X(FormattedValue)                 \
  X(GeneratorExp)                   \
  X(Index)                          \
  X(Invocation)                     \
  X(Lambda)                         \
  X(List)                           \
  X(ListComp)                       \
  X(NameRef)                        \
  X(Number)                         \
  X(Set)                            \
  X(SetComp)                        \
  X(Slice)                          \
  X(Starred)                        \
  X(String)                         \
  X(Ternary)                        \
  X(Tuple)                          \
  X(Unop)                           \
  X(Yield)                          \
  X(YieldFrom)

#define CORAL_AST_NODE_EACH(X) \
  X(Alias)                     \
  X(Comprehension)             \
  X(ExceptHandler)             \
  X(KeywordArg)                \
  X(Module)                    \
  X(Param)                     \
  X(ParamList)                 \
  X(WithItem)                  \
  CORAL_AST_STMT_NODE_EACH(X)  \
  CORAL_AST_EXPR_NODE_EACH(X)

// Forward decls of non-leaf types.
class Expr;
class Stmt;

// Forward decls of all leaf types.
#define FORWARD_DECL(__type) class __type;
CORAL_AST_NODE_EACH(FORWARD_DECL)
#undef FORWARD_DECL

enum class AstNodeKind {
#define MAKE_ENUM(__type) k##__type,
  CORAL_AST_NODE_EACH(MAKE_ENUM)
#undef MAKE_ENUM
};

// Returns the name of the node type; e.g. "Await" for AstNodeKind::kAwait.
std::string AstNodeKindToString(AstNodeKind kind);

inline std::ostream& operator<<(std::ostream& os, AstNodeKind kind) {
  os << AstNodeKindToString(kind);
  return os;
}

// Abstract base class for AST nodes.
//
// Nodes are owned by their Module (see Module::Make) and refer to each other
// by raw pointer; the syntax tree is immutable once parsed.
class AstNode {
 public:
  explicit AstNode(Module* owner) : owner_(owner) {}
  virtual ~AstNode();

  virtual AstNodeKind kind() const = 0;

  // Returns a structural dump of the subtree rooted at this node. Positions
  // are not included, so equal dumps mean structurally equal trees.
  virtual std::string ToString() const = 0;

  // Retrieves the name of the leafmost-derived class, suitable for debugging;
  // e.g. "NameRef", "Invocation", etc.
  std::string GetNodeTypeName() const { return AstNodeKindToString(kind()); }

  Module* owner() const { return owner_; }

 private:
  Module* owner_;
};

// Returns whether the two subtrees are structurally equal, ignoring positions.
bool NodesEqual(const AstNode* a, const AstNode* b);

// Base class for the nodes that have a position in the text.
class SpannedNode : public AstNode {
 public:
  SpannedNode(Module* owner, Span span)
      : AstNode(owner), span_(std::move(span)) {}
  ~SpannedNode() override;

  const Span& span() const { return span_; }

 private:
  Span span_;
};

// Abstract base class for expressions.
class Expr : public SpannedNode {
 public:
  using SpannedNode::SpannedNode;
  ~Expr() override;
};

// A sequence of statements, e.g. the body of a function.
using StmtBlock = std::vector<Stmt*>;

// Abstract base class for statements. The statement's line (the line of its
// first token, or of its first decorator) is the anchor for comment placement.
class Stmt : public SpannedNode {
 public:
  using SpannedNode::SpannedNode;
  ~Stmt() override;

  int64_t lineno() const { return span().start().lineno(); }
  int64_t colno() const { return span().start().colno(); }

  // Returns the statement sequences owned by this statement, in source order;
  // e.g. for a `for` statement the body and the `else:` arm.
  virtual std::vector<const StmtBlock*> GetBlocks() const { return {}; }
};

// -- Operator kinds

#define CORAL_BINOP_KIND_EACH(X)          \
  /* enum member, dump name, tok str */   \
  X(kAdd, "Add", "+")                     \
  X(kSub, "Sub", "-")                     \
  X(kMul, "Mult", "*")                    \
  X(kMatMul, "MatMult", "@")              \
  X(kDiv, "Div", "/")                     \
  X(kFloorDiv, "FloorDiv", "//")          \
  X(kMod, "Mod", "%")                     \
  X(kPow, "Pow", "**")                    \
  X(kShl, "LShift", "<<")                 \
  X(kShr, "RShift", ">>")                 \
  X(kBitOr, "BitOr", "|")                 \
  X(kBitXor, "BitXor", "^")               \
  X(kBitAnd, "BitAnd", "&")

enum class BinopKind {
#define FIRST_COMMA(A, ...) A,
  CORAL_BINOP_KIND_EACH(FIRST_COMMA)
#undef FIRST_COMMA
};

// Returns the "operator token" corresponding to the given binop kind; e.g. "+"
// for kAdd.
std::string BinopKindFormat(BinopKind kind);

// Returns a string representation of the given binary operation kind; e.g.
// "FloorDiv".
std::string BinopKindToString(BinopKind kind);

#define CORAL_COMPARE_OP_KIND_EACH(X) \
  X(kEq, "Eq", "==")                  \
  X(kNotEq, "NotEq", "!=")            \
  X(kLt, "Lt", "<")                   \
  X(kLtE, "LtE", "<=")                \
  X(kGt, "Gt", ">")                   \
  X(kGtE, "GtE", ">=")                \
  X(kIn, "In", "in")                  \
  X(kNotIn, "NotIn", "not in")        \
  X(kIs, "Is", "is")                  \
  X(kIsNot, "IsNot", "is not")

enum class CompareOpKind {
#define FIRST_COMMA(A, ...) A,
  CORAL_COMPARE_OP_KIND_EACH(FIRST_COMMA)
#undef FIRST_COMMA
};

std::string CompareOpKindFormat(CompareOpKind kind);
std::string CompareOpKindToString(CompareOpKind kind);

enum class UnopKind {
  kNot,     // not x
  kNegate,  // -x
  kPlus,    // +x
  kInvert,  // ~x
};

std::string UnopKindFormat(UnopKind kind);
std::string UnopKindToString(UnopKind kind);

enum class BoolOpKind {
  kAnd,
  kOr,
};

std::string BoolOpKindFormat(BoolOpKind kind);

enum class ConstantKind {
  kTrue,
  kFalse,
  kNone,
  kEllipsis,
};

// Returns the source spelling of the constant, e.g. "..." for kEllipsis.
std::string ConstantKindFormat(ConstantKind kind);

// -- Expressions

// Represents a reference to a name (identifier).
class NameRef : public Expr {
 public:
  NameRef(Module* owner, Span span, std::string identifier)
      : Expr(owner, std::move(span)), identifier_(std::move(identifier)) {}

  AstNodeKind kind() const override { return AstNodeKind::kNameRef; }
  std::string ToString() const override;

  const std::string& identifier() const { return identifier_; }

 private:
  std::string identifier_;
};

// Represents a numeric literal. The original spelling is retained only for
// diagnostics; formatting uses the value.
class Number : public Expr {
 public:
  Number(Module* owner, Span span, NumberLiteral literal, std::string text)
      : Expr(owner, std::move(span)),
        literal_(std::move(literal)),
        text_(std::move(text)) {}

  AstNodeKind kind() const override { return AstNodeKind::kNumber; }
  std::string ToString() const override;

  NumberKind number_kind() const { return literal_.kind; }
  // Decimal digits of an integer literal.
  const std::string& decimal() const { return literal_.decimal; }
  // Value of a float literal, or the imaginary part of an imaginary literal.
  double value() const { return literal_.value; }
  const std::string& text() const { return text_; }

 private:
  NumberLiteral literal_;
  std::string text_;
};

// Represents a str literal (after adjacent literals have been concatenated).
class String : public Expr {
 public:
  // `raw_body` is the verbatim body of a lone raw literal (`r"\d"`).
  String(Module* owner, Span span, std::string value,
         std::optional<std::string> raw_body = std::nullopt)
      : Expr(owner, std::move(span)),
        value_(std::move(value)),
        raw_body_(std::move(raw_body)) {}

  AstNodeKind kind() const override { return AstNodeKind::kString; }
  std::string ToString() const override;

  // Decoded value, UTF-8 encoded.
  const std::string& value() const { return value_; }
  const std::optional<std::string>& raw_body() const { return raw_body_; }

 private:
  std::string value_;
  std::optional<std::string> raw_body_;
};

// Represents a bytes literal.
class Bytes : public Expr {
 public:
  Bytes(Module* owner, Span span, std::string value,
        std::optional<std::string> raw_body = std::nullopt)
      : Expr(owner, std::move(span)),
        value_(std::move(value)),
        raw_body_(std::move(raw_body)) {}

  AstNodeKind kind() const override { return AstNodeKind::kBytes; }
  std::string ToString() const override;

  const std::string& value() const { return value_; }
  const std::optional<std::string>& raw_body() const { return raw_body_; }

 private:
  std::string value_;
  std::optional<std::string> raw_body_;
};

// Represents `True`, `False`, `None` or `...`.
class Constant : public Expr {
 public:
  Constant(Module* owner, Span span, ConstantKind constant_kind)
      : Expr(owner, std::move(span)), constant_kind_(constant_kind) {}

  AstNodeKind kind() const override { return AstNodeKind::kConstant; }
  std::string ToString() const override;

  ConstantKind constant_kind() const { return constant_kind_; }

 private:
  ConstantKind constant_kind_;
};

// Represents a formatted string literal, e.g. `f"x = {x!r:>8}"`. Each part is
// either a String (literal text) or a FormattedValue.
class FormattedString : public Expr {
 public:
  FormattedString(Module* owner, Span span, std::vector<Expr*> parts)
      : Expr(owner, std::move(span)), parts_(std::move(parts)) {}

  AstNodeKind kind() const override { return AstNodeKind::kFormattedString; }
  std::string ToString() const override;

  const std::vector<Expr*>& parts() const { return parts_; }

 private:
  std::vector<Expr*> parts_;
};

// Represents a replacement field of a formatted string literal.
class FormattedValue : public Expr {
 public:
  FormattedValue(Module* owner, Span span, Expr* value,
                 std::optional<char> conversion,
                 FormattedString* format_spec)
      : Expr(owner, std::move(span)),
        value_(CORAL_DIE_IF_NULL(value)),
        conversion_(conversion),
        format_spec_(format_spec) {}

  AstNodeKind kind() const override { return AstNodeKind::kFormattedValue; }
  std::string ToString() const override;

  Expr* value() const { return value_; }
  // One of 's', 'r', 'a' if present.
  std::optional<char> conversion() const { return conversion_; }
  // May be null.
  FormattedString* format_spec() const { return format_spec_; }

 private:
  Expr* value_;
  std::optional<char> conversion_;
  FormattedString* format_spec_;
};

// Base for the sequence displays: `[a, b]`, `(a, b)`, `{a, b}`.
class SequenceExpr : public Expr {
 public:
  SequenceExpr(Module* owner, Span span, std::vector<Expr*> elements)
      : Expr(owner, std::move(span)), elements_(std::move(elements)) {}

  const std::vector<Expr*>& elements() const { return elements_; }

 protected:
  std::string ElementsToString(absl::string_view node_name) const;

 private:
  std::vector<Expr*> elements_;
};

class List : public SequenceExpr {
 public:
  using SequenceExpr::SequenceExpr;
  AstNodeKind kind() const override { return AstNodeKind::kList; }
  std::string ToString() const override { return ElementsToString("List"); }
};

class Tuple : public SequenceExpr {
 public:
  using SequenceExpr::SequenceExpr;
  AstNodeKind kind() const override { return AstNodeKind::kTuple; }
  std::string ToString() const override { return ElementsToString("Tuple"); }
};

class Set : public SequenceExpr {
 public:
  using SequenceExpr::SequenceExpr;
  AstNodeKind kind() const override { return AstNodeKind::kSet; }
  std::string ToString() const override { return ElementsToString("Set"); }
};

// Represents a dict display. A null key denotes a `**mapping` entry.
class Dict : public Expr {
 public:
  Dict(Module* owner, Span span, std::vector<Expr*> keys,
       std::vector<Expr*> values)
      : Expr(owner, std::move(span)),
        keys_(std::move(keys)),
        values_(std::move(values)) {
    CORAL_CHECK_EQ(keys_.size(), values_.size());
  }

  AstNodeKind kind() const override { return AstNodeKind::kDict; }
  std::string ToString() const override;

  const std::vector<Expr*>& keys() const { return keys_; }
  const std::vector<Expr*>& values() const { return values_; }

 private:
  std::vector<Expr*> keys_;
  std::vector<Expr*> values_;
};

// One `for target in iter if cond...` clause of a comprehension.
class Comprehension : public SpannedNode {
 public:
  Comprehension(Module* owner, Span span, Expr* target, Expr* iter,
                std::vector<Expr*> ifs)
      : SpannedNode(owner, std::move(span)),
        target_(target),
        iter_(iter),
        ifs_(std::move(ifs)) {}

  AstNodeKind kind() const override { return AstNodeKind::kComprehension; }
  std::string ToString() const override;

  Expr* target() const { return target_; }
  Expr* iter() const { return iter_; }
  const std::vector<Expr*>& ifs() const { return ifs_; }

 private:
  Expr* target_;
  Expr* iter_;
  std::vector<Expr*> ifs_;
};

// Base for the list/set/generator comprehensions, which have one element
// expression.
class ElementComprehension : public Expr {
 public:
  ElementComprehension(Module* owner, Span span, Expr* element,
                       std::vector<Comprehension*> generators)
      : Expr(owner, std::move(span)),
        element_(element),
        generators_(std::move(generators)) {}

  Expr* element() const { return element_; }
  const std::vector<Comprehension*>& generators() const { return generators_; }

 protected:
  std::string ComprehensionToString(absl::string_view node_name) const;

 private:
  Expr* element_;
  std::vector<Comprehension*> generators_;
};

class ListComp : public ElementComprehension {
 public:
  using ElementComprehension::ElementComprehension;
  AstNodeKind kind() const override { return AstNodeKind::kListComp; }
  std::string ToString() const override {
    return ComprehensionToString("ListComp");
  }
};

class SetComp : public ElementComprehension {
 public:
  using ElementComprehension::ElementComprehension;
  AstNodeKind kind() const override { return AstNodeKind::kSetComp; }
  std::string ToString() const override {
    return ComprehensionToString("SetComp");
  }
};

class GeneratorExp : public ElementComprehension {
 public:
  using ElementComprehension::ElementComprehension;
  AstNodeKind kind() const override { return AstNodeKind::kGeneratorExp; }
  std::string ToString() const override {
    return ComprehensionToString("GeneratorExp");
  }
};

class DictComp : public Expr {
 public:
  DictComp(Module* owner, Span span, Expr* key, Expr* value,
           std::vector<Comprehension*> generators)
      : Expr(owner, std::move(span)),
        key_(key),
        value_(value),
        generators_(std::move(generators)) {}

  AstNodeKind kind() const override { return AstNodeKind::kDictComp; }
  std::string ToString() const override;

  Expr* key() const { return key_; }
  Expr* value() const { return value_; }
  const std::vector<Comprehension*>& generators() const { return generators_; }

 private:
  Expr* key_;
  Expr* value_;
  std::vector<Comprehension*> generators_;
};

// Represents a binary operation; e.g. `a ** b`.
class Binop : public Expr {
 public:
  Binop(Module* owner, Span span, BinopKind binop_kind, Expr* lhs, Expr* rhs)
      : Expr(owner, std::move(span)),
        binop_kind_(binop_kind),
        lhs_(lhs),
        rhs_(rhs) {}

  AstNodeKind kind() const override { return AstNodeKind::kBinop; }
  std::string ToString() const override;

  BinopKind binop_kind() const { return binop_kind_; }
  Expr* lhs() const { return lhs_; }
  Expr* rhs() const { return rhs_; }

 private:
  BinopKind binop_kind_;
  Expr* lhs_;
  Expr* rhs_;
};

// Represents a run of the same boolean operator; e.g. `a or b or c`.
class BoolOp : public Expr {
 public:
  BoolOp(Module* owner, Span span, BoolOpKind op, std::vector<Expr*> values)
      : Expr(owner, std::move(span)), op_(op), values_(std::move(values)) {
    CORAL_CHECK_GE(values_.size(), 2);
  }

  AstNodeKind kind() const override { return AstNodeKind::kBoolOp; }
  std::string ToString() const override;

  BoolOpKind op() const { return op_; }
  const std::vector<Expr*>& values() const { return values_; }

 private:
  BoolOpKind op_;
  std::vector<Expr*> values_;
};

// Represents a comparison chain; e.g. `a < b <= c`.
class Compare : public Expr {
 public:
  Compare(Module* owner, Span span, Expr* lhs, std::vector<CompareOpKind> ops,
          std::vector<Expr*> comparators)
      : Expr(owner, std::move(span)),
        lhs_(lhs),
        ops_(std::move(ops)),
        comparators_(std::move(comparators)) {
    CORAL_CHECK_EQ(ops_.size(), comparators_.size());
  }

  AstNodeKind kind() const override { return AstNodeKind::kCompare; }
  std::string ToString() const override;

  Expr* lhs() const { return lhs_; }
  const std::vector<CompareOpKind>& ops() const { return ops_; }
  const std::vector<Expr*>& comparators() const { return comparators_; }

 private:
  Expr* lhs_;
  std::vector<CompareOpKind> ops_;
  std::vector<Expr*> comparators_;
};

// Represents a unary operation; e.g. `-x` or `not x`.
class Unop : public Expr {
 public:
  Unop(Module* owner, Span span, UnopKind unop_kind, Expr* operand)
      : Expr(owner, std::move(span)),
        unop_kind_(unop_kind),
        operand_(operand) {}

  AstNodeKind kind() const override { return AstNodeKind::kUnop; }
  std::string ToString() const override;

  UnopKind unop_kind() const { return unop_kind_; }
  Expr* operand() const { return operand_; }

 private:
  UnopKind unop_kind_;
  Expr* operand_;
};

// Represents the ternary expression; e.g. in Pythonic style:
//
//  consequent if test else alternate
class Ternary : public Expr {
 public:
  Ternary(Module* owner, Span span, Expr* test, Expr* consequent,
          Expr* alternate)
      : Expr(owner, std::move(span)),
        test_(test),
        consequent_(consequent),
        alternate_(alternate) {}

  AstNodeKind kind() const override { return AstNodeKind::kTernary; }
  std::string ToString() const override;

  Expr* test() const { return test_; }
  Expr* consequent() const { return consequent_; }
  Expr* alternate() const { return alternate_; }

 private:
  Expr* test_;
  Expr* consequent_;
  Expr* alternate_;
};

// A keyword argument `name=value` of a call or class definition; `**value`
// when the name is absent.
class KeywordArg : public SpannedNode {
 public:
  KeywordArg(Module* owner, Span span, std::optional<std::string> name,
             Expr* value)
      : SpannedNode(owner, std::move(span)),
        name_(std::move(name)),
        value_(value) {}

  AstNodeKind kind() const override { return AstNodeKind::kKeywordArg; }
  std::string ToString() const override;

  const std::optional<std::string>& name() const { return name_; }
  Expr* value() const { return value_; }

 private:
  std::optional<std::string> name_;
  Expr* value_;
};

// Represents a call; positional arguments (including `*iterable`) precede the
// keyword arguments.
class Invocation : public Expr {
 public:
  Invocation(Module* owner, Span span, Expr* callee, std::vector<Expr*> args,
             std::vector<KeywordArg*> keywords)
      : Expr(owner, std::move(span)),
        callee_(callee),
        args_(std::move(args)),
        keywords_(std::move(keywords)) {}

  AstNodeKind kind() const override { return AstNodeKind::kInvocation; }
  std::string ToString() const override;

  Expr* callee() const { return callee_; }
  const std::vector<Expr*>& args() const { return args_; }
  const std::vector<KeywordArg*>& keywords() const { return keywords_; }

 private:
  Expr* callee_;
  std::vector<Expr*> args_;
  std::vector<KeywordArg*> keywords_;
};

// Represents an attribute access; e.g. `lhs.attr`.
class Attr : public Expr {
 public:
  Attr(Module* owner, Span span, Expr* lhs, std::string attr)
      : Expr(owner, std::move(span)), lhs_(lhs), attr_(std::move(attr)) {}

  AstNodeKind kind() const override { return AstNodeKind::kAttr; }
  std::string ToString() const override;

  Expr* lhs() const { return lhs_; }
  const std::string& attr() const { return attr_; }

 private:
  Expr* lhs_;
  std::string attr_;
};

// Represents a subscript; e.g. `lhs[index]`. The index may be a Slice or a
// Tuple (possibly of Slices).
class Index : public Expr {
 public:
  Index(Module* owner, Span span, Expr* lhs, Expr* index)
      : Expr(owner, std::move(span)), lhs_(lhs), index_(index) {}

  AstNodeKind kind() const override { return AstNodeKind::kIndex; }
  std::string ToString() const override;

  Expr* lhs() const { return lhs_; }
  Expr* index() const { return index_; }

 private:
  Expr* lhs_;
  Expr* index_;
};

// Represents `lower:upper:step` inside a subscript; each part may be null.
class Slice : public Expr {
 public:
  Slice(Module* owner, Span span, Expr* lower, Expr* upper, Expr* step)
      : Expr(owner, std::move(span)),
        lower_(lower),
        upper_(upper),
        step_(step) {}

  AstNodeKind kind() const override { return AstNodeKind::kSlice; }
  std::string ToString() const override;

  Expr* lower() const { return lower_; }
  Expr* upper() const { return upper_; }
  Expr* step() const { return step_; }

 private:
  Expr* lower_;
  Expr* upper_;
  Expr* step_;
};

// Represents `*value` in a call, display or assignment target.
class Starred : public Expr {
 public:
  Starred(Module* owner, Span span, Expr* value)
      : Expr(owner, std::move(span)), value_(value) {}

  AstNodeKind kind() const override { return AstNodeKind::kStarred; }
  std::string ToString() const override;

  Expr* value() const { return value_; }

 private:
  Expr* value_;
};

class Await : public Expr {
 public:
  Await(Module* owner, Span span, Expr* value)
      : Expr(owner, std::move(span)), value_(value) {}

  AstNodeKind kind() const override { return AstNodeKind::kAwait; }
  std::string ToString() const override;

  Expr* value() const { return value_; }

 private:
  Expr* value_;
};

// Represents `yield` with an optional (possibly null) value.
class Yield : public Expr {
 public:
  Yield(Module* owner, Span span, Expr* value)
      : Expr(owner, std::move(span)), value_(value) {}

  AstNodeKind kind() const override { return AstNodeKind::kYield; }
  std::string ToString() const override;

  Expr* value() const { return value_; }

 private:
  Expr* value_;
};

class YieldFrom : public Expr {
 public:
  YieldFrom(Module* owner, Span span, Expr* value)
      : Expr(owner, std::move(span)), value_(value) {}

  AstNodeKind kind() const override { return AstNodeKind::kYieldFrom; }
  std::string ToString() const override;

  Expr* value() const { return value_; }

 private:
  Expr* value_;
};

// A parameter of a function or lambda; lambda parameters have no annotation.
class Param : public SpannedNode {
 public:
  Param(Module* owner, Span span, std::string name, Expr* annotation)
      : SpannedNode(owner, std::move(span)),
        name_(std::move(name)),
        annotation_(annotation) {}

  AstNodeKind kind() const override { return AstNodeKind::kParam; }
  std::string ToString() const override;

  const std::string& name() const { return name_; }
  // May be null.
  Expr* annotation() const { return annotation_; }

 private:
  std::string name_;
  Expr* annotation_;
};

// The parameters of a function or lambda, grouped by kind:
//
//   def f(args..., args_with_defaults..., *vararg, kwonlyargs..., **kwarg)
//
// `defaults` belong to the trailing positional parameters. `kw_defaults` is
// parallel to `kwonlyargs` with null entries for parameters without a
// default.
class ParamList : public SpannedNode {
 public:
  ParamList(Module* owner, Span span, std::vector<Param*> args,
            std::vector<Expr*> defaults, Param* vararg,
            std::vector<Param*> kwonlyargs, std::vector<Expr*> kw_defaults,
            Param* kwarg)
      : SpannedNode(owner, std::move(span)),
        args_(std::move(args)),
        defaults_(std::move(defaults)),
        vararg_(vararg),
        kwonlyargs_(std::move(kwonlyargs)),
        kw_defaults_(std::move(kw_defaults)),
        kwarg_(kwarg) {
    CORAL_CHECK_LE(defaults_.size(), args_.size());
    CORAL_CHECK_EQ(kwonlyargs_.size(), kw_defaults_.size());
  }

  AstNodeKind kind() const override { return AstNodeKind::kParamList; }
  std::string ToString() const override;

  const std::vector<Param*>& args() const { return args_; }
  const std::vector<Expr*>& defaults() const { return defaults_; }
  Param* vararg() const { return vararg_; }
  const std::vector<Param*>& kwonlyargs() const { return kwonlyargs_; }
  const std::vector<Expr*>& kw_defaults() const { return kw_defaults_; }
  Param* kwarg() const { return kwarg_; }

  bool empty() const {
    return args_.empty() && vararg_ == nullptr && kwonlyargs_.empty() &&
           kwarg_ == nullptr;
  }

 private:
  std::vector<Param*> args_;
  std::vector<Expr*> defaults_;
  Param* vararg_;
  std::vector<Param*> kwonlyargs_;
  std::vector<Expr*> kw_defaults_;
  Param* kwarg_;
};

// Represents `lambda params: body`.
class Lambda : public Expr {
 public:
  Lambda(Module* owner, Span span, ParamList* params, Expr* body)
      : Expr(owner, std::move(span)), params_(params), body_(body) {}

  AstNodeKind kind() const override { return AstNodeKind::kLambda; }
  std::string ToString() const override;

  ParamList* params() const { return params_; }
  Expr* body() const { return body_; }

 private:
  ParamList* params_;
  Expr* body_;
};

// -- Statement helpers

// `name as asname` in an import statement; `name` may be dotted, or `*` in a
// from-import.
class Alias : public SpannedNode {
 public:
  Alias(Module* owner, Span span, std::string name,
        std::optional<std::string> asname)
      : SpannedNode(owner, std::move(span)),
        name_(std::move(name)),
        asname_(std::move(asname)) {}

  AstNodeKind kind() const override { return AstNodeKind::kAlias; }
  std::string ToString() const override;

  const std::string& name() const { return name_; }
  const std::optional<std::string>& asname() const { return asname_; }

 private:
  std::string name_;
  std::optional<std::string> asname_;
};

// `context_expr as optional_vars` in a with statement.
class WithItem : public SpannedNode {
 public:
  WithItem(Module* owner, Span span, Expr* context_expr, Expr* optional_vars)
      : SpannedNode(owner, std::move(span)),
        context_expr_(context_expr),
        optional_vars_(optional_vars) {}

  AstNodeKind kind() const override { return AstNodeKind::kWithItem; }
  std::string ToString() const override;

  Expr* context_expr() const { return context_expr_; }
  // May be null.
  Expr* optional_vars() const { return optional_vars_; }

 private:
  Expr* context_expr_;
  Expr* optional_vars_;
};

// An `except [type [as name]]:` clause of a try statement.
class ExceptHandler : public SpannedNode {
 public:
  ExceptHandler(Module* owner, Span span, Expr* type,
                std::optional<std::string> name, StmtBlock body)
      : SpannedNode(owner, std::move(span)),
        type_(type),
        name_(std::move(name)),
        body_(std::move(body)) {}

  AstNodeKind kind() const override { return AstNodeKind::kExceptHandler; }
  std::string ToString() const override;

  int64_t lineno() const { return span().start().lineno(); }

  // May be null (bare `except:`).
  Expr* type() const { return type_; }
  const std::optional<std::string>& name() const { return name_; }
  const StmtBlock& body() const { return body_; }

 private:
  Expr* type_;
  std::optional<std::string> name_;
  StmtBlock body_;
};

// -- Statements

// An expression evaluated for its side effects; e.g. a call.
class ExprStmt : public Stmt {
 public:
  ExprStmt(Module* owner, Span span, Expr* expr)
      : Stmt(owner, std::move(span)), expr_(CORAL_DIE_IF_NULL(expr)) {}

  AstNodeKind kind() const override { return AstNodeKind::kExprStmt; }
  std::string ToString() const override;

  Expr* expr() const { return expr_; }

 private:
  Expr* expr_;
};

// `t1 = t2 = value`.
class Assign : public Stmt {
 public:
  Assign(Module* owner, Span span, std::vector<Expr*> targets, Expr* value)
      : Stmt(owner, std::move(span)),
        targets_(std::move(targets)),
        value_(value) {}

  AstNodeKind kind() const override { return AstNodeKind::kAssign; }
  std::string ToString() const override;

  const std::vector<Expr*>& targets() const { return targets_; }
  Expr* value() const { return value_; }

 private:
  std::vector<Expr*> targets_;
  Expr* value_;
};

// `target op= value`.
class AugAssign : public Stmt {
 public:
  AugAssign(Module* owner, Span span, Expr* target, BinopKind op, Expr* value)
      : Stmt(owner, std::move(span)), target_(target), op_(op), value_(value) {}

  AstNodeKind kind() const override { return AstNodeKind::kAugAssign; }
  std::string ToString() const override;

  Expr* target() const { return target_; }
  BinopKind op() const { return op_; }
  Expr* value() const { return value_; }

 private:
  Expr* target_;
  BinopKind op_;
  Expr* value_;
};

// `target: annotation [= value]`.
class AnnAssign : public Stmt {
 public:
  AnnAssign(Module* owner, Span span, Expr* target, Expr* annotation,
            Expr* value)
      : Stmt(owner, std::move(span)),
        target_(target),
        annotation_(annotation),
        value_(value) {}

  AstNodeKind kind() const override { return AstNodeKind::kAnnAssign; }
  std::string ToString() const override;

  Expr* target() const { return target_; }
  Expr* annotation() const { return annotation_; }
  // May be null.
  Expr* value() const { return value_; }

 private:
  Expr* target_;
  Expr* annotation_;
  Expr* value_;
};

class Pass : public Stmt {
 public:
  using Stmt::Stmt;
  AstNodeKind kind() const override { return AstNodeKind::kPass; }
  std::string ToString() const override { return "Pass()"; }
};

class Break : public Stmt {
 public:
  using Stmt::Stmt;
  AstNodeKind kind() const override { return AstNodeKind::kBreak; }
  std::string ToString() const override { return "Break()"; }
};

class Continue : public Stmt {
 public:
  using Stmt::Stmt;
  AstNodeKind kind() const override { return AstNodeKind::kContinue; }
  std::string ToString() const override { return "Continue()"; }
};

class Return : public Stmt {
 public:
  Return(Module* owner, Span span, Expr* value)
      : Stmt(owner, std::move(span)), value_(value) {}

  AstNodeKind kind() const override { return AstNodeKind::kReturn; }
  std::string ToString() const override;

  // May be null.
  Expr* value() const { return value_; }

 private:
  Expr* value_;
};

class Delete : public Stmt {
 public:
  Delete(Module* owner, Span span, std::vector<Expr*> targets)
      : Stmt(owner, std::move(span)), targets_(std::move(targets)) {}

  AstNodeKind kind() const override { return AstNodeKind::kDelete; }
  std::string ToString() const override;

  const std::vector<Expr*>& targets() const { return targets_; }

 private:
  std::vector<Expr*> targets_;
};

// `global a, b`.
class Global : public Stmt {
 public:
  Global(Module* owner, Span span, std::vector<std::string> names)
      : Stmt(owner, std::move(span)), names_(std::move(names)) {}

  AstNodeKind kind() const override { return AstNodeKind::kGlobal; }
  std::string ToString() const override;

  const std::vector<std::string>& names() const { return names_; }

 private:
  std::vector<std::string> names_;
};

// `nonlocal a, b`.
class Nonlocal : public Stmt {
 public:
  Nonlocal(Module* owner, Span span, std::vector<std::string> names)
      : Stmt(owner, std::move(span)), names_(std::move(names)) {}

  AstNodeKind kind() const override { return AstNodeKind::kNonlocal; }
  std::string ToString() const override;

  const std::vector<std::string>& names() const { return names_; }

 private:
  std::vector<std::string> names_;
};

// `import a.b as c, d`.
class Import : public Stmt {
 public:
  Import(Module* owner, Span span, std::vector<Alias*> names)
      : Stmt(owner, std::move(span)), names_(std::move(names)) {}

  AstNodeKind kind() const override { return AstNodeKind::kImport; }
  std::string ToString() const override;

  const std::vector<Alias*>& names() const { return names_; }

 private:
  std::vector<Alias*> names_;
};

// `from ..module import a as b, c`; `level` counts the leading dots and the
// module may be empty when level is non-zero.
class ImportFrom : public Stmt {
 public:
  ImportFrom(Module* owner, Span span, std::string module, int64_t level,
             std::vector<Alias*> names)
      : Stmt(owner, std::move(span)),
        module_(std::move(module)),
        level_(level),
        names_(std::move(names)) {}

  AstNodeKind kind() const override { return AstNodeKind::kImportFrom; }
  std::string ToString() const override;

  const std::string& module() const { return module_; }
  int64_t level() const { return level_; }
  const std::vector<Alias*>& names() const { return names_; }

 private:
  std::string module_;
  int64_t level_;
  std::vector<Alias*> names_;
};

// `raise [exc [from cause]]`.
class Raise : public Stmt {
 public:
  Raise(Module* owner, Span span, Expr* exc, Expr* cause)
      : Stmt(owner, std::move(span)), exc_(exc), cause_(cause) {}

  AstNodeKind kind() const override { return AstNodeKind::kRaise; }
  std::string ToString() const override;

  // Both may be null.
  Expr* exc() const { return exc_; }
  Expr* cause() const { return cause_; }

 private:
  Expr* exc_;
  Expr* cause_;
};

// `assert test[, msg]`.
class Assert : public Stmt {
 public:
  Assert(Module* owner, Span span, Expr* test, Expr* msg)
      : Stmt(owner, std::move(span)), test_(test), msg_(msg) {}

  AstNodeKind kind() const override { return AstNodeKind::kAssert; }
  std::string ToString() const override;

  Expr* test() const { return test_; }
  // May be null.
  Expr* msg() const { return msg_; }

 private:
  Expr* test_;
  Expr* msg_;
};

// Represents an if statement. An `elif` clause is represented as an If that
// is the sole statement of the `orelse` block (and whose span starts at the
// `elif` keyword); `else_pos` is only set for a literal `else:` clause.
class If : public Stmt {
 public:
  If(Module* owner, Span span, Expr* test, StmtBlock body, StmtBlock orelse,
     std::optional<Pos> else_pos)
      : Stmt(owner, std::move(span)),
        test_(test),
        body_(std::move(body)),
        orelse_(std::move(orelse)),
        else_pos_(std::move(else_pos)) {}

  AstNodeKind kind() const override { return AstNodeKind::kIf; }
  std::string ToString() const override;
  std::vector<const StmtBlock*> GetBlocks() const override {
    return {&body_, &orelse_};
  }

  Expr* test() const { return test_; }
  const StmtBlock& body() const { return body_; }
  const StmtBlock& orelse() const { return orelse_; }
  const std::optional<Pos>& else_pos() const { return else_pos_; }

 private:
  Expr* test_;
  StmtBlock body_;
  StmtBlock orelse_;
  std::optional<Pos> else_pos_;
};

class While : public Stmt {
 public:
  While(Module* owner, Span span, Expr* test, StmtBlock body,
        StmtBlock orelse, std::optional<Pos> else_pos)
      : Stmt(owner, std::move(span)),
        test_(test),
        body_(std::move(body)),
        orelse_(std::move(orelse)),
        else_pos_(std::move(else_pos)) {}

  AstNodeKind kind() const override { return AstNodeKind::kWhile; }
  std::string ToString() const override;
  std::vector<const StmtBlock*> GetBlocks() const override {
    return {&body_, &orelse_};
  }

  Expr* test() const { return test_; }
  const StmtBlock& body() const { return body_; }
  const StmtBlock& orelse() const { return orelse_; }
  const std::optional<Pos>& else_pos() const { return else_pos_; }

 private:
  Expr* test_;
  StmtBlock body_;
  StmtBlock orelse_;
  std::optional<Pos> else_pos_;
};

class For : public Stmt {
 public:
  For(Module* owner, Span span, Expr* target, Expr* iter, StmtBlock body,
      StmtBlock orelse, std::optional<Pos> else_pos)
      : Stmt(owner, std::move(span)),
        target_(target),
        iter_(iter),
        body_(std::move(body)),
        orelse_(std::move(orelse)),
        else_pos_(std::move(else_pos)) {}

  AstNodeKind kind() const override { return AstNodeKind::kFor; }
  std::string ToString() const override;
  std::vector<const StmtBlock*> GetBlocks() const override {
    return {&body_, &orelse_};
  }

  Expr* target() const { return target_; }
  Expr* iter() const { return iter_; }
  const StmtBlock& body() const { return body_; }
  const StmtBlock& orelse() const { return orelse_; }
  const std::optional<Pos>& else_pos() const { return else_pos_; }

 private:
  Expr* target_;
  Expr* iter_;
  StmtBlock body_;
  StmtBlock orelse_;
  std::optional<Pos> else_pos_;
};

// Represents a function definition. The span starts at the first decorator
// when there is one.
class Function : public Stmt {
 public:
  Function(Module* owner, Span span, std::string name, ParamList* params,
           StmtBlock body, std::vector<Expr*> decorators, Expr* returns,
           Pos keyword_pos)
      : Stmt(owner, std::move(span)),
        name_(std::move(name)),
        params_(params),
        body_(std::move(body)),
        decorators_(std::move(decorators)),
        returns_(returns),
        keyword_pos_(std::move(keyword_pos)) {}

  AstNodeKind kind() const override { return AstNodeKind::kFunction; }
  std::string ToString() const override;
  std::vector<const StmtBlock*> GetBlocks() const override { return {&body_}; }

  const std::string& name() const { return name_; }
  ParamList* params() const { return params_; }
  const StmtBlock& body() const { return body_; }
  const std::vector<Expr*>& decorators() const { return decorators_; }
  // Return annotation; may be null.
  Expr* returns() const { return returns_; }
  // Position of the `def` keyword; differs from the span start only for a
  // decorated function.
  const Pos& keyword_pos() const { return keyword_pos_; }

 private:
  std::string name_;
  ParamList* params_;
  StmtBlock body_;
  std::vector<Expr*> decorators_;
  Expr* returns_;
  Pos keyword_pos_;
};

class ClassDef : public Stmt {
 public:
  ClassDef(Module* owner, Span span, std::string name, std::vector<Expr*> bases,
           std::vector<KeywordArg*> keywords, StmtBlock body,
           std::vector<Expr*> decorators, Pos keyword_pos)
      : Stmt(owner, std::move(span)),
        name_(std::move(name)),
        bases_(std::move(bases)),
        keywords_(std::move(keywords)),
        body_(std::move(body)),
        decorators_(std::move(decorators)),
        keyword_pos_(std::move(keyword_pos)) {}

  AstNodeKind kind() const override { return AstNodeKind::kClassDef; }
  std::string ToString() const override;
  std::vector<const StmtBlock*> GetBlocks() const override { return {&body_}; }

  const std::string& name() const { return name_; }
  const std::vector<Expr*>& bases() const { return bases_; }
  const std::vector<KeywordArg*>& keywords() const { return keywords_; }
  const StmtBlock& body() const { return body_; }
  const std::vector<Expr*>& decorators() const { return decorators_; }
  // Position of the `class` keyword.
  const Pos& keyword_pos() const { return keyword_pos_; }

 private:
  std::string name_;
  std::vector<Expr*> bases_;
  std::vector<KeywordArg*> keywords_;
  StmtBlock body_;
  std::vector<Expr*> decorators_;
  Pos keyword_pos_;
};

class With : public Stmt {
 public:
  With(Module* owner, Span span, std::vector<WithItem*> items, StmtBlock body)
      : Stmt(owner, std::move(span)),
        items_(std::move(items)),
        body_(std::move(body)) {}

  AstNodeKind kind() const override { return AstNodeKind::kWith; }
  std::string ToString() const override;
  std::vector<const StmtBlock*> GetBlocks() const override { return {&body_}; }

  const std::vector<WithItem*>& items() const { return items_; }
  const StmtBlock& body() const { return body_; }

 private:
  std::vector<WithItem*> items_;
  StmtBlock body_;
};

// Represents a try statement; the blocks are, in order, the body, each
// handler's body, the `else:` arm and the `finally:` arm.
class Try : public Stmt {
 public:
  Try(Module* owner, Span span, StmtBlock body,
      std::vector<ExceptHandler*> handlers, StmtBlock orelse,
      StmtBlock finalbody, std::optional<Pos> else_pos,
      std::optional<Pos> finally_pos)
      : Stmt(owner, std::move(span)),
        body_(std::move(body)),
        handlers_(std::move(handlers)),
        orelse_(std::move(orelse)),
        finalbody_(std::move(finalbody)),
        else_pos_(std::move(else_pos)),
        finally_pos_(std::move(finally_pos)) {}

  AstNodeKind kind() const override { return AstNodeKind::kTry; }
  std::string ToString() const override;
  std::vector<const StmtBlock*> GetBlocks() const override;

  const StmtBlock& body() const { return body_; }
  const std::vector<ExceptHandler*>& handlers() const { return handlers_; }
  const StmtBlock& orelse() const { return orelse_; }
  const StmtBlock& finalbody() const { return finalbody_; }
  const std::optional<Pos>& else_pos() const { return else_pos_; }
  const std::optional<Pos>& finally_pos() const { return finally_pos_; }

 private:
  StmtBlock body_;
  std::vector<ExceptHandler*> handlers_;
  StmtBlock orelse_;
  StmtBlock finalbody_;
  std::optional<Pos> else_pos_;
  std::optional<Pos> finally_pos_;
};

// Represents a parsed source file: owns every node of the tree.
class Module : public AstNode {
 public:
  explicit Module(std::string name) : AstNode(this), name_(std::move(name)) {
    CORAL_VLOG(3) << "Created module \"" << name_ << "\" @ " << this;
  }

  ~Module() override;

  AstNodeKind kind() const override { return AstNodeKind::kModule; }
  std::string ToString() const override;

  template <typename T, typename... Args>
  T* Make(Args&&... args) {
    std::unique_ptr<T> node =
        std::make_unique<T>(this, std::forward<Args>(args)...);
    T* ptr = node.get();
    nodes_.push_back(std::move(node));
    return ptr;
  }

  const std::string& name() const { return name_; }
  const StmtBlock& body() const { return body_; }
  void set_body(StmtBlock body) { body_ = std::move(body); }

 private:
  std::string name_;
  StmtBlock body_;
  // Owned AST nodes.
  std::vector<std::unique_ptr<AstNode>> nodes_;
};

}  // namespace coral

#endif  // CORAL_FRONTEND_AST_H_
