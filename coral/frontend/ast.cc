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

#include "coral/frontend/ast.h"

#include <optional>
#include <string>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "coral/common/logging/logging.h"
#include "coral/frontend/number_literal.h"
#include "coral/frontend/string_literal.h"

namespace coral {
namespace {

std::string OrNone(const AstNode* node) {
  if (node == nullptr) {
    return "None";
  }
  return node->ToString();
}

std::string Quoted(absl::string_view s) {
  return absl::StrCat("\"", EscapeStringLiteral(s, '"', /*is_bytes=*/false),
                      "\"");
}

std::string QuotedOrNone(const std::optional<std::string>& s) {
  if (!s.has_value()) {
    return "None";
  }
  return Quoted(*s);
}

template <typename T>
std::string NodesToString(const std::vector<T*>& nodes) {
  return absl::StrCat(
      "[",
      absl::StrJoin(nodes, ", ",
                    [](std::string* out, const T* node) {
                      absl::StrAppend(out, OrNone(node));
                    }),
      "]");
}

std::string NamesToString(const std::vector<std::string>& names) {
  return absl::StrCat("[",
                      absl::StrJoin(names, ", ",
                                    [](std::string* out, const std::string& s) {
                                      absl::StrAppend(out, Quoted(s));
                                    }),
                      "]");
}

}  // namespace

std::string AstNodeKindToString(AstNodeKind kind) {
  switch (kind) {
#define CASE(__type)          \
  case AstNodeKind::k##__type: \
    return #__type;
    CORAL_AST_NODE_EACH(CASE)
#undef CASE
  }
  return absl::StrFormat("<invalid AstNodeKind(%d)>", static_cast<int>(kind));
}

std::string BinopKindFormat(BinopKind kind) {
  switch (kind) {
#define CASE(__enum, __unused, __str) \
  case BinopKind::__enum:              \
    return __str;
    CORAL_BINOP_KIND_EACH(CASE)
#undef CASE
  }
  return absl::StrFormat("<invalid BinopKind(%d)>", static_cast<int>(kind));
}

std::string BinopKindToString(BinopKind kind) {
  switch (kind) {
#define CASE(__enum, __name, __unused) \
  case BinopKind::__enum:               \
    return __name;
    CORAL_BINOP_KIND_EACH(CASE)
#undef CASE
  }
  return absl::StrFormat("<invalid BinopKind(%d)>", static_cast<int>(kind));
}

std::string CompareOpKindFormat(CompareOpKind kind) {
  switch (kind) {
#define CASE(__enum, __unused, __str) \
  case CompareOpKind::__enum:          \
    return __str;
    CORAL_COMPARE_OP_KIND_EACH(CASE)
#undef CASE
  }
  return absl::StrFormat("<invalid CompareOpKind(%d)>",
                         static_cast<int>(kind));
}

std::string CompareOpKindToString(CompareOpKind kind) {
  switch (kind) {
#define CASE(__enum, __name, __unused) \
  case CompareOpKind::__enum:           \
    return __name;
    CORAL_COMPARE_OP_KIND_EACH(CASE)
#undef CASE
  }
  return absl::StrFormat("<invalid CompareOpKind(%d)>",
                         static_cast<int>(kind));
}

std::string UnopKindFormat(UnopKind kind) {
  switch (kind) {
    case UnopKind::kNot:
      return "not";
    case UnopKind::kNegate:
      return "-";
    case UnopKind::kPlus:
      return "+";
    case UnopKind::kInvert:
      return "~";
  }
  return absl::StrFormat("<invalid UnopKind(%d)>", static_cast<int>(kind));
}

std::string UnopKindToString(UnopKind kind) {
  switch (kind) {
    case UnopKind::kNot:
      return "Not";
    case UnopKind::kNegate:
      return "USub";
    case UnopKind::kPlus:
      return "UAdd";
    case UnopKind::kInvert:
      return "Invert";
  }
  return absl::StrFormat("<invalid UnopKind(%d)>", static_cast<int>(kind));
}

std::string BoolOpKindFormat(BoolOpKind kind) {
  switch (kind) {
    case BoolOpKind::kAnd:
      return "and";
    case BoolOpKind::kOr:
      return "or";
  }
  return absl::StrFormat("<invalid BoolOpKind(%d)>", static_cast<int>(kind));
}

std::string ConstantKindFormat(ConstantKind kind) {
  switch (kind) {
    case ConstantKind::kTrue:
      return "True";
    case ConstantKind::kFalse:
      return "False";
    case ConstantKind::kNone:
      return "None";
    case ConstantKind::kEllipsis:
      return "...";
  }
  return absl::StrFormat("<invalid ConstantKind(%d)>", static_cast<int>(kind));
}

bool NodesEqual(const AstNode* a, const AstNode* b) {
  if (a == nullptr || b == nullptr) {
    return a == b;
  }
  return a->ToString() == b->ToString();
}

AstNode::~AstNode() = default;

SpannedNode::~SpannedNode() = default;

Expr::~Expr() = default;

Stmt::~Stmt() = default;

Module::~Module() {
  CORAL_VLOG(3) << "Destroying module \"" << name_ << "\" @ " << this;
}

// -- Expressions

std::string NameRef::ToString() const {
  return absl::StrFormat("Name(%s)", Quoted(identifier_));
}

std::string Number::ToString() const {
  switch (literal_.kind) {
    case NumberKind::kInt:
      return absl::StrFormat("Int(%s)", literal_.decimal);
    case NumberKind::kFloat:
      return absl::StrFormat("Float(%.17g)", literal_.value);
    case NumberKind::kImaginary:
      return absl::StrFormat("Imaginary(%.17g)", literal_.value);
  }
  return absl::StrFormat("<invalid NumberKind(%d)>",
                         static_cast<int>(literal_.kind));
}

std::string String::ToString() const {
  return absl::StrFormat("Str(%s)", Quoted(value_));
}

std::string Bytes::ToString() const {
  return absl::StrFormat(
      "Bytes(b\"%s\")", EscapeStringLiteral(value_, '"', /*is_bytes=*/true));
}

std::string Constant::ToString() const {
  // The dump names the ellipsis rather than spelling it as source text.
  if (constant_kind_ == ConstantKind::kEllipsis) {
    return "Constant(Ellipsis)";
  }
  return absl::StrFormat("Constant(%s)", ConstantKindFormat(constant_kind_));
}

std::string FormattedString::ToString() const {
  return absl::StrFormat("JoinedStr(%s)", NodesToString(parts_));
}

std::string FormattedValue::ToString() const {
  std::string conversion =
      conversion_.has_value() ? std::string(1, *conversion_) : "None";
  return absl::StrFormat("FormattedValue(%s, conversion=%s, format_spec=%s)",
                         value_->ToString(), conversion, OrNone(format_spec_));
}

std::string SequenceExpr::ElementsToString(absl::string_view node_name) const {
  return absl::StrFormat("%s(%s)", node_name, NodesToString(elements_));
}

std::string Dict::ToString() const {
  return absl::StrFormat("Dict(keys=%s, values=%s)", NodesToString(keys_),
                         NodesToString(values_));
}

std::string Comprehension::ToString() const {
  return absl::StrFormat("comprehension(target=%s, iter=%s, ifs=%s)",
                         target_->ToString(), iter_->ToString(),
                         NodesToString(ifs_));
}

std::string ElementComprehension::ComprehensionToString(
    absl::string_view node_name) const {
  return absl::StrFormat("%s(%s, %s)", node_name, element_->ToString(),
                         NodesToString(generators_));
}

std::string DictComp::ToString() const {
  return absl::StrFormat("DictComp(%s, %s, %s)", key_->ToString(),
                         value_->ToString(), NodesToString(generators_));
}

std::string Binop::ToString() const {
  return absl::StrFormat("BinOp(%s, %s, %s)", lhs_->ToString(),
                         BinopKindToString(binop_kind_), rhs_->ToString());
}

std::string BoolOp::ToString() const {
  return absl::StrFormat("BoolOp(%s, %s)",
                         op_ == BoolOpKind::kAnd ? "And" : "Or",
                         NodesToString(values_));
}

std::string Compare::ToString() const {
  std::string ops = absl::StrJoin(
      ops_, ", ", [](std::string* out, CompareOpKind op) {
        absl::StrAppend(out, CompareOpKindToString(op));
      });
  return absl::StrFormat("Compare(%s, [%s], %s)", lhs_->ToString(), ops,
                         NodesToString(comparators_));
}

std::string Unop::ToString() const {
  return absl::StrFormat("UnaryOp(%s, %s)", UnopKindToString(unop_kind_),
                         operand_->ToString());
}

std::string Ternary::ToString() const {
  return absl::StrFormat("IfExp(test=%s, body=%s, orelse=%s)",
                         test_->ToString(), consequent_->ToString(),
                         alternate_->ToString());
}

std::string KeywordArg::ToString() const {
  return absl::StrFormat("keyword(%s, %s)", QuotedOrNone(name_),
                         value_->ToString());
}

std::string Invocation::ToString() const {
  return absl::StrFormat("Call(%s, %s, %s)", callee_->ToString(),
                         NodesToString(args_), NodesToString(keywords_));
}

std::string Attr::ToString() const {
  return absl::StrFormat("Attribute(%s, %s)", lhs_->ToString(), Quoted(attr_));
}

std::string Index::ToString() const {
  return absl::StrFormat("Subscript(%s, %s)", lhs_->ToString(),
                         index_->ToString());
}

std::string Slice::ToString() const {
  return absl::StrFormat("Slice(%s, %s, %s)", OrNone(lower_), OrNone(upper_),
                         OrNone(step_));
}

std::string Starred::ToString() const {
  return absl::StrFormat("Starred(%s)", value_->ToString());
}

std::string Await::ToString() const {
  return absl::StrFormat("Await(%s)", value_->ToString());
}

std::string Yield::ToString() const {
  return absl::StrFormat("Yield(%s)", OrNone(value_));
}

std::string YieldFrom::ToString() const {
  return absl::StrFormat("YieldFrom(%s)", value_->ToString());
}

std::string Param::ToString() const {
  return absl::StrFormat("arg(%s, %s)", Quoted(name_), OrNone(annotation_));
}

std::string ParamList::ToString() const {
  return absl::StrFormat(
      "arguments(args=%s, vararg=%s, kwonlyargs=%s, kw_defaults=%s, "
      "kwarg=%s, defaults=%s)",
      NodesToString(args_), OrNone(vararg_), NodesToString(kwonlyargs_),
      NodesToString(kw_defaults_), OrNone(kwarg_), NodesToString(defaults_));
}

std::string Lambda::ToString() const {
  return absl::StrFormat("Lambda(%s, %s)", params_->ToString(),
                         body_->ToString());
}

// -- Statement helpers

std::string Alias::ToString() const {
  return absl::StrFormat("alias(%s, %s)", Quoted(name_), QuotedOrNone(asname_));
}

std::string WithItem::ToString() const {
  return absl::StrFormat("withitem(%s, %s)", context_expr_->ToString(),
                         OrNone(optional_vars_));
}

std::string ExceptHandler::ToString() const {
  return absl::StrFormat("ExceptHandler(%s, %s, %s)", OrNone(type_),
                         QuotedOrNone(name_), NodesToString(body_));
}

// -- Statements

std::string ExprStmt::ToString() const {
  return absl::StrFormat("Expr(%s)", expr_->ToString());
}

std::string Assign::ToString() const {
  return absl::StrFormat("Assign(%s, %s)", NodesToString(targets_),
                         value_->ToString());
}

std::string AugAssign::ToString() const {
  return absl::StrFormat("AugAssign(%s, %s, %s)", target_->ToString(),
                         BinopKindToString(op_), value_->ToString());
}

std::string AnnAssign::ToString() const {
  return absl::StrFormat("AnnAssign(%s, %s, %s)", target_->ToString(),
                         annotation_->ToString(), OrNone(value_));
}

std::string Return::ToString() const {
  return absl::StrFormat("Return(%s)", OrNone(value_));
}

std::string Delete::ToString() const {
  return absl::StrFormat("Delete(%s)", NodesToString(targets_));
}

std::string Global::ToString() const {
  return absl::StrFormat("Global(%s)", NamesToString(names_));
}

std::string Nonlocal::ToString() const {
  return absl::StrFormat("Nonlocal(%s)", NamesToString(names_));
}

std::string Import::ToString() const {
  return absl::StrFormat("Import(%s)", NodesToString(names_));
}

std::string ImportFrom::ToString() const {
  return absl::StrFormat("ImportFrom(%s, %s, level=%d)", Quoted(module_),
                         NodesToString(names_), level_);
}

std::string Raise::ToString() const {
  return absl::StrFormat("Raise(%s, %s)", OrNone(exc_), OrNone(cause_));
}

std::string Assert::ToString() const {
  return absl::StrFormat("Assert(%s, %s)", test_->ToString(), OrNone(msg_));
}

std::string If::ToString() const {
  return absl::StrFormat("If(%s, %s, %s)", test_->ToString(),
                         NodesToString(body_), NodesToString(orelse_));
}

std::string While::ToString() const {
  return absl::StrFormat("While(%s, %s, %s)", test_->ToString(),
                         NodesToString(body_), NodesToString(orelse_));
}

std::string For::ToString() const {
  return absl::StrFormat("For(%s, %s, %s, %s)", target_->ToString(),
                         iter_->ToString(), NodesToString(body_),
                         NodesToString(orelse_));
}

std::string Function::ToString() const {
  return absl::StrFormat("FunctionDef(%s, %s, %s, decorators=%s, returns=%s)",
                         Quoted(name_), params_->ToString(),
                         NodesToString(body_), NodesToString(decorators_),
                         OrNone(returns_));
}

std::string ClassDef::ToString() const {
  return absl::StrFormat("ClassDef(%s, bases=%s, keywords=%s, %s, "
                         "decorators=%s)",
                         Quoted(name_), NodesToString(bases_),
                         NodesToString(keywords_), NodesToString(body_),
                         NodesToString(decorators_));
}

std::string With::ToString() const {
  return absl::StrFormat("With(%s, %s)", NodesToString(items_),
                         NodesToString(body_));
}

std::vector<const StmtBlock*> Try::GetBlocks() const {
  std::vector<const StmtBlock*> blocks = {&body_};
  for (const ExceptHandler* handler : handlers_) {
    blocks.push_back(&handler->body());
  }
  blocks.push_back(&orelse_);
  blocks.push_back(&finalbody_);
  return blocks;
}

std::string Try::ToString() const {
  return absl::StrFormat("Try(%s, %s, %s, %s)", NodesToString(body_),
                         NodesToString(handlers_), NodesToString(orelse_),
                         NodesToString(finalbody_));
}

std::string Module::ToString() const {
  return absl::StrFormat("Module(%s)", NodesToString(body_));
}

}  // namespace coral
