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


#ifndef CORAL_FMT_AST_FMT_H_
#define CORAL_FMT_AST_FMT_H_

#include <string>

#include "absl/strings/string_view.h"
#include "coral/fmt/annotated.h"
#include "coral/frontend/ast.h"

namespace coral {

// Renders an annotated block (typically the module top level, as produced by
// MergeComments()) as canonical source text.
//
// Nested blocks are indented by four spaces per level; every line, including
// the last, is terminated by a newline, and an empty block renders as the
// empty string. Node kinds without a rendering rule render as
// `<unsupported:KindName>`.
std::string FormatBlock(const Block& block);

// Renders `expr` as canonical source text, with parentheses derived from
// operator precedence; e.g. "(a + b) * c".
std::string FormatExpr(const Expr* expr);

// Returns the canonical spelling of the comment `text` (which starts with
// `#`): "#" followed by a space and the stripped remainder, or just "#" if
// there is no remainder.
std::string FormatComment(absl::string_view text);

}  // namespace coral

#endif  // CORAL_FMT_AST_FMT_H_
