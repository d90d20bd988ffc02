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


#include "coral/fmt/reformat.h"

#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "coral/common/logging/logging.h"
#include "coral/common/status/status_macros.h"
#include "coral/fmt/annotated.h"
#include "coral/fmt/ast_fmt.h"
#include "coral/fmt/comments.h"
#include "coral/frontend/parser.h"

namespace coral {

absl::StatusOr<std::string> Reformat(absl::string_view text,
                                     absl::string_view filename) {
  CORAL_ASSIGN_OR_RETURN(ParsedModule parsed, ParseModule(text, filename));
  CORAL_ASSIGN_OR_RETURN(
      Block block,
      MergeComments(*parsed.module, parsed.comments, parsed.source_lines));
  CORAL_VLOG(3) << "Annotated " << filename << ": " << BlockToString(block);
  return FormatBlock(block);
}

}  // namespace coral
