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


#ifndef CORAL_FMT_REFORMAT_H_
#define CORAL_FMT_REFORMAT_H_

#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace coral {

// Returns the canonical form of the program `text`, with its comments kept:
// parses it, attaches the comments to the syntax tree (see MergeComments())
// and renders the result (see FormatBlock()).
//
// Reformatting is idempotent: Reformat(Reformat(x)) == Reformat(x).
//
// Scan and parse errors are returned as-is, positioned within `filename`.
absl::StatusOr<std::string> Reformat(absl::string_view text,
                                     absl::string_view filename);

}  // namespace coral

#endif  // CORAL_FMT_REFORMAT_H_
