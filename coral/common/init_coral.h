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

#ifndef CORAL_COMMON_INIT_CORAL_H_
#define CORAL_COMMON_INIT_CORAL_H_

#include <vector>

#include "absl/strings/string_view.h"

namespace coral {

// Initializes global state in the binary, i.e. the command line flags
// (including the `--v` logging verbosity). This function might exit the
// program, for example if the command line flags are invalid or if a '--help'
// command line argument was provided.
//
// Is typically called early on in main().
//
// `usage` provides a short usage message passed to
// absl::SetProgramUsageMessage().
//
// Returns a vector of the positional arguments that are not part of any
// command-line flag (or arguments to a flag), not including the program
// invocation name.
std::vector<absl::string_view> InitCoral(absl::string_view usage, int argc,
                                         char* argv[]);

}  // namespace coral

#endif  // CORAL_COMMON_INIT_CORAL_H_
