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

#include "coral/common/init_coral.h"

#include <vector>

#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/strings/string_view.h"
#include "coral/common/logging/logging.h"

namespace coral {

std::vector<absl::string_view> InitCoral(absl::string_view usage, int argc,
                                         char* argv[]) {
  absl::SetProgramUsageMessage(usage);
  std::vector<char*> remaining = absl::ParseCommandLine(argc, argv);
  CORAL_CHECK(!remaining.empty());
  CORAL_VLOG(1) << "Initialized with " << remaining.size() - 1
                << " positional argument(s)";
  return std::vector<absl::string_view>(remaining.begin() + 1,
                                        remaining.end());
}

}  // namespace coral
