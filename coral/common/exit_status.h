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

#ifndef CORAL_COMMON_EXIT_STATUS_H_
#define CORAL_COMMON_EXIT_STATUS_H_

#include "absl/status/status.h"

namespace coral {

// Converts a status into a process exit code: EXIT_SUCCESS for an ok status,
// EXIT_FAILURE otherwise. When `log_on_error` is set the status is written to
// stderr first.
int ExitStatus(const absl::Status& status, bool log_on_error = true);

}  // namespace coral

#endif  // CORAL_COMMON_EXIT_STATUS_H_
