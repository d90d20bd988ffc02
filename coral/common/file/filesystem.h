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

#ifndef CORAL_COMMON_FILE_FILESYSTEM_H_
#define CORAL_COMMON_FILE_FILESYSTEM_H_

#include <filesystem>  // NOLINT
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace coral {

// Returns the entire contents of the file at `file_name`. Returns a NotFound
// error if the file does not exist and an Unavailable error if it cannot be
// read.
absl::StatusOr<std::string> GetFileContents(
    const std::filesystem::path& file_name);

// Writes `content` to the file at `file_name`, overwriting any existing
// contents.
absl::Status SetFileContents(const std::filesystem::path& file_name,
                             absl::string_view content);

}  // namespace coral

#endif  // CORAL_COMMON_FILE_FILESYSTEM_H_
