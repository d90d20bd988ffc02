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

#include "coral/common/file/filesystem.h"

#include <cerrno>
#include <cstring>
#include <filesystem>  // NOLINT
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>  // NOLINT

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "coral/common/logging/logging.h"

namespace coral {

absl::StatusOr<std::string> GetFileContents(
    const std::filesystem::path& file_name) {
  std::error_code ec;
  if (!std::filesystem::exists(file_name, ec)) {
    return absl::NotFoundError(
        absl::StrCat("Failed to open file: ", file_name.string(),
                     ec ? absl::StrCat(" (", ec.message(), ")") : ""));
  }
  std::ifstream file(file_name, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    return absl::UnavailableError(absl::StrCat(
        "Failed to open file: ", file_name.string(), ": ", strerror(errno)));
  }
  std::ostringstream contents;
  contents << file.rdbuf();
  if (file.bad()) {
    return absl::UnavailableError(
        absl::StrCat("Failed to read file: ", file_name.string()));
  }
  CORAL_VLOG(2) << "Read " << contents.str().size() << " bytes from "
                << file_name.string();
  return contents.str();
}

absl::Status SetFileContents(const std::filesystem::path& file_name,
                             absl::string_view content) {
  std::ofstream file(file_name,
                     std::ios::out | std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    return absl::UnavailableError(
        absl::StrCat("Failed to open file for writing: ", file_name.string(),
                     ": ", strerror(errno)));
  }
  file.write(content.data(), static_cast<std::streamsize>(content.size()));
  file.close();
  if (file.fail()) {
    return absl::UnavailableError(
        absl::StrCat("Failed to write file: ", file_name.string()));
  }
  CORAL_VLOG(2) << "Wrote " << content.size() << " bytes to "
                << file_name.string();
  return absl::OkStatus();
}

}  // namespace coral
