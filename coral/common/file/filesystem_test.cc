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

#include <filesystem>  // NOLINT
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "coral/common/status/matchers.h"

namespace coral {
namespace {

using status_testing::IsOkAndHolds;
using status_testing::StatusIs;

std::filesystem::path TempPath(const char* name) {
  return std::filesystem::path(::testing::TempDir()) / name;
}

TEST(FilesystemTest, SetThenGetContents) {
  std::filesystem::path path = TempPath("coral_filesystem_test.py");
  CORAL_ASSERT_OK(SetFileContents(path, "x = 1  # c\n"));
  EXPECT_THAT(GetFileContents(path), IsOkAndHolds("x = 1  # c\n"));

  CORAL_ASSERT_OK(SetFileContents(path, ""));
  EXPECT_THAT(GetFileContents(path), IsOkAndHolds(""));
}

TEST(FilesystemTest, GetContentsOfMissingFile) {
  EXPECT_THAT(GetFileContents(TempPath("does_not_exist.py")),
              StatusIs(absl::StatusCode::kNotFound));
}

}  // namespace
}  // namespace coral
