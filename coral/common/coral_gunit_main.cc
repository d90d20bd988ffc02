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

#include "gtest/gtest.h"
#include "coral/common/init_coral.h"

int main(int argc, char* argv[]) {
  testing::InitGoogleTest(&argc, argv);
  // Picks up the flags gtest did not consume, e.g. `--v` for CORAL_VLOG.
  coral::InitCoral(argv[0], argc, argv);
  return RUN_ALL_TESTS();
}
