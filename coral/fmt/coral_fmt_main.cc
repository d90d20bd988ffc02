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


#include <algorithm>
#include <filesystem>  // NOLINT
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "coral/common/exit_status.h"
#include "coral/common/file/filesystem.h"
#include "coral/common/init_coral.h"
#include "coral/common/logging/logging.h"
#include "coral/common/status/status_macros.h"
#include "coral/fmt/reformat.h"
#include "coral/frontend/error_printer.h"
#include "coral/frontend/errors.h"
#include "coral/frontend/parser.h"

// Note: we attempt to keep our command line interface similar to clang-format.
ABSL_FLAG(bool, i, false, "whether to modify the given path argument in-place");

ABSL_FLAG(bool, error_on_changes, false,
          "whether to error if the formatting changes the file contents");

ABSL_FLAG(std::string, mode, "autofmt",
          "whether to reformat or to dump the parsed syntax tree; choices: "
          "autofmt|parse");

namespace coral {
namespace {

static constexpr absl::string_view kUsage = R"(
Formats the Python source code present inside of a `.py` file, keeping its
comments. Use `-` to read from stdin.
)";

enum class Mode {
  // Prints the syntax tree of the module; comments are not kept.
  kParse,
  // Prints the canonical form of the module with its comments.
  kAutofmt,
};

// Prints a positional error (scan or parse) with its source context to
// stderr. Returns whether the status was such an error.
bool TryPrintError(const absl::Status& status, absl::string_view contents) {
  if (status.ok() || !IsPositionalError(status)) {
    return false;
  }
  absl::StatusOr<PositionalErrorData> data_or = GetPositionalErrorData(status);
  if (!data_or.ok()) {
    CORAL_LOG(ERROR)
        << "Could not extract a textual position from error message: "
        << status << ": " << data_or.status();
    return false;
  }
  const PositionalErrorData& data = data_or.value();
  absl::Status print_status = PrintPositionalError(
      data.span, absl::StrFormat("%s: %s", data.error_type, data.message),
      contents, std::cerr);
  if (!print_status.ok()) {
    CORAL_LOG(ERROR) << "Could not print positional error: " << print_status;
  }
  return print_status.ok();
}

absl::Status RunOnOneFile(absl::string_view input_path, bool in_place,
                          bool error_on_changes, Mode mode) {
  std::filesystem::path path(std::string{input_path});
  CORAL_ASSIGN_OR_RETURN(std::string contents, GetFileContents(path));
  CORAL_VLOG(1) << "Formatting " << input_path << " (" << contents.size()
                << " bytes)";

  std::string formatted;
  absl::Status status;
  switch (mode) {
    case Mode::kAutofmt: {
      absl::StatusOr<std::string> reformatted =
          Reformat(contents, path.string());
      status = reformatted.status();
      if (reformatted.ok()) {
        formatted = std::move(reformatted).value();
      }
      break;
    }
    case Mode::kParse: {
      absl::StatusOr<ParsedModule> parsed =
          ParseModule(contents, path.string());
      status = parsed.status();
      if (parsed.ok()) {
        formatted = parsed->module->ToString();
      }
      break;
    }
  }
  if (!status.ok()) {
    TryPrintError(status, contents);
    return status;
  }

  if (in_place) {
    CORAL_RETURN_IF_ERROR(SetFileContents(path, formatted));
  } else {
    std::cout << formatted << std::flush;
  }

  if (error_on_changes && formatted != contents) {
    return absl::InternalError("Formatting changed the file contents.");
  }

  return absl::OkStatus();
}

absl::Status RealMain(absl::Span<const absl::string_view> input_paths,
                      bool in_place, bool error_on_changes,
                      const std::string& mode_str) {
  // Restrictions on the command line, to avoid confusing results:
  //
  // - If stdin is the input, it should be the only input.
  // - If we're *not* doing in-place formatting, there should be only one input
  //   (otherwise things will be all jumbled together in stdout).
  // - If we error-on-changes, there should be only one input, so it is clear
  //   which file the error refers to.
  bool has_stdin_arg =
      std::any_of(input_paths.begin(), input_paths.end(),
                  [](absl::string_view path) { return path == "-"; });
  std::optional<std::vector<absl::string_view>> stdin_input;
  if (has_stdin_arg) {
    if (input_paths.size() != 1) {
      return absl::InvalidArgumentError(
          "Cannot have stdin along with file arguments.");
    }
    if (in_place) {
      return absl::InvalidArgumentError(
          "Cannot format stdin with in-place formatting.");
    }
    stdin_input = std::vector<absl::string_view>{"/dev/stdin"};
    input_paths = absl::MakeConstSpan(stdin_input.value());
  }

  if (error_on_changes && input_paths.size() > 1) {
    return absl::InvalidArgumentError(
        "Cannot have multiple input files when error-on-changes is enabled.");
  }

  if (!in_place && input_paths.size() > 1) {
    return absl::InvalidArgumentError(
        "Cannot have multiple input files when in-place formatting is "
        "disabled.");
  }

  Mode mode;
  if (mode_str == "autofmt") {
    mode = Mode::kAutofmt;
  } else if (mode_str == "parse") {
    mode = Mode::kParse;
  } else {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid mode: `", mode_str, "`"));
  }

  for (absl::string_view input_path : input_paths) {
    CORAL_RETURN_IF_ERROR(
        RunOnOneFile(input_path, in_place, error_on_changes, mode));
  }

  return absl::OkStatus();
}

}  // namespace
}  // namespace coral

int main(int argc, char* argv[]) {
  std::vector<absl::string_view> args =
      coral::InitCoral(coral::kUsage, argc, argv);
  if (args.empty()) {
    CORAL_LOG(FATAL) << "No command-line arguments to format; want " << argv[0]
                     << " <input-file>[, ...]";
  }

  absl::Status status = coral::RealMain(
      args,
      /*in_place=*/absl::GetFlag(FLAGS_i),
      /*error_on_changes=*/absl::GetFlag(FLAGS_error_on_changes),
      /*mode_str=*/absl::GetFlag(FLAGS_mode));
  return coral::ExitStatus(status);
}
