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

#ifndef CORAL_COMMON_STATUS_STATUS_MACROS_H_
#define CORAL_COMMON_STATUS_STATUS_MACROS_H_

#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"

// Evaluates an expression that produces an `absl::Status`. If the status is
// not ok, returns it from the current function.
//
// For example:
//   absl::Status MultiStepFunction() {
//     CORAL_RETURN_IF_ERROR(Function(args...));
//     CORAL_RETURN_IF_ERROR(foo.Method(args...));
//     return absl::OkStatus();
//   }
#define CORAL_RETURN_IF_ERROR(expr)                                  \
  do {                                                               \
    const ::absl::Status _coral_status_to_verify = (expr);           \
    if (ABSL_PREDICT_FALSE(!_coral_status_to_verify.ok())) {         \
      return _coral_status_to_verify;                                \
    }                                                                \
  } while (false)

// Executes an expression `rexpr` that returns an `absl::StatusOr<T>`. On OK,
// moves its value into the variable defined by `lhs`, otherwise returns the
// error status from the current function.
//
// Interface:
//
//   CORAL_ASSIGN_OR_RETURN(lhs, rexpr)
//
// Example: Declaring and initializing a new variable (ValueType can be
// anything that can be initialized with assignment, including references):
//   CORAL_ASSIGN_OR_RETURN(ValueType value, MaybeGetValue(arg));
//
// Example: Assigning to an existing variable:
//   ValueType value;
//   CORAL_ASSIGN_OR_RETURN(value, MaybeGetValue(arg));
//
// WARNING: Expands into multiple statements; it cannot be used in a single
// statement (e.g. as the body of an if statement without {})!
#define CORAL_ASSIGN_OR_RETURN(lhs, rexpr)                                   \
  CORAL_ASSIGN_OR_RETURN_IMPL(                                               \
      CORAL_STATUS_MACROS_CONCAT_NAME(_coral_statusor, __LINE__), lhs, rexpr)

#define CORAL_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rexpr) \
  auto statusor = (rexpr);                                \
  if (ABSL_PREDICT_FALSE(!statusor.ok())) {               \
    return std::move(statusor).status();                  \
  }                                                       \
  lhs = std::move(statusor).value()

// Internal helpers for macro expansion.
#define CORAL_STATUS_MACROS_CONCAT_NAME_INNER(x, y) x##y
#define CORAL_STATUS_MACROS_CONCAT_NAME(x, y) \
  CORAL_STATUS_MACROS_CONCAT_NAME_INNER(x, y)

#endif  // CORAL_COMMON_STATUS_STATUS_MACROS_H_
