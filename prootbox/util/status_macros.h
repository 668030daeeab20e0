// Copyright 2024 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

// Early-return helpers for functions returning absl::Status or
// absl::StatusOr<T>.

#ifndef PROOTBOX_UTIL_STATUS_MACROS_H_
#define PROOTBOX_UTIL_STATUS_MACROS_H_

#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"

#define PROOTBOX_MACROS_CONCAT_INNER_(x, y) x##y
#define PROOTBOX_MACROS_CONCAT(x, y) PROOTBOX_MACROS_CONCAT_INNER_(x, y)

// Evaluates expr and returns its status from the enclosing function unless it
// is OK.
#define PROOTBOX_RETURN_IF_ERROR(expr) \
  PROOTBOX_RETURN_IF_ERROR_IMPL(       \
      PROOTBOX_MACROS_CONCAT(_prootbox_status, __LINE__), expr)

#define PROOTBOX_RETURN_IF_ERROR_IMPL(status, expr) \
  do {                                              \
    const auto status = (expr);                     \
    if (ABSL_PREDICT_FALSE(!status.ok())) {         \
      return status;                                \
    }                                               \
  } while (0)

// Evaluates rexpr, a StatusOr<T>. On success moves the value into lhs, which
// may be a declaration. Otherwise returns the error from the enclosing
// function.
#define PROOTBOX_ASSIGN_OR_RETURN(lhs, rexpr) \
  PROOTBOX_ASSIGN_OR_RETURN_IMPL(             \
      PROOTBOX_MACROS_CONCAT(_prootbox_statusor, __LINE__), lhs, rexpr)

#define PROOTBOX_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rexpr) \
  auto statusor = (rexpr);                                   \
  if (ABSL_PREDICT_FALSE(!statusor.ok())) {                  \
    return statusor.status();                                \
  }                                                          \
  lhs = std::move(statusor).value()

#endif  // PROOTBOX_UTIL_STATUS_MACROS_H_
