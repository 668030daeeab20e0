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

// This file defines prootbox::ExecutionOutcome, the result of one confined
// foreground command.

#ifndef PROOTBOX_EXECUTION_OUTCOME_H_
#define PROOTBOX_EXECUTION_OUTCOME_H_

#include <string>

#include "absl/strings/string_view.h"

namespace prootbox {

struct ExecutionOutcome {
  // Exit code of the command, or -1 if it could not run to completion
  // (not started, timed out, rejected).
  int exit_code = -1;
  std::string stdout_text;
  std::string stderr_text;

  // Outcome for a command that never produced a process result.
  static ExecutionOutcome Failure(absl::string_view message);

  bool success() const { return exit_code == 0; }

  std::string ToString() const;
};

}  // namespace prootbox

#endif  // PROOTBOX_EXECUTION_OUTCOME_H_
