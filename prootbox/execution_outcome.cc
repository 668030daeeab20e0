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

#include "prootbox/execution_outcome.h"

#include <string>

#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"

namespace prootbox {

ExecutionOutcome ExecutionOutcome::Failure(absl::string_view message) {
  ExecutionOutcome outcome;
  outcome.exit_code = -1;
  outcome.stderr_text = std::string(message);
  return outcome;
}

std::string ExecutionOutcome::ToString() const {
  return absl::StrCat(success() ? "OK" : "FAILED", " - Exit code: ", exit_code,
                      ", stdout: ", stdout_text.size(),
                      " bytes, stderr: ", stderr_text.size(), " bytes");
}

}  // namespace prootbox
