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

#ifndef PROOTBOX_BACKGROUND_LAUNCHER_H_
#define PROOTBOX_BACKGROUND_LAUNCHER_H_

#include <memory>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "prootbox/executor.h"
#include "prootbox/subprocess.h"

namespace prootbox {

// Starts detached commands in the container. Implemented by
// SandboxContainerManager; the process supervisor only sees this interface.
class BackgroundLauncher {
 public:
  virtual ~BackgroundLauncher() = default;

  // Starts command through the shell and returns immediately. Fails with
  // FailedPrecondition if the container is not running.
  virtual absl::StatusOr<std::unique_ptr<Subprocess>> ExecuteBackground(
      absl::string_view sandbox_id, absl::string_view command,
      const Environment& env) = 0;

  // Directory holding the background process logs of a sandbox.
  virtual std::string SandboxLogDir(absl::string_view sandbox_id) const = 0;
};

}  // namespace prootbox

#endif  // PROOTBOX_BACKGROUND_LAUNCHER_H_
