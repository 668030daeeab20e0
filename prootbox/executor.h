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

#ifndef PROOTBOX_EXECUTOR_H_
#define PROOTBOX_EXECUTOR_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "prootbox/execution_outcome.h"
#include "prootbox/subprocess.h"

namespace prootbox {

using Environment = absl::btree_map<std::string, std::string>;

// In-sandbox path of the per-sandbox workspace and the initial working
// directory.
inline constexpr absl::string_view kWorkspacePath = "/workspace";

// PATH inside the sandbox before any tool directories are prepended.
inline constexpr absl::string_view kBasePath =
    "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";

// Host locations the confinement helper stitches together.
struct ConfinementPaths {
  std::string helper_path;
  std::string rootfs_dir;
  // Writable layer with usr/local, usr/lib and root below it.
  std::string upper_dir;
  // Exported as PROOT_TMP_DIR.
  std::string helper_tmp_dir;
  // Exported as LD_PRELOAD when the file exists.
  std::string preload_library;
};

// The prootbox::ProcessExecutor class builds confined command invocations and
// runs them. It holds no per-invocation state and may be shared between
// threads.
class ProcessExecutor final {
 public:
  explicit ProcessExecutor(ConfinementPaths paths);

  ProcessExecutor(const ProcessExecutor&) = delete;
  ProcessExecutor& operator=(const ProcessExecutor&) = delete;

  // Returns the helper command line that runs command with workspace_dir
  // mounted at kWorkspacePath. The argument order matters to the helper: bind
  // mounts first, then the root, then the working directory, then the
  // command.
  std::vector<std::string> BuildArgv(
      absl::string_view workspace_dir,
      const std::vector<std::string>& command) const;

  // Returns the baseline environment merged with overrides, as KEY=value
  // strings. Overrides win on collisions.
  std::vector<std::string> BuildEnvironment(const Environment& overrides) const;

  // Starts a confined process without waiting for it.
  absl::StatusOr<std::unique_ptr<Subprocess>> Launch(
      absl::string_view workspace_dir, const std::vector<std::string>& command,
      const Environment& overrides) const;

  // Captures the output of a launched process until it exits or the timeout
  // expires. On timeout the process group is killed, orphaned helpers are
  // swept and the outcome reports exit code -1.
  ExecutionOutcome Collect(Subprocess& process, absl::Duration timeout) const;

  // Launch() followed by Collect(). Spawn failures become an outcome with
  // exit code -1.
  ExecutionOutcome Run(absl::string_view workspace_dir,
                       const std::vector<std::string>& command,
                       const Environment& overrides,
                       absl::Duration timeout) const;

  // Kills helper processes found in /proc. With orphans_only set, helpers
  // whose parent is this process are spared. Returns the number of processes
  // signalled.
  int KillHelperProcesses(bool orphans_only) const;

  const ConfinementPaths& paths() const { return paths_; }

 private:
  ConfinementPaths paths_;
};

}  // namespace prootbox

#endif  // PROOTBOX_EXECUTOR_H_
