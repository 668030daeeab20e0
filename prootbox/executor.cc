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

#include "prootbox/executor.h"

#include <signal.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/statusor.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/strip.h"
#include "absl/time/time.h"
#include "prootbox/line_reader.h"
#include "prootbox/util/fileops.h"
#include "prootbox/util/path.h"
#include "prootbox/util/proc.h"

namespace prootbox {
namespace {

// Time the process gets to die after SIGKILL.
constexpr absl::Duration kKillGrace = absl::Seconds(5);
// Time the readers get to drain the pipes once the process is gone.
constexpr absl::Duration kReaderGrace = absl::Seconds(1);

// Returns true if the process runs the helper, either directly or as the
// script argument of an interpreter.
bool RunsHelper(pid_t pid, const std::string& helper_path) {
  const std::vector<std::string> args = util::GetCmdLineArgs(pid);
  for (size_t i = 0; i < args.size() && i < 2; ++i) {
    if (args[i] == helper_path) {
      return true;
    }
  }
  return false;
}

}  // namespace

ProcessExecutor::ProcessExecutor(ConfinementPaths paths)
    : paths_(std::move(paths)) {}

std::vector<std::string> ProcessExecutor::BuildArgv(
    absl::string_view workspace_dir,
    const std::vector<std::string>& command) const {
  std::vector<std::string> argv = {
      paths_.helper_path,
      "-b", "/dev",
      "-b", "/proc",
      "-b", "/sys",
      "-b", absl::StrCat(workspace_dir, ":", kWorkspacePath),
      "-b", absl::StrCat(file::JoinPath(paths_.upper_dir, "usr/local"),
                         ":/usr/local"),
      "-b", absl::StrCat(file::JoinPath(paths_.upper_dir, "root"), ":/root"),
      // The trailing "!" binds without following symlinks, so the writable
      // copy fully shadows the one in the rootfs.
      "-b", absl::StrCat(file::JoinPath(paths_.upper_dir, "usr/lib"),
                         ":/usr/lib!"),
      "-R", paths_.rootfs_dir,
      "-w", std::string(kWorkspacePath),
      "--link2symlink",
  };
  argv.insert(argv.end(), command.begin(), command.end());
  return argv;
}

std::vector<std::string> ProcessExecutor::BuildEnvironment(
    const Environment& overrides) const {
  Environment env = {
      {"HOME", "/root"},
      {"TMPDIR", "/tmp"},
      {"PROOT_TMP_DIR", paths_.helper_tmp_dir},
      {"PREFIX", "/usr"},
      {"PATH", std::string(kBasePath)},
  };
  if (!paths_.preload_library.empty() &&
      file_util::fileops::Exists(paths_.preload_library, true)) {
    env["LD_PRELOAD"] = paths_.preload_library;
  }
  for (const auto& [key, value] : overrides) {
    env[key] = value;
  }
  std::vector<std::string> result;
  result.reserve(env.size());
  for (const auto& [key, value] : env) {
    result.push_back(absl::StrCat(key, "=", value));
  }
  return result;
}

absl::StatusOr<std::unique_ptr<Subprocess>> ProcessExecutor::Launch(
    absl::string_view workspace_dir, const std::vector<std::string>& command,
    const Environment& overrides) const {
  std::vector<std::string> argv = BuildArgv(workspace_dir, command);
  std::vector<std::string> envp = BuildEnvironment(overrides);
  VLOG(2) << "Environment: " << absl::StrJoin(envp, " ");
  return Subprocess::Start(argv, envp);
}

ExecutionOutcome ProcessExecutor::Collect(Subprocess& process,
                                          absl::Duration timeout) const {
  std::string out;
  std::string err;
  LineReader out_reader(process.TakeStdout(), [&out](absl::string_view line) {
    absl::StrAppend(&out, line, "\n");
  });
  LineReader err_reader(process.TakeStderr(), [&err](absl::string_view line) {
    absl::StrAppend(&err, line, "\n");
  });

  const bool exited = process.AwaitExitWithTimeout(timeout);
  if (!exited) {
    LOG(WARNING) << "Pid " << process.pid() << " timed out after " << timeout
                 << ", killing it";
    process.Kill();
    if (!process.AwaitExitWithTimeout(kKillGrace)) {
      LOG(WARNING) << "Pid " << process.pid() << " survived SIGKILL";
    }
    const int swept = KillHelperProcesses(/*orphans_only=*/true);
    if (swept > 0) {
      LOG(INFO) << "Killed " << swept << " orphaned helper processes";
    }
  }
  for (LineReader* reader : {&out_reader, &err_reader}) {
    if (!reader->AwaitEndOfStream(kReaderGrace)) {
      VLOG(1) << "Output of pid " << process.pid()
              << " still open, abandoning reader";
    }
    reader->Cancel();
  }

  ExecutionOutcome outcome;
  if (!exited) {
    outcome.exit_code = -1;
    outcome.stdout_text = std::move(out);
    outcome.stderr_text =
        absl::StrCat(err, "\nExecution timed out after ",
                     absl::ToInt64Milliseconds(timeout), "ms");
    return outcome;
  }
  outcome.exit_code = process.exit_code();
  outcome.stdout_text = std::string(absl::StripTrailingAsciiWhitespace(out));
  outcome.stderr_text = std::string(absl::StripTrailingAsciiWhitespace(err));
  return outcome;
}

ExecutionOutcome ProcessExecutor::Run(absl::string_view workspace_dir,
                                      const std::vector<std::string>& command,
                                      const Environment& overrides,
                                      absl::Duration timeout) const {
  absl::StatusOr<std::unique_ptr<Subprocess>> process =
      Launch(workspace_dir, command, overrides);
  if (!process.ok()) {
    return ExecutionOutcome::Failure(
        absl::StrCat("Execution error: ", process.status().message()));
  }
  return Collect(**process, timeout);
}

int ProcessExecutor::KillHelperProcesses(bool orphans_only) const {
  const pid_t self = getpid();
  int killed = 0;
  for (pid_t pid : util::ListProcessIds()) {
    if (pid == self || !RunsHelper(pid, paths_.helper_path)) {
      continue;
    }
    if (orphans_only) {
      pid_t parent;
      if (absl::SimpleAtoi(util::GetProcStatusLine(pid, "PPid"), &parent) &&
          parent == self) {
        continue;
      }
    }
    if (kill(pid, SIGKILL) == 0) {
      ++killed;
    } else if (errno != ESRCH) {
      PLOG(WARNING) << "kill(" << pid << ", SIGKILL)";
    }
  }
  return killed;
}

}  // namespace prootbox
