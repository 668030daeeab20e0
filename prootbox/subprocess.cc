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

#include "prootbox/subprocess.h"

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/cleanup/cleanup.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "prootbox/util/fileops.h"
#include "prootbox/util/proc.h"

namespace prootbox {

using file_util::fileops::FDCloser;

absl::StatusOr<std::unique_ptr<Subprocess>> Subprocess::Start(
    const std::vector<std::string>& argv,
    const std::vector<std::string>& envp) {
  if (argv.empty()) {
    return absl::InvalidArgumentError("Empty argument vector");
  }
  int out_pipe[2];
  if (pipe2(out_pipe, O_CLOEXEC) == -1) {
    return absl::ErrnoToStatus(errno, "pipe2() for stdout");
  }
  FDCloser out_read(out_pipe[0]);
  FDCloser out_write(out_pipe[1]);
  int err_pipe[2];
  if (pipe2(err_pipe, O_CLOEXEC) == -1) {
    return absl::ErrnoToStatus(errno, "pipe2() for stderr");
  }
  FDCloser err_read(err_pipe[0]);
  FDCloser err_write(err_pipe[1]);

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  absl::Cleanup actions_cleanup = [&actions] {
    posix_spawn_file_actions_destroy(&actions);
  };
  posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null",
                                   O_RDONLY, 0);
  posix_spawn_file_actions_adddup2(&actions, out_write.get(), STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions, err_write.get(), STDERR_FILENO);

  posix_spawnattr_t attr;
  posix_spawnattr_init(&attr);
  absl::Cleanup attr_cleanup = [&attr] { posix_spawnattr_destroy(&attr); };
  sigset_t default_signals;
  sigemptyset(&default_signals);
  sigaddset(&default_signals, SIGPIPE);
  posix_spawnattr_setsigdefault(&attr, &default_signals);
  sigset_t empty_mask;
  sigemptyset(&empty_mask);
  posix_spawnattr_setsigmask(&attr, &empty_mask);
  posix_spawnattr_setpgroup(&attr, 0);
  posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP |
                                      POSIX_SPAWN_SETSIGDEF |
                                      POSIX_SPAWN_SETSIGMASK);

  util::CharPtrArray args(argv);
  util::CharPtrArray env(envp);
  pid_t pid;
  if (int error = posix_spawn(&pid, argv[0].c_str(), &actions, &attr,
                              args.data(), env.data());
      error != 0) {
    return absl::ErrnoToStatus(error,
                               absl::StrCat("posix_spawn(", argv[0], ")"));
  }
  VLOG(1) << "Spawned pid " << pid << ": " << absl::StrJoin(argv, " ");

  out_write.Close();
  err_write.Close();
  std::unique_ptr<Subprocess> process(
      new Subprocess(pid, std::move(out_read), std::move(err_read)));
  process->reaper_ = Thread(process.get(), &Subprocess::Reap);
  return process;
}

Subprocess::Subprocess(pid_t pid, FDCloser stdout_fd, FDCloser stderr_fd)
    : pid_(pid), stdout_(std::move(stdout_fd)), stderr_(std::move(stderr_fd)) {}

Subprocess::~Subprocess() {
  if (!HasExited()) {
    Kill();
  }
  if (reaper_.IsJoinable()) {
    reaper_.Join();
  }
}

void Subprocess::Reap() {
  int status = 0;
  pid_t ret;
  do {
    ret = waitpid(pid_, &status, 0);
  } while (ret == -1 && errno == EINTR);
  if (ret == -1) {
    PLOG(ERROR) << "waitpid(" << pid_ << ")";
  } else if (WIFEXITED(status)) {
    exit_code_ = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    exit_code_ = 128 + WTERMSIG(status);
  }
  VLOG(1) << "Pid " << pid_ << " finished with exit code " << exit_code_;
  exited_.Notify();
}

void Subprocess::Kill() {
  // Once reaped, the pid may belong to an unrelated process group.
  if (HasExited()) {
    return;
  }
  if (kill(-pid_, SIGKILL) == -1 && errno != ESRCH) {
    PLOG(WARNING) << "kill(-" << pid_ << ", SIGKILL)";
  }
}

bool Subprocess::AwaitExitWithTimeout(absl::Duration timeout) {
  return exited_.WaitForNotificationWithTimeout(timeout);
}

}  // namespace prootbox
