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

#ifndef PROOTBOX_SUBPROCESS_H_
#define PROOTBOX_SUBPROCESS_H_

#include <sys/types.h>

#include <memory>
#include <string>
#include <vector>

#include "absl/base/attributes.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/notification.h"
#include "absl/time/time.h"
#include "prootbox/util/fileops.h"
#include "prootbox/util/thread.h"

namespace prootbox {

// A child process with piped stdout/stderr, running in its own process group.
// A dedicated thread reaps the child as soon as it exits, so the process table
// entry disappears without anyone waiting on it.
class Subprocess final {
 public:
  // Spawns argv[0], which must be a path, with exactly the environment in
  // envp. stdin is connected to /dev/null.
  static absl::StatusOr<std::unique_ptr<Subprocess>> Start(
      const std::vector<std::string>& argv,
      const std::vector<std::string>& envp);

  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;

  // Kills the process group if the child is still running and waits for it.
  ~Subprocess();

  pid_t pid() const { return pid_; }

  // Transfers ownership of the read end of the stdout/stderr pipe. May be
  // called once per stream.
  file_util::fileops::FDCloser TakeStdout() { return std::move(stdout_); }
  file_util::fileops::FDCloser TakeStderr() { return std::move(stderr_); }

  // Sends SIGKILL to the whole process group. Does nothing once the child
  // has been reaped.
  void Kill();

  // Returns true if the child exited within the timeout.
  ABSL_MUST_USE_RESULT bool AwaitExitWithTimeout(absl::Duration timeout);

  bool HasExited() const { return exited_.HasBeenNotified(); }

  // Exit status of the child, or 128 + signal number if it was killed by a
  // signal. -1 until the child has exited.
  int exit_code() const { return HasExited() ? exit_code_ : -1; }

 private:
  Subprocess(pid_t pid, file_util::fileops::FDCloser stdout_fd,
             file_util::fileops::FDCloser stderr_fd);

  void Reap();

  const pid_t pid_;
  file_util::fileops::FDCloser stdout_;
  file_util::fileops::FDCloser stderr_;
  int exit_code_ = -1;
  absl::Notification exited_;
  Thread reaper_;
};

}  // namespace prootbox

#endif  // PROOTBOX_SUBPROCESS_H_
