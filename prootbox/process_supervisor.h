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

// The prootbox::BackgroundProcessSupervisor class tracks detached commands:
// their status, their logs and whether they are still alive.

#ifndef PROOTBOX_PROCESS_SUPERVISOR_H_
#define PROOTBOX_PROCESS_SUPERVISOR_H_

#include <sys/types.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/functional/function_ref.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/synchronization/notification.h"
#include "absl/time/time.h"
#include "prootbox/background_launcher.h"
#include "prootbox/container_manager.h"
#include "prootbox/container_state.h"
#include "prootbox/executor.h"
#include "prootbox/util/thread.h"

namespace prootbox {

inline constexpr int kMaxRunningProcessesPerSandbox = 10;
inline constexpr int64_t kMaxLogBytes = 10 * 1024 * 1024;
inline constexpr absl::Duration kLivenessInterval = absl::Seconds(5);
inline constexpr int64_t kDefaultLogPageSize = 1000;
inline constexpr absl::Duration kDefaultLogRetention = absl::Hours(24);

// Status transitions only move forward: Starting -> Running ->
// {Stopped, Failed}. Starting may also end directly in Stopped or Failed.
enum class ProcessStatus {
  kStarting,
  kRunning,
  kStopped,
  kFailed,
};

absl::string_view ProcessStatusName(ProcessStatus status);

struct BackgroundProcessInfo {
  std::string process_id;
  std::string sandbox_id;
  std::string command;
  std::string tag;
  ProcessStatus status = ProcessStatus::kStarting;
  std::optional<pid_t> pid;
  std::string stdout_path;
  std::string stderr_path;
  absl::Time created_at;
  std::optional<absl::Time> started_at;
  std::optional<absl::Time> exited_at;
  std::optional<int> exit_code;

  bool is_active() const {
    return status == ProcessStatus::kStarting ||
           status == ProcessStatus::kRunning;
  }

  std::string ToString() const;
};

enum class LogStream { kStdout, kStderr };

// Accepts "stdout" and "stderr".
absl::StatusOr<LogStream> ParseLogStream(absl::string_view name);

struct LogPage {
  std::vector<std::string> lines;
  int64_t total_lines = 0;
  bool has_more = false;
};

struct SupervisorOptions {
  // Processes in Running state allowed per sandbox.
  int max_running_per_sandbox = kMaxRunningProcessesPerSandbox;
  // Ceiling per log file, after which a truncation notice ends the log.
  int64_t max_log_bytes = kMaxLogBytes;
  absl::Duration liveness_interval = kLivenessInterval;
  // Time a killed process gets to exit.
  absl::Duration kill_grace = absl::Seconds(2);
};

class BackgroundProcessSupervisor final : public ContainerObserver {
 public:
  // launcher must outlive the supervisor.
  explicit BackgroundProcessSupervisor(BackgroundLauncher* launcher,
                                       SupervisorOptions options = {});

  BackgroundProcessSupervisor(const BackgroundProcessSupervisor&) = delete;
  BackgroundProcessSupervisor& operator=(const BackgroundProcessSupervisor&) =
      delete;

  // Stops the liveness sweep and kills processes that are still running.
  ~BackgroundProcessSupervisor() override;

  // Starts command in the background and returns its record. Fails with
  // ResourceExhausted if the sandbox is at capacity. If the process cannot be
  // spawned the record is kept in Failed state and the error names its id.
  absl::StatusOr<BackgroundProcessInfo> Start(absl::string_view sandbox_id,
                                              absl::string_view command,
                                              absl::string_view tag = "",
                                              const Environment& env = {});

  // Kills the process, waits briefly for it to exit, stops log capture and
  // marks it Stopped. Killing a finished process is a no-op.
  absl::Status Kill(absl::string_view process_id);

  // Returns up to limit lines of a log, starting at line offset.
  absl::StatusOr<LogPage> ReadLogs(absl::string_view process_id,
                                   absl::string_view stream, int64_t offset = 0,
                                   int64_t limit = kDefaultLogPageSize) const;

  std::optional<BackgroundProcessInfo> Get(absl::string_view process_id) const;
  std::vector<BackgroundProcessInfo> ListBySandbox(
      absl::string_view sandbox_id) const;
  std::vector<BackgroundProcessInfo> GetAll() const;

  // Drops finished records that exited more than age ago, with their logs.
  // Returns the number of records dropped.
  int CleanupOlderThan(absl::Duration age = kDefaultLogRetention);

  // Kills the running processes of a sandbox and drops all of its records and
  // logs. Returns the number of records dropped.
  int CleanupSandbox(absl::string_view sandbox_id);

  // Kills every running process. Returns the number killed.
  int StopAll();

  // Marks active records Stopped with exit code -1 without killing anything,
  // for when the container was shut down underneath them.
  void MarkAllStopped();

  // Forgets every record. Processes still alive are killed.
  void ClearAll();

  // Marks Running records whose pid has vanished as Failed. Runs periodically
  // on the sweep thread.
  void CheckLiveness();

  // Follows the container: Stopped marks everything stopped and
  // NotInitialized clears all records.
  void OnStateChanged(const ContainerState& state) override;

 private:
  class LogCapture;
  struct Entry;

  std::shared_ptr<Entry> Find(absl::string_view process_id) const
      ABSL_LOCKS_EXCLUDED(entries_mutex_);
  std::vector<std::shared_ptr<Entry>> Snapshot() const
      ABSL_LOCKS_EXCLUDED(entries_mutex_);
  int CountRunning(absl::string_view sandbox_id) const;
  std::string NewProcessId();
  // Removes the records selected by pred, deleting their log files.
  int RemoveIf(absl::FunctionRef<bool(const BackgroundProcessInfo&)> pred);
  void RunSweeper();

  BackgroundLauncher* const launcher_;
  const SupervisorOptions options_;

  // Serializes Start() so the capacity check holds.
  absl::Mutex start_mutex_;

  mutable absl::Mutex entries_mutex_;
  absl::flat_hash_map<std::string, std::shared_ptr<Entry>> entries_
      ABSL_GUARDED_BY(entries_mutex_);

  absl::Notification shutdown_;
  Thread sweeper_;
};

}  // namespace prootbox

#endif  // PROOTBOX_PROCESS_SUPERVISOR_H_
