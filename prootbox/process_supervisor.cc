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

#include "prootbox/process_supervisor.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/random/random.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "prootbox/layout.h"
#include "prootbox/line_reader.h"
#include "prootbox/subprocess.h"
#include "prootbox/util/file_helpers.h"
#include "prootbox/util/fileops.h"
#include "prootbox/util/path.h"
#include "prootbox/util/proc.h"
#include "prootbox/util/status_macros.h"

namespace prootbox {

namespace fileops = file_util::fileops;

namespace {

bool CanTransition(ProcessStatus from, ProcessStatus to) {
  switch (from) {
    case ProcessStatus::kStarting:
      return to != ProcessStatus::kStarting;
    case ProcessStatus::kRunning:
      return to == ProcessStatus::kStopped || to == ProcessStatus::kFailed;
    case ProcessStatus::kStopped:
    case ProcessStatus::kFailed:
      return false;
  }
  return false;
}

std::string ToBase36(uint64_t value) {
  static constexpr char kDigits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
  if (value == 0) {
    return "0";
  }
  std::string out;
  while (value > 0) {
    out.push_back(kDigits[value % 36]);
    value /= 36;
  }
  std::reverse(out.begin(), out.end());
  return out;
}

std::string TruncationNotice(int64_t max_bytes) {
  constexpr int64_t kMiB = 1024 * 1024;
  if (max_bytes % kMiB == 0) {
    return absl::StrCat("[Log truncated: exceeded max size ",
                        max_bytes / kMiB, "MB]");
  }
  return absl::StrCat("[Log truncated: exceeded max size ", max_bytes,
                      " bytes]");
}

absl::StatusOr<fileops::FDCloser> CreateLogFile(const std::string& path) {
  fileops::FDCloser fd(
      open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
  if (fd.get() == -1) {
    return absl::ErrnoToStatus(errno,
                               absl::StrCat("Cannot create log file ", path));
  }
  return fd;
}

}  // namespace

absl::string_view ProcessStatusName(ProcessStatus status) {
  switch (status) {
    case ProcessStatus::kStarting:
      return "STARTING";
    case ProcessStatus::kRunning:
      return "RUNNING";
    case ProcessStatus::kStopped:
      return "STOPPED";
    case ProcessStatus::kFailed:
      return "FAILED";
  }
  return "UNKNOWN";
}

std::string BackgroundProcessInfo::ToString() const {
  std::string out = absl::StrCat(process_id, " [", ProcessStatusName(status),
                                 "] sandbox=", sandbox_id);
  if (pid.has_value()) {
    absl::StrAppend(&out, " pid=", *pid);
  }
  if (exit_code.has_value()) {
    absl::StrAppend(&out, " exit=", *exit_code);
  }
  if (!tag.empty()) {
    absl::StrAppend(&out, " tag=", tag);
  }
  absl::StrAppend(&out, ": ", command);
  return out;
}

absl::StatusOr<LogStream> ParseLogStream(absl::string_view name) {
  if (name == "stdout") {
    return LogStream::kStdout;
  }
  if (name == "stderr") {
    return LogStream::kStderr;
  }
  return absl::InvalidArgumentError(
      absl::StrCat("Invalid stream: ", name, ". Use 'stdout' or 'stderr'"));
}

// Copies the lines of one output stream into a log file until the stream ends
// or the capture is cancelled. Once the byte ceiling is passed a single notice
// is written and the rest of the stream is drained without being stored.
class BackgroundProcessSupervisor::LogCapture {
 public:
  LogCapture(fileops::FDCloser source, fileops::FDCloser log_file,
             int64_t max_bytes)
      : log_file_(std::move(log_file)),
        max_bytes_(max_bytes),
        reader_(std::move(source),
                [this](absl::string_view line) { OnLine(line); }) {}

  LogCapture(const LogCapture&) = delete;
  LogCapture& operator=(const LogCapture&) = delete;

  // Gives the stream some time to drain, then stops reading.
  void Finish(absl::Duration grace) {
    if (!reader_.AwaitEndOfStream(grace)) {
      VLOG(1) << "Log stream still open after " << grace << ", cancelling";
    }
    reader_.Cancel();
  }

 private:
  void OnLine(absl::string_view line) {
    if (truncated_) {
      return;
    }
    written_ += static_cast<int64_t>(line.size()) + 1;
    std::string record;
    if (written_ > max_bytes_) {
      truncated_ = true;
      record = absl::StrCat(TruncationNotice(max_bytes_), "\n");
    } else {
      record = absl::StrCat(line, "\n");
    }
    if (!fileops::WriteToFD(log_file_.get(), record.data(), record.size())) {
      PLOG(WARNING) << "Writing background process log";
    }
  }

  // Only touched from the reader thread.
  fileops::FDCloser log_file_;
  const int64_t max_bytes_;
  int64_t written_ = 0;
  bool truncated_ = false;
  // Declared last so the reader thread is joined before the state it uses is
  // destroyed.
  LineReader reader_;
};

struct BackgroundProcessSupervisor::Entry {
  explicit Entry(std::string id) : process_id(std::move(id)) {}

  // Immutable copy of info.process_id, readable without the lock.
  const std::string process_id;
  absl::Mutex mutex;
  BackgroundProcessInfo info ABSL_GUARDED_BY(mutex);
  std::unique_ptr<Subprocess> process ABSL_GUARDED_BY(mutex);
  std::unique_ptr<LogCapture> stdout_capture ABSL_GUARDED_BY(mutex);
  std::unique_ptr<LogCapture> stderr_capture ABSL_GUARDED_BY(mutex);

  // Applies a transition if it is allowed. Returns false otherwise.
  bool TransitionTo(ProcessStatus status) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex) {
    if (!CanTransition(info.status, status)) {
      VLOG(1) << "Ignoring transition of " << info.process_id << " from "
              << ProcessStatusName(info.status) << " to "
              << ProcessStatusName(status);
      return false;
    }
    info.status = status;
    if (status == ProcessStatus::kStopped ||
        status == ProcessStatus::kFailed) {
      info.exited_at = absl::Now();
    }
    return true;
  }
};

BackgroundProcessSupervisor::BackgroundProcessSupervisor(
    BackgroundLauncher* launcher, SupervisorOptions options)
    : launcher_(launcher),
      options_(std::move(options)),
      sweeper_(this, &BackgroundProcessSupervisor::RunSweeper) {
  CHECK(launcher_ != nullptr);
}

BackgroundProcessSupervisor::~BackgroundProcessSupervisor() {
  shutdown_.Notify();
  sweeper_.Join();
  ClearAll();
}

void BackgroundProcessSupervisor::RunSweeper() {
  while (!shutdown_.WaitForNotificationWithTimeout(
      options_.liveness_interval)) {
    CheckLiveness();
  }
}

std::string BackgroundProcessSupervisor::NewProcessId() {
  absl::BitGen gen;
  return absl::StrFormat("proc_%s_%08x",
                         ToBase36(absl::ToUnixMillis(absl::Now())),
                         absl::Uniform<uint32_t>(gen));
}

std::shared_ptr<BackgroundProcessSupervisor::Entry>
BackgroundProcessSupervisor::Find(absl::string_view process_id) const {
  absl::MutexLock lock(&entries_mutex_);
  auto it = entries_.find(process_id);
  return it == entries_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<BackgroundProcessSupervisor::Entry>>
BackgroundProcessSupervisor::Snapshot() const {
  absl::MutexLock lock(&entries_mutex_);
  std::vector<std::shared_ptr<Entry>> entries;
  entries.reserve(entries_.size());
  for (const auto& [id, entry] : entries_) {
    entries.push_back(entry);
  }
  return entries;
}

int BackgroundProcessSupervisor::CountRunning(
    absl::string_view sandbox_id) const {
  int running = 0;
  for (const auto& entry : Snapshot()) {
    absl::MutexLock lock(&entry->mutex);
    if (entry->info.sandbox_id == sandbox_id &&
        entry->info.status == ProcessStatus::kRunning) {
      ++running;
    }
  }
  return running;
}

absl::StatusOr<BackgroundProcessInfo> BackgroundProcessSupervisor::Start(
    absl::string_view sandbox_id, absl::string_view command,
    absl::string_view tag, const Environment& env) {
  PROOTBOX_RETURN_IF_ERROR(ValidateSandboxId(sandbox_id));
  absl::MutexLock start_lock(&start_mutex_);
  if (CountRunning(sandbox_id) >= options_.max_running_per_sandbox) {
    return absl::ResourceExhaustedError(absl::StrCat(
        "Too many running processes (max ", options_.max_running_per_sandbox,
        "). Please stop some processes first."));
  }

  const std::string log_dir = launcher_->SandboxLogDir(sandbox_id);
  if (!fileops::CreateDirectoryRecursively(log_dir, 0755)) {
    return absl::ErrnoToStatus(
        errno, absl::StrCat("Cannot create log directory ", log_dir));
  }

  auto entry = std::make_shared<Entry>(NewProcessId());
  absl::MutexLock entry_lock(&entry->mutex);
  BackgroundProcessInfo& info = entry->info;
  info.process_id = entry->process_id;
  info.sandbox_id = std::string(sandbox_id);
  info.command = std::string(command);
  info.tag = std::string(tag);
  info.stdout_path = file::JoinPath(log_dir, info.process_id + ".stdout.log");
  info.stderr_path = file::JoinPath(log_dir, info.process_id + ".stderr.log");
  info.created_at = absl::Now();
  {
    absl::MutexLock lock(&entries_mutex_);
    entries_[info.process_id] = entry;
  }

  auto fail = [&](const absl::Status& status) {
    entry->TransitionTo(ProcessStatus::kFailed);
    info.exit_code = -1;
    LOG(WARNING) << "Background process " << info.process_id
                 << " failed to start: " << status;
    return absl::Status(status.code(),
                        absl::StrCat("Failed to start process ",
                                     info.process_id, ": ", status.message()));
  };

  absl::StatusOr<fileops::FDCloser> stdout_log =
      CreateLogFile(info.stdout_path);
  if (!stdout_log.ok()) {
    return fail(stdout_log.status());
  }
  absl::StatusOr<fileops::FDCloser> stderr_log =
      CreateLogFile(info.stderr_path);
  if (!stderr_log.ok()) {
    return fail(stderr_log.status());
  }
  absl::StatusOr<std::unique_ptr<Subprocess>> process =
      launcher_->ExecuteBackground(sandbox_id, command, env);
  if (!process.ok()) {
    return fail(process.status());
  }

  entry->process = *std::move(process);
  entry->stdout_capture = std::make_unique<LogCapture>(
      entry->process->TakeStdout(), *std::move(stdout_log),
      options_.max_log_bytes);
  entry->stderr_capture = std::make_unique<LogCapture>(
      entry->process->TakeStderr(), *std::move(stderr_log),
      options_.max_log_bytes);
  info.pid = entry->process->pid();
  info.started_at = absl::Now();
  entry->TransitionTo(ProcessStatus::kRunning);
  LOG(INFO) << "Started background process " << info.ToString();
  return info;
}

absl::Status BackgroundProcessSupervisor::Kill(absl::string_view process_id) {
  std::shared_ptr<Entry> entry = Find(process_id);
  if (entry == nullptr) {
    return absl::NotFoundError(
        absl::StrCat("Process not found: ", process_id));
  }
  absl::MutexLock lock(&entry->mutex);
  if (!entry->info.is_active()) {
    return absl::OkStatus();
  }
  if (entry->process != nullptr) {
    entry->process->Kill();
    if (!entry->process->AwaitExitWithTimeout(options_.kill_grace)) {
      LOG(WARNING) << "Process " << process_id << " did not exit within "
                   << options_.kill_grace << " of SIGKILL";
    }
    entry->info.exit_code = entry->process->exit_code();
  } else {
    entry->info.exit_code = -1;
  }
  for (auto* capture : {&entry->stdout_capture, &entry->stderr_capture}) {
    if (*capture != nullptr) {
      (*capture)->Finish(absl::Milliseconds(500));
    }
  }
  entry->TransitionTo(ProcessStatus::kStopped);
  LOG(INFO) << "Killed background process " << entry->info.ToString();
  return absl::OkStatus();
}

absl::StatusOr<LogPage> BackgroundProcessSupervisor::ReadLogs(
    absl::string_view process_id, absl::string_view stream, int64_t offset,
    int64_t limit) const {
  if (offset < 0 || limit < 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid log range: offset=", offset, " limit=", limit));
  }
  std::shared_ptr<Entry> entry = Find(process_id);
  if (entry == nullptr) {
    return absl::NotFoundError(
        absl::StrCat("Process not found: ", process_id));
  }
  PROOTBOX_ASSIGN_OR_RETURN(LogStream which, ParseLogStream(stream));
  std::string path;
  {
    absl::MutexLock lock(&entry->mutex);
    path = which == LogStream::kStdout ? entry->info.stdout_path
                                       : entry->info.stderr_path;
  }

  LogPage page;
  std::string contents;
  if (absl::Status status = file::GetContents(path, &contents); !status.ok()) {
    if (absl::IsNotFound(status)) {
      return page;
    }
    return status;
  }
  std::vector<absl::string_view> lines = absl::StrSplit(contents, '\n');
  if (!lines.empty() && lines.back().empty()) {
    lines.pop_back();
  }
  const int64_t total = static_cast<int64_t>(lines.size());
  // offset + limit may overflow.
  const int64_t begin = std::min(offset, total);
  const int64_t end = limit >= total - begin ? total : begin + limit;
  page.lines.assign(lines.begin() + begin, lines.begin() + end);
  page.total_lines = total;
  page.has_more = offset < total && limit < total - offset;
  return page;
}

std::optional<BackgroundProcessInfo> BackgroundProcessSupervisor::Get(
    absl::string_view process_id) const {
  std::shared_ptr<Entry> entry = Find(process_id);
  if (entry == nullptr) {
    return std::nullopt;
  }
  absl::MutexLock lock(&entry->mutex);
  return entry->info;
}

std::vector<BackgroundProcessInfo> BackgroundProcessSupervisor::ListBySandbox(
    absl::string_view sandbox_id) const {
  std::vector<BackgroundProcessInfo> result;
  for (const BackgroundProcessInfo& info : GetAll()) {
    if (info.sandbox_id == sandbox_id) {
      result.push_back(info);
    }
  }
  return result;
}

std::vector<BackgroundProcessInfo> BackgroundProcessSupervisor::GetAll() const {
  std::vector<BackgroundProcessInfo> result;
  for (const auto& entry : Snapshot()) {
    absl::MutexLock lock(&entry->mutex);
    result.push_back(entry->info);
  }
  std::sort(result.begin(), result.end(),
            [](const BackgroundProcessInfo& a, const BackgroundProcessInfo& b) {
              return a.created_at < b.created_at;
            });
  return result;
}

int BackgroundProcessSupervisor::RemoveIf(
    absl::FunctionRef<bool(const BackgroundProcessInfo&)> pred) {
  std::vector<std::shared_ptr<Entry>> selected;
  for (auto& entry : Snapshot()) {
    absl::MutexLock lock(&entry->mutex);
    if (pred(entry->info)) {
      selected.push_back(std::move(entry));
    }
  }
  std::vector<std::shared_ptr<Entry>> removed;
  {
    absl::MutexLock lock(&entries_mutex_);
    for (auto& entry : selected) {
      auto it = entries_.find(entry->process_id);
      if (it != entries_.end() && it->second == entry) {
        entries_.erase(it);
        removed.push_back(std::move(entry));
      }
    }
  }
  for (const auto& entry : removed) {
    absl::MutexLock lock(&entry->mutex);
    for (const std::string* path :
         {&entry->info.stdout_path, &entry->info.stderr_path}) {
      if (unlink(path->c_str()) == -1 && errno != ENOENT) {
        PLOG(WARNING) << "Removing log file " << *path;
      }
    }
  }
  return static_cast<int>(removed.size());
}

int BackgroundProcessSupervisor::CleanupOlderThan(absl::Duration age) {
  const absl::Time cutoff = absl::Now() - age;
  int removed = RemoveIf([cutoff](const BackgroundProcessInfo& info) {
    return !info.is_active() && info.exited_at.has_value() &&
           *info.exited_at < cutoff;
  });
  if (removed > 0) {
    LOG(INFO) << "Cleaned up " << removed << " finished background processes";
  }
  return removed;
}

int BackgroundProcessSupervisor::CleanupSandbox(absl::string_view sandbox_id) {
  for (const BackgroundProcessInfo& info : ListBySandbox(sandbox_id)) {
    if (info.is_active()) {
      if (absl::Status status = Kill(info.process_id); !status.ok()) {
        LOG(WARNING) << "Killing " << info.process_id << ": " << status;
      }
    }
  }
  return RemoveIf([sandbox_id](const BackgroundProcessInfo& info) {
    return info.sandbox_id == sandbox_id;
  });
}

int BackgroundProcessSupervisor::StopAll() {
  int stopped = 0;
  for (const BackgroundProcessInfo& info : GetAll()) {
    if (!info.is_active()) {
      continue;
    }
    if (absl::Status status = Kill(info.process_id); !status.ok()) {
      LOG(WARNING) << "Killing " << info.process_id << ": " << status;
      continue;
    }
    ++stopped;
  }
  return stopped;
}

void BackgroundProcessSupervisor::MarkAllStopped() {
  for (const auto& entry : Snapshot()) {
    absl::MutexLock lock(&entry->mutex);
    if (entry->TransitionTo(ProcessStatus::kStopped)) {
      entry->info.exit_code = -1;
    }
  }
}

void BackgroundProcessSupervisor::ClearAll() {
  absl::flat_hash_map<std::string, std::shared_ptr<Entry>> entries;
  {
    absl::MutexLock lock(&entries_mutex_);
    entries.swap(entries_);
  }
  if (!entries.empty()) {
    VLOG(1) << "Dropping " << entries.size() << " background process records";
  }
}

void BackgroundProcessSupervisor::CheckLiveness() {
  for (const auto& entry : Snapshot()) {
    absl::MutexLock lock(&entry->mutex);
    BackgroundProcessInfo& info = entry->info;
    if (info.status != ProcessStatus::kRunning || !info.pid.has_value()) {
      continue;
    }
    const bool alive = entry->process != nullptr
                           ? !entry->process->HasExited()
                           : util::ProcessEntryExists(*info.pid);
    if (alive) {
      continue;
    }
    entry->TransitionTo(ProcessStatus::kFailed);
    info.exit_code = -1;
    LOG(INFO) << "Background process " << info.process_id << " (pid "
              << *info.pid << ") is gone";
  }
}

void BackgroundProcessSupervisor::OnStateChanged(const ContainerState& state) {
  switch (state.phase()) {
    case ContainerState::Phase::kStopped:
      MarkAllStopped();
      break;
    case ContainerState::Phase::kNotInitialized:
      ClearAll();
      break;
    default:
      break;
  }
}

}  // namespace prootbox
