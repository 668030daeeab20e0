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

#include "prootbox/container_manager.h"

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
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/escaping.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "prootbox/archive.h"
#include "prootbox/util/file_helpers.h"
#include "prootbox/util/fileops.h"
#include "prootbox/util/path.h"
#include "prootbox/util/status_macros.h"

namespace prootbox {
namespace {

using file_util::fileops::FDCloser;

constexpr absl::string_view kInstanceId = "global";

// Caches removed by CleanupUpperLayer(), relative to the writable layer.
constexpr absl::string_view kCacheDirs[] = {
    "root/.cache",
    "root/.npm",
    "root/.cargo/registry/cache",
    "root/go/pkg/mod/cache",
};

std::string ShellQuote(absl::string_view word) {
  return absl::StrCat("'", absl::StrReplaceAll(word, {{"'", "'\\''"}}), "'");
}

absl::Status MakeDirectory(const std::string& path) {
  if (!file_util::fileops::CreateDirectoryRecursively(path, 0755)) {
    return absl::ErrnoToStatus(errno, absl::StrCat("mkdir(", path, ")"));
  }
  return absl::OkStatus();
}

// Copies everything readable from in_fd into a new file at path.
absl::Status CopyToFile(int in_fd, const std::string& path, mode_t mode) {
  FDCloser out(
      open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode));
  if (out.get() == -1) {
    return absl::ErrnoToStatus(errno, absl::StrCat("open(", path, ")"));
  }
  char buffer[64 * 1024];
  for (;;) {
    ssize_t n = TEMP_FAILURE_RETRY(read(in_fd, buffer, sizeof(buffer)));
    if (n < 0) {
      return absl::ErrnoToStatus(errno, "read() asset");
    }
    if (n == 0) {
      break;
    }
    if (!file_util::fileops::WriteToFD(out.get(), buffer, n)) {
      return absl::ErrnoToStatus(errno, absl::StrCat("write(", path, ")"));
    }
  }
  if (fchmod(out.get(), mode) == -1) {
    return absl::ErrnoToStatus(errno, absl::StrCat("fchmod(", path, ")"));
  }
  return absl::OkStatus();
}

ConfinementPaths MakeConfinementPaths(const ContainerOptions& options,
                                      const ContainerLayout& layout) {
  ConfinementPaths paths;
  paths.helper_path = layout.helper_path();
  paths.rootfs_dir = layout.rootfs_dir();
  paths.upper_dir = layout.upper_dir();
  paths.helper_tmp_dir = layout.cache_dir();
  paths.preload_library =
      options.preload_library.empty()
          ? file::JoinPath(options.base_dir, "lib/libtermux-exec.so")
          : options.preload_library;
  return paths;
}

}  // namespace

SandboxContainerManager::SandboxContainerManager(
    ContainerOptions options, std::unique_ptr<AssetProvider> assets)
    : options_(std::move(options)),
      layout_(options_.base_dir),
      assets_(std::move(assets)),
      executor_(MakeConfinementPaths(options_, layout_)) {
  CHECK(assets_ != nullptr);
  CHECK(!options_.base_dir.empty());
}

SandboxContainerManager::~SandboxContainerManager() {
  absl::MutexLock lock(&process_mutex_);
  if (foreground_process_ != nullptr) {
    foreground_process_->Kill();
  }
}

ContainerState SandboxContainerManager::state() const {
  absl::MutexLock lock(&state_mutex_);
  return state_;
}

std::optional<ContainerInstance> SandboxContainerManager::instance() const {
  absl::MutexLock lock(&state_mutex_);
  return instance_;
}

void SandboxContainerManager::AddObserver(ContainerObserver* observer) {
  absl::MutexLock lock(&observers_mutex_);
  observers_.push_back(observer);
}

void SandboxContainerManager::RemoveObserver(ContainerObserver* observer) {
  absl::MutexLock lock(&observers_mutex_);
  observers_.erase(std::remove(observers_.begin(), observers_.end(), observer),
                   observers_.end());
}

void SandboxContainerManager::PublishState(const ContainerState& state) {
  {
    absl::MutexLock lock(&state_mutex_);
    state_ = state;
  }
  NotifyObservers(state);
}

void SandboxContainerManager::NotifyObservers(const ContainerState& state) {
  VLOG(1) << "Container state: " << state;
  std::vector<ContainerObserver*> observers;
  {
    absl::MutexLock lock(&observers_mutex_);
    observers = observers_;
  }
  for (ContainerObserver* observer : observers) {
    observer->OnStateChanged(state);
  }
}

absl::Status SandboxContainerManager::Initialize() {
  bool was_error;
  {
    absl::MutexLock lock(&state_mutex_);
    if (!state_.is(ContainerState::Phase::kNotInitialized) &&
        !state_.is(ContainerState::Phase::kError)) {
      return absl::FailedPreconditionError(absl::StrCat(
          "Already initialized or initializing (state: ", state_.ToString(),
          ")"));
    }
    was_error = state_.is(ContainerState::Phase::kError);
    state_ = ContainerState::Initializing(0);
  }
  if (was_error) {
    NotifyObservers(ContainerState::NotInitialized());
  }
  NotifyObservers(ContainerState::Initializing(0));

  LOG(INFO) << "Initializing container in " << layout_.base_dir();
  if (absl::Status status = Provision(); !status.ok()) {
    LOG(ERROR) << "Container initialization failed: " << status;
    PublishState(ContainerState::Error(status.message()));
    return status;
  }
  LOG(INFO) << "Container initialized";
  PublishState(ContainerState::Running());
  return absl::OkStatus();
}

absl::Status SandboxContainerManager::Provision() {
  PROOTBOX_ASSIGN_OR_RETURN(HostArchitecture arch, ResolveHostArchitecture());
  for (const std::string& dir :
       {layout_.helper_dir(), layout_.rootfs_dir(), layout_.container_dir()}) {
    PROOTBOX_RETURN_IF_ERROR(MakeDirectory(dir));
  }
  PublishState(ContainerState::Initializing(0.2f));

  PROOTBOX_RETURN_IF_ERROR(InstallHelper(arch));
  PublishState(ContainerState::Initializing(0.5f));

  PROOTBOX_RETURN_IF_ERROR(InstallRootfs(arch));
  PublishState(ContainerState::Initializing(0.8f));

  return CreateInstance();
}

absl::StatusOr<HostArchitecture>
SandboxContainerManager::ResolveHostArchitecture() const {
  if (!options_.architecture.empty()) {
    return ResolveArchitecture(options_.architecture);
  }
  return DetectHostArchitecture();
}

absl::Status SandboxContainerManager::InstallHelper(
    const HostArchitecture& arch) {
  const std::string helper = layout_.helper_path();
  if (file_util::fileops::Exists(helper, true)) {
    VLOG(1) << "Helper already installed at " << helper;
    return absl::OkStatus();
  }
  const std::string asset = HelperAssetName(arch);
  PROOTBOX_ASSIGN_OR_RETURN(FDCloser in, assets_->Open(asset));
  const std::string partial = absl::StrCat(helper, ".partial");
  PROOTBOX_RETURN_IF_ERROR(CopyToFile(in.get(), partial, 0755));
  if (rename(partial.c_str(), helper.c_str()) == -1) {
    return absl::ErrnoToStatus(errno, absl::StrCat("rename(", helper, ")"));
  }
  LOG(INFO) << "Installed helper " << asset;
  return absl::OkStatus();
}

bool SandboxContainerManager::RootfsNeedsUpdate() const {
  if (!file_util::fileops::IsNonEmptyDirectory(layout_.rootfs_dir())) {
    return true;
  }
  std::string contents;
  if (!file::GetContents(layout_.rootfs_version_file(), &contents).ok()) {
    LOG(INFO) << "Rootfs has no version marker";
    return true;
  }
  int version;
  if (!absl::SimpleAtoi(absl::StripAsciiWhitespace(contents), &version)) {
    LOG(WARNING) << "Unreadable rootfs version marker: " << contents;
    return true;
  }
  if (version < kRootfsVersion) {
    LOG(INFO) << "Rootfs version " << version << " is older than "
              << kRootfsVersion;
    return true;
  }
  return false;
}

absl::Status SandboxContainerManager::InstallRootfs(
    const HostArchitecture& arch) {
  if (!RootfsNeedsUpdate()) {
    VLOG(1) << "Rootfs is up to date";
    return absl::OkStatus();
  }
  const std::string rootfs = layout_.rootfs_dir();
  if (!file_util::fileops::DeleteRecursively(rootfs)) {
    return absl::ErrnoToStatus(errno, absl::StrCat("delete(", rootfs, ")"));
  }
  PROOTBOX_RETURN_IF_ERROR(MakeDirectory(rootfs));

  const std::vector<std::string> candidates = RootfsAssetCandidates(arch);
  for (const std::string& asset : candidates) {
    absl::StatusOr<FDCloser> in = assets_->Open(asset);
    if (absl::IsNotFound(in.status())) {
      VLOG(1) << "No rootfs asset " << asset;
      continue;
    }
    if (!in.ok()) {
      return in.status();
    }
    LOG(INFO) << "Extracting rootfs from " << asset;
    ArchiveExtractor extractor(rootfs);
    PROOTBOX_ASSIGN_OR_RETURN(ExtractionSummary summary,
                              extractor.Extract(in->get()));
    LOG(INFO) << "Extracted " << summary.files << " files into " << rootfs;
    return file::SetContents(layout_.rootfs_version_file(),
                             absl::StrCat(kRootfsVersion));
  }
  return absl::NotFoundError(
      absl::StrCat("No rootfs archive for ", arch.rootfs_arch,
                   ", tried: ", absl::StrJoin(candidates, ", ")));
}

absl::Status SandboxContainerManager::EnsureOverlayDirectories() const {
  for (const std::string& dir :
       {layout_.work_dir(), layout_.upper_local_dir(), layout_.upper_lib_dir(),
        layout_.upper_home_dir(), layout_.cache_dir(),
        layout_.sandboxes_dir()}) {
    PROOTBOX_RETURN_IF_ERROR(MakeDirectory(dir));
  }
  return absl::OkStatus();
}

absl::Status SandboxContainerManager::CreateInstance() {
  PROOTBOX_RETURN_IF_ERROR(EnsureOverlayDirectories());
  absl::MutexLock lock(&state_mutex_);
  instance_ = ContainerInstance{std::string(kInstanceId), layout_.upper_dir(),
                                layout_.work_dir()};
  return absl::OkStatus();
}

absl::Status SandboxContainerManager::Start() {
  const ContainerState current = state();
  switch (current.phase()) {
    case ContainerState::Phase::kRunning:
      return absl::OkStatus();
    case ContainerState::Phase::kInitializing:
      return absl::FailedPreconditionError("Already initializing");
    case ContainerState::Phase::kNotInitialized:
    case ContainerState::Phase::kError:
      return Initialize();
    case ContainerState::Phase::kStopped:
      break;
  }
  if (instance().has_value()) {
    PROOTBOX_RETURN_IF_ERROR(EnsureOverlayDirectories());
  } else {
    PROOTBOX_RETURN_IF_ERROR(CreateInstance());
  }
  LOG(INFO) << "Container started";
  PublishState(ContainerState::Running());
  return absl::OkStatus();
}

absl::Status SandboxContainerManager::Stop() {
  const ContainerState current = state();
  if (!current.is(ContainerState::Phase::kRunning)) {
    return absl::FailedPreconditionError(absl::StrCat(
        "Container is not running (state: ", current.ToString(), ")"));
  }
  KillRunningCommands();
  LOG(INFO) << "Container stopped";
  PublishState(ContainerState::Stopped());
  return absl::OkStatus();
}

absl::Status SandboxContainerManager::Destroy() {
  KillRunningCommands();
  std::vector<std::string> failed;
  for (const std::string& path :
       {layout_.upper_dir(), layout_.work_dir(), layout_.rootfs_dir()}) {
    if (!file_util::fileops::DeleteRecursively(path)) {
      PLOG(WARNING) << "Could not delete " << path;
      failed.push_back(path);
    }
  }
  {
    absl::MutexLock lock(&state_mutex_);
    instance_.reset();
  }
  LOG(INFO) << "Container destroyed";
  PublishState(ContainerState::NotInitialized());
  if (!failed.empty()) {
    return absl::InternalError(
        absl::StrCat("Could not delete ", absl::StrJoin(failed, ", ")));
  }
  return absl::OkStatus();
}

bool SandboxContainerManager::IsInstalled() const {
  if (!file_util::fileops::Exists(layout_.helper_path(), true) ||
      !file_util::fileops::IsNonEmptyDirectory(layout_.rootfs_dir())) {
    return false;
  }
  // bin/sh is usually an absolute symlink that only resolves inside the
  // rootfs, so it is not followed.
  const std::string shell = file::JoinPath(layout_.rootfs_dir(), "bin/sh");
  struct stat st;
  if (lstat(shell.c_str(), &st) == -1) {
    return false;
  }
  return S_ISLNK(st.st_mode) || (S_ISREG(st.st_mode) && st.st_size > 0);
}

absl::Status SandboxContainerManager::RestoreState() {
  const ContainerState current = state();
  if (!current.is(ContainerState::Phase::kNotInitialized)) {
    return absl::FailedPreconditionError(absl::StrCat(
        "Cannot restore in state ", current.ToString()));
  }
  if (!IsInstalled()) {
    return absl::FailedPreconditionError("Container is not installed");
  }
  const bool has_upper = file_util::fileops::IsDirectory(layout_.upper_dir());
  PROOTBOX_RETURN_IF_ERROR(CreateInstance());
  if (has_upper) {
    LOG(INFO) << "Restored existing container";
    PublishState(ContainerState::Stopped());
  } else {
    LOG(INFO) << "Restored installation with a fresh writable layer";
    PublishState(ContainerState::Running());
  }
  return absl::OkStatus();
}

absl::Status SandboxContainerManager::OnForeground() {
  if (!auto_manage_) {
    return absl::OkStatus();
  }
  const ContainerState current = state();
  if (current.is(ContainerState::Phase::kNotInitialized)) {
    return Initialize();
  }
  if (current.is(ContainerState::Phase::kStopped)) {
    return Start();
  }
  return absl::OkStatus();
}

absl::Status SandboxContainerManager::OnBackground() {
  if (!auto_manage_ || !state().is(ContainerState::Phase::kRunning)) {
    return absl::OkStatus();
  }
  return Stop();
}

void SandboxContainerManager::KillRunningCommands() {
  {
    absl::MutexLock lock(&process_mutex_);
    if (foreground_process_ != nullptr) {
      LOG(INFO) << "Killing foreground pid " << foreground_process_->pid();
      foreground_process_->Kill();
      foreground_process_ = nullptr;
    }
  }
  const int killed = executor_.KillHelperProcesses(/*orphans_only=*/false);
  if (killed > 0) {
    LOG(INFO) << "Killed " << killed << " helper processes";
  }
}

bool SandboxContainerManager::HasForegroundProcess() const {
  absl::MutexLock lock(&process_mutex_);
  return foreground_process_ != nullptr;
}

std::optional<ExecutionOutcome> SandboxContainerManager::CheckRunning() const {
  const ContainerState current = state();
  if (current.is(ContainerState::Phase::kRunning)) {
    return std::nullopt;
  }
  return ExecutionOutcome::Failure(absl::StrCat(
      "Container not running. Current state: ", current.ToString()));
}

absl::StatusOr<std::string> SandboxContainerManager::PrepareWorkspace(
    absl::string_view sandbox_id) const {
  PROOTBOX_RETURN_IF_ERROR(ValidateSandboxId(sandbox_id));
  std::string workspace = layout_.sandbox_dir(sandbox_id);
  PROOTBOX_RETURN_IF_ERROR(MakeDirectory(workspace));
  return workspace;
}

Environment SandboxContainerManager::MergeEnvironment(
    const Environment& overrides) const {
  Environment env = GetToolEnvironment();
  for (const auto& [key, value] : overrides) {
    env[key] = value;
  }
  return env;
}

ExecutionOutcome SandboxContainerManager::ExecuteForeground(
    absl::string_view sandbox_id, absl::string_view command,
    const ForegroundOptions& options) {
  if (std::optional<ExecutionOutcome> failure = CheckRunning()) {
    return *std::move(failure);
  }
  if (options.policy != CommandPolicy::kUnrestricted) {
    const ValidationResult result = ValidateCommand(options.policy, command);
    if (!result.accepted()) {
      LOG(INFO) << "Rejected " << CommandPolicyName(options.policy)
                << " command: " << result.fragment();
      return ExecutionOutcome::Failure(
          absl::StrCat("SECURITY VIOLATION: ", result.reason(),
                       "\nBlocked command: ", result.fragment()));
    }
  }
  const absl::Duration timeout = options.timeout > absl::ZeroDuration()
                                     ? options.timeout
                                     : options_.default_timeout;
  return RunTracked(sandbox_id, command, timeout, options.env);
}

ExecutionOutcome SandboxContainerManager::RunTracked(
    absl::string_view sandbox_id, absl::string_view command,
    absl::Duration timeout, const Environment& env) {
  absl::StatusOr<std::string> workspace = PrepareWorkspace(sandbox_id);
  if (!workspace.ok()) {
    return ExecutionOutcome::Failure(
        absl::StrCat("Execution error: ", workspace.status().message()));
  }
  VLOG(1) << "[" << sandbox_id << "] " << command;
  absl::StatusOr<std::unique_ptr<Subprocess>> process = executor_.Launch(
      *workspace, {"sh", "-c", std::string(command)}, MergeEnvironment(env));
  if (!process.ok()) {
    LOG(WARNING) << "Could not start command: " << process.status();
    return ExecutionOutcome::Failure(
        absl::StrCat("Execution error: ", process.status().message()));
  }
  Subprocess* const handle = process->get();
  {
    absl::MutexLock lock(&process_mutex_);
    foreground_process_ = handle;
  }
  ExecutionOutcome outcome = executor_.Collect(*handle, timeout);
  {
    absl::MutexLock lock(&process_mutex_);
    if (foreground_process_ == handle) {
      foreground_process_ = nullptr;
    }
  }
  VLOG(1) << "[" << sandbox_id << "] " << outcome.ToString();
  return outcome;
}

ExecutionOutcome SandboxContainerManager::ExecutePython(
    absl::string_view sandbox_id, absl::string_view code,
    const std::vector<std::string>& packages) {
  if (std::optional<ExecutionOutcome> failure = CheckRunning()) {
    return *std::move(failure);
  }
  if (!packages.empty()) {
    std::vector<std::string> quoted;
    for (const std::string& package : packages) {
      quoted.push_back(ShellQuote(package));
    }
    ExecutionOutcome install = RunTracked(
        sandbox_id,
        absl::StrCat("pip install --quiet ", absl::StrJoin(quoted, " ")),
        options_.default_timeout, {});
    if (!install.success()) {
      install.stderr_text = absl::StrCat("Failed to install packages: ",
                                         install.stderr_text);
      return install;
    }
  }
  const std::string script = absl::StrCat(
      "/tmp/prootbox_", absl::ToUnixMillis(absl::Now()), ".py");
  const std::string command = absl::StrCat(
      "echo ", absl::Base64Escape(code), " | base64 -d > ", script,
      " && python3 ", script, "; status=$?; rm -f ", script, "; exit $status");
  return RunTracked(sandbox_id, command, options_.default_timeout, {});
}

absl::StatusOr<std::unique_ptr<Subprocess>>
SandboxContainerManager::ExecuteBackground(absl::string_view sandbox_id,
                                           absl::string_view command,
                                           const Environment& env) {
  const ContainerState current = state();
  if (!current.is(ContainerState::Phase::kRunning)) {
    return absl::FailedPreconditionError(absl::StrCat(
        "Container not running. Current state: ", current.ToString()));
  }
  PROOTBOX_ASSIGN_OR_RETURN(std::string workspace,
                            PrepareWorkspace(sandbox_id));
  VLOG(1) << "[" << sandbox_id << "] background: " << command;
  return executor_.Launch(workspace, {"sh", "-c", std::string(command)},
                          MergeEnvironment(env));
}

std::string SandboxContainerManager::SandboxLogDir(
    absl::string_view sandbox_id) const {
  return layout_.sandbox_log_dir(sandbox_id);
}

Environment SandboxContainerManager::GetToolEnvironment() const {
  const std::string local = layout_.upper_local_dir();
  auto installed = [&local](absl::string_view name) {
    return file_util::fileops::IsDirectory(file::JoinPath(local, name));
  };
  Environment env;
  std::vector<std::string> bin_dirs;
  if (installed("node")) {
    bin_dirs.push_back("/usr/local/node/bin");
    env["NODE_HOME"] = "/usr/local/node";
  }
  if (installed("go")) {
    bin_dirs.push_back("/usr/local/go/bin");
    env["GOROOT"] = "/usr/local/go";
    env["GOPATH"] = "/root/go";
  }
  std::vector<std::string> entries;
  std::string error;
  if (file_util::fileops::ListDirectoryEntries(local, &entries, &error)) {
    std::sort(entries.begin(), entries.end());
    for (const std::string& entry : entries) {
      if (absl::StartsWith(entry, "jdk") && installed(entry)) {
        const std::string java_home = file::JoinPath("/usr/local", entry);
        bin_dirs.push_back(file::JoinPath(java_home, "bin"));
        env["JAVA_HOME"] = java_home;
        break;
      }
    }
  }
  if (installed("rust")) {
    bin_dirs.push_back("/usr/local/rust/bin");
    env["RUST_HOME"] = "/usr/local/rust";
  }
  if (installed("python")) {
    bin_dirs.push_back("/usr/local/python/bin");
    env["PYTHON_HOME"] = "/usr/local/python";
    env["PIP_CACHE_DIR"] = "/root/.cache/pip";
  }
  if (!bin_dirs.empty()) {
    env["PATH"] = absl::StrCat(absl::StrJoin(bin_dirs, ":"), ":", kBasePath);
  }
  return env;
}

absl::StatusOr<std::vector<std::string>>
SandboxContainerManager::GetInstalledPackages() {
  if (std::optional<ExecutionOutcome> failure = CheckRunning()) {
    return absl::FailedPreconditionError(failure->stderr_text);
  }
  ExecutionOutcome outcome =
      RunTracked("packages", "pip list --format=freeze 2>/dev/null",
                 options_.default_timeout, {});
  if (!outcome.success()) {
    return absl::InternalError(absl::StrCat(
        "pip list failed with exit code ", outcome.exit_code, ": ",
        outcome.stderr_text));
  }
  std::vector<std::string> packages;
  for (absl::string_view line : absl::StrSplit(outcome.stdout_text, '\n')) {
    line = absl::StripAsciiWhitespace(line);
    if (!line.empty()) {
      packages.emplace_back(line);
    }
  }
  return packages;
}

int64_t SandboxContainerManager::GetContainerSize() const {
  return file_util::fileops::DiskUsage(layout_.container_dir());
}

CleanupResult SandboxContainerManager::CleanupUpperLayer() {
  CleanupResult result;
  for (absl::string_view cache : kCacheDirs) {
    const std::string path = file::JoinPath(layout_.upper_dir(), cache);
    if (!file_util::fileops::Exists(path, false)) {
      continue;
    }
    const int64_t size = file_util::fileops::DiskUsage(path);
    if (!file_util::fileops::DeleteRecursively(path)) {
      PLOG(WARNING) << "Could not delete " << path;
      continue;
    }
    result.freed_bytes += size;
    result.removed_paths.push_back(path);
  }
  LOG(INFO) << "Cleanup freed " << result.freed_bytes << " bytes";
  return result;
}

}  // namespace prootbox
