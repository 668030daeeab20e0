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

// The prootbox::SandboxContainerManager class owns the single shared
// container: its lifecycle, its on-disk provisioning and the execution of
// commands inside it.

#ifndef PROOTBOX_CONTAINER_MANAGER_H_
#define PROOTBOX_CONTAINER_MANAGER_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "prootbox/assets.h"
#include "prootbox/background_launcher.h"
#include "prootbox/command_validator.h"
#include "prootbox/container_state.h"
#include "prootbox/execution_outcome.h"
#include "prootbox/executor.h"
#include "prootbox/layout.h"
#include "prootbox/subprocess.h"

namespace prootbox {

// Bump when the rootfs contents or the on-disk layout change; existing
// installations are re-extracted on the next initialization.
inline constexpr int kRootfsVersion = 1;

inline constexpr absl::Duration kDefaultForegroundTimeout = absl::Minutes(5);

struct ContainerOptions {
  // Root of all on-disk state.
  std::string base_dir;
  // Library exported as LD_PRELOAD when present. Defaults to
  // <base_dir>/lib/libtermux-exec.so.
  std::string preload_library;
  // uname() machine name to provision for. Detected when empty.
  std::string architecture;
  absl::Duration default_timeout = kDefaultForegroundTimeout;
};

struct ForegroundOptions {
  // Zero selects ContainerOptions::default_timeout.
  absl::Duration timeout = absl::ZeroDuration();
  // Merged over the baseline and tool environment.
  Environment env;
  CommandPolicy policy = CommandPolicy::kUnrestricted;
};

// The provisioned container. At most one exists at a time.
struct ContainerInstance {
  std::string id;
  std::string upper_dir;
  std::string work_dir;
};

struct CleanupResult {
  int64_t freed_bytes = 0;
  std::vector<std::string> removed_paths;
};

class ContainerObserver {
 public:
  virtual ~ContainerObserver() = default;

  // Called after every state change, outside of any manager lock.
  virtual void OnStateChanged(const ContainerState& state) = 0;
};

class SandboxContainerManager final : public BackgroundLauncher {
 public:
  SandboxContainerManager(ContainerOptions options,
                          std::unique_ptr<AssetProvider> assets);

  SandboxContainerManager(const SandboxContainerManager&) = delete;
  SandboxContainerManager& operator=(const SandboxContainerManager&) = delete;

  ~SandboxContainerManager() override;

  ContainerState state() const ABSL_LOCKS_EXCLUDED(state_mutex_);
  std::optional<ContainerInstance> instance() const
      ABSL_LOCKS_EXCLUDED(state_mutex_);

  // Observers must outlive the manager or be removed first.
  void AddObserver(ContainerObserver* observer);
  void RemoveObserver(ContainerObserver* observer);

  // Lifecycle. These must not be called concurrently with each other.
  //
  // Provisions the helper binary, the rootfs and the writable layer, then
  // enters Running. Valid from NotInitialized and Error. Provisioning failures
  // are returned and leave the manager in Error.
  absl::Status Initialize();
  // Running: no-op. NotInitialized: Initialize(). Stopped: re-creates missing
  // overlay directories and enters Running. Error: resets, then Initialize().
  absl::Status Start();
  // Kills running commands and enters Stopped. Only valid from Running. The
  // writable layer is kept.
  absl::Status Stop();
  // Kills running commands, deletes the writable layer, the work directory
  // and the rootfs, and enters NotInitialized. Valid from any state.
  absl::Status Destroy();

  // Rediscovers an installation left by a previous process. Enters Stopped if
  // a writable layer exists, otherwise creates one and enters Running. Fails
  // with FailedPrecondition if nothing usable is installed.
  absl::Status RestoreState();

  // Returns true if the helper binary and a rootfs with a shell are on disk.
  bool IsInstalled() const;

  // Host lifecycle hooks. With auto management enabled, coming to the
  // foreground initializes or restarts the container and going to the
  // background stops a running one. Otherwise they do nothing.
  void set_auto_manage(bool enable) { auto_manage_ = enable; }
  absl::Status OnForeground();
  absl::Status OnBackground();

  // Runs command with "sh -c" in the workspace of sandbox_id and waits for
  // it. Never fails: problems are reported as exit code -1 with a message on
  // stderr.
  ExecutionOutcome ExecuteForeground(absl::string_view sandbox_id,
                                     absl::string_view command,
                                     const ForegroundOptions& options = {});

  // Installs packages with pip if given, then runs code with python3.
  ExecutionOutcome ExecutePython(absl::string_view sandbox_id,
                                 absl::string_view code,
                                 const std::vector<std::string>& packages = {});

  // BackgroundLauncher implementation.
  absl::StatusOr<std::unique_ptr<Subprocess>> ExecuteBackground(
      absl::string_view sandbox_id, absl::string_view command,
      const Environment& env) override;
  std::string SandboxLogDir(absl::string_view sandbox_id) const override;

  // Environment for tools installed below /usr/local in the writable layer.
  Environment GetToolEnvironment() const;

  // Python packages installed in the container, as name==version lines.
  absl::StatusOr<std::vector<std::string>> GetInstalledPackages();

  // Bytes used by the container directory (writable layer and work).
  int64_t GetContainerSize() const;

  // Removes package manager caches from the writable layer.
  CleanupResult CleanupUpperLayer();

  // Returns true while a foreground command is being tracked.
  bool HasForegroundProcess() const ABSL_LOCKS_EXCLUDED(process_mutex_);

  const ContainerLayout& layout() const { return layout_; }

 private:
  void PublishState(const ContainerState& state)
      ABSL_LOCKS_EXCLUDED(state_mutex_);
  void NotifyObservers(const ContainerState& state);

  absl::Status Provision();
  absl::StatusOr<HostArchitecture> ResolveHostArchitecture() const;
  absl::Status InstallHelper(const HostArchitecture& arch);
  absl::Status InstallRootfs(const HostArchitecture& arch);
  bool RootfsNeedsUpdate() const;
  absl::Status EnsureOverlayDirectories() const;
  absl::Status CreateInstance() ABSL_LOCKS_EXCLUDED(state_mutex_);

  // Kills the tracked foreground process and every helper process.
  void KillRunningCommands() ABSL_LOCKS_EXCLUDED(process_mutex_);

  // Returns a failure outcome unless the container is running.
  std::optional<ExecutionOutcome> CheckRunning() const;

  ExecutionOutcome RunTracked(absl::string_view sandbox_id,
                              absl::string_view command, absl::Duration timeout,
                              const Environment& env)
      ABSL_LOCKS_EXCLUDED(process_mutex_);

  absl::StatusOr<std::string> PrepareWorkspace(
      absl::string_view sandbox_id) const;

  Environment MergeEnvironment(const Environment& overrides) const;

  const ContainerOptions options_;
  const ContainerLayout layout_;
  std::unique_ptr<AssetProvider> assets_;
  const ProcessExecutor executor_;
  bool auto_manage_ = false;

  mutable absl::Mutex state_mutex_;
  ContainerState state_ ABSL_GUARDED_BY(state_mutex_);
  std::optional<ContainerInstance> instance_ ABSL_GUARDED_BY(state_mutex_);

  absl::Mutex observers_mutex_;
  std::vector<ContainerObserver*> observers_
      ABSL_GUARDED_BY(observers_mutex_);

  // The most recently started foreground command. Owned by the thread running
  // it, which clears this under the lock before destroying the process.
  mutable absl::Mutex process_mutex_;
  Subprocess* foreground_process_ ABSL_GUARDED_BY(process_mutex_) = nullptr;
};

}  // namespace prootbox

#endif  // PROOTBOX_CONTAINER_MANAGER_H_
