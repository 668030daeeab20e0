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

#include "prootbox/flags.h"

#include <cstdint>
#include <string>

#include "absl/flags/flag.h"
#include "absl/time/time.h"
#include "prootbox/container_manager.h"
#include "prootbox/process_supervisor.h"

ABSL_FLAG(std::string, prootbox_base_dir, "/tmp/prootbox",
          "Directory holding the helper, the rootfs, the overlay and the "
          "per-sandbox workspaces");
ABSL_FLAG(std::string, prootbox_asset_dir, "",
          "Directory holding the bundled assets (proot/, rootfs/, alpine/). "
          "Defaults to <prootbox_base_dir>/assets");
ABSL_FLAG(std::string, prootbox_exec_preload_library, "",
          "Library exported as LD_PRELOAD inside the container when present. "
          "Defaults to <prootbox_base_dir>/lib/libtermux-exec.so");
ABSL_FLAG(std::string, prootbox_architecture, "",
          "Machine name to provision for (e.g. aarch64, x86_64). Detected "
          "from uname() when empty");
ABSL_FLAG(absl::Duration, prootbox_foreground_timeout,
          prootbox::kDefaultForegroundTimeout,
          "Time limit of a foreground command");
ABSL_FLAG(int, prootbox_max_background_processes,
          prootbox::kMaxRunningProcessesPerSandbox,
          "Maximum number of running background processes per sandbox");
ABSL_FLAG(int64_t, prootbox_max_log_bytes, prootbox::kMaxLogBytes,
          "Size ceiling of a background process log file");
ABSL_FLAG(absl::Duration, prootbox_liveness_interval,
          prootbox::kLivenessInterval,
          "Interval between background process liveness checks");

namespace prootbox {

ContainerOptions ContainerOptionsFromFlags() {
  ContainerOptions options;
  options.base_dir = absl::GetFlag(FLAGS_prootbox_base_dir);
  options.preload_library = absl::GetFlag(FLAGS_prootbox_exec_preload_library);
  options.architecture = absl::GetFlag(FLAGS_prootbox_architecture);
  options.default_timeout = absl::GetFlag(FLAGS_prootbox_foreground_timeout);
  return options;
}

SupervisorOptions SupervisorOptionsFromFlags() {
  SupervisorOptions options;
  options.max_running_per_sandbox =
      absl::GetFlag(FLAGS_prootbox_max_background_processes);
  options.max_log_bytes = absl::GetFlag(FLAGS_prootbox_max_log_bytes);
  options.liveness_interval = absl::GetFlag(FLAGS_prootbox_liveness_interval);
  return options;
}

}  // namespace prootbox
