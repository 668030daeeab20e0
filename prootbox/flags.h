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

// Command-line configuration of the container engine.

#ifndef PROOTBOX_FLAGS_H_
#define PROOTBOX_FLAGS_H_

#include <cstdint>
#include <string>

#include "absl/flags/declare.h"
#include "absl/time/time.h"
#include "prootbox/container_manager.h"
#include "prootbox/process_supervisor.h"

ABSL_DECLARE_FLAG(std::string, prootbox_base_dir);
ABSL_DECLARE_FLAG(std::string, prootbox_asset_dir);
ABSL_DECLARE_FLAG(std::string, prootbox_exec_preload_library);
ABSL_DECLARE_FLAG(std::string, prootbox_architecture);
ABSL_DECLARE_FLAG(absl::Duration, prootbox_foreground_timeout);
ABSL_DECLARE_FLAG(int, prootbox_max_background_processes);
ABSL_DECLARE_FLAG(int64_t, prootbox_max_log_bytes);
ABSL_DECLARE_FLAG(absl::Duration, prootbox_liveness_interval);

namespace prootbox {

ContainerOptions ContainerOptionsFromFlags();
SupervisorOptions SupervisorOptionsFromFlags();

}  // namespace prootbox

#endif  // PROOTBOX_FLAGS_H_
