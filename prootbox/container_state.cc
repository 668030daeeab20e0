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

#include "prootbox/container_state.h"

#include <algorithm>
#include <ostream>
#include <string>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"

namespace prootbox {

ContainerState ContainerState::Initializing(float progress) {
  ContainerState state(Phase::kInitializing);
  state.progress_ = std::clamp(progress, 0.0f, 1.0f);
  return state;
}

ContainerState ContainerState::Error(absl::string_view message) {
  ContainerState state(Phase::kError);
  state.message_ = std::string(message);
  return state;
}

absl::string_view PhaseName(ContainerState::Phase phase) {
  switch (phase) {
    case ContainerState::Phase::kNotInitialized:
      return "NotInitialized";
    case ContainerState::Phase::kInitializing:
      return "Initializing";
    case ContainerState::Phase::kRunning:
      return "Running";
    case ContainerState::Phase::kStopped:
      return "Stopped";
    case ContainerState::Phase::kError:
      return "Error";
  }
  return "Unknown";
}

std::string ContainerState::ToString() const {
  switch (phase_) {
    case Phase::kInitializing:
      return absl::StrFormat("Initializing(%.0f%%)", progress_ * 100);
    case Phase::kError:
      return absl::StrCat("Error(", message_, ")");
    default:
      return std::string(PhaseName(phase_));
  }
}

std::ostream& operator<<(std::ostream& os, const ContainerState& state) {
  return os << state.ToString();
}

}  // namespace prootbox
