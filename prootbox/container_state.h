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

#ifndef PROOTBOX_CONTAINER_STATE_H_
#define PROOTBOX_CONTAINER_STATE_H_

#include <ostream>
#include <string>

#include "absl/strings/string_view.h"

namespace prootbox {

// Phase of the global container together with the data carried by some
// phases: a progress fraction while initializing and a message on error.
class ContainerState {
 public:
  enum class Phase {
    kNotInitialized,
    kInitializing,
    kRunning,
    kStopped,
    kError,
  };

  ContainerState() = default;

  static ContainerState NotInitialized() { return ContainerState(); }
  static ContainerState Initializing(float progress);
  static ContainerState Running() { return ContainerState(Phase::kRunning); }
  static ContainerState Stopped() { return ContainerState(Phase::kStopped); }
  static ContainerState Error(absl::string_view message);

  Phase phase() const { return phase_; }
  // Only meaningful while initializing; always within [0, 1].
  float progress() const { return progress_; }
  // Only set in the error phase.
  const std::string& message() const { return message_; }

  bool is(Phase phase) const { return phase_ == phase; }

  std::string ToString() const;

  friend bool operator==(const ContainerState& a, const ContainerState& b) {
    return a.phase_ == b.phase_ && a.progress_ == b.progress_ &&
           a.message_ == b.message_;
  }
  friend bool operator!=(const ContainerState& a, const ContainerState& b) {
    return !(a == b);
  }

 private:
  explicit ContainerState(Phase phase) : phase_(phase) {}

  Phase phase_ = Phase::kNotInitialized;
  float progress_ = 0;
  std::string message_;
};

absl::string_view PhaseName(ContainerState::Phase phase);

std::ostream& operator<<(std::ostream& os, const ContainerState& state);

}  // namespace prootbox

#endif  // PROOTBOX_CONTAINER_STATE_H_
