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

#include <sstream>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "prootbox/execution_outcome.h"

namespace prootbox {
namespace {

using ::testing::Eq;
using ::testing::FloatEq;
using ::testing::StrEq;

TEST(ContainerStateTest, DefaultIsNotInitialized) {
  ContainerState state;
  EXPECT_TRUE(state.is(ContainerState::Phase::kNotInitialized));
  EXPECT_THAT(state, Eq(ContainerState::NotInitialized()));
  EXPECT_THAT(state.ToString(), StrEq("NotInitialized"));
}

TEST(ContainerStateTest, InitializingClampsProgress) {
  EXPECT_THAT(ContainerState::Initializing(0.5f).progress(), FloatEq(0.5f));
  EXPECT_THAT(ContainerState::Initializing(-1).progress(), FloatEq(0));
  EXPECT_THAT(ContainerState::Initializing(7).progress(), FloatEq(1));
  EXPECT_THAT(ContainerState::Initializing(0.2f).ToString(),
              StrEq("Initializing(20%)"));
}

TEST(ContainerStateTest, ErrorCarriesMessage) {
  ContainerState state = ContainerState::Error("disk full");
  EXPECT_TRUE(state.is(ContainerState::Phase::kError));
  EXPECT_THAT(state.message(), StrEq("disk full"));
  EXPECT_THAT(state.ToString(), StrEq("Error(disk full)"));
  EXPECT_NE(state, ContainerState::Error("other"));
}

TEST(ContainerStateTest, Names) {
  EXPECT_THAT(PhaseName(ContainerState::Phase::kRunning), StrEq("Running"));
  EXPECT_THAT(PhaseName(ContainerState::Phase::kStopped), StrEq("Stopped"));
  EXPECT_THAT(ContainerState::Running().ToString(), StrEq("Running"));
  EXPECT_THAT(ContainerState::Stopped().ToString(), StrEq("Stopped"));

  std::ostringstream os;
  os << ContainerState::Stopped();
  EXPECT_THAT(os.str(), StrEq("Stopped"));
}

TEST(ExecutionOutcomeTest, Failure) {
  ExecutionOutcome outcome = ExecutionOutcome::Failure("no container");
  EXPECT_THAT(outcome.exit_code, Eq(-1));
  EXPECT_FALSE(outcome.success());
  EXPECT_THAT(outcome.stdout_text, StrEq(""));
  EXPECT_THAT(outcome.stderr_text, StrEq("no container"));
}

TEST(ExecutionOutcomeTest, ToString) {
  ExecutionOutcome outcome;
  outcome.exit_code = 0;
  outcome.stdout_text = "hello";
  EXPECT_TRUE(outcome.success());
  EXPECT_THAT(outcome.ToString(),
              StrEq("OK - Exit code: 0, stdout: 5 bytes, stderr: 0 bytes"));
}

}  // namespace
}  // namespace prootbox
