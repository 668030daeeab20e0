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

#include "prootbox/executor.h"

#include <signal.h>

#include <memory>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "prootbox/execution_outcome.h"
#include "prootbox/testing.h"
#include "prootbox/util/file_helpers.h"
#include "prootbox/util/fileops.h"
#include "prootbox/util/path.h"
#include "prootbox/util/status_matchers.h"
#include "prootbox/util/thread.h"

namespace prootbox {
namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::Each;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Not;
using ::testing::StartsWith;
using ::testing::StrEq;

class ExecutorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    PROOTBOX_ASSERT_OK_AND_ASSIGN(dir_, CreateTempDir("executor_test"));
    paths_.helper_path = file::JoinPath(dir_, "proot/proot");
    paths_.rootfs_dir = file::JoinPath(dir_, "rootfs");
    paths_.upper_dir = file::JoinPath(dir_, "container/upper");
    paths_.helper_tmp_dir = file::JoinPath(dir_, "cache");
    paths_.preload_library = file::JoinPath(dir_, "lib/libtermux-exec.so");
    ASSERT_TRUE(file_util::fileops::CreateDirectoryRecursively(
        file::JoinPath(dir_, "proot"), 0755));
    PROOTBOX_ASSERT_OK(WriteFakeHelper(paths_.helper_path));
    workspace_ = file::JoinPath(dir_, "sandboxes/test");
  }

  void TearDown() override { file_util::fileops::DeleteRecursively(dir_); }

  ExecutionOutcome RunShell(const ProcessExecutor& executor,
                            const std::string& command,
                            const Environment& env = {},
                            absl::Duration timeout = absl::Seconds(30)) {
    return executor.Run(workspace_, {"sh", "-c", command}, env, timeout);
  }

  std::string dir_;
  std::string workspace_;
  ConfinementPaths paths_;
};

TEST_F(ExecutorTest, BuildArgvOrder) {
  ProcessExecutor executor(paths_);
  const std::string upper = paths_.upper_dir;
  EXPECT_THAT(
      executor.BuildArgv("/data/sandboxes/s1", {"sh", "-c", "ls"}),
      ElementsAre(paths_.helper_path,
                  "-b", "/dev",
                  "-b", "/proc",
                  "-b", "/sys",
                  "-b", "/data/sandboxes/s1:/workspace",
                  "-b", absl::StrCat(upper, "/usr/local:/usr/local"),
                  "-b", absl::StrCat(upper, "/root:/root"),
                  "-b", absl::StrCat(upper, "/usr/lib:/usr/lib!"),
                  "-R", paths_.rootfs_dir,
                  "-w", "/workspace",
                  "--link2symlink",
                  "sh", "-c", "ls"));
}

TEST_F(ExecutorTest, BuildEnvironmentBaselineAndOverrides) {
  ProcessExecutor executor(paths_);
  std::vector<std::string> env = executor.BuildEnvironment({});
  EXPECT_THAT(env, ElementsAre("HOME=/root",
                               "PATH=/usr/local/sbin:/usr/local/bin:/usr/sbin:"
                               "/usr/bin:/sbin:/bin",
                               "PREFIX=/usr",
                               absl::StrCat("PROOT_TMP_DIR=",
                                            paths_.helper_tmp_dir),
                               "TMPDIR=/tmp"));

  env = executor.BuildEnvironment({{"HOME", "/workspace"}, {"FOO", "bar"}});
  EXPECT_THAT(env, Contains("HOME=/workspace"));
  EXPECT_THAT(env, Contains("FOO=bar"));
  EXPECT_THAT(env, Not(Contains("HOME=/root")));
}

TEST_F(ExecutorTest, PreloadLibraryOnlyWhenPresent) {
  ProcessExecutor executor(paths_);
  const std::string preload = absl::StrCat("LD_PRELOAD=",
                                           paths_.preload_library);
  EXPECT_THAT(executor.BuildEnvironment({}), Not(Contains(preload)));

  ASSERT_TRUE(file_util::fileops::CreateDirectoryRecursively(
      file::JoinPath(dir_, "lib"), 0755));
  PROOTBOX_ASSERT_OK(file::SetContents(paths_.preload_library, ""));
  EXPECT_THAT(executor.BuildEnvironment({}), Contains(preload));
}

TEST_F(ExecutorTest, RunsCommandAndCapturesStreams) {
  ProcessExecutor executor(paths_);
  ExecutionOutcome outcome = RunShell(
      executor, "printf '  out\\n\\n'; echo err >&2; echo err2 >&2; exit 7");
  EXPECT_THAT(outcome.exit_code, Eq(7));
  EXPECT_FALSE(outcome.success());
  // Only trailing whitespace is stripped.
  EXPECT_THAT(outcome.stdout_text, StrEq("  out"));
  EXPECT_THAT(outcome.stderr_text, StrEq("err\nerr2"));
}

TEST_F(ExecutorTest, PassesEnvironmentToCommand) {
  ProcessExecutor executor(paths_);
  ExecutionOutcome outcome =
      RunShell(executor, "echo \"$HOME|$PREFIX|$FOO\"", {{"FOO", "bar"}});
  ASSERT_TRUE(outcome.success()) << outcome.ToString();
  EXPECT_THAT(outcome.stdout_text, StrEq("/root|/usr|bar"));
}

TEST_F(ExecutorTest, TimeoutKillsProcess) {
  ProcessExecutor executor(paths_);
  const absl::Time start = absl::Now();
  ExecutionOutcome outcome = RunShell(executor, "echo started; sleep 30", {},
                                      absl::Milliseconds(500));
  EXPECT_LT(absl::Now() - start, absl::Seconds(15));
  EXPECT_THAT(outcome.exit_code, Eq(-1));
  EXPECT_THAT(outcome.stdout_text, HasSubstr("started"));
  EXPECT_THAT(outcome.stderr_text,
              HasSubstr("Execution timed out after 500ms"));
}

TEST_F(ExecutorTest, SpawnFailureIsAnOutcome) {
  paths_.helper_path = file::JoinPath(dir_, "missing/proot");
  ProcessExecutor executor(paths_);
  ExecutionOutcome outcome = RunShell(executor, "true");
  EXPECT_THAT(outcome.exit_code, Eq(-1));
  EXPECT_THAT(outcome.stdout_text, IsEmpty());
  EXPECT_THAT(outcome.stderr_text, StartsWith("Execution error: "));
}

TEST_F(ExecutorTest, ConcurrentRunsKeepOutputsApart) {
  ProcessExecutor executor(paths_);
  ExecutionOutcome first;
  ExecutionOutcome second;
  Thread a([&] {
    first = RunShell(executor, "for i in 1 2 3 4 5 6 7 8; do echo A; done");
  });
  Thread b([&] {
    second = RunShell(executor, "for i in 1 2 3 4 5 6 7 8; do echo B; done");
  });
  a.Join();
  b.Join();
  std::vector<std::string> first_lines = absl::StrSplit(first.stdout_text, '\n');
  std::vector<std::string> second_lines =
      absl::StrSplit(second.stdout_text, '\n');
  EXPECT_THAT(first_lines, ::testing::SizeIs(8));
  EXPECT_THAT(first_lines, Each(StrEq("A")));
  EXPECT_THAT(second_lines, ::testing::SizeIs(8));
  EXPECT_THAT(second_lines, Each(StrEq("B")));
}

TEST_F(ExecutorTest, KillHelperProcessesSparesOwnChildren) {
  // A helper that keeps running under its own name.
  PROOTBOX_ASSERT_OK(
      file::SetContents(paths_.helper_path, "#!/bin/sh\nsleep 30\n", 0755));
  ProcessExecutor executor(paths_);
  absl::StatusOr<std::unique_ptr<Subprocess>> process =
      executor.Launch(workspace_, {"true"}, {});
  ASSERT_THAT(process.status(), ::prootbox::testing::IsOk());

  EXPECT_THAT(executor.KillHelperProcesses(/*orphans_only=*/true), Eq(0));
  EXPECT_FALSE((*process)->AwaitExitWithTimeout(absl::Milliseconds(200)));

  EXPECT_THAT(executor.KillHelperProcesses(/*orphans_only=*/false), Eq(1));
  ASSERT_TRUE((*process)->AwaitExitWithTimeout(absl::Seconds(10)));
  EXPECT_THAT((*process)->exit_code(), Eq(128 + SIGKILL));
  // Takes the orphaned sleep down with the process group.
  (*process)->Kill();
}

}  // namespace
}  // namespace prootbox
