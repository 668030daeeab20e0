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

#include <signal.h>
#include <unistd.h>

#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "prootbox/container_state.h"
#include "prootbox/executor.h"
#include "prootbox/subprocess.h"
#include "prootbox/testing.h"
#include "prootbox/util/fileops.h"
#include "prootbox/util/path.h"
#include "prootbox/util/proc.h"
#include "prootbox/util/status_matchers.h"

namespace prootbox {
namespace {

using ::prootbox::testing::IsOk;
using ::prootbox::testing::StatusIs;
using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::MatchesRegex;
using ::testing::Optional;
using ::testing::SizeIs;
using ::testing::StartsWith;
using ::testing::StrEq;

constexpr absl::Duration kWaitLimit = absl::Seconds(10);

// Runs commands directly with the host shell.
class ShellLauncher : public BackgroundLauncher {
 public:
  explicit ShellLauncher(std::string root) : root_(std::move(root)) {}

  absl::StatusOr<std::unique_ptr<Subprocess>> ExecuteBackground(
      absl::string_view sandbox_id, absl::string_view command,
      const Environment& env) override {
    if (failing_) {
      return absl::FailedPreconditionError(
          "Container not running. Current state: Stopped");
    }
    std::vector<std::string> envp = {"PATH=/usr/bin:/bin"};
    for (const auto& [key, value] : env) {
      envp.push_back(absl::StrCat(key, "=", value));
    }
    return Subprocess::Start({"/bin/sh", "-c", std::string(command)}, envp);
  }

  std::string SandboxLogDir(absl::string_view sandbox_id) const override {
    return file::JoinPath(root_, sandbox_id, "logs");
  }

  void set_failing(bool failing) { failing_ = failing; }

 private:
  std::string root_;
  bool failing_ = false;
};

class ProcessSupervisorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    PROOTBOX_ASSERT_OK_AND_ASSIGN(dir_, CreateTempDir("supervisor_test"));
    launcher_ = std::make_unique<ShellLauncher>(dir_);
    // The periodic sweep is exercised separately.
    options_.liveness_interval = absl::Hours(1);
  }

  void TearDown() override {
    supervisor_.reset();
    file_util::fileops::DeleteRecursively(dir_);
  }

  BackgroundProcessSupervisor& supervisor() {
    if (supervisor_ == nullptr) {
      supervisor_ = std::make_unique<BackgroundProcessSupervisor>(
          launcher_.get(), options_);
    }
    return *supervisor_;
  }

  BackgroundProcessInfo StartOrDie(absl::string_view sandbox_id,
                                   absl::string_view command) {
    absl::StatusOr<BackgroundProcessInfo> info =
        supervisor().Start(sandbox_id, command);
    EXPECT_THAT(info, IsOk());
    return info.ok() ? *std::move(info) : BackgroundProcessInfo();
  }

  // Polls a log until it holds at least min_lines lines.
  LogPage AwaitLogLines(const std::string& process_id,
                        absl::string_view stream, int64_t min_lines) {
    const absl::Time deadline = absl::Now() + kWaitLimit;
    LogPage page;
    do {
      absl::StatusOr<LogPage> read = supervisor().ReadLogs(process_id, stream);
      EXPECT_THAT(read, IsOk());
      if (!read.ok()) {
        break;
      }
      page = *std::move(read);
      if (page.total_lines >= min_lines) {
        break;
      }
      absl::SleepFor(absl::Milliseconds(20));
    } while (absl::Now() < deadline);
    return page;
  }

  std::string dir_;
  std::unique_ptr<ShellLauncher> launcher_;
  SupervisorOptions options_;
  std::unique_ptr<BackgroundProcessSupervisor> supervisor_;
};

TEST(ProcessStatusTest, Names) {
  EXPECT_THAT(ProcessStatusName(ProcessStatus::kStarting), StrEq("STARTING"));
  EXPECT_THAT(ProcessStatusName(ProcessStatus::kRunning), StrEq("RUNNING"));
  EXPECT_THAT(ProcessStatusName(ProcessStatus::kStopped), StrEq("STOPPED"));
  EXPECT_THAT(ProcessStatusName(ProcessStatus::kFailed), StrEq("FAILED"));
}

TEST(LogStreamTest, Parse) {
  PROOTBOX_ASSERT_OK_AND_ASSIGN(LogStream out, ParseLogStream("stdout"));
  EXPECT_THAT(out, Eq(LogStream::kStdout));
  PROOTBOX_ASSERT_OK_AND_ASSIGN(LogStream err, ParseLogStream("stderr"));
  EXPECT_THAT(err, Eq(LogStream::kStderr));
  EXPECT_THAT(ParseLogStream("stdin"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       StrEq("Invalid stream: stdin. Use 'stdout' or "
                             "'stderr'")));
}

TEST_F(ProcessSupervisorTest, StartReportsRunningProcess) {
  PROOTBOX_ASSERT_OK_AND_ASSIGN(
      BackgroundProcessInfo info,
      supervisor().Start("s1", "sleep 30", "dev-server"));

  EXPECT_THAT(info.process_id, MatchesRegex("proc_[0-9a-z]+_[0-9a-f]{8}"));
  EXPECT_THAT(info.sandbox_id, StrEq("s1"));
  EXPECT_THAT(info.command, StrEq("sleep 30"));
  EXPECT_THAT(info.tag, StrEq("dev-server"));
  EXPECT_THAT(info.status, Eq(ProcessStatus::kRunning));
  ASSERT_TRUE(info.pid.has_value());
  EXPECT_TRUE(util::ProcessEntryExists(*info.pid));
  EXPECT_TRUE(info.started_at.has_value());
  EXPECT_FALSE(info.exited_at.has_value());
  EXPECT_FALSE(info.exit_code.has_value());
  EXPECT_THAT(info.stdout_path,
              StrEq(file::JoinPath(dir_, "s1/logs",
                                   info.process_id + ".stdout.log")));
  EXPECT_TRUE(file_util::fileops::Exists(info.stdout_path, false));
  EXPECT_TRUE(file_util::fileops::Exists(info.stderr_path, false));

  std::optional<BackgroundProcessInfo> fetched =
      supervisor().Get(info.process_id);
  ASSERT_TRUE(fetched.has_value());
  EXPECT_THAT(fetched->status, Eq(ProcessStatus::kRunning));
  EXPECT_THAT(fetched->pid, Eq(info.pid));
  EXPECT_THAT(supervisor().Get("proc_missing"), Eq(std::nullopt));
}

TEST_F(ProcessSupervisorTest, ProcessIdsAreUnique) {
  const BackgroundProcessInfo a = StartOrDie("s1", "sleep 30");
  const BackgroundProcessInfo b = StartOrDie("s1", "sleep 30");
  EXPECT_NE(a.process_id, b.process_id);
}

TEST_F(ProcessSupervisorTest, RejectsInvalidSandboxId) {
  EXPECT_THAT(supervisor().Start("../etc", "sleep 30"),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(supervisor().GetAll(), IsEmpty());
}

TEST_F(ProcessSupervisorTest, CapturesAndPagesLogs) {
  const BackgroundProcessInfo info = StartOrDie(
      "s1",
      "for i in 1 2 3 4 5; do echo line$i; done; echo oops >&2; sleep 30");

  EXPECT_THAT(AwaitLogLines(info.process_id, "stdout", 5).total_lines, Eq(5));
  EXPECT_THAT(AwaitLogLines(info.process_id, "stderr", 1).lines,
              ElementsAre("oops"));

  PROOTBOX_ASSERT_OK_AND_ASSIGN(
      LogPage page, supervisor().ReadLogs(info.process_id, "stdout", 1, 2));
  EXPECT_THAT(page.lines, ElementsAre("line2", "line3"));
  EXPECT_THAT(page.total_lines, Eq(5));
  EXPECT_TRUE(page.has_more);

  PROOTBOX_ASSERT_OK_AND_ASSIGN(
      page, supervisor().ReadLogs(info.process_id, "stdout", 3, 2));
  EXPECT_THAT(page.lines, ElementsAre("line4", "line5"));
  EXPECT_FALSE(page.has_more);

  PROOTBOX_ASSERT_OK_AND_ASSIGN(
      page, supervisor().ReadLogs(info.process_id, "stdout", 10, 2));
  EXPECT_THAT(page.lines, IsEmpty());
  EXPECT_THAT(page.total_lines, Eq(5));
  EXPECT_FALSE(page.has_more);
}

TEST_F(ProcessSupervisorTest, ReadLogsWithHugeRange) {
  const BackgroundProcessInfo info =
      StartOrDie("s1", "echo a; echo b; echo c; sleep 30");
  ASSERT_THAT(AwaitLogLines(info.process_id, "stdout", 3).total_lines, Eq(3));
  constexpr int64_t kMax = std::numeric_limits<int64_t>::max();

  PROOTBOX_ASSERT_OK_AND_ASSIGN(
      LogPage page, supervisor().ReadLogs(info.process_id, "stdout", 1, kMax));
  EXPECT_THAT(page.lines, ElementsAre("b", "c"));
  EXPECT_THAT(page.total_lines, Eq(3));
  EXPECT_FALSE(page.has_more);

  PROOTBOX_ASSERT_OK_AND_ASSIGN(
      page, supervisor().ReadLogs(info.process_id, "stdout", kMax, kMax));
  EXPECT_THAT(page.lines, IsEmpty());
  EXPECT_FALSE(page.has_more);

  PROOTBOX_ASSERT_OK_AND_ASSIGN(
      page, supervisor().ReadLogs(info.process_id, "stdout", kMax, 1));
  EXPECT_THAT(page.lines, IsEmpty());
  EXPECT_FALSE(page.has_more);

  PROOTBOX_ASSERT_OK_AND_ASSIGN(
      page, supervisor().ReadLogs(info.process_id, "stdout", 0, 0));
  EXPECT_THAT(page.lines, IsEmpty());
  EXPECT_TRUE(page.has_more);
}

TEST_F(ProcessSupervisorTest, ReadLogsErrors) {
  const BackgroundProcessInfo info = StartOrDie("s1", "sleep 30");

  EXPECT_THAT(supervisor().ReadLogs(info.process_id, "stdin"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Invalid stream: stdin")));
  EXPECT_THAT(supervisor().ReadLogs("proc_nope", "stdout"),
              StatusIs(absl::StatusCode::kNotFound,
                       StrEq("Process not found: proc_nope")));
  EXPECT_THAT(supervisor().ReadLogs(info.process_id, "stdout", -1, 10),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST_F(ProcessSupervisorTest, ReadLogsOfDeletedFileIsEmpty) {
  const BackgroundProcessInfo info = StartOrDie("s1", "sleep 30");
  ASSERT_EQ(unlink(info.stdout_path.c_str()), 0);

  PROOTBOX_ASSERT_OK_AND_ASSIGN(
      LogPage page, supervisor().ReadLogs(info.process_id, "stdout"));
  EXPECT_THAT(page.lines, IsEmpty());
  EXPECT_THAT(page.total_lines, Eq(0));
  EXPECT_FALSE(page.has_more);
}

TEST_F(ProcessSupervisorTest, PassesEnvironment) {
  PROOTBOX_ASSERT_OK_AND_ASSIGN(
      BackgroundProcessInfo info,
      supervisor().Start("s1", "echo \"$GREETING\"; sleep 30", "",
                         {{"GREETING", "hello"}}));

  EXPECT_THAT(AwaitLogLines(info.process_id, "stdout", 1).lines,
              ElementsAre("hello"));
}

TEST_F(ProcessSupervisorTest, KillStopsProcess) {
  const BackgroundProcessInfo info = StartOrDie("s1", "sleep 30");

  PROOTBOX_ASSERT_OK(supervisor().Kill(info.process_id));

  std::optional<BackgroundProcessInfo> killed =
      supervisor().Get(info.process_id);
  ASSERT_TRUE(killed.has_value());
  EXPECT_THAT(killed->status, Eq(ProcessStatus::kStopped));
  EXPECT_THAT(killed->exit_code, Optional(128 + SIGKILL));
  EXPECT_TRUE(killed->exited_at.has_value());
  EXPECT_FALSE(util::ProcessEntryExists(*info.pid));

  // Killing again changes nothing.
  PROOTBOX_ASSERT_OK(supervisor().Kill(info.process_id));
  EXPECT_THAT(supervisor().Get(info.process_id)->exited_at,
              Eq(killed->exited_at));

  EXPECT_THAT(supervisor().Kill("proc_nope"),
              StatusIs(absl::StatusCode::kNotFound));
}

TEST_F(ProcessSupervisorTest, EnforcesPerSandboxCapacity) {
  options_.max_running_per_sandbox = 2;
  const BackgroundProcessInfo first = StartOrDie("s1", "sleep 30");
  StartOrDie("s1", "sleep 30");

  EXPECT_THAT(supervisor().Start("s1", "sleep 30"),
              StatusIs(absl::StatusCode::kResourceExhausted,
                       StrEq("Too many running processes (max 2). Please "
                             "stop some processes first.")));
  // Other sandboxes have their own budget.
  PROOTBOX_EXPECT_OK(supervisor().Start("s2", "sleep 30"));

  PROOTBOX_ASSERT_OK(supervisor().Kill(first.process_id));
  PROOTBOX_EXPECT_OK(supervisor().Start("s1", "sleep 30"));
}

TEST_F(ProcessSupervisorTest, DefaultCapacity) {
  for (int i = 0; i < kMaxRunningProcessesPerSandbox; ++i) {
    StartOrDie("s1", "sleep 30");
  }
  EXPECT_THAT(supervisor().Start("s1", "sleep 30"),
              StatusIs(absl::StatusCode::kResourceExhausted,
                       HasSubstr("(max 10)")));
}

TEST_F(ProcessSupervisorTest, TruncatesOversizedLogs) {
  options_.max_log_bytes = 20;
  const BackgroundProcessInfo info = StartOrDie(
      "s1", "for i in 0 1 2 3 4 5 6 7 8 9; do echo line $i; done; sleep 30");

  AwaitLogLines(info.process_id, "stdout", 3);
  // Give the rest of the output a chance to (not) show up.
  absl::SleepFor(absl::Milliseconds(200));

  PROOTBOX_ASSERT_OK_AND_ASSIGN(
      LogPage page, supervisor().ReadLogs(info.process_id, "stdout"));
  EXPECT_THAT(page.lines,
              ElementsAre("line 0", "line 1",
                          "[Log truncated: exceeded max size 20 bytes]"));
}

TEST_F(ProcessSupervisorTest, LivenessCheckMarksExitedProcessFailed) {
  const BackgroundProcessInfo info = StartOrDie("s1", "exit 0");

  const absl::Time deadline = absl::Now() + kWaitLimit;
  do {
    absl::SleepFor(absl::Milliseconds(10));
    supervisor().CheckLiveness();
  } while (supervisor().Get(info.process_id)->status ==
               ProcessStatus::kRunning &&
           absl::Now() < deadline);

  std::optional<BackgroundProcessInfo> checked =
      supervisor().Get(info.process_id);
  ASSERT_TRUE(checked.has_value());
  EXPECT_THAT(checked->status, Eq(ProcessStatus::kFailed));
  EXPECT_THAT(checked->exit_code, Optional(-1));
  EXPECT_TRUE(checked->exited_at.has_value());
}

TEST_F(ProcessSupervisorTest, LivenessCheckKeepsLiveProcesses) {
  const BackgroundProcessInfo info = StartOrDie("s1", "sleep 30");

  supervisor().CheckLiveness();

  EXPECT_THAT(supervisor().Get(info.process_id)->status,
              Eq(ProcessStatus::kRunning));
}

TEST_F(ProcessSupervisorTest, SweeperRunsPeriodically) {
  options_.liveness_interval = absl::Milliseconds(50);
  const BackgroundProcessInfo info = StartOrDie("s1", "exit 0");

  const absl::Time deadline = absl::Now() + kWaitLimit;
  while (supervisor().Get(info.process_id)->status != ProcessStatus::kFailed &&
         absl::Now() < deadline) {
    absl::SleepFor(absl::Milliseconds(20));
  }
  EXPECT_THAT(supervisor().Get(info.process_id)->status,
              Eq(ProcessStatus::kFailed));
}

TEST_F(ProcessSupervisorTest, SpawnFailureIsRecorded) {
  launcher_->set_failing(true);

  absl::StatusOr<BackgroundProcessInfo> info = supervisor().Start("s1", "ls");

  EXPECT_THAT(info, StatusIs(absl::StatusCode::kFailedPrecondition,
                             StartsWith("Failed to start process proc_")));
  EXPECT_THAT(info.status().message(), HasSubstr("Container not running"));
  const std::vector<BackgroundProcessInfo> all = supervisor().GetAll();
  ASSERT_THAT(all, SizeIs(1));
  EXPECT_THAT(all[0].status, Eq(ProcessStatus::kFailed));
  EXPECT_THAT(all[0].exit_code, Optional(-1));
  EXPECT_THAT(std::string(info.status().message()),
              HasSubstr(all[0].process_id));
  EXPECT_FALSE(all[0].pid.has_value());
}

TEST_F(ProcessSupervisorTest, ListsInCreationOrder) {
  const BackgroundProcessInfo a = StartOrDie("s1", "sleep 30");
  const BackgroundProcessInfo b = StartOrDie("s2", "sleep 30");
  const BackgroundProcessInfo c = StartOrDie("s1", "sleep 30");

  std::vector<std::string> ids;
  for (const BackgroundProcessInfo& info : supervisor().GetAll()) {
    ids.push_back(info.process_id);
  }
  EXPECT_THAT(ids, ElementsAre(a.process_id, b.process_id, c.process_id));

  ids.clear();
  for (const BackgroundProcessInfo& info : supervisor().ListBySandbox("s1")) {
    ids.push_back(info.process_id);
  }
  EXPECT_THAT(ids, ElementsAre(a.process_id, c.process_id));
  EXPECT_THAT(supervisor().ListBySandbox("s3"), IsEmpty());
}

TEST_F(ProcessSupervisorTest, CleanupOlderThanDropsFinishedRecords) {
  const BackgroundProcessInfo done = StartOrDie("s1", "sleep 30");
  const BackgroundProcessInfo running = StartOrDie("s1", "sleep 30");
  PROOTBOX_ASSERT_OK(supervisor().Kill(done.process_id));

  EXPECT_THAT(supervisor().CleanupOlderThan(absl::Hours(1)), Eq(0));
  absl::SleepFor(absl::Milliseconds(5));
  EXPECT_THAT(supervisor().CleanupOlderThan(absl::ZeroDuration()), Eq(1));

  EXPECT_THAT(supervisor().Get(done.process_id), Eq(std::nullopt));
  EXPECT_FALSE(file_util::fileops::Exists(done.stdout_path, false));
  EXPECT_FALSE(file_util::fileops::Exists(done.stderr_path, false));
  EXPECT_TRUE(supervisor().Get(running.process_id).has_value());
}

TEST_F(ProcessSupervisorTest, CleanupSandboxKillsAndDrops) {
  const BackgroundProcessInfo a = StartOrDie("s1", "sleep 30");
  const BackgroundProcessInfo b = StartOrDie("s1", "sleep 30");
  const BackgroundProcessInfo other = StartOrDie("s2", "sleep 30");
  PROOTBOX_ASSERT_OK(supervisor().Kill(b.process_id));

  EXPECT_THAT(supervisor().CleanupSandbox("s1"), Eq(2));

  EXPECT_THAT(supervisor().ListBySandbox("s1"), IsEmpty());
  EXPECT_FALSE(util::ProcessEntryExists(*a.pid));
  EXPECT_FALSE(file_util::fileops::Exists(a.stdout_path, false));
  EXPECT_THAT(supervisor().Get(other.process_id)->status,
              Eq(ProcessStatus::kRunning));
}

TEST_F(ProcessSupervisorTest, StopAllKillsActiveProcesses) {
  const BackgroundProcessInfo a = StartOrDie("s1", "sleep 30");
  const BackgroundProcessInfo b = StartOrDie("s2", "sleep 30");
  const BackgroundProcessInfo c = StartOrDie("s2", "sleep 30");
  PROOTBOX_ASSERT_OK(supervisor().Kill(c.process_id));

  EXPECT_THAT(supervisor().StopAll(), Eq(2));

  for (const BackgroundProcessInfo& info : supervisor().GetAll()) {
    EXPECT_THAT(info.status, Eq(ProcessStatus::kStopped)) << info.ToString();
  }
  EXPECT_FALSE(util::ProcessEntryExists(*a.pid));
  EXPECT_FALSE(util::ProcessEntryExists(*b.pid));
  EXPECT_THAT(supervisor().StopAll(), Eq(0));
}

TEST_F(ProcessSupervisorTest, FollowsContainerState) {
  const BackgroundProcessInfo info = StartOrDie("s1", "sleep 30");

  supervisor().OnStateChanged(ContainerState::Running());
  EXPECT_THAT(supervisor().Get(info.process_id)->status,
              Eq(ProcessStatus::kRunning));

  supervisor().OnStateChanged(ContainerState::Stopped());
  std::optional<BackgroundProcessInfo> stopped =
      supervisor().Get(info.process_id);
  ASSERT_TRUE(stopped.has_value());
  EXPECT_THAT(stopped->status, Eq(ProcessStatus::kStopped));
  EXPECT_THAT(stopped->exit_code, Optional(-1));

  supervisor().OnStateChanged(ContainerState::NotInitialized());
  EXPECT_THAT(supervisor().GetAll(), IsEmpty());
  // Dropping the record kills what was left.
  EXPECT_FALSE(util::ProcessEntryExists(*info.pid));
}

TEST_F(ProcessSupervisorTest, ToStringSummarizesRecord) {
  const BackgroundProcessInfo info = StartOrDie("s1", "sleep 30");
  EXPECT_THAT(info.ToString(),
              StrEq(absl::StrCat(info.process_id, " [RUNNING] sandbox=s1 pid=",
                                 *info.pid, ": sleep 30")));
}

}  // namespace
}  // namespace prootbox
