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

#include "prootbox/command_validator.h"

#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "prootbox/util/status_matchers.h"

namespace prootbox {
namespace {

using ::prootbox::testing::IsOk;
using ::prootbox::testing::StatusIs;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::StrEq;

TEST(ShellTest, SplitCommandList) {
  EXPECT_THAT(shell::SplitCommandList("a; b && c || d\ne"),
              ElementsAre("a", "b", "c", "d", "e"));
  EXPECT_THAT(shell::SplitCommandList("echo 'a; b' && echo \"c && d\""),
              ElementsAre("echo 'a; b'", "echo \"c && d\""));
  EXPECT_THAT(shell::SplitCommandList("echo a\\;b"),
              ElementsAre("echo a\\;b"));
  EXPECT_THAT(shell::SplitCommandList("  ;; "), IsEmpty());
  // A single pipe is not a list separator.
  EXPECT_THAT(shell::SplitCommandList("a | b"), ElementsAre("a | b"));
}

TEST(ShellTest, SplitPipeline) {
  EXPECT_THAT(shell::SplitPipeline("cat a.txt | grep foo|wc -l"),
              ElementsAre("cat a.txt", "grep foo", "wc -l"));
  EXPECT_THAT(shell::SplitPipeline("grep 'a|b' file"),
              ElementsAre("grep 'a|b' file"));
}

TEST(ShellTest, Tokenize) {
  EXPECT_THAT(shell::Tokenize("  ls   -la\t/tmp "),
              ElementsAre("ls", "-la", "/tmp"));
  EXPECT_THAT(shell::Tokenize("echo 'hello world' \"a \\\"b\\\"\" c\\ d"),
              ElementsAre("echo", "hello world", "a \"b\"", "c d"));
  EXPECT_THAT(shell::Tokenize("echo ''"), ElementsAre("echo", ""));
  EXPECT_THAT(shell::Tokenize(""), IsEmpty());
}

TEST(ShellTest, ParseCommand) {
  ParsedCommand parsed =
      shell::ParseCommand("  GIT_PAGER=cat FOO=1 git --no-pager log -n 3 ");
  EXPECT_THAT(parsed.text, StrEq("GIT_PAGER=cat FOO=1 git --no-pager log -n 3"));
  EXPECT_THAT(parsed.base_command, StrEq("git"));
  EXPECT_THAT(parsed.subcommand, StrEq("log"));
  EXPECT_THAT(parsed.arguments, ElementsAre("--no-pager", "log", "-n", "3"));

  parsed = shell::ParseCommand("A=1");
  EXPECT_THAT(parsed.base_command, IsEmpty());

  EXPECT_TRUE(shell::IsAssignment("_X1=y"));
  EXPECT_FALSE(shell::IsAssignment("=y"));
  EXPECT_FALSE(shell::IsAssignment("1X=y"));
  EXPECT_FALSE(shell::IsAssignment("--opt=y"));
}

TEST(ReadOnlyValidatorTest, AcceptsInspectionCommands) {
  EXPECT_TRUE(ValidateReadOnlyCommand("ls -la /tmp").accepted());
  EXPECT_TRUE(ValidateReadOnlyCommand("cat a.txt | grep foo").accepted());
  EXPECT_TRUE(ValidateReadOnlyCommand("git status").accepted());
  EXPECT_TRUE(ValidateReadOnlyCommand("git log --oneline && git diff HEAD~1")
                  .accepted());
  EXPECT_TRUE(ValidateReadOnlyCommand("LANG=C sort file | uniq -c").accepted());
  EXPECT_TRUE(ValidateReadOnlyCommand("docker").accepted());
  EXPECT_TRUE(ValidateReadOnlyCommand("pip list; npm list").accepted());
  EXPECT_TRUE(ValidateReadOnlyCommand("grep 'rm -rf' notes.txt").accepted());
  EXPECT_TRUE(ValidateReadOnlyCommand("").accepted());
}

TEST(ReadOnlyValidatorTest, RejectsCommandsOutsideWhitelist) {
  ValidationResult result = ValidateReadOnlyCommand("rm -rf /");
  ASSERT_FALSE(result.accepted());
  EXPECT_THAT(result.fragment(), StrEq("rm -rf /"));
  EXPECT_THAT(result.reason(), HasSubstr("'rm' is not in the readonly"));

  result = ValidateReadOnlyCommand("ls && python3 script.py");
  ASSERT_FALSE(result.accepted());
  EXPECT_THAT(result.fragment(), StrEq("python3 script.py"));

  result = ValidateReadOnlyCommand("cat file | sh");
  ASSERT_FALSE(result.accepted());
  EXPECT_THAT(result.fragment(), StrEq("sh"));
}

TEST(ReadOnlyValidatorTest, RestrictsSubcommands) {
  ValidationResult result = ValidateReadOnlyCommand("git push");
  ASSERT_FALSE(result.accepted());
  EXPECT_THAT(result.fragment(), StrEq("git push"));
  EXPECT_THAT(result.reason(), HasSubstr("'git push' is not allowed"));
  EXPECT_THAT(result.reason(), HasSubstr("status, log, diff"));

  result = ValidateReadOnlyCommand("git");
  ASSERT_FALSE(result.accepted());
  EXPECT_THAT(result.reason(), HasSubstr("'git' requires a subcommand"));

  EXPECT_FALSE(ValidateReadOnlyCommand("docker run alpine").accepted());
  EXPECT_FALSE(ValidateReadOnlyCommand("pip install requests").accepted());

  result = ValidateReadOnlyCommand("sqlite3 db.sqlite 'drop table t'");
  ASSERT_FALSE(result.accepted());
  EXPECT_THAT(result.reason(), HasSubstr("(none)"));
}

TEST(ReadOnlyValidatorTest, RejectsShellOperators) {
  ValidationResult result = ValidateReadOnlyCommand("echo hi > /tmp/out");
  ASSERT_FALSE(result.accepted());
  EXPECT_THAT(result.reason(), HasSubstr("Redirect operators"));
  EXPECT_THAT(result.fragment(), StrEq("echo hi > /tmp/out"));

  EXPECT_THAT(ValidateReadOnlyCommand("cat < /etc/passwd").reason(),
              HasSubstr("Redirect operators"));
  EXPECT_THAT(ValidateReadOnlyCommand("echo $(rm -rf /)").reason(),
              HasSubstr("Command substitution"));
  EXPECT_THAT(ValidateReadOnlyCommand("echo `id`").reason(),
              HasSubstr("Command substitution"));
  EXPECT_THAT(ValidateReadOnlyCommand("sleep 100 &").reason(),
              HasSubstr("Background execution"));
  EXPECT_THAT(ValidateReadOnlyCommand("ls && sleep 1 & ls").reason(),
              HasSubstr("Background execution"));
}

TEST(SystemPathValidatorTest, RejectsDestructiveCommandsOnSystemPaths) {
  ValidationResult result = ValidateSystemPathCommand("rm -rf /");
  ASSERT_FALSE(result.accepted());
  EXPECT_THAT(result.fragment(), StrEq("rm -rf /"));
  EXPECT_THAT(result.reason(), HasSubstr("Cannot modify system path: /."));

  result = ValidateSystemPathCommand("rm -rf /usr/bin/python3");
  ASSERT_FALSE(result.accepted());
  EXPECT_THAT(result.reason(), HasSubstr("System path /usr/bin is protected"));

  EXPECT_FALSE(ValidateSystemPathCommand("chmod 777 /etc/passwd").accepted());
  EXPECT_FALSE(ValidateSystemPathCommand("mv /lib/libc.so /x").accepted());
  EXPECT_FALSE(
      ValidateSystemPathCommand("dd if=/dev/zero of=/dev/sda").accepted());
  EXPECT_FALSE(ValidateSystemPathCommand("mkfs.ext4 /dev/sdb1").accepted());
  EXPECT_FALSE(ValidateSystemPathCommand("sudo rm -rf /usr").accepted());
  EXPECT_FALSE(ValidateSystemPathCommand("/bin/rm -f /etc/hosts").accepted());
  EXPECT_FALSE(
      ValidateSystemPathCommand("cd /workspace && rm -rf /tmp").accepted());
  EXPECT_FALSE(
      ValidateSystemPathCommand("rm -rf /workspace/../usr/lib").accepted());
  EXPECT_FALSE(ValidateSystemPathCommand("rm -rf '/etc'").accepted());
}

TEST(SystemPathValidatorTest, AcceptsEverythingElse) {
  EXPECT_TRUE(ValidateSystemPathCommand("apk add python3").accepted());
  EXPECT_TRUE(
      ValidateSystemPathCommand("rm -rf /usr/local/oldtool").accepted());
  EXPECT_TRUE(ValidateSystemPathCommand("rm -rf /workspace/build").accepted());
  EXPECT_TRUE(ValidateSystemPathCommand("rm -rf /root/.cache").accepted());
  EXPECT_TRUE(ValidateSystemPathCommand("ls /etc && cat /etc/os-release")
                  .accepted());
  EXPECT_TRUE(ValidateSystemPathCommand("echo hi > /tmp/out").accepted());
  EXPECT_TRUE(ValidateSystemPathCommand("rm -rf build").accepted());
  EXPECT_TRUE(ValidateSystemPathCommand("rm /etcetera/file").accepted());
}

TEST(ValidateCommandTest, DispatchesOnPolicy) {
  EXPECT_TRUE(
      ValidateCommand(CommandPolicy::kUnrestricted, "rm -rf /").accepted());
  EXPECT_FALSE(
      ValidateCommand(CommandPolicy::kReadOnly, "apk add git").accepted());
  EXPECT_TRUE(ValidateCommand(CommandPolicy::kProtectSystemPaths,
                              "apk add git")
                  .accepted());
  EXPECT_FALSE(ValidateCommand(CommandPolicy::kProtectSystemPaths,
                               "rm -rf /")
                   .accepted());
  EXPECT_THAT(CommandPolicyName(CommandPolicy::kReadOnly), StrEq("readonly"));
}

TEST(ValidationResultTest, ToStatus) {
  EXPECT_THAT(ValidationResult::Accept().ToStatus(), IsOk());
  EXPECT_THAT(ValidationResult::Reject("rm x", "nope").ToStatus(),
              StatusIs(absl::StatusCode::kPermissionDenied, "nope"));
}

}  // namespace
}  // namespace prootbox
