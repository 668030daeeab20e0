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

// Static checks for shell command lines run in restricted modes.
//
// The checks work on the raw command text with a small quote-aware tokenizer.
// They are an allow-list over the common shell syntax, not a complete shell
// grammar, and must only be used to narrow what a command may do.

#ifndef PROOTBOX_COMMAND_VALIDATOR_H_
#define PROOTBOX_COMMAND_VALIDATOR_H_

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace prootbox {

enum class CommandPolicy {
  // No checks.
  kUnrestricted,
  // Only inspection commands: see ValidateReadOnlyCommand().
  kReadOnly,
  // Anything except destructive commands on system paths: see
  // ValidateSystemPathCommand().
  kProtectSystemPaths,
};

// One simple command after splitting on list and pipeline operators.
struct ParsedCommand {
  // The command text as it appeared, without surrounding whitespace.
  std::string text;
  // First word after leading VAR=value assignments. Empty if there is none.
  std::string base_command;
  // First argument that does not start with "-". Empty if there is none.
  std::string subcommand;
  // All words after the base command, with quotes removed.
  std::vector<std::string> arguments;
};

class ValidationResult {
 public:
  static ValidationResult Accept() { return ValidationResult(); }
  static ValidationResult Reject(absl::string_view fragment,
                                 absl::string_view reason);

  bool accepted() const { return accepted_; }
  // The part of the command that caused the rejection.
  const std::string& fragment() const { return fragment_; }
  // Human-readable explanation, including the allowed alternatives.
  const std::string& reason() const { return reason_; }

  // OK if accepted, PermissionDenied with the reason otherwise.
  absl::Status ToStatus() const;

 private:
  ValidationResult() = default;

  bool accepted_ = true;
  std::string fragment_;
  std::string reason_;
};

namespace shell {

// Splits on unquoted ";", "&&", "||" and newlines.
std::vector<std::string> SplitCommandList(absl::string_view command);

// Splits one list element on unquoted "|".
std::vector<std::string> SplitPipeline(absl::string_view command);

// Splits on unquoted whitespace and removes quoting. Backslash escapes the
// next character outside single quotes.
std::vector<std::string> Tokenize(absl::string_view command);

// Returns true for words of the form NAME=value.
bool IsAssignment(absl::string_view word);

// Tokenizes a simple command and drops leading assignments.
ParsedCommand ParseCommand(absl::string_view command);

}  // namespace shell

// Accepts a command only if it has no redirections, command substitutions or
// background jobs and every simple command in it is an inspection utility, or
// a tool whose subcommand is known to be read-only (e.g. "git status").
ValidationResult ValidateReadOnlyCommand(absl::string_view command);

// Rejects delete, move, format and permission-change commands that name a
// protected system path such as /bin, /etc or /usr/lib. /usr/local stays
// writable so that self-installed tools can be managed.
ValidationResult ValidateSystemPathCommand(absl::string_view command);

ValidationResult ValidateCommand(CommandPolicy policy,
                                 absl::string_view command);

absl::string_view CommandPolicyName(CommandPolicy policy);

}  // namespace prootbox

#endif  // PROOTBOX_COMMAND_VALIDATOR_H_
