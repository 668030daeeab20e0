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

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "prootbox/util/fileops.h"
#include "prootbox/util/path.h"

namespace prootbox {
namespace {

// Tracks quoting one character at a time.
class QuoteState {
 public:
  // Consumes c. Returns true if c is neither quoted nor escaped and may
  // therefore act as a shell operator.
  bool Feed(char c) {
    if (escaped_) {
      escaped_ = false;
      return false;
    }
    if (quote_ == '\'') {
      if (c == '\'') {
        quote_ = 0;
      }
      return false;
    }
    if (quote_ == '"') {
      if (c == '\\') {
        escaped_ = true;
      } else if (c == '"') {
        quote_ = 0;
      }
      return false;
    }
    if (c == '\\') {
      escaped_ = true;
      return false;
    }
    if (c == '\'' || c == '"') {
      quote_ = c;
      return false;
    }
    return true;
  }

 private:
  char quote_ = 0;
  bool escaped_ = false;
};

void FlushPart(std::string* current, std::vector<std::string>* parts) {
  absl::string_view trimmed = absl::StripAsciiWhitespace(*current);
  if (!trimmed.empty()) {
    parts->emplace_back(trimmed);
  }
  current->clear();
}

const absl::flat_hash_set<absl::string_view>& ReadOnlyCommands() {
  static const auto* const kCommands = new absl::flat_hash_set<
      absl::string_view>({
      // Files and text.
      "ls", "cat", "head", "tail", "less", "more", "file", "stat", "readlink",
      "grep", "egrep", "fgrep", "awk", "sed", "tr", "cut", "sort", "uniq",
      "wc", "strings", "xxd", "hexdump", "od",
      // Search.
      "find", "locate", "which", "whereis",
      // System information.
      "pwd", "whoami", "id", "date", "uname", "hostname", "uptime", "env",
      "printenv", "getprop",
      // Shell helpers.
      "echo", "printf", "test", "[", "[[", "seq", "yes", "true", "false",
      "sleep",
      // Network diagnostics.
      "ping", "curl", "wget", "nslookup", "dig", "host",
      // Archive listing.
      "tar", "gzip", "gunzip", "zcat", "bzcat", "xzcat", "zipinfo", "unzip",
      "jar", "ar",
      // Processes and devices.
      "ps", "top", "df", "du", "free", "mount", "lsmod", "lsusb", "lspci",
  });
  return *kCommands;
}

struct RestrictedCommand {
  absl::string_view name;
  bool requires_subcommand;
  std::vector<absl::string_view> subcommands;
};

const std::vector<RestrictedCommand>& RestrictedCommands() {
  static const auto* const kCommands = new std::vector<RestrictedCommand>{
      {"git",
       true,
       {"status", "log", "diff", "show", "branch", "remote", "config",
        "ls-files", "ls-tree", "rev-parse", "describe", "tag", "stash",
        "blame", "grep", "cat-file", "for-each-ref", "verify-commit",
        "verify-tag"}},
      {"docker",
       false,
       {"ps", "images", "inspect", "logs", "top", "stats", "version", "info"}},
      {"kubectl",
       false,
       {"get", "describe", "logs", "top", "version", "cluster-info"}},
      {"npm", false, {"list", "view", "search", "config", "version"}},
      {"pip", false, {"list", "show", "search", "freeze", "config"}},
      {"gradle",
       false,
       {"tasks", "dependencies", "projects", "properties", "wrapper"}},
      {"mvn", false, {"help", "dependency:tree", "dependency:list"}},
      {"adb", false, {"devices", "version", "help", "shell"}},
      {"sqlite3", false, {}},
  };
  return *kCommands;
}

const RestrictedCommand* FindRestrictedCommand(absl::string_view name) {
  for (const RestrictedCommand& command : RestrictedCommands()) {
    if (command.name == name) {
      return &command;
    }
  }
  return nullptr;
}

// Returns true if the text contains an "&" that is not part of "&&".
bool HasBackgroundOperator(absl::string_view command) {
  for (size_t i = 0; i < command.size(); ++i) {
    if (command[i] != '&') {
      continue;
    }
    const bool prev_amp = i > 0 && command[i - 1] == '&';
    const bool next_amp = i + 1 < command.size() && command[i + 1] == '&';
    if (!prev_amp && !next_amp) {
      return true;
    }
  }
  return false;
}

ValidationResult ValidateReadOnlySimpleCommand(const ParsedCommand& parsed) {
  if (parsed.base_command.empty() ||
      ReadOnlyCommands().contains(parsed.base_command)) {
    return ValidationResult::Accept();
  }
  const RestrictedCommand* restricted =
      FindRestrictedCommand(parsed.base_command);
  if (restricted == nullptr) {
    return ValidationResult::Reject(
        parsed.text,
        absl::StrCat("Command '", parsed.base_command,
                     "' is not in the readonly whitelist. Allowed commands "
                     "include: ls, cat, grep, find, git (status/log/diff "
                     "only), etc."));
  }
  const std::string allowed =
      restricted->subcommands.empty()
          ? "(none)"
          : absl::StrJoin(restricted->subcommands, ", ");
  if (parsed.subcommand.empty()) {
    if (restricted->requires_subcommand) {
      return ValidationResult::Reject(
          parsed.text, absl::StrCat("'", restricted->name,
                                    "' requires a subcommand. Allowed: ",
                                    allowed));
    }
    return ValidationResult::Accept();
  }
  if (std::find(restricted->subcommands.begin(), restricted->subcommands.end(),
                parsed.subcommand) != restricted->subcommands.end()) {
    return ValidationResult::Accept();
  }
  return ValidationResult::Reject(
      parsed.text,
      absl::StrCat("'", restricted->name, " ", parsed.subcommand,
                   "' is not allowed. Allowed ", restricted->name,
                   " subcommands: ", allowed));
}

bool IsDestructiveCommand(absl::string_view word) {
  static const auto* const kCommands = new absl::flat_hash_set<
      absl::string_view>({"rm", "rmdir", "unlink", "shred", "mv", "dd",
                          "fdisk", "sfdisk", "parted", "chmod", "chown",
                          "chgrp"});
  const std::string name = file_util::fileops::Basename(word);
  return kCommands->contains(name) || absl::StartsWith(name, "mkfs");
}

bool IsPathChar(char c) {
  return absl::ascii_isalnum(c) || c == '.' || c == '_' || c == '/' ||
         c == '-';
}

// Collects absolute paths from a word: the whole word if it starts with "/",
// and the value part of forms like "of=/dev/sda" or "--dir:/etc".
std::vector<std::string> AbsolutePathsIn(absl::string_view word) {
  std::vector<std::string> paths;
  for (size_t i = 0; i < word.size(); ++i) {
    if (word[i] != '/' || (i > 0 && word[i - 1] != '=' && word[i - 1] != ':')) {
      continue;
    }
    size_t end = i + 1;
    while (end < word.size() && IsPathChar(word[end])) {
      ++end;
    }
    paths.emplace_back(word.substr(i, end - i));
    i = end;
  }
  return paths;
}

// Returns the protected path covering path, or an empty view.
absl::string_view ProtectedPathFor(absl::string_view path) {
  // Protected together with everything below them.
  static constexpr absl::string_view kProtectedTrees[] = {
      "/bin", "/sbin",  "/usr/bin", "/usr/sbin", "/lib", "/lib64", "/usr/lib",
      "/usr/lib64", "/etc", "/dev", "/proc", "/sys", "/run", "/tmp",
  };
  // Protected themselves; their other children stay writable.
  static constexpr absl::string_view kProtectedRoots[] = {"/", "/usr"};

  const std::string clean = file::CleanPath(path);
  for (absl::string_view root : kProtectedRoots) {
    if (clean == root) {
      return root;
    }
  }
  for (absl::string_view tree : kProtectedTrees) {
    if (file::IsSameOrNestedUnder(clean, tree)) {
      return tree;
    }
  }
  return {};
}

}  // namespace

ValidationResult ValidationResult::Reject(absl::string_view fragment,
                                          absl::string_view reason) {
  ValidationResult result;
  result.accepted_ = false;
  result.fragment_ = std::string(fragment);
  result.reason_ = std::string(reason);
  return result;
}

absl::Status ValidationResult::ToStatus() const {
  if (accepted_) {
    return absl::OkStatus();
  }
  return absl::PermissionDeniedError(reason_);
}

namespace shell {

std::vector<std::string> SplitCommandList(absl::string_view command) {
  std::vector<std::string> parts;
  std::string current;
  QuoteState state;
  for (size_t i = 0; i < command.size(); ++i) {
    const char c = command[i];
    if (state.Feed(c)) {
      if (c == ';' || c == '\n') {
        FlushPart(&current, &parts);
        continue;
      }
      if ((c == '&' || c == '|') && i + 1 < command.size() &&
          command[i + 1] == c) {
        FlushPart(&current, &parts);
        ++i;
        continue;
      }
    }
    current.push_back(c);
  }
  FlushPart(&current, &parts);
  return parts;
}

std::vector<std::string> SplitPipeline(absl::string_view command) {
  std::vector<std::string> parts;
  std::string current;
  QuoteState state;
  for (char c : command) {
    if (state.Feed(c) && c == '|') {
      FlushPart(&current, &parts);
      continue;
    }
    current.push_back(c);
  }
  FlushPart(&current, &parts);
  return parts;
}

std::vector<std::string> Tokenize(absl::string_view command) {
  std::vector<std::string> tokens;
  std::string current;
  bool in_token = false;
  bool escaped = false;
  char quote = 0;
  for (char c : command) {
    if (escaped) {
      current.push_back(c);
      escaped = false;
    } else if (quote == '\'') {
      if (c == '\'') {
        quote = 0;
      } else {
        current.push_back(c);
      }
    } else if (quote == '"') {
      if (c == '\\') {
        escaped = true;
      } else if (c == '"') {
        quote = 0;
      } else {
        current.push_back(c);
      }
    } else if (c == '\\') {
      escaped = true;
      in_token = true;
    } else if (c == '\'' || c == '"') {
      quote = c;
      in_token = true;
    } else if (absl::ascii_isspace(c)) {
      if (in_token) {
        tokens.push_back(std::move(current));
        current.clear();
        in_token = false;
      }
    } else {
      current.push_back(c);
      in_token = true;
    }
  }
  if (in_token) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

bool IsAssignment(absl::string_view word) {
  const size_t equals = word.find('=');
  if (equals == absl::string_view::npos || equals == 0) {
    return false;
  }
  if (!absl::ascii_isalpha(word[0]) && word[0] != '_') {
    return false;
  }
  return std::all_of(word.begin(), word.begin() + equals, [](char c) {
    return absl::ascii_isalnum(c) || c == '_';
  });
}

ParsedCommand ParseCommand(absl::string_view command) {
  ParsedCommand parsed;
  parsed.text = std::string(absl::StripAsciiWhitespace(command));
  std::vector<std::string> tokens = Tokenize(command);
  auto it = tokens.begin();
  while (it != tokens.end() && IsAssignment(*it)) {
    ++it;
  }
  if (it == tokens.end()) {
    return parsed;
  }
  parsed.base_command = *it;
  parsed.arguments.assign(it + 1, tokens.end());
  for (const std::string& argument : parsed.arguments) {
    if (!absl::StartsWith(argument, "-")) {
      parsed.subcommand = argument;
      break;
    }
  }
  return parsed;
}

}  // namespace shell

ValidationResult ValidateReadOnlyCommand(absl::string_view command) {
  if (absl::StrContains(command, '>') || absl::StrContains(command, '<')) {
    return ValidationResult::Reject(
        command,
        "Redirect operators (>, >>, <) are not allowed in readonly mode");
  }
  if (absl::StrContains(command, "$(") || absl::StrContains(command, '`')) {
    return ValidationResult::Reject(
        command,
        "Command substitution ($() or ``) is not allowed in readonly mode");
  }
  if (HasBackgroundOperator(command)) {
    return ValidationResult::Reject(command,
                                    "Background execution (&) is not allowed");
  }
  for (const std::string& element : shell::SplitCommandList(command)) {
    for (const std::string& stage : shell::SplitPipeline(element)) {
      ValidationResult result =
          ValidateReadOnlySimpleCommand(shell::ParseCommand(stage));
      if (!result.accepted()) {
        return result;
      }
    }
  }
  return ValidationResult::Accept();
}

ValidationResult ValidateSystemPathCommand(absl::string_view command) {
  for (const std::string& element : shell::SplitCommandList(command)) {
    for (const std::string& stage : shell::SplitPipeline(element)) {
      std::vector<std::string> words = shell::Tokenize(stage);
      if (std::none_of(words.begin(), words.end(), IsDestructiveCommand)) {
        continue;
      }
      for (const std::string& word : words) {
        if (IsDestructiveCommand(word)) {
          continue;
        }
        for (const std::string& path : AbsolutePathsIn(word)) {
          absl::string_view protected_path = ProtectedPathFor(path);
          if (protected_path.empty()) {
            continue;
          }
          return ValidationResult::Reject(
              stage,
              absl::StrCat("Cannot modify system path: ", path,
                           ". System path ", protected_path,
                           " is protected for system stability. You can "
                           "delete user-installed tools in /usr/local "
                           "(python, node, go, rust, etc.)"));
        }
      }
    }
  }
  return ValidationResult::Accept();
}

ValidationResult ValidateCommand(CommandPolicy policy,
                                 absl::string_view command) {
  switch (policy) {
    case CommandPolicy::kReadOnly:
      return ValidateReadOnlyCommand(command);
    case CommandPolicy::kProtectSystemPaths:
      return ValidateSystemPathCommand(command);
    case CommandPolicy::kUnrestricted:
      break;
  }
  return ValidationResult::Accept();
}

absl::string_view CommandPolicyName(CommandPolicy policy) {
  switch (policy) {
    case CommandPolicy::kUnrestricted:
      return "unrestricted";
    case CommandPolicy::kReadOnly:
      return "readonly";
    case CommandPolicy::kProtectSystemPaths:
      return "protect-system-paths";
  }
  return "unknown";
}

}  // namespace prootbox
