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

// Command-line front end of the container engine.
//
// Example usage:
//   prootbox_tool --prootbox_base_dir=/data/prootbox init
//   prootbox_tool exec demo 'uname -a'
//   prootbox_tool exec-readonly demo 'ls -la /workspace'
//   prootbox_tool bg demo 'python3 -m http.server'


#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/base/log_severity.h"
#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/globals.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "prootbox/assets.h"
#include "prootbox/command_validator.h"
#include "prootbox/container_manager.h"
#include "prootbox/execution_outcome.h"
#include "prootbox/flags.h"
#include "prootbox/process_supervisor.h"
#include "prootbox/util/fileops.h"
#include "prootbox/util/path.h"

namespace {

using ::prootbox::BackgroundProcessInfo;
using ::prootbox::BackgroundProcessSupervisor;
using ::prootbox::CommandPolicy;
using ::prootbox::ExecutionOutcome;
using ::prootbox::SandboxContainerManager;

int ReportStatus(const absl::Status& status) {
  if (!status.ok()) {
    absl::FPrintF(stderr, "%s\n", status.ToString());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}

int ReportOutcome(const ExecutionOutcome& outcome) {
  if (!outcome.stdout_text.empty()) {
    absl::PrintF("%s\n", outcome.stdout_text);
  }
  if (!outcome.stderr_text.empty()) {
    absl::FPrintF(stderr, "%s\n", outcome.stderr_text);
  }
  return outcome.exit_code >= 0 ? outcome.exit_code : EXIT_FAILURE;
}

int PrintStatus(const SandboxContainerManager& manager) {
  absl::PrintF("state:     %s\n", manager.state().ToString());
  absl::PrintF("installed: %s\n", manager.IsInstalled() ? "yes" : "no");
  absl::PrintF("base dir:  %s\n", manager.layout().base_dir());
  return EXIT_SUCCESS;
}

int Execute(SandboxContainerManager& manager, CommandPolicy policy,
            const std::vector<std::string>& args) {
  if (args.size() < 2) {
    absl::FPrintF(stderr, "Usage: exec <sandbox> <command...>\n");
    return EXIT_FAILURE;
  }
  prootbox::ForegroundOptions options;
  options.policy = policy;
  const std::string command = absl::StrJoin(args.begin() + 1, args.end(), " ");
  return ReportOutcome(manager.ExecuteForeground(args[0], command, options));
}

// Prints log lines of one stream past *offset and advances it.
void DrainLogs(const BackgroundProcessSupervisor& supervisor,
               const std::string& process_id, absl::string_view stream,
               int64_t* offset, FILE* out) {
  for (;;) {
    absl::StatusOr<prootbox::LogPage> page =
        supervisor.ReadLogs(process_id, stream, *offset);
    if (!page.ok()) {
      LOG(WARNING) << "Reading " << stream << " of " << process_id << ": "
                   << page.status();
      return;
    }
    for (const std::string& line : page->lines) {
      absl::FPrintF(out, "%s\n", line);
    }
    *offset += static_cast<int64_t>(page->lines.size());
    if (!page->has_more) {
      return;
    }
  }
}

int RunInBackground(BackgroundProcessSupervisor& supervisor,
                    const std::vector<std::string>& args) {
  if (args.size() < 2) {
    absl::FPrintF(stderr, "Usage: bg <sandbox> <command...>\n");
    return EXIT_FAILURE;
  }
  const std::string command = absl::StrJoin(args.begin() + 1, args.end(), " ");
  absl::StatusOr<BackgroundProcessInfo> info =
      supervisor.Start(args[0], command, "prootbox_tool");
  if (!info.ok()) {
    return ReportStatus(info.status());
  }
  absl::FPrintF(stderr, "Started %s\n", info->ToString());

  int64_t stdout_offset = 0;
  int64_t stderr_offset = 0;
  for (;;) {
    std::optional<BackgroundProcessInfo> current =
        supervisor.Get(info->process_id);
    const bool active = current.has_value() && current->is_active();
    DrainLogs(supervisor, info->process_id, "stdout", &stdout_offset, stdout);
    DrainLogs(supervisor, info->process_id, "stderr", &stderr_offset, stderr);
    if (!active) {
      if (current.has_value()) {
        absl::FPrintF(stderr, "Finished %s\n", current->ToString());
      }
      break;
    }
    absl::SleepFor(absl::Milliseconds(200));
  }
  return EXIT_SUCCESS;
}

int Validate(const std::vector<std::string>& args) {
  if (args.size() < 2) {
    absl::FPrintF(stderr, "Usage: validate <readonly|protected> <command...>\n");
    return EXIT_FAILURE;
  }
  CommandPolicy policy;
  if (args[0] == "readonly") {
    policy = CommandPolicy::kReadOnly;
  } else if (args[0] == "protected") {
    policy = CommandPolicy::kProtectSystemPaths;
  } else {
    absl::FPrintF(stderr, "Unknown policy: %s\n", args[0]);
    return EXIT_FAILURE;
  }
  const std::string command = absl::StrJoin(args.begin() + 1, args.end(), " ");
  prootbox::ValidationResult result =
      prootbox::ValidateCommand(policy, command);
  if (!result.accepted()) {
    absl::PrintF("rejected: %s\n  fragment: %s\n", result.reason(),
                 result.fragment());
    return EXIT_FAILURE;
  }
  absl::PrintF("accepted\n");
  return EXIT_SUCCESS;
}

int Cleanup(SandboxContainerManager& manager) {
  prootbox::CleanupResult result = manager.CleanupUpperLayer();
  for (const std::string& path : result.removed_paths) {
    absl::PrintF("removed %s\n", path);
  }
  absl::PrintF("freed %d bytes\n", result.freed_bytes);
  return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char* argv[]) {
  const std::string program_name =
      prootbox::file_util::fileops::Basename(argv[0]);
  absl::SetProgramUsageMessage(absl::StrFormat(
      "Runs commands inside a proot based Linux container.\n"
      "Usage: %1$s [OPTION] COMMAND [ARGS]...\n"
      "Commands: status, init, start, stop, destroy, exec, exec-readonly,\n"
      "          exec-protected, bg, validate, size, cleanup",
      program_name));

  std::vector<std::string> args;
  {
    const std::vector<char*> parsed_argv = absl::ParseCommandLine(argc, argv);
    args.assign(parsed_argv.begin() + 1, parsed_argv.end());
  }
  absl::SetStderrThreshold(absl::LogSeverityAtLeast::kWarning);
  absl::InitializeLog();

  if (args.empty()) {
    absl::FPrintF(stderr, "Missing command\n");
    return EXIT_FAILURE;
  }
  const std::string verb = args[0];
  args.erase(args.begin());

  if (verb == "validate") {
    return Validate(args);
  }

  prootbox::ContainerOptions options = prootbox::ContainerOptionsFromFlags();
  std::string asset_dir = absl::GetFlag(FLAGS_prootbox_asset_dir);
  if (asset_dir.empty()) {
    asset_dir = prootbox::file::JoinPath(options.base_dir, "assets");
  }
  SandboxContainerManager manager(
      std::move(options),
      std::make_unique<prootbox::DirectoryAssetProvider>(asset_dir));
  BackgroundProcessSupervisor supervisor(
      &manager, prootbox::SupervisorOptionsFromFlags());
  manager.AddObserver(&supervisor);

  if (absl::Status status = manager.RestoreState(); !status.ok()) {
    VLOG(1) << "Nothing to restore: " << status;
  }

  // A restored container comes back stopped; commands need it running.
  const bool runs_commands = verb == "exec" || verb == "exec-readonly" ||
                             verb == "exec-protected" || verb == "bg";
  if (runs_commands) {
    if (absl::Status status = manager.Start(); !status.ok()) {
      manager.RemoveObserver(&supervisor);
      return ReportStatus(status);
    }
  }

  int result = EXIT_FAILURE;
  if (verb == "status") {
    result = PrintStatus(manager);
  } else if (verb == "init") {
    result = ReportStatus(manager.Initialize());
  } else if (verb == "start") {
    result = ReportStatus(manager.Start());
  } else if (verb == "stop") {
    result = ReportStatus(manager.Stop());
  } else if (verb == "destroy") {
    result = ReportStatus(manager.Destroy());
  } else if (verb == "exec") {
    result = Execute(manager, CommandPolicy::kUnrestricted, args);
  } else if (verb == "exec-readonly") {
    result = Execute(manager, CommandPolicy::kReadOnly, args);
  } else if (verb == "exec-protected") {
    result = Execute(manager, CommandPolicy::kProtectSystemPaths, args);
  } else if (verb == "bg") {
    result = RunInBackground(supervisor, args);
  } else if (verb == "size") {
    absl::PrintF("%d\n", manager.GetContainerSize());
    result = EXIT_SUCCESS;
  } else if (verb == "cleanup") {
    result = Cleanup(manager);
  } else {
    absl::FPrintF(stderr, "Unknown command: %s\n", verb);
  }
  manager.RemoveObserver(&supervisor);
  return result;
}
