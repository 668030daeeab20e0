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

#include "prootbox/util/proc.h"

#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include "prootbox/util/file_helpers.h"
#include "prootbox/util/fileops.h"
#include "prootbox/util/path.h"

namespace prootbox::util {

CharPtrArray::CharPtrArray(const std::vector<std::string>& vec)
    : content_(absl::StrJoin(vec, absl::string_view("\0", 1))) {
  array_.reserve(vec.size() + 1);
  size_t offset = 0;
  for (const std::string& str : vec) {
    array_.push_back(content_.c_str() + offset);
    offset += str.size() + 1;
  }
  array_.push_back(nullptr);
}

std::vector<std::string> GetCmdLineArgs(pid_t pid) {
  std::string cmdline;
  if (!file::GetContents(file::JoinPath("/proc", absl::StrCat(pid), "cmdline"),
                         &cmdline)
           .ok()) {
    return {};
  }
  const absl::string_view args =
      absl::StripSuffix(cmdline, absl::string_view("\0", 1));
  if (args.empty()) {
    return {};
  }
  return absl::StrSplit(args, absl::string_view("\0", 1));
}

std::string GetProcStatusLine(pid_t pid, const std::string& value) {
  std::string contents;
  if (!file::GetContents(file::JoinPath("/proc", absl::StrCat(pid), "status"),
                         &contents)
           .ok()) {
    return "";
  }
  for (absl::string_view line : absl::StrSplit(contents, '\n')) {
    std::pair<absl::string_view, absl::string_view> kv =
        absl::StrSplit(line, absl::MaxSplits(':', 1));
    if (kv.first == value) {
      return std::string(absl::StripAsciiWhitespace(kv.second));
    }
  }
  VLOG(2) << "No '" << value << "' field for pid " << pid;
  return "";
}

std::vector<pid_t> ListProcessIds() {
  std::vector<std::string> entries;
  std::string error;
  if (!file_util::fileops::ListDirectoryEntries("/proc", &entries, &error)) {
    LOG(WARNING) << error;
    return {};
  }
  std::vector<pid_t> pids;
  for (const std::string& entry : entries) {
    int pid;
    if (absl::SimpleAtoi(entry, &pid) && pid > 0) {
      pids.push_back(pid);
    }
  }
  return pids;
}

bool ProcessEntryExists(pid_t pid) {
  return pid > 0 && file_util::fileops::Exists(
                        file::JoinPath("/proc", absl::StrCat(pid)), false);
}

}  // namespace prootbox::util
