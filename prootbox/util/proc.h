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

// Helpers for spawning processes and inspecting /proc.

#ifndef PROOTBOX_UTIL_PROC_H_
#define PROOTBOX_UTIL_PROC_H_

#include <sys/types.h>

#include <string>
#include <vector>

namespace prootbox::util {

// A nullptr-terminated char* array (like argv or environ) backed by a single
// owned buffer.
class CharPtrArray {
 public:
  explicit CharPtrArray(const std::vector<std::string>& vec);

  CharPtrArray(const CharPtrArray&) = delete;
  CharPtrArray& operator=(const CharPtrArray&) = delete;

  char* const* data() const { return const_cast<char* const*>(array_.data()); }
  size_t size() const { return array_.size() - 1; }

 private:
  std::string content_;
  std::vector<const char*> array_;
};

// Returns the argument vector of a process, read from /proc/<pid>/cmdline.
// Returns an empty vector if the process is gone or inaccessible.
std::vector<std::string> GetCmdLineArgs(pid_t pid);

// Returns the value of a field (e.g. "PPid") from /proc/<pid>/status, or an
// empty string.
std::string GetProcStatusLine(pid_t pid, const std::string& value);

// Returns the pids of all processes visible in /proc.
std::vector<pid_t> ListProcessIds();

// Returns true if /proc/<pid> exists.
bool ProcessEntryExists(pid_t pid);

}  // namespace prootbox::util

#endif  // PROOTBOX_UTIL_PROC_H_
