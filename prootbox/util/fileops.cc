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

#include "prootbox/util/fileops.h"

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <memory>

#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "prootbox/util/path.h"

namespace prootbox::file_util::fileops {

FDCloser::~FDCloser() { Close(); }

bool FDCloser::Close() {
  int fd = Release();
  if (fd == kInvalidFd) {
    return false;
  }
  return close(fd) == 0 || errno == EINTR;
}

int FDCloser::Release() {
  int ret = fd_;
  fd_ = kInvalidFd;
  return ret;
}

std::string Basename(absl::string_view path) {
  const auto last_slash = path.rfind('/');
  if (last_slash == absl::string_view::npos) {
    return std::string(path);
  }
  return std::string(path.substr(last_slash + 1));
}

std::string StripBasename(absl::string_view path) {
  const auto last_slash = path.rfind('/');
  if (last_slash == absl::string_view::npos) {
    return "";
  }
  return last_slash == 0 ? "/" : std::string(path.substr(0, last_slash));
}

bool Exists(const std::string& filename, bool fully_resolve) {
  struct stat st;
  return (fully_resolve ? stat(filename.c_str(), &st)
                        : lstat(filename.c_str(), &st)) == 0;
}

bool IsDirectory(const std::string& path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool IsNonEmptyDirectory(const std::string& path) {
  std::vector<std::string> entries;
  std::string error;
  return IsDirectory(path) && ListDirectoryEntries(path, &entries, &error) &&
         !entries.empty();
}

bool ListDirectoryEntries(const std::string& directory,
                          std::vector<std::string>* entries,
                          std::string* error) {
  std::unique_ptr<DIR, int (*)(DIR*)> dir{opendir(directory.c_str()),
                                          &closedir};
  if (!dir) {
    *error = absl::StrCat("opendir(", directory, "): ", strerror(errno));
    return false;
  }
  errno = 0;
  for (struct dirent* entry = readdir(dir.get()); entry != nullptr;
       entry = readdir(dir.get())) {
    absl::string_view name = entry->d_name;
    if (name != "." && name != "..") {
      entries->emplace_back(name);
    }
  }
  if (errno != 0) {
    *error = absl::StrCat("readdir(", directory, "): ", strerror(errno));
    return false;
  }
  return true;
}

bool CreateDirectoryRecursively(const std::string& path, mode_t mode) {
  if (path.empty()) {
    return false;
  }
  if (IsDirectory(path)) {
    return true;
  }
  const std::string parent = StripBasename(file::CleanPath(path));
  if (!parent.empty() && parent != "/" && !IsDirectory(parent) &&
      !CreateDirectoryRecursively(parent, mode)) {
    return false;
  }
  return mkdir(path.c_str(), mode) == 0 || errno == EEXIST;
}

bool DeleteRecursively(const std::string& filename) {
  struct stat st;
  if (lstat(filename.c_str(), &st) != 0) {
    return errno == ENOENT;
  }
  if (!S_ISDIR(st.st_mode)) {
    return unlink(filename.c_str()) == 0 || errno == ENOENT;
  }
  std::vector<std::string> entries;
  std::string error;
  if (!ListDirectoryEntries(filename, &entries, &error)) {
    // Directories without read permission can still be removed when empty.
    return rmdir(filename.c_str()) == 0;
  }
  bool ok = true;
  for (const auto& entry : entries) {
    ok = DeleteRecursively(file::JoinPath(filename, entry)) && ok;
  }
  return ok && (rmdir(filename.c_str()) == 0 || errno == ENOENT);
}

int64_t DiskUsage(const std::string& path) {
  struct stat st;
  if (lstat(path.c_str(), &st) != 0) {
    return 0;
  }
  if (S_ISREG(st.st_mode)) {
    return st.st_size;
  }
  if (!S_ISDIR(st.st_mode)) {
    return 0;
  }
  std::vector<std::string> entries;
  std::string error;
  if (!ListDirectoryEntries(path, &entries, &error)) {
    return 0;
  }
  int64_t total = 0;
  for (const auto& entry : entries) {
    total += DiskUsage(file::JoinPath(path, entry));
  }
  return total;
}

bool WriteToFD(int fd, const char* data, size_t size) {
  while (size > 0) {
    ssize_t result = TEMP_FAILURE_RETRY(write(fd, data, size));
    if (result <= 0) {
      return false;
    }
    size -= result;
    data += result;
  }
  return true;
}

}  // namespace prootbox::file_util::fileops
