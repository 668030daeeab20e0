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

#ifndef PROOTBOX_UTIL_FILEOPS_H_
#define PROOTBOX_UTIL_FILEOPS_H_

#include <sys/types.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/string_view.h"

namespace prootbox::file_util::fileops {

// RAII helper class to automatically close file descriptors.
class FDCloser {
 public:
  explicit FDCloser(int fd = kInvalidFd) : fd_{fd} {}
  FDCloser(const FDCloser&) = delete;
  FDCloser& operator=(const FDCloser&) = delete;
  FDCloser(FDCloser&& other) : fd_(other.Release()) {}
  FDCloser& operator=(FDCloser&& other) {
    Swap(other);
    other.Close();
    return *this;
  }
  ~FDCloser();

  int get() const { return fd_; }
  bool Close();
  void Swap(FDCloser& other) { std::swap(fd_, other.fd_); }
  int Release();

 private:
  static constexpr int kInvalidFd = -1;

  int fd_;
};

// Returns the last path component. A trailing slash yields an empty basename.
std::string Basename(absl::string_view path);

// Returns everything before the last slash, "/" for top-level entries and ""
// for bare names.
std::string StripBasename(absl::string_view path);

// Tests whether filename exists. With fully_resolve set, a dangling symlink
// counts as missing.
bool Exists(const std::string& filename, bool fully_resolve);

// Returns true if path is a directory (symlinks are followed).
bool IsDirectory(const std::string& path);

// Returns true if path is a directory containing at least one entry.
bool IsNonEmptyDirectory(const std::string& path);

// Fills entries with the basenames found in directory, without "." and "..".
// On failure returns false and describes the problem in error.
bool ListDirectoryEntries(const std::string& directory,
                          std::vector<std::string>* entries,
                          std::string* error);

// Creates path and all missing parents with the given mode. Succeeds if the
// directory already exists.
bool CreateDirectoryRecursively(const std::string& path, mode_t mode);

// Deletes the specified file or directory, including any sub-directories.
// Symlinks are removed, never followed.
bool DeleteRecursively(const std::string& filename);

// Returns the apparent size in bytes of all regular files below path. Entries
// that vanish or cannot be read are skipped.
int64_t DiskUsage(const std::string& path);

// Writes data to a blocking file descriptor. Returns true on success.
bool WriteToFD(int fd, const char* data, size_t size);

}  // namespace prootbox::file_util::fileops

#endif  // PROOTBOX_UTIL_FILEOPS_H_
