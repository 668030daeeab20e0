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

#include "prootbox/util/file_helpers.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "prootbox/util/fileops.h"

namespace prootbox::file {

using file_util::fileops::FDCloser;

absl::Status GetContents(absl::string_view path, std::string* output) {
  const std::string name(path);
  FDCloser fd(open(name.c_str(), O_RDONLY | O_CLOEXEC));
  if (fd.get() == -1) {
    return absl::ErrnoToStatus(errno, absl::StrCat("open(", path, ")"));
  }
  std::string contents;
  char buffer[8192];
  for (;;) {
    ssize_t n = TEMP_FAILURE_RETRY(read(fd.get(), buffer, sizeof(buffer)));
    if (n < 0) {
      return absl::ErrnoToStatus(errno, absl::StrCat("read(", path, ")"));
    }
    if (n == 0) {
      break;
    }
    contents.append(buffer, n);
  }
  *output = std::move(contents);
  return absl::OkStatus();
}

absl::Status SetContents(absl::string_view path, absl::string_view content,
                         mode_t mode) {
  const std::string name(path);
  FDCloser fd(
      open(name.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode));
  if (fd.get() == -1) {
    return absl::ErrnoToStatus(errno, absl::StrCat("open(", path, ")"));
  }
  if (!file_util::fileops::WriteToFD(fd.get(), content.data(),
                                     content.size())) {
    return absl::ErrnoToStatus(errno, absl::StrCat("write(", path, ")"));
  }
  if (!fd.Close()) {
    return absl::ErrnoToStatus(errno, absl::StrCat("close(", path, ")"));
  }
  return absl::OkStatus();
}

}  // namespace prootbox::file
