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

#include "prootbox/assets.h"

#include <fcntl.h>
#include <sys/utsname.h>

#include <cerrno>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "prootbox/util/fileops.h"
#include "prootbox/util/path.h"

namespace prootbox {
namespace {

constexpr absl::string_view kAlpineRelease = "3.19.0";

}  // namespace

absl::StatusOr<HostArchitecture> ResolveArchitecture(
    absl::string_view machine) {
  if (machine == "aarch64" || machine == "arm64") {
    return HostArchitecture{"aarch64", "aarch64"};
  }
  if (absl::StartsWith(machine, "armv7") ||
      absl::StartsWith(machine, "armv8l")) {
    return HostArchitecture{"armv7a", "armhf"};
  }
  if (machine == "x86_64" || machine == "amd64") {
    return HostArchitecture{"x86_64", "x86_64"};
  }
  if (machine == "i386" || machine == "i486" || machine == "i586" ||
      machine == "i686" || machine == "x86") {
    return HostArchitecture{"i686", "x86"};
  }
  return absl::UnimplementedError(
      absl::StrCat("Unsupported architecture: ", machine));
}

absl::StatusOr<HostArchitecture> DetectHostArchitecture() {
  struct utsname name;
  if (uname(&name) == -1) {
    return absl::ErrnoToStatus(errno, "uname()");
  }
  return ResolveArchitecture(name.machine);
}

std::string HelperAssetName(const HostArchitecture& arch) {
  return absl::StrCat("proot/proot-", arch.helper_arch);
}

std::vector<std::string> RootfsAssetCandidates(const HostArchitecture& arch) {
  const std::string versioned = absl::StrCat(
      "rootfs/alpine-minirootfs-", kAlpineRelease, "-", arch.rootfs_arch);
  return {
      absl::StrCat(versioned, ".tar.gz"),
      absl::StrCat(versioned, ".tar"),
      "alpine/alpine-rootfs.tar",
      "rootfs/alpine-rootfs.tar.gz",
  };
}

absl::StatusOr<file_util::fileops::FDCloser> DirectoryAssetProvider::Open(
    absl::string_view name) {
  const std::string path = file::JoinPath(root_, name);
  file_util::fileops::FDCloser fd(open(path.c_str(), O_RDONLY | O_CLOEXEC));
  if (fd.get() == -1) {
    if (errno == ENOENT) {
      return absl::NotFoundError(absl::StrCat("Asset not found: ", name));
    }
    return absl::ErrnoToStatus(errno, absl::StrCat("open(", path, ")"));
  }
  return fd;
}

}  // namespace prootbox
