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

// Sources for the provisioning artifacts: the confinement helper binary and
// the root filesystem archive.

#ifndef PROOTBOX_ASSETS_H_
#define PROOTBOX_ASSETS_H_

#include <string>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "prootbox/util/fileops.h"

namespace prootbox {

// Architecture names as used by the helper binaries and the rootfs images.
struct HostArchitecture {
  std::string helper_arch;  // aarch64, armv7a, x86_64, i686
  std::string rootfs_arch;  // aarch64, armhf, x86_64, x86
};

// Maps a uname() machine string to the asset architecture names.
absl::StatusOr<HostArchitecture> ResolveArchitecture(absl::string_view machine);

// Resolves the architecture of the running host.
absl::StatusOr<HostArchitecture> DetectHostArchitecture();

// Asset name of the confinement helper, e.g. "proot/proot-x86_64".
std::string HelperAssetName(const HostArchitecture& arch);

// Rootfs archive asset names, most preferred first.
std::vector<std::string> RootfsAssetCandidates(const HostArchitecture& arch);

class AssetProvider {
 public:
  virtual ~AssetProvider() = default;

  // Opens an asset for reading. Returns NotFound if it does not exist.
  virtual absl::StatusOr<file_util::fileops::FDCloser> Open(
      absl::string_view name) = 0;
};

// Serves assets from files below a root directory.
class DirectoryAssetProvider : public AssetProvider {
 public:
  explicit DirectoryAssetProvider(std::string root) : root_(std::move(root)) {}

  absl::StatusOr<file_util::fileops::FDCloser> Open(
      absl::string_view name) override;

 private:
  std::string root_;
};

}  // namespace prootbox

#endif  // PROOTBOX_ASSETS_H_
