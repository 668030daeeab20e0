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

#ifndef PROOTBOX_LAYOUT_H_
#define PROOTBOX_LAYOUT_H_

#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace prootbox {

// On-disk layout below the base directory. Changing it requires bumping the
// rootfs version.
//
//   <base>/proot/proot                   confinement helper
//   <base>/rootfs/                       read-only root filesystem
//   <base>/rootfs/rootfs_version.txt     version marker
//   <base>/container/work/               scratch work directory
//   <base>/container/upper/{usr/local,usr/lib,root}/
//   <base>/cache/                        helper temporary files
//   <base>/sandboxes/<id>/               per-sandbox workspace
//   <base>/sandboxes/<id>/logs/          background process logs
class ContainerLayout {
 public:
  explicit ContainerLayout(std::string base_dir);

  const std::string& base_dir() const { return base_dir_; }
  std::string helper_dir() const;
  std::string helper_path() const;
  std::string rootfs_dir() const;
  std::string rootfs_version_file() const;
  std::string container_dir() const;
  std::string work_dir() const;
  std::string upper_dir() const;
  std::string upper_local_dir() const;
  std::string upper_lib_dir() const;
  std::string upper_home_dir() const;
  std::string cache_dir() const;
  std::string sandboxes_dir() const;
  std::string sandbox_dir(absl::string_view sandbox_id) const;
  std::string sandbox_log_dir(absl::string_view sandbox_id) const;

 private:
  std::string base_dir_;
};

// Sandbox identities name directories: they must be non-empty, must not
// contain "/" and must not be "." or "..".
absl::Status ValidateSandboxId(absl::string_view sandbox_id);

}  // namespace prootbox

#endif  // PROOTBOX_LAYOUT_H_
