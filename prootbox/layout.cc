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

#include "prootbox/layout.h"

#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "prootbox/util/path.h"

namespace prootbox {

ContainerLayout::ContainerLayout(std::string base_dir)
    : base_dir_(std::move(base_dir)) {}

std::string ContainerLayout::helper_dir() const {
  return file::JoinPath(base_dir_, "proot");
}

std::string ContainerLayout::helper_path() const {
  return file::JoinPath(helper_dir(), "proot");
}

std::string ContainerLayout::rootfs_dir() const {
  return file::JoinPath(base_dir_, "rootfs");
}

std::string ContainerLayout::rootfs_version_file() const {
  return file::JoinPath(rootfs_dir(), "rootfs_version.txt");
}

std::string ContainerLayout::container_dir() const {
  return file::JoinPath(base_dir_, "container");
}

std::string ContainerLayout::work_dir() const {
  return file::JoinPath(container_dir(), "work");
}

std::string ContainerLayout::upper_dir() const {
  return file::JoinPath(container_dir(), "upper");
}

std::string ContainerLayout::upper_local_dir() const {
  return file::JoinPath(upper_dir(), "usr/local");
}

std::string ContainerLayout::upper_lib_dir() const {
  return file::JoinPath(upper_dir(), "usr/lib");
}

std::string ContainerLayout::upper_home_dir() const {
  return file::JoinPath(upper_dir(), "root");
}

std::string ContainerLayout::cache_dir() const {
  return file::JoinPath(base_dir_, "cache");
}

std::string ContainerLayout::sandboxes_dir() const {
  return file::JoinPath(base_dir_, "sandboxes");
}

std::string ContainerLayout::sandbox_dir(absl::string_view sandbox_id) const {
  return file::JoinPath(sandboxes_dir(), sandbox_id);
}

std::string ContainerLayout::sandbox_log_dir(
    absl::string_view sandbox_id) const {
  return file::JoinPath(sandbox_dir(sandbox_id), "logs");
}

absl::Status ValidateSandboxId(absl::string_view sandbox_id) {
  if (sandbox_id.empty() || sandbox_id == "." || sandbox_id == ".." ||
      absl::StrContains(sandbox_id, '/') ||
      absl::StrContains(sandbox_id, '\0')) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid sandbox id: '", sandbox_id, "'"));
  }
  return absl::OkStatus();
}

}  // namespace prootbox
