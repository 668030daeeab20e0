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

// Helpers shared by the prootbox tests.

#ifndef PROOTBOX_TESTING_H_
#define PROOTBOX_TESTING_H_

#include <sys/types.h>

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "prootbox/assets.h"

namespace prootbox {

// Returns a writable path usable in tests. If the name argument is specified,
// returns a name under that path.
std::string GetTestTempPath(absl::string_view name = {});

// Creates a fresh directory below GetTestTempPath().
absl::StatusOr<std::string> CreateTempDir(absl::string_view prefix);

// Builds an uncompressed ustar archive in memory.
class TarBuilder {
 public:
  TarBuilder& AddDirectory(absl::string_view name, mode_t mode = 0755);
  TarBuilder& AddFile(absl::string_view name, absl::string_view content,
                      mode_t mode = 0644);
  TarBuilder& AddSymlink(absl::string_view name, absl::string_view target);
  // Appends an entry with an arbitrary type flag and no data.
  TarBuilder& AddEntry(absl::string_view name, char type);

  // Returns the archive, terminated by two zero blocks.
  std::string Finish() const;

  // Returns the archive without its end-of-archive marker.
  const std::string& contents() const { return data_; }

 private:
  void AppendHeader(absl::string_view name, mode_t mode, size_t size,
                    char type, absl::string_view link_target);

  std::string data_;
};

// Compresses data into a single gzip member.
absl::StatusOr<std::string> GzipCompress(absl::string_view data);

// Writes an executable stand-in for the confinement helper. It drops every
// argument up to and including --link2symlink and execs the rest on the host.
absl::Status WriteFakeHelper(const std::string& path);

// Populates asset_dir with a helper (see WriteFakeHelper()) and a gzipped
// rootfs containing bin/sh, laid out the way DirectoryAssetProvider expects.
absl::Status ProvisionTestAssets(const std::string& asset_dir,
                                 const HostArchitecture& arch);

}  // namespace prootbox

#endif  // PROOTBOX_TESTING_H_
