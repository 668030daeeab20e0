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

// Extraction of tar and gzip-compressed tar streams onto disk.

#ifndef PROOTBOX_ARCHIVE_H_
#define PROOTBOX_ARCHIVE_H_

#include <cstdint>
#include <string>

#include "absl/status/statusor.h"

namespace prootbox {

struct ExtractionSummary {
  int64_t files = 0;
  int64_t directories = 0;
  int64_t symlinks = 0;
  // Entries of other types (hard links, devices, extended headers), entries
  // whose names escape the target directory and entries below a symlink or
  // other non-directory.
  int64_t skipped = 0;
};

// Materializes a tar archive below a target directory. The input may be
// gzip-compressed, which is detected from the 0x1f 0x8b magic bytes.
//
// Regular files keep the permission bits of their header (owner read/write is
// always added), directories are created as needed and symbolic links point
// at the literal target from the header. Names are interpreted relative to the
// target directory; ".." components that would leave it are skipped, as are
// entries whose parent already exists as a symlink or other non-directory.
class ArchiveExtractor {
 public:
  explicit ArchiveExtractor(std::string target_dir);

  ArchiveExtractor(const ArchiveExtractor&) = delete;
  ArchiveExtractor& operator=(const ArchiveExtractor&) = delete;

  // Reads the archive from fd until the end-of-archive marker or end of
  // input. A stream truncated inside an entry yields DataLoss.
  absl::StatusOr<ExtractionSummary> Extract(int fd);

 private:
  std::string target_dir_;
};

}  // namespace prootbox

#endif  // PROOTBOX_ARCHIVE_H_
