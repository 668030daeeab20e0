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

#include "prootbox/testing.h"

#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "prootbox/assets.h"
#include "prootbox/util/file_helpers.h"
#include "prootbox/util/fileops.h"
#include "prootbox/util/path.h"
#include "prootbox/util/status_macros.h"
#include "zlib.h"

namespace prootbox {

namespace {

constexpr size_t kBlockSize = 512;

void WriteOctal(char* field, size_t width, uint64_t value) {
  // width includes the terminating NUL.
  std::string text = absl::StrFormat("%0*o", static_cast<int>(width - 1),
                                     value);
  memcpy(field, text.data(), std::min(text.size(), width - 1));
}

void PadToBlock(std::string* data) {
  if (size_t rem = data->size() % kBlockSize; rem != 0) {
    data->append(kBlockSize - rem, '\0');
  }
}

}  // namespace

std::string GetTestTempPath(absl::string_view name) {
  const char* test_tmpdir = getenv("TEST_TMPDIR");
  return file::JoinPath(test_tmpdir ? test_tmpdir : "/tmp", name);
}

absl::StatusOr<std::string> CreateTempDir(absl::string_view prefix) {
  const std::string root = GetTestTempPath();
  if (!file_util::fileops::CreateDirectoryRecursively(root, 0700)) {
    return absl::ErrnoToStatus(errno, absl::StrCat("mkdir ", root));
  }
  std::string pattern = file::JoinPath(root, absl::StrCat(prefix, "XXXXXX"));
  if (mkdtemp(pattern.data()) == nullptr) {
    return absl::ErrnoToStatus(errno, absl::StrCat("mkdtemp ", pattern));
  }
  return pattern;
}

void TarBuilder::AppendHeader(absl::string_view name, mode_t mode,
                              size_t size, char type,
                              absl::string_view link_target) {
  char header[kBlockSize] = {};
  absl::string_view prefix;
  if (name.size() > 100) {
    const size_t split = name.rfind('/', 155);
    prefix = name.substr(0, split);
    name = name.substr(split + 1);
  }
  memcpy(header, name.data(), std::min<size_t>(name.size(), 100));
  WriteOctal(header + 100, 8, mode & 07777);
  WriteOctal(header + 108, 8, 0);
  WriteOctal(header + 116, 8, 0);
  WriteOctal(header + 124, 12, size);
  WriteOctal(header + 136, 12, 0);
  memset(header + 148, ' ', 8);
  header[156] = type;
  memcpy(header + 157, link_target.data(),
         std::min<size_t>(link_target.size(), 100));
  memcpy(header + 257, "ustar", 6);
  memcpy(header + 263, "00", 2);
  memcpy(header + 345, prefix.data(), std::min<size_t>(prefix.size(), 155));

  unsigned int checksum = 0;
  for (unsigned char c : header) {
    checksum += c;
  }
  std::string sum = absl::StrFormat("%06o", checksum);
  memcpy(header + 148, sum.data(), 6);
  header[154] = '\0';
  header[155] = ' ';
  data_.append(header, kBlockSize);
}

TarBuilder& TarBuilder::AddDirectory(absl::string_view name, mode_t mode) {
  AppendHeader(name, mode, 0, '5', "");
  return *this;
}

TarBuilder& TarBuilder::AddFile(absl::string_view name,
                                absl::string_view content, mode_t mode) {
  AppendHeader(name, mode, content.size(), '0', "");
  data_.append(content.data(), content.size());
  PadToBlock(&data_);
  return *this;
}

TarBuilder& TarBuilder::AddSymlink(absl::string_view name,
                                   absl::string_view target) {
  AppendHeader(name, 0777, 0, '2', target);
  return *this;
}

TarBuilder& TarBuilder::AddEntry(absl::string_view name, char type) {
  AppendHeader(name, 0644, 0, type, "");
  return *this;
}

std::string TarBuilder::Finish() const {
  std::string archive = data_;
  archive.append(2 * kBlockSize, '\0');
  return archive;
}

absl::StatusOr<std::string> GzipCompress(absl::string_view data) {
  z_stream strm = {};
  // 16 + MAX_WBITS selects the gzip wrapper.
  if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS,
                   8, Z_DEFAULT_STRATEGY) != Z_OK) {
    return absl::InternalError("deflateInit2 failed");
  }
  std::string out;
  out.resize(deflateBound(&strm, data.size()));
  strm.next_in =
      reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  strm.avail_in = data.size();
  strm.next_out = reinterpret_cast<Bytef*>(out.data());
  strm.avail_out = out.size();
  const int ret = deflate(&strm, Z_FINISH);
  deflateEnd(&strm);
  if (ret != Z_STREAM_END) {
    return absl::InternalError(absl::StrCat("deflate failed: ", ret));
  }
  out.resize(strm.total_out);
  return out;
}

absl::Status WriteFakeHelper(const std::string& path) {
  static constexpr absl::string_view kScript =
      "#!/bin/sh\n"
      "while [ $# -gt 0 ]; do\n"
      "  if [ \"$1\" = \"--link2symlink\" ]; then\n"
      "    shift\n"
      "    exec \"$@\"\n"
      "  fi\n"
      "  shift\n"
      "done\n"
      "exit 127\n";
  return file::SetContents(path, kScript, 0755);
}

absl::Status ProvisionTestAssets(const std::string& asset_dir,
                                 const HostArchitecture& arch) {
  const std::string helper = file::JoinPath(asset_dir, HelperAssetName(arch));
  const std::string rootfs =
      file::JoinPath(asset_dir, "rootfs/alpine-rootfs.tar.gz");
  for (const std::string& dir : {file::JoinPath(asset_dir, "proot"),
                                 file::JoinPath(asset_dir, "rootfs")}) {
    if (!file_util::fileops::CreateDirectoryRecursively(dir, 0755)) {
      return absl::ErrnoToStatus(errno, absl::StrCat("mkdir ", dir));
    }
  }
  PROOTBOX_RETURN_IF_ERROR(WriteFakeHelper(helper));

  TarBuilder tar;
  tar.AddDirectory("bin")
      .AddFile("bin/sh", "#!/bin/true\n", 0755)
      .AddDirectory("etc")
      .AddFile("etc/os-release", "ID=alpine\nVERSION_ID=3.19.0\n")
      .AddSymlink("bin/ash", "sh");
  PROOTBOX_ASSIGN_OR_RETURN(std::string gzipped, GzipCompress(tar.Finish()));
  return file::SetContents(rootfs, gzipped);
}

}  // namespace prootbox
