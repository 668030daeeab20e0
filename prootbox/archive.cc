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

#include "prootbox/archive.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "prootbox/util/fileops.h"
#include "prootbox/util/path.h"
#include "prootbox/util/status_macros.h"
#include "zlib.h"

namespace prootbox {
namespace {

using file_util::fileops::FDCloser;

constexpr size_t kBlockSize = 512;
constexpr size_t kChunkSize = 64 * 1024;

// Header field offsets and lengths.
constexpr size_t kNameOffset = 0;
constexpr size_t kNameLength = 100;
constexpr size_t kModeOffset = 100;
constexpr size_t kModeLength = 8;
constexpr size_t kSizeOffset = 124;
constexpr size_t kSizeLength = 12;
constexpr size_t kTypeOffset = 156;
constexpr size_t kLinkNameOffset = 157;
constexpr size_t kLinkNameLength = 100;
constexpr size_t kMagicOffset = 257;
constexpr size_t kPrefixOffset = 345;
constexpr size_t kPrefixLength = 155;

using Block = std::array<char, kBlockSize>;

// Sequential byte stream. Read() returns 0 only at end of input.
class ByteSource {
 public:
  virtual ~ByteSource() = default;
  virtual absl::StatusOr<size_t> Read(char* buffer, size_t size) = 0;
};

class FdSource : public ByteSource {
 public:
  FdSource(int fd, std::string prefix) : fd_(fd), prefix_(std::move(prefix)) {}

  absl::StatusOr<size_t> Read(char* buffer, size_t size) override {
    if (!prefix_.empty()) {
      const size_t n = std::min(size, prefix_.size());
      memcpy(buffer, prefix_.data(), n);
      prefix_.erase(0, n);
      return n;
    }
    ssize_t n = TEMP_FAILURE_RETRY(read(fd_, buffer, size));
    if (n < 0) {
      return absl::ErrnoToStatus(errno, "read() archive");
    }
    return static_cast<size_t>(n);
  }

 private:
  int fd_;
  std::string prefix_;
};

class GzipSource : public ByteSource {
 public:
  explicit GzipSource(std::unique_ptr<ByteSource> input)
      : input_(std::move(input)), in_(new unsigned char[kChunkSize]) {}

  ~GzipSource() override {
    if (initialized_) {
      inflateEnd(&stream_);
    }
  }

  absl::Status Init() {
    // 16 + MAX_WBITS accepts the gzip wrapper only.
    if (inflateInit2(&stream_, 16 + MAX_WBITS) != Z_OK) {
      return absl::InternalError("inflateInit2() failed");
    }
    initialized_ = true;
    return absl::OkStatus();
  }

  absl::StatusOr<size_t> Read(char* buffer, size_t size) override {
    stream_.next_out = reinterpret_cast<unsigned char*>(buffer);
    stream_.avail_out = static_cast<uInt>(size);
    while (stream_.avail_out == size && !finished_) {
      if (stream_.avail_in == 0) {
        PROOTBOX_ASSIGN_OR_RETURN(
            size_t n, input_->Read(reinterpret_cast<char*>(in_.get()),
                                   kChunkSize));
        if (n == 0) {
          return absl::DataLossError("Truncated gzip stream");
        }
        stream_.next_in = in_.get();
        stream_.avail_in = static_cast<uInt>(n);
      }
      int ret = inflate(&stream_, Z_NO_FLUSH);
      if (ret == Z_STREAM_END) {
        // Concatenated gzip members form one stream.
        if (stream_.avail_in == 0) {
          PROOTBOX_ASSIGN_OR_RETURN(
              size_t n, input_->Read(reinterpret_cast<char*>(in_.get()),
                                     kChunkSize));
          stream_.next_in = in_.get();
          stream_.avail_in = static_cast<uInt>(n);
        }
        if (stream_.avail_in == 0) {
          finished_ = true;
        } else if (inflateReset(&stream_) != Z_OK) {
          return absl::InternalError("inflateReset() failed");
        }
      } else if (ret != Z_OK && ret != Z_BUF_ERROR) {
        return absl::DataLossError(absl::StrCat(
            "Corrupt gzip stream: ", stream_.msg ? stream_.msg : "unknown"));
      }
    }
    return size - stream_.avail_out;
  }

 private:
  std::unique_ptr<ByteSource> input_;
  std::unique_ptr<unsigned char[]> in_;
  z_stream stream_ = {};
  bool initialized_ = false;
  bool finished_ = false;
};

// Fills buffer completely. Returns false on a clean end of input before the
// first byte, DataLoss on a short read.
absl::StatusOr<bool> ReadFully(ByteSource& source, char* buffer, size_t size) {
  size_t total = 0;
  while (total < size) {
    PROOTBOX_ASSIGN_OR_RETURN(size_t n,
                              source.Read(buffer + total, size - total));
    if (n == 0) {
      if (total == 0) {
        return false;
      }
      return absl::DataLossError("Truncated tar stream");
    }
    total += n;
  }
  return true;
}

absl::Status Skip(ByteSource& source, uint64_t size) {
  char buffer[kBlockSize * 8];
  while (size > 0) {
    const size_t chunk = std::min<uint64_t>(size, sizeof(buffer));
    PROOTBOX_ASSIGN_OR_RETURN(bool read, ReadFully(source, buffer, chunk));
    if (!read) {
      return absl::DataLossError("Truncated tar entry");
    }
    size -= chunk;
  }
  return absl::OkStatus();
}

uint64_t PaddedSize(uint64_t size) {
  return (size + kBlockSize - 1) / kBlockSize * kBlockSize;
}

std::string ParseString(const Block& header, size_t offset, size_t length) {
  const char* start = header.data() + offset;
  return std::string(start, strnlen(start, length));
}

// Numeric fields are octal ASCII padded with spaces or NULs. GNU tar stores
// values that do not fit as big-endian base-256 with the high bit set.
uint64_t ParseNumber(const Block& header, size_t offset, size_t length) {
  const unsigned char* field =
      reinterpret_cast<const unsigned char*>(header.data() + offset);
  uint64_t value = 0;
  if (field[0] & 0x80) {
    value = field[0] & 0x7f;
    for (size_t i = 1; i < length; ++i) {
      value = (value << 8) | field[i];
    }
    return value;
  }
  size_t i = 0;
  while (i < length && (field[i] == ' ' || field[i] == '\0')) {
    ++i;
  }
  for (; i < length && field[i] >= '0' && field[i] <= '7'; ++i) {
    value = value * 8 + (field[i] - '0');
  }
  return value;
}

bool IsZeroBlock(const Block& block) {
  return std::all_of(block.begin(), block.end(),
                     [](char c) { return c == '\0'; });
}

// Returns the entry path relative to the archive root, or an empty string if
// the entry refers to the root itself or escapes it.
std::string EntryPath(const Block& header) {
  std::string name = ParseString(header, kNameOffset, kNameLength);
  if (absl::StartsWith(
          absl::string_view(header.data() + kMagicOffset, 5), "ustar")) {
    const std::string prefix =
        ParseString(header, kPrefixOffset, kPrefixLength);
    if (!prefix.empty()) {
      name = absl::StrCat(prefix, "/", name);
    }
  }
  const std::string clean = file::CleanPath(absl::StrCat("./", name));
  if (clean == "." || clean == ".." || absl::StartsWith(clean, "../")) {
    return "";
  }
  return clean;
}

// Returns true if an existing parent of the entry is not a real directory.
// Parents are later created with mkdir, which would follow a symlink planted
// by an earlier entry out of the target directory.
bool HasNonDirectoryParent(const std::string& root,
                           absl::string_view relative) {
  const std::vector<absl::string_view> parts = absl::StrSplit(relative, '/');
  std::string current = root;
  for (size_t i = 0; i + 1 < parts.size(); ++i) {
    current = file::JoinPath(current, parts[i]);
    struct stat st;
    if (lstat(current.c_str(), &st) == -1) {
      return false;
    }
    if (!S_ISDIR(st.st_mode)) {
      return true;
    }
  }
  return false;
}

absl::Status EnsureParent(const std::string& path) {
  const std::string parent = file_util::fileops::StripBasename(path);
  if (!parent.empty() &&
      !file_util::fileops::CreateDirectoryRecursively(parent, 0755)) {
    return absl::ErrnoToStatus(errno, absl::StrCat("mkdir(", parent, ")"));
  }
  return absl::OkStatus();
}

// Removes whatever non-directory occupies path so it can be recreated.
absl::Status ClearPath(const std::string& path) {
  struct stat st;
  if (lstat(path.c_str(), &st) == 0 && !S_ISDIR(st.st_mode) &&
      unlink(path.c_str()) == -1) {
    return absl::ErrnoToStatus(errno, absl::StrCat("unlink(", path, ")"));
  }
  return absl::OkStatus();
}

absl::Status WriteFile(ByteSource& source, const std::string& path,
                       uint64_t size, mode_t mode) {
  PROOTBOX_RETURN_IF_ERROR(EnsureParent(path));
  PROOTBOX_RETURN_IF_ERROR(ClearPath(path));
  FDCloser fd(open(path.c_str(),
                   O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_CLOEXEC,
                   0600));
  if (fd.get() == -1) {
    return absl::ErrnoToStatus(errno, absl::StrCat("open(", path, ")"));
  }
  auto buffer = std::make_unique<char[]>(kChunkSize);
  uint64_t remaining = size;
  while (remaining > 0) {
    const size_t chunk = std::min<uint64_t>(remaining, kChunkSize);
    PROOTBOX_ASSIGN_OR_RETURN(bool read,
                              ReadFully(source, buffer.get(), chunk));
    if (!read) {
      return absl::DataLossError(absl::StrCat("Truncated entry: ", path));
    }
    if (!file_util::fileops::WriteToFD(fd.get(), buffer.get(), chunk)) {
      return absl::ErrnoToStatus(errno, absl::StrCat("write(", path, ")"));
    }
    remaining -= chunk;
  }
  // fchmod() is not subject to the umask.
  if (fchmod(fd.get(), (mode & 07777) | S_IRUSR | S_IWUSR) == -1) {
    return absl::ErrnoToStatus(errno, absl::StrCat("fchmod(", path, ")"));
  }
  return Skip(source, PaddedSize(size) - size);
}

absl::Status MakeDirectory(const std::string& path, mode_t mode) {
  PROOTBOX_RETURN_IF_ERROR(ClearPath(path));
  if (!file_util::fileops::CreateDirectoryRecursively(path, 0755)) {
    return absl::ErrnoToStatus(errno, absl::StrCat("mkdir(", path, ")"));
  }
  if (chmod(path.c_str(), (mode & 07777) | S_IRWXU) == -1) {
    return absl::ErrnoToStatus(errno, absl::StrCat("chmod(", path, ")"));
  }
  return absl::OkStatus();
}

absl::Status MakeSymlink(const std::string& path, const std::string& target) {
  PROOTBOX_RETURN_IF_ERROR(EnsureParent(path));
  PROOTBOX_RETURN_IF_ERROR(ClearPath(path));
  if (symlink(target.c_str(), path.c_str()) == -1) {
    return absl::ErrnoToStatus(
        errno, absl::StrCat("symlink(", target, ", ", path, ")"));
  }
  return absl::OkStatus();
}

}  // namespace

ArchiveExtractor::ArchiveExtractor(std::string target_dir)
    : target_dir_(std::move(target_dir)) {}

absl::StatusOr<ExtractionSummary> ArchiveExtractor::Extract(int fd) {
  if (!file_util::fileops::CreateDirectoryRecursively(target_dir_, 0755)) {
    return absl::ErrnoToStatus(errno, absl::StrCat("mkdir(", target_dir_, ")"));
  }

  // Sniff the gzip magic, then hand the consumed bytes back to the reader.
  std::string magic(2, '\0');
  size_t sniffed = 0;
  while (sniffed < magic.size()) {
    ssize_t n = TEMP_FAILURE_RETRY(
        read(fd, &magic[sniffed], magic.size() - sniffed));
    if (n < 0) {
      return absl::ErrnoToStatus(errno, "read() archive");
    }
    if (n == 0) {
      break;
    }
    sniffed += n;
  }
  magic.resize(sniffed);

  std::unique_ptr<ByteSource> source =
      std::make_unique<FdSource>(fd, magic);
  if (magic == "\x1f\x8b") {
    VLOG(1) << "Archive is gzip-compressed";
    auto gzip = std::make_unique<GzipSource>(std::move(source));
    PROOTBOX_RETURN_IF_ERROR(gzip->Init());
    source = std::move(gzip);
  }

  ExtractionSummary summary;
  Block header;
  for (;;) {
    PROOTBOX_ASSIGN_OR_RETURN(
        bool read, ReadFully(*source, header.data(), header.size()));
    if (!read) {
      VLOG(1) << "Archive ended without end-of-archive marker";
      break;
    }
    if (IsZeroBlock(header)) {
      PROOTBOX_ASSIGN_OR_RETURN(
          read, ReadFully(*source, header.data(), header.size()));
      if (!read || IsZeroBlock(header)) {
        break;
      }
      // A lone zero block is padding; the block just read is a header.
    }

    const std::string relative = EntryPath(header);
    const mode_t mode = ParseNumber(header, kModeOffset, kModeLength);
    const uint64_t size = ParseNumber(header, kSizeOffset, kSizeLength);
    const char type = header[kTypeOffset];

    if (relative.empty()) {
      VLOG(1) << "Skipping entry '"
              << ParseString(header, kNameOffset, kNameLength) << "'";
      ++summary.skipped;
      PROOTBOX_RETURN_IF_ERROR(Skip(*source, PaddedSize(size)));
      continue;
    }
    if (HasNonDirectoryParent(target_dir_, relative)) {
      LOG(WARNING) << "Skipping entry " << relative
                   << " below a non-directory";
      ++summary.skipped;
      PROOTBOX_RETURN_IF_ERROR(Skip(*source, PaddedSize(size)));
      continue;
    }
    const std::string path = file::JoinPath(target_dir_, relative);
    switch (type) {
      case '0':
      case '\0':
      case '7':
        PROOTBOX_RETURN_IF_ERROR(WriteFile(*source, path, size, mode));
        ++summary.files;
        break;
      case '5':
        PROOTBOX_RETURN_IF_ERROR(MakeDirectory(path, mode));
        PROOTBOX_RETURN_IF_ERROR(Skip(*source, PaddedSize(size)));
        ++summary.directories;
        break;
      case '2': {
        const std::string target =
            ParseString(header, kLinkNameOffset, kLinkNameLength);
        if (absl::Status status = MakeSymlink(path, target); !status.ok()) {
          LOG(WARNING) << "Skipping symlink " << relative << ": " << status;
          ++summary.skipped;
        } else {
          ++summary.symlinks;
        }
        PROOTBOX_RETURN_IF_ERROR(Skip(*source, PaddedSize(size)));
        break;
      }
      default:
        VLOG(2) << "Skipping entry " << relative << " of type '" << type
                << "'";
        ++summary.skipped;
        PROOTBOX_RETURN_IF_ERROR(Skip(*source, PaddedSize(size)));
        break;
    }
  }
  VLOG(1) << "Extracted " << summary.files << " files, "
          << summary.directories << " directories, " << summary.symlinks
          << " symlinks into " << target_dir_;
  return summary;
}

}  // namespace prootbox
