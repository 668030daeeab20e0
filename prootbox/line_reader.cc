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

#include "prootbox/line_reader.h"

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <string>
#include <utility>

#include "absl/log/log.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"

namespace prootbox {
namespace {

constexpr int kPollIntervalMs = 100;

}  // namespace

LineReader::LineReader(file_util::fileops::FDCloser fd, LineCallback on_line)
    : fd_(std::move(fd)), on_line_(std::move(on_line)) {
  thread_ = Thread(this, &LineReader::Run);
}

LineReader::~LineReader() { Cancel(); }

bool LineReader::AwaitEndOfStream(absl::Duration timeout) {
  return done_.WaitForNotificationWithTimeout(timeout);
}

void LineReader::Cancel() {
  cancelled_ = true;
  if (thread_.IsJoinable()) {
    thread_.Join();
  }
}

void LineReader::Run() {
  std::string pending;
  char buffer[4096];
  while (!cancelled_) {
    struct pollfd pfd = {fd_.get(), POLLIN, 0};
    int ready = poll(&pfd, 1, kPollIntervalMs);
    if (ready == -1) {
      if (errno == EINTR) {
        continue;
      }
      PLOG(WARNING) << "poll() on fd " << fd_.get();
      break;
    }
    if (ready == 0) {
      continue;
    }
    ssize_t n = TEMP_FAILURE_RETRY(read(fd_.get(), buffer, sizeof(buffer)));
    if (n < 0) {
      PLOG(WARNING) << "read() on fd " << fd_.get();
      break;
    }
    if (n == 0) {
      break;
    }
    pending.append(buffer, n);
    size_t start = 0;
    for (size_t newline = pending.find('\n', start);
         newline != std::string::npos;
         newline = pending.find('\n', start)) {
      absl::string_view line(pending.data() + start, newline - start);
      on_line_(absl::StripSuffix(line, "\r"));
      start = newline + 1;
    }
    pending.erase(0, start);
  }
  if (!cancelled_ && !pending.empty()) {
    on_line_(pending);
  }
  fd_.Close();
  done_.Notify();
}

}  // namespace prootbox
