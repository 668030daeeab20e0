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

#ifndef PROOTBOX_LINE_READER_H_
#define PROOTBOX_LINE_READER_H_

#include <atomic>

#include "absl/base/attributes.h"
#include "absl/functional/any_invocable.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/notification.h"
#include "absl/time/time.h"
#include "prootbox/util/fileops.h"
#include "prootbox/util/thread.h"

namespace prootbox {

// Drains a pipe on its own thread and hands every line, without its line
// terminator, to a callback. A final line lacking a newline is delivered at
// end of stream. The callback runs on the reader thread only.
class LineReader final {
 public:
  using LineCallback = absl::AnyInvocable<void(absl::string_view line)>;

  LineReader(file_util::fileops::FDCloser fd, LineCallback on_line);

  LineReader(const LineReader&) = delete;
  LineReader& operator=(const LineReader&) = delete;

  // Cancels the reader if it is still running.
  ~LineReader();

  // Returns true if end of stream was reached within the timeout.
  ABSL_MUST_USE_RESULT bool AwaitEndOfStream(absl::Duration timeout);

  // Stops reading and joins the thread. No callbacks run after this returns.
  void Cancel();

 private:
  void Run();

  file_util::fileops::FDCloser fd_;
  LineCallback on_line_;
  std::atomic<bool> cancelled_{false};
  absl::Notification done_;
  Thread thread_;
};

}  // namespace prootbox

#endif  // PROOTBOX_LINE_READER_H_
