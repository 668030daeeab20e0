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

#ifndef PROOTBOX_UTIL_FILE_HELPERS_H_
#define PROOTBOX_UTIL_FILE_HELPERS_H_

#include <sys/types.h>

#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace prootbox::file {

// Reads the whole file into output. A missing file yields NotFound.
absl::Status GetContents(absl::string_view path, std::string* output);

// Replaces the file contents, creating it with mode if it does not exist.
absl::Status SetContents(absl::string_view path, absl::string_view content,
                         mode_t mode = 0644);

}  // namespace prootbox::file

#endif  // PROOTBOX_UTIL_FILE_HELPERS_H_
