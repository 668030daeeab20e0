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

#ifndef PROOTBOX_UTIL_PATH_H_
#define PROOTBOX_UTIL_PATH_H_

#include <initializer_list>
#include <string>

#include "absl/strings/string_view.h"

namespace prootbox::file {

namespace internal {
std::string JoinPathImpl(std::initializer_list<absl::string_view> paths);
}  // namespace internal

// Joins path components with exactly one "/" between them. Empty components
// are skipped.
template <typename... T>
inline std::string JoinPath(const T&... args) {
  return internal::JoinPathImpl({args...});
}

bool IsAbsolutePath(absl::string_view path);

// Collapses duplicate "/"s, resolves "." and ".." lexically and removes the
// trailing "/". A ".." at the root of an absolute path stays at the root.
std::string CleanPath(absl::string_view path);

// Returns true if path equals prefix or lies below it. Both are compared
// component-wise after CleanPath, so "/usr/libexec" is not under "/usr/lib".
bool IsSameOrNestedUnder(absl::string_view path, absl::string_view prefix);

}  // namespace prootbox::file

#endif  // PROOTBOX_UTIL_PATH_H_
