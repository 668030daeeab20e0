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

#include "prootbox/util/path.h"

#include <string>
#include <vector>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"

namespace prootbox::file {
namespace internal {

std::string JoinPathImpl(std::initializer_list<absl::string_view> paths) {
  std::string result;
  for (absl::string_view path : paths) {
    if (path.empty()) {
      continue;
    }
    if (result.empty()) {
      result = std::string(path);
      continue;
    }
    absl::ConsumePrefix(&path, "/");
    if (result.back() != '/') {
      result.push_back('/');
    }
    absl::StrAppend(&result, path);
  }
  return result;
}

}  // namespace internal

bool IsAbsolutePath(absl::string_view path) {
  return absl::StartsWith(path, "/");
}

std::string CleanPath(absl::string_view path) {
  const bool absolute = IsAbsolutePath(path);
  std::vector<absl::string_view> parts;
  for (absl::string_view part : absl::StrSplit(path, '/', absl::SkipEmpty())) {
    if (part == ".") {
      continue;
    }
    if (part == "..") {
      if (!parts.empty() && parts.back() != "..") {
        parts.pop_back();
      } else if (!absolute) {
        parts.push_back(part);
      }
      continue;
    }
    parts.push_back(part);
  }
  const std::string joined = absl::StrJoin(parts, "/");
  if (absolute) {
    return absl::StrCat("/", joined);
  }
  return joined.empty() ? "." : joined;
}

bool IsSameOrNestedUnder(absl::string_view path, absl::string_view prefix) {
  const std::string clean_path = CleanPath(path);
  const std::string clean_prefix = CleanPath(prefix);
  if (clean_path == clean_prefix) {
    return true;
  }
  if (clean_prefix == "/") {
    return IsAbsolutePath(clean_path);
  }
  return absl::StartsWith(clean_path, absl::StrCat(clean_prefix, "/"));
}

}  // namespace prootbox::file
