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

#ifndef PROOTBOX_UTIL_THREAD_H_
#define PROOTBOX_UTIL_THREAD_H_

#include <thread>
#include <utility>

#include "absl/functional/any_invocable.h"

namespace prootbox {

// Owning thread handle. The thread must be joined before destruction.
class Thread {
 public:
  Thread() = default;

  explicit Thread(absl::AnyInvocable<void() &&> functor)
      : thread_([f = std::move(functor)]() mutable { std::move(f)(); }) {}

  template <class CL>
  Thread(CL* ptr, void (CL::*ptr_to_member)())
      : thread_(ptr_to_member, ptr) {}

  Thread(const Thread&) = delete;
  Thread& operator=(const Thread&) = delete;

  Thread(Thread&&) = default;
  Thread& operator=(Thread&&) = default;

  void Join() { thread_.join(); }

  bool IsJoinable() const { return thread_.joinable(); }

 private:
  std::thread thread_;
};

}  // namespace prootbox

#endif  // PROOTBOX_UTIL_THREAD_H_
