// Copyright 2026 mfaferek93
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <atomic>
#include <memory>

namespace parts_compat {

/// Read side of a cooperative cancellation flag.
/// Copies share state with the CancellationSource that issued them.
class CancellationToken {
 public:
  bool is_cancelled() const {
    return state_->load(std::memory_order_acquire);
  }

 private:
  friend class CancellationSource;

  explicit CancellationToken(std::shared_ptr<std::atomic<bool>> state) : state_(std::move(state)) {
  }

  std::shared_ptr<std::atomic<bool>> state_;
};

/// Owner of a cancellation flag. A caller that supersedes an in-flight lookup
/// (e.g. a newer keystroke in a live search) calls cancel() on the old source.
class CancellationSource {
 public:
  CancellationSource() : state_(std::make_shared<std::atomic<bool>>(false)) {
  }

  CancellationToken token() const {
    return CancellationToken(state_);
  }

  void cancel() {
    state_->store(true, std::memory_order_release);
  }

  bool is_cancelled() const {
    return state_->load(std::memory_order_acquire);
  }

 private:
  std::shared_ptr<std::atomic<bool>> state_;
};

/// True only when a token was supplied and it has fired
inline bool is_cancelled(const CancellationToken * token) {
  return token != nullptr && token->is_cancelled();
}

}  // namespace parts_compat
