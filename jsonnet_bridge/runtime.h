// Copyright 2020 Google LLC
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

#ifndef JSONNET_BRIDGE_RUNTIME_H_
#define JSONNET_BRIDGE_RUNTIME_H_

#include <atomic>
#include <functional>
#include <memory>
#include <utility>

#include "absl/base/thread_annotations.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "jsonnet_bridge/runtime_api.h"

namespace jbridge {

// Guards the one-time initialization of the evaluator runtime.
//
// The guard starts out uninitialized. The first successful Get() runs the
// factory and moves the guard to the initialized state, which is terminal:
// the runtime is never torn down or re-created. Concurrent first callers
// block until exactly one of them has run the factory. If the factory fails,
// that caller gets an InitializationError and the guard stays uninitialized,
// so the next caller tries again.
class RuntimeGuard {
 public:
  using Factory =
      std::function<absl::StatusOr<std::unique_ptr<ForeignRuntime>>()>;

  explicit RuntimeGuard(Factory factory) : factory_(std::move(factory)) {}

  RuntimeGuard(const RuntimeGuard&) = delete;
  RuntimeGuard& operator=(const RuntimeGuard&) = delete;

  // Returns the process-wide guard backed by LibJsonnetRuntime. It is never
  // destroyed.
  static RuntimeGuard& Default();

  // Returns the runtime, initializing it if needed. The returned pointer is
  // valid for the lifetime of the guard.
  absl::StatusOr<ForeignRuntime*> Get() ABSL_LOCKS_EXCLUDED(mu_);

  bool is_initialized() const {
    return ready_.load(std::memory_order_acquire) != nullptr;
  }

  // Number of times the factory has been invoked.
  int init_attempts() const ABSL_LOCKS_EXCLUDED(mu_);

 private:
  Factory factory_;
  // Published once `runtime_` is set, for the lock-free fast path.
  std::atomic<ForeignRuntime*> ready_{nullptr};

  mutable absl::Mutex mu_;
  std::unique_ptr<ForeignRuntime> runtime_ ABSL_GUARDED_BY(mu_);
  int init_attempts_ ABSL_GUARDED_BY(mu_) = 0;
};

}  // namespace jbridge

#endif  // JSONNET_BRIDGE_RUNTIME_H_
