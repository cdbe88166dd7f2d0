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

#include "jsonnet_bridge/runtime.h"

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "jsonnet_bridge/errors.h"

namespace jbridge {

RuntimeGuard& RuntimeGuard::Default() {
  static auto* guard = new RuntimeGuard(&LibJsonnetRuntime::Create);
  return *guard;
}

absl::StatusOr<ForeignRuntime*> RuntimeGuard::Get() {
  if (ForeignRuntime* runtime = ready_.load(std::memory_order_acquire)) {
    return runtime;
  }

  absl::MutexLock lock(&mu_);
  // Another caller may have finished initialization while we waited.
  if (runtime_) {
    return runtime_.get();
  }

  ++init_attempts_;
  absl::StatusOr<std::unique_ptr<ForeignRuntime>> runtime = factory_();
  if (!runtime.ok() || *runtime == nullptr) {
    absl::Status status = runtime.ok()
                              ? InitializationError("Runtime factory "
                                                    "returned no runtime")
                              : runtime.status();
    LOG(WARNING) << "Jsonnet runtime initialization failed (attempt "
                 << init_attempts_ << "): " << status;
    if (GetErrorKind(status) != ErrorKind::kInitialization) {
      status = InitializationError(absl::StrCat(
          "Jsonnet runtime initialization failed: ", status.message()));
    }
    return status;
  }

  runtime_ = *std::move(runtime);
  LOG(INFO) << "Initialized Jsonnet runtime " << runtime_->Version();
  ready_.store(runtime_.get(), std::memory_order_release);
  return runtime_.get();
}

int RuntimeGuard::init_attempts() const {
  absl::MutexLock lock(&mu_);
  return init_attempts_;
}

}  // namespace jbridge
