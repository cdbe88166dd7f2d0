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

#include "jsonnet_bridge/testing.h"

#include <cstring>

#include "absl/strings/str_cat.h"
#include "jsonnet_bridge/util/status_macros.h"

namespace jbridge {

absl::StatusOr<std::unique_ptr<TrackingRuntime>> TrackingRuntime::Create() {
  JBRIDGE_ASSIGN_OR_RETURN(std::unique_ptr<ForeignRuntime> runtime,
                           LibJsonnetRuntime::Create());
  return std::make_unique<TrackingRuntime>(std::move(runtime));
}

void TrackingRuntime::InjectNextResult(std::string bytes, int error) {
  absl::MutexLock lock(&mu_);
  injected_ = Injected{std::move(bytes), error};
}

int TrackingRuntime::vms_created() const {
  absl::MutexLock lock(&mu_);
  return vms_created_;
}

int TrackingRuntime::vms_destroyed() const {
  absl::MutexLock lock(&mu_);
  return vms_destroyed_;
}

int TrackingRuntime::buffers_returned() const {
  absl::MutexLock lock(&mu_);
  return buffers_returned_;
}

int TrackingRuntime::buffers_released() const {
  absl::MutexLock lock(&mu_);
  return buffers_released_;
}

int TrackingRuntime::evaluations() const {
  absl::MutexLock lock(&mu_);
  return evaluations_;
}

size_t TrackingRuntime::outstanding_buffers() const {
  absl::MutexLock lock(&mu_);
  return live_buffers_.size();
}

int TrackingRuntime::bad_releases() const {
  absl::MutexLock lock(&mu_);
  return bad_releases_;
}

std::vector<std::string> TrackingRuntime::bindings() const {
  absl::MutexLock lock(&mu_);
  return bindings_;
}

JsonnetVm* TrackingRuntime::MakeVm() {
  JsonnetVm* vm = wrapped_->MakeVm();
  absl::MutexLock lock(&mu_);
  if (vm != nullptr) {
    ++vms_created_;
  }
  return vm;
}

void TrackingRuntime::DestroyVm(JsonnetVm* vm) {
  {
    absl::MutexLock lock(&mu_);
    ++vms_destroyed_;
  }
  wrapped_->DestroyVm(vm);
}

void TrackingRuntime::ExtVar(JsonnetVm* vm, const char* key,
                             const char* value) {
  {
    absl::MutexLock lock(&mu_);
    bindings_.push_back(absl::StrCat("string:", key));
  }
  wrapped_->ExtVar(vm, key, value);
}

void TrackingRuntime::ExtCode(JsonnetVm* vm, const char* key,
                              const char* value) {
  {
    absl::MutexLock lock(&mu_);
    bindings_.push_back(absl::StrCat("code:", key));
  }
  wrapped_->ExtCode(vm, key, value);
}

char* TrackingRuntime::EvaluateSnippet(JsonnetVm* vm, const char* filename,
                                       const char* snippet, int* error) {
  std::optional<Injected> injected;
  {
    absl::MutexLock lock(&mu_);
    ++evaluations_;
    injected.swap(injected_);
  }
  char* result;
  if (injected.has_value()) {
    result = wrapped_->Realloc(vm, nullptr, injected->bytes.size() + 1);
    memcpy(result, injected->bytes.c_str(), injected->bytes.size() + 1);
    *error = injected->error;
  } else {
    result = wrapped_->EvaluateSnippet(vm, filename, snippet, error);
  }
  if (result != nullptr) {
    absl::MutexLock lock(&mu_);
    ++buffers_returned_;
    live_buffers_.insert(result);
  }
  return result;
}

char* TrackingRuntime::Realloc(JsonnetVm* vm, char* buf, size_t size) {
  if (buf != nullptr && size == 0) {
    absl::MutexLock lock(&mu_);
    if (live_buffers_.erase(buf) == 1) {
      ++buffers_released_;
    } else {
      ++bad_releases_;
      // Never forward a double free.
      return nullptr;
    }
  }
  return wrapped_->Realloc(vm, buf, size);
}

}  // namespace jbridge
