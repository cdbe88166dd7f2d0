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

#ifndef JSONNET_BRIDGE_FOREIGN_BUFFER_H_
#define JSONNET_BRIDGE_FOREIGN_BUFFER_H_

#include <utility>

#include "jsonnet_bridge/runtime_api.h"

namespace jbridge {

// Owns one buffer allocated by the evaluator. The buffer is handed back to
// the evaluator exactly once, either by Release() or by the destructor,
// whichever comes first. The owning VM must outlive this object.
class ForeignBuffer {
 public:
  ForeignBuffer() = default;
  ForeignBuffer(ForeignRuntime* runtime, JsonnetVm* vm, char* data)
      : runtime_(runtime), vm_(vm), data_(data) {}

  ForeignBuffer(const ForeignBuffer&) = delete;
  ForeignBuffer& operator=(const ForeignBuffer&) = delete;

  ForeignBuffer(ForeignBuffer&& other) noexcept { *this = std::move(other); }
  ForeignBuffer& operator=(ForeignBuffer&& other) noexcept;

  ~ForeignBuffer() { Release(); }

  // Returns the NUL-terminated contents, or nullptr once released.
  const char* data() const { return data_; }
  bool is_released() const { return data_ == nullptr; }

  // Returns the memory to the evaluator. Subsequent calls do nothing.
  void Release();

 private:
  ForeignRuntime* runtime_ = nullptr;
  JsonnetVm* vm_ = nullptr;
  char* data_ = nullptr;
};

}  // namespace jbridge

#endif  // JSONNET_BRIDGE_FOREIGN_BUFFER_H_
