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

#include "jsonnet_bridge/foreign_buffer.h"

namespace jbridge {

ForeignBuffer& ForeignBuffer::operator=(ForeignBuffer&& other) noexcept {
  if (this != &other) {
    Release();
    runtime_ = std::exchange(other.runtime_, nullptr);
    vm_ = std::exchange(other.vm_, nullptr);
    data_ = std::exchange(other.data_, nullptr);
  }
  return *this;
}

void ForeignBuffer::Release() {
  if (data_ == nullptr) {
    return;
  }
  // Realloc with size 0 frees the buffer and returns nullptr.
  runtime_->Realloc(vm_, data_, 0);
  data_ = nullptr;
}

}  // namespace jbridge
