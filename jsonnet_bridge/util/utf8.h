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

#ifndef JSONNET_BRIDGE_UTIL_UTF8_H_
#define JSONNET_BRIDGE_UTIL_UTF8_H_

#include <cstddef>

#include "absl/strings/string_view.h"

namespace jbridge {

// Returns the offset of the first byte that does not start a well-formed UTF-8
// sequence, or absl::string_view::npos if `text` is entirely well-formed.
// Overlong encodings, surrogates and code points above U+10FFFF are rejected.
size_t FindInvalidUtf8(absl::string_view text);

inline bool IsValidUtf8(absl::string_view text) {
  return FindInvalidUtf8(text) == absl::string_view::npos;
}

}  // namespace jbridge

#endif  // JSONNET_BRIDGE_UTIL_UTF8_H_
