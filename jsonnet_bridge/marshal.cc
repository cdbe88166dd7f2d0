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

#include "jsonnet_bridge/marshal.h"

#include <cstring>

#include "absl/strings/str_cat.h"
#include "jsonnet_bridge/errors.h"
#include "jsonnet_bridge/util/utf8.h"

namespace jbridge {

absl::StatusOr<std::string> ToForeign(absl::string_view bytes,
                                      absl::string_view what) {
  if (size_t pos = bytes.find('\0'); pos != absl::string_view::npos) {
    return InvalidInputError(
        absl::StrCat(what, " contains a NUL byte at offset ", pos));
  }
  if (size_t pos = FindInvalidUtf8(bytes); pos != absl::string_view::npos) {
    return InvalidInputError(
        absl::StrCat(what, " is not valid UTF-8 (offset ", pos, ")"));
  }
  return std::string(bytes);
}

absl::StatusOr<std::string> FromForeign(const ForeignBuffer& buffer) {
  const char* data = buffer.data();
  if (data == nullptr) {
    return EncodingError("Jsonnet evaluator returned no result buffer");
  }
  std::string text(data, strlen(data));
  if (size_t pos = FindInvalidUtf8(text); pos != absl::string_view::npos) {
    return EncodingError(absl::StrCat(
        "Jsonnet evaluator returned invalid UTF-8 at offset ", pos, " of ",
        text.size(), " bytes"));
  }
  return text;
}

}  // namespace jbridge
