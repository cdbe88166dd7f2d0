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

#include "jsonnet_bridge/util/utf8.h"

#include <cstdint>

namespace jbridge {
namespace {

bool IsContinuation(uint8_t c) { return (c & 0xC0) == 0x80; }

// Returns the length of the well-formed sequence starting at `pos`, or 0.
size_t SequenceLength(absl::string_view text, size_t pos) {
  const auto byte = [&text](size_t i) {
    return static_cast<uint8_t>(text[i]);
  };
  const uint8_t lead = byte(pos);
  const size_t remaining = text.size() - pos;
  if (lead < 0x80) {
    return 1;
  }
  if (lead >= 0xC2 && lead <= 0xDF) {
    return remaining >= 2 && IsContinuation(byte(pos + 1)) ? 2 : 0;
  }
  if (lead >= 0xE0 && lead <= 0xEF) {
    if (remaining < 3) {
      return 0;
    }
    const uint8_t second = byte(pos + 1);
    // E0 must not be overlong, ED must not encode a surrogate.
    const uint8_t lo = lead == 0xE0 ? 0xA0 : 0x80;
    const uint8_t hi = lead == 0xED ? 0x9F : 0xBF;
    if (second < lo || second > hi || !IsContinuation(byte(pos + 2))) {
      return 0;
    }
    return 3;
  }
  if (lead >= 0xF0 && lead <= 0xF4) {
    if (remaining < 4) {
      return 0;
    }
    const uint8_t second = byte(pos + 1);
    const uint8_t lo = lead == 0xF0 ? 0x90 : 0x80;
    const uint8_t hi = lead == 0xF4 ? 0x8F : 0xBF;
    if (second < lo || second > hi || !IsContinuation(byte(pos + 2)) ||
        !IsContinuation(byte(pos + 3))) {
      return 0;
    }
    return 4;
  }
  return 0;
}

}  // namespace

size_t FindInvalidUtf8(absl::string_view text) {
  size_t pos = 0;
  while (pos < text.size()) {
    const size_t len = SequenceLength(text, pos);
    if (len == 0) {
      return pos;
    }
    pos += len;
  }
  return absl::string_view::npos;
}

}  // namespace jbridge
