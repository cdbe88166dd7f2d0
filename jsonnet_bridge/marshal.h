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

// Conversions between native strings and the NUL-terminated byte buffers
// accepted and returned by the evaluator's C entry points.

#ifndef JSONNET_BRIDGE_MARSHAL_H_
#define JSONNET_BRIDGE_MARSHAL_H_

#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "jsonnet_bridge/foreign_buffer.h"

namespace jbridge {

// Returns an owned copy of `bytes` whose c_str() may be passed to the
// evaluator. Fails with InvalidInputError if `bytes` contains a NUL byte
// (which would silently truncate it) or is not valid UTF-8. `what` names the
// argument in error messages, e.g. "external variable name".
absl::StatusOr<std::string> ToForeign(absl::string_view bytes,
                                      absl::string_view what);

// Copies the contents of `buffer` into a native string. The buffer is not
// released. Fails with EncodingError if the buffer is null or does not hold
// valid UTF-8.
absl::StatusOr<std::string> FromForeign(const ForeignBuffer& buffer);

}  // namespace jbridge

#endif  // JSONNET_BRIDGE_MARSHAL_H_
