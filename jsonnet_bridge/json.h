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

#ifndef JSONNET_BRIDGE_JSON_H_
#define JSONNET_BRIDGE_JSON_H_

#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace jbridge {

// Re-serializes JSON text without insignificant whitespace, e.g. the
// evaluator's multi-line object output becomes {"foo":"bar","hoge":2}.
// Fails with InvalidArgumentError if `json` does not parse.
absl::StatusOr<std::string> CompactJson(absl::string_view json);

}  // namespace jbridge

#endif  // JSONNET_BRIDGE_JSON_H_
