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

#include "jsonnet_bridge/json.h"

#include <nlohmann/json.hpp>

#include "absl/status/status.h"

namespace jbridge {

absl::StatusOr<std::string> CompactJson(absl::string_view json) {
  nlohmann::json value = nlohmann::json::parse(json.begin(), json.end(),
                                               /*cb=*/nullptr,
                                               /*allow_exceptions=*/false);
  if (value.is_discarded()) {
    return absl::InvalidArgumentError("Evaluator output is not valid JSON");
  }
  return value.dump();
}

}  // namespace jbridge
