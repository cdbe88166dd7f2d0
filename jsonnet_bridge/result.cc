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

#include "jsonnet_bridge/result.h"

#include "jsonnet_bridge/errors.h"

namespace jbridge {

const std::string& EvaluationResult::Empty() {
  static const auto* empty = new std::string();
  return *empty;
}

absl::StatusOr<std::string> EvaluationResult::ToStatusOr() && {
  if (!ok_) {
    return EvaluationFailureError(text_);
  }
  return std::move(text_);
}

std::ostream& operator<<(std::ostream& os, const EvaluationResult& result) {
  if (result.ok()) {
    return os << "Success(" << result.json() << ")";
  }
  return os << "Failure(" << result.error() << ")";
}

}  // namespace jbridge
