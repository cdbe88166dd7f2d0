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

#ifndef JSONNET_BRIDGE_RESULT_H_
#define JSONNET_BRIDGE_RESULT_H_

#include <ostream>
#include <string>
#include <utility>

#include "absl/status/statusor.h"

namespace jbridge {

// Outcome of an evaluation that reached the evaluator: either the rendered
// JSON, or the evaluator's diagnostic passed through verbatim. Both are
// native strings; nothing here refers to evaluator memory.
class EvaluationResult {
 public:
  static EvaluationResult Success(std::string json) {
    return EvaluationResult(true, std::move(json));
  }
  static EvaluationResult Failure(std::string message) {
    return EvaluationResult(false, std::move(message));
  }

  bool ok() const { return ok_; }

  // The JSON text. Empty for a failure.
  const std::string& json() const { return ok_ ? text_ : Empty(); }
  // The diagnostic. Empty for a success.
  const std::string& error() const { return ok_ ? Empty() : text_; }

  // Converts a failure into an EvaluationFailureError carrying the
  // diagnostic, for use with JBRIDGE_ASSIGN_OR_RETURN.
  absl::StatusOr<std::string> ToStatusOr() &&;

  friend bool operator==(const EvaluationResult& a,
                         const EvaluationResult& b) {
    return a.ok_ == b.ok_ && a.text_ == b.text_;
  }
  friend bool operator!=(const EvaluationResult& a,
                         const EvaluationResult& b) {
    return !(a == b);
  }

 private:
  EvaluationResult(bool ok, std::string text)
      : ok_(ok), text_(std::move(text)) {}

  static const std::string& Empty();

  bool ok_;
  std::string text_;
};

std::ostream& operator<<(std::ostream& os, const EvaluationResult& result);

}  // namespace jbridge

#endif  // JSONNET_BRIDGE_RESULT_H_
