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

#ifndef JSONNET_BRIDGE_ERRORS_H_
#define JSONNET_BRIDGE_ERRORS_H_

#include <ostream>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace jbridge {

// Classification of the errors produced by the bridge. Evaluator diagnostics
// are normally carried by EvaluationResult::Failure and only become a status
// through EvaluationResult::ToStatusOr().
enum class ErrorKind {
  kNone,
  // The Jsonnet program failed to parse or evaluate.
  kEvaluationFailure,
  // A precondition was violated before anything crossed the boundary.
  kInvalidInput,
  // A buffer returned by the evaluator could not be read as UTF-8 text.
  kEncoding,
  // The evaluator runtime failed to start. Later calls retry.
  kInitialization,
  // Any other non-OK status.
  kOther,
};

absl::string_view ErrorKindName(ErrorKind kind);
std::ostream& operator<<(std::ostream& os, ErrorKind kind);

// Each of the functions below creates an error status of the kind implied by
// its name. The absl::StatusCode is kFailedPrecondition, kInvalidArgument,
// kDataLoss and kUnavailable respectively.
absl::Status EvaluationFailureError(absl::string_view message);
absl::Status InvalidInputError(absl::string_view message);
absl::Status EncodingError(absl::string_view message);
absl::Status InitializationError(absl::string_view message);

// Returns the kind of a status created by one of the functions above,
// kNone for an OK status and kOther for any other status.
ErrorKind GetErrorKind(const absl::Status& status);

}  // namespace jbridge

#endif  // JSONNET_BRIDGE_ERRORS_H_
