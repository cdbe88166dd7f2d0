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

#include "jsonnet_bridge/errors.h"

#include "absl/strings/cord.h"

namespace jbridge {
namespace {

constexpr absl::string_view kErrorKindUrl =
    "type.googleapis.com/jsonnet_bridge.ErrorKind";

absl::Status MakeError(absl::StatusCode code, ErrorKind kind,
                       absl::string_view message) {
  absl::Status status(code, message);
  status.SetPayload(kErrorKindUrl, absl::Cord(ErrorKindName(kind)));
  return status;
}

}  // namespace

absl::string_view ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:
      return "None";
    case ErrorKind::kEvaluationFailure:
      return "EvaluationFailure";
    case ErrorKind::kInvalidInput:
      return "InvalidInput";
    case ErrorKind::kEncoding:
      return "EncodingError";
    case ErrorKind::kInitialization:
      return "InitializationError";
    case ErrorKind::kOther:
      return "Other";
  }
  return "Other";
}

std::ostream& operator<<(std::ostream& os, ErrorKind kind) {
  return os << ErrorKindName(kind);
}

absl::Status EvaluationFailureError(absl::string_view message) {
  return MakeError(absl::StatusCode::kFailedPrecondition,
                   ErrorKind::kEvaluationFailure, message);
}

absl::Status InvalidInputError(absl::string_view message) {
  return MakeError(absl::StatusCode::kInvalidArgument, ErrorKind::kInvalidInput,
                   message);
}

absl::Status EncodingError(absl::string_view message) {
  return MakeError(absl::StatusCode::kDataLoss, ErrorKind::kEncoding, message);
}

absl::Status InitializationError(absl::string_view message) {
  return MakeError(absl::StatusCode::kUnavailable, ErrorKind::kInitialization,
                   message);
}

ErrorKind GetErrorKind(const absl::Status& status) {
  if (status.ok()) {
    return ErrorKind::kNone;
  }
  const auto payload = status.GetPayload(kErrorKindUrl);
  if (!payload.has_value()) {
    return ErrorKind::kOther;
  }
  for (ErrorKind kind :
       {ErrorKind::kEvaluationFailure, ErrorKind::kInvalidInput,
        ErrorKind::kEncoding, ErrorKind::kInitialization}) {
    if (*payload == ErrorKindName(kind)) {
      return kind;
    }
  }
  return ErrorKind::kOther;
}

}  // namespace jbridge
