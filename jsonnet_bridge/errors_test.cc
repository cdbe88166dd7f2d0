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

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/status_matchers.h"
#include "jsonnet_bridge/util/status_matchers.h"

namespace jbridge {
namespace {

using ::absl_testing::StatusIs;
using ::testing::Eq;

TEST(ErrorsTest, KindsMapToCanonicalCodes) {
  EXPECT_THAT(InvalidInputError("empty name"),
              StatusIs(absl::StatusCode::kInvalidArgument, "empty name"));
  EXPECT_THAT(EncodingError("bad bytes"),
              StatusIs(absl::StatusCode::kDataLoss, "bad bytes"));
  EXPECT_THAT(InitializationError("no runtime"),
              StatusIs(absl::StatusCode::kUnavailable, "no runtime"));
  EXPECT_THAT(EvaluationFailureError("1:1 boom"),
              StatusIs(absl::StatusCode::kFailedPrecondition, "1:1 boom"));
}

TEST(ErrorsTest, KindRoundTripsThroughPayload) {
  EXPECT_THAT(GetErrorKind(InvalidInputError("x")),
              Eq(ErrorKind::kInvalidInput));
  EXPECT_THAT(GetErrorKind(EncodingError("x")), Eq(ErrorKind::kEncoding));
  EXPECT_THAT(GetErrorKind(InitializationError("x")),
              Eq(ErrorKind::kInitialization));
  EXPECT_THAT(GetErrorKind(EvaluationFailureError("x")),
              Eq(ErrorKind::kEvaluationFailure));
}

TEST(ErrorsTest, PlainStatusesAreUnclassified) {
  EXPECT_THAT(GetErrorKind(absl::OkStatus()), Eq(ErrorKind::kNone));
  // Same code as InvalidInputError, but no payload.
  EXPECT_THAT(GetErrorKind(absl::InvalidArgumentError("x")),
              Eq(ErrorKind::kOther));
  EXPECT_THAT(GetErrorKind(absl::DeadlineExceededError("x")),
              Eq(ErrorKind::kOther));
}

}  // namespace
}  // namespace jbridge
