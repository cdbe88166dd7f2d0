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

#ifndef JSONNET_BRIDGE_UTIL_STATUS_MATCHERS_H_
#define JSONNET_BRIDGE_UTIL_STATUS_MATCHERS_H_

#include <utility>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status_matchers.h"
#include "jsonnet_bridge/util/status_macros.h"  // IWYU pragma: keep

// Declares `lhs` from the value of the absl::StatusOr<T> `rexpr`, failing the
// current test if it holds an error.
#define JBRIDGE_ASSERT_OK_AND_ASSIGN(lhs, rexpr) \
  JBRIDGE_ASSERT_OK_AND_ASSIGN_IMPL(             \
      JBRIDGE_MACROS_IMPL_CONCAT(_jbridge_statusor, __LINE__), lhs, rexpr)

#define JBRIDGE_ASSERT_OK_AND_ASSIGN_IMPL(statusor, lhs, rexpr)     \
  auto statusor = (rexpr);                                          \
  ASSERT_THAT(statusor.status(), ::absl_testing::IsOk()) << #rexpr; \
  lhs = std::move(statusor).value()

#endif  // JSONNET_BRIDGE_UTIL_STATUS_MATCHERS_H_
