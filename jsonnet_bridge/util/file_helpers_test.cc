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

#include "jsonnet_bridge/util/file_helpers.h"

#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/status_matchers.h"
#include "absl/strings/str_cat.h"
#include "jsonnet_bridge/util/status_matchers.h"

namespace jbridge::file {
namespace {

using ::absl_testing::IsOk;
using ::absl_testing::IsOkAndHolds;
using ::absl_testing::StatusIs;
using ::testing::HasSubstr;

TEST(FileHelpersTest, RoundTripsBinaryContent) {
  const std::string path =
      absl::StrCat(::testing::TempDir(), "/file_helpers_test.bin");
  const std::string content("{\n  a: 1,\0\xFF}\n", 12);
  ASSERT_THAT(SetContents(path, content), IsOk());
  EXPECT_THAT(GetContents(path), IsOkAndHolds(content));
}

TEST(FileHelpersTest, MissingFileIsNotFound) {
  EXPECT_THAT(GetContents("/nonexistent/dir/main.jsonnet"),
              StatusIs(absl::StatusCode::kNotFound,
                       HasSubstr("/nonexistent/dir/main.jsonnet")));
}

}  // namespace
}  // namespace jbridge::file
