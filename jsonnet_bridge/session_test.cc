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

#include "jsonnet_bridge/session.h"

#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/status_matchers.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "jsonnet_bridge/errors.h"
#include "jsonnet_bridge/json.h"
#include "jsonnet_bridge/testing.h"
#include "jsonnet_bridge/util/file_helpers.h"
#include "jsonnet_bridge/util/status_macros.h"

namespace jbridge {
namespace {

using ::absl_testing::IsOk;
using ::absl_testing::IsOkAndHolds;
using ::absl_testing::StatusIs;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::StrEq;

absl::StatusOr<std::unique_ptr<ForeignRuntime>> MakeTrackingRuntime() {
  JBRIDGE_ASSIGN_OR_RETURN(std::unique_ptr<TrackingRuntime> runtime,
                           TrackingRuntime::Create());
  return std::unique_ptr<ForeignRuntime>(std::move(runtime));
}

// Evaluates against the real evaluator, observed through a TrackingRuntime.
class SessionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    JBRIDGE_ASSERT_OK_AND_ASSIGN(ForeignRuntime * runtime, guard_.Get());
    runtime_ = static_cast<TrackingRuntime*>(runtime);
  }

  absl::StatusOr<EvaluationResult> Run(absl::string_view source,
                                       const ExtVarTable& vars = {}) {
    Session session(&guard_, config_);
    return session.Run(config_.filename, source, vars);
  }

  void ExpectNothingLeaked() {
    EXPECT_THAT(runtime_->outstanding_buffers(), Eq(size_t{0}));
    EXPECT_THAT(runtime_->bad_releases(), Eq(0));
    EXPECT_THAT(runtime_->vms_destroyed(), Eq(runtime_->vms_created()));
  }

  RuntimeGuard guard_{&MakeTrackingRuntime};
  TrackingRuntime* runtime_ = nullptr;
  EvaluatorConfig config_;
};

TEST_F(SessionTest, EvaluatesToJson) {
  JBRIDGE_ASSERT_OK_AND_ASSIGN(EvaluationResult result,
                               Run(R"({a: 1 + 1, b: [true, null, "x"]})"));
  ASSERT_TRUE(result.ok()) << result;
  EXPECT_THAT(CompactJson(result.json()),
              IsOkAndHolds(R"({"a":2,"b":[true,null,"x"]})"));
  EXPECT_THAT(runtime_->buffers_returned(), Eq(1));
  EXPECT_THAT(runtime_->buffers_released(), Eq(1));
  ExpectNothingLeaked();
}

TEST_F(SessionTest, BindsStringAndCodeVariables) {
  ExtVarTable vars;
  vars.SetString("foo", "bar").SetCode("hoge", "1");
  JBRIDGE_ASSERT_OK_AND_ASSIGN(
      EvaluationResult result,
      Run(R"({foo: std.extVar("foo"), hoge: std.extVar("hoge") + 1})", vars));
  ASSERT_TRUE(result.ok()) << result;
  EXPECT_THAT(CompactJson(result.json()),
              IsOkAndHolds(R"({"foo":"bar","hoge":2})"));
  EXPECT_THAT(runtime_->bindings(), ElementsAre("string:foo", "code:hoge"));
}

TEST_F(SessionTest, StringVariableIsQuotedJson) {
  ExtVarTable vars;
  vars.SetString("foo", "bar");
  JBRIDGE_ASSERT_OK_AND_ASSIGN(EvaluationResult result,
                               Run(R"(std.extVar("foo"))", vars));
  EXPECT_THAT(absl::StripTrailingAsciiWhitespace(result.json()),
              Eq("\"bar\""));
}

TEST_F(SessionTest, VariableOrderDoesNotChangeOutput) {
  constexpr absl::string_view kProgram =
      R"({a: std.extVar("a"), b: std.extVar("b")})";
  ExtVarTable forward;
  forward.SetString("a", "1").SetCode("b", "[2]");
  ExtVarTable backward;
  backward.SetCode("b", "[2]").SetString("a", "1");

  JBRIDGE_ASSERT_OK_AND_ASSIGN(EvaluationResult first, Run(kProgram, forward));
  JBRIDGE_ASSERT_OK_AND_ASSIGN(EvaluationResult second,
                               Run(kProgram, backward));
  EXPECT_EQ(first, second);
}

TEST_F(SessionTest, SyntaxErrorIsFailureAndReleasesBuffer) {
  JBRIDGE_ASSERT_OK_AND_ASSIGN(EvaluationResult result, Run("{a: }"));
  EXPECT_FALSE(result.ok());
  EXPECT_THAT(result.error(), HasSubstr(kDefaultSnippetFilename));
  EXPECT_THAT(runtime_->buffers_released(), Eq(1));
  ExpectNothingLeaked();
}

TEST_F(SessionTest, PassesDiagnosticThroughVerbatim) {
  JBRIDGE_ASSERT_OK_AND_ASSIGN(EvaluationResult unknown,
                               Run("local x = 1; y"));
  EXPECT_FALSE(unknown.ok());
  EXPECT_THAT(unknown.error(), HasSubstr("Unknown variable"));

  JBRIDGE_ASSERT_OK_AND_ASSIGN(EvaluationResult runtime_error,
                               Run(R"(local f() = error "boom"; [f()])"));
  EXPECT_FALSE(runtime_error.ok());
  EXPECT_THAT(runtime_error.error(), HasSubstr("RUNTIME ERROR: boom"));
  // The stack trace follows on separate lines.
  EXPECT_THAT(runtime_error.error(), HasSubstr("\n"));
}

TEST_F(SessionTest, MissingVariableIsFailure) {
  JBRIDGE_ASSERT_OK_AND_ASSIGN(EvaluationResult result,
                               Run(R"(std.extVar("nope"))"));
  EXPECT_FALSE(result.ok());
  EXPECT_THAT(result.error(), HasSubstr("nope"));
  ExpectNothingLeaked();
}

TEST_F(SessionTest, UsesGivenFilenameInDiagnostics) {
  Session session(&guard_, config_);
  JBRIDGE_ASSERT_OK_AND_ASSIGN(EvaluationResult result,
                               session.Run("config.jsonnet", "{", {}));
  EXPECT_FALSE(result.ok());
  EXPECT_THAT(result.error(), HasSubstr("config.jsonnet"));
}

TEST_F(SessionTest, RejectedInputNeverReachesEvaluator) {
  EXPECT_THAT(Run(absl::string_view("1\0+1", 4)),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Jsonnet source contains a NUL byte")));
  EXPECT_THAT(Run("\"\xFF\""), StatusIs(absl::StatusCode::kInvalidArgument,
                                        HasSubstr("not valid UTF-8")));

  ExtVarTable vars;
  vars.SetString("", "x");
  absl::StatusOr<EvaluationResult> result = Run("1", vars);
  EXPECT_THAT(GetErrorKind(result.status()), Eq(ErrorKind::kInvalidInput));

  Session session(&guard_, config_);
  EXPECT_THAT(session.Run(absl::string_view("a\0", 2), "1", {}),
              StatusIs(absl::StatusCode::kInvalidArgument));

  EXPECT_THAT(runtime_->evaluations(), Eq(0));
  EXPECT_THAT(runtime_->vms_created(), Eq(0));
}

TEST_F(SessionTest, InvalidUtf8OutputIsEncodingErrorAndReleased) {
  runtime_->InjectNextResult("\"caf\xC3\"", 0);
  absl::StatusOr<EvaluationResult> result = Run("true");
  EXPECT_THAT(result, StatusIs(absl::StatusCode::kDataLoss,
                               HasSubstr("invalid UTF-8 at offset 4")));
  EXPECT_THAT(GetErrorKind(result.status()), Eq(ErrorKind::kEncoding));
  EXPECT_THAT(runtime_->buffers_returned(), Eq(1));
  EXPECT_THAT(runtime_->buffers_released(), Eq(1));
  ExpectNothingLeaked();
}

TEST_F(SessionTest, InjectedFailureFlagIsHonored) {
  runtime_->InjectNextResult("RUNTIME ERROR: injected\n", 1);
  JBRIDGE_ASSERT_OK_AND_ASSIGN(EvaluationResult result, Run("true"));
  EXPECT_EQ(result, EvaluationResult::Failure("RUNTIME ERROR: injected\n"));
  ExpectNothingLeaked();
}

TEST_F(SessionTest, ResolvesImportsFromImportPaths) {
  const std::string dir = ::testing::TempDir();
  ASSERT_THAT(file::SetContents(absl::StrCat(dir, "/session_test_lib.libsonnet"),
                                "{ answer: 42 }\n"),
              IsOk());
  config_.import_paths = {dir};
  JBRIDGE_ASSERT_OK_AND_ASSIGN(
      EvaluationResult result,
      Run(R"((import "session_test_lib.libsonnet").answer)"));
  ASSERT_TRUE(result.ok()) << result;
  EXPECT_THAT(absl::StripTrailingAsciiWhitespace(result.json()), Eq("42"));
}

TEST_F(SessionTest, MaxStackLimitsRecursion) {
  config_.max_stack = 10;
  JBRIDGE_ASSERT_OK_AND_ASSIGN(
      EvaluationResult result,
      Run("local f(n) = if n == 0 then 0 else 1 + f(n - 1); f(100)"));
  EXPECT_FALSE(result.ok());
  EXPECT_THAT(result.error(), HasSubstr("stack"));
  ExpectNothingLeaked();
}

TEST_F(SessionTest, StringOutputReturnsRawString) {
  config_.string_output = true;
  JBRIDGE_ASSERT_OK_AND_ASSIGN(EvaluationResult result,
                               Run(R"("line one\nline two")"));
  ASSERT_TRUE(result.ok()) << result;
  EXPECT_THAT(absl::StripTrailingAsciiWhitespace(result.json()),
              Eq("line one\nline two"));
}

class SessionConcurrencyTest : public SessionTest,
                               public ::testing::WithParamInterface<bool> {};

TEST_P(SessionConcurrencyTest, ConcurrentSessionsAreIsolated) {
  constexpr int kThreads = 8;
  constexpr int kRunsPerThread = 5;
  config_.serialize_foreign_calls = GetParam();

  std::vector<std::vector<std::string>> outputs(kThreads);
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([this, i, &outputs] {
      // Each thread evaluates its own program text.
      const std::string source = absl::StrCat(
          R"({id: std.extVar("id"), run: std.extVar("run"), square: )", i,
          " * ", i, R"(, tag: "t)", i, R"("})");
      Session session(&guard_, config_);
      for (int run = 0; run < kRunsPerThread; ++run) {
        ExtVarTable vars;
        vars.SetString("id", absl::StrCat(i)).SetCode("run", absl::StrCat(run));
        absl::StatusOr<EvaluationResult> result =
            session.Run(config_.filename, source, vars);
        if (!result.ok() || !result->ok()) {
          outputs[i].push_back("error");
          continue;
        }
        absl::StatusOr<std::string> json = CompactJson(result->json());
        outputs[i].push_back(json.ok() ? *json : "bad json");
      }
    });
  }
  for (std::thread& thread : threads) {
    thread.join();
  }

  for (int i = 0; i < kThreads; ++i) {
    ASSERT_THAT(outputs[i].size(), Eq(size_t{kRunsPerThread}));
    for (int run = 0; run < kRunsPerThread; ++run) {
      EXPECT_THAT(outputs[i][run],
                  Eq(absl::StrCat(R"({"id":")", i, R"(","run":)", run,
                                  R"(,"square":)", i * i, R"(,"tag":"t)", i,
                                  R"("})")));
    }
  }
  EXPECT_THAT(runtime_->vms_created(), Eq(kThreads * kRunsPerThread));
  ExpectNothingLeaked();
}

INSTANTIATE_TEST_SUITE_P(SerializeForeignCalls, SessionConcurrencyTest,
                         ::testing::Bool());

JsonnetVm* FakeVm() { return reinterpret_cast<JsonnetVm*>(0x1000); }

// Drives a Session against a mock evaluator.
class SessionMockTest : public ::testing::Test {
 protected:
  SessionMockTest()
      : runtime_(new NiceMock<MockForeignRuntime>()),
        guard_([runtime = runtime_]()
                   -> absl::StatusOr<std::unique_ptr<ForeignRuntime>> {
          return std::unique_ptr<ForeignRuntime>(runtime);
        }) {
    ON_CALL(*runtime_, Version()).WillByDefault(Return("mock"));
    ON_CALL(*runtime_, MakeVm()).WillByDefault(Return(FakeVm()));
  }

  // Owned by guard_ once Get() has run.
  NiceMock<MockForeignRuntime>* runtime_;
  RuntimeGuard guard_;
  EvaluatorConfig config_;
};

TEST_F(SessionMockTest, AppliesConfigurationBeforeEvaluating) {
  static char output[] = "{}";
  config_.max_stack = 50;
  config_.max_trace = 3;
  config_.string_output = true;
  config_.import_paths = {"/lib/a", "/lib/b"};
  ExtVarTable vars;
  vars.SetCode("x", "1");
  {
    InSequence sequence;
    EXPECT_CALL(*runtime_, MakeVm()).WillOnce(Return(FakeVm()));
    EXPECT_CALL(*runtime_, MaxStack(FakeVm(), 50));
    EXPECT_CALL(*runtime_, MaxTrace(FakeVm(), 3));
    EXPECT_CALL(*runtime_, StringOutput(FakeVm(), true));
    EXPECT_CALL(*runtime_, JpathAdd(FakeVm(), StrEq("/lib/a")));
    EXPECT_CALL(*runtime_, JpathAdd(FakeVm(), StrEq("/lib/b")));
    EXPECT_CALL(*runtime_, ExtCode(FakeVm(), StrEq("x"), StrEq("1")));
    EXPECT_CALL(*runtime_,
                EvaluateSnippet(FakeVm(), StrEq("<snippet>"), StrEq("{}"), _))
        .WillOnce(Return(output));
    EXPECT_CALL(*runtime_, Realloc(FakeVm(), output, 0));
    EXPECT_CALL(*runtime_, DestroyVm(FakeVm()));
  }

  Session session(&guard_, config_);
  EXPECT_THAT(session.Run(config_.filename, "{}", vars),
              IsOkAndHolds(EvaluationResult::Success("{}")));
}

TEST_F(SessionMockTest, LeavesDefaultsAlone) {
  static char output[] = "1";
  EXPECT_CALL(*runtime_, MaxStack(_, _)).Times(0);
  EXPECT_CALL(*runtime_, MaxTrace(_, _)).Times(0);
  EXPECT_CALL(*runtime_, StringOutput(_, _)).Times(0);
  EXPECT_CALL(*runtime_, JpathAdd(_, _)).Times(0);
  EXPECT_CALL(*runtime_, EvaluateSnippet(FakeVm(), _, _, _))
      .WillOnce(Return(output));

  Session session(&guard_, config_);
  EXPECT_THAT(session.Run(config_.filename, "1", {}), IsOk());
}

TEST_F(SessionMockTest, NullResultIsEncodingError) {
  EXPECT_CALL(*runtime_, EvaluateSnippet(FakeVm(), _, _, _))
      .WillOnce(Return(nullptr));
  EXPECT_CALL(*runtime_, Realloc(_, _, _)).Times(0);
  EXPECT_CALL(*runtime_, DestroyVm(FakeVm())).Times(1);

  Session session(&guard_, config_);
  absl::StatusOr<EvaluationResult> result =
      session.Run(config_.filename, "1", {});
  EXPECT_THAT(result, StatusIs(absl::StatusCode::kDataLoss,
                               HasSubstr("no result buffer")));
}

TEST_F(SessionMockTest, VmCreationFailure) {
  EXPECT_CALL(*runtime_, MakeVm()).WillOnce(Return(nullptr));
  EXPECT_CALL(*runtime_, EvaluateSnippet(_, _, _, _)).Times(0);
  EXPECT_CALL(*runtime_, DestroyVm(_)).Times(0);

  Session session(&guard_, config_);
  EXPECT_THAT(session.Run(config_.filename, "1", {}),
              StatusIs(absl::StatusCode::kResourceExhausted));
}

TEST(SessionInitTest, InitializationFailurePropagates) {
  RuntimeGuard broken([]() -> absl::StatusOr<std::unique_ptr<ForeignRuntime>> {
    return InitializationError("libjsonnet missing");
  });
  EvaluatorConfig config;
  Session session(&broken, config);
  absl::StatusOr<EvaluationResult> result =
      session.Run(config.filename, "1", {});
  EXPECT_THAT(result, StatusIs(absl::StatusCode::kUnavailable,
                               HasSubstr("libjsonnet missing")));
  EXPECT_THAT(GetErrorKind(result.status()), Eq(ErrorKind::kInitialization));
}

}  // namespace
}  // namespace jbridge
