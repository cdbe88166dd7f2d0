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

#ifndef JSONNET_BRIDGE_EVALUATOR_H_
#define JSONNET_BRIDGE_EVALUATOR_H_

#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "jsonnet_bridge/config.h"
#include "jsonnet_bridge/ext_vars.h"
#include "jsonnet_bridge/native_callback.h"
#include "jsonnet_bridge/result.h"
#include "jsonnet_bridge/runtime.h"

namespace jbridge {

// Evaluates Jsonnet programs through the embedded evaluator.
//
// Example:
//   jbridge::Evaluator evaluator;
//   jbridge::ExtVarTable vars;
//   vars.SetString("foo", "bar").SetCode("hoge", "1");
//   JBRIDGE_ASSIGN_OR_RETURN(
//       jbridge::EvaluationResult result,
//       evaluator.Evaluate(R"({foo: std.extVar("foo")})", vars));
//   if (!result.ok()) {
//     LOG(ERROR) << result.error();
//   }
//
// The const evaluation methods may be called concurrently from any number of
// threads; each call runs its own Session. RegisterNativeCallback() must not
// race with evaluations.
class Evaluator {
 public:
  // `guard` must outlive the evaluator and every worker started by
  // EvaluateWithTimeout(). The default guard lives for the whole process.
  explicit Evaluator(EvaluatorConfig config = {},
                     RuntimeGuard* guard = &RuntimeGuard::Default())
      : config_(std::move(config)), guard_(guard) {}

  const EvaluatorConfig& config() const { return config_; }

  // Makes `function` reachable from Jsonnet as std.native(name). Registering
  // a name again replaces the earlier function.
  absl::Status RegisterNativeCallback(std::string name,
                                      std::vector<std::string> params,
                                      NativeFunction function);

  // Evaluates `source`, naming it config().filename in diagnostics.
  absl::StatusOr<EvaluationResult> Evaluate(
      absl::string_view source, const ExtVarTable& vars = {}) const {
    return EvaluateSnippet(config_.filename, source, vars);
  }

  absl::StatusOr<EvaluationResult> EvaluateSnippet(
      absl::string_view filename, absl::string_view source,
      const ExtVarTable& vars = {}) const;

  // Runs the evaluation on a dedicated thread and waits at most `timeout`.
  // The evaluator cannot be interrupted, so on timeout the worker thread is
  // abandoned: it keeps running, releases its own resources once the
  // evaluator returns, and its result is discarded. Returns
  // DeadlineExceededError in that case.
  absl::StatusOr<EvaluationResult> EvaluateWithTimeout(
      absl::string_view source, const ExtVarTable& vars,
      absl::Duration timeout) const {
    return EvaluateSnippetWithTimeout(config_.filename, source, vars, timeout);
  }

  absl::StatusOr<EvaluationResult> EvaluateSnippetWithTimeout(
      absl::string_view filename, absl::string_view source,
      const ExtVarTable& vars, absl::Duration timeout) const;

  // Returns the version of the embedded evaluator.
  static absl::StatusOr<std::string> LibraryVersion(
      RuntimeGuard* guard = &RuntimeGuard::Default());

 private:
  EvaluatorConfig config_;
  RuntimeGuard* guard_;
  std::vector<NativeCallback> natives_;
};

}  // namespace jbridge

#endif  // JSONNET_BRIDGE_EVALUATOR_H_
