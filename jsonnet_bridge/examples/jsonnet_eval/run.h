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

#ifndef JSONNET_BRIDGE_EXAMPLES_JSONNET_EVAL_RUN_H_
#define JSONNET_BRIDGE_EXAMPLES_JSONNET_EVAL_RUN_H_

#include <string>

#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "jsonnet_bridge/config.h"
#include "jsonnet_bridge/examples/jsonnet_eval/args.h"
#include "jsonnet_bridge/runtime.h"

namespace jbridge::jsonnet_eval {

struct RunOptions {
  // `filename` is ignored; it comes from the invocation.
  EvaluatorConfig config;
  // Zero means no limit.
  absl::Duration timeout = absl::ZeroDuration();
  // Re-print JSON output on one line.
  bool compact = true;
};

// Evaluates the program named by `invocation` and returns the text to print
// on stdout, newline-terminated. An evaluation failure is returned as an
// EvaluationFailureError carrying the evaluator's diagnostic.
absl::StatusOr<std::string> Run(const Invocation& invocation,
                                const RunOptions& options,
                                RuntimeGuard* guard = &RuntimeGuard::Default());

}  // namespace jbridge::jsonnet_eval

#endif  // JSONNET_BRIDGE_EXAMPLES_JSONNET_EVAL_RUN_H_
