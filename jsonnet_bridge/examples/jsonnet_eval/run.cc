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

#include "jsonnet_bridge/examples/jsonnet_eval/run.h"

#include <utility>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "jsonnet_bridge/evaluator.h"
#include "jsonnet_bridge/json.h"
#include "jsonnet_bridge/result.h"
#include "jsonnet_bridge/util/file_helpers.h"
#include "jsonnet_bridge/util/status_macros.h"

namespace jbridge::jsonnet_eval {

absl::StatusOr<std::string> Run(const Invocation& invocation,
                                const RunOptions& options,
                                RuntimeGuard* guard) {
  EvaluatorConfig config = options.config;
  std::string source;
  if (invocation.exec) {
    config.filename = kExecFilename;
    source = invocation.input;
  } else {
    config.filename = invocation.input;
    JBRIDGE_ASSIGN_OR_RETURN(source, file::GetContents(invocation.input));
  }
  VLOG(1) << "Evaluating " << config.filename << " with "
          << invocation.vars.size() << " external variable(s)";

  Evaluator evaluator(std::move(config), guard);
  const absl::Duration timeout = options.timeout > absl::ZeroDuration()
                                     ? options.timeout
                                     : absl::InfiniteDuration();
  JBRIDGE_ASSIGN_OR_RETURN(
      EvaluationResult result,
      evaluator.EvaluateWithTimeout(source, invocation.vars, timeout));
  JBRIDGE_ASSIGN_OR_RETURN(std::string output, std::move(result).ToStatusOr());

  if (!options.compact || evaluator.config().string_output) {
    return output;
  }
  JBRIDGE_ASSIGN_OR_RETURN(std::string compact, CompactJson(output));
  return absl::StrCat(compact, "\n");
}

}  // namespace jbridge::jsonnet_eval
