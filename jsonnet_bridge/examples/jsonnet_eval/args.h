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

#ifndef JSONNET_BRIDGE_EXAMPLES_JSONNET_EVAL_ARGS_H_
#define JSONNET_BRIDGE_EXAMPLES_JSONNET_EVAL_ARGS_H_

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "jsonnet_bridge/ext_vars.h"

namespace jbridge::jsonnet_eval {

inline constexpr char kExecFilename[] = "<exec>";

// What to evaluate, as given on the command line.
struct Invocation {
  // --ext-str and --ext-code bindings in command-line order.
  ExtVarTable vars;
  // -e/--exec: `input` is Jsonnet code rather than a file path.
  bool exec = false;
  std::string input;
};

// Removes --ext-str, --ext-code and -e/--exec from `args` and records them in
// `invocation`. These take repeated NAME=VALUE operands, which absl flags do
// not model, so they are handled before absl::ParseCommandLine(). The
// returned arguments, starting with the program name, are left for it.
// Fails with InvalidArgumentError on a missing operand or a missing '='.
absl::StatusOr<std::vector<char*>> ExtractArgs(absl::Span<char* const> args,
                                               Invocation* invocation);

// Takes FILE_OR_CODE from what absl::ParseCommandLine() left over, program
// name first.
absl::Status SetInput(absl::Span<char* const> positional,
                      Invocation* invocation);

}  // namespace jbridge::jsonnet_eval

#endif  // JSONNET_BRIDGE_EXAMPLES_JSONNET_EVAL_ARGS_H_
