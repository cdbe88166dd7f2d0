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

#ifndef JSONNET_BRIDGE_SESSION_H_
#define JSONNET_BRIDGE_SESSION_H_

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "jsonnet_bridge/config.h"
#include "jsonnet_bridge/ext_vars.h"
#include "jsonnet_bridge/native_callback.h"
#include "jsonnet_bridge/result.h"
#include "jsonnet_bridge/runtime.h"

namespace jbridge {

// One evaluation of a Jsonnet program, from marshaling the inputs to
// releasing the evaluator's result buffer.
//
// Every call to Run() creates a fresh VM, binds the external variables and
// native callbacks on it, evaluates, copies the result out, releases the
// result buffer and destroys the VM. Nothing is shared between calls except
// the runtime obtained from the guard, so sessions on different threads do
// not see each other's variables or output.
//
// Run() blocks until the evaluator returns and cannot be interrupted.
class Session {
 public:
  // `guard`, `config` and the callbacks in `natives` must outlive the
  // session.
  Session(RuntimeGuard* guard, const EvaluatorConfig& config,
          absl::Span<const NativeCallback> natives = {})
      : guard_(guard), config_(config), natives_(natives) {}

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  // Returns EvaluationResult::Failure if the program does not parse or
  // evaluate. Returns InvalidInputError for rejected inputs (nothing reaches
  // the evaluator), EncodingError if the output is unreadable (the buffer is
  // already released) and InitializationError if the runtime cannot start.
  absl::StatusOr<EvaluationResult> Run(absl::string_view filename,
                                       absl::string_view source,
                                       const ExtVarTable& vars) const;

 private:
  RuntimeGuard* guard_;
  const EvaluatorConfig& config_;
  absl::Span<const NativeCallback> natives_;
};

}  // namespace jbridge

#endif  // JSONNET_BRIDGE_SESSION_H_
