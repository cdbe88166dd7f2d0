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
#include <utility>
#include <vector>

#include "absl/cleanup/cleanup.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"
#include "jsonnet_bridge/foreign_buffer.h"
#include "jsonnet_bridge/marshal.h"
#include "jsonnet_bridge/util/status_macros.h"

namespace jbridge {
namespace {

// Held for the whole VM lifetime when EvaluatorConfig::serialize_foreign_calls
// is set.
absl::Mutex& ForeignCallMutex() {
  static auto* mu = new absl::Mutex();
  return *mu;
}

}  // namespace

absl::StatusOr<EvaluationResult> Session::Run(absl::string_view filename,
                                              absl::string_view source,
                                              const ExtVarTable& vars) const {
  JBRIDGE_ASSIGN_OR_RETURN(ForeignRuntime * runtime, guard_->Get());

  // Validate and marshal everything before a VM exists, so that rejected
  // input never reaches the evaluator.
  JBRIDGE_ASSIGN_OR_RETURN(std::string c_filename,
                           ToForeign(filename, "Snippet filename"));
  JBRIDGE_ASSIGN_OR_RETURN(std::string c_source,
                           ToForeign(source, "Jsonnet source"));
  JBRIDGE_ASSIGN_OR_RETURN(ExtVarRegistration ext_vars,
                           ExtVarRegistration::Build(vars));
  std::vector<std::string> import_paths;
  import_paths.reserve(config_.import_paths.size());
  for (const std::string& path : config_.import_paths) {
    JBRIDGE_ASSIGN_OR_RETURN(std::string c_path,
                             ToForeign(path, "Import path"));
    import_paths.push_back(std::move(c_path));
  }
  for (const NativeCallback& native : natives_) {
    JBRIDGE_RETURN_IF_ERROR(ValidateNativeCallback(native));
  }

  absl::MutexLockMaybe serialize(
      config_.serialize_foreign_calls ? &ForeignCallMutex() : nullptr);

  JsonnetVm* vm = runtime->MakeVm();
  if (vm == nullptr) {
    return absl::ResourceExhaustedError("Could not create a Jsonnet VM");
  }
  absl::Cleanup destroy_vm = [runtime, vm] { runtime->DestroyVm(vm); };
  VLOG(1) << "Evaluating '" << c_filename << "' (" << c_source.size()
          << " bytes, " << ext_vars.size() << " external variable(s))";

  if (config_.max_stack > 0) {
    runtime->MaxStack(vm, config_.max_stack);
  }
  if (config_.max_trace > 0) {
    runtime->MaxTrace(vm, config_.max_trace);
  }
  if (config_.string_output) {
    runtime->StringOutput(vm, true);
  }
  for (const std::string& path : import_paths) {
    runtime->JpathAdd(vm, path.c_str());
  }
  ext_vars.Apply(runtime, vm);

  // The evaluator calls back into the bindings until EvaluateSnippet()
  // returns; they are destroyed before the VM.
  std::vector<std::unique_ptr<NativeCallbackBinding>> bindings;
  bindings.reserve(natives_.size());
  for (const NativeCallback& native : natives_) {
    bindings.push_back(
        std::make_unique<NativeCallbackBinding>(runtime, vm, &native));
    bindings.back()->Register();
  }

  int error = 0;
  ForeignBuffer output(
      runtime, vm,
      runtime->EvaluateSnippet(vm, c_filename.c_str(), c_source.c_str(),
                               &error));
  absl::StatusOr<std::string> text = FromForeign(output);
  // Released on every path, including the encoding failure below.
  output.Release();
  JBRIDGE_RETURN_IF_ERROR(text.status());

  if (error != 0) {
    VLOG(1) << "Evaluation of '" << c_filename << "' failed: " << *text;
    return EvaluationResult::Failure(*std::move(text));
  }
  return EvaluationResult::Success(*std::move(text));
}

}  // namespace jbridge
