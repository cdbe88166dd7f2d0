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

#include "jsonnet_bridge/evaluator.h"

#include <memory>
#include <thread>  // NOLINT(build/c++11)

#include "absl/algorithm/container.h"
#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "absl/synchronization/notification.h"
#include "jsonnet_bridge/session.h"
#include "jsonnet_bridge/util/status_macros.h"

namespace jbridge {

absl::Status Evaluator::RegisterNativeCallback(std::string name,
                                               std::vector<std::string> params,
                                               NativeFunction function) {
  NativeCallback callback{std::move(name), std::move(params),
                          std::move(function)};
  JBRIDGE_RETURN_IF_ERROR(ValidateNativeCallback(callback));
  auto it = absl::c_find_if(natives_, [&callback](const NativeCallback& n) {
    return n.name == callback.name;
  });
  if (it != natives_.end()) {
    VLOG(1) << "Native function '" << callback.name << "' replaced";
    *it = std::move(callback);
  } else {
    natives_.push_back(std::move(callback));
  }
  return absl::OkStatus();
}

absl::StatusOr<EvaluationResult> Evaluator::EvaluateSnippet(
    absl::string_view filename, absl::string_view source,
    const ExtVarTable& vars) const {
  Session session(guard_, config_, natives_);
  return session.Run(filename, source, vars);
}

absl::StatusOr<EvaluationResult> Evaluator::EvaluateSnippetWithTimeout(
    absl::string_view filename, absl::string_view source,
    const ExtVarTable& vars, absl::Duration timeout) const {
  if (timeout == absl::InfiniteDuration()) {
    return EvaluateSnippet(filename, source, vars);
  }

  // Shared with the worker, which may outlive this call.
  struct Handoff {
    absl::Notification done;
    absl::StatusOr<EvaluationResult> result;
  };
  auto handoff = std::make_shared<Handoff>();

  // The worker gets its own copies of everything so that abandoning it does
  // not leave it pointing into this evaluator or the caller's arguments.
  std::thread([handoff, guard = guard_, config = config_, natives = natives_,
               filename = std::string(filename),
               source = std::string(source), vars]() {
    Session session(guard, config, natives);
    handoff->result = session.Run(filename, source, vars);
    handoff->done.Notify();
  }).detach();

  if (!handoff->done.WaitForNotificationWithTimeout(timeout)) {
    LOG(WARNING) << "Evaluation of '" << filename << "' did not finish within "
                 << timeout << "; abandoning its worker thread";
    return absl::DeadlineExceededError(
        absl::StrCat("Jsonnet evaluation of '", filename,
                     "' did not finish within ",
                     absl::FormatDuration(timeout)));
  }
  return std::move(handoff->result);
}

absl::StatusOr<std::string> Evaluator::LibraryVersion(RuntimeGuard* guard) {
  JBRIDGE_ASSIGN_OR_RETURN(ForeignRuntime * runtime, guard->Get());
  return runtime->Version();
}

}  // namespace jbridge
