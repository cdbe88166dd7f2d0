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

#ifndef JSONNET_BRIDGE_NATIVE_CALLBACK_H_
#define JSONNET_BRIDGE_NATIVE_CALLBACK_H_

#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "jsonnet_bridge/runtime_api.h"

namespace jbridge {

// A scalar exchanged with a native function: null, boolean, number or string.
using NativeValue = std::variant<std::monostate, bool, double, std::string>;

std::ostream& operator<<(std::ostream& os, const NativeValue& value);

// A host function callable from Jsonnet through std.native(name). It receives
// one argument per declared parameter. Returning an error status raises a
// Jsonnet runtime error carrying the status message.
using NativeFunction =
    std::function<absl::StatusOr<NativeValue>(absl::Span<const NativeValue>)>;

struct NativeCallback {
  std::string name;
  std::vector<std::string> params;
  NativeFunction function;
};

// Fails with InvalidInputError if the name or a parameter is empty, contains
// a NUL byte or invalid UTF-8, or if the function is empty.
absl::Status ValidateNativeCallback(const NativeCallback& callback);

// Binds a NativeCallback to one VM. Must outlive every evaluation on that VM,
// since the evaluator calls back through a pointer to this object.
class NativeCallbackBinding {
 public:
  NativeCallbackBinding(ForeignRuntime* runtime, JsonnetVm* vm,
                        const NativeCallback* callback);

  NativeCallbackBinding(const NativeCallbackBinding&) = delete;
  NativeCallbackBinding& operator=(const NativeCallbackBinding&) = delete;

  // Registers the trampoline with the evaluator.
  void Register();

 private:
  // Matches JsonnetNativeCallback.
  static JsonnetJsonValue* Trampoline(void* ctx,
                                      const JsonnetJsonValue* const* argv,
                                      int* success);

  absl::StatusOr<NativeValue> ExtractArgument(const JsonnetJsonValue* value,
                                              size_t index) const;
  absl::StatusOr<JsonnetJsonValue*> MakeResult(const NativeValue& value) const;

  ForeignRuntime* runtime_;
  JsonnetVm* vm_;
  const NativeCallback* callback_;
  // nullptr-terminated parameter names, pointing into callback_->params.
  std::vector<const char*> param_ptrs_;
};

}  // namespace jbridge

#endif  // JSONNET_BRIDGE_NATIVE_CALLBACK_H_
