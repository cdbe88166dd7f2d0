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

#include "jsonnet_bridge/native_callback.h"

#include <cstddef>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "jsonnet_bridge/errors.h"
#include "jsonnet_bridge/marshal.h"
#include "jsonnet_bridge/util/status_macros.h"

namespace jbridge {

std::ostream& operator<<(std::ostream& os, const NativeValue& value) {
  if (std::holds_alternative<std::monostate>(value)) {
    return os << "null";
  }
  if (const bool* b = std::get_if<bool>(&value)) {
    return os << (*b ? "true" : "false");
  }
  if (const double* d = std::get_if<double>(&value)) {
    return os << *d;
  }
  return os << '"' << std::get<std::string>(value) << '"';
}

absl::Status ValidateNativeCallback(const NativeCallback& callback) {
  if (callback.name.empty()) {
    return InvalidInputError("Native function name must not be empty");
  }
  JBRIDGE_RETURN_IF_ERROR(
      ToForeign(callback.name, "Native function name").status());
  for (const std::string& param : callback.params) {
    if (param.empty()) {
      return InvalidInputError(absl::StrCat(
          "Native function '", callback.name, "' has an empty parameter name"));
    }
    JBRIDGE_RETURN_IF_ERROR(
        ToForeign(param, absl::StrCat("Parameter of native function '",
                                      callback.name, "'"))
            .status());
  }
  if (!callback.function) {
    return InvalidInputError(absl::StrCat("Native function '", callback.name,
                                          "' has no implementation"));
  }
  return absl::OkStatus();
}

NativeCallbackBinding::NativeCallbackBinding(ForeignRuntime* runtime,
                                             JsonnetVm* vm,
                                             const NativeCallback* callback)
    : runtime_(runtime), vm_(vm), callback_(callback) {
  param_ptrs_.reserve(callback_->params.size() + 1);
  for (const std::string& param : callback_->params) {
    param_ptrs_.push_back(param.c_str());
  }
  param_ptrs_.push_back(nullptr);
}

void NativeCallbackBinding::Register() {
  VLOG(1) << "Registering native function '" << callback_->name << "' with "
          << callback_->params.size() << " parameter(s)";
  runtime_->NativeCallback(vm_, callback_->name.c_str(),
                           &NativeCallbackBinding::Trampoline, this,
                           param_ptrs_.data());
}

JsonnetJsonValue* NativeCallbackBinding::Trampoline(
    void* ctx, const JsonnetJsonValue* const* argv, int* success) {
  auto* self = static_cast<NativeCallbackBinding*>(ctx);
  const size_t argc = self->callback_->params.size();

  std::vector<NativeValue> args;
  args.reserve(argc);
  absl::StatusOr<NativeValue> result;
  for (size_t i = 0; i < argc; ++i) {
    absl::StatusOr<NativeValue> arg = self->ExtractArgument(argv[i], i);
    if (!arg.ok()) {
      result = arg.status();
      break;
    }
    args.push_back(*std::move(arg));
  }
  if (args.size() == argc) {
    result = self->callback_->function(absl::MakeConstSpan(args));
  }

  absl::StatusOr<JsonnetJsonValue*> value =
      result.ok() ? self->MakeResult(*result)
                  : absl::StatusOr<JsonnetJsonValue*>(result.status());
  if (!value.ok()) {
    VLOG(1) << "Native function '" << self->callback_->name
            << "' failed: " << value.status();
    // On failure the evaluator expects the error message as a string value.
    *success = 0;
    const std::string message(value.status().message());
    return self->runtime_->JsonMakeString(self->vm_, message.c_str());
  }
  *success = 1;
  return *value;
}

absl::StatusOr<NativeValue> NativeCallbackBinding::ExtractArgument(
    const JsonnetJsonValue* value, size_t index) const {
  if (const char* s = runtime_->JsonExtractString(vm_, value)) {
    return NativeValue(std::string(s));
  }
  double number;
  if (runtime_->JsonExtractNumber(vm_, value, &number)) {
    return NativeValue(number);
  }
  if (int b = runtime_->JsonExtractBool(vm_, value); b != 2) {
    return NativeValue(b == 1);
  }
  if (runtime_->JsonExtractNull(vm_, value)) {
    return NativeValue();
  }
  return InvalidInputError(absl::StrCat(
      "Argument '", callback_->params[index], "' of native function '",
      callback_->name, "' must be null, a boolean, a number or a string"));
}

absl::StatusOr<JsonnetJsonValue*> NativeCallbackBinding::MakeResult(
    const NativeValue& value) const {
  if (std::holds_alternative<std::monostate>(value)) {
    return runtime_->JsonMakeNull(vm_);
  }
  if (const bool* b = std::get_if<bool>(&value)) {
    return runtime_->JsonMakeBool(vm_, *b);
  }
  if (const double* d = std::get_if<double>(&value)) {
    return runtime_->JsonMakeNumber(vm_, *d);
  }
  JBRIDGE_ASSIGN_OR_RETURN(
      std::string s,
      ToForeign(std::get<std::string>(value),
                absl::StrCat("Result of native function '", callback_->name,
                             "'")));
  return runtime_->JsonMakeString(vm_, s.c_str());
}

}  // namespace jbridge
