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

#include "jsonnet_bridge/runtime_api.h"

#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"
#include "jsonnet_bridge/errors.h"

namespace jbridge {

absl::StatusOr<std::unique_ptr<ForeignRuntime>> LibJsonnetRuntime::Create() {
  const char* version = jsonnet_version();
  if (version == nullptr || *version == '\0') {
    return InitializationError("Jsonnet evaluator reported no version");
  }
  JsonnetVm* vm = jsonnet_make();
  if (vm == nullptr) {
    return InitializationError(
        absl::StrCat("Could not create a Jsonnet VM (evaluator ", version,
                     ")"));
  }
  jsonnet_destroy(vm);
  // Using `new` to access a non-public constructor.
  return absl::WrapUnique(new LibJsonnetRuntime());
}

std::string LibJsonnetRuntime::Version() { return jsonnet_version(); }

JsonnetVm* LibJsonnetRuntime::MakeVm() { return jsonnet_make(); }

void LibJsonnetRuntime::DestroyVm(JsonnetVm* vm) { jsonnet_destroy(vm); }

void LibJsonnetRuntime::MaxStack(JsonnetVm* vm, unsigned int depth) {
  jsonnet_max_stack(vm, depth);
}

void LibJsonnetRuntime::MaxTrace(JsonnetVm* vm, unsigned int lines) {
  jsonnet_max_trace(vm, lines);
}

void LibJsonnetRuntime::StringOutput(JsonnetVm* vm, bool enabled) {
  jsonnet_string_output(vm, enabled ? 1 : 0);
}

void LibJsonnetRuntime::JpathAdd(JsonnetVm* vm, const char* path) {
  jsonnet_jpath_add(vm, path);
}

void LibJsonnetRuntime::ExtVar(JsonnetVm* vm, const char* key,
                               const char* value) {
  jsonnet_ext_var(vm, key, value);
}

void LibJsonnetRuntime::ExtCode(JsonnetVm* vm, const char* key,
                                const char* value) {
  jsonnet_ext_code(vm, key, value);
}

void LibJsonnetRuntime::NativeCallback(JsonnetVm* vm, const char* name,
                                       JsonnetNativeCallback* cb, void* ctx,
                                       const char* const* params) {
  jsonnet_native_callback(vm, name, cb, ctx, params);
}

char* LibJsonnetRuntime::EvaluateSnippet(JsonnetVm* vm, const char* filename,
                                         const char* snippet, int* error) {
  return jsonnet_evaluate_snippet(vm, filename, snippet, error);
}

char* LibJsonnetRuntime::Realloc(JsonnetVm* vm, char* buf, size_t size) {
  return jsonnet_realloc(vm, buf, size);
}

const char* LibJsonnetRuntime::JsonExtractString(JsonnetVm* vm,
                                                 const JsonnetJsonValue* v) {
  return jsonnet_json_extract_string(vm, v);
}

bool LibJsonnetRuntime::JsonExtractNumber(JsonnetVm* vm,
                                          const JsonnetJsonValue* v,
                                          double* out) {
  return jsonnet_json_extract_number(vm, v, out) != 0;
}

int LibJsonnetRuntime::JsonExtractBool(JsonnetVm* vm,
                                       const JsonnetJsonValue* v) {
  return jsonnet_json_extract_bool(vm, v);
}

bool LibJsonnetRuntime::JsonExtractNull(JsonnetVm* vm,
                                        const JsonnetJsonValue* v) {
  return jsonnet_json_extract_null(vm, v) != 0;
}

JsonnetJsonValue* LibJsonnetRuntime::JsonMakeString(JsonnetVm* vm,
                                                    const char* v) {
  return jsonnet_json_make_string(vm, v);
}

JsonnetJsonValue* LibJsonnetRuntime::JsonMakeNumber(JsonnetVm* vm, double v) {
  return jsonnet_json_make_number(vm, v);
}

JsonnetJsonValue* LibJsonnetRuntime::JsonMakeBool(JsonnetVm* vm, bool v) {
  return jsonnet_json_make_bool(vm, v ? 1 : 0);
}

JsonnetJsonValue* LibJsonnetRuntime::JsonMakeNull(JsonnetVm* vm) {
  return jsonnet_json_make_null(vm);
}

}  // namespace jbridge
