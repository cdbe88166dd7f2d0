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

#ifndef JSONNET_BRIDGE_RUNTIME_API_H_
#define JSONNET_BRIDGE_RUNTIME_API_H_

#include <cstddef>
#include <memory>
#include <string>

extern "C" {
#include <libjsonnet.h>
}

#include "absl/status/statusor.h"

namespace jbridge {

// The C entry points of the embedded Jsonnet evaluator.
//
// Every buffer returned from EvaluateSnippet() is allocated by the evaluator
// and must be handed back through Realloc(vm, buf, 0) while `vm` is alive.
// Callers should not do this by hand; see ForeignBuffer.
//
// Implementations must be safe to call from multiple threads as long as each
// JsonnetVm is used by one thread at a time.
class ForeignRuntime {
 public:
  virtual ~ForeignRuntime() = default;

  // Returns the evaluator's version string, e.g. "v0.20.0".
  virtual std::string Version() = 0;

  // Creates and destroys evaluator instances.
  virtual JsonnetVm* MakeVm() = 0;
  virtual void DestroyVm(JsonnetVm* vm) = 0;

  // Per-VM limits and options.
  virtual void MaxStack(JsonnetVm* vm, unsigned int depth) = 0;
  virtual void MaxTrace(JsonnetVm* vm, unsigned int lines) = 0;
  virtual void StringOutput(JsonnetVm* vm, bool enabled) = 0;
  virtual void JpathAdd(JsonnetVm* vm, const char* path) = 0;

  // Binds an external variable to a literal string or to Jsonnet code.
  virtual void ExtVar(JsonnetVm* vm, const char* key, const char* value) = 0;
  virtual void ExtCode(JsonnetVm* vm, const char* key, const char* value) = 0;

  // Registers a function reachable through std.native(name). `params` is a
  // nullptr-terminated array of parameter names.
  virtual void NativeCallback(JsonnetVm* vm, const char* name,
                              JsonnetNativeCallback* cb, void* ctx,
                              const char* const* params) = 0;

  // Evaluates `snippet`. On return `*error` is zero if the result is JSON
  // text and non-zero if it is a diagnostic.
  virtual char* EvaluateSnippet(JsonnetVm* vm, const char* filename,
                                const char* snippet, int* error) = 0;

  // Allocates, resizes or (with size 0) frees evaluator-owned memory.
  virtual char* Realloc(JsonnetVm* vm, char* buf, size_t size) = 0;

  // Accessors for values passed to and returned from native callbacks.
  virtual const char* JsonExtractString(JsonnetVm* vm,
                                        const JsonnetJsonValue* v) = 0;
  virtual bool JsonExtractNumber(JsonnetVm* vm, const JsonnetJsonValue* v,
                                 double* out) = 0;
  // Returns 0 for false, 1 for true and 2 if `v` is not a boolean.
  virtual int JsonExtractBool(JsonnetVm* vm, const JsonnetJsonValue* v) = 0;
  virtual bool JsonExtractNull(JsonnetVm* vm, const JsonnetJsonValue* v) = 0;
  virtual JsonnetJsonValue* JsonMakeString(JsonnetVm* vm, const char* v) = 0;
  virtual JsonnetJsonValue* JsonMakeNumber(JsonnetVm* vm, double v) = 0;
  virtual JsonnetJsonValue* JsonMakeBool(JsonnetVm* vm, bool v) = 0;
  virtual JsonnetJsonValue* JsonMakeNull(JsonnetVm* vm) = 0;
};

// Forwards to the libjsonnet.h functions linked into this binary.
class LibJsonnetRuntime final : public ForeignRuntime {
 public:
  // Probes the linked evaluator (version query and one VM round trip) and
  // returns an InitializationError if it is not usable.
  static absl::StatusOr<std::unique_ptr<ForeignRuntime>> Create();

  std::string Version() override;
  JsonnetVm* MakeVm() override;
  void DestroyVm(JsonnetVm* vm) override;
  void MaxStack(JsonnetVm* vm, unsigned int depth) override;
  void MaxTrace(JsonnetVm* vm, unsigned int lines) override;
  void StringOutput(JsonnetVm* vm, bool enabled) override;
  void JpathAdd(JsonnetVm* vm, const char* path) override;
  void ExtVar(JsonnetVm* vm, const char* key, const char* value) override;
  void ExtCode(JsonnetVm* vm, const char* key, const char* value) override;
  void NativeCallback(JsonnetVm* vm, const char* name,
                      JsonnetNativeCallback* cb, void* ctx,
                      const char* const* params) override;
  char* EvaluateSnippet(JsonnetVm* vm, const char* filename,
                        const char* snippet, int* error) override;
  char* Realloc(JsonnetVm* vm, char* buf, size_t size) override;
  const char* JsonExtractString(JsonnetVm* vm,
                                const JsonnetJsonValue* v) override;
  bool JsonExtractNumber(JsonnetVm* vm, const JsonnetJsonValue* v,
                         double* out) override;
  int JsonExtractBool(JsonnetVm* vm, const JsonnetJsonValue* v) override;
  bool JsonExtractNull(JsonnetVm* vm, const JsonnetJsonValue* v) override;
  JsonnetJsonValue* JsonMakeString(JsonnetVm* vm, const char* v) override;
  JsonnetJsonValue* JsonMakeNumber(JsonnetVm* vm, double v) override;
  JsonnetJsonValue* JsonMakeBool(JsonnetVm* vm, bool v) override;
  JsonnetJsonValue* JsonMakeNull(JsonnetVm* vm) override;

 private:
  LibJsonnetRuntime() = default;
};

}  // namespace jbridge

#endif  // JSONNET_BRIDGE_RUNTIME_API_H_
