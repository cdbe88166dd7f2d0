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

#ifndef JSONNET_BRIDGE_TESTING_H_
#define JSONNET_BRIDGE_TESTING_H_

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "gmock/gmock.h"
#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_set.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "jsonnet_bridge/runtime_api.h"
#include "jsonnet_bridge/util/status_matchers.h"  // IWYU pragma: export

namespace jbridge {

class MockForeignRuntime : public ForeignRuntime {
 public:
  MOCK_METHOD(std::string, Version, (), (override));
  MOCK_METHOD(JsonnetVm*, MakeVm, (), (override));
  MOCK_METHOD(void, DestroyVm, (JsonnetVm*), (override));
  MOCK_METHOD(void, MaxStack, (JsonnetVm*, unsigned int), (override));
  MOCK_METHOD(void, MaxTrace, (JsonnetVm*, unsigned int), (override));
  MOCK_METHOD(void, StringOutput, (JsonnetVm*, bool), (override));
  MOCK_METHOD(void, JpathAdd, (JsonnetVm*, const char*), (override));
  MOCK_METHOD(void, ExtVar, (JsonnetVm*, const char*, const char*),
              (override));
  MOCK_METHOD(void, ExtCode, (JsonnetVm*, const char*, const char*),
              (override));
  MOCK_METHOD(void, NativeCallback,
              (JsonnetVm*, const char*, JsonnetNativeCallback*, void*,
               const char* const*),
              (override));
  MOCK_METHOD(char*, EvaluateSnippet,
              (JsonnetVm*, const char*, const char*, int*), (override));
  MOCK_METHOD(char*, Realloc, (JsonnetVm*, char*, size_t), (override));
  MOCK_METHOD(const char*, JsonExtractString,
              (JsonnetVm*, const JsonnetJsonValue*), (override));
  MOCK_METHOD(bool, JsonExtractNumber,
              (JsonnetVm*, const JsonnetJsonValue*, double*), (override));
  MOCK_METHOD(int, JsonExtractBool, (JsonnetVm*, const JsonnetJsonValue*),
              (override));
  MOCK_METHOD(bool, JsonExtractNull, (JsonnetVm*, const JsonnetJsonValue*),
              (override));
  MOCK_METHOD(JsonnetJsonValue*, JsonMakeString, (JsonnetVm*, const char*),
              (override));
  MOCK_METHOD(JsonnetJsonValue*, JsonMakeNumber, (JsonnetVm*, double),
              (override));
  MOCK_METHOD(JsonnetJsonValue*, JsonMakeBool, (JsonnetVm*, bool),
              (override));
  MOCK_METHOD(JsonnetJsonValue*, JsonMakeNull, (JsonnetVm*), (override));
};

// A ForeignRuntime decorator that records what crosses the boundary: VMs
// created and destroyed, result buffers handed out and released, and the
// variables bound. It can also replace the next evaluation result, e.g. with
// bytes that are not valid UTF-8. Thread-safe.
class TrackingRuntime : public ForeignRuntime {
 public:
  explicit TrackingRuntime(std::unique_ptr<ForeignRuntime> wrapped)
      : wrapped_(std::move(wrapped)) {}

  // Wraps LibJsonnetRuntime.
  static absl::StatusOr<std::unique_ptr<TrackingRuntime>> Create();

  // Makes the next EvaluateSnippet() skip the evaluator and return a buffer
  // holding `bytes` (allocated through the evaluator) with `error` as flag.
  void InjectNextResult(std::string bytes, int error);

  int vms_created() const ABSL_LOCKS_EXCLUDED(mu_);
  int vms_destroyed() const ABSL_LOCKS_EXCLUDED(mu_);
  int buffers_returned() const ABSL_LOCKS_EXCLUDED(mu_);
  int buffers_released() const ABSL_LOCKS_EXCLUDED(mu_);
  int evaluations() const ABSL_LOCKS_EXCLUDED(mu_);
  // Result buffers handed out but not yet released.
  size_t outstanding_buffers() const ABSL_LOCKS_EXCLUDED(mu_);
  // Releases of pointers that were never handed out or were already freed.
  int bad_releases() const ABSL_LOCKS_EXCLUDED(mu_);
  // "string:<name>" or "code:<name>" per binding, in call order.
  std::vector<std::string> bindings() const ABSL_LOCKS_EXCLUDED(mu_);

  std::string Version() override { return wrapped_->Version(); }
  JsonnetVm* MakeVm() override;
  void DestroyVm(JsonnetVm* vm) override;
  void MaxStack(JsonnetVm* vm, unsigned int depth) override {
    wrapped_->MaxStack(vm, depth);
  }
  void MaxTrace(JsonnetVm* vm, unsigned int lines) override {
    wrapped_->MaxTrace(vm, lines);
  }
  void StringOutput(JsonnetVm* vm, bool enabled) override {
    wrapped_->StringOutput(vm, enabled);
  }
  void JpathAdd(JsonnetVm* vm, const char* path) override {
    wrapped_->JpathAdd(vm, path);
  }
  void ExtVar(JsonnetVm* vm, const char* key, const char* value) override;
  void ExtCode(JsonnetVm* vm, const char* key, const char* value) override;
  void NativeCallback(JsonnetVm* vm, const char* name,
                      JsonnetNativeCallback* cb, void* ctx,
                      const char* const* params) override {
    wrapped_->NativeCallback(vm, name, cb, ctx, params);
  }
  char* EvaluateSnippet(JsonnetVm* vm, const char* filename,
                        const char* snippet, int* error) override;
  char* Realloc(JsonnetVm* vm, char* buf, size_t size) override;
  const char* JsonExtractString(JsonnetVm* vm,
                                const JsonnetJsonValue* v) override {
    return wrapped_->JsonExtractString(vm, v);
  }
  bool JsonExtractNumber(JsonnetVm* vm, const JsonnetJsonValue* v,
                         double* out) override {
    return wrapped_->JsonExtractNumber(vm, v, out);
  }
  int JsonExtractBool(JsonnetVm* vm, const JsonnetJsonValue* v) override {
    return wrapped_->JsonExtractBool(vm, v);
  }
  bool JsonExtractNull(JsonnetVm* vm, const JsonnetJsonValue* v) override {
    return wrapped_->JsonExtractNull(vm, v);
  }
  JsonnetJsonValue* JsonMakeString(JsonnetVm* vm, const char* v) override {
    return wrapped_->JsonMakeString(vm, v);
  }
  JsonnetJsonValue* JsonMakeNumber(JsonnetVm* vm, double v) override {
    return wrapped_->JsonMakeNumber(vm, v);
  }
  JsonnetJsonValue* JsonMakeBool(JsonnetVm* vm, bool v) override {
    return wrapped_->JsonMakeBool(vm, v);
  }
  JsonnetJsonValue* JsonMakeNull(JsonnetVm* vm) override {
    return wrapped_->JsonMakeNull(vm);
  }

 private:
  struct Injected {
    std::string bytes;
    int error;
  };

  std::unique_ptr<ForeignRuntime> wrapped_;

  mutable absl::Mutex mu_;
  std::optional<Injected> injected_ ABSL_GUARDED_BY(mu_);
  absl::flat_hash_set<char*> live_buffers_ ABSL_GUARDED_BY(mu_);
  std::vector<std::string> bindings_ ABSL_GUARDED_BY(mu_);
  int vms_created_ ABSL_GUARDED_BY(mu_) = 0;
  int vms_destroyed_ ABSL_GUARDED_BY(mu_) = 0;
  int buffers_returned_ ABSL_GUARDED_BY(mu_) = 0;
  int buffers_released_ ABSL_GUARDED_BY(mu_) = 0;
  int bad_releases_ ABSL_GUARDED_BY(mu_) = 0;
  int evaluations_ ABSL_GUARDED_BY(mu_) = 0;
};

}  // namespace jbridge

#endif  // JSONNET_BRIDGE_TESTING_H_
