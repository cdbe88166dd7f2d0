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

#ifndef JSONNET_BRIDGE_EXT_VARS_H_
#define JSONNET_BRIDGE_EXT_VARS_H_

#include <cstddef>
#include <initializer_list>
#include <ostream>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "jsonnet_bridge/runtime_api.h"

namespace jbridge {

enum class ExtVarKind {
  // The value is bound as a Jsonnet string.
  kString,
  // The value is Jsonnet source, evaluated when std.extVar() reads it.
  kCode,
};

std::ostream& operator<<(std::ostream& os, ExtVarKind kind);

struct ExtVar {
  std::string name;
  std::string value;
  ExtVarKind kind = ExtVarKind::kString;
};

// An ordered set of external variables for one evaluation.
//
// Names are unique: setting a name that is already present replaces its value
// and kind (last write wins) while keeping the position of the first write.
// Names are not validated here; ExtVarRegistration::Build() rejects them.
class ExtVarTable {
 public:
  ExtVarTable() = default;
  ExtVarTable(std::initializer_list<ExtVar> vars);

  ExtVarTable& Set(ExtVar var);
  ExtVarTable& SetString(absl::string_view name, absl::string_view value) {
    return Set({std::string(name), std::string(value), ExtVarKind::kString});
  }
  ExtVarTable& SetCode(absl::string_view name, absl::string_view code) {
    return Set({std::string(name), std::string(code), ExtVarKind::kCode});
  }

  // Returns nullptr if `name` is not set.
  const ExtVar* Find(absl::string_view name) const;

  const std::vector<ExtVar>& vars() const { return vars_; }
  size_t size() const { return vars_.size(); }
  bool empty() const { return vars_.empty(); }

 private:
  std::vector<ExtVar> vars_;
  absl::flat_hash_map<std::string, size_t> index_;
};

// The validated, boundary-ready form of an ExtVarTable.
class ExtVarRegistration {
 public:
  // Checks every variable before anything is sent to the evaluator. Fails
  // with InvalidInputError if a name is empty, or if a name or value contains
  // a NUL byte or invalid UTF-8.
  static absl::StatusOr<ExtVarRegistration> Build(const ExtVarTable& table);

  // Binds every variable on `vm`, one ext_var or ext_code call per entry in
  // table order.
  void Apply(ForeignRuntime* runtime, JsonnetVm* vm) const;

  size_t size() const { return entries_.size(); }

 private:
  struct Entry {
    std::string name;
    std::string value;
    ExtVarKind kind;
  };

  ExtVarRegistration() = default;

  std::vector<Entry> entries_;
};

}  // namespace jbridge

#endif  // JSONNET_BRIDGE_EXT_VARS_H_
