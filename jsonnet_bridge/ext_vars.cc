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

#include "jsonnet_bridge/ext_vars.h"

#include <utility>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "jsonnet_bridge/errors.h"
#include "jsonnet_bridge/marshal.h"
#include "jsonnet_bridge/util/status_macros.h"

namespace jbridge {

std::ostream& operator<<(std::ostream& os, ExtVarKind kind) {
  switch (kind) {
    case ExtVarKind::kString:
      return os << "string";
    case ExtVarKind::kCode:
      return os << "code";
  }
  return os << "unknown";
}

ExtVarTable::ExtVarTable(std::initializer_list<ExtVar> vars) {
  for (const ExtVar& var : vars) {
    Set(var);
  }
}

ExtVarTable& ExtVarTable::Set(ExtVar var) {
  auto [it, inserted] = index_.try_emplace(var.name, vars_.size());
  if (inserted) {
    vars_.push_back(std::move(var));
    return *this;
  }
  ExtVar& existing = vars_[it->second];
  VLOG(1) << "External variable '" << existing.name << "' (" << existing.kind
          << ") replaced by a later " << var.kind << " value";
  existing.value = std::move(var.value);
  existing.kind = var.kind;
  return *this;
}

const ExtVar* ExtVarTable::Find(absl::string_view name) const {
  auto it = index_.find(name);
  return it == index_.end() ? nullptr : &vars_[it->second];
}

absl::StatusOr<ExtVarRegistration> ExtVarRegistration::Build(
    const ExtVarTable& table) {
  ExtVarRegistration registration;
  registration.entries_.reserve(table.size());
  for (const ExtVar& var : table.vars()) {
    if (var.name.empty()) {
      return InvalidInputError("External variable name must not be empty");
    }
    Entry entry;
    entry.kind = var.kind;
    JBRIDGE_ASSIGN_OR_RETURN(entry.name,
                             ToForeign(var.name, "External variable name"));
    JBRIDGE_ASSIGN_OR_RETURN(
        entry.value,
        ToForeign(var.value, absl::StrCat("Value of external variable '",
                                          var.name, "'")));
    registration.entries_.push_back(std::move(entry));
  }
  return registration;
}

void ExtVarRegistration::Apply(ForeignRuntime* runtime, JsonnetVm* vm) const {
  for (const Entry& entry : entries_) {
    VLOG(1) << "Binding external variable '" << entry.name << "' as "
            << entry.kind;
    switch (entry.kind) {
      case ExtVarKind::kString:
        runtime->ExtVar(vm, entry.name.c_str(), entry.value.c_str());
        break;
      case ExtVarKind::kCode:
        runtime->ExtCode(vm, entry.name.c_str(), entry.value.c_str());
        break;
    }
  }
}

}  // namespace jbridge
