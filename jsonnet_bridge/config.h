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

#ifndef JSONNET_BRIDGE_CONFIG_H_
#define JSONNET_BRIDGE_CONFIG_H_

#include <string>
#include <vector>

namespace jbridge {

// Filename used in diagnostics when the caller does not name the snippet.
inline constexpr char kDefaultSnippetFilename[] = "<snippet>";

struct EvaluatorConfig {
  // Shown in evaluator diagnostics, e.g. "<snippet>:1:7-10 ...".
  std::string filename = kDefaultSnippetFilename;

  // Maximum evaluation stack depth. 0 keeps the evaluator default.
  unsigned int max_stack = 0;

  // Maximum number of stack frames in a diagnostic. 0 keeps the evaluator
  // default.
  unsigned int max_trace = 0;

  // Library search directories for import statements, in priority order.
  std::vector<std::string> import_paths;

  // Expect the program to produce a string and return it unquoted.
  bool string_output = false;

  // Serialize all evaluator work in the process behind one lock. Sessions
  // use separate VMs and normally run concurrently; this is a fallback for
  // evaluator builds that are not safe to call from several threads.
  //
  // The lock is held while native callbacks run. A native function that
  // starts another evaluation with this option set deadlocks, since the lock
  // is not reentrant.
  bool serialize_foreign_calls = false;
};

}  // namespace jbridge

#endif  // JSONNET_BRIDGE_CONFIG_H_
