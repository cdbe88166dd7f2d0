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

// Evaluates a Jsonnet file, or with -e a Jsonnet snippet, and prints the
// resulting JSON.
//
//   jsonnet_eval --ext-str foo=bar --ext-code hoge=1 \
//       -e '{foo: std.extVar("foo"), hoge: std.extVar("hoge") + 1}'
//   {"foo":"bar","hoge":2}

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/globals.h"
#include "absl/log/initialize.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "absl/types/span.h"
#include "jsonnet_bridge/errors.h"
#include "jsonnet_bridge/examples/jsonnet_eval/args.h"
#include "jsonnet_bridge/examples/jsonnet_eval/run.h"

ABSL_FLAG(uint32_t, max_stack, 0,
          "Maximum evaluation stack depth (0: evaluator default)");
ABSL_FLAG(uint32_t, max_trace, 0,
          "Maximum stack frames shown in errors (0: evaluator default)");
ABSL_FLAG(std::vector<std::string>, jpath, {},
          "Comma-separated library search directories");
ABSL_FLAG(absl::Duration, timeout, absl::ZeroDuration(),
          "Give up on evaluation after this long (0: no limit)");
ABSL_FLAG(bool, compact, true, "Print JSON output on a single line");
ABSL_FLAG(bool, string_output, false,
          "Expect a string result and print it unquoted");
ABSL_FLAG(bool, serialize_foreign_calls, false,
          "Serialize all calls into the Jsonnet evaluator");

namespace {

constexpr char kUsage[] =
    "[--ext-str NAME=VALUE]... [--ext-code NAME=EXPR]... [-e|--exec] "
    "FILE_OR_CODE";

int Fail(const absl::Status& status) {
  if (jbridge::GetErrorKind(status) == jbridge::ErrorKind::kEvaluationFailure) {
    // The evaluator diagnostic is already formatted for the terminal.
    std::cerr << status.message();
  } else {
    std::cerr << "jsonnet_eval: " << status.message() << "\n";
  }
  return EXIT_FAILURE;
}

}  // namespace

int main(int argc, char* argv[]) {
  absl::SetProgramUsageMessage(kUsage);

  jbridge::jsonnet_eval::Invocation invocation;
  absl::StatusOr<std::vector<char*>> remaining =
      jbridge::jsonnet_eval::ExtractArgs(absl::MakeConstSpan(argv, argc),
                                         &invocation);
  if (!remaining.ok()) {
    std::cerr << remaining.status().message() << "\nUsage: " << argv[0] << " "
              << kUsage << "\n";
    return EXIT_FAILURE;
  }
  std::vector<char*> positional = absl::ParseCommandLine(
      static_cast<int>(remaining->size()), remaining->data());
  absl::SetStderrThreshold(absl::LogSeverityAtLeast::kWarning);
  absl::InitializeLog();

  if (absl::Status status =
          jbridge::jsonnet_eval::SetInput(positional, &invocation);
      !status.ok()) {
    std::cerr << status.message() << "\nUsage: " << argv[0] << " " << kUsage
              << "\n";
    return EXIT_FAILURE;
  }

  jbridge::jsonnet_eval::RunOptions options;
  options.config.max_stack = absl::GetFlag(FLAGS_max_stack);
  options.config.max_trace = absl::GetFlag(FLAGS_max_trace);
  options.config.import_paths = absl::GetFlag(FLAGS_jpath);
  options.config.string_output = absl::GetFlag(FLAGS_string_output);
  options.config.serialize_foreign_calls =
      absl::GetFlag(FLAGS_serialize_foreign_calls);
  options.timeout = absl::GetFlag(FLAGS_timeout);
  options.compact = absl::GetFlag(FLAGS_compact);

  absl::StatusOr<std::string> output =
      jbridge::jsonnet_eval::Run(invocation, options);
  if (!output.ok()) {
    return Fail(output.status());
  }
  std::cout << *output;
  return EXIT_SUCCESS;
}
