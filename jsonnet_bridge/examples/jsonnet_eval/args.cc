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

#include "jsonnet_bridge/examples/jsonnet_eval/args.h"

#include <cstddef>
#include <utility>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "jsonnet_bridge/util/status_macros.h"

namespace jbridge::jsonnet_eval {
namespace {

constexpr absl::string_view kExtStr = "--ext-str";
constexpr absl::string_view kExtCode = "--ext-code";

absl::StatusOr<ExtVar> ParseBinding(absl::string_view flag,
                                    absl::string_view operand,
                                    ExtVarKind kind) {
  const size_t eq = operand.find('=');
  if (eq == absl::string_view::npos) {
    return absl::InvalidArgumentError(
        absl::StrCat(flag, " expects NAME=VALUE, got '", operand, "'"));
  }
  return ExtVar{std::string(operand.substr(0, eq)),
                std::string(operand.substr(eq + 1)), kind};
}

}  // namespace

absl::StatusOr<std::vector<char*>> ExtractArgs(absl::Span<char* const> args,
                                               Invocation* invocation) {
  std::vector<char*> remaining;
  if (args.empty()) {
    return remaining;
  }
  remaining.push_back(args[0]);
  for (size_t i = 1; i < args.size(); ++i) {
    absl::string_view arg = args[i];
    if (arg == "--") {
      remaining.insert(remaining.end(), args.begin() + i, args.end());
      break;
    }
    if (arg == "-e" || arg == "--exec") {
      invocation->exec = true;
      continue;
    }

    bool consumed = false;
    for (absl::string_view flag : {kExtStr, kExtCode}) {
      if (!absl::StartsWith(arg, flag)) {
        continue;
      }
      absl::string_view rest = arg.substr(flag.size());
      if (!rest.empty() && rest.front() != '=') {
        // Some other flag sharing the prefix.
        continue;
      }
      absl::string_view operand;
      if (!rest.empty()) {
        operand = rest.substr(1);
      } else if (i + 1 < args.size()) {
        operand = args[++i];
      } else {
        return absl::InvalidArgumentError(
            absl::StrCat(flag, " expects NAME=VALUE"));
      }
      const ExtVarKind kind =
          flag == kExtStr ? ExtVarKind::kString : ExtVarKind::kCode;
      JBRIDGE_ASSIGN_OR_RETURN(ExtVar var, ParseBinding(flag, operand, kind));
      invocation->vars.Set(std::move(var));
      consumed = true;
      break;
    }
    if (!consumed) {
      remaining.push_back(args[i]);
    }
  }
  return remaining;
}

absl::Status SetInput(absl::Span<char* const> positional,
                      Invocation* invocation) {
  if (positional.size() != 2) {
    return absl::InvalidArgumentError(
        absl::StrCat("Expected exactly one FILE_OR_CODE argument, got ",
                     positional.empty() ? 0 : positional.size() - 1));
  }
  invocation->input = positional[1];
  return absl::OkStatus();
}

}  // namespace jbridge::jsonnet_eval
