// Copyright 2010-2025 Google LLC
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

// Implications between boolean variables.
//
// Enumerates every assignment of three booleans a, b and c such that
// a => c, not(a) => not(c) and b => c.

#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/log/globals.h"
#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "ortools/base/init_google.h"
#include "ortools/base/logging.h"
#include "ortools/base/status_macros.h"
#include "rostering/model/constraint_sink.h"
#include "rostering/model/solution.h"
#include "rostering/sat/cp_sat_sink.h"
#include "rostering/sat/search_parameters.pb.h"
#include "rostering/sat/solution_enumerator.h"
#include "rostering/scenarios/proto_overrides.h"
#include "rostering/scenarios/scenarios.h"
#include "rostering/scenarios/schedule_printer.h"

ABSL_FLAG(std::string, params, "", "SearchParameters in text format.");

namespace rostering {

absl::Status SolveImplications(const std::string& params) {
  SearchParameters parameters;
  RETURN_IF_ERROR(MergeTextOverrides(params, &parameters));

  CpSatConstraintSink sink;
  ASSIGN_OR_RETURN(const ImplicationPuzzle puzzle,
                   BuildImplicationPuzzle(&sink));
  const std::vector<Literal> variables = {puzzle.a, puzzle.b, puzzle.c};

  const SolutionPredicate of_interest =
      parameters.solutions_of_interest().empty()
          ? AllSolutions()
          : SolutionsIn(std::vector<int64_t>(
                parameters.solutions_of_interest().begin(),
                parameters.solutions_of_interest().end()));
  const SolutionEnumerator enumerator(&sink, parameters);
  ASSIGN_OR_RETURN(
      const SearchResult result,
      enumerator.Enumerate(of_interest, [&](int64_t index,
                                            const Solution& solution) {
        absl::PrintF("%s",
                     FormatNamedValues(index, sink, variables, solution));
      }));
  absl::PrintF("\n%s", FormatStatistics(result));
  LOG(INFO) << "Search finished with status " << result.status;
  return absl::OkStatus();
}

}  // namespace rostering

int main(int argc, char** argv) {
  absl::SetStderrThreshold(absl::LogSeverityAtLeast::kInfo);
  InitGoogle(argv[0], &argc, &argv, true);
  QCHECK_OK(rostering::SolveImplications(absl::GetFlag(FLAGS_params)));
  return EXIT_SUCCESS;
}
