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

// Driver scheduling with breaks.
//
// Three drivers share one day of eight half-hour time blocks. Every block is
// driven by exactly one driver, each driver works (drives or rests) between
// four and five blocks, and nobody drives more than two blocks in a row.
// Enumerates the schedules and prints a few of them.

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
#include "rostering/model/schedule_model.h"
#include "rostering/model/solution.h"
#include "rostering/model/work_policy.pb.h"
#include "rostering/sat/cp_sat_sink.h"
#include "rostering/sat/search_parameters.pb.h"
#include "rostering/sat/solution_enumerator.h"
#include "rostering/scenarios/proto_overrides.h"
#include "rostering/scenarios/scenarios.h"
#include "rostering/scenarios/schedule_printer.h"

ABSL_FLAG(std::string, policy, "",
          "WorkPolicy fields in text format, merged on top of the scenario.");
ABSL_FLAG(std::string, params, "", "SearchParameters in text format.");

namespace rostering {

absl::Status ScheduleDrivers(const std::string& policy_overrides,
                             const std::string& params) {
  WorkPolicy policy = DriverBreaksPolicy();
  RETURN_IF_ERROR(MergeTextOverrides(policy_overrides, &policy));
  SearchParameters parameters;
  RETURN_IF_ERROR(MergeTextOverrides(params, &parameters));
  if (parameters.solutions_of_interest().empty()) {
    parameters.add_solutions_of_interest(1);
    parameters.add_solutions_of_interest(2);
  }

  CpSatConstraintSink sink;
  ASSIGN_OR_RETURN(const ScheduleModel model,
                   ScheduleModel::Build(DriverStates(), policy, &sink));
  LOG(INFO) << "Scheduling " << policy.num_entities() << " drivers on "
            << policy.num_subperiods() << " time blocks with "
            << sink.num_variables() << " variables.";

  const ScheduleLabels labels = {"Driver", "time-block"};
  const SolutionEnumerator enumerator(&sink, parameters);
  ASSIGN_OR_RETURN(
      const SearchResult result,
      enumerator.Enumerate(
          SolutionsIn(std::vector<int64_t>(
              parameters.solutions_of_interest().begin(),
              parameters.solutions_of_interest().end())),
          [&](int64_t index, const Solution& solution) {
            absl::PrintF("%s", FormatSchedule(index, model, solution, labels));
          }));
  absl::PrintF("\n%s", FormatStatistics(result));
  LOG(INFO) << "Search finished with status " << result.status;
  return absl::OkStatus();
}

}  // namespace rostering

int main(int argc, char** argv) {
  absl::SetStderrThreshold(absl::LogSeverityAtLeast::kInfo);
  InitGoogle(argv[0], &argc, &argv, true);
  QCHECK_OK(rostering::ScheduleDrivers(absl::GetFlag(FLAGS_policy),
                                       absl::GetFlag(FLAGS_params)));
  return EXIT_SUCCESS;
}
