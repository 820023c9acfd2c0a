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

// Driver scheduling with free days.
//
// Six drivers over two days of six time blocks. The driving rules are the
// ones of driver_scheduling_sat, except that a driver may take a whole day
// off: the minimum workload only applies to the days a driver works. Looks
// for a single schedule.

#include <cstdlib>
#include <string>

#include "absl/flags/flag.h"
#include "absl/log/globals.h"
#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "ortools/base/init_google.h"
#include "ortools/base/logging.h"
#include "ortools/base/status_macros.h"
#include "rostering/model/period_indicators.h"
#include "rostering/model/schedule_model.h"
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

absl::Status ScheduleDriversWithFreeDays(const std::string& policy_overrides,
                                         const std::string& params) {
  WorkPolicy policy = DriverFreeDaysPolicy();
  RETURN_IF_ERROR(MergeTextOverrides(policy_overrides, &policy));
  SearchParameters parameters;
  RETURN_IF_ERROR(MergeTextOverrides(params, &parameters));

  CpSatConstraintSink sink;
  ASSIGN_OR_RETURN(const ScheduleModel model,
                   ScheduleModel::Build(DriverStates(), policy, &sink));
  LOG(INFO) << "Scheduling " << policy.num_entities() << " drivers on "
            << policy.num_periods() << " days with " << sink.num_variables()
            << " variables.";

  const SolutionEnumerator enumerator(&sink, parameters);
  ASSIGN_OR_RETURN(const SearchResult result,
                   enumerator.SolveFirstFeasible());
  if (result.solution.has_value()) {
    absl::PrintF("%s", FormatSchedule(1, model, *result.solution,
                                      {"Driver", "time-block"}));
    const PeriodIndicators* free_days = model.free_periods();
    if (free_days != nullptr) {
      for (int day = 0; day < free_days->num_periods(); ++day) {
        for (int driver = 0; driver < free_days->num_entities(); ++driver) {
          if (result.solution->Value(free_days->Get(driver, day))) {
            absl::PrintF("Driver %d is off on day %d\n", driver, day);
          }
        }
      }
    }
  } else {
    absl::PrintF("No schedule found.\n");
  }
  absl::PrintF("\n%s", FormatStatistics(result));
  LOG(INFO) << "Search finished with status " << result.status;
  return absl::OkStatus();
}

}  // namespace rostering

int main(int argc, char** argv) {
  absl::SetStderrThreshold(absl::LogSeverityAtLeast::kInfo);
  InitGoogle(argv[0], &argc, &argv, true);
  QCHECK_OK(rostering::ScheduleDriversWithFreeDays(
      absl::GetFlag(FLAGS_policy), absl::GetFlag(FLAGS_params)));
  return EXIT_SUCCESS;
}
