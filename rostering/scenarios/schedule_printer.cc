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

#include "rostering/scenarios/schedule_printer.h"

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/types/span.h"
#include "rostering/model/constraint_sink.h"
#include "rostering/model/decision_grid.h"
#include "rostering/model/schedule_model.h"
#include "rostering/model/solution.h"
#include "rostering/sat/solution_enumerator.h"

namespace rostering {

std::string FormatSchedule(int64_t solution_index, const ScheduleModel& model,
                           const Solution& solution,
                           const ScheduleLabels& labels) {
  const DecisionGrid& grid = model.grid();
  std::string output = absl::StrCat("Solution ", solution_index, "\n");
  for (int period = 0; period < grid.num_periods(); ++period) {
    absl::StrAppend(&output, "Day ", period, "\n");
    for (int entity = 0; entity < grid.num_entities(); ++entity) {
      if (model.WorkloadIn(solution, entity, period) == 0) {
        absl::StrAppendFormat(&output, "  %s %d does not work\n",
                              labels.entity, entity);
        continue;
      }
      for (int subperiod = 0; subperiod < grid.num_subperiods(); ++subperiod) {
        const int state = model.StateIn(solution, entity, period, subperiod);
        absl::StrAppendFormat(
            &output, "  %s %d %s %d: %s\n", labels.entity, entity,
            labels.subperiod, subperiod,
            state < 0 ? "?" : grid.vocabulary().name(state));
      }
    }
  }
  absl::StrAppend(&output, "\n");
  return output;
}

std::string FormatNamedValues(int64_t solution_index,
                              const ConstraintSink& sink,
                              absl::Span<const Literal> literals,
                              const Solution& solution) {
  std::vector<std::pair<std::string, bool>> values;
  values.reserve(literals.size());
  for (const Literal literal : literals) {
    values.emplace_back(sink.VariableName(literal.variable()),
                        solution.Value(literal));
  }
  std::sort(values.begin(), values.end());

  std::string output = absl::StrCat("Solution ", solution_index, "\n");
  for (const auto& [name, value] : values) {
    absl::StrAppendFormat(&output, "  %s -> %d\n", name, value ? 1 : 0);
  }
  absl::StrAppend(&output, "\n");
  return output;
}

std::string FormatStatistics(const SearchResult& result) {
  const SearchStatistics& statistics = result.statistics;
  std::string output = "Statistics\n";
  absl::StrAppendFormat(&output, "  - status          : %s\n",
                        SearchStatusToString(result.status));
  absl::StrAppendFormat(&output, "  - conflicts       : %d\n",
                        statistics.num_conflicts);
  absl::StrAppendFormat(&output, "  - branches        : %d\n",
                        statistics.num_branches);
  absl::StrAppendFormat(&output, "  - wall time       : %f s\n",
                        statistics.wall_time);
  absl::StrAppendFormat(&output, "  - solutions found : %d\n",
                        statistics.num_solutions);
  return output;
}

}  // namespace rostering
