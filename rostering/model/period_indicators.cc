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

#include "rostering/model/period_indicators.h"

#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "ortools/base/logging.h"
#include "ortools/base/status_macros.h"
#include "rostering/model/constraint_sink.h"
#include "rostering/model/decision_grid.h"

namespace rostering {

absl::StatusOr<Literal> DefineIndicator(const DecisionGrid& grid, int entity,
                                        int period, int defining_state,
                                        absl::string_view name,
                                        ConstraintSink* sink) {
  CHECK(sink != nullptr);
  RETURN_IF_ERROR(grid.CheckIndices(entity, period, 0, defining_state));

  const Literal indicator = sink->NewBoolVar(name);
  std::vector<LinearTerm> all_in_state;
  for (int s = 0; s < grid.num_subperiods(); ++s) {
    const Literal cell = grid.Get(entity, period, s, defining_state);
    RETURN_IF_ERROR(sink->AddImplication(cell.Negated(), indicator.Negated()));
    RETURN_IF_ERROR(sink->AddImplication(indicator, cell));
    all_in_state.push_back({cell, 1});
  }
  all_in_state.push_back({indicator, -1});
  RETURN_IF_ERROR(sink->AddLinear(all_in_state, Comparison::kLessOrEqual,
                                  grid.num_subperiods() - 1));
  return indicator;
}

absl::StatusOr<PeriodIndicators> PeriodIndicators::Create(
    const DecisionGrid& grid, int defining_state, absl::string_view prefix,
    ConstraintSink* sink) {
  PeriodIndicators indicators(grid.num_entities(), grid.num_periods(),
                              defining_state);
  indicators.literals_.reserve(grid.num_entities() * grid.num_periods());
  for (int e = 0; e < grid.num_entities(); ++e) {
    for (int p = 0; p < grid.num_periods(); ++p) {
      ASSIGN_OR_RETURN(
          const Literal indicator,
          DefineIndicator(grid, e, p, defining_state,
                          absl::StrCat(prefix, "_e", e, "_p", p), sink));
      indicators.literals_.push_back(indicator);
    }
  }
  VLOG(1) << "Defined " << indicators.literals_.size() << " '"
          << grid.vocabulary().name(defining_state) << "' period indicators.";
  return indicators;
}

absl::StatusOr<Literal> PeriodIndicators::Find(int entity, int period) const {
  if (entity < 0 || entity >= num_entities_ || period < 0 ||
      period >= num_periods_) {
    return absl::OutOfRangeError(
        absl::StrCat("no indicator for entity ", entity, " and period ",
                     period, " (", num_entities_, " entities, ", num_periods_,
                     " periods)"));
  }
  return Get(entity, period);
}

}  // namespace rostering
