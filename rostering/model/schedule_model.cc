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

#include "rostering/model/schedule_model.h"

#include <utility>

#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "ortools/base/logging.h"
#include "ortools/base/status_macros.h"
#include "rostering/model/constraint_sink.h"
#include "rostering/model/decision_grid.h"
#include "rostering/model/period_indicators.h"
#include "rostering/model/policy_constraints.h"
#include "rostering/model/solution.h"
#include "rostering/model/state_vocabulary.h"
#include "rostering/model/work_policy.pb.h"

namespace rostering {

absl::StatusOr<ScheduleModel> ScheduleModel::Build(StateVocabulary vocabulary,
                                                   const WorkPolicy& policy,
                                                   ConstraintSink* sink) {
  CHECK(sink != nullptr);
  RETURN_IF_ERROR(ValidateWorkPolicy(policy));
  int active_state = -1;
  if (!policy.active_state().empty()) {
    ASSIGN_OR_RETURN(active_state, vocabulary.IndexOf(policy.active_state()));
  }
  int idle_state = -1;
  if (!policy.idle_state().empty()) {
    ASSIGN_OR_RETURN(idle_state, vocabulary.IndexOf(policy.idle_state()));
  }

  ASSIGN_OR_RETURN(
      DecisionGrid grid,
      DecisionGrid::Create(policy.num_entities(), policy.num_periods(),
                           policy.num_subperiods(), std::move(vocabulary),
                           policy.variable_prefix(), sink));
  ScheduleModel model(policy, std::move(grid));
  model.active_state_ = active_state;
  model.idle_state_ = idle_state;
  if (policy.model_free_periods()) {
    ASSIGN_OR_RETURN(
        PeriodIndicators indicators,
        PeriodIndicators::Create(model.grid_, idle_state,
                                 absl::StrCat(policy.variable_prefix(), "_free"),
                                 sink));
    model.free_periods_.emplace(std::move(indicators));
  }
  RETURN_IF_ERROR(AddWorkPolicyConstraints(model.grid_, policy,
                                           model.free_periods(), sink));
  VLOG(1) << "Schedule model built with " << sink->num_variables()
          << " variables.";
  return model;
}

int ScheduleModel::StateIn(const Solution& solution, int entity, int period,
                           int subperiod) const {
  for (int st = 0; st < grid_.num_states(); ++st) {
    if (solution.Value(grid_.Get(entity, period, subperiod, st))) return st;
  }
  return -1;
}

int ScheduleModel::WorkloadIn(const Solution& solution, int entity,
                              int period) const {
  return solution.CountTrue(grid_.WorkLiterals(entity, period));
}

}  // namespace rostering
