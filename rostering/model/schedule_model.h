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

#ifndef ROSTERING_MODEL_SCHEDULE_MODEL_H_
#define ROSTERING_MODEL_SCHEDULE_MODEL_H_

#include <optional>
#include <utility>

#include "absl/status/statusor.h"
#include "rostering/model/constraint_sink.h"
#include "rostering/model/decision_grid.h"
#include "rostering/model/period_indicators.h"
#include "rostering/model/solution.h"
#include "rostering/model/state_vocabulary.h"
#include "rostering/model/work_policy.pb.h"

namespace rostering {

// The decision grid, the optional free period indicators and all the policy
// constraints of one WorkPolicy, registered on a sink.
//
// Typical usage:
//   CpSatConstraintSink sink;
//   ASSIGN_OR_RETURN(const ScheduleModel model,
//                    ScheduleModel::Build(vocabulary, policy, &sink));
//   SolutionEnumerator enumerator(&sink, parameters);
//   ...
class ScheduleModel {
 public:
  // Fails with InvalidArgument on an invalid policy, NotFound when a state
  // name of the policy is not in the vocabulary, and with the errors of the
  // grid and constraint builders.
  static absl::StatusOr<ScheduleModel> Build(StateVocabulary vocabulary,
                                             const WorkPolicy& policy,
                                             ConstraintSink* sink);

  const WorkPolicy& policy() const { return policy_; }
  const DecisionGrid& grid() const { return grid_; }

  // Null unless the policy models free periods.
  const PeriodIndicators* free_periods() const {
    return free_periods_.has_value() ? &*free_periods_ : nullptr;
  }

  // -1 when the policy does not name one.
  int active_state() const { return active_state_; }
  int idle_state() const { return idle_state_; }

  // The state of (entity, period, subperiod) in a solution, or -1 if no state
  // variable of the cell is true.
  int StateIn(const Solution& solution, int entity, int period,
              int subperiod) const;

  // Number of work subperiods of (entity, period) in a solution.
  int WorkloadIn(const Solution& solution, int entity, int period) const;

 private:
  ScheduleModel(const WorkPolicy& policy, DecisionGrid grid)
      : policy_(policy), grid_(std::move(grid)) {}

  WorkPolicy policy_;
  DecisionGrid grid_;
  std::optional<PeriodIndicators> free_periods_;
  int active_state_ = -1;
  int idle_state_ = -1;
};

}  // namespace rostering

#endif  // ROSTERING_MODEL_SCHEDULE_MODEL_H_
