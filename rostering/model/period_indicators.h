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

#ifndef ROSTERING_MODEL_PERIOD_INDICATORS_H_
#define ROSTERING_MODEL_PERIOD_INDICATORS_H_

#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "ortools/base/logging.h"
#include "rostering/model/constraint_sink.h"
#include "rostering/model/decision_grid.h"

namespace rostering {

// Creates a boolean variable and links it to the grid so that, in every
// solution,
//   indicator <=> grid(entity, period, s, defining_state) for all subperiods s.
//
// For each subperiod s the pair
//   not grid(entity, period, s, defining_state) => not indicator
//   indicator => grid(entity, period, s, defining_state)
// is registered, followed by
//   sum_s grid(entity, period, s, defining_state) - indicator
//       <= num_subperiods - 1
// which forces the indicator to true once every subperiod is in the defining
// state.
//
// Returns OutOfRange if entity, period or defining_state is not in the grid.
absl::StatusOr<Literal> DefineIndicator(const DecisionGrid& grid, int entity,
                                        int period, int defining_state,
                                        absl::string_view name,
                                        ConstraintSink* sink);

// One DefineIndicator() literal per (entity, period) of a grid, all for the
// same defining state. With the idle state, they read "the entity is free on
// that period".
class PeriodIndicators {
 public:
  static absl::StatusOr<PeriodIndicators> Create(const DecisionGrid& grid,
                                                 int defining_state,
                                                 absl::string_view prefix,
                                                 ConstraintSink* sink);

  int num_entities() const { return num_entities_; }
  int num_periods() const { return num_periods_; }
  int defining_state() const { return defining_state_; }

  Literal Get(int entity, int period) const {
    DCHECK(0 <= entity && entity < num_entities_) << entity;
    DCHECK(0 <= period && period < num_periods_) << period;
    return literals_[entity * num_periods_ + period];
  }

  // Returns OutOfRange for an index outside the grid.
  absl::StatusOr<Literal> Find(int entity, int period) const;

 private:
  PeriodIndicators(int num_entities, int num_periods, int defining_state)
      : num_entities_(num_entities),
        num_periods_(num_periods),
        defining_state_(defining_state) {}

  int num_entities_;
  int num_periods_;
  int defining_state_;
  std::vector<Literal> literals_;
};

}  // namespace rostering

#endif  // ROSTERING_MODEL_PERIOD_INDICATORS_H_
