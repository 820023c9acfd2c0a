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

// Registration of the scheduling policy constraint families on a
// ConstraintSink. Every function is a pure function of its inputs: it only
// reads the grid and adds constraints to the sink.
//
// All functions return OutOfRange when given a state or a literal that does
// not exist, and InvalidArgument for a negative bound. Nothing is clamped.

#ifndef ROSTERING_MODEL_POLICY_CONSTRAINTS_H_
#define ROSTERING_MODEL_POLICY_CONSTRAINTS_H_

#include "absl/status/status.h"
#include "rostering/model/constraint_sink.h"
#include "rostering/model/decision_grid.h"
#include "rostering/model/period_indicators.h"
#include "rostering/model/work_policy.pb.h"

namespace rostering {

// For every (period, subperiod), exactly one entity is in active_state.
absl::Status AddExactlyOneActive(const DecisionGrid& grid, int active_state,
                                 ConstraintSink* sink);

// For every (entity, period, subperiod), exactly one state holds.
absl::Status AddExclusiveActivity(const DecisionGrid& grid,
                                  ConstraintSink* sink);

// For every (entity, period), the number of subperiods spent in a work state
// is at most max_work_subperiods. This holds on every period, including the
// ones without coverage requirement.
absl::Status AddMaxWorkload(const DecisionGrid& grid, int max_work_subperiods,
                            ConstraintSink* sink);

// For every (entity, period), the number of work subperiods is at least
// min_work_subperiods * (1 - free), where free is the indicator of
// free_periods for that (entity, period). It is registered as
//   workload + min_work_subperiods * free >= min_work_subperiods.
// If free_periods is nullptr the bound applies unconditionally.
absl::Status AddMinWorkload(const DecisionGrid& grid, int min_work_subperiods,
                            const PeriodIndicators* free_periods,
                            ConstraintSink* sink);

// For every (entity, period) and every window of max_consecutive + 1
// contiguous subperiods that fits in the period, at most max_consecutive of
// them are in active_state. Windows do not wrap around and do not span two
// periods, so two runs of max_consecutive separated by a single other state
// stay allowed.
absl::Status AddMaxConsecutiveActive(const DecisionGrid& grid,
                                     int active_state, int max_consecutive,
                                     ConstraintSink* sink);

// a => b.
absl::Status AddImplication(Literal a, Literal b, ConstraintSink* sink);

// a => not(b).
absl::Status AddExclusion(Literal a, Literal b, ConstraintSink* sink);

// Checks the dimensions and bounds of a policy. State names are resolved
// later, against a vocabulary.
absl::Status ValidateWorkPolicy(const WorkPolicy& policy);

// Registers every family enabled by the policy. free_periods must be set iff
// policy.model_free_periods() is true.
absl::Status AddWorkPolicyConstraints(const DecisionGrid& grid,
                                      const WorkPolicy& policy,
                                      const PeriodIndicators* free_periods,
                                      ConstraintSink* sink);

}  // namespace rostering

#endif  // ROSTERING_MODEL_POLICY_CONSTRAINTS_H_
