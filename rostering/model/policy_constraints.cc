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

#include "rostering/model/policy_constraints.h"

#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "ortools/base/logging.h"
#include "ortools/base/status_macros.h"
#include "rostering/model/constraint_sink.h"
#include "rostering/model/decision_grid.h"
#include "rostering/model/period_indicators.h"
#include "rostering/model/work_policy.pb.h"

namespace rostering {

namespace {

absl::Status CheckState(const DecisionGrid& grid, int state) {
  if (!grid.vocabulary().IsValidState(state)) {
    return absl::OutOfRangeError(absl::StrCat(
        "state ", state, " is not in [0, ", grid.num_states(), ")"));
  }
  return absl::OkStatus();
}

absl::Status CheckNonNegative(int value, absl::string_view name) {
  if (value < 0) {
    return absl::InvalidArgumentError(
        absl::StrCat(name, " must be non-negative, got ", value));
  }
  return absl::OkStatus();
}

absl::Status CheckPositive(int value, absl::string_view name) {
  if (value <= 0) {
    return absl::InvalidArgumentError(
        absl::StrCat(name, " must be positive, got ", value));
  }
  return absl::OkStatus();
}

}  // namespace

absl::Status AddExactlyOneActive(const DecisionGrid& grid, int active_state,
                                 ConstraintSink* sink) {
  RETURN_IF_ERROR(CheckState(grid, active_state));
  std::vector<Literal> active(grid.num_entities(), Literal(0));
  for (int p = 0; p < grid.num_periods(); ++p) {
    for (int s = 0; s < grid.num_subperiods(); ++s) {
      for (int e = 0; e < grid.num_entities(); ++e) {
        active[e] = grid.Get(e, p, s, active_state);
      }
      RETURN_IF_ERROR(sink->AddSum(active, Comparison::kEqual, 1));
    }
  }
  VLOG(1) << "Added " << grid.num_periods() * grid.num_subperiods()
          << " exactly-one '" << grid.vocabulary().name(active_state)
          << "' constraints.";
  return absl::OkStatus();
}

absl::Status AddExclusiveActivity(const DecisionGrid& grid,
                                  ConstraintSink* sink) {
  for (int e = 0; e < grid.num_entities(); ++e) {
    for (int p = 0; p < grid.num_periods(); ++p) {
      for (int s = 0; s < grid.num_subperiods(); ++s) {
        RETURN_IF_ERROR(sink->AddSum(grid.StateLiterals(e, p, s),
                                     Comparison::kEqual, 1));
      }
    }
  }
  return absl::OkStatus();
}

absl::Status AddMaxWorkload(const DecisionGrid& grid, int max_work_subperiods,
                            ConstraintSink* sink) {
  RETURN_IF_ERROR(
      CheckNonNegative(max_work_subperiods, "max_work_subperiods"));
  for (int e = 0; e < grid.num_entities(); ++e) {
    for (int p = 0; p < grid.num_periods(); ++p) {
      RETURN_IF_ERROR(sink->AddSum(grid.WorkLiterals(e, p),
                                   Comparison::kLessOrEqual,
                                   max_work_subperiods));
    }
  }
  return absl::OkStatus();
}

absl::Status AddMinWorkload(const DecisionGrid& grid, int min_work_subperiods,
                            const PeriodIndicators* free_periods,
                            ConstraintSink* sink) {
  RETURN_IF_ERROR(
      CheckNonNegative(min_work_subperiods, "min_work_subperiods"));
  if (free_periods != nullptr &&
      (free_periods->num_entities() != grid.num_entities() ||
       free_periods->num_periods() != grid.num_periods())) {
    return absl::InvalidArgumentError(
        "the free period indicators do not match the grid dimensions");
  }
  for (int e = 0; e < grid.num_entities(); ++e) {
    for (int p = 0; p < grid.num_periods(); ++p) {
      std::vector<LinearTerm> terms;
      for (const Literal work : grid.WorkLiterals(e, p)) {
        terms.push_back({work, 1});
      }
      if (free_periods != nullptr) {
        terms.push_back({free_periods->Get(e, p), min_work_subperiods});
      }
      RETURN_IF_ERROR(sink->AddLinear(terms, Comparison::kGreaterOrEqual,
                                      min_work_subperiods));
    }
  }
  return absl::OkStatus();
}

absl::Status AddMaxConsecutiveActive(const DecisionGrid& grid,
                                     int active_state, int max_consecutive,
                                     ConstraintSink* sink) {
  RETURN_IF_ERROR(CheckState(grid, active_state));
  RETURN_IF_ERROR(CheckNonNegative(max_consecutive, "max_consecutive"));
  const int window = max_consecutive + 1;
  if (window > grid.num_subperiods()) {
    VLOG(1) << "No run of " << window << " subperiods fits in a period of "
            << grid.num_subperiods() << ".";
    return absl::OkStatus();
  }
  int num_windows = 0;
  for (int e = 0; e < grid.num_entities(); ++e) {
    for (int p = 0; p < grid.num_periods(); ++p) {
      for (int start = 0; start + window <= grid.num_subperiods(); ++start) {
        RETURN_IF_ERROR(sink->AddSum(
            grid.StateRun(e, p, active_state, start, start + window),
            Comparison::kLessOrEqual, max_consecutive));
        ++num_windows;
      }
    }
  }
  VLOG(1) << "Added " << num_windows << " sliding windows of " << window
          << " subperiods.";
  return absl::OkStatus();
}

absl::Status AddImplication(Literal a, Literal b, ConstraintSink* sink) {
  return sink->AddImplication(a, b);
}

absl::Status AddExclusion(Literal a, Literal b, ConstraintSink* sink) {
  return sink->AddImplication(a, b.Negated());
}

absl::Status ValidateWorkPolicy(const WorkPolicy& policy) {
  RETURN_IF_ERROR(CheckPositive(policy.num_entities(), "num_entities"));
  RETURN_IF_ERROR(CheckPositive(policy.num_periods(), "num_periods"));
  RETURN_IF_ERROR(CheckPositive(policy.num_subperiods(), "num_subperiods"));
  if (policy.has_max_work_subperiods()) {
    RETURN_IF_ERROR(CheckNonNegative(policy.max_work_subperiods(),
                                     "max_work_subperiods"));
  }
  if (policy.has_min_work_subperiods()) {
    RETURN_IF_ERROR(CheckNonNegative(policy.min_work_subperiods(),
                                     "min_work_subperiods"));
  }
  if (policy.has_min_work_subperiods() && policy.has_max_work_subperiods() &&
      policy.min_work_subperiods() > policy.max_work_subperiods()) {
    return absl::InvalidArgumentError(absl::StrCat(
        "min_work_subperiods (", policy.min_work_subperiods(),
        ") is greater than max_work_subperiods (",
        policy.max_work_subperiods(), ")"));
  }
  if (policy.has_max_consecutive_active()) {
    RETURN_IF_ERROR(CheckNonNegative(policy.max_consecutive_active(),
                                     "max_consecutive_active"));
  }
  if ((policy.exactly_one_active_per_subperiod() ||
       policy.has_max_consecutive_active()) &&
      policy.active_state().empty()) {
    return absl::InvalidArgumentError(
        "active_state must be set to cover subperiods or bound runs");
  }
  if (policy.model_free_periods() && policy.idle_state().empty()) {
    return absl::InvalidArgumentError(
        "idle_state must be set to model free periods");
  }
  return absl::OkStatus();
}

absl::Status AddWorkPolicyConstraints(const DecisionGrid& grid,
                                      const WorkPolicy& policy,
                                      const PeriodIndicators* free_periods,
                                      ConstraintSink* sink) {
  RETURN_IF_ERROR(ValidateWorkPolicy(policy));
  if (grid.num_entities() != policy.num_entities() ||
      grid.num_periods() != policy.num_periods() ||
      grid.num_subperiods() != policy.num_subperiods()) {
    return absl::InvalidArgumentError(
        "the grid dimensions do not match the work policy");
  }
  if (policy.model_free_periods() != (free_periods != nullptr)) {
    return absl::InvalidArgumentError(
        "free period indicators must be given iff model_free_periods is set");
  }

  if (policy.exactly_one_active_per_subperiod()) {
    ASSIGN_OR_RETURN(const int active,
                     grid.vocabulary().IndexOf(policy.active_state()));
    RETURN_IF_ERROR(AddExactlyOneActive(grid, active, sink));
  }
  if (policy.exclusive_activity()) {
    RETURN_IF_ERROR(AddExclusiveActivity(grid, sink));
  }
  if (policy.has_max_work_subperiods()) {
    RETURN_IF_ERROR(AddMaxWorkload(grid, policy.max_work_subperiods(), sink));
  }
  if (policy.has_min_work_subperiods()) {
    RETURN_IF_ERROR(AddMinWorkload(grid, policy.min_work_subperiods(),
                                   free_periods, sink));
  }
  if (policy.has_max_consecutive_active()) {
    ASSIGN_OR_RETURN(const int active,
                     grid.vocabulary().IndexOf(policy.active_state()));
    RETURN_IF_ERROR(AddMaxConsecutiveActive(
        grid, active, policy.max_consecutive_active(), sink));
  }
  return absl::OkStatus();
}

}  // namespace rostering
