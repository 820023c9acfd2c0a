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

// Checks that the models registered by the model layer have the expected
// solution sets once handed to CP-SAT.

#include <cstdint>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "gtest/gtest.h"
#include "ortools/base/logging.h"
#include "rostering/model/constraint_sink.h"
#include "rostering/model/decision_grid.h"
#include "rostering/model/period_indicators.h"
#include "rostering/model/policy_constraints.h"
#include "rostering/model/solution.h"
#include "rostering/model/state_vocabulary.h"
#include "rostering/sat/cp_sat_sink.h"
#include "rostering/sat/search_parameters.pb.h"
#include "rostering/sat/solution_enumerator.h"

namespace rostering {
namespace {

DecisionGrid MakeGrid(const std::vector<StateDefinition>& states,
                      int num_subperiods, ConstraintSink* sink) {
  absl::StatusOr<StateVocabulary> vocabulary = StateVocabulary::Create(states);
  CHECK_OK(vocabulary.status());
  absl::StatusOr<DecisionGrid> grid = DecisionGrid::Create(
      1, 1, num_subperiods, *std::move(vocabulary), "x", sink);
  CHECK_OK(grid.status());
  CHECK_OK(AddExclusiveActivity(*grid, sink));
  return *std::move(grid);
}

SearchParameters TestParameters() {
  SearchParameters parameters;
  parameters.set_max_time_in_seconds(10.0);
  return parameters;
}

SearchStatus Solve(const CpSatConstraintSink& sink) {
  const absl::StatusOr<SearchResult> result =
      SolutionEnumerator(&sink, TestParameters()).SolveFirstFeasible();
  CHECK_OK(result.status());
  return result->status;
}

constexpr int kIdle = 0;
constexpr int kBusy = 1;

DecisionGrid MakeIdleBusyGrid(ConstraintSink* sink) {
  return MakeGrid({{"IDLE", false}, {"BUSY", true}}, 3, sink);
}

TEST(DefineIndicatorTest, TrueInExactlyOneEnumeratedSolution) {
  CpSatConstraintSink sink;
  const DecisionGrid grid = MakeIdleBusyGrid(&sink);
  const absl::StatusOr<Literal> indicator =
      DefineIndicator(grid, 0, 0, kIdle, "free", &sink);
  ASSERT_TRUE(indicator.ok()) << indicator.status();

  int num_true = 0;
  const SolutionEnumerator enumerator(&sink, TestParameters());
  const absl::StatusOr<SearchResult> result = enumerator.Enumerate(
      AllSolutions(), [&](int64_t, const Solution& solution) {
        if (solution.Value(*indicator)) {
          ++num_true;
          EXPECT_EQ(solution.CountTrue(grid.StateRun(0, 0, kIdle, 0, 3)), 3);
        }
      });
  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_EQ(result->status, SearchStatus::kAllSolutionsFound);
  EXPECT_EQ(result->statistics.num_solutions, 8);
  EXPECT_EQ(num_true, 1);
}

TEST(DefineIndicatorTest, CannotBeFalseWhenEverySubperiodIsInState) {
  CpSatConstraintSink sink;
  const DecisionGrid grid = MakeIdleBusyGrid(&sink);
  const absl::StatusOr<Literal> indicator =
      DefineIndicator(grid, 0, 0, kIdle, "free", &sink);
  ASSERT_TRUE(indicator.ok()) << indicator.status();
  ASSERT_TRUE(sink.AddSum(grid.StateRun(0, 0, kIdle, 0, 3), Comparison::kEqual,
                          3)
                  .ok());
  ASSERT_TRUE(sink.AddSum({*indicator}, Comparison::kEqual, 0).ok());

  const absl::StatusOr<SearchResult> result =
      SolutionEnumerator(&sink, TestParameters()).SolveFirstFeasible();
  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_EQ(result->status, SearchStatus::kInfeasible);
  EXPECT_FALSE(result->solution.has_value());
}

TEST(DefineIndicatorTest, CannotBeTrueWhenOneSubperiodIsNotInState) {
  CpSatConstraintSink sink;
  const DecisionGrid grid = MakeIdleBusyGrid(&sink);
  const absl::StatusOr<Literal> indicator =
      DefineIndicator(grid, 0, 0, kIdle, "free", &sink);
  ASSERT_TRUE(indicator.ok()) << indicator.status();
  ASSERT_TRUE(
      sink.AddSum({grid.Get(0, 0, 1, kBusy)}, Comparison::kEqual, 1).ok());
  ASSERT_TRUE(sink.AddSum({*indicator}, Comparison::kEqual, 1).ok());

  const absl::StatusOr<SearchResult> result =
      SolutionEnumerator(&sink, TestParameters()).SolveFirstFeasible();
  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_EQ(result->status, SearchStatus::kInfeasible);
}

constexpr int kFree = 0;
constexpr int kDrive = 1;
constexpr int kRest = 2;

DecisionGrid MakeDriverGrid(int num_subperiods, ConstraintSink* sink) {
  return MakeGrid({{"FREE", false}, {"DRIVE", true}, {"REST", true}},
                  num_subperiods, sink);
}

// Forces the DRIVE pattern of entity 0, period 0. The other subperiods are
// forced to REST.
void ForceDrivingPattern(const DecisionGrid& grid,
                         const std::vector<bool>& driving,
                         ConstraintSink* sink) {
  for (int s = 0; s < driving.size(); ++s) {
    const int state = driving[s] ? kDrive : kRest;
    CHECK_OK(sink->AddSum({grid.Get(0, 0, s, state)}, Comparison::kEqual, 1));
  }
}

TEST(AddMinWorkloadTest, FreeDayMakesZeroWorkloadFeasible) {
  CpSatConstraintSink sink;
  const DecisionGrid grid = MakeDriverGrid(4, &sink);
  const absl::StatusOr<PeriodIndicators> free_periods =
      PeriodIndicators::Create(grid, kFree, "free", &sink);
  ASSERT_TRUE(free_periods.ok()) << free_periods.status();
  ASSERT_TRUE(AddMinWorkload(grid, 3, &*free_periods, &sink).ok());
  ASSERT_TRUE(sink.AddSum(grid.WorkLiterals(0, 0), Comparison::kEqual, 0).ok());
  EXPECT_EQ(Solve(sink), SearchStatus::kFeasible);
}

TEST(AddMinWorkloadTest, WorkingDayBelowMinimumIsInfeasible) {
  CpSatConstraintSink sink;
  const DecisionGrid grid = MakeDriverGrid(4, &sink);
  const absl::StatusOr<PeriodIndicators> free_periods =
      PeriodIndicators::Create(grid, kFree, "free", &sink);
  ASSERT_TRUE(free_periods.ok()) << free_periods.status();
  ASSERT_TRUE(AddMinWorkload(grid, 3, &*free_periods, &sink).ok());
  ASSERT_TRUE(sink.AddSum(grid.WorkLiterals(0, 0), Comparison::kEqual, 2).ok());
  EXPECT_EQ(Solve(sink), SearchStatus::kInfeasible);
}

TEST(AddMaxConsecutiveActiveTest, RunsSeparatedByOneBreakAreFeasible) {
  CpSatConstraintSink sink;
  const DecisionGrid grid = MakeDriverGrid(5, &sink);
  ASSERT_TRUE(AddMaxConsecutiveActive(grid, kDrive, 2, &sink).ok());
  ForceDrivingPattern(grid, {true, true, false, true, true}, &sink);
  EXPECT_EQ(Solve(sink), SearchStatus::kFeasible);
}

TEST(AddMaxConsecutiveActiveTest, LongerRunIsInfeasible) {
  CpSatConstraintSink sink;
  const DecisionGrid grid = MakeDriverGrid(5, &sink);
  ASSERT_TRUE(AddMaxConsecutiveActive(grid, kDrive, 2, &sink).ok());
  ForceDrivingPattern(grid, {false, true, true, true, false}, &sink);
  EXPECT_EQ(Solve(sink), SearchStatus::kInfeasible);
}

}  // namespace
}  // namespace rostering
