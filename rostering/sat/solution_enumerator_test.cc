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

#include "rostering/sat/solution_enumerator.h"

#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "rostering/model/constraint_sink.h"
#include "rostering/model/solution.h"
#include "rostering/sat/cp_sat_sink.h"
#include "rostering/sat/search_parameters.pb.h"

namespace rostering {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

// Three free booleans with a + b + c <= 2: seven solutions.
class SolutionEnumeratorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    for (const char* name : {"a", "b", "c"}) {
      literals_.push_back(sink_.NewBoolVar(name));
    }
    ASSERT_TRUE(sink_.AddSum(literals_, Comparison::kLessOrEqual, 2).ok());
    parameters_.set_max_time_in_seconds(10.0);
  }

  CpSatConstraintSink sink_;
  std::vector<Literal> literals_;
  SearchParameters parameters_;
};

TEST_F(SolutionEnumeratorTest, EnumeratesAllSolutions) {
  std::vector<int64_t> indices;
  std::vector<Solution> solutions;
  const SolutionEnumerator enumerator(&sink_, parameters_);
  const absl::StatusOr<SearchResult> result = enumerator.Enumerate(
      AllSolutions(), [&](int64_t index, const Solution& solution) {
        indices.push_back(index);
        solutions.push_back(solution);
      });
  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_EQ(result->status, SearchStatus::kAllSolutionsFound);
  EXPECT_TRUE(result->HasSolution());
  EXPECT_EQ(result->statistics.num_solutions, 7);
  EXPECT_GE(result->statistics.wall_time, 0.0);
  EXPECT_FALSE(result->solution.has_value());
  EXPECT_THAT(indices, ElementsAre(1, 2, 3, 4, 5, 6, 7));
  for (int i = 0; i < solutions.size(); ++i) {
    EXPECT_LE(solutions[i].CountTrue(literals_), 2);
    for (int j = 0; j < i; ++j) EXPECT_NE(solutions[i], solutions[j]);
  }
}

TEST_F(SolutionEnumeratorTest, PredicateSelectsReportedSolutions) {
  std::vector<int64_t> indices;
  const SolutionEnumerator enumerator(&sink_, parameters_);
  const absl::StatusOr<SearchResult> result = enumerator.Enumerate(
      SolutionsIn({2, 5, 42}),
      [&](int64_t index, const Solution&) { indices.push_back(index); });
  ASSERT_TRUE(result.ok()) << result.status();
  // The search does not stop once the selected solutions are reported.
  EXPECT_EQ(result->statistics.num_solutions, 7);
  EXPECT_THAT(indices, ElementsAre(2, 5));
}

TEST_F(SolutionEnumeratorTest, FirstSolutions) {
  std::vector<int64_t> indices;
  const SolutionEnumerator enumerator(&sink_, parameters_);
  const absl::StatusOr<SearchResult> result = enumerator.Enumerate(
      FirstSolutions(2),
      [&](int64_t index, const Solution&) { indices.push_back(index); });
  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_EQ(result->statistics.num_solutions, 7);
  EXPECT_THAT(indices, ElementsAre(1, 2));
}

TEST_F(SolutionEnumeratorTest, RunsAreIndependent) {
  const SolutionEnumerator enumerator(&sink_, parameters_);
  int num_calls = 0;
  const auto count = [&](int64_t, const Solution&) { ++num_calls; };
  const absl::StatusOr<SearchResult> first =
      enumerator.Enumerate(AllSolutions(), count);
  const absl::StatusOr<SearchResult> second =
      enumerator.Enumerate(NoSolution(), count);
  ASSERT_TRUE(first.ok()) << first.status();
  ASSERT_TRUE(second.ok()) << second.status();
  EXPECT_EQ(first->statistics.num_solutions, 7);
  EXPECT_EQ(second->statistics.num_solutions, 7);
  EXPECT_EQ(second->status, first->status);
  EXPECT_EQ(num_calls, 7);
}

TEST_F(SolutionEnumeratorTest, SolveFirstFeasible) {
  const SolutionEnumerator enumerator(&sink_, parameters_);
  const absl::StatusOr<SearchResult> result = enumerator.SolveFirstFeasible();
  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_EQ(result->status, SearchStatus::kFeasible);
  ASSERT_TRUE(result->solution.has_value());
  EXPECT_EQ(result->solution->num_variables(), 3);
  EXPECT_LE(result->solution->CountTrue(literals_), 2);
  EXPECT_EQ(result->statistics.num_solutions, 1);
}

TEST_F(SolutionEnumeratorTest, InfeasibleIsNotAnError) {
  ASSERT_TRUE(sink_.AddSum(literals_, Comparison::kGreaterOrEqual, 3).ok());
  const SolutionEnumerator enumerator(&sink_, parameters_);

  int num_calls = 0;
  const absl::StatusOr<SearchResult> enumerated = enumerator.Enumerate(
      AllSolutions(), [&](int64_t, const Solution&) { ++num_calls; });
  ASSERT_TRUE(enumerated.ok()) << enumerated.status();
  EXPECT_EQ(enumerated->status, SearchStatus::kInfeasible);
  EXPECT_FALSE(enumerated->HasSolution());
  EXPECT_EQ(enumerated->statistics.num_solutions, 0);
  EXPECT_EQ(num_calls, 0);

  const absl::StatusOr<SearchResult> first = enumerator.SolveFirstFeasible();
  ASSERT_TRUE(first.ok()) << first.status();
  EXPECT_EQ(first->status, SearchStatus::kInfeasible);
  EXPECT_FALSE(first->solution.has_value());
  EXPECT_EQ(first->statistics.num_solutions, 0);
}

// 2^24 solutions cannot be enumerated in a fraction of a second.
TEST(SolutionEnumeratorLimitTest, TimeLimitWithSolutions) {
  CpSatConstraintSink sink;
  for (int i = 0; i < 24; ++i) sink.NewBoolVar("x");
  SearchParameters parameters;
  parameters.set_max_time_in_seconds(0.2);

  int64_t num_reported = 0;
  const absl::StatusOr<SearchResult> result =
      SolutionEnumerator(&sink, parameters)
          .Enumerate(FirstSolutions(3),
                     [&](int64_t, const Solution&) { ++num_reported; });
  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_EQ(result->status, SearchStatus::kLimitReachedWithSolution);
  EXPECT_GT(result->statistics.num_solutions, 3);
  EXPECT_LT(result->statistics.num_solutions, int64_t{1} << 24);
  EXPECT_EQ(num_reported, 3);
}

// Placing 20 pigeons in 19 holes is infeasible, but clause learning cannot
// prove it within a few hundredths of a second.
void BuildPigeonHole(int num_pigeons, int num_holes,
                     CpSatConstraintSink* sink) {
  std::vector<std::vector<Literal>> in_hole(num_holes);
  for (int p = 0; p < num_pigeons; ++p) {
    std::vector<Literal> holes;
    for (int h = 0; h < num_holes; ++h) {
      const Literal x = sink->NewBoolVar(absl::StrCat("p", p, "_h", h));
      holes.push_back(x);
      in_hole[h].push_back(x);
    }
    ASSERT_TRUE(sink->AddSum(holes, Comparison::kEqual, 1).ok());
  }
  for (const std::vector<Literal>& pigeons : in_hole) {
    ASSERT_TRUE(sink->AddSum(pigeons, Comparison::kLessOrEqual, 1).ok());
  }
}

TEST(SolutionEnumeratorLimitTest, TimeLimitWithoutSolution) {
  CpSatConstraintSink sink;
  BuildPigeonHole(20, 19, &sink);
  SearchParameters parameters;
  parameters.set_max_time_in_seconds(0.05);

  int64_t num_reported = 0;
  const absl::StatusOr<SearchResult> enumerated =
      SolutionEnumerator(&sink, parameters)
          .Enumerate(AllSolutions(),
                     [&](int64_t, const Solution&) { ++num_reported; });
  ASSERT_TRUE(enumerated.ok()) << enumerated.status();
  EXPECT_EQ(enumerated->status, SearchStatus::kLimitReachedWithoutSolution);
  EXPECT_NE(enumerated->status, SearchStatus::kInfeasible);
  EXPECT_FALSE(enumerated->HasSolution());
  EXPECT_FALSE(enumerated->solution.has_value());
  EXPECT_EQ(enumerated->statistics.num_solutions, 0);
  EXPECT_EQ(num_reported, 0);

  const absl::StatusOr<SearchResult> first =
      SolutionEnumerator(&sink, parameters).SolveFirstFeasible();
  ASSERT_TRUE(first.ok()) << first.status();
  EXPECT_EQ(first->status, SearchStatus::kLimitReachedWithoutSolution);
  EXPECT_FALSE(first->HasSolution());
  EXPECT_FALSE(first->solution.has_value());
}

TEST(SolutionEnumeratorLimitTest, InvalidParameters) {
  CpSatConstraintSink sink;
  sink.NewBoolVar("x");
  SearchParameters parameters;
  parameters.set_max_time_in_seconds(0.0);

  const absl::StatusOr<SearchResult> enumerated =
      SolutionEnumerator(&sink, parameters)
          .Enumerate(AllSolutions(), [](int64_t, const Solution&) {});
  EXPECT_EQ(enumerated.status().code(), absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(SolutionEnumerator(&sink, parameters)
                .SolveFirstFeasible()
                .status()
                .code(),
            absl::StatusCode::kInvalidArgument);
}

TEST(SolutionPredicateTest, Predicates) {
  EXPECT_TRUE(AllSolutions()(1));
  EXPECT_TRUE(AllSolutions()(1000000));
  EXPECT_FALSE(NoSolution()(1));
  EXPECT_TRUE(FirstSolutions(2)(2));
  EXPECT_FALSE(FirstSolutions(2)(3));
  EXPECT_FALSE(FirstSolutions(0)(1));
  EXPECT_TRUE(SolutionsIn({3, 1})(1));
  EXPECT_FALSE(SolutionsIn({3, 1})(2));
  EXPECT_FALSE(SolutionsIn({})(1));
}

TEST(ValidateSearchParametersTest, DefaultIsValid) {
  const absl::Status status = ValidateSearchParameters(SearchParameters());
  EXPECT_TRUE(status.ok()) << status;
}

TEST(ValidateSearchParametersTest, BadTimeLimit) {
  SearchParameters parameters;
  parameters.set_max_time_in_seconds(-1.0);
  absl::Status status = ValidateSearchParameters(parameters);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(status.message(), HasSubstr("max_time_in_seconds"));

  parameters.set_max_time_in_seconds(std::numeric_limits<double>::infinity());
  status = ValidateSearchParameters(parameters);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);

  parameters.set_max_time_in_seconds(std::nan(""));
  status = ValidateSearchParameters(parameters);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(status.message(), HasSubstr("NAN"));
}

TEST(ValidateSearchParametersTest, BadNumWorkers) {
  SearchParameters parameters;
  parameters.set_num_workers(0);
  const absl::Status status = ValidateSearchParameters(parameters);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(status.message(), HasSubstr("num_workers"));
}

TEST(ValidateSearchParametersTest, BadSolutionIndex) {
  SearchParameters parameters;
  parameters.add_solutions_of_interest(0);
  const absl::Status status = ValidateSearchParameters(parameters);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(status.message(), HasSubstr("1-based"));
}

TEST(SearchStatusTest, ToString) {
  EXPECT_EQ(SearchStatusToString(SearchStatus::kFeasible), "FEASIBLE");
  EXPECT_EQ(SearchStatusToString(SearchStatus::kLimitReachedWithoutSolution),
            "LIMIT_REACHED_WITHOUT_SOLUTION");
}

TEST(SearchStatisticsTest, DebugString) {
  SearchStatistics statistics;
  statistics.num_solutions = 3;
  statistics.num_conflicts = 4;
  EXPECT_THAT(statistics.DebugString(), HasSubstr("num_solutions: 3"));
  EXPECT_THAT(statistics.DebugString(), HasSubstr("num_conflicts: 4"));
}

}  // namespace
}  // namespace rostering
