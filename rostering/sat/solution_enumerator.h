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

#ifndef ROSTERING_SAT_SOLUTION_ENUMERATOR_H_
#define ROSTERING_SAT_SOLUTION_ENUMERATOR_H_

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "ortools/sat/cp_model.pb.h"
#include "ortools/sat/sat_parameters.pb.h"
#include "rostering/model/solution.h"
#include "rostering/sat/cp_sat_sink.h"
#include "rostering/sat/search_parameters.pb.h"

namespace rostering {

// Terminal outcome of a search. Infeasibility and running out of time are
// both valid outcomes, and they are kept apart: kInfeasible is a proof that no
// solution exists, the kLimitReached* values are not.
enum class SearchStatus {
  // SolveFirstFeasible() found a solution.
  kFeasible,
  // Enumerate() explored the whole search space and found at least one
  // solution.
  kAllSolutionsFound,
  // The model has no solution.
  kInfeasible,
  // The time budget elapsed after at least one solution was found.
  kLimitReachedWithSolution,
  // The time budget elapsed before any solution was found.
  kLimitReachedWithoutSolution,
};

absl::string_view SearchStatusToString(SearchStatus status);
std::ostream& operator<<(std::ostream& os, SearchStatus status);

// Statistics of one run. They are not accumulated across runs.
struct SearchStatistics {
  int64_t num_solutions = 0;
  int64_t num_conflicts = 0;
  int64_t num_branches = 0;
  // In seconds.
  double wall_time = 0.0;

  std::string DebugString() const;
};

struct SearchResult {
  SearchStatus status = SearchStatus::kLimitReachedWithoutSolution;
  SearchStatistics statistics;
  // Filled by SolveFirstFeasible() when a solution was found. Enumerate()
  // hands solutions to its callback instead.
  std::optional<Solution> solution;

  bool HasSolution() const {
    return status == SearchStatus::kFeasible ||
           status == SearchStatus::kAllSolutionsFound ||
           status == SearchStatus::kLimitReachedWithSolution;
  }
};

// Decides, from its 1-based index, whether an enumerated solution is reported
// to the callback.
using SolutionPredicate = std::function<bool(int64_t solution_index)>;

// Receives an enumerated solution of interest and its 1-based index.
using SolutionCallback =
    std::function<void(int64_t solution_index, const Solution& solution)>;

SolutionPredicate AllSolutions();
SolutionPredicate NoSolution();
SolutionPredicate FirstSolutions(int64_t count);
SolutionPredicate SolutionsIn(const std::vector<int64_t>& indices);

// Returns InvalidArgument if the time budget is not positive and finite, or if
// there is no search worker.
absl::Status ValidateSearchParameters(const SearchParameters& parameters);

// Runs CP-SAT on the model held by a CpSatConstraintSink. The model must be
// fully built before any method is called, and must not change while a search
// runs.
//
// Both methods can be called any number of times; every call is an
// independent run with its own statistics.
class SolutionEnumerator {
 public:
  SolutionEnumerator(const CpSatConstraintSink* sink,
                     const SearchParameters& parameters)
      : sink_(sink), parameters_(parameters) {}

  // Enumerates every solution until the search space is exhausted or the time
  // budget elapses. Each solution gets the next 1-based index and is passed
  // to callback iff of_interest(index) is true. The search continues after a
  // solution whatever the predicate says.
  //
  // The callback is never called concurrently.
  absl::StatusOr<SearchResult> Enumerate(const SolutionPredicate& of_interest,
                                         const SolutionCallback& callback) const;

  // Looks for one solution within the time budget. Check result.status before
  // reading result.solution.
  absl::StatusOr<SearchResult> SolveFirstFeasible() const;

  const SearchParameters& parameters() const { return parameters_; }

 private:
  operations_research::sat::SatParameters MakeSatParameters(
      bool enumerate_all_solutions) const;

  absl::StatusOr<operations_research::sat::CpSolverResponse> Solve(
      const operations_research::sat::SatParameters& sat_parameters,
      const std::function<void(
          const operations_research::sat::CpSolverResponse&)>& observer) const;

  const CpSatConstraintSink* const sink_;
  const SearchParameters parameters_;
};

}  // namespace rostering

#endif  // ROSTERING_SAT_SOLUTION_ENUMERATOR_H_
