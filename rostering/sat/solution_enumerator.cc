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
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "ortools/base/logging.h"
#include "ortools/base/status_macros.h"
#include "ortools/sat/cp_model.pb.h"
#include "ortools/sat/cp_model_checker.h"
#include "ortools/sat/cp_model_solver.h"
#include "ortools/sat/model.h"
#include "ortools/sat/sat_parameters.pb.h"
#include "rostering/model/solution.h"
#include "rostering/sat/cp_sat_sink.h"
#include "rostering/sat/search_parameters.pb.h"

namespace rostering {

using ::operations_research::sat::CpSolverResponse;
using ::operations_research::sat::CpSolverResponseStats;
using ::operations_research::sat::CpSolverStatus;
using ::operations_research::sat::Model;
using ::operations_research::sat::NewFeasibleSolutionObserver;
using ::operations_research::sat::NewSatParameters;
using ::operations_research::sat::SatParameters;
using ::operations_research::sat::SolveCpModel;
using ::operations_research::sat::ValidateCpModel;

absl::string_view SearchStatusToString(SearchStatus status) {
  switch (status) {
    case SearchStatus::kFeasible:
      return "FEASIBLE";
    case SearchStatus::kAllSolutionsFound:
      return "ALL_SOLUTIONS_FOUND";
    case SearchStatus::kInfeasible:
      return "INFEASIBLE";
    case SearchStatus::kLimitReachedWithSolution:
      return "LIMIT_REACHED_WITH_SOLUTION";
    case SearchStatus::kLimitReachedWithoutSolution:
      return "LIMIT_REACHED_WITHOUT_SOLUTION";
  }
  LOG(DFATAL) << "Unknown SearchStatus: " << static_cast<int>(status);
  return "UNKNOWN";
}

std::ostream& operator<<(std::ostream& os, SearchStatus status) {
  return os << SearchStatusToString(status);
}

std::string SearchStatistics::DebugString() const {
  return absl::StrFormat(
      "num_solutions: %d num_conflicts: %d num_branches: %d wall_time: %fs",
      num_solutions, num_conflicts, num_branches, wall_time);
}

SolutionPredicate AllSolutions() {
  return [](int64_t) { return true; };
}

SolutionPredicate NoSolution() {
  return [](int64_t) { return false; };
}

SolutionPredicate FirstSolutions(int64_t count) {
  return [count](int64_t index) { return index <= count; };
}

SolutionPredicate SolutionsIn(const std::vector<int64_t>& indices) {
  absl::flat_hash_set<int64_t> wanted(indices.begin(), indices.end());
  return [wanted = std::move(wanted)](int64_t index) {
    return wanted.contains(index);
  };
}

absl::Status ValidateSearchParameters(const SearchParameters& parameters) {
  if (std::isnan(parameters.max_time_in_seconds())) {
    return absl::InvalidArgumentError("max_time_in_seconds is NAN");
  }
  if (!std::isfinite(parameters.max_time_in_seconds()) ||
      parameters.max_time_in_seconds() <= 0.0) {
    return absl::InvalidArgumentError(
        absl::StrCat("max_time_in_seconds must be positive and finite, got ",
                     parameters.max_time_in_seconds()));
  }
  if (parameters.num_workers() < 1) {
    return absl::InvalidArgumentError(absl::StrCat(
        "num_workers must be at least 1, got ", parameters.num_workers()));
  }
  if (parameters.linearization_level() < 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("linearization_level must be non-negative, got ",
                     parameters.linearization_level()));
  }
  for (const int64_t index : parameters.solutions_of_interest()) {
    if (index < 1) {
      return absl::InvalidArgumentError(absl::StrCat(
          "solutions_of_interest are 1-based, got ", index));
    }
  }
  return absl::OkStatus();
}

SatParameters SolutionEnumerator::MakeSatParameters(
    bool enumerate_all_solutions) const {
  SatParameters sat_parameters;
  sat_parameters.set_max_time_in_seconds(parameters_.max_time_in_seconds());
  sat_parameters.set_linearization_level(parameters_.linearization_level());
  sat_parameters.set_log_search_progress(parameters_.log_search_progress());
  sat_parameters.set_random_seed(parameters_.random_seed());
  if (enumerate_all_solutions) {
    // Solution enumeration is only supported by the sequential search.
    sat_parameters.set_enumerate_all_solutions(true);
    sat_parameters.set_num_workers(1);
  } else {
    sat_parameters.set_num_workers(parameters_.num_workers());
  }
  return sat_parameters;
}

absl::StatusOr<CpSolverResponse> SolutionEnumerator::Solve(
    const SatParameters& sat_parameters,
    const std::function<void(const CpSolverResponse&)>& observer) const {
  RETURN_IF_ERROR(ValidateSearchParameters(parameters_));
  const std::string model_error = ValidateCpModel(sink_->Proto());
  if (!model_error.empty()) {
    return absl::InternalError(
        absl::StrCat("invalid CP-SAT model: ", model_error));
  }

  Model model;
  model.Add(NewSatParameters(sat_parameters));
  if (observer != nullptr) {
    model.Add(NewFeasibleSolutionObserver(observer));
  }
  VLOG(1) << "Solving a model with " << sink_->num_variables()
          << " variables and " << sink_->Proto().constraints_size()
          << " constraints.";
  CpSolverResponse response = SolveCpModel(sink_->Proto(), &model);
  VLOG(1) << CpSolverResponseStats(response, /*has_objective=*/false);

  if (response.status() == CpSolverStatus::MODEL_INVALID) {
    return absl::InternalError(absl::StrCat("CP-SAT rejected the model: ",
                                            response.solution_info()));
  }
  return response;
}

namespace {

SearchStatistics StatisticsFrom(const CpSolverResponse& response,
                                int64_t num_solutions) {
  SearchStatistics statistics;
  statistics.num_solutions = num_solutions;
  statistics.num_conflicts = response.num_conflicts();
  statistics.num_branches = response.num_branches();
  statistics.wall_time = response.wall_time();
  return statistics;
}

}  // namespace

absl::StatusOr<SearchResult> SolutionEnumerator::Enumerate(
    const SolutionPredicate& of_interest,
    const SolutionCallback& callback) const {
  int64_t num_solutions = 0;
  const auto observer = [&](const CpSolverResponse& response) {
    ++num_solutions;
    if (of_interest(num_solutions)) {
      callback(num_solutions, sink_->ExtractSolution(response));
    }
  };
  ASSIGN_OR_RETURN(const CpSolverResponse response,
                   Solve(MakeSatParameters(/*enumerate_all_solutions=*/true),
                         observer));

  SearchResult result;
  result.statistics = StatisticsFrom(response, num_solutions);
  switch (response.status()) {
    case CpSolverStatus::OPTIMAL:
      result.status = num_solutions > 0 ? SearchStatus::kAllSolutionsFound
                                        : SearchStatus::kInfeasible;
      break;
    case CpSolverStatus::INFEASIBLE:
      result.status = SearchStatus::kInfeasible;
      break;
    case CpSolverStatus::FEASIBLE:
      result.status = SearchStatus::kLimitReachedWithSolution;
      break;
    default:
      result.status = num_solutions > 0
                          ? SearchStatus::kLimitReachedWithSolution
                          : SearchStatus::kLimitReachedWithoutSolution;
      break;
  }
  VLOG(1) << "Enumeration finished with status " << result.status << ", "
          << result.statistics.DebugString();
  return result;
}

absl::StatusOr<SearchResult> SolutionEnumerator::SolveFirstFeasible() const {
  ASSIGN_OR_RETURN(
      const CpSolverResponse response,
      Solve(MakeSatParameters(/*enumerate_all_solutions=*/false), nullptr));

  SearchResult result;
  switch (response.status()) {
    case CpSolverStatus::OPTIMAL:
      result.status = SearchStatus::kFeasible;
      break;
    case CpSolverStatus::FEASIBLE:
      // Without an objective any solution is as good as another.
      result.status = sink_->Proto().has_objective()
                          ? SearchStatus::kLimitReachedWithSolution
                          : SearchStatus::kFeasible;
      break;
    case CpSolverStatus::INFEASIBLE:
      result.status = SearchStatus::kInfeasible;
      break;
    default:
      result.status = SearchStatus::kLimitReachedWithoutSolution;
      break;
  }
  if (result.HasSolution()) {
    result.solution = sink_->ExtractSolution(response);
  }
  result.statistics = StatisticsFrom(response, result.HasSolution() ? 1 : 0);
  VLOG(1) << "Search finished with status " << result.status << ", "
          << result.statistics.DebugString();
  return result;
}

}  // namespace rostering
