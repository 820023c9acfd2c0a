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

#include "rostering/model/decision_grid.h"

#include <cstdint>
#include <limits>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "ortools/base/logging.h"
#include "ortools/base/status_macros.h"
#include "rostering/model/constraint_sink.h"
#include "rostering/model/state_vocabulary.h"

namespace rostering {

namespace {
absl::Status CheckPositive(int value, absl::string_view name) {
  if (value <= 0) {
    return absl::InvalidArgumentError(
        absl::StrCat(name, " must be positive, got ", value));
  }
  return absl::OkStatus();
}

absl::Status CheckInRange(int value, int size, absl::string_view name) {
  if (value < 0 || value >= size) {
    return absl::OutOfRangeError(absl::StrCat(name, " ", value,
                                              " is not in [0, ", size, ")"));
  }
  return absl::OkStatus();
}
}  // namespace

absl::StatusOr<DecisionGrid> DecisionGrid::Create(int num_entities,
                                                  int num_periods,
                                                  int num_subperiods,
                                                  StateVocabulary vocabulary,
                                                  absl::string_view prefix,
                                                  ConstraintSink* sink) {
  CHECK(sink != nullptr);
  RETURN_IF_ERROR(CheckPositive(num_entities, "num_entities"));
  RETURN_IF_ERROR(CheckPositive(num_periods, "num_periods"));
  RETURN_IF_ERROR(CheckPositive(num_subperiods, "num_subperiods"));
  const int64_t num_variables = int64_t{num_entities} * num_periods *
                                num_subperiods * vocabulary.num_states();
  if (num_variables > std::numeric_limits<int>::max()) {
    return absl::InvalidArgumentError(
        absl::StrCat("the grid would need ", num_variables, " variables"));
  }

  DecisionGrid grid(num_entities, num_periods, num_subperiods,
                    std::move(vocabulary));
  grid.literals_.reserve(num_variables);
  for (int e = 0; e < num_entities; ++e) {
    for (int p = 0; p < num_periods; ++p) {
      for (int s = 0; s < num_subperiods; ++s) {
        for (int st = 0; st < grid.num_states(); ++st) {
          DCHECK_EQ(grid.literals_.size(), grid.Index(e, p, s, st));
          grid.literals_.push_back(sink->NewBoolVar(
              absl::StrCat(prefix, "_e", e, "_p", p, "_s", s, "_",
                           grid.vocabulary_.name(st))));
        }
      }
    }
  }
  VLOG(1) << "Created a " << num_entities << "x" << num_periods << "x"
          << num_subperiods << "x" << grid.num_states()
          << " decision grid '" << prefix << "'.";
  return grid;
}

DecisionGrid::DecisionGrid(int num_entities, int num_periods,
                           int num_subperiods, StateVocabulary vocabulary)
    : num_entities_(num_entities),
      num_periods_(num_periods),
      num_subperiods_(num_subperiods),
      vocabulary_(std::move(vocabulary)) {}

absl::StatusOr<Literal> DecisionGrid::Find(int entity, int period,
                                           int subperiod, int state) const {
  RETURN_IF_ERROR(CheckIndices(entity, period, subperiod, state));
  return literals_[Index(entity, period, subperiod, state)];
}

absl::Status DecisionGrid::CheckIndices(int entity, int period, int subperiod,
                                        int state) const {
  RETURN_IF_ERROR(CheckInRange(entity, num_entities_, "entity"));
  RETURN_IF_ERROR(CheckInRange(period, num_periods_, "period"));
  RETURN_IF_ERROR(CheckInRange(subperiod, num_subperiods_, "subperiod"));
  return CheckInRange(state, vocabulary_.num_states(), "state");
}

std::vector<Literal> DecisionGrid::StateLiterals(int entity, int period,
                                                 int subperiod) const {
  std::vector<Literal> result;
  result.reserve(num_states());
  for (int st = 0; st < num_states(); ++st) {
    result.push_back(Get(entity, period, subperiod, st));
  }
  return result;
}

std::vector<Literal> DecisionGrid::WorkLiterals(int entity, int period) const {
  std::vector<Literal> result;
  result.reserve(num_subperiods_ * vocabulary_.work_states().size());
  for (int s = 0; s < num_subperiods_; ++s) {
    for (const int st : vocabulary_.work_states()) {
      result.push_back(Get(entity, period, s, st));
    }
  }
  return result;
}

std::vector<Literal> DecisionGrid::StateRun(int entity, int period, int state,
                                            int begin, int end) const {
  DCHECK_LE(0, begin);
  DCHECK_LE(end, num_subperiods_);
  std::vector<Literal> result;
  for (int s = begin; s < end; ++s) {
    result.push_back(Get(entity, period, s, state));
  }
  return result;
}

}  // namespace rostering
