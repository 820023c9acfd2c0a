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

#ifndef ROSTERING_MODEL_DECISION_GRID_H_
#define ROSTERING_MODEL_DECISION_GRID_H_

#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "ortools/base/logging.h"
#include "rostering/model/constraint_sink.h"
#include "rostering/model/state_vocabulary.h"

namespace rostering {

// Dense collection of boolean decision variables. The variable at
// (entity, period, subperiod, state) is true iff the entity is in that state
// during that subperiod of that period.
//
// Variables are created once, by Create(), and named
// "<prefix>_e<entity>_p<period>_s<subperiod>_<STATE>".
class DecisionGrid {
 public:
  // Returns InvalidArgument if a dimension is not positive or if the grid
  // would be too large to be indexed.
  static absl::StatusOr<DecisionGrid> Create(int num_entities, int num_periods,
                                             int num_subperiods,
                                             StateVocabulary vocabulary,
                                             absl::string_view prefix,
                                             ConstraintSink* sink);

  int num_entities() const { return num_entities_; }
  int num_periods() const { return num_periods_; }
  int num_subperiods() const { return num_subperiods_; }
  int num_states() const { return vocabulary_.num_states(); }
  const StateVocabulary& vocabulary() const { return vocabulary_; }

  // O(1) lookup. Indices must be in range.
  Literal Get(int entity, int period, int subperiod, int state) const {
    DCHECK_OK(CheckIndices(entity, period, subperiod, state));
    return literals_[Index(entity, period, subperiod, state)];
  }

  // Same as Get() but returns OutOfRange for an index outside the grid.
  absl::StatusOr<Literal> Find(int entity, int period, int subperiod,
                               int state) const;

  absl::Status CheckIndices(int entity, int period, int subperiod,
                            int state) const;

  // The num_states() literals of one cell, in state order.
  std::vector<Literal> StateLiterals(int entity, int period,
                                     int subperiod) const;

  // The literals of every work state of every subperiod of (entity, period).
  // Their sum is the workload of the entity on that period.
  std::vector<Literal> WorkLiterals(int entity, int period) const;

  // The literals of `state` for subperiods [begin, end) of (entity, period).
  std::vector<Literal> StateRun(int entity, int period, int state, int begin,
                                int end) const;

 private:
  DecisionGrid(int num_entities, int num_periods, int num_subperiods,
               StateVocabulary vocabulary);

  int Index(int entity, int period, int subperiod, int state) const {
    return ((entity * num_periods_ + period) * num_subperiods_ + subperiod) *
               vocabulary_.num_states() +
           state;
  }

  int num_entities_;
  int num_periods_;
  int num_subperiods_;
  StateVocabulary vocabulary_;
  std::vector<Literal> literals_;
};

}  // namespace rostering

#endif  // ROSTERING_MODEL_DECISION_GRID_H_
