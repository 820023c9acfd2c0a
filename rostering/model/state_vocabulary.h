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

#ifndef ROSTERING_MODEL_STATE_VOCABULARY_H_
#define ROSTERING_MODEL_STATE_VOCABULARY_H_

#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"

namespace rostering {

struct StateDefinition {
  std::string name;
  // True if being in this state counts towards the workload of an entity.
  bool is_work = false;
};

// The closed, ordered set of mutually exclusive states an entity can be in
// during one subperiod. States are addressed by their index in the
// declaration order.
//
// work_states() is used to compute every workload bound: a state missing
// from it, or listed twice, silently changes all of them.
class StateVocabulary {
 public:
  // Returns InvalidArgument for an empty list or an empty name, and
  // AlreadyExists when two states share a name.
  static absl::StatusOr<StateVocabulary> Create(
      std::vector<StateDefinition> states);

  int num_states() const { return states_.size(); }
  absl::Span<const StateDefinition> states() const { return states_; }
  const std::string& name(int state) const;
  bool IsWork(int state) const;

  // Indices of the states whose is_work is true, in declaration order.
  absl::Span<const int> work_states() const { return work_states_; }

  // Returns NotFound for an unknown name.
  absl::StatusOr<int> IndexOf(absl::string_view name) const;

  bool IsValidState(int state) const {
    return state >= 0 && state < num_states();
  }

 private:
  explicit StateVocabulary(std::vector<StateDefinition> states);

  std::vector<StateDefinition> states_;
  std::vector<int> work_states_;
  absl::flat_hash_map<std::string, int> index_by_name_;
};

}  // namespace rostering

#endif  // ROSTERING_MODEL_STATE_VOCABULARY_H_
