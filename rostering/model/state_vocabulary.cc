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

#include "rostering/model/state_vocabulary.h"

#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "ortools/base/logging.h"

namespace rostering {

absl::StatusOr<StateVocabulary> StateVocabulary::Create(
    std::vector<StateDefinition> states) {
  if (states.empty()) {
    return absl::InvalidArgumentError("a state vocabulary cannot be empty");
  }
  absl::flat_hash_set<absl::string_view> names;
  for (int i = 0; i < states.size(); ++i) {
    const std::string& name = states[i].name;
    if (name.empty()) {
      return absl::InvalidArgumentError(
          absl::StrCat("state #", i, " has an empty name"));
    }
    if (!names.insert(name).second) {
      return absl::AlreadyExistsError(
          absl::StrCat("duplicate state name '", name, "'"));
    }
  }
  return StateVocabulary(std::move(states));
}

StateVocabulary::StateVocabulary(std::vector<StateDefinition> states)
    : states_(std::move(states)) {
  for (int i = 0; i < states_.size(); ++i) {
    index_by_name_[states_[i].name] = i;
    if (states_[i].is_work) work_states_.push_back(i);
  }
}

const std::string& StateVocabulary::name(int state) const {
  DCHECK(IsValidState(state)) << state;
  return states_[state].name;
}

bool StateVocabulary::IsWork(int state) const {
  DCHECK(IsValidState(state)) << state;
  return states_[state].is_work;
}

absl::StatusOr<int> StateVocabulary::IndexOf(absl::string_view name) const {
  const auto it = index_by_name_.find(name);
  if (it == index_by_name_.end()) {
    return absl::NotFoundError(absl::StrCat("unknown state '", name, "'"));
  }
  return it->second;
}

}  // namespace rostering
