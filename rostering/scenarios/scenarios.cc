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

#include "rostering/scenarios/scenarios.h"

#include <string>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "ortools/base/logging.h"
#include "ortools/base/status_macros.h"
#include "rostering/model/constraint_sink.h"
#include "rostering/model/policy_constraints.h"
#include "rostering/model/state_vocabulary.h"
#include "rostering/model/work_policy.pb.h"

namespace rostering {
namespace {

struct StateInfo {
  absl::string_view name;
  bool is_work;
};

// Indexed by DriverState.
constexpr StateInfo kDriverStates[] = {
    {"FREE", false},
    {"DRIVE", true},
    {"REST", true},
};

// Indexed by NurseState.
constexpr StateInfo kNurseStates[] = {
    {"OFF", false},
    {"ON_SHIFT", true},
};

StateVocabulary VocabularyFromTable(absl::Span<const StateInfo> table) {
  std::vector<StateDefinition> definitions;
  definitions.reserve(table.size());
  for (const StateInfo& info : table) {
    definitions.push_back({std::string(info.name), info.is_work});
  }
  absl::StatusOr<StateVocabulary> vocabulary =
      StateVocabulary::Create(std::move(definitions));
  // The tables above are valid vocabularies.
  CHECK_OK(vocabulary.status());
  return *std::move(vocabulary);
}

}  // namespace

absl::string_view DriverStateName(DriverState state) {
  return kDriverStates[static_cast<int>(state)].name;
}

bool IsWork(DriverState state) {
  return kDriverStates[static_cast<int>(state)].is_work;
}

absl::string_view NurseStateName(NurseState state) {
  return kNurseStates[static_cast<int>(state)].name;
}

bool IsWork(NurseState state) {
  return kNurseStates[static_cast<int>(state)].is_work;
}

StateVocabulary DriverStates() { return VocabularyFromTable(kDriverStates); }

StateVocabulary NurseStates() { return VocabularyFromTable(kNurseStates); }

WorkPolicy DriverBreaksPolicy() {
  WorkPolicy policy;
  policy.set_num_entities(3);
  policy.set_num_periods(1);
  policy.set_num_subperiods(8);
  policy.set_active_state(std::string(DriverStateName(DriverState::kDrive)));
  policy.set_idle_state(std::string(DriverStateName(DriverState::kFree)));
  policy.set_exactly_one_active_per_subperiod(true);
  policy.set_exclusive_activity(true);
  policy.set_min_work_subperiods(4);
  policy.set_max_work_subperiods(5);
  policy.set_max_consecutive_active(2);
  policy.set_variable_prefix("timeblock");
  return policy;
}

WorkPolicy DriverFreeDaysPolicy() {
  WorkPolicy policy = DriverBreaksPolicy();
  policy.set_num_entities(6);
  policy.set_num_periods(2);
  policy.set_num_subperiods(6);
  policy.set_min_work_subperiods(3);
  policy.set_max_work_subperiods(4);
  policy.set_model_free_periods(true);
  return policy;
}

WorkPolicy NurseShiftsPolicy() {
  WorkPolicy policy;
  policy.set_num_entities(4);
  policy.set_num_periods(3);
  policy.set_num_subperiods(3);
  policy.set_active_state(std::string(NurseStateName(NurseState::kOnShift)));
  policy.set_idle_state(std::string(NurseStateName(NurseState::kOff)));
  policy.set_exclusive_activity(true);
  policy.set_max_work_subperiods(1);
  policy.set_variable_prefix("shift");
  return policy;
}

absl::StatusOr<ImplicationPuzzle> BuildImplicationPuzzle(ConstraintSink* sink) {
  const ImplicationPuzzle puzzle = {sink->NewBoolVar("a"),
                                    sink->NewBoolVar("b"),
                                    sink->NewBoolVar("c")};
  RETURN_IF_ERROR(AddImplication(puzzle.a, puzzle.c, sink));
  RETURN_IF_ERROR(
      AddImplication(puzzle.a.Negated(), puzzle.c.Negated(), sink));
  RETURN_IF_ERROR(AddImplication(puzzle.b, puzzle.c, sink));
  return puzzle;
}

}  // namespace rostering
