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

// Scheduling instances used by the example binaries and by the tests.

#ifndef ROSTERING_SCENARIOS_SCENARIOS_H_
#define ROSTERING_SCENARIOS_SCENARIOS_H_

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "rostering/model/constraint_sink.h"
#include "rostering/model/state_vocabulary.h"
#include "rostering/model/work_policy.pb.h"

namespace rostering {

// What a driver does during a time block. The values are the state indices of
// DriverStates().
enum class DriverState { kFree = 0, kDrive = 1, kRest = 2 };

// What a nurse does during a shift. The values are the state indices of
// NurseStates().
enum class NurseState { kOff = 0, kOnShift = 1 };

absl::string_view DriverStateName(DriverState state);
bool IsWork(DriverState state);
absl::string_view NurseStateName(NurseState state);
bool IsWork(NurseState state);

// FREE, DRIVE and REST. Driving and resting both count as work.
StateVocabulary DriverStates();

// OFF and ON_SHIFT.
StateVocabulary NurseStates();

// 3 drivers, one day of 8 half-hour blocks. Exactly one driver drives in each
// block, every driver works 4 to 5 blocks and never drives more than 2 blocks
// in a row.
WorkPolicy DriverBreaksPolicy();

// 6 drivers, two days of 6 blocks. Same rules as DriverBreaksPolicy() with
// 3 to 4 blocks per working day. A driver may take a full day off, in which
// case the minimum does not apply.
WorkPolicy DriverFreeDaysPolicy();

// 4 nurses, 3 days of 3 shifts. A nurse works at most one shift per day and
// no shift needs to be covered.
WorkPolicy NurseShiftsPolicy();

// Three free booleans linked by a => c, not(a) => not(c) and b => c. The
// satisfying (a, b, c) are (0, 0, 0), (1, 0, 1) and (1, 1, 1).
struct ImplicationPuzzle {
  Literal a;
  Literal b;
  Literal c;
};

absl::StatusOr<ImplicationPuzzle> BuildImplicationPuzzle(ConstraintSink* sink);

}  // namespace rostering

#endif  // ROSTERING_SCENARIOS_SCENARIOS_H_
