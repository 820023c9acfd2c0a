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

// Plain text rendering of solutions and search statistics for the example
// binaries.

#ifndef ROSTERING_SCENARIOS_SCHEDULE_PRINTER_H_
#define ROSTERING_SCENARIOS_SCHEDULE_PRINTER_H_

#include <cstdint>
#include <string>

#include "absl/types/span.h"
#include "rostering/model/constraint_sink.h"
#include "rostering/model/schedule_model.h"
#include "rostering/model/solution.h"
#include "rostering/sat/solution_enumerator.h"

namespace rostering {

// Words used to describe an entity and a subperiod, e.g. "Driver" and
// "time-block".
struct ScheduleLabels {
  std::string entity = "Entity";
  std::string subperiod = "subperiod";
};

// Renders one solution of a schedule:
//   Solution 1
//   Day 0
//     Driver 0 time-block 0: DRIVE
//     ...
//     Driver 2 does not work
// An entity with no work subperiod on a day is reported on a single line.
std::string FormatSchedule(int64_t solution_index, const ScheduleModel& model,
                           const Solution& solution,
                           const ScheduleLabels& labels);

// Renders "  <name> -> <0|1>" for each literal, sorted by variable name.
std::string FormatNamedValues(int64_t solution_index,
                              const ConstraintSink& sink,
                              absl::Span<const Literal> literals,
                              const Solution& solution);

std::string FormatStatistics(const SearchResult& result);

}  // namespace rostering

#endif  // ROSTERING_SCENARIOS_SCHEDULE_PRINTER_H_
