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

#ifndef ROSTERING_MODEL_SOLUTION_H_
#define ROSTERING_MODEL_SOLUTION_H_

#include <utility>
#include <vector>

#include "absl/types/span.h"
#include "rostering/model/constraint_sink.h"

namespace rostering {

// Immutable snapshot of the value of every variable of a ConstraintSink in
// one satisfying assignment.
class Solution {
 public:
  Solution() = default;
  explicit Solution(std::vector<bool> values) : values_(std::move(values)) {}

  int num_variables() const { return values_.size(); }

  // The literal must reference a variable of the snapshot.
  bool Value(Literal literal) const;

  // Number of true literals in the span.
  int CountTrue(absl::Span<const Literal> literals) const;

  bool operator==(const Solution& other) const {
    return values_ == other.values_;
  }
  bool operator!=(const Solution& other) const { return !(*this == other); }

 private:
  std::vector<bool> values_;
};

}  // namespace rostering

#endif  // ROSTERING_MODEL_SOLUTION_H_
