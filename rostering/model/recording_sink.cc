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

#include "rostering/model/recording_sink.h"

#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "ortools/base/logging.h"
#include "ortools/base/status_macros.h"
#include "rostering/model/constraint_sink.h"
#include "rostering/model/solution.h"

namespace rostering {

Literal RecordingSink::NewBoolVar(absl::string_view name) {
  names_.emplace_back(name);
  return Literal(names_.size() - 1);
}

std::string RecordingSink::VariableName(int variable) const {
  CHECK_LT(variable, names_.size());
  return names_[variable];
}

absl::Status RecordingSink::AddLinear(absl::Span<const LinearTerm> terms,
                                      Comparison comparison, int64_t bound) {
  for (const LinearTerm& term : terms) {
    RETURN_IF_ERROR(CheckLiteral(term.literal));
  }
  linear_constraints_.push_back(
      {std::vector<LinearTerm>(terms.begin(), terms.end()), comparison,
       bound});
  return absl::OkStatus();
}

absl::Status RecordingSink::AddImplication(Literal a, Literal b) {
  RETURN_IF_ERROR(CheckLiteral(a));
  RETURN_IF_ERROR(CheckLiteral(b));
  implications_.push_back({a, b});
  return absl::OkStatus();
}

bool RecordingSink::IsSatisfiedBy(const Solution& solution) const {
  CHECK_EQ(solution.num_variables(), num_variables());
  for (const LinearConstraint& constraint : linear_constraints_) {
    int64_t activity = 0;
    for (const LinearTerm& term : constraint.terms) {
      if (solution.Value(term.literal)) activity += term.coefficient;
    }
    switch (constraint.comparison) {
      case Comparison::kEqual:
        if (activity != constraint.bound) return false;
        break;
      case Comparison::kLessOrEqual:
        if (activity > constraint.bound) return false;
        break;
      case Comparison::kGreaterOrEqual:
        if (activity < constraint.bound) return false;
        break;
    }
  }
  for (const Implication& implication : implications_) {
    if (solution.Value(implication.a) && !solution.Value(implication.b)) {
      return false;
    }
  }
  return true;
}

}  // namespace rostering
