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

#include "rostering/sat/cp_sat_sink.h"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "ortools/base/logging.h"
#include "ortools/base/status_macros.h"
#include "ortools/sat/cp_model.h"
#include "ortools/sat/cp_model.pb.h"
#include "rostering/model/constraint_sink.h"
#include "rostering/model/solution.h"

namespace rostering {

using ::operations_research::sat::BoolVar;
using ::operations_research::sat::CpSolverResponse;
using ::operations_research::sat::LinearExpr;
using ::operations_research::sat::SolutionBooleanValue;

Literal CpSatConstraintSink::NewBoolVar(absl::string_view name) {
  variables_.push_back(builder_.NewBoolVar().WithName(name));
  return Literal(variables_.size() - 1);
}

std::string CpSatConstraintSink::VariableName(int variable) const {
  CHECK_LT(variable, variables_.size());
  return variables_[variable].Name();
}

BoolVar CpSatConstraintSink::ToBoolVar(Literal literal) const {
  DCHECK_OK(CheckLiteral(literal));
  const BoolVar var = variables_[literal.variable()];
  return literal.IsPositive() ? var : var.Not();
}

absl::Status CpSatConstraintSink::AddLinear(absl::Span<const LinearTerm> terms,
                                            Comparison comparison,
                                            int64_t bound) {
  LinearExpr expr;
  for (const LinearTerm& term : terms) {
    RETURN_IF_ERROR(CheckLiteral(term.literal));
    // A negated BoolVar is expanded by CP-SAT into coefficient * (1 - var).
    expr.AddTerm(ToBoolVar(term.literal), term.coefficient);
  }
  switch (comparison) {
    case Comparison::kEqual:
      builder_.AddEquality(expr, bound);
      break;
    case Comparison::kLessOrEqual:
      builder_.AddLessOrEqual(expr, bound);
      break;
    case Comparison::kGreaterOrEqual:
      builder_.AddGreaterOrEqual(expr, bound);
      break;
  }
  return absl::OkStatus();
}

absl::Status CpSatConstraintSink::AddImplication(Literal a, Literal b) {
  RETURN_IF_ERROR(CheckLiteral(a));
  RETURN_IF_ERROR(CheckLiteral(b));
  builder_.AddImplication(ToBoolVar(a), ToBoolVar(b));
  return absl::OkStatus();
}

Solution CpSatConstraintSink::ExtractSolution(
    const CpSolverResponse& response) const {
  std::vector<bool> values(variables_.size());
  for (int i = 0; i < variables_.size(); ++i) {
    values[i] = SolutionBooleanValue(response, variables_[i]);
  }
  return Solution(std::move(values));
}

}  // namespace rostering
