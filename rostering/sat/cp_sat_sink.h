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

#ifndef ROSTERING_SAT_CP_SAT_SINK_H_
#define ROSTERING_SAT_CP_SAT_SINK_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "ortools/sat/cp_model.h"
#include "ortools/sat/cp_model.pb.h"
#include "rostering/model/constraint_sink.h"
#include "rostering/model/solution.h"

namespace rostering {

// ConstraintSink backed by a CP-SAT CpModelBuilder. Sink variable i is the
// i-th boolean variable created in the builder.
class CpSatConstraintSink : public ConstraintSink {
 public:
  CpSatConstraintSink() = default;

  // This type is neither copyable nor movable.
  CpSatConstraintSink(const CpSatConstraintSink&) = delete;
  CpSatConstraintSink& operator=(const CpSatConstraintSink&) = delete;

  Literal NewBoolVar(absl::string_view name) override;
  int num_variables() const override { return variables_.size(); }
  std::string VariableName(int variable) const override;
  absl::Status AddLinear(absl::Span<const LinearTerm> terms,
                         Comparison comparison, int64_t bound) override;
  absl::Status AddImplication(Literal a, Literal b) override;

  // The literal must come from this sink.
  operations_research::sat::BoolVar ToBoolVar(Literal literal) const;

  const operations_research::sat::CpModelProto& Proto() const {
    return builder_.Proto();
  }

  // Snapshot of the value of every sink variable in a response that holds a
  // solution.
  Solution ExtractSolution(
      const operations_research::sat::CpSolverResponse& response) const;

 private:
  operations_research::sat::CpModelBuilder builder_;
  std::vector<operations_research::sat::BoolVar> variables_;
};

}  // namespace rostering

#endif  // ROSTERING_SAT_CP_SAT_SINK_H_
