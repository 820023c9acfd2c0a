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

#ifndef ROSTERING_MODEL_RECORDING_SINK_H_
#define ROSTERING_MODEL_RECORDING_SINK_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "rostering/model/constraint_sink.h"
#include "rostering/model/solution.h"

namespace rostering {

// ConstraintSink that only stores what is registered. Used to inspect the
// constraints produced by the model builders, and to check them against an
// assignment, without running a solver.
class RecordingSink : public ConstraintSink {
 public:
  struct LinearConstraint {
    std::vector<LinearTerm> terms;
    Comparison comparison;
    int64_t bound;
  };

  struct Implication {
    Literal a;
    Literal b;
  };

  RecordingSink() = default;
  RecordingSink(const RecordingSink&) = delete;
  RecordingSink& operator=(const RecordingSink&) = delete;

  Literal NewBoolVar(absl::string_view name) override;
  int num_variables() const override { return names_.size(); }
  std::string VariableName(int variable) const override;
  absl::Status AddLinear(absl::Span<const LinearTerm> terms,
                         Comparison comparison, int64_t bound) override;
  absl::Status AddImplication(Literal a, Literal b) override;

  const std::vector<LinearConstraint>& linear_constraints() const {
    return linear_constraints_;
  }
  const std::vector<Implication>& implications() const {
    return implications_;
  }
  int num_constraints() const {
    return linear_constraints_.size() + implications_.size();
  }

  // True iff every recorded constraint holds. The solution must cover all the
  // variables of the sink.
  bool IsSatisfiedBy(const Solution& solution) const;

 private:
  std::vector<std::string> names_;
  std::vector<LinearConstraint> linear_constraints_;
  std::vector<Implication> implications_;
};

}  // namespace rostering

#endif  // ROSTERING_MODEL_RECORDING_SINK_H_
