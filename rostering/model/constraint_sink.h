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

#ifndef ROSTERING_MODEL_CONSTRAINT_SINK_H_
#define ROSTERING_MODEL_CONSTRAINT_SINK_H_

#include <cstdint>
#include <ostream>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"

namespace rostering {

// A boolean variable created by a ConstraintSink, or its negation.
//
// index() gives the CP-SAT convention for references: a non-negative index
// denotes the variable itself and -index - 1 its negation. The variable is
// kept as given; ConstraintSink::CheckLiteral rejects a negative one.
class Literal {
 public:
  explicit Literal(int variable, bool is_positive = true)
      : variable_(variable), is_positive_(is_positive) {}

  int variable() const { return variable_; }
  bool IsPositive() const { return is_positive_; }
  Literal Negated() const { return Literal(variable_, !is_positive_); }

  // The CP-SAT style signed reference.
  int index() const { return is_positive_ ? variable_ : -variable_ - 1; }

  bool operator==(const Literal& other) const {
    return variable_ == other.variable_ && is_positive_ == other.is_positive_;
  }
  bool operator!=(const Literal& other) const { return !(*this == other); }

  std::string DebugString() const;

 private:
  int variable_;
  bool is_positive_;
};

std::ostream& operator<<(std::ostream& os, const Literal& literal);

// A term of a linear constraint. A negated literal contributes
// coefficient * (1 - variable).
struct LinearTerm {
  Literal literal;
  int64_t coefficient;
};

enum class Comparison { kEqual, kLessOrEqual, kGreaterOrEqual };

absl::string_view ComparisonToString(Comparison comparison);

// Registration capability handed to the model builders. It owns the boolean
// variables and accumulates constraints over them; it knows nothing about the
// search that will later run on them.
//
// All registration must be done before the model is handed to a solver.
class ConstraintSink {
 public:
  virtual ~ConstraintSink() = default;

  // Creates a fresh boolean variable and returns its positive literal.
  virtual Literal NewBoolVar(absl::string_view name) = 0;

  virtual int num_variables() const = 0;

  virtual std::string VariableName(int variable) const = 0;

  // Adds sum(terms) <comparison> bound. Returns an OutOfRange error if a term
  // references a variable this sink did not create.
  virtual absl::Status AddLinear(absl::Span<const LinearTerm> terms,
                                 Comparison comparison, int64_t bound) = 0;

  // Adds a => b.
  virtual absl::Status AddImplication(Literal a, Literal b) = 0;

  // Adds sum(literals) <comparison> bound, all coefficients being one.
  absl::Status AddSum(absl::Span<const Literal> literals,
                      Comparison comparison, int64_t bound);

  // Returns OutOfRange if literal does not reference a variable of this sink.
  absl::Status CheckLiteral(Literal literal) const;
};

}  // namespace rostering

#endif  // ROSTERING_MODEL_CONSTRAINT_SINK_H_
