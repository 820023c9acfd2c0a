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

#include "rostering/model/solution.h"

#include "absl/types/span.h"
#include "ortools/base/logging.h"
#include "rostering/model/constraint_sink.h"

namespace rostering {

bool Solution::Value(Literal literal) const {
  CHECK_LT(literal.variable(), values_.size()) << literal;
  return values_[literal.variable()] == literal.IsPositive();
}

int Solution::CountTrue(absl::Span<const Literal> literals) const {
  int count = 0;
  for (const Literal literal : literals) {
    if (Value(literal)) ++count;
  }
  return count;
}

}  // namespace rostering
