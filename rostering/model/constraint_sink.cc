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

#include "rostering/model/constraint_sink.h"

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"

namespace rostering {

std::string Literal::DebugString() const {
  return IsPositive() ? absl::StrCat("+", variable())
                      : absl::StrCat("-", variable());
}

std::ostream& operator<<(std::ostream& os, const Literal& literal) {
  return os << literal.DebugString();
}

absl::string_view ComparisonToString(Comparison comparison) {
  switch (comparison) {
    case Comparison::kEqual:
      return "==";
    case Comparison::kLessOrEqual:
      return "<=";
    case Comparison::kGreaterOrEqual:
      return ">=";
  }
  return "?";
}

absl::Status ConstraintSink::AddSum(absl::Span<const Literal> literals,
                                    Comparison comparison, int64_t bound) {
  std::vector<LinearTerm> terms;
  terms.reserve(literals.size());
  for (const Literal literal : literals) {
    terms.push_back({literal, 1});
  }
  return AddLinear(terms, comparison, bound);
}

absl::Status ConstraintSink::CheckLiteral(Literal literal) const {
  if (literal.variable() < 0 || literal.variable() >= num_variables()) {
    return absl::OutOfRangeError(
        absl::StrCat("literal ", literal.DebugString(),
                     " references an unknown variable (the sink has ",
                     num_variables(), " variables)"));
  }
  return absl::OkStatus();
}

}  // namespace rostering
