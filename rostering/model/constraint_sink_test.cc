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

#include <vector>

#include "absl/status/status.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "rostering/model/recording_sink.h"
#include "rostering/model/solution.h"

namespace rostering {
namespace {

using ::testing::HasSubstr;

TEST(LiteralTest, PositiveAndNegatedReferences) {
  const Literal x(3);
  EXPECT_TRUE(x.IsPositive());
  EXPECT_EQ(x.variable(), 3);
  EXPECT_EQ(x.index(), 3);

  const Literal not_x = x.Negated();
  EXPECT_FALSE(not_x.IsPositive());
  EXPECT_EQ(not_x.variable(), 3);
  EXPECT_EQ(not_x.index(), -4);
  EXPECT_EQ(not_x.Negated(), x);
  EXPECT_NE(not_x, x);
  EXPECT_EQ(Literal(3, false), not_x);
}

TEST(LiteralTest, DebugString) {
  EXPECT_EQ(Literal(0).DebugString(), "+0");
  EXPECT_EQ(Literal(7, false).DebugString(), "-7");
}

TEST(ComparisonTest, ToString) {
  EXPECT_EQ(ComparisonToString(Comparison::kEqual), "==");
  EXPECT_EQ(ComparisonToString(Comparison::kLessOrEqual), "<=");
  EXPECT_EQ(ComparisonToString(Comparison::kGreaterOrEqual), ">=");
}

TEST(ConstraintSinkTest, NewBoolVarNumbersVariablesInOrder) {
  RecordingSink sink;
  EXPECT_EQ(sink.NewBoolVar("a"), Literal(0));
  EXPECT_EQ(sink.NewBoolVar("b"), Literal(1));
  EXPECT_EQ(sink.num_variables(), 2);
  EXPECT_EQ(sink.VariableName(1), "b");
}

TEST(ConstraintSinkTest, AddSumUsesUnitCoefficients) {
  RecordingSink sink;
  const Literal a = sink.NewBoolVar("a");
  const Literal b = sink.NewBoolVar("b");
  ASSERT_TRUE(sink.AddSum({a, b.Negated()}, Comparison::kLessOrEqual, 1).ok());

  ASSERT_EQ(sink.linear_constraints().size(), 1);
  const RecordingSink::LinearConstraint& constraint =
      sink.linear_constraints()[0];
  ASSERT_EQ(constraint.terms.size(), 2);
  EXPECT_EQ(constraint.terms[0].literal, a);
  EXPECT_EQ(constraint.terms[0].coefficient, 1);
  EXPECT_EQ(constraint.terms[1].literal, b.Negated());
  EXPECT_EQ(constraint.terms[1].coefficient, 1);
  EXPECT_EQ(constraint.comparison, Comparison::kLessOrEqual);
  EXPECT_EQ(constraint.bound, 1);
}

TEST(ConstraintSinkTest, UnknownLiteralIsOutOfRange) {
  RecordingSink sink;
  const Literal a = sink.NewBoolVar("a");

  const absl::Status status = sink.AddImplication(a, Literal(1, false));
  EXPECT_EQ(status.code(), absl::StatusCode::kOutOfRange);
  EXPECT_THAT(status.message(), HasSubstr("-1"));
  EXPECT_EQ(sink.AddSum({Literal(5)}, Comparison::kEqual, 1).code(),
            absl::StatusCode::kOutOfRange);
  EXPECT_EQ(sink.num_constraints(), 0);
}

TEST(ConstraintSinkTest, NegativeVariableIsOutOfRange) {
  RecordingSink sink;
  const Literal a = sink.NewBoolVar("a");
  const Literal bad(-1);
  EXPECT_EQ(bad.variable(), -1);
  EXPECT_NE(bad, a.Negated());

  const absl::Status status = sink.CheckLiteral(bad);
  EXPECT_EQ(status.code(), absl::StatusCode::kOutOfRange);
  EXPECT_THAT(status.message(), HasSubstr("unknown variable"));
  EXPECT_EQ(sink.AddImplication(bad, a).code(), absl::StatusCode::kOutOfRange);
  EXPECT_EQ(sink.AddImplication(a, bad.Negated()).code(),
            absl::StatusCode::kOutOfRange);
  EXPECT_EQ(sink.AddSum({a, bad}, Comparison::kLessOrEqual, 1).code(),
            absl::StatusCode::kOutOfRange);
  EXPECT_EQ(sink.num_constraints(), 0);
}

TEST(RecordingSinkTest, NegatedTermCountsWhenVariableIsFalse) {
  RecordingSink sink;
  const Literal a = sink.NewBoolVar("a");
  const Literal b = sink.NewBoolVar("b");
  // a + not(b) == 2, i.e. a and not(b).
  ASSERT_TRUE(sink.AddSum({a, b.Negated()}, Comparison::kEqual, 2).ok());

  EXPECT_TRUE(sink.IsSatisfiedBy(Solution({true, false})));
  EXPECT_FALSE(sink.IsSatisfiedBy(Solution({true, true})));
  EXPECT_FALSE(sink.IsSatisfiedBy(Solution({false, false})));
}

TEST(RecordingSinkTest, Implication) {
  RecordingSink sink;
  const Literal a = sink.NewBoolVar("a");
  const Literal b = sink.NewBoolVar("b");
  ASSERT_TRUE(sink.AddImplication(a, b).ok());

  EXPECT_TRUE(sink.IsSatisfiedBy(Solution({false, false})));
  EXPECT_TRUE(sink.IsSatisfiedBy(Solution({false, true})));
  EXPECT_TRUE(sink.IsSatisfiedBy(Solution({true, true})));
  EXPECT_FALSE(sink.IsSatisfiedBy(Solution({true, false})));
}

TEST(SolutionTest, ValueHonoursPolarity) {
  const Solution solution({true, false, true});
  EXPECT_EQ(solution.num_variables(), 3);
  EXPECT_TRUE(solution.Value(Literal(0)));
  EXPECT_FALSE(solution.Value(Literal(0, false)));
  EXPECT_FALSE(solution.Value(Literal(1)));
  EXPECT_TRUE(solution.Value(Literal(1, false)));
  EXPECT_EQ(solution.CountTrue({Literal(0), Literal(1), Literal(2)}), 2);
  EXPECT_EQ(solution.CountTrue({Literal(1, false), Literal(2, false)}), 1);
}

TEST(SolutionTest, Equality) {
  EXPECT_EQ(Solution({true, false}), Solution({true, false}));
  EXPECT_NE(Solution({true, false}), Solution({false, false}));
  EXPECT_NE(Solution({true}), Solution({true, false}));
}

}  // namespace
}  // namespace rostering
