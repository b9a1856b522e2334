#include "plonkish/constraint_system/linear_combination.h"

#include <optional>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "plonkish/constraint_system/assembly.h"
#include "plonkish/constraint_system/constraint_system_params.h"
#include "plonkish/error_handling/test_utils.h"
#include "plonkish/randomness/prng.h"

namespace plonkish {
namespace {

using testing::HasSubstr;

template <typename ConstraintSystemT>
std::vector<AllocatedNum> AllocRandom(ConstraintSystemT* cs, Prng* prng, size_t n) {
  std::vector<AllocatedNum> result;
  for (size_t i = 0; i < n; ++i) {
    const BaseFieldElement value = BaseFieldElement::RandomElement(prng);
    result.push_back(AllocatedNum::Alloc(cs, [&value]() { return std::optional(value); }));
  }
  return result;
}

TEST(LinearCombination, ConstantsOnly) {
  Assembly<Width4WithCustomGates> cs;
  LinearCombination lc;
  lc.AddAssignConstant(BaseFieldElement::FromUint(5));
  lc.AddAssignNumberWithCoeff(
      Num(BaseFieldElement::FromUint(3)), BaseFieldElement::FromUint(2));
  EXPECT_EQ(0U, lc.NumTerms());
  EXPECT_EQ(BaseFieldElement::FromUint(11), lc.GetValue());

  const Num num = lc.IntoNum(&cs);
  ASSERT_TRUE(num.IsConstant());
  EXPECT_EQ(BaseFieldElement::FromUint(11), num.AsConstant());
  EXPECT_EQ(0U, cs.NumGates());
}

TEST(LinearCombination, BareVariableIsNotMaterialized) {
  Prng prng;
  Assembly<Width4WithCustomGates> cs;
  const auto vars = AllocRandom(&cs, &prng, 1);
  LinearCombination lc;
  lc.AddAssignNumberWithCoeff(Num(vars[0]), BaseFieldElement::One());

  const Num num = lc.IntoNum(&cs);
  ASSERT_FALSE(num.IsConstant());
  EXPECT_EQ(vars[0].GetVariable(), num.AsVariable().GetVariable());
  EXPECT_EQ(0U, cs.NumGates());
}

TEST(LinearCombination, CancellingTermsBecomeConstant) {
  Prng prng;
  Assembly<Width4WithCustomGates> cs;
  const auto vars = AllocRandom(&cs, &prng, 1);
  LinearCombination lc;
  lc.AddAssignVariableWithCoeff(vars[0], BaseFieldElement::FromUint(3));
  lc.AddAssignVariableWithCoeff(vars[0], -BaseFieldElement::FromUint(3));
  lc.AddAssignConstant(BaseFieldElement::One());

  const Num num = lc.IntoNum(&cs);
  ASSERT_TRUE(num.IsConstant());
  EXPECT_EQ(BaseFieldElement::One(), num.AsConstant());
  EXPECT_EQ(0U, cs.NumGates());
}

/*
  Materializes an expression with n_terms distinct variables and checks the value, the number of
  gates and the satisfiability of the result.
*/
template <typename ParamsT>
void CheckMaterialization(size_t n_terms, size_t expected_n_gates) {
  Prng prng;
  Assembly<ParamsT> cs;
  const auto vars = AllocRandom(&cs, &prng, n_terms);
  LinearCombination lc;
  BaseFieldElement expected = BaseFieldElement::RandomElement(&prng);
  lc.AddAssignConstant(expected);
  for (const AllocatedNum& var : vars) {
    const BaseFieldElement coeff = BaseFieldElement::RandomElement(&prng);
    lc.AddAssignVariableWithCoeff(var, coeff);
    expected += coeff * *var.GetValue();
  }
  ASSERT_EQ(expected, lc.GetValue());

  const Num num = lc.IntoNum(&cs);
  ASSERT_FALSE(num.IsConstant());
  EXPECT_EQ(expected, num.GetValue());
  EXPECT_EQ(expected, cs.GetValue(num.AsVariable().GetVariable()));
  EXPECT_EQ(expected_n_gates, cs.NumGates());
  EXPECT_TRUE(cs.IsSatisfied());
}

TEST(LinearCombination, IntoNumWidth4) {
  CheckMaterialization<Width4WithCustomGates>(1, 1);
  CheckMaterialization<Width4WithCustomGates>(3, 1);
  CheckMaterialization<Width4WithCustomGates>(4, 2);
  CheckMaterialization<Width4WithCustomGates>(5, 2);
  CheckMaterialization<Width4WithCustomGates>(6, 3);
}

TEST(LinearCombination, IntoNumWidth3) {
  CheckMaterialization<Width3WithCustomGates>(2, 1);
  CheckMaterialization<Width3WithCustomGates>(3, 2);
  CheckMaterialization<Width3WithCustomGates>(5, 4);
}

TEST(LinearCombination, RepeatedVariablesAreMerged) {
  Prng prng;
  Assembly<Width4WithCustomGates> cs;
  const auto vars = AllocRandom(&cs, &prng, 2);
  LinearCombination lc;
  for (size_t i = 0; i < 3; ++i) {
    lc.AddAssignVariableWithCoeff(vars[0], BaseFieldElement::One());
    lc.AddAssignVariableWithCoeff(vars[1], BaseFieldElement::FromUint(2));
  }
  EXPECT_EQ(6U, lc.NumTerms());

  const Num num = lc.IntoNum(&cs);
  EXPECT_EQ(1U, cs.NumGates());
  EXPECT_EQ(
      BaseFieldElement::FromUint(3) * *vars[0].GetValue() +
          BaseFieldElement::FromUint(6) * *vars[1].GetValue(),
      num.GetValue());
  EXPECT_TRUE(cs.IsSatisfied());
}

TEST(LinearCombination, MissingWitnessPropagates) {
  Assembly<Width4WithCustomGates> cs;
  const Variable unassigned_variable =
      cs.Alloc([]() { return std::optional(BaseFieldElement::One()); });
  // The variable exists, but this handle carries no witness.
  const AllocatedNum unassigned(unassigned_variable, std::nullopt);
  LinearCombination lc;
  lc.AddAssignVariableWithCoeff(unassigned, BaseFieldElement::FromUint(2));
  EXPECT_EQ(std::nullopt, lc.GetValue());
  EXPECT_THROW(lc.IntoNum(&cs), SynthesisError);
}

TEST(LinearCombination, SetupModeBuildsTheSameShape) {
  Assembly<Width4WithCustomGates> cs(SynthesisMode::kSetup);
  std::vector<AllocatedNum> vars;
  for (size_t i = 0; i < 5; ++i) {
    vars.push_back(AllocatedNum::Alloc(
        &cs, []() -> std::optional<BaseFieldElement> { return std::nullopt; }));
  }
  LinearCombination lc;
  for (const AllocatedNum& var : vars) {
    lc.AddAssignVariableWithCoeff(var, BaseFieldElement::FromUint(2));
  }
  const Num num = lc.IntoNum(&cs);
  EXPECT_EQ(std::nullopt, num.GetValue());
  EXPECT_EQ(2U, cs.NumGates());
}

TEST(Num, AccessorsCheckTheTag) {
  const Num constant(BaseFieldElement::One());
  EXPECT_ASSERT(constant.AsVariable(), HasSubstr("holds a constant"));
  const Num variable(AllocatedNum(Variable(1), std::nullopt));
  EXPECT_ASSERT(variable.AsConstant(), HasSubstr("holds a variable"));
}

}  // namespace
}  // namespace plonkish
