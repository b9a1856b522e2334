#include "plonkish/gadgets/rescue/rescue_gadget.h"

#include <algorithm>
#include <optional>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "plonkish/constraint_system/assembly.h"
#include "plonkish/constraint_system/constraint_system_params.h"
#include "plonkish/constraint_system/synthesis_error.h"
#include "plonkish/error_handling/test_utils.h"
#include "plonkish/hash/rescue/rescue_constants.h"
#include "plonkish/hash/rescue/rescue_hash.h"
#include "plonkish/hash/rescue/rescue_test_utils.h"
#include "plonkish/randomness/prng.h"

namespace plonkish {
namespace {

using testing::HasSubstr;

using TestAssembly = Assembly<Width4WithCustomGates>;

template <typename ConstraintSystemT>
std::vector<AllocatedNum> AllocInputs(
    ConstraintSystemT* cs, const std::vector<BaseFieldElement>& values) {
  std::vector<AllocatedNum> result;
  result.reserve(values.size());
  for (const BaseFieldElement& value : values) {
    result.push_back(AllocatedNum::Alloc(cs, [&value]() { return std::optional(value); }));
  }
  return result;
}

std::vector<BaseFieldElement> ValuesOf(const std::vector<LinearCombination>& lcs) {
  std::vector<BaseFieldElement> values;
  for (const LinearCombination& lc : lcs) {
    const std::optional<BaseFieldElement> value = lc.GetValue();
    ASSERT_RELEASE(value.has_value(), "Expected a witness.");
    values.push_back(*value);
  }
  return values;
}

TEST(RescueMimcOverLcs, MatchesReferencePermutation) {
  Prng prng;
  const RescueParams params = RandomRescueParams(&prng, 2, 3, 4);
  const auto values = prng.RandomFieldElementVector<BaseFieldElement>(params.StateWidth());

  TestAssembly cs;
  std::vector<LinearCombination> state(params.StateWidth());
  const auto inputs = AllocInputs(&cs, values);
  for (size_t i = 0; i < inputs.size(); ++i) {
    state[i].AddAssignVariableWithCoeff(inputs[i], BaseFieldElement::One());
  }

  std::vector<BaseFieldElement> expected = values;
  RescueMimc(params, &expected);
  EXPECT_EQ(expected, ValuesOf(RescueMimcOverLcs(&cs, state, params)));
  EXPECT_TRUE(cs.IsSatisfied());
}

TEST(RescueMimcOverLcs, ConstantStateNeedsNoGates) {
  const RescueParams params = DefaultRescueParams();
  TestAssembly cs;
  const std::vector<LinearCombination> state(params.StateWidth());

  std::vector<BaseFieldElement> expected(params.StateWidth(), BaseFieldElement::Zero());
  RescueMimc(params, &expected);
  EXPECT_EQ(expected, ValuesOf(RescueMimcOverLcs(&cs, state, params)));
  EXPECT_EQ(0U, cs.NumGates());
}

TEST(RescueMimcOverLcs, WrongStateSize) {
  const RescueParams params = DefaultRescueParams();
  TestAssembly cs;
  const std::vector<LinearCombination> state(params.StateWidth() + 1);
  EXPECT_ASSERT(RescueMimcOverLcs(&cs, state, params), HasSubstr("mismatches the state width"));
}

/*
  Compares the gadget with the reference sponge for inputs spanning one to several blocks, padded
  and unpadded, squeezing one and then (if the rate allows) two values.
*/
void TestEquivalenceWithReference(const RescueParams& params, Prng* prng) {
  const size_t rate = params.Rate();
  for (size_t input_size = 1; input_size <= 3 * rate + 1; ++input_size) {
    for (size_t n_outputs = 1; n_outputs <= std::min<size_t>(2, rate); ++n_outputs) {
      const auto values = prng->RandomFieldElementVector<BaseFieldElement>(input_size);
      TestAssembly cs;
      const auto inputs = AllocInputs(&cs, values);

      const std::vector<BaseFieldElement> expected = RescueHash(params, values, n_outputs);
      EXPECT_EQ(expected, ValuesOf(RescueHashGadget(&cs, params, inputs, n_outputs)))
          << "rate " << rate << ", width " << params.StateWidth() << ", input size "
          << input_size << ", outputs " << n_outputs;
      EXPECT_TRUE(cs.IsSatisfied());
    }
  }
}

TEST(RescueHashGadget, MatchesReferenceWithDefaultParams) {
  Prng prng;
  TestEquivalenceWithReference(DefaultRescueParams(), &prng);
}

TEST(RescueHashGadget, MatchesReferenceWithRandomParams) {
  Prng prng;
  TestEquivalenceWithReference(RandomRescueParams(&prng, 1, 2, 3), &prng);
  TestEquivalenceWithReference(RandomRescueParams(&prng, 2, 1, 3), &prng);
  TestEquivalenceWithReference(RandomRescueParams(&prng, 3, 2, 2), &prng);
}

TEST(RescueHashGadget, TooManyOutputs) {
  const RescueParams params = DefaultRescueParams();
  TestAssembly cs;
  const auto inputs = AllocInputs(&cs, {BaseFieldElement::One()});
  EXPECT_ASSERT(RescueHashGadget(&cs, params, inputs, 3), HasSubstr("At most rate elements"));
}

/*
  Rate 2, state width 4, a single full block: the first squeeze runs the permutation and the second
  one only hands out the next state entry.
*/
TEST(StatefulRescueGadget, FullBlockTwoSqueezes) {
  const RescueParams params = DefaultRescueParams();
  TestAssembly cs;
  const auto inputs =
      AllocInputs(&cs, {BaseFieldElement::Zero(), BaseFieldElement::One()});

  StatefulRescueGadget<RescueParams> sponge(params);
  sponge.Absorb(&cs, inputs);
  // Absorbing a single block only buffers it.
  EXPECT_EQ(0U, cs.NumGates());

  const LinearCombination first = sponge.SqueezeOutSingle(&cs);
  const size_t n_gates = cs.NumGates();
  // Layer 0 materializes and raises the two input entries, layer 1 the four two-term entries, and
  // the 18 remaining layers each need two gates per four-term entry plus four S-box gates.
  EXPECT_EQ(2U + 2U + 4U + 4U + 18U * (8U + 4U), n_gates);

  const LinearCombination second = sponge.SqueezeOutSingle(&cs);
  EXPECT_EQ(n_gates, cs.NumGates());

  EXPECT_EQ(BaseFieldElement::FromUint(0x1ff304f990d7adf6), first.GetValue());
  EXPECT_EQ(BaseFieldElement::FromUint(0x18bfc85bea8d7676), second.GetValue());
  EXPECT_NE(first.GetValue(), second.GetValue());
  EXPECT_TRUE(cs.IsSatisfied());

  EXPECT_ASSERT(sponge.SqueezeOutSingle(&cs), HasSubstr("depleted"));
}

TEST(StatefulRescueGadget, SqueezeBeforeAbsorbThrows) {
  const RescueParams params = DefaultRescueParams();
  TestAssembly cs;
  StatefulRescueGadget<RescueParams> sponge(params);
  EXPECT_ASSERT(sponge.SqueezeOutSingle(&cs), HasSubstr("must be padded to the rate"));
}

TEST(StatefulRescueGadget, PaddedAndUnpaddedInput) {
  const RescueParams params = DefaultRescueParams();
  const std::vector<BaseFieldElement> values = {
      BaseFieldElement::FromUint(1), BaseFieldElement::FromUint(2),
      BaseFieldElement::FromUint(3)};
  TestAssembly cs;
  const auto inputs = AllocInputs(&cs, values);

  StatefulRescueGadget<RescueParams> padded(params);
  padded.Absorb(&cs, inputs);
  EXPECT_EQ(BaseFieldElement::FromUint(0x18c578fcaa63caed), padded.SqueezeOutSingle(&cs).GetValue());
  EXPECT_EQ(BaseFieldElement::FromUint(0xa55ebfe6f25dfa3), padded.SqueezeOutSingle(&cs).GetValue());

  StatefulRescueGadget<RescueParams> unpadded(params);
  unpadded.Absorb(&cs, gsl::make_span(inputs).first(2));
  EXPECT_EQ(RescueHash(params, gsl::make_span(values).first(2), 1)[0],
            unpadded.SqueezeOutSingle(&cs).GetValue());
  EXPECT_TRUE(cs.IsSatisfied());
}

TEST(StatefulRescueGadget, AbsorbAfterSqueeze) {
  const RescueParams params = DefaultRescueParams();
  TestAssembly cs;
  const auto first_block =
      AllocInputs(&cs, {BaseFieldElement::FromUint(1), BaseFieldElement::FromUint(2)});
  const auto second_block =
      AllocInputs(&cs, {BaseFieldElement::FromUint(3), BaseFieldElement::FromUint(4)});

  StatefulRescueGadget<RescueParams> sponge(params);
  sponge.Absorb(&cs, first_block);
  EXPECT_EQ(BaseFieldElement::FromUint(0x5d1e45356f44785), sponge.SqueezeOutSingle(&cs).GetValue());
  // The second output of the first block is never read.
  sponge.Absorb(&cs, second_block);
  EXPECT_EQ(BaseFieldElement::FromUint(0x9b53616010e594f), sponge.SqueezeOutSingle(&cs).GetValue());
  EXPECT_TRUE(cs.IsSatisfied());
}

TEST(StatefulRescueGadget, SeparateAbsorbCalls) {
  const RescueParams params = DefaultRescueParams();
  TestAssembly cs;
  const auto inputs =
      AllocInputs(&cs, {BaseFieldElement::FromUint(1), BaseFieldElement::FromUint(2)});

  // Each call is padded on its own.
  StatefulRescueGadget<RescueParams> sponge(params);
  sponge.Absorb(&cs, gsl::make_span(inputs).first(1));
  sponge.Absorb(&cs, gsl::make_span(inputs).last(1));
  EXPECT_EQ(BaseFieldElement::FromUint(0x532342f15c0a154), sponge.SqueezeOutSingle(&cs).GetValue());
  EXPECT_TRUE(cs.IsSatisfied());
}

TEST(StatefulRescueGadget, MatchesStatefulReference) {
  Prng prng;
  const RescueParams params = RandomRescueParams(&prng, 3, 1, 3);
  TestAssembly cs;
  StatefulRescueGadget<RescueParams> gadget(params);
  StatefulRescue<RescueParams> reference(params);

  for (size_t input_size : {4, 2, 7}) {
    const auto values = prng.RandomFieldElementVector<BaseFieldElement>(input_size);
    gadget.Absorb(&cs, AllocInputs(&cs, values));
    reference.Absorb(values);
    for (size_t i = 0; i < params.Rate(); ++i) {
      EXPECT_EQ(reference.SqueezeOutSingle(), gadget.SqueezeOutSingle(&cs).GetValue());
    }
  }
  EXPECT_TRUE(cs.IsSatisfied());
}

TEST(StatefulRescueGadget, RequiresFifthPowerGate) {
  const RescueParams params = DefaultRescueParams();
  const std::vector<BaseFieldElement> values = {BaseFieldElement::One(), BaseFieldElement::One()};
  const auto matcher = HasSubstr("fifth power custom gate");
  {
    Assembly<Width4WithoutCustomGates> cs;
    StatefulRescueGadget<RescueParams> sponge(params);
    sponge.Absorb(&cs, AllocInputs(&cs, values));
    EXPECT_ASSERT(sponge.SqueezeOutSingle(&cs), matcher);
  }
  {
    Assembly<Width3WithCustomGates> cs;
    StatefulRescueGadget<RescueParams> sponge(params);
    sponge.Absorb(&cs, AllocInputs(&cs, values));
    EXPECT_ASSERT(sponge.SqueezeOutSingle(&cs), matcher);
  }
  {
    TestAssembly cs;
    StatefulRescueGadget<RescueParams> sponge(params, /*force_no_custom_gates=*/true);
    sponge.Absorb(&cs, AllocInputs(&cs, values));
    EXPECT_ASSERT(sponge.SqueezeOutSingle(&cs), matcher);
  }
}

TEST(StatefulRescueGadget, SetupModeBuildsTheSameCircuit) {
  const RescueParams params = DefaultRescueParams();
  const size_t n_inputs = 5;

  TestAssembly proving_cs;
  Prng prng;
  const auto proving_inputs =
      AllocInputs(&proving_cs, prng.RandomFieldElementVector<BaseFieldElement>(n_inputs));
  RescueHashGadget(&proving_cs, params, proving_inputs, 2);

  TestAssembly setup_cs(SynthesisMode::kSetup);
  std::vector<AllocatedNum> setup_inputs;
  for (size_t i = 0; i < n_inputs; ++i) {
    setup_inputs.push_back(AllocatedNum::Alloc(
        &setup_cs, []() -> std::optional<BaseFieldElement> { return std::nullopt; }));
  }
  const auto outputs = RescueHashGadget(&setup_cs, params, setup_inputs, 2);

  EXPECT_EQ(std::nullopt, outputs[0].GetValue());
  EXPECT_EQ(proving_cs.NumGates(), setup_cs.NumGates());
  EXPECT_EQ(proving_cs.NumVariables(), setup_cs.NumVariables());
}

TEST(StatefulRescueGadget, MissingWitnessPropagates) {
  const RescueParams params = DefaultRescueParams();
  TestAssembly cs;
  const Variable variable = cs.Alloc([]() { return std::optional(BaseFieldElement::One()); });
  const std::vector<AllocatedNum> inputs = {AllocatedNum(variable, std::nullopt)};

  StatefulRescueGadget<RescueParams> sponge(params);
  sponge.Absorb(&cs, inputs);
  EXPECT_THROW(sponge.SqueezeOutSingle(&cs), SynthesisError);
}

}  // namespace
}  // namespace plonkish
