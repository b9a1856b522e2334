#include <optional>
#include <string>
#include <utility>

#include "glog/logging.h"

#include "plonkish/algebra/fields/base_field_element.h"
#include "plonkish/error_handling/error_handling.h"
#include "plonkish/gadgets/rescue/sbox_gadgets.h"
#include "plonkish/math/math.h"
#include "plonkish/utils/overloaded.h"

namespace plonkish {

template <typename ConstraintSystemT, typename ParamsT>
std::vector<LinearCombination> RescueMimcOverLcs(
    ConstraintSystemT* cs, const std::vector<LinearCombination>& state, const ParamsT& params,
    bool force_no_custom_gates) {
  const size_t state_width = params.StateWidth();
  ASSERT_RELEASE(state.size() == state_width, "State size mismatches the state width.");
  VLOG(2) << "Constraining the Rescue permutation, state width " << state_width << ", "
          << params.NumRounds() << " rounds.";

  std::vector<LinearCombination> current_state = state;
  const auto& first_round_constants = params.RoundConstants(0);
  for (size_t i = 0; i < state_width; ++i) {
    current_state[i].AddAssignConstant(first_round_constants[i]);
  }

  for (size_t round = 0; round < 2 * params.NumRounds(); ++round) {
    std::vector<Num> after_sbox;
    after_sbox.reserve(state_width);
    for (const LinearCombination& entry : current_state) {
      const Num input = entry.IntoNum(cs);
      if (round % 2 == 0) {
        after_sbox.push_back(
            ApplySBoxConstraints(cs, params.SBox0(), input, force_no_custom_gates));
      } else {
        after_sbox.push_back(
            ApplySBoxConstraints(cs, params.SBox1(), input, force_no_custom_gates));
      }
    }

    const auto& round_constants = params.RoundConstants(round + 1);
    std::vector<LinearCombination> new_state;
    new_state.reserve(state_width);
    for (size_t i = 0; i < state_width; ++i) {
      const auto& mds_row = params.MdsMatrixRow(i);
      LinearCombination lc;
      for (size_t j = 0; j < state_width; ++j) {
        lc.AddAssignNumberWithCoeff(after_sbox[j], mds_row[j]);
      }
      lc.AddAssignConstant(round_constants[i]);
      new_state.push_back(std::move(lc));
    }
    current_state = std::move(new_state);
  }

  return current_state;
}

template <typename ParamsT>
StatefulRescueGadget<ParamsT>::StatefulRescueGadget(
    const ParamsT& params, bool force_no_custom_gates)
    : params_(params),
      force_no_custom_gates_(force_no_custom_gates),
      internal_state_(params.StateWidth()),
      mode_(AccumulatingToAbsorb{}) {}

template <typename ParamsT>
template <typename ConstraintSystemT>
void StatefulRescueGadget<ParamsT>::Absorb(
    ConstraintSystemT* cs, gsl::span<const AllocatedNum> input) {
  const size_t rate = params_.Rate();
  std::vector<Num> padded;
  padded.reserve(RoundUpToMultiple(input.size(), rate));
  for (const AllocatedNum& value : input) {
    padded.emplace_back(value);
  }
  while (padded.size() % rate != 0) {
    padded.emplace_back(BaseFieldElement::One());
  }

  for (const Num& value : padded) {
    AbsorbSingleValue(cs, value);
  }
}

template <typename ParamsT>
template <typename ConstraintSystemT>
void StatefulRescueGadget<ParamsT>::AbsorbSingleValue(ConstraintSystemT* cs, const Num& value) {
  std::optional<ModeT> next_mode;
  std::visit(
      Overloaded{
          [&](AccumulatingToAbsorb& mode) {
            if (mode.pending.size() < params_.Rate()) {
              mode.pending.push_back(value);
              return;
            }
            AbsorbBlock(cs, mode.pending);
            mode.pending = {value};
          },
          [&](SqueezedInto& /*mode*/) {
            // Unread output is dropped.
            next_mode = AccumulatingToAbsorb{{value}};
          },
      },
      mode_);

  if (next_mode.has_value()) {
    mode_ = std::move(*next_mode);
  }
}

template <typename ParamsT>
template <typename ConstraintSystemT>
LinearCombination StatefulRescueGadget<ParamsT>::SqueezeOutSingle(ConstraintSystemT* cs) {
  std::optional<ModeT> next_mode;
  LinearCombination output = std::visit(
      Overloaded{
          [&](AccumulatingToAbsorb& mode) {
            ASSERT_RELEASE(
                mode.pending.size() == params_.Rate(),
                "Cannot squeeze with " + std::to_string(mode.pending.size()) +
                    " pending values, the input must be padded to the rate.");
            AbsorbBlock(cs, mode.pending);
            std::vector<LinearCombination> remaining(
                internal_state_.begin() + 1, internal_state_.begin() + params_.Rate());
            next_mode = SqueezedInto{std::move(remaining)};
            return internal_state_[0];
          },
          [&](SqueezedInto& mode) {
            ASSERT_RELEASE(!mode.remaining.empty(), "Squeezed state is depleted.");
            LinearCombination value = std::move(mode.remaining.front());
            mode.remaining.erase(mode.remaining.begin());
            return value;
          },
      },
      mode_);

  if (next_mode.has_value()) {
    mode_ = std::move(*next_mode);
  }
  return output;
}

template <typename ParamsT>
template <typename ConstraintSystemT>
void StatefulRescueGadget<ParamsT>::AbsorbBlock(
    ConstraintSystemT* cs, const std::vector<Num>& block) {
  for (size_t i = 0; i < block.size(); ++i) {
    internal_state_[i].AddAssignNumberWithCoeff(block[i], BaseFieldElement::One());
  }
  internal_state_ = RescueMimcOverLcs(cs, internal_state_, params_, force_no_custom_gates_);
}

template <typename ConstraintSystemT, typename ParamsT>
std::vector<LinearCombination> RescueHashGadget(
    ConstraintSystemT* cs, const ParamsT& params, gsl::span<const AllocatedNum> input,
    size_t n_outputs) {
  ASSERT_RELEASE(
      n_outputs <= params.Rate(), "At most rate elements can be squeezed after one absorption.");
  StatefulRescueGadget<ParamsT> sponge(params);
  sponge.Absorb(cs, input);

  std::vector<LinearCombination> result;
  result.reserve(n_outputs);
  for (size_t i = 0; i < n_outputs; ++i) {
    result.push_back(sponge.SqueezeOutSingle(cs));
  }
  return result;
}

}  // namespace plonkish
