#include <optional>
#include <string>
#include <utility>

#include "plonkish/algebra/field_operations.h"
#include "plonkish/error_handling/error_handling.h"
#include "plonkish/math/math.h"
#include "plonkish/utils/overloaded.h"

namespace plonkish {

template <typename ParamsT>
void RescueMimc(const ParamsT& params, std::vector<BaseFieldElement>* state) {
  const size_t state_width = params.StateWidth();
  ASSERT_RELEASE(state->size() == state_width, "State size mismatches the state width.");

  const auto& first_round_constants = params.RoundConstants(0);
  for (size_t i = 0; i < state_width; ++i) {
    (*state)[i] += first_round_constants[i];
  }

  for (size_t round = 0; round < 2 * params.NumRounds(); ++round) {
    if (round % 2 == 0) {
      params.SBox0().Apply(*state);
    } else {
      params.SBox1().Apply(*state);
    }

    const auto& round_constants = params.RoundConstants(round + 1);
    std::vector<BaseFieldElement> new_state;
    new_state.reserve(state_width);
    for (size_t i = 0; i < state_width; ++i) {
      const auto& mds_row = params.MdsMatrixRow(i);
      new_state.push_back(
          InnerProduct<BaseFieldElement>(mds_row, *state) + round_constants[i]);
    }
    *state = std::move(new_state);
  }
}

template <typename ParamsT>
StatefulRescue<ParamsT>::StatefulRescue(const ParamsT& params)
    : params_(params),
      internal_state_(params.StateWidth(), BaseFieldElement::Zero()),
      mode_(AccumulatingToAbsorb{}) {}

template <typename ParamsT>
void StatefulRescue<ParamsT>::Absorb(gsl::span<const BaseFieldElement> input) {
  const size_t rate = params_.Rate();
  std::vector<BaseFieldElement> padded(input.begin(), input.end());
  padded.resize(RoundUpToMultiple(input.size(), rate), BaseFieldElement::One());

  for (const BaseFieldElement& value : padded) {
    AbsorbSingleValue(value);
  }
}

template <typename ParamsT>
void StatefulRescue<ParamsT>::AbsorbSingleValue(const BaseFieldElement& value) {
  std::optional<ModeT> next_mode;
  std::visit(
      Overloaded{
          [&](AccumulatingToAbsorb& mode) {
            if (mode.pending.size() < params_.Rate()) {
              mode.pending.push_back(value);
              return;
            }
            AbsorbBlock(mode.pending);
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
BaseFieldElement StatefulRescue<ParamsT>::SqueezeOutSingle() {
  std::optional<ModeT> next_mode;
  const BaseFieldElement output = std::visit(
      Overloaded{
          [&](AccumulatingToAbsorb& mode) {
            ASSERT_RELEASE(
                mode.pending.size() == params_.Rate(),
                "Cannot squeeze with " + std::to_string(mode.pending.size()) +
                    " pending values, the input must be padded to the rate.");
            AbsorbBlock(mode.pending);
            std::vector<BaseFieldElement> remaining(
                internal_state_.begin() + 1, internal_state_.begin() + params_.Rate());
            next_mode = SqueezedInto{std::move(remaining)};
            return internal_state_[0];
          },
          [&](SqueezedInto& mode) {
            ASSERT_RELEASE(!mode.remaining.empty(), "Squeezed state is depleted.");
            const BaseFieldElement value = mode.remaining.front();
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
void StatefulRescue<ParamsT>::AbsorbBlock(const std::vector<BaseFieldElement>& block) {
  for (size_t i = 0; i < block.size(); ++i) {
    internal_state_[i] += block[i];
  }
  RescueMimc(params_, &internal_state_);
}

template <typename ParamsT>
std::vector<BaseFieldElement> RescueHash(
    const ParamsT& params, gsl::span<const BaseFieldElement> input, size_t n_outputs) {
  ASSERT_RELEASE(
      n_outputs <= params.Rate(), "At most rate elements can be squeezed after one absorption.");
  StatefulRescue<ParamsT> sponge(params);
  sponge.Absorb(input);

  std::vector<BaseFieldElement> result;
  result.reserve(n_outputs);
  for (size_t i = 0; i < n_outputs; ++i) {
    result.push_back(sponge.SqueezeOutSingle());
  }
  return result;
}

}  // namespace plonkish
