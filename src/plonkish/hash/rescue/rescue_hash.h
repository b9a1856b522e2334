#ifndef PLONKISH_HASH_RESCUE_RESCUE_HASH_H_
#define PLONKISH_HASH_RESCUE_RESCUE_HASH_H_

#include <cstddef>
#include <variant>
#include <vector>

#include "gsl/gsl-lite.hpp"

#include "plonkish/algebra/fields/base_field_element.h"

namespace plonkish {

/*
  Applies the Rescue permutation to state in place.
*/
template <typename ParamsT>
void RescueMimc(const ParamsT& params, std::vector<BaseFieldElement>* state);

/*
  The Rescue sponge, computed directly over field elements. This is the function that the circuit
  gadgets in plonkish/gadgets/rescue arithmetize.

  Absorbed input is padded with One() to a multiple of the rate. Squeezing runs the permutation
  once and then hands out the rate part of the state one element at a time; absorbing again drops
  whatever was not squeezed.
*/
template <typename ParamsT>
class StatefulRescue {
 public:
  explicit StatefulRescue(const ParamsT& params);

  void Absorb(gsl::span<const BaseFieldElement> input);

  BaseFieldElement SqueezeOutSingle();

 private:
  struct AccumulatingToAbsorb {
    std::vector<BaseFieldElement> pending;
  };
  struct SqueezedInto {
    std::vector<BaseFieldElement> remaining;
  };
  using ModeT = std::variant<AccumulatingToAbsorb, SqueezedInto>;

  void AbsorbSingleValue(const BaseFieldElement& value);

  /*
    Adds the pending block into the rate part of the state and runs the permutation.
  */
  void AbsorbBlock(const std::vector<BaseFieldElement>& block);

  const ParamsT& params_;
  std::vector<BaseFieldElement> internal_state_;
  ModeT mode_;
};

/*
  Absorbs input into a fresh sponge and squeezes n_outputs elements (at most the rate).
*/
template <typename ParamsT>
std::vector<BaseFieldElement> RescueHash(
    const ParamsT& params, gsl::span<const BaseFieldElement> input, size_t n_outputs);

}  // namespace plonkish

#include "plonkish/hash/rescue/rescue_hash.inl"

#endif  // PLONKISH_HASH_RESCUE_RESCUE_HASH_H_
