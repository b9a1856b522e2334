#ifndef PLONKISH_GADGETS_RESCUE_RESCUE_GADGET_H_
#define PLONKISH_GADGETS_RESCUE_RESCUE_GADGET_H_

#include <cstddef>
#include <variant>
#include <vector>

#include "gsl/gsl-lite.hpp"

#include "plonkish/constraint_system/allocated_num.h"
#include "plonkish/constraint_system/linear_combination.h"

namespace plonkish {

/*
  Constrains the Rescue permutation over a state of params.StateWidth() expressions and returns
  the permuted state.

  Each layer forces every state entry into a single variable, applies SBox0 (even layers) or
  SBox1 (odd layers) with the S-box gadgets, and leaves the MDS product plus the round constants as
  linear combinations, so the affine part of a round costs nothing until the next layer needs it.
*/
template <typename ConstraintSystemT, typename ParamsT>
std::vector<LinearCombination> RescueMimcOverLcs(
    ConstraintSystemT* cs, const std::vector<LinearCombination>& state, const ParamsT& params,
    bool force_no_custom_gates = false);

/*
  The Rescue sponge as a circuit gadget. Produces the same outputs as StatefulRescue (see
  plonkish/hash/rescue/rescue_hash.h) for the same sequence of Absorb and SqueezeOutSingle calls.

  The sponge is either accumulating input (0 to rate pending values) or handing out the rate part
  of the last permuted state (0 to rate - 1 remaining values):
  * Absorb pads its input with One() to a multiple of the rate. A value arriving when rate values
    are already pending first folds them into the state and runs the permutation. A value arriving
    while squeezing drops the remaining output.
  * SqueezeOutSingle, while accumulating, requires exactly rate pending values. It folds them,
    runs the permutation and returns the first state entry, keeping entries 1..rate-1 for the
    following calls. Squeezing more than rate values in a row throws.

  Outputs are returned as linear combinations; callers force them into variables with IntoNum()
  when needed.

  params must outlive the gadget. A constraint system that cannot register the fifth power gate
  makes every permutation throw.
*/
template <typename ParamsT>
class StatefulRescueGadget {
 public:
  explicit StatefulRescueGadget(const ParamsT& params, bool force_no_custom_gates = false);

  template <typename ConstraintSystemT>
  void Absorb(ConstraintSystemT* cs, gsl::span<const AllocatedNum> input);

  template <typename ConstraintSystemT>
  LinearCombination SqueezeOutSingle(ConstraintSystemT* cs);

 private:
  struct AccumulatingToAbsorb {
    std::vector<Num> pending;
  };
  struct SqueezedInto {
    std::vector<LinearCombination> remaining;
  };
  using ModeT = std::variant<AccumulatingToAbsorb, SqueezedInto>;

  template <typename ConstraintSystemT>
  void AbsorbSingleValue(ConstraintSystemT* cs, const Num& value);

  /*
    Adds block into the rate part of the state and runs the permutation.
  */
  template <typename ConstraintSystemT>
  void AbsorbBlock(ConstraintSystemT* cs, const std::vector<Num>& block);

  const ParamsT& params_;
  const bool force_no_custom_gates_;
  std::vector<LinearCombination> internal_state_;
  ModeT mode_;
};

/*
  The in-circuit counterpart of RescueHash(): absorbs input into a fresh sponge gadget and squeezes
  n_outputs values (at most the rate).
*/
template <typename ConstraintSystemT, typename ParamsT>
std::vector<LinearCombination> RescueHashGadget(
    ConstraintSystemT* cs, const ParamsT& params, gsl::span<const AllocatedNum> input,
    size_t n_outputs);

}  // namespace plonkish

#include "plonkish/gadgets/rescue/rescue_gadget.inl"

#endif  // PLONKISH_GADGETS_RESCUE_RESCUE_GADGET_H_
