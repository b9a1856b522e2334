#ifndef PLONKISH_GADGETS_RESCUE_SBOX_GADGETS_H_
#define PLONKISH_GADGETS_RESCUE_SBOX_GADGETS_H_

#include <optional>

#include "plonkish/algebra/fields/base_field_element.h"
#include "plonkish/constraint_system/allocated_num.h"
#include "plonkish/constraint_system/fifth_power_gate.h"
#include "plonkish/error_handling/error_handling.h"
#include "plonkish/hash/rescue/rescue_sboxes.h"

namespace plonkish {

/*
  Returns true if ConstraintSystemT can register the fifth power gate.
*/
template <typename ConstraintSystemT>
constexpr bool HasFifthPowerGate() {
  return ConstraintSystemT::Params::kHasCustomGates && ConstraintSystemT::Params::kStateWidth >= 4;
}

/*
  Constraint gadgets for the Rescue S-boxes. Every S-box kind is usable in a single direction:
    kShouldApplyForward - true if ApplyConstraints() is the valid entry point, false if
      ApplyConstraintsInReverse() is.
    ApplyConstraints(cs, sbox, element, force_no_custom_gates) - constrains sbox(element) by
      computing the power map forward.
    ApplyConstraintsInReverse(cs, sbox, element, force_no_custom_gates) - constrains sbox(element)
      by checking that the inverse map sends the output back to element.
  Calling the invalid entry point throws.

  Both kinds require the fifth power gate. If ConstraintSystemT does not offer it, or if
  force_no_custom_gates is set, the gadgets throw: there is no constraint path built from main
  gates only.
*/
template <typename SBoxT>
struct SBoxGadget;

namespace details {

[[noreturn]] inline void ThrowNoFifthPowerGate() {
  THROW_PLONKISH_EXCEPTION(
      "Rescue S-boxes are only implemented with the fifth power custom gate, which requires "
      "custom gates and at least four wires.");
}

}  // namespace details

template <>
struct SBoxGadget<QuinticSBox> {
  static constexpr bool kShouldApplyForward = true;

  template <typename ConstraintSystemT>
  static Num ApplyConstraints(
      ConstraintSystemT* cs, const QuinticSBox& /*sbox*/, const Num& element,
      bool force_no_custom_gates) {
    // NOLINTNEXTLINE: clang-tidy if constexpr bug.
    if constexpr (HasFifthPowerGate<ConstraintSystemT>()) {
      if (!force_no_custom_gates) {
        if (element.IsConstant()) {
          return Num(QuinticSBox::Apply(element.AsConstant()));
        }
        return Num(ApplyFifthPower(cs, element.AsVariable(), std::nullopt));
      }
    }
    details::ThrowNoFifthPowerGate();
  }

  template <typename ConstraintSystemT>
  static Num ApplyConstraintsInReverse(
      ConstraintSystemT* /*cs*/, const QuinticSBox& /*sbox*/, const Num& /*element*/,
      bool /*force_no_custom_gates*/) {
    THROW_PLONKISH_EXCEPTION("The fifth power S-box can only be applied forward.");
  }
};

template <>
struct SBoxGadget<PowerSBox> {
  static constexpr bool kShouldApplyForward = false;

  template <typename ConstraintSystemT>
  static Num ApplyConstraints(
      ConstraintSystemT* /*cs*/, const PowerSBox& /*sbox*/, const Num& /*element*/,
      bool /*force_no_custom_gates*/) {
    THROW_PLONKISH_EXCEPTION("The fifth root S-box can only be applied in reverse.");
  }

  /*
    Allocates out = element^power and checks out^5 == element with the fifth power gate. This is
    only a valid constraint when power is the inverse of 5.
  */
  template <typename ConstraintSystemT>
  static Num ApplyConstraintsInReverse(
      ConstraintSystemT* cs, const PowerSBox& sbox, const Num& element,
      bool force_no_custom_gates) {
    // NOLINTNEXTLINE: clang-tidy if constexpr bug.
    if constexpr (HasFifthPowerGate<ConstraintSystemT>()) {
      if (!force_no_custom_gates) {
        if (element.IsConstant()) {
          return Num(sbox.Apply(element.AsConstant()));
        }
        const AllocatedNum& input = element.AsVariable();
        const AllocatedNum output =
            AllocatedNum::Alloc(cs, [&]() -> std::optional<BaseFieldElement> {
              if (!input.GetValue().has_value()) {
                return std::nullopt;
              }
              return sbox.Apply(*input.GetValue());
            });
        ApplyFifthPower(cs, output, input);
        return Num(output);
      }
    }
    details::ThrowNoFifthPowerGate();
  }
};

/*
  Applies sbox to element through whichever entry point the S-box kind supports.
*/
template <typename ConstraintSystemT, typename SBoxT>
Num ApplySBoxConstraints(
    ConstraintSystemT* cs, const SBoxT& sbox, const Num& element, bool force_no_custom_gates) {
  if constexpr (SBoxGadget<SBoxT>::kShouldApplyForward) {  // NOLINT: clang-tidy if constexpr bug.
    return SBoxGadget<SBoxT>::ApplyConstraints(cs, sbox, element, force_no_custom_gates);
  } else {  // NOLINT: clang-tidy if constexpr bug.
    return SBoxGadget<SBoxT>::ApplyConstraintsInReverse(cs, sbox, element, force_no_custom_gates);
  }
}

}  // namespace plonkish

#endif  // PLONKISH_GADGETS_RESCUE_SBOX_GADGETS_H_
