#ifndef PLONKISH_HASH_RESCUE_RESCUE_SBOXES_H_
#define PLONKISH_HASH_RESCUE_RESCUE_SBOXES_H_

#include <cstdint>

#include "gsl/gsl-lite.hpp"

#include "plonkish/algebra/field_operations.h"
#include "plonkish/algebra/fields/base_field_element.h"

namespace plonkish {

/*
  The S-box x -> x^5.
*/
class QuinticSBox {
 public:
  static BaseFieldElement Apply(const BaseFieldElement& element) {
    BaseFieldElement result = element * element;
    result *= result;
    return result * element;
  }

  void Apply(gsl::span<BaseFieldElement> elements) const {
    for (BaseFieldElement& element : elements) {
      element = Apply(element);
    }
  }
};

/*
  The S-box x -> x^power. With power = kFifthRootExponent it is the inverse of QuinticSBox.
*/
class PowerSBox {
 public:
  // = (1/5) % (kModulus - 1).
  static constexpr uint64_t kFifthRootExponent = 0xcccccd4cccccccd;
  static_assert(
      (static_cast<__uint128_t>(kFifthRootExponent) * 5) % (BaseFieldElement::kModulus - 1) == 1,
      "kFifthRootExponent must be the inverse of 5 modulo kModulus - 1.");

  explicit PowerSBox(uint64_t power) : power_(power) {}

  static PowerSBox FifthRoot() { return PowerSBox(kFifthRootExponent); }

  uint64_t Power() const { return power_; }

  BaseFieldElement Apply(const BaseFieldElement& element) const { return Pow(element, power_); }

  void Apply(gsl::span<BaseFieldElement> elements) const {
    for (BaseFieldElement& element : elements) {
      element = Apply(element);
    }
  }

 private:
  uint64_t power_;
};

}  // namespace plonkish

#endif  // PLONKISH_HASH_RESCUE_RESCUE_SBOXES_H_
