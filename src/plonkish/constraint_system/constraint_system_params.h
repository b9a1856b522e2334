#ifndef PLONKISH_CONSTRAINT_SYSTEM_CONSTRAINT_SYSTEM_PARAMS_H_
#define PLONKISH_CONSTRAINT_SYSTEM_CONSTRAINT_SYSTEM_PARAMS_H_

#include <cstddef>

namespace plonkish {

/*
  Static capabilities of a constraint system:
    kStateWidth - the number of wires per gate.
    kHasCustomGates - whether gates other than the main gate may be registered.
  Gadgets read these flags at compile time, they are a property of the circuit configuration and
  never of the data.
*/
struct Width4WithCustomGates {
  static constexpr size_t kStateWidth = 4;
  static constexpr bool kHasCustomGates = true;
};

struct Width4WithoutCustomGates {
  static constexpr size_t kStateWidth = 4;
  static constexpr bool kHasCustomGates = false;
};

struct Width3WithCustomGates {
  static constexpr size_t kStateWidth = 3;
  static constexpr bool kHasCustomGates = true;
};

}  // namespace plonkish

#endif  // PLONKISH_CONSTRAINT_SYSTEM_CONSTRAINT_SYSTEM_PARAMS_H_
