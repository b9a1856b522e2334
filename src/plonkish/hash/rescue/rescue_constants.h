#ifndef PLONKISH_HASH_RESCUE_RESCUE_CONSTANTS_H_
#define PLONKISH_HASH_RESCUE_RESCUE_CONSTANTS_H_

#include <array>
#include <cstddef>

#include "plonkish/algebra/fields/base_field_element.h"
#include "plonkish/hash/rescue/rescue_params.h"

namespace plonkish {

/*
  The fixed Rescue instance used by the command line tool and the known answer tests:
  rate 2, capacity 2, 10 rounds (20 S-box layers).
*/
struct RescueConstants {
  static constexpr size_t kRate = 2;
  static constexpr size_t kCapacity = 2;
  static constexpr size_t kStateSize = kRate + kCapacity;
  static constexpr size_t kNumRounds = 10;
  static constexpr size_t kNumRoundConstantVectors = 2 * kNumRounds + 1;

  using VectorT = std::array<BaseFieldElement, kStateSize>;

  const std::array<VectorT, kNumRoundConstantVectors> k_round_constants;
  const std::array<VectorT, kStateSize> k_mds_matrix;
};

extern const RescueConstants kRescueConstants;

/*
  Returns kRescueConstants as a parameter set.
*/
RescueParams DefaultRescueParams();

}  // namespace plonkish

#endif  // PLONKISH_HASH_RESCUE_RESCUE_CONSTANTS_H_
