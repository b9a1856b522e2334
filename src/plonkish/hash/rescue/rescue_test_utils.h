#ifndef PLONKISH_HASH_RESCUE_RESCUE_TEST_UTILS_H_
#define PLONKISH_HASH_RESCUE_RESCUE_TEST_UTILS_H_

#include <cstddef>
#include <vector>

#include "plonkish/algebra/fields/base_field_element.h"
#include "plonkish/hash/rescue/rescue_params.h"
#include "plonkish/randomness/prng.h"

namespace plonkish {

/*
  Returns a parameter set with random round constants and a random Cauchy matrix as the diffusion
  layer. For tests only: nothing is checked about the security of the result.
*/
inline RescueParams RandomRescueParams(
    Prng* prng, size_t rate, size_t capacity, size_t num_rounds) {
  const size_t width = rate + capacity;
  std::vector<RescueParams::VectorT> round_constants;
  for (size_t i = 0; i < 2 * num_rounds + 1; ++i) {
    round_constants.push_back(prng->RandomFieldElementVector<BaseFieldElement>(width));
  }

  const auto xs = prng->RandomFieldElementVector<BaseFieldElement>(width);
  const auto ys = prng->RandomFieldElementVector<BaseFieldElement>(width);
  std::vector<RescueParams::VectorT> mds_matrix;
  for (size_t i = 0; i < width; ++i) {
    RescueParams::VectorT row;
    for (size_t j = 0; j < width; ++j) {
      row.push_back((xs[i] + ys[j]).Inverse());
    }
    mds_matrix.push_back(std::move(row));
  }

  return RescueParams(
      rate, capacity, num_rounds, std::move(round_constants), std::move(mds_matrix),
      PowerSBox::FifthRoot(), QuinticSBox());
}

}  // namespace plonkish

#endif  // PLONKISH_HASH_RESCUE_RESCUE_TEST_UTILS_H_
