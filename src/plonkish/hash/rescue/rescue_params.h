#ifndef PLONKISH_HASH_RESCUE_RESCUE_PARAMS_H_
#define PLONKISH_HASH_RESCUE_RESCUE_PARAMS_H_

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "plonkish/algebra/fields/base_field_element.h"
#include "plonkish/error_handling/error_handling.h"
#include "plonkish/hash/rescue/rescue_sboxes.h"

namespace plonkish {

/*
  A Rescue parameter set.
    rate, capacity - the sponge splits its state of width rate + capacity into a rate part that
      absorbs input and yields output, and a hidden capacity part.
    num_rounds - every round is made of two S-box layers, SBox0 on even layers and SBox1 on odd
      ones, so the permutation runs 2 * num_rounds layers.
    round_constants - 2 * num_rounds + 1 vectors of state width. Vector 0 is added before the first
      layer, vector i + 1 after layer i.
    mds_matrix - the state width x state width diffusion matrix applied after every layer.
  The parameters are supplied by the caller and only their shapes are validated.
*/
template <typename SBox0T, typename SBox1T>
class RescueHashParams {
 public:
  using SBox0Type = SBox0T;
  using SBox1Type = SBox1T;
  using VectorT = std::vector<BaseFieldElement>;

  RescueHashParams(
      size_t rate, size_t capacity, size_t num_rounds, std::vector<VectorT> round_constants,
      std::vector<VectorT> mds_matrix, SBox0T sbox_0, SBox1T sbox_1)
      : rate_(rate),
        capacity_(capacity),
        num_rounds_(num_rounds),
        round_constants_(std::move(round_constants)),
        mds_matrix_(std::move(mds_matrix)),
        sbox_0_(std::move(sbox_0)),
        sbox_1_(std::move(sbox_1)) {
    ASSERT_RELEASE(rate_ > 0, "The rate must be positive.");
    ASSERT_RELEASE(capacity_ > 0, "The capacity must be positive.");
    ASSERT_RELEASE(num_rounds_ > 0, "The number of rounds must be positive.");
    ASSERT_RELEASE(
        round_constants_.size() == 2 * num_rounds_ + 1,
        "Expected " + std::to_string(2 * num_rounds_ + 1) + " round constant vectors, got " +
            std::to_string(round_constants_.size()) + ".");
    for (const VectorT& round_constants_vector : round_constants_) {
      ASSERT_RELEASE(
          round_constants_vector.size() == StateWidth(),
          "Every round constant vector must be of the state width.");
    }
    ASSERT_RELEASE(mds_matrix_.size() == StateWidth(), "MDS matrix must be square.");
    for (const VectorT& row : mds_matrix_) {
      ASSERT_RELEASE(row.size() == StateWidth(), "MDS matrix must be square.");
    }
  }

  size_t Rate() const { return rate_; }
  size_t Capacity() const { return capacity_; }
  size_t StateWidth() const { return rate_ + capacity_; }
  size_t NumRounds() const { return num_rounds_; }

  const VectorT& RoundConstants(size_t round) const { return round_constants_.at(round); }
  const VectorT& MdsMatrixRow(size_t row) const { return mds_matrix_.at(row); }

  const SBox0T& SBox0() const { return sbox_0_; }
  const SBox1T& SBox1() const { return sbox_1_; }

 private:
  size_t rate_;
  size_t capacity_;
  size_t num_rounds_;
  std::vector<VectorT> round_constants_;
  std::vector<VectorT> mds_matrix_;
  SBox0T sbox_0_;
  SBox1T sbox_1_;
};

/*
  The standard alternation: fifth roots on even layers, fifth powers on odd layers.
*/
using RescueParams = RescueHashParams<PowerSBox, QuinticSBox>;

}  // namespace plonkish

#endif  // PLONKISH_HASH_RESCUE_RESCUE_PARAMS_H_
