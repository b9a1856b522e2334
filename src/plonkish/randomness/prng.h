#ifndef PLONKISH_RANDOMNESS_PRNG_H_
#define PLONKISH_RANDOMNESS_PRNG_H_

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <random>
#include <type_traits>
#include <vector>

#include "gsl/gsl-lite.hpp"

#include "plonkish/crypt_tools/blake2s_256.h"
#include "plonkish/error_handling/error_handling.h"

namespace plonkish {

/*
  Pseudo Random Number Generator based on a Blake2s hash chain: the seed is hashed once, and
  output bytes are produced by hashing the chain state together with an incrementing counter.

  Used to draw witnesses and parameter sets in tests. Note: This class is not thread safe.
*/
class Prng {
 public:
  /*
    The default constructor seeds from the system time, unless --override_random_seed is set.
    The seed is logged so that failing runs can be reproduced.
  */
  Prng();

  explicit Prng(gsl::span<const std::byte> seed) { InitHashChain(seed); }

  Prng(Prng&& src) = default;
  Prng& operator=(Prng&& other) = default;
  Prng(const Prng&) = delete;
  Prng& operator=(const Prng&) = delete;

  /*
    Returns a random integer in the closed interval [min, max].
  */
  template <typename T>
  T UniformInt(T min, T max) {
    static_assert(std::is_integral<T>::value, "Type is not integral.");
    ASSERT_RELEASE(min <= max, "Invalid interval.");
    std::uniform_int_distribution<T> d(min, max);
    return d(*this);
  }

  /*
    Returns a vector of random field elements.
  */
  template <typename T>
  std::vector<T> RandomFieldElementVector(size_t n_elements) {
    std::vector<T> return_vec;
    return_vec.reserve(n_elements);
    for (size_t i = 0; i < n_elements; ++i) {
      return_vec.push_back(T::RandomElement(this));
    }
    return return_vec;
  }

  void GetRandomBytes(gsl::span<std::byte> random_bytes_out);

  // UniformRandomBitGenerator interface, for use with std:: distributions.
  using result_type = uint64_t;
  static constexpr result_type min() { return 0; }                                     // NOLINT
  static constexpr result_type max() { return std::numeric_limits<uint64_t>::max(); }  // NOLINT
  result_type operator()();

 private:
  void InitHashChain(gsl::span<const std::byte> seed);

  /*
    Refills spare_bytes_ with the hash of the chain state and the next counter value.
  */
  void Refill();

  Blake2s256 hash_;
  std::array<std::byte, Blake2s256::kDigestNumBytes> spare_bytes_{};
  size_t num_spare_bytes_ = 0;
  uint64_t counter_ = 0;
};

}  // namespace plonkish

#endif  // PLONKISH_RANDOMNESS_PRNG_H_
