#ifndef PLONKISH_MATH_MATH_H_
#define PLONKISH_MATH_MATH_H_

#include <cstdint>
#include <string>

#include "plonkish/error_handling/error_handling.h"

namespace plonkish {

using std::size_t;

/*
  Returns 2^n, n must be < 64.
*/
constexpr uint64_t inline Pow2(uint64_t n) {
  ASSERT_RELEASE(n < 64, "n must be smaller than 64.");
  return UINT64_C(1) << n;
}

/*
  Returns floor(Log_2(n)), n must be > 0.
*/
constexpr size_t inline Log2Floor(const uint64_t n) {
  ASSERT_RELEASE(n != 0, "log2 of 0 is undefined.");
  static_assert(
      sizeof(long long) == 8,  // NOLINT: use C type long long.
      "It is assumed that the type long long is represented by 64 bits.");
  return 63 - __builtin_clzll(n);
}

/*
  Computes ceil(x / y).
*/
constexpr uint64_t DivCeil(const uint64_t numerator, const uint64_t denominator) {
  ASSERT_RELEASE(denominator != 0, "The denominator cannot be zero.");
  ASSERT_RELEASE(numerator + denominator > numerator, "Integer overflow.");
  return (numerator + denominator - 1) / denominator;
}

/*
  Returns the smallest multiple of denominator which is not smaller than numerator.
*/
constexpr uint64_t RoundUpToMultiple(const uint64_t numerator, const uint64_t denominator) {
  return DivCeil(numerator, denominator) * denominator;
}

}  // namespace plonkish

#endif  // PLONKISH_MATH_MATH_H_
