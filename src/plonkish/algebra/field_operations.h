#ifndef PLONKISH_ALGEBRA_FIELD_OPERATIONS_H_
#define PLONKISH_ALGEBRA_FIELD_OPERATIONS_H_

#include <vector>

#include "gsl/gsl-lite.hpp"

#include "plonkish/algebra/fields/base_field_element.h"
#include "plonkish/error_handling/error_handling.h"

namespace plonkish {

using std::size_t;
using std::uint64_t;

/*
  Returns the power of a field element.
  Note that this function doesn't support negative exponents.
*/
template <typename FieldElementT>
FieldElementT Pow(const FieldElementT& base, __uint128_t exp) {
  FieldElementT power = base;
  FieldElementT res = FieldElementT::One();
  while (exp != 0) {
    if ((exp & 1) == 1) {
      res *= power;
    }
    power *= power;
    exp >>= 1;
  }
  return res;
}

/*
  Returns the inner product of two vectors of the same length.
*/
template <typename FieldElementT>
FieldElementT InnerProduct(
    gsl::span<const FieldElementT> vector_a, gsl::span<const FieldElementT> vector_b) {
  ASSERT_RELEASE(vector_a.size() == vector_b.size(), "Size mismatch.");
  FieldElementT sum = FieldElementT::Zero();
  for (size_t i = 0; i < vector_a.size(); ++i) {
    sum += vector_a[i] * vector_b[i];
  }
  return sum;
}

}  // namespace plonkish

#endif  // PLONKISH_ALGEBRA_FIELD_OPERATIONS_H_
