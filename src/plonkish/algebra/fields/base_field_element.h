#ifndef PLONKISH_ALGEBRA_FIELDS_BASE_FIELD_ELEMENT_H_
#define PLONKISH_ALGEBRA_FIELDS_BASE_FIELD_ELEMENT_H_

#include <cstdint>
#include <iostream>
#include <string>

#include "plonkish/error_handling/error_handling.h"
#include "plonkish/math/math.h"
#include "plonkish/utils/attributes.h"

namespace plonkish {

class Prng;

/*
  The prime field in which the Rescue circuits are built.
  p = 2^61 + 20 * 2^32 + 1, so elements fit in one 64 bit word. They are stored in Montgomery
  representation for faster modular multiplication.
  Note that 5 does not divide p - 1, hence x -> x^5 is a permutation of the field.
*/
class BaseFieldElement {
 public:
  static constexpr uint64_t kModulus = 0x2000001400000001;  // 2**61 + 20 * 2**32 + 1.
  static constexpr uint64_t kModulusBits = Log2Floor(kModulus);
  static constexpr uint64_t kMontgomeryR = 0x1fffff73fffffff9;  // = 2^64 % kModulus.
  static constexpr uint64_t kMontgomeryRSquared = 0x1fc18a13fffce041;
  static constexpr uint64_t kMontgomeryMPrime = 0x20000013ffffffff;  // = (-(kModulus^-1)) mod 2^64.

  BaseFieldElement() = delete;

  static constexpr BaseFieldElement Zero() { return BaseFieldElement(0); }

  static constexpr BaseFieldElement One() { return BaseFieldElement(kMontgomeryR); }

  static constexpr BaseFieldElement FromUint(uint64_t val) {
    // MontgomeryMul divides by r, so multiplying by r^2 leaves val * r.
    return BaseFieldElement(MontgomeryMul(val, kMontgomeryRSquared));
  }

  BaseFieldElement operator+(const BaseFieldElement& rhs) const {
    return BaseFieldElement(ReduceIfNeeded(value_ + rhs.value_));
  }

  BaseFieldElement operator-(const BaseFieldElement& rhs) const {
    uint64_t val = value_ - rhs.value_;
    return BaseFieldElement(IsNegative(val) ? val + kModulus : val);
  }

  BaseFieldElement operator-() const { return Zero() - *this; }

  BaseFieldElement operator*(const BaseFieldElement& rhs) const {
    return BaseFieldElement(MontgomeryMul(value_, rhs.value_));
  }

  BaseFieldElement& operator+=(const BaseFieldElement& rhs);
  BaseFieldElement& operator-=(const BaseFieldElement& rhs);
  ALWAYS_INLINE BaseFieldElement& operator*=(const BaseFieldElement& rhs);

  constexpr bool operator==(const BaseFieldElement& rhs) const { return value_ == rhs.value_; }
  constexpr bool operator!=(const BaseFieldElement& rhs) const { return value_ != rhs.value_; }

  /*
    Computed as x^(p - 2).
  */
  BaseFieldElement Inverse() const;

  static BaseFieldElement RandomElement(Prng* prng);

  /*
    Parses a hex string ("0x...") holding the standard form of an element. The value must be
    smaller than kModulus.
  */
  static BaseFieldElement FromString(const std::string& s);

  std::string ToString() const;

  uint64_t ToStandardForm() const;

  static constexpr size_t SizeInBytes() { return sizeof(uint64_t); }

 private:
  explicit constexpr BaseFieldElement(uint64_t val) : value_(val) {}

  static constexpr bool IsNegative(uint64_t val) { return static_cast<int64_t>(val) < 0; }

  /*
    In montgomery representation there might be an overflow of the value. i.e val > kModulus.
    This functions takes val, and returns an equivalent value such that 0 <= value < kModulus.
  */
  static constexpr uint64_t ReduceIfNeeded(uint64_t val) {
    uint64_t alt_val = val - kModulus;
    return IsNegative(alt_val) ? val : alt_val;
  }

  static constexpr __uint128_t Umul128(uint64_t x, uint64_t y) {
    return static_cast<__uint128_t>(x) * static_cast<__uint128_t>(y);
  }

  /*
    Computes (x*y / (2^64)) mod kModulus.
  */
  static constexpr uint64_t MontgomeryMul(uint64_t x, uint64_t y) {
    __uint128_t mul_res = Umul128(x, y);
    uint64_t u = static_cast<uint64_t>(mul_res) * kMontgomeryMPrime;
    __uint128_t res = Umul128(kModulus, u) + mul_res;

    ASSERT_DEBUG(static_cast<uint64_t>(res) == 0, "Low 64bit should be 0.");

    return ReduceIfNeeded(static_cast<uint64_t>(res >> 64));
  }

  uint64_t value_ = 0;
};

std::ostream& operator<<(std::ostream& out, const BaseFieldElement& element);

}  // namespace plonkish

#include "plonkish/algebra/fields/base_field_element.inl"

#endif  // PLONKISH_ALGEBRA_FIELDS_BASE_FIELD_ELEMENT_H_
