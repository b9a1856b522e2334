namespace plonkish {

inline BaseFieldElement& BaseFieldElement::operator+=(const BaseFieldElement& rhs) {
  return *this = *this + rhs;
}

inline BaseFieldElement& BaseFieldElement::operator-=(const BaseFieldElement& rhs) {
  return *this = *this - rhs;
}

ALWAYS_INLINE BaseFieldElement& BaseFieldElement::operator*=(const BaseFieldElement& rhs) {
  value_ = MontgomeryMul(value_, rhs.value_);
  return *this;
}

inline BaseFieldElement BaseFieldElement::Inverse() const {
  ASSERT_RELEASE(*this != Zero(), "Zero does not have an inverse.");
  BaseFieldElement result = One();
  BaseFieldElement power = *this;
  for (uint64_t exp = kModulus - 2; exp != 0; exp >>= 1) {
    if ((exp & 1) != 0) {
      result *= power;
    }
    power *= power;
  }
  return result;
}

}  // namespace plonkish
