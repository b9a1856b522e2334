#include "plonkish/algebra/fields/base_field_element.h"

#include <array>
#include <cstddef>
#include <limits>

#include "plonkish/randomness/prng.h"
#include "plonkish/utils/serialization.h"
#include "plonkish/utils/to_from_string.h"

namespace plonkish {

BaseFieldElement BaseFieldElement::FromString(const std::string& s) {
  std::array<std::byte, SizeInBytes()> as_bytes{};
  HexStringToBytes(s, as_bytes);
  const uint64_t standard_form = Deserialize(as_bytes);
  ASSERT_RELEASE(
      standard_form < kModulus, "Value " + s + " is not smaller than the field modulus.");
  return BaseFieldElement(MontgomeryMul(standard_form, kMontgomeryRSquared));
}

std::string BaseFieldElement::ToString() const {
  std::array<std::byte, SizeInBytes()> as_bytes{};
  Serialize(ToStandardForm(), as_bytes);
  return BytesToHexString(as_bytes);
}

uint64_t BaseFieldElement::ToStandardForm() const { return MontgomeryMul(value_, 1); }

std::ostream& operator<<(std::ostream& out, const BaseFieldElement& element) {
  return out << element.ToString();
}

BaseFieldElement BaseFieldElement::RandomElement(Prng* prng) {
  // Uniformity is preserved under the Montgomery transformation, so the sampled word is used as
  // the internal representation directly.
  constexpr uint64_t kRelevantBits = (Pow2(kModulusBits + 1)) - 1;

  uint64_t sample;
  do {
    sample = prng->UniformInt<uint64_t>(0, std::numeric_limits<uint64_t>::max()) & kRelevantBits;
  } while (sample >= kModulus);

  return BaseFieldElement(sample);
}

}  // namespace plonkish
