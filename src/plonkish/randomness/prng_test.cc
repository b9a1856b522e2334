#include "plonkish/randomness/prng.h"

#include <array>
#include <cstddef>
#include <limits>
#include <set>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "plonkish/algebra/fields/base_field_element.h"
#include "plonkish/error_handling/test_utils.h"

namespace plonkish {
namespace {

using testing::HasSubstr;

const std::array<std::byte, 4> kSeed{std::byte{0xca}, std::byte{0xfe}, std::byte{0xca},
                                     std::byte{0xfe}};

template <typename T>
class PrngTest : public ::testing::Test {};

using IntTypes = ::testing::Types<uint16_t, uint32_t, uint64_t>;
TYPED_TEST_CASE(PrngTest, IntTypes);

TYPED_TEST(PrngTest, TwoInvocationsAreNotIdentical) {
  Prng prng(kSeed);
  auto a = prng.UniformInt<TypeParam>(0, std::numeric_limits<TypeParam>::max());
  auto b = prng.UniformInt<TypeParam>(0, std::numeric_limits<TypeParam>::max());
  EXPECT_NE(a, b);
}

TEST(PrngTest, SameSeedSameSequence) {
  Prng prng1(kSeed);
  Prng prng2(kSeed);
  for (size_t i = 0; i < 10; ++i) {
    EXPECT_EQ(prng1(), prng2());
  }
}

TEST(PrngTest, ChunkingDoesNotChangeOutput) {
  Prng prng1(kSeed);
  Prng prng2(kSeed);
  std::array<std::byte, 100> all_at_once{};
  prng1.GetRandomBytes(all_at_once);

  std::array<std::byte, 100> chunked{};
  const auto chunked_span = gsl::make_span(chunked);
  prng2.GetRandomBytes(chunked_span.subspan(0, 7));
  prng2.GetRandomBytes(chunked_span.subspan(7, 40));
  prng2.GetRandomBytes(chunked_span.subspan(47, 53));
  EXPECT_EQ(all_at_once, chunked);
}

TEST(PrngTest, UniformIntRange) {
  Prng prng(kSeed);
  std::set<int> seen;
  for (size_t i = 0; i < 1000; ++i) {
    const int x = prng.UniformInt(-2, 2);
    ASSERT_LE(-2, x);
    ASSERT_GE(2, x);
    seen.insert(x);
  }
  EXPECT_EQ(5U, seen.size());
  EXPECT_ASSERT(prng.UniformInt(3, 2), HasSubstr("Invalid interval"));
}

TEST(PrngTest, RandomFieldElementVector) {
  Prng prng(kSeed);
  const auto elements = prng.RandomFieldElementVector<BaseFieldElement>(8);
  ASSERT_EQ(8U, elements.size());
  EXPECT_NE(elements[0], elements[1]);
}

}  // namespace
}  // namespace plonkish
