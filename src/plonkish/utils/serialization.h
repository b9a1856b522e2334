#ifndef PLONKISH_UTILS_SERIALIZATION_H_
#define PLONKISH_UTILS_SERIALIZATION_H_

#include <endian.h>
#include <algorithm>
#include <cstddef>
#include <cstdint>

#include "gsl/gsl-lite.hpp"

#include "plonkish/error_handling/error_handling.h"

namespace plonkish {

/*
  Writes val into span_out in big-endian byte order.
*/
inline void Serialize(uint64_t val, gsl::span<std::byte> span_out) {
  ASSERT_RELEASE(
      span_out.size() == sizeof(uint64_t), "Destination span size mismatches uint64_t size.");
  val = htobe64(val);                                           // NOLINT
  const auto bytes = gsl::byte_span(val).as_span<std::byte>();  // NOLINT
  std::copy(bytes.begin(), bytes.end(), span_out.begin());
}

inline uint64_t Deserialize(gsl::span<const std::byte> span) {
  ASSERT_RELEASE(span.size() == sizeof(uint64_t), "Source span size mismatches uint64_t size.");
  uint64_t val;
  const auto bytes = gsl::byte_span(val).as_span<std::byte>();  // NOLINT
  std::copy(span.begin(), span.begin() + sizeof(uint64_t), bytes.begin());
  return be64toh(val);  // NOLINT
}

}  // namespace plonkish

#endif  // PLONKISH_UTILS_SERIALIZATION_H_
