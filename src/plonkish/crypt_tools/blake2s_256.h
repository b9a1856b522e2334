#ifndef PLONKISH_CRYPT_TOOLS_BLAKE2S_256_H_
#define PLONKISH_CRYPT_TOOLS_BLAKE2S_256_H_

#include <array>
#include <cstddef>
#include <iostream>
#include <string>

#include "gsl/gsl-lite.hpp"

namespace plonkish {

/*
  A 256 bit Blake2s digest.
*/
class Blake2s256 {
 public:
  static constexpr size_t kDigestNumBytes = 256 / 8;

  Blake2s256() : buffer_{} {}

  static Blake2s256 HashBytes(gsl::span<const std::byte> bytes);

  bool operator==(const Blake2s256& other) const { return buffer_ == other.buffer_; }
  bool operator!=(const Blake2s256& other) const { return !(*this == other); }
  const std::array<std::byte, kDigestNumBytes>& GetDigest() const { return buffer_; }
  std::string ToString() const;

 private:
  std::array<std::byte, kDigestNumBytes> buffer_;
};

std::ostream& operator<<(std::ostream& out, const Blake2s256& hash);

}  // namespace plonkish

#endif  // PLONKISH_CRYPT_TOOLS_BLAKE2S_256_H_
