#include "plonkish/crypt_tools/blake2s_256.h"

#include <cstdint>

#include "blake2.h"

#include "plonkish/error_handling/error_handling.h"
#include "plonkish/utils/to_from_string.h"

namespace plonkish {

Blake2s256 Blake2s256::HashBytes(gsl::span<const std::byte> bytes) {
  Blake2s256 result;
  blake2s_state ctx;
  ASSERT_RELEASE(blake2s_init(&ctx, kDigestNumBytes) == 0, "blake2s_init failed.");
  ASSERT_RELEASE(
      blake2s_update(&ctx, reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size()) == 0,
      "blake2s_update failed.");
  ASSERT_RELEASE(
      blake2s_final(&ctx, reinterpret_cast<uint8_t*>(result.buffer_.data()), kDigestNumBytes) == 0,
      "blake2s_final failed.");
  return result;
}

std::string Blake2s256::ToString() const {
  return BytesToHexString(buffer_, /*trim_leading_zeros=*/false);
}

std::ostream& operator<<(std::ostream& out, const Blake2s256& hash) {
  return out << hash.ToString();
}

}  // namespace plonkish
