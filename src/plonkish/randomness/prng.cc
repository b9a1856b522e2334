#include "plonkish/randomness/prng.h"

#include <algorithm>
#include <chrono>
#include <string>

#include "gflags/gflags.h"
#include "glog/logging.h"

#include "plonkish/utils/serialization.h"
#include "plonkish/utils/to_from_string.h"

DEFINE_string(override_random_seed, "", "override seed for prng");

namespace plonkish {

namespace {

std::array<std::byte, sizeof(uint64_t)> SeedFromSystemTime() {
  uint64_t seed = std::chrono::duration_cast<std::chrono::nanoseconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();

  std::array<std::byte, sizeof(uint64_t)> seed_bytes{};
  Serialize(seed, seed_bytes);

  return seed_bytes;
}

std::array<std::byte, sizeof(uint64_t)> SeedPrintoutToBytes(const std::string& printout) {
  std::array<std::byte, sizeof(uint64_t)> seed_bytes{};
  HexStringToBytes(printout, seed_bytes);
  return seed_bytes;
}

}  // namespace

Prng::Prng() {
  const std::array<std::byte, sizeof(uint64_t)> seed_bytes =
      FLAGS_override_random_seed.empty() ? SeedFromSystemTime()
                                         : SeedPrintoutToBytes(FLAGS_override_random_seed);
  const std::string seed_string = BytesToHexString(seed_bytes);
  LOG(INFO) << "Seeding PRNG with " << seed_string << ".";
  ASSERT_RELEASE(
      SeedPrintoutToBytes(seed_string) == seed_bytes, "Randomness not reproducible from printout.");
  InitHashChain(seed_bytes);
}

void Prng::InitHashChain(gsl::span<const std::byte> seed) {
  hash_ = Blake2s256::HashBytes(seed);
  num_spare_bytes_ = 0;
  counter_ = 0;
}

void Prng::Refill() {
  std::array<std::byte, 2 * Blake2s256::kDigestNumBytes> data{};
  std::array<std::byte, sizeof(uint64_t)> counter_bytes{};
  Serialize(counter_++, counter_bytes);

  std::copy(hash_.GetDigest().begin(), hash_.GetDigest().end(), data.begin());
  // The counter occupies the last 8 bytes of the buffer.
  std::copy(counter_bytes.begin(), counter_bytes.end(), data.end() - sizeof(uint64_t));
  spare_bytes_ = Blake2s256::HashBytes(data).GetDigest();
  num_spare_bytes_ = spare_bytes_.size();
}

void Prng::GetRandomBytes(gsl::span<std::byte> random_bytes_out) {
  size_t offset = 0;
  while (offset < random_bytes_out.size()) {
    if (num_spare_bytes_ == 0) {
      Refill();
    }
    const size_t n_bytes = std::min(num_spare_bytes_, random_bytes_out.size() - offset);
    const auto first = spare_bytes_.end() - num_spare_bytes_;
    std::copy(first, first + n_bytes, random_bytes_out.begin() + offset);
    num_spare_bytes_ -= n_bytes;
    offset += n_bytes;
  }
}

Prng::result_type Prng::operator()() {
  std::array<std::byte, sizeof(result_type)> bytes{};
  GetRandomBytes(bytes);
  return Deserialize(bytes);
}

}  // namespace plonkish
