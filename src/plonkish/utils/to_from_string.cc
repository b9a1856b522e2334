#include "plonkish/utils/to_from_string.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include "plonkish/error_handling/error_handling.h"

namespace plonkish {

std::string BytesToHexString(gsl::span<const std::byte> data, bool trim_leading_zeros) {
  ASSERT_RELEASE(!data.empty(), "Cannot convert empty byte sequence to hex.");
  std::stringstream s;
  auto iter = data.begin();
  s << "0x";
  if (trim_leading_zeros) {
    for (; iter != data.end() && std::to_integer<int>(*iter) == 0; ++iter) {
    }
    if (iter == data.end()) {
      return "0x0";
    }
    // The most significant byte is written without zero padding.
    s << std::hex << std::to_integer<int>(*iter);
    ++iter;
  }

  for (; iter != data.end(); ++iter) {
    s << std::setfill('0') << std::setw(2) << std::hex << std::to_integer<int>(*iter);
  }

  return s.str();
}

void HexStringToBytes(const std::string& hex_string, gsl::span<std::byte> as_bytes_out) {
  ASSERT_RELEASE(
      hex_string.length() > 2,
      "String (\"" + hex_string +
          "\") is too short, expected at least two chars (for the '0x' prefix).");
  ASSERT_RELEASE(
      hex_string.compare(0, 2, "0x") == 0,
      "String (\"" + hex_string + "\") does not start with '0x'.");
  std::string digits = hex_string.substr(2);
  ASSERT_RELEASE(
      digits.find_first_not_of("0123456789abcdefABCDEF") == std::string::npos,
      "String (\"" + hex_string + "\") contains a non hexadecimal character.");
  digits.erase(0, std::min(digits.find_first_not_of('0'), digits.size() - 1));
  if (digits.length() % 2 != 0) {
    digits.insert(0, 1, '0');
  }

  const size_t n_bytes = digits.length() / 2;
  ASSERT_RELEASE(
      as_bytes_out.size() >= n_bytes, "Output's length (" + std::to_string(as_bytes_out.size()) +
                                          ") is less than the number of encoded bytes (" +
                                          std::to_string(n_bytes) + ").");
  const size_t offset = as_bytes_out.size() - n_bytes;
  std::fill(as_bytes_out.begin(), as_bytes_out.begin() + offset, std::byte{0});
  for (size_t i = 0; i < n_bytes; ++i) {
    as_bytes_out[offset + i] = std::byte(std::stoi(digits.substr(i * 2, 2), nullptr, 16));
  }
}

std::vector<std::string> SplitString(const std::string& str, char delimiter) {
  std::vector<std::string> tokens;
  std::stringstream s(str);
  std::string token;
  while (std::getline(s, token, delimiter)) {
    if (!token.empty()) {
      tokens.push_back(token);
    }
  }
  return tokens;
}

}  // namespace plonkish
