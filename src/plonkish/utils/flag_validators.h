#ifndef PLONKISH_UTILS_FLAG_VALIDATORS_H_
#define PLONKISH_UTILS_FLAG_VALIDATORS_H_

#include <cstdint>
#include <string>

namespace plonkish {

/*
  Returns true if value is a non-empty comma separated list of hex field elements.
*/
bool ValidateFieldElementList(const char* flagname, const std::string& value);

/*
  Returns true if value is positive.
*/
bool ValidatePositive(const char* flagname, uint64_t value);

}  // namespace plonkish

#endif  // PLONKISH_UTILS_FLAG_VALIDATORS_H_
