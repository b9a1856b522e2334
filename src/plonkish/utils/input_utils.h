#ifndef PLONKISH_UTILS_INPUT_UTILS_H_
#define PLONKISH_UTILS_INPUT_UTILS_H_

#include <string>
#include <vector>

#include "plonkish/algebra/fields/base_field_element.h"

namespace plonkish {

/*
  Parses a comma separated list of hex field elements, e.g. "0x1,0x2a".
*/
std::vector<BaseFieldElement> ParseFieldElementList(const std::string& list);

}  // namespace plonkish

#endif  // PLONKISH_UTILS_INPUT_UTILS_H_
