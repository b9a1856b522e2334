#include "plonkish/utils/input_utils.h"

#include "plonkish/utils/to_from_string.h"

namespace plonkish {

std::vector<BaseFieldElement> ParseFieldElementList(const std::string& list) {
  std::vector<BaseFieldElement> elements;
  for (const std::string& token : SplitString(list, ',')) {
    elements.push_back(BaseFieldElement::FromString(token));
  }
  return elements;
}

}  // namespace plonkish
