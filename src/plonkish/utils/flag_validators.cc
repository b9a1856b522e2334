#include "plonkish/utils/flag_validators.h"

#include "glog/logging.h"

#include "plonkish/error_handling/error_handling.h"
#include "plonkish/utils/input_utils.h"

namespace plonkish {

bool ValidateFieldElementList(const char* flagname, const std::string& value) {
  try {
    if (ParseFieldElementList(value).empty()) {
      LOG(ERROR) << "--" << flagname << " must contain at least one field element.";
      return false;
    }
  } catch (const PlonkishException& e) {
    LOG(ERROR) << "Invalid value for --" << flagname << ": " << e.Message();
    return false;
  }
  return true;
}

bool ValidatePositive(const char* flagname, uint64_t value) {
  if (value == 0) {
    LOG(ERROR) << "--" << flagname << " must be positive.";
    return false;
  }
  return true;
}

}  // namespace plonkish
