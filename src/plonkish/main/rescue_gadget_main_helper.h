#ifndef PLONKISH_MAIN_RESCUE_GADGET_MAIN_HELPER_H_
#define PLONKISH_MAIN_RESCUE_GADGET_MAIN_HELPER_H_

#include <cstddef>
#include <vector>

#include "gsl/gsl-lite.hpp"

#include "plonkish/algebra/fields/base_field_element.h"
#include "plonkish/constraint_system/assembly.h"
#include "plonkish/hash/rescue/rescue_params.h"

namespace plonkish {

struct RescueCircuitSummary {
  // Empty in setup mode.
  std::vector<BaseFieldElement> digest;
  size_t n_gates;
  size_t n_variables;
};

/*
  Builds the Rescue hash of input as a circuit over a width 4 assembly with custom gates and squeezes
  n_outputs values.
  In proving mode the circuit digest is checked against RescueHash() and every gate is checked to
  hold; a mismatch throws. In setup mode only the values' count is used and no witness is computed.
*/
RescueCircuitSummary SynthesizeRescueHash(
    const RescueParams& params, gsl::span<const BaseFieldElement> input, size_t n_outputs,
    SynthesisMode mode);

}  // namespace plonkish

#endif  // PLONKISH_MAIN_RESCUE_GADGET_MAIN_HELPER_H_
