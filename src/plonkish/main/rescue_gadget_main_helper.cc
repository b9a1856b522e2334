#include "plonkish/main/rescue_gadget_main_helper.h"

#include <optional>

#include "glog/logging.h"

#include "plonkish/constraint_system/allocated_num.h"
#include "plonkish/constraint_system/constraint_system_params.h"
#include "plonkish/error_handling/error_handling.h"
#include "plonkish/gadgets/rescue/rescue_gadget.h"
#include "plonkish/hash/rescue/rescue_hash.h"
#include "plonkish/utils/profiling.h"

namespace plonkish {

RescueCircuitSummary SynthesizeRescueHash(
    const RescueParams& params, gsl::span<const BaseFieldElement> input, size_t n_outputs,
    SynthesisMode mode) {
  Assembly<Width4WithCustomGates> cs(mode);

  std::vector<AllocatedNum> input_variables;
  input_variables.reserve(input.size());
  for (const BaseFieldElement& value : input) {
    input_variables.push_back(AllocatedNum::Alloc(&cs, [&value]() { return std::optional(value); }));
  }

  std::vector<LinearCombination> outputs;
  {
    ProfilingBlock profiling_block("Rescue circuit synthesis");
    outputs = RescueHashGadget(&cs, params, input_variables, n_outputs);
  }
  VLOG(1) << "Rescue circuit: " << cs.NumGates() << " gates, " << cs.NumVariables()
          << " variables.";

  RescueCircuitSummary summary{{}, cs.NumGates(), cs.NumVariables()};
  if (mode == SynthesisMode::kSetup) {
    return summary;
  }

  for (const LinearCombination& output : outputs) {
    const std::optional<BaseFieldElement> value = output.GetValue();
    ASSERT_RELEASE(value.has_value(), "A squeezed value has no witness.");
    summary.digest.push_back(*value);
  }

  ProfilingBlock profiling_block("Circuit check");
  ASSERT_RELEASE(cs.IsSatisfied(), "The Rescue circuit is not satisfied by its witness.");
  ASSERT_RELEASE(
      summary.digest == RescueHash(params, input, n_outputs),
      "The circuit digest differs from the reference Rescue hash.");
  return summary;
}

}  // namespace plonkish
