/*
  Builds the Rescue sponge hash of a sequence of field elements as a PLONK-style circuit, checks it
  against the reference hash and reports the digest and the size of the circuit.

  Example:
    rescue_gadget_main --input=0x1,0x2,0x3 --n_outputs=2 --logtostderr
*/

#include <string>
#include <vector>

#include "gflags/gflags.h"
#include "glog/logging.h"

#include "plonkish/hash/rescue/rescue_constants.h"
#include "plonkish/main/rescue_gadget_main_helper.h"
#include "plonkish/utils/flag_validators.h"
#include "plonkish/utils/input_utils.h"

DEFINE_string(input, "", "Comma separated hex field elements to hash, e.g. 0x1,0x2.");
DEFINE_validator(input, &plonkish::ValidateFieldElementList);

DEFINE_uint64(n_outputs, 2, "Number of field elements to squeeze, at most the rate.");
DEFINE_validator(n_outputs, &plonkish::ValidatePositive);

DEFINE_bool(
    setup_only, false, "Optional. Build the circuit shape without witnesses and skip the checks.");

int main(int argc, char** argv) {
  using namespace plonkish;  // NOLINT
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT

  const RescueParams params = DefaultRescueParams();
  const std::vector<BaseFieldElement> input = ParseFieldElementList(FLAGS_input);
  const RescueCircuitSummary summary = SynthesizeRescueHash(
      params, input, FLAGS_n_outputs,
      FLAGS_setup_only ? SynthesisMode::kSetup : SynthesisMode::kProving);

  LOG(INFO) << "Circuit of " << summary.n_gates << " gates and " << summary.n_variables
            << " variables for " << input.size() << " input elements.";
  for (const BaseFieldElement& element : summary.digest) {
    LOG(INFO) << "Digest element: " << element;
  }
  return 0;
}
