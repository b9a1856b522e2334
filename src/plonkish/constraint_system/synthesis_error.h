#ifndef PLONKISH_CONSTRAINT_SYSTEM_SYNTHESIS_ERROR_H_
#define PLONKISH_CONSTRAINT_SYSTEM_SYNTHESIS_ERROR_H_

#include <exception>
#include <string>
#include <utility>

namespace plonkish {

/*
  Thrown when a witness value is requested but cannot be computed, e.g. when a circuit is
  synthesized in proving mode from inputs that carry no assignment.

  Unlike PlonkishException this is a recoverable condition: the caller may rerun the construction
  with witnesses supplied, or in setup mode to obtain the circuit shape only.
*/
class SynthesisError : public std::exception {
 public:
  explicit SynthesisError(std::string message) : message_(std::move(message)) {}
  const char* what() const noexcept override { return message_.c_str(); }

 private:
  std::string message_;
};

}  // namespace plonkish

#endif  // PLONKISH_CONSTRAINT_SYSTEM_SYNTHESIS_ERROR_H_
