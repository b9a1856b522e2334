#ifndef PLONKISH_CONSTRAINT_SYSTEM_ASSEMBLY_H_
#define PLONKISH_CONSTRAINT_SYSTEM_ASSEMBLY_H_

#include <array>
#include <cstddef>
#include <optional>
#include <vector>

#include "plonkish/algebra/fields/base_field_element.h"
#include "plonkish/constraint_system/gates.h"
#include "plonkish/constraint_system/synthesis_error.h"
#include "plonkish/constraint_system/variable.h"
#include "plonkish/error_handling/error_handling.h"

namespace plonkish {

enum class SynthesisMode {
  // Only the shape of the circuit is built. Value closures are never invoked.
  kSetup,
  // Every allocated variable receives a witness value.
  kProving,
};

/*
  An in-memory PLONK-style constraint system. It records variables, their witnesses and the gates
  registered on them, and can check that every gate is satisfied by the witnesses.

  ParamsT describes the static capabilities (see constraint_system_params.h). Any type with the
  same members (Params, Alloc, GetValue, GetDummyVariable, AddMainGate and, when
  Params::kHasCustomGates holds, AddFifthPowerGate) can be used with the gadgets in this library.
*/
template <typename ParamsT>
class Assembly {
 public:
  using Params = ParamsT;

  static_assert(Params::kStateWidth >= 3, "The main gate must have at least three wires.");

  explicit Assembly(SynthesisMode mode = SynthesisMode::kProving);

  SynthesisMode Mode() const { return mode_; }

  /*
    Allocates a new variable. In proving mode, value_func() is called and must return a value;
    std::nullopt results in a SynthesisError. In setup mode value_func is not called.
  */
  template <typename ValueFunc>
  Variable Alloc(const ValueFunc& value_func);

  /*
    Returns the witness of a variable, or std::nullopt in setup mode.
  */
  std::optional<BaseFieldElement> GetValue(const Variable& variable) const;

  /*
    A variable with a zero witness, used to fill gate slots that do not take part in a relation.
  */
  Variable GetDummyVariable() const { return Variable(0); }

  void AddMainGate(const MainGate& gate);

  void AddFifthPowerGate(const std::array<Variable, 4>& row);

  size_t NumGates() const { return gates_.size(); }
  size_t NumVariables() const { return values_.size(); }

  /*
    Returns true if every registered gate holds on the current witnesses. The first violated gate
    is logged. Must be called in proving mode.
  */
  bool IsSatisfied() const;

 private:
  const BaseFieldElement& WitnessOf(const Variable& variable) const;

  bool IsGateSatisfied(const MainGate& gate) const;
  bool IsGateSatisfied(const FifthPowerGate& gate) const;

  void AssertKnown(const Variable& variable) const;

  const SynthesisMode mode_;
  std::vector<std::optional<BaseFieldElement>> values_;
  std::vector<Gate> gates_;
};

}  // namespace plonkish

#include "plonkish/constraint_system/assembly.inl"

#endif  // PLONKISH_CONSTRAINT_SYSTEM_ASSEMBLY_H_
