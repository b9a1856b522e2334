#include <string>
#include <utility>

#include "glog/logging.h"

#include "plonkish/utils/overloaded.h"

namespace plonkish {

template <typename ParamsT>
Assembly<ParamsT>::Assembly(SynthesisMode mode) : mode_(mode) {
  // Index 0 is reserved for the dummy variable.
  values_.emplace_back(BaseFieldElement::Zero());
}

template <typename ParamsT>
template <typename ValueFunc>
Variable Assembly<ParamsT>::Alloc(const ValueFunc& value_func) {
  const Variable variable(values_.size());
  if (mode_ == SynthesisMode::kSetup) {
    values_.emplace_back(std::nullopt);
    return variable;
  }

  const std::optional<BaseFieldElement> value = value_func();
  if (!value.has_value()) {
    throw SynthesisError(
        "Assignment missing for variable " + std::to_string(variable.Index()) + ".");
  }
  values_.emplace_back(*value);
  return variable;
}

template <typename ParamsT>
std::optional<BaseFieldElement> Assembly<ParamsT>::GetValue(const Variable& variable) const {
  AssertKnown(variable);
  return values_[variable.Index()];
}

template <typename ParamsT>
void Assembly<ParamsT>::AddMainGate(const MainGate& gate) {
  ASSERT_RELEASE(
      gate.linear_terms.size() <= Params::kStateWidth,
      "Main gate has " + std::to_string(gate.linear_terms.size()) + " terms, but the width is " +
          std::to_string(Params::kStateWidth) + ".");
  ASSERT_RELEASE(
      gate.multiplication_coefficient == BaseFieldElement::Zero() || gate.linear_terms.size() >= 2,
      "The multiplication term needs variables in the first two slots.");
  for (const auto& [variable, coefficient] : gate.linear_terms) {
    (void)coefficient;
    AssertKnown(variable);
  }
  gates_.emplace_back(gate);
}

template <typename ParamsT>
void Assembly<ParamsT>::AddFifthPowerGate(const std::array<Variable, 4>& row) {
  static_assert(
      Params::kHasCustomGates && Params::kStateWidth >= 4,
      "The fifth power gate needs custom gates and at least four wires.");
  for (const Variable& variable : row) {
    AssertKnown(variable);
  }
  gates_.emplace_back(FifthPowerGate{row});
}

template <typename ParamsT>
bool Assembly<ParamsT>::IsSatisfied() const {
  ASSERT_RELEASE(
      mode_ == SynthesisMode::kProving, "Satisfiability can only be checked in proving mode.");
  for (size_t i = 0; i < gates_.size(); ++i) {
    const bool satisfied = std::visit(
        Overloaded{
            [this](const MainGate& gate) { return IsGateSatisfied(gate); },
            [this](const FifthPowerGate& gate) { return IsGateSatisfied(gate); },
        },
        gates_[i]);
    if (!satisfied) {
      LOG(ERROR) << "Gate " << i << " out of " << gates_.size() << " is not satisfied.";
      return false;
    }
  }
  return true;
}

template <typename ParamsT>
const BaseFieldElement& Assembly<ParamsT>::WitnessOf(const Variable& variable) const {
  AssertKnown(variable);
  const auto& value = values_[variable.Index()];
  ASSERT_RELEASE(
      value.has_value(), "Variable " + std::to_string(variable.Index()) + " has no witness.");
  return *value;
}

template <typename ParamsT>
bool Assembly<ParamsT>::IsGateSatisfied(const MainGate& gate) const {
  BaseFieldElement sum = gate.constant_term;
  for (const auto& [variable, coefficient] : gate.linear_terms) {
    sum += coefficient * WitnessOf(variable);
  }
  if (gate.multiplication_coefficient != BaseFieldElement::Zero()) {
    sum += gate.multiplication_coefficient * WitnessOf(gate.linear_terms[0].first) *
           WitnessOf(gate.linear_terms[1].first);
  }
  return sum == BaseFieldElement::Zero();
}

template <typename ParamsT>
bool Assembly<ParamsT>::IsGateSatisfied(const FifthPowerGate& gate) const {
  const BaseFieldElement& x = WitnessOf(gate.row[0]);
  const BaseFieldElement& x2 = WitnessOf(gate.row[1]);
  const BaseFieldElement& x4 = WitnessOf(gate.row[2]);
  const BaseFieldElement& y = WitnessOf(gate.row[3]);
  return x2 == x * x && x4 == x2 * x2 && y == x4 * x;
}

template <typename ParamsT>
void Assembly<ParamsT>::AssertKnown(const Variable& variable) const {
  ASSERT_RELEASE(
      variable.Index() < values_.size(),
      "Variable " + std::to_string(variable.Index()) + " was not allocated by this assembly.");
}

}  // namespace plonkish
