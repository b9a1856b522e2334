#ifndef PLONKISH_CONSTRAINT_SYSTEM_FIFTH_POWER_GATE_H_
#define PLONKISH_CONSTRAINT_SYSTEM_FIFTH_POWER_GATE_H_

#include <optional>

#include "plonkish/algebra/fields/base_field_element.h"
#include "plonkish/constraint_system/allocated_num.h"

namespace plonkish {

/*
  Constrains y = base^5 with a single FifthPowerGate row (base, base^2, base^4, y) and returns y.
  If expected_output is given it is used as y, so the gate checks that base^5 equals an existing
  variable; otherwise y is allocated with witness base^5.
  ConstraintSystemT must support custom gates and have at least four wires.
*/
template <typename ConstraintSystemT>
AllocatedNum ApplyFifthPower(
    ConstraintSystemT* cs, const AllocatedNum& base,
    const std::optional<AllocatedNum>& expected_output) {
  const auto square = [](const std::optional<BaseFieldElement>& value) {
    return value.has_value() ? std::optional<BaseFieldElement>(*value * *value) : std::nullopt;
  };

  const AllocatedNum base_squared =
      AllocatedNum::Alloc(cs, [&]() { return square(base.GetValue()); });
  const AllocatedNum base_fourth =
      AllocatedNum::Alloc(cs, [&]() { return square(base_squared.GetValue()); });

  std::optional<AllocatedNum> output = expected_output;
  if (!output.has_value()) {
    output = AllocatedNum::Alloc(cs, [&]() -> std::optional<BaseFieldElement> {
      if (!base.GetValue().has_value() || !base_fourth.GetValue().has_value()) {
        return std::nullopt;
      }
      return *base_fourth.GetValue() * *base.GetValue();
    });
  }

  cs->AddFifthPowerGate({base.GetVariable(), base_squared.GetVariable(),
                         base_fourth.GetVariable(), output->GetVariable()});
  return *output;
}

}  // namespace plonkish

#endif  // PLONKISH_CONSTRAINT_SYSTEM_FIFTH_POWER_GATE_H_
