#ifndef PLONKISH_CONSTRAINT_SYSTEM_ALLOCATED_NUM_H_
#define PLONKISH_CONSTRAINT_SYSTEM_ALLOCATED_NUM_H_

#include <optional>
#include <variant>

#include "plonkish/algebra/fields/base_field_element.h"
#include "plonkish/constraint_system/variable.h"
#include "plonkish/error_handling/error_handling.h"

namespace plonkish {

/*
  A circuit variable together with its witness (std::nullopt when synthesizing without
  witnesses).
*/
class AllocatedNum {
 public:
  AllocatedNum(const Variable& variable, const std::optional<BaseFieldElement>& value)
      : variable_(variable), value_(value) {}

  /*
    Allocates a new variable in cs. value_func returns std::optional<BaseFieldElement>, it is only
    invoked when cs computes witnesses.
  */
  template <typename ConstraintSystemT, typename ValueFunc>
  static AllocatedNum Alloc(ConstraintSystemT* cs, const ValueFunc& value_func) {
    std::optional<BaseFieldElement> value;
    const Variable variable = cs->Alloc([&value, &value_func]() {
      value = value_func();
      return value;
    });
    return AllocatedNum(variable, value);
  }

  const Variable& GetVariable() const { return variable_; }
  const std::optional<BaseFieldElement>& GetValue() const { return value_; }

 private:
  Variable variable_;
  std::optional<BaseFieldElement> value_;
};

/*
  A value that is either a constant known while building the circuit, or a circuit variable.
  Operations on a Num evaluate constants directly and only emit constraints for variables.
*/
class Num {
 public:
  explicit Num(const BaseFieldElement& constant) : value_(constant) {}
  explicit Num(const AllocatedNum& variable) : value_(variable) {}

  bool IsConstant() const { return std::holds_alternative<BaseFieldElement>(value_); }

  const BaseFieldElement& AsConstant() const {
    ASSERT_RELEASE(IsConstant(), "Num holds a variable, not a constant.");
    return std::get<BaseFieldElement>(value_);
  }

  const AllocatedNum& AsVariable() const {
    ASSERT_RELEASE(!IsConstant(), "Num holds a constant, not a variable.");
    return std::get<AllocatedNum>(value_);
  }

  std::optional<BaseFieldElement> GetValue() const {
    if (IsConstant()) {
      return AsConstant();
    }
    return AsVariable().GetValue();
  }

 private:
  std::variant<BaseFieldElement, AllocatedNum> value_;
};

}  // namespace plonkish

#endif  // PLONKISH_CONSTRAINT_SYSTEM_ALLOCATED_NUM_H_
