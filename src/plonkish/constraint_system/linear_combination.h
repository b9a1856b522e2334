#ifndef PLONKISH_CONSTRAINT_SYSTEM_LINEAR_COMBINATION_H_
#define PLONKISH_CONSTRAINT_SYSTEM_LINEAR_COMBINATION_H_

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "plonkish/algebra/fields/base_field_element.h"
#include "plonkish/constraint_system/allocated_num.h"

namespace plonkish {

/*
  An affine expression c + sum(coeff_i * v_i) over circuit variables, not yet bound to a wire.
  Adding terms is free; a gate is paid for only when IntoNum() forces the expression into a single
  variable.
*/
class LinearCombination {
 public:
  using TermT = std::pair<AllocatedNum, BaseFieldElement>;

  /*
    Constructs the zero expression.
  */
  LinearCombination() : constant_(BaseFieldElement::Zero()) {}

  void AddAssignConstant(const BaseFieldElement& constant) { constant_ += constant; }

  void AddAssignVariableWithCoeff(const AllocatedNum& variable, const BaseFieldElement& coeff) {
    terms_.emplace_back(variable, coeff);
  }

  void AddAssignNumberWithCoeff(const Num& number, const BaseFieldElement& coeff);

  /*
    Returns the value of the expression, or std::nullopt if a variable has no witness.
  */
  std::optional<BaseFieldElement> GetValue() const;

  const BaseFieldElement& ConstantTerm() const { return constant_; }
  size_t NumTerms() const { return terms_.size(); }

  /*
    Forces the expression into a Num:
    * No terms: the constant itself, no gate.
    * A single variable with coefficient one and no constant: that variable, no gate.
    * Otherwise a new variable constrained to equal the expression. The first main gate takes up
      to kStateWidth - 1 terms, every further gate carries the partial sum and up to
      kStateWidth - 2 more terms.
    Repeated variables are merged before any gate is emitted.
  */
  template <typename ConstraintSystemT>
  Num IntoNum(ConstraintSystemT* cs) const;

 private:
  /*
    Returns terms_ with repeated variables merged and zero coefficients dropped, in order of first
    appearance.
  */
  std::vector<TermT> SimplifiedTerms() const;

  /*
    Returns constant_ + the sum of the first n_terms of terms, or std::nullopt if one of them has no
    witness.
  */
  std::optional<BaseFieldElement> PartialValue(
      const std::vector<TermT>& terms, size_t n_terms) const;

  BaseFieldElement constant_;
  std::vector<TermT> terms_;
};

}  // namespace plonkish

#include "plonkish/constraint_system/linear_combination.inl"

#endif  // PLONKISH_CONSTRAINT_SYSTEM_LINEAR_COMBINATION_H_
