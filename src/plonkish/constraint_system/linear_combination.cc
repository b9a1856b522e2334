#include "plonkish/constraint_system/linear_combination.h"

#include <algorithm>

namespace plonkish {

void LinearCombination::AddAssignNumberWithCoeff(
    const Num& number, const BaseFieldElement& coeff) {
  if (number.IsConstant()) {
    constant_ += number.AsConstant() * coeff;
    return;
  }
  AddAssignVariableWithCoeff(number.AsVariable(), coeff);
}

std::optional<BaseFieldElement> LinearCombination::GetValue() const {
  return PartialValue(terms_, terms_.size());
}

std::vector<LinearCombination::TermT> LinearCombination::SimplifiedTerms() const {
  std::vector<TermT> simplified;
  simplified.reserve(terms_.size());
  for (const TermT& term : terms_) {
    auto it = std::find_if(simplified.begin(), simplified.end(), [&term](const TermT& existing) {
      return existing.first.GetVariable() == term.first.GetVariable();
    });
    if (it == simplified.end()) {
      simplified.push_back(term);
    } else {
      it->second += term.second;
    }
  }

  simplified.erase(
      std::remove_if(
          simplified.begin(), simplified.end(),
          [](const TermT& term) { return term.second == BaseFieldElement::Zero(); }),
      simplified.end());
  return simplified;
}

std::optional<BaseFieldElement> LinearCombination::PartialValue(
    const std::vector<TermT>& terms, size_t n_terms) const {
  BaseFieldElement sum = constant_;
  for (size_t i = 0; i < n_terms; ++i) {
    const std::optional<BaseFieldElement>& value = terms[i].first.GetValue();
    if (!value.has_value()) {
      return std::nullopt;
    }
    sum += terms[i].second * *value;
  }
  return sum;
}

}  // namespace plonkish
