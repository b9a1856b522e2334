#include <algorithm>

#include "plonkish/constraint_system/gates.h"

namespace plonkish {

template <typename ConstraintSystemT>
Num LinearCombination::IntoNum(ConstraintSystemT* cs) const {
  constexpr size_t kWidth = ConstraintSystemT::Params::kStateWidth;
  const std::vector<TermT> terms = SimplifiedTerms();

  if (terms.empty()) {
    return Num(constant_);
  }
  if (terms.size() == 1 && terms[0].second == BaseFieldElement::One() &&
      constant_ == BaseFieldElement::Zero()) {
    return Num(terms[0].first);
  }

  std::optional<AllocatedNum> partial_sum;
  size_t n_consumed = 0;
  while (n_consumed < terms.size()) {
    // One slot is always taken by the output, and one by the previous partial sum if any.
    const size_t n_free_slots = partial_sum.has_value() ? kWidth - 2 : kWidth - 1;
    const size_t chunk_end = std::min(terms.size(), n_consumed + n_free_slots);

    MainGate gate;
    if (partial_sum.has_value()) {
      gate.linear_terms.emplace_back(partial_sum->GetVariable(), BaseFieldElement::One());
    } else {
      gate.constant_term = constant_;
    }
    for (size_t i = n_consumed; i < chunk_end; ++i) {
      gate.linear_terms.emplace_back(terms[i].first.GetVariable(), terms[i].second);
    }

    const AllocatedNum output =
        AllocatedNum::Alloc(cs, [&]() { return PartialValue(terms, chunk_end); });
    gate.linear_terms.emplace_back(output.GetVariable(), -BaseFieldElement::One());
    cs->AddMainGate(gate);

    partial_sum = output;
    n_consumed = chunk_end;
  }

  return Num(*partial_sum);
}

}  // namespace plonkish
