#ifndef PLONKISH_CONSTRAINT_SYSTEM_GATES_H_
#define PLONKISH_CONSTRAINT_SYSTEM_GATES_H_

#include <array>
#include <utility>
#include <variant>
#include <vector>

#include "plonkish/algebra/fields/base_field_element.h"
#include "plonkish/constraint_system/variable.h"

namespace plonkish {

/*
  The main gate of width w:
    q_0 * v_0 + ... + q_{w-1} * v_{w-1} + q_m * v_0 * v_1 + q_c = 0.
  linear_terms holds at most w (variable, coefficient) pairs, slots not listed are filled with the
  dummy variable and a zero coefficient.
*/
struct MainGate {
  std::vector<std::pair<Variable, BaseFieldElement>> linear_terms;
  BaseFieldElement multiplication_coefficient = BaseFieldElement::Zero();
  BaseFieldElement constant_term = BaseFieldElement::Zero();
};

/*
  The custom degree 5 gate, placed on a single row (x, x2, x4, y) and checking:
    x2 = x * x, x4 = x2 * x2, y = x4 * x.
  Each relation is of degree 2, together they enforce y = x^5.
*/
struct FifthPowerGate {
  std::array<Variable, 4> row;
};

using Gate = std::variant<MainGate, FifthPowerGate>;

}  // namespace plonkish

#endif  // PLONKISH_CONSTRAINT_SYSTEM_GATES_H_
