#ifndef PLONKISH_UTILS_OVERLOADED_H_
#define PLONKISH_UTILS_OVERLOADED_H_

namespace plonkish {

/*
  Builds a visitor for std::visit out of a set of lambdas, one per alternative. A missing
  alternative is a compilation error, which makes every match exhaustive:
    std::visit(Overloaded{[](const A& a) { ... }, [](const B& b) { ... }}, variant);
*/
template <typename... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

template <typename... Ts>
Overloaded(Ts...)->Overloaded<Ts...>;

}  // namespace plonkish

#endif  // PLONKISH_UTILS_OVERLOADED_H_
