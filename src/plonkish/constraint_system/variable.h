#ifndef PLONKISH_CONSTRAINT_SYSTEM_VARIABLE_H_
#define PLONKISH_CONSTRAINT_SYSTEM_VARIABLE_H_

#include <cstddef>

namespace plonkish {

/*
  A handle to a wire of a constraint system. The handle is only meaningful for the constraint system
  that allocated it.
*/
class Variable {
 public:
  explicit constexpr Variable(size_t index) : index_(index) {}

  constexpr size_t Index() const { return index_; }

  constexpr bool operator==(const Variable& other) const { return index_ == other.index_; }
  constexpr bool operator!=(const Variable& other) const { return !(*this == other); }

 private:
  size_t index_;
};

}  // namespace plonkish

#endif  // PLONKISH_CONSTRAINT_SYSTEM_VARIABLE_H_
