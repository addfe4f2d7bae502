// src/operations/subtract.cpp
#include "spmat/operation.hpp"
#include "spmat/operation_registry.hpp"

namespace spmat {

/**
 * @brief lhs - rhs over the union of both coordinate sets.
 */
class SubtractOperation : public IOperation {
public:
  SparseMatrix apply(const SparseMatrix& lhs,
                     const SparseMatrix& rhs) const override {
    return lhs.subtract(rhs);
  }

  const char* name() const noexcept override { return "subtract"; }
  const char* label() const noexcept override { return "subtraction"; }
  Op kind() const noexcept override { return Op::Subtract; }
};

REGISTER_OPERATION(Op::Subtract, SubtractOperation);

} // namespace spmat
