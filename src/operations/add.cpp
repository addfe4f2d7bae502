#include "spmat/operation.hpp"
#include "spmat/operation_registry.hpp"

namespace spmat {

/**
 * @brief Element-wise sum; both operands must have the same shape.
 */
class AddOperation : public IOperation {
public:
  SparseMatrix apply(const SparseMatrix& lhs,
                     const SparseMatrix& rhs) const override {
    return lhs.add(rhs);
  }

  const char* name() const noexcept override { return "add"; }
  const char* label() const noexcept override { return "addition"; }
  Op kind() const noexcept override { return Op::Add; }
};

// Fills the Op::Add slot
REGISTER_OPERATION(Op::Add, AddOperation);

} // namespace spmat
