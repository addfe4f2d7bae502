#include "spmat/operation.hpp"
#include "spmat/operation_registry.hpp"

namespace spmat {

/**
 * @brief Matrix product; lhs.cols() must equal rhs.rows().
 */
class MultiplyOperation : public IOperation {
public:
  SparseMatrix apply(const SparseMatrix& lhs,
                     const SparseMatrix& rhs) const override {
    return lhs.multiply(rhs);
  }

  const char* name() const noexcept override {
    return "multiply";
  }
  const char* label() const noexcept override {
    return "multiplication";
  }
  Op kind() const noexcept override { return Op::Multiply; }
};

// fills the Op::Multiply slot
REGISTER_OPERATION(Op::Multiply, MultiplyOperation);

} // namespace spmat
