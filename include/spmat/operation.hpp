#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "spmat/sparse_matrix.hpp"

namespace spmat {

enum class Op { Add, Subtract, Multiply };

/// Canonical registry name: "add", "subtract" or "multiply"
const char* to_string(Op op) noexcept;

/// Every operation, in menu order
const std::vector<Op>& all_ops();

/**
 * @brief Resolve user input to an operation.
 *
 * Case-insensitive. Accepts the canonical name ("add"), the label
 * ("addition"), the menu number ("1") and the menu letter ("A").
 */
std::optional<Op> parse_op(const std::string& text);

class IOperation {
public:
  virtual ~IOperation() = default;

  /// lhs (op) rhs as a new matrix; neither operand is modified
  virtual SparseMatrix apply(const SparseMatrix& lhs,
                             const SparseMatrix& rhs) const = 0;

  /// Name used in the factory
  virtual const char* name() const noexcept = 0;

  /// Noun for messages and default file names, e.g. "addition"
  virtual const char* label() const noexcept = 0;

  virtual Op kind() const noexcept = 0;
};

/* Factory  ------------------------------------------------------------- */
std::unique_ptr<IOperation>
make_operation(const std::string& kind);

std::unique_ptr<IOperation>
make_operation(Op op);

/**
 * @brief Combine two matrices with the given operation.
 *
 * Errors raised by the operation (DimensionMismatch and its subclass)
 * propagate to the caller unchanged.
 */
SparseMatrix combine(Op op, const SparseMatrix& lhs, const SparseMatrix& rhs);

} // namespace spmat
