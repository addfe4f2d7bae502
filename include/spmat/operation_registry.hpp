#pragma once
#include "spmat/operation.hpp"
#include <cstddef>
#include <memory>

namespace spmat::detail {

/// Builds a fresh instance of one operation
using operation_maker = std::unique_ptr<IOperation>(*)();

/// Slot of @p op in the operation table
constexpr std::size_t slot_of(Op op) noexcept { return static_cast<std::size_t>(op); }

/// Number of slots: one per Op enumerator
constexpr std::size_t kOperationSlots = slot_of(Op::Multiply) + 1;

/**
 * @brief Static object that fills the table slot of one Op during static
 *        initialization (table lives in operation_factory.cpp).
 *
 * A later registration for the same Op replaces the earlier one.
 */
struct OperationRegistration {
  OperationRegistration(Op kind, operation_maker make);
};

} // namespace spmat::detail

/// Binds the operation class TYPE to the enumerator KIND
#define REGISTER_OPERATION(KIND, TYPE)                                      \
  static const ::spmat::detail::OperationRegistration registration_##TYPE{ \
      KIND, []() -> std::unique_ptr<::spmat::IOperation> {                  \
        return std::make_unique<TYPE>();                                    \
      }}
