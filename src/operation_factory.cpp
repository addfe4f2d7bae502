#include "spmat/operation.hpp"
#include "spmat/operation_registry.hpp"
#include <array>
#include <cctype>
#include <stdexcept>
#include <unordered_map>

namespace spmat::detail {

// slot_of(op) -> maker, empty until the operation's translation unit has
// run its REGISTER_OPERATION
static std::array<operation_maker, kOperationSlots>& operation_table()
{
  static std::array<operation_maker, kOperationSlots> table{};
  return table;
}

OperationRegistration::OperationRegistration(Op kind, operation_maker make)
{
  operation_table()[slot_of(kind)] = make;
}

} // namespace spmat::detail

namespace spmat {

const char* to_string(Op op) noexcept
{
  switch (op) {
    case Op::Add:      return "add";
    case Op::Subtract: return "subtract";
    case Op::Multiply: return "multiply";
  }
  return "unknown";
}

const std::vector<Op>& all_ops()
{
  static const std::vector<Op> ops{Op::Add, Op::Subtract, Op::Multiply};
  return ops;
}

std::optional<Op> parse_op(const std::string& text)
{
  auto b = text.find_first_not_of(" \t\r\n\v\f");
  if (b == std::string::npos)
    return std::nullopt;
  auto e = text.find_last_not_of(" \t\r\n\v\f");

  std::string s;
  for (char ch : text.substr(b, e - b + 1))
    s += static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));

  static const std::unordered_map<std::string, Op> aliases{
    {"add",         Op::Add},      {"addition",       Op::Add},
    {"1",           Op::Add},      {"a",              Op::Add},
    {"subtract",    Op::Subtract}, {"subtraction",    Op::Subtract},
    {"2",           Op::Subtract}, {"b",              Op::Subtract},
    {"multiply",    Op::Multiply}, {"multiplication", Op::Multiply},
    {"3",           Op::Multiply}, {"c",              Op::Multiply},
  };
  auto it = aliases.find(s);
  if (it == aliases.end())
    return std::nullopt;
  return it->second;
}

/* -------------------------------------------------------------------- */
/*  Public factory                                                      */
/* -------------------------------------------------------------------- */
std::unique_ptr<IOperation> make_operation(Op op)
{
  auto make = detail::operation_table()[detail::slot_of(op)];
  if (!make)
    throw std::runtime_error(std::string("operation not registered: ") + to_string(op));
  return make();
}

// Canonical names only; parse_op() handles aliases.
std::unique_ptr<IOperation> make_operation(const std::string& kind)
{
  for (Op op : all_ops())
    if (kind == to_string(op))
      return make_operation(op);
  throw std::runtime_error("unknown operation: " + kind);
}

SparseMatrix combine(Op op, const SparseMatrix& lhs, const SparseMatrix& rhs)
{
  return make_operation(op)->apply(lhs, rhs);
}

} // namespace spmat
