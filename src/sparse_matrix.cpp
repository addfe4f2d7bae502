#include "spmat/sparse_matrix.hpp"
#include "spmat/errors.hpp"

#include <limits>
#include <string>
#include <unordered_map>
#include <vector>

namespace spmat {

static std::string shape_str(const SparseMatrix& m) {
  return std::to_string(m.rows()) + "x" + std::to_string(m.cols());
}

static value_t checked_add(value_t a, value_t b) {
  value_t r;
  if (__builtin_add_overflow(a, b, &r))
    throw OverflowError("integer overflow: " + std::to_string(a) + " + " + std::to_string(b));
  return r;
}

static value_t checked_sub(value_t a, value_t b) {
  value_t r;
  if (__builtin_sub_overflow(a, b, &r))
    throw OverflowError("integer overflow: " + std::to_string(a) + " - " + std::to_string(b));
  return r;
}

static value_t checked_mul(value_t a, value_t b) {
  value_t r;
  if (__builtin_mul_overflow(a, b, &r))
    throw OverflowError("integer overflow: " + std::to_string(a) + " * " + std::to_string(b));
  return r;
}

SparseMatrix::SparseMatrix(int rows, int cols) {
  if (rows < 0 || cols < 0)
    throw InvalidIndex("negative matrix dimensions: " +
                       std::to_string(rows) + "x" + std::to_string(cols));
  nrows_ = rows;
  ncols_ = cols;
}

void SparseMatrix::set_element(int row, int col, value_t value) {
  if (row < 0 || col < 0)
    throw InvalidIndex("negative coordinate (" + std::to_string(row) + ", " +
                       std::to_string(col) + ")");
  // row + 1 / col + 1 must still be a valid dimension
  if (row == std::numeric_limits<int>::max() || col == std::numeric_limits<int>::max())
    throw InvalidIndex("coordinate out of range (" + std::to_string(row) + ", " +
                       std::to_string(col) + ")");

  if (row >= nrows_) nrows_ = row + 1;
  if (col >= ncols_) ncols_ = col + 1;

  auto it = index_.find(Coord{row, col});
  if (it != index_.end()) {
    entries_[it->second].value = value;
    return;
  }
  index_.emplace(Coord{row, col}, entries_.size());
  entries_.push_back(Entry{row, col, value});
}

value_t SparseMatrix::get_element(int row, int col) const noexcept {
  auto it = index_.find(Coord{row, col});
  return it == index_.end() ? 0 : entries_[it->second].value;
}

bool SparseMatrix::contains(int row, int col) const noexcept {
  return index_.count(Coord{row, col}) != 0;
}

void SparseMatrix::require_same_shape(const SparseMatrix& other, const char* op) const {
  if (nrows_ != other.nrows_ || ncols_ != other.ncols_)
    throw DimensionMismatch(std::string("cannot ") + op +
                            " matrices with different dimensions: " +
                            shape_str(*this) + " vs " + shape_str(other));
}

SparseMatrix SparseMatrix::add(const SparseMatrix& other) const {
  require_same_shape(other, "add");

  SparseMatrix result = *this;
  for (const auto& e : other.entries_)
    result.set_element(e.row, e.col, checked_add(result.get_element(e.row, e.col), e.value));
  return result;
}

SparseMatrix SparseMatrix::subtract(const SparseMatrix& other) const {
  require_same_shape(other, "subtract");

  // start from every entry of the minuend, then fold in the subtrahend
  SparseMatrix result = *this;
  for (const auto& e : other.entries_)
    result.set_element(e.row, e.col, checked_sub(get_element(e.row, e.col), e.value));
  return result;
}

SparseMatrix SparseMatrix::multiply(const SparseMatrix& other) const {
  if (ncols_ != other.nrows_)
    throw DimensionMismatchForMultiplication(
      "cannot multiply " + shape_str(*this) + " by " + shape_str(other) +
      ": the number of columns in the first matrix must equal the number of "
      "rows in the second");

  SparseMatrix result(nrows_, other.ncols_);

  // rhs entries bucketed by row, each bucket in rhs insertion order
  std::unordered_map<int, std::vector<const Entry*>> rhs_rows;
  rhs_rows.reserve(other.entries_.size());
  for (const auto& e : other.entries_)
    rhs_rows[e.row].push_back(&e);

  for (const auto& a : entries_) {
    auto it = rhs_rows.find(a.col);
    if (it == rhs_rows.end()) continue;
    for (const Entry* b : it->second)
      result.set_element(a.row, b->col,
                         checked_add(result.get_element(a.row, b->col),
                                     checked_mul(a.value, b->value)));
  }
  return result;
}

bool SparseMatrix::operator==(const SparseMatrix& other) const {
  if (nrows_ != other.nrows_ || ncols_ != other.ncols_) return false;
  if (entries_.size() != other.entries_.size()) return false;
  for (const auto& e : entries_) {
    auto it = other.index_.find(Coord{e.row, e.col});
    if (it == other.index_.end() || other.entries_[it->second].value != e.value)
      return false;
  }
  return true;
}

} // namespace spmat
