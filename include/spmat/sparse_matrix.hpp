#pragma once

#include <cstddef>
#include <functional>
#include <unordered_map>
#include <vector>

namespace spmat {

using value_t = long long;

/// (row, col) key of a stored entry, 0-based
struct Coord {
  int row;
  int col;

  bool operator==(const Coord& o) const noexcept {
    return row == o.row && col == o.col;
  }
  bool operator!=(const Coord& o) const noexcept { return !(*this == o); }
};

struct CoordHash {
  std::size_t operator()(const Coord& c) const noexcept {
    std::size_t h = std::hash<int>{}(c.row);
    return h ^ (std::hash<int>{}(c.col) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
  }
};

/// One stored (row, col, value) triple
struct Entry {
  int     row;
  int     col;
  value_t value;
};

/**
 * @brief Sparse integer matrix in coordinate form.
 *
 * Only stored entries are kept; every other cell reads as 0. Entries iterate
 * in insertion order (an overwrite keeps the original position), which is the
 * order used when the matrix is written out.
 *
 * Declared dimensions are a lower bound: set_element() grows rows/cols so that
 * every stored coordinate fits.
 */
class SparseMatrix {
public:
  SparseMatrix() = default;

  /**
   * @brief Empty matrix with the given declared dimensions.
   * @throws InvalidIndex if rows or cols is negative
   */
  SparseMatrix(int rows, int cols);

  int rows() const noexcept { return nrows_; }
  int cols() const noexcept { return ncols_; }

  /// number of stored entries (stored zeros included)
  std::size_t nnz() const noexcept { return entries_.size(); }

  [[nodiscard]]
  bool empty() const noexcept { return entries_.empty(); }

  /// Stored entries in insertion order
  const std::vector<Entry>& entries() const noexcept { return entries_; }

  /**
   * @brief Insert or overwrite the value at (row, col).
   *
   * Grows rows() to row+1 / cols() to col+1 when the coordinate lies outside
   * the declared shape. A value of 0 is stored as given.
   *
   * @throws InvalidIndex on a negative coordinate or one equal to INT_MAX;
   *         the matrix is unchanged
   */
  void set_element(int row, int col, value_t value);

  /// Stored value at (row, col), or 0 if nothing is stored there.
  value_t get_element(int row, int col) const noexcept;

  bool contains(int row, int col) const noexcept;

  /**
   * @brief Element-wise sum.
   * @throws DimensionMismatch unless both shapes are identical
   * @throws OverflowError if a sum leaves the range of value_t
   */
  SparseMatrix add(const SparseMatrix& other) const;

  /**
   * @brief Element-wise difference this - other.
   *
   * Coordinates stored only in this matrix are carried over unchanged, so the
   * result holds the union of both coordinate sets.
   *
   * @throws DimensionMismatch unless both shapes are identical
   * @throws OverflowError if a difference leaves the range of value_t
   */
  SparseMatrix subtract(const SparseMatrix& other) const;

  /**
   * @brief Matrix product this * other, shape rows() x other.cols().
   * @throws DimensionMismatchForMultiplication if cols() != other.rows()
   * @throws OverflowError if a product or partial sum leaves the range of value_t
   */
  SparseMatrix multiply(const SparseMatrix& other) const;

  /// Same shape and same entry mapping; insertion order is ignored.
  bool operator==(const SparseMatrix& other) const;
  bool operator!=(const SparseMatrix& other) const { return !(*this == other); }

private:
  void require_same_shape(const SparseMatrix& other, const char* op) const;

  int                                             nrows_ = 0;
  int                                             ncols_ = 0;
  std::vector<Entry>                              entries_;
  std::unordered_map<Coord, std::size_t, CoordHash> index_;   ///< coord -> position in entries_
};

} // namespace spmat
