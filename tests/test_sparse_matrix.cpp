#include <gtest/gtest.h>
#include "spmat/errors.hpp"
#include "spmat/sparse_matrix.hpp"

#include <limits>
#include <vector>

using namespace spmat;

namespace {

SparseMatrix make(int rows, int cols, const std::vector<Entry>& entries) {
  SparseMatrix m(rows, cols);
  for (const auto& e : entries) m.set_element(e.row, e.col, e.value);
  return m;
}

} // namespace

TEST(SparseMatrixTest, DefaultConstructor) {
  SparseMatrix m;
  EXPECT_EQ(m.rows(), 0);
  EXPECT_EQ(m.cols(), 0);
  EXPECT_EQ(m.nnz(), 0u);
  EXPECT_TRUE(m.empty());
}

TEST(SparseMatrixTest, DimensionConstructor) {
  SparseMatrix m(5, 7);
  EXPECT_EQ(m.rows(), 5);
  EXPECT_EQ(m.cols(), 7);
  EXPECT_TRUE(m.empty());
  for (int i = 0; i < 5; ++i)
    for (int j = 0; j < 7; ++j)
      EXPECT_EQ(m.get_element(i, j), 0);
}

TEST(SparseMatrixTest, NegativeDimensionsRejected) {
  EXPECT_THROW(SparseMatrix(-1, 2), InvalidIndex);
  EXPECT_THROW(SparseMatrix(2, -1), InvalidIndex);
}

TEST(SparseMatrixTest, SetAndGet) {
  SparseMatrix m(3, 3);
  m.set_element(1, 2, 42);
  EXPECT_EQ(m.get_element(1, 2), 42);
  EXPECT_TRUE(m.contains(1, 2));
  EXPECT_FALSE(m.contains(2, 1));
  EXPECT_EQ(m.get_element(2, 1), 0);
  EXPECT_EQ(m.nnz(), 1u);
}

TEST(SparseMatrixTest, OverwriteKeepsPosition) {
  SparseMatrix m(3, 3);
  m.set_element(0, 0, 1);
  m.set_element(1, 1, 2);
  m.set_element(0, 0, 9);
  ASSERT_EQ(m.nnz(), 2u);
  EXPECT_EQ(m.entries()[0].row, 0);
  EXPECT_EQ(m.entries()[0].value, 9);
  EXPECT_EQ(m.entries()[1].value, 2);
}

TEST(SparseMatrixTest, SetGrowsDimensions) {
  SparseMatrix m(2, 2);
  m.set_element(4, 1, 7);
  EXPECT_EQ(m.rows(), 5);
  EXPECT_EQ(m.cols(), 2);
  m.set_element(0, 9, 1);
  EXPECT_EQ(m.rows(), 5);
  EXPECT_EQ(m.cols(), 10);
}

TEST(SparseMatrixTest, SetInsideShapeDoesNotShrinkOrGrow) {
  SparseMatrix m(10, 10);
  m.set_element(1, 1, 1);
  EXPECT_EQ(m.rows(), 10);
  EXPECT_EQ(m.cols(), 10);
}

TEST(SparseMatrixTest, StoredZeroIsKept) {
  SparseMatrix m(2, 2);
  m.set_element(0, 1, 0);
  EXPECT_TRUE(m.contains(0, 1));
  EXPECT_EQ(m.get_element(0, 1), 0);
  EXPECT_EQ(m.nnz(), 1u);
}

TEST(SparseMatrixTest, NegativeCoordinateRejected) {
  SparseMatrix m(2, 2);
  EXPECT_THROW(m.set_element(-1, 0, 1), InvalidIndex);
  EXPECT_THROW(m.set_element(0, -3, 1), InvalidIndex);
  EXPECT_TRUE(m.empty());
  EXPECT_EQ(m.rows(), 2);
  EXPECT_EQ(m.cols(), 2);
}

TEST(SparseMatrixTest, LargestCoordinateGrowsToIntMax) {
  const int big = std::numeric_limits<int>::max() - 1;
  SparseMatrix m(1, 1);
  m.set_element(big, big, 1);
  EXPECT_EQ(m.rows(), std::numeric_limits<int>::max());
  EXPECT_EQ(m.cols(), std::numeric_limits<int>::max());
  EXPECT_EQ(m.get_element(big, big), 1);
}

TEST(SparseMatrixTest, IntMaxCoordinateRejected) {
  const int max = std::numeric_limits<int>::max();
  SparseMatrix m(2, 2);
  EXPECT_THROW(m.set_element(max, 0, 1), InvalidIndex);
  EXPECT_THROW(m.set_element(0, max, 1), InvalidIndex);
  EXPECT_TRUE(m.empty());
  EXPECT_EQ(m.rows(), 2);
  EXPECT_EQ(m.cols(), 2);
}

TEST(SparseMatrixTest, GetOutsideShapeReadsZero) {
  SparseMatrix m(2, 2);
  EXPECT_EQ(m.get_element(100, 100), 0);
  EXPECT_EQ(m.get_element(-1, 0), 0);
  EXPECT_EQ(m.rows(), 2);
}

TEST(SparseMatrixTest, EqualityIgnoresOrder) {
  auto a = make(2, 2, {{0, 0, 1}, {1, 1, 2}});
  auto b = make(2, 2, {{1, 1, 2}, {0, 0, 1}});
  EXPECT_EQ(a, b);
  b.set_element(1, 1, 3);
  EXPECT_NE(a, b);
  EXPECT_NE(a, make(3, 2, {{0, 0, 1}, {1, 1, 2}}));
}

TEST(SparseMatrixTest, AdditionScenario) {
  auto a = make(2, 2, {{0, 0, 1}, {1, 1, 2}});
  auto b = make(2, 2, {{0, 0, 3}, {0, 1, 4}});
  auto r = a.add(b);
  EXPECT_EQ(r.rows(), 2);
  EXPECT_EQ(r.cols(), 2);
  EXPECT_EQ(r.nnz(), 3u);
  EXPECT_EQ(r.get_element(0, 0), 4);
  EXPECT_EQ(r.get_element(1, 1), 2);
  EXPECT_EQ(r.get_element(0, 1), 4);

  // operands untouched
  EXPECT_EQ(a.get_element(0, 0), 1);
  EXPECT_EQ(b.get_element(0, 0), 3);
}

TEST(SparseMatrixTest, AdditionOrderIsLhsThenRhsOnly) {
  auto a = make(2, 2, {{0, 0, 1}, {1, 1, 2}});
  auto b = make(2, 2, {{0, 0, 3}, {0, 1, 4}});
  auto r = a.add(b);
  ASSERT_EQ(r.entries().size(), 3u);
  EXPECT_EQ(r.entries()[0].row, 0); EXPECT_EQ(r.entries()[0].col, 0);
  EXPECT_EQ(r.entries()[1].row, 1); EXPECT_EQ(r.entries()[1].col, 1);
  EXPECT_EQ(r.entries()[2].row, 0); EXPECT_EQ(r.entries()[2].col, 1);
}

TEST(SparseMatrixTest, AdditiveIdentity) {
  auto a = make(3, 4, {{0, 3, 5}, {2, 1, -7}, {1, 1, 9}});
  SparseMatrix zero(3, 4);
  EXPECT_EQ(a.add(zero), a);
  EXPECT_EQ(zero.add(a), a);
}

TEST(SparseMatrixTest, AdditionCommutes) {
  auto a = make(3, 3, {{0, 0, 1}, {2, 2, 5}, {1, 0, -4}});
  auto b = make(3, 3, {{2, 2, -5}, {0, 1, 8}, {1, 0, 4}});
  EXPECT_EQ(a.add(b), b.add(a));
}

TEST(SparseMatrixTest, AdditionShapeMismatch) {
  SparseMatrix a(2, 3), b(3, 2);
  EXPECT_THROW(a.add(b), DimensionMismatch);
  EXPECT_THROW(a.add(SparseMatrix(2, 4)), DimensionMismatch);
}

TEST(SparseMatrixTest, CancellationKeepsZeroAndShape) {
  auto a = make(2, 2, {{1, 1, 5}});
  auto b = make(2, 2, {{1, 1, -5}});
  auto r = a.add(b);
  EXPECT_EQ(r.get_element(1, 1), 0);
  EXPECT_EQ(r.rows(), 2);
  EXPECT_EQ(r.cols(), 2);

  auto d = a.subtract(a);
  EXPECT_EQ(d.get_element(1, 1), 0);
  EXPECT_EQ(d.rows(), 2);
  EXPECT_EQ(d.cols(), 2);
}

TEST(SparseMatrixTest, SubtractionKeepsMinuendOnlyEntries) {
  auto a = make(3, 3, {{0, 0, 10}, {2, 2, 6}});
  auto b = make(3, 3, {{0, 0, 4}, {1, 0, 3}});
  auto r = a.subtract(b);
  EXPECT_EQ(r.rows(), 3);
  EXPECT_EQ(r.cols(), 3);
  EXPECT_EQ(r.get_element(0, 0), 6);
  EXPECT_EQ(r.get_element(1, 0), -3);
  EXPECT_TRUE(r.contains(2, 2));
  EXPECT_EQ(r.get_element(2, 2), 6);
  EXPECT_EQ(r.nnz(), 3u);
}

TEST(SparseMatrixTest, SubtractionIsAdditionOfNegation) {
  auto a = make(2, 3, {{0, 0, 1}, {1, 2, 8}});
  auto b = make(2, 3, {{1, 2, 3}, {0, 1, 2}});
  SparseMatrix neg(2, 3);
  for (const auto& e : b.entries()) neg.set_element(e.row, e.col, -e.value);
  EXPECT_EQ(a.subtract(b), a.add(neg));
}

TEST(SparseMatrixTest, SubtractionShapeMismatch) {
  SparseMatrix a(2, 2), b(2, 3);
  EXPECT_THROW(a.subtract(b), DimensionMismatch);
}

TEST(SparseMatrixTest, MultiplicationScenario) {
  auto a = make(1, 2, {{0, 0, 2}, {0, 1, 3}});
  auto b = make(2, 1, {{0, 0, 5}, {1, 0, 7}});
  auto r = a.multiply(b);
  EXPECT_EQ(r.rows(), 1);
  EXPECT_EQ(r.cols(), 1);
  EXPECT_EQ(r.nnz(), 1u);
  EXPECT_EQ(r.get_element(0, 0), 31);
}

TEST(SparseMatrixTest, MultiplicationShape) {
  auto a = make(3, 4, {{2, 3, 1}});
  auto b = make(4, 5, {{3, 4, 2}});
  auto r = a.multiply(b);
  EXPECT_EQ(r.rows(), 3);
  EXPECT_EQ(r.cols(), 5);
  EXPECT_EQ(r.get_element(2, 4), 2);
}

TEST(SparseMatrixTest, MultiplicationMismatch) {
  SparseMatrix a(2, 3), b(2, 3);
  EXPECT_THROW(a.multiply(b), DimensionMismatchForMultiplication);
  // also catchable as the general shape error
  EXPECT_THROW(a.multiply(b), DimensionMismatch);
}

TEST(SparseMatrixTest, MultiplicationMatchesDense) {
  // [1 0 2]   [0 3]   [ 8 3]
  // [0 4 0] x [1 0] = [ 4 0]
  //           [4 0]
  auto a = make(2, 3, {{0, 0, 1}, {0, 2, 2}, {1, 1, 4}});
  auto b = make(3, 2, {{0, 1, 3}, {1, 0, 1}, {2, 0, 4}});
  auto r = a.multiply(b);
  EXPECT_EQ(r.get_element(0, 0), 8);
  EXPECT_EQ(r.get_element(0, 1), 3);
  EXPECT_EQ(r.get_element(1, 0), 4);
  EXPECT_EQ(r.get_element(1, 1), 0);
  EXPECT_FALSE(r.contains(1, 1));
}

TEST(SparseMatrixTest, MultiplicationByEmpty) {
  auto a = make(2, 2, {{0, 0, 1}, {1, 1, 1}});
  SparseMatrix z(2, 3);
  auto r = a.multiply(z);
  EXPECT_TRUE(r.empty());
  EXPECT_EQ(r.rows(), 2);
  EXPECT_EQ(r.cols(), 3);
}

TEST(SparseMatrixTest, MultiplicationNegativeValues) {
  auto a = make(2, 2, {{0, 0, -2}, {1, 0, 3}});
  auto b = make(2, 2, {{0, 0, 4}, {0, 1, -1}});
  auto r = a.multiply(b);
  EXPECT_EQ(r.get_element(0, 0), -8);
  EXPECT_EQ(r.get_element(0, 1), 2);
  EXPECT_EQ(r.get_element(1, 0), 12);
  EXPECT_EQ(r.get_element(1, 1), -3);
}

TEST(SparseMatrixTest, ArithmeticAtValueLimits) {
  const value_t max = std::numeric_limits<value_t>::max();
  const value_t min = std::numeric_limits<value_t>::min();

  auto a = make(1, 1, {{0, 0, max - 1}});
  auto one = make(1, 1, {{0, 0, 1}});
  EXPECT_EQ(a.add(one).get_element(0, 0), max);

  auto lo = make(1, 1, {{0, 0, min + 1}});
  EXPECT_EQ(lo.subtract(one).get_element(0, 0), min);

  auto m = make(1, 1, {{0, 0, max}});
  EXPECT_EQ(m.multiply(one).get_element(0, 0), max);
}

TEST(SparseMatrixTest, AdditionOverflowThrows) {
  const value_t max = std::numeric_limits<value_t>::max();
  auto a = make(1, 2, {{0, 0, max}, {0, 1, 1}});
  auto b = make(1, 2, {{0, 0, max}});
  EXPECT_THROW(a.add(b), OverflowError);
  EXPECT_THROW(a.add(make(1, 2, {{0, 0, 1}})), OverflowError);
  // operands untouched
  EXPECT_EQ(a.get_element(0, 0), max);
  EXPECT_EQ(b.get_element(0, 0), max);
}

TEST(SparseMatrixTest, SubtractionOverflowThrows) {
  const value_t max = std::numeric_limits<value_t>::max();
  const value_t min = std::numeric_limits<value_t>::min();
  auto lo = make(1, 1, {{0, 0, min}});
  EXPECT_THROW(lo.subtract(make(1, 1, {{0, 0, 1}})), OverflowError);
  // absent minuend cell reads 0, and 0 - LLONG_MIN does not fit
  EXPECT_THROW(SparseMatrix(1, 1).subtract(lo), OverflowError);
  auto hi = make(1, 1, {{0, 0, max}});
  EXPECT_THROW(hi.subtract(make(1, 1, {{0, 0, -1}})), OverflowError);
}

TEST(SparseMatrixTest, MultiplicationOverflowThrows) {
  auto a = make(1, 1, {{0, 0, 9000000000000LL}});
  EXPECT_THROW(a.multiply(a), OverflowError);

  // each product fits, their sum does not
  const value_t half = std::numeric_limits<value_t>::max() / 2 + 1;
  auto row = make(1, 2, {{0, 0, half}, {0, 1, half}});
  auto col = make(2, 1, {{0, 0, 1}, {1, 0, 1}});
  EXPECT_THROW(row.multiply(col), OverflowError);
}

TEST(SparseMatrixTest, OverflowIsAnError) {
  auto a = make(1, 1, {{0, 0, std::numeric_limits<value_t>::max()}});
  EXPECT_THROW(a.add(a), Error);
}
