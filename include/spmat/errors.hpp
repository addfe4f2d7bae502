#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace spmat {

/**
 * @brief Root of every error thrown by the spmat library.
 */
class Error : public std::runtime_error {
public:
  explicit Error(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief A matrix file could not be opened, read or written.
 */
class IOError : public Error {
public:
  IOError(const std::string& what, std::string path)
    : Error(what), path_(std::move(path)) {}

  /// Path that failed
  const std::string& path() const noexcept { return path_; }

private:
  std::string path_;
};

/**
 * @brief Malformed matrix text: bad header, bad dimension or bad entry line.
 */
class FormatError : public Error {
public:
  explicit FormatError(const std::string& what, int line = 0)
    : Error(what), line_(line) {}

  /// 1-based line number in the input, 0 if the error is not tied to a line
  int line() const noexcept { return line_; }

private:
  int line_;
};

/**
 * @brief Operand shapes differ for an element-wise operation.
 */
class DimensionMismatch : public Error {
public:
  explicit DimensionMismatch(const std::string& what) : Error(what) {}
};

/**
 * @brief Inner dimensions differ for a matrix product (lhs.cols != rhs.rows).
 */
class DimensionMismatchForMultiplication : public DimensionMismatch {
public:
  explicit DimensionMismatchForMultiplication(const std::string& what)
    : DimensionMismatch(what) {}
};

/**
 * @brief A sum, difference or product of two values does not fit in value_t.
 */
class OverflowError : public Error {
public:
  explicit OverflowError(const std::string& what) : Error(what) {}
};

/**
 * @brief A negative coordinate or dimension, or a coordinate equal to INT_MAX
 *        (the grown dimension would not fit), was handed to the API.
 */
class InvalidIndex : public Error {
public:
  explicit InvalidIndex(const std::string& what) : Error(what) {}
};

} // namespace spmat
