#pragma once

#include <string>

#include "spmat/sparse_matrix.hpp"

namespace spmat {

/**
 * @brief Load a matrix file written in the spmat text format.
 *
 * Backslashes in @p path are treated as directory separators.
 *
 * @throws IOError     if the file cannot be opened or read
 * @throws FormatError if its contents are malformed
 */
SparseMatrix load_matrix(const std::string& path);

/**
 * @brief Write describe(m) to @p path, replacing any existing file.
 * @throws IOError if the file cannot be opened or written
 */
void save_matrix(const std::string& path, const SparseMatrix& m);

} // namespace spmat
