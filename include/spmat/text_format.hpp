#pragma once

#include <iosfwd>
#include <string>

#include "spmat/sparse_matrix.hpp"

namespace spmat {

/**
 * @brief Decode the textual matrix format.
 *
 *   rows=<int>
 *   cols=<int>
 *   (<row>, <col>, <value>)
 *   ...
 *
 * Blank lines are ignored and every line is trimmed before it is inspected.
 * Entries are applied in file order, so a repeated coordinate keeps the last
 * value.
 *
 * @param text    the whole payload
 * @param source  name used in error messages (usually the file path)
 * @throws FormatError on the first malformed line
 */
SparseMatrix parse_matrix(const std::string& text,
                          const std::string& source = "<input>");

/**
 * @brief Encode a matrix in the textual format, entries in insertion order,
 *        lines joined by '\n' with no trailing newline.
 */
std::string describe(const SparseMatrix& m);

std::ostream& operator<<(std::ostream& os, const SparseMatrix& m);

} // namespace spmat
