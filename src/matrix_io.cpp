#include "spmat/matrix_io.hpp"
#include "spmat/errors.hpp"
#include "spmat/text_format.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace spmat {

SparseMatrix load_matrix(const std::string& path) {
  std::string native = path;
  std::replace(native.begin(), native.end(), '\\', '/');

  std::error_code ec;
  const auto st = std::filesystem::status(native, ec);
  if (!std::filesystem::exists(st))
    throw IOError("File not found: " + path, path);
  // a directory opens fine on Linux but every read fails
  if (std::filesystem::is_directory(st))
    throw IOError("not a regular file: " + path, path);

  std::ifstream in(native);
  if (!in)
    throw IOError("cannot open " + path, path);

  std::ostringstream buf;
  buf << in.rdbuf();
  if (in.bad())
    throw IOError("cannot read " + path, path);

  return parse_matrix(buf.str(), path);
}

void save_matrix(const std::string& path, const SparseMatrix& m) {
  std::ofstream out(path, std::ios::out | std::ios::trunc);
  if (!out)
    throw IOError("cannot open " + path + " for writing", path);

  out << describe(m);
  out.flush();
  if (!out)
    throw IOError("cannot write " + path, path);
}

} // namespace spmat
