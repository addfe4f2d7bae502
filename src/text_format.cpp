#include "spmat/text_format.hpp"
#include "spmat/errors.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace spmat {

namespace {

const char* const kSpace = " \t\r\n\v\f";

std::string trim(const std::string& s) {
  auto b = s.find_first_not_of(kSpace);
  if (b == std::string::npos) return {};
  auto e = s.find_last_not_of(kSpace);
  return s.substr(b, e - b + 1);
}

// Whole-string base-10 integer; surrounding whitespace allowed.
bool parse_int(const std::string& raw, long long& out) {
  std::string s = trim(raw);
  if (s.empty()) return false;
  errno = 0;
  char* end = nullptr;
  long long v = std::strtoll(s.c_str(), &end, 10);
  if (errno == ERANGE || end != s.c_str() + s.size()) return false;
  out = v;
  return true;
}

bool fits_int(long long v) {
  return v >= std::numeric_limits<int>::min() && v <= std::numeric_limits<int>::max();
}

struct Line {
  int         number;   // 1-based, counted before blank lines are dropped
  std::string text;
};

std::vector<Line> significant_lines(const std::string& text) {
  std::vector<Line> lines;
  std::istringstream in(text);
  std::string raw;
  int number = 0;
  while (std::getline(in, raw)) {
    ++number;
    std::string t = trim(raw);
    if (!t.empty()) lines.push_back(Line{number, std::move(t)});
  }
  return lines;
}

int parse_dimension(const Line& line, const char* key, const std::string& source) {
  auto fail = [&](const std::string& why) {
    return FormatError("Invalid matrix dimensions in " + source + " (line " +
                       std::to_string(line.number) + ": " + why + "): " + line.text,
                       line.number);
  };

  auto eq = line.text.find('=');
  if (eq == std::string::npos)
    throw fail(std::string("expected ") + key + "=<integer>");
  if (trim(line.text.substr(0, eq)) != key)
    throw fail(std::string("expected ") + key + "=<integer>");

  long long v = 0;
  if (!parse_int(line.text.substr(eq + 1), v))
    throw fail("not an integer");
  if (v < 0 || !fits_int(v))
    throw fail("out of range");
  return static_cast<int>(v);
}

Entry parse_entry(const Line& line, const std::string& source) {
  const std::string& t = line.text;
  auto fail = [&](const std::string& why) {
    return FormatError("Invalid format for matrix element in " + source + " (line " +
                       std::to_string(line.number) + ", " + why + "): " + t,
                       line.number);
  };

  if (t.front() != '(' || t.back() != ')')
    throw fail("expected (<row>, <col>, <value>)");

  std::vector<std::string> parts;
  std::istringstream inner(t.substr(1, t.size() - 2));
  std::string part;
  while (std::getline(inner, part, ','))
    parts.push_back(part);
  // getline drops an empty trailing field, e.g. "(1, 2,)"
  if (t.size() >= 3 && t[t.size() - 2] == ',')
    parts.emplace_back();
  if (parts.size() != 3)
    throw fail("expected three comma-separated integers");

  long long r = 0, c = 0, v = 0;
  if (!parse_int(parts[0], r) || !parse_int(parts[1], c) || !parse_int(parts[2], v))
    throw fail("not an integer");
  if (r < 0 || c < 0)
    throw fail("negative coordinate");
  // the largest coordinate must leave room for its dimension (coord + 1)
  if (r >= std::numeric_limits<int>::max() || c >= std::numeric_limits<int>::max())
    throw fail("coordinate out of range");

  return Entry{static_cast<int>(r), static_cast<int>(c), v};
}

} // namespace

SparseMatrix parse_matrix(const std::string& text, const std::string& source) {
  const auto lines = significant_lines(text);
  if (lines.size() < 2)
    throw FormatError(source + " must contain at least two lines for matrix dimensions.");

  const int nrows = parse_dimension(lines[0], "rows", source);
  const int ncols = parse_dimension(lines[1], "cols", source);

  SparseMatrix m(nrows, ncols);
  for (std::size_t i = 2; i < lines.size(); ++i) {
    Entry e = parse_entry(lines[i], source);
    m.set_element(e.row, e.col, e.value);
  }
  return m;
}

std::string describe(const SparseMatrix& m) {
  std::ostringstream os;
  os << m;
  return os.str();
}

std::ostream& operator<<(std::ostream& os, const SparseMatrix& m) {
  os << "rows=" << m.rows() << '\n' << "cols=" << m.cols();
  for (const auto& e : m.entries())
    os << "\n(" << e.row << ", " << e.col << ", " << e.value << ')';
  return os;
}

} // namespace spmat
