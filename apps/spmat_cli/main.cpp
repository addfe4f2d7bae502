// apps/spmat_cli/main.cpp
#include "spmat/matrix_io.hpp"
#include "spmat/operation.hpp"
#include "spmat/text_format.hpp"

#include <getopt.h>
#include <cctype>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

struct Options {
  std::string op;
  std::string lhs;
  std::string rhs;
  std::string output;
  bool        print = false;
  bool        quiet = false;
};

void usage(const char* argv0) {
  std::cerr << "Usage: " << argv0
            << " [--op add|subtract|multiply] [--lhs A.txt] [--rhs B.txt]"
               " [--output OUT.txt] [--print] [--quiet]\n"
            << "Anything not given on the command line is asked for interactively.\n";
}

// Reads one line from stdin after showing the prompt; EOF is an error so a
// closed pipe cannot spin the menu.
std::string prompt_user(const std::string& message) {
  std::cout << message << std::flush;
  std::string answer;
  if (!std::getline(std::cin, answer))
    throw std::runtime_error("unexpected end of input");
  return answer;
}

std::string capitalize(std::string s) {
  if (!s.empty())
    s[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[0])));
  return s;
}

spmat::SparseMatrix load_verbose(const std::string& which, const std::string& path,
                                 bool quiet) {
  if (!quiet) std::cout << "Loading " << which << " matrix from " << path << "...\n";
  auto m = spmat::load_matrix(path);
  if (!quiet) std::cout << "Loaded matrix size " << m.rows() << "x" << m.cols() << "\n";
  return m;
}

int run(Options opt) {
  const bool interactive = opt.op.empty() || opt.lhs.empty() || opt.rhs.empty();

  std::optional<spmat::Op> op;
  if (opt.op.empty()) {
    std::cout << "Available MATRIX Operations:\n";
    int i = 1;
    for (auto o : spmat::all_ops()) {
      auto impl = spmat::make_operation(o);
      std::cout << "(" << i++ << ") " << capitalize(impl->label()) << "\n";
    }
    op = spmat::parse_op(prompt_user("Select operation (1,2,3): "));
  } else {
    op = spmat::parse_op(opt.op);
  }
  if (!op)
    throw std::runtime_error("Invalid selection.");

  if (opt.lhs.empty()) opt.lhs = prompt_user("Enter path for the first matrix file: ");
  if (opt.rhs.empty()) opt.rhs = prompt_user("Enter path for the second matrix file: ");

  auto A = load_verbose("first", opt.lhs, opt.quiet);
  auto B = load_verbose("second", opt.rhs, opt.quiet);

  auto operation = spmat::make_operation(*op);
  const std::string label = operation->label();
  if (!opt.quiet) std::cout << "Performing " << label << "...\n";

  auto result = operation->apply(A, B);

  if (interactive || opt.print)
    std::cout << capitalize(label) << " Result:\n" << result << "\n";

  const std::string default_out = label + "_output.txt";
  if (opt.output.empty() && interactive)
    opt.output = prompt_user("Enter path to save the result matrix [" + default_out + "]: ");
  if (opt.output.empty())
    opt.output = default_out;

  spmat::save_matrix(opt.output, result);
  if (!opt.quiet)
    std::cout << capitalize(label) << " completed successfully. Output saved to "
              << opt.output << ".\n";
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  Options opt;
  static struct option opts[] = {
    {"op",     required_argument, 0, 'o'},
    {"lhs",    required_argument, 0, 'a'},
    {"rhs",    required_argument, 0, 'b'},
    {"output", required_argument, 0, 'w'},
    {"print",  no_argument,       0, 'p'},
    {"quiet",  no_argument,       0, 'q'},
    {"help",   no_argument,       0, 'h'},
    {0,0,0,0}
  };
  int c;
  while ((c = getopt_long(argc, argv, "o:a:b:w:pqh", opts, nullptr)) != -1) {
    switch (c) {
      case 'o': opt.op     = optarg; break;
      case 'a': opt.lhs    = optarg; break;
      case 'b': opt.rhs    = optarg; break;
      case 'w': opt.output = optarg; break;
      case 'p': opt.print  = true;   break;
      case 'q': opt.quiet  = true;   break;
      case 'h': usage(argv[0]); return 0;
      default:  usage(argv[0]); return 1;
    }
  }
  if (optind < argc) {
    std::cerr << "unexpected argument: " << argv[optind] << "\n";
    usage(argv[0]);
    return 1;
  }

  try {
    return run(opt);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
  }
  return 1;
}
