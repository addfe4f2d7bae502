// apps/makemat/makemat.cpp
#include "spmat/matrix_io.hpp"
#include "spmat/sparse_matrix.hpp"

#include <getopt.h>
#include <exception>
#include <iostream>
#include <random>
#include <string>

static void usage() {
  std::cerr << "Usage: spmat_makemat --rows R --cols C --density D --output F"
               " [--min V] [--max V] [--seed S]\n";
}

int main(int argc, char** argv) {
  int rows=0, cols=0;
  double density=0;
  long long vmin=-9, vmax=9;
  unsigned long long seed = std::random_device{}();
  std::string outfile;
  static struct option opts[] = {
    {"rows",    required_argument, 0, 'r'},
    {"cols",    required_argument, 0, 'c'},
    {"density", required_argument, 0, 'd'},
    {"output",  required_argument, 0, 'o'},
    {"min",     required_argument, 0, 'm'},
    {"max",     required_argument, 0, 'M'},
    {"seed",    required_argument, 0, 's'},
    {0,0,0,0}
  };
  int opt;
  try {
    while((opt = getopt_long(argc, argv, "r:c:d:o:m:M:s:", opts, nullptr)) != -1){
      switch(opt){
        case 'r': rows    = std::stoi(optarg);   break;
        case 'c': cols    = std::stoi(optarg);   break;
        case 'd': density = std::stod(optarg);   break;
        case 'o': outfile = optarg;              break;
        case 'm': vmin    = std::stoll(optarg);  break;
        case 'M': vmax    = std::stoll(optarg);  break;
        case 's': seed    = std::stoull(optarg); break;
        default: usage(); return 1;
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "Invalid args: " << e.what() << "\n";
    usage();
    return 1;
  }
  // [min, max] must hold at least one non-zero value
  if(rows<=0||cols<=0||density<=0||density>1||outfile.empty()||vmin>vmax||(vmin==0&&vmax==0)){
    std::cerr<<"Invalid args\n"; usage(); return 1;
  }

  std::mt19937_64 rng(seed);
  std::uniform_real_distribution<double> ud(0.0,1.0);
  std::uniform_int_distribution<long long> vd(vmin, vmax);

  spmat::SparseMatrix m(rows, cols);
  for(int i=0;i<rows;++i){
    for(int j=0;j<cols;++j){
      if(ud(rng) < density){
        long long v;
        do { v = vd(rng); } while (v == 0);
        m.set_element(i, j, v);
      }
    }
  }

  try {
    spmat::save_matrix(outfile, m);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
  std::cout << "Wrote " << rows << "x" << cols << " matrix with " << m.nnz()
            << " entries to " << outfile << "\n";
  return 0;
}
