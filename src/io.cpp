#include "io.hpp"
#include <algorithm>
#include "log.hpp"

using namespace std;

namespace FD {

Labels sample_names(size_t n) {
  Labels names;
  for (size_t i = 1; i <= n; ++i)
    names.push_back(std::to_string(i));
  return names;
}

vector<string> write_model_frame(const ModelFrame &frame,
                                 const Parameters &parameters) {
  const Design &design = frame.design;
  auto row_names = sample_names(design.num_samples());
  vector<string> paths;
  paths.push_back(write_matrix(design.matrix,
                               parameters.output_prefix + "X.tsv",
                               parameters.compression_mode, row_names,
                               design.labels, parameters.separator));
  paths.push_back(write_vector(frame.response,
                               parameters.output_prefix + "y.tsv",
                               parameters.compression_mode,
                               frame.formula.response, row_names,
                               parameters.separator));
  for (auto &path : paths)
    LOG(info) << "Wrote " << path;
  return paths;
}

void print_matrix_head(ostream &os, const Matrix &m, const Labels &col_names,
                       size_t n) {
  size_t X = m.rows();
  size_t Y = m.cols();
  for (size_t y = 0; y < Y; ++y)
    os << (y > 0 ? "\t" : "") << col_names[y];
  os << endl;
  for (size_t x = 0; x < std::min<size_t>(X, n); ++x) {
    for (size_t y = 0; y < Y; ++y)
      os << (y > 0 ? "\t" : "") << m(x, y);
    os << endl;
  }
  if (X > n)
    os << "... " << (X - n) << " more rows" << endl;
}
}
