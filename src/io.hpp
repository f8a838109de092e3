#ifndef IO_HPP
#define IO_HPP
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "compression.hpp"
#include "formula.hpp"
#include "parameters.hpp"
#include "types.hpp"

namespace FD {

/** Row names "1", "2", ..., "n" */
Labels sample_names(size_t n);

template <typename V>
std::string write_vector(const V &v, const std::string &path,
                         CompressionMode mode, const std::string &label,
                         const Labels &names = Labels(),
                         const std::string &separator = "\t") {
  size_t X = v.size();

  bool names_given = not names.empty();

  if (names_given) {
    if (names.size() != X)
      throw(std::runtime_error(
          "Error: length of names (" + std::to_string(names.size())
          + ") does not match length of vector (" + std::to_string(X) + ")."));
  }

  return write_file(path, mode, [&](std::ostream &ofs) {
    ofs << (names_given ? separator : "") << label << '\n';
    for (size_t x = 0; x < X; ++x)
      ofs << (names_given ? names[x] + separator : "") << v[x] << '\n';
  });
}

template <typename M>
std::string write_matrix(const M &m, const std::string &path,
                         CompressionMode mode,
                         const Labels &row_names = Labels(),
                         const Labels &col_names = Labels(),
                         const std::string &separator = "\t") {
  size_t X = m.rows();
  size_t Y = m.cols();

  bool row_names_given = not row_names.empty();
  bool col_names_given = not col_names.empty();

  if (row_names_given) {
    if (row_names.size() != X)
      throw(std::runtime_error(
          "Error: length of row names (" + std::to_string(row_names.size())
          + ") does not match number of rows (" + std::to_string(X) + ")."));
  }

  if (col_names_given) {
    if (col_names.size() != Y)
      throw(std::runtime_error(
          "Error: length of col names (" + std::to_string(col_names.size())
          + ") does not match number of cols (" + std::to_string(Y) + ")."));
  }

  return write_file(path, mode, [&](std::ostream &ofs) {
    if (col_names_given) {
      for (size_t y = 0; y < Y; ++y)
        ofs << (y != 0 or row_names_given ? separator : "") << col_names[y];
      ofs << '\n';
    }
    for (size_t x = 0; x < X; ++x) {
      if (row_names_given)
        ofs << row_names[x] + separator;
      for (size_t y = 0; y < Y; ++y)
        ofs << (y != 0 ? separator : "") << m(x, y);
      ofs << '\n';
    }
  });
}

/**
 * Write the design matrix to <prefix>X.tsv and the response to <prefix>y.tsv,
 * each with the suffix of the compression mode appended
 *
 * @return the paths of the two files
 */
std::vector<std::string> write_model_frame(const ModelFrame &frame,
                                           const Parameters &parameters);

void print_matrix_head(std::ostream &os, const Matrix &m,
                       const Labels &col_names, size_t n = 10);
}

#endif
