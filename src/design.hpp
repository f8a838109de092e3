#ifndef DESIGN_HPP
#define DESIGN_HPP

#include <iostream>
#include <stdexcept>
#include <vector>
#include "types.hpp"

namespace Exception {
namespace Design {
struct RowMismatch : public std::logic_error {
  RowMismatch(size_t n, size_t expected)
      : std::logic_error("Error: column group has " + std::to_string(n)
                         + " rows but the design has "
                         + std::to_string(expected) + "."){};
};
struct LabelMismatch : public std::logic_error {
  LabelMismatch(size_t n, size_t expected)
      : std::logic_error("Error: column group has " + std::to_string(n)
                         + " labels for " + std::to_string(expected)
                         + " columns."){};
};
}
}

namespace FD {

const std::string intercept_label = "intercept";

/** The columns one term contributes to the design, as an n x m block */
struct ColumnGroup {
  ColumnGroup() = default;
  ColumnGroup(const Vector &v, const std::string &label);
  ColumnGroup(const Matrix &m, const Labels &labels);
  Matrix values;
  Labels labels;
  size_t size() const;
};

using ColumnGroups = std::vector<ColumnGroup>;

/** Design matrix with one row per sample and one column per feature */
struct Design {
  Matrix matrix;
  Labels labels;
  size_t num_samples() const;
  size_t num_features() const;
  std::string to_string() const;
};

std::ostream &operator<<(std::ostream &os, const Design &design);

/**
 * Place the column groups side by side in the given order
 *
 * @param groups Column groups; each must have n rows
 * @param n Number of samples
 */
Design assemble(const ColumnGroups &groups, size_t n);
}

#endif
