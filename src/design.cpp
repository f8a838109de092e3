#include "design.hpp"
#include "aux.hpp"
#include "log.hpp"

using namespace std;

namespace FD {

ColumnGroup::ColumnGroup(const Vector &v, const string &label)
    : values(v), labels{label} {}

ColumnGroup::ColumnGroup(const Matrix &m, const Labels &labels_)
    : values(m), labels(labels_) {}

size_t ColumnGroup::size() const { return values.cols(); }

size_t Design::num_samples() const { return matrix.rows(); }

size_t Design::num_features() const { return matrix.cols(); }

string Design::to_string() const {
  return "Design matrix: " + std::to_string(num_samples()) + " samples x "
         + std::to_string(num_features()) + " features ["
         + intercalate(begin(labels), end(labels), string(", ")) + "]";
}

ostream &operator<<(ostream &os, const Design &design) {
  os << design.to_string();
  return os;
}

Design assemble(const ColumnGroups &groups, size_t n) {
  size_t num_features = 0;
  for (auto &group : groups) {
    if (static_cast<size_t>(group.values.rows()) != n)
      throw Exception::Design::RowMismatch(group.values.rows(), n);
    if (group.labels.size() != group.size())
      throw Exception::Design::LabelMismatch(group.labels.size(),
                                             group.size());
    num_features += group.size();
  }

  Design design;
  design.matrix = Matrix(n, num_features);
  size_t col = 0;
  for (auto &group : groups) {
    design.matrix.middleCols(col, group.size()) = group.values;
    design.labels.insert(end(design.labels), begin(group.labels),
                         end(group.labels));
    col += group.size();
  }
  LOG(verbose) << design;
  return design;
}
}
