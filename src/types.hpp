#ifndef TYPES_HPP
#define TYPES_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <eigen3/Eigen/Dense>

namespace FD {
using Float = double;
using Index = Eigen::MatrixXd::Index;
using Vector = Eigen::VectorXd;
using Matrix = Eigen::MatrixXd;
using Labels = std::vector<std::string>;
}

namespace Eigen {
VectorXd::Scalar* begin(VectorXd& v);
VectorXd::Scalar* end(VectorXd& v);

const VectorXd::Scalar* begin(const VectorXd& v);
const VectorXd::Scalar* end(const VectorXd& v);
}
#endif
