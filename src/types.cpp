#include "types.hpp"
namespace Eigen {
VectorXd::Scalar* begin(VectorXd& v) { return v.data(); }
VectorXd::Scalar* end(VectorXd& v) { return v.data() + v.size(); }

const VectorXd::Scalar* begin(const VectorXd& v) { return v.data(); }
const VectorXd::Scalar* end(const VectorXd& v) { return v.data() + v.size(); }
}
