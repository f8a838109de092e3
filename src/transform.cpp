#include "transform.hpp"
#include <cmath>
#include <map>
#include <sstream>
#include "exceptions.hpp"

using namespace std;

namespace FD {
namespace Transform {

namespace {
const map<string, Function> &registry() {
  static const map<string, Function> functions{
      {"log",
       [](const Vector &x) -> Vector { return x.array().log().matrix(); }},
      {"exp",
       [](const Vector &x) -> Vector { return x.array().exp().matrix(); }},
      {"sin",
       [](const Vector &x) -> Vector { return x.array().sin().matrix(); }},
      {"cos",
       [](const Vector &x) -> Vector { return x.array().cos().matrix(); }},
      {"tan",
       [](const Vector &x) -> Vector { return x.array().tan().matrix(); }},
      {"tanh",
       [](const Vector &x) -> Vector { return x.array().tanh().matrix(); }},
      {"sqrt",
       [](const Vector &x) -> Vector { return x.array().sqrt().matrix(); }},
  };
  return functions;
}
}

const vector<string> &names() {
  static const vector<string> transform_names{"log", "exp", "sin", "cos",
                                              "tan", "tanh", "sqrt"};
  return transform_names;
}

bool is_transform(const string &name) {
  return registry().find(name) != registry().end();
}

const Function &lookup(const string &name) {
  auto iter = registry().find(name);
  if (iter == registry().end())
    throw Exception::Formula::NumericEvaluation("unknown transform '" + name
                                                + "'.");
  return iter->second;
}

Vector apply(const string &name, const Vector &x) {
  Vector y = lookup(name)(x);
  check_domain(name, x, y);
  return y;
}
}

void check_domain(const string &label, const Vector &input,
                  const Vector &output) {
  for (Index i = 0; i < output.size(); ++i)
    if (std::isnan(output[i]) and not std::isnan(input[i])) {
      ostringstream ss;
      ss << "'" << label << "' is undefined for value " << input[i]
         << " in row " << i << ".";
      throw Exception::Formula::NumericEvaluation(ss.str());
    }
}
}
