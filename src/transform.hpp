#ifndef TRANSFORM_HPP
#define TRANSFORM_HPP

#include <functional>
#include <string>
#include <vector>
#include "types.hpp"

namespace FD {
namespace Transform {

using Function = std::function<Vector(const Vector &)>;

/** Names of the supported elementwise transforms */
const std::vector<std::string> &names();

bool is_transform(const std::string &name);

/**
 * Retrieve the elementwise function registered under a name
 *
 * Throws Exception::Formula::NumericEvaluation for names outside the closed
 * set log, exp, sin, cos, tan, tanh, sqrt.
 */
const Function &lookup(const std::string &name);

/**
 * Apply a named transform and check the result
 *
 * Throws Exception::Formula::NumericEvaluation if an entry becomes NaN while
 * the input entry was not NaN.
 */
Vector apply(const std::string &name, const Vector &x);
}

/**
 * Raise a NumericEvaluation error naming label and the first offending value
 * if a NaN was produced from a non-NaN input
 */
void check_domain(const std::string &label, const Vector &input,
                  const Vector &output);
}

#endif
