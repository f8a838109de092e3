#include <sstream>
#include "exceptions.hpp"
#include "formula.hpp"
#include "test_aux.hpp"

using namespace std;
using namespace Test;
using FD::DataFrame;
using FD::Matrix;
using FD::Vector;

namespace {

Vector vec(std::initializer_list<double> values) {
  Vector v(values.size());
  size_t i = 0;
  for (auto x : values)
    v[i++] = x;
  return v;
}

void test_parse() {
  FD::Formula formula("y ~ 1 + x +c(g)+ x:z");
  check(formula.response == "y", "response");
  check((formula.terms == FD::Formula::Terms{"1", "x", "c(g)", "x:z"}),
        "terms are split and trimmed");
  check(formula.to_string() == "y ~ 1 + x + c(g) + x:z", "to_string");

  istringstream is("  count ~ poly(x, 2)\n");
  is >> formula;
  check(formula.response == "count"
            and formula.terms == FD::Formula::Terms{"poly(x, 2)"},
        "read from stream");

  check_throws<Exception::Formula::Syntax>(
      []() { FD::Formula("y ~ x ~ z"); }, "two separators");
  check_throws<Exception::Formula::Syntax>(
      []() { FD::Formula("y + x"); }, "no separator");
  check_throws<Exception::Formula::Syntax>(
      []() { FD::Formula("y ~ x + x"); }, "repeated term");
  check_throws<Exception::Formula::Syntax>(
      []() { FD::Formula("y ~ x + log(x) +x"); }, "repeated term, spaced");
  check_throws<Exception::Formula::Syntax>(
      []() { FD::Formula("y ~ x + "); }, "trailing '+'");
  check_throws<Exception::Formula::Syntax>(
      []() { FD::Formula("y ~ "); }, "no terms");
}

// Scenarios with small tables, results written out in full

void test_intercept() {
  DataFrame data;
  data.add_numeric_column("x", vec({1, 2, 3}));
  data.add_numeric_column("y", vec({10, 20, 30}));

  auto frame = FD::evaluate("y ~ 1 + x", data);
  Matrix expected(3, 2);
  expected << 1, 1,
              1, 2,
              1, 3;
  check(approx_equal(frame.design.matrix, expected), "intercept design");
  check(approx_equal(frame.response, vec({10, 20, 30})), "response");
  check((frame.design.labels == FD::Labels{"intercept", "x"}),
        "intercept labels");
  check(frame.design.num_samples() == data.row_count()
            and static_cast<size_t>(frame.response.size())
                    == data.row_count(),
        "X and y have one row per sample");
}

void test_power() {
  DataFrame data;
  data.add_numeric_column("x", vec({4, 9}));
  data.add_numeric_column("y", vec({0, 1}));

  auto frame = FD::evaluate("y ~ I(x^(1/2))", data);
  Matrix expected(2, 1);
  expected << 2, 3;
  check(approx_equal(frame.design.matrix, expected), "rational power");
}

void test_polynomial() {
  DataFrame data;
  data.add_numeric_column("x", vec({1, 2}));
  data.add_numeric_column("y", vec({0, 1}));

  auto frame = FD::evaluate("y ~ poly(x,2)", data);
  Matrix expected(2, 2);
  expected << 1, 1,
              2, 4;
  check(approx_equal(frame.design.matrix, expected), "polynomial");

  check_throws<Exception::Formula::InvalidParameter>(
      [&]() { FD::evaluate("y ~ poly(x,0)", data); }, "degree 0");
}

void test_dummy() {
  DataFrame data;
  data.add_categorical_column("g", {"a", "b", "a"});
  data.add_numeric_column("y", vec({1, 2, 3}));

  auto frame = FD::evaluate("y ~ c(g)", data);
  Matrix expected(3, 2);
  expected << 1, 0,
              0, 1,
              1, 0;
  check(frame.design.matrix == expected, "dummy encoding");
  check((frame.design.labels == FD::Labels{"g[a]", "g[b]"}), "dummy labels");
  check(frame.design.matrix.rowwise().sum() == Vector::Ones(3),
        "exactly one indicator per row");
}

void test_interactions() {
  DataFrame data;
  data.add_numeric_column("x", vec({1, 2}));
  data.add_numeric_column("z", vec({3, 4}));
  data.add_numeric_column("y", vec({0, 0}));
  data.add_categorical_column("g", {"a", "b"});

  auto frame = FD::evaluate("y ~ x*z", data);
  Matrix expected(2, 3);
  expected << 1, 3, 3,
              2, 4, 8;
  check(approx_equal(frame.design.matrix, expected), "cross term");
  check((frame.design.labels == FD::Labels{"x", "z", "x:z"}),
        "cross term labels");

  frame = FD::evaluate("y ~ x : z", data);
  expected.resize(2, 1);
  expected << 3, 8;
  check(approx_equal(frame.design.matrix, expected), "interaction term");
  check(frame.design.labels == FD::Labels{"x:z"}, "interaction label");

  frame = FD::evaluate("y ~ I(x^2):log(z)", data);
  expected << log(3.0), 4 * log(4.0);
  check(approx_equal(frame.design.matrix, expected),
        "interaction of derived terms");

  check_throws<Exception::Formula::Syntax>(
      [&]() { FD::evaluate("y ~ x:z:x", data); }, "ternary ':'");
  check_throws<Exception::Formula::Syntax>(
      [&]() { FD::evaluate("y ~ x*z*x", data); }, "ternary '*'");
  check_throws<Exception::Formula::UnsupportedOperation>(
      [&]() { FD::evaluate("y ~ c(g):x", data); },
      "dummy operand of ':'");
  check_throws<Exception::Formula::UnsupportedOperation>(
      [&]() { FD::evaluate("y ~ x*poly(z, 2)", data); },
      "polynomial operand of '*'");
  check_throws<Exception::Formula::UnknownColumn>(
      [&]() { FD::evaluate("y ~ x:log(w)", data); }, "absent operand");
}

void test_column_order() {
  DataFrame data;
  data.add_numeric_column("x", vec({1, 2, 3}));
  data.add_numeric_column("z", vec({2, 1, 0}));
  data.add_numeric_column("y", vec({0, 0, 0}));
  data.add_categorical_column("g", {"b", "a", "c"});

  auto frame
      = FD::evaluate("y ~ poly(x, 2) + 1 + c(g) + x*z + sqrt(x)", data);
  check((frame.design.labels
         == FD::Labels{"x^1", "x^2", "intercept", "g[a]", "g[b]", "g[c]", "x",
                       "z", "x:z", "sqrt(x)"}),
        "columns follow the order of the terms");
  check(frame.design.num_features() == 10, "number of features");
  check(approx_equal(frame.design.matrix.col(8), vec({2, 2, 0})),
        "cross product column");
  check(approx_equal(frame.design.matrix.col(2), Vector::Ones(3)),
        "intercept column");
}

void test_errors() {
  DataFrame data;
  data.add_numeric_column("x", vec({1, 2}));
  data.add_numeric_column("y", vec({3, 4}));

  check_throws<Exception::Formula::Syntax>(
      [&]() { FD::evaluate("y ~ x ~ z", data); }, "two separators");
  check_throws<Exception::Formula::UnknownColumn>(
      [&]() { FD::evaluate("w ~ x", data); }, "absent response");
  check_throws<Exception::Formula::UnsupportedOperation>(
      [&]() { FD::evaluate("y ~ abs(x)", data); }, "unsupported term");
  check_throws<Exception::Formula::Error>(
      [&]() { FD::evaluate("y ~ x + x", data); }, "common base class");
}

void test_evaluator() {
  DataFrame data;
  data.add_numeric_column("x", vec({1, 2, 3, 4, 5}));
  data.add_numeric_column("y", vec({1, 0, 1, 0, 1}));

  FD::Parameters parameters;
  parameters.chunksize = 2;
  FD::Evaluator chunked(parameters);
  FD::Evaluator plain;

  auto a = chunked("y ~ 1 + x + I(x^3)", data);
  auto b = plain("y ~ 1 + x + I(x^3)", data);
  check(a.design.matrix == b.design.matrix and a.response == b.response,
        "chunksize has no effect on the result");
  check(a.design.num_samples() == 5, "all rows are evaluated");

  FD::DataFrame other;
  other.add_numeric_column("x", vec({7}));
  other.add_numeric_column("y", vec({8}));
  auto c = plain("y ~ x", other);
  auto d = plain("y ~ x", data);
  check(c.design.num_samples() == 1 and d.design.num_samples() == 5,
        "evaluator keeps no data between calls");

  auto features = FD::expand_features("1 + x", data);
  check(features.num_features() == 2, "expand_features from text");
}
}

int main(int argc, char **argv) {
  init_logging("", Verbosity::warning);
  test_parse();
  test_intercept();
  test_power();
  test_polynomial();
  test_dummy();
  test_interactions();
  test_column_order();
  test_errors();
  test_evaluator();
  return report("test_formula");
}
