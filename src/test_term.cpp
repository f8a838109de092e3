#include <cmath>
#include "exceptions.hpp"
#include "term.hpp"
#include "test_aux.hpp"
#include "transform.hpp"

using namespace std;
using namespace Test;
using FD::DataFrame;
using FD::Term;
using FD::Vector;

namespace {

DataFrame example_data() {
  DataFrame data;
  Vector x(3), neg(3), shadow(3);
  x << 1, 4, 9;
  neg << -1, 4, 9;
  shadow << 7, 8, 9;
  data.add_numeric_column("x", x);
  data.add_numeric_column("neg", neg);
  data.add_numeric_column("c(x)", shadow);
  data.add_categorical_column("g", {"u", "v", "u"});
  return data;
}

void test_classify() {
  auto data = example_data();

  FD::Term blank;
  check(blank.kind == FD::Term::Kind::column and blank.degree == 0,
        "default term is a plain column");

  auto term = FD::classify(" x ", data);
  check(term.kind == Term::Kind::column and term.column == "x",
        "column term");
  check(term.text == "x", "term text is trimmed");

  term = FD::classify("c(x)", data);
  check(term.kind == Term::Kind::column,
        "a column named like a dummy term is used as a column");

  term = FD::classify("c(g)", data);
  check(term.kind == Term::Kind::dummy and term.column == "g", "dummy term");

  term = FD::classify("tanh(x)", data);
  check(term.kind == Term::Kind::transform and term.function == "tanh"
            and term.column == "x",
        "transform term");

  term = FD::classify("I(x ^ (1/2))", data);
  check(term.kind == Term::Kind::power and term.column == "x"
            and term.exponent == "(1/2)",
        "power term");

  term = FD::classify("poly(x, 3)", data);
  check(term.kind == Term::Kind::polynomial and term.column == "x"
            and term.degree == 3,
        "polynomial term");

  check_throws<Exception::Formula::UnsupportedOperation>(
      [&]() { FD::classify("abs(x)", data); }, "unknown function");
  check_throws<Exception::Formula::UnsupportedOperation>(
      [&]() { FD::classify("w", data); }, "unknown plain name");
  check_throws<Exception::Formula::UnsupportedOperation>(
      [&]() { FD::classify("c(x y)", data); }, "dummy with a space");
  check_throws<Exception::Formula::Syntax>(
      [&]() { FD::classify("I(x)", data); }, "power term without '^'");
  check_throws<Exception::Formula::Syntax>(
      [&]() { FD::classify("poly(x)", data); }, "polynomial without degree");
  check_throws<Exception::Formula::InvalidParameter>(
      [&]() { FD::classify("poly(x, 0)", data); }, "polynomial of degree 0");
  check_throws<Exception::Formula::InvalidParameter>(
      [&]() { FD::classify("poly(x, -2)", data); },
      "polynomial of negative degree");
  check_throws<Exception::Formula::InvalidParameter>(
      [&]() { FD::classify("poly(x, 1.5)", data); },
      "polynomial of fractional degree");
}

void test_parse_exponent() {
  check(FD::parse_exponent("2") == 2, "plain exponent");
  check(FD::parse_exponent("-0.5") == -0.5, "negative exponent");
  check(FD::parse_exponent("(3)") == 3, "parenthesized exponent");
  check(FD::parse_exponent("( 0.25 )") == 0.25, "parenthesized decimal");
  check(FD::parse_exponent("(1/2)") == 0.5, "rational exponent");
  check(approx(FD::parse_exponent("(1/2 1/3)"), 5.0 / 6),
        "sum of rational exponents");
  check(FD::parse_exponent("(1/4 0.25 1)") == 1.5,
        "rational mixed with decimal and integer");
  check(FD::parse_exponent("(-1/2)") == -0.5, "negative rational");

  check_throws<Exception::Formula::NumericEvaluation>(
      []() { FD::parse_exponent("two"); }, "word as exponent");
  check_throws<Exception::Formula::NumericEvaluation>(
      []() { FD::parse_exponent("(a/b)"); }, "letters in rational");
  check_throws<Exception::Formula::NumericEvaluation>(
      []() { FD::parse_exponent("(1/0)"); }, "zero denominator");

  check(FD::parse_exponent("(1/2 5.)") == 5.5,
        "decimal without fraction digits");
  check(FD::parse_exponent("(1/2 .5)") == 1, "decimal without integer digits");
  check(approx(FD::parse_exponent("(1/2 1e-3)"), 0.501),
        "decimal with exponent");
  check(FD::parse_exponent("(1/2 -2E1)") == -19.5, "negative with exponent");
  check_throws<Exception::Formula::NumericEvaluation>(
      []() { FD::parse_exponent("(1/-2)"); }, "signed denominator");
  check_throws<Exception::Formula::NumericEvaluation>(
      []() { FD::parse_exponent("(1/2 .)"); }, "lone decimal point");
  check_throws<Exception::Formula::NumericEvaluation>(
      []() { FD::parse_exponent("(1/2 0.00000000000000000001)"); },
      "more fraction digits than a 64 bit denominator holds");
  check_throws<Exception::Formula::NumericEvaluation>(
      []() { FD::parse_exponent("(1/2 9e30)"); },
      "exponent too large for an exact rational");
  check_throws<Exception::Formula::NumericEvaluation>(
      []() { FD::parse_exponent("(1/2 99999999999999999999)"); },
      "integer too large for an exact rational");
}

void test_resolve() {
  auto data = example_data();

  auto group = FD::resolve("x", data);
  check(group.size() == 1 and group.labels[0] == "x", "column group");
  check(group.values.col(0) == data.column_values("x"), "column values");

  group = FD::resolve("c(x)", data);
  check(group.values(0, 0) == 7, "shadowing column values");

  group = FD::resolve("c(g)", data);
  check(group.size() == 2, "one column per category");
  check((group.labels == FD::Labels{"g[u]", "g[v]"}), "dummy labels");
  check(group.values(0, 0) == 1 and group.values(1, 1) == 1
            and group.values(2, 0) == 1 and group.values(0, 1) == 0,
        "dummy values");

  group = FD::resolve("sqrt(x)", data);
  check(group.values(1, 0) == 2 and group.values(2, 0) == 3,
        "sqrt transform");
  group = FD::resolve("log(x)", data);
  check(approx(group.values(1, 0), log(4.0)), "log transform");
  group = FD::resolve("exp(x)", data);
  check(approx(group.values(0, 0), exp(1.0)), "exp transform");
  group = FD::resolve("sin(x)", data);
  check(approx(group.values(2, 0), sin(9.0)), "sin transform");
  group = FD::resolve("cos(x)", data);
  check(approx(group.values(2, 0), cos(9.0)), "cos transform");
  group = FD::resolve("tan(x)", data);
  check(approx(group.values(0, 0), tan(1.0)), "tan transform");

  group = FD::resolve("I(x^(1/2))", data);
  group.values.col(0) -= FD::resolve("sqrt(x)", data).values.col(0);
  check(group.values.cwiseAbs().maxCoeff() < 1e-12,
        "rational square root equals sqrt");

  group = FD::resolve("I(x^2)", data);
  check(approx(group.values(2, 0), 81) and group.labels[0] == "I(x^2)",
        "integer power");
  group = FD::resolve("I(x^-1)", data);
  check(approx(group.values(1, 0), 0.25), "negative power");
  group = FD::resolve("I(neg^3)", data);
  check(approx(group.values(0, 0), -1), "odd power of a negative value");

  group = FD::resolve("poly(x, 3)", data);
  check(group.size() == 3, "polynomial columns");
  check((group.labels == FD::Labels{"x^1", "x^2", "x^3"}),
        "polynomial labels");
  check(approx(group.values(1, 0), 4) and approx(group.values(1, 1), 16)
            and approx(group.values(1, 2), 64),
        "ascending powers");

  check_throws<Exception::Formula::NumericEvaluation>(
      [&]() { FD::resolve("I(neg^(1/2))", data); },
      "fractional power of a negative value");
  check_throws<Exception::Formula::NumericEvaluation>(
      [&]() { FD::resolve("log(neg)", data); }, "log of a negative value");
  check_throws<Exception::Formula::NumericEvaluation>(
      [&]() { FD::resolve("I(x^y)", data); }, "malformed exponent");
  check_throws<Exception::Formula::NumericEvaluation>(
      [&]() { FD::resolve("log(g)", data); }, "transform of categorical");
  check_throws<Exception::Formula::UnknownColumn>(
      [&]() { FD::resolve("c(z)", data); }, "dummy of absent column");
  check_throws<Exception::Formula::UnknownColumn>(
      [&]() { FD::resolve("log(z)", data); }, "transform of absent column");
  check_throws<Exception::Formula::UnknownColumn>(
      [&]() { FD::resolve("I(z^2)", data); }, "power of absent column");
  check_throws<Exception::Formula::UnknownColumn>(
      [&]() { FD::resolve("poly(z, 2)", data); },
      "polynomial of absent column");
}

void test_transform_registry() {
  check(FD::Transform::names().size() == 7, "seven transforms");
  for (auto &name : FD::Transform::names())
    check(FD::Transform::is_transform(name), "registered: " + name);
  check(not FD::Transform::is_transform("abs"), "abs is not registered");
  check_throws<Exception::Formula::NumericEvaluation>(
      []() { FD::Transform::lookup("abs"); }, "lookup of unknown transform");
}
}

int main(int argc, char **argv) {
  init_logging("", Verbosity::warning);
  test_classify();
  test_parse_exponent();
  test_resolve();
  test_transform_registry();
  return report("test_term");
}
