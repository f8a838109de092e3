#include "term.hpp"
#include <boost/lexical_cast.hpp>
#include <boost/rational.hpp>
#include <boost/tokenizer.hpp>
#include <cstdlib>
#include <limits>
#include <regex>
#include "aux.hpp"
#include "exceptions.hpp"
#include "log.hpp"
#include "transform.hpp"

using namespace std;

namespace FD {

namespace {
using Rational = boost::rational<long long>;

const regex dummy_pattern(R"(^c\((\w+)\)$)");
const regex power_pattern(R"(^I\((.*)\)$)");
const regex polynomial_pattern(R"(^poly\((.*)\)$)");
// sign, integer digits, then either /denominator or .fraction and exponent
const regex fraction_pattern(
    R"(^([+-]?)(?=\d|\.\d)(\d*)(?:/(\d+)|(?:\.(\d*))?(?:[eE]([+-]?\d+))?)$)");

const regex &transform_pattern() {
  static const regex pattern(
      "^(" + intercalate(begin(Transform::names()), end(Transform::names()),
                         string("|"))
      + R"()\((\w+)\)$)");
  return pattern;
}

Float parse_number(const string &str) {
  Float x;
  if (not boost::conversion::try_lexical_convert(str, x))
    throw Exception::Formula::NumericEvaluation(
        "could not convert exponent '" + str + "' to a number.");
  return x;
}

long long parse_integer(const string &str) {
  long long x;
  if (not boost::conversion::try_lexical_convert(str, x))
    throw Exception::Formula::NumericEvaluation(
        "could not convert '" + str + "' to an integer.");
  return x;
}

long long power_of_ten(long long k, const string &str) {
  if (k < 0 or k > numeric_limits<long long>::digits10)
    throw Exception::Formula::NumericEvaluation(
        "'" + str + "' is out of range for an exact rational number.");
  long long p = 1;
  for (long long i = 0; i < k; ++i)
    p *= 10;
  return p;
}

Rational parse_rational(const string &str) {
  smatch match;
  if (not regex_match(str, match, fraction_pattern))
    throw Exception::Formula::NumericEvaluation("invalid rational number '"
                                                + str + "'.");
  try {
    long long numerator = parse_integer(match[2].str() + match[4].str());
    if (match[1] == "-")
      numerator = -numerator;
    if (match[3].matched)
      return Rational(numerator, parse_integer(match[3].str()));

    long long exponent = match[5].matched ? parse_integer(match[5].str()) : 0;
    exponent -= match[4].length();
    if (exponent < 0)
      return Rational(numerator, power_of_ten(-exponent, str));
    long long scale = power_of_ten(exponent, str);
    if (abs(numerator) > numeric_limits<long long>::max() / scale)
      throw Exception::Formula::NumericEvaluation(
          "'" + str + "' is out of range for an exact rational number.");
    return Rational(numerator * scale);
  } catch (const boost::bad_rational &e) {
    throw Exception::Formula::NumericEvaluation("invalid rational number '"
                                                + str + "': " + e.what());
  }
}

const Vector &numeric_column(const string &name, const DataFrame &data) {
  if (not data.has_column(name))
    throw Exception::Formula::UnknownColumn(name);
  return data.column_values(name);
}
}

string to_string(Term::Kind kind) {
  switch (kind) {
    case Term::Kind::column:
      return "column";
    case Term::Kind::dummy:
      return "dummy";
    case Term::Kind::transform:
      return "transform";
    case Term::Kind::power:
      return "power";
    case Term::Kind::polynomial:
      return "polynomial";
    default:
      throw logic_error("Implementation of to_string(Term::Kind) incomplete!");
  }
}

string Term::to_string() const {
  return FD::to_string(kind) + " term '" + text + "'";
}

ostream &operator<<(ostream &os, const Term &term) {
  os << term.to_string();
  return os;
}

Float parse_exponent(const string &exponent_) {
  string exponent = trim(exponent_);
  auto open = exponent.find('(');
  auto close = exponent.find(')');
  if (open == string::npos or close == string::npos)
    return parse_number(exponent);

  string inner = trim(exponent.substr(open + 1, close - open - 1));
  if (inner.find('/') == string::npos)
    return parse_number(inner);

  using tokenizer = boost::tokenizer<boost::char_separator<char>>;
  boost::char_separator<char> sep(" \t");
  Rational sum(0);
  size_t num_tokens = 0;
  for (auto &token : tokenizer(inner, sep)) {
    sum += parse_rational(token);
    ++num_tokens;
  }
  if (num_tokens == 0)
    throw Exception::Formula::NumericEvaluation("empty exponent '" + exponent
                                                + "'.");
  LOG(trace) << "Exponent " << exponent << " = " << sum;
  return boost::rational_cast<Float>(sum);
}

Term classify(const string &text_, const DataFrame &data) {
  Term term;
  term.text = trim(text_);
  smatch match;

  if (data.has_column(term.text)) {
    term.kind = Term::Kind::column;
    term.column = term.text;
  } else if (regex_match(term.text, match, dummy_pattern)) {
    term.kind = Term::Kind::dummy;
    term.column = match[1].str();
  } else if (regex_match(term.text, match, transform_pattern())) {
    term.kind = Term::Kind::transform;
    term.function = match[1].str();
    term.column = match[2].str();
  } else if (regex_match(term.text, match, power_pattern)) {
    term.kind = Term::Kind::power;
    auto parts = split_and_trim('^', match[1].str());
    if (parts.size() != 2)
      throw Exception::Formula::Syntax("power term '" + term.text
                                       + "' needs the form I(x^p).");
    term.column = parts[0];
    term.exponent = parts[1];
  } else if (regex_match(term.text, match, polynomial_pattern)) {
    term.kind = Term::Kind::polynomial;
    auto parts = split_and_trim(',', match[1].str());
    if (parts.size() != 2)
      throw Exception::Formula::Syntax("polynomial term '" + term.text
                                       + "' needs the form poly(x, k).");
    term.column = parts[0];
    if (not boost::conversion::try_lexical_convert(parts[1], term.degree))
      throw Exception::Formula::InvalidParameter(
          "degree '" + parts[1] + "' in '" + term.text
          + "' is not an integer.");
    if (term.degree < 1)
      throw Exception::Formula::InvalidParameter(
          "degree in '" + term.text + "' should be no smaller than 1.");
  } else
    throw Exception::Formula::UnsupportedOperation(term.text);

  LOG(debug) << "Classified " << term;
  return term;
}

ColumnGroup resolve(const Term &term, const DataFrame &data) {
  switch (term.kind) {
    case Term::Kind::column:
      return ColumnGroup(numeric_column(term.column, data), term.text);

    case Term::Kind::dummy: {
      if (not data.has_column(term.column))
        throw Exception::Formula::UnknownColumn(term.column);
      auto dummies = data.one_hot(term.column);
      Labels labels;
      for (auto &category : dummies.categories)
        labels.push_back(term.column + "[" + category + "]");
      return ColumnGroup(dummies.indicators, labels);
    }

    case Term::Kind::transform:
      return ColumnGroup(
          Transform::apply(term.function, numeric_column(term.column, data)),
          term.text);

    case Term::Kind::power: {
      const Vector &x = numeric_column(term.column, data);
      Float exponent = parse_exponent(term.exponent);
      Vector y = x.array().pow(exponent).matrix();
      check_domain(term.text, x, y);
      return ColumnGroup(y, term.text);
    }

    case Term::Kind::polynomial: {
      const Vector &x = numeric_column(term.column, data);
      Matrix m(x.size(), term.degree);
      Labels labels;
      for (int p = 1; p <= term.degree; ++p) {
        m.col(p - 1) = x.array().pow(static_cast<Float>(p)).matrix();
        labels.push_back(term.column + "^" + std::to_string(p));
      }
      return ColumnGroup(m, labels);
    }

    default:
      throw logic_error("Implementation of resolve(Term) incomplete!");
  }
}

ColumnGroup resolve(const string &text, const DataFrame &data) {
  return resolve(classify(text, data), data);
}
}
