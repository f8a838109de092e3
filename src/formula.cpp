#include "formula.hpp"

#include <set>
#include "aux.hpp"
#include "exceptions.hpp"
#include "log.hpp"
#include "term.hpp"

using namespace std;

namespace FD {

namespace {
Vector single_column(const ColumnGroup &group, const string &operand,
                     const string &term) {
  if (group.size() != 1)
    throw Exception::Formula::UnsupportedOperation(
        term, "operand '" + operand + "' yields " + std::to_string(group.size())
                  + " columns but interactions need a single column.");
  return group.values.col(0);
}

vector<string> binary_operands(char op, const string &term) {
  auto operands = split_and_trim(op, term);
  if (operands.size() != 2)
    throw Exception::Formula::Syntax("the operator " + string(1, op)
                                     + " should be binary in '" + term
                                     + "'.");
  return operands;
}
}

Formula::Formula(const string &str) {
  if (not str.empty())
    from_string(str);
}

void Formula::from_string(const string &str) {
  if (count_of(formula_separator, str) != 1)
    throw Exception::Formula::Syntax(
        "'~' should be used once to separate the response and the features "
        "in '" + str + "'.");

  auto sides = split_and_trim(formula_separator, str);
  response = sides[0];
  terms = parse_terms(sides[1]);
}

Formula::Terms parse_terms(const string &independent) {
  auto terms = split_and_trim(term_separator, independent);
  set<string> seen;
  for (auto &term : terms) {
    if (term.empty())
      throw Exception::Formula::Syntax("empty term in '" + independent
                                       + "'.");
    if (not seen.insert(term).second)
      throw Exception::Formula::Syntax("the features should be different; '"
                                       + term + "' is repeated.");
  }
  return terms;
}

string Formula::to_string() const {
  return response + " " + formula_separator + " "
         + intercalate(begin(terms), end(terms), string(" + "));
}

ostream &operator<<(ostream &os, const Formula &formula) {
  os << formula.to_string();
  return os;
}

istream &operator>>(istream &is, Formula &formula) {
  string token;
  getline(is, token);
  formula.from_string(token);
  return is;
}

Design expand_features(const Formula::Terms &terms, const DataFrame &data) {
  const size_t n = data.row_count();
  ColumnGroups groups;
  for (auto &term : terms) {
    if (term == unit_term) {
      groups.push_back(ColumnGroup(Vector::Ones(n), intercept_label));
    } else if (term.find(interaction_operator) != string::npos) {
      auto operands = binary_operands(interaction_operator, term);
      auto a = resolve(operands[0], data);
      auto b = resolve(operands[1], data);
      Vector product = single_column(a, operands[0], term)
                           .cwiseProduct(single_column(b, operands[1], term));
      groups.push_back(ColumnGroup(
          product, operands[0] + interaction_operator + operands[1]));
    } else if (term.find(cross_operator) != string::npos) {
      auto operands = binary_operands(cross_operator, term);
      auto a = resolve(operands[0], data);
      auto b = resolve(operands[1], data);
      Vector x1 = single_column(a, operands[0], term);
      Vector x2 = single_column(b, operands[1], term);
      Matrix m(n, 3);
      m << x1, x2, x1.cwiseProduct(x2);
      groups.push_back(ColumnGroup(
          m, {operands[0], operands[1],
              operands[0] + interaction_operator + operands[1]}));
    } else
      groups.push_back(resolve(term, data));
  }
  return assemble(groups, n);
}

Design expand_features(const string &independent, const DataFrame &data) {
  return expand_features(parse_terms(independent), data);
}

Evaluator::Evaluator(const Parameters &parameters_)
    : parameters(parameters_) {}

ModelFrame Evaluator::operator()(const string &formula,
                                 const DataFrame &data) const {
  return (*this)(Formula(formula), data);
}

ModelFrame Evaluator::operator()(const Formula &formula,
                                 const DataFrame &data) const {
  LOG(verbose) << "Evaluating formula " << formula;
  if (parameters.chunksize > 0)
    LOG(debug) << "Ignoring chunksize " << parameters.chunksize
               << "; all rows are evaluated at once.";

  if (not data.has_column(formula.response))
    throw Exception::Formula::UnknownColumn(formula.response);

  ModelFrame frame;
  frame.formula = formula;
  frame.response = data.column_values(formula.response);
  frame.design = expand_features(formula.terms, data);
  return frame;
}

ModelFrame evaluate(const string &formula, const DataFrame &data) {
  return Evaluator()(formula, data);
}
}
