#ifndef FORMULA_HPP
#define FORMULA_HPP

#include <iostream>
#include <string>
#include <vector>
#include "dataframe.hpp"
#include "design.hpp"
#include "parameters.hpp"

namespace FD {

const char formula_separator = '~';
const char term_separator = '+';
const char interaction_operator = ':';
const char cross_operator = '*';
const std::string unit_term = "1";

/**
 * A formula "response ~ term + term + ..."
 *
 * Parsing only splits the text; the terms are interpreted during evaluation.
 */
struct Formula {
  using Terms = std::vector<std::string>;

  Formula(const std::string &str = "");

  /**
   * Parse a formula
   *
   * Throws Exception::Formula::Syntax if there is not exactly one '~' or if
   * parse_terms() rejects the right hand side.
   */
  void from_string(const std::string &str);
  std::string to_string() const;

  std::string response;
  Terms terms;
};

std::ostream &operator<<(std::ostream &os, const Formula &formula);
std::istream &operator>>(std::istream &is, Formula &formula);

/**
 * Split the right hand side of a formula at '+' into trimmed terms
 *
 * Throws Exception::Formula::Syntax for empty or repeated terms.
 */
Formula::Terms parse_terms(const std::string &independent);

/** Design matrix X and response vector y of a formula */
struct ModelFrame {
  Formula formula;
  Design design;
  Vector response;
};

/**
 * Compute the design matrix for the right hand side of a formula
 *
 * Besides the term kinds known to classify(), a term can be "1" for the
 * intercept, "a:b" for the product of two columns, or "a*b" for the columns
 * a, b, and a:b.
 */
Design expand_features(const Formula::Terms &terms, const DataFrame &data);
Design expand_features(const std::string &independent, const DataFrame &data);

/**
 * Evaluates formulas against data frames
 *
 * Holds only its parameters; the data frame is passed to every call, so that
 * an Evaluator can be shared between threads.
 */
struct Evaluator {
  Evaluator(const Parameters &parameters = Parameters());

  ModelFrame operator()(const std::string &formula,
                        const DataFrame &data) const;
  ModelFrame operator()(const Formula &formula, const DataFrame &data) const;

  Parameters parameters;
};

/** Evaluate a formula with default parameters */
ModelFrame evaluate(const std::string &formula, const DataFrame &data);
}

#endif
