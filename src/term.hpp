#ifndef TERM_HPP
#define TERM_HPP

#include <iostream>
#include <string>
#include "dataframe.hpp"
#include "design.hpp"

namespace FD {

/**
 * A single feature term of a formula, classified by its syntax
 *
 * Only the fields relevant for the kind are set:
 *   column      x            column = "x"
 *   dummy       c(g)         column = "g"
 *   transform   log(x)       column = "x", function = "log"
 *   power       I(x^(1/2))   column = "x", exponent = "(1/2)"
 *   polynomial  poly(x, 3)   column = "x", degree = 3
 */
struct Term {
  enum class Kind { column, dummy, transform, power, polynomial };
  Kind kind = Kind::column;
  std::string text;
  std::string column;
  std::string function;
  std::string exponent;
  int degree = 0;
  std::string to_string() const;
};

std::string to_string(Term::Kind kind);
std::ostream &operator<<(std::ostream &os, const Term &term);

/**
 * Determine the kind of a term
 *
 * The checks are made in this order and the first one that matches wins:
 * the name of a column of data, c(name), log|exp|sin|cos|tan|tanh|sqrt(name),
 * I(name^exponent), poly(name, degree). A column whose name looks like one
 * of the other forms, e.g. "c(age)", is therefore used as is.
 *
 * Throws Exception::Formula::UnsupportedOperation if no form matches,
 * Exception::Formula::Syntax for a power term without exactly one '^' or a
 * polynomial term without exactly one ',', and
 * Exception::Formula::InvalidParameter for a polynomial degree that is not an
 * integer of at least 1.
 */
Term classify(const std::string &text, const DataFrame &data);

/** Compute the columns for a classified term */
ColumnGroup resolve(const Term &term, const DataFrame &data);

/** Classify and resolve a term */
ColumnGroup resolve(const std::string &text, const DataFrame &data);

/**
 * Parse the exponent of a power term
 *
 * Either a plain number, "2" or "-0.5", or a parenthesized expression. If the
 * parenthesized text contains a '/' it is read as a white space separated sum
 * of rational numbers, "(1/2 1/3)" meaning 5/6, that is summed exactly before
 * conversion to floating point.
 */
Float parse_exponent(const std::string &exponent);
}

#endif
