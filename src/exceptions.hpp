#ifndef EXCEPTIONS_HPP
#define EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace Exception {
namespace Formula {
/** Common base of all errors raised while evaluating a formula */
struct Error : public std::runtime_error {
  Error(const std::string &str) : std::runtime_error(str){};
};
struct Syntax : public Error {
  Syntax(const std::string &str)
      : Error("Error: syntax error in formula: " + str){};
};
struct UnknownColumn : public Error {
  UnknownColumn(const std::string &name)
      : Error("Error: column not found in the data: '" + name + "'."),
        column(name){};
  std::string column;
};
struct UnsupportedOperation : public Error {
  UnsupportedOperation(const std::string &term)
      : Error("Error: the operation is not supported: '" + term + "'."),
        term(term){};
  UnsupportedOperation(const std::string &term, const std::string &reason)
      : Error("Error: the operation is not supported: '" + term + "': "
              + reason),
        term(term){};
  std::string term;
};
struct InvalidParameter : public Error {
  InvalidParameter(const std::string &str)
      : Error("Error: invalid parameter: " + str){};
};
struct NumericEvaluation : public Error {
  NumericEvaluation(const std::string &str)
      : Error("Error: numeric evaluation failed: " + str){};
};
}
}

#endif
