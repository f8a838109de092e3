#include "verbosity.hpp"
#include <stdexcept>
#include <utility>
#include <vector>

using namespace std;

namespace {
const vector<pair<Verbosity, string>> verbosity_names{
    {Verbosity::fatal, "fatal"},     {Verbosity::error, "error"},
    {Verbosity::warning, "warning"}, {Verbosity::info, "info"},
    {Verbosity::verbose, "verbose"}, {Verbosity::debug, "debug"},
    {Verbosity::trace, "trace"},     {Verbosity::everything, "everything"}};
}

Verbosity verbosity = Verbosity::info;

string to_string(Verbosity verb) {
  for (auto &entry : verbosity_names)
    if (entry.first == verb)
      return entry.second;
  throw logic_error("Implementation of to_string(Verbosity) incomplete!");
}

ostream &operator<<(ostream &os, Verbosity verb) {
  os << to_string(verb);
  return os;
}

istream &operator>>(istream &is, Verbosity &verb) {
  string token;
  is >> token;
  for (auto &entry : verbosity_names)
    if (entry.second == token) {
      verb = entry.first;
      return is;
    }
  throw runtime_error("Error: unknown verbosity level '" + token + "'.");
}
