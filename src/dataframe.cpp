#include "dataframe.hpp"
#include <algorithm>
#include <boost/lexical_cast.hpp>
#include <boost/tokenizer.hpp>
#include <cmath>
#include <iomanip>
#include <limits>
#include <set>
#include <sstream>
#include "compression.hpp"
#include "exceptions.hpp"
#include "log.hpp"

using namespace std;

namespace FD {

size_t DataFrame::Column::size() const {
  if (kind == Kind::numeric)
    return values.size();
  return levels.size();
}

void DataFrame::add_column(Column &&column) {
  if (has_column(column.name))
    throw Exception::DataFrame::RepeatedColumnName(column.name);
  if (not columns.empty() and column.size() != row_count())
    throw Exception::DataFrame::LengthMismatch(column.name, column.size(),
                                               row_count());
  column_idx[column.name] = columns.size();
  columns.push_back(move(column));
}

void DataFrame::add_numeric_column(const string &name, const Vector &values) {
  Column column;
  column.name = name;
  column.kind = Column::Kind::numeric;
  column.values = values;
  add_column(move(column));
}

void DataFrame::add_categorical_column(const string &name,
                                       const vector<string> &levels) {
  Column column;
  column.name = name;
  column.kind = Column::Kind::categorical;
  column.levels = levels;
  add_column(move(column));
}

bool DataFrame::has_column(const string &name) const {
  return column_idx.find(name) != column_idx.end();
}

const DataFrame::Column &DataFrame::get_column(const string &name) const {
  auto iter = column_idx.find(name);
  if (iter == column_idx.end())
    throw Exception::Formula::UnknownColumn(name);
  return columns[iter->second];
}

const Vector &DataFrame::column_values(const string &name) const {
  const Column &column = get_column(name);
  if (column.kind != Column::Kind::numeric)
    throw Exception::Formula::NumericEvaluation(
        "column '" + name + "' is categorical; use c(" + name + ").");
  return column.values;
}

DataFrame::Dummies DataFrame::one_hot(const string &name) const {
  const Column &column = get_column(name);
  const size_t n = column.size();
  Dummies dummies;
  vector<size_t> category_of_row(n);

  if (column.kind == Column::Kind::numeric) {
    // NaN is not a category; its rows get no indicator
    set<Float> distinct;
    for (auto &x : column.values)
      if (not std::isnan(x))
        distinct.insert(x);
    vector<Float> categories(distinct.begin(), distinct.end());
    for (auto &x : categories) {
      ostringstream ss;
      ss << setprecision(numeric_limits<Float>::max_digits10) << x;
      dummies.categories.push_back(ss.str());
    }
    for (size_t i = 0; i < n; ++i)
      if (std::isnan(column.values[i]))
        category_of_row[i] = categories.size();
      else
        category_of_row[i] = distance(
            begin(categories),
            lower_bound(begin(categories), end(categories), column.values[i]));
  } else {
    set<string> distinct(begin(column.levels), end(column.levels));
    dummies.categories.assign(distinct.begin(), distinct.end());
    for (size_t i = 0; i < n; ++i)
      category_of_row[i] = distance(
          begin(dummies.categories),
          lower_bound(begin(dummies.categories), end(dummies.categories),
                      column.levels[i]));
  }

  dummies.indicators = Matrix::Zero(n, dummies.categories.size());
  for (size_t i = 0; i < n; ++i)
    if (category_of_row[i] < dummies.categories.size())
      dummies.indicators(i, category_of_row[i]) = 1;

  LOG(trace) << "One-hot encoding of '" << name << "' has "
             << dummies.categories.size() << " categories";
  return dummies;
}

size_t DataFrame::row_count() const {
  if (columns.empty())
    return 0;
  return columns.front().size();
}

size_t DataFrame::column_count() const { return columns.size(); }

Labels DataFrame::column_names() const {
  Labels names;
  for (auto &column : columns)
    names.push_back(column.name);
  return names;
}

string DataFrame::to_string() const {
  string str = "DataFrame with " + std::to_string(row_count()) + " rows and "
               + std::to_string(column_count()) + " columns:";
  for (auto &column : columns)
    str += " '" + column.name + "' ("
           + (column.kind == Column::Kind::numeric ? "numeric" : "categorical")
           + ")";
  return str;
}

ostream &operator<<(ostream &os, const DataFrame &data) {
  os << data.to_string();
  return os;
}

DataFrame read_table(istream &is, const string &separator) {
  using tokenizer = boost::tokenizer<boost::char_separator<char>>;
  boost::char_separator<char> sep(separator.c_str(), "",
                                  boost::keep_empty_tokens);

  auto tokenize = [&](string line) {
    if (not line.empty() and line.back() == '\r')
      line.pop_back();
    vector<string> fields;
    tokenizer tok(line, sep);
    for (auto token : tok)
      fields.push_back(token);
    return fields;
  };

  string line;
  if (not getline(is, line))
    throw Exception::DataFrame::EmptyHeader();
  const vector<string> header = tokenize(line);

  vector<vector<string>> fields(header.size());
  size_t line_no = 1;
  while (getline(is, line)) {
    ++line_no;
    if (line.empty() or line == "\r")
      continue;
    auto tokens = tokenize(line);
    if (tokens.size() != header.size())
      throw Exception::DataFrame::FieldCount(line_no, tokens.size(),
                                             header.size());
    for (size_t j = 0; j < tokens.size(); ++j)
      fields[j].push_back(tokens[j]);
  }

  DataFrame data;
  for (size_t j = 0; j < header.size(); ++j) {
    const size_t n = fields[j].size();
    Vector values(n);
    bool numeric = true;
    for (size_t i = 0; i < n and numeric; ++i)
      numeric = boost::conversion::try_lexical_convert(fields[j][i],
                                                       values[i]);
    if (numeric)
      data.add_numeric_column(header[j], values);
    else
      data.add_categorical_column(header[j], fields[j]);
  }
  LOG(verbose) << data;
  return data;
}

DataFrame load_table(const string &path, const string &separator) {
  LOG(debug) << "Reading table from " << path;
  return parse_file<DataFrame>(
      path, [&](istream &is) { return read_table(is, separator); });
}
}
