#ifndef DATAFRAME_HPP
#define DATAFRAME_HPP

#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include "types.hpp"

namespace Exception {
namespace DataFrame {
struct RepeatedColumnName : public std::runtime_error {
  RepeatedColumnName(const std::string &str)
      : std::runtime_error("Error: repeated column in table: '" + str
                           + "'."){};
};
struct LengthMismatch : public std::runtime_error {
  LengthMismatch(const std::string &str, size_t n, size_t expected)
      : std::runtime_error("Error: column '" + str + "' has "
                           + std::to_string(n) + " entries but the table has "
                           + std::to_string(expected) + " rows."){};
};
struct FieldCount : public std::runtime_error {
  FieldCount(size_t line, size_t n, size_t expected)
      : std::runtime_error("Error: line " + std::to_string(line) + " has "
                           + std::to_string(n) + " fields but the header has "
                           + std::to_string(expected) + "."){};
};
struct EmptyHeader : public std::runtime_error {
  EmptyHeader() : std::runtime_error("Error: table has no header line."){};
};
}
}

namespace FD {

/**
 * In-memory table of named columns with a common number of rows
 *
 * Columns are either numeric or categorical. Categorical columns can only be
 * used through their one-hot encoding.
 */
struct DataFrame {
  struct Column {
    enum class Kind { numeric, categorical };
    std::string name;
    Kind kind;
    Vector values;
    std::vector<std::string> levels;
    size_t size() const;
  };

  /** One indicator column per distinct value, in canonical order */
  struct Dummies {
    Matrix indicators;
    Labels categories;
  };

  void add_numeric_column(const std::string &name, const Vector &values);
  void add_categorical_column(const std::string &name,
                              const std::vector<std::string> &levels);

  bool has_column(const std::string &name) const;
  const Vector &column_values(const std::string &name) const;

  /**
   * Compute the one-hot encoding of a column
   *
   * Categories are ordered ascending: numerically for numeric columns and
   * lexicographically for categorical ones. NaN is not a category: rows
   * holding NaN get an all-zero indicator row.
   */
  Dummies one_hot(const std::string &name) const;

  size_t row_count() const;
  size_t column_count() const;
  Labels column_names() const;
  std::string to_string() const;

private:
  const Column &get_column(const std::string &name) const;
  void add_column(Column &&column);

  std::vector<Column> columns;
  std::unordered_map<std::string, size_t> column_idx;
};

std::ostream &operator<<(std::ostream &os, const DataFrame &data);

/**
 * Read a table with a header line
 *
 * Every column whose fields all parse as floating point numbers becomes a
 * numeric column; all others are categorical.
 */
DataFrame read_table(std::istream &is, const std::string &separator = "\t");

/** Read a possibly gzip or bzip2 compressed table from a file */
DataFrame load_table(const std::string &path,
                     const std::string &separator = "\t");
}

#endif
