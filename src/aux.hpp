#ifndef AUX_HPP
#define AUX_HPP

#include <iterator>
#include <numeric>
#include <string>
#include <vector>

/**
 * Split a string at every occurrence of a separator character
 *
 * Empty fields are retained, so that "a++b" gives three fields and "a+" two.
 *
 * @param sep Separator character
 * @param str String to split
 * @return The fields between separators, in order
 */
std::vector<std::string> split_at(char sep, const std::string &str);

/** Remove leading and trailing white space */
std::string trim(const std::string &str);

/** Split at a separator and trim every field */
std::vector<std::string> split_and_trim(char sep, const std::string &str);

/** Count occurrences of a character */
size_t count_of(char c, const std::string &str);

/**
 * Prepends iterator elements by a given symbol.
 */
template <typename InputIt, typename OutputIt, typename T>
void prepend(InputIt first, InputIt last, OutputIt d_first, T value) {
  for (; first != last; ++first) {
    *d_first++ = value;
    *d_first++ = *first;
  }
}

/**
 * Intersperses iterator elements by a given symbol.
 */
template <typename InputIt, typename OutputIt, typename T>
void intersperse(InputIt first, InputIt last, OutputIt d_first, T value) {
  if (first == last) {
    return;
  }
  *d_first = *first;
  prepend(++first, last, ++d_first, value);
}

/**
 * Intersperses iterator by a given symbol and concatenates the result.
 */
template <typename InputIt, typename T>
T intercalate(InputIt begin, InputIt last, const T &x) {
  std::vector<T> ret;
  intersperse(begin, last, std::back_inserter(ret), x);
  return std::accumulate(ret.begin(), ret.end(), T());
}

#endif
