#include "aux.hpp"
#include <algorithm>
#include <cctype>

using namespace std;

vector<string> split_at(char sep, const string &str) {
  vector<string> ret;
  size_t start = 0;
  size_t pos;
  while ((pos = str.find(sep, start)) != string::npos) {
    ret.push_back(str.substr(start, pos - start));
    start = pos + 1;
  }
  ret.push_back(str.substr(start));
  return ret;
}

string trim(const string &str) {
  auto is_space = [](char c) { return isspace(static_cast<unsigned char>(c)); };
  auto front = find_if_not(begin(str), end(str), is_space);
  auto back = find_if_not(str.rbegin(), str.rend(), is_space).base();
  if (front >= back)
    return "";
  return string(front, back);
}

vector<string> split_and_trim(char sep, const string &str) {
  vector<string> fields = split_at(sep, str);
  for (auto &field : fields)
    field = trim(field);
  return fields;
}

size_t count_of(char c, const string &str) {
  return count(begin(str), end(str), c);
}
