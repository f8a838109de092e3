#include "compression_mode.hpp"
#include <boost/filesystem/path.hpp>
#include <stdexcept>

using namespace std;

string to_string(CompressionMode mode) {
  switch (mode) {
    case CompressionMode::gzip:
      return ".gz";
    case CompressionMode::bzip2:
      return ".bz2";
    default:
      return "";
  }
}

CompressionMode compression_from_path(const string &path) {
  auto extension = boost::filesystem::path(path).extension();
  if (extension == ".gz")
    return CompressionMode::gzip;
  if (extension == ".bz2")
    return CompressionMode::bzip2;
  return CompressionMode::none;
}

ostream &operator<<(ostream &os, CompressionMode mode) {
  switch (mode) {
    case CompressionMode::gzip:
      os << "gzip";
      break;
    case CompressionMode::bzip2:
      os << "bzip2";
      break;
    default:
      os << "none";
      break;
  }
  return os;
}

istream &operator>>(istream &is, CompressionMode &mode) {
  string token;
  is >> token;
  if (token == "gzip" or token == "gz" or token == ".gz")
    mode = CompressionMode::gzip;
  else if (token == "bzip2" or token == "bz2" or token == ".bz2")
    mode = CompressionMode::bzip2;
  else if (token == "none")
    mode = CompressionMode::none;
  else
    throw runtime_error("Error: compression mode '" + token
                        + "' not understood.");
  return is;
}
