#include "parameters.hpp"

namespace FD {
std::ostream &operator<<(std::ostream &os, const Parameters &parameters) {
  os << "chunksize = " << parameters.chunksize
     << ", compression = " << parameters.compression_mode
     << ", separator = '" << parameters.separator << "'"
     << ", output = " << parameters.output_prefix;
  return os;
}
}
