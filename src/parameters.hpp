#ifndef PARAMETERS_HPP
#define PARAMETERS_HPP

#include <iostream>
#include <string>
#include "compression_mode.hpp"

namespace FD {

const std::string default_output_prefix = "design";

struct Parameters {
  /** Number of rows to evaluate per chunk; 0 means all rows at once.
   * Reserved for paginated evaluation, it has no effect on the output. */
  size_t chunksize = 0;
  CompressionMode compression_mode = CompressionMode::none;
  std::string separator = "\t";
  std::string output_prefix = default_output_prefix;
};

std::ostream &operator<<(std::ostream &os, const Parameters &parameters);
}

#endif
