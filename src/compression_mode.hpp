#ifndef COMPRESSION_MODE_HPP
#define COMPRESSION_MODE_HPP

#include <iostream>
#include <string>

enum class CompressionMode { none, gzip, bzip2 };

/** File name suffix of a compression mode, including the dot */
std::string to_string(CompressionMode mode);

/** Determine the compression mode from the suffix of a path */
CompressionMode compression_from_path(const std::string &path);

std::ostream &operator<<(std::ostream &os, CompressionMode mode);
std::istream &operator>>(std::istream &is, CompressionMode &mode);

#endif
