/* =====================================================================================
 * Copyright (c) 2012, Jonas Maaskola
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 * =====================================================================================
 *
 *       Filename:  compression.hpp
 *
 *    Description:  Routines for reading and writing possibly compressed files
 *
 * =====================================================================================
 */

#ifndef COMPRESSION_HPP
#define COMPRESSION_HPP

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>
#include <boost/iostreams/filter/bzip2.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include "compression_mode.hpp"

namespace Exception {
namespace File {
struct Existence : public std::runtime_error {
  Existence(const std::string &path)
      : std::runtime_error("Error: file does not exist: '" + path + "'."){};
};
struct Access : public std::runtime_error {
  Access(const std::string &path)
      : std::runtime_error("Error: file access failed: '" + path + "'."){};
};
struct Reading : public std::runtime_error {
  Reading(const std::string &path)
      : std::runtime_error("Error: reading from file failed: '" + path
                           + "'."){};
};
struct Writing : public std::runtime_error {
  Writing(const std::string &path)
      : std::runtime_error("Error: writing file failed: '" + path + "'."){};
};
}
}

/**
 * Return the first of path, path.gz, path.bz2 that exists
 */
inline std::string find_suffix_alternatives(
    const std::string &path,
    const std::vector<std::string> &suffixes = {"", ".gz", ".bz2"}) {
  for (auto &suffix : suffixes) {
    auto p = path + suffix;
    if (boost::filesystem::exists(p))
      return p;
  }
  throw Exception::File::Existence(path);
}

/**
 * Open path_ plus the compression suffix for writing and call fnc with the
 * output stream
 *
 * @return the path actually written to
 */
template <typename Fnc>
std::string write_file(const std::string &path_, CompressionMode mode,
                       Fnc fnc) {
  std::string p = path_ + to_string(mode);

  std::ios_base::openmode flags = std::ios_base::out;
  if (mode != CompressionMode::none)
    flags |= std::ios_base::binary;

  std::ofstream file(p, flags);
  if (not file)
    throw Exception::File::Access(p);
  boost::iostreams::filtering_stream<boost::iostreams::output> out;
  switch (mode) {
    case CompressionMode::gzip:
      out.push(boost::iostreams::gzip_compressor());
      break;
    case CompressionMode::bzip2:
      out.push(boost::iostreams::bzip2_compressor());
      break;
    default:
      break;
  }
  out.push(file);

  fnc(out);
  out.flush();
  if (out.bad())
    throw Exception::File::Writing(p);
  return p;
}

/**
 * Open a possibly compressed file and return the result of calling fnc on the
 * decompressed input stream
 */
template <typename T, typename Fnc>
T parse_file(const std::string &path_, Fnc fnc) {
  std::string p = find_suffix_alternatives(path_);
  CompressionMode mode = compression_from_path(p);

  std::ios_base::openmode flags = std::ios_base::in;
  if (mode != CompressionMode::none)
    flags |= std::ios_base::binary;

  std::ifstream file(p, flags);
  if (not file)
    throw Exception::File::Access(p);
  boost::iostreams::filtering_stream<boost::iostreams::input> in;
  if (mode == CompressionMode::gzip)
    in.push(boost::iostreams::gzip_decompressor());
  if (mode == CompressionMode::bzip2)
    in.push(boost::iostreams::bzip2_decompressor());
  in.push(file);

  T return_value = fnc(in);
  if (in.bad())
    throw Exception::File::Reading(p);
  return return_value;
}

#endif
