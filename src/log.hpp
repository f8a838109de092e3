#ifndef LOG_HPP
#define LOG_HPP

// needed for dynamic linking to the Boost log library
#define BOOST_LOG_DYN_LINK 1

#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <string>
#include "verbosity.hpp"

using severity_level = Verbosity;

// register a global logger
BOOST_LOG_GLOBAL_LOGGER(logger,
                        boost::log::sources::severity_logger_mt<severity_level>)

#define LOG(severity) BOOST_LOG_SEV(logger::get(), severity_level::severity)

/**
 * Install the log sink
 *
 * Messages are written to std::clog and, if path is non-empty, also to the
 * file at path.
 *
 * @param path Path of the log file; may be empty
 * @param threshold Least severe level that is still written
 */
void init_logging(const std::string &path,
                  Verbosity threshold = Verbosity::info);

#endif
