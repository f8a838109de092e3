#include "log.hpp"

#include <boost/core/null_deleter.hpp>
#include <boost/log/attributes/clock.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/expressions/formatters/date_time.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <fstream>
#include <ostream>
#include <stdexcept>

namespace logging = boost::log;
namespace src = boost::log::sources;
namespace expr = boost::log::expressions;
namespace sinks = boost::log::sinks;
namespace attrs = boost::log::attributes;

BOOST_LOG_ATTRIBUTE_KEYWORD(timestamp, "TimeStamp", boost::posix_time::ptime)
BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

BOOST_LOG_GLOBAL_LOGGER_INIT(logger, src::severity_logger_mt<severity_level>) {
  src::severity_logger_mt<severity_level> logger;

  // add attribute: each log line gets a timestamp
  logger.add_attribute("TimeStamp", attrs::local_clock());
  return logger;
}

void init_logging(const std::string &path, Verbosity threshold) {
  typedef sinks::synchronous_sink<sinks::text_ostream_backend> text_sink;
  boost::shared_ptr<text_sink> sink = boost::make_shared<text_sink>();

  if (not path.empty()) {
    auto file = boost::make_shared<std::ofstream>(path);
    if (not *file)
      throw std::runtime_error("Error: can not open log file '" + path + "'.");
    sink->locked_backend()->add_stream(file);
  }

  sink->locked_backend()->add_stream(
      boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));

  logging::formatter formatter = expr::stream
                                 << expr::format_date_time(
                                        timestamp, "%Y-%m-%d %H:%M:%S.%f")
                                 << " "
                                 << "[" << severity << "]"
                                 << " " << expr::smessage;
  sink->set_formatter(formatter);

  // lower values are more severe
  sink->set_filter(severity <= threshold);

  logging::core::get()->remove_all_sinks();
  logging::core::get()->add_sink(sink);
}
