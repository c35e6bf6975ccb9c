#ifndef BXFER_LOGGER_HPP
#define BXFER_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace bxfer::logging {

struct LogOptions {
  // Empty disables the file sink
  std::string log_file;
  std::string level = "info";
  bool console = true;
};

// Parses trace|debug|info|warning|error|fatal, throws std::invalid_argument otherwise
boost::log::trivial::severity_level parse_severity(const std::string& level);

// Installs console and/or file sinks and applies the severity filter.
// Replaces any sinks installed by a previous call.
void init_logging(const LogOptions& options);

} // namespace bxfer::logging

#endif // BXFER_LOGGER_HPP
