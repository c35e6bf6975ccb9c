#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace bxfer::logging {

boost::log::trivial::severity_level parse_severity(const std::string& level) {
  using boost::log::trivial::severity_level;
  if (level == "trace")   return severity_level::trace;
  if (level == "debug")   return severity_level::debug;
  if (level == "info")    return severity_level::info;
  if (level == "warning") return severity_level::warning;
  if (level == "error")   return severity_level::error;
  if (level == "fatal")   return severity_level::fatal;
  throw std::invalid_argument("Unknown log level: " + level);
}

void init_logging(const LogOptions& options) {
  namespace expr = boost::log::expressions;
  namespace sinks = boost::log::sinks;
  namespace keywords = boost::log::keywords;

  const auto min_level = parse_severity(options.level);

  try {
    // Clear any existing sinks
    boost::log::core::get()->remove_all_sinks();

    const auto formatter = expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << boost::log::trivial::severity << "] "
        << expr::smessage;

    if (options.console) {
      auto console_sink = boost::log::add_console_log(std::clog, keywords::auto_flush = true);
      console_sink->set_formatter(formatter);
    }

    if (!options.log_file.empty()) {
      auto backend = boost::make_shared<sinks::text_file_backend>();

      // Convert to absolute path
      std::filesystem::path log_path = std::filesystem::absolute(options.log_file);
      if (log_path.has_parent_path()) {
        std::filesystem::create_directories(log_path.parent_path());
      }
      backend->set_file_name_pattern(log_path.string());
      backend->set_open_mode(std::ios::out | std::ios::app);
      backend->auto_flush(true);

      using text_sink = sinks::synchronous_sink<sinks::text_file_backend>;
      auto sink = boost::make_shared<text_sink>(backend);
      sink->set_formatter(formatter);
      boost::log::core::get()->add_sink(sink);
    }

    boost::log::add_common_attributes();
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
    boost::log::core::get()->set_logging_enabled(true);

    BOOST_LOG_TRIVIAL(debug) << "Logger: Logging initialized at level " << options.level
                             << (options.log_file.empty() ? "" : " with file " + options.log_file);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

} // namespace bxfer::logging
