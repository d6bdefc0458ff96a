#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace mvault::logger {

namespace logging = boost::log;
namespace keywords = boost::log::keywords;
namespace expr = boost::log::expressions;

boost::log::trivial::severity_level parse_severity(const std::string& name) {
  if (name == "trace") return logging::trivial::trace;
  if (name == "debug") return logging::trivial::debug;
  if (name == "info") return logging::trivial::info;
  if (name == "warning" || name == "warn") return logging::trivial::warning;
  if (name == "error") return logging::trivial::error;
  if (name == "fatal") return logging::trivial::fatal;
  throw std::invalid_argument("Logger: Unknown severity level: " + name);
}

void init_logging(const std::string& log_file,
                  boost::log::trivial::severity_level min_level,
                  bool console) {
  try {
    // Clear any existing sinks
    logging::core::get()->remove_all_sinks();
    logging::add_common_attributes();

    auto format = (
      expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << logging::trivial::severity << "]"
        << " [Thread " << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "]"
        << " " << expr::smessage
    );

    if (console) {
      logging::add_console_log(
        std::clog,
        keywords::format = format,
        keywords::auto_flush = true
      );
    }

    if (!log_file.empty()) {
      std::filesystem::path log_path = std::filesystem::absolute(log_file);
      if (log_path.has_parent_path()) {
        std::filesystem::create_directories(log_path.parent_path());
      }
      logging::add_file_log(
        keywords::file_name = log_path.string(),
        keywords::open_mode = std::ios::out | std::ios::app,
        keywords::format = format,
        keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
        keywords::auto_flush = true
      );
    }

    set_log_level(min_level);
    logging::core::get()->set_logging_enabled(true);

    BOOST_LOG_TRIVIAL(debug) << "Logger: Logging initialized"
                             << (log_file.empty() ? "" : " with file: " + log_file);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void set_log_level(boost::log::trivial::severity_level min_level) {
  logging::core::get()->set_filter(logging::trivial::severity >= min_level);
}

void enable_logging() {
  logging::core::get()->set_logging_enabled(true);
}

void disable_logging() {
  logging::core::get()->set_logging_enabled(false);
}

} // namespace mvault::logger
