#ifndef MVAULT_LOGGER_HPP
#define MVAULT_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace mvault::logger {

// Parses "trace", "debug", "info", "warning" (or "warn"), "error", "fatal".
// Throws std::invalid_argument on anything else.
boost::log::trivial::severity_level parse_severity(const std::string& name);

// Installs a console sink and, when log_file is non-empty, a rotating text
// file sink. Replaces any sinks installed by a previous call.
void init_logging(const std::string& log_file = "",
                  boost::log::trivial::severity_level min_level = boost::log::trivial::info,
                  bool console = true);

// Changes the minimum severity without touching the installed sinks
void set_log_level(boost::log::trivial::severity_level min_level);

void enable_logging();
void disable_logging();

} // namespace mvault::logger

#endif // MVAULT_LOGGER_HPP
