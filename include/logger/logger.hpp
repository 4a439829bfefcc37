#ifndef FRAGNET_LOGGER_HPP
#define FRAGNET_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace fragnet::logger {

using severity_level = boost::log::trivial::severity_level;

// Installs a console sink and, when log_file is non-empty, a rotating file sink.
// Safe to call more than once: existing sinks are replaced.
void init_logging(const std::string& log_file = "",
                  severity_level min_level = severity_level::info);

// Changes the minimum severity without touching the installed sinks
void set_min_level(severity_level min_level);

// Parses "trace", "debug", "info", "warning", "error" or "fatal".
// Throws std::invalid_argument for anything else.
severity_level parse_severity(const std::string& name);

} // namespace fragnet::logger

#endif // FRAGNET_LOGGER_HPP
