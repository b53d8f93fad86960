#ifndef VAULT_LOGGER_HPP
#define VAULT_LOGGER_HPP

#include <cstddef>
#include <string>
#include <boost/log/trivial.hpp>

namespace vault::logging {

using severity_level = boost::log::trivial::severity_level;

// Rotation threshold for the file sink
constexpr std::size_t LOG_ROTATION_SIZE = 10 * 1024 * 1024;

// Maps trace, debug, info, warning, error or fatal (any case) to a level.
// Returns false for anything else.
bool parse_severity(const std::string& name, severity_level& level);

// Replaces any installed sinks with a console sink and, when log_file is
// not empty, a rotating file sink. Records below min_level are dropped.
void init_logging(const std::string& log_file = "", severity_level min_level = severity_level::info);

void set_log_level(severity_level min_level);

} // namespace vault::logging

#endif // VAULT_LOGGER_HPP
