#ifndef PCLOUD_LOGGER_HPP
#define PCLOUD_LOGGER_HPP

#include <iostream>
#include <string>
#include <boost/log/trivial.hpp>

namespace pcloud::logger {

struct LogOptions {
    // Empty disables the file sink
    std::string log_file;
    boost::log::trivial::severity_level min_severity = boost::log::trivial::info;
};

// Installs a console sink on the given stream plus an optional rotating file
// sink, and sets the minimum severity. Replaces previously installed sinks.
void init(const LogOptions& options, std::ostream& console = std::clog);

} // namespace pcloud::logger

#endif // PCLOUD_LOGGER_HPP
