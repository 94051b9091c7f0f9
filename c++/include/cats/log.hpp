#pragma once

#include <boost/log/trivial.hpp>
#include <string>

#define CATS_LOG(level)                                                           \
    BOOST_LOG_STREAM_WITH_PARAMS(::cats::log::logger(),                           \
                                 (::boost::log::keywords::severity =              \
                                      ::boost::log::trivial::level))              \
        << "[cats] "

namespace cats {
namespace log {

typedef boost::log::trivial::severity_level Severity;

// The trivial logger. The first call installs the default `warning` filter,
// so programs that never call init() only see warnings and worse.
boost::log::trivial::logger_type& logger();

// Installs a global severity filter; records below `level` are dropped.
void init(Severity level = boost::log::trivial::warning);

// Parses "trace", "debug", "info", "warning", "error" or "fatal".
Severity parse_severity(const std::string& name);

} // namespace log
} // namespace cats
